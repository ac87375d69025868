#include "identity/labels.hpp"

#include <algorithm>
#include <cctype>

namespace vc::identity {

namespace {

std::string lastHexRun(const std::string& s) {
    std::string last, cur;
    for (const char c : s) {
        if (std::isxdigit(static_cast<unsigned char>(c))) {
            cur.push_back(c);
        } else {
            if (!cur.empty()) last = cur;
            cur.clear();
        }
    }
    return cur.empty() ? last : cur;
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

}

std::string deriveHumanId(const types::VolumeIdentity& id) {
    std::string token;
    for (const auto* candidate : {&id.part_uuid, &id.pt_uuid, &id.fs_uuid, &id.volume_id}) {
        if (!candidate->empty()) {
            token = *candidate;
            break;
        }
    }

    const auto b = token.find_first_not_of(" \t");
    const auto e = token.find_last_not_of(" \t");
    token = b == std::string::npos ? std::string{} : token.substr(b, e - b + 1);
    if (token.empty()) return {};

    if (token.find('=') != std::string::npos || token.find('|') != std::string::npos)
        if (auto run = lastHexRun(token); !run.empty()) token = std::move(run);

    if (token.find('-') != std::string::npos) {
        std::vector<std::string> parts;
        size_t start = 0;
        while (start <= token.size()) {
            const auto dash = token.find('-', start);
            const auto part = token.substr(start, dash == std::string::npos ? std::string::npos : dash - start);
            if (!part.empty()) parts.push_back(part);
            if (dash == std::string::npos) break;
            start = dash + 1;
        }
        if (!parts.empty()) {
            std::string acc = parts.back();
            for (auto idx = static_cast<int>(parts.size()) - 2; acc.size() < 6 && idx >= 0; --idx)
                acc = parts[static_cast<size_t>(idx)] + "-" + acc;
            token = acc;
        }
    }

    constexpr size_t maxLen = 12;
    if (token.size() > maxLen) token = token.substr(token.size() - maxLen);
    return token;
}

std::vector<std::string> suggestMountPoints(const std::vector<MountInfo>& mounts) {
    std::vector<std::string> out;
    for (const auto& m : mounts) {
        const auto& mp = m.mount_point;
        if (startsWith(mp, "/mnt/") || startsWith(mp, "/media/") || startsWith(mp, "/run/media/"))
            out.push_back(mp);
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

}
