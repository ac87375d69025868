#pragma once

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

namespace vc::util {

// Editor droppings and OS metadata files: still logged as events, never catalogued as files.
class FileFilter {
public:
    FileFilter() = default;
    FileFilter(std::vector<std::string> names, std::vector<std::string> suffixes)
        : names_(std::move(names)), suffixes_(std::move(suffixes)) {}

    [[nodiscard]] bool ignored(const std::filesystem::path& p) const {
        const auto name = p.filename().string();
        if (name.empty()) return false;
        if (std::find(names_.begin(), names_.end(), name) != names_.end()) return true;
        return std::any_of(suffixes_.begin(), suffixes_.end(), [&](const std::string& sfx) {
            return !sfx.empty() && name.size() >= sfx.size() &&
                   name.compare(name.size() - sfx.size(), sfx.size(), sfx) == 0;
        });
    }

private:
    std::vector<std::string> names_ = {".DS_Store", "Thumbs.db"};
    std::vector<std::string> suffixes_ = {".lock", ".tmp", ".swp", ".swx", "~"};
};

}
