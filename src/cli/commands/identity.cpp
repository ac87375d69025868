#include "cli/commands.hpp"
#include "cli/Context.hpp"
#include "cli/Router.hpp"
#include "cli/Table.hpp"
#include "cli/argsHelpers.hpp"
#include "catalog/CatalogStore.hpp"
#include "identity/IdentityResolver.hpp"
#include "identity/labels.hpp"

#include <algorithm>
#include <array>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace vc::types;

namespace vc::cli {

namespace {

constexpr std::array kLabelColumns{
    "label_index", "human_id", "volume_id", "directory", "label", "fs_uuid", "device", "pt_uuid", "part_uuid",
    "wwn", "model", "serial", "vendor", "usage_total_bytes", "usage_used_bytes", "usage_free_bytes"
};

std::string csvEscape(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string out = "\"";
    for (const char c : s) {
        if (c == '"') out += "\"\"";
        else out.push_back(c);
    }
    return out + "\"";
}

// Numbered volumes first, in label order; a volume not yet numbered prints its position.
std::vector<Volume> inLabelOrder(std::vector<Volume> volumes) {
    std::stable_sort(volumes.begin(), volumes.end(), [](const Volume& a, const Volume& b) {
        if (a.label_index && b.label_index) return *a.label_index < *b.label_index;
        return a.label_index.has_value() && !b.label_index.has_value();
    });
    return volumes;
}

std::vector<std::string> labelRow(const Volume& v, const size_t position) {
    auto id = v.identity;
    id.volume_id = v.volume_id;
    const auto usage = [&](int64_t DiskUsage::* field) {
        return v.usage ? std::to_string((*v.usage).*field) : std::string{};
    };
    const auto index = v.label_index ? *v.label_index : static_cast<int64_t>(position);
    return {std::to_string(index), identity::deriveHumanId(id), v.volume_id, v.directory, id.fs_label, id.fs_uuid,
            id.device, id.pt_uuid, id.part_uuid, id.wwn, id.model, id.serial, id.vendor, usage(&DiskUsage::total_bytes),
            usage(&DiskUsage::used_bytes), usage(&DiskUsage::free_bytes)};
}

CommandResult handleIdentify(const CommandCall& call, Context& ctx) {
    if (call.positionals.size() != 1) throw std::invalid_argument("identify expects exactly one DIR");
    const auto id = ctx.resolver()->resolve(call.positionals.front());

    if (hasFlag(call, "json")) return okJson(id);

    std::string out;
    const auto line = [&out](const char* k, const std::string& v) {
        if (!v.empty()) out += fmt::format("{:<12} {}\n", k, v);
    };
    line("volume_id", id.volume_id);
    line("directory", id.directory);
    line("mount_point", id.mount_point);
    line("device", id.device);
    line("fs_type", id.fs_type);
    line("fs_uuid", id.fs_uuid);
    line("label", id.fs_label);
    line("fs_version", id.fs_version);
    line("serial", id.serial);
    line("model", id.model);
    line("vendor", id.vendor);
    line("wwn", id.wwn);
    line("pt_uuid", id.pt_uuid);
    line("part_uuid", id.part_uuid);
    line("human_id", identity::deriveHumanId(id));
    if (!id.hasHardwareIdentity()) out += "(no hardware identity available, id falls back to the mount source or path)\n";
    return ok(out);
}

CommandResult handleLabels(const CommandCall& call, Context& ctx) {
    const auto volumes = inLabelOrder(ctx.store().listVolumes());

    if (hasFlag(call, "json")) {
        auto arr = nlohmann::json::array();
        for (size_t n = 0; n < volumes.size(); ++n) {
            const auto cells = labelRow(volumes[n], n + 1);
            nlohmann::json row;
            row[kLabelColumns[0]] = std::stoll(cells[0]);
            for (size_t i = 1; i < kLabelColumns.size(); ++i) row[kLabelColumns[i]] = cells[i];
            arr.push_back(std::move(row));
        }
        return okJson(arr);
    }

    if (hasFlag(call, "csv")) {
        std::string out;
        for (size_t i = 0; i < kLabelColumns.size(); ++i) out += fmt::format("{}{}", i ? "," : "", kLabelColumns[i]);
        out += '\n';
        for (size_t n = 0; n < volumes.size(); ++n) {
            const auto cells = labelRow(volumes[n], n + 1);
            for (size_t i = 0; i < cells.size(); ++i) out += (i ? "," : "") + csvEscape(cells[i]);
            out += '\n';
        }
        return ok(out);
    }

    if (volumes.empty()) return ok("No volumes catalogued yet.\n");

    Table t({{"#", Align::Right}, {"ID"}, {"LABEL"}, {"VOLUME", Align::Left, 48, true},
             {"DIRECTORY", Align::Left, 40, true}, {"MODEL"}});
    for (size_t n = 0; n < volumes.size(); ++n) {
        const auto cells = labelRow(volumes[n], n + 1);
        t.add_row({cells[0], cells[1], cells[4].empty() ? "-" : cells[4], cells[2], cells[3],
                   cells[10].empty() ? "-" : cells[10]});
    }
    return ok(t.render());
}

CommandResult handleSuggest(const CommandCall& call, Context& ctx) {
    const auto suggestions = ctx.resolver()->suggest();
    if (hasFlag(call, "json")) return okJson(suggestions);
    if (suggestions.empty()) return ok("No removable-looking mounts found under /mnt, /media or /run/media.\n");

    Table t({{"DIRECTORY", Align::Left, 40, true}, {"VOLUME", Align::Left, 48, true}});
    for (const auto& s : suggestions) t.add_row({s.path, s.volume_id});
    return ok(t.render());
}

}

void registerIdentityCommands(Router& r, Context& ctx) {
    r.registerCommand("identify", {"Resolve the volume identity behind a directory", "identify DIR [--json]",
        [&ctx](const CommandCall& c) { return handleIdentify(c, ctx); }, {"id"}, {"json"}});

    r.registerCommand("labels", {"Short printable ids for every known volume", "labels [--json | --csv]",
        [&ctx](const CommandCall& c) { return handleLabels(c, ctx); }, {}, {"json", "csv"}});

    r.registerCommand("suggest", {"Mounted media worth watching", "suggest [--json]",
        [&ctx](const CommandCall& c) { return handleSuggest(c, ctx); }, {}, {"json"}});
}

}
