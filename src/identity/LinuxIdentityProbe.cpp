#include "identity/LinuxIdentityProbe.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace vc::identity {

namespace {

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string readFirstLine(const fs::path& p) {
    std::ifstream in(p);
    if (!in) return {};
    std::string line;
    std::getline(in, line);
    return trim(line);
}

// udev escapes unsafe characters in /dev/disk/by-label names as \xHH
std::string decodeHexEscapes(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 3 < s.size() && s[i + 1] == 'x' &&
            std::isxdigit(static_cast<unsigned char>(s[i + 2])) && std::isxdigit(static_cast<unsigned char>(s[i + 3]))) {
            out.push_back(static_cast<char>(std::stoi(s.substr(i + 2, 2), nullptr, 16)));
            i += 3;
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

bool isUnder(const std::string& path, const std::string& mountPoint) {
    if (mountPoint == "/") return !path.empty() && path.front() == '/';
    if (path.size() < mountPoint.size()) return false;
    if (path.compare(0, mountPoint.size(), mountPoint) != 0) return false;
    return path.size() == mountPoint.size() || path[mountPoint.size()] == '/';
}

void fillIfEmpty(std::string& field, const std::string& value) {
    if (field.empty() && !value.empty()) field = value;
}

}

LinuxIdentityProbe::LinuxIdentityProbe(fs::path sysroot) : sysroot_(std::move(sysroot)) {}

fs::path LinuxIdentityProbe::host(const fs::path& abs) const {
    return sysroot_ / abs.relative_path();
}

std::string LinuxIdentityProbe::decodeMountEscapes(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 3 < s.size() &&
            s[i + 1] >= '0' && s[i + 1] <= '7' && s[i + 2] >= '0' && s[i + 2] <= '7' &&
            s[i + 3] >= '0' && s[i + 3] <= '7') {
            out.push_back(static_cast<char>((s[i + 1] - '0') * 64 + (s[i + 2] - '0') * 8 + (s[i + 3] - '0')));
            i += 3;
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

// 36 35 98:0 /mnt1 /mnt/parent rw,noatime master:1 - ext3 /dev/root rw,errors=continue
std::optional<MountInfo> LinuxIdentityProbe::parseMountInfoLine(const std::string& line) {
    std::istringstream ss(line);
    std::vector<std::string> fields;
    std::string f;
    while (ss >> f) fields.push_back(f);
    if (fields.size() < 7) return std::nullopt;

    size_t sep = 6;
    while (sep < fields.size() && fields[sep] != "-") ++sep;
    if (sep + 2 >= fields.size()) return std::nullopt;

    MountInfo m;
    m.maj_min = fields[2];
    m.mount_point = decodeMountEscapes(fields[4]);
    m.fs_type = fields[sep + 1];
    m.source = decodeMountEscapes(fields[sep + 2]);
    return m;
}

std::vector<MountInfo> LinuxIdentityProbe::listMounts() const {
    std::ifstream in(host("/proc/self/mountinfo"));
    if (!in) return {};

    std::vector<MountInfo> mounts;
    std::string line;
    while (std::getline(in, line))
        if (auto m = parseMountInfoLine(line)) mounts.push_back(std::move(*m));
    return mounts;
}

std::optional<MountInfo> LinuxIdentityProbe::probeMount(const fs::path& directory) const {
    std::error_code ec;
    auto canonical = fs::weakly_canonical(directory, ec);
    if (ec) canonical = directory.lexically_normal();
    const auto target = canonical.string();

    // Later entries shadow earlier ones on the same mount point, so ties go to the last seen
    std::optional<MountInfo> best;
    for (auto& m : listMounts()) {
        if (!isUnder(target, m.mount_point)) continue;
        if (!best || m.mount_point.size() >= best->mount_point.size()) best = std::move(m);
    }
    return best;
}

std::optional<BlockDeviceInfo> LinuxIdentityProbe::probeBlockDevice(const MountInfo& mount) const {
    BlockDeviceInfo info;
    if (!mount.maj_min.empty()) {
        readUdev(mount.maj_min, info);
        readSysfs(mount.maj_min, info);
    }
    if (!mount.source.empty() && mount.source.front() == '/') readDiskLinks(mount.source, info);

    const bool any = !info.fs_uuid.empty() || !info.fs_label.empty() || !info.serial.empty() ||
                     !info.model.empty() || !info.part_uuid.empty() || !info.pt_uuid.empty() || !info.raw.empty();
    if (!any) return std::nullopt;
    return info;
}

void LinuxIdentityProbe::readUdev(const std::string& majMin, BlockDeviceInfo& out) const {
    std::ifstream in(host("/run/udev/data") / ("b" + majMin));
    if (!in) return;

    std::map<std::string, std::string> env;
    std::string line;
    while (std::getline(in, line)) {
        if (line.size() < 3 || line.compare(0, 2, "E:") != 0) continue;
        const auto eq = line.find('=', 2);
        if (eq == std::string::npos) continue;
        env[line.substr(2, eq - 2)] = line.substr(eq + 1);
    }

    const auto get = [&](const char* key) -> std::string {
        const auto it = env.find(key);
        return it == env.end() ? std::string{} : it->second;
    };

    fillIfEmpty(out.fs_uuid, get("ID_FS_UUID"));
    fillIfEmpty(out.fs_label, get("ID_FS_LABEL"));
    fillIfEmpty(out.fs_version, get("ID_FS_VERSION"));
    fillIfEmpty(out.serial, get("ID_SERIAL_SHORT"));
    fillIfEmpty(out.serial, get("ID_SERIAL"));
    fillIfEmpty(out.model, get("ID_MODEL"));
    fillIfEmpty(out.vendor, get("ID_VENDOR"));
    fillIfEmpty(out.wwn, get("ID_WWN"));
    fillIfEmpty(out.pt_uuid, get("ID_PART_TABLE_UUID"));
    fillIfEmpty(out.part_uuid, get("ID_PART_ENTRY_UUID"));

    for (const auto& [k, v] : env) out.raw["udev." + k] = v;
}

void LinuxIdentityProbe::readDiskLinks(const std::string& source, BlockDeviceInfo& out) const {
    const auto deviceName = fs::path(source).filename().string();

    const auto scan = [&](const char* dir, std::string& field, const char* rawKey) {
        std::error_code ec;
        for (fs::directory_iterator it(host(dir), ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code lec;
            const auto target = fs::read_symlink(it->path(), lec);
            if (lec || target.filename().string() != deviceName) continue;
            const auto value = decodeHexEscapes(it->path().filename().string());
            fillIfEmpty(field, value);
            out.raw[rawKey] = value;
            return;
        }
    };

    scan("/dev/disk/by-uuid", out.fs_uuid, "by-uuid");
    scan("/dev/disk/by-label", out.fs_label, "by-label");
    scan("/dev/disk/by-partuuid", out.part_uuid, "by-partuuid");
}

void LinuxIdentityProbe::readSysfs(const std::string& majMin, BlockDeviceInfo& out) const {
    const auto base = host("/sys/dev/block") / majMin;
    // partitions carry no device/ of their own, the parent disk does
    for (const auto& dev : {base / "device", base / ".." / "device"}) {
        std::error_code ec;
        if (!fs::is_directory(dev, ec)) continue;
        const auto model = readFirstLine(dev / "model");
        const auto vendor = readFirstLine(dev / "vendor");
        const auto serial = readFirstLine(dev / "serial");
        fillIfEmpty(out.model, model);
        fillIfEmpty(out.vendor, vendor);
        fillIfEmpty(out.serial, serial);
        if (!model.empty()) out.raw["sysfs.model"] = model;
        if (!vendor.empty()) out.raw["sysfs.vendor"] = vendor;
        if (!serial.empty()) out.raw["sysfs.serial"] = serial;
        break;
    }
}

}
