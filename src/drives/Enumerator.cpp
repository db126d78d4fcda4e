#include "drives/Enumerator.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <sstream>
#include <unordered_set>

using namespace ds::drives;
using namespace ds::drives::model;

namespace {

const std::unordered_set<std::string> PSEUDO_FILESYSTEMS = {
    "proc", "sysfs", "devtmpfs", "devpts", "cgroup", "cgroup2", "securityfs", "pstore",
    "debugfs", "tracefs", "configfs", "fusectl", "mqueue", "hugetlbfs", "bpf", "autofs",
    "binfmt_misc", "rpc_pipefs", "nsfs", "efivarfs", "selinuxfs", "ramfs"
};

const std::unordered_set<std::string> NETWORK_FILESYSTEMS = {
    "nfs", "nfs4", "cifs", "smb3", "smbfs", "ncpfs", "afs", "9p",
    "ceph", "glusterfs", "fuse.sshfs", "fuse.glusterfs", "davfs"
};

}

bool Enumerator::isPseudoFilesystem(const std::string& fsType) {
    return PSEUDO_FILESYSTEMS.contains(fsType);
}

bool Enumerator::isNetworkFilesystem(const std::string& fsType) {
    return NETWORK_FILESYSTEMS.contains(fsType);
}

std::string Enumerator::unescape(const std::string& field) {
    std::string out;
    out.reserve(field.size());

    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size()) {
            const auto digits = field.substr(i + 1, 3);
            if (digits.find_first_not_of("01234567") == std::string::npos) {
                out.push_back(static_cast<char>(std::stoi(digits, nullptr, 8)));
                i += 3;
                continue;
            }
        }
        out.push_back(field[i]);
    }

    return out;
}

std::vector<Drive> Enumerator::parse(std::istream& in) {
    std::vector<Drive> drives;
    std::unordered_set<std::string> seen;

    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string device, mountPoint, fsType;
        if (!(fields >> device >> mountPoint >> fsType)) continue;
        if (isPseudoFilesystem(fsType)) continue;

        auto path = unescape(mountPoint);
        if (!seen.insert(path).second) continue;

        drives.push_back(Drive{
            .name = path,
            .path = path,
            .kind = isNetworkFilesystem(fsType) ? "network" : "local"
        });
    }

    return drives;
}

std::vector<Drive> Enumerator::fallback() {
    return {Drive{.name = "/", .path = "/", .kind = "local"}};
}

std::vector<Drive> Enumerator::list(const std::filesystem::path& mounts) {
    std::ifstream in(mounts);
    if (!in) {
        log::Registry::diskscout()->warn("[DriveEnumerator] Unable to open {}, using fallback", mounts.string());
        return fallback();
    }

    try {
        auto drives = parse(in);
        if (drives.empty()) return fallback();
        return drives;
    } catch (const std::exception& e) {
        log::Registry::diskscout()->warn("[DriveEnumerator] Failed to parse {}: {}", mounts.string(), e.what());
        return fallback();
    }
}
