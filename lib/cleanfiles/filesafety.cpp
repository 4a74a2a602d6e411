/**
 * @file filesafety.cpp
 * @brief Checks applied to every root before a run touches it
 *
 * A run deletes, renames and moves files anywhere below its roots, so a root
 * pointing at a system directory or a kernel pseudo filesystem is refused.
 * Roots that are legitimate but risky (the home directory, a mount point,
 * removable media) are only reported.
 */

#include "filesafety.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <sys/vfs.h>

/**
 * @brief Directories that can never be a scan root
 *
 * Only the directory itself is matched; a project directory below /opt or
 * /tmp is fine.
 */
const std::unordered_set<std::string> FileSafety::CRITICAL_PATHS = {
    "/", "/boot", "/dev", "/etc", "/lib", "/lib64",
    "/proc", "/root", "/run", "/sys", "/usr", "/var",
    "/bin", "/sbin", "/opt", "/srv", "/tmp"
};

namespace {

std::string normalized(const std::filesystem::path& p) {
    std::string s = p.lexically_normal().string();
    while (s.size() > 1 && s.back() == '/') {
        s.pop_back();
    }
    return s;
}

} // namespace

/**
 * @brief Checks whether a directory may be used as a scan root
 *
 * Checks in order of severity:
 * 1. System paths (blocked)
 * 2. Virtual filesystems like /proc, /sys (blocked)
 * 3. User home directory (warning)
 * 4. Removable media (warning)
 * 5. Mount points (warning)
 *
 * @param root The directory to check
 * @return RootStatus of the first check that matched
 */
FileSafety::RootStatus FileSafety::checkRoot(const std::filesystem::path& root) {
    const std::string path = normalized(root);

    if (isSystemPath(path)) {
        return RootStatus::BlockedSystemPath;
    }

    if (isVirtualFilesystem(path)) {
        return RootStatus::BlockedVirtualFS;
    }

    if (isUserHome(path)) {
        return RootStatus::WarningHome;
    }

    if (isRemovableMedia(path)) {
        return RootStatus::WarningRemovableMedia;
    }

    if (isMountPoint(path)) {
        return RootStatus::WarningMountPoint;
    }

    return RootStatus::Allowed;
}

bool FileSafety::isBlocked(RootStatus status) {
    return status == RootStatus::BlockedSystemPath ||
           status == RootStatus::BlockedVirtualFS;
}

std::string FileSafety::getStatusMessage(RootStatus status, const std::string& path) {
    switch (status) {
        case RootStatus::Allowed:
            return "Root allowed: " + path;
        case RootStatus::BlockedSystemPath:
            return "Refusing to clean system directory: " + path;
        case RootStatus::BlockedVirtualFS:
            return "Refusing to clean virtual/system filesystem: " + path;
        case RootStatus::WarningHome:
            return "This is your home directory: " + path;
        case RootStatus::WarningMountPoint:
            return "This is a mount point: " + path;
        case RootStatus::WarningRemovableMedia:
            return "This is on removable media: " + path;
    }
    return "Unknown status";
}

bool FileSafety::isSystemPath(const std::string& path) {
    return CRITICAL_PATHS.count(path) > 0;
}

/**
 * @brief Checks if a path is the user's home directory
 *
 * @note Returns false if the HOME environment variable is not set
 */
bool FileSafety::isUserHome(const std::string& path) {
    const char* home = std::getenv("HOME");
    return home && path == normalized(home);
}

bool FileSafety::isMountPoint(const std::string& path) {
    for (const auto& mount : getMountPoints()) {
        if (mount.mountpoint == path) {
            return true;
        }
    }
    return false;
}

/**
 * @brief Checks if a path resides on a kernel pseudo filesystem
 *
 * Uses statfs() to read the filesystem magic number. tmpfs and ramfs are
 * ordinary places for user files and are not listed.
 *
 * @return true if the path is on a pseudo filesystem or if statfs() fails
 *
 * Filesystem types checked (see /usr/include/linux/magic.h):
 * - procfs (0x9fa0)
 * - sysfs (0x62656572)
 * - devpts (0x3434)
 * - securityfs (0x73636673)
 * - cgroup (0x27e0eb)
 * - cgroup2 (0x63677270)
 */
bool FileSafety::isVirtualFilesystem(const std::string& path) {
    struct statfs fs_info;

    if (statfs(path.c_str(), &fs_info) != 0) {
        return true;  // On error, assume protected
    }

    const long VIRTUAL_FS[] = {
        0x9fa0,       // PROC_SUPER_MAGIC
        0x62656572,   // SYSFS_MAGIC
        0x3434,       // DEVPTS_SUPER_MAGIC
        0x73636673,   // SECURITYFS_MAGIC
        0x27e0eb,     // CGROUP_SUPER_MAGIC
        0x63677270,   // CGROUP2_SUPER_MAGIC
    };

    for (auto magic : VIRTUAL_FS) {
        if (static_cast<long>(fs_info.f_type) == magic) {
            return true;
        }
    }

    return false;
}

/**
 * @brief Checks if a path is on removable media
 *
 * A mount point under /media, /mnt or /run/media counts as removable. For
 * SCSI devices (/dev/sd*) the sysfs removable flag is consulted as well.
 */
bool FileSafety::isRemovableMedia(const std::string& path) {
    for (const auto& mount : getMountPoints()) {
        if (mount.is_root || !isUnder(path, mount.mountpoint)) {
            continue;
        }

        if (mount.is_removable) {
            return true;
        }

        if (mount.device.find("/dev/sd") == 0 && mount.device.size() >= 8) {
            // e.g. /dev/sda1 → /sys/block/sda/removable
            std::string device_name = mount.device.substr(5, 3);
            std::ifstream removable_file("/sys/block/" + device_name + "/removable");
            int removable = 0;
            if (removable_file >> removable && removable == 1) {
                return true;
            }
        }
    }

    return false;
}

/**
 * @brief Parses /proc/mounts
 *
 * @return One entry per mount; empty if /proc/mounts cannot be opened
 */
std::vector<FileSafety::MountInfo> FileSafety::getMountPoints() {
    std::vector<MountInfo> mounts;
    std::ifstream mounts_file("/proc/mounts");

    if (!mounts_file.is_open()) {
        return mounts;
    }

    std::string line;
    while (std::getline(mounts_file, line)) {
        std::istringstream iss(line);
        MountInfo info;

        if (!(iss >> info.device >> info.mountpoint >> info.fstype)) {
            continue;
        }

        info.is_root = (info.mountpoint == "/");
        info.is_removable = (isUnder(info.mountpoint, "/media") ||
                             isUnder(info.mountpoint, "/mnt") ||
                             isUnder(info.mountpoint, "/run/media"));

        mounts.push_back(info);
    }

    return mounts;
}

bool FileSafety::isUnder(const std::string& path, const std::string& mountpoint) {
    if (path.compare(0, mountpoint.size(), mountpoint) != 0) {
        return false;
    }
    return path.size() == mountpoint.size() || mountpoint == "/" ||
           path[mountpoint.size()] == '/';
}
