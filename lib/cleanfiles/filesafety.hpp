#ifndef FILESAFETY_HPP
#define FILESAFETY_HPP

#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

/**
 * @brief Safety checks for the directories a run is allowed to clean
 */
class FileSafety {
public:
    enum class RootStatus {
        Allowed,
        BlockedSystemPath,
        BlockedVirtualFS,
        WarningHome,
        WarningMountPoint,
        WarningRemovableMedia
    };

    struct MountInfo {
        std::string device;
        std::string mountpoint;
        std::string fstype;
        bool is_removable;
        bool is_root;
    };

    /**
     * @brief Check whether a directory may be used as a scan root
     * @param root Absolute directory path
     * @return RootStatus; Blocked* statuses must abort the run
     */
    static RootStatus checkRoot(const std::filesystem::path& root);

    static bool isBlocked(RootStatus status);

    /**
     * @brief Get human-readable message for a root status
     */
    static std::string getStatusMessage(RootStatus status, const std::string& path);

    /**
     * @brief Check if path is a critical system directory
     */
    static bool isSystemPath(const std::string& path);

    static bool isUserHome(const std::string& path);

    static bool isMountPoint(const std::string& path);

    /**
     * @brief Check if path is on a kernel pseudo filesystem
     */
    static bool isVirtualFilesystem(const std::string& path);

    /**
     * @brief Check if path is on removable media (USB, etc.)
     */
    static bool isRemovableMedia(const std::string& path);

    /**
     * @brief Get all mount points from /proc/mounts
     */
    static std::vector<MountInfo> getMountPoints();

    /** @brief Whether @p path equals @p mountpoint or lies below it */
    static bool isUnder(const std::string& path, const std::string& mountpoint);

private:
    static const std::unordered_set<std::string> CRITICAL_PATHS;
};

#endif // FILESAFETY_HPP
