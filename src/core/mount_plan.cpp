#include "mount_plan.hpp"
#include "../defs.hpp"

namespace rdinit {

void MountPlan::record(const MountEntry& entry) {
    entries_.push_back(entry);
}

std::vector<MountEntry> MountPlan::handoff_entries() const {
    std::vector<MountEntry> result;
    for (const auto& entry : entries_) {
        if (entry.move_on_handoff) {
            result.push_back(entry);
        }
    }
    return result;
}

std::optional<MountEntry> MountPlan::find(const std::string& target) const {
    for (const auto& entry : entries_) {
        if (entry.target == target) {
            return entry;
        }
    }
    return std::nullopt;
}

std::vector<MountEntry> virtual_fs_entries() {
    return {
        {"devtmpfs", "/dev", "devtmpfs", "mode=0755,nosuid", true},
        {"proc", "/proc", "proc", "nosuid,noexec,nodev", true},
        {"sysfs", "/sys", "sysfs", "nosuid,noexec,nodev", true},
        {"tmpfs", "/run", "tmpfs", RUN_MOUNT_OPTIONS, true},
    };
}

}  // namespace rdinit
