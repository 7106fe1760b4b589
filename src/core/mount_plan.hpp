#pragma once

#include <optional>
#include <string>
#include <vector>

namespace rdinit {

struct MountEntry {
    std::string source;
    std::string target;
    std::string fstype;
    std::string options;
    // Moved below the new root before switching; never unmounted
    bool move_on_handoff = false;
};

/**
 * Ordered record of the mounts made during boot.
 *
 * The virtual filesystems come first in fixed order; root strategies append
 * their helper mounts. The Handoff Controller walks handoff_entries() in the
 * same order to relocate them.
 */
class MountPlan {
public:
    void record(const MountEntry& entry);

    const std::vector<MountEntry>& entries() const { return entries_; }
    std::vector<MountEntry> handoff_entries() const;
    std::optional<MountEntry> find(const std::string& target) const;

private:
    std::vector<MountEntry> entries_;
};

// devtmpfs /dev, proc /proc, sysfs /sys, tmpfs /run, in that order
std::vector<MountEntry> virtual_fs_entries();

}  // namespace rdinit
