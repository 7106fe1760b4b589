#pragma once

#include <string>

#include "../core/boot_config.hpp"
#include "../core/failure.hpp"
#include "../core/mount_plan.hpp"
#include "../core/settings.hpp"
#include "../platform/platform.hpp"
#include "device_resolver.hpp"

namespace rdinit {

struct OverlayLayout {
    std::string lower;
    std::string upper;
    std::string work;
    std::string target;
};

// Mount entry for a read-only NFS export; the kernel needs the server address
MountEntry nfs_mount_entry(const std::string& server, const std::string& path,
                           const std::string& target, const std::string& extra_options);

/**
 * Locate or fetch the squashfs image and return its path.
 *
 * Helper mounts (boot device, NFS export, toram tmpfs) are recorded in plan as
 * move-on-handoff. With to_ram the returned path is the copy in RAM.
 */
Outcome<std::string> acquire_squashfs_image(Platform& platform, DeviceResolver& resolver,
                                            MountPlan& plan, const SquashfsSource& source,
                                            const BootConfig& config, const Settings& settings);

/**
 * Union-mount the prepared layers at layout.target.
 *
 * upper and work must live on the same filesystem; a stale work directory is
 * emptied first. Both checks happen before anything is mounted.
 */
MaybeFailure assemble_overlay(Platform& platform, MountPlan& plan, const OverlayLayout& layout);

// Loop-mount the image, prepare the upper layer and assemble the overlay at NEW_ROOT
MaybeFailure mount_squashfs_root(Platform& platform, DeviceResolver& resolver, MountPlan& plan,
                                 const std::string& image, const BootConfig& config);

}  // namespace rdinit
