#pragma once

#include <string>

#include "../core/boot_config.hpp"
#include "../core/failure.hpp"
#include "../core/mount_plan.hpp"
#include "../core/settings.hpp"
#include "../platform/platform.hpp"
#include "device_resolver.hpp"

namespace rdinit {

// What the acquire phase produced for the mount phase
struct AcquiredRoot {
    // Block device, squashfs image path or "server:/path"
    std::string source;
    // Set when a LUKS container was opened
    std::string mapper;
};

/**
 * Produces a mounted root filesystem at NEW_ROOT for the selected strategy.
 *
 * acquire() makes the backing storage available (RootAcquired); mount() puts
 * it at NEW_ROOT (RootMounted).
 */
class RootAssembler {
public:
    RootAssembler(Platform& platform, DeviceProbe& probe, Console& console,
                  DeviceResolver& resolver, MountPlan& plan, const BootConfig& config,
                  const Settings& settings)
        : platform_(platform),
          probe_(probe),
          console_(console),
          resolver_(resolver),
          plan_(plan),
          config_(config),
          settings_(settings) {}

    Outcome<AcquiredRoot> acquire();
    MaybeFailure mount(const AcquiredRoot& root);

private:
    Outcome<AcquiredRoot> acquire_luks(const LuksRoot& strategy);
    MaybeFailure mount_block_device(const std::string& device);
    MaybeFailure mount_nfs(const NfsSpec& nfs);

    Platform& platform_;
    DeviceProbe& probe_;
    Console& console_;
    DeviceResolver& resolver_;
    MountPlan& plan_;
    const BootConfig& config_;
    const Settings& settings_;
};

}  // namespace rdinit
