#pragma once

#include <optional>
#include <string>

#include "../core/boot_config.hpp"
#include "../core/failure.hpp"
#include "../platform/platform.hpp"
#include "device_resolver.hpp"

namespace rdinit {

// Scan and activate volume groups; safe to repeat
MaybeFailure activate_lvm(Platform& platform, const LvmSpec& spec);

// "/dev/<vg>/<lv>" or "/dev/mapper/<vg>-<lv>" ("--" escapes a hyphen in a name)
std::optional<LvmSpec> lvm_volume_from_path(const std::string& path);

// Activate, then wait for the logical volume named by root
Outcome<std::string> acquire_lvm_volume(Platform& platform, DeviceResolver& resolver,
                                        const LvmSpec& spec, const DeviceSpec& root);

}  // namespace rdinit
