#pragma once

#include <string>
#include <vector>

#include "../core/boot_config.hpp"
#include "../core/failure.hpp"
#include "../core/settings.hpp"
#include "../platform/platform.hpp"

namespace rdinit {

// Modules without which the selected root strategy cannot work
std::vector<std::string> required_modules(const BootConfig& config);

// Drivers worth trying for this boot; failures are only logged
std::vector<std::string> optional_modules(const BootConfig& config, const Settings& settings);

// True when the kernel already has the feature, built in or loaded earlier
bool kernel_provides(Platform& platform, const std::string& module);

/**
 * Load required then optional modules, then wait settle_seconds for devices
 * to show up.
 *
 * A required module that cannot be loaded and is not provided by the kernel
 * yields ModuleLoadFailed.
 */
MaybeFailure load_modules(Platform& platform, const BootConfig& config,
                          const Settings& settings);

}  // namespace rdinit
