#pragma once

#include <string>

#include "../core/boot_config.hpp"
#include "../core/failure.hpp"
#include "../platform/platform.hpp"
#include "device_resolver.hpp"

namespace rdinit {

/**
 * Open a LUKS container and return the mapper device path.
 *
 * An existing mapping is reused without prompting. Otherwise the user gets
 * LUKS_MAX_ATTEMPTS passphrase prompts; each passphrase is fed to cryptsetup
 * on stdin. Exhausting them yields UnlockFailed.
 */
Outcome<std::string> unlock_luks(Platform& platform, Console& console,
                                 DeviceResolver& resolver, const LuksSpec& spec);

}  // namespace rdinit
