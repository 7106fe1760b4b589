#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "../defs.hpp"
#include "../log.hpp"

namespace rdinit {

// Defaults baked into the initramfs; the kernel command line overrides them.
struct Settings {
    unsigned device_timeout = DEFAULT_DEVICE_TIMEOUT;
    unsigned network_timeout = DEFAULT_NETWORK_TIMEOUT;
    unsigned settle_seconds = DEFAULT_SETTLE_SECONDS;
    unsigned toram_headroom_mb = DEFAULT_TORAM_HEADROOM_MB;
    uint64_t overlay_size = DEFAULT_OVERLAY_SIZE;
    std::vector<std::string> modules;
    std::string rescue_shell = DEFAULT_RESCUE_SHELL;
    LogLevel log_level = LogLevel::INFO;

    static Settings load_default();
    static Settings from_string(const std::string& content);
    // Missing file means defaults
    static Settings from_file(const std::string& path);
};

}  // namespace rdinit
