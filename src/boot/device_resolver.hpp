#pragma once

#include <map>
#include <string>

#include "../core/boot_config.hpp"
#include "../core/failure.hpp"
#include "../platform/platform.hpp"

namespace rdinit {

/**
 * Turns device specifiers into block device paths, waiting for them to appear.
 *
 * Polls once per second. A specifier that resolved once is answered from the
 * cache for the rest of the boot. When several devices carry the same tag the
 * first one the probe reports wins.
 */
class DeviceResolver {
public:
    DeviceResolver(Platform& platform, DeviceProbe& probe, unsigned timeout_seconds)
        : platform_(platform), probe_(probe), timeout_seconds_(timeout_seconds) {}

    void set_wait_forever(bool forever) { wait_forever_ = forever; }

    // stage is reported in the DeviceNotFound failure
    Outcome<std::string> resolve(const DeviceSpec& spec, BootStage stage);

    std::optional<std::string> cached(const DeviceSpec& spec) const;

private:
    std::optional<std::string> probe_once(const DeviceSpec& spec);
    std::vector<std::string> snapshot();

    Platform& platform_;
    DeviceProbe& probe_;
    unsigned timeout_seconds_;
    bool wait_forever_ = false;
    std::map<std::string, std::string> cache_;
};

}  // namespace rdinit
