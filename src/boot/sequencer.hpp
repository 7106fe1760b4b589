#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../core/boot_config.hpp"
#include "../core/failure.hpp"
#include "../core/mount_plan.hpp"
#include "../core/settings.hpp"
#include "../platform/platform.hpp"

namespace rdinit {

// Mutable record of one boot, owned by the sequencer
struct BootState {
    BootStage stage = BootStage::Init;
    std::vector<BootStage> history;
    std::string root_device;
    std::string squashfs_image;
    std::string luks_mapper;
    bool network_ready = false;
    std::string init_path;
    std::optional<BootConfig> config;
    std::optional<Failure> failure;
};

/**
 * The PID 1 boot pipeline.
 *
 * Runs every stage in order, stopping at break= checkpoints for a shell, and
 * ends either in the switch to the real root or in the rescue shell with the
 * failure that stopped it.
 */
class BootSequencer {
public:
    BootSequencer(Platform& platform, DeviceProbe& probe, Console& console, Settings settings)
        : platform_(platform), probe_(probe), console_(console), settings_(std::move(settings)) {}

    // kernel_args are the arguments the kernel passed to /init, forwarded to the real init
    const BootState& run(const std::vector<std::string>& kernel_args);

    const BootState& state() const { return state_; }
    const MountPlan& plan() const { return plan_; }

private:
    MaybeFailure boot(const std::vector<std::string>& kernel_args);
    void advance(BootStage stage);
    void checkpoint(const std::string& name);
    void enter_rescue(const Failure& failure);

    Platform& platform_;
    DeviceProbe& probe_;
    Console& console_;
    Settings settings_;
    MountPlan plan_;
    BootState state_;
};

}  // namespace rdinit
