#include "sequencer.hpp"
#include "../defs.hpp"
#include "../log.hpp"
#include "device_resolver.hpp"
#include "handoff.hpp"
#include "modules.hpp"
#include "network.hpp"
#include "rescue.hpp"
#include "root_assembler.hpp"
#include "vfs_mounter.hpp"

namespace rdinit {

void BootSequencer::advance(BootStage stage) {
    state_.stage = stage;
    state_.history.push_back(stage);
    LOGD("Stage %s reached", stage_name(stage));
}

void BootSequencer::checkpoint(const std::string& name) {
    if (!state_.config || !state_.config->breaks_at(name))
        return;
    LOGI("Break point: %s", name.c_str());
    console_.rescue_shell(checkpoint_banner(name, state_.stage), RescueMode::Checkpoint);
}

void BootSequencer::enter_rescue(const Failure& failure) {
    LOGE("Boot failed: %s", failure.summary().c_str());
    state_.failure = failure;
    advance(BootStage::RescueShell);
    console_.rescue_shell(failure_banner(failure), RescueMode::Fatal);
}

MaybeFailure BootSequencer::boot(const std::vector<std::string>& kernel_args) {
    log_set_level(settings_.log_level);

    auto failure = mount_virtual_filesystems(platform_, plan_);
    if (failure)
        return failure;
    advance(BootStage::VirtFSMounted);

    auto cmdline = platform_.read_file(CMDLINE_PATH);
    if (!cmdline) {
        LOGW("Cannot read %s: %s", CMDLINE_PATH, platform_.last_error().c_str());
        cmdline = std::string();
    }
    auto parsed = parse_cmdline(*cmdline, settings_);
    if (!parsed)
        return parsed.failure();
    state_.config = parsed.value();
    const BootConfig& config = *state_.config;

    if (config.debug && log_get_level() > LogLevel::DEBUG)
        log_set_level(LogLevel::DEBUG);
    LOGD("Boot configuration:\n%s", describe_config(config).c_str());
    advance(BootStage::CmdlineParsed);
    checkpoint(BREAK_TOP);

    failure = load_modules(platform_, config, settings_);
    if (failure)
        return failure;
    advance(BootStage::ModulesLoaded);
    checkpoint(BREAK_MODULES);

    if (config.needs_network()) {
        // Only a network root insists on confirmed reachability
        NetworkPolicy policy = std::holds_alternative<NetworkRoot>(config.strategy)
                                   ? NetworkPolicy::RequireOnline
                                   : NetworkPolicy::BestEffort;
        failure = configure_network(platform_, config, settings_, policy);
        if (failure)
            return failure;
        state_.network_ready = true;
        advance(BootStage::NetworkReady);
    }
    checkpoint(BREAK_PREMOUNT);

    unsigned timeout = config.root_delay_seconds ? *config.root_delay_seconds
                                                 : settings_.device_timeout;
    DeviceResolver resolver(platform_, probe_, timeout);
    resolver.set_wait_forever(config.root_wait_forever);

    RootAssembler assembler(platform_, probe_, console_, resolver, plan_, config, settings_);
    auto acquired = assembler.acquire();
    if (!acquired)
        return acquired.failure();
    if (std::holds_alternative<SquashfsRoot>(config.strategy)) {
        state_.squashfs_image = acquired.value().source;
    } else {
        state_.root_device = acquired.value().source;
    }
    state_.luks_mapper = acquired.value().mapper;
    advance(BootStage::RootAcquired);
    checkpoint(BREAK_MOUNT);

    failure = assembler.mount(acquired.value());
    if (failure)
        return failure;
    advance(BootStage::RootMounted);
    checkpoint(BREAK_BOTTOM);

    auto init = resolve_init(platform_, NEW_ROOT, config.init);
    if (!init)
        return init.failure();
    state_.init_path = init.value();
    checkpoint(BREAK_INIT);

    failure = move_mounts(platform_, plan_, NEW_ROOT);
    if (failure)
        return failure;
    advance(BootStage::FSMoved);

    std::vector<std::string> argv = {state_.init_path};
    const auto& extra = kernel_args.empty() ? config.init_args : kernel_args;
    argv.insert(argv.end(), extra.begin(), extra.end());

    failure = switch_to_root(platform_, NEW_ROOT, state_.init_path, argv);
    if (failure)
        return failure;
    advance(BootStage::SwitchedRoot);
    return std::nullopt;
}

const BootState& BootSequencer::run(const std::vector<std::string>& kernel_args) {
    LOGI("rdinit %s starting", RDINIT_VERSION);
    auto failure = boot(kernel_args);
    if (failure)
        enter_rescue(*failure);
    return state_;
}

}  // namespace rdinit
