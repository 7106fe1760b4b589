#include "modules.hpp"
#include "../defs.hpp"
#include "../log.hpp"
#include "../utils.hpp"

#include <algorithm>

namespace rdinit {

namespace {

void add_unique(std::vector<std::string>& list, const std::string& name) {
    if (std::find(list.begin(), list.end(), name) == list.end())
        list.push_back(name);
}

bool modprobe(Platform& platform, const std::string& module) {
    auto result = platform.run({MODPROBE, module});
    if (result.exit_code != 0) {
        LOGD("modprobe %s failed (%d): %s", module.c_str(), result.exit_code,
             trim(result.stderr_str).c_str());
        return false;
    }
    return true;
}

}  // namespace

std::vector<std::string> required_modules(const BootConfig& config) {
    std::vector<std::string> modules;
    if (std::holds_alternative<SquashfsRoot>(config.strategy)) {
        modules = {"squashfs", "overlay", "loop"};
        if (std::holds_alternative<SquashfsNfsFile>(
                std::get<SquashfsRoot>(config.strategy).source)) {
            add_unique(modules, "nfs");
        }
    } else if (auto* luks = std::get_if<LuksRoot>(&config.strategy)) {
        modules = {"dm_crypt"};
        if (luks->lvm)
            add_unique(modules, "dm_mod");
    } else if (std::holds_alternative<LvmRoot>(config.strategy)) {
        modules = {"dm_mod"};
    } else if (std::holds_alternative<NetworkRoot>(config.strategy)) {
        modules = {"nfs"};
    }
    return modules;
}

std::vector<std::string> optional_modules(const BootConfig& config, const Settings& settings) {
    std::vector<std::string> modules;
    for (const auto& name : config.extra_modules)
        add_unique(modules, name);
    for (const auto& name : STORAGE_DRIVERS)
        add_unique(modules, name);
    if (config.needs_network()) {
        for (const auto& name : NETWORK_DRIVERS)
            add_unique(modules, name);
    }
    for (const auto& name : settings.modules)
        add_unique(modules, name);
    return modules;
}

bool kernel_provides(Platform& platform, const std::string& module) {
    auto filesystems = platform.read_file(FILESYSTEMS_PATH);
    if (filesystems) {
        for (const auto& line : split(*filesystems, '\n')) {
            auto fields = split(line, '\t');
            if (!fields.empty() && trim(fields.back()) == module)
                return true;
        }
    }
    return platform.exists(std::string(SYS_MODULE_DIR) + "/" + module);
}

MaybeFailure load_modules(Platform& platform, const BootConfig& config,
                          const Settings& settings) {
    bool have_modprobe = platform.has_program(MODPROBE);
    if (!have_modprobe) {
        LOGW("%s not found, relying on built-in drivers", MODPROBE);
    }

    for (const auto& module : required_modules(config)) {
        if (have_modprobe && modprobe(platform, module)) {
            LOGI("Loaded %s", module.c_str());
            continue;
        }
        if (kernel_provides(platform, module)) {
            LOGD("%s is built into the kernel", module.c_str());
            continue;
        }
        std::string reason = "required module " + module + " could not be loaded";
        LOGE("%s", reason.c_str());
        return make_failure(BootStage::ModulesLoaded, FailureKind::ModuleLoadFailed, reason);
    }

    if (have_modprobe) {
        for (const auto& module : optional_modules(config, settings)) {
            if (!modprobe(platform, module)) {
                LOGD("Optional module %s not loaded", module.c_str());
            }
        }
    }

    if (settings.settle_seconds > 0) {
        LOGD("Waiting %us for devices to settle", settings.settle_seconds);
        platform.sleep_seconds(settings.settle_seconds);
    }
    return std::nullopt;
}

}  // namespace rdinit
