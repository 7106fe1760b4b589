#include "luks.hpp"
#include "../defs.hpp"
#include "../log.hpp"
#include "../utils.hpp"

namespace rdinit {

Outcome<std::string> unlock_luks(Platform& platform, Console& console,
                                 DeviceResolver& resolver, const LuksSpec& spec) {
    std::string mapper = spec.mapper_path();
    if (platform.is_block_device(mapper)) {
        LOGI("%s is already open", mapper.c_str());
        return mapper;
    }

    auto device = resolver.resolve(spec.source, BootStage::RootAcquired);
    if (!device)
        return device.failure();

    std::vector<std::string> args = {CRYPTSETUP, "open", device.value(), spec.mapper_name,
                                     "--key-file=-"};
    for (const auto& option : split(spec.options, ',')) {
        if (option == "discard" || option == "allow-discards") {
            args.push_back("--allow-discards");
        } else if (!option.empty()) {
            LOGW("Ignoring unsupported LUKS option %s", option.c_str());
        }
    }

    std::string prompt = "Passphrase for " + device.value() + " (" + spec.mapper_name + "): ";
    for (unsigned attempt = 1; attempt <= LUKS_MAX_ATTEMPTS; ++attempt) {
        auto passphrase = console.read_secret(prompt);
        if (!passphrase) {
            LOGW("No passphrase entered");
            break;
        }

        auto result = platform.run(args, *passphrase);
        if (result.exit_code == 0) {
            LOGI("Unlocked %s as %s", device.value().c_str(), mapper.c_str());
            return mapper;
        }

        LOGW("Unlock attempt %u/%u failed: %s", attempt, LUKS_MAX_ATTEMPTS,
             trim(result.stderr_str).c_str());
        console.message("Wrong passphrase.");
    }

    std::string reason = "cannot unlock " + device.value() + " after " +
                         std::to_string(LUKS_MAX_ATTEMPTS) + " attempts";
    LOGE("%s", reason.c_str());
    return make_failure(BootStage::RootAcquired, FailureKind::UnlockFailed, reason);
}

}  // namespace rdinit
