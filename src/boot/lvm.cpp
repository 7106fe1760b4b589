#include "lvm.hpp"
#include "../defs.hpp"
#include "../log.hpp"
#include "../utils.hpp"

namespace rdinit {

MaybeFailure activate_lvm(Platform& platform, const LvmSpec& spec) {
    if (!platform.has_program(LVM)) {
        std::string reason = "lvm is not available in the initramfs";
        LOGE("%s", reason.c_str());
        return make_failure(BootStage::RootAcquired, FailureKind::LvmActivationFailed, reason);
    }

    auto scan = platform.run({LVM, "vgscan", "--mknodes"});
    if (scan.exit_code != 0) {
        LOGW("vgscan failed: %s", trim(scan.stderr_str).c_str());
    }

    std::vector<std::string> args = {LVM, "vgchange", "-ay"};
    if (!spec.vg.empty())
        args.push_back(spec.vg);

    auto change = platform.run(args);
    if (change.exit_code != 0) {
        std::string reason = "vgchange -ay " + (spec.vg.empty() ? std::string("(all)") : spec.vg) +
                             " failed: " + trim(change.stderr_str);
        LOGE("%s", reason.c_str());
        return make_failure(BootStage::RootAcquired, FailureKind::LvmActivationFailed, reason);
    }

    LOGI("Activated volume group %s", spec.vg.empty() ? "(all)" : spec.vg.c_str());
    return std::nullopt;
}

std::optional<LvmSpec> lvm_volume_from_path(const std::string& path) {
    if (!starts_with(path, "/dev/"))
        return std::nullopt;
    std::string rest = path.substr(5);

    if (starts_with(rest, "mapper/")) {
        std::string name = rest.substr(7);
        // The first hyphen that is not part of a "--" pair separates vg from lv
        for (size_t i = 0; i < name.size(); ++i) {
            if (name[i] != '-')
                continue;
            if (i + 1 < name.size() && name[i + 1] == '-') {
                ++i;
                continue;
            }
            if (i == 0 || i + 1 == name.size())
                return std::nullopt;
            auto unescape = [](const std::string& text) {
                std::string out;
                for (size_t j = 0; j < text.size(); ++j) {
                    out += text[j];
                    if (text[j] == '-' && j + 1 < text.size() && text[j + 1] == '-')
                        ++j;
                }
                return out;
            };
            return LvmSpec{unescape(name.substr(0, i)), unescape(name.substr(i + 1))};
        }
        return std::nullopt;
    }

    auto parts = split(rest, '/');
    if (parts.size() != 2 || parts[0].empty() || parts[1].empty())
        return std::nullopt;
    // udev and devtmpfs directories that are not volume groups
    for (const char* reserved : {"disk", "block", "char", "bus", "input", "pts", "shm", "net",
                                 "snd", "dri", "cpu", "md", "fd"}) {
        if (parts[0] == reserved)
            return std::nullopt;
    }
    return LvmSpec{parts[0], parts[1]};
}

Outcome<std::string> acquire_lvm_volume(Platform& platform, DeviceResolver& resolver,
                                        const LvmSpec& spec, const DeviceSpec& root) {
    auto failure = activate_lvm(platform, spec);
    if (failure)
        return *failure;
    return resolver.resolve(root, BootStage::RootAcquired);
}

}  // namespace rdinit
