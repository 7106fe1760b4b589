#include "root_assembler.hpp"
#include "../defs.hpp"
#include "../log.hpp"
#include "../utils.hpp"
#include "luks.hpp"
#include "lvm.hpp"
#include "squashfs.hpp"

namespace rdinit {

namespace {

Outcome<AcquiredRoot> as_root(const Outcome<std::string>& path) {
    if (!path)
        return path.failure();
    return AcquiredRoot{path.value(), ""};
}

}  // namespace

Outcome<AcquiredRoot> RootAssembler::acquire_luks(const LuksRoot& strategy) {
    auto mapper = unlock_luks(platform_, console_, resolver_, strategy.luks);
    if (!mapper)
        return mapper.failure();

    if (!strategy.lvm) {
        if (strategy.root == DeviceSpec::path(mapper.value()))
            return AcquiredRoot{mapper.value(), mapper.value()};

        // root= names something inside the container: a filesystem or an LVM volume
        if (strategy.root.kind == DeviceSpec::Kind::Path) {
            auto volume = lvm_volume_from_path(strategy.root.value);
            bool mapper_name = starts_with(strategy.root.value, "/dev/mapper/");
            if (volume && (!mapper_name || platform_.has_program(LVM))) {
                auto failure = activate_lvm(platform_, LvmSpec{volume->vg, ""});
                if (failure)
                    return *failure;
            }
        }
        auto root = resolver_.resolve(strategy.root, BootStage::RootAcquired);
        if (!root)
            return root.failure();
        return AcquiredRoot{root.value(), mapper.value()};
    }

    auto volume = acquire_lvm_volume(platform_, resolver_, *strategy.lvm, strategy.root);
    if (!volume)
        return volume.failure();
    return AcquiredRoot{volume.value(), mapper.value()};
}

Outcome<AcquiredRoot> RootAssembler::acquire() {
    LOGI("Acquiring root (%s)", strategy_name(config_.strategy));

    if (auto* plain = std::get_if<PlainRoot>(&config_.strategy)) {
        return as_root(resolver_.resolve(plain->device, BootStage::RootAcquired));
    }
    if (auto* luks = std::get_if<LuksRoot>(&config_.strategy)) {
        return acquire_luks(*luks);
    }
    if (auto* lvm = std::get_if<LvmRoot>(&config_.strategy)) {
        return as_root(acquire_lvm_volume(platform_, resolver_, lvm->lvm, lvm->root));
    }
    if (auto* squashfs = std::get_if<SquashfsRoot>(&config_.strategy)) {
        return as_root(acquire_squashfs_image(platform_, resolver_, plan_, squashfs->source,
                                              config_, settings_));
    }

    const auto& nfs = std::get<NetworkRoot>(config_.strategy).nfs;
    return AcquiredRoot{nfs.server + ":" + nfs.path, ""};
}

MaybeFailure RootAssembler::mount_block_device(const std::string& device) {
    std::string fstype = config_.rootfstype;
    if (fstype == "auto") {
        auto probed = probe_.probe_fstype(device);
        if (probed) {
            fstype = *probed;
            LOGD("Probed %s as %s", device.c_str(), fstype.c_str());
        }
    }

    std::string options = config_.read_only ? "ro" : "rw";
    if (!config_.rootflags.empty())
        options += "," + config_.rootflags;

    MountEntry entry{device, NEW_ROOT, fstype, options, false};
    LOGI("Mounting %s (%s, %s) on %s", device.c_str(), fstype.c_str(), options.c_str(),
         NEW_ROOT);
    if (!platform_.mount(entry)) {
        std::string reason = "cannot mount " + device + " on " + NEW_ROOT + ": " +
                             platform_.last_error();
        LOGE("%s", reason.c_str());
        return make_failure(BootStage::RootMounted, FailureKind::MountFailed, reason);
    }
    plan_.record(entry);
    return std::nullopt;
}

MaybeFailure RootAssembler::mount_nfs(const NfsSpec& nfs) {
    MountEntry entry = nfs_mount_entry(nfs.server, nfs.path, NEW_ROOT, nfs.options);
    entry.move_on_handoff = false;

    LOGI("Mounting %s on %s", entry.source.c_str(), NEW_ROOT);
    if (!platform_.mount(entry)) {
        std::string reason = "cannot mount " + entry.source + ": " + platform_.last_error();
        LOGE("%s", reason.c_str());
        return make_failure(BootStage::RootMounted, FailureKind::MountFailed, reason);
    }
    plan_.record(entry);
    return std::nullopt;
}

MaybeFailure RootAssembler::mount(const AcquiredRoot& root) {
    if (std::holds_alternative<SquashfsRoot>(config_.strategy)) {
        return mount_squashfs_root(platform_, resolver_, plan_, root.source, config_);
    }
    if (auto* network = std::get_if<NetworkRoot>(&config_.strategy)) {
        return mount_nfs(network->nfs);
    }
    return mount_block_device(root.source);
}

}  // namespace rdinit
