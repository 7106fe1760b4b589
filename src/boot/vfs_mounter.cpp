#include "vfs_mounter.hpp"
#include "../log.hpp"

namespace rdinit {

namespace {

struct DeviceNode {
    const char* path;
    DeviceNumber number;
    unsigned mode;
};

// The kernel opens /dev/console for PID 1 before devtmpfs exists
const DeviceNode initramfs_nodes[] = {
    {"/dev/console", {5, 1}, 0600},
    {"/dev/null", {1, 3}, 0666},
};

void ensure_device_nodes(Platform& platform) {
    if (!platform.make_directory("/dev")) {
        LOGW("Cannot create /dev: %s", platform.last_error().c_str());
        return;
    }
    for (const auto& node : initramfs_nodes) {
        if (platform.char_device_number(node.path))
            continue;
        if (!platform.make_char_device(node.path, node.number, node.mode)) {
            LOGW("Cannot create %s: %s", node.path, platform.last_error().c_str());
        }
    }
}

void mount_optional(Platform& platform, const MountEntry& entry) {
    if (!platform.mount(entry)) {
        LOGW("Optional mount %s failed: %s", entry.target.c_str(),
             platform.last_error().c_str());
    }
}

}  // namespace

MaybeFailure mount_virtual_filesystems(Platform& platform, MountPlan& plan) {
    ensure_device_nodes(platform);

    for (const auto& entry : virtual_fs_entries()) {
        if (!platform.mount(entry)) {
            std::string reason = "cannot mount " + entry.fstype + " on " + entry.target + ": " +
                                 platform.last_error();
            LOGE("%s", reason.c_str());
            return make_failure(BootStage::VirtFSMounted, FailureKind::VirtualFsMountFailed,
                                reason);
        }
        plan.record(entry);
        LOGD("Mounted %s on %s", entry.fstype.c_str(), entry.target.c_str());
    }

    // These live inside /dev and /run and travel with them on handoff
    mount_optional(platform, {"devpts", "/dev/pts", "devpts", "gid=5,mode=620,noexec,nosuid"});
    mount_optional(platform, {"tmpfs", "/dev/shm", "tmpfs", "mode=1777,nosuid,nodev"});
    for (const char* dir : {"/run/initramfs", "/run/lock"}) {
        if (!platform.make_directory(dir)) {
            LOGW("Cannot create %s: %s", dir, platform.last_error().c_str());
        }
    }

    // Lift kmsg rate limiting so early messages are not dropped
    if (!platform.write_file("/proc/sys/kernel/printk_devkmsg", "on\n")) {
        LOGD("Cannot set printk_devkmsg: %s", platform.last_error().c_str());
    }

    if (!platform.attach_kernel_log()) {
        LOGW("%s, logging to console only", platform.last_error().c_str());
    }
    return std::nullopt;
}

}  // namespace rdinit
