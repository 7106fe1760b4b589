#include "squashfs.hpp"
#include "../defs.hpp"
#include "../log.hpp"
#include "../utils.hpp"

namespace rdinit {

namespace {

constexpr uint64_t MIB = 1024 * 1024;

Failure unavailable(const std::string& reason) {
    LOGE("%s", reason.c_str());
    return make_failure(BootStage::RootAcquired, FailureKind::SquashfsUnavailable, reason);
}

Failure mount_failed(Platform& platform, const std::string& what) {
    std::string reason = what + ": " + platform.last_error();
    LOGE("%s", reason.c_str());
    return make_failure(BootStage::RootMounted, FailureKind::MountFailed, reason);
}

Failure layout_invalid(const std::string& reason) {
    LOGE("%s", reason.c_str());
    return make_failure(BootStage::RootMounted, FailureKind::OverlayLayoutInvalid, reason);
}

// Visitor producing the image path for each acquisition method
class ImageLocator {
public:
    ImageLocator(Platform& platform, DeviceResolver& resolver, MountPlan& plan)
        : platform_(platform), resolver_(resolver), plan_(plan) {}

    Outcome<std::string> operator()(const SquashfsLocalFile& source) {
        return checked(source.path);
    }

    Outcome<std::string> operator()(const SquashfsDeviceFile& source) {
        auto device = resolver_.resolve(source.device, BootStage::RootAcquired);
        if (!device)
            return device.failure();

        MountEntry entry{device.value(), MNT_BOOT, "auto", "ro", true};
        if (!platform_.mount(entry)) {
            return unavailable("cannot mount boot device " + device.value() + ": " +
                               platform_.last_error());
        }
        plan_.record(entry);
        return checked(join_path(MNT_BOOT, source.path));
    }

    Outcome<std::string> operator()(const SquashfsNfsFile& source) {
        if (source.path.empty() || source.path[0] != '/')
            return unavailable("NFS image path must be absolute: " + source.path);

        MountEntry entry =
            nfs_mount_entry(source.server, dirname_of(source.path), MNT_NFS, "");
        if (!platform_.mount(entry)) {
            return unavailable("cannot mount " + entry.source + ": " + platform_.last_error());
        }
        plan_.record(entry);
        return checked(join_path(MNT_NFS, basename_of(source.path)));
    }

    Outcome<std::string> operator()(const SquashfsHttpFile& source) {
        if (!platform_.make_directory(dirname_of(DOWNLOAD_PATH))) {
            return unavailable("cannot create download directory: " + platform_.last_error());
        }

        std::vector<std::string> args;
        if (platform_.has_program("wget")) {
            args = {"wget", "-q", "-O", DOWNLOAD_PATH, source.url};
        } else if (platform_.has_program("curl")) {
            args = {"curl", "-fsSL", "-o", DOWNLOAD_PATH, source.url};
        } else {
            return unavailable("neither wget nor curl is available to fetch " + source.url);
        }

        LOGI("Downloading %s", source.url.c_str());
        auto result = platform_.run(args);
        if (result.exit_code != 0) {
            return unavailable("download of " + source.url + " failed: " +
                               trim(result.stderr_str));
        }
        return checked(DOWNLOAD_PATH);
    }

private:
    Outcome<std::string> checked(const std::string& path) {
        if (!platform_.is_regular_file(path))
            return unavailable("squashfs image " + path + " not found");
        return path;
    }

    Platform& platform_;
    DeviceResolver& resolver_;
    MountPlan& plan_;
};

Outcome<std::string> copy_to_ram(Platform& platform, MountPlan& plan, const std::string& image,
                                 const Settings& settings) {
    auto size = platform.file_size(image);
    if (!size)
        return unavailable("cannot size " + image + ": " + platform.last_error());

    uint64_t tmpfs_mb = *size / MIB + settings.toram_headroom_mb;
    MountEntry entry{"tmpfs", MNT_TORAM, "tmpfs",
                     "size=" + std::to_string(tmpfs_mb) + "M,mode=0755", true};
    if (!platform.mount(entry)) {
        return unavailable("cannot mount toram tmpfs: " + platform.last_error());
    }
    plan.record(entry);

    std::string copy = join_path(MNT_TORAM, TORAM_IMAGE_NAME);
    LOGI("Copying %s to RAM (%lluM)", image.c_str(),
         static_cast<unsigned long long>(*size / MIB));
    if (!platform.copy_file(image, copy)) {
        return unavailable("copy to RAM failed: " + platform.last_error());
    }
    return copy;
}

}  // namespace

MountEntry nfs_mount_entry(const std::string& server, const std::string& path,
                           const std::string& target, const std::string& extra_options) {
    std::string options = "ro,nolock,addr=" + server;
    if (!extra_options.empty())
        options += "," + extra_options;
    return MountEntry{server + ":" + path, target, "nfs", options, true};
}

Outcome<std::string> acquire_squashfs_image(Platform& platform, DeviceResolver& resolver,
                                            MountPlan& plan, const SquashfsSource& source,
                                            const BootConfig& config, const Settings& settings) {
    ImageLocator locator(platform, resolver, plan);
    auto image = std::visit(locator, source);
    if (!image)
        return image;

    LOGI("Squashfs image: %s", image.value().c_str());
    if (config.to_ram)
        return copy_to_ram(platform, plan, image.value(), settings);
    return image;
}

MaybeFailure assemble_overlay(Platform& platform, MountPlan& plan, const OverlayLayout& layout) {
    auto upper_fs = platform.filesystem_id(layout.upper);
    auto work_fs = platform.filesystem_id(layout.work);
    if (!upper_fs || !work_fs) {
        return layout_invalid("cannot stat overlay directories: " + platform.last_error());
    }
    if (*upper_fs != *work_fs) {
        return layout_invalid("upperdir " + layout.upper + " and workdir " + layout.work +
                              " are on different filesystems");
    }

    auto stale = platform.list_directory(layout.work);
    if (!stale) {
        return layout_invalid("cannot read workdir " + layout.work + ": " +
                              platform.last_error());
    }
    if (!stale->empty()) {
        LOGW("Clearing stale workdir %s", layout.work.c_str());
        if (!platform.clear_directory(layout.work)) {
            return layout_invalid("cannot clear workdir " + layout.work + ": " +
                                  platform.last_error());
        }
        auto left = platform.list_directory(layout.work);
        if (!left || !left->empty()) {
            return layout_invalid("workdir " + layout.work + " is not empty");
        }
    }

    MountEntry entry{"overlay", layout.target, "overlay",
                     "lowerdir=" + layout.lower + ",upperdir=" + layout.upper +
                         ",workdir=" + layout.work,
                     false};
    if (!platform.mount(entry)) {
        return mount_failed(platform, "cannot mount overlay on " + layout.target);
    }
    plan.record(entry);
    return std::nullopt;
}

MaybeFailure mount_squashfs_root(Platform& platform, DeviceResolver& resolver, MountPlan& plan,
                                 const std::string& image, const BootConfig& config) {
    auto loop = platform.attach_loop(image);
    if (!loop) {
        return mount_failed(platform, "cannot attach " + image + " to a loop device");
    }

    MountEntry lower{*loop, MNT_RO, "squashfs", "ro", true};
    if (!platform.mount(lower)) {
        return mount_failed(platform, "cannot mount squashfs " + image);
    }
    plan.record(lower);

    MountEntry upper;
    if (!config.persistent_device_spec.empty()) {
        auto spec = DeviceSpec::parse(config.persistent_device_spec);
        if (!spec) {
            return layout_invalid("persistent=" + config.persistent_device_spec +
                                  " is not a device specifier");
        }
        auto device = resolver.resolve(*spec, BootStage::RootMounted);
        if (!device)
            return device.failure();
        upper = MountEntry{device.value(), MNT_RW, "auto", "rw", true};
        LOGI("Using %s for persistent changes", device.value().c_str());
    } else {
        upper = MountEntry{"tmpfs", MNT_RW, "tmpfs",
                           "size=" + std::to_string(config.overlay_size_bytes) + ",mode=0755",
                           true};
    }
    if (!platform.mount(upper)) {
        return mount_failed(platform, "cannot mount overlay upper layer on " + upper.target);
    }
    plan.record(upper);

    OverlayLayout layout{MNT_RO, join_path(MNT_RW, OVERLAY_UPPER_NAME),
                         join_path(MNT_RW, OVERLAY_WORK_NAME), NEW_ROOT};
    if (!platform.make_directory(layout.upper) || !platform.make_directory(layout.work)) {
        return mount_failed(platform, "cannot create overlay directories");
    }

    return assemble_overlay(platform, plan, layout);
}

}  // namespace rdinit
