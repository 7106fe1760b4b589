#include "../src/boot/device_resolver.hpp"
#include "../src/boot/squashfs.hpp"
#include "../src/defs.hpp"
#include "fakes.hpp"
#include "test_framework.hpp"

using namespace rdinit;
using namespace rdinit::testing;

void test_overlay_rejects_split_filesystems() {
    FakePlatform platform;
    platform.fs_ids["/mnt/rw/upper"] = 10;
    platform.fs_ids["/mnt/rw/work"] = 11;
    MountPlan plan;

    auto failure =
        assemble_overlay(platform, plan, {"/mnt/ro", "/mnt/rw/upper", "/mnt/rw/work", "/mnt/root"});
    RD_ASSERT(failure.has_value(), "different filesystems must fail");
    RD_ASSERT(failure->kind == FailureKind::OverlayLayoutInvalid, "wrong failure kind");
    RD_ASSERT(platform.mounts.empty(), "nothing may be mounted before the check");
    RD_ASSERT(plan.entries().empty(), "nothing recorded");
}

void test_overlay_clears_stale_workdir() {
    FakePlatform platform;
    platform.listings["/mnt/rw/work"] = {"work"};
    MountPlan plan;

    auto failure =
        assemble_overlay(platform, plan, {"/mnt/ro", "/mnt/rw/upper", "/mnt/rw/work", "/mnt/root"});
    RD_ASSERT(!failure, "stale workdir is cleared, not fatal");
    RD_ASSERT_EQ(platform.cleared.size(), 1u);
    RD_ASSERT_EQ(platform.cleared[0], "/mnt/rw/work");
    RD_ASSERT_EQ(platform.mounts.size(), 1u);
    RD_ASSERT_EQ(platform.mounts[0].fstype, "overlay");
    RD_ASSERT_EQ(platform.mounts[0].options,
                 "lowerdir=/mnt/ro,upperdir=/mnt/rw/upper,workdir=/mnt/rw/work");
}

void test_squashfs_root_with_tmpfs_upper() {
    FakePlatform platform;
    FakeProbe probe(platform);
    platform.regular_files["/images/root.squashfs"] = 300ULL * 1024 * 1024;
    DeviceResolver resolver(platform, probe, 30);
    MountPlan plan;

    BootConfig config;
    config.overlay_size_bytes = 2ULL * 1024 * 1024 * 1024;

    auto failure = mount_squashfs_root(platform, resolver, plan, "/images/root.squashfs", config);
    RD_ASSERT(!failure, "squashfs root should mount: " << (failure ? failure->summary() : ""));

    auto targets = platform.mount_targets();
    RD_ASSERT_EQ(targets.size(), 3u);
    RD_ASSERT_EQ(targets[0], "/mnt/ro");
    RD_ASSERT_EQ(targets[1], "/mnt/rw");
    RD_ASSERT_EQ(targets[2], "/mnt/root");
    RD_ASSERT_EQ(platform.mounts[0].source, "/dev/loop0");
    RD_ASSERT_EQ(platform.mounts[0].fstype, "squashfs");
    RD_ASSERT_EQ(platform.mounts[1].fstype, "tmpfs");
    RD_ASSERT_EQ(platform.mounts[1].options, "size=2147483648,mode=0755");

    // Layers travel into the new root; the union mount is the root itself
    auto handoff = plan.handoff_entries();
    RD_ASSERT_EQ(handoff.size(), 2u);
    RD_ASSERT(!plan.find("/mnt/root")->move_on_handoff, "overlay stays where it is");
}

void test_persistent_upper_layer() {
    FakePlatform platform;
    FakeProbe probe(platform);
    probe.add("LABEL", "persist", "/dev/sdb2", 0, "ext4");
    platform.regular_files["/root.sqfs"] = 1024;
    DeviceResolver resolver(platform, probe, 30);
    MountPlan plan;

    BootConfig config;
    config.persistent_device_spec = "LABEL=persist";
    auto failure = mount_squashfs_root(platform, resolver, plan, "/root.sqfs", config);
    RD_ASSERT(!failure, "persistent layer should mount");
    RD_ASSERT_EQ(platform.mounts[1].source, "/dev/sdb2");
    RD_ASSERT_EQ(platform.mounts[1].options, "rw");
}

void test_toram_copies_image() {
    FakePlatform platform;
    FakeProbe probe(platform);
    platform.regular_files["/images/root.squashfs"] = 300ULL * 1024 * 1024;
    DeviceResolver resolver(platform, probe, 30);
    MountPlan plan;

    BootConfig config;
    config.to_ram = true;
    auto image = acquire_squashfs_image(platform, resolver, plan,
                                        SquashfsLocalFile{"/images/root.squashfs"}, config,
                                        Settings::load_default());
    RD_ASSERT(image.ok(), "toram should succeed");
    RD_ASSERT_EQ(image.value(), "/mnt/toram/rootfs.squashfs");
    RD_ASSERT_EQ(platform.mounts.size(), 1u);
    RD_ASSERT_EQ(platform.mounts[0].options, "size=400M,mode=0755");
    RD_ASSERT(platform.is_regular_file("/mnt/toram/rootfs.squashfs"), "copy made");
}

void test_missing_image_is_unavailable() {
    FakePlatform platform;
    FakeProbe probe(platform);
    DeviceResolver resolver(platform, probe, 30);
    MountPlan plan;

    auto image = acquire_squashfs_image(platform, resolver, plan,
                                        SquashfsLocalFile{"/nope.squashfs"}, BootConfig(),
                                        Settings::load_default());
    RD_ASSERT(!image.ok(), "missing image");
    RD_ASSERT(image.failure().kind == FailureKind::SquashfsUnavailable, "wrong failure kind");
}

void test_image_on_boot_device() {
    FakePlatform platform;
    FakeProbe probe(platform);
    probe.add("LABEL", "LIVE", "/dev/sr0", 0, "iso9660");
    platform.regular_files["/mnt/boot/live/fs.squashfs"] = 4096;
    DeviceResolver resolver(platform, probe, 30);
    MountPlan plan;

    auto source = parse_squashfs_source("LABEL=LIVE:/live/fs.squashfs");
    auto image =
        acquire_squashfs_image(platform, resolver, plan, source, BootConfig(), Settings());
    RD_ASSERT(image.ok(), "image on boot device: " << (image.ok() ? "" : image.failure().reason));
    RD_ASSERT_EQ(image.value(), "/mnt/boot/live/fs.squashfs");
    RD_ASSERT(plan.find("/mnt/boot")->move_on_handoff, "boot device travels on handoff");
}

RD_TEST_CASE(test_overlay_rejects_split_filesystems, "Overlay: upper/work on different fs");
RD_TEST_CASE(test_overlay_clears_stale_workdir, "Overlay: stale workdir cleared");
RD_TEST_CASE(test_squashfs_root_with_tmpfs_upper, "Squashfs: tmpfs upper layer of 2G");
RD_TEST_CASE(test_persistent_upper_layer, "Squashfs: persistent upper layer");
RD_TEST_CASE(test_toram_copies_image, "Squashfs: toram copy");
RD_TEST_CASE(test_missing_image_is_unavailable, "Squashfs: missing image");
RD_TEST_CASE(test_image_on_boot_device, "Squashfs: image on boot device");
