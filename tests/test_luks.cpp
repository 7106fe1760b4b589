#include "../src/boot/device_resolver.hpp"
#include "../src/boot/luks.hpp"
#include "../src/boot/lvm.hpp"
#include "fakes.hpp"
#include "test_framework.hpp"

using namespace rdinit;
using namespace rdinit::testing;

namespace {

LuksSpec test_spec() {
    LuksSpec spec;
    spec.source = *DeviceSpec::parse("UUID=abcd");
    spec.mapper_name = "luks-abcd";
    return spec;
}

ExecResult wrong_key() {
    return ExecResult{2, "", "No key available with this passphrase."};
}

}  // namespace

void test_unlock_on_second_attempt() {
    FakePlatform platform;
    FakeProbe probe(platform);
    FakeConsole console;
    probe.add("UUID", "abcd", "/dev/sda2", 0, "crypto_LUKS");
    platform.scripted["cryptsetup"] = {wrong_key(), ExecResult{0, "", ""}};
    console.secrets = {std::string("wrong"), std::string("right")};
    DeviceResolver resolver(platform, probe, 30);

    auto mapper = unlock_luks(platform, console, resolver, test_spec());
    RD_ASSERT(mapper.ok(), "second passphrase unlocks");
    RD_ASSERT_EQ(mapper.value(), "/dev/mapper/luks-abcd");
    RD_ASSERT_EQ(console.prompts, 2u);
    RD_ASSERT_EQ(console.messages.size(), 1u);
    RD_ASSERT_EQ(platform.inputs.back(), "right");

    const auto& args = platform.commands.back();
    RD_ASSERT_EQ(args[1], "open");
    RD_ASSERT_EQ(args[2], "/dev/sda2");
    RD_ASSERT_EQ(args[3], "luks-abcd");
}

void test_unlock_gives_up_after_three() {
    FakePlatform platform;
    FakeProbe probe(platform);
    FakeConsole console;
    probe.add("UUID", "abcd", "/dev/sda2", 0, "crypto_LUKS");
    platform.scripted["cryptsetup"] = {wrong_key(), wrong_key(), wrong_key(), ExecResult{0, "", ""}};
    console.secrets = {std::string("a"), std::string("b"), std::string("c"), std::string("d")};
    DeviceResolver resolver(platform, probe, 30);

    auto mapper = unlock_luks(platform, console, resolver, test_spec());
    RD_ASSERT(!mapper.ok(), "three wrong passphrases fail");
    RD_ASSERT(mapper.failure().kind == FailureKind::UnlockFailed, "wrong failure kind");
    RD_ASSERT_EQ(console.prompts, 3u);
    RD_ASSERT_EQ(platform.count_commands("cryptsetup"), 3u);
}

void test_existing_mapping_is_reused() {
    FakePlatform platform;
    FakeProbe probe(platform);
    FakeConsole console;
    platform.block_devices.insert("/dev/mapper/luks-abcd");
    DeviceResolver resolver(platform, probe, 30);

    auto mapper = unlock_luks(platform, console, resolver, test_spec());
    RD_ASSERT(mapper.ok(), "open mapping is reused");
    RD_ASSERT_EQ(console.prompts, 0u);
    RD_ASSERT(platform.commands.empty(), "cryptsetup not run");
}

void test_discard_option_passed() {
    FakePlatform platform;
    FakeProbe probe(platform);
    FakeConsole console;
    probe.add("UUID", "abcd", "/dev/sda2");
    console.secrets = {std::string("pw")};
    DeviceResolver resolver(platform, probe, 30);

    LuksSpec spec = test_spec();
    spec.options = "discard";
    auto mapper = unlock_luks(platform, console, resolver, spec);
    RD_ASSERT(mapper.ok(), "unlock");
    RD_ASSERT_EQ(platform.commands.back().back(), "--allow-discards");
}

void test_lvm_activation() {
    FakePlatform platform;
    FakeProbe probe(platform);
    platform.programs.insert("lvm");
    platform.block_devices.insert("/dev/vg0/root");
    DeviceResolver resolver(platform, probe, 30);

    auto volume = acquire_lvm_volume(platform, resolver, LvmSpec{"vg0", "root"},
                                     DeviceSpec::path("/dev/vg0/root"));
    RD_ASSERT(volume.ok(), "volume resolves after activation");
    RD_ASSERT_EQ(platform.commands.size(), 2u);
    RD_ASSERT_EQ(platform.commands[1][1], "vgchange");
    RD_ASSERT_EQ(platform.commands[1][3], "vg0");
}

void test_lvm_missing_tool() {
    FakePlatform platform;
    auto failure = activate_lvm(platform, LvmSpec{"vg0", "root"});
    RD_ASSERT(failure.has_value(), "no lvm binary");
    RD_ASSERT(failure->kind == FailureKind::LvmActivationFailed, "wrong failure kind");
}

void test_lvm_volume_paths() {
    auto plain = lvm_volume_from_path("/dev/vg0/root");
    RD_ASSERT(plain.has_value(), "/dev/<vg>/<lv>");
    RD_ASSERT_EQ(plain->vg, "vg0");
    RD_ASSERT_EQ(plain->lv, "root");

    auto mapped = lvm_volume_from_path("/dev/mapper/my--vg-home--lv");
    RD_ASSERT(mapped.has_value(), "/dev/mapper/<vg>-<lv>");
    RD_ASSERT_EQ(mapped->vg, "my-vg");
    RD_ASSERT_EQ(mapped->lv, "home-lv");

    RD_ASSERT(!lvm_volume_from_path("/dev/mapper/cryptroot").has_value(), "no separator");
    RD_ASSERT(!lvm_volume_from_path("/dev/sda1").has_value(), "partition");
    RD_ASSERT(!lvm_volume_from_path("/dev/disk/by-uuid/x").has_value(), "udev link");
    RD_ASSERT(!lvm_volume_from_path("/dev/md/root").has_value(), "md array");
}

RD_TEST_CASE(test_unlock_on_second_attempt, "LUKS: correct passphrase on attempt 2");
RD_TEST_CASE(test_unlock_gives_up_after_three, "LUKS: gives up after three attempts");
RD_TEST_CASE(test_existing_mapping_is_reused, "LUKS: existing mapping reused");
RD_TEST_CASE(test_discard_option_passed, "LUKS: discard option");
RD_TEST_CASE(test_lvm_activation, "LVM: activation then resolve");
RD_TEST_CASE(test_lvm_missing_tool, "LVM: missing lvm tool");
RD_TEST_CASE(test_lvm_volume_paths, "LVM: volume names from device paths");
