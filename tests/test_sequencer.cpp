#include <algorithm>

#include "../src/boot/sequencer.hpp"
#include "fakes.hpp"
#include "test_framework.hpp"

using namespace rdinit;
using namespace rdinit::testing;

namespace {

Settings quiet_settings() {
    Settings settings;
    settings.settle_seconds = 0;
    settings.log_level = LogLevel::ERROR;
    return settings;
}

bool reached(const BootState& state, BootStage stage) {
    return std::find(state.history.begin(), state.history.end(), stage) != state.history.end();
}

const MountEntry* mount_at(const FakePlatform& platform, const std::string& target) {
    for (const auto& entry : platform.mounts) {
        if (entry.target == target)
            return &entry;
    }
    return nullptr;
}

// Position of the first command starting with words, or -1
int command_index(const FakePlatform& platform, const std::vector<std::string>& words) {
    for (size_t i = 0; i < platform.commands.size(); ++i) {
        const auto& args = platform.commands[i];
        if (args.size() >= words.size() && std::equal(words.begin(), words.end(), args.begin()))
            return static_cast<int>(i);
    }
    return -1;
}

}  // namespace

void test_plain_boot_reaches_switch_root() {
    FakePlatform platform;
    FakeProbe probe(platform);
    FakeConsole console;
    platform.boot_with("root=UUID=1111 rootfstype=ext4 ro");
    probe.add("UUID", "1111", "/dev/sda1");

    BootSequencer sequencer(platform, probe, console, quiet_settings());
    const BootState& state = sequencer.run({});

    RD_ASSERT(state.stage == BootStage::SwitchedRoot,
              "expected SwitchedRoot, got " << stage_name(state.stage));
    RD_ASSERT(!state.failure, "no failure expected");
    RD_ASSERT(!reached(state, BootStage::NetworkReady), "network not needed");
    RD_ASSERT_EQ(state.root_device, "/dev/sda1");
    RD_ASSERT_EQ(state.init_path, "/sbin/init");

    const MountEntry* root = mount_at(platform, "/mnt/root");
    RD_ASSERT(root != nullptr, "root mounted");
    RD_ASSERT_EQ(root->source, "/dev/sda1");
    RD_ASSERT_EQ(root->fstype, "ext4");
    RD_ASSERT_EQ(root->options, "ro");

    RD_ASSERT_EQ(platform.moves.size(), 4u);
    RD_ASSERT_EQ(platform.moves[0].second, "/mnt/root/dev");
    RD_ASSERT(platform.switched, "switch_root called");
    RD_ASSERT_EQ(platform.switch_argv.size(), 1u);
    RD_ASSERT(console.rescues.empty(), "no shell expected");
}

void test_squashfs_boot_with_overlay() {
    FakePlatform platform;
    FakeProbe probe(platform);
    FakeConsole console;
    platform.boot_with("squashfs=/images/root.squashfs overlay_size=2G");
    platform.programs.insert("modprobe");
    platform.regular_files["/images/root.squashfs"] = 700ULL * 1024 * 1024;

    BootSequencer sequencer(platform, probe, console, quiet_settings());
    const BootState& state = sequencer.run({});

    RD_ASSERT(state.stage == BootStage::SwitchedRoot,
              "expected SwitchedRoot: " << (state.failure ? state.failure->summary() : ""));
    RD_ASSERT_EQ(state.squashfs_image, "/images/root.squashfs");

    const MountEntry* upper = mount_at(platform, "/mnt/rw");
    RD_ASSERT(upper != nullptr, "upper layer mounted");
    RD_ASSERT_EQ(upper->options, "size=2147483648,mode=0755");
    RD_ASSERT(mount_at(platform, "/mnt/root")->fstype == "overlay", "overlay is the root");

    RD_ASSERT_EQ(platform.moves.size(), 6u);
    RD_ASSERT_EQ(platform.moves[4].first, "/mnt/ro");
    RD_ASSERT_EQ(platform.moves[5].first, "/mnt/rw");
    RD_ASSERT(platform.count_commands("modprobe") >= 3, "squashfs modules loaded");
}

void test_missing_device_drops_to_rescue() {
    FakePlatform platform;
    FakeProbe probe(platform);
    FakeConsole console;
    platform.boot_with("root=UUID=deadbeef");
    probe.add("UUID", "1111", "/dev/sda1");

    BootSequencer sequencer(platform, probe, console, quiet_settings());
    const BootState& state = sequencer.run({});

    RD_ASSERT(state.stage == BootStage::RescueShell, "boot must stop in the rescue shell");
    RD_ASSERT(state.failure.has_value(), "failure recorded");
    RD_ASSERT(state.failure->kind == FailureKind::DeviceNotFound, "wrong failure kind");
    RD_ASSERT(state.failure->stage == BootStage::RootAcquired, "wrong failure stage");
    RD_ASSERT_EQ(platform.now, 30u);
    RD_ASSERT(!platform.switched, "no switch after failure");
    RD_ASSERT(platform.moves.empty(), "no mounts moved after failure");

    RD_ASSERT_EQ(console.rescues.size(), 1u);
    RD_ASSERT(console.rescues[0].second == RescueMode::Fatal, "fatal rescue");
    RD_ASSERT(console.rescues[0].first.find("/dev/sda1") != std::string::npos,
              "banner lists visible devices");
}

void test_missing_root_drops_to_rescue() {
    FakePlatform platform;
    FakeProbe probe(platform);
    FakeConsole console;
    platform.boot_with("quiet");

    BootSequencer sequencer(platform, probe, console, quiet_settings());
    const BootState& state = sequencer.run({});

    RD_ASSERT(state.stage == BootStage::RescueShell, "rescue expected");
    RD_ASSERT(state.failure->kind == FailureKind::MissingRootSpecifier, "wrong failure kind");
    RD_ASSERT(state.failure->stage == BootStage::CmdlineParsed, "wrong failure stage");
    RD_ASSERT(reached(state, BootStage::VirtFSMounted), "virtual filesystems came first");
}

void test_break_point_resumes() {
    FakePlatform platform;
    FakeProbe probe(platform);
    FakeConsole console;
    platform.boot_with("root=UUID=1111 break=premount,init");
    probe.add("UUID", "1111", "/dev/sda1");

    BootSequencer sequencer(platform, probe, console, quiet_settings());
    const BootState& state = sequencer.run({});

    RD_ASSERT(state.stage == BootStage::SwitchedRoot, "boot resumes after the shell exits");
    RD_ASSERT_EQ(console.rescues.size(), 2u);
    RD_ASSERT(console.rescues[0].second == RescueMode::Checkpoint, "checkpoint shell");
    RD_ASSERT(console.rescues[0].first.find("premount") != std::string::npos, "premount first");
    RD_ASSERT(console.rescues[1].first.find("init") != std::string::npos, "init second");
}

void test_init_arguments_forwarded() {
    FakePlatform platform;
    FakeProbe probe(platform);
    FakeConsole console;
    platform.boot_with("root=/dev/vda1 -- emergency");
    platform.block_devices.insert("/dev/vda1");

    BootSequencer from_cmdline(platform, probe, console, quiet_settings());
    from_cmdline.run({});
    RD_ASSERT_EQ(platform.switch_argv.size(), 2u);
    RD_ASSERT_EQ(platform.switch_argv[1], "emergency");

    BootSequencer from_kernel(platform, probe, console, quiet_settings());
    from_kernel.run({"single"});
    RD_ASSERT_EQ(platform.switch_argv.size(), 2u);
    RD_ASSERT_EQ(platform.switch_argv[1], "single");
}

void test_luks_boot() {
    FakePlatform platform;
    FakeProbe probe(platform);
    FakeConsole console;
    platform.boot_with("root=/dev/mapper/luks-abcd rd.luks.uuid=abcd rw");
    platform.programs.insert("modprobe");
    probe.add("UUID", "abcd", "/dev/nvme0n1p3", 0, "crypto_LUKS");
    console.secrets = {std::string("secret")};

    BootSequencer sequencer(platform, probe, console, quiet_settings());
    const BootState& state = sequencer.run({});

    RD_ASSERT(state.stage == BootStage::SwitchedRoot,
              "LUKS boot: " << (state.failure ? state.failure->summary() : ""));
    RD_ASSERT_EQ(state.luks_mapper, "/dev/mapper/luks-abcd");
    RD_ASSERT_EQ(mount_at(platform, "/mnt/root")->source, "/dev/mapper/luks-abcd");
    RD_ASSERT_EQ(mount_at(platform, "/mnt/root")->options, "rw");
    RD_ASSERT_EQ(console.prompts, 1u);
}

void test_root_delay_limits_wait() {
    FakePlatform platform;
    FakeProbe probe(platform);
    FakeConsole console;
    platform.boot_with("root=UUID=x rootdelay=5");

    BootSequencer sequencer(platform, probe, console, quiet_settings());
    const BootState& state = sequencer.run({});

    RD_ASSERT(state.stage == BootStage::RescueShell, "rescue expected");
    RD_ASSERT(state.failure->kind == FailureKind::DeviceNotFound, "wrong failure kind");
    RD_ASSERT_EQ(platform.now, 5u);
}

void test_lvm_boot() {
    FakePlatform platform;
    FakeProbe probe(platform);
    FakeConsole console;
    platform.boot_with("root=/dev/vg0/root rd.lvm.vg=vg0");
    platform.programs = {"modprobe", "lvm"};
    platform.block_devices.insert("/dev/vg0/root");

    BootSequencer sequencer(platform, probe, console, quiet_settings());
    const BootState& state = sequencer.run({});

    RD_ASSERT(state.stage == BootStage::SwitchedRoot,
              "LVM boot: " << (state.failure ? state.failure->summary() : ""));
    int scan = command_index(platform, {"lvm", "vgscan", "--mknodes"});
    int change = command_index(platform, {"lvm", "vgchange", "-ay", "vg0"});
    RD_ASSERT(scan >= 0 && change > scan, "vgscan then vgchange");
    RD_ASSERT_EQ(mount_at(platform, "/mnt/root")->source, "/dev/vg0/root");
    RD_ASSERT(state.luks_mapper.empty(), "no LUKS container");
}

void test_lvm_on_luks_boot() {
    FakePlatform platform;
    FakeProbe probe(platform);
    FakeConsole console;
    platform.boot_with("root=/dev/vg0/root rd.luks.uuid=abcd rd.lvm.lv=vg0/root");
    platform.programs = {"modprobe", "lvm"};
    platform.block_devices.insert("/dev/vg0/root");
    probe.add("UUID", "abcd", "/dev/nvme0n1p3", 0, "crypto_LUKS");
    console.secrets = {std::string("secret")};

    BootSequencer sequencer(platform, probe, console, quiet_settings());
    const BootState& state = sequencer.run({});

    RD_ASSERT(state.stage == BootStage::SwitchedRoot,
              "LVM on LUKS: " << (state.failure ? state.failure->summary() : ""));
    int unlock = command_index(platform, {"cryptsetup", "open"});
    int change = command_index(platform, {"lvm", "vgchange", "-ay", "vg0"});
    RD_ASSERT(unlock >= 0 && change > unlock, "container opened before activation");
    RD_ASSERT_EQ(state.luks_mapper, "/dev/mapper/luks-abcd");
    RD_ASSERT_EQ(mount_at(platform, "/mnt/root")->source, "/dev/vg0/root");
}

void test_cryptdevice_with_volume_root() {
    FakePlatform platform;
    FakeProbe probe(platform);
    FakeConsole console;
    platform.boot_with("cryptdevice=UUID=abcd:cryptlvm root=/dev/vg0/root");
    platform.programs = {"modprobe", "lvm"};
    platform.block_devices.insert("/dev/vg0/root");
    probe.add("UUID", "abcd", "/dev/sda2", 0, "crypto_LUKS");
    console.secrets = {std::string("secret")};

    BootSequencer sequencer(platform, probe, console, quiet_settings());
    const BootState& state = sequencer.run({});

    RD_ASSERT(state.stage == BootStage::SwitchedRoot,
              "cryptdevice boot: " << (state.failure ? state.failure->summary() : ""));
    int unlock = command_index(platform, {"cryptsetup", "open", "/dev/sda2", "cryptlvm"});
    int change = command_index(platform, {"lvm", "vgchange", "-ay", "vg0"});
    RD_ASSERT(unlock >= 0 && change > unlock, "volume group activated after unlocking");
    RD_ASSERT_EQ(state.luks_mapper, "/dev/mapper/cryptlvm");
    RD_ASSERT_EQ(mount_at(platform, "/mnt/root")->source, "/dev/vg0/root");
}

void test_cryptdevice_with_filesystem_uuid_root() {
    FakePlatform platform;
    FakeProbe probe(platform);
    FakeConsole console;
    platform.boot_with("cryptdevice=UUID=abcd:cryptroot root=UUID=f00d");
    platform.programs.insert("modprobe");
    probe.add("UUID", "abcd", "/dev/sda2", 0, "crypto_LUKS");
    probe.add("UUID", "f00d", "/dev/mapper/cryptroot");
    console.secrets = {std::string("secret")};

    BootSequencer sequencer(platform, probe, console, quiet_settings());
    const BootState& state = sequencer.run({});

    RD_ASSERT(state.stage == BootStage::SwitchedRoot,
              "filesystem UUID root: " << (state.failure ? state.failure->summary() : ""));
    RD_ASSERT_EQ(mount_at(platform, "/mnt/root")->source, "/dev/mapper/cryptroot");
    RD_ASSERT_EQ(platform.count_commands("lvm"), 0u);
}

void test_nfs_boot() {
    FakePlatform platform;
    FakeProbe probe(platform);
    FakeConsole console;
    platform.boot_with("root=/dev/nfs nfsroot=10.0.0.5:/export/root ip=dhcp");
    platform.programs = {"modprobe", "udhcpc"};
    platform.listings["/sys/class/net"] = {"lo", "eth0"};
    platform.global_address = true;

    BootSequencer sequencer(platform, probe, console, quiet_settings());
    const BootState& state = sequencer.run({});

    RD_ASSERT(state.stage == BootStage::SwitchedRoot,
              "NFS boot: " << (state.failure ? state.failure->summary() : ""));
    RD_ASSERT(state.network_ready, "network brought up");
    RD_ASSERT(reached(state, BootStage::NetworkReady), "NetworkReady reached");
    const MountEntry* root = mount_at(platform, "/mnt/root");
    RD_ASSERT_EQ(root->source, "10.0.0.5:/export/root");
    RD_ASSERT_EQ(root->fstype, "nfs");
    RD_ASSERT_EQ(root->options, "ro,nolock,addr=10.0.0.5");
}

void test_unreachable_nfs_root() {
    FakePlatform platform;
    FakeProbe probe(platform);
    FakeConsole console;
    platform.boot_with("root=/dev/nfs nfsroot=10.0.0.5:/export/root ip=dhcp");
    platform.programs = {"modprobe", "udhcpc"};
    platform.listings["/sys/class/net"] = {"eth0"};

    Settings settings = quiet_settings();
    settings.network_timeout = 3;
    BootSequencer sequencer(platform, probe, console, settings);
    const BootState& state = sequencer.run({});

    RD_ASSERT(state.stage == BootStage::RescueShell, "rescue expected");
    RD_ASSERT(state.failure->kind == FailureKind::NetworkFailed, "wrong failure kind");
    RD_ASSERT(mount_at(platform, "/mnt/root") == nullptr, "root never mounted");
}

RD_TEST_CASE(test_plain_boot_reaches_switch_root, "Sequencer: plain UUID root");
RD_TEST_CASE(test_squashfs_boot_with_overlay, "Sequencer: squashfs with 2G overlay");
RD_TEST_CASE(test_missing_device_drops_to_rescue, "Sequencer: missing device rescue");
RD_TEST_CASE(test_missing_root_drops_to_rescue, "Sequencer: missing root= rescue");
RD_TEST_CASE(test_break_point_resumes, "Sequencer: break points resume");
RD_TEST_CASE(test_init_arguments_forwarded, "Sequencer: init arguments");
RD_TEST_CASE(test_luks_boot, "Sequencer: LUKS root");
RD_TEST_CASE(test_root_delay_limits_wait, "Sequencer: rootdelay timeout");
RD_TEST_CASE(test_lvm_boot, "Sequencer: LVM root");
RD_TEST_CASE(test_lvm_on_luks_boot, "Sequencer: LVM on LUKS root");
RD_TEST_CASE(test_cryptdevice_with_volume_root, "Sequencer: cryptdevice with volume root");
RD_TEST_CASE(test_cryptdevice_with_filesystem_uuid_root, "Sequencer: cryptdevice with UUID root");
RD_TEST_CASE(test_nfs_boot, "Sequencer: NFS root");
RD_TEST_CASE(test_unreachable_nfs_root, "Sequencer: unreachable NFS root");
