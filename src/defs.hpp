#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace rdinit {

// Version info
constexpr const char* RDINIT_VERSION = "1.0.0";

// Kernel interfaces
constexpr const char* CMDLINE_PATH = "/proc/cmdline";
constexpr const char* FILESYSTEMS_PATH = "/proc/filesystems";
constexpr const char* KMSG_PATH = "/dev/kmsg";
constexpr const char* SYS_BLOCK_DIR = "/sys/class/block";
constexpr const char* SYS_NET_DIR = "/sys/class/net";
constexpr const char* SYS_MODULE_DIR = "/sys/module";

// Initramfs configuration
constexpr const char* SETTINGS_PATH = "/etc/rdinit.conf";
constexpr const char* RESOLV_CONF_PATH = "/etc/resolv.conf";

// Mount points
constexpr const char* NEW_ROOT = "/mnt/root";
constexpr const char* MNT_RO = "/mnt/ro";
constexpr const char* MNT_RW = "/mnt/rw";
constexpr const char* MNT_TORAM = "/mnt/toram";
constexpr const char* MNT_BOOT = "/mnt/boot";
constexpr const char* MNT_NFS = "/mnt/nfs";
constexpr const char* OVERLAY_UPPER_NAME = "upper";
constexpr const char* OVERLAY_WORK_NAME = "work";

// Squashfs acquisition
constexpr const char* DEFAULT_SQUASHFS_NAME = "/rootfs.squashfs";
constexpr const char* DOWNLOAD_PATH = "/tmp/rootfs.squashfs";
constexpr const char* TORAM_IMAGE_NAME = "rootfs.squashfs";

// Tools
constexpr const char* DEFAULT_RESCUE_SHELL = "/bin/sh";
constexpr const char* MODPROBE = "modprobe";
constexpr const char* CRYPTSETUP = "cryptsetup";
constexpr const char* LVM = "lvm";
constexpr const char* NETWORK_MANAGER_PATH = "/usr/sbin/NetworkManager";
constexpr const char* NM_INITRD_GENERATOR_PATH = "/usr/libexec/nm-initrd-generator";
constexpr const char* NM_ONLINE_PATH = "/usr/bin/nm-online";

// Init
constexpr const char* DEFAULT_INIT = "/sbin/init";
const std::vector<std::string> INIT_CANDIDATES = {
    "/usr/lib/systemd/systemd", "/lib/systemd/systemd", "/sbin/init"};

// Defaults
constexpr unsigned DEFAULT_DEVICE_TIMEOUT = 30;
constexpr unsigned DEFAULT_NETWORK_TIMEOUT = 60;
constexpr unsigned DEFAULT_SETTLE_SECONDS = 2;
constexpr unsigned DEFAULT_TORAM_HEADROOM_MB = 100;
constexpr uint64_t DEFAULT_OVERLAY_SIZE = 2ULL * 1024 * 1024 * 1024;
constexpr unsigned LUKS_MAX_ATTEMPTS = 3;
constexpr unsigned MAX_SYMLINK_DEPTH = 40;

// Mount options for the virtual filesystems
constexpr const char* RUN_MOUNT_OPTIONS = "mode=0755,nodev,nosuid,strictatime";

// Kernel modules
const std::vector<std::string> STORAGE_DRIVERS = {
    "ahci", "nvme", "sd_mod", "usb_storage", "virtio_blk", "virtio_scsi"};
const std::vector<std::string> NETWORK_DRIVERS = {
    "af_packet", "e1000e", "igb", "ixgbe", "virtio_net"};

// Break checkpoints, in boot order
constexpr const char* BREAK_TOP = "top";
constexpr const char* BREAK_MODULES = "modules";
constexpr const char* BREAK_PREMOUNT = "premount";
constexpr const char* BREAK_MOUNT = "mount";
constexpr const char* BREAK_BOTTOM = "bottom";
constexpr const char* BREAK_INIT = "init";
const std::vector<std::string> BREAK_CHECKPOINTS = {
    BREAK_TOP, BREAK_MODULES, BREAK_PREMOUNT, BREAK_MOUNT, BREAK_BOTTOM, BREAK_INIT};

}  // namespace rdinit
