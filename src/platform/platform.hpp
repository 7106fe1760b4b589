#pragma once

#include <sys/types.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../core/mount_plan.hpp"
#include "../utils.hpp"

namespace rdinit {

struct DeviceNumber {
    unsigned major;
    unsigned minor;
};

/**
 * Everything the boot sequence asks of the kernel and of external tools.
 *
 * LinuxPlatform performs the real syscalls; tests substitute a fake that
 * records calls and simulates time with sleep_seconds().
 */
class Platform {
public:
    virtual ~Platform() = default;

    // Filesystem queries
    virtual bool exists(const std::string& path) = 0;
    virtual bool is_directory(const std::string& path) = 0;
    virtual bool is_regular_file(const std::string& path) = 0;
    virtual bool is_block_device(const std::string& path) = 0;
    virtual std::optional<DeviceNumber> char_device_number(const std::string& path) = 0;
    virtual std::optional<uint64_t> file_size(const std::string& path) = 0;
    // Identifies the filesystem instance a path lives on (st_dev)
    virtual std::optional<uint64_t> filesystem_id(const std::string& path) = 0;
    virtual std::optional<std::vector<std::string>> list_directory(const std::string& path) = 0;
    // Resolves symlinks relative to root, not to the caller's "/"
    virtual bool is_executable_in_root(const std::string& root, const std::string& path) = 0;
    virtual std::optional<std::string> read_file(const std::string& path) = 0;

    // Filesystem changes
    virtual bool make_directory(const std::string& path) = 0;
    virtual bool make_char_device(const std::string& path, DeviceNumber number,
                                  unsigned mode) = 0;
    virtual bool write_file(const std::string& path, const std::string& content) = 0;
    virtual bool copy_file(const std::string& from, const std::string& to) = 0;
    // Removes the contents of a directory without crossing into other mounts
    virtual bool clear_directory(const std::string& path) = 0;

    // Mounts
    virtual bool mount(const MountEntry& entry) = 0;
    virtual bool move_mount(const std::string& from, const std::string& to) = 0;
    virtual std::optional<std::string> attach_loop(const std::string& file) = 0;

    // Processes
    virtual bool has_program(const std::string& name) = 0;
    virtual ExecResult run(const std::vector<std::string>& args,
                           const std::string& input = std::string()) = 0;
    virtual pid_t spawn(const std::vector<std::string>& args) = 0;
    // Exit code once the child has finished, nullopt while it runs
    virtual std::optional<int> try_reap(pid_t pid) = 0;
    virtual void terminate(pid_t pid) = 0;

    // Network
    virtual bool has_global_address() = 0;

    // Time
    virtual void sleep_seconds(unsigned seconds) = 0;

    // Switch logging to the kernel log once /dev is populated
    virtual bool attach_kernel_log() = 0;

    /**
     * Replace the initramfs with new_root and exec init as the current process.
     *
     * The real implementation only returns on failure, with false.
     */
    virtual bool switch_root(const std::string& new_root, const std::string& init,
                             const std::vector<std::string>& argv) = 0;

    // Description of the most recent failed call
    virtual std::string last_error() const = 0;
};

class DeviceProbe {
public:
    virtual ~DeviceProbe() = default;

    // tag is UUID, LABEL or PARTUUID; candidates in discovery order
    virtual std::vector<std::string> find_by_tag(const std::string& tag,
                                                 const std::string& value) = 0;
    // One line per visible block device, e.g. "/dev/sda1 TYPE=ext4 UUID=..."
    virtual std::vector<std::string> list_block_devices() = 0;
    virtual std::optional<std::string> probe_fstype(const std::string& device) = 0;
};

enum class RescueMode {
    Checkpoint,
    Fatal,
};

class Console {
public:
    virtual ~Console() = default;

    virtual void message(const std::string& text) = 0;
    // Reads a line with echo disabled; nullopt on EOF
    virtual std::optional<std::string> read_secret(const std::string& prompt) = 0;
    // Shows the banner and runs an interactive shell until it exits
    virtual void rescue_shell(const std::string& banner, RescueMode mode) = 0;
};

}  // namespace rdinit
