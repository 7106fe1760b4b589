#pragma once

#include <string>

#include "platform.hpp"

namespace rdinit {

// Parsed form of a comma separated mount option string
struct MountFlags {
    unsigned long flags = 0;
    std::string data;
};

MountFlags parse_mount_options(const std::string& options);

class LinuxPlatform : public Platform {
public:
    bool exists(const std::string& path) override;
    bool is_directory(const std::string& path) override;
    bool is_regular_file(const std::string& path) override;
    bool is_block_device(const std::string& path) override;
    std::optional<DeviceNumber> char_device_number(const std::string& path) override;
    std::optional<uint64_t> file_size(const std::string& path) override;
    std::optional<uint64_t> filesystem_id(const std::string& path) override;
    std::optional<std::vector<std::string>> list_directory(const std::string& path) override;
    bool is_executable_in_root(const std::string& root, const std::string& path) override;
    std::optional<std::string> read_file(const std::string& path) override;

    bool make_directory(const std::string& path) override;
    bool make_char_device(const std::string& path, DeviceNumber number, unsigned mode) override;
    bool write_file(const std::string& path, const std::string& content) override;
    bool copy_file(const std::string& from, const std::string& to) override;
    bool clear_directory(const std::string& path) override;

    bool mount(const MountEntry& entry) override;
    bool move_mount(const std::string& from, const std::string& to) override;
    std::optional<std::string> attach_loop(const std::string& file) override;

    bool has_program(const std::string& name) override;
    ExecResult run(const std::vector<std::string>& args, const std::string& input) override;
    pid_t spawn(const std::vector<std::string>& args) override;
    std::optional<int> try_reap(pid_t pid) override;
    void terminate(pid_t pid) override;

    bool has_global_address() override;

    void sleep_seconds(unsigned seconds) override;

    bool attach_kernel_log() override;

    bool switch_root(const std::string& new_root, const std::string& init,
                     const std::vector<std::string>& argv) override;

    std::string last_error() const override { return last_error_; }

private:
    bool fail(const std::string& what);
    bool mount_auto(const MountEntry& entry, const MountFlags& parsed);

    std::string last_error_;
};

}  // namespace rdinit
