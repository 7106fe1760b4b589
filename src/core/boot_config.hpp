#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "failure.hpp"

namespace rdinit {

struct Settings;

// A block device named by path or by filesystem/partition identity.
struct DeviceSpec {
    enum class Kind { Path, Uuid, Label, PartUuid };

    Kind kind = Kind::Path;
    std::string value;

    // Accepts "/dev/x", "UUID=", "LABEL=", "PARTUUID=" and bare kernel names ("sda1")
    static std::optional<DeviceSpec> parse(const std::string& text);
    static DeviceSpec path(const std::string& path);

    // The form it was written in, e.g. "UUID=1111"
    std::string text() const;
    bool operator==(const DeviceSpec& other) const {
        return kind == other.kind && value == other.value;
    }
};

struct LuksSpec {
    DeviceSpec source;
    std::string mapper_name;
    std::string options;

    std::string mapper_path() const { return "/dev/mapper/" + mapper_name; }
};

struct LvmSpec {
    std::string vg;
    std::string lv;
};

struct NfsSpec {
    std::string server;
    std::string path;
    std::string options;
};

// Where the squashfs image comes from.
struct SquashfsLocalFile {
    std::string path;
};
struct SquashfsDeviceFile {
    DeviceSpec device;
    std::string path;
};
struct SquashfsNfsFile {
    std::string server;
    std::string path;
};
struct SquashfsHttpFile {
    std::string url;
};
using SquashfsSource =
    std::variant<SquashfsLocalFile, SquashfsDeviceFile, SquashfsNfsFile, SquashfsHttpFile>;

SquashfsSource parse_squashfs_source(const std::string& text);
bool squashfs_source_needs_network(const SquashfsSource& source);

// Root acquisition strategies; exactly one is selected per boot.
struct PlainRoot {
    DeviceSpec device;
};
struct LuksRoot {
    LuksSpec luks;
    std::optional<LvmSpec> lvm;
    DeviceSpec root;
};
struct LvmRoot {
    LvmSpec lvm;
    DeviceSpec root;
};
struct SquashfsRoot {
    SquashfsSource source;
};
struct NetworkRoot {
    NfsSpec nfs;
};
using RootStrategy = std::variant<PlainRoot, LuksRoot, LvmRoot, SquashfsRoot, NetworkRoot>;

const char* strategy_name(const RootStrategy& strategy);

struct BootConfig {
    std::string root;
    std::string rootfstype = "auto";
    std::string rootflags;
    bool read_only = true;
    std::string init = "/sbin/init";
    std::optional<unsigned> root_delay_seconds;
    bool root_wait_forever = false;
    std::set<std::string> break_stages;
    bool debug = false;
    std::string network_spec;
    std::string squashfs_spec;
    uint64_t overlay_size_bytes = 0;
    std::string persistent_device_spec;
    bool to_ram = false;
    std::optional<LuksSpec> luks;
    std::optional<LvmSpec> lvm;
    std::string nfsroot;
    std::vector<std::string> extra_modules;
    std::vector<std::string> init_args;

    RootStrategy strategy;

    bool breaks_at(const std::string& checkpoint) const {
        return break_stages.count(checkpoint) != 0;
    }
    bool needs_network() const;
};

// Splits a kernel command line; double quotes group, "--" ends kernel parameters.
std::vector<std::string> tokenize_cmdline(const std::string& cmdline,
                                          std::vector<std::string>* init_args = nullptr);

Outcome<BootConfig> parse_cmdline(const std::string& cmdline, const Settings& settings);

std::optional<NfsSpec> parse_nfs_spec(const std::string& text);

// Multi-line human readable dump used by "rdinit check-cmdline" and debug logging
std::string describe_config(const BootConfig& config);

}  // namespace rdinit
