#include "validator.hpp"
#include "../defs.hpp"
#include "../utils.hpp"

#include <elf.h>
#include <algorithm>
#include <cstddef>
#include <regex>

namespace rdinit {

namespace {

constexpr const char* SECTION_CRITICAL = "Critical Checks";
constexpr const char* SECTION_DIRS = "Directory Structure";
constexpr const char* SECTION_DEVICES = "Device Nodes";
constexpr const char* SECTION_SCRIPT = "Init Script Analysis";
constexpr const char* SECTION_BINARIES = "Binary Availability";
constexpr const char* SECTION_ARCHIVE = "Archive Ordering";

constexpr size_t SCRIPT_READ_LIMIT = 1024 * 1024;
constexpr size_t BINARY_READ_LIMIT = 32 * 1024 * 1024;
constexpr size_t MAX_LISTED_ORPHANS = 10;

uint64_t read_uint(const std::string& data, size_t offset, size_t width, bool big_endian) {
    uint64_t value = 0;
    for (size_t i = 0; i < width; ++i) {
        size_t index = big_endian ? offset + i : offset + width - 1 - i;
        value = (value << 8) | static_cast<unsigned char>(data[index]);
    }
    return value;
}

struct Resolved {
    std::string path;
    TreeNode node;
};

// Follow symlinks inside the image
std::optional<Resolved> resolve(const ImageTree& tree, std::string path) {
    for (unsigned depth = 0; depth <= MAX_SYMLINK_DEPTH; ++depth) {
        auto node = tree.lookup(path);
        if (!node)
            return std::nullopt;
        if (node->type != TreeNode::Type::Symlink)
            return Resolved{path, *node};

        const std::string& target = node->link_target;
        if (!target.empty() && target[0] == '/') {
            path = target.substr(1);
        } else {
            std::string dir = dirname_of(path);
            path = dir == "." ? target : join_path(dir, target);
        }

        // Collapse "." and ".." so the in-memory index matches
        std::vector<std::string> parts;
        for (const auto& part : split(path, '/')) {
            if (part.empty() || part == ".")
                continue;
            if (part == "..") {
                if (!parts.empty())
                    parts.pop_back();
                continue;
            }
            parts.push_back(part);
        }
        path = join(parts, "/");
    }
    return std::nullopt;
}

bool is_directory(const ImageTree& tree, const std::string& path) {
    auto resolved = resolve(tree, path);
    return resolved && resolved->node.type == TreeNode::Type::Directory;
}

// Present as a file or as a link, dangling links included
bool has_entry(const ImageTree& tree, const std::string& path) {
    auto node = tree.lookup(path);
    return node && (node->type == TreeNode::Type::File || node->type == TreeNode::Type::Symlink);
}

bool has_binary(const ImageTree& tree, const std::string& name) {
    for (const char* dir : {"bin", "sbin", "usr/bin", "usr/sbin"}) {
        if (has_entry(tree, std::string(dir) + "/" + name))
            return true;
    }
    return false;
}

// Busybox keeps its applet names as a NUL separated table
bool busybox_has_applet(const std::string& busybox, const std::string& name) {
    std::string needle;
    needle += '\0';
    needle += name;
    needle += '\0';
    return busybox.find(needle) != std::string::npos;
}

void check_device_node(const ImageTree& tree, ValidationReport& report, const std::string& path,
                       uint32_t major, uint32_t minor, Severity missing, const char* consequence) {
    std::string shown = "/" + path;
    auto node = tree.lookup(path);
    if (!node) {
        report.add(missing, SECTION_DEVICES, shown + " missing - " + consequence);
        return;
    }
    if (node->type != TreeNode::Type::CharDevice) {
        report.add(Severity::Error, SECTION_DEVICES, shown + " is not a character device");
        return;
    }
    if (node->rdev_major != major || node->rdev_minor != minor) {
        report.add(Severity::Error, SECTION_DEVICES,
                   shown + " is " + std::to_string(node->rdev_major) + ":" +
                       std::to_string(node->rdev_minor) + ", expected " + std::to_string(major) +
                       ":" + std::to_string(minor));
        return;
    }
    report.add(Severity::Ok, SECTION_DEVICES, shown + " exists");
}

void check_linkage(ValidationReport& report, const std::string& what, const std::string& data) {
    auto dynamic = elf_is_dynamic(data);
    if (!dynamic)
        return;
    if (*dynamic) {
        report.add(Severity::Warning, SECTION_CRITICAL,
                   what + " is dynamically linked - ensure required libraries are included");
    } else {
        report.add(Severity::Ok, SECTION_CRITICAL, what + " is statically linked");
    }
}

// Returns the /init content when it could be read
std::optional<std::string> check_init(const ImageTree& tree, ValidationReport& report) {
    auto init = resolve(tree, "init");
    if (!init) {
        report.add(Severity::Error, SECTION_CRITICAL, "/init not found - initramfs will not boot");
        return std::nullopt;
    }
    if (init->node.type != TreeNode::Type::File) {
        report.add(Severity::Error, SECTION_CRITICAL, "/init is not a regular file");
        return std::nullopt;
    }
    if ((init->node.mode & 0111) == 0) {
        report.add(Severity::Error, SECTION_CRITICAL, "/init exists but is NOT executable");
        return std::nullopt;
    }
    report.add(Severity::Ok, SECTION_CRITICAL, "/init exists and is executable");

    auto content = tree.read(init->path, BINARY_READ_LIMIT);
    if (!content) {
        report.add(Severity::Error, SECTION_CRITICAL, "/init cannot be read");
        return std::nullopt;
    }

    if (elf_is_dynamic(*content)) {
        report.add(Severity::Ok, SECTION_CRITICAL, "/init is an ELF executable");
        check_linkage(report, "/init", *content);
        return content;
    }

    std::string shebang = content->substr(0, std::min<size_t>(content->find('\n'), 100));
    if (starts_with(shebang, "#!/bin/sh") || starts_with(shebang, "#!/bin/busybox") ||
        starts_with(shebang, "#!/bin/bash")) {
        report.add(Severity::Ok, SECTION_CRITICAL, "/init has valid shebang: " + shebang);
    } else {
        report.add(Severity::Warning, SECTION_CRITICAL,
                   "/init shebang may be non-portable: " + shebang);
    }
    return content;
}

void check_directories(const ImageTree& tree, ValidationReport& report) {
    for (const char* dir : {"bin", "dev", "etc", "lib", "mnt", "proc", "run", "sys"}) {
        std::string name = dir;
        if (is_directory(tree, name)) {
            report.add(Severity::Ok, SECTION_DIRS, "/" + name + " exists");
        } else if (name == "proc" || name == "sys" || name == "run" || name == "mnt") {
            report.add(Severity::Warning, SECTION_DIRS,
                       "/" + name + " missing (will be created at runtime)");
        } else {
            report.add(Severity::Error, SECTION_DIRS, "/" + name + " missing");
        }
    }

    if (is_directory(tree, "mnt/root") || is_directory(tree, "sysroot") ||
        is_directory(tree, "newroot")) {
        report.add(Severity::Ok, SECTION_DIRS, "Root mount point exists");
    } else {
        report.add(Severity::Warning, SECTION_DIRS,
                   "No root mount point (mnt/root, sysroot, or newroot)");
    }
}

struct ScriptRule {
    const char* pattern;
    const char* found;
    Severity missing_severity;
    const char* missing;
};

void check_script(const std::string& script, ValidationReport& report) {
    if (std::regex_search(script, std::regex("switch_root"))) {
        report.add(Severity::Ok, SECTION_SCRIPT, "switch_root found in /init");
        if (std::regex_search(script, std::regex("exec.*switch_root"))) {
            report.add(Severity::Ok, SECTION_SCRIPT, "switch_root called with exec (correct)");
        } else {
            report.add(Severity::Warning, SECTION_SCRIPT,
                       "switch_root may not be called with exec - PID 1 must be maintained");
        }
    } else {
        report.add(Severity::Warning, SECTION_SCRIPT,
                   "switch_root not found - custom pivot mechanism?");
    }

    const ScriptRule rules[] = {
        {"mount.*devtmpfs", "devtmpfs mount found", Severity::Warning,
         "devtmpfs mount not found - device nodes may not be available"},
        {"mount.*proc", "/proc mount found", Severity::Error,
         "/proc mount not found - kernel command line parsing will fail"},
        {"mount.*/run", "/run mount found", Severity::Warning,
         "/run mount not found - systemd handoff may fail"},
        {"rescue_shell|emergency|/bin/sh", "Emergency shell fallback found", Severity::Warning,
         "No emergency shell fallback - debugging boot failures will be difficult"},
    };
    for (const auto& rule : rules) {
        if (std::regex_search(script, std::regex(rule.pattern))) {
            report.add(Severity::Ok, SECTION_SCRIPT, rule.found);
        } else {
            report.add(rule.missing_severity, SECTION_SCRIPT, rule.missing);
        }
    }
}

void check_binaries(const ImageTree& tree, ValidationReport& report, bool binary_init) {
    std::string busybox;
    if (auto resolved = resolve(tree, "bin/busybox")) {
        if (auto data = tree.read(resolved->path, BINARY_READ_LIMIT))
            busybox = std::move(*data);
    }

    auto available = [&](const std::string& name, std::string* how) {
        if (has_binary(tree, name)) {
            *how = name + " available";
            return true;
        }
        if (!busybox.empty() && busybox_has_applet(busybox, name)) {
            *how = name + " available (busybox applet)";
            return true;
        }
        return false;
    };

    for (const char* bin : {"sh", "mount", "umount", "switch_root"}) {
        std::string name = bin;
        std::string how;
        if (available(name, &how)) {
            report.add(Severity::Ok, SECTION_BINARIES, how);
        } else if (binary_init && name != "sh") {
            // A native /init performs these itself
            report.add(Severity::Info, SECTION_BINARIES,
                       name + " not found (not needed by a binary /init)");
        } else {
            report.add(Severity::Error, SECTION_BINARIES, name + " not found");
        }
    }

    for (const char* bin : {"findfs", "blkid", "modprobe", "sleep", "cat", "grep"}) {
        std::string name = bin;
        std::string how;
        if (available(name, &how)) {
            report.add(Severity::Ok, SECTION_BINARIES, how);
        } else {
            report.add(Severity::Info, SECTION_BINARIES, name + " not found (optional)");
        }
    }
}

void check_ordering(const ImageTree& tree, ValidationReport& report) {
    auto orphans = tree.ordering_problems();
    if (orphans.empty())
        return;

    for (size_t i = 0; i < orphans.size() && i < MAX_LISTED_ORPHANS; ++i) {
        report.add(Severity::Error, SECTION_ARCHIVE,
                   orphans[i] + " appears before its parent directory");
    }
    if (orphans.size() > MAX_LISTED_ORPHANS) {
        report.add(Severity::Error, SECTION_ARCHIVE,
                   std::to_string(orphans.size() - MAX_LISTED_ORPHANS) +
                       " more entries precede their parent directory");
    }
}

}  // namespace

void ValidationReport::add(Severity severity, const std::string& section,
                           const std::string& message) {
    findings_.push_back({severity, section, message});
    if (severity == Severity::Error)
        ++errors_;
    else if (severity == Severity::Warning)
        ++warnings_;
}

int ValidationReport::exit_code() const {
    if (errors_ > 0)
        return 1;
    if (warnings_ > 0)
        return 2;
    return 0;
}

std::optional<bool> elf_is_dynamic(const std::string& data) {
    if (data.size() < EI_NIDENT || data.compare(0, SELFMAG, ELFMAG) != 0)
        return std::nullopt;

    bool is64 = data[EI_CLASS] == ELFCLASS64;
    bool big_endian = data[EI_DATA] == ELFDATA2MSB;
    size_t header_size = is64 ? sizeof(Elf64_Ehdr) : sizeof(Elf32_Ehdr);
    if (data.size() < header_size)
        return false;

    uint64_t phoff = is64 ? read_uint(data, offsetof(Elf64_Ehdr, e_phoff), 8, big_endian)
                          : read_uint(data, offsetof(Elf32_Ehdr, e_phoff), 4, big_endian);
    uint64_t phentsize =
        read_uint(data, is64 ? offsetof(Elf64_Ehdr, e_phentsize) : offsetof(Elf32_Ehdr, e_phentsize),
                  2, big_endian);
    uint64_t phnum =
        read_uint(data, is64 ? offsetof(Elf64_Ehdr, e_phnum) : offsetof(Elf32_Ehdr, e_phnum), 2,
                  big_endian);

    // Header fields are untrusted; only read program headers that lie inside data
    if (phentsize < 4 || phoff > data.size())
        return false;
    uint64_t available = (data.size() - phoff) / phentsize;
    for (uint64_t i = 0; i < phnum && i < available; ++i) {
        uint64_t offset = phoff + i * phentsize;
        if (read_uint(data, offset, 4, big_endian) == PT_INTERP)
            return true;
    }
    return false;
}

ValidationReport validate_image(const ImageTree& tree) {
    ValidationReport report;

    auto init = check_init(tree, report);
    bool binary_init = init && elf_is_dynamic(*init).has_value();

    if (auto busybox = resolve(tree, "bin/busybox")) {
        report.add(Severity::Ok, SECTION_CRITICAL, "/bin/busybox exists");
        if (auto data = tree.read(busybox->path, BINARY_READ_LIMIT))
            check_linkage(report, "busybox", *data);
    } else {
        report.add(Severity::Warning, SECTION_CRITICAL,
                   "/bin/busybox not found - ensure shell is available");
    }

    check_directories(tree, report);
    check_device_node(tree, report, "dev/console", 5, 1, Severity::Error,
                      "kernel console output will fail");
    check_device_node(tree, report, "dev/null", 1, 3, Severity::Warning,
                      "some commands may fail");

    if (init && !binary_init) {
        check_script(init->substr(0, SCRIPT_READ_LIMIT), report);
    } else if (binary_init) {
        report.add(Severity::Info, SECTION_SCRIPT, "/init is a binary, script analysis skipped");
    }

    check_binaries(tree, report, binary_init);
    check_ordering(tree, report);
    return report;
}

}  // namespace rdinit
