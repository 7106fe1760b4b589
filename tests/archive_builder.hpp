#pragma once

#include <sys/stat.h>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include "../src/validate/cpio.hpp"

namespace rdinit {
namespace testing {

/**
 * Writes newc archives in memory, and the matching CpioEntry lists for
 * tests that skip the byte level.
 */
class ArchiveBuilder {
public:
    ArchiveBuilder& dir(const std::string& name) { return add(name, S_IFDIR | 0755, ""); }
    ArchiveBuilder& file(const std::string& name, const std::string& data, uint32_t perm = 0644) {
        return add(name, S_IFREG | perm, data);
    }
    ArchiveBuilder& symlink(const std::string& name, const std::string& target) {
        return add(name, S_IFLNK | 0777, target);
    }
    ArchiveBuilder& chardev(const std::string& name, uint32_t major, uint32_t minor) {
        return add(name, S_IFCHR | 0600, "", major, minor);
    }

    const std::vector<CpioEntry>& entries() const { return entries_; }

    std::string bytes() const {
        std::string out;
        uint32_t ino = 1;
        for (const auto& entry : entries_)
            append(out, entry.name, entry.mode, ino++, entry.rdev_major, entry.rdev_minor,
                   entry.data);
        append(out, "TRAILER!!!", 0, 0, 0, 0, "");
        while (out.size() % 512 != 0)
            out += '\0';
        return out;
    }

private:
    ArchiveBuilder& add(const std::string& name, uint32_t mode, const std::string& data,
                        uint32_t major = 0, uint32_t minor = 0) {
        CpioEntry entry;
        entry.name = name;
        entry.mode = mode;
        entry.nlink = 1;
        entry.rdev_major = major;
        entry.rdev_minor = minor;
        entry.data = data;
        entries_.push_back(entry);
        return *this;
    }

    static void pad4(std::string& out) {
        while (out.size() % 4 != 0)
            out += '\0';
    }

    static void append(std::string& out, const std::string& name, uint32_t mode, uint32_t ino,
                       uint32_t major, uint32_t minor, const std::string& data) {
        char header[111];
        snprintf(header, sizeof(header),
                 "070701%08X%08X%08X%08X%08X%08X%08X%08X%08X%08X%08X%08X%08X", ino, mode, 0u, 0u,
                 1u, 0u, static_cast<uint32_t>(data.size()), 0u, 0u, major, minor,
                 static_cast<uint32_t>(name.size() + 1), 0u);
        out.append(header, 110);
        out += name;
        out += '\0';
        pad4(out);
        out += data;
        pad4(out);
    }

    std::vector<CpioEntry> entries_;
};

}  // namespace testing
}  // namespace rdinit
