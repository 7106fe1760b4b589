#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace rdinit {

// One member of a newc ("070701") or newc+crc ("070702") archive
struct CpioEntry {
    std::string name;  // normalized, no leading "./" or "/"
    uint32_t mode = 0;
    uint32_t nlink = 0;
    uint32_t rdev_major = 0;
    uint32_t rdev_minor = 0;
    std::string data;
};

struct CpioArchive {
    std::vector<CpioEntry> entries;
    // Bytes after the last trailer that are not padding, e.g. a compressed
    // archive appended to an uncompressed early-microcode one
    std::string trailing;
};

/**
 * Parse concatenated newc archives.
 *
 * @param data Uncompressed archive bytes
 * @param out Parsed entries in archive order
 * @param error Set on failure
 * @return false if the data is not a well formed newc archive
 */
bool parse_cpio(const std::string& data, CpioArchive* out, std::string* error);

// Entries whose parent directory was not created by an earlier entry
std::vector<std::string> find_orphan_entries(const std::vector<CpioEntry>& entries);

}  // namespace rdinit
