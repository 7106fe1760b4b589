#include "cpio.hpp"
#include "../utils.hpp"

#include <sys/stat.h>
#include <set>

namespace rdinit {

namespace {

constexpr size_t HEADER_SIZE = 110;
constexpr const char* TRAILER_NAME = "TRAILER!!!";

size_t align4(size_t offset) {
    return (offset + 3) & ~static_cast<size_t>(3);
}

bool parse_hex_field(const std::string& data, size_t offset, uint32_t* out) {
    uint32_t value = 0;
    for (size_t i = 0; i < 8; ++i) {
        char c = data[offset + i];
        value <<= 4;
        if (c >= '0' && c <= '9') {
            value |= static_cast<uint32_t>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            value |= static_cast<uint32_t>(c - 'a' + 10);
        } else if (c >= 'A' && c <= 'F') {
            value |= static_cast<uint32_t>(c - 'A' + 10);
        } else {
            return false;
        }
    }
    *out = value;
    return true;
}

std::string normalize_name(std::string name) {
    while (starts_with(name, "./"))
        name = name.substr(2);
    while (!name.empty() && name[0] == '/')
        name = name.substr(1);
    while (!name.empty() && name.back() == '/')
        name.pop_back();
    return name;
}

bool is_magic(const std::string& data, size_t offset) {
    return data.compare(offset, 6, "070701") == 0 || data.compare(offset, 6, "070702") == 0;
}

}  // namespace

bool parse_cpio(const std::string& data, CpioArchive* out, std::string* error) {
    size_t offset = 0;
    bool seen_trailer = false;

    while (offset < data.size()) {
        if (seen_trailer) {
            // Archives may be padded and concatenated
            while (offset < data.size() && data[offset] == '\0')
                ++offset;
            if (offset >= data.size())
                break;
            if (data.size() - offset < 6 || !is_magic(data, offset)) {
                out->trailing = data.substr(offset);
                break;
            }
            seen_trailer = false;
        }

        if (data.size() - offset < HEADER_SIZE) {
            *error = "truncated header at offset " + std::to_string(offset);
            return false;
        }
        if (!is_magic(data, offset)) {
            *error = "bad magic at offset " + std::to_string(offset) + " (not a newc archive)";
            return false;
        }

        // Field order after the magic: ino mode uid gid nlink mtime filesize
        // devmajor devminor rdevmajor rdevminor namesize check
        uint32_t fields[13];
        for (size_t i = 0; i < 13; ++i) {
            if (!parse_hex_field(data, offset + 6 + i * 8, &fields[i])) {
                *error = "bad header field at offset " + std::to_string(offset);
                return false;
            }
        }
        uint32_t mode = fields[1];
        uint32_t nlink = fields[4];
        uint32_t filesize = fields[6];
        uint32_t rdev_major = fields[9];
        uint32_t rdev_minor = fields[10];
        uint32_t namesize = fields[11];

        size_t name_start = offset + HEADER_SIZE;
        if (namesize == 0 || data.size() - name_start < namesize) {
            *error = "truncated name at offset " + std::to_string(offset);
            return false;
        }
        std::string name = data.substr(name_start, namesize - 1);

        size_t data_start = align4(name_start + namesize);
        if (data_start > data.size() || data.size() - data_start < filesize) {
            *error = "truncated data for " + name;
            return false;
        }
        offset = align4(data_start + filesize);

        if (name == TRAILER_NAME) {
            seen_trailer = true;
            continue;
        }

        CpioEntry entry;
        entry.name = normalize_name(name);
        if (entry.name.empty() || entry.name == ".")
            continue;
        entry.mode = mode;
        entry.nlink = nlink;
        entry.rdev_major = rdev_major;
        entry.rdev_minor = rdev_minor;
        entry.data = data.substr(data_start, filesize);
        out->entries.push_back(std::move(entry));
    }

    if (!seen_trailer && out->trailing.empty()) {
        *error = "archive has no TRAILER!!! entry";
        return false;
    }
    return true;
}

std::vector<std::string> find_orphan_entries(const std::vector<CpioEntry>& entries) {
    std::set<std::string> directories;
    std::vector<std::string> orphans;

    for (const auto& entry : entries) {
        size_t slash = entry.name.find_last_of('/');
        if (slash != std::string::npos) {
            std::string parent = entry.name.substr(0, slash);
            if (directories.count(parent) == 0)
                orphans.push_back(entry.name);
        }
        if (S_ISDIR(entry.mode))
            directories.insert(entry.name);
    }
    return orphans;
}

}  // namespace rdinit
