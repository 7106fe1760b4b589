#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "cpio.hpp"

namespace rdinit {

struct TreeNode {
    enum class Type { File, Directory, Symlink, CharDevice, BlockDevice, Other };

    Type type = Type::Other;
    uint32_t mode = 0;
    uint32_t rdev_major = 0;
    uint32_t rdev_minor = 0;
    std::string link_target;
};

/**
 * Read-only view of an initramfs, either unpacked on disk or held in memory
 * from an archive. Paths are relative to the image root ("bin/sh").
 */
class ImageTree {
public:
    virtual ~ImageTree() = default;

    // Does not follow a final symlink
    virtual std::optional<TreeNode> lookup(const std::string& path) const = 0;
    // Up to limit bytes of a regular file
    virtual std::optional<std::string> read(const std::string& path, size_t limit) const = 0;

    // Members that precede their parent directory; always empty on disk
    virtual std::vector<std::string> ordering_problems() const { return {}; }
};

class DirectoryTree : public ImageTree {
public:
    explicit DirectoryTree(std::string root) : root_(std::move(root)) {}

    std::optional<TreeNode> lookup(const std::string& path) const override;
    std::optional<std::string> read(const std::string& path, size_t limit) const override;

private:
    std::string root_;
};

class ArchiveTree : public ImageTree {
public:
    explicit ArchiveTree(std::vector<CpioEntry> entries);

    std::optional<TreeNode> lookup(const std::string& path) const override;
    std::optional<std::string> read(const std::string& path, size_t limit) const override;
    std::vector<std::string> ordering_problems() const override;

private:
    std::vector<CpioEntry> entries_;
    // Later members replace earlier ones, as when the kernel unpacks them
    std::map<std::string, size_t> index_;
};

enum class Compression { None, Gzip, Xz, Bzip2, Zstd, Lz4, Unknown };

const char* compression_name(Compression compression);
Compression detect_compression(const std::string& head);

/**
 * Load an initramfs image file, decompressing through the matching tool.
 *
 * An uncompressed archive followed by a compressed one (early microcode
 * layout) is merged into one tree.
 */
std::unique_ptr<ArchiveTree> load_archive(const std::string& path, std::string* error);

}  // namespace rdinit
