#include "image_tree.hpp"
#include "../log.hpp"
#include "../utils.hpp"

#include <sys/stat.h>
#include <sys/sysmacros.h>
#include <unistd.h>
#include <climits>
#include <cstdlib>
#include <fstream>

namespace rdinit {

namespace {

TreeNode::Type type_from_mode(uint32_t mode) {
    if (S_ISREG(mode))
        return TreeNode::Type::File;
    if (S_ISDIR(mode))
        return TreeNode::Type::Directory;
    if (S_ISLNK(mode))
        return TreeNode::Type::Symlink;
    if (S_ISCHR(mode))
        return TreeNode::Type::CharDevice;
    if (S_ISBLK(mode))
        return TreeNode::Type::BlockDevice;
    return TreeNode::Type::Other;
}

/**
 * RAII temporary file, removed on destruction
 */
class TempFile {
public:
    TempFile() {
        char name[] = "/tmp/rdinit-validate-XXXXXX";
        int fd = mkstemp(name);
        if (fd >= 0) {
            close(fd);
            path_ = name;
        }
    }
    ~TempFile() {
        if (!path_.empty())
            unlink(path_.c_str());
    }
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

std::vector<std::string> decompressor_for(Compression compression) {
    switch (compression) {
    case Compression::Gzip:
        return {"gzip", "-dc"};
    case Compression::Xz:
        return {"xz", "-dc"};
    case Compression::Bzip2:
        return {"bzip2", "-dc"};
    case Compression::Zstd:
        return {"zstd", "-dcq"};
    case Compression::Lz4:
        return {"lz4", "-dc"};
    case Compression::None:
    case Compression::Unknown:
        break;
    }
    return {};
}

bool decompress_file(const std::string& path, Compression compression, std::string* out,
                     std::string* error) {
    auto args = decompressor_for(compression);
    if (args.empty()) {
        *error = "unknown archive format";
        return false;
    }
    args.push_back(path);

    LOGD("Decompressing %s with %s", path.c_str(), args[0].c_str());
    auto result = exec_command(args);
    if (result.exit_code != 0) {
        *error = args[0] + " failed (" + std::to_string(result.exit_code) +
                 "): " + trim(result.stderr_str);
        return false;
    }
    *out = std::move(result.stdout_str);
    return true;
}

}  // namespace

std::optional<TreeNode> DirectoryTree::lookup(const std::string& path) const {
    std::string full = join_path(root_, path);
    struct stat st;
    if (lstat(full.c_str(), &st) != 0)
        return std::nullopt;

    TreeNode node;
    node.type = type_from_mode(st.st_mode);
    node.mode = st.st_mode;
    if (node.type == TreeNode::Type::CharDevice || node.type == TreeNode::Type::BlockDevice) {
        node.rdev_major = major(st.st_rdev);
        node.rdev_minor = minor(st.st_rdev);
    }
    if (node.type == TreeNode::Type::Symlink) {
        char target[PATH_MAX];
        ssize_t len = readlink(full.c_str(), target, sizeof(target) - 1);
        if (len >= 0)
            node.link_target.assign(target, static_cast<size_t>(len));
    }
    return node;
}

std::optional<std::string> DirectoryTree::read(const std::string& path, size_t limit) const {
    std::ifstream ifs(join_path(root_, path), std::ios::binary);
    if (!ifs)
        return std::nullopt;

    std::string content(limit, '\0');
    ifs.read(&content[0], static_cast<std::streamsize>(limit));
    content.resize(static_cast<size_t>(ifs.gcount()));
    return content;
}

ArchiveTree::ArchiveTree(std::vector<CpioEntry> entries) : entries_(std::move(entries)) {
    for (size_t i = 0; i < entries_.size(); ++i)
        index_[entries_[i].name] = i;
}

std::optional<TreeNode> ArchiveTree::lookup(const std::string& path) const {
    auto it = index_.find(path);
    if (it == index_.end())
        return std::nullopt;

    const CpioEntry& entry = entries_[it->second];
    TreeNode node;
    node.type = type_from_mode(entry.mode);
    node.mode = entry.mode;
    node.rdev_major = entry.rdev_major;
    node.rdev_minor = entry.rdev_minor;
    if (node.type == TreeNode::Type::Symlink)
        node.link_target = entry.data;
    return node;
}

std::optional<std::string> ArchiveTree::read(const std::string& path, size_t limit) const {
    auto it = index_.find(path);
    if (it == index_.end())
        return std::nullopt;
    const CpioEntry& entry = entries_[it->second];
    if (!S_ISREG(entry.mode))
        return std::nullopt;
    return entry.data.substr(0, limit);
}

std::vector<std::string> ArchiveTree::ordering_problems() const {
    return find_orphan_entries(entries_);
}

const char* compression_name(Compression compression) {
    switch (compression) {
    case Compression::None:
        return "uncompressed";
    case Compression::Gzip:
        return "gzip";
    case Compression::Xz:
        return "xz";
    case Compression::Bzip2:
        return "bzip2";
    case Compression::Zstd:
        return "zstd";
    case Compression::Lz4:
        return "lz4";
    case Compression::Unknown:
        break;
    }
    return "unknown";
}

Compression detect_compression(const std::string& head) {
    auto has_prefix = [&head](const char* magic, size_t len) {
        return head.size() >= len && head.compare(0, len, magic, len) == 0;
    };

    if (has_prefix("070701", 6) || has_prefix("070702", 6))
        return Compression::None;
    if (has_prefix("\x1f\x8b", 2))
        return Compression::Gzip;
    if (has_prefix("\xfd" "7zXZ\0", 6))
        return Compression::Xz;
    if (has_prefix("BZh", 3))
        return Compression::Bzip2;
    if (has_prefix("\x28\xb5\x2f\xfd", 4))
        return Compression::Zstd;
    if (has_prefix("\x02\x21\x4c\x18", 4))
        return Compression::Lz4;
    return Compression::Unknown;
}

std::unique_ptr<ArchiveTree> load_archive(const std::string& path, std::string* error) {
    auto data = read_file(path);
    if (!data) {
        *error = "cannot read " + path;
        return nullptr;
    }

    Compression compression = detect_compression(data->substr(0, 8));
    LOGI("%s is %s", path.c_str(), compression_name(compression));

    std::string raw;
    if (compression == Compression::None) {
        raw = std::move(*data);
    } else if (!decompress_file(path, compression, &raw, error)) {
        return nullptr;
    }

    CpioArchive archive;
    if (!parse_cpio(raw, &archive, error))
        return nullptr;

    // Early microcode images put the real archive, compressed, after the first one
    while (!archive.trailing.empty()) {
        Compression next = detect_compression(archive.trailing.substr(0, 8));
        if (next == Compression::None || next == Compression::Unknown) {
            *error = "unrecognized data after the archive trailer";
            return nullptr;
        }

        TempFile segment;
        if (segment.path().empty() || !write_file(segment.path(), archive.trailing)) {
            *error = "cannot stage the appended archive for decompression";
            return nullptr;
        }
        LOGI("Appended %s archive found", compression_name(next));

        std::string more;
        if (!decompress_file(segment.path(), next, &more, error))
            return nullptr;

        CpioArchive appended;
        if (!parse_cpio(more, &appended, error))
            return nullptr;
        for (auto& entry : appended.entries)
            archive.entries.push_back(std::move(entry));
        archive.trailing = std::move(appended.trailing);
    }

    return std::unique_ptr<ArchiveTree>(new ArchiveTree(std::move(archive.entries)));
}

}  // namespace rdinit
