#include "blkid_probe.hpp"
#include "../defs.hpp"
#include "../log.hpp"

#include <blkid/blkid.h>
#include <dirent.h>
#include <limits.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <algorithm>
#include <cstring>

namespace rdinit {

namespace {

class BlkidCache {
public:
    BlkidCache() {
        if (blkid_get_cache(&cache_, "/dev/null") < 0) {
            LOGW("blkid_get_cache failed");
            cache_ = nullptr;
        }
    }
    ~BlkidCache() {
        if (cache_)
            blkid_put_cache(cache_);
    }
    BlkidCache(const BlkidCache&) = delete;
    BlkidCache& operator=(const BlkidCache&) = delete;

    blkid_cache get() const { return cache_; }

private:
    blkid_cache cache_ = nullptr;
};

class BlkidDevIterate {
public:
    explicit BlkidDevIterate(blkid_cache cache) : iter_(blkid_dev_iterate_begin(cache)) {}
    ~BlkidDevIterate() {
        if (iter_)
            blkid_dev_iterate_end(iter_);
    }
    BlkidDevIterate(const BlkidDevIterate&) = delete;
    BlkidDevIterate& operator=(const BlkidDevIterate&) = delete;

    blkid_dev_iterate get() const { return iter_; }

private:
    blkid_dev_iterate iter_;
};

class BlkidTagIterate {
public:
    explicit BlkidTagIterate(blkid_dev dev) : iter_(blkid_tag_iterate_begin(dev)) {}
    ~BlkidTagIterate() {
        if (iter_)
            blkid_tag_iterate_end(iter_);
    }
    BlkidTagIterate(const BlkidTagIterate&) = delete;
    BlkidTagIterate& operator=(const BlkidTagIterate&) = delete;

    blkid_tag_iterate get() const { return iter_; }

private:
    blkid_tag_iterate iter_;
};

const char* by_link_dir(const std::string& tag) {
    if (tag == "UUID")
        return "/dev/disk/by-uuid";
    if (tag == "LABEL")
        return "/dev/disk/by-label";
    if (tag == "PARTUUID")
        return "/dev/disk/by-partuuid";
    return nullptr;
}

std::optional<std::string> resolve_by_link(const std::string& tag, const std::string& value) {
    const char* dir = by_link_dir(tag);
    if (!dir)
        return std::nullopt;

    std::string link = std::string(dir) + "/" + value;
    char resolved[PATH_MAX];
    if (!realpath(link.c_str(), resolved))
        return std::nullopt;

    struct stat st;
    if (stat(resolved, &st) != 0 || !S_ISBLK(st.st_mode))
        return std::nullopt;
    return std::string(resolved);
}

std::string describe_tags(blkid_dev dev) {
    std::string tags;
    BlkidTagIterate iter(dev);
    if (!iter.get())
        return tags;

    const char* type;
    const char* value;
    while (blkid_tag_next(iter.get(), &type, &value) == 0) {
        tags += " ";
        tags += type;
        tags += "=";
        tags += value;
    }
    return tags;
}

}  // namespace

std::vector<std::string> BlkidProbe::find_by_tag(const std::string& tag,
                                                 const std::string& value) {
    std::vector<std::string> candidates;

    BlkidCache cache;
    if (cache.get()) {
        if (blkid_probe_all(cache.get()) < 0) {
            LOGW("blkid_probe_all failed");
        }
        BlkidDevIterate iter(cache.get());
        if (iter.get() && blkid_dev_set_search(iter.get(), tag.c_str(), value.c_str()) == 0) {
            blkid_dev dev = nullptr;
            while (blkid_dev_next(iter.get(), &dev) == 0) {
                dev = blkid_verify(cache.get(), dev);
                if (dev)
                    candidates.push_back(blkid_dev_devname(dev));
            }
        }
    }

    if (candidates.empty()) {
        auto linked = resolve_by_link(tag, value);
        if (linked)
            candidates.push_back(*linked);
    }
    return candidates;
}

std::vector<std::string> BlkidProbe::list_block_devices() {
    std::vector<std::string> names;
    DIR* dir = opendir(SYS_BLOCK_DIR);
    if (dir) {
        struct dirent* d;
        while ((d = readdir(dir)) != nullptr) {
            if (d->d_name[0] == '.')
                continue;
            names.push_back(d->d_name);
        }
        closedir(dir);
    }
    std::sort(names.begin(), names.end());

    std::vector<std::string> lines;
    BlkidCache cache;
    for (const auto& name : names) {
        std::string device = "/dev/" + name;
        std::string line = device;
        if (cache.get()) {
            blkid_dev dev = blkid_get_dev(cache.get(), device.c_str(), BLKID_DEV_NORMAL);
            if (dev)
                line += describe_tags(dev);
        }
        lines.push_back(line);
    }
    return lines;
}

std::optional<std::string> BlkidProbe::probe_fstype(const std::string& device) {
    BlkidCache cache;
    if (!cache.get())
        return std::nullopt;

    blkid_dev dev = blkid_get_dev(cache.get(), device.c_str(), BLKID_DEV_NORMAL);
    if (!dev)
        return std::nullopt;

    BlkidTagIterate iter(dev);
    if (!iter.get())
        return std::nullopt;

    const char* type;
    const char* value;
    while (blkid_tag_next(iter.get(), &type, &value) == 0) {
        if (strcmp(type, "TYPE") == 0)
            return std::string(value);
    }
    return std::nullopt;
}

}  // namespace rdinit
