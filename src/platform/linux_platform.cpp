#include "linux_platform.hpp"
#include "../defs.hpp"
#include "../log.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <ifaddrs.h>
#include <linux/loop.h>
#include <linux/magic.h>
#include <netinet/in.h>
#include <signal.h>
#include <sys/ioctl.h>
#include <sys/mount.h>
#include <sys/stat.h>
#include <sys/statfs.h>
#include <sys/sysmacros.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

namespace rdinit {

namespace {

struct MountOption {
    const char* name;
    unsigned long flagmask;
    unsigned long flagset;
    bool invert;
};

constexpr unsigned long MS_AMASK = MS_NOATIME | MS_RELATIME;

// Sorted by name
const MountOption known_options[] = {
    {"async", MS_SYNCHRONOUS, MS_SYNCHRONOUS, true},
    {"atime", MS_AMASK, MS_NOATIME, true},
    {"bind", MS_BIND, MS_BIND, false},
    {"dev", MS_NODEV, MS_NODEV, true},
    {"diratime", MS_NODIRATIME, MS_NODIRATIME, true},
    {"dirsync", MS_DIRSYNC, MS_DIRSYNC, false},
    {"exec", MS_NOEXEC, MS_NOEXEC, true},
    {"lazytime", MS_LAZYTIME, MS_LAZYTIME, false},
    {"noatime", MS_AMASK, MS_NOATIME, false},
    {"nodev", MS_NODEV, MS_NODEV, false},
    {"nodiratime", MS_NODIRATIME, MS_NODIRATIME, false},
    {"noexec", MS_NOEXEC, MS_NOEXEC, false},
    {"norelatime", MS_AMASK, MS_RELATIME, true},
    {"nostrictatime", MS_STRICTATIME, MS_STRICTATIME, true},
    {"nosuid", MS_NOSUID, MS_NOSUID, false},
    {"relatime", MS_AMASK, MS_RELATIME, false},
    {"ro", MS_RDONLY, MS_RDONLY, false},
    {"rw", MS_RDONLY, MS_RDONLY, true},
    {"silent", MS_SILENT, MS_SILENT, false},
    {"strictatime", MS_STRICTATIME, MS_STRICTATIME, false},
    {"suid", MS_NOSUID, MS_NOSUID, true},
    {"sync", MS_SYNCHRONOUS, MS_SYNCHRONOUS, false},
};

/**
 * RAII wrapper for a file descriptor
 */
class UniqueFd {
public:
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() {
        if (fd_ >= 0)
            close(fd_);
    }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const { return fd_; }
    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

private:
    int fd_;
};

/**
 * Remove everything below dfd that lives on root_dev.
 *
 * Takes ownership of dfd. Entries on other devices (mount points) are skipped.
 */
bool remove_tree_contents(int dfd, dev_t root_dev) {
    DIR* dir = fdopendir(dfd);
    if (!dir) {
        close(dfd);
        return false;
    }

    bool ok = true;
    struct dirent* d;
    while ((d = readdir(dir)) != nullptr) {
        if (strcmp(d->d_name, ".") == 0 || strcmp(d->d_name, "..") == 0)
            continue;

        struct stat st;
        if (fstatat(dirfd(dir), d->d_name, &st, AT_SYMLINK_NOFOLLOW) != 0) {
            ok = false;
            continue;
        }
        if (st.st_dev != root_dev)
            continue;

        bool is_dir = S_ISDIR(st.st_mode);
        if (is_dir) {
            int child = openat(dirfd(dir), d->d_name, O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC);
            if (child < 0 || !remove_tree_contents(child, root_dev)) {
                ok = false;
                continue;
            }
        }
        if (unlinkat(dirfd(dir), d->d_name, is_dir ? AT_REMOVEDIR : 0) != 0) {
            ok = false;
        }
    }

    closedir(dir);
    return ok;
}

std::vector<std::string> path_components(const std::string& path) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : path) {
        if (c == '/') {
            if (!current.empty())
                parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty())
        parts.push_back(current);
    return parts;
}

// Kernel filesystem types that need no backing device
std::vector<std::string> block_filesystems() {
    std::vector<std::string> types;
    std::ifstream ifs(FILESYSTEMS_PATH);
    std::string line;
    while (std::getline(ifs, line)) {
        if (line.empty() || starts_with(line, "nodev"))
            continue;
        std::string type = trim(line);
        if (!type.empty())
            types.push_back(type);
    }
    return types;
}

}  // namespace

MountFlags parse_mount_options(const std::string& options) {
    MountFlags result;
    std::vector<std::string> extra;

    for (const auto& option : split(options, ',')) {
        if (option.empty() || option == "defaults")
            continue;

        const MountOption* known = nullptr;
        for (const auto& candidate : known_options) {
            int cmp = strcmp(option.c_str(), candidate.name);
            if (cmp == 0) {
                known = &candidate;
                break;
            }
            if (cmp < 0)
                break;
        }

        if (!known) {
            extra.push_back(option);
            continue;
        }

        result.flags &= ~known->flagmask;
        if (known->invert) {
            result.flags &= ~known->flagset;
        } else {
            result.flags |= known->flagset;
        }
    }

    result.data = join(extra, ",");
    return result;
}

bool LinuxPlatform::fail(const std::string& what) {
    last_error_ = what + ": " + strerror(errno);
    return false;
}

bool LinuxPlatform::exists(const std::string& path) {
    struct stat st;
    return lstat(path.c_str(), &st) == 0;
}

bool LinuxPlatform::is_directory(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool LinuxPlatform::is_regular_file(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

bool LinuxPlatform::is_block_device(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISBLK(st.st_mode);
}

std::optional<DeviceNumber> LinuxPlatform::char_device_number(const std::string& path) {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0 || !S_ISCHR(st.st_mode))
        return std::nullopt;
    return DeviceNumber{major(st.st_rdev), minor(st.st_rdev)};
}

std::optional<uint64_t> LinuxPlatform::file_size(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        fail("stat " + path);
        return std::nullopt;
    }
    return static_cast<uint64_t>(st.st_size);
}

std::optional<uint64_t> LinuxPlatform::filesystem_id(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        fail("stat " + path);
        return std::nullopt;
    }
    return static_cast<uint64_t>(st.st_dev);
}

std::optional<std::vector<std::string>> LinuxPlatform::list_directory(const std::string& path) {
    DIR* dir = opendir(path.c_str());
    if (!dir) {
        fail("opendir " + path);
        return std::nullopt;
    }

    std::vector<std::string> names;
    struct dirent* d;
    while ((d = readdir(dir)) != nullptr) {
        if (strcmp(d->d_name, ".") == 0 || strcmp(d->d_name, "..") == 0)
            continue;
        names.push_back(d->d_name);
    }
    closedir(dir);
    return names;
}

bool LinuxPlatform::is_executable_in_root(const std::string& root, const std::string& path) {
    std::vector<std::string> pending = path_components(path);
    std::vector<std::string> resolved;
    unsigned links = 0;

    // Walk component by component so absolute links stay inside root
    size_t index = 0;
    while (index < pending.size()) {
        const std::string component = pending[index++];
        if (component == ".")
            continue;
        if (component == "..") {
            if (!resolved.empty())
                resolved.pop_back();
            continue;
        }

        resolved.push_back(component);
        std::string host_path = root + "/" + join(resolved, "/");

        struct stat st;
        if (lstat(host_path.c_str(), &st) != 0)
            return false;
        if (!S_ISLNK(st.st_mode))
            continue;

        if (++links > MAX_SYMLINK_DEPTH)
            return false;

        char target[PATH_MAX];
        ssize_t len = readlink(host_path.c_str(), target, sizeof(target) - 1);
        if (len < 0)
            return false;
        target[len] = '\0';

        resolved.pop_back();
        if (target[0] == '/')
            resolved.clear();

        std::vector<std::string> rest = path_components(target);
        rest.insert(rest.end(), pending.begin() + index, pending.end());
        pending = rest;
        index = 0;
    }

    std::string host_path = root + "/" + join(resolved, "/");
    struct stat st;
    if (stat(host_path.c_str(), &st) != 0 || !S_ISREG(st.st_mode))
        return false;
    return access(host_path.c_str(), X_OK) == 0;
}

std::optional<std::string> LinuxPlatform::read_file(const std::string& path) {
    return rdinit::read_file(path);
}

bool LinuxPlatform::make_directory(const std::string& path) {
    if (!ensure_dir_exists(path)) {
        return fail("mkdir " + path);
    }
    return true;
}

bool LinuxPlatform::make_char_device(const std::string& path, DeviceNumber number,
                                     unsigned mode) {
    if (mknod(path.c_str(), S_IFCHR | mode, makedev(number.major, number.minor)) != 0 &&
        errno != EEXIST) {
        return fail("mknod " + path);
    }
    return true;
}

bool LinuxPlatform::write_file(const std::string& path, const std::string& content) {
    if (!rdinit::write_file(path, content)) {
        return fail("write " + path);
    }
    return true;
}

bool LinuxPlatform::copy_file(const std::string& from, const std::string& to) {
    std::ifstream src(from, std::ios::binary);
    if (!src) {
        return fail("open " + from);
    }
    std::ofstream dst(to, std::ios::binary | std::ios::trunc);
    if (!dst) {
        return fail("create " + to);
    }
    dst << src.rdbuf();
    dst.flush();
    if (!dst) {
        return fail("copy " + from + " to " + to);
    }
    return true;
}

bool LinuxPlatform::clear_directory(const std::string& path) {
    int fd = open(path.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return fail("open " + path);
    }
    struct stat st;
    if (fstat(fd, &st) != 0) {
        close(fd);
        return fail("stat " + path);
    }
    if (!remove_tree_contents(fd, st.st_dev)) {
        return fail("clear " + path);
    }
    return true;
}

bool LinuxPlatform::mount_auto(const MountEntry& entry, const MountFlags& parsed) {
    for (const auto& type : block_filesystems()) {
        if (::mount(entry.source.c_str(), entry.target.c_str(), type.c_str(), parsed.flags,
                    parsed.data.empty() ? nullptr : parsed.data.c_str()) == 0) {
            LOGD("mounted %s as %s", entry.source.c_str(), type.c_str());
            return true;
        }
    }
    return fail("mount " + entry.source + " on " + entry.target + " (no filesystem type matched)");
}

bool LinuxPlatform::mount(const MountEntry& entry) {
    if (!make_directory(entry.target)) {
        return false;
    }

    MountFlags parsed = parse_mount_options(entry.options);
    if (entry.fstype == "auto") {
        return mount_auto(entry, parsed);
    }

    if (::mount(entry.source.c_str(), entry.target.c_str(), entry.fstype.c_str(), parsed.flags,
                parsed.data.empty() ? nullptr : parsed.data.c_str()) != 0) {
        return fail("mount " + entry.source + " on " + entry.target + " (" + entry.fstype + ")");
    }
    return true;
}

bool LinuxPlatform::move_mount(const std::string& from, const std::string& to) {
    if (!make_directory(to)) {
        return false;
    }
    if (::mount(from.c_str(), to.c_str(), nullptr, MS_MOVE, nullptr) != 0) {
        return fail("move " + from + " to " + to);
    }
    return true;
}

std::optional<std::string> LinuxPlatform::attach_loop(const std::string& file) {
    UniqueFd control(open("/dev/loop-control", O_RDWR | O_CLOEXEC));
    if (control.get() < 0) {
        fail("open /dev/loop-control");
        return std::nullopt;
    }
    int number = ioctl(control.get(), LOOP_CTL_GET_FREE);
    if (number < 0) {
        fail("LOOP_CTL_GET_FREE");
        return std::nullopt;
    }

    std::string device = "/dev/loop" + std::to_string(number);
    UniqueFd backing(open(file.c_str(), O_RDONLY | O_CLOEXEC));
    if (backing.get() < 0) {
        fail("open " + file);
        return std::nullopt;
    }
    UniqueFd loop(open(device.c_str(), O_RDONLY | O_CLOEXEC));
    if (loop.get() < 0) {
        fail("open " + device);
        return std::nullopt;
    }

#ifdef LOOP_CONFIGURE
    struct loop_config config;
    memset(&config, 0, sizeof(config));
    config.fd = static_cast<__u32>(backing.get());
    config.info.lo_flags = LO_FLAGS_READ_ONLY;
    strncpy(reinterpret_cast<char*>(config.info.lo_file_name), file.c_str(), LO_NAME_SIZE - 1);
    if (ioctl(loop.get(), LOOP_CONFIGURE, &config) == 0) {
        return device;
    }
    if (errno != EINVAL && errno != ENOTTY) {
        fail("LOOP_CONFIGURE " + device);
        return std::nullopt;
    }
#endif  // #ifdef LOOP_CONFIGURE

    // Kernels before 5.8
    if (ioctl(loop.get(), LOOP_SET_FD, backing.get()) != 0) {
        fail("LOOP_SET_FD " + device);
        return std::nullopt;
    }
    struct loop_info64 info;
    memset(&info, 0, sizeof(info));
    info.lo_flags = LO_FLAGS_READ_ONLY;
    strncpy(reinterpret_cast<char*>(info.lo_file_name), file.c_str(), LO_NAME_SIZE - 1);
    if (ioctl(loop.get(), LOOP_SET_STATUS64, &info) != 0) {
        fail("LOOP_SET_STATUS64 " + device);
        ioctl(loop.get(), LOOP_CLR_FD, 0);
        return std::nullopt;
    }
    return device;
}

bool LinuxPlatform::has_program(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0;
    }

    const char* path_env = getenv("PATH");
    std::string path_str = path_env ? path_env : "/bin:/sbin:/usr/bin:/usr/sbin";
    for (const auto& dir : split(path_str, ':')) {
        if (dir.empty())
            continue;
        std::string candidate = dir + "/" + name;
        if (access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

ExecResult LinuxPlatform::run(const std::vector<std::string>& args, const std::string& input) {
    LOGD("exec: %s", join(args, " ").c_str());
    ExecResult result = exec_command(args, input);
    if (result.exit_code != 0) {
        last_error_ = args.empty() ? "empty command" : args[0] + " exited with " +
                                                             std::to_string(result.exit_code);
    }
    return result;
}

pid_t LinuxPlatform::spawn(const std::vector<std::string>& args) {
    LOGD("spawn: %s", join(args, " ").c_str());
    pid_t pid = exec_command_async(args);
    if (pid < 0) {
        fail("fork");
    }
    return pid;
}

std::optional<int> LinuxPlatform::try_reap(pid_t pid) {
    int status = 0;
    pid_t ret = waitpid(pid, &status, WNOHANG);
    if (ret == 0)
        return std::nullopt;
    if (ret < 0) {
        fail("waitpid");
        return -1;
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

void LinuxPlatform::terminate(pid_t pid) {
    if (kill(pid, SIGTERM) == 0) {
        int status;
        waitpid(pid, &status, 0);
    }
}

bool LinuxPlatform::has_global_address() {
    struct ifaddrs* addrs = nullptr;
    if (getifaddrs(&addrs) != 0) {
        fail("getifaddrs");
        return false;
    }

    bool found = false;
    for (struct ifaddrs* ifa = addrs; ifa != nullptr && !found; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr)
            continue;
        if (ifa->ifa_addr->sa_family == AF_INET) {
            auto* in = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
            uint32_t addr = ntohl(in->sin_addr.s_addr);
            bool loopback = (addr >> 24) == 127;
            bool link_local = (addr >> 16) == 0xa9fe;
            found = !loopback && !link_local && addr != 0;
        } else if (ifa->ifa_addr->sa_family == AF_INET6) {
            auto* in6 = reinterpret_cast<struct sockaddr_in6*>(ifa->ifa_addr);
            found = !IN6_IS_ADDR_LOOPBACK(&in6->sin6_addr) &&
                    !IN6_IS_ADDR_LINKLOCAL(&in6->sin6_addr) &&
                    !IN6_IS_ADDR_UNSPECIFIED(&in6->sin6_addr);
        }
    }

    freeifaddrs(addrs);
    return found;
}

void LinuxPlatform::sleep_seconds(unsigned seconds) {
    unsigned remaining = seconds;
    while (remaining > 0) {
        remaining = sleep(remaining);
    }
}

bool LinuxPlatform::attach_kernel_log() {
    if (!log_open_kmsg(KMSG_PATH)) {
        return fail(std::string("open ") + KMSG_PATH);
    }
    return true;
}

bool LinuxPlatform::switch_root(const std::string& new_root, const std::string& init,
                                const std::vector<std::string>& argv) {
    struct statfs root_fs;
    if (statfs("/", &root_fs) != 0) {
        return fail("statfs /");
    }
    if (root_fs.f_type != RAMFS_MAGIC && root_fs.f_type != TMPFS_MAGIC) {
        errno = EINVAL;
        return fail("/ is not an initramfs");
    }

    struct stat root_st;
    if (stat("/", &root_st) != 0) {
        return fail("stat /");
    }

    if (chdir(new_root.c_str()) != 0) {
        return fail("chdir " + new_root);
    }

    UniqueFd old_root(open("/", O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (old_root.get() < 0) {
        return fail("open /");
    }

    if (::mount(".", "/", nullptr, MS_MOVE, nullptr) != 0) {
        return fail("move " + new_root + " to /");
    }
    if (chroot(".") != 0) {
        return fail("chroot");
    }
    if (chdir("/") != 0) {
        return fail("chdir /");
    }

    // Free the initramfs; it is only reachable through old_root now
    if (!remove_tree_contents(old_root.release(), root_st.st_dev)) {
        LOGW("Some initramfs content could not be removed");
    }

    std::vector<char*> c_args;
    for (const auto& arg : argv) {
        c_args.push_back(const_cast<char*>(arg.c_str()));
    }
    c_args.push_back(nullptr);

    execv(init.c_str(), c_args.data());
    return fail("execv " + init);
}

}  // namespace rdinit
