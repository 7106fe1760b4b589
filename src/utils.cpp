#include "utils.hpp"
#include "log.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace rdinit {

bool ensure_dir_exists(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        return S_ISDIR(st.st_mode);
    }

    // Create directory recursively
    std::string current;
    for (char c : path) {
        current += c;
        if (c == '/' && current.size() > 1) {
            if (mkdir(current.c_str(), 0755) != 0 && errno != EEXIST) {
                LOGE("Failed to create directory %s: %s", current.c_str(), strerror(errno));
                return false;
            }
        }
    }

    if (mkdir(path.c_str(), 0755) != 0 && errno != EEXIST) {
        LOGE("Failed to create directory %s: %s", path.c_str(), strerror(errno));
        return false;
    }

    return true;
}

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos)
        return "";
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, delim)) {
        result.push_back(item);
    }
    // getline drops a trailing empty field
    if (!str.empty() && str.back() == delim) {
        result.push_back("");
    }
    return result;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0)
            out += sep;
        out += parts[i];
    }
    return out;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

std::optional<uint64_t> parse_unsigned(const std::string& str) {
    if (str.empty())
        return std::nullopt;
    uint64_t value = 0;
    for (char c : str) {
        if (c < '0' || c > '9')
            return std::nullopt;
        uint64_t next = value * 10 + static_cast<uint64_t>(c - '0');
        if (next / 10 != value)
            return std::nullopt;
        value = next;
    }
    return value;
}

std::optional<uint64_t> parse_size(const std::string& str) {
    if (str.empty())
        return std::nullopt;

    std::string digits = str;
    uint64_t multiplier = 1;
    switch (str.back()) {
    case 'k':
    case 'K':
        multiplier = 1ULL << 10;
        break;
    case 'm':
    case 'M':
        multiplier = 1ULL << 20;
        break;
    case 'g':
    case 'G':
        multiplier = 1ULL << 30;
        break;
    case 't':
    case 'T':
        multiplier = 1ULL << 40;
        break;
    default:
        break;
    }
    if (multiplier != 1) {
        digits.pop_back();
    }

    auto value = parse_unsigned(digits);
    if (!value || *value == 0)
        return std::nullopt;
    if (*value > UINT64_MAX / multiplier)
        return std::nullopt;
    return *value * multiplier;
}

std::string join_path(const std::string& base, const std::string& path) {
    if (base.empty() || base == "/")
        return path.empty() || path[0] != '/' ? "/" + path : path;
    std::string out = base;
    while (out.size() > 1 && out.back() == '/')
        out.pop_back();
    if (path.empty())
        return out;
    if (path[0] != '/')
        out += '/';
    return out + path;
}

std::string dirname_of(const std::string& path) {
    size_t pos = path.find_last_of('/');
    if (pos == std::string::npos)
        return ".";
    if (pos == 0)
        return "/";
    return path.substr(0, pos);
}

std::string basename_of(const std::string& path) {
    size_t pos = path.find_last_of('/');
    if (pos == std::string::npos)
        return path;
    return path.substr(pos + 1);
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        return std::nullopt;

    std::stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

bool write_file(const std::string& path, const std::string& content) {
    std::ofstream ofs(path);
    if (!ofs)
        return false;
    ofs << content;
    return static_cast<bool>(ofs);
}

static void close_pipe(int fds[2]) {
    close(fds[0]);
    close(fds[1]);
}

ExecResult exec_command(const std::vector<std::string>& args) {
    return exec_command(args, std::string());
}

ExecResult exec_command(const std::vector<std::string>& args, const std::string& input) {
    ExecResult result{-1, "", ""};

    if (args.empty())
        return result;

    int stdin_pipe[2], stdout_pipe[2], stderr_pipe[2];
    if (pipe(stdin_pipe) != 0) {
        return result;
    }
    if (pipe(stdout_pipe) != 0) {
        close_pipe(stdin_pipe);
        return result;
    }
    if (pipe(stderr_pipe) != 0) {
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return result;
    }

    if (pid == 0) {
        // Child process
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdin_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        std::vector<char*> c_args;
        for (const auto& arg : args) {
            c_args.push_back(const_cast<char*>(arg.c_str()));
        }
        c_args.push_back(nullptr);

        execvp(c_args[0], c_args.data());
        _exit(127);
    }

    // Parent process
    close(stdin_pipe[0]);
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    // Input is small (passphrases); a child that exits early must not kill us
    struct sigaction ignore {}, previous {};
    ignore.sa_handler = SIG_IGN;
    sigaction(SIGPIPE, &ignore, &previous);
    size_t offset = 0;
    while (offset < input.size()) {
        ssize_t n = write(stdin_pipe[1], input.data() + offset, input.size() - offset);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            break;
        }
        offset += static_cast<size_t>(n);
    }
    close(stdin_pipe[1]);
    sigaction(SIGPIPE, &previous, nullptr);

    // Drain both pipes together; a child blocked on a full stderr pipe would
    // otherwise never close stdout
    struct pollfd fds[2] = {{stdout_pipe[0], POLLIN, 0}, {stderr_pipe[0], POLLIN, 0}};
    std::string* sinks[2] = {&result.stdout_str, &result.stderr_str};
    int open_fds = 2;
    char buf[4096];
    while (open_fds > 0) {
        if (poll(fds, 2, -1) < 0) {
            if (errno == EINTR)
                continue;
            LOGE("poll failed: %s", strerror(errno));
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0)
                continue;
            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, n);
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --open_fds;
            }
        }
    }
    for (const auto& fd : fds) {
        if (fd.fd >= 0)
            close(fd.fd);
    }

    int status;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            return result;
    }
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    }

    return result;
}

pid_t exec_command_async(const std::vector<std::string>& args) {
    if (args.empty())
        return -1;

    pid_t pid = fork();
    if (pid < 0)
        return -1;

    if (pid == 0) {
        // Child process
        std::vector<char*> c_args;
        for (const auto& arg : args) {
            c_args.push_back(const_cast<char*>(arg.c_str()));
        }
        c_args.push_back(nullptr);

        execvp(c_args[0], c_args.data());
        _exit(127);
    }

    return pid;
}

}  // namespace rdinit
