#include "log.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <cstdio>
#include <cstring>

namespace rdinit {

static LogLevel g_log_level = LogLevel::INFO;
static char g_log_tag[32] = "rdinit";
static int g_kmsg_fd = -1;

bool log_open_kmsg(const char* device) {
    int fd = open(device, O_WRONLY | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }
    if (g_kmsg_fd >= 0) {
        close(g_kmsg_fd);
    }
    g_kmsg_fd = fd;
    return true;
}

void log_init(const char* tag) {
    strncpy(g_log_tag, tag, sizeof(g_log_tag) - 1);
    g_log_tag[sizeof(g_log_tag) - 1] = '\0';
}

void log_set_level(LogLevel level) {
    g_log_level = level;
}

LogLevel log_get_level() {
    return g_log_level;
}

bool log_parse_level(const std::string& name, LogLevel* out) {
    if (name == "verbose") {
        *out = LogLevel::VERBOSE;
    } else if (name == "debug") {
        *out = LogLevel::DEBUG;
    } else if (name == "info") {
        *out = LogLevel::INFO;
    } else if (name == "warn") {
        *out = LogLevel::WARN;
    } else if (name == "error") {
        *out = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

static void log_write(LogLevel level, const char* fmt, va_list args) {
    if (level < g_log_level)
        return;

    const char* level_str;
    int kern_level;
    switch (level) {
    case LogLevel::VERBOSE:
        level_str = "V";
        kern_level = 7;
        break;
    case LogLevel::DEBUG:
        level_str = "D";
        kern_level = 7;
        break;
    case LogLevel::INFO:
        level_str = "I";
        kern_level = 6;
        break;
    case LogLevel::WARN:
        level_str = "W";
        kern_level = 4;
        break;
    case LogLevel::ERROR:
        level_str = "E";
        kern_level = 3;
        break;
    default:
        level_str = "?";
        kern_level = 6;
        break;
    }

    char msg[1024];
    vsnprintf(msg, sizeof(msg), fmt, args);

    // Format: "<level>tag: message"
    if (g_kmsg_fd >= 0) {
        char buf[1100];
        int len = snprintf(buf, sizeof(buf), "<%d>%s: %s\n", kern_level, g_log_tag, msg);
        if (len >= static_cast<int>(sizeof(buf))) {
            len = sizeof(buf) - 1;
        }
        if (write(g_kmsg_fd, buf, len) < 0) {
            close(g_kmsg_fd);
            g_kmsg_fd = -1;
        }
    }

    // Also write to the console
    fprintf(stderr, "%s/%s: %s\n", level_str, g_log_tag, msg);
}

void log_v(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_write(LogLevel::VERBOSE, fmt, args);
    va_end(args);
}

void log_d(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_write(LogLevel::DEBUG, fmt, args);
    va_end(args);
}

void log_i(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_write(LogLevel::INFO, fmt, args);
    va_end(args);
}

void log_w(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_write(LogLevel::WARN, fmt, args);
    va_end(args);
}

void log_e(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_write(LogLevel::ERROR, fmt, args);
    va_end(args);
}

}  // namespace rdinit
