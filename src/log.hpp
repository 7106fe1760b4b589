#pragma once

#include <cstdarg>
#include <string>

namespace rdinit {

enum class LogLevel {
    VERBOSE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
};

/**
 * Open the kernel log device as the primary sink.
 *
 * Until this succeeds (before devtmpfs is mounted) messages go to stderr only.
 *
 * @param device Path to the kmsg device (e.g., "/dev/kmsg")
 * @return true if the device could be opened for writing
 */
bool log_open_kmsg(const char* device);

void log_init(const char* tag);
void log_set_level(LogLevel level);
LogLevel log_get_level();
bool log_parse_level(const std::string& name, LogLevel* out);

void log_v(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_d(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_i(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_w(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_e(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

// Helper macros
#define LOGV(...) rdinit::log_v(__VA_ARGS__)
#define LOGD(...) rdinit::log_d(__VA_ARGS__)
#define LOGI(...) rdinit::log_i(__VA_ARGS__)
#define LOGW(...) rdinit::log_w(__VA_ARGS__)
#define LOGE(...) rdinit::log_e(__VA_ARGS__)

}  // namespace rdinit
