#pragma once

#include <sys/types.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rdinit {

// File system utilities
bool ensure_dir_exists(const std::string& path);

// String utilities
std::string trim(const std::string& str);
std::vector<std::string> split(const std::string& str, char delim);
std::string join(const std::vector<std::string>& parts, const std::string& sep);
bool starts_with(const std::string& str, const std::string& prefix);
std::optional<uint64_t> parse_unsigned(const std::string& str);
// Accepts an optional K/M/G/T suffix (powers of 1024)
std::optional<uint64_t> parse_size(const std::string& str);
std::string join_path(const std::string& base, const std::string& path);
std::string dirname_of(const std::string& path);
std::string basename_of(const std::string& path);

// File I/O
std::optional<std::string> read_file(const std::string& path);
bool write_file(const std::string& path, const std::string& content);

// Command execution
struct ExecResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};
ExecResult exec_command(const std::vector<std::string>& args);
ExecResult exec_command(const std::vector<std::string>& args, const std::string& input);
pid_t exec_command_async(const std::vector<std::string>& args);

}  // namespace rdinit
