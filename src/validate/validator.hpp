#pragma once

#include <optional>
#include <string>
#include <vector>

#include "image_tree.hpp"

namespace rdinit {

enum class Severity { Ok, Info, Warning, Error };

struct Finding {
    Severity severity;
    std::string section;
    std::string message;
};

class ValidationReport {
public:
    void add(Severity severity, const std::string& section, const std::string& message);

    const std::vector<Finding>& findings() const { return findings_; }
    int error_count() const { return errors_; }
    int warning_count() const { return warnings_; }

    // 0 clean, 1 errors, 2 warnings only
    int exit_code() const;

private:
    std::vector<Finding> findings_;
    int errors_ = 0;
    int warnings_ = 0;
};

// nullopt when data is not an ELF image; otherwise whether it requests an interpreter
std::optional<bool> elf_is_dynamic(const std::string& data);

// Run every structural check against an unpacked or in-memory initramfs
ValidationReport validate_image(const ImageTree& tree);

}  // namespace rdinit
