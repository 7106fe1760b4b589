#include "rescue.hpp"

#include <sstream>

namespace rdinit {

namespace {

constexpr const char* RULE = "========================================";

void append_hints(std::ostringstream& out) {
    out << "Useful commands:\n";
    out << "  ip addr              - Show network interfaces\n";
    out << "  cat /proc/cmdline    - Show kernel parameters\n";
    out << "  ls /dev              - List devices\n";
    out << "  blkid                - Show filesystem identities\n";
    out << "  dmesg | tail         - Recent kernel messages\n";
    out << "\n";
}

}  // namespace

std::string failure_banner(const Failure& failure) {
    std::ostringstream out;
    out << "\n" << RULE << "\n";
    out << "INITRAMFS ERROR: " << failure.reason << "\n";
    out << RULE << "\n\n";
    out << "Stage:   " << stage_name(failure.stage) << "\n";
    out << "Failure: " << failure_kind_name(failure.kind) << "\n";
    if (!failure.snapshot.empty()) {
        out << "\nVisible block devices:\n";
        for (const auto& line : failure.snapshot)
            out << "  " << line << "\n";
    }
    out << "\n";
    append_hints(out);
    out << "Boot cannot continue. Fix the problem and reboot.\n\n";
    return out.str();
}

std::string checkpoint_banner(const std::string& checkpoint, BootStage stage) {
    std::ostringstream out;
    out << "\nBreak point: " << checkpoint << " (after " << stage_name(stage) << ")\n";
    append_hints(out);
    out << "Type 'exit' to continue boot.\n\n";
    return out.str();
}

}  // namespace rdinit
