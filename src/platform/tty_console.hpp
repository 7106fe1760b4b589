#pragma once

#include <string>
#include <utility>

#include "platform.hpp"

namespace rdinit {

// Console on the process's stdin/stdout, normally /dev/console for PID 1.
class TtyConsole : public Console {
public:
    explicit TtyConsole(std::string shell) : shell_(std::move(shell)) {}

    void message(const std::string& text) override;
    std::optional<std::string> read_secret(const std::string& prompt) override;
    void rescue_shell(const std::string& banner, RescueMode mode) override;

private:
    std::string shell_;
};

}  // namespace rdinit
