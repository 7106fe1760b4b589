#include "tty_console.hpp"
#include "../log.hpp"

#include <fcntl.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>

namespace rdinit {

namespace {

// Restores the terminal attributes on scope exit
class EchoOff {
public:
    EchoOff() {
        if (tcgetattr(STDIN_FILENO, &saved_) == 0) {
            struct termios quiet = saved_;
            quiet.c_lflag &= ~ECHO;
            quiet.c_lflag |= ICANON | ECHONL;
            active_ = tcsetattr(STDIN_FILENO, TCSAFLUSH, &quiet) == 0;
        }
    }
    ~EchoOff() {
        if (active_)
            tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved_);
    }
    EchoOff(const EchoOff&) = delete;
    EchoOff& operator=(const EchoOff&) = delete;

private:
    struct termios saved_;
    bool active_ = false;
};

}  // namespace

void TtyConsole::message(const std::string& text) {
    std::cout << text << std::endl;
}

std::optional<std::string> TtyConsole::read_secret(const std::string& prompt) {
    std::cout << prompt << std::flush;

    EchoOff echo_off;
    std::string line;
    if (!std::getline(std::cin, line)) {
        std::cin.clear();
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return line;
}

void TtyConsole::rescue_shell(const std::string& banner, RescueMode mode) {
    std::cout << banner << std::flush;

    pid_t pid = fork();
    if (pid < 0) {
        LOGE("fork for rescue shell failed: %s", strerror(errno));
        sleep(1);
        return;
    }

    if (pid == 0) {
        setsid();
        // Job control needs the console as controlling terminal
        ioctl(STDIN_FILENO, TIOCSCTTY, 1);
        const char* name = mode == RescueMode::Fatal ? "rescue" : "break";
        setenv("RDINIT_SHELL", name, 1);
        execl(shell_.c_str(), shell_.c_str(), "-i", static_cast<char*>(nullptr));
        fprintf(stderr, "cannot exec %s: %s\n", shell_.c_str(), strerror(errno));
        _exit(127);
    }

    // As PID 1 every orphan lands here too, reap until the shell is gone
    for (;;) {
        int status;
        pid_t ret = waitpid(-1, &status, 0);
        if (ret == pid)
            break;
        if (ret < 0 && errno != EINTR) {
            if (errno == ECHILD)
                break;
            LOGE("waitpid: %s", strerror(errno));
            break;
        }
    }

    if (mode == RescueMode::Checkpoint) {
        LOGI("Shell exited, continuing boot");
    }
}

}  // namespace rdinit
