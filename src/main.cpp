/**
 * rdinit - initramfs /init
 *
 * As PID 1 it mounts the early filesystems, assembles the real root and
 * switches to it. Run by hand it offers diagnostics (see cli.cpp).
 */

#include <fcntl.h>
#include <unistd.h>
#include <cstdlib>
#include <string>
#include <vector>

#include "boot/rescue.hpp"
#include "boot/sequencer.hpp"
#include "cli.hpp"
#include "core/settings.hpp"
#include "defs.hpp"
#include "log.hpp"
#include "platform/blkid_probe.hpp"
#include "platform/linux_platform.hpp"
#include "platform/tty_console.hpp"

namespace {

// The kernel may start us without usable stdio when /dev/console is missing
void setup_console() {
    if (fcntl(STDIN_FILENO, F_GETFD) >= 0 && fcntl(STDOUT_FILENO, F_GETFD) >= 0 &&
        fcntl(STDERR_FILENO, F_GETFD) >= 0)
        return;

    int fd = open("/dev/console", O_RDWR | O_NOCTTY);
    if (fd < 0)
        return;
    for (int target = STDIN_FILENO; target <= STDERR_FILENO; ++target) {
        if (fcntl(target, F_GETFD) < 0)
            dup2(fd, target);
    }
    if (fd > STDERR_FILENO)
        close(fd);
}

}  // namespace

int main(int argc, char* argv[]) {
    if (getpid() != 1) {
        return rdinit::cli_run(argc, argv);
    }

    setup_console();
    setenv("PATH", "/usr/sbin:/usr/bin:/sbin:/bin", 0);
    rdinit::log_init("rdinit");

    rdinit::Settings settings = rdinit::Settings::from_file(rdinit::SETTINGS_PATH);
    rdinit::LinuxPlatform platform;
    rdinit::BlkidProbe probe;
    rdinit::TtyConsole console(settings.rescue_shell);

    std::vector<std::string> kernel_args(argv + 1, argv + argc);
    rdinit::BootSequencer sequencer(platform, probe, console, settings);
    const rdinit::BootState& state = sequencer.run(kernel_args);

    // Reaching this point means the handoff did not happen; PID 1 must not exit
    rdinit::Failure failure =
        state.failure ? *state.failure
                      : rdinit::make_failure(state.stage, rdinit::FailureKind::SwitchRootFailed,
                                             "init returned control to the initramfs");
    for (;;) {
        console.rescue_shell(rdinit::failure_banner(failure), rdinit::RescueMode::Fatal);
    }
}
