#include <workflow_tracker/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace workflow_tracker {

bool IsStderrTty() { return ::isatty(STDERR_FILENO) == 1; }

bool IsStdoutTty() { return ::isatty(STDOUT_FILENO) == 1; }

bool NoColorEnvSet() { return std::getenv("NO_COLOR") != nullptr; }

bool ShouldUseColor(ColorMode mode, bool is_tty) {
    if (mode == ColorMode::Auto) {
        return is_tty && !NoColorEnvSet();
    }
    return mode == ColorMode::Always;
}

} // namespace workflow_tracker
