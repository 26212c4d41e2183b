#pragma once

namespace workflow_tracker {

// SGR sequences shared by the color log sink and the CLI formatter.
namespace ansi {

constexpr const char* kReset  = "\033[0m";
constexpr const char* kBold   = "\033[1m";
constexpr const char* kDim    = "\033[90m";
constexpr const char* kRed    = "\033[1;31m";
constexpr const char* kGreen  = "\033[1;32m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kCyan   = "\033[36m";

} // namespace ansi

// --color / --no-color / neither.
enum class ColorMode {
    Auto,
    Always,
    Never,
};

bool IsStderrTty();
bool IsStdoutTty();

// NO_COLOR set to any value, including empty.
bool NoColorEnvSet();

// Always and Never win; Auto needs a terminal and no NO_COLOR.
bool ShouldUseColor(ColorMode mode, bool is_tty);

} // namespace workflow_tracker
