#pragma once

#include <optional>

namespace pocketbase {

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if stdout is a terminal (for colored table/error output).
bool IsStdoutTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Resolve the effective color mode: an explicit choice wins, NO_COLOR
/// disables, otherwise color follows whether the stream is a terminal.
bool ResolveColor(std::optional<bool> forced, bool is_tty);

} // namespace pocketbase
