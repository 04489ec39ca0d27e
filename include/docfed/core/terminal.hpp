#pragma once

namespace docfed {

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if stdout is a terminal (for colored result tables).
bool IsStdoutTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Resolve whether output to stdout should be colored given explicit
/// --color / --no-color requests, NO_COLOR and whether stdout is a tty.
bool ResolveColorMode(bool force_color, bool force_no_color);

} // namespace docfed
