#pragma once

namespace toolbridge {

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Color decision for the console log sink: NO_COLOR wins, then an explicit
/// --color/--no-color flag, then whether stderr is a terminal.
bool ShouldUseColor(bool force_color, bool force_no_color);

} // namespace toolbridge
