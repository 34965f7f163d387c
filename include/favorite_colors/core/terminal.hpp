#pragma once

namespace favorite_colors {

/// True if stderr is a terminal; log colors are only emitted there.
bool IsStderrTty();

/// True if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Resolve the final color decision from CLI overrides and the environment.
/// An explicit --no-color or NO_COLOR wins over --color.
bool ResolveLogColor(bool force_color, bool force_no_color);

} // namespace favorite_colors
