#pragma once

namespace ens_mcp {

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if stdout is a terminal (for colored smoke-test output).
bool IsStdoutTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

} // namespace ens_mcp
