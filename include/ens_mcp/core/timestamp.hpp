#pragma once

#include <chrono>
#include <string>

namespace ens_mcp {

/// UTC ISO-8601 with millisecond precision, e.g. "2024-05-01T12:34:56.789Z".
std::string Iso8601Utc(std::chrono::system_clock::time_point tp);

/// Iso8601Utc(system_clock::now()).
std::string Iso8601Now();

/// Local wall-clock time as HH:MM:SS (compact console log prefix).
std::string HhMmSsNow();

} // namespace ens_mcp
