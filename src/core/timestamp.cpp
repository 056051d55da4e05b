#include <ens_mcp/core/timestamp.hpp>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace ens_mcp {

std::string Iso8601Utc(std::chrono::system_clock::time_point tp) {
    const auto time_t_tp = std::chrono::system_clock::to_time_t(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &time_t_tp);
#else
    gmtime_r(&time_t_tp, &utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << 'Z';
    return oss.str();
}

std::string Iso8601Now() {
    return Iso8601Utc(std::chrono::system_clock::now());
}

std::string HhMmSsNow() {
    const auto time_t_now =
        std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &time_t_now);
#else
    localtime_r(&time_t_now, &local);
#endif

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S");
    return oss.str();
}

} // namespace ens_mcp
