#include "util/time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace ragquery::time {

std::string current_time_iso8601() { return to_iso8601(std::chrono::system_clock::now()); }

std::string to_iso8601(std::chrono::system_clock::time_point point) {
    using clock = std::chrono::system_clock;
    const auto point_seconds = std::chrono::time_point_cast<std::chrono::seconds>(point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(point - point_seconds).count();
    if (ms < 0) {
        ms = 0;
    }

    const std::time_t time_t_value = clock::to_time_t(point_seconds);
    std::tm tm_buffer{};
#if defined(_WIN32)
    gmtime_s(&tm_buffer, &time_t_value);
#else
    gmtime_r(&time_t_value, &tm_buffer);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buffer, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
}

std::int64_t to_epoch_millis(std::chrono::system_clock::time_point point) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(point.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_millis(std::int64_t millis) {
    return std::chrono::system_clock::time_point{std::chrono::milliseconds{millis}};
}

long elapsed_ms(std::chrono::steady_clock::time_point since) {
    return static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - since).count());
}

}  // namespace ragquery::time
