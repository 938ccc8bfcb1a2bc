#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace ragquery::time {

// Returns the current UTC time formatted as ISO-8601 with millisecond precision.
std::string current_time_iso8601();

std::string to_iso8601(std::chrono::system_clock::time_point point);

std::int64_t to_epoch_millis(std::chrono::system_clock::time_point point);
std::chrono::system_clock::time_point from_epoch_millis(std::int64_t millis);

long elapsed_ms(std::chrono::steady_clock::time_point since);

}  // namespace ragquery::time
