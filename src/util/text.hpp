#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace ragquery::text {

// True for 1..max_length characters drawn from [A-Za-z0-9_-].
bool is_identifier(std::string_view value, std::size_t max_length);

bool is_blank(std::string_view value);

std::string trim(std::string_view value);

// Replaces every run of ASCII whitespace with one space and trims both ends.
std::string collapse_whitespace(std::string_view value);

// Number of UTF-8 code points; continuation bytes are not counted.
std::size_t utf8_length(std::string_view value);

// Largest position <= pos that does not split a UTF-8 sequence.
std::size_t utf8_floor(std::string_view value, std::size_t pos);

// Cuts to at most max_bytes on a UTF-8 boundary and appends "..." when cut.
std::string preview(std::string_view value, std::size_t max_bytes);

}  // namespace ragquery::text
