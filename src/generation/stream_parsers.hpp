#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ragquery {

// Incremental Server-Sent Events decoder. feed() accepts arbitrary byte
// slices and returns the data payload of every event completed by them.
// Multi-line data fields are joined with '\n'; comments and other fields are
// skipped.
class SseParser {
public:
    std::vector<std::string> feed(std::string_view bytes);

    // Dispatches a trailing event that was not terminated by a blank line.
    std::optional<std::string> finish();

private:
    void consume_line(std::string_view line, std::vector<std::string>& events);

    std::string pending_;
    std::string data_;
    bool has_data_ = false;
};

// Newline-delimited JSON: returns each complete non-blank line.
class NdjsonParser {
public:
    std::vector<std::string> feed(std::string_view bytes);
    std::optional<std::string> finish();

private:
    std::string pending_;
};

}  // namespace ragquery
