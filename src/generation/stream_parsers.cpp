#include "generation/stream_parsers.hpp"

#include <utility>

#include "util/text.hpp"

namespace ragquery {
namespace {

std::string_view strip_cr(std::string_view line) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    return line;
}

}  // namespace

std::vector<std::string> SseParser::feed(std::string_view bytes) {
    std::vector<std::string> events;
    pending_.append(bytes);

    std::size_t start = 0;
    while (true) {
        const std::size_t newline = pending_.find('\n', start);
        if (newline == std::string::npos) {
            break;
        }
        consume_line(strip_cr(std::string_view{pending_}.substr(start, newline - start)), events);
        start = newline + 1;
    }
    pending_.erase(0, start);
    return events;
}

void SseParser::consume_line(std::string_view line, std::vector<std::string>& events) {
    if (line.empty()) {
        if (has_data_) {
            events.push_back(std::move(data_));
            data_.clear();
            has_data_ = false;
        }
        return;
    }
    if (line.front() == ':') {
        return;
    }

    const std::size_t colon = line.find(':');
    const std::string_view field = line.substr(0, colon);
    if (field != "data") {
        return;
    }
    std::string_view value = colon == std::string_view::npos ? std::string_view{} : line.substr(colon + 1);
    if (!value.empty() && value.front() == ' ') {
        value.remove_prefix(1);
    }
    if (has_data_) {
        data_.push_back('\n');
    }
    data_.append(value);
    has_data_ = true;
}

std::optional<std::string> SseParser::finish() {
    const std::string_view tail = strip_cr(pending_);
    if (!tail.empty()) {
        std::vector<std::string> ignored;
        consume_line(tail, ignored);
    }
    pending_.clear();
    if (!has_data_) {
        return std::nullopt;
    }
    has_data_ = false;
    std::string out = std::move(data_);
    data_.clear();
    return out;
}

std::vector<std::string> NdjsonParser::feed(std::string_view bytes) {
    std::vector<std::string> lines;
    pending_.append(bytes);

    std::size_t start = 0;
    while (true) {
        const std::size_t newline = pending_.find('\n', start);
        if (newline == std::string::npos) {
            break;
        }
        const std::string_view line = strip_cr(std::string_view{pending_}.substr(start, newline - start));
        if (!text::is_blank(line)) {
            lines.emplace_back(line);
        }
        start = newline + 1;
    }
    pending_.erase(0, start);
    return lines;
}

std::optional<std::string> NdjsonParser::finish() {
    if (text::is_blank(pending_)) {
        pending_.clear();
        return std::nullopt;
    }
    std::string out = std::move(pending_);
    pending_.clear();
    return out;
}

}  // namespace ragquery
