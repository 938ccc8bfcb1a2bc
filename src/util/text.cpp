#include "util/text.hpp"

namespace ragquery::text {
namespace {

bool is_space(char ch) {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

bool is_identifier_char(char ch) {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '_' ||
           ch == '-';
}

}  // namespace

bool is_identifier(std::string_view value, std::size_t max_length) {
    if (value.empty() || value.size() > max_length) {
        return false;
    }
    for (const char ch : value) {
        if (!is_identifier_char(ch)) {
            return false;
        }
    }
    return true;
}

bool is_blank(std::string_view value) {
    for (const char ch : value) {
        if (!is_space(ch)) {
            return false;
        }
    }
    return true;
}

std::string trim(std::string_view value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && is_space(value[begin])) {
        ++begin;
    }
    while (end > begin && is_space(value[end - 1])) {
        --end;
    }
    return std::string{value.substr(begin, end - begin)};
}

std::string collapse_whitespace(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    bool pending_space = false;
    for (const char ch : value) {
        if (is_space(ch)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(ch);
    }
    return out;
}

std::size_t utf8_length(std::string_view value) {
    std::size_t count = 0;
    for (const char ch : value) {
        if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::size_t utf8_floor(std::string_view value, std::size_t pos) {
    if (pos >= value.size()) {
        return value.size();
    }
    while (pos > 0 && (static_cast<unsigned char>(value[pos]) & 0xC0) == 0x80) {
        --pos;
    }
    return pos;
}

std::string preview(std::string_view value, std::size_t max_bytes) {
    if (value.size() <= max_bytes) {
        return std::string{value};
    }
    return std::string{value.substr(0, utf8_floor(value, max_bytes))} + "...";
}

}  // namespace ragquery::text
