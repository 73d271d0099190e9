#include "cli_parse.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>

namespace collager::core {

bool parse_positive_int(const std::string& value, int& out) {
    int parsed = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return false;
    }
    if (parsed <= 0) {
        return false;
    }
    out = parsed;
    return true;
}

bool parse_non_negative_uint(const std::string& value, unsigned int& out) {
    int parsed = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc() || ptr != value.data() + value.size() || parsed < 0) {
        return false;
    }
    out = static_cast<unsigned int>(parsed);
    return true;
}

bool parse_shape(const std::string& value, Shape& out) {
    const std::string lower = to_lower_copy(value);
    if (lower == "rectangle") {
        out = Shape::Rectangle;
        return true;
    }
    if (lower == "circle") {
        out = Shape::Circle;
        return true;
    }
    return false;
}

bool parse_draw_mode(const std::string& value, DrawMode& out) {
    const std::string lower = to_lower_copy(value);
    if (lower == "serial") {
        out = DrawMode::Serial;
        return true;
    }
    if (lower == "joined") {
        out = DrawMode::Joined;
        return true;
    }
    if (lower == "detached") {
        out = DrawMode::Detached;
        return true;
    }
    return false;
}

bool parse_color(const std::string& value, Color& out) {
    constexpr int MAX_CHANNELS = 4;
    constexpr int MIN_REQUIRED_CHANNELS = 3;
    constexpr int MAX_CHANNEL_VALUE = 255;
    std::array<int, MAX_CHANNELS> parts = {0, 0, 0, MAX_CHANNEL_VALUE};
    int part_count = 0;
    size_t start = 0;
    while (start <= value.size()) {
        const size_t comma = value.find(',', start);
        const size_t end = (comma == std::string::npos) ? value.size() : comma;
        if (end == start || part_count >= MAX_CHANNELS) {
            return false;
        }

        const std::string token = trim_copy(value.substr(start, end - start));
        int channel = 0;
        const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), channel);
        if (ec != std::errc() || ptr != token.data() + token.size() || channel < 0 || channel > MAX_CHANNEL_VALUE) {
            return false;
        }
        parts[part_count++] = channel;

        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }

    if (part_count != MIN_REQUIRED_CHANNELS && part_count != MAX_CHANNELS) {
        return false;
    }

    out = Color{static_cast<unsigned char>(parts[0]), static_cast<unsigned char>(parts[1]),
                static_cast<unsigned char>(parts[2]), static_cast<unsigned char>(parts[3])};
    return true;
}

std::string trim_copy(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

std::string to_lower_copy(std::string value) {
    std::ranges::transform(value, value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace collager::core
