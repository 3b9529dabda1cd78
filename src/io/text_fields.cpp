#include "text_fields.hpp"

#include <cctype>
#include <charconv>
#include <system_error>

namespace itemsim::io {

namespace {

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() &&
           std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() &&
           std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

auto splitFields(std::string_view line, char delimiter)
    -> std::vector<std::string_view> {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }

    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true) {
        auto end = line.find(delimiter, start);
        if (end == std::string_view::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, end - start));
        start = end + 1;
    }
    return fields;
}

auto parseInt32(std::string_view field) -> std::optional<std::int32_t> {
    field = trim(field);
    if (field.empty()) {
        return std::nullopt;
    }
    if (field.front() == '+') {
        field.remove_prefix(1);
        if (field.empty() || field.front() == '-') {
            return std::nullopt;
        }
    }

    std::int32_t value = 0;
    auto [ptr, ec] =
        std::from_chars(field.data(), field.data() + field.size(), value);
    if (ec != std::errc{} || ptr != field.data() + field.size()) {
        return std::nullopt;
    }
    return value;
}

auto latin1ToUtf8(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        auto byte = static_cast<unsigned char>(c);
        if (byte < 0x80) {
            out += c;
        } else {
            out += static_cast<char>(0xC0 | (byte >> 6));
            out += static_cast<char>(0x80 | (byte & 0x3F));
        }
    }
    return out;
}

bool isBlank(std::string_view line) noexcept {
    for (char c : line) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

}  // namespace itemsim::io
