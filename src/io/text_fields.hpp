#ifndef ITEMSIM_IO_TEXT_FIELDS_HPP
#define ITEMSIM_IO_TEXT_FIELDS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace itemsim::io {

/**
 * @brief Split @p line on @p delimiter, keeping empty fields
 *
 * A trailing carriage return is dropped first so files written on Windows
 * parse the same way.
 */
[[nodiscard]] auto splitFields(std::string_view line, char delimiter)
    -> std::vector<std::string_view>;

/**
 * @brief Parse a base-10 32-bit integer, surrounding blanks allowed
 * @return std::nullopt if the field is empty, non-numeric or out of range
 */
[[nodiscard]] auto parseInt32(std::string_view field)
    -> std::optional<std::int32_t>;

/**
 * @brief Re-encode ISO-8859-1 text as UTF-8
 */
[[nodiscard]] auto latin1ToUtf8(std::string_view text) -> std::string;

/**
 * @brief Whether the line holds nothing but whitespace
 */
[[nodiscard]] bool isBlank(std::string_view line) noexcept;

}  // namespace itemsim::io

#endif  // ITEMSIM_IO_TEXT_FIELDS_HPP
