#pragma once

#include <string>
#include <string_view>

#include <cstddef>
#include <cstdint>

namespace typanon {

// Decodes the UTF-8 sequence starting at `idx` and advances `idx` past it.
// Malformed input yields a negative value and advances by at least one byte.
[[nodiscard]] std::int32_t next_code_point(
    const std::string_view source, std::size_t& idx) noexcept;

[[nodiscard]] std::int32_t peek_code_point(
    const std::string_view source, const std::size_t idx) noexcept;

void append_code_point(std::string& buffer, const std::int32_t cp);

[[nodiscard]] std::size_t count_code_points(
    const std::string_view source) noexcept;

[[nodiscard]] bool is_numeric(const std::int32_t cp) noexcept;
[[nodiscard]] bool is_alphanumeric(const std::int32_t cp) noexcept;
[[nodiscard]] bool is_uppercase(const std::int32_t cp) noexcept;

[[nodiscard]] bool is_ident_start(const std::int32_t cp) noexcept;
[[nodiscard]] bool is_ident_continue(const std::int32_t cp) noexcept;

[[nodiscard]] std::int32_t to_lower(const std::int32_t cp) noexcept;
[[nodiscard]] std::int32_t to_upper(const std::int32_t cp) noexcept;

// Appends `word` to `buffer`, uppercasing every code point (`all == true`)
// or only the first one.
void append_uppercased(
    std::string& buffer, const std::string_view word, const bool all);

} // namespace typanon
