#include "unicode.hpp"

#include <unicode/uchar.h>
#include <unicode/utf8.h>

#include <string>
#include <string_view>

#include <cassert>
#include <cstddef>
#include <cstdint>

namespace typanon {

std::int32_t next_code_point(
    const std::string_view source, std::size_t& idx) noexcept
{
    assert(idx < source.size());

    const auto length = static_cast<std::int32_t>(source.size());
    auto i = static_cast<std::int32_t>(idx);

    UChar32 cp;
    U8_NEXT(source.data(), i, length, cp);

    idx = static_cast<std::size_t>(i);
    return cp;
}

std::int32_t peek_code_point(
    const std::string_view source, const std::size_t idx) noexcept
{
    if (idx >= source.size())
    {
        return -1;
    }

    std::size_t tmp_idx = idx;
    return next_code_point(source, tmp_idx);
}

void append_code_point(std::string& buffer, const std::int32_t cp)
{
    assert(cp >= 0);

    char bytes[U8_MAX_LENGTH];
    std::int32_t n_bytes = 0;

    U8_APPEND_UNSAFE(bytes, n_bytes, cp);
    buffer.append(bytes, static_cast<std::size_t>(n_bytes));
}

std::size_t count_code_points(const std::string_view source) noexcept
{
    std::size_t result = 0;

    for (std::size_t i = 0; i < source.size(); ++result)
    {
        (void)next_code_point(source, i);
    }

    return result;
}

bool is_numeric(const std::int32_t cp) noexcept
{
    if (cp < 0)
    {
        return false;
    }

    const auto type = static_cast<UCharCategory>(u_charType(cp));

    return type == U_DECIMAL_DIGIT_NUMBER || type == U_LETTER_NUMBER ||
           type == U_OTHER_NUMBER;
}

bool is_alphanumeric(const std::int32_t cp) noexcept
{
    return cp >= 0 && (u_isUAlphabetic(cp) || is_numeric(cp));
}

bool is_uppercase(const std::int32_t cp) noexcept
{
    return cp >= 0 && u_isUUppercase(cp);
}

bool is_ident_start(const std::int32_t cp) noexcept
{
    return cp == '_' || (cp >= 0 && u_hasBinaryProperty(cp, UCHAR_XID_START));
}

bool is_ident_continue(const std::int32_t cp) noexcept
{
    return cp == '_' || cp == '-' ||
           (cp >= 0 && u_hasBinaryProperty(cp, UCHAR_XID_CONTINUE));
}

std::int32_t to_lower(const std::int32_t cp) noexcept
{
    return cp < 0 ? cp : u_tolower(cp);
}

std::int32_t to_upper(const std::int32_t cp) noexcept
{
    return cp < 0 ? cp : u_toupper(cp);
}

void append_uppercased(
    std::string& buffer, const std::string_view word, const bool all)
{
    bool first = true;

    for (std::size_t i = 0; i < word.size();)
    {
        const std::size_t start_idx = i;
        const std::int32_t cp = next_code_point(word, i);

        if (cp < 0 || (!all && !first))
        {
            buffer.append(word.data() + start_idx, i - start_idx);
        }
        else
        {
            append_code_point(buffer, to_upper(cp));
        }

        first = false;
    }
}

} // namespace typanon
