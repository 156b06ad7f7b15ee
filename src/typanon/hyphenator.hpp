#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <cstddef>
#include <cstdint>

namespace typanon {

// Syllable lengths of a word, in code points. Each entry saturates at 255.
using syllable_pattern = std::vector<std::uint8_t>;

// Liang's hyphenation algorithm, as used by TeX. Patterns are letter
// sequences interleaved with digits, e.g. `a1n` or `.ach4`; an odd maximum
// between two letters allows a break there.
class hyphenator
{
private:
    std::unordered_map<std::string, std::vector<std::uint8_t>> _patterns;
    std::size_t _max_pattern_length;
    std::size_t _left_min;
    std::size_t _right_min;

public:
    [[nodiscard]] explicit hyphenator(
        const std::size_t left_min, const std::size_t right_min) noexcept;

    // Returns the built-in patterns for a two-letter ISO 639-1 code.
    [[nodiscard]] static std::optional<hyphenator> for_language(
        const std::string_view iso_code);

    // Builds a hyphenator from a whitespace-separated TeX pattern list.
    // `%` starts a comment that runs to the end of the line.
    [[nodiscard]] static std::optional<hyphenator> from_patterns(
        std::ostream& err_stream, const std::string_view text,
        const std::size_t left_min, const std::size_t right_min);

    void add_pattern(const std::string_view pattern);

    [[nodiscard]] std::size_t pattern_count() const noexcept;

    [[nodiscard]] syllable_pattern syllable_lengths(
        const std::string_view word) const;
};

} // namespace typanon
