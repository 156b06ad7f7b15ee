#pragma once

#include <optional>
#include <random>
#include <string>
#include <string_view>

#include <cstdint>

namespace typanon {

class hyphenator;
class wordlist;

class word_substituter
{
public:
    struct config
    {
        // Unset means seeding from `std::random_device`.
        std::optional<std::uint64_t> seed = std::nullopt;
    };

private:
    const hyphenator& _hyphenator;
    const wordlist& _wordlist;
    std::mt19937_64 _rng;

    [[nodiscard]] char random_char(const std::string_view charset);

    [[nodiscard]] bool substitute_from_wordlist(
        std::string& output_buffer, const std::string_view word);

    void substitute_with_garbage(
        std::string& output_buffer, const std::string_view word);

public:
    [[nodiscard]] explicit word_substituter(
        const hyphenator& h, const wordlist& wl, const config& cfg);

    // Replaces every maximal run of alphanumeric code points in `text`,
    // copying everything in between unchanged.
    void substitute_text(std::string& output_buffer, const std::string_view text);

    void substitute_word(std::string& output_buffer, const std::string_view word);
};

} // namespace typanon
