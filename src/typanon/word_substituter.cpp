#include "word_substituter.hpp"

#include "hyphenator.hpp"
#include "unicode.hpp"
#include "wordlist.hpp"

#include <random>
#include <string>
#include <string_view>
#include <vector>

#include <cassert>
#include <cstddef>
#include <cstdint>

namespace typanon {

namespace {

constexpr std::string_view charset_lowercase = "abcdefghijklmnopqrstuvwxyz";
constexpr std::string_view charset_uppercase = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
constexpr std::string_view charset_digits = "0123456789";

[[nodiscard]] std::uint64_t make_seed(
    const word_substituter::config& cfg)
{
    if (cfg.seed.has_value())
    {
        return *cfg.seed;
    }

    std::random_device rd;
    return (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
}

struct word_shape
{
    bool _all_numeric;
    bool _starts_uppercase;
    bool _all_uppercase;
    std::size_t _n_letters;
};

[[nodiscard]] word_shape get_word_shape(const std::string_view word) noexcept
{
    word_shape result{._all_numeric = true,
        ._starts_uppercase = false,
        ._all_uppercase = true,
        ._n_letters = 0};

    bool first = true;
    for (std::size_t i = 0; i < word.size();)
    {
        const std::int32_t cp = next_code_point(word, i);

        if (first)
        {
            result._starts_uppercase = is_uppercase(cp);
            first = false;
        }

        if (is_numeric(cp))
        {
            continue;
        }

        result._all_numeric = false;
        ++result._n_letters;

        if (!is_uppercase(cp))
        {
            result._all_uppercase = false;
        }
    }

    if (result._n_letters < 2)
    {
        result._all_uppercase = false;
    }

    return result;
}

} // namespace

word_substituter::word_substituter(
    const hyphenator& h, const wordlist& wl, const config& cfg)
    : _hyphenator{h}, _wordlist{wl}, _rng{make_seed(cfg)}
{}

char word_substituter::random_char(const std::string_view charset)
{
    assert(!charset.empty());

    std::uniform_int_distribution<std::size_t> dist(0, charset.size() - 1);
    return charset[dist(_rng)];
}

bool word_substituter::substitute_from_wordlist(
    std::string& output_buffer, const std::string_view word)
{
    const std::vector<std::string>* candidates =
        _wordlist.find_by_hyphenation(_hyphenator.syllable_lengths(word));

    if (candidates == nullptr)
    {
        candidates = _wordlist.find_by_length(count_code_points(word));
    }

    if (candidates == nullptr)
    {
        return false;
    }

    assert(!candidates->empty());

    std::uniform_int_distribution<std::size_t> dist(0, candidates->size() - 1);
    const std::string& replacement = (*candidates)[dist(_rng)];

    const word_shape shape = get_word_shape(word);

    if (shape._all_uppercase || shape._starts_uppercase)
    {
        append_uppercased(output_buffer, replacement, shape._all_uppercase);
    }
    else
    {
        output_buffer.append(replacement);
    }

    return true;
}

void word_substituter::substitute_with_garbage(
    std::string& output_buffer, const std::string_view word)
{
    for (std::size_t i = 0; i < word.size();)
    {
        const std::int32_t cp = next_code_point(word, i);

        if (is_numeric(cp))
        {
            output_buffer.append(1, random_char(charset_digits));
        }
        else if (is_uppercase(cp))
        {
            output_buffer.append(1, random_char(charset_uppercase));
        }
        else
        {
            output_buffer.append(1, random_char(charset_lowercase));
        }
    }
}

void word_substituter::substitute_text(
    std::string& output_buffer, const std::string_view text)
{
    std::size_t i = 0;
    std::size_t gap_start_idx = 0;

    while (i < text.size())
    {
        const std::size_t word_start_idx = i;
        if (!is_alphanumeric(next_code_point(text, i)))
        {
            continue;
        }

        output_buffer.append(
            text.data() + gap_start_idx, word_start_idx - gap_start_idx);

        std::size_t word_end_idx = i;
        while (word_end_idx < text.size())
        {
            std::size_t next_idx = word_end_idx;
            if (!is_alphanumeric(next_code_point(text, next_idx)))
            {
                break;
            }

            word_end_idx = next_idx;
        }

        substitute_word(output_buffer,
            text.substr(word_start_idx, word_end_idx - word_start_idx));

        i = gap_start_idx = word_end_idx;
    }

    output_buffer.append(
        text.data() + gap_start_idx, text.size() - gap_start_idx);
}

void word_substituter::substitute_word(
    std::string& output_buffer, const std::string_view word)
{
    if (word.empty())
    {
        return;
    }

    if (get_word_shape(word)._all_numeric)
    {
        for (std::size_t i = 0; i < word.size();)
        {
            (void)next_code_point(word, i);
            output_buffer.append(1, random_char(charset_digits));
        }

        return;
    }

    if (substitute_from_wordlist(output_buffer, word))
    {
        return;
    }

    substitute_with_garbage(output_buffer, word);
}

} // namespace typanon
