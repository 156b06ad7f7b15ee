#include "hyphenator.hpp"

#include "unicode.hpp"

#include <algorithm>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <cassert>
#include <cstddef>
#include <cstdint>

namespace typanon {

namespace {

struct language_rules
{
    std::string_view _iso_code;
    std::string_view _vowels;
    std::string_view _consonants;

    // Consonant clusters that are never split and that start a syllable.
    std::vector<std::string_view> _clusters;

    std::size_t _left_min;
    std::size_t _right_min;
};

[[nodiscard]] const std::vector<language_rules>& get_builtin_rules()
{
    static const std::vector<language_rules> rules{
        language_rules{._iso_code = "en",
            ._vowels = "aeiouy",
            ._consonants = "bcdfghjklmnpqrstvwxz",
            ._clusters = {"bl", "br", "ch", "ck", "cl", "cr", "dr", "fl", "fr",
                "gh", "gl", "gr", "kn", "ph", "pl", "pr", "qu", "sc", "sh",
                "sk", "sl", "sm", "sn", "sp", "st", "sw", "th", "tr", "tw",
                "wh", "wr"},
            ._left_min = 2,
            ._right_min = 3},
        language_rules{._iso_code = "de",
            ._vowels = "aeiouyäöü",
            ._consonants = "bcdfghjklmnpqrstvwxzß",
            ._clusters = {"bl", "br", "ch", "ck", "dr", "fl", "fr", "gl", "gr",
                "kl", "kn", "kr", "ph", "pf", "pl", "pr", "qu", "sch", "sp",
                "st", "th", "tr", "tz"},
            ._left_min = 2,
            ._right_min = 2},
    };

    return rules;
}

[[nodiscard]] std::vector<std::string> split_letters(const std::string_view sv)
{
    std::vector<std::string> result;

    for (std::size_t i = 0; i < sv.size();)
    {
        std::string letter;
        append_code_point(letter, next_code_point(sv, i));
        result.push_back(std::move(letter));
    }

    return result;
}

void add_rule_patterns(hyphenator& h, const language_rules& rules)
{
    const std::vector<std::string> vowels = split_letters(rules._vowels);
    const std::vector<std::string> consonants =
        split_letters(rules._consonants);

    std::string pattern;

    // Break between two adjacent consonants...
    for (const std::string& c0 : consonants)
    {
        for (const std::string& c1 : consonants)
        {
            pattern.clear();
            pattern.append(c0);
            pattern.append(1, '1');
            pattern.append(c1);
            h.add_pattern(pattern);
        }
    }

    // ...before a single consonant between two vowels...
    for (const std::string& v0 : vowels)
    {
        for (const std::string& c : consonants)
        {
            for (const std::string& v1 : vowels)
            {
                pattern.clear();
                pattern.append(v0);
                pattern.append(1, '1');
                pattern.append(c);
                pattern.append(v1);
                h.add_pattern(pattern);
            }
        }
    }

    // ...but never inside a cluster, and before a cluster between vowels.
    for (const std::string_view cluster : rules._clusters)
    {
        const std::vector<std::string> letters = split_letters(cluster);

        pattern.clear();
        for (std::size_t i = 0; i < letters.size(); ++i)
        {
            if (i != 0)
            {
                pattern.append(1, '2');
            }

            pattern.append(letters[i]);
        }

        h.add_pattern(pattern);

        for (const std::string& v0 : vowels)
        {
            for (const std::string& v1 : vowels)
            {
                pattern.clear();
                pattern.append(v0);
                pattern.append(1, '1');
                pattern.append(cluster);
                pattern.append(v1);
                h.add_pattern(pattern);
            }
        }
    }
}

[[nodiscard]] bool is_ascii_digit(const std::int32_t cp) noexcept
{
    return cp >= '0' && cp <= '9';
}

} // namespace

hyphenator::hyphenator(
    const std::size_t left_min, const std::size_t right_min) noexcept
    : _patterns{}, _max_pattern_length{0}, _left_min{left_min},
      _right_min{right_min}
{}

std::optional<hyphenator> hyphenator::for_language(
    const std::string_view iso_code)
{
    for (const language_rules& rules : get_builtin_rules())
    {
        if (rules._iso_code != iso_code)
        {
            continue;
        }

        hyphenator result{rules._left_min, rules._right_min};
        add_rule_patterns(result, rules);
        return result;
    }

    return std::nullopt;
}

std::optional<hyphenator> hyphenator::from_patterns(std::ostream& err_stream,
    const std::string_view text, const std::size_t left_min,
    const std::size_t right_min)
{
    hyphenator result{left_min, right_min};

    std::size_t i = 0;
    while (i < text.size())
    {
        if (text[i] == '%')
        {
            const std::size_t newline_idx = text.find('\n', i);
            i = newline_idx == std::string_view::npos ? text.size()
                                                      : newline_idx + 1;
            continue;
        }

        if (text[i] == ' ' || text[i] == '\t' || text[i] == '\n' ||
            text[i] == '\r')
        {
            ++i;
            continue;
        }

        const std::size_t start_idx = i;
        while (i < text.size() && text[i] != ' ' && text[i] != '\t' &&
               text[i] != '\n' && text[i] != '\r' && text[i] != '%')
        {
            ++i;
        }

        result.add_pattern(text.substr(start_idx, i - start_idx));
    }

    if (result.pattern_count() == 0)
    {
        err_stream << "((IO ERROR)): Hyphenation pattern list contains no "
                      "patterns\n\n";

        return std::nullopt;
    }

    return result;
}

void hyphenator::add_pattern(const std::string_view pattern)
{
    std::string letters;
    std::vector<std::uint8_t> values{0};

    for (std::size_t i = 0; i < pattern.size();)
    {
        const std::int32_t cp = next_code_point(pattern, i);

        if (cp < 0)
        {
            continue;
        }

        if (is_ascii_digit(cp))
        {
            values.back() = static_cast<std::uint8_t>(cp - '0');
            continue;
        }

        append_code_point(letters, to_lower(cp));
        values.push_back(0);
    }

    if (letters.empty())
    {
        return;
    }

    _max_pattern_length = std::max(_max_pattern_length, values.size() - 1);

    std::vector<std::uint8_t>& existing = _patterns[letters];
    if (existing.size() != values.size())
    {
        existing = std::move(values);
        return;
    }

    for (std::size_t i = 0; i < values.size(); ++i)
    {
        existing[i] = std::max(existing[i], values[i]);
    }
}

std::size_t hyphenator::pattern_count() const noexcept
{
    return _patterns.size();
}

syllable_pattern hyphenator::syllable_lengths(const std::string_view word) const
{
    // Lowercased word surrounded by the `.` boundary markers, as letters.
    std::vector<std::string> dotted{"."};

    for (std::size_t i = 0; i < word.size();)
    {
        std::string letter;

        const std::int32_t cp = next_code_point(word, i);
        append_code_point(letter, cp < 0 ? 0xFFFD : to_lower(cp));

        dotted.push_back(std::move(letter));
    }

    dotted.emplace_back(".");

    const std::size_t n_letters = dotted.size() - 2;
    if (n_letters == 0)
    {
        return {};
    }

    // `values[p]` is the score of the gap before `dotted[p]`.
    std::vector<std::uint8_t> values(dotted.size() + 1, 0);

    std::string key;
    for (std::size_t start = 0; start < dotted.size(); ++start)
    {
        key.clear();

        const std::size_t max_end =
            std::min(dotted.size(), start + _max_pattern_length);

        for (std::size_t end = start; end < max_end; ++end)
        {
            key.append(dotted[end]);

            const auto it = _patterns.find(key);
            if (it == _patterns.end())
            {
                continue;
            }

            const std::vector<std::uint8_t>& pattern_values = it->second;
            assert(pattern_values.size() == end - start + 2);

            for (std::size_t k = 0; k < pattern_values.size(); ++k)
            {
                values[start + k] = std::max(values[start + k], pattern_values[k]);
            }
        }
    }

    syllable_pattern result;
    std::size_t syllable_length = 0;

    const auto push_syllable = [&]
    {
        result.push_back(static_cast<std::uint8_t>(
            std::min<std::size_t>(syllable_length, 255)));

        syllable_length = 0;
    };

    for (std::size_t k = 0; k < n_letters; ++k)
    {
        // Gap before word letter `k` is before `dotted[k + 1]`.
        const bool can_break = k >= _left_min && n_letters - k >= _right_min &&
                               values[k + 1] % 2 == 1;

        if (can_break && syllable_length > 0)
        {
            push_syllable();
        }

        ++syllable_length;
    }

    push_syllable();
    return result;
}

} // namespace typanon
