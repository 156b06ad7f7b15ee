#pragma once

#include "hyphenator.hpp"

#include <iosfwd>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <cstddef>

namespace typanon {

class wordlist
{
private:
    std::map<std::size_t, std::vector<std::string>> _by_length;
    std::map<syllable_pattern, std::vector<std::string>> _by_hyphenation;
    std::size_t _size;

    [[nodiscard]] static const std::vector<std::string>* if_large_enough(
        const std::vector<std::string>& words) noexcept;

public:
    // A bucket must hold at least this many words to be chosen from.
    static constexpr std::size_t minimum_word_count = 16;

    [[nodiscard]] wordlist() noexcept;

    void add_word(const hyphenator& h, const std::string_view word);

    // Adds every non-empty line of `contents`, with trailing whitespace
    // removed.
    void add_lines(const hyphenator& h, const std::string_view contents);

    [[nodiscard]] std::size_t size() const noexcept;

    [[nodiscard]] const std::vector<std::string>* find_by_length(
        const std::size_t length) const noexcept;

    [[nodiscard]] const std::vector<std::string>* find_by_hyphenation(
        const syllable_pattern& pattern) const noexcept;
};

[[nodiscard]] bool load_wordlist(std::ostream& err_stream,
    const std::string& path, const hyphenator& h, wordlist& output);

} // namespace typanon
