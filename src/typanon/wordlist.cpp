#include "wordlist.hpp"

#include "file_io.hpp"
#include "hyphenator.hpp"
#include "unicode.hpp"

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <cstddef>

namespace typanon {

wordlist::wordlist() noexcept : _by_length{}, _by_hyphenation{}, _size{0}
{}

const std::vector<std::string>* wordlist::if_large_enough(
    const std::vector<std::string>& words) noexcept
{
    return words.size() >= minimum_word_count ? &words : nullptr;
}

void wordlist::add_word(const hyphenator& h, const std::string_view word)
{
    _by_length[count_code_points(word)].emplace_back(word);
    _by_hyphenation[h.syllable_lengths(word)].emplace_back(word);
    ++_size;
}

void wordlist::add_lines(const hyphenator& h, const std::string_view contents)
{
    std::size_t line_start_idx = 0;

    while (line_start_idx < contents.size())
    {
        std::size_t line_end_idx = contents.find('\n', line_start_idx);
        if (line_end_idx == std::string_view::npos)
        {
            line_end_idx = contents.size();
        }

        std::string_view line =
            contents.substr(line_start_idx, line_end_idx - line_start_idx);

        while (!line.empty() && (line.back() == ' ' || line.back() == '\t' ||
                                    line.back() == '\r'))
        {
            line.remove_suffix(1);
        }

        if (!line.empty())
        {
            add_word(h, line);
        }

        line_start_idx = line_end_idx + 1;
    }
}

std::size_t wordlist::size() const noexcept
{
    return _size;
}

const std::vector<std::string>* wordlist::find_by_length(
    const std::size_t length) const noexcept
{
    const auto it = _by_length.find(length);
    return it == _by_length.end() ? nullptr : if_large_enough(it->second);
}

const std::vector<std::string>* wordlist::find_by_hyphenation(
    const syllable_pattern& pattern) const noexcept
{
    const auto it = _by_hyphenation.find(pattern);
    return it == _by_hyphenation.end() ? nullptr
                                       : if_large_enough(it->second);
}

bool load_wordlist(std::ostream& err_stream, const std::string& path,
    const hyphenator& h, wordlist& output)
{
    std::string contents;
    if (!read_file_in_buffer(err_stream, path, contents))
    {
        return false;
    }

    output.add_lines(h, contents);
    return true;
}

} // namespace typanon
