#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <typanon/hyphenator.hpp>
#include <typanon/unicode.hpp>

#include <numeric>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include <cstddef>

using namespace std::string_view_literals;

namespace {

[[nodiscard]] typanon::hyphenator make_from_patterns(
    const std::string_view patterns, const std::size_t left_min = 2,
    const std::size_t right_min = 2)
{
    std::ostringstream oss;

    std::optional<typanon::hyphenator> h =
        typanon::hyphenator::from_patterns(oss, patterns, left_min, right_min);

    REQUIRE(h.has_value());
    REQUIRE(oss.str() == "");

    return *h;
}

[[nodiscard]] std::size_t total_length(const typanon::syllable_pattern& p)
{
    return std::accumulate(p.begin(), p.end(), std::size_t{0});
}

} // namespace

TEST_CASE("hyphenator from_patterns #0")
{
    const typanon::hyphenator h = make_from_patterns("a1n"sv);

    REQUIRE(h.pattern_count() == 1);
    REQUIRE(h.syllable_lengths("banana"sv) == typanon::syllable_pattern{2, 2, 2});
}

TEST_CASE("hyphenator from_patterns #1")
{
    const typanon::hyphenator h = make_from_patterns(R"(% a comment line
  a1n  % trailing comment
n2a
)"sv);

    REQUIRE(h.pattern_count() == 2);
    REQUIRE(h.syllable_lengths("banana"sv) == typanon::syllable_pattern{2, 2, 2});
}

TEST_CASE("hyphenator from_patterns #2")
{
    std::ostringstream oss;

    const std::optional<typanon::hyphenator> h =
        typanon::hyphenator::from_patterns(oss, "% nothing\n\n  "sv, 2, 2);

    REQUIRE(!h.has_value());
    REQUIRE(oss.str().find("((IO ERROR))") != std::string::npos);
}

TEST_CASE("hyphenator higher even value inhibits break")
{
    const typanon::hyphenator h = make_from_patterns("a1n .ba2n"sv);
    REQUIRE(h.syllable_lengths("banana"sv) == typanon::syllable_pattern{4, 2});
}

TEST_CASE("hyphenator respects minimum margins")
{
    const typanon::hyphenator h = make_from_patterns("a1n"sv, 3, 3);
    REQUIRE(h.syllable_lengths("banana"sv) == typanon::syllable_pattern{6});
}

TEST_CASE("hyphenator is case insensitive")
{
    const typanon::hyphenator h = make_from_patterns("A1N"sv);
    REQUIRE(h.syllable_lengths("BaNaNa"sv) == typanon::syllable_pattern{2, 2, 2});
}

TEST_CASE("hyphenator empty word")
{
    const typanon::hyphenator h = make_from_patterns("a1n"sv);
    REQUIRE(h.syllable_lengths(""sv).empty());
}

TEST_CASE("hyphenator saturates long syllables")
{
    const typanon::hyphenator h = make_from_patterns("x1y"sv);
    const std::string word(300, 'a');

    REQUIRE(h.syllable_lengths(word) == typanon::syllable_pattern{255});
}

TEST_CASE("hyphenator for_language")
{
    REQUIRE(typanon::hyphenator::for_language("en").has_value());
    REQUIRE(typanon::hyphenator::for_language("de").has_value());
    REQUIRE(!typanon::hyphenator::for_language("xx").has_value());
    REQUIRE(!typanon::hyphenator::for_language("").has_value());
}

TEST_CASE("hyphenator english")
{
    const typanon::hyphenator h = *typanon::hyphenator::for_language("en");

    REQUIRE(h.syllable_lengths("cat"sv) == typanon::syllable_pattern{3});
    REQUIRE(h.syllable_lengths("winter"sv) == typanon::syllable_pattern{3, 3});
    REQUIRE(h.syllable_lengths("paper"sv) == typanon::syllable_pattern{2, 3});
    REQUIRE(h.syllable_lengths("Paper"sv) == typanon::syllable_pattern{2, 3});
}

TEST_CASE("hyphenator german")
{
    const typanon::hyphenator h = *typanon::hyphenator::for_language("de");

    REQUIRE(h.syllable_lengths("Katze"sv) == typanon::syllable_pattern{2, 3});
}

TEST_CASE("hyphenator syllables cover the whole word")
{
    const typanon::hyphenator h = *typanon::hyphenator::for_language("en");

    for (const std::string_view word :
        {"hyphenation"sv, "anonymization"sv, "a"sv, "strengths"sv,
            "Überraschung"sv, "encyclopedia"sv})
    {
        CAPTURE(word);

        const typanon::syllable_pattern p = h.syllable_lengths(word);

        REQUIRE(!p.empty());
        REQUIRE(total_length(p) == typanon::count_code_points(word));
    }
}
