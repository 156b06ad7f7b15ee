#pragma once

#include <iosfwd>
#include <optional>
#include <string>

#include <cstdint>

namespace typanon {

struct cli_options
{
    std::optional<std::string> in_place_path;
    std::optional<std::string> wordlist_path;
    std::optional<std::string> patterns_path;
    std::string language = "en";
    std::optional<std::uint64_t> seed;
    bool aggressive = false;
    bool help = false;
};

void print_usage(std::ostream& os, const char* program_name);

// Parses `argv` with `getopt_long`. Returns `std::nullopt` after emitting a
// diagnostic on invalid usage.
[[nodiscard]] std::optional<cli_options> parse_cli_options(
    std::ostream& err_stream, int argc, char** argv);

} // namespace typanon
