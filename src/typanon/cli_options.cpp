#include "cli_options.hpp"

#include <getopt.h>

#include <charconv>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <cstdint>

namespace typanon {

namespace {

constexpr const char* short_options = ":i:w:l:p:s:ah";

const option long_options[] = {
    {"in-place", required_argument, nullptr, 'i'},
    {"wordlist", required_argument, nullptr, 'w'},
    {"language", required_argument, nullptr, 'l'},
    {"patterns", required_argument, nullptr, 'p'},
    {"seed", required_argument, nullptr, 's'},
    {"aggressive", no_argument, nullptr, 'a'},
    {"help", no_argument, nullptr, 'h'},
    {nullptr, 0, nullptr, 0},
};

[[nodiscard]] std::ostream& error_diagnostic_stream(std::ostream& err_stream)
{
    return err_stream << "((CLI ERROR)): ";
}

[[nodiscard]] std::optional<std::string> normalize_language(
    const std::string_view code)
{
    if (code.size() != 2)
    {
        return std::nullopt;
    }

    std::string result;
    for (const char c : code)
    {
        if (c >= 'a' && c <= 'z')
        {
            result.append(1, c);
        }
        else if (c >= 'A' && c <= 'Z')
        {
            result.append(1, static_cast<char>(c - 'A' + 'a'));
        }
        else
        {
            return std::nullopt;
        }
    }

    return result;
}

[[nodiscard]] std::optional<std::uint64_t> parse_seed(const std::string_view sv)
{
    std::uint64_t result{};

    const auto [ptr, ec] =
        std::from_chars(sv.data(), sv.data() + sv.size(), result);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return result;
}

} // namespace

void print_usage(std::ostream& os, const char* program_name)
{
    os << "Usage: " << program_name
       << " [-i FILE] [-w FILE] [-l CODE] [-p FILE] [-s SEED] [-a] [-h]\n"
          "\n"
          "Replaces all words in a Typst document with random garbage.\n"
          "Reads standard input and writes standard output unless -i is "
          "given.\n"
          "\n"
          "  -i, --in-place FILE  a file to perform in-place replacement on\n"
          "  -w, --wordlist FILE  the path to a line-separated wordlist\n"
          "  -l, --language CODE  an ISO 639-1 language code, like `de` "
          "(default: en)\n"
          "  -p, --patterns FILE  TeX hyphenation patterns for the language\n"
          "  -s, --seed N         seed for reproducible output\n"
          "  -a, --aggressive     also replace elements that are more likely "
          "to\n"
          "                       change behavior, like strings\n"
          "  -h, --help           show this help\n";
}

std::optional<cli_options> parse_cli_options(
    std::ostream& err_stream, int argc, char** argv)
{
    cli_options result;

    // Full rescan, so that repeated calls start over.
    optind = 0;
    opterr = 0;

    int opt;
    int opt_idx;

    while ((opt = getopt_long(argc, argv, short_options, long_options,
                &opt_idx)) != -1)
    {
        switch (opt)
        {
            case 'i': result.in_place_path = optarg; break;
            case 'w': result.wordlist_path = optarg; break;
            case 'p': result.patterns_path = optarg; break;
            case 'a': result.aggressive = true; break;
            case 'h': result.help = true; break;

            case 'l':
            {
                const std::optional<std::string> language =
                    normalize_language(optarg);

                if (!language.has_value())
                {
                    error_diagnostic_stream(err_stream)
                        << "Language '" << optarg
                        << "' is not two ASCII letters long\n\n";

                    return std::nullopt;
                }

                result.language = *language;
                break;
            }

            case 's':
            {
                result.seed = parse_seed(optarg);

                if (!result.seed.has_value())
                {
                    error_diagnostic_stream(err_stream)
                        << "Invalid seed '" << optarg << "'\n\n";

                    return std::nullopt;
                }

                break;
            }

            case ':':
            {
                error_diagnostic_stream(err_stream)
                    << "Missing argument for '" << argv[optind - 1] << "'\n\n";

                return std::nullopt;
            }

            default:
            {
                error_diagnostic_stream(err_stream)
                    << "Unknown option '" << argv[optind - 1] << "'\n\n";

                return std::nullopt;
            }
        }
    }

    if (optind < argc)
    {
        error_diagnostic_stream(err_stream)
            << "Unexpected argument '" << argv[optind] << "'\n\n";

        return std::nullopt;
    }

    return result;
}

} // namespace typanon
