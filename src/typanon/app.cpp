#include "app.hpp"

#include "anonymizer.hpp"
#include "cli_options.hpp"
#include "file_io.hpp"
#include "hyphenator.hpp"
#include "word_substituter.hpp"
#include "wordlist.hpp"

#include <iostream>
#include <optional>
#include <string>

namespace typanon {

namespace {

[[nodiscard]] std::optional<hyphenator> make_hyphenator(
    const cli_options& opts, std::ostream& err_stream)
{
    if (opts.patterns_path.has_value())
    {
        std::string patterns;
        if (!read_file_in_buffer(err_stream, *opts.patterns_path, patterns))
        {
            return std::nullopt;
        }

        return hyphenator::from_patterns(
            err_stream, patterns, 2 /* left_min */, 2 /* right_min */);
    }

    std::optional<hyphenator> result = hyphenator::for_language(opts.language);
    if (!result.has_value())
    {
        err_stream << "((CLI ERROR)): Language '" << opts.language
                   << "' not supported without a pattern file (-p)\n\n";
    }

    return result;
}

} // namespace

exit_code run(const cli_options& opts, std::istream& input,
    std::ostream& output, std::ostream& err_stream)
{
    const std::optional<hyphenator> h = make_hyphenator(opts, err_stream);
    if (!h.has_value())
    {
        return exit_code::configuration_error;
    }

    wordlist wl;
    if (opts.wordlist_path.has_value() &&
        !load_wordlist(err_stream, *opts.wordlist_path, *h, wl))
    {
        return exit_code::configuration_error;
    }

    std::string source;
    if (opts.in_place_path.has_value())
    {
        if (!read_file_in_buffer(err_stream, *opts.in_place_path, source))
        {
            return exit_code::input_error;
        }
    }
    else if (!read_stream_in_buffer(input, source))
    {
        err_stream << "((IO ERROR)): Failed to read standard input\n\n";
        return exit_code::input_error;
    }

    word_substituter substituter{*h, wl, {.seed = opts.seed}};
    anonymizer anon{err_stream, substituter};

    std::string output_buffer;
    output_buffer.reserve(source.size() + 1024);

    if (!anon.anonymize(
            {.aggressive = opts.aggressive}, output_buffer, source))
    {
        return exit_code::document_error;
    }

    if (opts.in_place_path.has_value())
    {
        return write_buffer_to_file(
                   err_stream, *opts.in_place_path, output_buffer)
                   ? exit_code::success
                   : exit_code::output_error;
    }

    output << output_buffer;
    output.flush();

    if (!output)
    {
        err_stream << "((IO ERROR)): Failed to write standard output\n\n";
        return exit_code::output_error;
    }

    return exit_code::success;
}

} // namespace typanon
