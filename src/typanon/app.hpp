#pragma once

#include "cli_options.hpp"

#include <iosfwd>

namespace typanon {

enum class exit_code : int
{
    success = 0,
    configuration_error = 1,
    input_error = 2,
    document_error = 3,
    output_error = 4
};

// Anonymizes the document selected by `opts`: the in-place file if one is
// given, `input` otherwise. Nothing is written when the document cannot be
// processed.
[[nodiscard]] exit_code run(const cli_options& opts, std::istream& input,
    std::ostream& output, std::ostream& err_stream);

} // namespace typanon
