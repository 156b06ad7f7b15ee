#pragma once

#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>

namespace typanon {

class word_substituter;

class anonymizer
{
private:
    class state;
    class pass;

    std::unique_ptr<state> _state;

public:
    struct config
    {
        // Also replace string literals and raw text.
        bool aggressive = false;
    };

    [[nodiscard]] explicit anonymizer(
        std::ostream& err_stream, word_substituter& substituter);

    ~anonymizer();

    // Appends the anonymized `source` to `output_buffer`. On failure a
    // diagnostic is emitted and `output_buffer` is left as it was.
    [[nodiscard]] bool anonymize(const config& cfg, std::string& output_buffer,
        const std::string_view source) noexcept;
};

} // namespace typanon
