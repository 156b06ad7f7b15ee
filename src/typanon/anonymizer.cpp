#include "anonymizer.hpp"

#include "unicode.hpp"
#include "word_substituter.hpp"

#include <algorithm>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <cassert>
#include <cstddef>
#include <cstdint>

namespace typanon {

using namespace std::string_view_literals;

class anonymizer::state
{
public:
    std::ostream& _err_stream;
    word_substituter& _substituter;

    [[nodiscard]] explicit state(
        std::ostream& err_stream, word_substituter& substituter) noexcept
        : _err_stream{err_stream}, _substituter{substituter}
    {}
};

namespace {

[[nodiscard]] bool is_statement_keyword(const std::string_view ident) noexcept
{
    return ident == "let"sv || ident == "set"sv || ident == "show"sv ||
           ident == "if"sv || ident == "for"sv || ident == "while"sv ||
           ident == "return"sv || ident == "break"sv || ident == "continue"sv;
}

[[nodiscard]] bool is_module_keyword(const std::string_view ident) noexcept
{
    return ident == "import"sv || ident == "include"sv;
}

[[nodiscard]] bool is_label_char(const std::int32_t cp) noexcept
{
    return is_ident_continue(cp) || cp == '.' || cp == ':';
}

[[nodiscard]] bool is_closing_delimiter(const char c) noexcept
{
    return c == ')' || c == '}' || c == ']';
}

[[nodiscard]] bool is_ascii_digit(const char c) noexcept
{
    return c >= '0' && c <= '9';
}

[[nodiscard]] bool is_link_terminator(const char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '<' ||
           c == '>' || c == '"' || c == '`';
}

[[nodiscard]] bool is_link_trailing_punctuation(const char c) noexcept
{
    return c == '.' || c == ',' || c == ';' || c == ':' || c == '!' ||
           c == '?' || c == '\'';
}

} // namespace

class anonymizer::pass
{
private:
    std::ostream& _err_stream;
    word_substituter& _substituter;
    const anonymizer::config _cfg;
    const std::string_view _source;
    std::size_t _curr_idx;

    [[nodiscard]] bool is_done() const noexcept
    {
        return _curr_idx >= _source.size();
    }

    void step_fwd(const std::size_t n_steps) noexcept
    {
        _curr_idx += n_steps;
    }

    [[nodiscard]] char get_curr_char() const noexcept
    {
        assert(!is_done());
        return _source[_curr_idx];
    }

    [[nodiscard]] std::optional<char> peek(const std::size_t n_steps) const
    {
        if (_curr_idx + n_steps >= _source.size())
        {
            return std::nullopt;
        }

        return _source[_curr_idx + n_steps];
    }

    [[nodiscard]] std::int32_t get_curr_code_point() const noexcept
    {
        return peek_code_point(_source, _curr_idx);
    }

    [[nodiscard]] bool starts_with(const std::string_view prefix) const noexcept
    {
        return _source.substr(_curr_idx, prefix.size()) == prefix;
    }

    [[nodiscard]] std::optional<std::size_t> find_next(
        const char c, const std::size_t start_idx) const noexcept
    {
        const std::size_t idx = _source.find(c, start_idx);
        if (idx == std::string_view::npos)
        {
            return std::nullopt;
        }

        return {idx};
    }

    [[nodiscard]] std::size_t get_line(const std::size_t idx) const noexcept
    {
        const std::string_view before = _source.substr(0, idx);
        return 1 + static_cast<std::size_t>(
                       std::count(before.begin(), before.end(), '\n'));
    }

    [[nodiscard]] std::ostream& error_diagnostic_stream(const std::size_t idx)
    {
        return _err_stream << "((TYPANON ERROR))(" << get_line(idx) << "): ";
    }

    void error_diagnostic(const std::size_t idx, const std::string_view reason)
    {
        error_diagnostic_stream(idx) << reason << "\n\n";
    }

    void error_diagnostic_delimiter(
        const std::size_t idx, const std::string_view reason)
    {
        error_diagnostic_stream(idx)
            << reason << " '" << _source[idx] << "'\n\n";
    }

    void copy_range(std::string& output_buffer, const std::size_t start_idx,
        const std::size_t end_idx)
    {
        assert(start_idx <= end_idx);
        assert(end_idx <= _source.size());

        output_buffer.append(_source.data() + start_idx, end_idx - start_idx);
    }

    void substitute_range(std::string& output_buffer,
        const std::size_t start_idx, const std::size_t end_idx)
    {
        assert(start_idx <= end_idx);
        assert(end_idx <= _source.size());

        if (start_idx == end_idx)
        {
            return;
        }

        _substituter.substitute_text(
            output_buffer, _source.substr(start_idx, end_idx - start_idx));
    }

    void process_content_range(std::string& output_buffer,
        const std::size_t start_idx, const std::size_t end_idx,
        const bool replace)
    {
        if (replace)
        {
            substitute_range(output_buffer, start_idx, end_idx);
        }
        else
        {
            copy_range(output_buffer, start_idx, end_idx);
        }
    }

    void copy_curr_char(std::string& output_buffer)
    {
        output_buffer.append(1, get_curr_char());
        step_fwd(1);
    }

    void skip_code_point() noexcept
    {
        (void)next_code_point(_source, _curr_idx);
    }

    [[nodiscard]] std::size_t find_identifier_end(
        const std::size_t start_idx) const noexcept
    {
        assert(is_ident_start(peek_code_point(_source, start_idx)));

        std::size_t i = start_idx;
        (void)next_code_point(_source, i);

        while (i < _source.size())
        {
            std::size_t next_idx = i;
            const std::int32_t cp = next_code_point(_source, next_idx);

            if (!is_ident_continue(cp))
            {
                break;
            }

            // A hyphen only continues an identifier when more follows.
            if (cp == '-' &&
                !is_ident_continue(peek_code_point(_source, next_idx)))
            {
                break;
            }

            i = next_idx;
        }

        return i;
    }

    [[nodiscard]] std::string_view peek_identifier() const noexcept
    {
        return _source.substr(
            _curr_idx, find_identifier_end(_curr_idx) - _curr_idx);
    }

    void copy_identifier(std::string& output_buffer)
    {
        const std::size_t end_idx = find_identifier_end(_curr_idx);
        copy_range(output_buffer, _curr_idx, end_idx);
        _curr_idx = end_idx;
    }

    // Numeric literal with an optional unit suffix, e.g. `12`, `1.5em`.
    void copy_number(std::string& output_buffer)
    {
        assert(is_ascii_digit(get_curr_char()));

        while (!is_done() && is_ascii_digit(get_curr_char()))
        {
            copy_curr_char(output_buffer);
        }

        if (!is_done() && get_curr_char() == '.' && peek(1).has_value() &&
            is_ascii_digit(*peek(1)))
        {
            copy_curr_char(output_buffer);

            while (!is_done() && is_ascii_digit(get_curr_char()))
            {
                copy_curr_char(output_buffer);
            }
        }

        if (!is_done() && is_ident_start(get_curr_code_point()))
        {
            copy_identifier(output_buffer);
        }
    }

    [[nodiscard]] bool is_comment_start() const
    {
        return get_curr_char() == '/' && (peek(1) == '/' || peek(1) == '*');
    }

    [[nodiscard]] bool is_embedded_code_start(const std::size_t idx) const
    {
        if (idx >= _source.size())
        {
            return false;
        }

        const char c = _source[idx];
        return c == '(' || c == '{' || c == '[' || c == '"' || c == '`' ||
               is_ascii_digit(c) ||
               is_ident_start(peek_code_point(_source, idx));
    }

    [[nodiscard]] std::optional<std::size_t> find_label_end() const noexcept
    {
        assert(get_curr_char() == '<');

        std::size_t i = _curr_idx + 1;
        while (i < _source.size())
        {
            std::size_t next_idx = i;
            if (!is_label_char(next_code_point(_source, next_idx)))
            {
                break;
            }

            i = next_idx;
        }

        if (i == _curr_idx + 1 || i >= _source.size() || _source[i] != '>')
        {
            return std::nullopt;
        }

        return {i + 1};
    }

    [[nodiscard]] std::size_t find_reference_end() const noexcept
    {
        assert(get_curr_char() == '@');

        std::size_t i = _curr_idx + 1;
        std::size_t end_idx = i;

        while (i < _source.size())
        {
            const std::int32_t cp = next_code_point(_source, i);
            if (!is_label_char(cp))
            {
                break;
            }

            // References cannot end with `.` or `:`.
            if (cp != '.' && cp != ':')
            {
                end_idx = i;
            }
        }

        return end_idx;
    }

    [[nodiscard]] bool is_reference_start() const noexcept
    {
        return find_reference_end() > _curr_idx + 1;
    }

    [[nodiscard]] bool is_link_start() const noexcept
    {
        return starts_with("https://"sv) || starts_with("http://"sv);
    }

    //
    // Shared constructs
    // ------------------------------------------------------------------------

    [[nodiscard]] bool process_escape(std::string& output_buffer)
    {
        assert(get_curr_char() == '\\');

        const std::size_t start_idx = _curr_idx;
        step_fwd(1);

        if (!is_done())
        {
            if (get_curr_char() == 'u' && peek(1) == '{')
            {
                const std::optional<std::size_t> close_idx =
                    find_next('}', _curr_idx + 2);

                if (!close_idx.has_value())
                {
                    error_diagnostic(
                        start_idx, "unclosed unicode escape sequence");

                    return false;
                }

                _curr_idx = *close_idx + 1;
            }
            else
            {
                skip_code_point();
            }
        }

        copy_range(output_buffer, start_idx, _curr_idx);
        return true;
    }

    [[nodiscard]] bool process_comment(std::string& output_buffer)
    {
        assert(is_comment_start());

        const std::size_t start_idx = _curr_idx;
        const std::size_t body_start_idx = start_idx + 2;

        if (peek(1) == '/')
        {
            const std::size_t end_idx =
                find_next('\n', body_start_idx).value_or(_source.size());

            copy_range(output_buffer, start_idx, body_start_idx);
            substitute_range(output_buffer, body_start_idx, end_idx);

            _curr_idx = end_idx;
            return true;
        }

        // Block comments nest.
        std::size_t depth = 1;
        std::size_t i = body_start_idx;

        while (i + 1 < _source.size())
        {
            if (_source[i] == '/' && _source[i + 1] == '*')
            {
                ++depth;
                i += 2;
                continue;
            }

            if (_source[i] == '*' && _source[i + 1] == '/')
            {
                --depth;
                if (depth == 0)
                {
                    break;
                }

                i += 2;
                continue;
            }

            ++i;
        }

        if (depth != 0)
        {
            error_diagnostic(start_idx, "unclosed block comment");
            return false;
        }

        copy_range(output_buffer, start_idx, body_start_idx);
        substitute_range(output_buffer, body_start_idx, i);
        copy_range(output_buffer, i, i + 2);

        _curr_idx = i + 2;
        return true;
    }

    [[nodiscard]] std::optional<std::size_t> find_backtick_run(
        const std::size_t n_backticks, const std::size_t start_idx) const
    {
        std::size_t found = 0;

        for (std::size_t i = start_idx; i < _source.size(); ++i)
        {
            if (_source[i] != '`')
            {
                found = 0;
                continue;
            }

            ++found;
            if (found == n_backticks)
            {
                return {i + 1 - n_backticks};
            }
        }

        return std::nullopt;
    }

    [[nodiscard]] bool process_raw(std::string& output_buffer)
    {
        assert(get_curr_char() == '`');

        const std::size_t start_idx = _curr_idx;

        std::size_t n_backticks = 0;
        while (peek(n_backticks) == '`')
        {
            ++n_backticks;
        }

        step_fwd(n_backticks);

        // Two backticks are an empty raw element.
        if (n_backticks == 2)
        {
            copy_range(output_buffer, start_idx, _curr_idx);
            return true;
        }

        // Language tag of a raw block.
        if (n_backticks >= 3)
        {
            while (!is_done() && is_ident_continue(get_curr_code_point()))
            {
                skip_code_point();
            }
        }

        const std::size_t body_start_idx = _curr_idx;

        const std::optional<std::size_t> close_idx =
            find_backtick_run(n_backticks, body_start_idx);

        if (!close_idx.has_value())
        {
            error_diagnostic(start_idx, "unclosed raw text");
            return false;
        }

        copy_range(output_buffer, start_idx, body_start_idx);
        process_content_range(
            output_buffer, body_start_idx, *close_idx, _cfg.aggressive);

        _curr_idx = *close_idx + n_backticks;
        copy_range(output_buffer, *close_idx, _curr_idx);

        return true;
    }

    [[nodiscard]] bool process_string(std::string& output_buffer)
    {
        assert(get_curr_char() == '"');

        const std::size_t open_idx = _curr_idx;
        copy_curr_char(output_buffer);

        std::size_t segment_start_idx = _curr_idx;

        while (!is_done())
        {
            const char c = get_curr_char();

            if (c != '"' && c != '\\')
            {
                step_fwd(1);
                continue;
            }

            process_content_range(output_buffer, segment_start_idx, _curr_idx,
                _cfg.aggressive);

            if (c == '"')
            {
                copy_curr_char(output_buffer);
                return true;
            }

            if (!process_escape(output_buffer))
            {
                return false;
            }

            segment_start_idx = _curr_idx;
        }

        error_diagnostic(open_idx, "unclosed string");
        return false;
    }

    [[nodiscard]] bool skip_string()
    {
        assert(get_curr_char() == '"');

        const std::size_t open_idx = _curr_idx;
        step_fwd(1);

        while (!is_done())
        {
            const char c = get_curr_char();
            step_fwd(1);

            if (c == '\\')
            {
                if (!is_done())
                {
                    skip_code_point();
                }

                continue;
            }

            if (c == '"')
            {
                return true;
            }
        }

        error_diagnostic(open_idx, "unclosed string");
        return false;
    }

    [[nodiscard]] bool process_math(std::string& output_buffer)
    {
        assert(get_curr_char() == '$');

        const std::size_t open_idx = _curr_idx;
        copy_curr_char(output_buffer);

        while (!is_done())
        {
            const char c = get_curr_char();

            if (c == '$')
            {
                copy_curr_char(output_buffer);
                return true;
            }

            bool ok = true;

            if (c == '\\')
            {
                ok = process_escape(output_buffer);
            }
            else if (c == '"')
            {
                ok = process_string(output_buffer);
            }
            else if (is_comment_start())
            {
                ok = process_comment(output_buffer);
            }
            else if (c == '#' && is_embedded_code_start(_curr_idx + 1))
            {
                ok = process_embedded_code(output_buffer);
            }
            else
            {
                copy_curr_char(output_buffer);
            }

            if (!ok)
            {
                return false;
            }
        }

        error_diagnostic(open_idx, "unclosed equation");
        return false;
    }

    //
    // Code mode
    // ------------------------------------------------------------------------

    // Copies an `import` or `include` statement verbatim, strings included.
    [[nodiscard]] bool process_module_statement(std::string& output_buffer)
    {
        const std::size_t start_idx = _curr_idx;
        std::size_t depth = 0;

        while (!is_done())
        {
            const char c = get_curr_char();

            if (depth == 0 &&
                (c == '\n' || c == ';' || is_closing_delimiter(c)))
            {
                break;
            }

            if (c == '"')
            {
                if (!skip_string())
                {
                    return false;
                }

                continue;
            }

            if (c == '(' || c == '{' || c == '[')
            {
                ++depth;
            }
            else if (is_closing_delimiter(c))
            {
                --depth;
            }

            step_fwd(1);
        }

        copy_range(output_buffer, start_idx, _curr_idx);
        return true;
    }

    [[nodiscard]] bool process_code_token(std::string& output_buffer)
    {
        const char c = get_curr_char();

        if (c == '"')
        {
            return process_string(output_buffer);
        }

        if (is_comment_start())
        {
            return process_comment(output_buffer);
        }

        if (c == '[')
        {
            return process_content_block(output_buffer);
        }

        if (c == '(')
        {
            return process_code_group(output_buffer, ')');
        }

        if (c == '{')
        {
            return process_code_group(output_buffer, '}');
        }

        if (c == '$')
        {
            return process_math(output_buffer);
        }

        if (c == '`')
        {
            return process_raw(output_buffer);
        }

        if (is_ident_start(get_curr_code_point()))
        {
            if (is_module_keyword(peek_identifier()))
            {
                return process_module_statement(output_buffer);
            }

            copy_identifier(output_buffer);
            return true;
        }

        copy_curr_char(output_buffer);
        return true;
    }

    [[nodiscard]] bool process_code_group(
        std::string& output_buffer, const char closing)
    {
        const std::size_t open_idx = _curr_idx;
        copy_curr_char(output_buffer);

        while (!is_done())
        {
            const char c = get_curr_char();

            if (c == closing)
            {
                copy_curr_char(output_buffer);
                return true;
            }

            if (is_closing_delimiter(c))
            {
                error_diagnostic_delimiter(_curr_idx, "unexpected delimiter");
                return false;
            }

            if (!process_code_token(output_buffer))
            {
                return false;
            }
        }

        error_diagnostic_delimiter(open_idx, "unclosed delimiter");
        return false;
    }

    // An embedded statement runs until a line break or a semicolon, or
    // until the enclosing block closes.
    [[nodiscard]] bool process_code_statement(std::string& output_buffer)
    {
        while (!is_done())
        {
            const char c = get_curr_char();

            if (c == '\n' || is_closing_delimiter(c))
            {
                return true;
            }

            if (c == ';')
            {
                copy_curr_char(output_buffer);
                return true;
            }

            if (!process_code_token(output_buffer))
            {
                return false;
            }
        }

        return true;
    }

    [[nodiscard]] bool process_postfix_chain(std::string& output_buffer)
    {
        while (!is_done())
        {
            const char c = get_curr_char();

            if (c == '.' &&
                is_ident_start(peek_code_point(_source, _curr_idx + 1)))
            {
                copy_curr_char(output_buffer);
                copy_identifier(output_buffer);
                continue;
            }

            bool ok = true;

            if (c == '(')
            {
                ok = process_code_group(output_buffer, ')');
            }
            else if (c == '[')
            {
                ok = process_content_block(output_buffer);
            }
            else
            {
                return true;
            }

            if (!ok)
            {
                return false;
            }
        }

        return true;
    }

    [[nodiscard]] bool process_embedded_expression(std::string& output_buffer)
    {
        assert(is_embedded_code_start(_curr_idx));

        const char c = get_curr_char();
        bool ok = true;

        if (c == '(')
        {
            ok = process_code_group(output_buffer, ')');
        }
        else if (c == '{')
        {
            ok = process_code_group(output_buffer, '}');
        }
        else if (c == '[')
        {
            ok = process_content_block(output_buffer);
        }
        else if (c == '"')
        {
            ok = process_string(output_buffer);
        }
        else if (c == '`')
        {
            ok = process_raw(output_buffer);
        }
        else if (is_ascii_digit(c))
        {
            copy_number(output_buffer);
        }
        else
        {
            const std::string_view ident = peek_identifier();

            if (is_module_keyword(ident))
            {
                return process_module_statement(output_buffer);
            }

            copy_identifier(output_buffer);

            if (is_statement_keyword(ident))
            {
                return process_code_statement(output_buffer);
            }

            if (ident == "context"sv)
            {
                while (!is_done() &&
                       (get_curr_char() == ' ' || get_curr_char() == '\t'))
                {
                    copy_curr_char(output_buffer);
                }

                if (!is_embedded_code_start(_curr_idx))
                {
                    return true;
                }

                return process_embedded_expression(output_buffer);
            }
        }

        if (!ok)
        {
            return false;
        }

        return process_postfix_chain(output_buffer);
    }

    [[nodiscard]] bool process_embedded_code(std::string& output_buffer)
    {
        assert(get_curr_char() == '#');

        copy_curr_char(output_buffer);
        return process_embedded_expression(output_buffer);
    }

    //
    // Markup mode
    // ------------------------------------------------------------------------

    [[nodiscard]] bool process_content_block(std::string& output_buffer)
    {
        assert(get_curr_char() == '[');

        const std::size_t open_idx = _curr_idx;
        copy_curr_char(output_buffer);

        if (!process_markup(output_buffer, open_idx))
        {
            return false;
        }

        assert(get_curr_char() == ']');
        copy_curr_char(output_buffer);

        return true;
    }

    void process_label(std::string& output_buffer, const std::size_t end_idx)
    {
        copy_range(output_buffer, _curr_idx, end_idx);
        _curr_idx = end_idx;
    }

    [[nodiscard]] bool process_reference(std::string& output_buffer)
    {
        const std::size_t end_idx = find_reference_end();
        copy_range(output_buffer, _curr_idx, end_idx);
        _curr_idx = end_idx;

        // Optional supplement, e.g. `@intro[Chapter]`.
        if (!is_done() && get_curr_char() == '[')
        {
            return process_content_block(output_buffer);
        }

        return true;
    }

    // The scheme stays intact so the result is still recognized as a link.
    void process_link(std::string& output_buffer)
    {
        const std::size_t scheme_end_idx =
            _curr_idx + (starts_with("https://"sv) ? 8 : 7);

        std::size_t i = scheme_end_idx;
        std::size_t paren_depth = 0;
        std::size_t bracket_depth = 0;

        for (; i < _source.size(); ++i)
        {
            const char c = _source[i];

            if (is_link_terminator(c))
            {
                break;
            }

            if (c == '(')
            {
                ++paren_depth;
            }
            else if (c == ')')
            {
                if (paren_depth == 0)
                {
                    break;
                }

                --paren_depth;
            }
            else if (c == '[')
            {
                ++bracket_depth;
            }
            else if (c == ']')
            {
                if (bracket_depth == 0)
                {
                    break;
                }

                --bracket_depth;
            }
        }

        while (i > scheme_end_idx && is_link_trailing_punctuation(_source[i - 1]))
        {
            --i;
        }

        copy_range(output_buffer, _curr_idx, scheme_end_idx);
        substitute_range(output_buffer, scheme_end_idx, i);

        _curr_idx = i;
    }

    [[nodiscard]] bool is_markup_construct_start() const
    {
        switch (get_curr_char())
        {
            case '\\':
            case '`':
            case '$':
            case '[': return true;

            case '/': return is_comment_start();
            case '#': return is_embedded_code_start(_curr_idx + 1);
            case '<': return find_label_end().has_value();
            case '@': return is_reference_start();
            case 'h': return is_link_start();

            default: return false;
        }
    }

    [[nodiscard]] bool process_markup_construct(std::string& output_buffer)
    {
        assert(is_markup_construct_start());

        switch (get_curr_char())
        {
            case '\\': return process_escape(output_buffer);
            case '`': return process_raw(output_buffer);
            case '$': return process_math(output_buffer);
            case '[': return process_content_block(output_buffer);
            case '/': return process_comment(output_buffer);
            case '#': return process_embedded_code(output_buffer);
            case '@': return process_reference(output_buffer);

            case '<':
            {
                process_label(output_buffer, *find_label_end());
                return true;
            }

            case 'h':
            {
                process_link(output_buffer);
                return true;
            }

            default: break;
        }

        error_diagnostic(_curr_idx, "fatal classification error");
        return false;
    }

    // Processes markup until the end of the source or, inside a content
    // block opened at `open_idx`, until its closing bracket (not consumed).
    [[nodiscard]] bool process_markup(std::string& output_buffer,
        const std::optional<std::size_t> open_idx)
    {
        std::size_t text_start_idx = _curr_idx;

        while (!is_done())
        {
            if (get_curr_char() == ']')
            {
                substitute_range(output_buffer, text_start_idx, _curr_idx);

                if (open_idx.has_value())
                {
                    return true;
                }

                error_diagnostic_delimiter(_curr_idx, "unexpected delimiter");
                return false;
            }

            if (!is_markup_construct_start())
            {
                step_fwd(1);
                continue;
            }

            substitute_range(output_buffer, text_start_idx, _curr_idx);

            if (!process_markup_construct(output_buffer))
            {
                return false;
            }

            text_start_idx = _curr_idx;
        }

        substitute_range(output_buffer, text_start_idx, _curr_idx);

        if (open_idx.has_value())
        {
            error_diagnostic_delimiter(*open_idx, "unclosed delimiter");
            return false;
        }

        return true;
    }

public:
    [[nodiscard]] explicit pass(anonymizer::state& state,
        const anonymizer::config& cfg, const std::string_view source)
        : _err_stream{state._err_stream}, _substituter{state._substituter},
          _cfg{cfg}, _source{source}, _curr_idx{0}
    {}

    [[nodiscard]] bool anonymize(std::string& output_buffer)
    {
        return process_markup(output_buffer, std::nullopt);
    }
};

anonymizer::anonymizer(std::ostream& err_stream, word_substituter& substituter)
    : _state{std::make_unique<state>(err_stream, substituter)}
{}

anonymizer::~anonymizer() = default;

bool anonymizer::anonymize(const config& cfg, std::string& output_buffer,
    const std::string_view source) noexcept
{
    const std::size_t initial_size = output_buffer.size();

    if (!pass{*_state, cfg, source}.anonymize(output_buffer))
    {
        output_buffer.resize(initial_size);
        return false;
    }

    return true;
}

} // namespace typanon
