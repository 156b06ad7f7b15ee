#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <typanon/app.hpp>
#include <typanon/cli_options.hpp>

#include <fstream>
#include <ios>
#include <iterator>
#include <sstream>
#include <string>
#include <string_view>

#include <cstddef>

using namespace std::string_view_literals;

namespace {

void make_tmp_file(const std::string_view path, const std::string_view contents)
{
    std::ofstream ofs(std::string{path});
    REQUIRE(ofs);

    ofs << contents;
    ofs.flush();

    REQUIRE(ofs);
}

[[nodiscard]] std::string read_tmp_file(const std::string_view path)
{
    std::ifstream ifs(std::string{path});
    REQUIRE(ifs);

    return std::string{std::istreambuf_iterator<char>{ifs},
        std::istreambuf_iterator<char>{}};
}

struct run_result
{
    typanon::exit_code _code;
    std::string _output;
    std::string _diagnostics;
};

[[nodiscard]] run_result do_run(
    const typanon::cli_options& opts, const std::string_view input)
{
    std::istringstream iss{std::string{input}};
    std::ostringstream output;
    std::ostringstream err;

    const typanon::exit_code code = typanon::run(opts, iss, output, err);
    return run_result{
        ._code = code, ._output = output.str(), ._diagnostics = err.str()};
}

[[nodiscard]] typanon::cli_options seeded_options()
{
    typanon::cli_options opts;
    opts.seed = 99;
    return opts;
}

} // namespace

TEST_CASE("app run from standard input")
{
    const std::string_view source = "= Title\n#emph[Words] and $x$.\n"sv;
    const run_result r = do_run(seeded_options(), source);

    REQUIRE(r._code == typanon::exit_code::success);
    REQUIRE(r._diagnostics == "");
    REQUIRE(r._output.size() == source.size());
    REQUIRE(r._output.substr(0, 2) == "= ");
    REQUIRE(r._output.substr(8, 6) == "#emph[");
    REQUIRE(r._output.substr(source.size() - 5) == "$x$.\n");
    REQUIRE(r._output != source);
}

TEST_CASE("app run writes nothing on document errors")
{
    const run_result r = do_run(seeded_options(), "Some $math\n"sv);

    REQUIRE(r._code == typanon::exit_code::document_error);
    REQUIRE(r._output == "");
    REQUIRE(r._diagnostics.find("unclosed equation") != std::string::npos);
}

TEST_CASE("app run in place")
{
    make_tmp_file("./in_place.typ", "Secret text #strong[here]\n");

    typanon::cli_options opts = seeded_options();
    opts.in_place_path = "./in_place.typ";

    const run_result r = do_run(opts, "ignored"sv);

    REQUIRE(r._code == typanon::exit_code::success);
    REQUIRE(r._output == "");

    const std::string result = read_tmp_file("./in_place.typ");
    REQUIRE(result.size() == 26);
    REQUIRE(result.substr(12) == "#strong[" + result.substr(20, 4) + "]\n");
    REQUIRE(result.substr(0, 12) != "Secret text ");
}

TEST_CASE("app run in place keeps file on document errors")
{
    make_tmp_file("./in_place_error.typ", "Broken ]\n");

    typanon::cli_options opts = seeded_options();
    opts.in_place_path = "./in_place_error.typ";

    const run_result r = do_run(opts, ""sv);

    REQUIRE(r._code == typanon::exit_code::document_error);
    REQUIRE(read_tmp_file("./in_place_error.typ") == "Broken ]\n");
}

TEST_CASE("app run missing input file")
{
    typanon::cli_options opts = seeded_options();
    opts.in_place_path = "./missing-input.typ";

    const run_result r = do_run(opts, ""sv);

    REQUIRE(r._code == typanon::exit_code::input_error);
    REQUIRE(r._diagnostics.find("((IO ERROR))") != std::string::npos);
}

TEST_CASE("app run unsupported language")
{
    typanon::cli_options opts = seeded_options();
    opts.language = "fr";

    const run_result r = do_run(opts, "text"sv);

    REQUIRE(r._code == typanon::exit_code::configuration_error);
    REQUIRE(r._diagnostics.find("'fr' not supported") != std::string::npos);
}

TEST_CASE("app run with pattern file for other languages")
{
    make_tmp_file("./hyph-fr.pat.txt", "% test patterns\na1n\n");

    typanon::cli_options opts = seeded_options();
    opts.language = "fr";
    opts.patterns_path = "./hyph-fr.pat.txt";

    const run_result r = do_run(opts, "bonjour"sv);

    REQUIRE(r._code == typanon::exit_code::success);
    REQUIRE(r._output.size() == 7);
}

TEST_CASE("app run missing wordlist")
{
    typanon::cli_options opts = seeded_options();
    opts.wordlist_path = "./missing-wordlist.txt";

    const run_result r = do_run(opts, "text"sv);

    REQUIRE(r._code == typanon::exit_code::configuration_error);
}

TEST_CASE("app run with wordlist")
{
    make_tmp_file("./app_wordlist.txt",
        "able\nacid\naged\nalso\narea\narmy\naway\nbaby\nback\nball\nband\n"
        "bank\nbase\nbath\nbear\nbeat\n");

    typanon::cli_options opts = seeded_options();
    opts.wordlist_path = "./app_wordlist.txt";

    const run_result r = do_run(opts, "word"sv);

    REQUIRE(r._code == typanon::exit_code::success);

    const std::string wordlist = read_tmp_file("./app_wordlist.txt");
    REQUIRE(r._output.size() == 4);
    REQUIRE(wordlist.find(r._output + "\n") != std::string::npos);
}

TEST_CASE("app run aggressive")
{
    typanon::cli_options opts = seeded_options();
    opts.aggressive = true;

    const std::string_view source = "#let title = \"Quarterly report\""sv;
    const run_result r = do_run(opts, source);

    REQUIRE(r._code == typanon::exit_code::success);
    REQUIRE(r._output.substr(0, 14) == "#let title = \"");
    REQUIRE(r._output.substr(14, 16) != "Quarterly report");
    REQUIRE(r._output.back() == '"');
}

TEST_CASE("app run failing standard output")
{
    std::istringstream iss{"Some text"};
    std::ostringstream output;
    std::ostringstream err;
    output.setstate(std::ios::badbit);

    const typanon::exit_code code =
        typanon::run(seeded_options(), iss, output, err);

    REQUIRE(code == typanon::exit_code::output_error);
    REQUIRE(err.str().find("((IO ERROR))") != std::string::npos);
}
