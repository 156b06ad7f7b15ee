#include <typanon/app.hpp>
#include <typanon/cli_options.hpp>

#include <iostream>
#include <optional>

int main(int argc, char** argv)
{
    std::ios_base::sync_with_stdio(false);
    std::cin.tie(nullptr);

    const std::optional<typanon::cli_options> opts =
        typanon::parse_cli_options(std::cerr, argc, argv);

    if (!opts.has_value())
    {
        typanon::print_usage(std::cerr, argv[0]);
        return static_cast<int>(typanon::exit_code::configuration_error);
    }

    if (opts->help)
    {
        typanon::print_usage(std::cout, argv[0]);
        return static_cast<int>(typanon::exit_code::success);
    }

    return static_cast<int>(
        typanon::run(*opts, std::cin, std::cout, std::cerr));
}
