#include "pivot/cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        pivot::pipeline_config cfg{};
        pivot::cli::command_request request{};
        if (auto cli_result = pivot::cli::parse_cli(argc, argv, cfg, request)) {
            return *cli_result;
        }

        return pivot::cli::run_command(cfg, request, std::cout, std::cerr);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
