#pragma once

#include "config.hpp"

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace pivot::cli {

    enum class command_kind : uint8_t { none, analyze, synthesize, validate, benchmark, evolve, cache_gc, cache_list };

    // what the subcommand asked for, beyond the shared pipeline_config
    struct command_request {
        command_kind kind{command_kind::none};
        std::filesystem::path source{};
        std::string language{};
        std::filesystem::path blueprint{};
        std::filesystem::path manifest{};
        std::filesystem::path output{};
        std::filesystem::path vessel_dir{"vessels"};
        std::vector<std::string> functions{};
        std::vector<std::string> args{};
        std::string baseline{};
        bool save_baseline{false};
        int64_t max_age_hours{24 * 7};
    };

    // Resolves config (defaults, then --config file, then flags) and the subcommand. Returns
    // an exit code when the process should stop here (help, --version, --print-config, bad
    // arguments).
    std::optional<int> parse_cli(
            int argc,
            const char* const* argv,
            pipeline_config& cfg,
            command_request& request,
            std::ostream& out,
            std::ostream& err);

    std::optional<int> parse_cli(int argc, char** argv, pipeline_config& cfg, command_request& request);

    // runs one subcommand; returns the process exit code
    int run_command(const pipeline_config& cfg, const command_request& request, std::ostream& out, std::ostream& err);

}  // namespace pivot::cli
