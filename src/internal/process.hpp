#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace pivot::internal {

    struct process_result {
        int exit_code{-1};
        bool timed_out{false};
        // exec itself failed (binary missing or not executable)
        bool spawn_failed{false};
        std::string stdout_text{};
        std::string stderr_text{};
        std::chrono::nanoseconds elapsed{};

        bool ok() const { return !timed_out && !spawn_failed && exit_code == 0; }
    };

    // Runs args[0] (PATH lookup) in its own process group. On timeout the whole group is
    // killed and the result is flagged timed_out.
    process_result run_process(const std::vector<std::string>& args, std::chrono::milliseconds timeout);

    std::string first_line(std::string_view text);

    void make_executable(const std::string& path);

}  // namespace pivot::internal
