#pragma once

#include "pivot.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

#include "../src/internal/hash.hpp"
#include "../src/internal/json_io.hpp"
#include "../src/internal/process.hpp"
#include "../src/internal/types.hpp"
#include "../src/internal/worker_pool.hpp"

extern "C" {
#include <unistd.h>
}

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace pivot::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            static std::atomic<unsigned> counter{0U};
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now << "_" << counter.fetch_add(1U);
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    inline void write_text_file(const fs::path& path, std::string_view text) {
        auto parent = path.parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }
        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        REQUIRE(out.good());
        out << text;
        REQUIRE(out.good());
    }

    inline std::string read_text_file(const fs::path& path) {
        std::ifstream in{path};
        REQUIRE(in.good());
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    // stand-in for an external tool (compiler, interpreter, vessel)
    inline void write_executable_script(const fs::path& path, std::string_view content) {
        write_text_file(path, content);
        fs::permissions(
                path,
                fs::perms::owner_read | fs::perms::owner_write | fs::perms::owner_exec | fs::perms::group_read |
                        fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
                fs::perm_options::replace);
    }

    inline size_t count_lines(const fs::path& path) {
        std::error_code ec{};
        if (!fs::exists(path, ec)) {
            return 0U;
        }
        auto text = read_text_file(path);
        return static_cast<size_t>(std::ranges::count(text, '\n'));
    }

    inline const function_spec& find_function(const std::vector<function_spec>& specs, std::string_view name) {
        auto it = std::ranges::find(specs, name, &function_spec::name);
        REQUIRE(it != specs.end());
        return *it;
    }

}  // namespace pivot::test::detail
