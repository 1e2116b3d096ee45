#pragma once

#include "pivot/format.hpp"

#include <glaze/glaze.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

extern "C" {
#include <unistd.h>
}

namespace pivot::internal {

    using namespace pivot::literals;
    namespace fs = std::filesystem;

    inline constexpr int supported_schema_version = 1;

    inline std::string read_text_file(const fs::path& path) {
        std::ifstream in{path};
        if (!in) {
            throw std::runtime_error("failed to open {}"_format(path.string()));
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        if (!in.good() && !in.eof()) {
            throw std::runtime_error("failed to read {}"_format(path.string()));
        }
        return ss.str();
    }

    inline void write_text_file(const fs::path& path, std::string_view text) {
        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        if (!out) {
            throw std::runtime_error("failed to open {}"_format(path.string()));
        }
        out << text;
        out.flush();
        if (!out) {
            throw std::runtime_error("failed to write {}"_format(path.string()));
        }
    }

    // sibling temp name unique across threads and processes
    inline fs::path temp_sibling(const fs::path& path) {
        static std::atomic<uint64_t> counter{0U};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        return path.parent_path() /
               ".{}.{}.{}.{}.tmp"_format(path.filename().string(), ::getpid(), stamp, counter.fetch_add(1U));
    }

    // readers observe either the previous file or the complete new one
    inline void publish_text_file(const fs::path& path, std::string_view text) {
        auto tmp = temp_sibling(path);
        write_text_file(tmp, text);
        std::error_code ec{};
        fs::rename(tmp, path, ec);
        if (ec) {
            fs::remove(tmp, ec);
            throw std::runtime_error("failed to publish {}"_format(path.string()));
        }
    }

    template <typename T>
    std::string to_json(const T& value) {
        std::string json{};
        auto ec = glz::write_json(value, json);
        if (ec) {
            throw std::runtime_error("failed to serialize json payload");
        }
        return json;
    }

    template <typename T>
    void write_json_file(const T& value, const fs::path& path) {
        std::string json{};
        auto ec = glz::write_json(value, json);
        if (ec) {
            throw std::runtime_error("failed to serialize json for {}"_format(path.string()));
        }
        json.push_back('\n');
        publish_text_file(path, json);
    }

    // keys absent from json keep the values already in `value`
    template <typename T>
    void parse_json_into(T& value, const std::string& json, const std::string& origin) {
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(value, json);
        if (ec) {
            throw std::runtime_error("failed to parse json {}: {}"_format(origin, glz::format_error(ec, json)));
        }
    }

    template <typename T>
    T parse_json(const std::string& json, const std::string& origin) {
        T value{};
        parse_json_into(value, json, origin);
        return value;
    }

    template <typename T>
    T read_json_file(const fs::path& path) {
        return parse_json<T>(read_text_file(path), path.string());
    }

    inline void validate_supported_schema_version(int schema_version, const std::string& origin) {
        if (schema_version < 1 || schema_version > supported_schema_version) {
            throw std::runtime_error(
                    "unsupported schema version in {}: {} (supported: {})"_format(
                            origin, schema_version, supported_schema_version));
        }
    }

    inline int64_t now_epoch_ms() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                .count();
    }

}  // namespace pivot::internal
