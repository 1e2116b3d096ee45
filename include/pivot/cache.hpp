#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace pivot {

    namespace fs = std::filesystem;

    // everything that determines a compiled artifact
    struct cache_key {
        std::string rendered_source{};
        std::string profile_id{};
        std::string toolchain_version{};
        std::string target_triple{};
    };

    // 16 lowercase hex digits; any change in any key component yields a different hash
    std::string content_hash(const cache_key& key);

    struct cache_entry {
        std::string hash{};
        fs::path binary_path{};
        uint64_t binary_size{};
        int64_t created_ms{};
        std::string source_digest{};
        std::string profile_id{};
        std::string toolchain_version{};
        std::string target_triple{};
    };

    /*
     * On-disk layout under root:
     *   entries/<hash>.json   published by rename, never rewritten in place
     *   objects/<hash>/       the binary an entry points at
     *   staging/              scratch space for in-flight compiles
     *
     * All member functions are safe to call concurrently. Callers that compile on a miss
     * hold lock(hash) across lookup, compile and insert so that at most one compile per
     * hash is in flight.
     */
    class build_cache {
        struct lock_slot {
            std::mutex mutex{};
            size_t users{};
        };

      public:
        class hash_lock {
          public:
            hash_lock(hash_lock&& other) noexcept;
            hash_lock& operator=(hash_lock&&) = delete;
            hash_lock(const hash_lock&) = delete;
            hash_lock& operator=(const hash_lock&) = delete;
            ~hash_lock();

            const std::string& hash() const { return hash_; }

          private:
            friend class build_cache;
            hash_lock(build_cache& owner, std::string hash, std::shared_ptr<lock_slot> slot);

            build_cache* owner_{};
            std::string hash_{};
            std::shared_ptr<lock_slot> slot_{};
        };

        // creates the directory layout and loads the entry index
        explicit build_cache(fs::path root);

        const fs::path& root() const { return root_; }

        // an entry file that exists but cannot be parsed comes back with an empty binary path
        // so that verify() reports it as corrupt
        std::optional<cache_entry> lookup(std::string_view hash) const;

        // the referenced binary exists, is a regular file and has the recorded size
        bool verify(const cache_entry& entry) const;

        // moves staged_binary into objects/<hash>/ and publishes the entry; an existing valid
        // entry is returned unchanged. Throws if a corrupt entry is in the way (repair first).
        cache_entry insert(const std::string& hash, const cache_key& key, const fs::path& staged_binary);

        // removes an entry and its objects; returns false when there was nothing to remove
        bool repair(std::string_view hash);

        std::vector<cache_entry> entries() const;

        // removes entries created more than max_age ago; returns how many were removed
        size_t collect_garbage(std::chrono::milliseconds max_age);

        // fresh private directory under staging/
        fs::path make_staging_dir() const;

        [[nodiscard]] hash_lock lock(const std::string& hash);

      private:
        fs::path root_;
        fs::path entries_dir_;
        fs::path objects_dir_;
        fs::path staging_dir_;

        mutable std::shared_mutex index_mutex_{};
        mutable std::map<std::string, cache_entry, std::less<>> index_{};

        std::mutex lock_table_mutex_{};
        std::map<std::string, std::shared_ptr<lock_slot>, std::less<>> lock_table_{};

        fs::path entry_path(std::string_view hash) const;
        std::optional<cache_entry> load_entry(std::string_view hash) const;
        void release(const std::string& hash, const std::shared_ptr<lock_slot>& slot);
    };

}  // namespace pivot
