#include "pivot/cache.hpp"

#include "pivot/format.hpp"
#include "pivot/utils.hpp"

#include "internal/hash.hpp"
#include "internal/json_io.hpp"
#include "internal/types.hpp"

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <system_error>
#include <utility>

using namespace pivot::literals;
using namespace std::string_view_literals;

namespace pivot {

    namespace detail {

        static bool is_valid_hash(std::string_view hash) {
            return hash.size() == 16U && std::ranges::all_of(hash, [](char c) {
                       return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
                   });
        }

        static void require_valid_hash(std::string_view hash) {
            if (!is_valid_hash(hash)) {
                throw std::invalid_argument("invalid cache hash: '{}'"_format(hash));
            }
        }

        static cache_entry from_record(const internal::cache_entry_record& record) {
            return cache_entry{
                    .hash = record.hash,
                    .binary_path = record.binary_path,
                    .binary_size = record.binary_size,
                    .created_ms = record.created_ms,
                    .source_digest = record.source_digest,
                    .profile_id = record.profile_id,
                    .toolchain_version = record.toolchain_version,
                    .target_triple = record.target_triple};
        }

        static internal::cache_entry_record to_record(const cache_entry& entry) {
            return internal::cache_entry_record{
                    .schema_version = internal::supported_schema_version,
                    .hash = entry.hash,
                    .binary_path = entry.binary_path.string(),
                    .binary_size = entry.binary_size,
                    .created_ms = entry.created_ms,
                    .source_digest = entry.source_digest,
                    .profile_id = entry.profile_id,
                    .toolchain_version = entry.toolchain_version,
                    .target_triple = entry.target_triple};
        }

        static void ensure_directory(const fs::path& dir) {
            std::error_code ec{};
            fs::create_directories(dir, ec);
            if (ec) {
                throw std::runtime_error("failed to create cache directory {}: {}"_format(dir.string(), ec.message()));
            }
        }

        // rename when possible; staging may live on another filesystem
        static void move_file(const fs::path& from, const fs::path& to) {
            std::error_code ec{};
            fs::rename(from, to, ec);
            if (!ec) {
                return;
            }
            fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
            if (ec) {
                throw std::runtime_error(
                        "failed to move {} into cache at {}: {}"_format(from.string(), to.string(), ec.message()));
            }
            fs::permissions(to, fs::status(from).permissions(), ec);
            fs::remove(from, ec);
        }

    }  // namespace detail

    std::string content_hash(const cache_key& key) {
        internal::content_hasher hasher{};
        hasher.update_field("source"sv, key.rendered_source);
        hasher.update_field("profile"sv, key.profile_id);
        hasher.update_field("toolchain"sv, key.toolchain_version);
        hasher.update_field("triple"sv, key.target_triple);
        return hasher.hex();
    }

    build_cache::hash_lock::hash_lock(build_cache& owner, std::string hash, std::shared_ptr<lock_slot> slot)
            : owner_{&owner}, hash_{std::move(hash)}, slot_{std::move(slot)} {}

    build_cache::hash_lock::hash_lock(hash_lock&& other) noexcept
            : owner_{std::exchange(other.owner_, nullptr)}, hash_{std::move(other.hash_)}, slot_{std::move(other.slot_)} {}

    build_cache::hash_lock::~hash_lock() {
        if (owner_ != nullptr) {
            owner_->release(hash_, slot_);
        }
    }

    build_cache::build_cache(fs::path root)
            : root_{std::move(root)},
              entries_dir_{root_ / "entries"},
              objects_dir_{root_ / "objects"},
              staging_dir_{root_ / "staging"} {
        detail::ensure_directory(entries_dir_);
        detail::ensure_directory(objects_dir_);
        detail::ensure_directory(staging_dir_);

        std::error_code ec{};
        for (const auto& dirent : fs::directory_iterator{entries_dir_, ec}) {
            const auto& path = dirent.path();
            if (path.extension() != ".json" || !detail::is_valid_hash(path.stem().string())) {
                continue;
            }
            if (auto entry = load_entry(path.stem().string())) {
                index_.emplace(entry->hash, std::move(*entry));
            }
        }
        if (ec) {
            throw std::runtime_error("failed to scan {}: {}"_format(entries_dir_.string(), ec.message()));
        }
        debug_log("opened build cache at ", root_.string(), " with ", index_.size(), " entries");
    }

    fs::path build_cache::entry_path(std::string_view hash) const {
        return entries_dir_ / "{}.json"_format(hash);
    }

    std::optional<cache_entry> build_cache::load_entry(std::string_view hash) const {
        auto path = entry_path(hash);
        std::error_code ec{};
        if (!fs::exists(path, ec)) {
            return std::nullopt;
        }
        try {
            auto record = internal::read_json_file<internal::cache_entry_record>(path);
            internal::validate_supported_schema_version(record.schema_version, path.string());
            if (record.hash != hash) {
                throw std::runtime_error("entry hash {} does not match file name"_format(record.hash));
            }
            return detail::from_record(record);
        } catch (const std::exception& e) {
            debug_log("unreadable cache entry ", path.string(), ": ", e.what());
            return cache_entry{.hash = std::string{hash}};
        }
    }

    std::optional<cache_entry> build_cache::lookup(std::string_view hash) const {
        detail::require_valid_hash(hash);
        {
            std::shared_lock read{index_mutex_};
            if (auto it = index_.find(hash); it != index_.end()) {
                return it->second;
            }
        }

        // another process may have published it since the index was loaded
        auto entry = load_entry(hash);
        if (entry && !entry->binary_path.empty()) {
            std::unique_lock write{index_mutex_};
            index_.insert_or_assign(entry->hash, *entry);
        }
        return entry;
    }

    bool build_cache::verify(const cache_entry& entry) const {
        if (entry.binary_path.empty()) {
            return false;
        }
        std::error_code ec{};
        if (!fs::is_regular_file(entry.binary_path, ec)) {
            return false;
        }
        auto size = fs::file_size(entry.binary_path, ec);
        return !ec && size == entry.binary_size;
    }

    cache_entry build_cache::insert(const std::string& hash, const cache_key& key, const fs::path& staged_binary) {
        detail::require_valid_hash(hash);

        if (auto existing = lookup(hash)) {
            if (verify(*existing)) {
                std::error_code ec{};
                fs::remove(staged_binary, ec);
                return *existing;
            }
            throw std::runtime_error("refusing to overwrite corrupt cache entry {}; repair it first"_format(hash));
        }

        std::error_code ec{};
        if (!fs::is_regular_file(staged_binary, ec)) {
            throw std::runtime_error("staged binary {} does not exist"_format(staged_binary.string()));
        }

        auto object_dir = objects_dir_ / hash;
        detail::ensure_directory(object_dir);
        auto binary_path = object_dir / staged_binary.filename();
        detail::move_file(staged_binary, binary_path);

        auto size = fs::file_size(binary_path, ec);
        if (ec) {
            throw std::runtime_error("failed to stat {}: {}"_format(binary_path.string(), ec.message()));
        }

        internal::content_hasher source_hasher{};
        source_hasher.update_bytes(key.rendered_source);

        cache_entry entry{
                .hash = hash,
                .binary_path = binary_path,
                .binary_size = size,
                .created_ms = internal::now_epoch_ms(),
                .source_digest = source_hasher.hex(),
                .profile_id = key.profile_id,
                .toolchain_version = key.toolchain_version,
                .target_triple = key.target_triple};

        internal::write_json_file(detail::to_record(entry), entry_path(hash));
        {
            std::unique_lock write{index_mutex_};
            index_.insert_or_assign(hash, entry);
        }
        debug_log("cached ", hash, " -> ", binary_path.string());
        return entry;
    }

    bool build_cache::repair(std::string_view hash) {
        detail::require_valid_hash(hash);
        {
            std::unique_lock write{index_mutex_};
            if (auto it = index_.find(hash); it != index_.end()) {
                index_.erase(it);
            }
        }

        std::error_code ec{};
        auto removed_entry = fs::remove(entry_path(hash), ec);
        if (ec) {
            throw std::runtime_error("failed to remove cache entry {}: {}"_format(hash, ec.message()));
        }
        auto removed_objects = fs::remove_all(objects_dir_ / std::string{hash}, ec);
        if (ec) {
            throw std::runtime_error("failed to remove cache objects for {}: {}"_format(hash, ec.message()));
        }
        debug_log("repaired cache entry ", hash);
        return removed_entry || removed_objects > 0U;
    }

    std::vector<cache_entry> build_cache::entries() const {
        std::shared_lock read{index_mutex_};
        std::vector<cache_entry> out{};
        out.reserve(index_.size());
        for (const auto& [_, entry] : index_) {
            out.push_back(entry);
        }
        return out;
    }

    size_t build_cache::collect_garbage(std::chrono::milliseconds max_age) {
        auto cutoff = internal::now_epoch_ms() - max_age.count();
        std::vector<std::string> stale{};
        for (const auto& entry : entries()) {
            if (entry.created_ms < cutoff) {
                stale.push_back(entry.hash);
            }
        }

        size_t removed = 0U;
        for (const auto& hash : stale) {
            auto guard = lock(hash);
            if (repair(hash)) {
                ++removed;
            }
        }
        debug_log("cache gc removed ", removed, " entries");
        return removed;
    }

    fs::path build_cache::make_staging_dir() const {
        static std::atomic<uint64_t> counter{0U};
        auto dir = staging_dir_ / "job-{}-{}-{}"_format(
                                          ::getpid(),
                                          internal::now_epoch_ms(),
                                          counter.fetch_add(1U, std::memory_order_relaxed));
        detail::ensure_directory(dir);
        return dir;
    }

    build_cache::hash_lock build_cache::lock(const std::string& hash) {
        std::shared_ptr<lock_slot> slot{};
        {
            std::lock_guard table{lock_table_mutex_};
            auto& entry = lock_table_[hash];
            if (!entry) {
                entry = std::make_shared<lock_slot>();
            }
            ++entry->users;
            slot = entry;
        }
        slot->mutex.lock();
        return hash_lock{*this, hash, std::move(slot)};
    }

    void build_cache::release(const std::string& hash, const std::shared_ptr<lock_slot>& slot) {
        slot->mutex.unlock();
        std::lock_guard table{lock_table_mutex_};
        if (--slot->users == 0U) {
            lock_table_.erase(hash);
        }
    }

}  // namespace pivot
