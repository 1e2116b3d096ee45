#include "utils.hpp"

namespace pivot::test {
    using namespace std::string_view_literals;

    namespace detail {
        static cache_key sample_key() {
            return cache_key{
                    .rendered_source = "double calculate(double x) { return x * 2.0; }\n",
                    .profile_id = "balanced",
                    .toolchain_version = "clang 18.1.3",
                    .target_triple = "x86_64-unknown-linux-gnu"};
        }

        static fs::path stage_binary(build_cache& cache, std::string_view name, std::string_view content) {
            auto path = cache.make_staging_dir() / std::string{name};
            write_text_file(path, content);
            return path;
        }
    }  // namespace detail

    TEST_CASE("004: content hash is stable and sensitive to every key field", "[004][cache][hash]") {
        auto key = detail::sample_key();
        auto hash = content_hash(key);
        CHECK(hash.size() == 16U);
        CHECK(std::ranges::all_of(hash, [](char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); }));
        CHECK(content_hash(detail::sample_key()) == hash);

        auto source = key;
        source.rendered_source += " ";
        CHECK(content_hash(source) != hash);

        auto profile = key;
        profile.profile_id = "aggressive";
        CHECK(content_hash(profile) != hash);

        auto toolchain = key;
        toolchain.toolchain_version = "clang 18.1.4";
        CHECK(content_hash(toolchain) != hash);

        auto triple = key;
        triple.target_triple = "aarch64-unknown-linux-gnu";
        CHECK(content_hash(triple) != hash);
    }

    TEST_CASE("004: adjacent key fields cannot alias", "[004][cache][hash]") {
        cache_key left{.rendered_source = "ab", .profile_id = "c"};
        cache_key right{.rendered_source = "a", .profile_id = "bc"};
        CHECK(content_hash(left) != content_hash(right));

        internal::content_hasher a{};
        a.update_field("x", "yz");
        internal::content_hasher b{};
        b.update_field("xy", "z");
        CHECK(a.value() != b.value());

        internal::content_hasher empty{};
        CHECK(empty.value() == internal::content_hasher::offset_basis);
        CHECK(empty.hex() == "cbf29ce484222325");
    }

    TEST_CASE("004: insert, lookup and verify", "[004][cache]") {
        detail::temp_dir tmp{"pivot_004_insert"};
        build_cache cache{tmp.path / "cache"};
        CHECK(fs::is_directory(tmp.path / "cache" / "entries"));
        CHECK(fs::is_directory(tmp.path / "cache" / "objects"));
        CHECK(fs::is_directory(tmp.path / "cache" / "staging"));

        auto key = detail::sample_key();
        auto hash = content_hash(key);
        CHECK_FALSE(cache.lookup(hash));

        auto staged = detail::stage_binary(cache, "calculate", "binary-bytes");
        auto entry = cache.insert(hash, key, staged);
        CHECK(entry.hash == hash);
        CHECK(entry.binary_size == 12U);
        CHECK(entry.profile_id == "balanced");
        CHECK(entry.toolchain_version == "clang 18.1.3");
        CHECK(entry.binary_path.filename() == "calculate");
        CHECK(fs::exists(entry.binary_path));
        CHECK_FALSE(fs::exists(staged));
        CHECK(fs::exists(tmp.path / "cache" / "entries" / (hash + ".json")));

        auto found = cache.lookup(hash);
        REQUIRE(found);
        CHECK(found->binary_path == entry.binary_path);
        CHECK(cache.verify(*found));

        SECTION("a second insert keeps the first entry") {
            auto again = detail::stage_binary(cache, "calculate", "different bytes");
            auto second = cache.insert(hash, key, again);
            CHECK(second.binary_path == entry.binary_path);
            CHECK(second.binary_size == 12U);
            CHECK(second.created_ms == entry.created_ms);
            CHECK_FALSE(fs::exists(again));
            CHECK(cache.entries().size() == 1U);
        }

        SECTION("entries survive reopening the cache") {
            build_cache reopened{tmp.path / "cache"};
            auto listed = reopened.entries();
            REQUIRE(listed.size() == 1U);
            CHECK(listed[0].hash == hash);
            CHECK(listed[0].source_digest == entry.source_digest);
            CHECK(reopened.verify(listed[0]));
        }
    }

    TEST_CASE("004: corrupt entries are detected and repaired", "[004][cache][repair]") {
        detail::temp_dir tmp{"pivot_004_corrupt"};
        build_cache cache{tmp.path};
        auto key = detail::sample_key();
        auto hash = content_hash(key);
        auto entry = cache.insert(hash, key, detail::stage_binary(cache, "calculate", "binary-bytes"));

        SECTION("truncated binary") {
            detail::write_text_file(entry.binary_path, "bin");
            auto found = cache.lookup(hash);
            REQUIRE(found);
            CHECK_FALSE(cache.verify(*found));

            auto staged = detail::stage_binary(cache, "calculate", "binary-bytes");
            CHECK_THROWS_AS(cache.insert(hash, key, staged), std::runtime_error);
            CHECK(cache.repair(hash));
            CHECK_FALSE(cache.lookup(hash));

            auto fresh = cache.insert(hash, key, staged);
            CHECK(cache.verify(fresh));
        }

        SECTION("missing binary") {
            fs::remove(entry.binary_path);
            auto found = cache.lookup(hash);
            REQUIRE(found);
            CHECK_FALSE(cache.verify(*found));
        }

        SECTION("unparseable entry file") {
            detail::write_text_file(tmp.path / "entries" / (hash + ".json"), "{not json");
            build_cache reopened{tmp.path};
            auto found = reopened.lookup(hash);
            REQUIRE(found);
            CHECK(found->binary_path.empty());
            CHECK_FALSE(reopened.verify(*found));
            CHECK(reopened.repair(hash));
            CHECK_FALSE(fs::exists(tmp.path / "entries" / (hash + ".json")));
        }

        CHECK_FALSE(cache.repair("0000000000000000"));
    }

    TEST_CASE("004: invalid hashes are rejected", "[004][cache]") {
        detail::temp_dir tmp{"pivot_004_invalid"};
        build_cache cache{tmp.path};
        CHECK_THROWS_AS(cache.lookup("abc"), std::invalid_argument);
        CHECK_THROWS_AS(cache.lookup("../../etc/passwd"), std::invalid_argument);
        CHECK_THROWS_AS(cache.lookup("ABCDEF0123456789"), std::invalid_argument);
        CHECK_THROWS_AS(cache.repair("zzzzzzzzzzzzzzzz"), std::invalid_argument);
    }

    TEST_CASE("004: garbage collection removes stale entries", "[004][cache][gc]") {
        detail::temp_dir tmp{"pivot_004_gc"};
        build_cache cache{tmp.path};
        auto key = detail::sample_key();
        auto hash = content_hash(key);
        auto entry = cache.insert(hash, key, detail::stage_binary(cache, "calculate", "binary-bytes"));

        CHECK(cache.collect_garbage(std::chrono::hours{1}) == 0U);
        CHECK(cache.lookup(hash));

        std::this_thread::sleep_for(std::chrono::milliseconds{5});
        CHECK(cache.collect_garbage(std::chrono::milliseconds{0}) == 1U);
        CHECK_FALSE(cache.lookup(hash));
        CHECK_FALSE(fs::exists(entry.binary_path));
        CHECK(cache.entries().empty());
    }

    TEST_CASE("004: hash locks serialize holders of the same hash", "[004][cache][concurrency]") {
        detail::temp_dir tmp{"pivot_004_lock"};
        build_cache cache{tmp.path};
        auto hash = content_hash(detail::sample_key());

        std::atomic<int> inside{0};
        std::atomic<int> max_inside{0};
        std::vector<std::thread> threads{};
        for (int i = 0; i < 4; ++i) {
            threads.emplace_back([&] {
                for (int round = 0; round < 10; ++round) {
                    auto guard = cache.lock(hash);
                    auto now = inside.fetch_add(1) + 1;
                    auto seen = max_inside.load();
                    while (now > seen && !max_inside.compare_exchange_weak(seen, now)) {
                    }
                    std::this_thread::sleep_for(std::chrono::microseconds{200});
                    inside.fetch_sub(1);
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        CHECK(max_inside.load() == 1);

        auto first = cache.lock(hash);
        CHECK(first.hash() == hash);
        auto other = cache.lock("0123456789abcdef");
        CHECK(other.hash() == "0123456789abcdef");
    }

}  // namespace pivot::test
