#include "cache/ResolutionCache.hpp"

#include <doctest/doctest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace RS;

namespace {

auto enabledConfig(std::int64_t maxCost) -> CacheConfig {
    CacheConfig config;
    config.enabled     = true;
    config.maxCost     = maxCost;
    config.numCounters = 1024;
    return config;
}

} // namespace

TEST_SUITE("cache.resolution") {
    TEST_CASE("fingerprint separates scope path and merge options") {
        MergeOptions defaults;
        MergeOptions shallow{ObjectStrategy::Shallow, ArrayStrategy::Concat, KeyConflict::Replace};

        auto a = ResolutionCache::fingerprint("local", "a.b", defaults);
        CHECK(a == std::string{"local\x1f" "a.b\x1f" "deep|concat|replace"});
        CHECK(a != ResolutionCache::fingerprint("global", "a.b", defaults));
        CHECK(a != ResolutionCache::fingerprint("local", "a.c", defaults));
        CHECK(a != ResolutionCache::fingerprint("local", "a.b", shallow));
        CHECK(a == ResolutionCache::fingerprint("local", "a.b", MergeOptions{}));
    }

    TEST_CASE("lookup returns the recorded depth") {
        ResolutionCache cache{enabledConfig(1 << 20)};
        CHECK_FALSE(cache.lookup("k").has_value());

        CHECK(cache.set("k", Node{"v"}, 3));
        auto hit = cache.lookup("k");
        REQUIRE(hit.has_value());
        CHECK(hit->value == Node{"v"});
        CHECK(hit->depth == 3);

        CHECK(cache.set("plain", Node{1}));
        CHECK(cache.lookup("plain")->depth == 1);
        CHECK(*cache.get("k") == Node{"v"});
    }

    TEST_CASE("get and set") {
        ResolutionCache cache{enabledConfig(1 << 20)};
        CHECK_FALSE(cache.get("k").has_value());

        Node value{Node::Mapping{{"host", "localhost"}}};
        CHECK(cache.set("k", value));
        auto hit = cache.get("k");
        REQUIRE(hit.has_value());
        CHECK(*hit == value);

        auto stats = cache.stats();
        CHECK(stats.hits == 1);
        CHECK(stats.misses == 1);
        CHECK(stats.admissions == 1);
        CHECK(stats.entries == 1);
        CHECK(stats.cost == value.costEstimate());
    }

    TEST_CASE("overwriting a key keeps cost accurate") {
        ResolutionCache cache{enabledConfig(1 << 20)};
        CHECK(cache.set("k", Node{"short"}));
        CHECK(cache.set("k", Node{std::string(100, 'x')}));
        auto stats = cache.stats();
        CHECK(stats.entries == 1);
        CHECK(stats.cost == Node{std::string(100, 'x')}.costEstimate());
        CHECK(*cache.get("k") == Node{std::string(100, 'x')});
    }

    TEST_CASE("values larger than the budget are rejected") {
        ResolutionCache cache{enabledConfig(50)};
        CHECK_FALSE(cache.set("big", Node{std::string(100, 'x')}));
        CHECK_FALSE(cache.get("big").has_value());
        CHECK(cache.stats().rejections == 1);
    }

    TEST_CASE("cost stays within budget under pressure") {
        // Each value costs 8.
        ResolutionCache cache{enabledConfig(40)};
        for (int i = 0; i < 50; ++i) {
            auto key = "key" + std::to_string(i);
            (void)cache.get(key);
            (void)cache.set(key, Node{i});
            CHECK(cache.stats().cost <= 40);
        }
        auto stats = cache.stats();
        CHECK(stats.entries <= 5);
        CHECK(stats.evictions + stats.rejections > 0);
    }

    TEST_CASE("frequently requested entries survive eviction") {
        ResolutionCache cache{enabledConfig(16)};
        for (int i = 0; i < 20; ++i)
            (void)cache.get("hot");
        CHECK(cache.set("hot", Node{1}));
        CHECK(cache.set("warm", Node{2}));

        // A cold key is requested once; it cannot displace the hot entry.
        (void)cache.get("cold");
        (void)cache.set("cold", Node{3});
        CHECK(cache.get("hot").has_value());
        CHECK(cache.stats().cost <= 16);
    }

    TEST_CASE("clear empties the store") {
        ResolutionCache cache{enabledConfig(1 << 20)};
        CHECK(cache.set("a", Node{1}));
        CHECK(cache.set("b", Node{2}));
        cache.clear();
        CHECK(cache.stats().entries == 0);
        CHECK(cache.stats().cost == 0);
        CHECK_FALSE(cache.get("a").has_value());
    }

    TEST_CASE("concurrent readers and writers") {
        ResolutionCache          cache{enabledConfig(1 << 16)};
        std::atomic<int>         corrupted{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&cache, &corrupted, t] {
                for (int i = 0; i < 200; ++i) {
                    auto key = "k" + std::to_string((i + t) % 32);
                    if (auto found = cache.get(key)) {
                        if (!found->isInteger() || found->asInteger() != (i + t) % 32)
                            ++corrupted;
                    } else {
                        (void)cache.set(key, Node{(i + t) % 32});
                    }
                }
            });
        }
        for (auto& thread : threads)
            thread.join();
        CHECK(corrupted.load() == 0);
        auto stats = cache.stats();
        CHECK(stats.cost <= (1 << 16));
        CHECK(stats.hits + stats.misses == 8 * 200);
    }
}
