#pragma once
#include "core/Node.hpp"
#include "merge/MergeOptions.hpp"
#include "path/TransparentString.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <parallel_hashmap/phmap.h>

namespace RS {

struct CacheConfig {
    bool          enabled     = false;
    std::int64_t  maxCost     = std::int64_t{100} << 20;
    std::size_t   numCounters = 1'000'000;
    std::size_t   sampleSize  = 5;
};

struct CacheStats {
    std::uint64_t hits       = 0;
    std::uint64_t misses     = 0;
    std::uint64_t admissions = 0;
    std::uint64_t rejections = 0;
    std::uint64_t evictions  = 0;
    std::int64_t  cost       = 0;
    std::size_t   entries    = 0;
};

// A cached target and the number of reference levels its evaluation needed,
// counting the reference itself.
struct CachedTarget {
    Node        value;
    std::size_t depth = 1;
};

/**
 * Cost-bounded memo of evaluated reference targets.
 *
 * Keys are exact fingerprints, see fingerprint(). Values are copied in and
 * out. Reads go through the sharded map's own locks; writes are serialised so
 * that cost accounting and eviction stay consistent.
 *
 * Admission and eviction follow a TinyLFU-like scheme: a count-min sketch
 * tracks how often keys are requested, and when the store is full the least
 * frequently requested of the `sampleSize` oldest entries is evicted, unless
 * the incoming key is requested even less often, in which case it is rejected.
 */
class ResolutionCache {
public:
    explicit ResolutionCache(CacheConfig config);

    // kind \x1f canonical-path \x1f object|array|conflict
    [[nodiscard]] static auto fingerprint(std::string_view scopeKind, std::string_view canonicalPath, MergeOptions const& options) -> std::string;

    [[nodiscard]] auto get(std::string const& key) -> std::optional<Node>;
    [[nodiscard]] auto lookup(std::string const& key) -> std::optional<CachedTarget>;
    // Returns whether the value was stored.
    auto set(std::string const& key, Node const& value, std::size_t depth = 1) -> bool;
    auto clear() -> void;

    [[nodiscard]] auto stats() const -> CacheStats;
    [[nodiscard]] auto config() const -> CacheConfig const& { return this->cfg; }

private:
    struct Entry {
        CachedTarget target;
        std::int64_t cost = 0;
    };

    static constexpr std::size_t SketchDepth = 4;

    using Map = phmap::parallel_flat_hash_map<std::string,
                                              Entry,
                                              TransparentStringHash,
                                              std::equal_to<>,
                                              std::allocator<std::pair<const std::string, Entry>>,
                                              4,
                                              std::mutex>;

    auto recordAccess(std::string_view key) -> void;
    [[nodiscard]] auto frequency(std::string_view key) const -> std::uint32_t;
    auto makeRoom(std::string const& key, std::int64_t cost) -> bool;
    auto age() -> void;

    CacheConfig cfg;
    Map         entries;

    std::size_t                                sketchWidth;
    std::unique_ptr<std::atomic<std::uint8_t>[]> sketch;
    std::atomic<std::uint64_t>                 accessCount{0};
    std::uint64_t                              resetInterval;

    std::mutex              writeMutex;
    std::deque<std::string> insertionOrder;

    std::atomic<std::int64_t>  totalCost{0};
    std::atomic<std::uint64_t> hits{0};
    std::atomic<std::uint64_t> misses{0};
    std::atomic<std::uint64_t> admissions{0};
    std::atomic<std::uint64_t> rejections{0};
    std::atomic<std::uint64_t> evictions{0};
};

} // namespace RS
