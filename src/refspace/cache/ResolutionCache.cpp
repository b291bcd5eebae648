#include "ResolutionCache.hpp"

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <functional>
#include <limits>

namespace RS {

namespace {

constexpr char kFieldSeparator = '\x1f';

// Row seeds for the count-min sketch.
constexpr std::uint64_t kSeeds[] = {0x9E3779B97F4A7C15ull, 0xC2B2AE3D27D4EB4Full, 0x165667B19E3779F9ull, 0x27D4EB2F165667C5ull};

auto mix(std::uint64_t hash, std::uint64_t seed) -> std::uint64_t {
    hash ^= seed;
    hash ^= hash >> 33;
    hash *= 0xff51afd7ed558ccdull;
    hash ^= hash >> 33;
    hash *= 0xc4ceb9fe1a85ec53ull;
    hash ^= hash >> 33;
    return hash;
}

} // namespace

ResolutionCache::ResolutionCache(CacheConfig config)
    : cfg(config),
      sketchWidth(std::max<std::size_t>(config.numCounters / SketchDepth, 64)),
      sketch(std::make_unique<std::atomic<std::uint8_t>[]>(sketchWidth * SketchDepth)),
      resetInterval(std::max<std::uint64_t>(config.numCounters, 1024) * 10) {
    if (this->cfg.sampleSize == 0)
        this->cfg.sampleSize = 1;
}

auto ResolutionCache::fingerprint(std::string_view scopeKind, std::string_view canonicalPath, MergeOptions const& options) -> std::string {
    std::string key;
    key.reserve(scopeKind.size() + canonicalPath.size() + 32);
    key.append(scopeKind);
    key.push_back(kFieldSeparator);
    key.append(canonicalPath);
    key.push_back(kFieldSeparator);
    key.append(canonicalString(options));
    return key;
}

auto ResolutionCache::get(std::string const& key) -> std::optional<Node> {
    auto found = this->lookup(key);
    if (!found)
        return std::nullopt;
    return std::move(found->value);
}

auto ResolutionCache::lookup(std::string const& key) -> std::optional<CachedTarget> {
    this->recordAccess(key);
    std::optional<CachedTarget> found;
    this->entries.if_contains(key, [&found](auto const& slot) { found = slot.second.target; });
    if (found) {
        this->hits.fetch_add(1, std::memory_order_relaxed);
        rs_log("Cache hit " + key, "Cache");
    } else {
        this->misses.fetch_add(1, std::memory_order_relaxed);
    }
    return found;
}

auto ResolutionCache::set(std::string const& key, Node const& value, std::size_t depth) -> bool {
    auto const cost = value.costEstimate();
    if (cost > this->cfg.maxCost) {
        this->rejections.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    std::lock_guard<std::mutex> lock(this->writeMutex);

    std::int64_t previousCost = 0;
    bool const   existed      = this->entries.if_contains(key, [&previousCost](auto const& slot) { previousCost = slot.second.cost; });
    if (existed) {
        this->entries.erase(key);
        this->totalCost.fetch_sub(previousCost, std::memory_order_relaxed);
        std::erase(this->insertionOrder, key);
    }

    if (!this->makeRoom(key, cost)) {
        this->rejections.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    this->entries.emplace(key, Entry{CachedTarget{value, depth}, cost});
    this->insertionOrder.push_back(key);
    this->totalCost.fetch_add(cost, std::memory_order_relaxed);
    this->admissions.fetch_add(1, std::memory_order_relaxed);
    return true;
}

auto ResolutionCache::makeRoom(std::string const& key, std::int64_t cost) -> bool {
    auto const incoming = this->frequency(key);
    while (this->totalCost.load(std::memory_order_relaxed) + cost > this->cfg.maxCost) {
        if (this->insertionOrder.empty())
            return false;

        auto const     sampled   = std::min(this->cfg.sampleSize, this->insertionOrder.size());
        std::size_t    victim    = 0;
        std::uint32_t  victimHit = std::numeric_limits<std::uint32_t>::max();
        for (std::size_t i = 0; i < sampled; ++i) {
            auto const hitCount = this->frequency(this->insertionOrder[i]);
            if (hitCount < victimHit) {
                victim    = i;
                victimHit = hitCount;
            }
        }
        if (incoming < victimHit)
            return false;

        auto const   victimKey  = this->insertionOrder[victim];
        std::int64_t victimCost = 0;
        this->entries.if_contains(victimKey, [&victimCost](auto const& slot) { victimCost = slot.second.cost; });
        this->entries.erase(victimKey);
        this->insertionOrder.erase(this->insertionOrder.begin() + static_cast<std::ptrdiff_t>(victim));
        this->totalCost.fetch_sub(victimCost, std::memory_order_relaxed);
        this->evictions.fetch_add(1, std::memory_order_relaxed);
        rs_log("Cache evicted " + victimKey, "Cache");
    }
    return true;
}

auto ResolutionCache::recordAccess(std::string_view key) -> void {
    auto const hash = std::hash<std::string_view>{}(key);
    for (std::size_t row = 0; row < SketchDepth; ++row) {
        auto& counter = this->sketch[row * this->sketchWidth + mix(hash, kSeeds[row]) % this->sketchWidth];
        auto  current = counter.load(std::memory_order_relaxed);
        while (current < std::numeric_limits<std::uint8_t>::max() && !counter.compare_exchange_weak(current, static_cast<std::uint8_t>(current + 1), std::memory_order_relaxed)) {
        }
    }
    if (this->accessCount.fetch_add(1, std::memory_order_relaxed) + 1 == this->resetInterval) {
        this->age();
    }
}

auto ResolutionCache::frequency(std::string_view key) const -> std::uint32_t {
    auto const    hash = std::hash<std::string_view>{}(key);
    std::uint32_t low  = std::numeric_limits<std::uint32_t>::max();
    for (std::size_t row = 0; row < SketchDepth; ++row) {
        auto const value = this->sketch[row * this->sketchWidth + mix(hash, kSeeds[row]) % this->sketchWidth].load(std::memory_order_relaxed);
        low              = std::min<std::uint32_t>(low, value);
    }
    return low;
}

// Halves every counter so that old popularity decays.
auto ResolutionCache::age() -> void {
    for (std::size_t i = 0; i < this->sketchWidth * SketchDepth; ++i) {
        auto& counter = this->sketch[i];
        counter.store(static_cast<std::uint8_t>(counter.load(std::memory_order_relaxed) >> 1), std::memory_order_relaxed);
    }
    this->accessCount.store(0, std::memory_order_relaxed);
}

auto ResolutionCache::clear() -> void {
    std::lock_guard<std::mutex> lock(this->writeMutex);
    this->entries.clear();
    this->insertionOrder.clear();
    this->totalCost.store(0, std::memory_order_relaxed);
}

auto ResolutionCache::stats() const -> CacheStats {
    return CacheStats{.hits       = this->hits.load(std::memory_order_relaxed),
                      .misses     = this->misses.load(std::memory_order_relaxed),
                      .admissions = this->admissions.load(std::memory_order_relaxed),
                      .rejections = this->rejections.load(std::memory_order_relaxed),
                      .evictions  = this->evictions.load(std::memory_order_relaxed),
                      .cost       = this->totalCost.load(std::memory_order_relaxed),
                      .entries    = this->entries.size()};
}

} // namespace RS
