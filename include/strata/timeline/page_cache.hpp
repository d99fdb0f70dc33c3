#pragma once

#include "strata/storage/key.hpp"
#include "strata/timeline/timeline_id.hpp"

#include <cstddef>
#include <cstdint>
#include <list>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace strata::timeline {

struct PageCacheTelemetrySnapshot final {
    std::uint64_t hits = 0U;
    std::uint64_t misses = 0U;
    std::uint64_t insertions = 0U;
    std::uint64_t evictions = 0U;
    std::uint64_t resident_bytes = 0U;
    std::uint64_t resident_entries = 0U;
};

// LRU memo of reconstructed pages shared by all timelines, bounded in bytes.
class PageCache final {
public:
    struct Config final {
        std::size_t capacity_bytes = 64U * 1024U * 1024U;
    };

    PageCache();
    explicit PageCache(Config config);

    PageCache(const PageCache&) = delete;
    PageCache& operator=(const PageCache&) = delete;

    [[nodiscard]] bool lookup(const TimelineId& timeline, const storage::Key& key, std::uint64_t lsn, std::vector<std::byte>& out);
    void insert(const TimelineId& timeline, const storage::Key& key, std::uint64_t lsn, const std::vector<std::byte>& page);
    void forget_timeline(const TimelineId& timeline);
    void clear();

    [[nodiscard]] std::size_t capacity_bytes() const noexcept;
    [[nodiscard]] PageCacheTelemetrySnapshot telemetry_snapshot() const;

private:
    struct CacheKey final {
        TimelineId timeline{};
        storage::Key key{};
        std::uint64_t lsn = 0U;

        bool operator==(const CacheKey&) const = default;
    };

    struct CacheKeyHash final {
        std::size_t operator()(const CacheKey& key) const noexcept;
    };

    struct Entry final {
        CacheKey key{};
        std::vector<std::byte> page{};
    };

    using EntryList = std::list<Entry>;

    void evict_locked();

    Config config_{};
    mutable std::mutex mutex_{};
    EntryList lru_{};
    std::unordered_map<CacheKey, EntryList::iterator, CacheKeyHash> index_{};
    std::size_t resident_bytes_ = 0U;
    PageCacheTelemetrySnapshot telemetry_{};
};

}  // namespace strata::timeline
