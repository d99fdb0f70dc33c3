#include "strata/timeline/page_cache.hpp"

#include <functional>

namespace strata::timeline {

PageCache::PageCache()
    : PageCache(Config{})
{
}

PageCache::PageCache(Config config)
    : config_{config}
{
}

std::size_t PageCache::CacheKeyHash::operator()(const CacheKey& key) const noexcept
{
    auto hash = TimelineIdHash{}(key.timeline);
    hash ^= storage::KeyHash{}(key.key) + 0x9E3779B97F4A7C15ULL + (hash << 6) + (hash >> 2);
    hash ^= std::hash<std::uint64_t>{}(key.lsn) + 0x9E3779B97F4A7C15ULL + (hash << 6) + (hash >> 2);
    return hash;
}

bool PageCache::lookup(const TimelineId& timeline, const storage::Key& key, std::uint64_t lsn, std::vector<std::byte>& out)
{
    std::lock_guard lock(mutex_);
    const auto it = index_.find(CacheKey{timeline, key, lsn});
    if (it == index_.end()) {
        ++telemetry_.misses;
        return false;
    }
    lru_.splice(lru_.begin(), lru_, it->second);
    out = it->second->page;
    ++telemetry_.hits;
    return true;
}

void PageCache::insert(const TimelineId& timeline, const storage::Key& key, std::uint64_t lsn, const std::vector<std::byte>& page)
{
    if (page.size() > config_.capacity_bytes) {
        return;
    }

    std::lock_guard lock(mutex_);
    CacheKey cache_key{timeline, key, lsn};
    if (const auto it = index_.find(cache_key); it != index_.end()) {
        resident_bytes_ -= it->second->page.size();
        it->second->page = page;
        resident_bytes_ += page.size();
        lru_.splice(lru_.begin(), lru_, it->second);
    } else {
        lru_.push_front(Entry{cache_key, page});
        index_.emplace(cache_key, lru_.begin());
        resident_bytes_ += page.size();
        ++telemetry_.insertions;
    }
    evict_locked();
}

void PageCache::evict_locked()
{
    while (resident_bytes_ > config_.capacity_bytes && !lru_.empty()) {
        auto& victim = lru_.back();
        resident_bytes_ -= victim.page.size();
        index_.erase(victim.key);
        lru_.pop_back();
        ++telemetry_.evictions;
    }
}

void PageCache::forget_timeline(const TimelineId& timeline)
{
    std::lock_guard lock(mutex_);
    for (auto it = lru_.begin(); it != lru_.end();) {
        if (it->key.timeline == timeline) {
            resident_bytes_ -= it->page.size();
            index_.erase(it->key);
            it = lru_.erase(it);
        } else {
            ++it;
        }
    }
}

void PageCache::clear()
{
    std::lock_guard lock(mutex_);
    lru_.clear();
    index_.clear();
    resident_bytes_ = 0U;
}

std::size_t PageCache::capacity_bytes() const noexcept
{
    return config_.capacity_bytes;
}

PageCacheTelemetrySnapshot PageCache::telemetry_snapshot() const
{
    std::lock_guard lock(mutex_);
    auto snapshot = telemetry_;
    snapshot.resident_bytes = resident_bytes_;
    snapshot.resident_entries = lru_.size();
    return snapshot;
}

}  // namespace strata::timeline
