#include "strata/storage/inmemory_layer.hpp"

#include "strata/storage/storage_errors.hpp"

#include <mutex>

namespace strata::storage {

namespace {

constexpr std::size_t kEntryOverhead = sizeof(Key) + sizeof(std::uint64_t) + sizeof(PageValue);

}  // namespace

InMemoryLayer::InMemoryLayer(std::uint64_t start_lsn, std::uint64_t sequence)
    : start_lsn_{start_lsn}
    , sequence_{sequence}
    , created_at_{std::chrono::steady_clock::now()}
{
}

LayerDescriptor InMemoryLayer::descriptor() const
{
    LayerDescriptor descriptor{};
    descriptor.kind = LayerKind::InMemory;
    descriptor.key_range = KeyRange::full();
    descriptor.lsn_range = LsnRange{start_lsn_, end_lsn_.load(std::memory_order_acquire)};
    descriptor.sequence = sequence_;
    return descriptor;
}

std::error_code InMemoryLayer::put_value(const Key& key, std::uint64_t lsn, PageValue value)
{
    std::unique_lock lock(mutex_);
    if (frozen_.load(std::memory_order_relaxed)) {
        return make_error_code(StorageErrc::TimelineStopping);
    }
    if (lsn < start_lsn_) {
        return make_error_code(StorageErrc::LsnOutOfOrder);
    }

    auto& versions = values_[key];
    if (!versions.empty() && versions.back().first >= lsn) {
        return make_error_code(StorageErrc::LsnOutOfOrder);
    }

    size_bytes_.fetch_add(value.bytes.size() + kEntryOverhead, std::memory_order_relaxed);
    versions.emplace_back(lsn, std::move(value));
    ++entry_count_;
    return {};
}

void InMemoryLayer::freeze(std::uint64_t end_lsn)
{
    std::unique_lock lock(mutex_);
    end_lsn_.store(end_lsn, std::memory_order_release);
    frozen_.store(true, std::memory_order_release);
}

std::error_code InMemoryLayer::collect_versions(const Key& key,
                                                std::uint64_t max_lsn,
                                                std::vector<VersionedValue>& out) const
{
    std::shared_lock lock(mutex_);
    const auto it = values_.find(key);
    if (it == values_.end()) {
        return {};
    }
    const auto& versions = it->second;
    for (auto version = versions.rbegin(); version != versions.rend(); ++version) {
        if (version->first <= max_lsn) {
            out.push_back(VersionedValue{version->first, version->second});
        }
    }
    return {};
}

std::error_code InMemoryLayer::load_entries(std::vector<LayerEntry>& out) const
{
    std::shared_lock lock(mutex_);
    out.reserve(out.size() + entry_count_);
    for (const auto& [key, versions] : values_) {
        for (const auto& [lsn, value] : versions) {
            out.push_back(LayerEntry{key, lsn, value});
        }
    }
    return {};
}

std::error_code InMemoryLayer::collect_keys(std::uint64_t max_lsn, std::set<Key>& out) const
{
    std::shared_lock lock(mutex_);
    for (const auto& [key, versions] : values_) {
        if (!versions.empty() && versions.front().first <= max_lsn) {
            out.insert(key);
        }
    }
    return {};
}

bool InMemoryLayer::frozen() const noexcept
{
    return frozen_.load(std::memory_order_acquire);
}

bool InMemoryLayer::empty() const
{
    std::shared_lock lock(mutex_);
    return entry_count_ == 0U;
}

std::uint64_t InMemoryLayer::start_lsn() const noexcept
{
    return start_lsn_;
}

std::uint64_t InMemoryLayer::end_lsn() const noexcept
{
    return end_lsn_.load(std::memory_order_acquire);
}

std::uint64_t InMemoryLayer::sequence() const noexcept
{
    return sequence_;
}

std::size_t InMemoryLayer::size_bytes() const noexcept
{
    return size_bytes_.load(std::memory_order_relaxed);
}

std::size_t InMemoryLayer::entry_count() const
{
    std::shared_lock lock(mutex_);
    return entry_count_;
}

std::chrono::steady_clock::time_point InMemoryLayer::created_at() const noexcept
{
    return created_at_;
}

}  // namespace strata::storage
