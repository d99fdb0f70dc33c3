#pragma once

#include "strata/storage/layer.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace strata::storage {

// The mutable head of a timeline. One writer appends, any number of readers
// query concurrently. Once frozen the layer accepts no more values and its
// end LSN is fixed.
class InMemoryLayer final : public Layer {
public:
    InMemoryLayer(std::uint64_t start_lsn, std::uint64_t sequence);

    InMemoryLayer(const InMemoryLayer&) = delete;
    InMemoryLayer& operator=(const InMemoryLayer&) = delete;

    [[nodiscard]] LayerDescriptor descriptor() const override;
    [[nodiscard]] std::error_code collect_versions(const Key& key,
                                                  std::uint64_t max_lsn,
                                                  std::vector<VersionedValue>& out) const override;
    [[nodiscard]] std::error_code load_entries(std::vector<LayerEntry>& out) const override;
    [[nodiscard]] std::error_code collect_keys(std::uint64_t max_lsn, std::set<Key>& out) const override;

    [[nodiscard]] bool is_in_memory() const noexcept override
    {
        return true;
    }

    // Fails with LsnOutOfOrder when `lsn` is not above the key's newest version
    // or below the layer start; with TimelineStopping once frozen.
    [[nodiscard]] std::error_code put_value(const Key& key, std::uint64_t lsn, PageValue value);

    void freeze(std::uint64_t end_lsn);

    [[nodiscard]] bool frozen() const noexcept;
    [[nodiscard]] bool empty() const;
    [[nodiscard]] std::uint64_t start_lsn() const noexcept;
    [[nodiscard]] std::uint64_t end_lsn() const noexcept;
    [[nodiscard]] std::uint64_t sequence() const noexcept;
    [[nodiscard]] std::size_t size_bytes() const noexcept;
    [[nodiscard]] std::size_t entry_count() const;
    [[nodiscard]] std::chrono::steady_clock::time_point created_at() const noexcept;

private:
    std::uint64_t start_lsn_ = 0U;
    std::uint64_t sequence_ = 0U;
    std::chrono::steady_clock::time_point created_at_{};

    mutable std::shared_mutex mutex_{};
    std::map<Key, std::vector<std::pair<std::uint64_t, PageValue>>> values_{};
    std::size_t entry_count_ = 0U;
    std::atomic<std::size_t> size_bytes_{0U};
    std::atomic_bool frozen_{false};
    std::atomic<std::uint64_t> end_lsn_{kMaxLsn};
};

}  // namespace strata::storage
