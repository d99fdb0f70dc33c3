#pragma once

#include "strata/storage/wal_codec.hpp"
#include "strata/timeline/timeline.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <system_error>

namespace strata::timeline {

struct WalIngestStats final {
    std::uint64_t records_decoded = 0U;
    std::uint64_t records_ingested = 0U;
    std::uint64_t records_skipped = 0U;
    std::uint64_t bytes_received = 0U;
};

// Feeds a raw WAL byte stream into a timeline. The stream starts at
// `start_lsn`; records the timeline already holds (a replay overlap after
// restart) are skipped, anything else out of order breaks the timeline.
class WalIngest final {
public:
    WalIngest(std::shared_ptr<Timeline> timeline, std::uint64_t start_lsn);

    [[nodiscard]] std::error_code feed(std::span<const std::byte> bytes);
    // Durable position reported by the WAL source.
    void commit(std::uint64_t lsn) noexcept;

    [[nodiscard]] std::uint64_t commit_lsn() const noexcept;
    [[nodiscard]] std::uint64_t decoded_lsn() const noexcept;
    [[nodiscard]] const WalIngestStats& stats() const noexcept;

private:
    std::shared_ptr<Timeline> timeline_{};
    storage::WalStreamDecoder decoder_;
    std::uint64_t skip_through_lsn_ = 0U;
    std::uint64_t commit_lsn_ = 0U;
    WalIngestStats stats_{};
};

}  // namespace strata::timeline
