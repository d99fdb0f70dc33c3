#include "strata/timeline/wal_ingest.hpp"

#include "strata/storage/storage_errors.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <optional>
#include <stdexcept>

namespace strata::timeline {

WalIngest::WalIngest(std::shared_ptr<Timeline> timeline, std::uint64_t start_lsn)
    : timeline_{std::move(timeline)}
    , decoder_{start_lsn}
{
    if (!timeline_) {
        throw std::invalid_argument{"WalIngest requires a timeline"};
    }
    skip_through_lsn_ = timeline_->last_record_lsn();
    commit_lsn_ = start_lsn;
}

std::error_code WalIngest::feed(std::span<const std::byte> bytes)
{
    stats_.bytes_received += bytes.size();
    decoder_.feed_bytes(bytes);

    while (true) {
        std::optional<storage::WalRecord> record;
        if (auto ec = decoder_.poll_decode(record); ec) {
            timeline_->mark_broken(ec, decoder_.next_lsn());
            return ec;
        }
        if (!record) {
            return {};
        }
        ++stats_.records_decoded;

        if (record->lsn <= skip_through_lsn_) {
            ++stats_.records_skipped;
            continue;
        }
        if (auto ec = timeline_->ingest(*record); ec) {
            return ec;
        }
        ++stats_.records_ingested;

        if ((record->flags & storage::WalRecordFlag::Commit) == storage::WalRecordFlag::Commit) {
            commit(record->lsn);
        }
    }
}

void WalIngest::commit(std::uint64_t lsn) noexcept
{
    commit_lsn_ = std::max(commit_lsn_, lsn);
}

std::uint64_t WalIngest::commit_lsn() const noexcept
{
    return commit_lsn_;
}

std::uint64_t WalIngest::decoded_lsn() const noexcept
{
    return decoder_.next_lsn();
}

const WalIngestStats& WalIngest::stats() const noexcept
{
    return stats_;
}

}  // namespace strata::timeline
