#include "strata/timeline/wal_ingest.hpp"

#include "strata/storage/storage_errors.hpp"
#include "timeline_test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <stdexcept>

namespace strata::timeline::tests {

using storage::Key;
using storage::StorageErrc;

namespace {

// Encodes a stream of increments to block 0 after an initial image, returning
// the bytes and the end LSN of every record.
std::vector<std::byte> build_stream(std::size_t records, std::vector<std::uint64_t>& end_lsns)
{
    std::vector<std::byte> stream;
    for (std::size_t index = 0; index < records; ++index) {
        auto record = index == 0U ? image_record(0U, Key::from_block(0U), 10U) : add_record(0U, Key::from_block(0U), 1U);
        if (index % 4U == 3U) {
            record.flags = storage::WalRecordFlag::Commit;
        }
        const auto bytes = storage::encode_wal_record(record);
        stream.insert(stream.end(), bytes.begin(), bytes.end());
        end_lsns.push_back(stream.size());
    }
    return stream;
}

}  // namespace

TEST_CASE("WalIngest decodes a chunked stream into the timeline", "[wal_ingest]")
{
    TimelineHarness harness{"strata_wal_ingest_"};
    auto timeline = harness.create_root();
    REQUIRE(timeline);

    std::vector<std::uint64_t> end_lsns;
    const auto stream = build_stream(10U, end_lsns);

    WalIngest ingest{timeline, 0U};
    for (std::size_t offset = 0; offset < stream.size(); offset += 13U) {
        const auto length = std::min<std::size_t>(13U, stream.size() - offset);
        REQUIRE_FALSE(ingest.feed(std::span<const std::byte>{stream}.subspan(offset, length)));
    }

    CHECK(ingest.stats().records_decoded == 10U);
    CHECK(ingest.stats().records_ingested == 10U);
    CHECK(ingest.stats().bytes_received == stream.size());
    CHECK(ingest.decoded_lsn() == stream.size());
    CHECK(timeline->last_record_lsn() == end_lsns.back());
    CHECK(timeline->prev_record_lsn() == end_lsns[8]);
    CHECK(ingest.commit_lsn() == end_lsns[7]);

    std::error_code ec;
    CHECK(read_u64(*timeline, Key::from_block(0U), end_lsns.back(), ec) == 19U);
    CHECK(read_u64(*timeline, Key::from_block(0U), end_lsns[4], ec) == 14U);
    CHECK_FALSE(ec);

    ingest.commit(end_lsns[9]);
    CHECK(ingest.commit_lsn() == end_lsns[9]);
    ingest.commit(end_lsns[0]);
    CHECK(ingest.commit_lsn() == end_lsns[9]);
}

TEST_CASE("WalIngest skips records replayed after a restart", "[wal_ingest]")
{
    TimelineHarness harness{"strata_wal_ingest_replay_"};
    auto timeline = harness.create_root();
    REQUIRE(timeline);

    std::vector<std::uint64_t> end_lsns;
    const auto stream = build_stream(8U, end_lsns);
    const auto split = static_cast<std::size_t>(end_lsns[4]);

    {
        WalIngest ingest{timeline, 0U};
        REQUIRE_FALSE(ingest.feed(std::span<const std::byte>{stream}.first(split)));
    }
    REQUIRE_FALSE(timeline->checkpoint());

    auto loaded = harness.restart(timeline);
    REQUIRE(loaded);
    REQUIRE(loaded->resume_lsn() == end_lsns[4]);

    // The source resends from the start of the segment.
    WalIngest replay{loaded, 0U};
    REQUIRE_FALSE(replay.feed(stream));
    CHECK(replay.stats().records_skipped == 5U);
    CHECK(replay.stats().records_ingested == 3U);
    CHECK(loaded->last_record_lsn() == end_lsns.back());

    std::error_code ec;
    CHECK(read_u64(*loaded, Key::from_block(0U), end_lsns.back(), ec) == 17U);
    CHECK_FALSE(ec);
}

TEST_CASE("Corrupt WAL bytes break the timeline", "[wal_ingest]")
{
    TimelineHarness harness{"strata_wal_ingest_corrupt_"};
    auto timeline = harness.create_root();
    REQUIRE(timeline);

    std::vector<std::uint64_t> end_lsns;
    auto stream = build_stream(3U, end_lsns);
    stream[static_cast<std::size_t>(end_lsns[1]) + 40U] ^= std::byte{0x5A};

    WalIngest ingest{timeline, 0U};
    CHECK(ingest.feed(stream) == StorageErrc::CorruptWalRecord);
    CHECK(timeline->state() == TimelineState::Broken);
    CHECK(timeline->last_record_lsn() == end_lsns[1]);
    CHECK(ingest.feed(stream) == StorageErrc::CorruptWalRecord);
}

TEST_CASE("WalIngest requires a timeline", "[wal_ingest]")
{
    CHECK_THROWS_AS((WalIngest{nullptr, 0U}), std::invalid_argument);
}

}  // namespace strata::timeline::tests
