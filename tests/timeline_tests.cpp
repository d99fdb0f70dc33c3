#include "strata/timeline/timeline.hpp"

#include "strata/storage/storage_errors.hpp"
#include "strata/timeline/compaction.hpp"
#include "timeline_test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <fstream>
#include <map>
#include <random>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

namespace strata::timeline::tests {

using storage::Key;
using storage::StorageErrc;

TEST_CASE("Timeline reads page versions over an imported image", "[timeline]")
{
    TimelineHarness harness{"strata_timeline_import_"};
    auto timeline = harness.create_root();
    REQUIRE(timeline);

    const auto key = Key::from_block(42U);
    REQUIRE_FALSE(timeline->import_images({{key, storage::encode_u64_page(10U)}}, 0U));
    CHECK(timeline->last_record_lsn() == 0U);
    CHECK(timeline->disk_consistent_lsn() == 0U);

    REQUIRE_FALSE(timeline->ingest(add_record(100U, key, 5U)));

    std::error_code ec;
    CHECK(read_u64(*timeline, key, 100U, ec) == 15U);
    CHECK_FALSE(ec);
    CHECK(read_u64(*timeline, key, 50U, ec) == 10U);
    CHECK_FALSE(ec);
    CHECK(read_u64(*timeline, key, 0U, ec) == 10U);
    CHECK_FALSE(ec);

    (void)read_u64(*timeline, key, 101U, ec);
    CHECK(ec == StorageErrc::LsnInFuture);
    (void)read_u64(*timeline, Key::from_block(43U), 100U, ec);
    CHECK(ec == StorageErrc::NoCoveringLayer);

    std::vector<std::byte> page;
    REQUIRE_FALSE(timeline->get_page_latest(key, page));
    CHECK(storage::decode_u64_page(page) == 15U);
}

TEST_CASE("Timeline refuses imports once it holds data", "[timeline]")
{
    TimelineHarness harness{"strata_timeline_import_twice_"};
    auto timeline = harness.create_root();
    REQUIRE(timeline);

    REQUIRE_FALSE(timeline->ingest(image_record(10U, Key::from_block(1U), 1U)));
    CHECK(timeline->import_images({{Key::from_block(2U), storage::encode_u64_page(2U)}}, 20U)
          == std::errc::operation_not_permitted);
}

TEST_CASE("Missing base versions are reported", "[timeline]")
{
    TimelineHarness harness{"strata_timeline_missing_base_"};
    auto timeline = harness.create_root();
    REQUIRE(timeline);

    REQUIRE_FALSE(timeline->ingest(add_record(10U, Key::from_block(1U), 1U)));
    std::error_code ec;
    (void)read_u64(*timeline, Key::from_block(1U), 10U, ec);
    CHECK(ec == StorageErrc::MissingBaseImage);
}

TEST_CASE("Flushed layers and LSNs survive a restart", "[timeline]")
{
    TimelineHarness harness{"strata_timeline_restart_"};
    auto timeline = harness.create_root();
    REQUIRE(timeline);

    const auto key = Key::from_block(1U);
    REQUIRE_FALSE(timeline->ingest(image_record(10U, key, 1U)));
    REQUIRE_FALSE(timeline->ingest(add_record(50U, key, 2U)));
    REQUIRE_FALSE(timeline->ingest(add_record(99U, key, 3U)));
    REQUIRE_FALSE(timeline->checkpoint());

    auto snapshot = timeline->layers();
    REQUIRE(snapshot->historic_layers().size() == 1U);
    const auto descriptor = snapshot->historic_layers().front()->descriptor();
    CHECK(descriptor.kind == storage::LayerKind::Delta);
    CHECK(descriptor.lsn_range == storage::LsnRange{0U, 100U});
    CHECK(snapshot->open_layer()->start_lsn() == 100U);
    CHECK(snapshot->frozen_layers().empty());
    CHECK(timeline->disk_consistent_lsn() == 99U);
    CHECK(timeline->resume_lsn() == 99U);

    const auto before = timeline->manifest();
    CHECK(before.prev_record_lsn == 50U);

    // Leftovers from an interrupted write are cleaned up on load.
    const auto directory = timeline->directory();
    std::ofstream{directory / "partial.tmp"} << "x";
    auto orphan = descriptor;
    orphan.sequence += 100U;
    std::ofstream{directory / orphan.file_name()} << "x";

    auto loaded = harness.restart(timeline);
    REQUIRE(loaded);
    const auto after = loaded->manifest();
    CHECK(after.layers == before.layers);
    CHECK(after.disk_consistent_lsn == before.disk_consistent_lsn);
    CHECK(after.prev_record_lsn == before.prev_record_lsn);
    CHECK(after.gc_cutoff_lsn == before.gc_cutoff_lsn);
    CHECK(loaded->last_record_lsn() == 99U);
    CHECK(loaded->prev_record_lsn() == 50U);
    CHECK(loaded->layers()->open_layer()->start_lsn() == 100U);
    CHECK_FALSE(std::filesystem::exists(directory / "partial.tmp"));
    CHECK_FALSE(std::filesystem::exists(directory / orphan.file_name()));

    std::error_code ec;
    CHECK(read_u64(*loaded, key, 99U, ec) == 6U);
    CHECK(read_u64(*loaded, key, 60U, ec) == 3U);
    CHECK_FALSE(ec);

    REQUIRE_FALSE(loaded->ingest(add_record(120U, key, 4U)));
    CHECK(read_u64(*loaded, key, 120U, ec) == 10U);
}

TEST_CASE("Unflushed records are lost on restart and replayed from resume_lsn", "[timeline]")
{
    TimelineHarness harness{"strata_timeline_replay_"};
    auto timeline = harness.create_root();
    REQUIRE(timeline);

    const auto key = Key::from_block(7U);
    REQUIRE_FALSE(timeline->ingest(image_record(10U, key, 5U)));
    REQUIRE_FALSE(timeline->checkpoint());
    REQUIRE_FALSE(timeline->ingest(add_record(20U, key, 1U)));

    auto loaded = harness.restart(timeline);
    REQUIRE(loaded);
    CHECK(loaded->last_record_lsn() == 10U);
    CHECK(loaded->resume_lsn() == 10U);

    REQUIRE_FALSE(loaded->ingest(add_record(20U, key, 1U)));
    std::error_code ec;
    CHECK(read_u64(*loaded, key, 20U, ec) == 6U);
}

TEST_CASE("Out-of-order records break the timeline", "[timeline]")
{
    TimelineHarness harness{"strata_timeline_broken_"};
    auto timeline = harness.create_root();
    REQUIRE(timeline);

    const auto key = Key::from_block(1U);
    REQUIRE_FALSE(timeline->ingest(image_record(50U, key, 1U)));
    CHECK(timeline->ingest(add_record(40U, key, 1U)) == StorageErrc::LsnOutOfOrder);
    CHECK(timeline->state() == TimelineState::Broken);
    CHECK(timeline->ingest(add_record(60U, key, 1U)) == StorageErrc::TimelineBroken);
    CHECK(timeline->last_record_lsn() == 50U);
    CHECK(timeline->wait_lsn(60U, 10ms) == StorageErrc::TimelineBroken);

    std::error_code ec;
    CHECK(read_u64(*timeline, key, 50U, ec) == 1U);
    CHECK_FALSE(ec);
}

TEST_CASE("A record touching one page twice is corrupt", "[timeline]")
{
    TimelineHarness harness{"strata_timeline_duplicate_block_"};
    auto timeline = harness.create_root();
    REQUIRE(timeline);

    auto record = image_record(10U, Key::from_block(1U), 1U);
    record.blocks.push_back(record.blocks.front());
    CHECK(timeline->ingest(record) == StorageErrc::CorruptWalRecord);
    CHECK(timeline->state() == TimelineState::Broken);
}

TEST_CASE("Records at the sentinel key or LSN never reach a layer", "[timeline]")
{
    TimelineHarness harness{"strata_timeline_sentinels_"};

    SECTION("Key::max() is not a page")
    {
        auto timeline = harness.create_root();
        REQUIRE(timeline);
        REQUIRE_FALSE(timeline->ingest(image_record(8U, Key::from_block(1U), 3U)));
        CHECK(timeline->ingest(image_record(16U, Key::max(), 7U)) == StorageErrc::CorruptWalRecord);
        CHECK(timeline->state() == TimelineState::Broken);

        REQUIRE_FALSE(timeline->checkpoint());
        CHECK(timeline->layers()->frozen_layers().empty());
        CHECK(timeline->disk_consistent_lsn() == 8U);
        std::error_code ec;
        CHECK(read_u64(*timeline, Key::from_block(1U), 8U, ec) == 3U);
        CHECK_FALSE(ec);
    }

    SECTION("kMaxLsn is not a record position")
    {
        auto timeline = harness.create_root();
        REQUIRE(timeline);
        REQUIRE_FALSE(timeline->ingest(image_record(8U, Key::from_block(1U), 3U)));
        CHECK(timeline->ingest(image_record(storage::kMaxLsn, Key::from_block(1U), 4U)) == StorageErrc::CorruptWalRecord);
        CHECK(timeline->last_record_lsn() == 8U);

        REQUIRE_FALSE(timeline->checkpoint());
        CHECK(timeline->disk_consistent_lsn() == 8U);
        REQUIRE_FALSE(timeline->checkpoint());
    }

    SECTION("Imports stay inside the key and LSN space")
    {
        auto timeline = harness.create_root();
        REQUIRE(timeline);
        CHECK(timeline->import_images({{Key::from_block(1U), storage::encode_u64_page(1U)}}, storage::kMaxLsn - 1U)
              == std::errc::invalid_argument);
        CHECK(timeline->import_images({{Key::max(), storage::encode_u64_page(1U)}}, 8U) == std::errc::invalid_argument);
        CHECK(timeline->layers()->historic_layers().empty());
        REQUIRE_FALSE(timeline->import_images({{Key::from_block(1U), storage::encode_u64_page(1U)}}, 8U));
    }
}

TEST_CASE("Deltas that would grow a page past the limit fail the read only", "[timeline]")
{
    TimelineHarness harness{"strata_timeline_oversize_delta_"};
    auto timeline = harness.create_root();
    REQUIRE(timeline);

    const auto key = Key::from_block(3U);
    REQUIRE_FALSE(timeline->import_images({{key, storage::encode_u64_page(11U)}}, 8U));

    const std::array<storage::RedoOp, 1> ops{storage::RedoOp::write(0xFFFFFFF0U, storage::encode_u64_page(1U))};
    storage::WalRecord record{};
    record.lsn = 16U;
    record.blocks.push_back(storage::WalBlock{key, storage::PageValue::delta(ops)});
    REQUIRE_FALSE(timeline->ingest(record));
    REQUIRE_FALSE(timeline->checkpoint());

    std::error_code ec;
    (void)read_u64(*timeline, key, 16U, ec);
    CHECK(ec == StorageErrc::CorruptDelta);
    CHECK(timeline->telemetry_snapshot().reconstruct_failures == 1U);
    CHECK(read_u64(*timeline, key, 8U, ec) == 11U);
    CHECK_FALSE(ec);

    Compactor compactor{*timeline};
    CompactionResult result{};
    CHECK(compactor.create_image_layers(true, result) == StorageErrc::CorruptDelta);
    CHECK(result.image_layers_written == 0U);
    CHECK(timeline->state() == TimelineState::Active);
}

TEST_CASE("wait_lsn blocks until the record arrives or times out", "[timeline]")
{
    TimelineHarness harness{"strata_timeline_wait_"};
    auto timeline = harness.create_root();
    REQUIRE(timeline);

    CHECK(timeline->wait_lsn(100U, 20ms) == StorageErrc::WaitLsnTimeout);

    std::thread writer{[&timeline]() {
        std::this_thread::sleep_for(20ms);
        (void)timeline->ingest(image_record(100U, Key::from_block(1U), 1U));
    }};
    CHECK_FALSE(timeline->wait_lsn(100U, 2s));
    writer.join();
    CHECK_FALSE(timeline->wait_lsn(50U, 0ms));

    timeline->shutdown();
    CHECK(timeline->wait_lsn(200U, 2s) == StorageErrc::TimelineStopping);
    std::vector<std::byte> page;
    CHECK(timeline->get_page(Key::from_block(1U), 100U, page) == StorageErrc::TimelineStopping);
}

TEST_CASE("Freezing follows the checkpoint distance", "[timeline]")
{
    auto config = make_test_config();
    config.checkpoint_distance = 256U;
    TimelineHarness harness{"strata_timeline_freeze_"};
    auto timeline = harness.create_root(config);
    REQUIRE(timeline);

    std::uint64_t lsn = 0U;
    for (std::uint32_t block = 0; block < 16U; ++block) {
        lsn += 8U;
        REQUIRE_FALSE(timeline->ingest(image_record(lsn, Key::from_block(block), block)));
    }
    const auto telemetry = timeline->telemetry_snapshot();
    CHECK(telemetry.layers_frozen >= 1U);
    CHECK(telemetry.records_ingested == 16U);

    REQUIRE_FALSE(timeline->flush_frozen_layers());
    const auto info = timeline->info();
    CHECK(info.frozen_layers == 0U);
    CHECK(info.delta_layers == telemetry.layers_frozen);
    CHECK(info.disk_consistent_lsn < info.last_record_lsn + 1U);
    CHECK(info.state == TimelineState::Active);

    CHECK_FALSE(timeline->maybe_freeze());
}

TEST_CASE("Timeline rejects bad configuration", "[timeline]")
{
    TimelineHarness harness{"strata_timeline_config_"};
    auto config = make_test_config();
    config.compaction_threshold = 1U;
    const auto id = TimelineId::generate();
    CHECK_THROWS_AS((Timeline{id, std::nullopt, 0U, harness.timeline_dir(id), config, harness.resources()}),
                    std::invalid_argument);
    CHECK_THROWS_AS((Timeline{id, id, 0U, harness.timeline_dir(id), make_test_config(), harness.resources()}),
                    std::invalid_argument);
}

TEST_CASE("Reads match a replayed model at every LSN", "[timeline]")
{
    constexpr std::size_t kKeys = 8U;
    using State = std::array<std::uint64_t, kKeys>;

    auto config = make_test_config();
    config.checkpoint_distance = 512U;
    config.max_frozen_bytes = 0U;
    TimelineHarness harness{"strata_timeline_model_"};
    auto timeline = harness.create_root(config);
    REQUIRE(timeline);

    std::mt19937_64 rng{20240611U};
    std::map<std::uint64_t, State> history;
    State state{};

    std::uint64_t lsn = 8U;
    storage::WalRecord seed{};
    seed.lsn = lsn;
    for (std::size_t index = 0; index < kKeys; ++index) {
        state[index] = index * 100U;
        seed.blocks.push_back(storage::WalBlock{Key::from_block(static_cast<std::uint32_t>(index)),
                                                storage::PageValue::image(storage::encode_u64_page(state[index]))});
    }
    REQUIRE_FALSE(timeline->ingest(seed));
    history[lsn] = state;

    for (int step = 0; step < 400; ++step) {
        lsn += 8U * (1U + rng() % 4U);
        storage::WalRecord record{};
        record.lsn = lsn;
        const auto first = rng() % kKeys;
        const auto count = 1U + rng() % 3U;
        for (std::size_t offset = 0; offset < count; ++offset) {
            const auto index = (first + offset) % kKeys;
            const auto key = Key::from_block(static_cast<std::uint32_t>(index));
            const auto choice = rng() % 10U;
            const auto value = rng() % 1000U;
            if (choice < 7U) {
                const std::array<storage::RedoOp, 1> ops{storage::RedoOp::add_u64(0U, value)};
                record.blocks.push_back(storage::WalBlock{key, storage::PageValue::delta(ops)});
                state[index] += value;
            } else if (choice < 8U) {
                record.blocks.push_back(storage::WalBlock{key, storage::PageValue::image(storage::encode_u64_page(value))});
                state[index] = value;
            } else {
                const auto bytes = storage::encode_u64_page(value);
                const std::array<storage::RedoOp, 1> ops{storage::RedoOp::write(0U, bytes)};
                record.blocks.push_back(storage::WalBlock{key, storage::PageValue::delta(ops, choice == 9U)});
                state[index] = value;
            }
        }
        REQUIRE_FALSE(timeline->ingest(record));
        history[lsn] = state;
    }

    auto verify = [&history](Timeline& target, std::mt19937_64& picker) {
        const auto first_lsn = history.begin()->first;
        const auto last_lsn = history.rbegin()->first;
        for (int sample = 0; sample < 60; ++sample) {
            const auto at = first_lsn + picker() % (last_lsn - first_lsn + 1U);
            const auto& expected = std::prev(history.upper_bound(at))->second;
            for (std::size_t index = 0; index < kKeys; ++index) {
                std::error_code ec;
                const auto value = read_u64(target, Key::from_block(static_cast<std::uint32_t>(index)), at, ec);
                REQUIRE_FALSE(ec);
                REQUIRE(value == expected[index]);
            }
        }
    };

    CHECK(timeline->telemetry_snapshot().layers_flushed > 1U);
    verify(*timeline, rng);

    REQUIRE_FALSE(timeline->checkpoint());
    auto loaded = harness.restart(timeline, config);
    REQUIRE(loaded);
    CHECK(loaded->last_record_lsn() == lsn);
    verify(*loaded, rng);
}

}  // namespace strata::timeline::tests
