#include "strata/timeline/timeline_registry.hpp"

#include "strata/storage/storage_errors.hpp"
#include "timeline_test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

namespace strata::timeline::tests {

using storage::Key;
using storage::StorageErrc;

namespace {

RegistryConfig make_registry_config(const std::filesystem::path& data_dir)
{
    RegistryConfig config{};
    config.data_dir = data_dir;
    config.timeline = make_test_config();
    config.async_io.worker_threads = 2U;
    return config;
}

std::uint64_t registry_read(TimelineRegistry& registry, const TimelineId& id, std::uint64_t lsn, std::error_code& ec)
{
    std::vector<std::byte> page;
    ec = registry.get_page(id, Key::from_block(1U), lsn, page);
    return ec ? 0U : storage::decode_u64_page(page);
}

// Root with block 1 = 10 at LSN 16, then +1 at 24 and 32.
TimelineId create_populated_root(TimelineRegistry& registry)
{
    TimelineId id{};
    if (registry.create_timeline(std::nullopt, id)) {
        return {};
    }
    auto timeline = registry.get(id);
    if (timeline->ingest(image_record(16U, Key::from_block(1U), 10U)) || timeline->ingest(add_record(24U, Key::from_block(1U), 1U))
        || timeline->ingest(add_record(32U, Key::from_block(1U), 1U))) {
        return {};
    }
    return id;
}

}  // namespace

TEST_CASE("Branches read through their ancestor and diverge independently", "[registry]")
{
    const auto dir = make_temp_dir("strata_registry_branch_");
    TimelineRegistry registry{make_registry_config(dir)};
    REQUIRE_FALSE(registry.load());

    const auto root_id = create_populated_root(registry);
    REQUIRE_FALSE(root_id.is_zero());

    TimelineId child_id{};
    REQUIRE_FALSE(registry.create_branch(root_id, 24U, std::nullopt, child_id));
    auto root = registry.get(root_id);
    auto child = registry.get(child_id);
    REQUIRE(child);
    CHECK(child->ancestor_id() == root_id);
    CHECK(child->ancestor_lsn() == 24U);
    CHECK(child->last_record_lsn() == 24U);
    CHECK(root->disk_consistent_lsn() >= 24U);

    std::error_code ec;
    CHECK(registry_read(registry, child_id, 24U, ec) == 11U);
    CHECK_FALSE(ec);
    CHECK(registry_read(registry, child_id, 16U, ec) == 10U);
    CHECK_FALSE(ec);

    REQUIRE_FALSE(child->ingest(add_record(40U, Key::from_block(1U), 100U)));
    REQUIRE_FALSE(root->ingest(add_record(40U, Key::from_block(1U), 1U)));

    CHECK(registry_read(registry, child_id, 40U, ec) == 111U);
    CHECK(registry_read(registry, root_id, 40U, ec) == 13U);
    CHECK(registry_read(registry, root_id, 32U, ec) == 12U);
    CHECK_FALSE(ec);

    std::uint64_t last = 0U;
    REQUIRE_FALSE(registry.get_last_record_lsn(child_id, last));
    CHECK(last == 40U);
    CHECK(registry.retain_lsns(root_id) == std::vector<std::uint64_t>{24U});
    CHECK(registry.retain_lsns(child_id).empty());

    const auto listed = registry.list_timelines();
    REQUIRE(listed.size() == 2U);
    CHECK(listed[0].id < listed[1].id);

    registry.shutdown();
    (void)std::filesystem::remove_all(dir);
}

TEST_CASE("Branch creation validates the branch point", "[registry]")
{
    const auto dir = make_temp_dir("strata_registry_branch_errors_");
    TimelineRegistry registry{make_registry_config(dir)};
    REQUIRE_FALSE(registry.load());

    const auto root_id = create_populated_root(registry);
    REQUIRE_FALSE(root_id.is_zero());

    TimelineId out{};
    CHECK(registry.create_branch(TimelineId::generate(), 16U, std::nullopt, out) == StorageErrc::TimelineNotFound);
    CHECK(registry.create_branch(root_id, 33U, std::nullopt, out) == StorageErrc::LsnInFuture);

    REQUIRE_FALSE(registry.create_branch(root_id, 32U, std::nullopt, out));
    CHECK(registry.create_branch(root_id, 32U, out, out) == StorageErrc::TimelineAlreadyExists);
    CHECK(registry.create_timeline(root_id, out) == StorageErrc::TimelineAlreadyExists);

    const auto other_id = create_populated_root(registry);
    REQUIRE_FALSE(other_id.is_zero());
    REQUIRE_FALSE(registry.checkpoint(other_id));
    GcResult gc{};
    REQUIRE_FALSE(registry.gc(other_id, 0U, gc));
    CHECK(gc.cutoff_lsn == 32U);
    CHECK(registry.create_branch(other_id, 24U, std::nullopt, out) == StorageErrc::BranchPointTooOld);

    registry.shutdown();
    (void)std::filesystem::remove_all(dir);
}

TEST_CASE("GC on an ancestor stops at its children's branch points", "[registry]")
{
    const auto dir = make_temp_dir("strata_registry_gc_");
    TimelineRegistry registry{make_registry_config(dir)};
    REQUIRE_FALSE(registry.load());

    const auto root_id = create_populated_root(registry);
    REQUIRE_FALSE(root_id.is_zero());
    TimelineId child_id{};
    REQUIRE_FALSE(registry.create_branch(root_id, 24U, std::nullopt, child_id));

    GcResult gc{};
    REQUIRE_FALSE(registry.gc(root_id, 0U, gc));
    CHECK(gc.cutoff_lsn == 24U);

    std::error_code ec;
    CHECK(registry_read(registry, child_id, 24U, ec) == 11U);
    CHECK_FALSE(ec);

    const auto child = registry.get(child_id);
    CHECK(child->gc_cutoff_lsn() == 0U);
    (void)registry_read(registry, child_id, 16U, ec);
    CHECK(ec == StorageErrc::LsnTooOld);

    registry.shutdown();
    (void)std::filesystem::remove_all(dir);
}

TEST_CASE("Cached branch reads fail once the ancestor collects past them", "[registry]")
{
    const auto dir = make_temp_dir("strata_registry_gc_cached_");
    TimelineRegistry registry{make_registry_config(dir)};
    REQUIRE_FALSE(registry.load());

    const auto root_id = create_populated_root(registry);
    REQUIRE_FALSE(root_id.is_zero());
    TimelineId child_id{};
    REQUIRE_FALSE(registry.create_branch(root_id, 24U, std::nullopt, child_id));

    std::error_code ec;
    CHECK(registry_read(registry, child_id, 16U, ec) == 10U);
    REQUIRE_FALSE(ec);
    CHECK(registry_read(registry, child_id, 16U, ec) == 10U);
    REQUIRE_FALSE(ec);
    CHECK(registry.get(child_id)->telemetry_snapshot().cache_hits == 1U);

    GcResult gc{};
    REQUIRE_FALSE(registry.gc(root_id, 0U, gc));
    REQUIRE(gc.cutoff_lsn == 24U);

    (void)registry_read(registry, child_id, 16U, ec);
    CHECK(ec == StorageErrc::LsnTooOld);
    CHECK(registry_read(registry, child_id, 24U, ec) == 11U);
    CHECK_FALSE(ec);

    registry.shutdown();
    (void)std::filesystem::remove_all(dir);
}

TEST_CASE("Timelines with children cannot be deleted", "[registry]")
{
    const auto dir = make_temp_dir("strata_registry_delete_");
    TimelineRegistry registry{make_registry_config(dir)};
    REQUIRE_FALSE(registry.load());

    const auto root_id = create_populated_root(registry);
    REQUIRE_FALSE(root_id.is_zero());
    TimelineId child_id{};
    REQUIRE_FALSE(registry.create_branch(root_id, 32U, std::nullopt, child_id));

    CHECK(registry.delete_timeline(root_id) == StorageErrc::TimelineHasChildren);
    CHECK(registry.delete_timeline(TimelineId::generate()) == StorageErrc::TimelineNotFound);

    REQUIRE_FALSE(registry.delete_timeline(child_id));
    CHECK_FALSE(registry.get(child_id));
    CHECK_FALSE(std::filesystem::exists(registry.timeline_directory(child_id)));
    CHECK(registry.retain_lsns(root_id).empty());

    REQUIRE_FALSE(registry.delete_timeline(root_id));
    CHECK(registry.list_timelines().empty());

    std::vector<std::byte> page;
    CHECK(registry.get_page(root_id, Key::from_block(1U), 16U, page) == StorageErrc::TimelineNotFound);
    TimelineInfo info{};
    CHECK(registry.timeline_info(root_id, info) == StorageErrc::TimelineNotFound);

    registry.shutdown();
    (void)std::filesystem::remove_all(dir);
}

TEST_CASE("The registry reloads timelines and their ancestry", "[registry]")
{
    const auto dir = make_temp_dir("strata_registry_load_");
    TimelineId root_id{};
    TimelineId child_id{};
    {
        TimelineRegistry registry{make_registry_config(dir)};
        REQUIRE_FALSE(registry.load());
        root_id = create_populated_root(registry);
        REQUIRE_FALSE(root_id.is_zero());
        REQUIRE_FALSE(registry.create_branch(root_id, 24U, std::nullopt, child_id));
        REQUIRE_FALSE(registry.get(child_id)->ingest(add_record(48U, Key::from_block(1U), 5U)));
        REQUIRE_FALSE(registry.checkpoint(root_id));
        REQUIRE_FALSE(registry.checkpoint(child_id));
        registry.shutdown();
    }

    // An interrupted creation and a foreign directory.
    std::filesystem::create_directories(dir / "timelines" / TimelineId::generate().to_string());
    std::filesystem::create_directories(dir / "timelines" / "scratch");

    TimelineRegistry registry{make_registry_config(dir)};
    REQUIRE_FALSE(registry.load());
    const auto listed = registry.list_timelines();
    REQUIRE(listed.size() == 2U);
    CHECK(std::filesystem::exists(dir / "timelines" / "scratch"));

    TimelineInfo info{};
    REQUIRE_FALSE(registry.timeline_info(child_id, info));
    CHECK(info.ancestor_id == root_id);
    CHECK(info.ancestor_lsn == 24U);
    CHECK(info.last_record_lsn == 48U);
    CHECK(info.delta_layers == 1U);

    std::error_code ec;
    CHECK(registry_read(registry, child_id, 48U, ec) == 16U);
    CHECK_FALSE(ec);
    CHECK(registry_read(registry, root_id, 32U, ec) == 12U);
    CHECK_FALSE(ec);

    registry.shutdown();
    (void)std::filesystem::remove_all(dir);
}

TEST_CASE("Background loops flush timelines that reach the checkpoint timeout", "[registry]")
{
    const auto dir = make_temp_dir("strata_registry_background_");
    auto config = make_registry_config(dir);
    config.timeline.checkpoint_timeout = 10ms;
    config.flush_period = 20ms;
    TimelineRegistry registry{config};
    REQUIRE_FALSE(registry.load());
    registry.start_background_loops();
    REQUIRE(registry.flush_loop());
    CHECK(registry.flush_loop()->running());

    const auto root_id = create_populated_root(registry);
    REQUIRE_FALSE(root_id.is_zero());
    const auto root = registry.get(root_id);

    for (int attempt = 0; attempt < 200 && root->disk_consistent_lsn() < 32U; ++attempt) {
        std::this_thread::sleep_for(10ms);
    }
    CHECK(root->disk_consistent_lsn() == 32U);
    CHECK(root->info().delta_layers >= 1U);

    registry.shutdown();
    CHECK_FALSE(registry.flush_loop()->running());
    CHECK(root->state() == TimelineState::Stopping);
    (void)std::filesystem::remove_all(dir);
}

TEST_CASE("The registry rejects an empty data directory", "[registry]")
{
    CHECK_THROWS_AS(TimelineRegistry{RegistryConfig{}}, std::invalid_argument);
}

}  // namespace strata::timeline::tests
