#include "strata/timeline/engine_metrics.hpp"

#include "strata/timeline/timeline_registry.hpp"
#include "timeline_test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <map>
#include <string>

namespace strata::timeline::tests {

TEST_CASE("EngineTelemetryRegistry sums registered samplers", "[metrics]")
{
    EngineTelemetryRegistry registry;
    registry.register_timeline("timeline/a", []() {
        TimelineTelemetrySnapshot snapshot{};
        snapshot.records_ingested = 10U;
        snapshot.layers_flushed = 2U;
        return snapshot;
    });
    registry.register_timeline("timeline/b", []() {
        TimelineTelemetrySnapshot snapshot{};
        snapshot.records_ingested = 5U;
        snapshot.gc_runs = 1U;
        return snapshot;
    });
    registry.register_page_cache("page_cache", []() {
        PageCacheTelemetrySnapshot snapshot{};
        snapshot.hits = 3U;
        snapshot.misses = 1U;
        snapshot.resident_bytes = 4096U;
        return snapshot;
    });

    const auto total = registry.aggregate_timelines();
    CHECK(total.records_ingested == 15U);
    CHECK(total.layers_flushed == 2U);
    CHECK(total.gc_runs == 1U);

    std::map<std::string, std::uint64_t> visited;
    registry.visit_timelines([&visited](const std::string& identifier, const TimelineTelemetrySnapshot& snapshot) {
        visited[identifier] = snapshot.records_ingested;
    });
    CHECK(visited == std::map<std::string, std::uint64_t>{{"timeline/a", 10U}, {"timeline/b", 5U}});

    const auto metrics = collect_engine_metrics(registry);
    CHECK(metrics.page_cache.resident_bytes == 4096U);
    CHECK(metrics.page_cache_hit_ratio == 0.75);

    registry.unregister_timeline("timeline/a");
    CHECK(registry.aggregate_timelines().records_ingested == 5U);
    registry.unregister_page_cache("page_cache");
    CHECK(registry.aggregate_page_caches().hits == 0U);
}

TEST_CASE("OpenMetrics output lists every counter and ends with EOF", "[metrics]")
{
    EngineMetricsSnapshot snapshot{};
    snapshot.timelines.records_ingested = 42U;
    snapshot.timelines.layers_removed = 3U;
    snapshot.page_cache.resident_bytes = 512U;
    snapshot.page_cache_hit_ratio = 0.5;

    const auto text = engine_metrics_to_openmetrics(snapshot, std::chrono::system_clock::time_point{std::chrono::seconds{1700000000}});
    CHECK(text.find("# TYPE strata_wal_records_ingested counter\n") != std::string::npos);
    CHECK(text.find("strata_wal_records_ingested_total 42\n") != std::string::npos);
    CHECK(text.find("strata_gc_layers_removed_total 3\n") != std::string::npos);
    CHECK(text.find("# TYPE strata_page_cache_resident_bytes gauge\n") != std::string::npos);
    CHECK(text.find("strata_page_cache_resident_bytes 512\n") != std::string::npos);
    CHECK(text.find("strata_page_cache_hit_ratio 0.5\n") != std::string::npos);
    CHECK(text.find("strata_metrics_scrape_timestamp_seconds 1700000000\n") != std::string::npos);
    CHECK(text.ends_with("# EOF\n"));
}

TEST_CASE("Registry timelines report into the telemetry registry", "[metrics]")
{
    const auto dir = make_temp_dir("strata_metrics_registry_");
    EngineTelemetryRegistry telemetry;
    RegistryConfig config{};
    config.data_dir = dir;
    config.timeline = make_test_config();
    config.telemetry_registry = &telemetry;

    {
        TimelineRegistry registry{config};
        REQUIRE_FALSE(registry.load());
        TimelineId id{};
        REQUIRE_FALSE(registry.create_timeline(std::nullopt, id));
        const auto timeline = registry.get(id);
        REQUIRE_FALSE(timeline->ingest(image_record(16U, storage::Key::from_block(1U), 7U)));
        REQUIRE_FALSE(registry.checkpoint(id));

        std::vector<std::byte> page;
        REQUIRE_FALSE(registry.get_page(id, storage::Key::from_block(1U), 16U, page));
        REQUIRE_FALSE(registry.get_page(id, storage::Key::from_block(1U), 16U, page));

        const auto metrics = collect_engine_metrics(telemetry);
        CHECK(metrics.timelines.records_ingested == 1U);
        CHECK(metrics.timelines.layers_flushed == 1U);
        CHECK(metrics.timelines.page_reconstructions == 1U);
        CHECK(metrics.page_cache.hits == 1U);
        CHECK(metrics.page_cache.misses == 1U);

        registry.shutdown();
        CHECK(collect_engine_metrics(telemetry).timelines.records_ingested == 0U);
    }
    (void)std::filesystem::remove_all(dir);
}

}  // namespace strata::timeline::tests
