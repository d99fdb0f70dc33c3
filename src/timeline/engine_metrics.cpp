#include "strata/timeline/engine_metrics.hpp"

#include <cmath>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace strata::timeline {
namespace {

constexpr double kNsPerSecond = 1'000'000'000.0;

[[nodiscard]] std::string format_double(double value)
{
    if (!std::isfinite(value)) {
        return "0";
    }
    std::ostringstream stream;
    stream << std::setprecision(17) << value;
    return stream.str();
}

void write_counter(std::ostringstream& out, const char* name, const char* help, std::uint64_t value)
{
    out << "# HELP " << name << ' ' << help << '\n';
    out << "# TYPE " << name << " counter\n";
    out << name << "_total " << value << '\n';
}

void write_gauge(std::ostringstream& out, const char* name, const char* help, const std::string& value)
{
    out << "# HELP " << name << ' ' << help << '\n';
    out << "# TYPE " << name << " gauge\n";
    out << name << ' ' << value << '\n';
}

}  // namespace

EngineMetricsSnapshot collect_engine_metrics(const EngineTelemetryRegistry& registry)
{
    EngineMetricsSnapshot snapshot{};
    snapshot.timelines = registry.aggregate_timelines();
    snapshot.page_cache = registry.aggregate_page_caches();
    const auto lookups = snapshot.page_cache.hits + snapshot.page_cache.misses;
    snapshot.page_cache_hit_ratio = lookups == 0U
        ? 0.0
        : static_cast<double>(snapshot.page_cache.hits) / static_cast<double>(lookups);
    return snapshot;
}

std::string engine_metrics_to_openmetrics(const EngineMetricsSnapshot& snapshot,
                                          std::chrono::system_clock::time_point wall_now)
{
    const auto wall_seconds = std::chrono::duration_cast<std::chrono::nanoseconds>(wall_now.time_since_epoch()).count()
        / kNsPerSecond;
    const auto& timelines = snapshot.timelines;

    std::ostringstream out;
    write_counter(out, "strata_wal_records_ingested", "WAL records applied to open layers.", timelines.records_ingested);
    write_counter(out, "strata_wal_bytes_ingested", "Page value bytes applied to open layers.", timelines.bytes_ingested);
    write_counter(out, "strata_layers_frozen", "Open layers frozen.", timelines.layers_frozen);
    write_counter(out, "strata_layers_flushed", "Frozen layers written as delta layer files.", timelines.layers_flushed);
    write_counter(out, "strata_flush_bytes", "Bytes written by layer flushes.", timelines.flush_bytes);
    write_counter(out, "strata_layers_uploaded", "Layer files uploaded to remote storage.", timelines.layers_uploaded);
    write_counter(out, "strata_upload_failures", "Layer uploads that failed after retries.", timelines.upload_failures);
    write_counter(out, "strata_compactions", "Level-0 compaction passes that published new layers.", timelines.compactions);
    write_counter(out, "strata_compaction_layers_in", "Layers consumed by compaction.", timelines.compaction_layers_in);
    write_counter(out, "strata_compaction_layers_out", "Layers produced by compaction.", timelines.compaction_layers_out);
    write_counter(out, "strata_image_layers_created", "Image layers materialized.", timelines.images_created);
    write_counter(out, "strata_gc_runs", "Garbage collection passes.", timelines.gc_runs);
    write_counter(out, "strata_gc_layers_removed", "Layers removed by garbage collection.", timelines.layers_removed);
    write_counter(out, "strata_page_reconstructions", "Pages reconstructed from layers.", timelines.page_reconstructions);
    write_counter(out, "strata_page_reconstruct_failures", "Page requests that failed reconstruction.", timelines.reconstruct_failures);
    write_counter(out, "strata_ingest_backpressure_waits", "Times ingestion waited for frozen layers to flush.", timelines.backpressure_waits);

    write_counter(out, "strata_page_cache_hits", "Page cache lookups served from memory.", snapshot.page_cache.hits);
    write_counter(out, "strata_page_cache_misses", "Page cache lookups that missed.", snapshot.page_cache.misses);
    write_counter(out, "strata_page_cache_evictions", "Pages evicted from the page cache.", snapshot.page_cache.evictions);
    write_gauge(out, "strata_page_cache_resident_bytes", "Bytes held by the page cache.", std::to_string(snapshot.page_cache.resident_bytes));
    write_gauge(out, "strata_page_cache_hit_ratio", "Fraction of page cache lookups that hit.", format_double(snapshot.page_cache_hit_ratio));
    write_gauge(out,
                "strata_metrics_scrape_timestamp_seconds",
                "Wall clock time when the metrics snapshot was generated.",
                format_double(wall_seconds));
    out << "# EOF\n";
    return out.str();
}

}  // namespace strata::timeline
