#include "strata/timeline/engine_telemetry_registry.hpp"

#include <utility>
#include <vector>

namespace strata::timeline {

namespace {

TimelineTelemetrySnapshot& accumulate(TimelineTelemetrySnapshot& target, const TimelineTelemetrySnapshot& source)
{
    target.records_ingested += source.records_ingested;
    target.bytes_ingested += source.bytes_ingested;
    target.layers_frozen += source.layers_frozen;
    target.layers_flushed += source.layers_flushed;
    target.flush_bytes += source.flush_bytes;
    target.layers_uploaded += source.layers_uploaded;
    target.upload_failures += source.upload_failures;
    target.compactions += source.compactions;
    target.compaction_layers_in += source.compaction_layers_in;
    target.compaction_layers_out += source.compaction_layers_out;
    target.images_created += source.images_created;
    target.gc_runs += source.gc_runs;
    target.layers_removed += source.layers_removed;
    target.page_reconstructions += source.page_reconstructions;
    target.cache_hits += source.cache_hits;
    target.reconstruct_failures += source.reconstruct_failures;
    target.backpressure_waits += source.backpressure_waits;
    return target;
}

PageCacheTelemetrySnapshot& accumulate(PageCacheTelemetrySnapshot& target, const PageCacheTelemetrySnapshot& source)
{
    target.hits += source.hits;
    target.misses += source.misses;
    target.insertions += source.insertions;
    target.evictions += source.evictions;
    target.resident_bytes += source.resident_bytes;
    target.resident_entries += source.resident_entries;
    return target;
}

}  // namespace

void EngineTelemetryRegistry::register_timeline(std::string identifier, TimelineSampler sampler)
{
    if (!sampler) {
        return;
    }
    std::lock_guard guard(mutex_);
    timeline_samplers_.insert_or_assign(std::move(identifier), std::move(sampler));
}

void EngineTelemetryRegistry::unregister_timeline(const std::string& identifier)
{
    std::lock_guard guard(mutex_);
    timeline_samplers_.erase(identifier);
}

TimelineTelemetrySnapshot EngineTelemetryRegistry::aggregate_timelines() const
{
    std::vector<TimelineSampler> callbacks;
    {
        std::lock_guard guard(mutex_);
        callbacks.reserve(timeline_samplers_.size());
        for (const auto& [_, sampler] : timeline_samplers_) {
            callbacks.push_back(sampler);
        }
    }

    TimelineTelemetrySnapshot total{};
    for (const auto& callback : callbacks) {
        accumulate(total, callback());
    }
    return total;
}

void EngineTelemetryRegistry::visit_timelines(const TimelineVisitor& visitor) const
{
    if (!visitor) {
        return;
    }

    std::vector<std::pair<std::string, TimelineSampler>> entries;
    {
        std::lock_guard guard(mutex_);
        entries.reserve(timeline_samplers_.size());
        for (const auto& [identifier, sampler] : timeline_samplers_) {
            entries.emplace_back(identifier, sampler);
        }
    }

    for (const auto& [identifier, sampler] : entries) {
        visitor(identifier, sampler());
    }
}

void EngineTelemetryRegistry::register_page_cache(std::string identifier, PageCacheSampler sampler)
{
    if (!sampler) {
        return;
    }
    std::lock_guard guard(mutex_);
    page_cache_samplers_.insert_or_assign(std::move(identifier), std::move(sampler));
}

void EngineTelemetryRegistry::unregister_page_cache(const std::string& identifier)
{
    std::lock_guard guard(mutex_);
    page_cache_samplers_.erase(identifier);
}

PageCacheTelemetrySnapshot EngineTelemetryRegistry::aggregate_page_caches() const
{
    std::vector<PageCacheSampler> callbacks;
    {
        std::lock_guard guard(mutex_);
        callbacks.reserve(page_cache_samplers_.size());
        for (const auto& [_, sampler] : page_cache_samplers_) {
            callbacks.push_back(sampler);
        }
    }

    PageCacheTelemetrySnapshot total{};
    for (const auto& callback : callbacks) {
        accumulate(total, callback());
    }
    return total;
}

}  // namespace strata::timeline
