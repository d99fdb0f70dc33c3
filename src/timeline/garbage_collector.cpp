#include "strata/timeline/garbage_collector.hpp"

#include "strata/storage/storage_errors.hpp"

#include <glog/logging.h>

#include <algorithm>

namespace strata::timeline {

using storage::StorageErrc;

GarbageCollector::GarbageCollector(Timeline& timeline)
    : timeline_{timeline}
{
}

std::uint64_t GarbageCollector::compute_cutoff(std::uint64_t last_record_lsn,
                                               std::uint64_t current_cutoff,
                                               std::uint64_t horizon,
                                               const std::vector<std::uint64_t>& retain_lsns) noexcept
{
    auto cutoff = last_record_lsn > horizon ? last_record_lsn - horizon : 0U;
    if (!retain_lsns.empty()) {
        cutoff = std::min(cutoff, *std::min_element(retain_lsns.begin(), retain_lsns.end()));
    }
    return std::max(cutoff, current_cutoff);
}

std::error_code GarbageCollector::run(std::uint64_t horizon, const std::vector<std::uint64_t>& retain_lsns, GcResult& result)
{
    const auto started = std::chrono::steady_clock::now();
    std::lock_guard maintenance_lock(timeline_.maintenance_mutex_);
    if (timeline_.cancelled()) {
        return make_error_code(StorageErrc::Cancelled);
    }

    const auto cutoff = compute_cutoff(timeline_.last_record_lsn(), timeline_.gc_cutoff_lsn(), horizon, retain_lsns);
    result = GcResult{};
    result.cutoff_lsn = cutoff;

    // The cutoff is persisted before any layer it makes unreachable is removed.
    if (cutoff > timeline_.gc_cutoff_lsn()) {
        std::lock_guard write_lock(timeline_.layer_write_mutex_);
        auto lsns = timeline_.durable_;
        lsns.gc_cutoff_lsn = cutoff;
        if (auto ec = timeline_.publish_locked(storage::LayerMapUpdate{}, lsns); ec) {
            return ec;
        }
        if (timeline_.resources_.page_cache) {
            timeline_.resources_.page_cache->forget_timeline(timeline_.id());
        }
    }

    const auto snapshot = timeline_.layer_map_.snapshot();
    std::vector<std::shared_ptr<storage::PersistentLayer>> removable;
    for (const auto& layer : snapshot->historic_layers()) {
        ++result.layers_total;
        const auto descriptor = layer->descriptor();

        if (descriptor.lsn_range.end > cutoff) {
            ++result.layers_needed_by_cutoff;
            continue;
        }
        const auto needed_by_branch = std::any_of(retain_lsns.begin(), retain_lsns.end(), [&](std::uint64_t retain) {
            return retain >= descriptor.lsn_range.start && retain < cutoff;
        });
        if (needed_by_branch) {
            ++result.layers_needed_by_branches;
            continue;
        }
        // Images between the layer's end and the cutoff must cover its keys.
        if (!snapshot->image_coverage(descriptor.key_range, storage::LsnRange{descriptor.lsn_range.end, cutoff + 1U})) {
            ++result.layers_not_updated;
            continue;
        }
        removable.push_back(layer);
    }

    if (!removable.empty()) {
        std::lock_guard write_lock(timeline_.layer_write_mutex_);
        storage::LayerMapUpdate update{};
        update.historic_removed = removable;
        if (auto ec = timeline_.publish_locked(update, timeline_.durable_); ec) {
            LOG(WARNING) << "GC of timeline " << timeline_.id().to_string() << " failed to publish: " << ec.message();
            return ec;
        }
        for (const auto& layer : removable) {
            layer->mark_for_deletion();
        }
    }

    result.layers_removed = removable.size();
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    timeline_.telemetry_.gc_runs.fetch_add(1U, std::memory_order_relaxed);
    timeline_.telemetry_.layers_removed.fetch_add(removable.size(), std::memory_order_relaxed);

    LOG(INFO) << "GC of timeline " << timeline_.id().to_string() << " at cutoff " << storage::format_lsn(cutoff) << ": "
              << result.layers_total << " layers, " << result.layers_needed_by_cutoff << " needed by cutoff, "
              << result.layers_needed_by_branches << " needed by branches, " << result.layers_not_updated
              << " not updated, " << result.layers_removed << " removed in " << result.elapsed.count() << " ms";
    return {};
}

}  // namespace strata::timeline
