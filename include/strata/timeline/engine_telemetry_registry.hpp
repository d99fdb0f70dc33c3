#pragma once

#include "strata/timeline/page_cache.hpp"
#include "strata/timeline/timeline.hpp"

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace strata::timeline {

class EngineTelemetryRegistry final {
public:
    using TimelineSampler = std::function<TimelineTelemetrySnapshot()>;
    using TimelineVisitor = std::function<void(const std::string&, const TimelineTelemetrySnapshot&)>;
    using PageCacheSampler = std::function<PageCacheTelemetrySnapshot()>;

    void register_timeline(std::string identifier, TimelineSampler sampler);
    void unregister_timeline(const std::string& identifier);
    [[nodiscard]] TimelineTelemetrySnapshot aggregate_timelines() const;
    void visit_timelines(const TimelineVisitor& visitor) const;

    void register_page_cache(std::string identifier, PageCacheSampler sampler);
    void unregister_page_cache(const std::string& identifier);
    [[nodiscard]] PageCacheTelemetrySnapshot aggregate_page_caches() const;

private:
    mutable std::mutex mutex_{};
    std::unordered_map<std::string, TimelineSampler> timeline_samplers_{};
    std::unordered_map<std::string, PageCacheSampler> page_cache_samplers_{};
};

}  // namespace strata::timeline
