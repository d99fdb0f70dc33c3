#pragma once

#include "strata/storage/async_io.hpp"
#include "strata/storage/remote_storage.hpp"
#include "strata/timeline/background_loop.hpp"
#include "strata/timeline/compaction.hpp"
#include "strata/timeline/engine_telemetry_registry.hpp"
#include "strata/timeline/garbage_collector.hpp"
#include "strata/timeline/page_cache.hpp"
#include "strata/timeline/timeline.hpp"
#include "strata/timeline/timeline_config.hpp"
#include "strata/timeline/timeline_id.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

namespace strata::timeline {

struct RegistryConfig final {
    std::filesystem::path data_dir{};
    TimelineConfig timeline{};
    PageCache::Config page_cache{};
    storage::AsyncIoConfig async_io{};
    std::shared_ptr<storage::AsyncIo> async_io_instance{};
    std::shared_ptr<storage::RemoteStorage> remote{};
    EngineTelemetryRegistry* telemetry_registry = nullptr;
    std::chrono::milliseconds flush_period{std::chrono::seconds{1}};
};

// Owns every timeline of a data directory. Timelines refer to their ancestor
// by id and resolve it through the registry.
class TimelineRegistry final {
public:
    explicit TimelineRegistry(RegistryConfig config);
    ~TimelineRegistry();

    TimelineRegistry(const TimelineRegistry&) = delete;
    TimelineRegistry& operator=(const TimelineRegistry&) = delete;
    TimelineRegistry(TimelineRegistry&&) = delete;
    TimelineRegistry& operator=(TimelineRegistry&&) = delete;

    // Loads every timeline under <data_dir>/timelines.
    [[nodiscard]] std::error_code load();
    // Starts the flush, compaction and GC loops.
    void start_background_loops();
    void shutdown();

    [[nodiscard]] std::error_code create_timeline(std::optional<TimelineId> id, TimelineId& out);
    [[nodiscard]] std::error_code create_branch(const TimelineId& ancestor_id,
                                                std::uint64_t at_lsn,
                                                std::optional<TimelineId> id,
                                                TimelineId& out);
    [[nodiscard]] std::error_code delete_timeline(const TimelineId& id);

    [[nodiscard]] std::shared_ptr<Timeline> get(const TimelineId& id) const;
    [[nodiscard]] std::error_code get_page(const TimelineId& id,
                                           const storage::Key& key,
                                           std::uint64_t lsn,
                                           std::vector<std::byte>& out);
    [[nodiscard]] std::error_code get_last_record_lsn(const TimelineId& id, std::uint64_t& out) const;
    [[nodiscard]] std::error_code timeline_info(const TimelineId& id, TimelineInfo& out) const;
    // Sorted by id.
    [[nodiscard]] std::vector<TimelineInfo> list_timelines() const;

    [[nodiscard]] std::error_code import_images(const TimelineId& id,
                                                const std::vector<std::pair<storage::Key, std::vector<std::byte>>>& pages,
                                                std::uint64_t lsn);
    [[nodiscard]] std::error_code checkpoint(const TimelineId& id);
    [[nodiscard]] std::error_code compact(const TimelineId& id, bool force, CompactionResult& result);
    // Uses the configured gc_horizon unless `horizon` is given.
    [[nodiscard]] std::error_code gc(const TimelineId& id, std::optional<std::uint64_t> horizon, GcResult& result);
    // Branch points of live children of `id`.
    [[nodiscard]] std::vector<std::uint64_t> retain_lsns(const TimelineId& id) const;

    [[nodiscard]] const std::filesystem::path& data_dir() const noexcept;
    [[nodiscard]] std::filesystem::path timeline_directory(const TimelineId& id) const;
    [[nodiscard]] const std::shared_ptr<PageCache>& page_cache() const noexcept;
    [[nodiscard]] std::shared_ptr<storage::AsyncIo> async_io() const noexcept;
    [[nodiscard]] const BackgroundLoop* flush_loop() const noexcept;

private:
    [[nodiscard]] TimelineResources make_resources();
    [[nodiscard]] std::vector<std::shared_ptr<Timeline>> snapshot_timelines() const;
    [[nodiscard]] bool has_children_locked(const TimelineId& id) const;
    void attach(const std::shared_ptr<Timeline>& timeline);
    void detach(const Timeline& timeline);

    [[nodiscard]] std::error_code run_flush_pass(bool force);
    [[nodiscard]] std::error_code run_compaction_pass(bool force);
    [[nodiscard]] std::error_code run_gc_pass(bool force);

    RegistryConfig config_{};
    std::shared_ptr<storage::AsyncIo> io_{};
    bool owns_io_ = false;
    std::shared_ptr<PageCache> page_cache_{};

    mutable std::mutex mutex_{};
    std::unordered_map<TimelineId, std::shared_ptr<Timeline>, TimelineIdHash> timelines_{};
    bool loops_started_ = false;

    // Serializes GC with timeline creation and deletion so a new branch point
    // is never below its ancestor's cutoff.
    std::mutex lifecycle_mutex_{};

    std::unique_ptr<BackgroundLoop> flush_loop_{};
    std::unique_ptr<BackgroundLoop> compaction_loop_{};
    std::unique_ptr<BackgroundLoop> gc_loop_{};
};

}  // namespace strata::timeline
