#pragma once

#include "strata/storage/async_io.hpp"
#include "strata/storage/layer_map.hpp"
#include "strata/storage/remote_storage.hpp"
#include "strata/storage/wal_codec.hpp"
#include "strata/timeline/page_cache.hpp"
#include "strata/timeline/timeline_config.hpp"
#include "strata/timeline/timeline_id.hpp"
#include "strata/timeline/timeline_manifest.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace strata::timeline {

enum class TimelineState : std::uint8_t {
    Loading,
    Active,
    Stopping,
    Broken
};

[[nodiscard]] const char* to_string(TimelineState state) noexcept;

struct TimelineTelemetrySnapshot final {
    std::uint64_t records_ingested = 0U;
    std::uint64_t bytes_ingested = 0U;
    std::uint64_t layers_frozen = 0U;
    std::uint64_t layers_flushed = 0U;
    std::uint64_t flush_bytes = 0U;
    std::uint64_t layers_uploaded = 0U;
    std::uint64_t upload_failures = 0U;
    std::uint64_t compactions = 0U;
    std::uint64_t compaction_layers_in = 0U;
    std::uint64_t compaction_layers_out = 0U;
    std::uint64_t images_created = 0U;
    std::uint64_t gc_runs = 0U;
    std::uint64_t layers_removed = 0U;
    std::uint64_t page_reconstructions = 0U;
    std::uint64_t cache_hits = 0U;
    std::uint64_t reconstruct_failures = 0U;
    std::uint64_t backpressure_waits = 0U;
};

struct TimelineInfo final {
    TimelineId id{};
    std::optional<TimelineId> ancestor_id{};
    std::uint64_t ancestor_lsn = 0U;
    std::uint64_t last_record_lsn = 0U;
    std::uint64_t prev_record_lsn = 0U;
    std::uint64_t gc_cutoff_lsn = 0U;
    std::uint64_t disk_consistent_lsn = 0U;
    std::uint64_t remote_consistent_lsn = 0U;
    std::uint64_t physical_size = 0U;
    std::size_t delta_layers = 0U;
    std::size_t image_layers = 0U;
    std::size_t frozen_layers = 0U;
    std::size_t open_layer_bytes = 0U;
    TimelineState state = TimelineState::Loading;
};

class Timeline;

// Resolves ancestors by id; timelines never hold pointers to each other.
using AncestorResolver = std::function<std::shared_ptr<Timeline>(const TimelineId&)>;

struct TimelineResources final {
    std::shared_ptr<storage::AsyncIo> io{};
    std::shared_ptr<storage::RemoteStorage> remote{};
    std::shared_ptr<PageCache> page_cache{};
    AncestorResolver resolve_ancestor{};
};

class Compactor;
class GarbageCollector;

class Timeline final {
public:
    using FlushHook = std::function<void()>;

    Timeline(TimelineId id,
             std::optional<TimelineId> ancestor_id,
             std::uint64_t ancestor_lsn,
             std::filesystem::path directory,
             TimelineConfig config,
             TimelineResources resources);
    ~Timeline();

    Timeline(const Timeline&) = delete;
    Timeline& operator=(const Timeline&) = delete;

    // Brand new timeline: creates the directory and the first manifest.
    [[nodiscard]] std::error_code initialize(std::uint64_t last_record_lsn,
                                             std::uint64_t prev_record_lsn,
                                             std::uint64_t gc_cutoff_lsn);
    // Rebuilds the layer set and LSN metadata from the manifest in `directory`.
    [[nodiscard]] static std::error_code load(const std::filesystem::path& directory,
                                              TimelineConfig config,
                                              TimelineResources resources,
                                              std::shared_ptr<Timeline>& out);

    // Seeds a fresh root timeline with an image layer at `lsn`.
    [[nodiscard]] std::error_code import_images(const std::vector<std::pair<storage::Key, std::vector<std::byte>>>& pages,
                                                std::uint64_t lsn);

    [[nodiscard]] std::error_code ingest(const storage::WalRecord& record);
    // Where the WAL source must resume after restart.
    [[nodiscard]] std::uint64_t resume_lsn() const noexcept;

    [[nodiscard]] std::error_code get_page(const storage::Key& key, std::uint64_t lsn, std::vector<std::byte>& out);
    [[nodiscard]] std::error_code get_page_latest(const storage::Key& key, std::vector<std::byte>& out);
    [[nodiscard]] std::error_code wait_lsn(std::uint64_t lsn, std::chrono::milliseconds timeout);
    [[nodiscard]] std::error_code wait_lsn(std::uint64_t lsn);

    // Reconstruction without bounds checks against last_record_lsn; used for
    // child read-through and image creation.
    [[nodiscard]] std::error_code reconstruct_page(const storage::Key& key, std::uint64_t lsn, std::vector<std::byte>& out);
    // Keys with a version at or below `lsn`, including keys inherited from ancestors.
    [[nodiscard]] std::error_code collect_keys(std::uint64_t lsn, std::set<storage::Key>& out);

    // Freezes the open layer when it is over the size or age threshold.
    bool maybe_freeze();
    // Returns false when the open layer was empty.
    bool freeze_open_layer();
    [[nodiscard]] std::error_code flush_frozen_layers();
    [[nodiscard]] std::error_code upload_layers();
    [[nodiscard]] std::error_code evict_layers();
    // Freeze, flush and upload.
    [[nodiscard]] std::error_code checkpoint();

    // Stops ingestion after a protocol error at `lsn`.
    void mark_broken(const std::error_code& ec, std::uint64_t lsn);

    void set_flush_hook(FlushHook hook);
    void shutdown();
    [[nodiscard]] std::error_code delete_storage();

    [[nodiscard]] const TimelineId& id() const noexcept;
    [[nodiscard]] const std::optional<TimelineId>& ancestor_id() const noexcept;
    [[nodiscard]] std::uint64_t ancestor_lsn() const noexcept;
    [[nodiscard]] const std::filesystem::path& directory() const noexcept;
    [[nodiscard]] const TimelineConfig& config() const noexcept;

    [[nodiscard]] std::uint64_t last_record_lsn() const noexcept;
    [[nodiscard]] std::uint64_t prev_record_lsn() const noexcept;
    [[nodiscard]] std::uint64_t disk_consistent_lsn() const noexcept;
    [[nodiscard]] std::uint64_t remote_consistent_lsn() const noexcept;
    [[nodiscard]] std::uint64_t gc_cutoff_lsn() const noexcept;
    [[nodiscard]] TimelineState state() const noexcept;
    [[nodiscard]] bool cancelled() const noexcept;

    [[nodiscard]] std::shared_ptr<const storage::LayerMapSnapshot> layers() const;
    [[nodiscard]] TimelineManifest manifest() const;
    [[nodiscard]] TimelineInfo info() const;
    [[nodiscard]] TimelineTelemetrySnapshot telemetry_snapshot() const;

private:
    friend class Compactor;
    friend class GarbageCollector;

    struct Telemetry final {
        std::atomic<std::uint64_t> records_ingested{0U};
        std::atomic<std::uint64_t> bytes_ingested{0U};
        std::atomic<std::uint64_t> layers_frozen{0U};
        std::atomic<std::uint64_t> layers_flushed{0U};
        std::atomic<std::uint64_t> flush_bytes{0U};
        std::atomic<std::uint64_t> layers_uploaded{0U};
        std::atomic<std::uint64_t> upload_failures{0U};
        std::atomic<std::uint64_t> compactions{0U};
        std::atomic<std::uint64_t> compaction_layers_in{0U};
        std::atomic<std::uint64_t> compaction_layers_out{0U};
        std::atomic<std::uint64_t> images_created{0U};
        std::atomic<std::uint64_t> gc_runs{0U};
        std::atomic<std::uint64_t> layers_removed{0U};
        std::atomic<std::uint64_t> page_reconstructions{0U};
        std::atomic<std::uint64_t> cache_hits{0U};
        std::atomic<std::uint64_t> reconstruct_failures{0U};
        std::atomic<std::uint64_t> backpressure_waits{0U};
    };

    // LSNs recorded in the manifest. Guarded by layer_write_mutex_.
    struct DurableLsns final {
        std::uint64_t disk_consistent_lsn = 0U;
        std::uint64_t prev_record_lsn = 0U;
        std::uint64_t gc_cutoff_lsn = 0U;
        std::uint64_t remote_consistent_lsn = 0U;
    };

    [[nodiscard]] std::error_code check_readable() const;
    // LsnTooOld when a read at `lsn` resolves through an ancestor whose GC
    // cutoff has passed it.
    [[nodiscard]] std::error_code check_ancestor_cutoff(std::uint64_t lsn) const;
    [[nodiscard]] std::error_code fail_ingest(std::error_code ec, const storage::WalRecord& record);
    bool freeze_locked();
    void wait_for_frozen_capacity();

    [[nodiscard]] std::uint64_t allocate_sequence() noexcept;
    [[nodiscard]] std::string remote_key(const storage::LayerDescriptor& descriptor) const;
    [[nodiscard]] std::filesystem::path layer_path(const storage::LayerDescriptor& descriptor) const;
    [[nodiscard]] std::shared_ptr<storage::PersistentLayer> make_layer(const storage::LayerDescriptor& descriptor,
                                                                       std::uint64_t file_size) const;
    [[nodiscard]] std::error_code write_layer(storage::LayerFileWriter& writer,
                                              std::shared_ptr<storage::PersistentLayer>& out) const;

    [[nodiscard]] TimelineManifest manifest_for(const storage::LayerMapSnapshot& snapshot,
                                                const DurableLsns& lsns) const;
    // Persists the manifest for the post-update layer set, then publishes it.
    // Caller holds layer_write_mutex_.
    [[nodiscard]] std::error_code publish_locked(const storage::LayerMapUpdate& update, const DurableLsns& lsns);
    [[nodiscard]] std::error_code remove_stray_files(const TimelineManifest& manifest) const;

    TimelineId id_{};
    std::optional<TimelineId> ancestor_id_{};
    std::uint64_t ancestor_lsn_ = 0U;
    std::filesystem::path directory_{};
    TimelineConfig config_{};
    TimelineResources resources_{};

    storage::LayerMap layer_map_{};

    std::atomic<std::uint64_t> last_record_lsn_{0U};
    std::atomic<std::uint64_t> prev_record_lsn_{0U};
    std::atomic<std::uint64_t> disk_consistent_lsn_{0U};
    std::atomic<std::uint64_t> remote_consistent_lsn_{0U};
    std::atomic<std::uint64_t> gc_cutoff_lsn_{0U};
    std::atomic<std::uint64_t> next_sequence_{1U};
    std::atomic<TimelineState> state_{TimelineState::Loading};
    std::atomic_bool cancelled_{false};

    std::mutex ingest_mutex_{};
    std::mutex flush_mutex_{};
    std::mutex upload_mutex_{};
    std::mutex maintenance_mutex_{};
    mutable std::mutex layer_write_mutex_{};
    DurableLsns durable_{};
    // prev_record_lsn at each frozen layer's end LSN.
    std::map<std::uint64_t, std::uint64_t> frozen_prev_lsns_{};

    mutable std::mutex lsn_mutex_{};
    std::condition_variable lsn_cv_{};
    std::condition_variable frozen_cv_{};
    FlushHook flush_hook_{};

    Telemetry telemetry_{};
};

}  // namespace strata::timeline
