#include "strata/timeline/timeline_registry.hpp"

#include "strata/storage/storage_errors.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace strata::timeline {

using storage::StorageErrc;

namespace {

constexpr const char* kTimelinesDirectory = "timelines";

std::string telemetry_identifier(const TimelineId& id)
{
    return "timeline/" + id.to_string();
}

void keep_first_failure(std::error_code& first, const std::error_code& ec)
{
    if (ec && ec != StorageErrc::Cancelled && !first) {
        first = ec;
    }
}

}  // namespace

TimelineRegistry::TimelineRegistry(RegistryConfig config)
    : config_{std::move(config)}
{
    if (config_.data_dir.empty()) {
        throw std::invalid_argument{"TimelineRegistry requires a data directory"};
    }
    if (config_.flush_period.count() <= 0) {
        throw std::invalid_argument{"TimelineRegistry flush period must be positive"};
    }

    if (config_.async_io_instance) {
        io_ = config_.async_io_instance;
    } else {
        io_ = std::shared_ptr<storage::AsyncIo>(storage::create_async_io(config_.async_io).release());
        owns_io_ = true;
    }
    page_cache_ = std::make_shared<PageCache>(config_.page_cache);

    if (config_.telemetry_registry) {
        config_.telemetry_registry->register_page_cache("page_cache", [cache = page_cache_]() {
            return cache->telemetry_snapshot();
        });
    }
}

TimelineRegistry::~TimelineRegistry()
{
    shutdown();
}

TimelineResources TimelineRegistry::make_resources()
{
    TimelineResources resources{};
    resources.io = io_;
    resources.remote = config_.remote;
    resources.page_cache = page_cache_;
    resources.resolve_ancestor = [this](const TimelineId& id) { return get(id); };
    return resources;
}

std::filesystem::path TimelineRegistry::timeline_directory(const TimelineId& id) const
{
    return config_.data_dir / kTimelinesDirectory / id.to_string();
}

std::error_code TimelineRegistry::load()
{
    const auto root = config_.data_dir / kTimelinesDirectory;
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) {
        LOG(ERROR) << "Failed to create " << root << ": " << ec.message();
        return ec;
    }

    std::filesystem::directory_iterator it{root, ec};
    if (ec) {
        return ec;
    }

    std::vector<std::shared_ptr<Timeline>> loaded;
    for (const auto& entry : it) {
        if (!entry.is_directory(ec)) {
            continue;
        }
        const auto id = TimelineId::parse(entry.path().filename().string());
        if (!id) {
            LOG(WARNING) << "Ignoring unexpected entry " << entry.path();
            continue;
        }
        if (get(*id)) {
            continue;
        }

        // A directory without a manifest is a creation that never completed.
        if (!std::filesystem::exists(entry.path() / kManifestFileName, ec)) {
            LOG(WARNING) << "Removing timeline directory without a manifest: " << entry.path();
            std::filesystem::remove_all(entry.path(), ec);
            if (ec) {
                return ec;
            }
            continue;
        }

        std::shared_ptr<Timeline> timeline;
        try {
            if (auto load_ec = Timeline::load(entry.path(), config_.timeline, make_resources(), timeline); load_ec) {
                return load_ec;
            }
        } catch (const std::exception& error) {
            LOG(ERROR) << "Failed to load timeline " << entry.path() << ": " << error.what();
            return std::make_error_code(std::errc::invalid_argument);
        }
        loaded.push_back(timeline);
        attach(timeline);
    }

    for (const auto& timeline : loaded) {
        const auto& ancestor = timeline->ancestor_id();
        if (ancestor && !get(*ancestor)) {
            LOG(ERROR) << "Timeline " << timeline->id().to_string() << " references missing ancestor "
                       << ancestor->to_string();
        }
    }

    LOG(INFO) << "Loaded " << loaded.size() << " timelines from " << root;
    return {};
}

void TimelineRegistry::attach(const std::shared_ptr<Timeline>& timeline)
{
    bool loops_started = false;
    {
        std::lock_guard lock(mutex_);
        timelines_.insert_or_assign(timeline->id(), timeline);
        loops_started = loops_started_;
    }

    if (loops_started) {
        auto* loop = flush_loop_.get();
        timeline->set_flush_hook([loop]() { loop->request_force_run(); });
    }
    if (config_.telemetry_registry) {
        std::weak_ptr<Timeline> weak = timeline;
        config_.telemetry_registry->register_timeline(telemetry_identifier(timeline->id()), [weak]() {
            const auto strong = weak.lock();
            return strong ? strong->telemetry_snapshot() : TimelineTelemetrySnapshot{};
        });
    }
}

void TimelineRegistry::detach(const Timeline& timeline)
{
    if (config_.telemetry_registry) {
        config_.telemetry_registry->unregister_timeline(telemetry_identifier(timeline.id()));
    }
    std::lock_guard lock(mutex_);
    timelines_.erase(timeline.id());
}

void TimelineRegistry::start_background_loops()
{
    {
        std::lock_guard lock(mutex_);
        if (loops_started_) {
            return;
        }
    }

    flush_loop_ = std::make_unique<BackgroundLoop>(
        BackgroundLoop::Config{"flush", config_.flush_period, false},
        [this](bool force) { return run_flush_pass(force); });
    compaction_loop_ = std::make_unique<BackgroundLoop>(
        BackgroundLoop::Config{"compaction", config_.timeline.compaction_period, false},
        [this](bool force) { return run_compaction_pass(force); });
    gc_loop_ = std::make_unique<BackgroundLoop>(
        BackgroundLoop::Config{"gc", config_.timeline.gc_period, false},
        [this](bool force) { return run_gc_pass(force); });

    flush_loop_->start();
    compaction_loop_->start();
    gc_loop_->start();

    {
        std::lock_guard lock(mutex_);
        loops_started_ = true;
    }
    auto* loop = flush_loop_.get();
    for (const auto& timeline : snapshot_timelines()) {
        timeline->set_flush_hook([loop]() { loop->request_force_run(); });
    }
    LOG(INFO) << "Started background loops for " << config_.data_dir;
}

void TimelineRegistry::shutdown()
{
    const auto timelines = snapshot_timelines();
    for (const auto& timeline : timelines) {
        timeline->shutdown();
    }

    if (gc_loop_) {
        gc_loop_->stop();
    }
    if (compaction_loop_) {
        compaction_loop_->stop();
    }
    if (flush_loop_) {
        flush_loop_->stop();
    }

    if (config_.telemetry_registry) {
        for (const auto& timeline : timelines) {
            config_.telemetry_registry->unregister_timeline(telemetry_identifier(timeline->id()));
        }
        config_.telemetry_registry->unregister_page_cache("page_cache");
    }

    {
        std::lock_guard lock(mutex_);
        timelines_.clear();
        loops_started_ = false;
    }

    if (owns_io_ && io_) {
        io_->shutdown();
    }
}

std::error_code TimelineRegistry::create_timeline(std::optional<TimelineId> id, TimelineId& out)
{
    std::lock_guard lifecycle_lock(lifecycle_mutex_);
    const auto timeline_id = id.value_or(TimelineId::generate());
    const auto directory = timeline_directory(timeline_id);
    if (get(timeline_id) || std::filesystem::exists(directory)) {
        return make_error_code(StorageErrc::TimelineAlreadyExists);
    }

    std::shared_ptr<Timeline> timeline;
    try {
        timeline = std::make_shared<Timeline>(timeline_id, std::nullopt, 0U, directory, config_.timeline, make_resources());
    } catch (const std::exception& error) {
        LOG(ERROR) << "Invalid timeline configuration: " << error.what();
        return std::make_error_code(std::errc::invalid_argument);
    }

    if (auto ec = timeline->initialize(0U, 0U, 0U); ec) {
        return ec;
    }
    attach(timeline);
    out = timeline_id;
    return {};
}

std::error_code TimelineRegistry::create_branch(const TimelineId& ancestor_id,
                                                std::uint64_t at_lsn,
                                                std::optional<TimelineId> id,
                                                TimelineId& out)
{
    std::lock_guard lifecycle_lock(lifecycle_mutex_);

    const auto ancestor = get(ancestor_id);
    if (!ancestor) {
        return make_error_code(StorageErrc::TimelineNotFound);
    }
    if (ancestor->state() == TimelineState::Stopping) {
        return make_error_code(StorageErrc::TimelineStopping);
    }
    if (at_lsn > ancestor->last_record_lsn()) {
        return make_error_code(StorageErrc::LsnInFuture);
    }
    if (at_lsn < ancestor->gc_cutoff_lsn()) {
        return make_error_code(StorageErrc::BranchPointTooOld);
    }

    const auto timeline_id = id.value_or(TimelineId::generate());
    const auto directory = timeline_directory(timeline_id);
    if (get(timeline_id) || std::filesystem::exists(directory)) {
        return make_error_code(StorageErrc::TimelineAlreadyExists);
    }

    // The branch point must survive an ancestor restart.
    if (at_lsn > ancestor->disk_consistent_lsn()) {
        ancestor->freeze_open_layer();
        if (auto ec = ancestor->flush_frozen_layers(); ec) {
            LOG(WARNING) << "Failed to flush ancestor " << ancestor_id.to_string() << " before branching: " << ec.message();
            return ec;
        }
    }

    const auto prev_record_lsn = at_lsn == ancestor->last_record_lsn() ? ancestor->prev_record_lsn() : 0U;

    std::shared_ptr<Timeline> timeline;
    try {
        timeline = std::make_shared<Timeline>(timeline_id, ancestor_id, at_lsn, directory, config_.timeline, make_resources());
    } catch (const std::exception& error) {
        LOG(ERROR) << "Invalid timeline configuration: " << error.what();
        return std::make_error_code(std::errc::invalid_argument);
    }

    if (auto ec = timeline->initialize(at_lsn, prev_record_lsn, ancestor->gc_cutoff_lsn()); ec) {
        return ec;
    }
    attach(timeline);
    out = timeline_id;
    return {};
}

bool TimelineRegistry::has_children_locked(const TimelineId& id) const
{
    return std::any_of(timelines_.begin(), timelines_.end(), [&id](const auto& entry) {
        const auto& ancestor = entry.second->ancestor_id();
        return ancestor && *ancestor == id;
    });
}

std::error_code TimelineRegistry::delete_timeline(const TimelineId& id)
{
    std::lock_guard lifecycle_lock(lifecycle_mutex_);

    std::shared_ptr<Timeline> timeline;
    {
        std::lock_guard lock(mutex_);
        const auto it = timelines_.find(id);
        if (it == timelines_.end()) {
            return make_error_code(StorageErrc::TimelineNotFound);
        }
        if (has_children_locked(id)) {
            return make_error_code(StorageErrc::TimelineHasChildren);
        }
        timeline = it->second;
    }

    detach(*timeline);
    return timeline->delete_storage();
}

std::shared_ptr<Timeline> TimelineRegistry::get(const TimelineId& id) const
{
    std::lock_guard lock(mutex_);
    const auto it = timelines_.find(id);
    return it == timelines_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<Timeline>> TimelineRegistry::snapshot_timelines() const
{
    std::vector<std::shared_ptr<Timeline>> result;
    std::lock_guard lock(mutex_);
    result.reserve(timelines_.size());
    for (const auto& [_, timeline] : timelines_) {
        result.push_back(timeline);
    }
    return result;
}

std::error_code TimelineRegistry::get_page(const TimelineId& id,
                                           const storage::Key& key,
                                           std::uint64_t lsn,
                                           std::vector<std::byte>& out)
{
    const auto timeline = get(id);
    if (!timeline) {
        return make_error_code(StorageErrc::TimelineNotFound);
    }
    return timeline->get_page(key, lsn, out);
}

std::error_code TimelineRegistry::get_last_record_lsn(const TimelineId& id, std::uint64_t& out) const
{
    const auto timeline = get(id);
    if (!timeline) {
        return make_error_code(StorageErrc::TimelineNotFound);
    }
    out = timeline->last_record_lsn();
    return {};
}

std::error_code TimelineRegistry::timeline_info(const TimelineId& id, TimelineInfo& out) const
{
    const auto timeline = get(id);
    if (!timeline) {
        return make_error_code(StorageErrc::TimelineNotFound);
    }
    out = timeline->info();
    return {};
}

std::vector<TimelineInfo> TimelineRegistry::list_timelines() const
{
    std::vector<TimelineInfo> result;
    for (const auto& timeline : snapshot_timelines()) {
        result.push_back(timeline->info());
    }
    std::sort(result.begin(), result.end(), [](const TimelineInfo& lhs, const TimelineInfo& rhs) { return lhs.id < rhs.id; });
    return result;
}

std::error_code TimelineRegistry::import_images(const TimelineId& id,
                                                const std::vector<std::pair<storage::Key, std::vector<std::byte>>>& pages,
                                                std::uint64_t lsn)
{
    const auto timeline = get(id);
    if (!timeline) {
        return make_error_code(StorageErrc::TimelineNotFound);
    }
    return timeline->import_images(pages, lsn);
}

std::error_code TimelineRegistry::checkpoint(const TimelineId& id)
{
    const auto timeline = get(id);
    if (!timeline) {
        return make_error_code(StorageErrc::TimelineNotFound);
    }
    return timeline->checkpoint();
}

std::error_code TimelineRegistry::compact(const TimelineId& id, bool force, CompactionResult& result)
{
    const auto timeline = get(id);
    if (!timeline) {
        return make_error_code(StorageErrc::TimelineNotFound);
    }
    Compactor compactor{*timeline};
    return compactor.run(force, result);
}

std::vector<std::uint64_t> TimelineRegistry::retain_lsns(const TimelineId& id) const
{
    std::vector<std::uint64_t> result;
    std::lock_guard lock(mutex_);
    for (const auto& [_, timeline] : timelines_) {
        const auto& ancestor = timeline->ancestor_id();
        if (ancestor && *ancestor == id) {
            result.push_back(timeline->ancestor_lsn());
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::error_code TimelineRegistry::gc(const TimelineId& id, std::optional<std::uint64_t> horizon, GcResult& result)
{
    std::lock_guard lifecycle_lock(lifecycle_mutex_);
    const auto timeline = get(id);
    if (!timeline) {
        return make_error_code(StorageErrc::TimelineNotFound);
    }
    GarbageCollector collector{*timeline};
    return collector.run(horizon.value_or(config_.timeline.gc_horizon), retain_lsns(id), result);
}

std::error_code TimelineRegistry::run_flush_pass(bool)
{
    std::error_code first_failure;
    for (const auto& timeline : snapshot_timelines()) {
        if (timeline->state() != TimelineState::Active) {
            continue;
        }
        timeline->maybe_freeze();
        keep_first_failure(first_failure, timeline->flush_frozen_layers());
        keep_first_failure(first_failure, timeline->upload_layers());
    }
    return first_failure;
}

std::error_code TimelineRegistry::run_compaction_pass(bool force)
{
    std::error_code first_failure;
    for (const auto& timeline : snapshot_timelines()) {
        if (timeline->state() != TimelineState::Active) {
            continue;
        }
        CompactionResult result{};
        Compactor compactor{*timeline};
        keep_first_failure(first_failure, compactor.run(force, result));
    }
    return first_failure;
}

std::error_code TimelineRegistry::run_gc_pass(bool)
{
    std::error_code first_failure;
    for (const auto& timeline : snapshot_timelines()) {
        if (timeline->state() == TimelineState::Stopping) {
            continue;
        }
        GcResult result{};
        if (const auto ec = gc(timeline->id(), std::nullopt, result); ec != StorageErrc::TimelineNotFound) {
            keep_first_failure(first_failure, ec);
        }
    }
    return first_failure;
}

const std::filesystem::path& TimelineRegistry::data_dir() const noexcept
{
    return config_.data_dir;
}

const std::shared_ptr<PageCache>& TimelineRegistry::page_cache() const noexcept
{
    return page_cache_;
}

std::shared_ptr<storage::AsyncIo> TimelineRegistry::async_io() const noexcept
{
    return io_;
}

const BackgroundLoop* TimelineRegistry::flush_loop() const noexcept
{
    return flush_loop_.get();
}

}  // namespace strata::timeline
