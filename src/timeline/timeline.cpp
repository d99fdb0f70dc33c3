#include "strata/timeline/timeline.hpp"

#include "strata/storage/storage_errors.hpp"
#include "strata/timeline/page_reconstruct.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <stdexcept>

namespace strata::timeline {

using storage::InMemoryLayer;
using storage::LayerDescriptor;
using storage::LayerKind;
using storage::LayerMapUpdate;
using storage::PersistentLayer;
using storage::StorageErrc;

namespace {

std::uint64_t open_layer_start(std::uint64_t last_record_lsn) noexcept
{
    return last_record_lsn == 0U ? 0U : last_record_lsn + 1U;
}

bool is_staging_file(const std::filesystem::path& path)
{
    const auto extension = path.extension();
    return extension == ".tmp" || extension == ".download";
}

}  // namespace

const char* to_string(TimelineState state) noexcept
{
    switch (state) {
    case TimelineState::Loading:
        return "loading";
    case TimelineState::Active:
        return "active";
    case TimelineState::Stopping:
        return "stopping";
    case TimelineState::Broken:
        return "broken";
    }
    return "unknown";
}

Timeline::Timeline(TimelineId id,
                   std::optional<TimelineId> ancestor_id,
                   std::uint64_t ancestor_lsn,
                   std::filesystem::path directory,
                   TimelineConfig config,
                   TimelineResources resources)
    : id_{id}
    , ancestor_id_{std::move(ancestor_id)}
    , ancestor_lsn_{ancestor_lsn}
    , directory_{std::move(directory)}
    , config_{config}
    , resources_{std::move(resources)}
{
    if (!resources_.io) {
        throw std::invalid_argument{"Timeline requires a valid AsyncIo instance"};
    }
    if (directory_.empty()) {
        throw std::invalid_argument{"Timeline requires a directory"};
    }
    if (config_.checkpoint_distance == 0U || config_.compaction_target_size == 0U) {
        throw std::invalid_argument{"Timeline layer size thresholds must be positive"};
    }
    if (config_.compaction_threshold < 2U || config_.image_creation_threshold == 0U) {
        throw std::invalid_argument{"Timeline compaction thresholds are out of range"};
    }
    if (ancestor_id_ && *ancestor_id_ == id_) {
        throw std::invalid_argument{"Timeline cannot be its own ancestor"};
    }
}

Timeline::~Timeline()
{
    shutdown();
}

std::error_code Timeline::initialize(std::uint64_t last_record_lsn,
                                     std::uint64_t prev_record_lsn,
                                     std::uint64_t gc_cutoff_lsn)
{
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        LOG(ERROR) << "Failed to create timeline directory " << directory_ << ": " << ec.message();
        return ec;
    }

    std::lock_guard ingest_lock(ingest_mutex_);
    std::lock_guard write_lock(layer_write_mutex_);

    LayerMapUpdate update{};
    update.replace_open_layer = true;
    update.open_layer = std::make_shared<InMemoryLayer>(open_layer_start(last_record_lsn), allocate_sequence());

    DurableLsns lsns{};
    lsns.disk_consistent_lsn = last_record_lsn;
    lsns.prev_record_lsn = prev_record_lsn;
    lsns.gc_cutoff_lsn = gc_cutoff_lsn;
    lsns.remote_consistent_lsn = last_record_lsn;
    if (ec = publish_locked(update, lsns); ec) {
        return ec;
    }

    last_record_lsn_.store(last_record_lsn, std::memory_order_release);
    prev_record_lsn_.store(prev_record_lsn, std::memory_order_release);
    state_.store(TimelineState::Active, std::memory_order_release);

    LOG(INFO) << "Created timeline " << id_.to_string() << " at lsn " << storage::format_lsn(last_record_lsn)
              << (ancestor_id_ ? " branched from " + ancestor_id_->to_string() : std::string{});
    return {};
}

std::error_code Timeline::load(const std::filesystem::path& directory,
                               TimelineConfig config,
                               TimelineResources resources,
                               std::shared_ptr<Timeline>& out)
{
    if (!resources.io) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    TimelineManifest manifest{};
    if (auto ec = read_manifest(*resources.io, directory / kManifestFileName, manifest); ec) {
        LOG(ERROR) << "Failed to read manifest in " << directory << ": " << ec.message();
        return ec;
    }
    if (manifest.timeline_id.to_string() != directory.filename().string()) {
        LOG(ERROR) << "Manifest in " << directory << " belongs to timeline " << manifest.timeline_id.to_string();
        return make_error_code(StorageErrc::CorruptManifest);
    }

    auto timeline = std::make_shared<Timeline>(manifest.timeline_id,
                                               manifest.ancestor_id,
                                               manifest.ancestor_lsn,
                                               directory,
                                               config,
                                               std::move(resources));
    timeline->next_sequence_.store(manifest.next_sequence, std::memory_order_release);

    LayerMapUpdate update{};
    for (const auto& entry : manifest.layers) {
        auto layer = timeline->make_layer(entry.descriptor, entry.file_size);
        layer->set_uploaded(entry.uploaded);
        if (!layer->local_file_present() && !(entry.uploaded && timeline->resources_.remote)) {
            LOG(ERROR) << "Layer " << entry.descriptor.to_string() << " of timeline " << manifest.timeline_id.to_string()
                       << " has neither a local file nor a remote copy";
            return make_error_code(StorageErrc::CorruptLayer);
        }
        update.historic_added.push_back(std::move(layer));
    }

    if (auto ec = timeline->remove_stray_files(manifest); ec) {
        LOG(WARNING) << "Failed to clean up timeline directory " << directory << ": " << ec.message();
    }

    update.replace_open_layer = true;
    update.open_layer = std::make_shared<InMemoryLayer>(open_layer_start(manifest.disk_consistent_lsn),
                                                        timeline->allocate_sequence());
    {
        std::lock_guard lock(timeline->layer_write_mutex_);
        timeline->layer_map_.apply(update);
        timeline->durable_ = DurableLsns{manifest.disk_consistent_lsn,
                                         manifest.prev_record_lsn,
                                         manifest.gc_cutoff_lsn,
                                         manifest.remote_consistent_lsn};
    }

    timeline->last_record_lsn_.store(manifest.disk_consistent_lsn, std::memory_order_release);
    timeline->prev_record_lsn_.store(manifest.prev_record_lsn, std::memory_order_release);
    timeline->disk_consistent_lsn_.store(manifest.disk_consistent_lsn, std::memory_order_release);
    timeline->remote_consistent_lsn_.store(manifest.remote_consistent_lsn, std::memory_order_release);
    timeline->gc_cutoff_lsn_.store(manifest.gc_cutoff_lsn, std::memory_order_release);
    timeline->state_.store(TimelineState::Active, std::memory_order_release);

    LOG(INFO) << "Loaded timeline " << manifest.timeline_id.to_string() << " with " << manifest.layers.size()
              << " layers at disk_consistent_lsn " << storage::format_lsn(manifest.disk_consistent_lsn);
    out = std::move(timeline);
    return {};
}

std::error_code Timeline::remove_stray_files(const TimelineManifest& manifest) const
{
    std::error_code ec;
    std::filesystem::directory_iterator it{directory_, ec};
    if (ec) {
        return ec;
    }

    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        const auto name = entry.path().filename().string();
        if (name == kManifestFileName) {
            continue;
        }

        bool stray = is_staging_file(entry.path());
        if (!stray) {
            const auto descriptor = LayerDescriptor::parse_file_name(name);
            stray = descriptor.has_value()
                    && std::none_of(manifest.layers.begin(), manifest.layers.end(), [&](const ManifestLayer& layer) {
                           return layer.descriptor.file_name() == name;
                       });
        }
        if (stray) {
            std::filesystem::remove(entry.path(), ec);
            if (ec) {
                return ec;
            }
            LOG(INFO) << "Removed leftover file " << entry.path();
        }
    }
    return {};
}

std::error_code Timeline::import_images(const std::vector<std::pair<storage::Key, std::vector<std::byte>>>& pages,
                                        std::uint64_t lsn)
{
    if (auto ec = check_readable(); ec) {
        return ec;
    }

    std::lock_guard ingest_lock(ingest_mutex_);
    const auto snapshot = layer_map_.snapshot();
    if (ancestor_id_ || !snapshot->historic_layers().empty() || !snapshot->frozen_layers().empty()
        || !snapshot->open_layer()->empty() || last_record_lsn() > lsn) {
        return std::make_error_code(std::errc::operation_not_permitted);
    }

    if (lsn >= storage::kMaxLsn - 1U) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    auto sorted = pages;
    std::sort(sorted.begin(), sorted.end(), [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });

    LayerDescriptor descriptor{};
    descriptor.kind = LayerKind::Image;
    descriptor.key_range = storage::KeyRange::full();
    descriptor.lsn_range = storage::LsnRange{lsn, lsn + 1U};
    descriptor.sequence = allocate_sequence();

    storage::LayerFileWriter writer{descriptor};
    for (const auto& [key, page] : sorted) {
        if (auto ec = writer.append(key, lsn, storage::PageValue::image(page)); ec) {
            return ec;
        }
    }

    std::shared_ptr<PersistentLayer> layer;
    if (auto ec = write_layer(writer, layer); ec) {
        return ec;
    }

    {
        std::lock_guard write_lock(layer_write_mutex_);
        LayerMapUpdate update{};
        update.replace_open_layer = true;
        update.open_layer = std::make_shared<InMemoryLayer>(lsn + 1U, allocate_sequence());
        update.historic_added.push_back(layer);

        auto lsns = durable_;
        lsns.disk_consistent_lsn = lsn;
        lsns.prev_record_lsn = 0U;
        if (auto ec = publish_locked(update, lsns); ec) {
            layer->mark_for_deletion();
            return ec;
        }
    }

    {
        std::lock_guard lock(lsn_mutex_);
        last_record_lsn_.store(lsn, std::memory_order_release);
        prev_record_lsn_.store(0U, std::memory_order_release);
    }
    lsn_cv_.notify_all();

    LOG(INFO) << "Imported " << sorted.size() << " page images into timeline " << id_.to_string() << " at lsn "
              << storage::format_lsn(lsn);
    if (auto ec = upload_layers(); ec) {
        LOG(WARNING) << "Upload after import failed, retrying on the next pass: " << ec.message();
    }
    return {};
}

void Timeline::mark_broken(const std::error_code& ec, std::uint64_t lsn)
{
    state_.store(TimelineState::Broken, std::memory_order_release);
    LOG(ERROR) << "Timeline " << id_.to_string() << " stopped ingesting at lsn " << storage::format_lsn(lsn)
               << " (last_record_lsn " << storage::format_lsn(last_record_lsn()) << "): " << ec.message();
    {
        std::lock_guard lock(lsn_mutex_);
        lsn_cv_.notify_all();
    }
}

std::error_code Timeline::fail_ingest(std::error_code ec, const storage::WalRecord& record)
{
    if (storage::classify(ec) == storage::StorageErrorClass::Protocol) {
        mark_broken(ec, record.lsn);
    }
    return ec;
}

std::error_code Timeline::ingest(const storage::WalRecord& record)
{
    switch (state()) {
    case TimelineState::Broken:
        return make_error_code(StorageErrc::TimelineBroken);
    case TimelineState::Loading:
    case TimelineState::Stopping:
        return make_error_code(StorageErrc::TimelineStopping);
    case TimelineState::Active:
        break;
    }

    std::unique_lock ingest_lock(ingest_mutex_);
    if (record.lsn <= last_record_lsn()) {
        return fail_ingest(make_error_code(StorageErrc::LsnOutOfOrder), record);
    }
    // The open layer ends at lsn + 1, so the top LSN cannot be stored.
    if (record.lsn == storage::kMaxLsn) {
        return fail_ingest(make_error_code(StorageErrc::CorruptWalRecord), record);
    }

    std::set<storage::Key> touched;
    for (const auto& block : record.blocks) {
        if (block.key == storage::Key::max() || !touched.insert(block.key).second) {
            return fail_ingest(make_error_code(StorageErrc::CorruptWalRecord), record);
        }
    }

    const auto open = layer_map_.snapshot()->open_layer();
    std::uint64_t bytes = 0U;
    for (const auto& block : record.blocks) {
        bytes += block.value.bytes.size();
        if (auto ec = open->put_value(block.key, record.lsn, block.value); ec) {
            return fail_ingest(ec, record);
        }
    }

    {
        std::lock_guard lock(lsn_mutex_);
        prev_record_lsn_.store(last_record_lsn_.load(std::memory_order_relaxed), std::memory_order_release);
        last_record_lsn_.store(record.lsn, std::memory_order_release);
    }
    lsn_cv_.notify_all();

    telemetry_.records_ingested.fetch_add(1U, std::memory_order_relaxed);
    telemetry_.bytes_ingested.fetch_add(bytes, std::memory_order_relaxed);

    const auto distance = open->size_bytes() >= config_.checkpoint_distance;
    const auto age = std::chrono::steady_clock::now() - open->created_at() >= config_.checkpoint_timeout;
    if (distance || age) {
        freeze_locked();
        ingest_lock.unlock();
        wait_for_frozen_capacity();
    }
    return {};
}

std::uint64_t Timeline::resume_lsn() const noexcept
{
    return disk_consistent_lsn();
}

bool Timeline::maybe_freeze()
{
    std::lock_guard ingest_lock(ingest_mutex_);
    const auto open = layer_map_.snapshot()->open_layer();
    if (!open || open->empty()) {
        return false;
    }
    const auto age = std::chrono::steady_clock::now() - open->created_at();
    if (open->size_bytes() < config_.checkpoint_distance && age < config_.checkpoint_timeout) {
        return false;
    }
    return freeze_locked();
}

bool Timeline::freeze_open_layer()
{
    std::lock_guard ingest_lock(ingest_mutex_);
    return freeze_locked();
}

bool Timeline::freeze_locked()
{
    FlushHook hook;
    {
        std::lock_guard write_lock(layer_write_mutex_);
        const auto open = layer_map_.snapshot()->open_layer();
        if (!open || open->empty()) {
            return false;
        }

        const auto end_lsn = last_record_lsn() + 1U;
        open->freeze(end_lsn);

        LayerMapUpdate update{};
        update.replace_open_layer = true;
        update.open_layer = std::make_shared<InMemoryLayer>(end_lsn, allocate_sequence());
        update.frozen_added.push_back(open);
        layer_map_.apply(update);
        frozen_prev_lsns_[end_lsn] = prev_record_lsn();

        VLOG(1) << "Froze open layer of timeline " << id_.to_string() << " at " << storage::format_lsn(end_lsn) << " ("
                << open->size_bytes() << " bytes)";
    }
    telemetry_.layers_frozen.fetch_add(1U, std::memory_order_relaxed);

    {
        std::lock_guard lock(lsn_mutex_);
        hook = flush_hook_;
    }
    if (hook) {
        hook();
    }
    return true;
}

void Timeline::wait_for_frozen_capacity()
{
    if (layer_map_.snapshot()->frozen_bytes() <= config_.max_frozen_bytes) {
        return;
    }

    bool has_hook = false;
    {
        std::lock_guard lock(lsn_mutex_);
        has_hook = static_cast<bool>(flush_hook_);
    }
    if (!has_hook) {
        // Nobody flushes in the background, so flush inline.
        if (auto ec = flush_frozen_layers(); ec) {
            LOG(WARNING) << "Inline flush of timeline " << id_.to_string() << " failed: " << ec.message();
        }
        return;
    }

    telemetry_.backpressure_waits.fetch_add(1U, std::memory_order_relaxed);
    std::unique_lock lock(lsn_mutex_);
    while (layer_map_.snapshot()->frozen_bytes() > config_.max_frozen_bytes && !cancelled()) {
        frozen_cv_.wait_for(lock, std::chrono::milliseconds{100});
    }
}

std::error_code Timeline::flush_frozen_layers()
{
    std::lock_guard flush_lock(flush_mutex_);

    while (true) {
        const auto snapshot = layer_map_.snapshot();
        if (snapshot->frozen_layers().empty()) {
            break;
        }
        if (cancelled()) {
            return make_error_code(StorageErrc::Cancelled);
        }

        const auto frozen = snapshot->frozen_layers().back();
        std::vector<storage::LayerEntry> entries;
        if (auto ec = frozen->load_entries(entries); ec) {
            return ec;
        }

        LayerDescriptor descriptor{};
        descriptor.kind = LayerKind::Delta;
        descriptor.key_range = storage::KeyRange::full();
        descriptor.lsn_range = storage::LsnRange{frozen->start_lsn(), frozen->end_lsn()};
        descriptor.sequence = frozen->sequence();

        std::shared_ptr<PersistentLayer> layer;
        if (!entries.empty()) {
            storage::LayerFileWriter writer{descriptor};
            for (const auto& entry : entries) {
                if (auto ec = writer.append(entry.key, entry.lsn, entry.value); ec) {
                    return ec;
                }
            }
            if (auto ec = write_layer(writer, layer); ec) {
                LOG(WARNING) << "Failed to write layer " << descriptor.to_string() << " of timeline " << id_.to_string()
                             << ", keeping it in memory: " << ec.message();
                return ec;
            }
        }

        {
            std::lock_guard write_lock(layer_write_mutex_);
            LayerMapUpdate update{};
            update.frozen_removed.push_back(frozen);
            if (layer) {
                update.historic_added.push_back(layer);
            }

            auto lsns = durable_;
            lsns.disk_consistent_lsn = frozen->end_lsn() - 1U;
            if (const auto it = frozen_prev_lsns_.find(frozen->end_lsn()); it != frozen_prev_lsns_.end()) {
                lsns.prev_record_lsn = it->second;
            }
            if (auto ec = publish_locked(update, lsns); ec) {
                if (layer) {
                    layer->mark_for_deletion();
                }
                return ec;
            }
            frozen_prev_lsns_.erase(frozen->end_lsn());
        }

        telemetry_.layers_flushed.fetch_add(1U, std::memory_order_relaxed);
        if (layer) {
            telemetry_.flush_bytes.fetch_add(layer->file_size(), std::memory_order_relaxed);
        }
        LOG(INFO) << "Flushed layer " << descriptor.to_string() << " of timeline " << id_.to_string() << " ("
                  << entries.size() << " entries, " << (layer ? layer->file_size() : 0U) << " bytes)";

        {
            std::lock_guard lock(lsn_mutex_);
            frozen_cv_.notify_all();
        }
    }
    return {};
}

std::error_code Timeline::upload_layers()
{
    if (!resources_.remote) {
        return {};
    }

    std::lock_guard upload_lock(upload_mutex_);
    const auto frontier = disk_consistent_lsn();
    const auto snapshot = layer_map_.snapshot();

    bool uploaded_any = false;
    for (const auto& layer : snapshot->historic_layers()) {
        if (layer->uploaded()) {
            continue;
        }
        if (auto ec = layer->upload(); ec) {
            telemetry_.upload_failures.fetch_add(1U, std::memory_order_relaxed);
            LOG(WARNING) << "Upload of layer " << layer->descriptor().to_string() << " failed: " << ec.message();
            return ec;
        }
        telemetry_.layers_uploaded.fetch_add(1U, std::memory_order_relaxed);
        uploaded_any = true;
    }

    if (uploaded_any || remote_consistent_lsn() < frontier) {
        std::lock_guard write_lock(layer_write_mutex_);
        auto lsns = durable_;
        lsns.remote_consistent_lsn = std::max(lsns.remote_consistent_lsn, frontier);
        if (auto ec = publish_locked(LayerMapUpdate{}, lsns); ec) {
            return ec;
        }
    }

    if (config_.evict_after_upload) {
        return evict_layers();
    }
    return {};
}

std::error_code Timeline::evict_layers()
{
    const auto snapshot = layer_map_.snapshot();
    for (const auto& layer : snapshot->historic_layers()) {
        if (!layer->uploaded() || !layer->local_file_present()) {
            continue;
        }
        if (auto ec = layer->evict(true); ec) {
            return ec;
        }
        VLOG(1) << "Evicted layer " << layer->descriptor().to_string();
    }
    return {};
}

std::error_code Timeline::checkpoint()
{
    freeze_open_layer();
    if (auto ec = flush_frozen_layers(); ec) {
        return ec;
    }
    return upload_layers();
}

std::error_code Timeline::check_readable() const
{
    const auto current = state();
    if (current == TimelineState::Stopping || current == TimelineState::Loading) {
        return make_error_code(StorageErrc::TimelineStopping);
    }
    return {};
}

std::error_code Timeline::get_page(const storage::Key& key, std::uint64_t lsn, std::vector<std::byte>& out)
{
    if (auto ec = check_readable(); ec) {
        return ec;
    }
    if (lsn > last_record_lsn()) {
        return make_error_code(StorageErrc::LsnInFuture);
    }
    if (lsn < gc_cutoff_lsn()) {
        return make_error_code(StorageErrc::LsnTooOld);
    }
    if (auto ec = check_ancestor_cutoff(lsn); ec) {
        return ec;
    }

    if (resources_.page_cache && resources_.page_cache->lookup(id_, key, lsn, out)) {
        telemetry_.cache_hits.fetch_add(1U, std::memory_order_relaxed);
        return {};
    }

    std::vector<std::byte> page;
    if (auto ec = reconstruct_page(key, lsn, page); ec) {
        telemetry_.reconstruct_failures.fetch_add(1U, std::memory_order_relaxed);
        // GC may have advanced past `lsn` while the read was in flight.
        if (lsn < gc_cutoff_lsn()) {
            return make_error_code(StorageErrc::LsnTooOld);
        }
        if (storage::classify(ec) == storage::StorageErrorClass::Corruption) {
            LOG(ERROR) << "Failed to reconstruct " << key.to_string() << " at " << storage::format_lsn(lsn)
                       << " on timeline " << id_.to_string() << ": " << ec.message();
        }
        return ec;
    }

    telemetry_.page_reconstructions.fetch_add(1U, std::memory_order_relaxed);
    if (resources_.page_cache) {
        resources_.page_cache->insert(id_, key, lsn, page);
    }
    out = std::move(page);
    return {};
}

std::error_code Timeline::check_ancestor_cutoff(std::uint64_t lsn) const
{
    // Nothing at or below the branch point is stored on this timeline.
    if (!ancestor_id_ || lsn > ancestor_lsn_) {
        return {};
    }
    const auto ancestor = resources_.resolve_ancestor ? resources_.resolve_ancestor(*ancestor_id_) : nullptr;
    if (!ancestor) {
        return {};
    }
    if (lsn < ancestor->gc_cutoff_lsn()) {
        return make_error_code(StorageErrc::LsnTooOld);
    }
    return ancestor->check_ancestor_cutoff(lsn);
}

std::error_code Timeline::get_page_latest(const storage::Key& key, std::vector<std::byte>& out)
{
    return get_page(key, last_record_lsn(), out);
}

std::error_code Timeline::wait_lsn(std::uint64_t lsn)
{
    return wait_lsn(lsn, config_.wait_lsn_timeout);
}

std::error_code Timeline::wait_lsn(std::uint64_t lsn, std::chrono::milliseconds timeout)
{
    std::unique_lock lock(lsn_mutex_);
    const bool reached = lsn_cv_.wait_for(lock, timeout, [this, lsn]() {
        return last_record_lsn() >= lsn || cancelled() || state() == TimelineState::Broken;
    });
    if (last_record_lsn() >= lsn) {
        return {};
    }
    if (state() == TimelineState::Broken) {
        return make_error_code(StorageErrc::TimelineBroken);
    }
    if (cancelled()) {
        return make_error_code(StorageErrc::TimelineStopping);
    }
    return reached ? std::error_code{} : make_error_code(StorageErrc::WaitLsnTimeout);
}

std::error_code Timeline::reconstruct_page(const storage::Key& key, std::uint64_t lsn, std::vector<std::byte>& out)
{
    const auto snapshot = layer_map_.snapshot();
    ReconstructState state{};
    if (auto ec = collect_reconstruct_data(snapshot->query(key, lsn), key, lsn, state); ec) {
        return ec;
    }
    if (state.has_base() || !ancestor_id_) {
        return state.materialize(nullptr, out);
    }

    auto ancestor = resources_.resolve_ancestor ? resources_.resolve_ancestor(*ancestor_id_) : nullptr;
    if (!ancestor) {
        LOG(ERROR) << "Ancestor " << ancestor_id_->to_string() << " of timeline " << id_.to_string() << " is not loaded";
        return make_error_code(StorageErrc::TimelineNotFound);
    }

    const auto ancestor_lsn = std::min(lsn, ancestor_lsn_);
    if (ancestor_lsn < ancestor->gc_cutoff_lsn()) {
        return make_error_code(StorageErrc::LsnTooOld);
    }

    std::vector<std::byte> base;
    if (auto ec = ancestor->reconstruct_page(key, ancestor_lsn, base); ec) {
        if (ec == StorageErrc::NoCoveringLayer && !state.empty()) {
            return make_error_code(StorageErrc::MissingBaseImage);
        }
        return ec;
    }
    return state.materialize(&base, out);
}

std::error_code Timeline::collect_keys(std::uint64_t lsn, std::set<storage::Key>& out)
{
    const auto snapshot = layer_map_.snapshot();
    std::vector<std::shared_ptr<const storage::Layer>> layers;
    if (snapshot->open_layer()) {
        layers.push_back(snapshot->open_layer());
    }
    layers.insert(layers.end(), snapshot->frozen_layers().begin(), snapshot->frozen_layers().end());
    layers.insert(layers.end(), snapshot->historic_layers().begin(), snapshot->historic_layers().end());

    for (const auto& layer : layers) {
        if (layer->descriptor().lsn_range.start > lsn) {
            continue;
        }
        if (auto ec = layer->collect_keys(lsn, out); ec) {
            return ec;
        }
    }

    if (!ancestor_id_) {
        return {};
    }
    auto ancestor = resources_.resolve_ancestor ? resources_.resolve_ancestor(*ancestor_id_) : nullptr;
    if (!ancestor) {
        return make_error_code(StorageErrc::TimelineNotFound);
    }
    return ancestor->collect_keys(std::min(lsn, ancestor_lsn_), out);
}

void Timeline::set_flush_hook(FlushHook hook)
{
    std::lock_guard lock(lsn_mutex_);
    flush_hook_ = std::move(hook);
}

void Timeline::shutdown()
{
    auto expected = TimelineState::Active;
    state_.compare_exchange_strong(expected, TimelineState::Stopping, std::memory_order_acq_rel);
    expected = TimelineState::Loading;
    state_.compare_exchange_strong(expected, TimelineState::Stopping, std::memory_order_acq_rel);
    cancelled_.store(true, std::memory_order_release);
    {
        std::lock_guard lock(lsn_mutex_);
        flush_hook_ = nullptr;
    }
    lsn_cv_.notify_all();
    frozen_cv_.notify_all();
}

std::error_code Timeline::delete_storage()
{
    shutdown();

    std::lock_guard flush_lock(flush_mutex_);
    std::lock_guard maintenance_lock(maintenance_mutex_);
    std::lock_guard write_lock(layer_write_mutex_);

    const auto snapshot = layer_map_.snapshot();
    LayerMapUpdate update{};
    update.replace_open_layer = true;
    update.frozen_removed = snapshot->frozen_layers();
    update.historic_removed = snapshot->historic_layers();
    for (const auto& layer : snapshot->historic_layers()) {
        layer->mark_for_deletion();
    }
    layer_map_.apply(update);

    if (resources_.page_cache) {
        resources_.page_cache->forget_timeline(id_);
    }

    std::error_code ec;
    std::filesystem::remove_all(directory_, ec);
    if (ec) {
        LOG(ERROR) << "Failed to remove timeline directory " << directory_ << ": " << ec.message();
        return ec;
    }
    LOG(INFO) << "Deleted timeline " << id_.to_string();
    return {};
}

std::uint64_t Timeline::allocate_sequence() noexcept
{
    return next_sequence_.fetch_add(1U, std::memory_order_acq_rel);
}

std::string Timeline::remote_key(const LayerDescriptor& descriptor) const
{
    return "timelines/" + id_.to_string() + "/" + descriptor.file_name();
}

std::filesystem::path Timeline::layer_path(const LayerDescriptor& descriptor) const
{
    return directory_ / descriptor.file_name();
}

std::shared_ptr<PersistentLayer> Timeline::make_layer(const LayerDescriptor& descriptor, std::uint64_t file_size) const
{
    storage::PersistentLayerContext context{};
    context.io = resources_.io;
    context.remote = resources_.remote;
    context.retry = config_.remote_retry;
    context.cancelled = &cancelled_;
    return std::make_shared<PersistentLayer>(descriptor, layer_path(descriptor), remote_key(descriptor), file_size, context);
}

std::error_code Timeline::write_layer(storage::LayerFileWriter& writer, std::shared_ptr<PersistentLayer>& out) const
{
    const auto& descriptor = writer.descriptor();
    std::uint64_t file_size = 0U;
    if (auto ec = writer.finish(*resources_.io, layer_path(descriptor), file_size); ec) {
        return ec;
    }
    out = make_layer(descriptor, file_size);
    return {};
}

TimelineManifest Timeline::manifest_for(const storage::LayerMapSnapshot& snapshot, const DurableLsns& lsns) const
{
    TimelineManifest manifest{};
    manifest.timeline_id = id_;
    manifest.ancestor_id = ancestor_id_;
    manifest.ancestor_lsn = ancestor_lsn_;
    manifest.disk_consistent_lsn = lsns.disk_consistent_lsn;
    manifest.prev_record_lsn = lsns.prev_record_lsn;
    manifest.gc_cutoff_lsn = lsns.gc_cutoff_lsn;
    manifest.remote_consistent_lsn = lsns.remote_consistent_lsn;
    manifest.next_sequence = next_sequence_.load(std::memory_order_acquire);
    manifest.layers.reserve(snapshot.historic_layers().size());
    for (const auto& layer : snapshot.historic_layers()) {
        manifest.layers.push_back(ManifestLayer{layer->descriptor(), layer->file_size(), layer->uploaded()});
    }
    return manifest;
}

std::error_code Timeline::publish_locked(const LayerMapUpdate& update, const DurableLsns& lsns)
{
    const auto next = layer_map_.preview(update);
    const auto manifest = manifest_for(*next, lsns);
    if (auto ec = write_manifest(*resources_.io, directory_ / kManifestFileName, manifest); ec) {
        LOG(ERROR) << "Failed to write manifest of timeline " << id_.to_string() << ": " << ec.message();
        return ec;
    }

    layer_map_.apply(update);
    durable_ = lsns;
    disk_consistent_lsn_.store(lsns.disk_consistent_lsn, std::memory_order_release);
    remote_consistent_lsn_.store(lsns.remote_consistent_lsn, std::memory_order_release);
    gc_cutoff_lsn_.store(lsns.gc_cutoff_lsn, std::memory_order_release);
    return {};
}

const TimelineId& Timeline::id() const noexcept
{
    return id_;
}

const std::optional<TimelineId>& Timeline::ancestor_id() const noexcept
{
    return ancestor_id_;
}

std::uint64_t Timeline::ancestor_lsn() const noexcept
{
    return ancestor_lsn_;
}

const std::filesystem::path& Timeline::directory() const noexcept
{
    return directory_;
}

const TimelineConfig& Timeline::config() const noexcept
{
    return config_;
}

std::uint64_t Timeline::last_record_lsn() const noexcept
{
    return last_record_lsn_.load(std::memory_order_acquire);
}

std::uint64_t Timeline::prev_record_lsn() const noexcept
{
    return prev_record_lsn_.load(std::memory_order_acquire);
}

std::uint64_t Timeline::disk_consistent_lsn() const noexcept
{
    return disk_consistent_lsn_.load(std::memory_order_acquire);
}

std::uint64_t Timeline::remote_consistent_lsn() const noexcept
{
    return remote_consistent_lsn_.load(std::memory_order_acquire);
}

std::uint64_t Timeline::gc_cutoff_lsn() const noexcept
{
    return gc_cutoff_lsn_.load(std::memory_order_acquire);
}

TimelineState Timeline::state() const noexcept
{
    return state_.load(std::memory_order_acquire);
}

bool Timeline::cancelled() const noexcept
{
    return cancelled_.load(std::memory_order_acquire);
}

std::shared_ptr<const storage::LayerMapSnapshot> Timeline::layers() const
{
    return layer_map_.snapshot();
}

TimelineManifest Timeline::manifest() const
{
    std::lock_guard lock(layer_write_mutex_);
    return manifest_for(*layer_map_.snapshot(), durable_);
}

TimelineInfo Timeline::info() const
{
    const auto snapshot = layer_map_.snapshot();

    TimelineInfo info{};
    info.id = id_;
    info.ancestor_id = ancestor_id_;
    info.ancestor_lsn = ancestor_lsn_;
    info.last_record_lsn = last_record_lsn();
    info.prev_record_lsn = prev_record_lsn();
    info.gc_cutoff_lsn = gc_cutoff_lsn();
    info.disk_consistent_lsn = disk_consistent_lsn();
    info.remote_consistent_lsn = remote_consistent_lsn();
    info.physical_size = snapshot->physical_size();
    for (const auto& layer : snapshot->historic_layers()) {
        if (layer->descriptor().kind == LayerKind::Image) {
            ++info.image_layers;
        } else {
            ++info.delta_layers;
        }
    }
    info.frozen_layers = snapshot->frozen_layers().size();
    info.open_layer_bytes = snapshot->open_layer() ? snapshot->open_layer()->size_bytes() : 0U;
    info.state = state();
    return info;
}

TimelineTelemetrySnapshot Timeline::telemetry_snapshot() const
{
    TimelineTelemetrySnapshot snapshot{};
    snapshot.records_ingested = telemetry_.records_ingested.load(std::memory_order_relaxed);
    snapshot.bytes_ingested = telemetry_.bytes_ingested.load(std::memory_order_relaxed);
    snapshot.layers_frozen = telemetry_.layers_frozen.load(std::memory_order_relaxed);
    snapshot.layers_flushed = telemetry_.layers_flushed.load(std::memory_order_relaxed);
    snapshot.flush_bytes = telemetry_.flush_bytes.load(std::memory_order_relaxed);
    snapshot.layers_uploaded = telemetry_.layers_uploaded.load(std::memory_order_relaxed);
    snapshot.upload_failures = telemetry_.upload_failures.load(std::memory_order_relaxed);
    snapshot.compactions = telemetry_.compactions.load(std::memory_order_relaxed);
    snapshot.compaction_layers_in = telemetry_.compaction_layers_in.load(std::memory_order_relaxed);
    snapshot.compaction_layers_out = telemetry_.compaction_layers_out.load(std::memory_order_relaxed);
    snapshot.images_created = telemetry_.images_created.load(std::memory_order_relaxed);
    snapshot.gc_runs = telemetry_.gc_runs.load(std::memory_order_relaxed);
    snapshot.layers_removed = telemetry_.layers_removed.load(std::memory_order_relaxed);
    snapshot.page_reconstructions = telemetry_.page_reconstructions.load(std::memory_order_relaxed);
    snapshot.cache_hits = telemetry_.cache_hits.load(std::memory_order_relaxed);
    snapshot.reconstruct_failures = telemetry_.reconstruct_failures.load(std::memory_order_relaxed);
    snapshot.backpressure_waits = telemetry_.backpressure_waits.load(std::memory_order_relaxed);
    return snapshot;
}

}  // namespace strata::timeline
