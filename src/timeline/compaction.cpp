#include "strata/timeline/compaction.hpp"

#include "strata/storage/storage_errors.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <set>

namespace strata::timeline {

using storage::Key;
using storage::KeyRange;
using storage::LayerDescriptor;
using storage::LayerKind;
using storage::LsnRange;
using storage::StorageErrc;

Compactor::Compactor(Timeline& timeline)
    : timeline_{timeline}
{
}

std::error_code Compactor::check_cancelled() const
{
    if (timeline_.cancelled()) {
        return make_error_code(StorageErrc::Cancelled);
    }
    return {};
}

void Compactor::discard(const LayerList& layers)
{
    for (const auto& layer : layers) {
        layer->mark_for_deletion();
    }
}

std::error_code Compactor::publish(const LayerList& removed, const LayerList& added)
{
    std::lock_guard write_lock(timeline_.layer_write_mutex_);
    if (auto ec = check_cancelled(); ec) {
        discard(added);
        return ec;
    }

    storage::LayerMapUpdate update{};
    update.historic_removed = removed;
    update.historic_added = added;
    if (auto ec = timeline_.publish_locked(update, timeline_.durable_); ec) {
        discard(added);
        return ec;
    }
    discard(removed);
    return {};
}

std::error_code Compactor::compact_level0(bool force, CompactionResult& result)
{
    const auto started = std::chrono::steady_clock::now();
    std::lock_guard maintenance_lock(timeline_.maintenance_mutex_);

    const auto snapshot = timeline_.layer_map_.snapshot();
    const auto inputs = snapshot->level0_deltas();
    const auto& config = timeline_.config_;
    const auto required = force ? std::size_t{2U} : config.compaction_threshold;
    if (inputs.size() < required) {
        return {};
    }

    std::vector<storage::LayerEntry> entries;
    LsnRange lsn_range{storage::kMaxLsn, 0U};
    for (const auto& layer : inputs) {
        if (auto ec = check_cancelled(); ec) {
            return ec;
        }
        if (auto ec = layer->load_entries(entries); ec) {
            return ec;
        }
        const auto descriptor = layer->descriptor();
        lsn_range.start = std::min(lsn_range.start, descriptor.lsn_range.start);
        lsn_range.end = std::max(lsn_range.end, descriptor.lsn_range.end);
    }
    std::sort(entries.begin(), entries.end(), [](const storage::LayerEntry& lhs, const storage::LayerEntry& rhs) {
        if (lhs.key != rhs.key) {
            return lhs.key < rhs.key;
        }
        return lhs.lsn < rhs.lsn;
    });

    LayerList outputs;
    auto start_writer = [&](const Key& start) {
        LayerDescriptor descriptor{};
        descriptor.kind = LayerKind::Delta;
        descriptor.key_range = KeyRange{start, Key::max()};
        descriptor.lsn_range = lsn_range;
        descriptor.sequence = timeline_.allocate_sequence();
        descriptor.level = 1U;
        return storage::LayerFileWriter{descriptor};
    };
    auto finish_writer = [&](storage::LayerFileWriter& writer, const Key& end) -> std::error_code {
        if (auto ec = check_cancelled(); ec) {
            return ec;
        }
        auto range = writer.descriptor().key_range;
        range.end = end;
        writer.set_key_range(range);
        std::shared_ptr<storage::PersistentLayer> layer;
        if (auto ec = timeline_.write_layer(writer, layer); ec) {
            return ec;
        }
        result.bytes_written += layer->file_size();
        outputs.push_back(std::move(layer));
        return {};
    };

    auto writer = start_writer(Key::min());
    std::error_code failure{};
    for (std::size_t index = 0; index < entries.size() && !failure; ++index) {
        const auto& entry = entries[index];
        // Split only between keys so one key's history stays in one layer.
        if (writer.entry_count() > 0U && writer.estimated_size() >= config.compaction_target_size
            && entry.key != entries[index - 1U].key) {
            if (failure = finish_writer(writer, entry.key); failure) {
                break;
            }
            writer = start_writer(entry.key);
        }
        failure = writer.append(entry.key, entry.lsn, entry.value);
    }
    if (!failure) {
        failure = finish_writer(writer, Key::max());
    }
    if (failure) {
        discard(outputs);
        if (failure != StorageErrc::Cancelled) {
            LOG(WARNING) << "Level-0 compaction of timeline " << timeline_.id().to_string()
                         << " failed and will be retried: " << failure.message();
        }
        return failure;
    }

    if (auto ec = publish(inputs, outputs); ec) {
        return ec;
    }

    result.level0_inputs += inputs.size();
    result.delta_layers_written += outputs.size();
    result.elapsed += std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    timeline_.telemetry_.compactions.fetch_add(1U, std::memory_order_relaxed);
    timeline_.telemetry_.compaction_layers_in.fetch_add(inputs.size(), std::memory_order_relaxed);
    timeline_.telemetry_.compaction_layers_out.fetch_add(outputs.size(), std::memory_order_relaxed);
    LOG(INFO) << "Compacted " << inputs.size() << " level-0 layers of timeline " << timeline_.id().to_string() << " into "
              << outputs.size() << " layers covering " << storage::format_lsn(lsn_range.start) << "-"
              << storage::format_lsn(lsn_range.end);
    return {};
}

std::error_code Compactor::create_image_layers(bool force, CompactionResult& result)
{
    const auto started = std::chrono::steady_clock::now();
    std::lock_guard maintenance_lock(timeline_.maintenance_mutex_);

    const auto snapshot = timeline_.layer_map_.snapshot();
    const auto image_lsn = timeline_.disk_consistent_lsn();
    const auto newest = snapshot->newest_image(KeyRange::full());
    const auto newest_lsn = newest ? newest->descriptor().image_lsn() : 0U;
    if (newest && newest_lsn >= image_lsn) {
        return {};
    }

    const auto deltas = snapshot->count_deltas(KeyRange::full(), LsnRange{newest ? newest_lsn + 1U : 0U, storage::kMaxLsn});
    const auto& config = timeline_.config_;
    if (deltas == 0U || (!force && deltas < config.image_creation_threshold)) {
        return {};
    }
    if (image_lsn < timeline_.gc_cutoff_lsn()) {
        return {};
    }

    std::set<Key> keys;
    if (auto ec = timeline_.collect_keys(image_lsn, keys); ec) {
        return ec;
    }

    LayerList outputs;
    auto start_writer = [&](const Key& start) {
        LayerDescriptor descriptor{};
        descriptor.kind = LayerKind::Image;
        descriptor.key_range = KeyRange{start, Key::max()};
        descriptor.lsn_range = LsnRange{image_lsn, image_lsn + 1U};
        descriptor.sequence = timeline_.allocate_sequence();
        return storage::LayerFileWriter{descriptor};
    };
    auto finish_writer = [&](storage::LayerFileWriter& writer, const Key& end) -> std::error_code {
        if (auto ec = check_cancelled(); ec) {
            return ec;
        }
        auto range = writer.descriptor().key_range;
        range.end = end;
        writer.set_key_range(range);
        std::shared_ptr<storage::PersistentLayer> layer;
        if (auto ec = timeline_.write_layer(writer, layer); ec) {
            return ec;
        }
        result.bytes_written += layer->file_size();
        outputs.push_back(std::move(layer));
        return {};
    };

    auto writer = start_writer(Key::min());
    std::error_code failure{};
    for (const auto& key : keys) {
        if (writer.entry_count() > 0U && writer.estimated_size() >= config.compaction_target_size) {
            if (failure = finish_writer(writer, key); failure) {
                break;
            }
            writer = start_writer(key);
        }
        std::vector<std::byte> page;
        if (failure = timeline_.reconstruct_page(key, image_lsn, page); failure) {
            break;
        }
        if (failure = writer.append(key, image_lsn, storage::PageValue::image(std::move(page))); failure) {
            break;
        }
    }
    if (!failure) {
        failure = finish_writer(writer, Key::max());
    }
    if (failure) {
        discard(outputs);
        if (failure != StorageErrc::Cancelled) {
            LOG(WARNING) << "Image creation for timeline " << timeline_.id().to_string() << " at "
                         << storage::format_lsn(image_lsn) << " failed and will be retried: " << failure.message();
        }
        return failure;
    }

    if (auto ec = publish({}, outputs); ec) {
        return ec;
    }

    result.image_layers_written += outputs.size();
    result.images_keys += keys.size();
    result.elapsed += std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    timeline_.telemetry_.images_created.fetch_add(outputs.size(), std::memory_order_relaxed);
    LOG(INFO) << "Created " << outputs.size() << " image layers with " << keys.size() << " pages for timeline "
              << timeline_.id().to_string() << " at " << storage::format_lsn(image_lsn);
    return {};
}

std::error_code Compactor::run(bool force, CompactionResult& result)
{
    if (auto ec = compact_level0(force, result); ec) {
        return ec;
    }
    if (auto ec = create_image_layers(force, result); ec) {
        return ec;
    }
    return timeline_.upload_layers();
}

}  // namespace strata::timeline
