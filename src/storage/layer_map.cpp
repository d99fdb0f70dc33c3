#include "strata/storage/layer_map.hpp"

#include <algorithm>

namespace strata::storage {

namespace {

template <typename Pointer>
void erase_pointers(std::vector<Pointer>& layers, const std::vector<Pointer>& removed)
{
    if (removed.empty()) {
        return;
    }
    std::erase_if(layers, [&removed](const Pointer& layer) {
        return std::find(removed.begin(), removed.end(), layer) != removed.end();
    });
}

bool newer_layer(const std::shared_ptr<PersistentLayer>& lhs, const std::shared_ptr<PersistentLayer>& rhs)
{
    return is_newer(lhs->descriptor(), rhs->descriptor());
}

}  // namespace

LayerMapSnapshot::LayerMapSnapshot(std::shared_ptr<InMemoryLayer> open_layer,
                                   std::vector<std::shared_ptr<InMemoryLayer>> frozen_layers,
                                   std::vector<std::shared_ptr<PersistentLayer>> historic_layers)
    : open_layer_{std::move(open_layer)}
    , frozen_layers_{std::move(frozen_layers)}
    , historic_layers_{std::move(historic_layers)}
{
    std::stable_sort(frozen_layers_.begin(), frozen_layers_.end(), [](const auto& lhs, const auto& rhs) {
        return lhs->start_lsn() > rhs->start_lsn();
    });
    std::stable_sort(historic_layers_.begin(), historic_layers_.end(), newer_layer);
    build_segments();
}

void LayerMapSnapshot::build_segments()
{
    std::vector<Key> boundaries;
    boundaries.reserve(historic_layers_.size() * 2U);
    for (const auto& layer : historic_layers_) {
        const auto descriptor = layer->descriptor();
        boundaries.push_back(descriptor.key_range.start);
        boundaries.push_back(descriptor.key_range.end);
    }
    std::sort(boundaries.begin(), boundaries.end());
    boundaries.erase(std::unique(boundaries.begin(), boundaries.end()), boundaries.end());

    segments_.clear();
    if (boundaries.size() < 2U) {
        return;
    }
    segments_.reserve(boundaries.size() - 1U);
    for (std::size_t index = 0; index + 1U < boundaries.size(); ++index) {
        Segment segment{};
        segment.start = boundaries[index];
        const KeyRange range{boundaries[index], boundaries[index + 1U]};
        // historic_layers_ is already newest first, so each segment inherits the order.
        for (const auto& layer : historic_layers_) {
            if (layer->descriptor().key_range.overlaps(range)) {
                segment.layers.push_back(layer);
            }
        }
        segments_.push_back(std::move(segment));
    }
    // Sentinel marking the end of the last segment.
    segments_.push_back(Segment{boundaries.back(), {}});
}

std::vector<std::shared_ptr<const Layer>> LayerMapSnapshot::query(const Key& key, std::uint64_t lsn) const
{
    std::vector<std::shared_ptr<const Layer>> result;

    if (open_layer_ && open_layer_->start_lsn() <= lsn) {
        result.push_back(open_layer_);
    }
    for (const auto& layer : frozen_layers_) {
        if (layer->start_lsn() <= lsn) {
            result.push_back(layer);
        }
    }

    auto it = std::upper_bound(segments_.begin(), segments_.end(), key, [](const Key& value, const Segment& segment) {
        return value < segment.start;
    });
    if (it == segments_.begin()) {
        return result;
    }
    --it;
    for (const auto& layer : it->layers) {
        if (layer->descriptor().lsn_range.start <= lsn) {
            result.push_back(layer);
        }
    }
    return result;
}

bool LayerMapSnapshot::image_coverage(const KeyRange& key_range, const LsnRange& lsn_range) const
{
    std::vector<KeyRange> images;
    for (const auto& layer : historic_layers_) {
        const auto descriptor = layer->descriptor();
        if (descriptor.kind == LayerKind::Image && lsn_range.contains(descriptor.image_lsn())
            && descriptor.key_range.overlaps(key_range)) {
            images.push_back(descriptor.key_range);
        }
    }
    std::sort(images.begin(), images.end(), [](const KeyRange& lhs, const KeyRange& rhs) { return lhs.start < rhs.start; });

    auto covered_to = key_range.start;
    for (const auto& range : images) {
        if (!(covered_to < key_range.end)) {
            break;
        }
        if (covered_to < range.start) {
            return false;
        }
        covered_to = std::max(covered_to, range.end);
    }
    return !(covered_to < key_range.end);
}

std::size_t LayerMapSnapshot::count_deltas(const KeyRange& key_range, const LsnRange& lsn_range) const
{
    return static_cast<std::size_t>(std::count_if(historic_layers_.begin(), historic_layers_.end(), [&](const auto& layer) {
        const auto descriptor = layer->descriptor();
        return descriptor.kind == LayerKind::Delta && descriptor.key_range.overlaps(key_range)
               && descriptor.lsn_range.overlaps(lsn_range);
    }));
}

std::vector<std::shared_ptr<PersistentLayer>> LayerMapSnapshot::level0_deltas() const
{
    std::vector<std::shared_ptr<PersistentLayer>> result;
    for (const auto& layer : historic_layers_) {
        const auto descriptor = layer->descriptor();
        if (descriptor.kind == LayerKind::Delta && descriptor.level == 0U && descriptor.key_range.is_full()) {
            result.push_back(layer);
        }
    }
    std::reverse(result.begin(), result.end());
    return result;
}

std::shared_ptr<PersistentLayer> LayerMapSnapshot::newest_image(const KeyRange& key_range) const
{
    for (const auto& layer : historic_layers_) {
        const auto descriptor = layer->descriptor();
        if (descriptor.kind == LayerKind::Image && descriptor.key_range.overlaps(key_range)) {
            return layer;
        }
    }
    return nullptr;
}

const std::shared_ptr<InMemoryLayer>& LayerMapSnapshot::open_layer() const noexcept
{
    return open_layer_;
}

const std::vector<std::shared_ptr<InMemoryLayer>>& LayerMapSnapshot::frozen_layers() const noexcept
{
    return frozen_layers_;
}

const std::vector<std::shared_ptr<PersistentLayer>>& LayerMapSnapshot::historic_layers() const noexcept
{
    return historic_layers_;
}

std::size_t LayerMapSnapshot::frozen_bytes() const noexcept
{
    std::size_t total = 0U;
    for (const auto& layer : frozen_layers_) {
        total += layer->size_bytes();
    }
    return total;
}

std::uint64_t LayerMapSnapshot::physical_size() const noexcept
{
    std::uint64_t total = 0U;
    for (const auto& layer : historic_layers_) {
        total += layer->file_size();
    }
    return total;
}

LayerMap::LayerMap()
    : current_{std::make_shared<const LayerMapSnapshot>()}
{
}

std::shared_ptr<const LayerMapSnapshot> LayerMap::snapshot() const
{
    std::lock_guard lock(mutex_);
    return current_;
}

std::shared_ptr<const LayerMapSnapshot> LayerMap::build(const LayerMapSnapshot& base, const LayerMapUpdate& update)
{
    auto open_layer = update.replace_open_layer ? update.open_layer : base.open_layer();

    auto frozen = base.frozen_layers();
    erase_pointers(frozen, update.frozen_removed);
    frozen.insert(frozen.end(), update.frozen_added.begin(), update.frozen_added.end());

    auto historic = base.historic_layers();
    erase_pointers(historic, update.historic_removed);
    historic.insert(historic.end(), update.historic_added.begin(), update.historic_added.end());

    return std::make_shared<const LayerMapSnapshot>(std::move(open_layer), std::move(frozen), std::move(historic));
}

std::shared_ptr<const LayerMapSnapshot> LayerMap::preview(const LayerMapUpdate& update) const
{
    return build(*snapshot(), update);
}

void LayerMap::apply(const LayerMapUpdate& update)
{
    // Callers serialize writers with the timeline's layer-write mutex.
    auto next = build(*snapshot(), update);
    std::lock_guard lock(mutex_);
    current_ = std::move(next);
}

void LayerMap::insert(std::shared_ptr<PersistentLayer> layer)
{
    LayerMapUpdate update{};
    update.historic_added.push_back(std::move(layer));
    apply(update);
}

void LayerMap::remove(const std::shared_ptr<PersistentLayer>& layer)
{
    LayerMapUpdate update{};
    update.historic_removed.push_back(layer);
    apply(update);
}

void LayerMap::replace(std::vector<std::shared_ptr<PersistentLayer>> removed,
                       std::vector<std::shared_ptr<PersistentLayer>> added)
{
    LayerMapUpdate update{};
    update.historic_removed = std::move(removed);
    update.historic_added = std::move(added);
    apply(update);
}

std::vector<std::shared_ptr<const Layer>> LayerMap::query(const Key& key, std::uint64_t lsn) const
{
    return snapshot()->query(key, lsn);
}

}  // namespace strata::storage
