#pragma once

#include "strata/storage/inmemory_layer.hpp"
#include "strata/storage/persistent_layer.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace strata::storage {

// Immutable view of a timeline's layers. Historic layers are indexed by
// elementary key segments; each segment keeps its covering layers newest first.
class LayerMapSnapshot final {
public:
    LayerMapSnapshot() = default;
    LayerMapSnapshot(std::shared_ptr<InMemoryLayer> open_layer,
                     std::vector<std::shared_ptr<InMemoryLayer>> frozen_layers,
                     std::vector<std::shared_ptr<PersistentLayer>> historic_layers);

    // Layers that contain `key` and hold versions at or below `lsn`, newest first.
    [[nodiscard]] std::vector<std::shared_ptr<const Layer>> query(const Key& key, std::uint64_t lsn) const;

    // True when image layers whose LSN lies in `lsn_range` together cover `key_range`.
    [[nodiscard]] bool image_coverage(const KeyRange& key_range, const LsnRange& lsn_range) const;
    // Delta layers overlapping both ranges.
    [[nodiscard]] std::size_t count_deltas(const KeyRange& key_range, const LsnRange& lsn_range) const;

    // Level-0 deltas (full keyspace, written by flushes), oldest first.
    [[nodiscard]] std::vector<std::shared_ptr<PersistentLayer>> level0_deltas() const;
    [[nodiscard]] std::shared_ptr<PersistentLayer> newest_image(const KeyRange& key_range) const;

    [[nodiscard]] const std::shared_ptr<InMemoryLayer>& open_layer() const noexcept;
    // Newest first.
    [[nodiscard]] const std::vector<std::shared_ptr<InMemoryLayer>>& frozen_layers() const noexcept;
    // Newest first.
    [[nodiscard]] const std::vector<std::shared_ptr<PersistentLayer>>& historic_layers() const noexcept;

    [[nodiscard]] std::size_t frozen_bytes() const noexcept;
    [[nodiscard]] std::uint64_t physical_size() const noexcept;

private:
    struct Segment final {
        Key start{};
        std::vector<std::shared_ptr<PersistentLayer>> layers{};
    };

    void build_segments();

    std::shared_ptr<InMemoryLayer> open_layer_{};
    std::vector<std::shared_ptr<InMemoryLayer>> frozen_layers_{};
    std::vector<std::shared_ptr<PersistentLayer>> historic_layers_{};
    std::vector<Segment> segments_{};
};

struct LayerMapUpdate final {
    std::shared_ptr<InMemoryLayer> open_layer{};
    bool replace_open_layer = false;
    std::vector<std::shared_ptr<InMemoryLayer>> frozen_added{};
    std::vector<std::shared_ptr<InMemoryLayer>> frozen_removed{};
    std::vector<std::shared_ptr<PersistentLayer>> historic_added{};
    std::vector<std::shared_ptr<PersistentLayer>> historic_removed{};
};

// Holds the current snapshot. Writers build a new snapshot and swap it in;
// readers keep whatever snapshot they loaded.
class LayerMap final {
public:
    LayerMap();

    LayerMap(const LayerMap&) = delete;
    LayerMap& operator=(const LayerMap&) = delete;

    [[nodiscard]] std::shared_ptr<const LayerMapSnapshot> snapshot() const;
    // Snapshot that would result from `update`, without publishing it.
    [[nodiscard]] std::shared_ptr<const LayerMapSnapshot> preview(const LayerMapUpdate& update) const;

    void apply(const LayerMapUpdate& update);
    void insert(std::shared_ptr<PersistentLayer> layer);
    void remove(const std::shared_ptr<PersistentLayer>& layer);
    void replace(std::vector<std::shared_ptr<PersistentLayer>> removed,
                 std::vector<std::shared_ptr<PersistentLayer>> added);

    [[nodiscard]] std::vector<std::shared_ptr<const Layer>> query(const Key& key, std::uint64_t lsn) const;

private:
    [[nodiscard]] static std::shared_ptr<const LayerMapSnapshot> build(const LayerMapSnapshot& base,
                                                                       const LayerMapUpdate& update);

    mutable std::mutex mutex_{};
    std::shared_ptr<const LayerMapSnapshot> current_{};
};

}  // namespace strata::storage
