#pragma once

#include "strata/timeline/timeline.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <system_error>
#include <vector>

namespace strata::timeline {

struct CompactionResult final {
    std::size_t level0_inputs = 0U;
    std::size_t delta_layers_written = 0U;
    std::size_t image_layers_written = 0U;
    std::size_t images_keys = 0U;
    std::uint64_t bytes_written = 0U;
    std::chrono::milliseconds elapsed{0};
};

// Rewrites a timeline's layers: merges level-0 deltas and materializes image
// layers. New layers are written first, then published in one LayerMap update;
// replaced layers are unlinked once no reader holds them.
class Compactor final {
public:
    explicit Compactor(Timeline& timeline);

    // Level-0 merge when there are at least compaction_threshold level-0 layers,
    // or at least two when `force` is set.
    [[nodiscard]] std::error_code compact_level0(bool force, CompactionResult& result);
    // Image layer at disk_consistent_lsn when enough deltas sit above the newest image.
    [[nodiscard]] std::error_code create_image_layers(bool force, CompactionResult& result);
    // Both passes, then uploads the new layers.
    [[nodiscard]] std::error_code run(bool force, CompactionResult& result);

private:
    using LayerList = std::vector<std::shared_ptr<storage::PersistentLayer>>;

    [[nodiscard]] std::error_code check_cancelled() const;
    // Publishes `added` in place of `removed`; on failure the new files are dropped.
    [[nodiscard]] std::error_code publish(const LayerList& removed, const LayerList& added);
    static void discard(const LayerList& layers);

    Timeline& timeline_;
};

}  // namespace strata::timeline
