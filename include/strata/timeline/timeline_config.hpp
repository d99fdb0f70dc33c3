#pragma once

#include "strata/storage/remote_storage.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace strata::timeline {

struct TimelineConfig final {
    // Open layer size that triggers a freeze.
    std::size_t checkpoint_distance = 256U * 1024U * 1024U;
    // Open layer age that triggers a freeze.
    std::chrono::milliseconds checkpoint_timeout{std::chrono::minutes{10}};
    // Ingestion waits for flushes while frozen layers hold more than this.
    std::size_t max_frozen_bytes = 1024U * 1024U * 1024U;

    std::size_t compaction_target_size = 128U * 1024U * 1024U;
    std::size_t compaction_threshold = 10U;
    std::chrono::milliseconds compaction_period{std::chrono::seconds{20}};
    std::size_t image_creation_threshold = 3U;

    std::uint64_t gc_horizon = 64U * 1024U * 1024U;
    std::chrono::milliseconds gc_period{std::chrono::seconds{100}};

    std::chrono::milliseconds wait_lsn_timeout{std::chrono::seconds{60}};

    storage::RemoteRetryPolicy remote_retry{};
    // Drop local copies of layer files once they are uploaded.
    bool evict_after_upload = false;
};

}  // namespace strata::timeline
