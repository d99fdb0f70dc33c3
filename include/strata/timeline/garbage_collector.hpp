#pragma once

#include "strata/timeline/timeline.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <system_error>
#include <vector>

namespace strata::timeline {

struct GcResult final {
    std::size_t layers_total = 0U;
    std::size_t layers_needed_by_cutoff = 0U;
    std::size_t layers_needed_by_branches = 0U;
    std::size_t layers_not_updated = 0U;
    std::size_t layers_removed = 0U;
    std::uint64_t cutoff_lsn = 0U;
    std::chrono::milliseconds elapsed{0};
};

// Advances a timeline's gc_cutoff_lsn and drops layers no retained LSN can reach.
class GarbageCollector final {
public:
    explicit GarbageCollector(Timeline& timeline);

    // The new cutoff is last_record_lsn - horizon, never below the current cutoff
    // and never above the lowest of `retain_lsns` (branch points of live children).
    [[nodiscard]] std::error_code run(std::uint64_t horizon, const std::vector<std::uint64_t>& retain_lsns, GcResult& result);

    [[nodiscard]] static std::uint64_t compute_cutoff(std::uint64_t last_record_lsn,
                                                      std::uint64_t current_cutoff,
                                                      std::uint64_t horizon,
                                                      const std::vector<std::uint64_t>& retain_lsns) noexcept;

private:
    Timeline& timeline_;
};

}  // namespace strata::timeline
