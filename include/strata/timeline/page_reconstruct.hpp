#pragma once

#include "strata/storage/layer.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <system_error>
#include <vector>

namespace strata::timeline {

// Versions of one key gathered newest to oldest across layers, down to the
// first base (an image or a will_init delta).
class ReconstructState final {
public:
    void add_versions(std::vector<storage::VersionedValue> versions);

    [[nodiscard]] bool has_base() const noexcept;
    [[nodiscard]] std::optional<std::uint64_t> base_lsn() const noexcept;
    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] std::size_t version_count() const noexcept;

    // Replays the collected versions oldest to newest. Without a base of its own
    // the state replays onto `ancestor_page`, which must then be provided.
    [[nodiscard]] std::error_code materialize(const std::vector<std::byte>* ancestor_page,
                                              std::vector<std::byte>& out) const;

private:
    void locate_base();

    // Newest first; at equal LSN an image sorts before a delta.
    std::vector<storage::VersionedValue> versions_{};
    std::optional<std::size_t> base_index_{};
};

// Walks `layers` (newest first) collecting versions of `key` at or below `lsn`
// until no older layer can change the result.
[[nodiscard]] std::error_code collect_reconstruct_data(const std::vector<std::shared_ptr<const storage::Layer>>& layers,
                                                       const storage::Key& key,
                                                       std::uint64_t lsn,
                                                       ReconstructState& state);

}  // namespace strata::timeline
