#pragma once

#include "strata/storage/key.hpp"
#include "strata/storage/page_value.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace strata::storage {

enum class LayerKind : std::uint8_t {
    Delta = 0,
    Image = 1,
    InMemory = 2
};

// Identity of a layer. Persistent layers are named after it and never change.
struct LayerDescriptor final {
    LayerKind kind = LayerKind::Delta;
    KeyRange key_range{};
    LsnRange lsn_range{};
    std::uint64_t sequence = 0U;
    // 0 for layers written by flush, 1 for compaction output. Not part of the
    // file name; recorded in the layer file header and the manifest.
    std::uint8_t level = 0U;

    bool operator==(const LayerDescriptor&) const = default;

    [[nodiscard]] bool is_delta() const noexcept
    {
        return kind != LayerKind::Image;
    }

    // Image layers hold a snapshot at lsn_range.start.
    [[nodiscard]] std::uint64_t image_lsn() const noexcept
    {
        return lsn_range.start;
    }

    [[nodiscard]] std::string file_name() const;
    [[nodiscard]] static std::optional<LayerDescriptor> parse_file_name(std::string_view name);
    [[nodiscard]] std::string to_string() const;
};

// Newer first: larger lsn_range.end, then larger sequence.
[[nodiscard]] bool is_newer(const LayerDescriptor& lhs, const LayerDescriptor& rhs) noexcept;

struct VersionedValue final {
    std::uint64_t lsn = 0U;
    PageValue value{};
};

struct LayerEntry final {
    Key key{};
    std::uint64_t lsn = 0U;
    PageValue value{};
};

class Layer {
public:
    virtual ~Layer() = default;

    [[nodiscard]] virtual LayerDescriptor descriptor() const = 0;

    // Appends every version of `key` with lsn <= max_lsn, newest first.
    [[nodiscard]] virtual std::error_code collect_versions(const Key& key,
                                                          std::uint64_t max_lsn,
                                                          std::vector<VersionedValue>& out) const = 0;

    // All entries ordered by (key, lsn).
    [[nodiscard]] virtual std::error_code load_entries(std::vector<LayerEntry>& out) const = 0;

    // Keys that have at least one version at or below max_lsn.
    [[nodiscard]] virtual std::error_code collect_keys(std::uint64_t max_lsn, std::set<Key>& out) const = 0;

    [[nodiscard]] virtual bool is_in_memory() const noexcept
    {
        return false;
    }
};

}  // namespace strata::storage
