#pragma once

#include "strata/storage/async_io.hpp"
#include "strata/storage/layer.hpp"
#include "strata/storage/packed_key.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <set>
#include <span>
#include <system_error>
#include <vector>

namespace strata::storage {

constexpr std::uint32_t kLayerFileMagic = 0x53544C59;  // STLY
constexpr std::uint16_t kLayerFileVersion = 1U;

struct alignas(8) LayerFileHeader final {
    std::uint32_t magic = kLayerFileMagic;
    std::uint16_t version = kLayerFileVersion;
    std::uint8_t kind = 0U;
    std::uint8_t level = 0U;
    PackedKey key_start{};
    PackedKey key_end{};
    std::uint64_t lsn_start = 0U;
    std::uint64_t lsn_end = 0U;
    std::uint64_t sequence = 0U;
    std::uint32_t entry_count = 0U;
    std::uint32_t checksum = 0U;
    std::uint64_t index_offset = 0U;
};

struct alignas(8) LayerIndexEntry final {
    PackedKey key{};
    std::uint8_t value_kind = 0U;
    std::uint8_t will_init = 0U;
    std::uint16_t reserved = 0U;
    std::uint64_t lsn = 0U;
    std::uint64_t offset = 0U;
    std::uint32_t length = 0U;
    std::uint32_t reserved0 = 0U;
};

static_assert(sizeof(LayerFileHeader) == 88, "LayerFileHeader expected to be 88 bytes");
static_assert(sizeof(LayerIndexEntry) == 48, "LayerIndexEntry expected to be 48 bytes");

// Accumulates entries in (key, lsn) order and writes them as one layer file.
class LayerFileWriter final {
public:
    explicit LayerFileWriter(LayerDescriptor descriptor);

    [[nodiscard]] std::error_code append(const Key& key, std::uint64_t lsn, const PageValue& value);

    [[nodiscard]] std::size_t entry_count() const noexcept;
    [[nodiscard]] std::size_t estimated_size() const noexcept;
    [[nodiscard]] const LayerDescriptor& descriptor() const noexcept;
    void set_key_range(const KeyRange& range) noexcept;

    // Writes through a temporary file; nothing is left at `path` on failure.
    [[nodiscard]] std::error_code finish(AsyncIo& io, const std::filesystem::path& path, std::uint64_t& out_file_size);

private:
    LayerDescriptor descriptor_{};
    std::vector<std::byte> values_{};
    std::vector<LayerIndexEntry> index_{};
    bool have_last_ = false;
    Key last_key_{};
    std::uint64_t last_lsn_ = 0U;
};

// Parsed, checksum-verified layer file held in memory.
class LayerFileReader final {
public:
    [[nodiscard]] static std::error_code parse(std::vector<std::byte> bytes, LayerFileReader& out);

    [[nodiscard]] const LayerDescriptor& descriptor() const noexcept;
    [[nodiscard]] std::size_t entry_count() const noexcept;

    void collect_versions(const Key& key, std::uint64_t max_lsn, std::vector<VersionedValue>& out) const;
    void load_entries(std::vector<LayerEntry>& out) const;
    void collect_keys(std::uint64_t max_lsn, std::set<Key>& out) const;

private:
    [[nodiscard]] PageValue value_at(const LayerIndexEntry& entry) const;

    LayerDescriptor descriptor_{};
    std::vector<std::byte> bytes_{};
    std::vector<LayerIndexEntry> index_{};
    std::vector<Key> keys_{};
};

}  // namespace strata::storage
