#pragma once

#include "strata/storage/async_io.hpp"
#include "strata/storage/layer.hpp"
#include "strata/storage/packed_key.hpp"
#include "strata/timeline/timeline_id.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <system_error>
#include <vector>

namespace strata::timeline {

inline constexpr char kManifestFileName[] = "manifest";

struct ManifestLayer final {
    storage::LayerDescriptor descriptor{};
    std::uint64_t file_size = 0U;
    bool uploaded = false;

    bool operator==(const ManifestLayer&) const = default;
};

// Everything needed to rebuild a timeline after restart.
struct TimelineManifest final {
    TimelineId timeline_id{};
    std::optional<TimelineId> ancestor_id{};
    std::uint64_t ancestor_lsn = 0U;
    std::uint64_t disk_consistent_lsn = 0U;
    std::uint64_t prev_record_lsn = 0U;
    std::uint64_t gc_cutoff_lsn = 0U;
    std::uint64_t remote_consistent_lsn = 0U;
    std::uint64_t next_sequence = 0U;
    std::vector<ManifestLayer> layers{};

    bool operator==(const TimelineManifest&) const = default;
};

constexpr std::uint32_t kManifestMagic = 0x53544D46;  // STMF
constexpr std::uint16_t kManifestVersion = 1U;
constexpr std::uint16_t kManifestFlagHasAncestor = 1U << 0;

struct alignas(8) ManifestHeader final {
    std::uint32_t magic = kManifestMagic;
    std::uint16_t version = kManifestVersion;
    std::uint16_t flags = 0U;
    std::uint8_t timeline_id[16]{};
    std::uint8_t ancestor_id[16]{};
    std::uint64_t ancestor_lsn = 0U;
    std::uint64_t disk_consistent_lsn = 0U;
    std::uint64_t prev_record_lsn = 0U;
    std::uint64_t gc_cutoff_lsn = 0U;
    std::uint64_t remote_consistent_lsn = 0U;
    std::uint64_t next_sequence = 0U;
    std::uint32_t layer_count = 0U;
    std::uint32_t checksum = 0U;
};

struct alignas(8) ManifestLayerRecord final {
    std::uint8_t kind = 0U;
    std::uint8_t uploaded = 0U;
    std::uint8_t level = 0U;
    std::uint8_t reserved = 0U;
    std::uint32_t reserved0 = 0U;
    storage::PackedKey key_start{};
    storage::PackedKey key_end{};
    std::uint64_t lsn_start = 0U;
    std::uint64_t lsn_end = 0U;
    std::uint64_t sequence = 0U;
    std::uint64_t file_size = 0U;
};

static_assert(sizeof(ManifestHeader) == 96, "ManifestHeader expected to be 96 bytes");
static_assert(sizeof(ManifestLayerRecord) == 80, "ManifestLayerRecord expected to be 80 bytes");

[[nodiscard]] std::vector<std::byte> encode_manifest(const TimelineManifest& manifest);
[[nodiscard]] std::error_code decode_manifest(std::span<const std::byte> bytes, TimelineManifest& out);

[[nodiscard]] std::error_code write_manifest(storage::AsyncIo& io,
                                             const std::filesystem::path& path,
                                             const TimelineManifest& manifest);
// CorruptManifest on any format or checksum failure; the I/O error otherwise.
[[nodiscard]] std::error_code read_manifest(storage::AsyncIo& io,
                                            const std::filesystem::path& path,
                                            TimelineManifest& out);

}  // namespace strata::timeline
