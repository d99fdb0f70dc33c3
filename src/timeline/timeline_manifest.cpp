#include "strata/timeline/timeline_manifest.hpp"

#include "strata/storage/checksum.hpp"
#include "strata/storage/storage_errors.hpp"

#include <cstring>

namespace strata::timeline {

namespace {

using storage::StorageErrc;

std::uint32_t compute_manifest_checksum(const ManifestHeader& header, std::span<const std::byte> body)
{
    auto copy = header;
    copy.checksum = 0U;
    auto state = storage::crc32c_extend(storage::kCrc32cInit, std::as_bytes(std::span{&copy, 1}));
    state = storage::crc32c_extend(state, body);
    return storage::crc32c_finalize(state);
}

}  // namespace

std::vector<std::byte> encode_manifest(const TimelineManifest& manifest)
{
    const auto body_size = manifest.layers.size() * sizeof(ManifestLayerRecord);
    std::vector<std::byte> bytes(sizeof(ManifestHeader) + body_size, std::byte{0});

    auto* record = bytes.data() + sizeof(ManifestHeader);
    for (const auto& layer : manifest.layers) {
        ManifestLayerRecord entry{};
        entry.kind = static_cast<std::uint8_t>(layer.descriptor.kind);
        entry.uploaded = layer.uploaded ? 1U : 0U;
        entry.level = layer.descriptor.level;
        entry.key_start = storage::pack_key(layer.descriptor.key_range.start);
        entry.key_end = storage::pack_key(layer.descriptor.key_range.end);
        entry.lsn_start = layer.descriptor.lsn_range.start;
        entry.lsn_end = layer.descriptor.lsn_range.end;
        entry.sequence = layer.descriptor.sequence;
        entry.file_size = layer.file_size;
        std::memcpy(record, &entry, sizeof(entry));
        record += sizeof(entry);
    }

    ManifestHeader header{};
    std::memcpy(header.timeline_id, manifest.timeline_id.bytes().data(), sizeof(header.timeline_id));
    if (manifest.ancestor_id) {
        header.flags |= kManifestFlagHasAncestor;
        std::memcpy(header.ancestor_id, manifest.ancestor_id->bytes().data(), sizeof(header.ancestor_id));
    }
    header.ancestor_lsn = manifest.ancestor_lsn;
    header.disk_consistent_lsn = manifest.disk_consistent_lsn;
    header.prev_record_lsn = manifest.prev_record_lsn;
    header.gc_cutoff_lsn = manifest.gc_cutoff_lsn;
    header.remote_consistent_lsn = manifest.remote_consistent_lsn;
    header.next_sequence = manifest.next_sequence;
    header.layer_count = static_cast<std::uint32_t>(manifest.layers.size());
    header.checksum = compute_manifest_checksum(header, std::span<const std::byte>(bytes.data() + sizeof(ManifestHeader), body_size));
    std::memcpy(bytes.data(), &header, sizeof(header));
    return bytes;
}

std::error_code decode_manifest(std::span<const std::byte> bytes, TimelineManifest& out)
{
    if (bytes.size() < sizeof(ManifestHeader)) {
        return make_error_code(StorageErrc::CorruptManifest);
    }

    ManifestHeader header{};
    std::memcpy(&header, bytes.data(), sizeof(header));
    if (header.magic != kManifestMagic || header.version != kManifestVersion) {
        return make_error_code(StorageErrc::CorruptManifest);
    }
    const auto body = bytes.subspan(sizeof(ManifestHeader));
    if (body.size() != static_cast<std::size_t>(header.layer_count) * sizeof(ManifestLayerRecord)) {
        return make_error_code(StorageErrc::CorruptManifest);
    }
    if (compute_manifest_checksum(header, body) != header.checksum) {
        return make_error_code(StorageErrc::CorruptManifest);
    }

    TimelineManifest manifest{};
    TimelineId::Bytes id{};
    std::memcpy(id.data(), header.timeline_id, id.size());
    manifest.timeline_id = TimelineId{id};
    if ((header.flags & kManifestFlagHasAncestor) != 0U) {
        std::memcpy(id.data(), header.ancestor_id, id.size());
        manifest.ancestor_id = TimelineId{id};
    }
    manifest.ancestor_lsn = header.ancestor_lsn;
    manifest.disk_consistent_lsn = header.disk_consistent_lsn;
    manifest.prev_record_lsn = header.prev_record_lsn;
    manifest.gc_cutoff_lsn = header.gc_cutoff_lsn;
    manifest.remote_consistent_lsn = header.remote_consistent_lsn;
    manifest.next_sequence = header.next_sequence;

    manifest.layers.reserve(header.layer_count);
    for (std::uint32_t index = 0; index < header.layer_count; ++index) {
        ManifestLayerRecord entry{};
        std::memcpy(&entry, body.data() + index * sizeof(ManifestLayerRecord), sizeof(entry));
        if (entry.kind > static_cast<std::uint8_t>(storage::LayerKind::Image)) {
            return make_error_code(StorageErrc::CorruptManifest);
        }
        ManifestLayer layer{};
        layer.descriptor.kind = static_cast<storage::LayerKind>(entry.kind);
        layer.descriptor.key_range = storage::KeyRange{storage::unpack_key(entry.key_start), storage::unpack_key(entry.key_end)};
        layer.descriptor.lsn_range = storage::LsnRange{entry.lsn_start, entry.lsn_end};
        layer.descriptor.sequence = entry.sequence;
        layer.descriptor.level = entry.level;
        layer.file_size = entry.file_size;
        layer.uploaded = entry.uploaded != 0U;
        if (layer.descriptor.key_range.empty() || layer.descriptor.lsn_range.empty()) {
            return make_error_code(StorageErrc::CorruptManifest);
        }
        manifest.layers.push_back(layer);
    }

    out = std::move(manifest);
    return {};
}

std::error_code write_manifest(storage::AsyncIo& io, const std::filesystem::path& path, const TimelineManifest& manifest)
{
    const auto bytes = encode_manifest(manifest);
    return storage::write_file_atomically(io, path, storage::FileClass::Manifest, bytes);
}

std::error_code read_manifest(storage::AsyncIo& io, const std::filesystem::path& path, TimelineManifest& out)
{
    std::vector<std::byte> bytes;
    if (auto ec = storage::read_whole_file(io, path, storage::FileClass::Manifest, bytes); ec) {
        return ec;
    }
    return decode_manifest(bytes, out);
}

}  // namespace strata::timeline
