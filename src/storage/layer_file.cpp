#include "strata/storage/layer_file.hpp"

#include "strata/storage/checksum.hpp"
#include "strata/storage/storage_errors.hpp"

#include <algorithm>
#include <cstring>

namespace strata::storage {

namespace {

std::uint32_t compute_layer_checksum(const LayerFileHeader& header, std::span<const std::byte> body)
{
    auto copy = header;
    copy.checksum = 0U;
    auto state = crc32c_extend(kCrc32cInit, std::as_bytes(std::span{&copy, 1}));
    state = crc32c_extend(state, body);
    return crc32c_finalize(state);
}

bool entry_less(const LayerIndexEntry& entry, const Key& key, std::uint64_t lsn)
{
    const auto entry_key = unpack_key(entry.key);
    if (entry_key != key) {
        return entry_key < key;
    }
    return entry.lsn < lsn;
}

}  // namespace

LayerFileWriter::LayerFileWriter(LayerDescriptor descriptor)
    : descriptor_{std::move(descriptor)}
{
}

std::error_code LayerFileWriter::append(const Key& key, std::uint64_t lsn, const PageValue& value)
{
    if (have_last_ && (key < last_key_ || (key == last_key_ && lsn <= last_lsn_))) {
        return std::make_error_code(std::errc::invalid_argument);
    }
    if (!descriptor_.key_range.contains(key) || !descriptor_.lsn_range.contains(lsn)) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    LayerIndexEntry entry{};
    entry.key = pack_key(key);
    entry.value_kind = static_cast<std::uint8_t>(value.kind);
    entry.will_init = value.will_init ? 1U : 0U;
    entry.lsn = lsn;
    entry.offset = sizeof(LayerFileHeader) + values_.size();
    entry.length = static_cast<std::uint32_t>(value.bytes.size());
    values_.insert(values_.end(), value.bytes.begin(), value.bytes.end());
    index_.push_back(entry);

    have_last_ = true;
    last_key_ = key;
    last_lsn_ = lsn;
    return {};
}

std::size_t LayerFileWriter::entry_count() const noexcept
{
    return index_.size();
}

std::size_t LayerFileWriter::estimated_size() const noexcept
{
    return sizeof(LayerFileHeader) + values_.size() + index_.size() * sizeof(LayerIndexEntry);
}

const LayerDescriptor& LayerFileWriter::descriptor() const noexcept
{
    return descriptor_;
}

void LayerFileWriter::set_key_range(const KeyRange& range) noexcept
{
    descriptor_.key_range = range;
}

std::error_code LayerFileWriter::finish(AsyncIo& io, const std::filesystem::path& path, std::uint64_t& out_file_size)
{
    out_file_size = 0U;

    const auto value_end = sizeof(LayerFileHeader) + values_.size();
    const auto index_offset = (value_end + 7U) & ~std::size_t{7U};
    const auto total = index_offset + index_.size() * sizeof(LayerIndexEntry);

    std::vector<std::byte> file(total, std::byte{0});
    if (!values_.empty()) {
        std::memcpy(file.data() + sizeof(LayerFileHeader), values_.data(), values_.size());
    }
    if (!index_.empty()) {
        std::memcpy(file.data() + index_offset, index_.data(), index_.size() * sizeof(LayerIndexEntry));
    }

    LayerFileHeader header{};
    header.kind = static_cast<std::uint8_t>(descriptor_.kind);
    header.level = descriptor_.level;
    header.key_start = pack_key(descriptor_.key_range.start);
    header.key_end = pack_key(descriptor_.key_range.end);
    header.lsn_start = descriptor_.lsn_range.start;
    header.lsn_end = descriptor_.lsn_range.end;
    header.sequence = descriptor_.sequence;
    header.entry_count = static_cast<std::uint32_t>(index_.size());
    header.index_offset = index_offset;
    header.checksum = compute_layer_checksum(
        header, std::span<const std::byte>(file.data() + sizeof(LayerFileHeader), total - sizeof(LayerFileHeader)));
    std::memcpy(file.data(), &header, sizeof(header));

    if (auto ec = write_file_atomically(io, path, FileClass::LayerFile, file); ec) {
        return ec;
    }
    out_file_size = total;
    return {};
}

std::error_code LayerFileReader::parse(std::vector<std::byte> bytes, LayerFileReader& out)
{
    if (bytes.size() < sizeof(LayerFileHeader)) {
        return make_error_code(StorageErrc::CorruptLayer);
    }

    LayerFileHeader header{};
    std::memcpy(&header, bytes.data(), sizeof(header));
    if (header.magic != kLayerFileMagic || header.version != kLayerFileVersion
        || header.kind > static_cast<std::uint8_t>(LayerKind::Image)) {
        return make_error_code(StorageErrc::CorruptLayer);
    }

    const auto body = std::span<const std::byte>(bytes.data() + sizeof(LayerFileHeader), bytes.size() - sizeof(LayerFileHeader));
    if (compute_layer_checksum(header, body) != header.checksum) {
        return make_error_code(StorageErrc::CorruptLayer);
    }

    const auto index_bytes = static_cast<std::uint64_t>(header.entry_count) * sizeof(LayerIndexEntry);
    if (header.index_offset < sizeof(LayerFileHeader) || header.index_offset + index_bytes != bytes.size()) {
        return make_error_code(StorageErrc::CorruptLayer);
    }

    LayerFileReader reader{};
    reader.descriptor_.kind = static_cast<LayerKind>(header.kind);
    reader.descriptor_.key_range = KeyRange{unpack_key(header.key_start), unpack_key(header.key_end)};
    reader.descriptor_.lsn_range = LsnRange{header.lsn_start, header.lsn_end};
    reader.descriptor_.sequence = header.sequence;
    reader.descriptor_.level = header.level;

    reader.index_.resize(header.entry_count);
    if (header.entry_count > 0U) {
        std::memcpy(reader.index_.data(), bytes.data() + header.index_offset, index_bytes);
    }
    for (const auto& entry : reader.index_) {
        if (entry.offset < sizeof(LayerFileHeader) || entry.offset + entry.length > header.index_offset
            || entry.value_kind > static_cast<std::uint8_t>(PageValueKind::Delta)) {
            return make_error_code(StorageErrc::CorruptLayer);
        }
        const auto key = unpack_key(entry.key);
        if (reader.keys_.empty() || reader.keys_.back() != key) {
            reader.keys_.push_back(key);
        }
    }

    reader.bytes_ = std::move(bytes);
    out = std::move(reader);
    return {};
}

const LayerDescriptor& LayerFileReader::descriptor() const noexcept
{
    return descriptor_;
}

std::size_t LayerFileReader::entry_count() const noexcept
{
    return index_.size();
}

PageValue LayerFileReader::value_at(const LayerIndexEntry& entry) const
{
    PageValue value{};
    value.kind = static_cast<PageValueKind>(entry.value_kind);
    value.will_init = entry.will_init != 0U;
    const auto begin = bytes_.begin() + static_cast<std::ptrdiff_t>(entry.offset);
    value.bytes.assign(begin, begin + entry.length);
    return value;
}

void LayerFileReader::collect_versions(const Key& key, std::uint64_t max_lsn, std::vector<VersionedValue>& out) const
{
    // First entry past (key, max_lsn), then walk backwards while the key matches.
    auto it = std::lower_bound(index_.begin(), index_.end(), max_lsn, [&key](const LayerIndexEntry& entry, std::uint64_t lsn) {
        return entry_less(entry, key, lsn) || (unpack_key(entry.key) == key && entry.lsn == lsn);
    });
    while (it != index_.begin()) {
        --it;
        if (unpack_key(it->key) != key) {
            break;
        }
        out.push_back(VersionedValue{it->lsn, value_at(*it)});
    }
}

void LayerFileReader::load_entries(std::vector<LayerEntry>& out) const
{
    out.reserve(out.size() + index_.size());
    for (const auto& entry : index_) {
        out.push_back(LayerEntry{unpack_key(entry.key), entry.lsn, value_at(entry)});
    }
}

void LayerFileReader::collect_keys(std::uint64_t max_lsn, std::set<Key>& out) const
{
    for (const auto& entry : index_) {
        if (entry.lsn <= max_lsn) {
            out.insert(unpack_key(entry.key));
        }
    }
}

}  // namespace strata::storage
