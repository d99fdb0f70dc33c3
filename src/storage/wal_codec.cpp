#include "strata/storage/wal_codec.hpp"

#include "strata/storage/checksum.hpp"
#include "strata/storage/storage_errors.hpp"

#include <cstring>

namespace strata::storage {

namespace {

std::size_t body_size(const WalRecord& record)
{
    std::size_t size = 0U;
    for (const auto& block : record.blocks) {
        size += sizeof(WalBlockHeader) + block.value.bytes.size();
    }
    return size;
}

}  // namespace

std::size_t encoded_wal_record_size(const WalRecord& record)
{
    return align_up_to_record(sizeof(WalRecordHeader) + body_size(record));
}

std::vector<std::byte> encode_wal_record(const WalRecord& record)
{
    const auto unaligned = sizeof(WalRecordHeader) + body_size(record);
    std::vector<std::byte> out(align_up_to_record(unaligned), std::byte{0});

    std::size_t offset = sizeof(WalRecordHeader);
    for (const auto& block : record.blocks) {
        WalBlockHeader block_header{};
        block_header.key = pack_key(block.key);
        block_header.kind = static_cast<std::uint8_t>(block.value.is_image() ? WalBlockKind::Image : WalBlockKind::Delta);
        block_header.will_init = block.value.will_init ? 1U : 0U;
        block_header.payload_length = static_cast<std::uint32_t>(block.value.bytes.size());
        std::memcpy(out.data() + offset, &block_header, sizeof(block_header));
        offset += sizeof(block_header);
        if (!block.value.bytes.empty()) {
            std::memcpy(out.data() + offset, block.value.bytes.data(), block.value.bytes.size());
            offset += block.value.bytes.size();
        }
    }

    WalRecordHeader header{};
    header.total_length = static_cast<std::uint32_t>(unaligned);
    header.type = static_cast<std::uint16_t>(record.type);
    header.flags = static_cast<std::uint16_t>(record.flags);
    header.block_count = static_cast<std::uint32_t>(record.blocks.size());
    header.prev_lsn = record.prev_lsn;
    const auto body = std::span<const std::byte>(out.data() + sizeof(WalRecordHeader), unaligned - sizeof(WalRecordHeader));
    apply_wal_checksum(header, body);
    std::memcpy(out.data(), &header, sizeof(header));
    return out;
}

WalStreamDecoder::WalStreamDecoder(std::uint64_t start_lsn)
    : next_lsn_{start_lsn}
{
}

void WalStreamDecoder::feed_bytes(std::span<const std::byte> bytes)
{
    if (consumed_ > 0U && consumed_ == buffer_.size()) {
        buffer_.clear();
        consumed_ = 0U;
    } else if (consumed_ > buffer_.size() / 2U) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(consumed_));
        consumed_ = 0U;
    }
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

std::error_code WalStreamDecoder::poll_decode(std::optional<WalRecord>& out)
{
    out.reset();
    if (failure_) {
        return failure_;
    }

    const auto available = buffer_.size() - consumed_;
    if (available < sizeof(WalRecordHeader)) {
        return {};
    }

    const auto* base = buffer_.data() + consumed_;
    WalRecordHeader header{};
    std::memcpy(&header, base, sizeof(header));
    if (!is_valid_record_header(header)) {
        failure_ = make_error_code(StorageErrc::CorruptWalRecord);
        return failure_;
    }

    const auto aligned = align_up_to_record(header.total_length);
    if (available < aligned) {
        return {};
    }
    // A nonzero prev_lsn must name where this record starts. The end position
    // becomes the record's LSN and must stay below kMaxLsn.
    if ((header.prev_lsn != 0U && header.prev_lsn != next_lsn_) || aligned >= kMaxLsn - next_lsn_) {
        failure_ = make_error_code(StorageErrc::CorruptWalRecord);
        return failure_;
    }

    const auto body = std::span<const std::byte>(base + sizeof(WalRecordHeader), header.total_length - sizeof(WalRecordHeader));
    if (!verify_wal_checksum(header, body)) {
        failure_ = make_error_code(StorageErrc::CorruptWalRecord);
        return failure_;
    }

    WalRecord record{};
    record.type = static_cast<WalRecordType>(header.type);
    record.flags = static_cast<WalRecordFlag>(header.flags);
    record.prev_lsn = next_lsn_;
    record.blocks.reserve(header.block_count);

    auto remaining = body;
    for (std::uint32_t index = 0; index < header.block_count; ++index) {
        if (remaining.size() < sizeof(WalBlockHeader)) {
            failure_ = make_error_code(StorageErrc::CorruptWalRecord);
            return failure_;
        }
        WalBlockHeader block_header{};
        std::memcpy(&block_header, remaining.data(), sizeof(block_header));
        remaining = remaining.subspan(sizeof(block_header));
        if (remaining.size() < block_header.payload_length
            || block_header.kind > static_cast<std::uint8_t>(WalBlockKind::Delta)
            || unpack_key(block_header.key) == Key::max()) {
            failure_ = make_error_code(StorageErrc::CorruptWalRecord);
            return failure_;
        }

        WalBlock block{};
        block.key = unpack_key(block_header.key);
        block.value.kind = block_header.kind == static_cast<std::uint8_t>(WalBlockKind::Image) ? PageValueKind::Image
                                                                                                 : PageValueKind::Delta;
        block.value.will_init = block_header.will_init != 0U;
        block.value.bytes.assign(remaining.begin(), remaining.begin() + block_header.payload_length);
        remaining = remaining.subspan(block_header.payload_length);
        record.blocks.push_back(std::move(block));
    }

    if (!remaining.empty()) {
        failure_ = make_error_code(StorageErrc::CorruptWalRecord);
        return failure_;
    }

    consumed_ += aligned;
    next_lsn_ += aligned;
    record.lsn = next_lsn_;
    out = std::move(record);
    return {};
}

std::uint64_t WalStreamDecoder::next_lsn() const noexcept
{
    return next_lsn_;
}

std::size_t WalStreamDecoder::buffered_bytes() const noexcept
{
    return buffer_.size() - consumed_;
}

}  // namespace strata::storage
