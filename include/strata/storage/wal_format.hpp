#pragma once

#include "strata/storage/packed_key.hpp"

#include <cstddef>
#include <cstdint>

namespace strata::storage {

constexpr std::size_t kWalRecordAlignment = 8;
constexpr std::uint32_t kWalMaxRecordLength = 64U * 1024U * 1024U;

enum class WalRecordType : std::uint16_t {
    // Carries one block entry per page it mutates.
    PageUpdate = 0,
    // Advances the LSN without touching pages (commit, checkpoint, switch records).
    Noop = 1
};

enum class WalRecordFlag : std::uint16_t {
    None = 0,
    Commit = 1 << 0
};

constexpr WalRecordFlag operator|(WalRecordFlag lhs, WalRecordFlag rhs)
{
    return static_cast<WalRecordFlag>(static_cast<std::uint16_t>(lhs) | static_cast<std::uint16_t>(rhs));
}

constexpr WalRecordFlag operator&(WalRecordFlag lhs, WalRecordFlag rhs)
{
    return static_cast<WalRecordFlag>(static_cast<std::uint16_t>(lhs) & static_cast<std::uint16_t>(rhs));
}

enum class WalBlockKind : std::uint8_t {
    Image = 0,
    Delta = 1
};

struct alignas(8) WalRecordHeader final {
    std::uint32_t total_length = sizeof(WalRecordHeader);
    std::uint16_t type = static_cast<std::uint16_t>(WalRecordType::PageUpdate);
    std::uint16_t flags = static_cast<std::uint16_t>(WalRecordFlag::None);
    std::uint32_t block_count = 0U;
    std::uint32_t checksum = 0U;
    // Position where this record starts, i.e. the previous record's LSN; 0 when
    // the producer does not track it.
    std::uint64_t prev_lsn = 0U;
    std::uint64_t reserved = 0U;
};

struct alignas(4) WalBlockHeader final {
    PackedKey key{};
    std::uint8_t kind = static_cast<std::uint8_t>(WalBlockKind::Image);
    std::uint8_t will_init = 0U;
    std::uint16_t reserved = 0U;
    std::uint32_t payload_length = 0U;
};

constexpr std::size_t align_up_to_record(std::size_t value)
{
    return (value + (kWalRecordAlignment - 1U)) & ~(kWalRecordAlignment - 1U);
}

constexpr bool is_valid_record_header(const WalRecordHeader& header)
{
    return header.total_length >= sizeof(WalRecordHeader) && header.total_length <= kWalMaxRecordLength
        && header.type <= static_cast<std::uint16_t>(WalRecordType::Noop);
}

static_assert(sizeof(WalRecordHeader) == 32, "WalRecordHeader expected to be 32 bytes");
static_assert(sizeof(WalBlockHeader) == 28, "WalBlockHeader expected to be 28 bytes");
static_assert(alignof(WalRecordHeader) == 8, "WalRecordHeader alignment must be 8");
static_assert((kWalRecordAlignment & (kWalRecordAlignment - 1)) == 0, "Record alignment must be a power of two");

}  // namespace strata::storage
