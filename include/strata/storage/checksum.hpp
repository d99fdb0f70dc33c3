#pragma once

#include "strata/storage/wal_format.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

namespace strata::storage {

constexpr std::uint32_t kCrc32cInit = 0xFFFFFFFFu;

std::uint32_t crc32c_extend(std::uint32_t state, std::span<const std::byte> data);
constexpr std::uint32_t crc32c_finalize(std::uint32_t state)
{
    return state ^ 0xFFFFFFFFu;
}
inline std::uint32_t crc32c(std::span<const std::byte> data)
{
    return crc32c_finalize(crc32c_extend(kCrc32cInit, data));
}

std::uint32_t compute_wal_checksum(const WalRecordHeader& header, std::span<const std::byte> body);
void apply_wal_checksum(WalRecordHeader& header, std::span<const std::byte> body);
bool verify_wal_checksum(const WalRecordHeader& header, std::span<const std::byte> body);

}  // namespace strata::storage
