#include "strata/storage/checksum.hpp"

#include <array>
#include <cstddef>
#include <cstring>

#if defined(__SSE4_2__)
#if defined(__x86_64__) || defined(__i386__)
#include <nmmintrin.h>
#define STRATA_STORAGE_HAS_SSE42 1
#endif
#endif

namespace strata::storage {

namespace {

// Reflected Castagnoli polynomial, matching the SSE4.2 crc32 instruction.
constexpr std::array<std::uint32_t, 256> make_crc32c_table()
{
    std::array<std::uint32_t, 256> table{};
    constexpr std::uint32_t poly = 0x82F63B78u;
    for (std::uint32_t i = 0; i < table.size(); ++i) {
        std::uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            const bool lsb = (crc & 1u) != 0u;
            crc >>= 1;
            if (lsb) {
                crc ^= poly;
            }
        }
        table[i] = crc;
    }
    return table;
}

constexpr auto kCrc32cTable = make_crc32c_table();

[[maybe_unused]] std::uint32_t crc32c_sw(std::uint32_t crc, std::span<const std::byte> data)
{
    for (auto byte : data) {
        const auto value = std::to_integer<std::uint8_t>(byte);
        const auto index = static_cast<std::uint8_t>((crc ^ value) & 0xFFu);
        crc = (crc >> 8U) ^ kCrc32cTable[index];
    }
    return crc;
}

#if defined(STRATA_STORAGE_HAS_SSE42)
std::uint32_t crc32c_hw(std::uint32_t crc, std::span<const std::byte> data)
{
    const auto* bytes = reinterpret_cast<const unsigned char*>(data.data());
    std::size_t remaining = data.size();

#if defined(__x86_64__)
    while (remaining >= sizeof(std::uint64_t)) {
        std::uint64_t chunk;
        std::memcpy(&chunk, bytes, sizeof(chunk));
        crc = static_cast<std::uint32_t>(_mm_crc32_u64(crc, chunk));
        bytes += sizeof(std::uint64_t);
        remaining -= sizeof(std::uint64_t);
    }
#endif
    while (remaining >= sizeof(std::uint32_t)) {
        std::uint32_t chunk;
        std::memcpy(&chunk, bytes, sizeof(chunk));
        crc = _mm_crc32_u32(crc, chunk);
        bytes += sizeof(std::uint32_t);
        remaining -= sizeof(std::uint32_t);
    }
    while (remaining > 0) {
        crc = _mm_crc32_u8(crc, *bytes++);
        --remaining;
    }

    return crc;
}
#endif

std::uint32_t dispatch_crc32c(std::uint32_t crc, std::span<const std::byte> data)
{
#if defined(STRATA_STORAGE_HAS_SSE42)
    return crc32c_hw(crc, data);
#else
    return crc32c_sw(crc, data);
#endif
}

}  // namespace

std::uint32_t crc32c_extend(std::uint32_t state, std::span<const std::byte> data)
{
    return dispatch_crc32c(state, data);
}

std::uint32_t compute_wal_checksum(const WalRecordHeader& header, std::span<const std::byte> body)
{
    auto copy = header;
    copy.checksum = 0U;
    auto header_bytes = std::as_bytes(std::span{&copy, 1});
    auto state = crc32c_extend(kCrc32cInit, header_bytes);
    state = crc32c_extend(state, body);
    return crc32c_finalize(state);
}

void apply_wal_checksum(WalRecordHeader& header, std::span<const std::byte> body)
{
    header.checksum = compute_wal_checksum(header, body);
}

bool verify_wal_checksum(const WalRecordHeader& header, std::span<const std::byte> body)
{
    return header.checksum == compute_wal_checksum(header, body);
}

}  // namespace strata::storage
