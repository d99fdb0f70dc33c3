#pragma once

#include "strata/storage/key.hpp"
#include "strata/storage/page_value.hpp"
#include "strata/storage/wal_format.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <system_error>
#include <vector>

namespace strata::storage {

struct WalBlock final {
    Key key{};
    PageValue value{};
};

// A decoded WAL record. `lsn` is the WAL position just past the record and
// `prev_lsn` the position where it starts.
struct WalRecord final {
    std::uint64_t lsn = 0U;
    std::uint64_t prev_lsn = 0U;
    WalRecordType type = WalRecordType::PageUpdate;
    WalRecordFlag flags = WalRecordFlag::None;
    std::vector<WalBlock> blocks{};
};

// Encodes `record` (its lsn is ignored) as an aligned, checksummed byte sequence.
[[nodiscard]] std::vector<std::byte> encode_wal_record(const WalRecord& record);

// Size of `record` once encoded, including alignment padding.
[[nodiscard]] std::size_t encoded_wal_record_size(const WalRecord& record);

// Incrementally decodes a WAL byte stream that begins at `start_lsn`.
class WalStreamDecoder final {
public:
    explicit WalStreamDecoder(std::uint64_t start_lsn = 0U);

    void feed_bytes(std::span<const std::byte> bytes);

    // Returns the next complete record, std::nullopt when more bytes are needed,
    // or an error when the stream is corrupt. Errors are sticky.
    [[nodiscard]] std::error_code poll_decode(std::optional<WalRecord>& out);

    [[nodiscard]] std::uint64_t next_lsn() const noexcept;
    [[nodiscard]] std::size_t buffered_bytes() const noexcept;

private:
    std::vector<std::byte> buffer_{};
    std::size_t consumed_ = 0U;
    std::uint64_t next_lsn_ = 0U;
    std::error_code failure_{};
};

}  // namespace strata::storage
