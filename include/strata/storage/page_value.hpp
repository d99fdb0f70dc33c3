#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <system_error>
#include <vector>

namespace strata::storage {

// Largest page a delta may produce. Ops that would grow a page past it are
// rejected as CorruptDelta.
constexpr std::size_t kMaxPageBytes = 1024U * 1024U;

enum class RedoOpType : std::uint8_t {
    // Little-endian 64-bit add at `offset`, wrapping on overflow.
    AddU64 = 0,
    // Overwrite `bytes` at `offset`, zero-extending the page as needed.
    Write = 1,
    Append = 2,
    // Shrink the page to `length` bytes; no-op when already shorter.
    Truncate = 3
};

struct RedoOp final {
    RedoOpType type = RedoOpType::Write;
    std::uint32_t offset = 0U;
    std::uint64_t addend = 0U;
    std::uint32_t length = 0U;
    std::vector<std::byte> bytes{};

    [[nodiscard]] static RedoOp add_u64(std::uint32_t offset, std::uint64_t addend);
    [[nodiscard]] static RedoOp write(std::uint32_t offset, std::span<const std::byte> bytes);
    [[nodiscard]] static RedoOp append(std::span<const std::byte> bytes);
    [[nodiscard]] static RedoOp truncate(std::uint32_t length);
};

enum class PageValueKind : std::uint8_t {
    Image = 0,
    Delta = 1
};

// A page version: a full image, or encoded redo ops against the previous version.
// A delta with `will_init` builds the page from an empty base.
struct PageValue final {
    PageValueKind kind = PageValueKind::Image;
    bool will_init = false;
    std::vector<std::byte> bytes{};

    [[nodiscard]] static PageValue image(std::vector<std::byte> page);
    [[nodiscard]] static PageValue delta(std::span<const RedoOp> ops, bool will_init = false);

    [[nodiscard]] bool is_image() const noexcept
    {
        return kind == PageValueKind::Image;
    }

    // True when the value can be materialized without an older version.
    [[nodiscard]] bool is_base() const noexcept
    {
        return kind == PageValueKind::Image || will_init;
    }

    bool operator==(const PageValue&) const = default;
};

[[nodiscard]] std::vector<std::byte> encode_redo_ops(std::span<const RedoOp> ops);
[[nodiscard]] std::error_code decode_redo_ops(std::span<const std::byte> encoded, std::vector<RedoOp>& out);

[[nodiscard]] std::error_code apply_redo_ops(std::vector<std::byte>& page, std::span<const RedoOp> ops);
[[nodiscard]] std::error_code apply_page_value(std::vector<std::byte>& page, const PageValue& value);

[[nodiscard]] std::vector<std::byte> encode_u64_page(std::uint64_t value);
[[nodiscard]] std::uint64_t decode_u64_page(std::span<const std::byte> page) noexcept;

}  // namespace strata::storage
