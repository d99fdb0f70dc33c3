#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace strata::storage {

constexpr std::uint64_t kMaxLsn = std::numeric_limits<std::uint64_t>::max();

// Addresses one page: relation tag plus block number. Ordered field by field.
struct Key final {
    std::uint32_t spc_node = 0U;
    std::uint32_t db_node = 0U;
    std::uint32_t rel_node = 0U;
    std::uint8_t fork = 0U;
    std::uint32_t block = 0U;

    auto operator<=>(const Key&) const = default;
    bool operator==(const Key&) const = default;

    [[nodiscard]] static constexpr Key min() noexcept
    {
        return Key{};
    }

    // Exclusive upper bound of every key range; never addresses a page.
    [[nodiscard]] static constexpr Key max() noexcept
    {
        constexpr auto u32 = std::numeric_limits<std::uint32_t>::max();
        return Key{u32, u32, u32, std::numeric_limits<std::uint8_t>::max(), u32};
    }

    // Block `block` of the default relation used by tools and tests.
    [[nodiscard]] static constexpr Key from_block(std::uint32_t block) noexcept
    {
        return Key{1663U, 1U, 1U, 0U, block};
    }

    [[nodiscard]] Key next() const noexcept;
    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] static std::optional<Key> parse(std::string_view text);
};

// Half-open [start, end).
struct KeyRange final {
    Key start = Key::min();
    Key end = Key::max();

    bool operator==(const KeyRange&) const = default;

    [[nodiscard]] static constexpr KeyRange full() noexcept
    {
        return KeyRange{Key::min(), Key::max()};
    }

    [[nodiscard]] static KeyRange singleton(const Key& key) noexcept
    {
        return KeyRange{key, key.next()};
    }

    [[nodiscard]] constexpr bool contains(const Key& key) const noexcept
    {
        return start <= key && key < end;
    }

    [[nodiscard]] constexpr bool overlaps(const KeyRange& other) const noexcept
    {
        return start < other.end && other.start < end;
    }

    [[nodiscard]] constexpr bool empty() const noexcept
    {
        return !(start < end);
    }

    [[nodiscard]] constexpr bool is_full() const noexcept
    {
        return start == Key::min() && end == Key::max();
    }
};

// Half-open [start, end).
struct LsnRange final {
    std::uint64_t start = 0U;
    std::uint64_t end = 0U;

    bool operator==(const LsnRange&) const = default;

    [[nodiscard]] constexpr bool contains(std::uint64_t lsn) const noexcept
    {
        return start <= lsn && lsn < end;
    }

    [[nodiscard]] constexpr bool overlaps(const LsnRange& other) const noexcept
    {
        return start < other.end && other.start < end;
    }

    [[nodiscard]] constexpr bool empty() const noexcept
    {
        return end <= start;
    }
};

// Renders as "<high>/<low>" in hex, the usual WAL position notation. parse_lsn
// also accepts a plain decimal number.
[[nodiscard]] std::string format_lsn(std::uint64_t lsn);
[[nodiscard]] std::optional<std::uint64_t> parse_lsn(std::string_view text);

struct KeyHash final {
    std::size_t operator()(const Key& key) const noexcept;
};

}  // namespace strata::storage
