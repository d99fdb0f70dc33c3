#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace strata::timeline {

// 128-bit random identifier, rendered as 32 lowercase hex digits.
class TimelineId final {
public:
    using Bytes = std::array<std::uint8_t, 16>;

    TimelineId() = default;
    explicit TimelineId(const Bytes& bytes) noexcept;

    [[nodiscard]] static TimelineId generate();
    [[nodiscard]] static std::optional<TimelineId> parse(std::string_view text);

    [[nodiscard]] const Bytes& bytes() const noexcept;
    [[nodiscard]] bool is_zero() const noexcept;
    [[nodiscard]] std::string to_string() const;

    auto operator<=>(const TimelineId&) const = default;
    bool operator==(const TimelineId&) const = default;

private:
    Bytes bytes_{};
};

struct TimelineIdHash final {
    std::size_t operator()(const TimelineId& id) const noexcept;
};

}  // namespace strata::timeline
