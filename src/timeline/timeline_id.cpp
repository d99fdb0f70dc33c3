#include "strata/timeline/timeline_id.hpp"

#include <algorithm>
#include <cstring>
#include <random>

namespace strata::timeline {

namespace {

int hex_value(char c) noexcept
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

}  // namespace

TimelineId::TimelineId(const Bytes& bytes) noexcept
    : bytes_{bytes}
{
}

TimelineId TimelineId::generate()
{
    thread_local std::mt19937_64 engine{std::random_device{}()};
    Bytes bytes{};
    do {
        for (std::size_t offset = 0; offset < bytes.size(); offset += sizeof(std::uint64_t)) {
            const auto value = engine();
            std::memcpy(bytes.data() + offset, &value, sizeof(value));
        }
    } while (std::all_of(bytes.begin(), bytes.end(), [](std::uint8_t b) { return b == 0U; }));
    return TimelineId{bytes};
}

std::optional<TimelineId> TimelineId::parse(std::string_view text)
{
    if (text.size() != 32U) {
        return std::nullopt;
    }
    Bytes bytes{};
    for (std::size_t index = 0; index < bytes.size(); ++index) {
        const auto high = hex_value(text[index * 2U]);
        const auto low = hex_value(text[index * 2U + 1U]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        bytes[index] = static_cast<std::uint8_t>((high << 4) | low);
    }
    return TimelineId{bytes};
}

const TimelineId::Bytes& TimelineId::bytes() const noexcept
{
    return bytes_;
}

bool TimelineId::is_zero() const noexcept
{
    return std::all_of(bytes_.begin(), bytes_.end(), [](std::uint8_t b) { return b == 0U; });
}

std::string TimelineId::to_string() const
{
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string text;
    text.reserve(bytes_.size() * 2U);
    for (const auto byte : bytes_) {
        text.push_back(kDigits[byte >> 4]);
        text.push_back(kDigits[byte & 0x0FU]);
    }
    return text;
}

std::size_t TimelineIdHash::operator()(const TimelineId& id) const noexcept
{
    std::uint64_t lo = 0U;
    std::uint64_t hi = 0U;
    std::memcpy(&lo, id.bytes().data(), sizeof(lo));
    std::memcpy(&hi, id.bytes().data() + sizeof(lo), sizeof(hi));
    return static_cast<std::size_t>(lo ^ (hi * 0x9E3779B97F4A7C15ULL));
}

}  // namespace strata::timeline
