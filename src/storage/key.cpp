#include "strata/storage/key.hpp"

#include <charconv>
#include <iomanip>
#include <limits>
#include <sstream>

namespace strata::storage {

namespace {

template <typename T>
bool parse_hex(std::string_view text, T& out)
{
    if (text.empty()) {
        return false;
    }
    std::uint64_t value = 0U;
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value, 16);
    if (ec != std::errc{} || ptr != end || value > std::numeric_limits<T>::max()) {
        return false;
    }
    out = static_cast<T>(value);
    return true;
}

}  // namespace

Key Key::next() const noexcept
{
    Key result = *this;
    if (result.block != std::numeric_limits<std::uint32_t>::max()) {
        ++result.block;
        return result;
    }
    result.block = 0U;
    if (result.fork != std::numeric_limits<std::uint8_t>::max()) {
        ++result.fork;
        return result;
    }
    result.fork = 0U;
    if (result.rel_node != std::numeric_limits<std::uint32_t>::max()) {
        ++result.rel_node;
        return result;
    }
    result.rel_node = 0U;
    if (result.db_node != std::numeric_limits<std::uint32_t>::max()) {
        ++result.db_node;
        return result;
    }
    result.db_node = 0U;
    if (result.spc_node != std::numeric_limits<std::uint32_t>::max()) {
        ++result.spc_node;
        return result;
    }
    return Key::max();
}

std::string Key::to_string() const
{
    std::ostringstream out;
    out << std::uppercase << std::hex << std::setfill('0') << std::setw(8) << spc_node << std::setw(8) << db_node
        << std::setw(8) << rel_node << std::setw(2) << static_cast<unsigned>(fork) << std::setw(8) << block;
    return out.str();
}

std::optional<Key> Key::parse(std::string_view text)
{
    if (text.size() != 34U) {
        return std::nullopt;
    }
    Key key{};
    if (!parse_hex(text.substr(0, 8), key.spc_node) || !parse_hex(text.substr(8, 8), key.db_node)
        || !parse_hex(text.substr(16, 8), key.rel_node) || !parse_hex(text.substr(24, 2), key.fork)
        || !parse_hex(text.substr(26, 8), key.block)) {
        return std::nullopt;
    }
    return key;
}

std::string format_lsn(std::uint64_t lsn)
{
    std::ostringstream out;
    out << std::uppercase << std::hex << (lsn >> 32U) << '/' << (lsn & 0xFFFFFFFFU);
    return out.str();
}

std::optional<std::uint64_t> parse_lsn(std::string_view text)
{
    const auto slash = text.find('/');
    if (slash == std::string_view::npos) {
        std::uint64_t value = 0U;
        const auto* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(text.data(), end, value, 10);
        if (text.empty() || ec != std::errc{} || ptr != end) {
            return std::nullopt;
        }
        return value;
    }
    std::uint32_t high = 0U;
    std::uint32_t low = 0U;
    if (!parse_hex(text.substr(0, slash), high) || !parse_hex(text.substr(slash + 1U), low)) {
        return std::nullopt;
    }
    return (static_cast<std::uint64_t>(high) << 32U) | low;
}

std::size_t KeyHash::operator()(const Key& key) const noexcept
{
    std::uint64_t h = 1469598103934665603ULL;
    auto mix = [&h](std::uint64_t value) {
        h ^= value;
        h *= 1099511628211ULL;
    };
    mix(key.spc_node);
    mix(key.db_node);
    mix(key.rel_node);
    mix(key.fork);
    mix(key.block);
    return static_cast<std::size_t>(h);
}

}  // namespace strata::storage
