#include "strata/storage/layer.hpp"

#include <charconv>
#include <iomanip>
#include <sstream>

namespace strata::storage {

namespace {

bool parse_u64_hex(std::string_view text, std::uint64_t& out)
{
    if (text.size() != 16U) {
        return false;
    }
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, out, 16);
    return ec == std::errc{} && ptr == end;
}

bool split_once(std::string_view text, std::string_view separator, std::string_view& head, std::string_view& tail)
{
    const auto pos = text.find(separator);
    if (pos == std::string_view::npos) {
        return false;
    }
    head = text.substr(0, pos);
    tail = text.substr(pos + separator.size());
    return true;
}

std::string hex16(std::uint64_t value)
{
    std::ostringstream out;
    out << std::uppercase << std::hex << std::setfill('0') << std::setw(16) << value;
    return out.str();
}

}  // namespace

// <key start>-<key end>__<lsn start>-<lsn end>_<sequence>.<delta|image>
std::string LayerDescriptor::file_name() const
{
    std::string name;
    name.reserve(160U);
    name += key_range.start.to_string();
    name += '-';
    name += key_range.end.to_string();
    name += "__";
    name += hex16(lsn_range.start);
    name += '-';
    name += hex16(lsn_range.end);
    name += '_';
    name += hex16(sequence);
    name += kind == LayerKind::Image ? ".image" : ".delta";
    return name;
}

std::optional<LayerDescriptor> LayerDescriptor::parse_file_name(std::string_view name)
{
    LayerDescriptor descriptor{};
    std::string_view stem;
    if (name.ends_with(".image")) {
        descriptor.kind = LayerKind::Image;
        stem = name.substr(0, name.size() - 6U);
    } else if (name.ends_with(".delta")) {
        descriptor.kind = LayerKind::Delta;
        stem = name.substr(0, name.size() - 6U);
    } else {
        return std::nullopt;
    }

    std::string_view keys;
    std::string_view rest;
    if (!split_once(stem, "__", keys, rest)) {
        return std::nullopt;
    }
    std::string_view key_start;
    std::string_view key_end;
    if (!split_once(keys, "-", key_start, key_end)) {
        return std::nullopt;
    }
    auto start = Key::parse(key_start);
    auto end = Key::parse(key_end);
    if (!start || !end) {
        return std::nullopt;
    }

    std::string_view lsns;
    std::string_view sequence;
    if (!split_once(rest, "_", lsns, sequence)) {
        return std::nullopt;
    }
    std::string_view lsn_start;
    std::string_view lsn_end;
    if (!split_once(lsns, "-", lsn_start, lsn_end)) {
        return std::nullopt;
    }
    if (!parse_u64_hex(lsn_start, descriptor.lsn_range.start) || !parse_u64_hex(lsn_end, descriptor.lsn_range.end)
        || !parse_u64_hex(sequence, descriptor.sequence)) {
        return std::nullopt;
    }

    descriptor.key_range = KeyRange{*start, *end};
    return descriptor;
}

std::string LayerDescriptor::to_string() const
{
    std::string text;
    switch (kind) {
    case LayerKind::Delta:
        text = "delta";
        break;
    case LayerKind::Image:
        text = "image";
        break;
    case LayerKind::InMemory:
        text = "inmem";
        break;
    }
    text += " keys=[" + key_range.start.to_string() + ", " + key_range.end.to_string() + ")";
    text += " lsn=[" + format_lsn(lsn_range.start) + ", ";
    text += lsn_range.end == kMaxLsn ? std::string{"open"} : format_lsn(lsn_range.end);
    text += ") seq=" + std::to_string(sequence);
    if (level > 0U) {
        text += " level=" + std::to_string(level);
    }
    return text;
}

bool is_newer(const LayerDescriptor& lhs, const LayerDescriptor& rhs) noexcept
{
    if (lhs.lsn_range.end != rhs.lsn_range.end) {
        return lhs.lsn_range.end > rhs.lsn_range.end;
    }
    return lhs.sequence > rhs.sequence;
}

}  // namespace strata::storage
