#include "strata/storage/page_value.hpp"

#include "strata/storage/storage_errors.hpp"

#include <algorithm>
#include <cstring>

namespace strata::storage {

namespace {

template <typename T>
void put(std::vector<std::byte>& out, T value)
{
    const auto offset = out.size();
    out.resize(offset + sizeof(T));
    std::memcpy(out.data() + offset, &value, sizeof(T));
}

template <typename T>
bool take(std::span<const std::byte>& in, T& value)
{
    if (in.size() < sizeof(T)) {
        return false;
    }
    std::memcpy(&value, in.data(), sizeof(T));
    in = in.subspan(sizeof(T));
    return true;
}

bool ensure_size(std::vector<std::byte>& page, std::size_t size)
{
    if (size > kMaxPageBytes) {
        return false;
    }
    if (page.size() < size) {
        page.resize(size, std::byte{0});
    }
    return true;
}

}  // namespace

RedoOp RedoOp::add_u64(std::uint32_t offset, std::uint64_t addend)
{
    RedoOp op{};
    op.type = RedoOpType::AddU64;
    op.offset = offset;
    op.addend = addend;
    return op;
}

RedoOp RedoOp::write(std::uint32_t offset, std::span<const std::byte> bytes)
{
    RedoOp op{};
    op.type = RedoOpType::Write;
    op.offset = offset;
    op.bytes.assign(bytes.begin(), bytes.end());
    return op;
}

RedoOp RedoOp::append(std::span<const std::byte> bytes)
{
    RedoOp op{};
    op.type = RedoOpType::Append;
    op.bytes.assign(bytes.begin(), bytes.end());
    return op;
}

RedoOp RedoOp::truncate(std::uint32_t length)
{
    RedoOp op{};
    op.type = RedoOpType::Truncate;
    op.length = length;
    return op;
}

PageValue PageValue::image(std::vector<std::byte> page)
{
    PageValue value{};
    value.kind = PageValueKind::Image;
    value.bytes = std::move(page);
    return value;
}

PageValue PageValue::delta(std::span<const RedoOp> ops, bool will_init)
{
    PageValue value{};
    value.kind = PageValueKind::Delta;
    value.will_init = will_init;
    value.bytes = encode_redo_ops(ops);
    return value;
}

std::vector<std::byte> encode_redo_ops(std::span<const RedoOp> ops)
{
    std::vector<std::byte> out;
    for (const auto& op : ops) {
        put(out, static_cast<std::uint8_t>(op.type));
        switch (op.type) {
        case RedoOpType::AddU64:
            put(out, op.offset);
            put(out, op.addend);
            break;
        case RedoOpType::Write:
            put(out, op.offset);
            put(out, static_cast<std::uint32_t>(op.bytes.size()));
            out.insert(out.end(), op.bytes.begin(), op.bytes.end());
            break;
        case RedoOpType::Append:
            put(out, static_cast<std::uint32_t>(op.bytes.size()));
            out.insert(out.end(), op.bytes.begin(), op.bytes.end());
            break;
        case RedoOpType::Truncate:
            put(out, op.length);
            break;
        }
    }
    return out;
}

std::error_code decode_redo_ops(std::span<const std::byte> encoded, std::vector<RedoOp>& out)
{
    out.clear();
    while (!encoded.empty()) {
        std::uint8_t raw_type = 0U;
        if (!take(encoded, raw_type)) {
            return make_error_code(StorageErrc::CorruptDelta);
        }
        RedoOp op{};
        switch (static_cast<RedoOpType>(raw_type)) {
        case RedoOpType::AddU64:
            op.type = RedoOpType::AddU64;
            if (!take(encoded, op.offset) || !take(encoded, op.addend)) {
                return make_error_code(StorageErrc::CorruptDelta);
            }
            break;
        case RedoOpType::Write:
        case RedoOpType::Append: {
            op.type = static_cast<RedoOpType>(raw_type);
            if (op.type == RedoOpType::Write && !take(encoded, op.offset)) {
                return make_error_code(StorageErrc::CorruptDelta);
            }
            std::uint32_t length = 0U;
            if (!take(encoded, length) || encoded.size() < length) {
                return make_error_code(StorageErrc::CorruptDelta);
            }
            op.bytes.assign(encoded.begin(), encoded.begin() + length);
            encoded = encoded.subspan(length);
            break;
        }
        case RedoOpType::Truncate:
            op.type = RedoOpType::Truncate;
            if (!take(encoded, op.length)) {
                return make_error_code(StorageErrc::CorruptDelta);
            }
            break;
        default:
            return make_error_code(StorageErrc::CorruptDelta);
        }
        out.push_back(std::move(op));
    }
    return {};
}

std::error_code apply_redo_ops(std::vector<std::byte>& page, std::span<const RedoOp> ops)
{
    for (const auto& op : ops) {
        switch (op.type) {
        case RedoOpType::AddU64: {
            const auto end = static_cast<std::size_t>(op.offset) + sizeof(std::uint64_t);
            if (!ensure_size(page, end)) {
                return make_error_code(StorageErrc::CorruptDelta);
            }
            std::uint64_t current = 0U;
            std::memcpy(&current, page.data() + op.offset, sizeof(current));
            current += op.addend;
            std::memcpy(page.data() + op.offset, &current, sizeof(current));
            break;
        }
        case RedoOpType::Write:
            if (!ensure_size(page, static_cast<std::size_t>(op.offset) + op.bytes.size())) {
                return make_error_code(StorageErrc::CorruptDelta);
            }
            std::copy(op.bytes.begin(), op.bytes.end(), page.begin() + op.offset);
            break;
        case RedoOpType::Append:
            if (page.size() + op.bytes.size() > kMaxPageBytes) {
                return make_error_code(StorageErrc::CorruptDelta);
            }
            page.insert(page.end(), op.bytes.begin(), op.bytes.end());
            break;
        case RedoOpType::Truncate:
            if (page.size() > op.length) {
                page.resize(op.length);
            }
            break;
        default:
            return make_error_code(StorageErrc::CorruptDelta);
        }
    }
    return {};
}

std::error_code apply_page_value(std::vector<std::byte>& page, const PageValue& value)
{
    if (value.kind == PageValueKind::Image) {
        page = value.bytes;
        return {};
    }
    if (value.will_init) {
        page.clear();
    }
    std::vector<RedoOp> ops;
    if (auto ec = decode_redo_ops(value.bytes, ops); ec) {
        return ec;
    }
    return apply_redo_ops(page, ops);
}

std::vector<std::byte> encode_u64_page(std::uint64_t value)
{
    std::vector<std::byte> page(sizeof(value));
    std::memcpy(page.data(), &value, sizeof(value));
    return page;
}

std::uint64_t decode_u64_page(std::span<const std::byte> page) noexcept
{
    std::uint64_t value = 0U;
    std::memcpy(&value, page.data(), std::min(page.size(), sizeof(value)));
    return value;
}

}  // namespace strata::storage
