#pragma once

#include "strata/storage/key.hpp"

#include <cstdint>

namespace strata::storage {

// Fixed 20-byte on-disk representation of a Key, shared by WAL and layer files.
struct alignas(4) PackedKey final {
    std::uint32_t spc_node = 0U;
    std::uint32_t db_node = 0U;
    std::uint32_t rel_node = 0U;
    std::uint32_t block = 0U;
    std::uint8_t fork = 0U;
    std::uint8_t reserved[3]{};
};

static_assert(sizeof(PackedKey) == 20, "PackedKey expected to be 20 bytes");

constexpr PackedKey pack_key(const Key& key) noexcept
{
    PackedKey packed{};
    packed.spc_node = key.spc_node;
    packed.db_node = key.db_node;
    packed.rel_node = key.rel_node;
    packed.block = key.block;
    packed.fork = key.fork;
    return packed;
}

constexpr Key unpack_key(const PackedKey& packed) noexcept
{
    return Key{packed.spc_node, packed.db_node, packed.rel_node, packed.fork, packed.block};
}

}  // namespace strata::storage
