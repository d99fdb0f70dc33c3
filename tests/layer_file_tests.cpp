#include "strata/storage/layer_file.hpp"

#include "strata/storage/storage_errors.hpp"

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace strata::storage::tests {

namespace {

std::filesystem::path make_temp_dir(const std::string& name)
{
    auto root = std::filesystem::temp_directory_path();
    auto dir = root / (name + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    (void)std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

LayerDescriptor delta_descriptor(std::uint64_t start, std::uint64_t end, std::uint64_t sequence)
{
    LayerDescriptor descriptor{};
    descriptor.kind = LayerKind::Delta;
    descriptor.key_range = KeyRange::full();
    descriptor.lsn_range = LsnRange{start, end};
    descriptor.sequence = sequence;
    return descriptor;
}

PageValue add(std::uint64_t addend)
{
    const std::array<RedoOp, 1> ops{RedoOp::add_u64(0U, addend)};
    return PageValue::delta(ops);
}

}  // namespace

TEST_CASE("Layer file names round trip through the descriptor", "[layer_file]")
{
    LayerDescriptor descriptor{};
    descriptor.kind = LayerKind::Image;
    descriptor.key_range = KeyRange{Key::from_block(3U), Key::from_block(900U)};
    descriptor.lsn_range = LsnRange{0x1000U, 0x1001U};
    descriptor.sequence = 42U;

    const auto name = descriptor.file_name();
    CHECK(name.ends_with(".image"));
    const auto parsed = LayerDescriptor::parse_file_name(name);
    REQUIRE(parsed.has_value());
    CHECK(*parsed == descriptor);

    const auto delta = delta_descriptor(16U, 4096U, 7U);
    const auto parsed_delta = LayerDescriptor::parse_file_name(delta.file_name());
    REQUIRE(parsed_delta.has_value());
    CHECK(*parsed_delta == delta);
}

TEST_CASE("Layer file names reject foreign files", "[layer_file]")
{
    const auto name = delta_descriptor(16U, 4096U, 7U).file_name();
    CHECK_FALSE(LayerDescriptor::parse_file_name("manifest").has_value());
    CHECK_FALSE(LayerDescriptor::parse_file_name(name + ".tmp").has_value());
    CHECK_FALSE(LayerDescriptor::parse_file_name(name.substr(1)).has_value());
    CHECK_FALSE(LayerDescriptor::parse_file_name("garbage__0-1_2.delta").has_value());
}

TEST_CASE("Newer layers sort by end LSN then sequence", "[layer_file]")
{
    CHECK(is_newer(delta_descriptor(0U, 200U, 1U), delta_descriptor(0U, 100U, 9U)));
    CHECK(is_newer(delta_descriptor(0U, 100U, 9U), delta_descriptor(50U, 100U, 2U)));
    CHECK_FALSE(is_newer(delta_descriptor(0U, 100U, 2U), delta_descriptor(0U, 100U, 2U)));
}

TEST_CASE("LayerFileWriter rejects out-of-order and out-of-range entries", "[layer_file]")
{
    LayerFileWriter writer{delta_descriptor(100U, 200U, 1U)};
    REQUIRE_FALSE(writer.append(Key::from_block(2U), 150U, add(1U)));

    CHECK(writer.append(Key::from_block(2U), 150U, add(1U)) == std::errc::invalid_argument);
    CHECK(writer.append(Key::from_block(1U), 160U, add(1U)) == std::errc::invalid_argument);
    CHECK(writer.append(Key::from_block(3U), 99U, add(1U)) == std::errc::invalid_argument);
    CHECK(writer.append(Key::from_block(3U), 200U, add(1U)) == std::errc::invalid_argument);

    REQUIRE_FALSE(writer.append(Key::from_block(2U), 151U, add(2U)));
    REQUIRE_FALSE(writer.append(Key::from_block(3U), 100U, add(3U)));
    CHECK(writer.entry_count() == 3U);
}

TEST_CASE("Layer files are written and read back", "[layer_file]")
{
    const auto dir = make_temp_dir("strata_layer_file_");
    auto io = create_async_io();

    const auto descriptor = delta_descriptor(100U, 300U, 5U);
    LayerFileWriter writer{descriptor};
    REQUIRE_FALSE(writer.append(Key::from_block(1U), 110U, PageValue::image(encode_u64_page(10U))));
    REQUIRE_FALSE(writer.append(Key::from_block(1U), 150U, add(2U)));
    REQUIRE_FALSE(writer.append(Key::from_block(1U), 250U, add(3U)));
    REQUIRE_FALSE(writer.append(Key::from_block(7U), 120U, add(4U)));

    const auto path = dir / descriptor.file_name();
    std::uint64_t file_size = 0U;
    REQUIRE_FALSE(writer.finish(*io, path, file_size));
    CHECK(file_size == std::filesystem::file_size(path));
    CHECK_FALSE(std::filesystem::exists(path.string() + ".tmp"));

    std::vector<std::byte> bytes;
    REQUIRE_FALSE(read_whole_file(*io, path, FileClass::LayerFile, bytes));
    LayerFileReader reader{};
    REQUIRE_FALSE(LayerFileReader::parse(std::move(bytes), reader));
    CHECK(reader.descriptor() == descriptor);
    CHECK(reader.entry_count() == 4U);

    SECTION("versions come back newest first and bounded by LSN")
    {
        std::vector<VersionedValue> versions;
        reader.collect_versions(Key::from_block(1U), 200U, versions);
        REQUIRE(versions.size() == 2U);
        CHECK(versions[0].lsn == 150U);
        CHECK(versions[0].value == add(2U));
        CHECK(versions[1].lsn == 110U);
        CHECK(versions[1].value.is_image());

        versions.clear();
        reader.collect_versions(Key::from_block(1U), 250U, versions);
        CHECK(versions.size() == 3U);

        versions.clear();
        reader.collect_versions(Key::from_block(4U), 300U, versions);
        CHECK(versions.empty());
    }

    SECTION("keys are filtered by LSN")
    {
        std::set<Key> keys;
        reader.collect_keys(115U, keys);
        CHECK(keys == std::set<Key>{Key::from_block(1U)});
        reader.collect_keys(300U, keys);
        CHECK(keys.size() == 2U);
    }

    SECTION("entries load in key order")
    {
        std::vector<LayerEntry> entries;
        reader.load_entries(entries);
        REQUIRE(entries.size() == 4U);
        CHECK(entries.back().key == Key::from_block(7U));
        CHECK(entries.back().lsn == 120U);
    }

    io->shutdown();
    (void)std::filesystem::remove_all(dir);
}

TEST_CASE("Damaged layer files are reported as corrupt", "[layer_file]")
{
    const auto dir = make_temp_dir("strata_layer_file_corrupt_");
    auto io = create_async_io();

    const auto descriptor = delta_descriptor(0U, 10U, 1U);
    LayerFileWriter writer{descriptor};
    REQUIRE_FALSE(writer.append(Key::from_block(1U), 5U, PageValue::image(encode_u64_page(77U))));
    const auto path = dir / descriptor.file_name();
    std::uint64_t file_size = 0U;
    REQUIRE_FALSE(writer.finish(*io, path, file_size));

    std::vector<std::byte> bytes;
    REQUIRE_FALSE(read_whole_file(*io, path, FileClass::LayerFile, bytes));

    LayerFileReader reader{};
    SECTION("flipped value byte")
    {
        bytes[sizeof(LayerFileHeader)] ^= std::byte{0x01};
        CHECK(LayerFileReader::parse(bytes, reader) == StorageErrc::CorruptLayer);
    }
    SECTION("truncated file")
    {
        bytes.resize(bytes.size() - 8U);
        CHECK(LayerFileReader::parse(bytes, reader) == StorageErrc::CorruptLayer);
    }
    SECTION("bad magic")
    {
        bytes[0] ^= std::byte{0xFF};
        CHECK(LayerFileReader::parse(bytes, reader) == StorageErrc::CorruptLayer);
    }
    SECTION("shorter than a header")
    {
        bytes.resize(16U);
        CHECK(LayerFileReader::parse(bytes, reader) == StorageErrc::CorruptLayer);
    }

    io->shutdown();
    (void)std::filesystem::remove_all(dir);
}

}  // namespace strata::storage::tests
