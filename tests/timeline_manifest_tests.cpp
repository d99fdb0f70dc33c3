#include "strata/timeline/timeline_manifest.hpp"

#include "strata/storage/storage_errors.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <string>

namespace strata::timeline::tests {

using storage::StorageErrc;

namespace {

std::filesystem::path make_temp_dir(const std::string& name)
{
    auto root = std::filesystem::temp_directory_path();
    auto dir = root / (name + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    (void)std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

TimelineManifest sample_manifest()
{
    TimelineManifest manifest{};
    manifest.timeline_id = TimelineId::generate();
    manifest.ancestor_id = TimelineId::generate();
    manifest.ancestor_lsn = 0x4000U;
    manifest.disk_consistent_lsn = 0x9000U;
    manifest.prev_record_lsn = 0x8F00U;
    manifest.gc_cutoff_lsn = 0x2000U;
    manifest.remote_consistent_lsn = 0x6000U;
    manifest.next_sequence = 17U;

    ManifestLayer delta{};
    delta.descriptor.kind = storage::LayerKind::Delta;
    delta.descriptor.lsn_range = storage::LsnRange{0x4001U, 0x9001U};
    delta.descriptor.sequence = 12U;
    delta.file_size = 4096U;
    delta.uploaded = true;

    ManifestLayer image{};
    image.descriptor.kind = storage::LayerKind::Image;
    image.descriptor.key_range = storage::KeyRange{storage::Key::from_block(1U), storage::Key::from_block(64U)};
    image.descriptor.lsn_range = storage::LsnRange{0x6000U, 0x6001U};
    image.descriptor.sequence = 16U;
    image.file_size = 8192U;

    manifest.layers = {delta, image};
    return manifest;
}

}  // namespace

TEST_CASE("Manifests decode to what was encoded", "[manifest]")
{
    const auto manifest = sample_manifest();
    TimelineManifest decoded{};
    REQUIRE_FALSE(decode_manifest(encode_manifest(manifest), decoded));
    CHECK(decoded == manifest);

    auto root = manifest;
    root.ancestor_id.reset();
    root.ancestor_lsn = 0U;
    root.layers.clear();
    REQUIRE_FALSE(decode_manifest(encode_manifest(root), decoded));
    CHECK_FALSE(decoded.ancestor_id.has_value());
    CHECK(decoded.layers.empty());
}

TEST_CASE("Damaged manifests are rejected", "[manifest]")
{
    auto bytes = encode_manifest(sample_manifest());
    TimelineManifest decoded{};

    SECTION("flipped layer byte")
    {
        bytes[sizeof(ManifestHeader) + 20U] ^= std::byte{0x10};
        CHECK(decode_manifest(bytes, decoded) == StorageErrc::CorruptManifest);
    }
    SECTION("flipped header byte")
    {
        bytes[40] ^= std::byte{0x01};
        CHECK(decode_manifest(bytes, decoded) == StorageErrc::CorruptManifest);
    }
    SECTION("missing layer record")
    {
        bytes.resize(bytes.size() - sizeof(ManifestLayerRecord));
        CHECK(decode_manifest(bytes, decoded) == StorageErrc::CorruptManifest);
    }
    SECTION("empty file")
    {
        bytes.clear();
        CHECK(decode_manifest(bytes, decoded) == StorageErrc::CorruptManifest);
    }
}

TEST_CASE("Manifest files are replaced atomically", "[manifest]")
{
    const auto dir = make_temp_dir("strata_manifest_");
    auto io = storage::create_async_io();
    const auto path = dir / kManifestFileName;

    auto manifest = sample_manifest();
    REQUIRE_FALSE(write_manifest(*io, path, manifest));
    manifest.disk_consistent_lsn = 0xA000U;
    manifest.layers.pop_back();
    REQUIRE_FALSE(write_manifest(*io, path, manifest));
    CHECK_FALSE(std::filesystem::exists(path.string() + ".tmp"));

    TimelineManifest loaded{};
    REQUIRE_FALSE(read_manifest(*io, path, loaded));
    CHECK(loaded == manifest);

    TimelineManifest missing{};
    CHECK(read_manifest(*io, dir / "absent", missing) == std::errc::no_such_file_or_directory);

    io->shutdown();
    (void)std::filesystem::remove_all(dir);
}

TEST_CASE("Timeline ids render as 32 hex digits", "[manifest]")
{
    const auto id = TimelineId::generate();
    const auto text = id.to_string();
    CHECK(text.size() == 32U);
    const auto parsed = TimelineId::parse(text);
    REQUIRE(parsed.has_value());
    CHECK(*parsed == id);
    CHECK_FALSE(TimelineId::parse("xyz").has_value());
    CHECK_FALSE(TimelineId::parse(text.substr(1)).has_value());
    CHECK(TimelineId{}.is_zero());
}

}  // namespace strata::timeline::tests
