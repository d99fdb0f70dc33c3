#include "strata/timeline/page_cache.hpp"

#include <catch2/catch_test_macros.hpp>

#include <vector>

namespace strata::timeline::tests {

namespace {

std::vector<std::byte> page_of(std::size_t size, unsigned fill)
{
    return std::vector<std::byte>(size, static_cast<std::byte>(fill));
}

}  // namespace

TEST_CASE("PageCache keys entries by timeline, key and LSN", "[page_cache]")
{
    PageCache cache{PageCache::Config{1024U}};
    const auto timeline = TimelineId::generate();
    const auto other = TimelineId::generate();
    const auto key = storage::Key::from_block(3U);

    cache.insert(timeline, key, 100U, page_of(8U, 1U));

    std::vector<std::byte> out;
    REQUIRE(cache.lookup(timeline, key, 100U, out));
    CHECK(out == page_of(8U, 1U));
    CHECK_FALSE(cache.lookup(timeline, key, 101U, out));
    CHECK_FALSE(cache.lookup(other, key, 100U, out));
    CHECK_FALSE(cache.lookup(timeline, storage::Key::from_block(4U), 100U, out));

    const auto telemetry = cache.telemetry_snapshot();
    CHECK(telemetry.hits == 1U);
    CHECK(telemetry.misses == 3U);
    CHECK(telemetry.insertions == 1U);
    CHECK(telemetry.resident_bytes == 8U);
}

TEST_CASE("PageCache evicts least recently used pages past capacity", "[page_cache]")
{
    PageCache cache{PageCache::Config{256U}};
    const auto timeline = TimelineId::generate();

    cache.insert(timeline, storage::Key::from_block(1U), 10U, page_of(100U, 1U));
    cache.insert(timeline, storage::Key::from_block(2U), 10U, page_of(100U, 2U));

    std::vector<std::byte> out;
    REQUIRE(cache.lookup(timeline, storage::Key::from_block(1U), 10U, out));
    cache.insert(timeline, storage::Key::from_block(3U), 10U, page_of(100U, 3U));

    CHECK(cache.lookup(timeline, storage::Key::from_block(1U), 10U, out));
    CHECK_FALSE(cache.lookup(timeline, storage::Key::from_block(2U), 10U, out));
    CHECK(cache.lookup(timeline, storage::Key::from_block(3U), 10U, out));

    const auto telemetry = cache.telemetry_snapshot();
    CHECK(telemetry.evictions == 1U);
    CHECK(telemetry.resident_bytes <= cache.capacity_bytes());

    cache.insert(timeline, storage::Key::from_block(9U), 10U, page_of(512U, 9U));
    CHECK_FALSE(cache.lookup(timeline, storage::Key::from_block(9U), 10U, out));
}

TEST_CASE("PageCache forgets one timeline at a time", "[page_cache]")
{
    PageCache cache{};
    const auto kept = TimelineId::generate();
    const auto dropped = TimelineId::generate();
    const auto key = storage::Key::from_block(1U);

    cache.insert(kept, key, 5U, page_of(16U, 1U));
    cache.insert(dropped, key, 5U, page_of(16U, 2U));
    cache.forget_timeline(dropped);

    std::vector<std::byte> out;
    CHECK(cache.lookup(kept, key, 5U, out));
    CHECK_FALSE(cache.lookup(dropped, key, 5U, out));
    CHECK(cache.telemetry_snapshot().resident_entries == 1U);

    cache.clear();
    CHECK(cache.telemetry_snapshot().resident_bytes == 0U);
}

}  // namespace strata::timeline::tests
