#pragma once

#include "strata/storage/async_io.hpp"
#include "strata/storage/remote_storage.hpp"
#include "strata/storage/wal_codec.hpp"
#include "strata/timeline/page_cache.hpp"
#include "strata/timeline/timeline.hpp"

#include <array>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace strata::timeline::tests {

inline std::filesystem::path make_temp_dir(const std::string& name)
{
    auto root = std::filesystem::temp_directory_path();
    auto dir = root / (name + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    (void)std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

// Small thresholds so tests produce several layers quickly.
inline TimelineConfig make_test_config()
{
    TimelineConfig config{};
    config.checkpoint_distance = 1024U * 1024U;
    config.max_frozen_bytes = 64U * 1024U * 1024U;
    config.compaction_target_size = 1024U * 1024U;
    config.compaction_threshold = 4U;
    config.image_creation_threshold = 2U;
    config.gc_horizon = 0U;
    config.wait_lsn_timeout = std::chrono::milliseconds{500};
    config.remote_retry.max_attempts = 2U;
    config.remote_retry.base_delay = std::chrono::milliseconds{1};
    config.remote_retry.max_delay = std::chrono::milliseconds{2};
    return config;
}

inline storage::WalRecord add_record(std::uint64_t lsn, const storage::Key& key, std::uint64_t addend)
{
    const std::array<storage::RedoOp, 1> ops{storage::RedoOp::add_u64(0U, addend)};
    storage::WalRecord record{};
    record.lsn = lsn;
    record.blocks.push_back(storage::WalBlock{key, storage::PageValue::delta(ops)});
    return record;
}

inline storage::WalRecord image_record(std::uint64_t lsn, const storage::Key& key, std::uint64_t value)
{
    storage::WalRecord record{};
    record.lsn = lsn;
    record.blocks.push_back(storage::WalBlock{key, storage::PageValue::image(storage::encode_u64_page(value))});
    return record;
}

// Owns the shared resources a set of timelines runs on, rooted in a temp directory.
class TimelineHarness {
public:
    explicit TimelineHarness(const std::string& name, bool with_remote = false)
        : dir_{make_temp_dir(name)}
        , io_{storage::create_async_io()}
        , page_cache_{std::make_shared<PageCache>()}
    {
        if (with_remote) {
            remote_ = std::make_shared<storage::LocalRemoteStorage>(dir_ / "remote");
        }
    }

    ~TimelineHarness()
    {
        timelines_.clear();
        io_->shutdown();
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    TimelineHarness(const TimelineHarness&) = delete;
    TimelineHarness& operator=(const TimelineHarness&) = delete;

    TimelineResources resources()
    {
        TimelineResources resources{};
        resources.io = io_;
        resources.remote = remote_;
        resources.page_cache = page_cache_;
        resources.resolve_ancestor = [this](const TimelineId& id) -> std::shared_ptr<Timeline> {
            for (const auto& timeline : timelines_) {
                if (timeline->id() == id) {
                    return timeline;
                }
            }
            return nullptr;
        };
        return resources;
    }

    std::filesystem::path timeline_dir(const TimelineId& id) const
    {
        return dir_ / "timelines" / id.to_string();
    }

    std::shared_ptr<Timeline> create_root(const TimelineConfig& config = make_test_config())
    {
        const auto id = TimelineId::generate();
        auto timeline = std::make_shared<Timeline>(id, std::nullopt, 0U, timeline_dir(id), config, resources());
        if (timeline->initialize(0U, 0U, 0U)) {
            return nullptr;
        }
        timelines_.push_back(timeline);
        return timeline;
    }

    std::shared_ptr<Timeline> create_child(const Timeline& ancestor, std::uint64_t at_lsn, const TimelineConfig& config = make_test_config())
    {
        const auto id = TimelineId::generate();
        auto timeline = std::make_shared<Timeline>(id, ancestor.id(), at_lsn, timeline_dir(id), config, resources());
        if (timeline->initialize(at_lsn, 0U, ancestor.gc_cutoff_lsn())) {
            return nullptr;
        }
        timelines_.push_back(timeline);
        return timeline;
    }

    // Drops the in-memory timeline and loads it again from its directory.
    std::shared_ptr<Timeline> restart(std::shared_ptr<Timeline>& timeline, const TimelineConfig& config = make_test_config())
    {
        const auto directory = timeline->directory();
        std::erase(timelines_, timeline);
        timeline->shutdown();
        timeline.reset();
        page_cache_->clear();

        std::shared_ptr<Timeline> loaded;
        if (Timeline::load(directory, config, resources(), loaded)) {
            return nullptr;
        }
        timelines_.push_back(loaded);
        return loaded;
    }

    const std::filesystem::path& dir() const noexcept
    {
        return dir_;
    }

    const std::shared_ptr<storage::AsyncIo>& io() const noexcept
    {
        return io_;
    }

    const std::shared_ptr<storage::RemoteStorage>& remote() const noexcept
    {
        return remote_;
    }

    // Applies to timelines created or loaded afterwards.
    void set_remote(std::shared_ptr<storage::RemoteStorage> remote)
    {
        remote_ = std::move(remote);
    }

    const std::shared_ptr<PageCache>& page_cache() const noexcept
    {
        return page_cache_;
    }

private:
    std::filesystem::path dir_;
    std::shared_ptr<storage::AsyncIo> io_;
    std::shared_ptr<storage::RemoteStorage> remote_;
    std::shared_ptr<PageCache> page_cache_;
    std::vector<std::shared_ptr<Timeline>> timelines_;
};

inline std::uint64_t read_u64(Timeline& timeline, const storage::Key& key, std::uint64_t lsn, std::error_code& ec)
{
    std::vector<std::byte> page;
    ec = timeline.get_page(key, lsn, page);
    return ec ? 0U : storage::decode_u64_page(page);
}

}  // namespace strata::timeline::tests
