#include "strata/timeline/page_reconstruct.hpp"

#include "strata/storage/storage_errors.hpp"

#include <algorithm>

namespace strata::timeline {

using storage::StorageErrc;
using storage::VersionedValue;

void ReconstructState::add_versions(std::vector<VersionedValue> versions)
{
    if (versions.empty()) {
        return;
    }
    versions_.insert(versions_.end(),
                     std::make_move_iterator(versions.begin()),
                     std::make_move_iterator(versions.end()));
    std::stable_sort(versions_.begin(), versions_.end(), [](const VersionedValue& lhs, const VersionedValue& rhs) {
        if (lhs.lsn != rhs.lsn) {
            return lhs.lsn > rhs.lsn;
        }
        return lhs.value.is_image() && !rhs.value.is_image();
    });
    locate_base();
}

void ReconstructState::locate_base()
{
    base_index_.reset();
    for (std::size_t index = 0; index < versions_.size(); ++index) {
        if (versions_[index].value.is_base()) {
            base_index_ = index;
            return;
        }
    }
}

bool ReconstructState::has_base() const noexcept
{
    return base_index_.has_value();
}

std::optional<std::uint64_t> ReconstructState::base_lsn() const noexcept
{
    if (!base_index_) {
        return std::nullopt;
    }
    return versions_[*base_index_].lsn;
}

bool ReconstructState::empty() const noexcept
{
    return versions_.empty();
}

std::size_t ReconstructState::version_count() const noexcept
{
    return versions_.size();
}

std::error_code ReconstructState::materialize(const std::vector<std::byte>* ancestor_page,
                                              std::vector<std::byte>& out) const
{
    std::vector<std::byte> page;
    std::size_t newer = versions_.size();
    std::uint64_t floor_lsn = 0U;
    if (base_index_) {
        const auto& base = versions_[*base_index_];
        if (auto ec = storage::apply_page_value(page, base.value); ec) {
            return ec;
        }
        newer = *base_index_;
        floor_lsn = base.lsn;
    } else if (ancestor_page != nullptr) {
        page = *ancestor_page;
    } else {
        return make_error_code(versions_.empty() ? StorageErrc::NoCoveringLayer : StorageErrc::MissingBaseImage);
    }

    // Entries before `newer` are at or above the base; a delta sharing the
    // base image's LSN is already part of that image.
    while (newer > 0U) {
        const auto& version = versions_[--newer];
        if (base_index_ && version.lsn <= floor_lsn) {
            continue;
        }
        if (auto ec = storage::apply_page_value(page, version.value); ec) {
            return ec;
        }
    }

    out = std::move(page);
    return {};
}

std::error_code collect_reconstruct_data(const std::vector<std::shared_ptr<const storage::Layer>>& layers,
                                         const storage::Key& key,
                                         std::uint64_t lsn,
                                         ReconstructState& state)
{
    for (const auto& layer : layers) {
        const auto descriptor = layer->descriptor();
        if (const auto base = state.base_lsn(); base && descriptor.lsn_range.end <= *base + 1U) {
            break;
        }

        std::vector<VersionedValue> versions;
        if (auto ec = layer->collect_versions(key, lsn, versions); ec) {
            return ec;
        }
        state.add_versions(std::move(versions));
    }
    return {};
}

}  // namespace strata::timeline
