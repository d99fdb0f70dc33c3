#include "strata/storage/storage_errors.hpp"

#include <string>

namespace strata::storage {

namespace {

class StorageErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "strata.storage";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<StorageErrc>(condition)) {
        case StorageErrc::Success:
            return "success";
        case StorageErrc::LsnOutOfOrder:
            return "WAL record LSN is not greater than the last record LSN";
        case StorageErrc::CorruptWalRecord:
            return "WAL record failed to decode";
        case StorageErrc::MissingBaseImage:
            return "no base image found for delta chain";
        case StorageErrc::NoCoveringLayer:
            return "no layer covers the requested key";
        case StorageErrc::CorruptLayer:
            return "layer file is corrupt";
        case StorageErrc::CorruptDelta:
            return "page delta failed to apply";
        case StorageErrc::CorruptManifest:
            return "timeline manifest is corrupt";
        case StorageErrc::RemoteStorageUnavailable:
            return "remote storage unavailable";
        case StorageErrc::LsnTooOld:
            return "requested LSN is older than the GC cutoff";
        case StorageErrc::LsnInFuture:
            return "requested LSN is beyond the last record LSN";
        case StorageErrc::WaitLsnTimeout:
            return "timed out waiting for LSN";
        case StorageErrc::BranchPointTooOld:
            return "branch point is older than the ancestor GC cutoff";
        case StorageErrc::TimelineNotFound:
            return "timeline not found";
        case StorageErrc::TimelineAlreadyExists:
            return "timeline already exists";
        case StorageErrc::TimelineHasChildren:
            return "timeline has live descendants";
        case StorageErrc::TimelineBroken:
            return "timeline is broken";
        case StorageErrc::TimelineStopping:
            return "timeline is stopping";
        case StorageErrc::Cancelled:
            return "operation cancelled";
        default:
            return "unknown storage error";
        }
    }
};

const StorageErrorCategory kCategory{};

}  // namespace

const std::error_category& storage_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(StorageErrc value) noexcept
{
    return {static_cast<int>(value), kCategory};
}

StorageErrorClass classify(const std::error_code& ec) noexcept
{
    if (!ec) {
        return StorageErrorClass::None;
    }
    if (ec.category() != kCategory) {
        return StorageErrorClass::Resource;
    }
    switch (static_cast<StorageErrc>(ec.value())) {
    case StorageErrc::LsnOutOfOrder:
    case StorageErrc::CorruptWalRecord:
        return StorageErrorClass::Protocol;
    case StorageErrc::MissingBaseImage:
    case StorageErrc::NoCoveringLayer:
    case StorageErrc::CorruptLayer:
    case StorageErrc::CorruptDelta:
    case StorageErrc::CorruptManifest:
        return StorageErrorClass::Corruption;
    case StorageErrc::RemoteStorageUnavailable:
        return StorageErrorClass::Resource;
    case StorageErrc::LsnTooOld:
    case StorageErrc::LsnInFuture:
    case StorageErrc::WaitLsnTimeout:
    case StorageErrc::BranchPointTooOld:
        return StorageErrorClass::Policy;
    case StorageErrc::Success:
        return StorageErrorClass::None;
    default:
        return StorageErrorClass::Lifecycle;
    }
}

}  // namespace strata::storage
