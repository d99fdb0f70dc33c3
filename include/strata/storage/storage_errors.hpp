#pragma once

#include <system_error>

namespace strata::storage {

enum class StorageErrc {
    Success = 0,
    // protocol
    LsnOutOfOrder,
    CorruptWalRecord,
    // corruption
    MissingBaseImage,
    NoCoveringLayer,
    CorruptLayer,
    CorruptDelta,
    CorruptManifest,
    // resource
    RemoteStorageUnavailable,
    // policy
    LsnTooOld,
    LsnInFuture,
    WaitLsnTimeout,
    BranchPointTooOld,
    // lifecycle
    TimelineNotFound,
    TimelineAlreadyExists,
    TimelineHasChildren,
    TimelineBroken,
    TimelineStopping,
    Cancelled
};

enum class StorageErrorClass {
    None,
    Protocol,
    Corruption,
    Resource,
    Policy,
    Lifecycle
};

const std::error_category& storage_error_category() noexcept;
std::error_code make_error_code(StorageErrc value) noexcept;

[[nodiscard]] StorageErrorClass classify(const std::error_code& ec) noexcept;

}  // namespace strata::storage

namespace std {

template <>
struct is_error_code_enum<strata::storage::StorageErrc> : true_type {
};

}  // namespace std
