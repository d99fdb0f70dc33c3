#pragma once

#include "strata/storage/async_io.hpp"
#include "strata/storage/layer.hpp"
#include "strata/storage/layer_file.hpp"
#include "strata/storage/remote_storage.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

namespace strata::storage {

struct PersistentLayerContext final {
    std::shared_ptr<AsyncIo> io{};
    std::shared_ptr<RemoteStorage> remote{};
    RemoteRetryPolicy retry{};
    const std::atomic_bool* cancelled = nullptr;
};

// Immutable delta or image layer backed by a local file and optionally a remote copy.
// Contents load on first access and may be evicted; a local file that was evicted is
// downloaded again on demand. Files marked for deletion are unlinked when the last
// reference to the layer goes away, so readers holding an older LayerMap snapshot
// keep working.
class PersistentLayer final : public Layer {
public:
    PersistentLayer(LayerDescriptor descriptor,
                    std::filesystem::path local_path,
                    std::string remote_key,
                    std::uint64_t file_size,
                    PersistentLayerContext context);
    ~PersistentLayer() override;

    PersistentLayer(const PersistentLayer&) = delete;
    PersistentLayer& operator=(const PersistentLayer&) = delete;

    [[nodiscard]] LayerDescriptor descriptor() const override;
    [[nodiscard]] std::error_code collect_versions(const Key& key,
                                                  std::uint64_t max_lsn,
                                                  std::vector<VersionedValue>& out) const override;
    [[nodiscard]] std::error_code load_entries(std::vector<LayerEntry>& out) const override;
    [[nodiscard]] std::error_code collect_keys(std::uint64_t max_lsn, std::set<Key>& out) const override;

    [[nodiscard]] const std::filesystem::path& local_path() const noexcept;
    [[nodiscard]] const std::string& remote_key() const noexcept;
    [[nodiscard]] std::uint64_t file_size() const noexcept;

    [[nodiscard]] bool uploaded() const noexcept;
    void set_uploaded(bool uploaded) noexcept;
    [[nodiscard]] bool resident() const;
    [[nodiscard]] bool local_file_present() const;

    [[nodiscard]] std::error_code upload();
    // Drops the in-memory contents. With `drop_local_file`, also removes the local
    // file, which is only allowed once the layer is uploaded.
    [[nodiscard]] std::error_code evict(bool drop_local_file);

    void mark_for_deletion() noexcept;
    [[nodiscard]] bool marked_for_deletion() const noexcept;

private:
    [[nodiscard]] std::error_code reader(std::shared_ptr<const LayerFileReader>& out) const;
    [[nodiscard]] std::error_code ensure_local_file() const;

    LayerDescriptor descriptor_{};
    std::filesystem::path local_path_{};
    std::string remote_key_{};
    std::uint64_t file_size_ = 0U;
    PersistentLayerContext context_{};

    mutable std::mutex mutex_{};
    mutable std::shared_ptr<const LayerFileReader> reader_{};
    std::atomic_bool uploaded_{false};
    std::atomic_bool delete_on_drop_{false};
};

}  // namespace strata::storage
