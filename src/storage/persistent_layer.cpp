#include "strata/storage/persistent_layer.hpp"

#include "strata/storage/storage_errors.hpp"

#include <glog/logging.h>

#include <stdexcept>
#include <utility>

namespace strata::storage {

PersistentLayer::PersistentLayer(LayerDescriptor descriptor,
                                 std::filesystem::path local_path,
                                 std::string remote_key,
                                 std::uint64_t file_size,
                                 PersistentLayerContext context)
    : descriptor_{std::move(descriptor)}
    , local_path_{std::move(local_path)}
    , remote_key_{std::move(remote_key)}
    , file_size_{file_size}
    , context_{std::move(context)}
{
    if (!context_.io) {
        throw std::invalid_argument{"PersistentLayer requires a valid AsyncIo instance"};
    }
    if (descriptor_.kind == LayerKind::InMemory) {
        throw std::invalid_argument{"PersistentLayer must be a delta or image layer"};
    }
}

PersistentLayer::~PersistentLayer()
{
    if (!delete_on_drop_.load(std::memory_order_acquire)) {
        return;
    }

    std::error_code ec;
    std::filesystem::remove(local_path_, ec);
    if (ec) {
        LOG(ERROR) << "Failed to remove layer file " << local_path_ << ": " << ec.message();
    }
    if (context_.remote && uploaded_.load(std::memory_order_acquire)) {
        if (auto remote_ec = context_.remote->remove(remote_key_); remote_ec) {
            LOG(ERROR) << "Failed to remove remote layer " << remote_key_ << ": " << remote_ec.message();
        }
    }
    VLOG(1) << "Deleted layer " << descriptor_.to_string();
}

LayerDescriptor PersistentLayer::descriptor() const
{
    return descriptor_;
}

const std::filesystem::path& PersistentLayer::local_path() const noexcept
{
    return local_path_;
}

const std::string& PersistentLayer::remote_key() const noexcept
{
    return remote_key_;
}

std::uint64_t PersistentLayer::file_size() const noexcept
{
    return file_size_;
}

bool PersistentLayer::uploaded() const noexcept
{
    return uploaded_.load(std::memory_order_acquire);
}

void PersistentLayer::set_uploaded(bool uploaded) noexcept
{
    uploaded_.store(uploaded, std::memory_order_release);
}

bool PersistentLayer::resident() const
{
    std::lock_guard lock(mutex_);
    return reader_ != nullptr;
}

bool PersistentLayer::local_file_present() const
{
    std::error_code ec;
    return std::filesystem::exists(local_path_, ec);
}

void PersistentLayer::mark_for_deletion() noexcept
{
    delete_on_drop_.store(true, std::memory_order_release);
}

bool PersistentLayer::marked_for_deletion() const noexcept
{
    return delete_on_drop_.load(std::memory_order_acquire);
}

std::error_code PersistentLayer::ensure_local_file() const
{
    if (local_file_present()) {
        return {};
    }
    if (!context_.remote || !uploaded()) {
        LOG(ERROR) << "Layer file " << local_path_ << " is missing and has no remote copy";
        return make_error_code(StorageErrc::CorruptLayer);
    }

    auto download = [this]() { return context_.remote->download(remote_key_, local_path_); };
    if (auto ec = retry_with_backoff(context_.retry, download, context_.cancelled, "download " + remote_key_); ec) {
        return ec == StorageErrc::Cancelled ? ec : make_error_code(StorageErrc::RemoteStorageUnavailable);
    }
    VLOG(1) << "Downloaded layer " << remote_key_;
    return {};
}

std::error_code PersistentLayer::reader(std::shared_ptr<const LayerFileReader>& out) const
{
    std::lock_guard lock(mutex_);
    if (reader_) {
        out = reader_;
        return {};
    }

    if (auto ec = ensure_local_file(); ec) {
        return ec;
    }

    std::vector<std::byte> bytes;
    if (auto ec = read_whole_file(*context_.io, local_path_, FileClass::LayerFile, bytes); ec) {
        LOG(ERROR) << "Failed to read layer file " << local_path_ << ": " << ec.message();
        return make_error_code(StorageErrc::CorruptLayer);
    }

    auto parsed = std::make_shared<LayerFileReader>();
    if (auto ec = LayerFileReader::parse(std::move(bytes), *parsed); ec) {
        LOG(ERROR) << "Layer file " << local_path_ << " failed validation: " << ec.message();
        return ec;
    }
    if (parsed->descriptor() != descriptor_) {
        LOG(ERROR) << "Layer file " << local_path_ << " does not match its descriptor " << descriptor_.to_string();
        return make_error_code(StorageErrc::CorruptLayer);
    }

    reader_ = std::move(parsed);
    out = reader_;
    return {};
}

std::error_code PersistentLayer::collect_versions(const Key& key,
                                                  std::uint64_t max_lsn,
                                                  std::vector<VersionedValue>& out) const
{
    std::shared_ptr<const LayerFileReader> contents;
    if (auto ec = reader(contents); ec) {
        return ec;
    }
    contents->collect_versions(key, max_lsn, out);
    return {};
}

std::error_code PersistentLayer::load_entries(std::vector<LayerEntry>& out) const
{
    std::shared_ptr<const LayerFileReader> contents;
    if (auto ec = reader(contents); ec) {
        return ec;
    }
    contents->load_entries(out);
    return {};
}

std::error_code PersistentLayer::collect_keys(std::uint64_t max_lsn, std::set<Key>& out) const
{
    std::shared_ptr<const LayerFileReader> contents;
    if (auto ec = reader(contents); ec) {
        return ec;
    }
    contents->collect_keys(max_lsn, out);
    return {};
}

std::error_code PersistentLayer::upload()
{
    if (uploaded()) {
        return {};
    }
    if (!context_.remote) {
        return {};
    }

    auto operation = [this]() { return context_.remote->upload(local_path_, remote_key_); };
    if (auto ec = retry_with_backoff(context_.retry, operation, context_.cancelled, "upload " + remote_key_); ec) {
        return ec == StorageErrc::Cancelled ? ec : make_error_code(StorageErrc::RemoteStorageUnavailable);
    }
    set_uploaded(true);
    VLOG(1) << "Uploaded layer " << remote_key_;
    return {};
}

std::error_code PersistentLayer::evict(bool drop_local_file)
{
    std::lock_guard lock(mutex_);
    if (drop_local_file) {
        if (!uploaded()) {
            return std::make_error_code(std::errc::operation_not_permitted);
        }
        std::error_code ec;
        std::filesystem::remove(local_path_, ec);
        if (ec) {
            return ec;
        }
    }
    reader_.reset();
    return {};
}

}  // namespace strata::storage
