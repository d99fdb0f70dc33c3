#include "strata/storage/remote_storage.hpp"

#include "strata/storage/storage_errors.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace strata::storage {

LocalRemoteStorage::LocalRemoteStorage(std::filesystem::path root)
    : root_{std::move(root)}
{
    if (root_.empty()) {
        throw std::invalid_argument{"LocalRemoteStorage requires a root directory"};
    }
}

std::filesystem::path LocalRemoteStorage::object_path(const std::string& remote_key) const
{
    return root_ / std::filesystem::path{remote_key};
}

std::error_code LocalRemoteStorage::upload(const std::filesystem::path& local_path, const std::string& remote_key)
{
    const auto destination = object_path(remote_key);
    std::error_code ec;
    std::filesystem::create_directories(destination.parent_path(), ec);
    if (ec) {
        return ec;
    }

    auto staging = destination;
    staging += ".part";
    std::filesystem::copy_file(local_path, staging, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return ec;
    }
    std::filesystem::rename(staging, destination, ec);
    return ec;
}

std::error_code LocalRemoteStorage::download(const std::string& remote_key, const std::filesystem::path& local_path)
{
    const auto source = object_path(remote_key);
    std::error_code ec;
    if (!std::filesystem::exists(source, ec)) {
        return ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory);
    }
    if (local_path.has_parent_path()) {
        std::filesystem::create_directories(local_path.parent_path(), ec);
        if (ec) {
            return ec;
        }
    }

    auto staging = local_path;
    staging += ".download";
    std::filesystem::copy_file(source, staging, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return ec;
    }
    std::filesystem::rename(staging, local_path, ec);
    return ec;
}

std::error_code LocalRemoteStorage::remove(const std::string& remote_key)
{
    std::error_code ec;
    std::filesystem::remove(object_path(remote_key), ec);
    return ec;
}

bool LocalRemoteStorage::exists(const std::string& remote_key) const
{
    std::error_code ec;
    return std::filesystem::exists(object_path(remote_key), ec);
}

const std::filesystem::path& LocalRemoteStorage::root() const noexcept
{
    return root_;
}

std::error_code retry_with_backoff(const RemoteRetryPolicy& policy,
                                   const std::function<std::error_code()>& operation,
                                   const std::atomic_bool* cancelled,
                                   const std::string& description)
{
    const auto attempts = std::max<std::size_t>(1U, policy.max_attempts);
    auto delay = policy.base_delay;
    std::error_code last_error{};

    for (std::size_t attempt = 1; attempt <= attempts; ++attempt) {
        if (cancelled != nullptr && cancelled->load(std::memory_order_acquire)) {
            return make_error_code(StorageErrc::Cancelled);
        }

        last_error = operation();
        if (!last_error) {
            return {};
        }

        LOG(WARNING) << "Remote storage operation " << description << " failed (attempt " << attempt << "/"
                     << attempts << "): " << last_error.message();
        if (attempt == attempts) {
            break;
        }
        std::this_thread::sleep_for(delay);
        delay = std::min(policy.max_delay, delay * 2);
    }

    return last_error;
}

}  // namespace strata::storage
