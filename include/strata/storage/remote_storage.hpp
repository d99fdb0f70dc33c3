#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <system_error>

namespace strata::storage {

// Object storage for immutable layer files, addressed by slash-separated keys.
class RemoteStorage {
public:
    virtual ~RemoteStorage() = default;

    [[nodiscard]] virtual std::error_code upload(const std::filesystem::path& local_path, const std::string& remote_key) = 0;
    [[nodiscard]] virtual std::error_code download(const std::string& remote_key, const std::filesystem::path& local_path) = 0;
    [[nodiscard]] virtual std::error_code remove(const std::string& remote_key) = 0;
    [[nodiscard]] virtual bool exists(const std::string& remote_key) const = 0;
};

// Keeps objects as files under a root directory.
class LocalRemoteStorage final : public RemoteStorage {
public:
    explicit LocalRemoteStorage(std::filesystem::path root);

    std::error_code upload(const std::filesystem::path& local_path, const std::string& remote_key) override;
    std::error_code download(const std::string& remote_key, const std::filesystem::path& local_path) override;
    std::error_code remove(const std::string& remote_key) override;
    bool exists(const std::string& remote_key) const override;

    [[nodiscard]] const std::filesystem::path& root() const noexcept;

private:
    [[nodiscard]] std::filesystem::path object_path(const std::string& remote_key) const;

    std::filesystem::path root_{};
};

struct RemoteRetryPolicy final {
    std::size_t max_attempts = 5U;
    std::chrono::milliseconds base_delay{50};
    std::chrono::milliseconds max_delay{std::chrono::seconds{5}};
};

// Runs `operation` until it succeeds, the attempts run out, or `cancelled` is set.
// Returns the last error of the final attempt.
[[nodiscard]] std::error_code retry_with_backoff(const RemoteRetryPolicy& policy,
                                                 const std::function<std::error_code()>& operation,
                                                 const std::atomic_bool* cancelled = nullptr,
                                                 const std::string& description = {});

}  // namespace strata::storage
