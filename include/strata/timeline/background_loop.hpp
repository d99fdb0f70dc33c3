#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>

namespace strata::timeline {

// Runs a maintenance task every `period` on its own thread. A forced run
// wakes the loop early; the task is told whether the run was forced.
class BackgroundLoop final {
public:
    using Task = std::function<std::error_code(bool force)>;

    struct Config final {
        std::string name{};
        std::chrono::milliseconds period{std::chrono::seconds{1}};
        bool run_immediately = false;
    };

    BackgroundLoop(Config config, Task task);
    ~BackgroundLoop();

    BackgroundLoop(const BackgroundLoop&) = delete;
    BackgroundLoop& operator=(const BackgroundLoop&) = delete;
    BackgroundLoop(BackgroundLoop&&) = delete;
    BackgroundLoop& operator=(BackgroundLoop&&) = delete;

    void start();
    void stop();
    void request_force_run();

    [[nodiscard]] bool running() const noexcept;
    [[nodiscard]] std::optional<std::chrono::steady_clock::time_point> last_run_time() const;
    [[nodiscard]] std::uint64_t run_count() const;
    [[nodiscard]] std::optional<std::error_code> last_error() const;
    [[nodiscard]] std::chrono::milliseconds period() const noexcept;
    [[nodiscard]] const std::string& name() const noexcept;

private:
    void run_loop();

    Config config_{};
    Task task_{};
    std::thread thread_{};
    mutable std::mutex mutex_{};
    std::condition_variable cv_{};
    bool running_ = false;
    bool stop_requested_ = false;
    bool force_run_requested_ = false;
    std::uint64_t run_count_ = 0U;
    std::optional<std::chrono::steady_clock::time_point> last_run_time_{};
    std::optional<std::error_code> last_error_{};
};

}  // namespace strata::timeline
