#include "strata/timeline/background_loop.hpp"

#include "strata/storage/storage_errors.hpp"

#include <glog/logging.h>

#include <stdexcept>
#include <utility>

namespace strata::timeline {

BackgroundLoop::BackgroundLoop(Config config, Task task)
    : config_{std::move(config)}
    , task_{std::move(task)}
{
    if (!task_) {
        throw std::invalid_argument{"BackgroundLoop requires a task"};
    }
}

BackgroundLoop::~BackgroundLoop()
{
    stop();
}

void BackgroundLoop::start()
{
    std::lock_guard lock(mutex_);
    if (running_) {
        return;
    }

    stop_requested_ = false;
    force_run_requested_ = force_run_requested_ || config_.run_immediately;
    running_ = true;
    thread_ = std::thread([this]() { run_loop(); });
}

void BackgroundLoop::stop()
{
    {
        std::lock_guard lock(mutex_);
        if (!running_) {
            return;
        }
        stop_requested_ = true;
        cv_.notify_all();
    }

    if (thread_.joinable()) {
        thread_.join();
    }

    std::lock_guard lock(mutex_);
    running_ = false;
    stop_requested_ = false;
    force_run_requested_ = false;
}

void BackgroundLoop::request_force_run()
{
    std::lock_guard lock(mutex_);
    if (!running_) {
        force_run_requested_ = true;
        return;
    }
    if (force_run_requested_) {
        return;
    }
    force_run_requested_ = true;
    cv_.notify_all();
}

bool BackgroundLoop::running() const noexcept
{
    std::lock_guard lock(mutex_);
    return running_;
}

std::optional<std::chrono::steady_clock::time_point> BackgroundLoop::last_run_time() const
{
    std::lock_guard lock(mutex_);
    return last_run_time_;
}

std::uint64_t BackgroundLoop::run_count() const
{
    std::lock_guard lock(mutex_);
    return run_count_;
}

std::optional<std::error_code> BackgroundLoop::last_error() const
{
    std::lock_guard lock(mutex_);
    return last_error_;
}

std::chrono::milliseconds BackgroundLoop::period() const noexcept
{
    return config_.period;
}

const std::string& BackgroundLoop::name() const noexcept
{
    return config_.name;
}

void BackgroundLoop::run_loop()
{
    const auto interval = config_.period;
    std::unique_lock lock(mutex_);

    while (!stop_requested_) {
        bool force_run = false;

        if (force_run_requested_) {
            force_run = true;
        } else if (interval.count() == 0) {
            cv_.wait(lock, [this]() { return stop_requested_ || force_run_requested_; });
            continue;
        } else {
            const auto target_time = last_run_time_.has_value()
                                         ? (*last_run_time_ + interval)
                                         : (std::chrono::steady_clock::now() + interval);
            const bool should_wake = cv_.wait_until(lock, target_time, [this]() {
                return stop_requested_ || force_run_requested_;
            });

            if (should_wake) {
                if (stop_requested_) {
                    break;
                }
                force_run = true;
            }
        }

        force_run_requested_ = false;

        lock.unlock();
        const auto now = std::chrono::steady_clock::now();
        const auto result = task_(force_run);
        if (result && result != storage::StorageErrc::Cancelled) {
            LOG(WARNING) << "Background " << config_.name << " pass failed: " << result.message();
        }
        lock.lock();
        last_run_time_ = now;
        ++run_count_;
        if (result) {
            last_error_ = result;
        } else {
            last_error_.reset();
        }
    }
}

}  // namespace strata::timeline
