#include "strata/storage/async_io.hpp"

#include <algorithm>
#include <cerrno>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <system_error>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace strata::storage {

namespace {

std::error_code last_os_error()
{
    return std::error_code{errno, std::generic_category()};
}

class FileDescriptor final {
public:
    explicit FileDescriptor(int fd) noexcept
        : fd_{fd}
    {
    }

    ~FileDescriptor()
    {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    [[nodiscard]] int get() const noexcept
    {
        return fd_;
    }

    [[nodiscard]] bool valid() const noexcept
    {
        return fd_ >= 0;
    }

private:
    int fd_ = -1;
};

IoResult perform_read(const ReadRequest& request)
{
    IoResult result{};

    if (request.data == nullptr || request.size == 0U) {
        result.status = std::make_error_code(std::errc::invalid_argument);
        return result;
    }

    FileDescriptor fd{::open(request.path.c_str(), O_RDONLY | O_CLOEXEC)};
    if (!fd.valid()) {
        result.status = last_os_error();
        return result;
    }

    std::size_t total = 0U;
    while (total < request.size) {
        const auto count = ::pread(fd.get(),
                                   request.data + total,
                                   request.size - total,
                                   static_cast<off_t>(request.offset + total));
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.status = last_os_error();
            return result;
        }
        if (count == 0) {
            break;
        }
        total += static_cast<std::size_t>(count);
    }

    result.bytes_transferred = total;
    return result;
}

IoResult perform_write(const WriteRequest& request)
{
    IoResult result{};

    if (request.data == nullptr || request.size == 0U) {
        result.status = std::make_error_code(std::errc::invalid_argument);
        return result;
    }

    int open_flags = O_WRONLY | O_CREAT | O_CLOEXEC;
    if (any(request.flags & IoFlag::Truncate)) {
        open_flags |= O_TRUNC;
    }
    FileDescriptor fd{::open(request.path.c_str(), open_flags, 0644)};
    if (!fd.valid()) {
        result.status = last_os_error();
        return result;
    }

    std::size_t total = 0U;
    while (total < request.size) {
        const auto count = ::pwrite(fd.get(),
                                    request.data + total,
                                    request.size - total,
                                    static_cast<off_t>(request.offset + total));
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.status = last_os_error();
            return result;
        }
        total += static_cast<std::size_t>(count);
    }

    if (any(request.flags & IoFlag::Dsync)) {
        if (::fsync(fd.get()) != 0) {
            result.status = last_os_error();
            return result;
        }
    }

    result.bytes_transferred = total;
    return result;
}

class ThreadPoolAsyncIo final : public AsyncIo {
public:
    explicit ThreadPoolAsyncIo(const AsyncIoConfig& config)
        : config_{config}
    {
        const auto worker_count = std::max<std::size_t>(1U, config_.worker_threads);
        for (std::size_t index = 0; index < worker_count; ++index) {
            workers_.emplace_back([this]() { worker_loop(); });
        }
    }

    ~ThreadPoolAsyncIo() override
    {
        shutdown();
    }

    std::future<IoResult> submit_read(ReadRequest request) override
    {
        Operation operation{[request = std::move(request)]() mutable -> IoResult {
            return perform_read(request);
        }};
        return enqueue(std::move(operation));
    }

    std::future<IoResult> submit_write(WriteRequest request) override
    {
        Operation operation{[request = std::move(request)]() mutable -> IoResult {
            return perform_write(request);
        }};
        return enqueue(std::move(operation));
    }

    std::future<IoResult> flush(FileClass) override
    {
        return std::async(std::launch::async, [this]() {
            std::unique_lock lock(inflight_mutex_);
            inflight_cv_.wait(lock, [this]() { return inflight_operations_ == 0U; });
            return IoResult{};
        });
    }

    void shutdown() override
    {
        {
            std::scoped_lock lock(queue_mutex_);
            if (!running_) {
                return;
            }
            running_ = false;
        }
        queue_cv_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

private:
    using Operation = std::packaged_task<IoResult()>;

    std::future<IoResult> enqueue(Operation operation)
    {
        std::unique_lock lock(queue_mutex_);
        queue_cv_.wait(lock, [this]() { return queue_.size() < config_.queue_depth || !running_; });
        if (!running_) {
            lock.unlock();
            std::promise<IoResult> promise;
            auto future = promise.get_future();
            promise.set_value(IoResult{0U, std::make_error_code(std::errc::operation_canceled)});
            return future;
        }

        auto future = operation.get_future();
        queue_.emplace_back(std::move(operation));
        lock.unlock();
        queue_cv_.notify_one();
        return future;
    }

    void worker_loop()
    {
        while (true) {
            Operation operation;
            {
                std::unique_lock lock(queue_mutex_);
                queue_cv_.wait(lock, [this]() { return !queue_.empty() || !running_; });
                if (!running_ && queue_.empty()) {
                    return;
                }
                operation = std::move(queue_.front());
                queue_.pop_front();
            }
            queue_cv_.notify_all();

            {
                std::scoped_lock lock(inflight_mutex_);
                ++inflight_operations_;
            }

            operation();

            {
                std::scoped_lock lock(inflight_mutex_);
                --inflight_operations_;
            }
            inflight_cv_.notify_all();
        }
    }

    AsyncIoConfig config_{};
    std::vector<std::thread> workers_{};
    std::deque<Operation> queue_{};
    std::mutex queue_mutex_{};
    std::condition_variable queue_cv_{};
    bool running_ = true;

    std::mutex inflight_mutex_{};
    std::condition_variable inflight_cv_{};
    std::size_t inflight_operations_ = 0U;
};

std::error_code sync_directory(const std::filesystem::path& directory)
{
    FileDescriptor fd{::open(directory.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC)};
    if (!fd.valid()) {
        return last_os_error();
    }
    if (::fsync(fd.get()) != 0) {
        return last_os_error();
    }
    return {};
}

}  // namespace

std::unique_ptr<AsyncIo> create_async_io(const AsyncIoConfig& config)
{
    return std::make_unique<ThreadPoolAsyncIo>(config);
}

std::error_code read_whole_file(AsyncIo& io,
                                const std::filesystem::path& path,
                                FileClass file_class,
                                std::vector<std::byte>& out)
{
    out.clear();
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return ec;
    }
    if (size == 0U) {
        return {};
    }

    out.resize(static_cast<std::size_t>(size));
    ReadRequest request{};
    request.path = path;
    request.offset = 0U;
    request.file_class = file_class;
    request.data = out.data();
    request.size = out.size();

    auto result = io.submit_read(request).get();
    if (result.status) {
        out.clear();
        return result.status;
    }
    if (result.bytes_transferred != request.size) {
        out.clear();
        return std::make_error_code(std::errc::io_error);
    }
    return {};
}

std::error_code write_file_atomically(AsyncIo& io,
                                      const std::filesystem::path& path,
                                      FileClass file_class,
                                      std::span<const std::byte> data)
{
    auto temp_path = path;
    temp_path += ".tmp";

    WriteRequest request{};
    request.path = temp_path;
    request.offset = 0U;
    request.file_class = file_class;
    request.data = data.data();
    request.size = data.size();
    request.flags = IoFlag::Dsync | IoFlag::Truncate;

    auto result = io.submit_write(request).get();
    if (!result.status && result.bytes_transferred != request.size) {
        result.status = std::make_error_code(std::errc::io_error);
    }
    if (result.status) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return result.status;
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return ec;
    }

    if (path.has_parent_path()) {
        return sync_directory(path.parent_path());
    }
    return {};
}

}  // namespace strata::storage
