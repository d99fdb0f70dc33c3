#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <future>
#include <memory>
#include <span>
#include <system_error>
#include <vector>

namespace strata::storage {

enum class FileClass : std::uint8_t {
	LayerFile,
	Manifest
};

enum class IoFlag : std::uint32_t {
	None = 0,
	Dsync = 1U << 0,
	HighPriority = 1U << 1,
	Truncate = 1U << 2
};

constexpr IoFlag operator|(IoFlag lhs, IoFlag rhs)
{
	return static_cast<IoFlag>(static_cast<std::uint32_t>(lhs) | static_cast<std::uint32_t>(rhs));
}

constexpr IoFlag operator&(IoFlag lhs, IoFlag rhs)
{
	return static_cast<IoFlag>(static_cast<std::uint32_t>(lhs) & static_cast<std::uint32_t>(rhs));
}

constexpr bool any(IoFlag flags)
{
	return static_cast<std::uint32_t>(flags) != 0U;
}

struct IoDescriptor {
	std::filesystem::path path{};
	std::uint64_t offset = 0U;
	FileClass file_class = FileClass::LayerFile;
};

struct ReadRequest final : IoDescriptor {
	std::byte* data = nullptr;
	std::size_t size = 0U;
};

struct WriteRequest final : IoDescriptor {
	const std::byte* data = nullptr;
	std::size_t size = 0U;
	IoFlag flags = IoFlag::None;
};

struct IoResult {
	std::size_t bytes_transferred = 0U;
	std::error_code status{};
};

struct AsyncIoConfig {
	std::size_t worker_threads = 4U;
	std::size_t queue_depth = 128U;
};

class AsyncIo {
public:
	virtual ~AsyncIo() = default;

	[[nodiscard]] virtual std::future<IoResult> submit_read(ReadRequest request) = 0;
	[[nodiscard]] virtual std::future<IoResult> submit_write(WriteRequest request) = 0;
	[[nodiscard]] virtual std::future<IoResult> flush(FileClass file_class) = 0;
	virtual void shutdown() = 0;
};

[[nodiscard]] std::unique_ptr<AsyncIo> create_async_io(const AsyncIoConfig& config = {});

// Reads the whole file at `path` through `io`.
[[nodiscard]] std::error_code read_whole_file(AsyncIo& io,
                                              const std::filesystem::path& path,
                                              FileClass file_class,
                                              std::vector<std::byte>& out);

// Writes `data` to `path` + ".tmp", syncs it, then renames it over `path`.
[[nodiscard]] std::error_code write_file_atomically(AsyncIo& io,
                                                    const std::filesystem::path& path,
                                                    FileClass file_class,
                                                    std::span<const std::byte> data);

}  // namespace strata::storage
