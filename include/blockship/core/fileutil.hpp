#pragma once

#include "blockship/core/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace blockship::fileutil {

/**
 * @brief Owning POSIX file descriptor, closed on destruction
 */
class FileHandle {
public:
    FileHandle() = default;
    explicit FileHandle(int fd) : fd_(fd) {}
    ~FileHandle();

    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;

    FileHandle(FileHandle&& other) noexcept;
    FileHandle& operator=(FileHandle&& other) noexcept;

    bool is_valid() const { return fd_ >= 0; }
    int native_handle() const { return fd_; }

    Result<void> sync();
    Result<void> close();

private:
    int fd_ = -1;
};

Result<FileHandle> open_directory(const std::filesystem::path& dir);

/// Create or truncate `path` for writing.
Result<FileHandle> create_file(const std::filesystem::path& path);

/// Write all of `data`, retrying short writes and EINTR.
Result<void> write_all(FileHandle& file, std::string_view data);

/// Flush directory entries of `dir` (renames, new links) to stable storage.
Result<void> fsync_directory(const std::filesystem::path& dir);

/**
 * @brief Replace `path` with `content` so that a crash leaves either the old
 *        or the new file, never a partial one
 *
 * Writes `<path>.tmp`, fsyncs it, renames it onto `path` and fsyncs the
 * parent directory. A stale `<path>.tmp` may remain after a failure; it is
 * truncated by the next call.
 */
Result<void> write_file_atomically(const std::filesystem::path& path, std::string_view content);

Result<std::string> read_file(const std::filesystem::path& path);

/// Hard link `src` to `dst`. Fails with EXDEV across filesystems.
Result<void> hardlink_file(const std::filesystem::path& src, const std::filesystem::path& dst);

/// Names of the entries of `dir`, sorted lexically.
Result<std::vector<std::string>> read_dir_names(const std::filesystem::path& dir);

std::string errno_message(int err);

} // namespace blockship::fileutil
