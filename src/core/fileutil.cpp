#include "blockship/core/fileutil.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace blockship::fileutil {
namespace fs = std::filesystem;

std::string errno_message(int err) {
    return std::error_code(err, std::generic_category()).message();
}

FileHandle::~FileHandle() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

FileHandle::FileHandle(FileHandle&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Result<void> FileHandle::sync() {
    if (::fsync(fd_) != 0) {
        return Err<void>(std::string("fsync: ") + errno_message(errno));
    }
    return Ok();
}

Result<void> FileHandle::close() {
    const int fd = fd_;
    fd_ = -1;
    if (fd >= 0 && ::close(fd) != 0) {
        return Err<void>(std::string("close: ") + errno_message(errno));
    }
    return Ok();
}

Result<FileHandle> open_directory(const fs::path& dir) {
    const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return Err<FileHandle>("open dir " + dir.string() + ": " + errno_message(errno));
    }
    return Ok(FileHandle(fd));
}

Result<void> fsync_directory(const fs::path& dir) {
    auto handle = open_directory(dir);
    if (handle.is_error()) {
        return Err<void>(handle.error());
    }
    if (auto res = handle.value().sync(); res.is_error()) {
        return Err<void>("sync dir " + dir.string() + ": " + res.error());
    }
    return handle.value().close();
}

Result<FileHandle> create_file(const fs::path& path) {
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0666);
    if (fd < 0) {
        return Err<FileHandle>("create " + path.string() + ": " + errno_message(errno));
    }
    return Ok(FileHandle(fd));
}

Result<void> write_all(FileHandle& file, std::string_view data) {
    std::size_t written = 0;
    while (written < data.size()) {
        const auto n = ::write(file.native_handle(), data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Err<void>(std::string("write: ") + errno_message(errno));
        }
        written += static_cast<std::size_t>(n);
    }
    return Ok();
}

Result<void> write_file_atomically(const fs::path& path, std::string_view content) {
    const fs::path tmp = path.string() + ".tmp";

    auto created = create_file(tmp);
    if (created.is_error()) {
        return Err<void>(created.error());
    }
    auto& file = created.value();

    if (auto res = write_all(file, content); res.is_error()) {
        return Err<void>(tmp.string() + ": " + res.error());
    }

    if (auto res = file.sync(); res.is_error()) {
        return Err<void>(tmp.string() + ": " + res.error());
    }
    if (auto res = file.close(); res.is_error()) {
        return Err<void>(tmp.string() + ": " + res.error());
    }

    // rename(2) cannot replace a directory with a file.
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        fs::remove_all(path, ec);
        if (ec) {
            return Err<void>("remove " + path.string() + ": " + ec.message());
        }
    }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        return Err<void>("rename " + tmp.string() + ": " + errno_message(errno));
    }

    auto parent = path.parent_path();
    if (parent.empty()) {
        parent = ".";
    }
    return fsync_directory(parent);
}

Result<std::string> read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>("open " + path.string() + ": " + errno_message(errno));
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (input.bad()) {
        return Err<std::string>("read " + path.string() + ": " + errno_message(errno));
    }
    return Ok(buffer.str());
}

Result<void> hardlink_file(const fs::path& src, const fs::path& dst) {
    if (::link(src.c_str(), dst.c_str()) != 0) {
        return Err<void>("link " + src.string() + " -> " + dst.string() + ": " + errno_message(errno));
    }
    return Ok();
}

Result<std::vector<std::string>> read_dir_names(const fs::path& dir) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return Err<std::vector<std::string>>("read dir " + dir.string() + ": " + ec.message());
    }

    std::vector<std::string> names;
    const fs::directory_iterator end{};
    for (; it != end; it.increment(ec)) {
        names.push_back(it->path().filename().string());
    }
    if (ec) {
        return Err<std::vector<std::string>>("read dir " + dir.string() + ": " + ec.message());
    }

    std::sort(names.begin(), names.end());
    return Ok(std::move(names));
}

} // namespace blockship::fileutil
