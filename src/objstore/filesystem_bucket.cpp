#include "blockship/objstore/filesystem_bucket.hpp"

#include "blockship/core/fileutil.hpp"

#include <string_view>
#include <system_error>
#include <vector>

namespace blockship::objstore {
namespace fs = std::filesystem;

FilesystemBucket::FilesystemBucket(fs::path root) : root_(std::move(root)) {}

fs::path FilesystemBucket::object_path(const std::string& name) const {
    return root_ / fs::path(name);
}

Result<bool> FilesystemBucket::exists(const Context& ctx, const std::string& name) {
    if (auto res = ctx.check(); res.is_error()) {
        return Err<bool>(res.error());
    }
    if (auto res = validate_object_name(name); res.is_error()) {
        return Err<bool>(res.error());
    }

    std::error_code ec;
    const auto status = fs::status(object_path(name), ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return Err<bool>("stat " + name + ": " + ec.message());
    }
    return Ok(fs::is_regular_file(status));
}

Result<void> FilesystemBucket::upload(const Context& ctx, const std::string& name, std::istream& content) {
    if (auto res = ctx.check(); res.is_error()) {
        return res;
    }
    if (auto res = validate_object_name(name); res.is_error()) {
        return res;
    }

    const auto destination = object_path(name);
    std::error_code ec;
    fs::create_directories(destination.parent_path(), ec);
    if (ec) {
        return Err<void>("create directory for " + name + ": " + ec.message());
    }

    const fs::path partial = destination.string() + ".partial";
    auto created = fileutil::create_file(partial);
    if (created.is_error()) {
        return Err<void>(created.error());
    }
    auto& file = created.value();

    // The handle closes when `created` goes out of scope.
    auto discard = [&](const std::string& error) {
        std::error_code remove_ec;
        fs::remove(partial, remove_ec);
        return Err<void>(error);
    };

    std::vector<char> buffer(kCopyBufferSize);
    while (content.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || content.gcount() > 0) {
        if (auto res = ctx.check(); res.is_error()) {
            return discard(res.error());
        }
        const auto chunk = std::string_view(buffer.data(), static_cast<std::size_t>(content.gcount()));
        if (auto res = fileutil::write_all(file, chunk); res.is_error()) {
            return discard(partial.string() + ": " + res.error());
        }
    }
    if (content.bad()) {
        return discard("read content for " + name);
    }

    // Data must be durable before the name is, or a crash can leave an empty object.
    if (auto res = file.sync(); res.is_error()) {
        return discard(partial.string() + ": " + res.error());
    }
    if (auto res = file.close(); res.is_error()) {
        return discard(partial.string() + ": " + res.error());
    }

    fs::rename(partial, destination, ec);
    if (ec) {
        return discard("rename " + partial.string() + ": " + ec.message());
    }
    return fileutil::fsync_directory(destination.parent_path());
}

} // namespace blockship::objstore
