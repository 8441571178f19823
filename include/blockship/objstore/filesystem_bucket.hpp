#pragma once

#include "blockship/objstore/bucket.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

namespace blockship::objstore {

/**
 * @brief Bucket backed by a local directory, one file per object
 *
 * Uploads stream into "<object>.partial" and are renamed into place once
 * complete, so exists() never reports a half-written object.
 */
class FilesystemBucket : public Bucket {
public:
    static constexpr std::size_t kCopyBufferSize = 64 * 1024;

    explicit FilesystemBucket(std::filesystem::path root);

    Result<bool> exists(const Context& ctx, const std::string& name) override;
    Result<void> upload(const Context& ctx, const std::string& name, std::istream& content) override;
    std::string name() const override { return "filesystem:" + root_.string(); }

    const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path object_path(const std::string& name) const;

    std::filesystem::path root_;
};

} // namespace blockship::objstore
