#pragma once

#include "blockship/core/context.hpp"
#include "blockship/core/result.hpp"

#include <filesystem>
#include <istream>
#include <string>

namespace blockship::objstore {

/**
 * @brief Remote object store the shipper writes blocks into
 *
 * Object names are relative, '/'-separated paths such as
 * "01HB6Y2J8Q4N5M7R0T3V9W2X1Z/chunks/000001". Implementations must make an
 * object visible under its name only once its full content is stored, and
 * must honour cancellation of `ctx` before starting work.
 */
class Bucket {
public:
    virtual ~Bucket() = default;

    virtual Result<bool> exists(const Context& ctx, const std::string& name) = 0;

    virtual Result<void> upload(const Context& ctx, const std::string& name, std::istream& content) = 0;

    /// Human-readable identity used in log lines.
    virtual std::string name() const = 0;
};

/// Reject empty, absolute and parent-escaping object names.
Result<void> validate_object_name(const std::string& name);

/// Join object path segments with '/'.
std::string join_object_path(const std::string& dir, const std::string& name);

/// Open `src` and upload it to `dst`.
Result<void> upload_file(const Context& ctx, Bucket& bucket,
                         const std::filesystem::path& src, const std::string& dst);

} // namespace blockship::objstore
