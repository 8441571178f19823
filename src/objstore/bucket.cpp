#include "blockship/objstore/bucket.hpp"

#include <fstream>
#include <sstream>

namespace blockship::objstore {
namespace fs = std::filesystem;

Result<void> validate_object_name(const std::string& name) {
    if (name.empty()) {
        return Err<void>(std::string("empty object name"));
    }
    if (name.front() == '/') {
        return Err<void>("absolute object name: " + name);
    }

    std::istringstream segments(name);
    std::string segment;
    while (std::getline(segments, segment, '/')) {
        if (segment.empty() || segment == "." || segment == "..") {
            return Err<void>("invalid object name: " + name);
        }
    }
    if (name.back() == '/') {
        return Err<void>("invalid object name: " + name);
    }
    return Ok();
}

std::string join_object_path(const std::string& dir, const std::string& name) {
    if (dir.empty()) {
        return name;
    }
    if (dir.back() == '/') {
        return dir + name;
    }
    return dir + "/" + name;
}

Result<void> upload_file(const Context& ctx, Bucket& bucket, const fs::path& src, const std::string& dst) {
    std::ifstream input(src, std::ios::binary);
    if (!input) {
        return Err<void>("open " + src.string() + " for upload");
    }
    return with_context(bucket.upload(ctx, dst, input), "upload " + dst);
}

} // namespace blockship::objstore
