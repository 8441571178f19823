#include "blockship/block/upload.hpp"

#include "blockship/block/meta.hpp"
#include "blockship/block/ulid.hpp"
#include "blockship/core/fileutil.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace blockship::block {
namespace fs = std::filesystem;

namespace {

Result<void> upload_object(const Context& ctx, objstore::Bucket& bucket,
                           const fs::path& src, const std::string& dst) {
    if (auto res = ctx.check(); res.is_error()) {
        return res;
    }
    spdlog::debug("upload object src={} dst={} bucket={}", src.string(), dst, bucket.name());
    return objstore::upload_file(ctx, bucket, src, dst);
}

Result<void> upload_chunks(const Context& ctx, objstore::Bucket& bucket,
                           const fs::path& chunks_dir, const std::string& prefix) {
    auto names = fileutil::read_dir_names(chunks_dir);
    if (names.is_error()) {
        return Err<void>(names.error());
    }

    for (const auto& name : names.value()) {
        const auto src = chunks_dir / name;
        std::error_code ec;
        if (!fs::is_regular_file(src, ec)) {
            continue;
        }
        auto res = upload_object(ctx, bucket, src, objstore::join_object_path(prefix, name));
        if (res.is_error()) {
            return res;
        }
    }
    return Ok();
}

} // namespace

Result<void> upload(const Context& ctx, objstore::Bucket& bucket, const fs::path& block_dir) {
    std::error_code ec;
    if (!fs::is_directory(block_dir, ec)) {
        return Err<void>(block_dir.string() + " is not a directory");
    }

    const auto dir_name = block_dir.filename().string();
    const auto id = Ulid::parse(dir_name);
    if (!id) {
        return Err<void>("not a block dir: " + dir_name);
    }

    auto meta = read_meta_file(block_dir);
    if (meta.is_error()) {
        return Err<void>("read meta: " + meta.error());
    }
    if (meta.value().ulid != *id) {
        return Err<void>("meta ulid " + meta.value().ulid.to_string() +
                         " does not match dir name " + dir_name);
    }

    const auto prefix = id->to_string();

    if (auto res = upload_chunks(ctx, bucket, block_dir / kChunksDirname,
                                 objstore::join_object_path(prefix, kChunksDirname));
        res.is_error()) {
        return with_context(res, "upload chunks");
    }

    if (auto res = upload_object(ctx, bucket, block_dir / kIndexFilename,
                                 objstore::join_object_path(prefix, kIndexFilename));
        res.is_error()) {
        return with_context(res, "upload index");
    }

    // Last, so the block only counts as present once everything else is.
    if (auto res = upload_object(ctx, bucket, block_dir / kMetaFilename,
                                 objstore::join_object_path(prefix, kMetaFilename));
        res.is_error()) {
        return with_context(res, "upload meta file");
    }

    return Ok();
}

} // namespace blockship::block
