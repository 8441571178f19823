#pragma once

#include "blockship/core/context.hpp"
#include "blockship/core/result.hpp"
#include "blockship/objstore/bucket.hpp"

#include <filesystem>

namespace blockship::block {

/**
 * @brief Upload a complete block directory to `bucket`
 *
 * `block_dir` must be named by the block's ULID and hold a meta.json whose
 * ulid matches that name. Objects land under "<ULID>/": every file of
 * chunks/ in name order, then index, then meta.json. The manifest goes last
 * so a reader that sees "<ULID>/meta.json" can rely on the rest of the block
 * being present.
 */
Result<void> upload(const Context& ctx, objstore::Bucket& bucket, const std::filesystem::path& block_dir);

} // namespace blockship::block
