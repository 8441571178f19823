#pragma once

#include "blockship/block/meta.hpp"
#include "blockship/core/context.hpp"
#include "blockship/core/result.hpp"
#include "blockship/events/event_bus.hpp"
#include "blockship/objstore/bucket.hpp"
#include "blockship/sync/scanner.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <limits>
#include <optional>

namespace blockship::sync {

/// Supplies the labels attached to each shipped block; std::nullopt attaches none.
using LabelsFn = std::function<std::optional<block::Labels>()>;

inline constexpr const char* kStagingDirname = "shipper";
inline constexpr const char* kUploadDirname = "upload";

/// Outcome of one successful ship_block() call.
enum class ShipOutcome {
    Uploaded,
    SkippedCompacted,  ///< compaction level > 1, never shipped
    AlreadyInBucket    ///< manifest already present remotely
};

/**
 * @brief Counters describing one sync pass
 */
struct SyncSummary {
    std::size_t blocks_seen = 0;
    std::size_t already_recorded = 0;
    std::size_t uploaded = 0;
    std::size_t skipped = 0; ///< handled without uploading (compacted or already in bucket)
    std::size_t failed = 0;
    bool scan_failed = false;
    bool meta_write_failed = false;
};

struct Timestamps {
    static constexpr std::int64_t kNoSyncedTime = std::numeric_limits<std::int64_t>::min();

    std::int64_t min_time = 0;                  ///< 0 when no local block exists
    std::int64_t max_sync_time = kNoSyncedTime; ///< kNoSyncedTime when nothing is confirmed
};

/**
 * @brief Ships new local blocks to a bucket exactly once
 *
 * Each sync() pass lists the blocks under `dir`, uploads the ones not yet
 * recorded in <dir>/shipper.json and rewrites that record. Uploads go
 * through a hard-linked staging copy under <dir>/shipper/upload/<ULID>, so
 * `dir` and the staging area must share a filesystem.
 *
 * Ids already recorded are trusted and not checked against the bucket
 * again: a block deleted remotely after it was recorded is not re-uploaded.
 *
 * Not safe for concurrent sync() calls.
 */
class Shipper {
public:
    Shipper(std::filesystem::path dir,
            objstore::Bucket& bucket,
            events::EventBus& bus,
            LabelsFn labels,
            block::SourceType source);

    /**
     * @brief Run one pass. Never throws; failures are logged, counted on the
     *        event bus and reflected in the returned summary.
     */
    SyncSummary sync(const Context& ctx);

    /**
     * @brief Earliest local data and latest data confirmed in the bucket
     *
     * Fails when the bookkeeping file cannot be read or the directory cannot
     * be scanned.
     */
    Result<Timestamps> timestamps() const;

    /**
     * @brief Ship a single block: compaction filter, existence check,
     *        staging, manifest augmentation, upload, cleanup
     *
     * Blocks above compaction level 1 and blocks whose manifest is already
     * in the bucket succeed without uploading anything.
     */
    Result<ShipOutcome> ship_block(const Context& ctx, const BlockEntry& entry);

    std::filesystem::path staging_dir(const block::Ulid& id) const;

    const std::filesystem::path& dir() const noexcept { return dir_; }

private:
    Result<void> stage_and_upload(const Context& ctx, const std::filesystem::path& block_dir,
                                  const block::Ulid& id);

    std::filesystem::path dir_;
    objstore::Bucket& bucket_;
    events::EventBus& bus_;
    LabelsFn labels_;
    block::SourceType source_;
    BlockScanner scanner_;
};

/**
 * @brief Hard link the chunks, index and meta.json of block `src` into `dst`
 *
 * `dst` must exist. Fails when `src` and `dst` are on different filesystems.
 */
Result<void> hardlink_block(const std::filesystem::path& src, const std::filesystem::path& dst);

} // namespace blockship::sync
