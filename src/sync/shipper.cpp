#include "blockship/sync/shipper.hpp"

#include "blockship/block/upload.hpp"
#include "blockship/core/fileutil.hpp"
#include "blockship/events/events.hpp"
#include "blockship/sync/meta_file.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <string>
#include <system_error>
#include <unordered_set>
#include <vector>

namespace blockship::sync {
namespace fs = std::filesystem;

namespace {

// Removes the staging directory when an upload attempt ends, however it ends.
class StagingDirGuard {
public:
    explicit StagingDirGuard(fs::path dir) : dir_(std::move(dir)) {}

    StagingDirGuard(const StagingDirGuard&) = delete;
    StagingDirGuard& operator=(const StagingDirGuard&) = delete;

    ~StagingDirGuard() {
        std::error_code ec;
        fs::remove_all(dir_, ec);
        if (ec) {
            spdlog::error("failed to clean upload directory dir={} err={}", dir_.string(), ec.message());
        }
    }

private:
    fs::path dir_;
};

std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

} // namespace

Shipper::Shipper(fs::path dir,
                 objstore::Bucket& bucket,
                 events::EventBus& bus,
                 LabelsFn labels,
                 block::SourceType source)
    : dir_(std::move(dir)),
      bucket_(bucket),
      bus_(bus),
      labels_(std::move(labels)),
      source_(source),
      scanner_(dir_) {}

fs::path Shipper::staging_dir(const block::Ulid& id) const {
    return dir_ / kStagingDirname / kUploadDirname / id.to_string();
}

SyncSummary Shipper::sync(const Context& ctx) {
    const auto started_at = std::chrono::steady_clock::now();
    bus_.emit(events::DirSyncStartedEvent{dir_.string()});

    SyncSummary summary;

    ShipperMeta meta;
    auto read = read_shipper_meta(dir_);
    if (read.is_ok()) {
        meta = std::move(read.value());
    } else if (read.error().kind != MetaFileError::Kind::NotFound) {
        // Only a deduplication hint: the bucket existence check catches
        // anything uploaded before, so start over with an empty record.
        spdlog::warn("reading meta file failed, removing it dir={} err={}", dir_.string(), read.error().message);
    }

    const std::unordered_set<block::Ulid> has_uploaded(meta.uploaded.begin(), meta.uploaded.end());

    // Rebuilt from scratch so blocks deleted locally drop out of the record.
    ShipperMeta next;

    auto scan = scanner_.scan([&](const BlockEntry& entry) -> Result<void> {
        const auto& block_meta = entry.meta;
        ++summary.blocks_seen;

        if (has_uploaded.count(block_meta.ulid) > 0) {
            ++summary.already_recorded;
            next.uploaded.push_back(block_meta.ulid);
            return Ok();
        }

        auto shipped = ship_block(ctx, entry);
        if (shipped.is_error()) {
            // Keep going with the other blocks; this one is retried next pass.
            spdlog::error("shipping failed block={} err={}", block_meta.ulid.to_string(), shipped.error());
            ++summary.failed;
            return Ok();
        }

        if (shipped.value() == ShipOutcome::Uploaded) {
            ++summary.uploaded;
        } else {
            ++summary.skipped;
        }
        next.uploaded.push_back(block_meta.ulid);
        return Ok();
    });

    if (scan.is_error()) {
        spdlog::error("iter block metas failed dir={} err={}", dir_.string(), scan.error());
        bus_.emit(events::DirSyncFailedEvent{dir_.string(), scan.error()});
        summary.scan_failed = true;
        return summary;
    }

    if (auto res = write_shipper_meta(dir_, next); res.is_error()) {
        spdlog::warn("updating meta file failed dir={} err={}", dir_.string(), res.error());
        bus_.emit(events::DirSyncFailedEvent{dir_.string(), res.error()});
        summary.meta_write_failed = true;
    }

    events::DirSyncCompletedEvent completed;
    completed.dir = dir_.string();
    completed.blocks_seen = summary.blocks_seen;
    completed.blocks_uploaded = summary.uploaded;
    completed.blocks_failed = summary.failed;
    completed.duration = elapsed_since(started_at);
    bus_.emit(completed);

    spdlog::debug("sync pass done dir={} seen={} uploaded={} failed={} duration={}ms",
                  dir_.string(), summary.blocks_seen, summary.uploaded, summary.failed,
                  completed.duration.count());
    return summary;
}

Result<ShipOutcome> Shipper::ship_block(const Context& ctx, const BlockEntry& entry) {
    const auto& meta = entry.meta;
    // Only level 1 blocks are shipped; compacted blocks are covered by their sources.
    if (meta.compaction.level > 1) {
        return Ok(ShipOutcome::SkippedCompacted);
    }

    const auto id = meta.ulid.to_string();
    const auto started_at = std::chrono::steady_clock::now();
    bus_.emit(events::BlockUploadStartedEvent{id});

    auto fail = [&](const std::string& error) {
        bus_.emit(events::BlockUploadFailedEvent{id, error});
        return Err<ShipOutcome>(error);
    };

    auto exists = bucket_.exists(ctx, objstore::join_object_path(id, block::kMetaFilename));
    if (exists.is_error()) {
        return fail("check exists: " + exists.error());
    }
    if (exists.value()) {
        spdlog::debug("block already in bucket id={}", id);
        return Ok(ShipOutcome::AlreadyInBucket);
    }

    spdlog::info("upload new block id={}", id);

    if (auto res = stage_and_upload(ctx, entry.dir, meta.ulid); res.is_error()) {
        return fail(res.error());
    }

    bus_.emit(events::BlockUploadedEvent{id, elapsed_since(started_at)});
    return Ok(ShipOutcome::Uploaded);
}

Result<void> Shipper::stage_and_upload(const Context& ctx, const fs::path& block_dir, const block::Ulid& id) {
    const auto updir = staging_dir(id);

    // A crashed earlier attempt may have left the directory behind.
    std::error_code ec;
    fs::remove_all(updir, ec);
    if (ec) {
        return Err<void>("clean upload directory: " + ec.message());
    }
    fs::create_directories(updir, ec);
    if (ec) {
        return Err<void>("create upload dir: " + ec.message());
    }
    StagingDirGuard guard(updir);

    // Hard links pin the block's files even if a compactor deletes the
    // source directory while we upload.
    if (auto res = hardlink_block(block_dir, updir); res.is_error()) {
        return with_context(res, "hard link block");
    }

    auto staged = block::read_meta_file(updir);
    if (staged.is_error()) {
        return Err<void>("read staged meta file: " + staged.error());
    }
    auto& meta = staged.value();
    if (labels_) {
        if (auto lset = labels_()) {
            meta.shipping.labels = std::move(*lset);
        }
    }
    meta.shipping.source = source_;

    // Replaces the staged link with a new file; the source manifest is untouched.
    if (auto res = block::write_meta_file(updir, meta); res.is_error()) {
        return with_context(res, "write meta file");
    }

    return block::upload(ctx, bucket_, updir);
}

Result<Timestamps> Shipper::timestamps() const {
    auto meta = read_shipper_meta(dir_);
    if (meta.is_error()) {
        return Err<Timestamps>("read shipper meta file: " + meta.error().message);
    }

    const std::unordered_set<block::Ulid> has_uploaded(meta.value().uploaded.begin(),
                                                       meta.value().uploaded.end());

    Timestamps ts;
    std::int64_t min_time = std::numeric_limits<std::int64_t>::max();

    auto scan = scanner_.scan([&](const BlockEntry& entry) -> Result<void> {
        const auto& block_meta = entry.meta;
        if (block_meta.min_time < min_time) {
            min_time = block_meta.min_time;
        }
        if (has_uploaded.count(block_meta.ulid) > 0 && block_meta.max_time > ts.max_sync_time) {
            ts.max_sync_time = block_meta.max_time;
        }
        return Ok();
    });
    if (scan.is_error()) {
        return Err<Timestamps>("iter block metas for timestamp: " + scan.error());
    }

    // No block yet: there is no lower bound to report.
    ts.min_time = min_time == std::numeric_limits<std::int64_t>::max() ? 0 : min_time;
    return Ok(ts);
}

Result<void> hardlink_block(const fs::path& src, const fs::path& dst) {
    const auto chunk_dir = dst / block::kChunksDirname;

    std::error_code ec;
    fs::create_directories(chunk_dir, ec);
    if (ec) {
        return Err<void>("create chunks dir: " + ec.message());
    }

    auto chunks = fileutil::read_dir_names(src / block::kChunksDirname);
    if (chunks.is_error()) {
        return Err<void>("read chunk dir: " + chunks.error());
    }

    std::vector<fs::path> files;
    files.reserve(chunks.value().size() + 2);
    for (const auto& name : chunks.value()) {
        files.push_back(fs::path(block::kChunksDirname) / name);
    }
    files.emplace_back(block::kMetaFilename);
    files.emplace_back(block::kIndexFilename);

    for (const auto& file : files) {
        if (auto res = fileutil::hardlink_file(src / file, dst / file); res.is_error()) {
            return Err<void>("hard link file " + file.string() + ": " + res.error());
        }
    }
    return Ok();
}

} // namespace blockship::sync
