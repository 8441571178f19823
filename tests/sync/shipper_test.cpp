#include "blockship/sync/shipper.hpp"

#include "blockship/block/meta.hpp"
#include "blockship/events/components.hpp"
#include "blockship/events/event_bus.hpp"
#include "blockship/objstore/inmem_bucket.hpp"
#include "blockship/sync/meta_file.hpp"
#include "support/test_blocks.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include <sys/stat.h>

namespace fs = std::filesystem;
using blockship::Context;
using blockship::Err;
using blockship::Result;
using blockship::block::Labels;
using blockship::block::SourceType;
using blockship::block::Ulid;
using blockship::events::EventBus;
using blockship::events::MetricsComponent;
using blockship::objstore::InMemoryBucket;
using blockship::sync::Shipper;
using blockship::sync::Timestamps;
using blockship::testing::BlockSpec;
using blockship::testing::create_temp_dir;
using blockship::testing::make_block;
using blockship::testing::make_ulid;
using blockship::testing::read_text;
using blockship::testing::write_file;

namespace {

// Fails every upload whose object name starts with one of the given prefixes.
class FlakyBucket : public InMemoryBucket {
public:
    std::set<std::string> failing_prefixes;

    Result<void> upload(const Context& ctx, const std::string& name, std::istream& content) override {
        for (const auto& prefix : failing_prefixes) {
            if (name.rfind(prefix, 0) == 0) {
                return Err<void>("injected failure for " + name);
            }
        }
        return InMemoryBucket::upload(ctx, name, content);
    }
};

// Records a violation whenever a manifest arrives before the rest of its block.
class ManifestLastBucket : public InMemoryBucket {
public:
    std::vector<std::string> violations;

    Result<void> upload(const Context& ctx, const std::string& name, std::istream& content) override {
        const auto slash = name.find('/');
        const auto id = name.substr(0, slash);
        if (name.substr(slash + 1) == "meta.json") {
            if (!get(id + "/index").has_value() || !get(id + "/chunks/000001").has_value()) {
                violations.push_back(name);
            }
        }
        return InMemoryBucket::upload(ctx, name, content);
    }
};

std::vector<Ulid> recorded_ids(const fs::path& dir) {
    auto meta = blockship::sync::read_shipper_meta(dir);
    if (meta.is_error()) {
        return {};
    }
    return meta.value().uploaded;
}

} // namespace

class ShipperTest : public ::testing::Test {
protected:
    void SetUp() override { root_ = create_temp_dir("blockship_shipper_test_"); }
    void TearDown() override { fs::remove_all(root_); }

    Shipper make_shipper(InMemoryBucket& bucket, blockship::sync::LabelsFn labels = nullptr) {
        return Shipper(root_, bucket, bus_, std::move(labels), SourceType::Sidecar);
    }

    fs::path root_;
    EventBus bus_;
};

TEST_F(ShipperTest, ShipsOnlyFirstLevelBlocks) {
    const BlockSpec b1{make_ulid(1000, 1), 100, 200, 1};
    const BlockSpec b2{make_ulid(2000, 2), 50, 150, 2};
    make_block(root_, b1);
    make_block(root_, b2);

    InMemoryBucket bucket;
    auto shipper = make_shipper(bucket);
    Context ctx;

    const auto summary = shipper.sync(ctx);
    EXPECT_EQ(summary.blocks_seen, 2u);
    EXPECT_EQ(summary.uploaded, 1u);
    EXPECT_EQ(summary.skipped, 1u);
    EXPECT_EQ(summary.failed, 0u);

    EXPECT_TRUE(bucket.get(b1.id.to_string() + "/meta.json").has_value());
    for (const auto& [name, content] : bucket.objects()) {
        EXPECT_NE(name.rfind(b2.id.to_string(), 0), 0u) << "compacted block was uploaded: " << name;
    }

    EXPECT_EQ(recorded_ids(root_), (std::vector<Ulid>{b1.id, b2.id}));

    auto ts = shipper.timestamps();
    ASSERT_TRUE(ts.is_ok()) << ts.error();
    EXPECT_EQ(ts.value().min_time, 50);
    EXPECT_EQ(ts.value().max_sync_time, 200);
}

TEST_F(ShipperTest, SecondPassIsNoOp) {
    make_block(root_, {make_ulid(1000, 1), 0, 10, 1});
    make_block(root_, {make_ulid(2000, 2), 10, 20, 1});

    InMemoryBucket bucket;
    auto shipper = make_shipper(bucket);
    Context ctx;

    ASSERT_EQ(shipper.sync(ctx).uploaded, 2u);
    const auto uploads_after_first = bucket.upload_log().size();
    const auto exists_after_first = bucket.exists_calls();
    const auto record_after_first = read_text(root_ / blockship::sync::kShipperMetaFilename);

    const auto summary = shipper.sync(ctx);
    EXPECT_EQ(summary.uploaded, 0u);
    EXPECT_EQ(summary.already_recorded, 2u);
    EXPECT_EQ(bucket.upload_log().size(), uploads_after_first);
    EXPECT_EQ(bucket.exists_calls(), exists_after_first);
    EXPECT_EQ(read_text(root_ / blockship::sync::kShipperMetaFilename), record_after_first);
}

TEST_F(ShipperTest, ManifestIsUploadedLastAndAugmented) {
    const BlockSpec spec{make_ulid(1000, 1), 0, 10, 1};
    const auto block_dir = make_block(root_, spec);
    const auto original_manifest = read_text(block_dir / "meta.json");

    ManifestLastBucket bucket;
    auto shipper = make_shipper(bucket, [] { return std::optional<Labels>(Labels{{"cluster", "eu1"}}); });
    Context ctx;

    ASSERT_EQ(shipper.sync(ctx).uploaded, 1u);
    EXPECT_TRUE(bucket.violations.empty());
    EXPECT_EQ(bucket.upload_log().back(), spec.id.to_string() + "/meta.json");

    auto shipped = blockship::block::parse_meta(bucket.get(spec.id.to_string() + "/meta.json").value_or(""));
    ASSERT_TRUE(shipped.is_ok()) << shipped.error();
    EXPECT_EQ(shipped.value().shipping.labels.at("cluster"), "eu1");
    EXPECT_EQ(shipped.value().shipping.source, SourceType::Sidecar);

    // Only the staged copy is rewritten.
    EXPECT_EQ(read_text(block_dir / "meta.json"), original_manifest);
    EXPECT_FALSE(fs::exists(shipper.staging_dir(spec.id)));
}

TEST_F(ShipperTest, NoLabelsWhenSupplierReturnsNothing) {
    const BlockSpec spec{make_ulid(1000, 1), 0, 10, 1};
    make_block(root_, spec);

    InMemoryBucket bucket;
    auto shipper = make_shipper(bucket, [] { return std::optional<Labels>(); });
    Context ctx;
    ASSERT_EQ(shipper.sync(ctx).uploaded, 1u);

    auto shipped = blockship::block::parse_meta(bucket.get(spec.id.to_string() + "/meta.json").value_or(""));
    ASSERT_TRUE(shipped.is_ok());
    EXPECT_TRUE(shipped.value().shipping.labels.empty());
}

TEST_F(ShipperTest, UnencodableLabelFailsBlockNotPass) {
    const BlockSpec b1{make_ulid(1000, 1), 0, 10, 1};
    const BlockSpec b2{make_ulid(2000, 2), 10, 20, 1};
    make_block(root_, b1);
    make_block(root_, b2);

    InMemoryBucket bucket;
    auto shipper = make_shipper(bucket, [] { return std::optional<Labels>(Labels{{"region", "caf\xe9"}}); });
    Context ctx;

    blockship::sync::SyncSummary summary;
    ASSERT_NO_THROW(summary = shipper.sync(ctx));
    EXPECT_EQ(summary.blocks_seen, 2u);
    EXPECT_EQ(summary.failed, 2u);
    EXPECT_FALSE(summary.meta_write_failed);
    EXPECT_TRUE(bucket.upload_log().empty());
    EXPECT_TRUE(fs::exists(root_ / blockship::sync::kShipperMetaFilename));
    EXPECT_TRUE(recorded_ids(root_).empty());
    EXPECT_FALSE(fs::exists(shipper.staging_dir(b1.id)));
}

TEST_F(ShipperTest, ShipsLowerCaseBlockDirectoryUnderCanonicalName) {
    const auto id = *Ulid::parse("01ARZ3NDEKTSV4RRFFQ69G5FAV");
    fs::rename(make_block(root_, {id, 0, 10, 1}), root_ / "01arz3ndektsv4rrffq69g5fav");

    InMemoryBucket bucket;
    auto shipper = make_shipper(bucket);
    Context ctx;

    const auto summary = shipper.sync(ctx);
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_EQ(summary.uploaded, 1u);
    EXPECT_TRUE(bucket.get("01ARZ3NDEKTSV4RRFFQ69G5FAV/meta.json").has_value());
    EXPECT_EQ(bucket.get("01ARZ3NDEKTSV4RRFFQ69G5FAV/chunks/000001").value_or(""), "chunk-data-1");
    EXPECT_EQ(recorded_ids(root_), (std::vector<Ulid>{id}));
}

TEST_F(ShipperTest, BlockAlreadyInBucketIsRecordedWithoutUpload) {
    const BlockSpec spec{make_ulid(1000, 1), 0, 10, 1};
    make_block(root_, spec);

    InMemoryBucket bucket;
    bucket.put(spec.id.to_string() + "/meta.json", "{}");
    auto shipper = make_shipper(bucket);
    Context ctx;

    const auto summary = shipper.sync(ctx);
    EXPECT_EQ(summary.uploaded, 0u);
    EXPECT_EQ(summary.skipped, 1u);
    EXPECT_TRUE(bucket.upload_log().empty());
    EXPECT_EQ(recorded_ids(root_), (std::vector<Ulid>{spec.id}));
}

TEST_F(ShipperTest, LostBookkeepingConvergesWithoutReupload) {
    make_block(root_, {make_ulid(1000, 1), 0, 10, 1});
    make_block(root_, {make_ulid(2000, 2), 10, 20, 1});

    InMemoryBucket bucket;
    auto shipper = make_shipper(bucket);
    Context ctx;
    shipper.sync(ctx);
    const auto recorded = recorded_ids(root_);
    const auto uploads = bucket.upload_log().size();
    const auto exists_calls = bucket.exists_calls();

    fs::remove(root_ / blockship::sync::kShipperMetaFilename);
    shipper.sync(ctx);
    EXPECT_EQ(recorded_ids(root_), recorded);
    EXPECT_EQ(bucket.upload_log().size(), uploads);
    EXPECT_EQ(bucket.exists_calls(), exists_calls + 2);

    write_file(root_ / blockship::sync::kShipperMetaFilename, "{ garbage");
    shipper.sync(ctx);
    EXPECT_EQ(recorded_ids(root_), recorded);
    EXPECT_EQ(bucket.upload_log().size(), uploads);
}

TEST_F(ShipperTest, RecordedBlocksAreTrustedWithoutCheck) {
    const BlockSpec spec{make_ulid(1000, 1), 100, 200, 1};
    make_block(root_, spec);

    blockship::sync::ShipperMeta meta;
    meta.uploaded = {spec.id};
    ASSERT_TRUE(blockship::sync::write_shipper_meta(root_, meta).is_ok());

    InMemoryBucket bucket; // does not hold the block
    auto shipper = make_shipper(bucket);
    Context ctx;

    const auto summary = shipper.sync(ctx);
    EXPECT_EQ(summary.already_recorded, 1u);
    EXPECT_EQ(bucket.exists_calls(), 0u);
    EXPECT_TRUE(bucket.upload_log().empty());

    auto ts = shipper.timestamps();
    ASSERT_TRUE(ts.is_ok());
    EXPECT_EQ(ts.value().max_sync_time, 200);
}

TEST_F(ShipperTest, FailedBlockDoesNotStopOthersAndIsRetried) {
    const BlockSpec bad{make_ulid(1000, 1), 0, 10, 1};
    const BlockSpec good{make_ulid(2000, 2), 10, 20, 1};
    make_block(root_, bad);
    make_block(root_, good);

    FlakyBucket bucket;
    bucket.failing_prefixes.insert(bad.id.to_string() + "/");
    auto shipper = make_shipper(bucket);
    Context ctx;

    auto summary = shipper.sync(ctx);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_EQ(summary.uploaded, 1u);
    EXPECT_EQ(recorded_ids(root_), (std::vector<Ulid>{good.id}));
    EXPECT_FALSE(bucket.get(bad.id.to_string() + "/meta.json").has_value());
    EXPECT_FALSE(fs::exists(shipper.staging_dir(bad.id)));

    bucket.failing_prefixes.clear();
    summary = shipper.sync(ctx);
    EXPECT_EQ(summary.uploaded, 1u);
    EXPECT_EQ(summary.already_recorded, 1u);
    EXPECT_EQ(recorded_ids(root_), (std::vector<Ulid>{bad.id, good.id}));
}

TEST_F(ShipperTest, StaleStagingDirectoryIsReplaced) {
    const BlockSpec spec{make_ulid(1000, 1), 0, 10, 1};
    make_block(root_, spec);

    InMemoryBucket bucket;
    auto shipper = make_shipper(bucket);

    // Left behind by a process killed after linking, before uploading.
    const auto stale = shipper.staging_dir(spec.id);
    fs::create_directories(stale / "chunks");
    write_file(stale / "chunks" / "000001", "stale");
    write_file(stale / "chunks" / "999999", "leftover");
    write_file(stale / "meta.json", "stale");

    Context ctx;
    ASSERT_EQ(shipper.sync(ctx).uploaded, 1u);
    EXPECT_FALSE(bucket.get(spec.id.to_string() + "/chunks/999999").has_value());
    EXPECT_EQ(bucket.get(spec.id.to_string() + "/chunks/000001").value_or(""), "chunk-data-1");
    EXPECT_FALSE(fs::exists(stale));
}

TEST_F(ShipperTest, VanishedBlocksDropOutOfBookkeeping) {
    const BlockSpec keep{make_ulid(1000, 1), 0, 10, 1};
    const BlockSpec drop{make_ulid(2000, 2), 10, 20, 1};
    make_block(root_, keep);
    const auto drop_dir = make_block(root_, drop);

    InMemoryBucket bucket;
    auto shipper = make_shipper(bucket);
    Context ctx;
    shipper.sync(ctx);
    ASSERT_EQ(recorded_ids(root_).size(), 2u);

    fs::remove_all(drop_dir);
    shipper.sync(ctx);
    EXPECT_EQ(recorded_ids(root_), (std::vector<Ulid>{keep.id}));
}

TEST_F(ShipperTest, CancelledPassLeavesBlocksUnrecorded) {
    make_block(root_, {make_ulid(1000, 1), 0, 10, 1});

    InMemoryBucket bucket;
    auto shipper = make_shipper(bucket);
    Context ctx;
    ctx.cancel();

    const auto summary = shipper.sync(ctx);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_TRUE(bucket.upload_log().empty());
    EXPECT_TRUE(recorded_ids(root_).empty());
    EXPECT_FALSE(summary.meta_write_failed);
}

TEST_F(ShipperTest, MissingDataDirFailsPassWithoutBookkeeping) {
    InMemoryBucket bucket;
    Shipper shipper(root_ / "missing", bucket, bus_, nullptr, SourceType::Sidecar);
    Context ctx;

    const auto summary = shipper.sync(ctx);
    EXPECT_TRUE(summary.scan_failed);
    EXPECT_FALSE(fs::exists(root_ / "missing" / blockship::sync::kShipperMetaFilename));
}

TEST_F(ShipperTest, TimestampsWithoutBlocks) {
    InMemoryBucket bucket;
    auto shipper = make_shipper(bucket);

    EXPECT_TRUE(shipper.timestamps().is_error());

    Context ctx;
    shipper.sync(ctx);
    auto ts = shipper.timestamps();
    ASSERT_TRUE(ts.is_ok());
    EXPECT_EQ(ts.value().min_time, 0);
    EXPECT_EQ(ts.value().max_sync_time, Timestamps::kNoSyncedTime);
}

TEST_F(ShipperTest, CountsSyncsAndUploads) {
    MetricsComponent metrics(bus_);
    const BlockSpec bad{make_ulid(1000, 1), 0, 10, 1};
    make_block(root_, bad);
    make_block(root_, {make_ulid(2000, 2), 10, 20, 1});
    make_block(root_, {make_ulid(3000, 3), 20, 30, 2});

    FlakyBucket bucket;
    bucket.failing_prefixes.insert(bad.id.to_string() + "/");
    auto shipper = make_shipper(bucket);
    Context ctx;
    shipper.sync(ctx);

    EXPECT_EQ(metrics.counter(blockship::events::kDirSyncsTotal), 1u);
    EXPECT_EQ(metrics.counter(blockship::events::kDirSyncFailuresTotal), 0u);
    EXPECT_EQ(metrics.counter(blockship::events::kUploadsTotal), 2u);
    EXPECT_EQ(metrics.counter(blockship::events::kUploadFailuresTotal), 1u);
}

TEST(HardlinkBlockTest, LinksChunksIndexAndMeta) {
    const auto root = create_temp_dir("blockship_hardlink_test_");
    BlockSpec spec{make_ulid(1000, 1), 0, 10, 1};
    spec.chunks = {{"000001", "a"}, {"000002", "b"}};
    const auto src = make_block(root, spec);
    const auto dst = root / "staged";
    fs::create_directories(dst);

    ASSERT_TRUE(blockship::sync::hardlink_block(src, dst).is_ok());

    for (const auto* file : {"chunks/000001", "chunks/000002", "index", "meta.json"}) {
        struct stat src_stat {};
        struct stat dst_stat {};
        ASSERT_EQ(::stat((src / file).c_str(), &src_stat), 0) << file;
        ASSERT_EQ(::stat((dst / file).c_str(), &dst_stat), 0) << file;
        EXPECT_EQ(src_stat.st_ino, dst_stat.st_ino) << file;
    }

    fs::remove_all(src);
    EXPECT_EQ(read_text(dst / "chunks" / "000002"), "b");
    fs::remove_all(root);
}
