#include "blockship/block/meta.hpp"

#include "support/test_blocks.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <filesystem>

namespace fs = std::filesystem;
using blockship::block::Meta;
using blockship::block::SourceType;
using blockship::block::parse_meta;
using blockship::block::serialize_meta;

namespace {

constexpr const char* kManifest = R"({
	"ulid": "01ARZ3NDEKTSV4RRFFQ69G5FAV",
	"minTime": 100,
	"maxTime": 200,
	"stats": {"numSamples": 10, "numSeries": 2, "numChunks": 3},
	"compaction": {"level": 1, "sources": ["01ARZ3NDEKTSV4RRFFQ69G5FAV"]},
	"version": 1,
	"producer": {"name": "ingester-3"}
})";

} // namespace

TEST(BlockMetaTest, ParsesManifest) {
    auto meta = parse_meta(kManifest);
    ASSERT_TRUE(meta.is_ok()) << meta.error();

    const auto& m = meta.value();
    EXPECT_EQ(m.ulid.to_string(), "01ARZ3NDEKTSV4RRFFQ69G5FAV");
    EXPECT_EQ(m.min_time, 100);
    EXPECT_EQ(m.max_time, 200);
    EXPECT_EQ(m.stats.num_samples, 10u);
    EXPECT_EQ(m.stats.num_series, 2u);
    EXPECT_EQ(m.stats.num_chunks, 3u);
    EXPECT_EQ(m.compaction.level, 1);
    ASSERT_EQ(m.compaction.sources.size(), 1u);
    EXPECT_EQ(m.version, 1);
    EXPECT_TRUE(m.shipping.labels.empty());
    EXPECT_EQ(m.shipping.source, SourceType::Unknown);
    EXPECT_TRUE(m.extra.contains("producer"));
}

TEST(BlockMetaTest, SerializeKeepsUnknownFieldsAndShippingInfo) {
    auto meta = parse_meta(kManifest);
    ASSERT_TRUE(meta.is_ok());

    meta.value().shipping.labels = {{"cluster", "eu1"}, {"replica", "a"}};
    meta.value().shipping.source = SourceType::Sidecar;

    const auto serialized = serialize_meta(meta.value());
    ASSERT_TRUE(serialized.is_ok()) << serialized.error();
    const auto& text = serialized.value();
    EXPECT_NE(text.find("\n\t\"ulid\""), std::string::npos);

    const auto doc = nlohmann::json::parse(text);
    EXPECT_EQ(doc["producer"]["name"], "ingester-3");
    EXPECT_EQ(doc["shipper"]["labels"]["cluster"], "eu1");
    EXPECT_EQ(doc["shipper"]["source"], "sidecar");

    auto reparsed = parse_meta(text);
    ASSERT_TRUE(reparsed.is_ok());
    EXPECT_EQ(reparsed.value().shipping.labels.at("replica"), "a");
    EXPECT_EQ(reparsed.value().shipping.source, SourceType::Sidecar);
    EXPECT_EQ(reparsed.value().extra, meta.value().extra);
}

TEST(BlockMetaTest, RejectsCorruptManifests) {
    EXPECT_TRUE(parse_meta("{not json").is_error());
    EXPECT_TRUE(parse_meta("[]").is_error());
    EXPECT_TRUE(parse_meta(R"({"minTime": 1, "maxTime": 2, "version": 1, "compaction": {"level": 1}})").is_error());
    EXPECT_TRUE(parse_meta(R"({"ulid": "nope", "minTime": 1, "maxTime": 2, "version": 1, "compaction": {"level": 1}})").is_error());
    EXPECT_TRUE(parse_meta(R"({"ulid": "01ARZ3NDEKTSV4RRFFQ69G5FAV", "maxTime": 2, "version": 1, "compaction": {"level": 1}})").is_error());
    EXPECT_TRUE(parse_meta(R"({"ulid": "01ARZ3NDEKTSV4RRFFQ69G5FAV", "minTime": 1, "maxTime": 2, "version": 2, "compaction": {"level": 1}})").is_error());
    EXPECT_TRUE(parse_meta(R"({"ulid": "01ARZ3NDEKTSV4RRFFQ69G5FAV", "minTime": 1, "maxTime": 2, "version": 1})").is_error());
}

TEST(BlockMetaTest, SourceTypeNames) {
    EXPECT_STREQ(blockship::block::to_string(SourceType::CompactorRepair), "compactor.repair");
    EXPECT_EQ(blockship::block::source_type_from_string("receive"), SourceType::Receive);
    EXPECT_EQ(blockship::block::source_type_from_string("mystery"), SourceType::Unknown);
    EXPECT_STREQ(blockship::block::to_string(SourceType::Unknown), "unknown");
}

TEST(BlockMetaTest, ReadAndWriteMetaFile) {
    const auto root = blockship::testing::create_temp_dir("blockship_meta_test_");
    const auto id = blockship::testing::make_ulid(1700000000000, 1);
    const auto dir = blockship::testing::make_block(root, {id, 10, 20, 1});

    auto meta = blockship::block::read_meta_file(dir);
    ASSERT_TRUE(meta.is_ok()) << meta.error();
    EXPECT_EQ(meta.value().ulid, id);

    meta.value().max_time = 30;
    ASSERT_TRUE(blockship::block::write_meta_file(dir, meta.value()).is_ok());

    auto reread = blockship::block::read_meta_file(dir);
    ASSERT_TRUE(reread.is_ok());
    EXPECT_EQ(reread.value().max_time, 30);

    EXPECT_TRUE(blockship::block::read_meta_file(root / "missing").is_error());
    fs::remove_all(root);
}

TEST(BlockMetaTest, SerializeRejectsInvalidUtf8Label) {
    auto meta = parse_meta(kManifest);
    ASSERT_TRUE(meta.is_ok());
    meta.value().shipping.labels = {{"region", "caf\xe9"}};

    auto text = serialize_meta(meta.value());
    ASSERT_TRUE(text.is_error());
    EXPECT_NE(text.error().find("serialize meta"), std::string::npos);
}
