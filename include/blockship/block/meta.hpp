#pragma once

/**
 * @file meta.hpp
 * @brief Block manifest (meta.json) model
 *
 * WHY THIS FILE EXISTS:
 * Every block directory carries a meta.json describing the block: its id,
 * the time range of the data it holds and how it was produced. The shipper
 * never looks inside index or chunk files; everything it needs to decide
 * whether and how to ship a block comes from this manifest.
 *
 * HOW IT INTEGRATES:
 * - BlockScanner (sync/scanner.hpp) loads one Meta per block directory
 * - Shipper attaches labels and a source tag to a staged copy and writes it
 *   back with write_meta_file()
 * - block::upload() re-reads the staged manifest to validate the directory
 *
 * DESIGN DECISIONS:
 * - Fields the shipper does not understand are kept in `extra` and written
 *   back untouched, so augmenting a manifest never drops producer data
 * - The shipping extension lives under its own "shipper" key and is only
 *   ever written into staged copies, never into the source block
 */

#include "blockship/block/ulid.hpp"
#include "blockship/core/result.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace blockship::block {

inline constexpr const char* kMetaFilename = "meta.json";
inline constexpr const char* kIndexFilename = "index";
inline constexpr const char* kChunksDirname = "chunks";

inline constexpr int kMetaVersion1 = 1;

/**
 * @brief How a block came to exist, recorded in the shipped manifest
 *
 * Readers of the bucket use it to tell freshly ingested blocks apart from
 * blocks rebuilt by compaction or repair jobs.
 */
enum class SourceType {
    Unknown,
    Sidecar,
    Compactor,
    CompactorRepair,
    Ruler,
    Receive,
    BucketRepair,
    Test
};

const char* to_string(SourceType source);
SourceType source_type_from_string(std::string_view text);

using Labels = std::map<std::string, std::string>;

struct BlockStats {
    std::uint64_t num_samples = 0;
    std::uint64_t num_series = 0;
    std::uint64_t num_chunks = 0;
};

/**
 * @brief Compaction lineage
 *
 * Level 1 is a block written straight from ingestion. Every compaction that
 * merges blocks produces a block one level higher; `sources` lists the
 * level-1 blocks it was ultimately built from.
 */
struct Compaction {
    int level = 1;
    std::vector<Ulid> sources;
};

/// Fields attached by the shipper before upload.
struct ShippingInfo {
    Labels labels;
    SourceType source = SourceType::Unknown;
};

struct Meta {
    Ulid ulid;
    std::int64_t min_time = 0; ///< Inclusive, milliseconds since epoch
    std::int64_t max_time = 0; ///< Exclusive, milliseconds since epoch
    BlockStats stats;
    Compaction compaction;
    int version = kMetaVersion1;
    ShippingInfo shipping;

    nlohmann::ordered_json extra = nlohmann::ordered_json::object(); ///< Unrecognised top-level fields
};

Result<Meta> parse_meta(std::string_view text);

/// Render the manifest as tab-indented JSON. Fails on label or extra values that are not valid UTF-8.
Result<std::string> serialize_meta(const Meta& meta);

/// Load <block_dir>/meta.json.
Result<Meta> read_meta_file(const std::filesystem::path& block_dir);

/// Atomically replace <block_dir>/meta.json.
Result<void> write_meta_file(const std::filesystem::path& block_dir, const Meta& meta);

} // namespace blockship::block
