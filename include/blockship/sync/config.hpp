#pragma once

#include "blockship/block/meta.hpp"
#include "blockship/core/result.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <utility>

namespace blockship::sync {

/**
 * @brief Settings for a long-running shipper process
 *
 * JSON form (every key optional in the file, but data_dir and bucket_dir
 * must be set by the file or the command line before validate() passes):
 *
 *   {
 *     "data_dir": "/var/lib/tsdb",
 *     "bucket_dir": "/mnt/bucket",
 *     "interval_seconds": 30,
 *     "source": "sidecar",
 *     "labels": {"cluster": "eu1", "replica": "a"},
 *     "log_level": "info"
 *   }
 */
/// Longest accepted pause between sync passes.
inline constexpr std::chrono::seconds kMaxSyncInterval{24 * 60 * 60};

struct ShipperConfig {
    std::filesystem::path data_dir;
    std::filesystem::path bucket_dir;
    std::chrono::seconds interval{30};
    block::SourceType source = block::SourceType::Sidecar;
    block::Labels labels;
    std::string log_level = "info";
};

/// Overlay the keys present in `text` onto `config`.
Result<void> apply_config_json(ShipperConfig& config, const std::string& text);

Result<ShipperConfig> load_config(const std::filesystem::path& path);

Result<void> validate(const ShipperConfig& config);

/// Parse a "name=value" label flag.
Result<std::pair<std::string, std::string>> parse_label(const std::string& text);

} // namespace blockship::sync
