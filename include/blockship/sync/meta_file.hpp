#pragma once

#include "blockship/block/ulid.hpp"
#include "blockship/core/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace blockship::sync {

inline constexpr const char* kShipperMetaFilename = "shipper.json";
inline constexpr int kShipperMetaVersion1 = 1;

/**
 * @brief Bookkeeping of blocks already confirmed in the bucket
 *
 * Stored as <data dir>/shipper.json:
 *
 *   {
 *   	"version": 1,
 *   	"uploaded": ["01HB6Y...", ...]
 *   }
 *
 * The record only saves redundant existence checks. Losing it costs extra
 * bucket round trips, never a duplicate or a missing block.
 */
struct ShipperMeta {
    int version = kShipperMetaVersion1;
    std::vector<block::Ulid> uploaded;
};

struct MetaFileError {
    enum class Kind {
        NotFound,
        VersionMismatch,
        Corrupt,
        Io
    };

    Kind kind = Kind::Io;
    std::string message;
};

using ShipperMetaResult = Result<ShipperMeta, MetaFileError>;

ShipperMetaResult read_shipper_meta(const std::filesystem::path& dir);

Result<void> write_shipper_meta(const std::filesystem::path& dir, const ShipperMeta& meta);

} // namespace blockship::sync
