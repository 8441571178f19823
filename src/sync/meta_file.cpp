#include "blockship/sync/meta_file.hpp"

#include "blockship/core/fileutil.hpp"

#include <nlohmann/json.hpp>

#include <system_error>

namespace blockship::sync {
namespace fs = std::filesystem;
using json = nlohmann::ordered_json;

namespace {

ShipperMetaResult fail(MetaFileError::Kind kind, std::string message) {
    return ShipperMetaResult(ErrValue<MetaFileError>(MetaFileError{kind, std::move(message)}));
}

} // namespace

ShipperMetaResult read_shipper_meta(const fs::path& dir) {
    const auto path = dir / kShipperMetaFilename;

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return fail(MetaFileError::Kind::Io, "stat " + path.string() + ": " + ec.message());
        }
        return fail(MetaFileError::Kind::NotFound, path.string() + " does not exist");
    }

    auto content = fileutil::read_file(path);
    if (content.is_error()) {
        return fail(MetaFileError::Kind::Io, content.error());
    }

    const auto doc = json::parse(content.value(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return fail(MetaFileError::Kind::Corrupt, "parse " + path.string() + ": invalid JSON object");
    }

    const auto version = doc.find("version");
    if (version == doc.end() || !version->is_number_integer()) {
        return fail(MetaFileError::Kind::Corrupt, "parse " + path.string() + ": missing version");
    }
    if (version->get<std::int64_t>() != kShipperMetaVersion1) {
        return fail(MetaFileError::Kind::VersionMismatch,
                    "unexpected meta file version " + std::to_string(version->get<std::int64_t>()));
    }

    ShipperMeta meta;
    meta.version = kShipperMetaVersion1;

    const auto uploaded = doc.find("uploaded");
    if (uploaded != doc.end() && !uploaded->is_null()) {
        if (!uploaded->is_array()) {
            return fail(MetaFileError::Kind::Corrupt, "parse " + path.string() + ": uploaded is not an array");
        }
        for (const auto& entry : *uploaded) {
            const auto id = entry.is_string() ? block::Ulid::parse(entry.get<std::string>()) : std::nullopt;
            if (!id) {
                return fail(MetaFileError::Kind::Corrupt,
                            "parse " + path.string() + ": invalid block id " + entry.dump());
            }
            meta.uploaded.push_back(*id);
        }
    }

    return ShipperMetaResult(OkValue<ShipperMeta>(std::move(meta)));
}

Result<void> write_shipper_meta(const fs::path& dir, const ShipperMeta& meta) {
    json doc;
    doc["version"] = meta.version;
    doc["uploaded"] = json::array();
    for (const auto& id : meta.uploaded) {
        doc["uploaded"].push_back(id.to_string());
    }
    return fileutil::write_file_atomically(dir / kShipperMetaFilename, doc.dump(1, '\t') + "\n");
}

} // namespace blockship::sync
