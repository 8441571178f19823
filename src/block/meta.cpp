#include "blockship/block/meta.hpp"

#include "blockship/core/fileutil.hpp"

#include <array>
#include <utility>

namespace blockship::block {
namespace fs = std::filesystem;
using json = nlohmann::ordered_json;

namespace {

constexpr std::array<std::pair<SourceType, const char*>, 7> kSourceNames{{
    {SourceType::Sidecar, "sidecar"},
    {SourceType::Compactor, "compactor"},
    {SourceType::CompactorRepair, "compactor.repair"},
    {SourceType::Ruler, "ruler"},
    {SourceType::Receive, "receive"},
    {SourceType::BucketRepair, "bucket.repair"},
    {SourceType::Test, "test"},
}};

constexpr const char* kKnownKeys[] = {"ulid", "minTime", "maxTime", "stats", "compaction", "version", "shipper"};

bool is_known_key(const std::string& key) {
    for (const char* known : kKnownKeys) {
        if (key == known) {
            return true;
        }
    }
    return false;
}

Result<std::int64_t> require_int(const json& obj, const char* key) {
    const auto it = obj.find(key);
    if (it == obj.end()) {
        return Err<std::int64_t>(std::string("missing field ") + key);
    }
    if (!it->is_number_integer()) {
        return Err<std::int64_t>(std::string("field ") + key + " is not an integer");
    }
    return Ok(it->get<std::int64_t>());
}

std::uint64_t optional_uint(const json& obj, const char* key) {
    const auto it = obj.find(key);
    if (it == obj.end() || !it->is_number_unsigned()) {
        return 0;
    }
    return it->get<std::uint64_t>();
}

Result<Ulid> parse_ulid_value(const json& value, const char* what) {
    if (!value.is_string()) {
        return Err<Ulid>(std::string(what) + " is not a string");
    }
    const auto text = value.get<std::string>();
    auto id = Ulid::parse(text);
    if (!id) {
        return Err<Ulid>(std::string(what) + " is not a valid ULID: " + text);
    }
    return Ok(*id);
}

Result<ShippingInfo> parse_shipping(const json& obj) {
    ShippingInfo info;
    if (!obj.is_object()) {
        return Err<ShippingInfo>(std::string("field shipper is not an object"));
    }
    if (const auto labels = obj.find("labels"); labels != obj.end() && !labels->is_null()) {
        if (!labels->is_object()) {
            return Err<ShippingInfo>(std::string("field shipper.labels is not an object"));
        }
        for (const auto& [name, value] : labels->items()) {
            if (!value.is_string()) {
                return Err<ShippingInfo>("label " + name + " is not a string");
            }
            info.labels.emplace(name, value.get<std::string>());
        }
    }
    if (const auto source = obj.find("source"); source != obj.end() && source->is_string()) {
        info.source = source_type_from_string(source->get<std::string>());
    }
    return Ok(std::move(info));
}

} // namespace

const char* to_string(SourceType source) {
    for (const auto& [type, name] : kSourceNames) {
        if (type == source) {
            return name;
        }
    }
    return "unknown";
}

SourceType source_type_from_string(std::string_view text) {
    for (const auto& [type, name] : kSourceNames) {
        if (text == name) {
            return type;
        }
    }
    return SourceType::Unknown;
}

Result<Meta> parse_meta(std::string_view text) {
    const auto doc = json::parse(text.begin(), text.end(), nullptr, false);
    if (doc.is_discarded()) {
        return Err<Meta>(std::string("invalid JSON"));
    }
    if (!doc.is_object()) {
        return Err<Meta>(std::string("meta is not a JSON object"));
    }

    Meta meta;

    const auto ulid_it = doc.find("ulid");
    if (ulid_it == doc.end()) {
        return Err<Meta>(std::string("missing field ulid"));
    }
    auto id = parse_ulid_value(*ulid_it, "ulid");
    if (id.is_error()) {
        return Err<Meta>(id.error());
    }
    meta.ulid = id.value();

    auto min_time = require_int(doc, "minTime");
    if (min_time.is_error()) {
        return Err<Meta>(min_time.error());
    }
    auto max_time = require_int(doc, "maxTime");
    if (max_time.is_error()) {
        return Err<Meta>(max_time.error());
    }
    meta.min_time = min_time.value();
    meta.max_time = max_time.value();

    auto version = require_int(doc, "version");
    if (version.is_error()) {
        return Err<Meta>(version.error());
    }
    if (version.value() != kMetaVersion1) {
        return Err<Meta>("unexpected meta version " + std::to_string(version.value()));
    }
    meta.version = static_cast<int>(version.value());

    const auto compaction = doc.find("compaction");
    if (compaction == doc.end() || !compaction->is_object()) {
        return Err<Meta>(std::string("missing field compaction"));
    }
    auto level = require_int(*compaction, "level");
    if (level.is_error()) {
        return Err<Meta>("compaction: " + level.error());
    }
    meta.compaction.level = static_cast<int>(level.value());
    if (const auto sources = compaction->find("sources"); sources != compaction->end() && sources->is_array()) {
        for (const auto& source : *sources) {
            auto source_id = parse_ulid_value(source, "compaction source");
            if (source_id.is_error()) {
                return Err<Meta>(source_id.error());
            }
            meta.compaction.sources.push_back(source_id.value());
        }
    }

    if (const auto stats = doc.find("stats"); stats != doc.end() && stats->is_object()) {
        meta.stats.num_samples = optional_uint(*stats, "numSamples");
        meta.stats.num_series = optional_uint(*stats, "numSeries");
        meta.stats.num_chunks = optional_uint(*stats, "numChunks");
    }

    if (const auto shipping = doc.find("shipper"); shipping != doc.end() && !shipping->is_null()) {
        auto info = parse_shipping(*shipping);
        if (info.is_error()) {
            return Err<Meta>(info.error());
        }
        meta.shipping = std::move(info.value());
    }

    for (const auto& [key, value] : doc.items()) {
        if (!is_known_key(key)) {
            meta.extra[key] = value;
        }
    }

    return Ok(std::move(meta));
}

Result<std::string> serialize_meta(const Meta& meta) {
    json doc;
    doc["ulid"] = meta.ulid.to_string();
    doc["minTime"] = meta.min_time;
    doc["maxTime"] = meta.max_time;
    doc["stats"] = {
        {"numSamples", meta.stats.num_samples},
        {"numSeries", meta.stats.num_series},
        {"numChunks", meta.stats.num_chunks},
    };

    json sources = json::array();
    for (const auto& source : meta.compaction.sources) {
        sources.push_back(source.to_string());
    }
    doc["compaction"] = {{"level", meta.compaction.level}, {"sources", std::move(sources)}};
    doc["version"] = meta.version;

    json labels = json::object();
    for (const auto& [name, value] : meta.shipping.labels) {
        labels[name] = value;
    }
    doc["shipper"] = {{"labels", std::move(labels)}, {"source", to_string(meta.shipping.source)}};

    for (const auto& [key, value] : meta.extra.items()) {
        doc[key] = value;
    }

    try {
        return Ok(doc.dump(1, '\t') + "\n");
    } catch (const json::exception& e) {
        return Err<std::string>(std::string("serialize meta: ") + e.what());
    }
}

Result<Meta> read_meta_file(const fs::path& block_dir) {
    const auto path = block_dir / kMetaFilename;
    auto content = fileutil::read_file(path);
    if (content.is_error()) {
        return Err<Meta>(content.error());
    }
    return with_context(parse_meta(content.value()), "parse " + path.string());
}

Result<void> write_meta_file(const fs::path& block_dir, const Meta& meta) {
    auto text = serialize_meta(meta);
    if (text.is_error()) {
        return Err<void>(text.error());
    }
    return fileutil::write_file_atomically(block_dir / kMetaFilename, text.value());
}

} // namespace blockship::block
