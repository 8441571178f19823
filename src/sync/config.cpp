#include "blockship/sync/config.hpp"

#include "blockship/core/fileutil.hpp"

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include <string>

namespace blockship::sync {
using json = nlohmann::json;

Result<void> apply_config_json(ShipperConfig& config, const std::string& text) {
    const auto doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Err<void>(std::string("config is not a JSON object"));
    }

    try {
        if (doc.contains("data_dir")) {
            config.data_dir = doc.at("data_dir").get<std::string>();
        }
        if (doc.contains("bucket_dir")) {
            config.bucket_dir = doc.at("bucket_dir").get<std::string>();
        }
        if (doc.contains("interval_seconds")) {
            config.interval = std::chrono::seconds(doc.at("interval_seconds").get<std::int64_t>());
        }
        if (doc.contains("source")) {
            const auto source = doc.at("source").get<std::string>();
            config.source = block::source_type_from_string(source);
            if (config.source == block::SourceType::Unknown) {
                return Err<void>("unknown source type: " + source);
            }
        }
        if (doc.contains("labels")) {
            config.labels = doc.at("labels").get<block::Labels>();
        }
        if (doc.contains("log_level")) {
            config.log_level = doc.at("log_level").get<std::string>();
        }
    } catch (const json::exception& e) {
        return Err<void>(std::string("invalid config: ") + e.what());
    }
    return Ok();
}

Result<ShipperConfig> load_config(const std::filesystem::path& path) {
    auto content = fileutil::read_file(path);
    if (content.is_error()) {
        return Err<ShipperConfig>(content.error());
    }

    ShipperConfig config;
    if (auto res = apply_config_json(config, content.value()); res.is_error()) {
        return Err<ShipperConfig>(path.string() + ": " + res.error());
    }
    return Ok(std::move(config));
}

Result<void> validate(const ShipperConfig& config) {
    if (config.data_dir.empty()) {
        return Err<void>(std::string("data_dir is required"));
    }
    if (config.bucket_dir.empty()) {
        return Err<void>(std::string("bucket_dir is required"));
    }
    if (config.interval.count() <= 0) {
        return Err<void>(std::string("interval_seconds must be > 0"));
    }
    if (config.interval > kMaxSyncInterval) {
        return Err<void>("interval_seconds must be <= " + std::to_string(kMaxSyncInterval.count()));
    }
    if (spdlog::level::from_str(config.log_level) == spdlog::level::off && config.log_level != "off") {
        return Err<void>("unknown log level: " + config.log_level);
    }
    return Ok();
}

Result<std::pair<std::string, std::string>> parse_label(const std::string& text) {
    const auto pos = text.find('=');
    if (pos == std::string::npos || pos == 0) {
        return Err<std::pair<std::string, std::string>>("label must be name=value: " + text);
    }
    return Ok(std::make_pair(text.substr(0, pos), text.substr(pos + 1)));
}

} // namespace blockship::sync
