#include "blockship/core/context.hpp"
#include "blockship/events/components.hpp"
#include "blockship/events/event_bus.hpp"
#include "blockship/objstore/filesystem_bucket.hpp"
#include "blockship/sync/config.hpp"
#include "blockship/sync/shipper.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <optional>
#include <string>
#include <thread>

namespace {

blockship::Context* g_context = nullptr;

void handle_signal(int) {
    if (g_context != nullptr) {
        g_context->cancel();
    }
}

void print_usage(const char* argv0) {
    spdlog::info("usage: {} [--config FILE] [--data DIR] [--bucket DIR] [--interval SECONDS]", argv0);
    spdlog::info("       [--source TYPE] [--label NAME=VALUE]... [--once]");
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    blockship::sync::ShipperConfig config;
    bool once = false;

    // --config is applied first so that the remaining flags override it.
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--config" && i + 1 < argc) {
            auto loaded = blockship::sync::load_config(argv[++i]);
            if (loaded.is_error()) {
                spdlog::error("Failed to load config: {}", loaded.error());
                return 1;
            }
            config = std::move(loaded.value());
        }
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            ++i;
        } else if ((arg == "-d" || arg == "--data") && i + 1 < argc) {
            config.data_dir = argv[++i];
        } else if ((arg == "-b" || arg == "--bucket") && i + 1 < argc) {
            config.bucket_dir = argv[++i];
        } else if (arg == "--interval" && i + 1 < argc) {
            const std::string value = argv[++i];
            try {
                config.interval = std::chrono::seconds(std::stoll(value));
            } catch (const std::exception&) {
                spdlog::error("Invalid interval: {}", value);
                return 1;
            }
        } else if (arg == "--source" && i + 1 < argc) {
            config.source = blockship::block::source_type_from_string(argv[++i]);
            if (config.source == blockship::block::SourceType::Unknown) {
                spdlog::error("Unknown source type: {}", argv[i]);
                return 1;
            }
        } else if (arg == "--label" && i + 1 < argc) {
            auto label = blockship::sync::parse_label(argv[++i]);
            if (label.is_error()) {
                spdlog::error("{}", label.error());
                return 1;
            }
            config.labels[label.value().first] = label.value().second;
        } else if (arg == "--log-level" && i + 1 < argc) {
            config.log_level = argv[++i];
        } else if (arg == "--once") {
            once = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            spdlog::error("Unknown argument: {}", arg);
            print_usage(argv[0]);
            return 1;
        }
    }

    if (auto res = blockship::sync::validate(config); res.is_error()) {
        spdlog::error("Invalid configuration: {}", res.error());
        return 1;
    }
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    blockship::Context ctx;
    g_context = &ctx;
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    blockship::events::EventBus bus;
    blockship::events::MetricsComponent metrics(bus);
    blockship::objstore::FilesystemBucket bucket(config.bucket_dir);

    const auto labels = config.labels;
    blockship::sync::Shipper shipper(
        config.data_dir, bucket, bus,
        [labels]() -> std::optional<blockship::block::Labels> {
            if (labels.empty()) {
                return std::nullopt;
            }
            return labels;
        },
        config.source);

    spdlog::info("Shipping blocks from {} to {} every {}s (source={})",
                 config.data_dir.string(), bucket.name(), config.interval.count(),
                 blockship::block::to_string(config.source));

    while (!ctx.cancelled()) {
        const auto summary = shipper.sync(ctx);
        spdlog::info("Sync pass: seen={} uploaded={} skipped={} failed={}",
                     summary.blocks_seen, summary.uploaded, summary.skipped, summary.failed);

        if (auto ts = shipper.timestamps(); ts.is_ok()) {
            spdlog::debug("Timestamps: min_time={} max_sync_time={}",
                          ts.value().min_time, ts.value().max_sync_time);
        } else {
            spdlog::debug("Timestamps unavailable: {}", ts.error());
        }

        if (once) {
            break;
        }

        const auto wake_at = std::chrono::steady_clock::now() + config.interval;
        while (!ctx.cancelled() && std::chrono::steady_clock::now() < wake_at) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    }

    g_context = nullptr;
    spdlog::info("Shipper statistics:");
    metrics.print_stats();
    return 0;
}
