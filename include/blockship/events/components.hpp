/**
 * @file components.hpp
 * @brief Listeners that turn shipper events into metrics
 */

#pragma once

#include "blockship/events/event_bus.hpp"
#include "blockship/events/events.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace blockship::events {

inline constexpr const char* kDirSyncsTotal = "shipper_dir_syncs_total";
inline constexpr const char* kDirSyncFailuresTotal = "shipper_dir_sync_failures_total";
inline constexpr const char* kUploadsTotal = "shipper_uploads_total";
inline constexpr const char* kUploadFailuresTotal = "shipper_upload_failures_total";

/**
 * @brief Named monotonic counters fed by shipper events
 *
 * WHAT IT TRACKS:
 * - shipper_dir_syncs_total          sync passes started
 * - shipper_dir_sync_failures_total  passes that failed to scan or persist
 * - shipper_uploads_total            block upload attempts
 * - shipper_upload_failures_total    block upload attempts that failed
 *
 * USAGE:
 * EventBus bus;
 * MetricsComponent metrics(bus);
 * ...
 * metrics.counter(kUploadsTotal);
 *
 * The component must outlive every emit on `bus`.
 */
class MetricsComponent {
public:
    explicit MetricsComponent(EventBus& bus) {
        increment_counter(kDirSyncsTotal, 0);
        increment_counter(kDirSyncFailuresTotal, 0);
        increment_counter(kUploadsTotal, 0);
        increment_counter(kUploadFailuresTotal, 0);

        bus.subscribe<DirSyncStartedEvent>([this](const DirSyncStartedEvent&) {
            increment_counter(kDirSyncsTotal);
        });
        bus.subscribe<DirSyncFailedEvent>([this](const DirSyncFailedEvent&) {
            increment_counter(kDirSyncFailuresTotal);
        });
        bus.subscribe<BlockUploadStartedEvent>([this](const BlockUploadStartedEvent&) {
            increment_counter(kUploadsTotal);
        });
        bus.subscribe<BlockUploadFailedEvent>([this](const BlockUploadFailedEvent&) {
            increment_counter(kUploadFailuresTotal);
        });
    }

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    void increment_counter(const std::string& name, std::uint64_t delta = 1) {
        std::lock_guard lock(mutex_);
        counters_[name] += delta;
    }

    std::uint64_t counter(const std::string& name) const {
        std::lock_guard lock(mutex_);
        auto it = counters_.find(name);
        return it != counters_.end() ? it->second : 0;
    }

    std::map<std::string, std::uint64_t> snapshot() const {
        std::lock_guard lock(mutex_);
        return counters_;
    }

    void print_stats() const {
        for (const auto& [name, value] : snapshot()) {
            spdlog::info("  {:<34} {}", name, value);
        }
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::uint64_t> counters_;
};

} // namespace blockship::events
