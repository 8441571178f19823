/**
 * @file events.hpp
 * @brief Events emitted by the shipper
 *
 * NAMING CONVENTION:
 * Events are past tense and describe something that already happened.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace blockship::events {

// ════════════════════════════════════════════════════════
// Sync pass events
// ════════════════════════════════════════════════════════

/// One sync pass over a data directory began.
struct DirSyncStartedEvent {
    std::string dir;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/// A sync pass could not scan the directory or persist its bookkeeping.
struct DirSyncFailedEvent {
    std::string dir;
    std::string error_message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct DirSyncCompletedEvent {
    std::string dir;
    std::size_t blocks_seen = 0;
    std::size_t blocks_uploaded = 0;
    std::size_t blocks_failed = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Block upload events
// ════════════════════════════════════════════════════════

/// Emitted once the block passed the compaction filter and is about to be checked and shipped.
struct BlockUploadStartedEvent {
    std::string block_id;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct BlockUploadedEvent {
    std::string block_id;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct BlockUploadFailedEvent {
    std::string block_id;
    std::string error_message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace blockship::events
