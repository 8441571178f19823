#pragma once

#include "blockship/objstore/bucket.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace blockship::objstore {

/**
 * @brief Thread-safe bucket kept entirely in memory
 *
 * Besides the stored objects it records the order in which objects were
 * uploaded and how many existence checks were made, so callers can assert
 * on upload ordering and deduplication.
 */
class InMemoryBucket : public Bucket {
public:
    Result<bool> exists(const Context& ctx, const std::string& name) override;
    Result<void> upload(const Context& ctx, const std::string& name, std::istream& content) override;
    std::string name() const override { return "inmem"; }

    /// Store an object directly, bypassing upload accounting.
    void put(const std::string& name, std::string content);
    void remove(const std::string& name);

    std::optional<std::string> get(const std::string& name) const;
    std::map<std::string, std::string> objects() const;
    std::vector<std::string> upload_log() const;
    std::size_t exists_calls() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> objects_;
    std::vector<std::string> upload_log_;
    std::size_t exists_calls_ = 0;
};

} // namespace blockship::objstore
