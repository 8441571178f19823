#pragma once

#include "blockship/block/meta.hpp"
#include "blockship/core/result.hpp"

#include <filesystem>
#include <functional>

namespace blockship::sync {

/// A block found by a scan: its manifest and the directory it was read from.
struct BlockEntry {
    std::filesystem::path dir;
    block::Meta meta;
};

/**
 * @brief Walks the block directories directly under a data directory
 *
 * Producers and compactors add and delete blocks while a scan runs, so a
 * candidate that vanishes, is not a directory, or has no readable
 * meta.json is logged and skipped instead of failing the scan. So is a
 * directory whose name is not the id in its own manifest.
 */
class BlockScanner {
public:
    /// Return an error to stop the scan; scan() then returns that error.
    using Visitor = std::function<Result<void>(const BlockEntry&)>;

    explicit BlockScanner(std::filesystem::path root);

    /**
     * @brief Call `visit` for every loadable block, in block id order
     *
     * Fails only when the root cannot be listed or `visit` fails.
     */
    Result<void> scan(const Visitor& visit) const;

    const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path root_;
};

} // namespace blockship::sync
