#include "blockship/sync/scanner.hpp"

#include "blockship/block/ulid.hpp"
#include "blockship/core/fileutil.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace blockship::sync {
namespace fs = std::filesystem;

BlockScanner::BlockScanner(fs::path root) : root_(std::move(root)) {}

Result<void> BlockScanner::scan(const Visitor& visit) const {
    auto names = fileutil::read_dir_names(root_);
    if (names.is_error()) {
        return Err<void>(names.error());
    }

    for (const auto& name : names.value()) {
        const auto id = block::Ulid::parse(name);
        if (!id) {
            continue;
        }
        const auto dir = root_ / name;

        std::error_code ec;
        const auto status = fs::status(dir, ec);
        if (ec) {
            spdlog::warn("open file failed dir={} err={}", dir.string(), ec.message());
            continue;
        }
        if (!fs::is_directory(status)) {
            continue;
        }

        auto meta = block::read_meta_file(dir);
        if (meta.is_error()) {
            spdlog::warn("reading meta file failed dir={} err={}", dir.string(), meta.error());
            continue;
        }

        if (meta.value().ulid != *id) {
            spdlog::warn("block dir does not match meta ulid dir={} ulid={}", dir.string(),
                         meta.value().ulid.to_string());
            continue;
        }

        if (auto res = visit(BlockEntry{dir, std::move(meta.value())}); res.is_error()) {
            return res;
        }
    }
    return Ok();
}

} // namespace blockship::sync
