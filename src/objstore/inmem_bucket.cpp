#include "blockship/objstore/inmem_bucket.hpp"

#include <sstream>

namespace blockship::objstore {

Result<bool> InMemoryBucket::exists(const Context& ctx, const std::string& name) {
    if (auto res = ctx.check(); res.is_error()) {
        return Err<bool>(res.error());
    }
    if (auto res = validate_object_name(name); res.is_error()) {
        return Err<bool>(res.error());
    }
    std::lock_guard lock(mutex_);
    ++exists_calls_;
    return Ok(objects_.find(name) != objects_.end());
}

Result<void> InMemoryBucket::upload(const Context& ctx, const std::string& name, std::istream& content) {
    if (auto res = ctx.check(); res.is_error()) {
        return res;
    }
    if (auto res = validate_object_name(name); res.is_error()) {
        return res;
    }

    std::ostringstream buffer;
    buffer << content.rdbuf();
    if (content.bad()) {
        return Err<void>("read content for " + name);
    }

    std::lock_guard lock(mutex_);
    objects_[name] = buffer.str();
    upload_log_.push_back(name);
    return Ok();
}

void InMemoryBucket::put(const std::string& name, std::string content) {
    std::lock_guard lock(mutex_);
    objects_[name] = std::move(content);
}

void InMemoryBucket::remove(const std::string& name) {
    std::lock_guard lock(mutex_);
    objects_.erase(name);
}

std::optional<std::string> InMemoryBucket::get(const std::string& name) const {
    std::lock_guard lock(mutex_);
    const auto it = objects_.find(name);
    if (it == objects_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, std::string> InMemoryBucket::objects() const {
    std::lock_guard lock(mutex_);
    return objects_;
}

std::vector<std::string> InMemoryBucket::upload_log() const {
    std::lock_guard lock(mutex_);
    return upload_log_;
}

std::size_t InMemoryBucket::exists_calls() const {
    std::lock_guard lock(mutex_);
    return exists_calls_;
}

} // namespace blockship::objstore
