// src/executor/checkpoint_store.cpp
#include "agentorch/executor/checkpoint_store.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace agentorch {

namespace {

size_t estimate_size_kb(const Value& data) {
    return data.dump().size() / 1024 + 1;
}

} // namespace

CheckpointStore::CheckpointStore(size_t max_count, size_t max_size_kb)
    : max_count_(max_count), max_size_kb_(max_size_kb) {}

bool CheckpointStore::save(const std::string& key, const Value& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t new_size_kb = estimate_size_kb(data);
    if (max_count_ == 0 || new_size_kb > max_size_kb_) {
        spdlog::warn("Checkpoint '{}' ({} KB) does not fit the checkpoint budget", key, new_size_kb);
        return false;
    }

    // 同名快照先移除，再作为最新的一个插入
    auto existing = snapshots_.find(key);
    if (existing != snapshots_.end()) {
        total_size_kb_ -= estimate_size_kb(existing->second);
        snapshots_.erase(existing);
        order_.erase(std::remove(order_.begin(), order_.end(), key), order_.end());
    }

    snapshots_[key] = data;
    order_.push_back(key);
    total_size_kb_ += new_size_kb;
    enforce_budget();
    return true;
}

std::optional<Value> CheckpointStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = snapshots_.find(key);
    if (it == snapshots_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> CheckpointStore::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}

size_t CheckpointStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshots_.size();
}

void CheckpointStore::set_limits(size_t max_count, size_t max_size_kb) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_count_ = max_count;
    max_size_kb_ = max_size_kb;
    enforce_budget();
}

void CheckpointStore::enforce_budget() {
    while (!order_.empty() && (snapshots_.size() > max_count_ || total_size_kb_ > max_size_kb_)) {
        std::string oldest = order_.front();
        order_.erase(order_.begin());
        auto it = snapshots_.find(oldest);
        if (it != snapshots_.end()) {
            total_size_kb_ -= estimate_size_kb(it->second);
            snapshots_.erase(it);
        }
    }
}

} // namespace agentorch
