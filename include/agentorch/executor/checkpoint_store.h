// include/agentorch/executor/checkpoint_store.h
#ifndef AGENTORCH_EXECUTOR_CHECKPOINT_STORE_H
#define AGENTORCH_EXECUTOR_CHECKPOINT_STORE_H

#include "agentorch/common/types.h"
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentorch {

// Data snapshots written by CheckpointAgent nodes, scoped to one execution.
// Oldest snapshots are evicted first (FIFO) once the count or size limit is hit.
class CheckpointStore {
public:
    explicit CheckpointStore(size_t max_count = 10, size_t max_size_kb = 512);

    // Returns false if the snapshot alone exceeds the size limit.
    bool save(const std::string& key, const Value& data);

    std::optional<Value> get(const std::string& key) const;

    // Keys in insertion order
    std::vector<std::string> keys() const;

    size_t size() const;

    void set_limits(size_t max_count, size_t max_size_kb);

private:
    void enforce_budget(); // 调用方持有锁

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Value> snapshots_;
    std::vector<std::string> order_;
    size_t max_count_;
    size_t max_size_kb_;
    size_t total_size_kb_ = 0;
};

} // namespace agentorch

#endif // AGENTORCH_EXECUTOR_CHECKPOINT_STORE_H
