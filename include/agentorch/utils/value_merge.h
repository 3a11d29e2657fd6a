#ifndef AGENTORCH_UTILS_VALUE_MERGE_H
#define AGENTORCH_UTILS_VALUE_MERGE_H

#include "agentorch/common/types.h"
#include <string>
#include <unordered_map>

namespace agentorch {

// "error_on_conflict", "last_write_wins", "deep_merge", "array_concat", "array_merge_unique"
using MergeStrategy = std::string;

struct MergePolicy {
    std::unordered_map<std::string, MergeStrategy> field_policies; // exact path or "prefix.*"
    MergeStrategy default_strategy = "deep_merge";
};

bool is_known_merge_strategy(const MergeStrategy& strategy);

// Merges `source` into `target`. Object fields recurse; arrays and scalars follow the
// strategy resolved for their dotted path. Throws std::runtime_error on conflicts
// under "error_on_conflict" and on unknown strategy names.
void merge_values(Value& target, const Value& source, const MergePolicy& policy = {});

// Object view of a value: objects as-is, null as {}, anything else as {"input": value}.
Value as_object(const Value& value);

} // namespace agentorch

#endif // AGENTORCH_UTILS_VALUE_MERGE_H
