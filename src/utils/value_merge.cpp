// src/utils/value_merge.cpp
#include "agentorch/utils/value_merge.h"
#include <algorithm>
#include <stdexcept>

namespace agentorch {

namespace {

MergeStrategy strategy_for_path(const std::string& path, const MergePolicy& policy) {
    auto exact_it = policy.field_policies.find(path);
    if (exact_it != policy.field_policies.end()) {
        return exact_it->second;
    }
    // "results.*" matches "results.items"
    for (const auto& [pattern, strategy] : policy.field_policies) {
        if (!pattern.empty() && pattern.back() == '*') {
            std::string prefix = pattern.substr(0, pattern.length() - 1);
            if (path.starts_with(prefix)) {
                return strategy;
            }
        }
    }
    return policy.default_strategy;
}

void merge_array(Value& target_arr, const Value& source_arr, const MergeStrategy& strategy) {
    if (strategy == "array_concat") {
        if (!target_arr.is_array()) target_arr = Value::array();
        for (const auto& item : source_arr) {
            target_arr.push_back(item);
        }
    } else if (strategy == "array_merge_unique") {
        if (!target_arr.is_array()) target_arr = Value::array();
        for (const auto& item : source_arr) {
            if (std::find(target_arr.begin(), target_arr.end(), item) == target_arr.end()) {
                target_arr.push_back(item);
            }
        }
    } else if (strategy == "deep_merge" || strategy == "last_write_wins") {
        target_arr = source_arr;
    } else if (strategy == "error_on_conflict") {
        if (target_arr != source_arr) {
            throw std::runtime_error("Merge conflict for array field: " + target_arr.dump() + " vs " + source_arr.dump());
        }
    } else {
        throw std::runtime_error("Unknown merge strategy: " + strategy);
    }
}

void merge_scalar(Value& target_val, const Value& source_val, const MergeStrategy& strategy) {
    if (strategy == "error_on_conflict") {
        if (target_val != source_val) {
            throw std::runtime_error("Merge conflict for scalar field: " + target_val.dump() + " vs " + source_val.dump());
        }
        return;
    }
    if (!is_known_merge_strategy(strategy)) {
        throw std::runtime_error("Unknown merge strategy: " + strategy);
    }
    target_val = source_val;
}

void merge_recursive(Value& target, const Value& source, const std::string& path_prefix, const MergePolicy& policy) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        const std::string current_path = path_prefix.empty() ? it.key() : path_prefix + "." + it.key();

        auto target_it = target.find(it.key());
        if (target_it == target.end()) {
            target[it.key()] = it.value();
            continue;
        }

        const MergeStrategy strategy = strategy_for_path(current_path, policy);
        if (target_it.value().is_object() && it.value().is_object()) {
            merge_recursive(target_it.value(), it.value(), current_path, policy);
        } else if (target_it.value().is_array() && it.value().is_array()) {
            merge_array(target_it.value(), it.value(), strategy);
        } else {
            merge_scalar(target_it.value(), it.value(), strategy);
        }
    }
}

} // namespace

bool is_known_merge_strategy(const MergeStrategy& strategy) {
    return strategy == "error_on_conflict" || strategy == "last_write_wins" ||
           strategy == "deep_merge" || strategy == "array_concat" ||
           strategy == "array_merge_unique";
}

void merge_values(Value& target, const Value& source, const MergePolicy& policy) {
    if (target.is_null()) {
        target = Value::object();
    }
    if (!target.is_object() || !source.is_object()) {
        if (source.is_array() && target.is_array()) {
            merge_array(target, source, policy.default_strategy);
        } else {
            merge_scalar(target, source, policy.default_strategy);
        }
        return;
    }
    merge_recursive(target, source, "", policy);
}

Value as_object(const Value& value) {
    if (value.is_object()) {
        return value;
    }
    Value wrapped = Value::object();
    if (!value.is_null()) {
        wrapped["input"] = value;
    }
    return wrapped;
}

} // namespace agentorch
