#include "tickflow/parameters/parameter_store.hpp"
#include <rfl.hpp>
#include <rfl/json.hpp>
#include <iostream>
#include <optional>
#include <type_traits>

namespace tickflow {

namespace {

bool as_number(const rfl::Generic& node, double& out) {
    return std::visit([&out](const auto& value) -> bool {
        using V = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<V, bool>) {
            return false;
        } else if constexpr (std::is_integral_v<V> || std::is_floating_point_v<V>) {
            out = static_cast<double>(value);
            return true;
        } else {
            return false;
        }
    }, node.variant());
}

bool flatten(const rfl::Generic& node, const std::string& path, ParameterLeaves& leaves) {
    return std::visit([&](const auto& value) -> bool {
        using V = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<V, rfl::Generic::Object>) {
            for (const auto& [key, child] : value) {
                if (key.empty() || key.find('.') != std::string::npos) {
                    std::cerr << "[ParameterStore] invalid key '" << key << "' below '" << path << "'\n";
                    return false;
                }
                if (!flatten(child, path.empty() ? key : path + "." + key, leaves)) {
                    return false;
                }
            }
            return true;
        } else if (path.empty()) {
            // Only objects may sit at the root
            return false;
        } else if constexpr (std::is_same_v<V, bool>) {
            leaves.emplace(path, value);
            return true;
        } else if constexpr (std::is_integral_v<V>) {
            leaves.emplace(path, static_cast<int64_t>(value));
            return true;
        } else if constexpr (std::is_floating_point_v<V>) {
            leaves.emplace(path, static_cast<double>(value));
            return true;
        } else if constexpr (std::is_same_v<V, std::string>) {
            leaves.emplace(path, value);
            return true;
        } else if constexpr (std::is_same_v<V, std::nullopt_t>) {
            leaves.emplace(path, std::monostate{});
            return true;
        } else if constexpr (std::is_same_v<V, rfl::Generic::Array>) {
            std::vector<double> list;
            list.reserve(value.size());
            for (const auto& element : value) {
                double number = 0.0;
                if (!as_number(element, number)) {
                    std::cerr << "[ParameterStore] '" << path << "' must be a list of numbers\n";
                    return false;
                }
                list.push_back(number);
            }
            leaves.emplace(path, std::move(list));
            return true;
        } else {
            std::cerr << "[ParameterStore] '" << path << "' has an unsupported value\n";
            return false;
        }
    }, node.variant());
}

std::shared_ptr<const NullablePaths> null_leaves(const ParameterLeaves& leaves) {
    auto nullable = std::make_shared<NullablePaths>();
    for (const auto& [path, value] : leaves) {
        if (kind_of(value) == ParameterKind::Null) {
            nullable->insert(path);
        }
    }
    return nullable;
}

bool has_prefix(std::string_view path, std::string_view prefix) {
    return path.size() > prefix.size() &&
           path.substr(0, prefix.size()) == prefix &&
           path[prefix.size()] == '.';
}

} // namespace

// ============================================================================
// ParameterSnapshot
// ============================================================================

bool ParameterSnapshot::contains_subtree(std::string_view path) const {
    if (path.empty()) {
        return !leaves_.empty();
    }
    auto it = leaves_.lower_bound(path);
    for (; it != leaves_.end() && it->first.compare(0, path.size(), path) == 0; ++it) {
        if (has_prefix(it->first, path)) {
            return true;
        }
    }
    return false;
}

std::vector<std::pair<std::string, ParameterValue>> ParameterSnapshot::subtree(std::string_view path) const {
    std::vector<std::pair<std::string, ParameterValue>> result;
    if (path.empty()) {
        result.assign(leaves_.begin(), leaves_.end());
        return result;
    }
    if (const ParameterValue* leaf = find(path)) {
        result.emplace_back(std::string(path), *leaf);
        return result;
    }
    auto it = leaves_.lower_bound(path);
    for (; it != leaves_.end() && it->first.compare(0, path.size(), path) == 0; ++it) {
        if (has_prefix(it->first, path)) {
            result.emplace_back(it->first, it->second);
        }
    }
    return result;
}

// ============================================================================
// ParameterStore
// ============================================================================

ParameterStore::ParameterStore()
    : ParameterStore(ParameterLeaves{}) {
}

ParameterStore::ParameterStore(ParameterLeaves initial)
    : nullable_(null_leaves(initial))
    , current_(std::make_shared<const ParameterSnapshot>(std::move(initial), 0, nullable_)) {
}

ParameterResult<std::shared_ptr<ParameterStore>> ParameterStore::from_json(std::string_view json) {
    auto document = rfl::json::read<rfl::Generic>(std::string(json));
    if (!document) {
        std::cerr << "[ParameterStore] parameter document is not valid JSON\n";
        return ParameterError::InvalidDocument;
    }
    
    ParameterLeaves leaves;
    if (!flatten(document.value(), "", leaves)) {
        return ParameterError::InvalidDocument;
    }
    return std::make_shared<ParameterStore>(std::move(leaves));
}

ParameterResult<ParameterReading> ParameterStore::read(std::string_view path) const {
    auto current = snapshot();
    const ParameterValue* value = current->find(path);
    if (!value) {
        return ParameterError::UnknownPath;
    }
    return ParameterReading{*value, current->generation()};
}

ParameterResult<std::vector<std::pair<std::string, ParameterReading>>>
ParameterStore::read_subtree(std::string_view path) const {
    auto current = snapshot();
    auto leaves = current->subtree(path);
    if (leaves.empty()) {
        return ParameterError::UnknownPath;
    }
    
    std::vector<std::pair<std::string, ParameterReading>> readings;
    readings.reserve(leaves.size());
    for (auto& [leaf_path, value] : leaves) {
        readings.emplace_back(std::move(leaf_path), ParameterReading{std::move(value), current->generation()});
    }
    return readings;
}

ParameterResult<uint64_t> ParameterStore::write(std::string_view path, ParameterValue value) {
    return write(Batch{{std::string(path), std::move(value)}});
}

ParameterResult<uint64_t> ParameterStore::write(const Batch& batch) {
    if (batch.empty()) {
        return ParameterError::EmptyBatch;
    }
    
    uint64_t generation = 0;
    std::vector<std::string> changed;
    std::vector<ChangeCallback> callbacks;
    {
        Lock lock(write_mutex_);
        auto current = snapshot();
        
        // Validate everything before touching the tree
        ParameterLeaves next = current->leaves();
        changed.reserve(batch.size());
        for (const auto& [path, value] : batch) {
            auto it = next.find(path);
            if (it == next.end()) {
                std::cerr << "[ParameterStore] write rejected: unknown path '" << path << "'\n";
                return ParameterError::UnknownPath;
            }
            auto coerced = coerce(it->second, value, nullable_->contains(path));
            if (!coerced) {
                std::cerr << "[ParameterStore] write rejected: '" << path << "' expects "
                          << to_string(kind_of(it->second)) << ", got " << to_string(kind_of(value)) << "\n";
                return coerced.error();
            }
            it->second = std::move(coerced.value());
            changed.push_back(path);
        }
        
        generation = current->generation() + 1;
        current_.store(std::make_shared<const ParameterSnapshot>(std::move(next), generation, nullable_),
                       std::memory_order_release);
        callbacks = callbacks_;
    }
    
    for (const auto& callback : callbacks) {
        callback(generation, changed);
    }
    return generation;
}

void ParameterStore::on_change(ChangeCallback callback) {
    Lock lock(write_mutex_);
    callbacks_.push_back(std::move(callback));
}

ParameterResult<ParameterValue> ParameterStore::coerce(const ParameterValue& current, ParameterValue value,
                                                       bool nullable) {
    if (nullable || kind_of(current) == kind_of(value)) {
        return value;
    }
    if (kind_of(current) == ParameterKind::Double && kind_of(value) == ParameterKind::Integer) {
        return ParameterValue{static_cast<double>(std::get<int64_t>(value))};
    }
    return ParameterError::TypeMismatch;
}

} // namespace tickflow
