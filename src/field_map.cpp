#include "datamap/field_map.hpp"
#include "datamap/errors.hpp"

#include <iterator>

namespace datamap {

// ============================================================================
// Value helpers
// ============================================================================

DataValue cloneValue(const DataValue& value) {
    return std::visit([](const auto& v) -> DataValue {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, std::unique_ptr<FieldMap>>) {
            // Deep copy nested mapping
            if (v) {
                return v->clone();
            }
            return std::unique_ptr<FieldMap>{};
        } else if constexpr (std::is_same_v<T, std::unique_ptr<ValueList>>) {
            if (v) {
                return v->clone();
            }
            return std::unique_ptr<ValueList>{};
        } else {
            // Copy scalars
            return v;
        }
    }, value);
}

bool valuesEqual(const DataValue& a, const DataValue& b) {
    if (a.index() != b.index()) {
        return false;
    }

    return std::visit([&b](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(b);

        if constexpr (std::is_same_v<T, std::unique_ptr<FieldMap>> ||
                      std::is_same_v<T, std::unique_ptr<ValueList>>) {
            if (!lhs || !rhs) {
                return !lhs && !rhs;
            }
            return *lhs == *rhs;
        } else {
            return lhs == rhs;
        }
    }, a);
}

std::string_view typeName(const DataValue& value) {
    switch (value.index()) {
        case 0: return "null";
        case 1: return "bool";
        case 2: return "int";
        case 3: return "double";
        case 4: return "string";
        case 5: return "map";
        case 6: return "list";
        default: return "unknown";
    }
}

// ============================================================================
// FieldMap
// ============================================================================

std::unique_ptr<FieldMap> FieldMap::clone() const {
    auto result = std::make_unique<FieldMap>();

    for (const auto& entry : entries_) {
        result->set(entry.key, cloneValue(entry.value));
    }

    return result;
}

const DataValue& FieldMap::get(std::string_view key) const {
    if (auto* value = find(key)) {
        return *value;
    }
    throw KeyNotFound("No field named '" + std::string(key) + "'");
}

DataValue& FieldMap::get(std::string_view key) {
    if (auto* value = find(key)) {
        return *value;
    }
    throw KeyNotFound("No field named '" + std::string(key) + "'");
}

const DataValue* FieldMap::find(std::string_view key) const {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return nullptr;
    }
    return &it->second->value;
}

DataValue* FieldMap::find(std::string_view key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return nullptr;
    }
    return &it->second->value;
}

bool FieldMap::has(std::string_view key) const {
    return index_.contains(key);
}

const std::string* FieldMap::getString(std::string_view key) const {
    auto* value = find(key);
    if (!value) return nullptr;
    return std::get_if<std::string>(value);
}

const FieldMap* FieldMap::getMap(std::string_view key) const {
    auto* value = find(key);
    if (!value) return nullptr;
    auto* ptr = std::get_if<std::unique_ptr<FieldMap>>(value);
    if (!ptr || !*ptr) return nullptr;
    return ptr->get();
}

FieldMap* FieldMap::getMap(std::string_view key) {
    auto* value = find(key);
    if (!value) return nullptr;
    auto* ptr = std::get_if<std::unique_ptr<FieldMap>>(value);
    if (!ptr || !*ptr) return nullptr;
    return ptr->get();
}

const ValueList* FieldMap::getList(std::string_view key) const {
    auto* value = find(key);
    if (!value) return nullptr;
    auto* ptr = std::get_if<std::unique_ptr<ValueList>>(value);
    if (!ptr || !*ptr) return nullptr;
    return ptr->get();
}

void FieldMap::set(std::string_view key, DataValue value) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        // Existing key keeps its position
        it->second->value = std::move(value);
        return;
    }

    entries_.push_back(Entry{std::string(key), std::move(value)});
    auto last = std::prev(entries_.end());
    // Index keys view the string owned by the list node
    index_.emplace(std::string_view(last->key), last);
}

bool FieldMap::remove(std::string_view key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return false;
    }

    auto node = it->second;
    index_.erase(it);
    entries_.erase(node);
    return true;
}

bool FieldMap::moveToEnd(std::string_view key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return false;
    }

    // splice relinks the node, so the index iterator stays valid
    entries_.splice(entries_.end(), entries_, it->second);
    return true;
}

void FieldMap::clear() {
    index_.clear();
    entries_.clear();
}

std::vector<std::string> FieldMap::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.key);
    }
    return result;
}

bool FieldMap::operator==(const FieldMap& other) const {
    if (entries_.size() != other.entries_.size()) {
        return false;
    }

    auto lhs = entries_.begin();
    auto rhs = other.entries_.begin();
    for (; lhs != entries_.end(); ++lhs, ++rhs) {
        if (lhs->key != rhs->key || !valuesEqual(lhs->value, rhs->value)) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// ValueList
// ============================================================================

std::unique_ptr<ValueList> ValueList::clone() const {
    auto result = std::make_unique<ValueList>();
    result->items_.reserve(items_.size());

    for (const auto& item : items_) {
        result->items_.push_back(cloneValue(item));
    }

    return result;
}

bool ValueList::operator==(const ValueList& other) const {
    if (items_.size() != other.items_.size()) {
        return false;
    }
    for (size_t i = 0; i < items_.size(); ++i) {
        if (!valuesEqual(items_[i], other.items_[i])) {
            return false;
        }
    }
    return true;
}

}  // namespace datamap
