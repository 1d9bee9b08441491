#pragma once

/**
 * @file field_map.hpp
 * @brief Insertion-ordered string -> value mapping with a closed value variant
 *
 * FieldMap backs raw records, record fields and nested mappings.
 * Entries live in a std::list so reordering never invalidates references,
 * with an unordered_map index for O(1) lookup and move-to-end.
 *
 * Values are move-only (nested maps and lists are owned through unique_ptr).
 * Use cloneValue()/clone() for deep copies.
 */

#include <cstdint>
#include <list>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace datamap {

// Forward declarations for the recursive variant
class FieldMap;
class ValueList;

// Type-safe variant for field values
// - monostate: null/empty value
// - bool: flags
// - int64_t: all integers
// - double: all floats
// - string: text
// - unique_ptr<FieldMap>: nested ordered mapping
// - unique_ptr<ValueList>: sequence of values
using DataValue = std::variant<
    std::monostate,
    bool,
    int64_t,
    double,
    std::string,
    std::unique_ptr<FieldMap>,
    std::unique_ptr<ValueList>
>;

/// Deep copy of a value
[[nodiscard]] DataValue cloneValue(const DataValue& value);

/// Deep structural equality (nested maps compare in order)
[[nodiscard]] bool valuesEqual(const DataValue& a, const DataValue& b);

/// Human-readable type name, for error messages
[[nodiscard]] std::string_view typeName(const DataValue& value);

// ============================================================================
// FieldMap - ordered field name -> value mapping
// ============================================================================

class FieldMap {
public:
    struct Entry {
        std::string key;
        DataValue value;
    };

    using const_iterator = std::list<Entry>::const_iterator;

    FieldMap() = default;
    ~FieldMap() = default;

    // Move-only (values may own nested containers)
    FieldMap(FieldMap&&) = default;
    FieldMap& operator=(FieldMap&&) = default;
    FieldMap(const FieldMap&) = delete;
    FieldMap& operator=(const FieldMap&) = delete;

    /// Deep copy
    [[nodiscard]] std::unique_ptr<FieldMap> clone() const;

    // ========================================================================
    // Access
    // ========================================================================

    /// Get a value. Throws KeyNotFound if absent.
    [[nodiscard]] const DataValue& get(std::string_view key) const;
    [[nodiscard]] DataValue& get(std::string_view key);

    /// Get a value, or nullptr if absent
    [[nodiscard]] const DataValue* find(std::string_view key) const;
    [[nodiscard]] DataValue* find(std::string_view key);

    [[nodiscard]] bool has(std::string_view key) const;

    /// Typed access; nullptr if absent or a different type
    [[nodiscard]] const std::string* getString(std::string_view key) const;
    [[nodiscard]] const FieldMap* getMap(std::string_view key) const;
    [[nodiscard]] FieldMap* getMap(std::string_view key);
    [[nodiscard]] const ValueList* getList(std::string_view key) const;

    // ========================================================================
    // Mutation
    // ========================================================================

    /// Overwrite in place, or append a new entry at the end
    void set(std::string_view key, DataValue value);

    /// Convenience for scalars, strings and nested containers
    template<typename T>
    void set(std::string_view key, T value);

    /// Remove a key. Returns false if it was absent.
    bool remove(std::string_view key);

    /// Move an existing key to the end. Returns false if absent.
    bool moveToEnd(std::string_view key);

    void clear();

    // ========================================================================
    // Container operations
    // ========================================================================

    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

    /// Keys in insertion order
    [[nodiscard]] std::vector<std::string> keys() const;

    [[nodiscard]] const_iterator begin() const { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const { return entries_.end(); }

    /// Order-sensitive deep equality
    bool operator==(const FieldMap& other) const;

private:
    std::list<Entry> entries_;
    std::unordered_map<std::string_view, std::list<Entry>::iterator> index_;
};

// ============================================================================
// ValueList - sequence of values
// ============================================================================

class ValueList {
public:
    ValueList() = default;

    ValueList(ValueList&&) = default;
    ValueList& operator=(ValueList&&) = default;
    ValueList(const ValueList&) = delete;
    ValueList& operator=(const ValueList&) = delete;

    void push(DataValue value) { items_.push_back(std::move(value)); }

    template<typename T>
    void push(T value);

    [[nodiscard]] const DataValue& operator[](size_t index) const { return items_[index]; }
    [[nodiscard]] DataValue& operator[](size_t index) { return items_[index]; }

    [[nodiscard]] size_t size() const { return items_.size(); }
    [[nodiscard]] bool empty() const { return items_.empty(); }

    [[nodiscard]] auto begin() const { return items_.begin(); }
    [[nodiscard]] auto end() const { return items_.end(); }

    [[nodiscard]] std::unique_ptr<ValueList> clone() const;

    bool operator==(const ValueList& other) const;

private:
    std::vector<DataValue> items_;
};

// ============================================================================
// Template implementations
// ============================================================================

namespace detail {

template<typename T>
DataValue toDataValue(T value) {
    if constexpr (std::is_same_v<T, DataValue>) {
        return value;
    } else if constexpr (std::is_same_v<T, bool>) {
        return value;
    } else if constexpr (std::is_integral_v<T>) {
        // All integers stored as int64_t
        return static_cast<int64_t>(value);
    } else if constexpr (std::is_floating_point_v<T>) {
        return static_cast<double>(value);
    } else if constexpr (std::is_same_v<T, std::string>) {
        return value;
    } else if constexpr (std::is_same_v<T, const char*>) {
        return std::string(value);
    } else if constexpr (std::is_same_v<T, std::string_view>) {
        return std::string(value);
    } else if constexpr (std::is_same_v<T, FieldMap>) {
        return std::make_unique<FieldMap>(std::move(value));
    } else if constexpr (std::is_same_v<T, ValueList>) {
        return std::make_unique<ValueList>(std::move(value));
    } else if constexpr (std::is_same_v<T, std::unique_ptr<FieldMap>> ||
                         std::is_same_v<T, std::unique_ptr<ValueList>>) {
        return value;
    } else {
        static_assert(sizeof(T) == 0, "Unsupported type for DataValue");
    }
}

}  // namespace detail

template<typename T>
void FieldMap::set(std::string_view key, T value) {
    set(key, detail::toDataValue<T>(std::move(value)));
}

template<typename T>
void ValueList::push(T value) {
    push(detail::toDataValue<T>(std::move(value)));
}

}  // namespace datamap
