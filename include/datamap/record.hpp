#pragma once

/**
 * @file record.hpp
 * @brief A single identified entry with ordered fields and translated names
 *
 * A Record owns an insertion-ordered FieldMap. One field, `name`, maps
 * language codes to display strings and must always be present.
 *
 * Records are only created by Store and stay at a fixed address inside it;
 * they cannot be copied, moved or swapped. The `name` field is read-only
 * through Record; translations change through Store::setName()/removeName() so the
 * store's (language, name) index never goes stale. All other fields are
 * freely mutable through the reference the store hands out.
 *
 * Not thread-safe.
 */

#include "datamap/field_map.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace datamap {

class Store;

using RecordId = uint32_t;

/// Field holding the language code -> display string mapping
inline constexpr std::string_view NAME_FIELD = "name";

/// Check that raw fields carry a usable `name` mapping.
/// Throws MissingField if absent, InvalidField if not a string map.
void validateNameField(const FieldMap& fields);

class Record {
public:
    /// Construction token. Only Store can make one.
    class Key {
        friend class Store;
        Key() = default;
    };

    /// `fields` must already pass validateNameField()
    Record(Key, RecordId id, FieldMap fields);
    ~Record() = default;

    Record(const Record&) = delete;
    Record& operator=(const Record&) = delete;
    Record(Record&&) = delete;
    Record& operator=(Record&&) = delete;

    [[nodiscard]] RecordId id() const { return id_; }

    // ========================================================================
    // Field access
    // ========================================================================

    /// Throws KeyNotFound if the field is absent
    [[nodiscard]] const DataValue& get(std::string_view field) const;

    /// Mutable access to a payload field. Throws KeyNotFound if absent,
    /// InvalidField for `name`.
    [[nodiscard]] DataValue& getMutable(std::string_view field);

    [[nodiscard]] bool contains(std::string_view field) const { return fields_.has(field); }

    /// Insert or overwrite. New fields are appended.
    void set(std::string_view field, DataValue value);

    template<typename T>
    void set(std::string_view field, T value) {
        set(field, detail::toDataValue<T>(std::move(value)));
    }

    /// Set a field and place it immediately after `afterField`.
    /// Fields that followed the anchor keep their relative order behind it.
    /// With a missing anchor (or anchor == field) this is a plain set().
    void setAfter(std::string_view field, DataValue value, std::string_view afterField);

    template<typename T>
    void setAfter(std::string_view field, T value, std::string_view afterField) {
        setAfter(field, detail::toDataValue<T>(std::move(value)), afterField);
    }

    /// Throws KeyNotFound if absent, InvalidField for `name`
    void remove(std::string_view field);

    /// Field names in order
    [[nodiscard]] std::vector<std::string> fieldNames() const { return fields_.keys(); }
    [[nodiscard]] size_t fieldCount() const { return fields_.size(); }

    [[nodiscard]] const FieldMap& fields() const { return fields_; }
    [[nodiscard]] FieldMap::const_iterator begin() const { return fields_.begin(); }
    [[nodiscard]] FieldMap::const_iterator end() const { return fields_.end(); }

    // ========================================================================
    // Names
    // ========================================================================

    /// Name in one language. Throws KeyNotFound if this record has none.
    [[nodiscard]] const std::string& name(std::string_view languageCode) const;

    [[nodiscard]] bool hasName(std::string_view languageCode) const;

    /// All (language, name) pairs in stored order
    [[nodiscard]] std::vector<std::pair<std::string_view, std::string_view>> names() const;

private:
    friend class Store;

    [[nodiscard]] const FieldMap& nameMap() const;
    [[nodiscard]] FieldMap& nameMap();

    // Store-only: keep the reverse index in step
    void setName(std::string_view languageCode, std::string_view name);
    bool removeName(std::string_view languageCode);

    RecordId id_;
    FieldMap fields_;
};

}  // namespace datamap
