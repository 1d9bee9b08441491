#pragma once

/**
 * @file store.hpp
 * @brief Insertion-ordered record store with a (language, name) reverse index
 *
 * Records are kept in insertion order regardless of identifier value.
 * Every (language, name) pair found in a record's `name` field is indexed
 * so records can be found by any translation of their name.
 *
 * Identifier generation:
 * - insert() takes the next candidate id and advances it by one
 * - addWithId() with an id above everything assigned so far pushes the
 *   candidate past it, so generated ids never collide with explicit ones
 *
 * Each mutating call updates records, index and generator state as one
 * unit; a call that throws leaves the store unchanged (except that
 * insert() consumes its candidate id).
 *
 * Not thread-safe. Callers serialize access.
 */

#include "datamap/record.hpp"

#include <cstdint>
#include <functional>
#include <list>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace datamap {

class NameView;

/// Reverse index key
struct NameKey {
    std::string languageCode;
    std::string name;

    bool operator==(const NameKey&) const = default;
};

/// What happens when a (language, name) pair is already claimed by another record
enum class NameCollisionPolicy : uint8_t {
    Reject,     ///< Throw DuplicateKey, store unchanged
    Overwrite   ///< Point the pair at the newer record and log a warning.
                ///< Releasing it falls back to the newest remaining holder.
};

struct StoreOptions {
    NameCollisionPolicy nameCollision = NameCollisionPolicy::Reject;
    RecordId firstId = 1;   ///< First generated id; must be >= 1
};

}  // namespace datamap

template<>
struct std::hash<datamap::NameKey> {
    size_t operator()(const datamap::NameKey& key) const noexcept {
        size_t h = std::hash<std::string>{}(key.languageCode);
        return h ^ (std::hash<std::string>{}(key.name) + 0x9e3779b9 + (h << 6) + (h >> 2));
    }
};

namespace datamap {

class Store {
public:
    using InitialEntries = std::vector<std::pair<RecordId, FieldMap>>;
    using iterator = std::list<Record>::iterator;
    using const_iterator = std::list<Record>::const_iterator;

    explicit Store(StoreOptions options = {});

    /// Pre-populate through the same path as addWithId(), in order
    explicit Store(InitialEntries initial, StoreOptions options = {});

    Store(Store&&) = default;
    Store& operator=(Store&&) = default;
    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    // ========================================================================
    // Name lookup
    // ========================================================================

    /// Id of the record named `name` in `languageCode`, or nullopt
    [[nodiscard]] std::optional<RecordId> idOf(std::string_view languageCode,
                                               std::string_view name) const;

    /// Record named `name` in `languageCode`, or nullptr
    [[nodiscard]] const Record* entryOf(std::string_view languageCode, std::string_view name) const;
    [[nodiscard]] Record* entryOf(std::string_view languageCode, std::string_view name);

    /// Lazy view over every record's name in one language (see name_view.hpp,
    /// included at the end of this header)
    [[nodiscard]] NameView names(std::string_view languageCode) const;

    // ========================================================================
    // Insertion
    // ========================================================================

    /// Add a record with an explicit id.
    /// Throws DuplicateKey (id or name taken), MissingField, InvalidField.
    Record& addWithId(RecordId id, FieldMap rawFields);

    /// Add a record with the next generated id.
    /// The candidate id is consumed even if the insert throws.
    Record& insert(FieldMap rawFields);

    /// insert() each entry in order. Not atomic: entries before a failing
    /// one stay committed.
    void extend(std::vector<FieldMap> entries);

    // ========================================================================
    // Store-mediated mutation
    // ========================================================================

    /// Set or replace one translation of a record's name.
    /// Throws KeyNotFound (id), DuplicateKey (pair taken, Reject policy).
    void setName(RecordId id, std::string_view languageCode, std::string_view name);

    /// Remove one translation. Throws KeyNotFound if id or language is absent.
    void removeName(RecordId id, std::string_view languageCode);

    /// Remove a record and its index entries. Throws KeyNotFound if absent.
    void erase(RecordId id);

    // ========================================================================
    // Id lookup
    // ========================================================================

    /// Throws KeyNotFound if absent
    [[nodiscard]] Record& at(RecordId id);
    [[nodiscard]] const Record& at(RecordId id) const;
    [[nodiscard]] Record& operator[](RecordId id) { return at(id); }
    [[nodiscard]] const Record& operator[](RecordId id) const { return at(id); }

    /// nullptr if absent
    [[nodiscard]] Record* find(RecordId id);
    [[nodiscard]] const Record* find(RecordId id) const;

    [[nodiscard]] bool contains(RecordId id) const { return index_.contains(id); }

    // ========================================================================
    // Container operations
    // ========================================================================

    [[nodiscard]] size_t size() const { return records_.size(); }
    [[nodiscard]] bool empty() const { return records_.empty(); }

    /// Identifiers in insertion order
    [[nodiscard]] std::vector<RecordId> ids() const;

    [[nodiscard]] iterator begin() { return records_.begin(); }
    [[nodiscard]] iterator end() { return records_.end(); }
    [[nodiscard]] const_iterator begin() const { return records_.begin(); }
    [[nodiscard]] const_iterator end() const { return records_.end(); }

    // ========================================================================
    // Generator state
    // ========================================================================

    /// Id the next insert() will try
    [[nodiscard]] uint64_t nextId() const { return nextId_; }

    /// Highest id reserved so far (firstId - 1 for a fresh store)
    [[nodiscard]] uint64_t highestId() const { return highestId_; }

    [[nodiscard]] const StoreOptions& options() const { return options_; }

private:
    // Throws DuplicateKey under the Reject policy if any name in `nameMap`
    // belongs to another id. Mutates nothing.
    void checkNameCollisions(RecordId id, const FieldMap& nameMap) const;

    // Point (languageCode, name) at id, logging any overwrite
    void claimName(std::string languageCode, std::string name, RecordId id);

    // Drop (languageCode, name) if it still points at id. Under Overwrite the
    // pair moves to the newest other record that still carries it.
    void releaseName(std::string_view languageCode, std::string_view name, RecordId id);

    std::list<Record> records_;
    std::unordered_map<RecordId, std::list<Record>::iterator> index_;
    std::unordered_map<NameKey, RecordId> reverseIndex_;

    StoreOptions options_;
    uint64_t nextId_;
    uint64_t highestId_;
};

}  // namespace datamap

// Store::names() returns a NameView by value
#include "datamap/name_view.hpp"
