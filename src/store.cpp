#include "datamap/store.hpp"
#include "datamap/name_view.hpp"
#include "datamap/errors.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <limits>
#include <stdexcept>

namespace datamap {

namespace {

std::string describeName(std::string_view languageCode, std::string_view name) {
    return "('" + std::string(languageCode) + "', '" + std::string(name) + "')";
}

}  // namespace

Store::Store(StoreOptions options)
    : options_(options)
    , nextId_(options.firstId)
    , highestId_(options.firstId > 0 ? options.firstId - 1 : 0) {
    if (options.firstId == 0) {
        throw std::invalid_argument("StoreOptions::firstId must be at least 1");
    }
}

Store::Store(InitialEntries initial, StoreOptions options)
    : Store(options) {
    for (auto& [id, fields] : initial) {
        addWithId(id, std::move(fields));
    }
}

// ============================================================================
// Name lookup
// ============================================================================

std::optional<RecordId> Store::idOf(std::string_view languageCode, std::string_view name) const {
    auto it = reverseIndex_.find(NameKey{std::string(languageCode), std::string(name)});
    if (it == reverseIndex_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const Record* Store::entryOf(std::string_view languageCode, std::string_view name) const {
    auto id = idOf(languageCode, name);
    if (!id) {
        return nullptr;
    }
    return find(*id);
}

Record* Store::entryOf(std::string_view languageCode, std::string_view name) {
    auto id = idOf(languageCode, name);
    if (!id) {
        return nullptr;
    }
    return find(*id);
}

NameView Store::names(std::string_view languageCode) const {
    return NameView(*this, languageCode);
}

// ============================================================================
// Insertion
// ============================================================================

Record& Store::addWithId(RecordId id, FieldMap rawFields) {
    if (index_.contains(id)) {
        throw DuplicateKey("An entry with id " + std::to_string(id) + " already exists");
    }

    validateNameField(rawFields);
    checkNameCollisions(id, *rawFields.getMap(NAME_FIELD));

    records_.emplace_back(Record::Key{}, id, std::move(rawFields));
    auto it = std::prev(records_.end());
    index_.emplace(id, it);

    for (const auto& [languageCode, name] : it->names()) {
        claimName(std::string(languageCode), std::string(name), id);
    }

    if (id > highestId_) {
        highestId_ = id;
        nextId_ = std::max<uint64_t>(nextId_, static_cast<uint64_t>(id) + 1);
    }

    return *it;
}

Record& Store::insert(FieldMap rawFields) {
    if (nextId_ > std::numeric_limits<RecordId>::max()) {
        throw std::overflow_error("Store identifier space exhausted");
    }

    auto id = static_cast<RecordId>(nextId_);
    ++nextId_;
    return addWithId(id, std::move(rawFields));
}

void Store::extend(std::vector<FieldMap> entries) {
    for (auto& entry : entries) {
        insert(std::move(entry));
    }
}

// ============================================================================
// Store-mediated mutation
// ============================================================================

void Store::setName(RecordId id, std::string_view languageCode, std::string_view name) {
    Record& record = at(id);

    auto it = reverseIndex_.find(NameKey{std::string(languageCode), std::string(name)});
    if (it != reverseIndex_.end() && it->second != id &&
        options_.nameCollision == NameCollisionPolicy::Reject) {
        throw DuplicateKey("Name " + describeName(languageCode, name) +
                           " already belongs to entry " + std::to_string(it->second));
    }

    if (record.hasName(languageCode)) {
        releaseName(languageCode, record.name(languageCode), id);
    }

    record.setName(languageCode, name);
    claimName(std::string(languageCode), std::string(name), id);
}

void Store::removeName(RecordId id, std::string_view languageCode) {
    Record& record = at(id);
    if (!record.hasName(languageCode)) {
        throw KeyNotFound("Entry " + std::to_string(id) + " has no name in language '" +
                          std::string(languageCode) + "'");
    }

    releaseName(languageCode, record.name(languageCode), id);
    record.removeName(languageCode);
}

void Store::erase(RecordId id) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw KeyNotFound("No entry with id " + std::to_string(id));
    }

    auto node = it->second;
    for (const auto& [languageCode, name] : node->names()) {
        releaseName(languageCode, name, id);
    }

    index_.erase(it);
    records_.erase(node);
}

// ============================================================================
// Id lookup
// ============================================================================

Record& Store::at(RecordId id) {
    if (auto* record = find(id)) {
        return *record;
    }
    throw KeyNotFound("No entry with id " + std::to_string(id));
}

const Record& Store::at(RecordId id) const {
    if (auto* record = find(id)) {
        return *record;
    }
    throw KeyNotFound("No entry with id " + std::to_string(id));
}

Record* Store::find(RecordId id) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return nullptr;
    }
    return &*it->second;
}

const Record* Store::find(RecordId id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return nullptr;
    }
    return &*it->second;
}

std::vector<RecordId> Store::ids() const {
    std::vector<RecordId> result;
    result.reserve(records_.size());
    for (const auto& record : records_) {
        result.push_back(record.id());
    }
    return result;
}

// ============================================================================
// Reverse index maintenance
// ============================================================================

void Store::checkNameCollisions(RecordId id, const FieldMap& nameMap) const {
    if (options_.nameCollision != NameCollisionPolicy::Reject) {
        return;
    }

    for (const auto& entry : nameMap) {
        const auto& name = std::get<std::string>(entry.value);
        auto it = reverseIndex_.find(NameKey{entry.key, name});
        if (it != reverseIndex_.end() && it->second != id) {
            throw DuplicateKey("Name " + describeName(entry.key, name) +
                               " already belongs to entry " + std::to_string(it->second));
        }
    }
}

void Store::claimName(std::string languageCode, std::string name, RecordId id) {
    auto [it, inserted] = reverseIndex_.try_emplace(NameKey{std::move(languageCode), std::move(name)}, id);
    if (!inserted && it->second != id) {
        std::cerr << "[Store] Name " << describeName(it->first.languageCode, it->first.name)
                  << " reassigned from entry " << it->second << " to entry " << id << "\n";
        it->second = id;
    }
}

void Store::releaseName(std::string_view languageCode, std::string_view name, RecordId id) {
    auto it = reverseIndex_.find(NameKey{std::string(languageCode), std::string(name)});
    // Under the Overwrite policy the pair may belong to a newer record
    if (it == reverseIndex_.end() || it->second != id) {
        return;
    }

    if (options_.nameCollision == NameCollisionPolicy::Overwrite) {
        for (auto rit = records_.rbegin(); rit != records_.rend(); ++rit) {
            if (rit->id() == id || !rit->hasName(languageCode)) {
                continue;
            }
            if (rit->name(languageCode) == name) {
                it->second = rit->id();
                return;
            }
        }
    }

    reverseIndex_.erase(it);
}

}  // namespace datamap
