#include "datamap/record.hpp"
#include "datamap/errors.hpp"

namespace datamap {

namespace {

void rejectNameMutation(std::string_view field, const char* operation) {
    if (field == NAME_FIELD) {
        throw InvalidField(std::string("Cannot ") + operation +
                           " the name field directly; use Store::setName/removeName");
    }
}

}  // namespace

void validateNameField(const FieldMap& fields) {
    const DataValue* value = fields.find(NAME_FIELD);
    if (!value) {
        throw MissingField("An entry is missing a name value");
    }

    const FieldMap* names = fields.getMap(NAME_FIELD);
    if (!names) {
        throw InvalidField("The name field must be a map of language code to name, got " +
                           std::string(typeName(*value)));
    }

    for (const auto& entry : *names) {
        if (!std::holds_alternative<std::string>(entry.value)) {
            throw InvalidField("Name for language '" + entry.key + "' must be a string, got " +
                               std::string(typeName(entry.value)));
        }
    }
}

Record::Record(Key, RecordId id, FieldMap fields)
    : id_(id), fields_(std::move(fields)) {}

// ============================================================================
// Field access
// ============================================================================

const DataValue& Record::get(std::string_view field) const {
    return fields_.get(field);
}

DataValue& Record::getMutable(std::string_view field) {
    rejectNameMutation(field, "modify");
    return fields_.get(field);
}

void Record::set(std::string_view field, DataValue value) {
    rejectNameMutation(field, "set");
    fields_.set(field, std::move(value));
}

void Record::setAfter(std::string_view field, DataValue value, std::string_view afterField) {
    rejectNameMutation(field, "set");

    if (field == afterField || !fields_.has(afterField)) {
        fields_.set(field, std::move(value));
        return;
    }

    // Snapshot the fields behind the anchor before touching the target
    std::vector<std::string> keysToMove;
    bool foundAnchor = false;
    for (const auto& entry : fields_) {
        if (foundAnchor) {
            if (entry.key != field) {
                keysToMove.push_back(entry.key);
            }
        } else if (entry.key == afterField) {
            foundAnchor = true;
        }
    }

    fields_.set(field, std::move(value));
    fields_.moveToEnd(field);

    for (const auto& key : keysToMove) {
        fields_.moveToEnd(key);
    }
}

void Record::remove(std::string_view field) {
    rejectNameMutation(field, "remove");
    if (!fields_.remove(field)) {
        throw KeyNotFound("No field named '" + std::string(field) + "' in entry " +
                          std::to_string(id_));
    }
}

// ============================================================================
// Names
// ============================================================================

const FieldMap& Record::nameMap() const {
    // Checked by Store before construction
    return *fields_.getMap(NAME_FIELD);
}

FieldMap& Record::nameMap() {
    return *fields_.getMap(NAME_FIELD);
}

const std::string& Record::name(std::string_view languageCode) const {
    if (auto* name = nameMap().getString(languageCode)) {
        return *name;
    }
    throw KeyNotFound("Entry " + std::to_string(id_) + " has no name in language '" +
                      std::string(languageCode) + "'");
}

bool Record::hasName(std::string_view languageCode) const {
    return nameMap().has(languageCode);
}

std::vector<std::pair<std::string_view, std::string_view>> Record::names() const {
    std::vector<std::pair<std::string_view, std::string_view>> result;
    const FieldMap& map = nameMap();
    result.reserve(map.size());
    for (const auto& entry : map) {
        result.emplace_back(entry.key, std::get<std::string>(entry.value));
    }
    return result;
}

void Record::setName(std::string_view languageCode, std::string_view name) {
    nameMap().set(languageCode, std::string(name));
}

bool Record::removeName(std::string_view languageCode) {
    return nameMap().remove(languageCode);
}

}  // namespace datamap
