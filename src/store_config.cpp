#include "datamap/store_config.hpp"

#include <iostream>
#include <limits>

namespace datamap {

std::optional<NameCollisionPolicy> parseNameCollisionPolicy(std::string_view text) {
    if (text == "reject") return NameCollisionPolicy::Reject;
    if (text == "overwrite") return NameCollisionPolicy::Overwrite;
    return std::nullopt;
}

std::string_view toString(NameCollisionPolicy policy) {
    switch (policy) {
        case NameCollisionPolicy::Reject: return "reject";
        case NameCollisionPolicy::Overwrite: return "overwrite";
    }
    return "unknown";
}

StoreOptions loadStoreOptions(const ConfigDocument& doc) {
    StoreOptions options;

    if (auto* entry = doc.get("name_collision")) {
        if (auto policy = parseNameCollisionPolicy(entry->value.asString())) {
            options.nameCollision = *policy;
        } else {
            std::cerr << "[StoreConfig] Line " << entry->line
                      << ": unknown name_collision '" << entry->value.asString()
                      << "', using " << toString(options.nameCollision) << "\n";
        }
    }

    if (auto* entry = doc.get("first_id")) {
        auto value = entry->value.asInteger();
        if (value && *value >= 1 && *value <= std::numeric_limits<RecordId>::max()) {
            options.firstId = static_cast<RecordId>(*value);
        } else {
            std::cerr << "[StoreConfig] Line " << entry->line
                      << ": first_id must be a positive integer, got '"
                      << entry->value.asString() << "', using " << options.firstId << "\n";
        }
    }

    return options;
}

StoreOptions loadStoreOptionsFile(const std::string& path) {
    ConfigParser parser;
    auto doc = parser.parseFile(path);
    if (!doc) {
        return StoreOptions{};
    }
    return loadStoreOptions(*doc);
}

}  // namespace datamap
