#pragma once

/**
 * @file store_config.hpp
 * @brief Build StoreOptions from a config document
 *
 * Recognized keys:
 *   name_collision: reject | overwrite
 *   first_id: <integer >= 1>
 *
 * Bad values are logged to stderr and the default is kept.
 */

#include "datamap/config_parser.hpp"
#include "datamap/store.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace datamap {

[[nodiscard]] std::optional<NameCollisionPolicy> parseNameCollisionPolicy(std::string_view text);
[[nodiscard]] std::string_view toString(NameCollisionPolicy policy);

[[nodiscard]] StoreOptions loadStoreOptions(const ConfigDocument& doc);

/// Defaults if the file is missing
[[nodiscard]] StoreOptions loadStoreOptionsFile(const std::string& path);

}  // namespace datamap
