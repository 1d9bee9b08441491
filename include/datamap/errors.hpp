#pragma once

/**
 * @file errors.hpp
 * @brief Exception types raised by the record store
 *
 * Every failure surfaces immediately as one of these. Nullable lookups
 * (find, entryOf, idOf) return nullptr/nullopt instead of throwing.
 */

#include <stdexcept>
#include <string>

namespace datamap {

/// Base class for all store errors
class DataMapError : public std::runtime_error {
public:
    explicit DataMapError(const std::string& message) : std::runtime_error(message) {}
};

/// A raw record has no `name` field
class MissingField : public DataMapError {
public:
    explicit MissingField(const std::string& message) : DataMapError(message) {}
};

/// A `name` field of the wrong shape, or a direct mutation of `name`
class InvalidField : public DataMapError {
public:
    explicit InvalidField(const std::string& message) : DataMapError(message) {}
};

/// An identifier or (language, name) pair is already taken
class DuplicateKey : public DataMapError {
public:
    explicit DuplicateKey(const std::string& message) : DataMapError(message) {}
};

/// Identifier, field or language lookup missed
class KeyNotFound : public DataMapError {
public:
    explicit KeyNotFound(const std::string& message) : DataMapError(message) {}
};

}  // namespace datamap
