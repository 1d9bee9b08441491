#pragma once

/**
 * @file name_view.hpp
 * @brief Lazy set-like view over every record's name in one language
 *
 * Nothing is materialized: contains() goes through the store's reverse
 * index and iteration walks the store in insertion order, reading each
 * record's name as it is dereferenced. A record without a name in the
 * view's language makes dereferencing throw KeyNotFound.
 *
 * The view and its iterators borrow the store and must not outlive it.
 * Iterators carry their own copy of the language code, so they may outlive
 * the view that made them.
 */

#include "datamap/store.hpp"

#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

namespace datamap {

class NameView {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = const std::string&;

        iterator() = default;

        reference operator*() const { return it_->name(languageCode_); }
        pointer operator->() const { return &**this; }

        iterator& operator++() {
            ++it_;
            return *this;
        }

        iterator operator++(int) {
            iterator tmp = *this;
            ++it_;
            return tmp;
        }

        bool operator==(const iterator& other) const { return it_ == other.it_; }

    private:
        friend class NameView;

        iterator(Store::const_iterator it, std::string languageCode)
            : it_(it), languageCode_(std::move(languageCode)) {}

        Store::const_iterator it_;
        std::string languageCode_;
    };

    NameView(const Store& store, std::string_view languageCode)
        : store_(&store), languageCode_(languageCode) {}

    /// True if some record is named `name` in this language
    [[nodiscard]] bool contains(std::string_view name) const {
        return store_->entryOf(languageCode_, name) != nullptr;
    }

    [[nodiscard]] iterator begin() const { return iterator(store_->begin(), languageCode_); }
    [[nodiscard]] iterator end() const { return iterator(store_->end(), languageCode_); }

    /// Number of records in the store (one name per record)
    [[nodiscard]] size_t size() const { return store_->size(); }

    [[nodiscard]] const std::string& language() const { return languageCode_; }

private:
    const Store* store_;
    std::string languageCode_;
};

}  // namespace datamap
