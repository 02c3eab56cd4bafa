#pragma once

#include "lexis/types.hpp"
#include <cstddef>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace lexis {

/**
 * Interns UTF-8 strings to dense ids. Id 0 is always the empty string and
 * ids grow by one per new string. Returned views stay valid for the
 * lifetime of the store.
 */
class StringStore {
public:
    using const_iterator = std::deque<std::string>::const_iterator;

    StringStore();

    StringStore(const StringStore&) = delete;
    StringStore& operator=(const StringStore&) = delete;

    /// Intern @p str, returning its id. Same string -> same id.
    attr_t add(std::string_view str);

    attr_t operator[](std::string_view str) { return add(str); }

    /// String for @p id. Throws InvalidArgumentError for unknown ids.
    std::string_view operator[](attr_t id) const;

    bool contains(std::string_view str) const { return index_.count(str) != 0; }
    bool contains(attr_t id) const noexcept { return id < strings_.size(); }

    /// Number of interned strings, including the empty string.
    size_t size() const noexcept { return strings_.size(); }

    // Iterates in id order, starting with the empty string
    const_iterator begin() const { return strings_.begin(); }
    const_iterator end() const { return strings_.end(); }

private:
    // deque doesn't invalidate references on growth, so the string_view keys stay valid
    std::deque<std::string> strings_;
    std::unordered_map<std::string_view, attr_t> index_;
};

} // namespace lexis
