#pragma once

#include "lexis/types.hpp"
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lexis {

/**
 * Result of a lexical attribute getter. std::monostate means "absent" and
 * leaves the target slot at its default; strings are interned before they
 * are stored.
 */
using AttrValue = std::variant<std::monostate, bool, int64_t, double, std::string>;

using AttrGetter = std::function<AttrValue(std::string_view)>;
using FlagGetter = std::function<bool(std::string_view)>;

struct AttrGetterEntry {
    attr_id_t attr;
    AttrGetter getter;
};

/**
 * Ordered registry of attribute getters, one entry per attribute id.
 * Iteration follows registration order; replacing a getter keeps its slot.
 */
class LexAttrGetters {
public:
    using const_iterator = std::vector<AttrGetterEntry>::const_iterator;

    LexAttrGetters() = default;
    LexAttrGetters(std::initializer_list<AttrGetterEntry> entries) {
        for (const auto& entry : entries) set(entry.attr, entry.getter);
    }

    void set(attr_id_t attr, AttrGetter getter) {
        for (auto& entry : entries_) {
            if (entry.attr == attr) {
                entry.getter = std::move(getter);
                return;
            }
        }
        entries_.push_back({attr, std::move(getter)});
    }

    bool contains(attr_id_t attr) const noexcept {
        for (const auto& entry : entries_) {
            if (entry.attr == attr) return true;
        }
        return false;
    }

    const AttrGetter* find(attr_id_t attr) const noexcept {
        for (const auto& entry : entries_) {
            if (entry.attr == attr) return &entry.getter;
        }
        return nullptr;
    }

    size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

private:
    std::vector<AttrGetterEntry> entries_;
};

/// Wraps a boolean predicate so it can be stored under a flag id.
inline AttrGetter flag_getter(FlagGetter predicate) {
    return [predicate = std::move(predicate)](std::string_view s) -> AttrValue {
        return predicate(s);
    };
}

} // namespace lexis
