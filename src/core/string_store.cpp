#include "lexis/string_store.hpp"
#include "lexis/error.hpp"

namespace lexis {

StringStore::StringStore() {
    add("");
}

attr_t StringStore::add(std::string_view str) {
    auto it = index_.find(str);
    if (it != index_.end()) return it->second;

    attr_t id = static_cast<attr_t>(strings_.size());
    strings_.emplace_back(str);
    index_.emplace(std::string_view(strings_.back()), id);
    return id;
}

std::string_view StringStore::operator[](attr_t id) const {
    if (id >= strings_.size()) {
        throw InvalidArgumentError("Unknown string id " + std::to_string(id),
                                   "StringStore::operator[]");
    }
    return strings_[id];
}

} // namespace lexis
