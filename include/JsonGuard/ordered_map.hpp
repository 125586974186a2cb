#pragma once

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace JsonGuard {

// String-keyed map that keeps insertion order. Lookup is linear, which is fine
// for the object sizes found in JSON documents.
template<class V>
class OrderedMap {
public:
    using key_type       = std::string;
    using mapped_type    = V;
    using value_type     = std::pair<std::string, V>;
    using storage_type   = std::vector<value_type>;
    using iterator       = typename storage_type::iterator;
    using const_iterator = typename storage_type::const_iterator;

    OrderedMap() = default;

    OrderedMap(std::initializer_list<value_type> init) {
        for (const auto & entry : init) {
            insert_or_assign(entry.first, entry.second);
        }
    }

    iterator       begin()       { return m_entries.begin(); }
    iterator       end()         { return m_entries.end(); }
    const_iterator begin() const { return m_entries.begin(); }
    const_iterator end()   const { return m_entries.end(); }

    std::size_t size()  const { return m_entries.size(); }
    bool        empty() const { return m_entries.empty(); }

    iterator find(std::string_view key) {
        return std::find_if(m_entries.begin(), m_entries.end(),
                            [key](const value_type & e) { return e.first == key; });
    }
    const_iterator find(std::string_view key) const {
        return std::find_if(m_entries.begin(), m_entries.end(),
                            [key](const value_type & e) { return e.first == key; });
    }

    bool contains(std::string_view key) const {
        return find(key) != end();
    }

    // A repeated key keeps its first position and takes the new value.
    V & insert_or_assign(std::string key, V value) {
        if (auto it = find(key); it != end()) {
            it->second = std::move(value);
            return it->second;
        }
        m_entries.emplace_back(std::move(key), std::move(value));
        return m_entries.back().second;
    }

    const V & at(std::string_view key) const {
        auto it = find(key);
        if (it == end()) {
            throw std::out_of_range("JsonGuard::OrderedMap: no such key: " + std::string(key));
        }
        return it->second;
    }

    // Same key set with equal values; order is not significant.
    friend bool operator==(const OrderedMap & lhs, const OrderedMap & rhs) {
        if (lhs.size() != rhs.size()) return false;
        for (const auto & [key, value] : lhs) {
            auto it = rhs.find(key);
            if (it == rhs.end() || !(it->second == value)) return false;
        }
        return true;
    }

private:
    storage_type m_entries;
};

} // namespace JsonGuard
