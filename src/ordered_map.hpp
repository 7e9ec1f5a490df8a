#pragma once
#include <cstddef>
#include <map>
#include <utility>
#include <vector>

namespace switchyard {

// Map that iterates in first-insertion order. Lookups go through a
// key -> slot index; values live contiguously in insertion order.
template <typename K, typename V>
class OrderedMap {
public:
    using value_type = std::pair<K, V>;
    using iterator = typename std::vector<value_type>::iterator;
    using const_iterator = typename std::vector<value_type>::const_iterator;

    V* find(const K& key) {
        auto it = index_.find(key);
        return it == index_.end() ? nullptr : &entries_[it->second].second;
    }

    const V* find(const K& key) const {
        auto it = index_.find(key);
        return it == index_.end() ? nullptr : &entries_[it->second].second;
    }

    bool contains(const K& key) const { return index_.count(key) > 0; }

    // Inserts at the end if absent; an existing entry keeps its slot and value.
    std::pair<V*, bool> try_emplace(const K& key, V value) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            return {&entries_[it->second].second, false};
        }
        index_.emplace(key, entries_.size());
        entries_.emplace_back(key, std::move(value));
        return {&entries_.back().second, true};
    }

    V& operator[](const K& key) { return *try_emplace(key, V{}).first; }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    iterator begin() { return entries_.begin(); }
    iterator end() { return entries_.end(); }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

private:
    std::vector<value_type> entries_;
    std::map<K, size_t> index_;
};

} // namespace switchyard
