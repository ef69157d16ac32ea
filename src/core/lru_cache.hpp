#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <unordered_map>
#include <utility>

namespace combopanel
{

// Fixed-capacity map that evicts the least recently used entry
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class LruCache
{
   public:
    explicit LruCache(size_t capacity) : capacity_(capacity > 0 ? capacity : 1) {}

    // Marks the entry as most recently used. Returns nullptr on a miss.
    const Value* get(const Key& key)
    {
        auto it = index_.find(key);
        if (it == index_.end())
        {
            ++misses_;
            return nullptr;
        }
        ++hits_;
        entries_.splice(entries_.begin(), entries_, it->second);
        return &it->second->second;
    }

    void put(const Key& key, Value value)
    {
        auto it = index_.find(key);
        if (it != index_.end())
        {
            it->second->second = std::move(value);
            entries_.splice(entries_.begin(), entries_, it->second);
            return;
        }

        if (entries_.size() >= capacity_)
        {
            index_.erase(entries_.back().first);
            entries_.pop_back();
            ++evictions_;
        }
        entries_.emplace_front(key, std::move(value));
        index_.emplace(key, entries_.begin());
    }

    bool contains(const Key& key) const { return index_.find(key) != index_.end(); }

    void clear()
    {
        entries_.clear();
        index_.clear();
    }

    size_t   size() const { return entries_.size(); }
    size_t   capacity() const { return capacity_; }
    uint64_t hits() const { return hits_; }
    uint64_t misses() const { return misses_; }
    uint64_t evictions() const { return evictions_; }

   private:
    using Entry = std::pair<Key, Value>;

    size_t                                                             capacity_;
    std::list<Entry>                                                   entries_;   // front = most recent
    std::unordered_map<Key, typename std::list<Entry>::iterator, Hash> index_;
    uint64_t                                                           hits_      = 0;
    uint64_t                                                           misses_    = 0;
    uint64_t                                                           evictions_ = 0;
};

}   // namespace combopanel
