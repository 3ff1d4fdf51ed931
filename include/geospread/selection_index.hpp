#pragma once

#include <cstdint>
#include <unordered_map>
#include <vector>

#include "geospread/city.hpp"

namespace geospread {

// Owned bookkeeping of which pool entries are currently selected.
// Selected entries are kept as an ordered list of pool positions; membership is
// answered from a per-position flag, so lookups never scan the selection.
// The pool must outlive the index.
class SelectionIndex {
public:
    explicit SelectionIndex(const std::vector<CityRecord>& pool);

    // Appends pool[pool_pos] to the selection.
    void add(int pool_pos);
    // Replaces the member at `slot` with pool[pool_pos]; returns the evicted pool position.
    int replace_at(int slot, int pool_pos);

    bool contains_pool_index(int pool_pos) const;
    bool contains_id(std::int64_t id) const;
    // Pool position for `id`, or -1 when the id is not in the pool.
    int pool_index_of(std::int64_t id) const;

    int size() const { return static_cast<int>(selected_.size()); }
    int pool_size() const { return static_cast<int>(pool_->size()); }
    int pool_pos_at(int slot) const { return selected_[static_cast<size_t>(slot)]; }
    const CityRecord& at(int slot) const { return (*pool_)[static_cast<size_t>(pool_pos_at(slot))]; }
    const std::vector<CityRecord>& pool() const { return *pool_; }

    std::vector<CityRecord> records() const;

private:
    void check_pool_pos(int pool_pos, const char* what) const;

    const std::vector<CityRecord>* pool_;
    std::unordered_map<std::int64_t, int> pos_by_id_;
    std::vector<int> selected_;
    std::vector<bool> in_selection_;
};

}  // namespace geospread
