#include "geospread/selection_index.hpp"

#include <stdexcept>
#include <string>

namespace geospread {

SelectionIndex::SelectionIndex(const std::vector<CityRecord>& pool)
    : pool_(&pool), in_selection_(pool.size(), false) {
    pos_by_id_.reserve(pool.size());
    for (size_t i = 0; i < pool.size(); ++i) {
        const auto [it, inserted] = pos_by_id_.emplace(pool[i].id, static_cast<int>(i));
        if (!inserted) {
            throw std::invalid_argument("SelectionIndex: duplicate city id " + std::to_string(pool[i].id));
        }
    }
}

void SelectionIndex::check_pool_pos(int pool_pos, const char* what) const {
    if (pool_pos < 0 || pool_pos >= pool_size()) {
        throw std::invalid_argument(std::string("SelectionIndex::") + what + ": pool position out of range: " +
                                    std::to_string(pool_pos));
    }
    if (in_selection_[static_cast<size_t>(pool_pos)]) {
        throw std::invalid_argument(std::string("SelectionIndex::") + what + ": city id " +
                                    std::to_string((*pool_)[static_cast<size_t>(pool_pos)].id) +
                                    " is already selected");
    }
}

void SelectionIndex::add(int pool_pos) {
    check_pool_pos(pool_pos, "add");
    selected_.push_back(pool_pos);
    in_selection_[static_cast<size_t>(pool_pos)] = true;
}

int SelectionIndex::replace_at(int slot, int pool_pos) {
    if (slot < 0 || slot >= size()) {
        throw std::invalid_argument("SelectionIndex::replace_at: slot out of range: " + std::to_string(slot));
    }
    check_pool_pos(pool_pos, "replace_at");
    const int evicted = selected_[static_cast<size_t>(slot)];
    in_selection_[static_cast<size_t>(evicted)] = false;
    selected_[static_cast<size_t>(slot)] = pool_pos;
    in_selection_[static_cast<size_t>(pool_pos)] = true;
    return evicted;
}

bool SelectionIndex::contains_pool_index(int pool_pos) const {
    if (pool_pos < 0 || pool_pos >= pool_size()) {
        return false;
    }
    return in_selection_[static_cast<size_t>(pool_pos)];
}

int SelectionIndex::pool_index_of(std::int64_t id) const {
    const auto it = pos_by_id_.find(id);
    return it == pos_by_id_.end() ? -1 : it->second;
}

bool SelectionIndex::contains_id(std::int64_t id) const {
    return contains_pool_index(pool_index_of(id));
}

std::vector<CityRecord> SelectionIndex::records() const {
    std::vector<CityRecord> out;
    out.reserve(selected_.size());
    for (const int pos : selected_) {
        out.push_back((*pool_)[static_cast<size_t>(pos)]);
    }
    return out;
}

}  // namespace geospread
