#pragma once

#include <string>
#include <vector>

#include "geospread/city.hpp"

namespace geospread {

struct GreedyOptions {
    int n = 200;

    // OpenMP threads for the candidate scan (<=0 keeps the runtime default).
    int threads = 0;

    // If >0, print a progress line every k rounds (stderr).
    int log_every = 0;
    std::string log_prefix = "[greedy]";
};

struct GreedyResult {
    // Picks in selection order; selected[0] is the most populous city.
    std::vector<CityRecord> selected;
    // Isolation score (km) of each pick at the round it was chosen; +inf for the seed.
    std::vector<double> pick_scores;

    int requested = 0;
    bool size_reduced = false;
    std::vector<std::string> warnings;
};

// Deterministic scan order used for seeding and tie-breaks:
// population descending, then id ascending.
std::vector<CityRecord> population_order(const std::vector<CityRecord>& pool);

// Max-min (farthest-point) selection over `pool`, which must hold only records
// with valid coordinates and distinct ids (std::invalid_argument otherwise). When the pool is smaller than opt.n
// every candidate is returned and `size_reduced` is set.
GreedyResult greedy_dispersion_select(const std::vector<CityRecord>& pool, const GreedyOptions& opt);

}  // namespace geospread
