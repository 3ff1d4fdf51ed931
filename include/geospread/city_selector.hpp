#pragma once

#include <istream>
#include <vector>

#include "geospread/city.hpp"
#include "geospread/greedy_dispersion.hpp"
#include "geospread/local_repair.hpp"
#include "geospread/selection_stats.hpp"

namespace geospread {

struct CitySelectorOptions {
    int n_cities = 200;
    double min_distance_km = 500.0;

    // Applied by the CSV entry point while loading.
    double population_min = 0.0;

    int max_repair_iterations = 10'000;
    double repair_time_limit_sec = 0.0;

    int threads = 0;
    // 0 silences progress; warnings are always printed.
    int log_every = 1;
};

struct SelectionReport {
    std::vector<CityRecord> selected;
    int input_records = 0;
    int valid_candidates = 0;

    GreedyResult greedy;
    RepairResult repair;
    SelectionStats stats;

    // Greedy and repair warnings in the order they were raised.
    std::vector<std::string> warnings;
};

void validate_selector_options(const CitySelectorOptions& opt);

// Drops records without valid coordinates, runs the max-min greedy pick and
// then the minimum-distance repair.
SelectionReport select_dispersed_cities(const std::vector<CityRecord>& cities, const CitySelectorOptions& opt);

// Loads the catalog (population floor applied) and runs select_dispersed_cities.
// Throws SchemaError before any selection work when required columns are absent.
SelectionReport select_dispersed_cities_csv(std::istream& in, const CitySelectorOptions& opt);

}  // namespace geospread
