#pragma once

#include <optional>
#include <string>
#include <vector>

#include "geospread/city.hpp"
#include "geospread/selection_stats.hpp"

namespace geospread {

enum class RepairStatus {
    kConverged = 0,        // every pair is at least min_distance_km apart
    kStalled = 1,          // a violation remains and no improving replacement exists
    kBudgetExhausted = 2,  // iteration or time budget ran out with a violation left
};

const char* repair_status_name(RepairStatus s);

struct RepairOptions {
    double min_distance_km = 500.0;

    // Hard caps on the repair loop. time_limit_sec <= 0 disables the clock.
    int max_iterations = 10'000;
    double time_limit_sec = 0.0;

    int threads = 0;

    // If >0, print the violation/replacement trace every k iterations (stderr).
    int log_every = 0;
    std::string log_prefix = "[repair]";
};

struct RepairStep {
    int iteration = 0;
    int slot = -1;             // position in the selection that was rewritten
    CityRecord removed;
    CityRecord kept;           // the other member of the violating pair
    CityRecord replacement;
    double violating_km = 0.0;
    double replacement_score_km = 0.0;  // min distance from the replacement to the other members
};

struct RepairResult {
    RepairStatus status = RepairStatus::kConverged;
    int iterations = 0;
    int replacements = 0;

    double initial_min_distance_km = 0.0;
    double final_min_distance_km = 0.0;

    std::vector<RepairStep> steps;
    // Closest pair left below the floor (slots refer to the returned selection).
    std::optional<ClosestPair> unresolved;
    std::vector<std::string> warnings;
};

// Swaps members of too-close pairs for better-separated pool candidates until
// every pair is at least opt.min_distance_km apart, no improving swap exists,
// or the budget is spent. `selection` is rewritten in place; its size never
// changes. Every selection member must be a pool record (matched by id).
RepairResult local_repair(std::vector<CityRecord>& selection,
                          const std::vector<CityRecord>& pool,
                          const RepairOptions& opt);

}  // namespace geospread
