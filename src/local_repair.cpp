#include "geospread/local_repair.hpp"

#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>

#include "geospread/geodesic.hpp"
#include "geospread/logging.hpp"
#include "geospread/omp_utils.hpp"
#include "geospread/selection_index.hpp"

namespace geospread {
namespace {

// Member of the pair to give up: the less populous one, else the larger id.
int removal_slot(const std::vector<CityRecord>& selection, const ClosestPair& cp) {
    const CityRecord& a = selection[static_cast<size_t>(cp.i)];
    const CityRecord& b = selection[static_cast<size_t>(cp.j)];
    if (a.population != b.population) {
        return a.population < b.population ? cp.i : cp.j;
    }
    return a.id > b.id ? cp.i : cp.j;
}

struct Replacement {
    int pool_pos = -1;
    double score_km = -1.0;
};

// Max-min search for the free slot: the unselected candidate whose nearest
// distance to the other members is largest.
Replacement best_replacement(const SelectionIndex& index, const std::vector<CityRecord>& selection, int free_slot) {
    const std::vector<CityRecord>& pool = index.pool();
    const int m = static_cast<int>(pool.size());
    const int k = static_cast<int>(selection.size());

    Replacement best;

#pragma omp parallel
    {
        Replacement local;

#pragma omp for schedule(static)
        for (int p = 0; p < m; ++p) {
            if (index.contains_pool_index(p)) {
                continue;
            }
            const CityRecord& cand = pool[static_cast<size_t>(p)];
            double score = std::numeric_limits<double>::infinity();
            for (int s = 0; s < k; ++s) {
                if (s == free_slot) {
                    continue;
                }
                const double d = distance_km(cand, selection[static_cast<size_t>(s)]);
                if (d < score) {
                    score = d;
                }
            }
            if (better_pick(score, p, local.score_km, local.pool_pos)) {
                local.score_km = score;
                local.pool_pos = p;
            }
        }

#pragma omp critical
        {
            if (local.pool_pos >= 0 && better_pick(local.score_km, local.pool_pos, best.score_km, best.pool_pos)) {
                best = local;
            }
        }
    }
    return best;
}

std::string describe_pair(const std::vector<CityRecord>& selection, const ClosestPair& cp) {
    std::ostringstream oss;
    oss << selection[static_cast<size_t>(cp.i)].name << " (id " << selection[static_cast<size_t>(cp.i)].id << ") and "
        << selection[static_cast<size_t>(cp.j)].name << " (id " << selection[static_cast<size_t>(cp.j)].id << ") only "
        << std::fixed;
    oss.precision(1);
    oss << cp.distance_km << " km apart";
    return oss.str();
}

}  // namespace

const char* repair_status_name(RepairStatus s) {
    switch (s) {
        case RepairStatus::kConverged:
            return "converged";
        case RepairStatus::kStalled:
            return "stalled";
        case RepairStatus::kBudgetExhausted:
            return "budget_exhausted";
    }
    return "unknown";
}

RepairResult local_repair(std::vector<CityRecord>& selection,
                          const std::vector<CityRecord>& pool,
                          const RepairOptions& opt) {
    if (!(opt.min_distance_km > 0.0) || !std::isfinite(opt.min_distance_km)) {
        throw std::invalid_argument("local_repair: min_distance_km must be a positive finite value");
    }
    if (opt.max_iterations <= 0) {
        throw std::invalid_argument("local_repair: max_iterations must be > 0");
    }

    SelectionIndex index(pool);
    for (const auto& c : selection) {
        const int pos = index.pool_index_of(c.id);
        if (pos < 0) {
            throw std::invalid_argument("local_repair: selected city id " + std::to_string(c.id) +
                                        " is not in the candidate pool");
        }
        index.add(pos);
    }

    omp_set_threads(opt.threads);

    const std::string prefix = opt.log_prefix.empty() ? std::string("[repair]") : opt.log_prefix;
    const auto t0 = std::chrono::steady_clock::now();
    auto elapsed_sec = [&]() {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    };

    RepairResult out;
    ClosestPair cp = find_closest_pair(selection);
    out.initial_min_distance_km = cp.distance_km;

    if (opt.log_every > 0) {
        std::lock_guard<std::mutex> lk(log_mutex());
        std::cerr << prefix << " start k=" << selection.size() << " pool=" << pool.size()
                  << " min_distance_km=" << opt.min_distance_km << " closest_km=" << cp.distance_km << "\n";
    }

    while (true) {
        if (!cp.valid() || cp.distance_km >= opt.min_distance_km) {
            out.status = RepairStatus::kConverged;
            if (opt.log_every > 0) {
                std::lock_guard<std::mutex> lk(log_mutex());
                std::cerr << prefix << " iteration " << out.iterations + 1 << ": all cities are at least "
                          << opt.min_distance_km << " km apart (closest: " << cp.distance_km << " km)\n";
            }
            break;
        }

        if (out.iterations >= opt.max_iterations ||
            (opt.time_limit_sec > 0.0 && elapsed_sec() >= opt.time_limit_sec)) {
            out.status = RepairStatus::kBudgetExhausted;
            out.unresolved = cp;
            out.warnings.push_back("repair budget exhausted after " + std::to_string(out.iterations) +
                                   " iterations; " + describe_pair(selection, cp));
            std::lock_guard<std::mutex> lk(log_mutex());
            std::cerr << prefix << " warning: " << out.warnings.back() << "\n";
            break;
        }

        out.iterations++;
        const bool trace = opt.log_every > 0 && (out.iterations % opt.log_every) == 0;
        if (trace) {
            std::lock_guard<std::mutex> lk(log_mutex());
            std::cerr << prefix << " iteration " << out.iterations << ": found " << describe_pair(selection, cp)
                      << "\n";
        }

        const int slot = removal_slot(selection, cp);
        const int other = (slot == cp.i) ? cp.j : cp.i;
        const Replacement rep = best_replacement(index, selection, slot);

        if (rep.pool_pos < 0 || !(rep.score_km > cp.distance_km)) {
            out.status = RepairStatus::kStalled;
            out.unresolved = cp;
            out.warnings.push_back("could not find a better replacement for " + describe_pair(selection, cp) +
                                   "; keeping original cities");
            std::lock_guard<std::mutex> lk(log_mutex());
            std::cerr << prefix << " warning: " << out.warnings.back() << "\n";
            break;
        }

        RepairStep step;
        step.iteration = out.iterations;
        step.slot = slot;
        step.removed = selection[static_cast<size_t>(slot)];
        step.kept = selection[static_cast<size_t>(other)];
        step.violating_km = cp.distance_km;
        step.replacement_score_km = rep.score_km;

        index.replace_at(slot, rep.pool_pos);
        selection[static_cast<size_t>(slot)] = pool[static_cast<size_t>(rep.pool_pos)];
        step.replacement = selection[static_cast<size_t>(slot)];
        out.steps.push_back(step);
        out.replacements++;

        if (trace) {
            std::lock_guard<std::mutex> lk(log_mutex());
            std::cerr << prefix << "   replaced " << step.removed.name << " (pop " << step.removed.population
                      << ") with " << step.replacement.name << " (min distance: " << rep.score_km << " km)\n";
        }

        cp = find_closest_pair(selection);
    }

    out.final_min_distance_km = cp.distance_km;

    if (opt.log_every > 0) {
        std::lock_guard<std::mutex> lk(log_mutex());
        std::cerr << prefix << " done status=" << repair_status_name(out.status) << " iterations=" << out.iterations
                  << " replacements=" << out.replacements << " closest_km=" << out.final_min_distance_km << "\n";
    }
    return out;
}

}  // namespace geospread
