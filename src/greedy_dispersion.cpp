#include "geospread/greedy_dispersion.hpp"

#include <algorithm>
#include <iostream>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_set>

#include "geospread/geodesic.hpp"
#include "geospread/logging.hpp"
#include "geospread/omp_utils.hpp"

namespace geospread {
namespace {

void require_valid_pool(const std::vector<CityRecord>& pool) {
    std::unordered_set<std::int64_t> seen;
    seen.reserve(pool.size());
    for (const auto& c : pool) {
        if (!has_valid_coordinates(c)) {
            throw std::invalid_argument("greedy_dispersion_select: city id " + std::to_string(c.id) +
                                        " has missing or out-of-range coordinates");
        }
        if (!seen.insert(c.id).second) {
            throw std::invalid_argument("greedy_dispersion_select: duplicate city id " + std::to_string(c.id));
        }
    }
}

}  // namespace

std::vector<CityRecord> population_order(const std::vector<CityRecord>& pool) {
    std::vector<CityRecord> order = pool;
    std::sort(order.begin(), order.end(), [](const CityRecord& a, const CityRecord& b) {
        if (a.population != b.population) {
            return a.population > b.population;
        }
        return a.id < b.id;
    });
    return order;
}

GreedyResult greedy_dispersion_select(const std::vector<CityRecord>& pool, const GreedyOptions& opt) {
    if (opt.n <= 0) {
        throw std::invalid_argument("greedy_dispersion_select: n must be > 0");
    }
    require_valid_pool(pool);

    const std::string prefix = opt.log_prefix.empty() ? std::string("[greedy]") : opt.log_prefix;

    GreedyResult out;
    out.requested = opt.n;

    const int m = static_cast<int>(pool.size());
    int target = opt.n;
    if (m < target) {
        out.size_reduced = true;
        out.warnings.push_back("only " + std::to_string(m) + " cities available, less than requested " +
                               std::to_string(opt.n));
        std::lock_guard<std::mutex> lk(log_mutex());
        std::cerr << prefix << " warning: " << out.warnings.back() << "\n";
        target = m;
    }
    if (target == 0) {
        return out;
    }

    omp_set_threads(opt.threads);

    const std::vector<CityRecord> order = population_order(pool);

    // Isolation score of every candidate against the current selection,
    // refreshed against the newest pick only.
    std::vector<double> min_dist(static_cast<size_t>(m), std::numeric_limits<double>::infinity());
    std::vector<char> taken(static_cast<size_t>(m), 0);

    out.selected.reserve(static_cast<size_t>(target));
    out.pick_scores.reserve(static_cast<size_t>(target));

    int newest = 0;
    taken[0] = 1;
    out.selected.push_back(order[0]);
    out.pick_scores.push_back(std::numeric_limits<double>::infinity());

    if (opt.log_every > 0) {
        std::lock_guard<std::mutex> lk(log_mutex());
        std::cerr << prefix << " start n=" << target << " pool=" << m << " threads=" << omp_max_threads()
                  << " seed=" << order[0].name << " (pop " << order[0].population << ")\n";
    }

    for (int round = 1; round < target; ++round) {
        const CityRecord& last = order[static_cast<size_t>(newest)];
        double best_score = -1.0;
        int best_idx = -1;

#pragma omp parallel
        {
            double local_score = -1.0;
            int local_idx = -1;

#pragma omp for schedule(static)
            for (int j = 0; j < m; ++j) {
                if (taken[static_cast<size_t>(j)]) {
                    continue;
                }
                const double d = distance_km(order[static_cast<size_t>(j)], last);
                double& md = min_dist[static_cast<size_t>(j)];
                if (d < md) {
                    md = d;
                }
                if (better_pick(md, j, local_score, local_idx)) {
                    local_score = md;
                    local_idx = j;
                }
            }

#pragma omp critical
            {
                if (local_idx >= 0 && better_pick(local_score, local_idx, best_score, best_idx)) {
                    best_score = local_score;
                    best_idx = local_idx;
                }
            }
        }

        if (best_idx < 0) {
            throw std::logic_error("greedy_dispersion_select: no unselected candidate left");
        }

        taken[static_cast<size_t>(best_idx)] = 1;
        newest = best_idx;
        out.selected.push_back(order[static_cast<size_t>(best_idx)]);
        out.pick_scores.push_back(best_score);

        if (opt.log_every > 0 && (round % opt.log_every) == 0) {
            std::lock_guard<std::mutex> lk(log_mutex());
            std::cerr << prefix << " round=" << round << "/" << target << " pick=" << out.selected.back().name
                      << " isolation_km=" << best_score << "\n";
        }
    }

    if (opt.log_every > 0) {
        std::lock_guard<std::mutex> lk(log_mutex());
        std::cerr << prefix << " done selected=" << out.selected.size()
                  << " last_isolation_km=" << out.pick_scores.back() << "\n";
    }

    return out;
}

}  // namespace geospread
