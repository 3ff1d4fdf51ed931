#include "geospread/city_selector.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <mutex>
#include <stdexcept>

#include "geospread/city_csv.hpp"
#include "geospread/logging.hpp"

namespace geospread {

void validate_selector_options(const CitySelectorOptions& opt) {
    if (opt.n_cities <= 0) {
        throw std::invalid_argument("n_cities must be > 0");
    }
    if (!(opt.min_distance_km > 0.0) || !std::isfinite(opt.min_distance_km)) {
        throw std::invalid_argument("min_distance_km must be a positive finite value");
    }
    if (opt.max_repair_iterations <= 0) {
        throw std::invalid_argument("max_repair_iterations must be > 0");
    }
    if (opt.repair_time_limit_sec < 0.0) {
        throw std::invalid_argument("repair_time_limit_sec must be >= 0");
    }
    if (opt.log_every < 0) {
        throw std::invalid_argument("log_every must be >= 0");
    }
}

SelectionReport select_dispersed_cities(const std::vector<CityRecord>& cities, const CitySelectorOptions& opt) {
    validate_selector_options(opt);

    SelectionReport report;
    report.input_records = static_cast<int>(cities.size());

    const std::vector<CityRecord> pool = valid_coordinate_cities(cities);
    report.valid_candidates = static_cast<int>(pool.size());

    if (opt.log_every > 0) {
        std::lock_guard<std::mutex> lk(log_mutex());
        std::cerr << "[select] selecting " << opt.n_cities << " geographically dispersed cities; "
                  << report.valid_candidates << " of " << report.input_records << " have valid coordinates\n";
    }

    GreedyOptions gopt;
    gopt.n = opt.n_cities;
    gopt.threads = opt.threads;
    gopt.log_every = opt.log_every > 0 ? std::max(1, opt.n_cities / 10) : 0;
    report.greedy = greedy_dispersion_select(pool, gopt);

    report.selected = report.greedy.selected;

    RepairOptions ropt;
    ropt.min_distance_km = opt.min_distance_km;
    ropt.max_iterations = opt.max_repair_iterations;
    ropt.time_limit_sec = opt.repair_time_limit_sec;
    ropt.threads = opt.threads;
    ropt.log_every = opt.log_every;
    report.repair = local_repair(report.selected, pool, ropt);

    report.stats = selection_stats(report.selected, opt.min_distance_km);

    report.warnings = report.greedy.warnings;
    report.warnings.insert(report.warnings.end(), report.repair.warnings.begin(), report.repair.warnings.end());
    return report;
}

SelectionReport select_dispersed_cities_csv(std::istream& in, const CitySelectorOptions& opt) {
    validate_selector_options(opt);

    ReadCityCsvOptions ropt;
    ropt.population_min = opt.population_min;
    const CityTable table = read_city_csv(in, ropt);

    if (opt.log_every > 0) {
        std::lock_guard<std::mutex> lk(log_mutex());
        std::cerr << "[select] loaded " << table.cities.size() << " cities (" << table.rows_read << " rows";
        if (opt.population_min > 0.0) {
            std::cerr << ", " << table.rows_below_population_min << " below population " << opt.population_min;
        }
        std::cerr << ")\n";
    }

    return select_dispersed_cities(table.cities, opt);
}

}  // namespace geospread
