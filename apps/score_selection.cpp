#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "geospread/city_csv.hpp"
#include "geospread/selection_stats.hpp"

namespace {

struct Args {
    std::string path;
    double min_distance_km = 500.0;
    bool strict = false;
};

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto need = [&](const char* flag) {
            if (i + 1 >= argc) {
                throw std::runtime_error(std::string("missing value for ") + flag);
            }
            return std::string(argv[++i]);
        };

        if (a == "--min-distance-km") {
            args.min_distance_km = std::stod(need("--min-distance-km"));
        } else if (a == "--strict") {
            args.strict = true;
        } else if (a == "-h" || a == "--help") {
            std::cout << "Usage: score_selection <selected.csv> [--min-distance-km 500] [--strict]\n";
            std::exit(0);
        } else if (!a.empty() && a[0] == '-') {
            throw std::runtime_error("unknown arg: " + a);
        } else if (args.path.empty()) {
            args.path = a;
        } else {
            throw std::runtime_error("unexpected extra arg: " + a);
        }
    }
    if (args.path.empty()) {
        throw std::runtime_error("missing <selected.csv>");
    }
    if (!(args.min_distance_km > 0.0)) {
        throw std::runtime_error("--min-distance-km must be > 0");
    }
    return args;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);

        std::ifstream f(args.path);
        if (!f) {
            throw std::runtime_error("failed to open: " + args.path);
        }
        const auto table = geospread::read_city_csv(f);
        if (table.rows_missing_coordinates > 0) {
            throw std::runtime_error(std::to_string(table.rows_missing_coordinates) +
                                     " rows have missing or out-of-range coordinates");
        }

        const auto st = geospread::selection_stats(table.cities, args.min_distance_km);

        std::cout << std::fixed << std::setprecision(3);
        std::cout << "cities: " << st.count << "\n";
        if (st.closest.valid()) {
            const auto& a = table.cities[static_cast<size_t>(st.closest.i)];
            const auto& b = table.cities[static_cast<size_t>(st.closest.j)];
            std::cout << "closest_km: " << st.min_distance_km << " (" << a.name << " / " << b.name << ")\n";
            std::cout << "mean_nearest_km: " << st.mean_nearest_km << "\n";
        }
        std::cout << "violating_pairs(<" << args.min_distance_km << " km): " << st.violating_pairs << "\n";

        if (args.strict && st.violating_pairs > 0) {
            return 2;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
