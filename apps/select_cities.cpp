#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "geospread/city_csv.hpp"
#include "geospread/city_selector.hpp"
#include "geospread/report_json.hpp"

namespace {

struct Args {
    std::string in_csv;
    std::string out_csv;
    std::string out_json;

    geospread::CitySelectorOptions opt;
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

        if (a == "--in") {
            args.in_csv = need("--in");
        } else if (a == "--out") {
            args.out_csv = need("--out");
        } else if (a == "--out-json") {
            args.out_json = need("--out-json");
        } else if (a == "--n") {
            args.opt.n_cities = std::stoi(need("--n"));
        } else if (a == "--min-distance-km") {
            args.opt.min_distance_km = std::stod(need("--min-distance-km"));
        } else if (a == "--population-min") {
            args.opt.population_min = std::stod(need("--population-min"));
        } else if (a == "--max-repair-iters") {
            args.opt.max_repair_iterations = std::stoi(need("--max-repair-iters"));
        } else if (a == "--time-limit") {
            args.opt.repair_time_limit_sec = std::stod(need("--time-limit"));
        } else if (a == "--threads") {
            args.opt.threads = std::stoi(need("--threads"));
        } else if (a == "--log-every") {
            args.opt.log_every = std::stoi(need("--log-every"));
        } else if (a == "-h" || a == "--help") {
            std::cout << "Usage: select_cities --in <cities.csv> --out <selected.csv>\n"
                      << "                     [--n 200] [--min-distance-km 500] [--population-min 0]\n"
                      << "                     [--max-repair-iters 10000] [--time-limit 0] [--threads 0]\n"
                      << "                     [--log-every 1] [--out-json path]\n";
            std::exit(0);
        } else if (!a.empty() && a[0] == '-') {
            throw std::runtime_error("unknown arg: " + a);
        } else if (args.in_csv.empty()) {
            args.in_csv = a;
        } else if (args.out_csv.empty()) {
            args.out_csv = a;
        } else {
            throw std::runtime_error("unexpected extra arg: " + a);
        }
    }
    if (args.in_csv.empty()) {
        throw std::runtime_error("missing --in <cities.csv>");
    }
    if (args.out_csv.empty()) {
        throw std::runtime_error("missing --out <selected.csv>");
    }
    if (args.opt.n_cities <= 0) {
        throw std::runtime_error("--n must be > 0");
    }
    if (!(args.opt.min_distance_km > 0.0)) {
        throw std::runtime_error("--min-distance-km must be > 0");
    }
    if (args.opt.population_min < 0.0) {
        throw std::runtime_error("--population-min must be >= 0");
    }
    if (args.opt.max_repair_iterations <= 0) {
        throw std::runtime_error("--max-repair-iters must be > 0");
    }
    if (args.opt.repair_time_limit_sec < 0.0) {
        throw std::runtime_error("--time-limit must be >= 0");
    }
    if (args.opt.log_every < 0) {
        throw std::runtime_error("--log-every must be >= 0");
    }
    return args;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);

        std::ifstream f(args.in_csv);
        if (!f) {
            throw std::runtime_error("failed to open: " + args.in_csv);
        }
        const auto report = geospread::select_dispersed_cities_csv(f, args.opt);

        std::ofstream out(args.out_csv);
        if (!out) {
            throw std::runtime_error("failed to open: " + args.out_csv);
        }
        geospread::write_selection_csv(out, report.selected);

        std::ostringstream payload;
        geospread::write_report_json(payload, report, args.opt);

        std::cout << payload.str();

        if (!args.out_json.empty()) {
            std::ofstream jf(args.out_json);
            if (!jf) {
                throw std::runtime_error("failed to open --out-json: " + args.out_json);
            }
            jf << payload.str();
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
