#include "geospread/report_json.hpp"

#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace geospread {

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const char ch : s) {
        switch (ch) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(ch)));
                    out += buf;
                } else {
                    out += ch;
                }
        }
    }
    return out;
}

std::string json_number(double v) {
    if (!std::isfinite(v)) {
        return "null";
    }
    std::ostringstream oss;
    oss << std::setprecision(17) << v;
    return oss.str();
}

void write_report_json(std::ostream& out, const SelectionReport& report, const CitySelectorOptions& opt) {
    out << "{\n";
    out << "  \"requested\": " << opt.n_cities << ",\n";
    out << "  \"selected\": " << report.selected.size() << ",\n";
    out << "  \"input_records\": " << report.input_records << ",\n";
    out << "  \"valid_candidates\": " << report.valid_candidates << ",\n";
    out << "  \"size_reduced\": " << (report.greedy.size_reduced ? "true" : "false") << ",\n";
    out << "  \"min_distance_km\": " << json_number(opt.min_distance_km) << ",\n";
    out << "  \"repair_status\": \"" << repair_status_name(report.repair.status) << "\",\n";
    out << "  \"repair_iterations\": " << report.repair.iterations << ",\n";
    out << "  \"repair_replacements\": " << report.repair.replacements << ",\n";
    out << "  \"closest_km_before_repair\": " << json_number(report.repair.initial_min_distance_km) << ",\n";
    out << "  \"closest_km\": " << json_number(report.stats.min_distance_km) << ",\n";
    out << "  \"mean_nearest_km\": " << json_number(report.stats.mean_nearest_km) << ",\n";
    out << "  \"violating_pairs\": " << report.stats.violating_pairs << ",\n";
    out << "  \"warnings\": [";
    for (size_t i = 0; i < report.warnings.size(); ++i) {
        out << (i == 0 ? "\n" : ",\n") << "    \"" << json_escape(report.warnings[i]) << "\"";
    }
    out << (report.warnings.empty() ? "]\n" : "\n  ]\n");
    out << "}\n";
}

}  // namespace geospread
