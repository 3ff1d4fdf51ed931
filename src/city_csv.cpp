#include "geospread/city_csv.hpp"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <limits>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace geospread {
namespace {

std::string trim_copy(std::string_view s) {
    size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) {
        ++b;
    }
    size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) {
        --e;
    }
    return std::string(s.substr(b, e - b));
}

std::string lower_copy(std::string s) {
    for (auto& ch : s) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return s;
}

std::string line_error(int line_no, const std::string& msg) {
    return "line " + std::to_string(line_no) + ": " + msg;
}

// Empty cells parse as NaN.
double parse_number(const std::string& raw, int line_no, const char* column) {
    const std::string s = trim_copy(raw);
    if (s.empty()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    size_t pos = 0;
    double v = 0.0;
    try {
        v = std::stod(s, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error(line_error(line_no, std::string("invalid ") + column + ": " + s));
    }
    if (pos != s.size()) {
        throw std::runtime_error(line_error(line_no, std::string("invalid ") + column + ": " + s));
    }
    return v;
}

std::int64_t parse_id(const std::string& raw, int line_no) {
    const std::string s = trim_copy(raw);
    size_t pos = 0;
    long long v = 0;
    try {
        v = std::stoll(s, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error(line_error(line_no, "invalid id: " + s));
    }
    if (pos != s.size()) {
        throw std::runtime_error(line_error(line_no, "invalid id: " + s));
    }
    return static_cast<std::int64_t>(v);
}

std::string quote_if_needed(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) {
        return s;
    }
    std::string out = "\"";
    for (const char ch : s) {
        if (ch == '"') {
            out += '"';
        }
        out += ch;
    }
    out += '"';
    return out;
}

}  // namespace

std::vector<std::string> split_csv_line(std::string_view line) {
    std::vector<std::string> out;
    std::string field;
    bool in_quotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (in_quotes) {
            if (ch == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += ch;
            }
        } else if (ch == '"') {
            in_quotes = true;
        } else if (ch == ',') {
            out.push_back(std::move(field));
            field.clear();
        } else if (ch != '\r') {
            field += ch;
        }
    }
    if (in_quotes) {
        throw std::runtime_error("unterminated quoted field");
    }
    out.push_back(std::move(field));
    return out;
}

CityTable read_city_csv(std::istream& in, const ReadCityCsvOptions& opt) {
    std::string line;
    int line_no = 0;

    std::vector<std::string> header;
    while (std::getline(in, line)) {
        line_no++;
        if (!trim_copy(line).empty()) {
            header = split_csv_line(line);
            break;
        }
    }
    if (header.empty()) {
        throw SchemaError("city catalog is empty (missing header row)");
    }

    std::unordered_map<std::string, int> col;
    for (size_t k = 0; k < header.size(); ++k) {
        col.emplace(lower_copy(trim_copy(header[k])), static_cast<int>(k));
    }
    auto column = [&](const char* name) {
        const auto it = col.find(name);
        return it == col.end() ? -1 : it->second;
    };

    const int c_lat = column("lat");
    const int c_lng = column("lng");
    const int c_pop = column("population");
    if (c_lat < 0 || c_lng < 0) {
        throw SchemaError("city data must contain 'lat' and 'lng' columns");
    }
    if (c_pop < 0) {
        throw SchemaError("city data must contain a 'population' column");
    }
    const int c_id = column("id");
    const int c_name = column("city") >= 0 ? column("city") : column("name");

    CityTable table;
    std::unordered_set<std::int64_t> seen_ids;
    int data_row = 0;

    while (std::getline(in, line)) {
        line_no++;
        if (trim_copy(line).empty()) {
            continue;
        }

        std::vector<std::string> fields;
        try {
            fields = split_csv_line(line);
        } catch (const std::runtime_error& e) {
            throw std::runtime_error(line_error(line_no, e.what()));
        }
        if (fields.size() != header.size()) {
            throw std::runtime_error(line_error(line_no, "expected " + std::to_string(header.size()) +
                                                             " columns, got " + std::to_string(fields.size())));
        }

        const int row = data_row++;
        table.rows_read++;

        CityRecord c;
        c.id = c_id >= 0 ? parse_id(fields[static_cast<size_t>(c_id)], line_no) : static_cast<std::int64_t>(row);
        if (c_name >= 0) {
            c.name = trim_copy(fields[static_cast<size_t>(c_name)]);
        }
        c.lat = parse_number(fields[static_cast<size_t>(c_lat)], line_no, "lat");
        c.lng = parse_number(fields[static_cast<size_t>(c_lng)], line_no, "lng");
        c.population = parse_number(fields[static_cast<size_t>(c_pop)], line_no, "population");
        if (std::isnan(c.population)) {
            c.population = 0.0;
        }
        if (c.population < 0.0 || !std::isfinite(c.population)) {
            throw std::runtime_error(line_error(line_no, "population must be a finite value >= 0"));
        }

        if (!seen_ids.insert(c.id).second) {
            throw std::runtime_error(line_error(line_no, "duplicate id " + std::to_string(c.id)));
        }

        if (opt.population_min > 0.0 && c.population < opt.population_min) {
            table.rows_below_population_min++;
            continue;
        }
        if (!has_valid_coordinates(c)) {
            table.rows_missing_coordinates++;
        }
        table.cities.push_back(std::move(c));
    }

    return table;
}

void write_selection_csv(std::ostream& out, const std::vector<CityRecord>& cities) {
    out << "rank,id,city,lat,lng,population\n";
    out << std::setprecision(17);
    for (size_t r = 0; r < cities.size(); ++r) {
        const auto& c = cities[r];
        out << r << "," << c.id << "," << quote_if_needed(c.name) << "," << c.lat << "," << c.lng << ","
            << c.population << "\n";
    }
}

}  // namespace geospread
