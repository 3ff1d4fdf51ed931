#pragma once

#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "geospread/city.hpp"

namespace geospread {

// Required columns are missing from the catalog header.
class SchemaError : public std::runtime_error {
public:
    explicit SchemaError(const std::string& msg) : std::runtime_error(msg) {}
};

struct ReadCityCsvOptions {
    // Rows with population below this floor are skipped.
    double population_min = 0.0;
};

struct CityTable {
    std::vector<CityRecord> cities;
    int rows_read = 0;
    int rows_below_population_min = 0;
    int rows_missing_coordinates = 0;
};

// Splits one CSV line, honouring double quotes and "" escapes.
std::vector<std::string> split_csv_line(std::string_view line);

// Reads a city catalog with a header row. Columns `lat`, `lng` and `population`
// are required (SchemaError otherwise); `id` and `city`/`name` are optional.
// Empty coordinate cells are kept as NaN so callers can drop them.
CityTable read_city_csv(std::istream& in, const ReadCityCsvOptions& opt = {});

void write_selection_csv(std::ostream& out, const std::vector<CityRecord>& cities);

}  // namespace geospread
