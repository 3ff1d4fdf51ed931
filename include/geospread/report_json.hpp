#pragma once

#include <ostream>
#include <string>

#include "geospread/city_selector.hpp"

namespace geospread {

// Escapes quotes, backslashes and every control byte below 0x20.
std::string json_escape(const std::string& s);

// JSON has no infinity; non-finite values are written as null.
std::string json_number(double v);

void write_report_json(std::ostream& out, const SelectionReport& report, const CitySelectorOptions& opt);

}  // namespace geospread
