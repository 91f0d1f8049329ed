#pragma once
#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace pitwall {

// Tiny CSV helpers shared by the catalog and data-directory loaders.
// No quoted fields; separators are plain commas.
std::string trim(std::string s);
std::vector<std::string> split_csv_line(const std::string& line);

// Strict numeric parses: the whole (trimmed) field must be consumed.
// Empty fields, "nan" and "NaN" are treated as missing.
std::optional<double> parse_double(const std::string& s);
std::optional<int> parse_int(const std::string& s);

// Accepts 1/0, true/false, yes/no (case-insensitive). Numeric strings other
// than 0/1 are truthy when non-zero.
std::optional<bool> parse_bool(const std::string& s);

// Walks a CSV stream: skips blank lines and lines starting with '#', and drops
// the first non-comment row when its first column equals header_key
// (case-insensitive). Calls on_row for every remaining row.
void for_each_csv_row(std::istream& in,
                      const std::string& header_key,
                      const std::function<void(const std::vector<std::string>&)>& on_row);

} // namespace pitwall
