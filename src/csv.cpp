#include <pitwall/csv.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace pitwall {

static std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

std::optional<double> parse_double(const std::string& s) {
  const std::string t = trim(s);
  if (t.empty() || lower(t) == "nan") return std::nullopt;
  try {
    size_t idx = 0;
    const double v = std::stod(t, &idx);
    if (idx != t.size() || std::isnan(v)) return std::nullopt;
    return v;
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

std::optional<int> parse_int(const std::string& s) {
  // Exports often write integral columns as floats ("12.0").
  const auto v = parse_double(s);
  if (!v) return std::nullopt;
  const double r = std::round(*v);
  if (std::fabs(*v - r) > 1e-9) return std::nullopt;
  if (r < static_cast<double>(std::numeric_limits<int>::min()) ||
      r > static_cast<double>(std::numeric_limits<int>::max())) {
    return std::nullopt;
  }
  return static_cast<int>(r);
}

std::optional<bool> parse_bool(const std::string& s) {
  const std::string t = lower(trim(s));
  if (t.empty()) return std::nullopt;
  if (t == "true" || t == "yes") return true;
  if (t == "false" || t == "no") return false;
  if (auto v = parse_double(t)) return *v != 0.0;
  return std::nullopt;
}

void for_each_csv_row(std::istream& in,
                      const std::string& header_key,
                      const std::function<void(const std::vector<std::string>&)>& on_row) {
  std::string line;
  bool first_row = true;
  const std::string key = lower(header_key);

  while (std::getline(in, line)) {
    const std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    const auto cols = split_csv_line(raw);
    if (first_row) {
      first_row = false;
      if (!key.empty() && lower(cols[0]) == key) continue;
    }
    on_row(cols);
  }
}

} // namespace pitwall
