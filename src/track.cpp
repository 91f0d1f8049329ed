#include <pitwall/track.hpp>
#include <pitwall/csv.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>

namespace pitwall {

const char* track_type_name(TrackType t) {
  switch (t) {
    case TrackType::Low:    return "Low";
    case TrackType::Medium: return "Medium";
    case TrackType::High:   return "High";
  }
  return "Medium";
}

std::optional<TrackType> parse_track_type(const std::string& s) {
  std::string l = trim(s);
  for (auto& c : l) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (l == "low")    return TrackType::Low;
  if (l == "medium") return TrackType::Medium;
  if (l == "high")   return TrackType::High;
  return std::nullopt;
}

static std::optional<Track> parse_track_row(const std::vector<std::string>& cols) {
  if (cols.size() < 3) return std::nullopt;
  const std::string key = cols[0];
  if (key.empty()) return std::nullopt;
  const auto type = parse_track_type(cols[1]);
  const auto len  = parse_double(cols[2]);
  if (!type || !len || *len <= 0.0) return std::nullopt;
  return Track{key, *type, *len};
}

static std::vector<Track> make_catalog_builtin() {
  return {
    {"Bahrain International Circuit",          TrackType::Medium, 5.412},
    {"Jeddah Corniche Circuit",                TrackType::High,   6.174},
    {"Albert Park Grand Prix Circuit",         TrackType::Medium, 5.278},
    {"Baku City Circuit",                      TrackType::Medium, 6.003},
    {"Miami International Autodrome",          TrackType::Low,    5.412},
    {"Circuit de Monaco",                      TrackType::Low,    3.337},
    {"Circuit de Barcelona-Catalunya",         TrackType::Medium, 4.657},
    {"Circuit Gilles Villeneuve",              TrackType::Medium, 4.361},
    {"Red Bull Ring",                          TrackType::Medium, 4.318},
    {"Silverstone Circuit",                    TrackType::High,   5.891},
    {"Hungaroring",                            TrackType::Low,    4.381},
    {"Circuit de Spa-Francorchamps",           TrackType::High,   7.004},
    {"Circuit Zandvoort",                      TrackType::Low,    4.259},
    {"Autodromo Nazionale Monza",              TrackType::High,   5.793},
    {"Marina Bay Street Circuit",              TrackType::Low,    4.940},
    {"Suzuka Circuit",                         TrackType::Medium, 5.807},
    {"Lusail International Circuit",           TrackType::Medium, 5.419},
    {"Circuit of The Americas",                TrackType::Medium, 5.513},
    {"Autódromo Hermanos Rodríguez",           TrackType::Low,    4.304},
    {"Autódromo José Carlos Pace",             TrackType::Medium, 4.309},
    {"Las Vegas Strip Circuit",                TrackType::Medium, 6.201},
    {"Yas Marina Circuit",                     TrackType::Medium, 5.281},
    {"Autodromo Enzo e Dino Ferrari",          TrackType::Medium, 4.909},
    {"Shanghai International Circuit",         TrackType::Medium, 5.451},
    {"Autodromo Internazionale del Mugello",   TrackType::High,   5.245},
  };
}

const std::vector<Track>& track_catalog() {
  static const std::vector<Track> cat = make_catalog_builtin();
  return cat;
}

std::optional<Track> track_by_key(const std::string& key) {
  const auto& cat = track_catalog();
  return track_by_key_in(cat, key);
}

std::optional<Track> track_by_key_in(const std::vector<Track>& cat, const std::string& key) {
  auto it = std::find_if(cat.begin(), cat.end(), [&](const Track& t){ return t.key == key; });
  if (it == cat.end()) return std::nullopt;
  return *it;
}

Track track_info(const std::string& key) {
  return track_info_in(track_catalog(), key);
}

Track track_info_in(const std::vector<Track>& cat, const std::string& key) {
  if (auto t = track_by_key_in(cat, key)) return *t;
  return Track{key, kDefaultTrackType, kDefaultTrackLengthKm};
}

std::vector<Track> track_catalog_from_csv_stream(std::istream& in) {
  std::vector<Track> out;
  for_each_csv_row(in, "key", [&](const std::vector<std::string>& cols) {
    if (auto row = parse_track_row(cols); row.has_value()) {
      out.push_back(*row);
    }
  });
  return out;
}

std::optional<std::vector<Track>> load_track_catalog_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return track_catalog_from_csv_stream(f);
}

} // namespace pitwall
