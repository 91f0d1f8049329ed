#pragma once
#include <optional>
#include <string>
#include <vector>
#include <istream>

namespace pitwall {

// Coarse speed classification used to scope degradation data.
enum class TrackType : int {
  Low = 0,
  Medium,
  High,
};

const char* track_type_name(TrackType t);
std::optional<TrackType> parse_track_type(const std::string& s);

struct Track {
  std::string key;                   // circuit name, e.g. "Bahrain International Circuit"
  TrackType type = TrackType::Medium;
  double length_km = 5.0;
};

inline constexpr TrackType kDefaultTrackType = TrackType::Medium;
inline constexpr double kDefaultTrackLengthKm = 5.0;

// Built-in catalog, initialized once and never mutated.
const std::vector<Track>& track_catalog();

// Lookup helpers
std::optional<Track> track_by_key(const std::string& key);

// Lookup within a specific catalog (e.g., CSV-loaded)
std::optional<Track> track_by_key_in(const std::vector<Track>& cat, const std::string& key);

// Total lookup: unknown names yield {key, Medium, 5.0 km}.
Track track_info(const std::string& key);
Track track_info_in(const std::vector<Track>& cat, const std::string& key);

// Stream-based CSV loader: key,type,length_km.
// Accepts an optional header row; ignores lines starting with '#' and blank lines.
// Whitespace around fields is trimmed. Invalid rows are skipped.
std::vector<Track> track_catalog_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<std::vector<Track>> load_track_catalog_csv(const std::string& path);

} // namespace pitwall
