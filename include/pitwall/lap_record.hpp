#pragma once
#include <optional>
#include <string>
#include <vector>
#include <pitwall/compound.hpp>
#include <pitwall/track.hpp>

namespace pitwall {

// One lap as published by the timing provider, before cleaning.
struct RawLap {
  std::string driver;                   // three-letter code; empty = missing
  std::string team;                     // raw constructor name; empty = missing
  int lap_number = 0;
  std::optional<double> lap_time_s;
  std::optional<double> tyre_life_laps;
  std::string compound;                 // provider label, may be unknown
  int stint = 0;
  double session_time_s = 0.0;          // session clock at lap end
  bool is_accurate = false;
  std::string track_status;             // "1" = green
};

struct WeatherSample {
  double session_time_s = 0.0;
  std::optional<double> air_temp;
  std::optional<double> track_temp;
  std::optional<double> humidity;
  std::optional<bool>   rainfall;
  std::optional<double> wind_speed;
};

struct SessionData {
  int year = 0;
  int round_number = 0;
  std::string event_name;
  std::string circuit_name;
  std::vector<RawLap> laps;
  std::vector<WeatherSample> weather;
};

struct ScheduleEntry {
  int round_number = 0;
  std::string event_name;
  std::string circuit_name;
};

// Cleaned, weighted lap used for degradation fitting.
struct LapRecord {
  int year = 0;
  int round_number = 0;
  std::string event_name;
  std::string driver;
  std::string team;                     // canonical
  int lap_number = 0;
  double tyre_life_laps = 0.0;
  double tyre_life_km = 0.0;
  double track_length_km = kDefaultTrackLengthKm;
  Compound compound = Compound::Medium;
  int stint = 0;
  TrackType track_type = kDefaultTrackType;
  bool is_wet = false;
  std::optional<double> air_temp;
  std::optional<double> track_temp;
  std::optional<double> humidity;
  bool rainfall = false;
  std::optional<double> wind_speed;
  double lap_time_s = 0.0;
  double data_weight = 1.0;
  std::string data_source;
};

using LapHistory = std::vector<LapRecord>;

} // namespace pitwall
