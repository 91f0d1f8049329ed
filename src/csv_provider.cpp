#include <pitwall/csv_provider.hpp>
#include <pitwall/csv.hpp>
#include <pitwall/errors.hpp>
#include <algorithm>
#include <fstream>

namespace pitwall {

static std::string col(const std::vector<std::string>& cols, std::size_t i) {
  return i < cols.size() ? cols[i] : std::string{};
}

std::vector<ScheduleEntry> schedule_from_csv_stream(std::istream& in) {
  std::vector<ScheduleEntry> out;
  for_each_csv_row(in, "round", [&](const std::vector<std::string>& cols) {
    const auto round = parse_int(col(cols, 0));
    const std::string event = col(cols, 1);
    if (!round || event.empty()) return;
    out.push_back(ScheduleEntry{*round, event, col(cols, 2)});
  });
  std::stable_sort(out.begin(), out.end(), [](const ScheduleEntry& a, const ScheduleEntry& b) {
    return a.round_number < b.round_number;
  });
  return out;
}

std::vector<RawLap> laps_from_csv_stream(std::istream& in) {
  std::vector<RawLap> out;
  for_each_csv_row(in, "driver", [&](const std::vector<std::string>& cols) {
    const auto lap_number = parse_int(col(cols, 2));
    const auto session_time = parse_double(col(cols, 7));
    if (!lap_number || !session_time) return;

    RawLap lap;
    lap.driver = col(cols, 0);
    lap.team = col(cols, 1);
    lap.lap_number = *lap_number;
    lap.lap_time_s = parse_double(col(cols, 3));
    lap.tyre_life_laps = parse_double(col(cols, 4));
    lap.compound = col(cols, 5);
    lap.stint = parse_int(col(cols, 6)).value_or(0);
    lap.session_time_s = *session_time;
    lap.is_accurate = parse_bool(col(cols, 8)).value_or(false);
    lap.track_status = col(cols, 9);
    out.push_back(std::move(lap));
  });
  return out;
}

std::vector<WeatherSample> weather_from_csv_stream(std::istream& in) {
  std::vector<WeatherSample> out;
  for_each_csv_row(in, "session_time_s", [&](const std::vector<std::string>& cols) {
    const auto t = parse_double(col(cols, 0));
    if (!t) return;
    WeatherSample w;
    w.session_time_s = *t;
    w.air_temp = parse_double(col(cols, 1));
    w.track_temp = parse_double(col(cols, 2));
    w.humidity = parse_double(col(cols, 3));
    w.rainfall = parse_bool(col(cols, 4));
    w.wind_speed = parse_double(col(cols, 5));
    out.push_back(w);
  });
  return out;
}

CsvDataProvider::CsvDataProvider(std::filesystem::path root) : root_(std::move(root)) {}

std::filesystem::path CsvDataProvider::season_dir(int year) const {
  return root_ / std::to_string(year);
}

std::vector<ScheduleEntry> CsvDataProvider::schedule(int year) {
  if (auto it = schedules_.find(year); it != schedules_.end()) return it->second;

  const auto path = season_dir(year) / "schedule.csv";
  std::ifstream f(path);
  if (!f) {
    throw DataUnavailableError(PITWALL_LOC("no schedule for " + std::to_string(year) +
                                           " (" + path.string() + ")"));
  }
  auto entries = schedule_from_csv_stream(f);
  if (entries.empty()) {
    throw DataUnavailableError(PITWALL_LOC("empty schedule: " + path.string()));
  }
  schedules_.emplace(year, entries);
  return entries;
}

SessionData CsvDataProvider::load_session(int year, const std::string& event_name) {
  const auto season = schedule(year);
  const auto event = find_event(season, event_name);
  if (!event) {
    throw DataUnavailableError(PITWALL_LOC("event '" + event_name + "' not in " +
                                           std::to_string(year) + " schedule"));
  }

  const auto dir = season_dir(year);
  const std::string round = std::to_string(event->round_number);
  const auto laps_path = dir / (round + "_laps.csv");
  std::ifstream laps_file(laps_path);
  if (!laps_file) {
    throw DataUnavailableError(PITWALL_LOC("no lap data: " + laps_path.string()));
  }

  SessionData session;
  session.year = year;
  session.round_number = event->round_number;
  session.event_name = event->event_name;
  session.circuit_name = event->circuit_name;
  session.laps = laps_from_csv_stream(laps_file);

  std::ifstream weather_file(dir / (round + "_weather.csv"));
  if (weather_file) session.weather = weather_from_csv_stream(weather_file);
  return session;
}

} // namespace pitwall
