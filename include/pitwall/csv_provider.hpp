#pragma once
#include <filesystem>
#include <istream>
#include <map>
#include <string>
#include <vector>
#include <pitwall/history.hpp>
#include <pitwall/lap_record.hpp>

namespace pitwall {

// Stream parsers for the data-directory files. Header row optional, '#'
// comments and blank lines ignored, fields trimmed, empty numerics missing.

// round,event_name,circuit_name -- sorted by round on return
std::vector<ScheduleEntry> schedule_from_csv_stream(std::istream& in);

// driver,team,lap_number,lap_time_s,tyre_life,compound,stint,session_time_s,is_accurate,track_status
// Rows with an unparseable lap number or session time are skipped.
std::vector<RawLap> laps_from_csv_stream(std::istream& in);

// session_time_s,air_temp,track_temp,humidity,rainfall,wind_speed
std::vector<WeatherSample> weather_from_csv_stream(std::istream& in);

// HistoricalDataProvider over a directory laid out as
//   <root>/<year>/schedule.csv
//   <root>/<year>/<round>_laps.csv
//   <root>/<year>/<round>_weather.csv   (optional)
class CsvDataProvider : public HistoricalDataProvider {
public:
  explicit CsvDataProvider(std::filesystem::path root);

  std::vector<ScheduleEntry> schedule(int year) override;
  SessionData load_session(int year, const std::string& event_name) override;

  const std::filesystem::path& root() const { return root_; }

private:
  std::filesystem::path season_dir(int year) const;

  std::filesystem::path root_;
  std::map<int, std::vector<ScheduleEntry>> schedules_;
};

} // namespace pitwall
