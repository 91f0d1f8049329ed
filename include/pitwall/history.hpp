#pragma once
#include <string>
#include <vector>
#include <pitwall/lap_record.hpp>
#include <pitwall/logging.hpp>
#include <pitwall/track.hpp>

namespace pitwall {

// Source of schedules and race sessions. Both calls throw
// DataUnavailableError when the requested data cannot be produced.
class HistoricalDataProvider {
public:
  virtual ~HistoricalDataProvider() = default;

  // Season events ordered by round number.
  virtual std::vector<ScheduleEntry> schedule(int year) = 0;

  // Race session of the event in that season.
  virtual SessionData load_session(int year, const std::string& event_name) = 0;
};

struct RaceSlice {
  int year = 0;
  std::string event_name;
  double weight = 1.0;
  std::string source;
};

namespace slice_source {
inline constexpr const char* kOlderCurrentSeason = "older_current_season";
inline constexpr const char* kSameRacePrevYear   = "same_race_prev_year";
inline constexpr const char* kFallbackPrevTail   = "fallback_prev_season_tail";
} // namespace slice_source

inline constexpr double kRecentRaceWeights[3] = {3.0, 2.5, 2.0};
inline constexpr double kOlderCurrentSeasonWeight = 1.0;
inline constexpr double kSameRacePrevYearWeight = 2.5;
inline constexpr double kFallbackWeight = 1.2;
inline constexpr std::size_t kFallbackRaceCount = 5;

// "prev_1_race", "prev_2_race", ... (1 = most recent)
std::string recent_race_source(std::size_t rank);

struct TargetContext {
  int year = 0;
  std::string grand_prix;       // as requested
  int round_number = 0;
  std::string event_name;       // canonical
  std::string circuit_name;
  TrackType track_type = kDefaultTrackType;
  double track_length_km = kDefaultTrackLengthKm;
};

// Case-insensitive match on event name, circuit name, or a substring of the
// event name. nullopt when nothing in the schedule matches.
std::optional<ScheduleEntry> find_event(const std::vector<ScheduleEntry>& schedule,
                                        const std::string& grand_prix);

// Circuit lookup with event name as a secondary key, then the default track.
Track lookup_track(const std::vector<Track>& catalog,
                   const std::string& circuit_name,
                   const std::string& event_name);

// Throws DataUnavailableError when the season schedule cannot be loaded or
// does not contain the grand prix.
TargetContext resolve_target_context(HistoricalDataProvider& provider,
                                     int year,
                                     const std::string& grand_prix,
                                     const std::vector<Track>& catalog = track_catalog());

// Weighted slices for a target: three most recent prior rounds (most recent
// first), older rounds of the season, then the same event a year earlier.
std::vector<RaceSlice> build_slices(const std::vector<ScheduleEntry>& season_schedule,
                                    const TargetContext& target);

// Last kFallbackRaceCount rounds of the given season, weighted kFallbackWeight.
std::vector<RaceSlice> build_fallback_slices(const std::vector<ScheduleEntry>& season_schedule,
                                             int season_year);

// Clean a race session into weighted lap records. Returns an empty vector (not
// an error) when nothing survives filtering.
std::vector<LapRecord> extract_session_laps(const SessionData& session,
                                            const RaceSlice& slice,
                                            const std::vector<Track>& catalog = track_catalog());

// Aggregate all slices for the target. Slices that fail to load are logged and
// skipped. When no primary slice yields records the previous-season tail is
// tried. An empty result means no usable history exists at all.
LapHistory build_weighted_history(HistoricalDataProvider& provider,
                                  const TargetContext& target,
                                  LogSink* sink = nullptr,
                                  const std::vector<Track>& catalog = track_catalog());

// Share of records flagged wet, 0 for an empty history.
double wet_lap_share(const LapHistory& history);

} // namespace pitwall
