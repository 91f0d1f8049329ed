#include <pitwall/history.hpp>
#include <pitwall/errors.hpp>
#include <pitwall/team_names.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <sstream>

namespace pitwall {

static std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

static std::string slice_label(const RaceSlice& s) {
  std::ostringstream oss;
  oss << s.year << " " << s.event_name << " (" << s.source << ", w=" << s.weight << ")";
  return oss.str();
}

std::string recent_race_source(std::size_t rank) {
  return "prev_" + std::to_string(rank) + "_race";
}

std::optional<ScheduleEntry> find_event(const std::vector<ScheduleEntry>& schedule,
                                        const std::string& grand_prix) {
  const std::string key = lower(grand_prix);
  if (key.empty()) return std::nullopt;

  // Exact names win over substring matches.
  for (const auto& e : schedule) {
    if (lower(e.event_name) == key || lower(e.circuit_name) == key) return e;
  }
  for (const auto& e : schedule) {
    if (lower(e.event_name).find(key) != std::string::npos) return e;
  }
  return std::nullopt;
}

Track lookup_track(const std::vector<Track>& catalog,
                   const std::string& circuit_name,
                   const std::string& event_name) {
  if (auto t = track_by_key_in(catalog, circuit_name)) return *t;
  if (auto t = track_by_key_in(catalog, event_name)) return *t;
  return Track{circuit_name.empty() ? event_name : circuit_name,
               kDefaultTrackType, kDefaultTrackLengthKm};
}

TargetContext resolve_target_context(HistoricalDataProvider& provider,
                                     int year,
                                     const std::string& grand_prix,
                                     const std::vector<Track>& catalog) {
  const auto season = provider.schedule(year);
  const auto event = find_event(season, grand_prix);
  if (!event) {
    throw DataUnavailableError(PITWALL_LOC("grand prix '" + grand_prix +
                                           "' not found in " + std::to_string(year) + " schedule"));
  }

  const Track track = lookup_track(catalog, event->circuit_name, event->event_name);
  TargetContext ctx;
  ctx.year = year;
  ctx.grand_prix = grand_prix;
  ctx.round_number = event->round_number;
  ctx.event_name = event->event_name;
  ctx.circuit_name = event->circuit_name;
  ctx.track_type = track.type;
  ctx.track_length_km = track.length_km;
  return ctx;
}

std::vector<RaceSlice> build_slices(const std::vector<ScheduleEntry>& season_schedule,
                                    const TargetContext& target) {
  std::vector<ScheduleEntry> prior;
  for (const auto& e : season_schedule) {
    if (e.round_number < target.round_number) prior.push_back(e);
  }
  std::stable_sort(prior.begin(), prior.end(), [](const ScheduleEntry& a, const ScheduleEntry& b) {
    return a.round_number < b.round_number;
  });

  std::vector<RaceSlice> slices;
  const std::size_t recent = std::min<std::size_t>(3, prior.size());
  const std::size_t older = prior.size() - recent;

  for (std::size_t i = 0; i < recent; ++i) {
    const auto& e = prior[prior.size() - 1 - i];
    slices.push_back(RaceSlice{target.year, e.event_name, kRecentRaceWeights[i],
                               recent_race_source(i + 1)});
  }
  for (std::size_t i = 0; i < older; ++i) {
    slices.push_back(RaceSlice{target.year, prior[i].event_name, kOlderCurrentSeasonWeight,
                               slice_source::kOlderCurrentSeason});
  }
  slices.push_back(RaceSlice{target.year - 1, target.event_name, kSameRacePrevYearWeight,
                             slice_source::kSameRacePrevYear});
  return slices;
}

std::vector<RaceSlice> build_fallback_slices(const std::vector<ScheduleEntry>& season_schedule,
                                             int season_year) {
  std::vector<ScheduleEntry> sorted = season_schedule;
  std::stable_sort(sorted.begin(), sorted.end(), [](const ScheduleEntry& a, const ScheduleEntry& b) {
    return a.round_number < b.round_number;
  });

  const std::size_t first = sorted.size() > kFallbackRaceCount ? sorted.size() - kFallbackRaceCount : 0;
  std::vector<RaceSlice> slices;
  for (std::size_t i = first; i < sorted.size(); ++i) {
    slices.push_back(RaceSlice{season_year, sorted[i].event_name, kFallbackWeight,
                               slice_source::kFallbackPrevTail});
  }
  return slices;
}

// Latest sample at or before t (backward as-of join); nullptr if none.
static const WeatherSample* weather_at(const std::vector<WeatherSample>& sorted, double t) {
  auto it = std::upper_bound(sorted.begin(), sorted.end(), t,
                             [](double v, const WeatherSample& w){ return v < w.session_time_s; });
  if (it == sorted.begin()) return nullptr;
  return &*(it - 1);
}

std::vector<LapRecord> extract_session_laps(const SessionData& session,
                                            const RaceSlice& slice,
                                            const std::vector<Track>& catalog) {
  std::vector<WeatherSample> weather = session.weather;
  std::stable_sort(weather.begin(), weather.end(), [](const WeatherSample& a, const WeatherSample& b) {
    return a.session_time_s < b.session_time_s;
  });

  const Track track = lookup_track(catalog, session.circuit_name, session.event_name);

  std::vector<LapRecord> out;
  out.reserve(session.laps.size());
  for (const auto& lap : session.laps) {
    if (!lap.is_accurate || lap.track_status != "1") continue;

    const auto compound = parse_compound(lap.compound);
    if (!compound) continue;
    if (!lap.lap_time_s || !std::isfinite(*lap.lap_time_s)) continue;
    if (!lap.tyre_life_laps || !std::isfinite(*lap.tyre_life_laps)) continue;
    if (lap.driver.empty() || lap.team.empty()) continue;

    LapRecord r;
    r.year = slice.year;
    r.round_number = session.round_number;
    r.event_name = session.event_name;
    r.driver = lap.driver;
    r.team = normalize_team_name(lap.team);
    r.lap_number = lap.lap_number;
    r.tyre_life_laps = *lap.tyre_life_laps;
    r.track_length_km = track.length_km;
    r.tyre_life_km = r.tyre_life_laps * track.length_km;
    r.compound = *compound;
    r.stint = lap.stint;
    r.track_type = track.type;
    r.lap_time_s = *lap.lap_time_s;
    r.data_weight = slice.weight;
    r.data_source = slice.source;

    if (const WeatherSample* w = weather_at(weather, lap.session_time_s)) {
      r.air_temp = w->air_temp;
      r.track_temp = w->track_temp;
      r.humidity = w->humidity;
      r.rainfall = w->rainfall.value_or(false);
      r.wind_speed = w->wind_speed;
    }
    r.is_wet = is_wet_compound(r.compound) || r.rainfall;

    out.push_back(std::move(r));
  }
  return out;
}

static std::size_t collect_slices(HistoricalDataProvider& provider,
                                  const std::vector<RaceSlice>& slices,
                                  const std::vector<Track>& catalog,
                                  LogSink* sink,
                                  LapHistory& out) {
  std::size_t loaded = 0;
  for (const auto& s : slices) {
    try {
      const SessionData session = provider.load_session(s.year, s.event_name);
      auto records = extract_session_laps(session, s, catalog);
      if (records.empty()) {
        log(sink, LogLevel::Debug, "no usable laps in " + slice_label(s));
        continue;
      }
      log(sink, LogLevel::Debug,
          std::to_string(records.size()) + " laps from " + slice_label(s));
      out.insert(out.end(), std::make_move_iterator(records.begin()),
                 std::make_move_iterator(records.end()));
      ++loaded;
    } catch (const DataUnavailableError& e) {
      log(sink, LogLevel::Warning, "skipping " + slice_label(s) + ": " + e.what());
    }
  }
  return loaded;
}

LapHistory build_weighted_history(HistoricalDataProvider& provider,
                                  const TargetContext& target,
                                  LogSink* sink,
                                  const std::vector<Track>& catalog) {
  std::vector<ScheduleEntry> season;
  try {
    season = provider.schedule(target.year);
  } catch (const DataUnavailableError& e) {
    log(sink, LogLevel::Warning, std::string("current season schedule unavailable: ") + e.what());
  }

  LapHistory history;
  const auto slices = build_slices(season, target);
  const std::size_t loaded = collect_slices(provider, slices, catalog, sink, history);
  log(sink, LogLevel::Info, std::to_string(loaded) + "/" + std::to_string(slices.size()) +
                           " history slices loaded, " + std::to_string(history.size()) + " laps");
  if (!history.empty()) return history;

  const int prev_year = target.year - 1;
  log(sink, LogLevel::Warning, "no usable history for target slices, falling back to " +
                              std::to_string(prev_year) + " season tail");
  std::vector<ScheduleEntry> prev_season;
  try {
    prev_season = provider.schedule(prev_year);
  } catch (const DataUnavailableError& e) {
    log(sink, LogLevel::Warning, std::string("previous season schedule unavailable: ") + e.what());
    return history;
  }
  collect_slices(provider, build_fallback_slices(prev_season, prev_year), catalog, sink, history);
  return history;
}

double wet_lap_share(const LapHistory& history) {
  if (history.empty()) return 0.0;
  const auto wet = std::count_if(history.begin(), history.end(),
                                 [](const LapRecord& r){ return r.is_wet; });
  return static_cast<double>(wet) / static_cast<double>(history.size());
}

} // namespace pitwall
