#pragma once
#include <cstddef>
#include <optional>
#include <vector>
#include <pitwall/compound.hpp>
#include <pitwall/degradation.hpp>

namespace pitwall {

struct SearchConfig {
  int max_stops = 2;
  std::size_t top_k = 5;
  int window_margin_laps = 6;   // stint lengths explored around the modeled window
  int min_stint_laps = 5;
  int length_step_laps = 2;     // stride for every stint except the last
};

struct StrategyCandidate {
  std::vector<Compound> compounds;
  std::vector<int> stint_laps;
  int stops = 0;
  double predicted_total_time_sec = 0.0;   // rounded to 3 decimals
};

struct LapRange {
  int lo = 0;
  int hi = 0;
};

// Compounds allowed for the condition that also have a model, in SOFT..WET
// order. Auto is treated as dry.
std::vector<Compound> compound_pool(RaceCondition condition, const CompoundModels& models);

// Dry races must use at least two distinct dry compounds.
bool is_valid_sequence(const std::vector<Compound>& seq, RaceCondition condition);

// [max(min_stint, window-margin), max(lo, window+margin)] per position.
// Every compound in seq must have a model.
std::vector<LapRange> stint_length_ranges(const std::vector<Compound>& seq,
                                          const CompoundModels& models,
                                          const SearchConfig& cfg = {});

// Lazily yields every ordered sequence (with repetition) of the pool, shortest
// first, lexicographic in pool order within a length.
class SequenceEnumerator {
public:
  SequenceEnumerator(std::vector<Compound> pool, int min_len, int max_len);
  std::optional<std::vector<Compound>> next();

private:
  std::vector<Compound> pool_;
  int len_;
  int max_len_;
  std::vector<std::size_t> idx_;
  bool started_{false};
};

// Lazily yields stint-length combinations summing exactly to total_laps.
// Positions before the last step through their range by `step`; the last
// position takes whatever remains when that lies inside its range. Iterative
// depth-first search with an explicit stack; branches whose remainder can no
// longer fit the remaining ranges are cut.
class StintLengthEnumerator {
public:
  StintLengthEnumerator(std::vector<LapRange> ranges, int total_laps, int step);
  std::optional<std::vector<int>> next();

private:
  struct Frame {
    std::size_t pos;
    int next_len;
    int remaining;
  };

  std::vector<LapRange> ranges_;
  int total_;
  int step_;
  std::vector<int> min_tail_;   // smallest sum reachable by positions i..n-1
  std::vector<int> max_tail_;   // largest sum reachable by positions i..n-1
  std::vector<Frame> stack_;
  std::vector<int> lengths_;
  bool started_{false};
};

// Sum over stints of fresh + slope*track_length*lap_index, plus pit loss per stop.
double score_strategy(const std::vector<Compound>& seq,
                      const std::vector<int>& stint_laps,
                      const CompoundModels& models,
                      double track_length_km,
                      double pit_loss_sec);

// Ranked strategies, fastest first, at most cfg.top_k. Times are rounded to
// 3 decimals before ranking; ties keep generation order. Empty when the pool is too small or no combination fits exactly.
std::vector<StrategyCandidate> optimize_strategy(const CompoundModels& models,
                                                 int race_laps,
                                                 double track_length_km,
                                                 RaceCondition condition,
                                                 double pit_loss_sec,
                                                 const SearchConfig& cfg = {});

} // namespace pitwall
