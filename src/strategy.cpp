#include <pitwall/strategy.hpp>
#include <pitwall/race.hpp>
#include <pitwall/stint.hpp>
#include <pitwall/weighted_stats.hpp>
#include <algorithm>
#include <set>

namespace pitwall {

static bool is_dry_compound(Compound c) {
  return std::find(kDryCompounds.begin(), kDryCompounds.end(), c) != kDryCompounds.end();
}

std::vector<Compound> compound_pool(RaceCondition condition, const CompoundModels& models) {
  std::vector<Compound> pool;
  auto add_available = [&](auto const& compounds) {
    for (Compound c : compounds) {
      if (models.count(c)) pool.push_back(c);
    }
  };
  switch (condition) {
    case RaceCondition::Wet:
      add_available(kWetCompounds);
      break;
    case RaceCondition::Mixed:
      add_available(kDryCompounds);
      add_available(kWetCompounds);
      break;
    case RaceCondition::Dry:
    case RaceCondition::Auto:
      add_available(kDryCompounds);
      break;
  }
  return pool;
}

static bool is_dry_race(RaceCondition condition) {
  return condition == RaceCondition::Dry || condition == RaceCondition::Auto;
}

bool is_valid_sequence(const std::vector<Compound>& seq, RaceCondition condition) {
  if (!is_dry_race(condition)) return true;
  std::set<Compound> used;
  for (Compound c : seq) {
    if (is_dry_compound(c)) used.insert(c);
  }
  return used.size() >= 2;
}

std::vector<LapRange> stint_length_ranges(const std::vector<Compound>& seq,
                                          const CompoundModels& models,
                                          const SearchConfig& cfg) {
  std::vector<LapRange> ranges;
  ranges.reserve(seq.size());
  for (Compound c : seq) {
    const int window = models.at(c).window_laps;
    const int lo = std::max(cfg.min_stint_laps, window - cfg.window_margin_laps);
    const int hi = std::max(lo, window + cfg.window_margin_laps);
    ranges.push_back(LapRange{lo, hi});
  }
  return ranges;
}

// ---------------- SequenceEnumerator ----------------

SequenceEnumerator::SequenceEnumerator(std::vector<Compound> pool, int min_len, int max_len)
  : pool_(std::move(pool)), len_(std::max(1, min_len)), max_len_(max_len) {}

std::optional<std::vector<Compound>> SequenceEnumerator::next() {
  if (pool_.empty() || len_ > max_len_) return std::nullopt;

  if (!started_) {
    started_ = true;
    idx_.assign(static_cast<std::size_t>(len_), 0);
  } else {
    // Odometer increment; last position turns fastest.
    int i = len_ - 1;
    while (i >= 0) {
      auto& d = idx_[static_cast<std::size_t>(i)];
      if (++d < pool_.size()) break;
      d = 0;
      --i;
    }
    if (i < 0) {
      ++len_;
      if (len_ > max_len_) return std::nullopt;
      idx_.assign(static_cast<std::size_t>(len_), 0);
    }
  }

  std::vector<Compound> seq;
  seq.reserve(idx_.size());
  for (std::size_t k : idx_) seq.push_back(pool_[k]);
  return seq;
}

// ---------------- StintLengthEnumerator ----------------

StintLengthEnumerator::StintLengthEnumerator(std::vector<LapRange> ranges, int total_laps, int step)
  : ranges_(std::move(ranges)), total_(total_laps), step_(std::max(1, step)) {
  const std::size_t n = ranges_.size();
  min_tail_.assign(n + 1, 0);
  max_tail_.assign(n + 1, 0);
  for (std::size_t i = n; i-- > 0;) {
    const LapRange& r = ranges_[i];
    int reach_hi = r.hi;
    if (i + 1 < n) {
      // Stepped positions only land on lo, lo+step, ...
      reach_hi = r.hi >= r.lo ? r.lo + ((r.hi - r.lo) / step_) * step_ : r.lo - 1;
    }
    min_tail_[i] = min_tail_[i + 1] + r.lo;
    max_tail_[i] = max_tail_[i + 1] + reach_hi;
  }
}

std::optional<std::vector<int>> StintLengthEnumerator::next() {
  const std::size_t n = ranges_.size();
  if (n == 0) return std::nullopt;

  if (!started_) {
    started_ = true;
    if (n == 1) {
      const LapRange& r = ranges_[0];
      if (total_ >= r.lo && total_ <= r.hi) return std::vector<int>{total_};
      return std::nullopt;
    }
    stack_.push_back(Frame{0, ranges_[0].lo, total_});
  }

  while (!stack_.empty()) {
    Frame& f = stack_.back();
    const std::size_t pos = f.pos;
    const int remaining = f.remaining;
    const LapRange& r = ranges_[pos];
    if (f.next_len > r.hi) {
      stack_.pop_back();
      continue;
    }
    const int len = f.next_len;
    f.next_len += step_;

    const int rest = remaining - len;
    if (rest <= 0) continue;
    if (rest < min_tail_[pos + 1] || rest > max_tail_[pos + 1]) continue;

    lengths_.resize(pos);
    lengths_.push_back(len);

    if (pos + 2 == n) {
      const LapRange& last = ranges_[n - 1];
      if (rest >= last.lo && rest <= last.hi) {
        std::vector<int> out = lengths_;
        out.push_back(rest);
        return out;
      }
      continue;
    }
    stack_.push_back(Frame{pos + 1, ranges_[pos + 1].lo, rest});
  }
  return std::nullopt;
}

// ---------------- scoring & ranking ----------------

double score_strategy(const std::vector<Compound>& seq,
                      const std::vector<int>& stint_laps,
                      const CompoundModels& models,
                      double track_length_km,
                      double pit_loss_sec) {
  std::vector<StintParams> stints;
  stints.reserve(seq.size());
  for (std::size_t i = 0; i < seq.size() && i < stint_laps.size(); ++i) {
    const CompoundModel& m = models.at(seq[i]);
    stints.push_back(StintParams{stint_laps[i], m.fresh_lap_time_sec,
                                 m.slope_sec_per_km * track_length_km});
  }
  return race_time_with_pits(stints, pit_loss_sec).value_or(0.0);
}

namespace {

// Bounded ranking: keeps the best k seen so far. A later candidate with an
// equal time ranks behind earlier ones.
class TopK {
public:
  explicit TopK(std::size_t k) : k_(k) {}

  void offer(StrategyCandidate c) {
    if (k_ == 0) return;
    if (best_.size() == k_ &&
        c.predicted_total_time_sec >= best_.back().predicted_total_time_sec) {
      return;
    }
    auto it = std::upper_bound(best_.begin(), best_.end(), c.predicted_total_time_sec,
                               [](double t, const StrategyCandidate& s) {
                                 return t < s.predicted_total_time_sec;
                               });
    best_.insert(it, std::move(c));
    if (best_.size() > k_) best_.pop_back();
  }

  std::vector<StrategyCandidate> take() { return std::move(best_); }

private:
  std::size_t k_;
  std::vector<StrategyCandidate> best_;
};

} // namespace

std::vector<StrategyCandidate> optimize_strategy(const CompoundModels& models,
                                                 int race_laps,
                                                 double track_length_km,
                                                 RaceCondition condition,
                                                 double pit_loss_sec,
                                                 const SearchConfig& cfg) {
  const auto pool = compound_pool(condition, models);
  if (pool.empty()) return {};
  if (is_dry_race(condition) && pool.size() < 2) return {};
  if (race_laps <= 0) return {};

  TopK ranking(cfg.top_k);
  SequenceEnumerator sequences(pool, 2, cfg.max_stops + 1);
  while (auto seq = sequences.next()) {
    if (!is_valid_sequence(*seq, condition)) continue;

    StintLengthEnumerator lengths(stint_length_ranges(*seq, models, cfg), race_laps,
                                  cfg.length_step_laps);
    while (auto laps = lengths.next()) {
      StrategyCandidate c;
      c.predicted_total_time_sec =
          round3(score_strategy(*seq, *laps, models, track_length_km, pit_loss_sec));
      c.compounds = *seq;
      c.stint_laps = std::move(*laps);
      c.stops = static_cast<int>(c.compounds.size()) - 1;
      ranking.offer(std::move(c));
    }
  }
  return ranking.take();
}

} // namespace pitwall
