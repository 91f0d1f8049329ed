#include <pitwall/overstay.hpp>

namespace pitwall {

OverstayTable build_overstay_table(const CompoundModels& models,
                                   double track_length_km,
                                   int max_extra_laps) {
  OverstayTable out;
  for (const auto& [compound, model] : models) {
    const double slope_per_lap = model.slope_sec_per_km * track_length_km;
    std::vector<OverstayRow> rows;
    rows.reserve(max_extra_laps > 0 ? static_cast<std::size_t>(max_extra_laps) : 0);
    double cumulative = 0.0;
    for (int extra = 1; extra <= max_extra_laps; ++extra) {
      const double incremental = slope_per_lap * extra;
      cumulative += incremental;
      rows.push_back(OverstayRow{extra, incremental, cumulative});
    }
    out.emplace(compound, std::move(rows));
  }
  return out;
}

} // namespace pitwall
