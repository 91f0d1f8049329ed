#pragma once
#include <array>
#include <optional>
#include <string>

namespace pitwall {

enum class Compound : int {
  Soft = 0,
  Medium,
  Hard,
  Intermediate,
  Wet,
};

inline constexpr std::array<Compound, 5> kAllCompounds{
  Compound::Soft, Compound::Medium, Compound::Hard, Compound::Intermediate, Compound::Wet};
inline constexpr std::array<Compound, 3> kDryCompounds{
  Compound::Soft, Compound::Medium, Compound::Hard};
inline constexpr std::array<Compound, 2> kWetCompounds{
  Compound::Intermediate, Compound::Wet};

// "SOFT", "MEDIUM", ... (upper case, as timing feeds publish them)
const char* compound_name(Compound c);

// Case-insensitive; nullopt for anything outside the five race compounds
// (e.g. "UNKNOWN", "TEST_UNKNOWN", empty).
std::optional<Compound> parse_compound(const std::string& s);

inline bool is_wet_compound(Compound c) {
  return c == Compound::Intermediate || c == Compound::Wet;
}

enum class RaceCondition : int {
  Auto = 0,
  Dry,
  Wet,
  Mixed,
};

const char* race_condition_name(RaceCondition c);
std::optional<RaceCondition> parse_race_condition(const std::string& s);

} // namespace pitwall
