#include <pitwall/compound.hpp>
#include <cctype>

namespace pitwall {

static std::string upper(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

const char* compound_name(Compound c) {
  switch (c) {
    case Compound::Soft:         return "SOFT";
    case Compound::Medium:       return "MEDIUM";
    case Compound::Hard:         return "HARD";
    case Compound::Intermediate: return "INTERMEDIATE";
    case Compound::Wet:          return "WET";
  }
  return "UNKNOWN";
}

std::optional<Compound> parse_compound(const std::string& s) {
  const auto S = upper(s);
  for (Compound c : kAllCompounds) {
    if (S == compound_name(c)) return c;
  }
  return std::nullopt;
}

const char* race_condition_name(RaceCondition c) {
  switch (c) {
    case RaceCondition::Auto:  return "auto";
    case RaceCondition::Dry:   return "dry";
    case RaceCondition::Wet:   return "wet";
    case RaceCondition::Mixed: return "mixed";
  }
  return "unknown";
}

std::optional<RaceCondition> parse_race_condition(const std::string& s) {
  const auto S = upper(s);
  if (S == "AUTO")  return RaceCondition::Auto;
  if (S == "DRY")   return RaceCondition::Dry;
  if (S == "WET")   return RaceCondition::Wet;
  if (S == "MIXED") return RaceCondition::Mixed;
  return std::nullopt;
}

} // namespace pitwall
