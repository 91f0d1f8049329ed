#include <pitwall/team_names.hpp>

namespace pitwall {

static std::unordered_map<std::string, std::string> make_aliases() {
  return {
    // Racing Bulls lineage (Toro Rosso, AlphaTauri, RB)
    {"Toro Rosso", "Racing Bulls"},
    {"Scuderia Toro Rosso", "Racing Bulls"},
    {"AlphaTauri", "Racing Bulls"},
    {"Scuderia AlphaTauri", "Racing Bulls"},
    {"AlphaTauri Honda", "Racing Bulls"},
    {"RB", "Racing Bulls"},
    {"RB F1 Team", "Racing Bulls"},
    {"Visa Cash App RB", "Racing Bulls"},
    {"Visa Cash App RB F1 Team", "Racing Bulls"},
    {"Racing Bulls", "Racing Bulls"},
    {"Racing Bulls F1 Team", "Racing Bulls"},

    {"Red Bull", "Red Bull Racing"},
    {"Red Bull Racing", "Red Bull Racing"},
    {"Red Bull Racing Honda", "Red Bull Racing"},
    {"Red Bull Racing Honda RBPT", "Red Bull Racing"},
    {"Oracle Red Bull Racing", "Red Bull Racing"},

    {"Mercedes", "Mercedes"},
    {"Mercedes-AMG Petronas", "Mercedes"},
    {"Mercedes-AMG PETRONAS F1 Team", "Mercedes"},
    {"Mercedes-AMG Petronas Formula One Team", "Mercedes"},

    {"Ferrari", "Ferrari"},
    {"Scuderia Ferrari", "Ferrari"},
    {"Scuderia Ferrari Mission Winnow", "Ferrari"},
    {"Scuderia Ferrari HP", "Ferrari"},

    {"McLaren", "McLaren"},
    {"McLaren F1 Team", "McLaren"},
    {"McLaren Renault", "McLaren"},
    {"McLaren Mercedes", "McLaren"},

    {"Williams", "Williams"},
    {"Williams Racing", "Williams"},
    {"Williams Mercedes", "Williams"},

    {"Haas", "Haas"},
    {"Haas F1 Team", "Haas"},
    {"Haas Ferrari", "Haas"},
    {"MoneyGram Haas F1 Team", "Haas"},

    // Racing Point era folds into Aston Martin
    {"Racing Point", "Aston Martin"},
    {"Racing Point BWT Mercedes", "Aston Martin"},
    {"Aston Martin", "Aston Martin"},
    {"Aston Martin F1 Team", "Aston Martin"},
    {"Aston Martin Aramco Cognizant Formula One Team", "Aston Martin"},
    {"Aston Martin Aramco F1 Team", "Aston Martin"},

    // Renault era folds into Alpine
    {"Renault", "Alpine"},
    {"Renault F1 Team", "Alpine"},
    {"Alpine", "Alpine"},
    {"Alpine F1 Team", "Alpine"},
    {"BWT Alpine F1 Team", "Alpine"},

    // Sauber / Alfa Romeo eras fold into Audi
    {"Alfa Romeo", "Audi"},
    {"Alfa Romeo Racing", "Audi"},
    {"Alfa Romeo Racing Ferrari", "Audi"},
    {"Alfa Romeo F1 Team", "Audi"},
    {"Sauber", "Audi"},
    {"Sauber F1 Team", "Audi"},
    {"Kick Sauber", "Audi"},
    {"Stake F1 Team Kick Sauber", "Audi"},
    {"Audi", "Audi"},
    {"Audi F1 Team", "Audi"},
    {"Audi Revolut F1 Team", "Audi"},

    {"Cadillac", "Cadillac"},
    {"Cadillac Racing", "Cadillac"},
    {"Cadillac F1 Team", "Cadillac"},
  };
}

const std::unordered_map<std::string, std::string>& team_name_aliases() {
  static const std::unordered_map<std::string, std::string> aliases = make_aliases();
  return aliases;
}

std::string normalize_team_name(const std::string& raw) {
  const auto& aliases = team_name_aliases();
  auto it = aliases.find(raw);
  if (it == aliases.end()) return raw;
  return it->second;
}

} // namespace pitwall
