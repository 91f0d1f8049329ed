#pragma once
#include <string>
#include <unordered_map>

namespace pitwall {

// Raw constructor names (all eras and sponsor variants) -> canonical team.
const std::unordered_map<std::string, std::string>& team_name_aliases();

// Identity for names not present in the table.
std::string normalize_team_name(const std::string& raw);

} // namespace pitwall
