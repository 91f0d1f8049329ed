#pragma once
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include <pitwall/planner.hpp>

namespace pitwall {

// {target, phase_1_history_rows, phase_2_compound_models,
//  phase_2_wet_experience_km, phase_3_best_strategies, phase_3_overstay_delta}
nlohmann::json plan_to_json(const StrategyPlan& plan);

// Pretty-printed (indent 2). Throws PitwallError when the file cannot be written.
void write_plan_json(const StrategyPlan& plan, const std::filesystem::path& path);

} // namespace pitwall
