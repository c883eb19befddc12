#pragma once

/**
 * Report - JSON records and human-readable text for evaluation results
 *
 * Field names follow the engine's records. Absent optionals serialize as
 * null. Fractions stay fractions; the only derived field is
 * weighted_expense_ratio_pct for display.
 */

#include "../engine/evaluator.hpp"

#include <nlohmann/json.hpp>

#include <ostream>

namespace gpo {
namespace io {

using json = nlohmann::ordered_json;

json to_json(const analytics::DrawdownSnapshot& snap);
json to_json(const analytics::DrawdownPoint& point);
json to_json(const strategy::Regime& regime);
json to_json(const strategy::RecoveryState& state);
json to_json(const trading::Position& position);
json to_json(const trading::RebalanceAction& action);
json to_json(const trading::AllocationResult& result);
json to_json(const engine::Evaluation& eval);
json to_json(const engine::Simulation& sim);

void render_text(std::ostream& out, const engine::Evaluation& eval);
void render_text(std::ostream& out, const engine::Simulation& sim);

} // namespace io
} // namespace gpo
