/**
 * MissionResults: JSON reports.
 *
 * Single run:
 *   { "scenario": {...}, "threat": {...}, "comparison": {...},
 *     "run": { outcome, deflection, timeline, damage } }
 *
 * Batch:
 *   { "scenario": {...}, "config": {...}, "summary": {...}, "runs": [...] }
 *
 * Per-run entries in a batch omit the event timeline.
 */

#ifndef ASTRA_MISSION_MISSION_RESULTS_HPP
#define ASTRA_MISSION_MISSION_RESULTS_HPP

#include "mission/mission_runner.hpp"
#include <ostream>
#include <vector>

namespace astra {
class JsonWriter;
}

namespace astra::mission {

void write_damage_json(JsonWriter& w, const DamageAssessment& damage);

void write_run_json(const RunResult& result, const Scenario& scenario, std::ostream& out);

void write_batch_json(const std::vector<RunResult>& results, const Scenario& scenario,
                      const RunnerConfig& config, std::ostream& out);

} // namespace astra::mission

#endif // ASTRA_MISSION_MISSION_RESULTS_HPP
