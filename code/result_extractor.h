/*
 * result_extractor.h
 *
 * This file contains the functions that map a solver assignment back
 * onto hourly dispatch decisions, compute the key figures of a run
 * and check the solution against the model constraints.
 *
 */

#ifndef RESULT_EXTRACTOR_H
#define RESULT_EXTRACTOR_H

#include <string>
#include <vector>

#include "asset_config.h"
#include "dispatch_model_builder.h"
#include "dispatch_types.h"
#include "milp_model.h"
#include "optimization_unit_general.hpp"

namespace DispatchOptimization {

    constexpr double validation_rel_tolerance = 1e-6; ///< Relative tolerance (with an absolute floor of the same size) for all solution checks

    /**
     * Builds the hourly schedule and the summary out of the assignment in outcome.
     * The solution is validated with validateSchedule() before it is returned.
     *
     * Throws an InternalConsistencyError (with a full variable dump) if the
     * assignment is incomplete or violates a constraint.
     */
    DispatchResult extractDispatchResult(
        const HorizonInput& input,
        const AssetConfig& config,
        const MilpModel& model,
        const DispatchModelLayout& layout,
        const SolverOutcome& outcome
    );

    /**
     * Checks energy balance, SoC bounds and continuity, terminal SoC, solar bounds,
     * battery power limits and diesel gating of a schedule.
     *
     * @return: Returns a list of human readable violations (empty if the schedule is valid)
     */
    std::vector<std::string> validateSchedule(
        const HorizonInput& input,
        const AssetConfig& config,
        const std::vector<DispatchDecision>& schedule
    );

    /**
     * Computes the cost breakdown and the energy figures of a schedule.
     */
    DispatchSummary summarizeSchedule(
        const HorizonInput& input,
        const AssetConfig& config,
        const std::vector<DispatchDecision>& schedule
    );

    /**
     * Returns all model variables together with their values as CSV table.
     */
    std::string createVariableDump(const MilpModel& model, const SolverOutcome& outcome);

}

#endif
