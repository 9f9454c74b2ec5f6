/*
 *
 * dispatch_engine.h
 *
 * Contains the run pipeline of one dispatch optimization:
 * validation, model construction, solving (with one retry) and
 * extraction of the result.
 *
 * */

#ifndef DISPATCH_ENGINE_H
#define DISPATCH_ENGINE_H

#include <string>

#include "asset_config.h"
#include "dispatch_types.h"
#include "optimization_unit_general.hpp"

namespace dispatch {

    /**
     * Computes the cost-optimal dispatch for one horizon.
     *
     * The solver is called once. If it reports an error (e.g. the time limit is reached
     * without any feasible solution), it is called a second time with the time limit
     * multiplied by SolverSettings::retry_time_limit_factor.
     * If the time limit is reached with a feasible solution, this solution is returned
     * with proven_optimal = false and a warning.
     *
     * Throws
     * - ConfigurationError if input or settings are invalid (before any solver call)
     * - InfeasibleModelError if the solver proves infeasibility
     * - SolverError if both solver calls failed
     * - InternalConsistencyError if the model is unbounded or the solution violates the model
     *
     * @param input: The hourly load and solar series
     * @param config: The validated asset configuration
     * @param settings: Solver time limit and MIP gap
     * @param solver_factory: Creates the solver instance (defaults to the compiled-in backend)
     * @param run_label: Name of the run used in log messages
     */
    DispatchResult runDispatch(
        const HorizonInput& input,
        const AssetConfig& config,
        const SolverSettings& settings,
        const MilpSolverFactory& solver_factory = createDefaultMilpSolver,
        const std::string& run_label = "run"
    );

    /**
     * Cost and fuel of supplying the complete load with the diesel generator only,
     * with the generator on in every hour of the horizon (also in hours without load).
     * The capacity of the generator is not taken into account.
     */
    DieselOnlyBaseline computeDieselOnlyBaseline(const HorizonInput& input, const AssetConfig& config);

    /**
     * Throws a ConfigurationError if a solver setting is out of range.
     */
    void validateSolverSettings(const SolverSettings& settings);

}

#endif
