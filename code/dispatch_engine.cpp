#include "dispatch_engine.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "dispatch_model_builder.h"
#include "errors.h"
#include "global.h"
#include "milp_model.h"
#include "result_extractor.h"
#include "status_output.hpp"

using namespace std;


void dispatch::validateSolverSettings(const SolverSettings& settings) {
    if (!std::isfinite(settings.time_limit_s) || settings.time_limit_s <= 0.0)
        throw ConfigurationError("Parameter 'solver time limit s' must be > 0.");
    if (!std::isfinite(settings.relative_mip_gap) || settings.relative_mip_gap < 0.0)
        throw ConfigurationError("Parameter 'solver relative MIP gap' must be >= 0.");
    if (!std::isfinite(settings.retry_time_limit_factor) || settings.retry_time_limit_factor < 1.0)
        throw ConfigurationError("Parameter 'solver retry time factor' must be >= 1.");
}

DispatchResult dispatch::runDispatch(
    const HorizonInput& input,
    const AssetConfig& config,
    const SolverSettings& settings,
    const MilpSolverFactory& solver_factory,
    const string& run_label)
{
    //
    // Validate and build the model
    input.validate();
    validateSolverSettings(settings);
    MilpModel model;
    const DispatchOptimization::DispatchModelLayout layout = DispatchOptimization::buildDispatchModel(input, config, model);

    //
    // Solve (one retry with a relaxed time limit on solver errors)
    SolverSettings current_settings = settings;
    SolverOutcome outcome;
    string solver_name;
    unsigned int attempts = 0;
    while (attempts < 2) {
        unique_ptr<BaseMilpSolver> solver = solver_factory();
        if (!solver) {
            throw SolverError(run_label + ": no solver backend available.");
        }
        solver_name = solver->get_name();
        attempts++;
        global::n_solver_calls_started++;
        outcome = solver->solve(model, current_settings);
        global::n_solver_calls_finished++;
        if (outcome.status != SolverStatus::Error)
            break;
        if (attempts < 2) {
            current_settings.time_limit_s *= settings.retry_time_limit_factor;
            StatusOutput::add_warning(run_label + ": solver error (" + outcome.message + "), retrying with a time limit of " +
                                      to_string(current_settings.time_limit_s) + " s.");
        }
    }

    //
    // Handle the non-solution outcomes
    if (outcome.status == SolverStatus::Error) {
        throw SolverError(run_label + ": solver failed " + to_string(attempts) + " times, last message: " + outcome.message);
    }
    if (outcome.status == SolverStatus::Infeasible) {
        vector<InfeasibilityHint> hints = DispatchOptimization::findInfeasibilityHints(input, config);
        stringstream ss;
        ss << run_label << ": the dispatch problem is infeasible";
        if (!hints.empty()) {
            ss << " (" << hints.size() << " suspected cause(s), first: hour " << hints.front().hour << ", "
               << hints.front().constraint_class << ": " << hints.front().detail << ")";
        }
        throw InfeasibleModelError(ss.str(), hints);
    }
    if (outcome.status == SolverStatus::Unbounded) {
        string dump = DispatchOptimization::createVariableDump(model, outcome);
        StatusOutput::add_error_message(run_label + ": the dispatch problem is unbounded.");
        throw InternalConsistencyError(run_label + ": the dispatch problem is unbounded.", dump);
    }

    //
    // Extract and check the result
    DispatchResult result;
    try {
        result = DispatchOptimization::extractDispatchResult(input, config, model, layout, outcome);
    } catch (const InternalConsistencyError& e) {
        StatusOutput::add_error_message(run_label + ": " + e.what());
        throw;
    }
    result.proven_optimal  = (outcome.status == SolverStatus::Optimal);
    result.status          = result.proven_optimal ? DispatchStatus::Optimal : DispatchStatus::Feasible;
    result.solver_name     = solver_name;
    result.solver_attempts = attempts;
    result.solve_time_s    = outcome.wall_time_s;
    result.mip_gap         = std::fabs(outcome.objective_value - outcome.best_bound) / std::max(1e-10, std::fabs(outcome.objective_value));
    if (!result.proven_optimal) {
        stringstream ss;
        ss << "time limit of " << current_settings.time_limit_s << " s reached before optimality was proven (gap "
           << std::fixed << std::setprecision(2) << 100.0 * result.mip_gap << " %)";
        result.warnings.push_back(ss.str());
        StatusOutput::add_warning(run_label + ": " + ss.str());
    }
    return result;
}

DieselOnlyBaseline dispatch::computeDieselOnlyBaseline(const HorizonInput& input, const AssetConfig& config) {
    const unsigned long n_hours = input.get_n_hours();
    const double load_kWh = input.get_total_load_kWh();
    DieselOnlyBaseline baseline;
    baseline.cost   = n_hours * config.get_diesel_no_load_cost_per_h() + load_kWh * config.get_diesel_marginal_cost_per_kWh();
    baseline.fuel_L = config.get_fuel_consumption_L(n_hours, load_kWh);
    return baseline;
}
