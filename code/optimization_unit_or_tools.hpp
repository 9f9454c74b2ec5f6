/**
 * optimization_unit_or_tools.hpp
 *
 * This file contains the solver backend that calls SCIP via the
 * linear solver wrapper of Google OR-Tools.
 */

#ifndef OPTIMIZATION_UNIT_OR_TOOLS_HPP
#define OPTIMIZATION_UNIT_OR_TOOLS_HPP

#include <chrono>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "milp_model.h"
#include "optimization_unit_general.hpp"

#include "ortools/linear_solver/linear_solver.h"

using namespace operations_research;

class ORToolsMilpSolver : public BaseMilpSolver {

    public:
    std::string get_name() const override { return "OR-Tools/SCIP"; }

    SolverOutcome solve(const MilpModel& milp, const SolverSettings& settings) override {
        SolverOutcome outcome;
        auto t_start = std::chrono::steady_clock::now();
        // Initialize the solver
        std::unique_ptr<MPSolver> model(MPSolver::CreateSolver("SCIP"));
        if (!model) {
            outcome.status  = SolverStatus::Error;
            outcome.message = "SCIP solver unavailable.";
            return outcome;
        }
        if (settings.verbose) {
            model->EnableOutput();
        } else {
            model->SuppressOutput();
        }
        model->set_time_limit(static_cast<int64_t>(settings.time_limit_s * 1000.0));
        const double infinity = model->infinity();
        auto to_solver_bound = [infinity](double b) -> double {
            if (std::isinf(b))
                return b > 0 ? infinity : -infinity;
            return b;
        };
        //
        // Create the variables
        std::vector<MPVariable*> vars;
        vars.reserve(milp.get_n_variables());
        for (const MilpVariable& v : milp.get_variables()) {
            if (v.type == MilpVariableType::Binary) {
                vars.push_back( model->MakeIntVar(v.lower_bound, v.upper_bound, v.name) );
            } else {
                vars.push_back( model->MakeNumVar(to_solver_bound(v.lower_bound), to_solver_bound(v.upper_bound), v.name) );
            }
        }
        //
        // Create the constraints
        for (const MilpConstraint& row : milp.get_constraints()) {
            MPConstraint* const c = model->MakeRowConstraint(to_solver_bound(row.lower_bound), to_solver_bound(row.upper_bound), row.name);
            for (const auto& entry : row.coefficients) {
                c->SetCoefficient(vars[entry.first], entry.second);
            }
        }
        //
        // Define the objective function
        MPObjective* const objective = model->MutableObjective();
        for (size_t j = 0; j < vars.size(); j++) {
            const double coeff = milp.get_variables()[j].objective_coefficient;
            if (coeff != 0.0)
                objective->SetCoefficient(vars[j], coeff);
        }
        objective->SetOffset(milp.get_objective_offset());
        objective->SetMinimization();
        //
        // Execute the optimization and check results
        MPSolverParameters params;
        params.SetDoubleParam(MPSolverParameters::RELATIVE_MIP_GAP, settings.relative_mip_gap);
        const MPSolver::ResultStatus result_status = model->Solve(params);
        outcome.wall_time_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - t_start).count();
        switch (result_status) {
            case MPSolver::OPTIMAL:
                outcome.status = SolverStatus::Optimal;
                break;
            case MPSolver::FEASIBLE:
                outcome.status = SolverStatus::Feasible;
                break;
            case MPSolver::INFEASIBLE:
                outcome.status = SolverStatus::Infeasible;
                break;
            case MPSolver::UNBOUNDED:
                outcome.status = SolverStatus::Unbounded;
                break;
            case MPSolver::NOT_SOLVED:
                outcome.status  = SolverStatus::Error;
                outcome.message = "No solution found within the time limit.";
                return outcome;
            default:
                std::cerr << "Optimization not resulting in optimal value.\n";
                std::cerr << "Solver status = " << result_status << std::endl;
                outcome.status  = SolverStatus::Error;
                outcome.message = "Solver terminated with status " + std::to_string(static_cast<int>(result_status)) + ".";
                return outcome;
        }
        //
        // Get the results
        if (outcome.status == SolverStatus::Optimal || outcome.status == SolverStatus::Feasible) {
            outcome.values.resize(vars.size());
            for (size_t j = 0; j < vars.size(); j++) {
                outcome.values[j] = vars[j]->solution_value();
            }
            outcome.objective_value = objective->Value();
            outcome.best_bound      = objective->BestBound();
        }
        return outcome;
    }

};

#endif
