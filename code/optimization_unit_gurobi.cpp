#include "optimization_unit_gurobi.hpp"

#include <chrono>
#include <cmath>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "milp_model.h"
#include "optimization_unit_general.hpp"

#include "gurobi_c++.h"


SolverOutcome GurobiMilpSolver::solve(const MilpModel& milp, const SolverSettings& settings) {
    SolverOutcome outcome;
    auto t_start = std::chrono::steady_clock::now();
    auto to_solver_bound = [](double b) -> double {
        if (std::isinf(b))
            return b > 0 ? GRB_INFINITY : -GRB_INFINITY;
        return b;
    };
    try {
        GRBEnv env = GRBEnv(true);
        env.set(GRB_IntParam_OutputFlag, settings.verbose ? 1 : 0);
        env.start();
        GRBModel model = GRBModel(env);
        model.set(GRB_DoubleParam_TimeLimit, settings.time_limit_s);
        model.set(GRB_DoubleParam_MIPGap, settings.relative_mip_gap);
        //
        // create the variables (objective coefficients are set directly)
        std::vector<GRBVar> vars;
        vars.reserve(milp.get_n_variables());
        for (const MilpVariable& v : milp.get_variables()) {
            const char vtype = (v.type == MilpVariableType::Binary) ? GRB_BINARY : GRB_CONTINUOUS;
            vars.push_back( model.addVar(to_solver_bound(v.lower_bound), to_solver_bound(v.upper_bound), v.objective_coefficient, vtype, v.name) );
        }
        model.set(GRB_DoubleAttr_ObjCon, milp.get_objective_offset());
        model.set(GRB_IntAttr_ModelSense, GRB_MINIMIZE);
        //
        // create the constraints
        for (const MilpConstraint& row : milp.get_constraints()) {
            GRBLinExpr expr = 0.0;
            for (const auto& entry : row.coefficients) {
                expr += entry.second * vars[entry.first];
            }
            if (row.lower_bound == row.upper_bound) {
                model.addConstr(expr == row.lower_bound, row.name);
            } else if (std::isinf(row.lower_bound)) {
                model.addConstr(expr <= row.upper_bound, row.name);
            } else if (std::isinf(row.upper_bound)) {
                model.addConstr(expr >= row.lower_bound, row.name);
            } else {
                model.addRange(expr, row.lower_bound, row.upper_bound, row.name);
            }
        }
        //
        // Execute the optimization and check results
        model.optimize();
        outcome.wall_time_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - t_start).count();
        const int model_status = model.get(GRB_IntAttr_Status);
        const int n_solutions  = model.get(GRB_IntAttr_SolCount);
        if (model_status == GRB_OPTIMAL) {
            outcome.status = SolverStatus::Optimal;
        } else if ((model_status == GRB_TIME_LIMIT || model_status == GRB_SUBOPTIMAL) && n_solutions > 0) {
            outcome.status = SolverStatus::Feasible;
        } else if (model_status == GRB_INFEASIBLE || model_status == GRB_INF_OR_UNBD) {
            // all variables are bounded, thus INF_OR_UNBD can only mean infeasible
            outcome.status = SolverStatus::Infeasible;
        } else if (model_status == GRB_UNBOUNDED) {
            outcome.status = SolverStatus::Unbounded;
        } else {
            std::cerr << "Optimization not resulting in optimal value.\n";
            std::cerr << "Gurobi model status = " << model_status << std::endl;
            outcome.status  = SolverStatus::Error;
            outcome.message = "Gurobi model status " + std::to_string(model_status);
            return outcome;
        }
        //
        // Get the results
        if (outcome.status == SolverStatus::Optimal || outcome.status == SolverStatus::Feasible) {
            outcome.values.resize(vars.size());
            for (size_t j = 0; j < vars.size(); j++) {
                outcome.values[j] = vars[j].get(GRB_DoubleAttr_X);
            }
            outcome.objective_value = model.get(GRB_DoubleAttr_ObjVal);
            outcome.best_bound      = model.get(GRB_DoubleAttr_ObjBound);
        }

    } catch (GRBException& e) {
        std::cerr << "Error during optimization (code = " << e.getErrorCode() << ") with message:" << std::endl;
        std::cerr << e.getMessage() << std::endl;
        outcome.status  = SolverStatus::Error;
        outcome.message = "Gurobi error " + std::to_string(e.getErrorCode()) + ": " + e.getMessage();
        outcome.values.clear();
    }
    return outcome;
}
