/**
 * optimization_unit_gurobi.hpp
 *
 * This file contains the solver backend that calls gurobi.
 */

#ifndef OPTIMIZATION_UNIT_GUROBI_HPP
#define OPTIMIZATION_UNIT_GUROBI_HPP

#include <string>

#include "milp_model.h"
#include "optimization_unit_general.hpp"

#include "gurobi_c++.h"

/**
 * Gurobi backend. Every instance creates its own environment,
 * thus instances can be used in parallel threads.
 */
class GurobiMilpSolver : public BaseMilpSolver {

    public:
        std::string get_name() const override { return "Gurobi"; }

        SolverOutcome solve(const MilpModel& milp, const SolverSettings& settings) override;

};

#endif
