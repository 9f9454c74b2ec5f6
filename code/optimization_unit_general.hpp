/**
 * optimization_unit_general.hpp
 *
 * This file contains all general classes / structs required
 * by the solver implementations.
 */

#ifndef OPTIMIZATION_UNIT_GENERAL_HPP
#define OPTIMIZATION_UNIT_GENERAL_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "milp_model.h"

/**
 * Outcome of one solver call, independent of the backend used.
 */
enum struct SolverStatus : short {
    Optimal,    ///< Proven optimal (within the relative MIP gap)
    Feasible,   ///< Time limit reached with an incumbent solution
    Infeasible, ///< Proven infeasible
    Unbounded,  ///< Proven unbounded
    Error       ///< Any other termination (including time limit without incumbent)
};

/**
 * Settings passed to every solver call.
 */
struct SolverSettings {
    double time_limit_s     = 30.0;  ///< Wall clock time limit of one solver call
    double relative_mip_gap = 0.05;  ///< Relative MIP gap at which the search stops
    double retry_time_limit_factor = 2.0; ///< The time limit is multiplied by this factor for the retry after an error
    bool   verbose          = false; ///< If true, the solver log is printed to stdout
};

/**
 * Result of one solver call.
 * values is only filled for SolverStatus::Optimal and SolverStatus::Feasible.
 */
struct SolverOutcome {
    SolverStatus status = SolverStatus::Error;
    std::vector<double> values; ///< Assignment for all columns of the model
    double objective_value = 0.0;
    double best_bound      = 0.0;
    double wall_time_s     = 0.0;
    std::string message;        ///< Backend specific status text
};


/**
 * This class represents the base class for a MILP solver backend.
 * One instance is used for one run only, i.e., it is never shared between threads.
 */
class BaseMilpSolver {
    public:
        virtual ~BaseMilpSolver() = default;

        /**
         * Solves the given model.
         * Errors inside of the backend are not thrown, but reported as SolverStatus::Error.
         *
         * @param model: The model in normalized form
         * @param settings: Time limit and gap settings
         *
         * @return: Returns the status, and, if a solution is available, the assignment of all variables
         */
        virtual SolverOutcome solve(const MilpModel& model, const SolverSettings& settings) = 0;

        /**
         * Returns the name of the backend (e.g. for the output)
         */
        virtual std::string get_name() const = 0;
};

/// Function creating a new solver instance for every run
using MilpSolverFactory = std::function<std::unique_ptr<BaseMilpSolver>()>;

/**
 * Creates a solver instance of the backend selected at compile time
 * (USE_OR_TOOLS or USE_GUROBI).
 */
std::unique_ptr<BaseMilpSolver> createDefaultMilpSolver();

const char* solverStatusToString(SolverStatus status);

#endif
