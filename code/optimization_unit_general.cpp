#include "optimization_unit_general.hpp"

#include <memory>

#ifdef USE_OR_TOOLS
#include "optimization_unit_or_tools.hpp"
#elif defined(USE_GUROBI)
#include "optimization_unit_gurobi.hpp"
#endif


std::unique_ptr<BaseMilpSolver> createDefaultMilpSolver() {
#ifdef USE_OR_TOOLS
    return std::make_unique<ORToolsMilpSolver>();
#elif defined(USE_GUROBI)
    return std::make_unique<GurobiMilpSolver>();
#else
    #error "No solver backend selected. Define USE_OR_TOOLS or USE_GUROBI."
#endif
}

const char* solverStatusToString(SolverStatus status) {
    switch (status) {
        case SolverStatus::Optimal:    return "OPTIMAL";
        case SolverStatus::Feasible:   return "FEASIBLE";
        case SolverStatus::Infeasible: return "INFEASIBLE";
        case SolverStatus::Unbounded:  return "UNBOUNDED";
        case SolverStatus::Error:      return "ERROR";
    }
    return "UNKNOWN";
}
