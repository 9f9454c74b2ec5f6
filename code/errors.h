/*
 * errors.h
 *
 * This file contains the exception types that are thrown
 * by the dispatch engine and its helpers.
 *
 */

#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>
#include <vector>

/**
 * Base class of all errors raised during a dispatch run.
 */
class DispatchError : public std::runtime_error {
    public:
        explicit DispatchError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Invalid configuration or invalid input series.
 * It is always thrown before the solver is called.
 */
class ConfigurationError : public DispatchError {
    public:
        explicit ConfigurationError(const std::string& message) : DispatchError(message) {}
};

/**
 * One suspected cause of an infeasible model.
 */
struct InfeasibilityHint {
    unsigned long hour; ///< Hour index within the horizon (0-based)
    std::string constraint_class; ///< Name of the constraint class that is suspected to be violated
    std::string detail; ///< Human readable explanation including the numbers involved
};

/**
 * The solver proved that no dispatch satisfies all constraints.
 */
class InfeasibleModelError : public DispatchError {
    public:
        InfeasibleModelError(const std::string& message, const std::vector<InfeasibilityHint>& hints)
            : DispatchError(message), hints(hints) {}
        const std::vector<InfeasibilityHint>& get_hints() const { return hints; }

    private:
        std::vector<InfeasibilityHint> hints;
};

/**
 * The solver returned something that violates the model (or the model is unbounded).
 * The variable dump (CSV formatted) is attached for later inspection.
 */
class InternalConsistencyError : public DispatchError {
    public:
        InternalConsistencyError(const std::string& message, const std::string& variable_dump)
            : DispatchError(message), variable_dump(variable_dump) {}
        const std::string& get_variable_dump() const { return variable_dump; }

    private:
        std::string variable_dump;
};

/**
 * The solver failed with an error, also after the retry with a relaxed time limit.
 */
class SolverError : public DispatchError {
    public:
        explicit SolverError(const std::string& message) : DispatchError(message) {}
};

#endif
