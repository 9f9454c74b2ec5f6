/*
 * milp_model.h
 *
 * This file contains a solver independent representation of a
 * mixed-integer linear program in row form:
 *
 *   min  c^T x + offset
 *   s.t. row_lb <= A x <= row_ub
 *        var_lb <= x   <= var_ub,  x_j binary for binary columns
 *
 * The solver adapters translate this form into their native models.
 *
 */

#ifndef MILP_MODEL_H
#define MILP_MODEL_H

#include <limits>
#include <string>
#include <utility>
#include <vector>

enum struct MilpVariableType : short {
    Continuous,
    Binary
};

struct MilpVariable {
    std::string name;
    double lower_bound;
    double upper_bound;
    MilpVariableType type;
    double objective_coefficient;
};

struct MilpConstraint {
    std::string name;
    double lower_bound;
    double upper_bound;
    std::vector<std::pair<size_t, double>> coefficients; ///< Sparse row: (column index, coefficient)
};

class MilpModel {
    public:
        static constexpr double infinity = std::numeric_limits<double>::infinity();

        /**
         * Adds a new column and returns its index.
         */
        size_t addVariable(double lower_bound, double upper_bound, MilpVariableType type, double objective_coefficient, const std::string& name);

        /**
         * Adds a new (empty) row and returns its index.
         * Use +/- MilpModel::infinity for one-sided rows.
         */
        size_t addConstraint(double lower_bound, double upper_bound, const std::string& name);

        /**
         * Sets the coefficient of column col in row row.
         * If the coefficient is already set, the value is added.
         */
        void setCoefficient(size_t row, size_t col, double value);

        void setObjectiveOffset(double offset) { objective_offset = offset; }

        const std::vector<MilpVariable>& get_variables() const { return variables; }
        const std::vector<MilpConstraint>& get_constraints() const { return constraints; }
        double get_objective_offset() const { return objective_offset; }
        size_t get_n_variables() const { return variables.size(); }
        size_t get_n_constraints() const { return constraints.size(); }
        size_t get_n_binary_variables() const;

        /// Returns c^T x + offset for the given assignment
        double evaluateObjective(const std::vector<double>& x) const;
        /// Returns the activity A_row x for the given assignment
        double computeRowActivity(size_t row, const std::vector<double>& x) const;

    private:
        std::vector<MilpVariable> variables;
        std::vector<MilpConstraint> constraints;
        double objective_offset = 0.0;
};

#endif
