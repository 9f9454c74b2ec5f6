#include "milp_model.h"

#include <stdexcept>
#include <string>
#include <vector>

using namespace std;


size_t MilpModel::addVariable(double lower_bound, double upper_bound, MilpVariableType type, double objective_coefficient, const string& name) {
    if (lower_bound > upper_bound) {
        throw logic_error("Variable " + name + " has a lower bound above its upper bound.");
    }
    variables.push_back({name, lower_bound, upper_bound, type, objective_coefficient});
    return variables.size() - 1;
}

size_t MilpModel::addConstraint(double lower_bound, double upper_bound, const string& name) {
    constraints.push_back({name, lower_bound, upper_bound, {}});
    return constraints.size() - 1;
}

void MilpModel::setCoefficient(size_t row, size_t col, double value) {
    if (row >= constraints.size() || col >= variables.size()) {
        throw out_of_range("Coefficient (" + to_string(row) + ", " + to_string(col) + ") is outside of the model.");
    }
    for (auto& entry : constraints[row].coefficients) {
        if (entry.first == col) {
            entry.second += value;
            return;
        }
    }
    constraints[row].coefficients.emplace_back(col, value);
}

size_t MilpModel::get_n_binary_variables() const {
    size_t n = 0;
    for (const MilpVariable& v : variables) {
        if (v.type == MilpVariableType::Binary)
            n++;
    }
    return n;
}

double MilpModel::evaluateObjective(const vector<double>& x) const {
    double value = objective_offset;
    for (size_t j = 0; j < variables.size() && j < x.size(); j++) {
        value += variables[j].objective_coefficient * x[j];
    }
    return value;
}

double MilpModel::computeRowActivity(size_t row, const vector<double>& x) const {
    double activity = 0.0;
    for (const auto& entry : constraints.at(row).coefficients) {
        activity += entry.second * x.at(entry.first);
    }
    return activity;
}
