#include "result_extractor.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

#include "errors.h"

using namespace std;

namespace {

    // absolute tolerance for a quantity of the given magnitude
    inline double tol(double magnitude) {
        return DispatchOptimization::validation_rel_tolerance * std::max(1.0, std::fabs(magnitude));
    }

    // removes solver noise around zero and small bound violations
    inline double clean(double value, double upper) {
        if (value < 0.0)
            return 0.0;
        if (value > upper)
            return upper;
        return value;
    }

}

namespace DispatchOptimization {

DispatchResult extractDispatchResult(
    const HorizonInput& input,
    const AssetConfig& config,
    const MilpModel& model,
    const DispatchModelLayout& layout,
    const SolverOutcome& outcome)
{
    if (outcome.values.size() != model.get_n_variables()) {
        throw InternalConsistencyError("Solver returned " + to_string(outcome.values.size()) + " values for a model with " +
                                       to_string(model.get_n_variables()) + " variables.", createVariableDump(model, outcome));
    }
    const vector<double>& x = outcome.values;
    const unsigned long T = layout.n_hours;

    //
    // map the assignment onto hourly decisions (raw values, checked below)
    vector<DispatchDecision> raw_schedule(T);
    for (unsigned long t = 0; t < T; t++) {
        DispatchDecision& d = raw_schedule[t];
        d.hour                 = t;
        d.timestamp            = (input.timestamps.size() > t) ? input.timestamps[t] : "";
        d.load_kW              = input.load_kW[t];
        d.solar_available_kW   = input.solar_available_kW[t];
        d.diesel_output_kW     = x[layout.v_pos_diesel_output_start + t];
        d.diesel_on            = x[layout.v_pos_diesel_on_start + t] > 0.5;
        d.battery_charge_kW    = x[layout.v_pos_bs_charge_start + t];
        d.battery_discharge_kW = x[layout.v_pos_bs_discharge_start + t];
        d.solar_used_kW        = x[layout.v_pos_solar_used_start + t];
        d.soc_kWh              = x[layout.v_pos_soc_start + t];
        d.curtailed_kW         = d.solar_available_kW - d.solar_used_kW;
    }

    vector<string> violations = validateSchedule(input, config, raw_schedule);
    if (!violations.empty()) {
        stringstream ss;
        ss << "Solution violates " << violations.size() << " model constraint(s), first: " << violations.front();
        throw InternalConsistencyError(ss.str(), createVariableDump(model, outcome));
    }

    //
    // clean the values for the reporting
    DispatchResult result;
    result.schedule = raw_schedule;
    for (DispatchDecision& d : result.schedule) {
        d.diesel_output_kW     = d.diesel_on ? clean(d.diesel_output_kW, config.get_diesel_capacity_kW()) : 0.0;
        d.battery_charge_kW    = clean(d.battery_charge_kW,    config.get_battery_max_charge_kW());
        d.battery_discharge_kW = clean(d.battery_discharge_kW, config.get_battery_max_discharge_kW());
        d.solar_used_kW        = clean(d.solar_used_kW, d.solar_available_kW);
        d.curtailed_kW         = d.solar_available_kW - d.solar_used_kW;
        d.soc_kWh              = clean(d.soc_kWh, config.get_battery_capacity_kWh());
    }
    result.summary = summarizeSchedule(input, config, result.schedule);
    result.summary.objective_value = outcome.objective_value;
    result.summary.best_bound      = outcome.best_bound;

    //
    // the recomputed cost has to match the objective of the solver
    const double cost_diff = std::fabs(result.summary.total_cost - outcome.objective_value);
    if (cost_diff > 100.0 * tol(outcome.objective_value)) {
        stringstream ss;
        ss << "Recomputed total cost " << result.summary.total_cost << " differs from the solver objective "
           << outcome.objective_value << ".";
        throw InternalConsistencyError(ss.str(), createVariableDump(model, outcome));
    }
    return result;
}

vector<string> validateSchedule(
    const HorizonInput& input,
    const AssetConfig& config,
    const vector<DispatchDecision>& schedule)
{
    vector<string> violations;
    const double cap_diesel_kW = config.get_diesel_capacity_kW();
    const double min_stable_kW = config.get_diesel_min_stable_kW();
    const double cap_bs_kWh    = config.get_battery_capacity_kWh();
    const double eta_c = config.get_charge_efficiency();
    const double eta_d = config.get_discharge_efficiency();
    const double init_soc_kWh = config.get_battery_initial_soc_kWh();

    if (schedule.size() != input.get_n_hours()) {
        violations.push_back("schedule has " + to_string(schedule.size()) + " hours, input has " + to_string(input.get_n_hours()));
        return violations;
    }
    auto report = [&](size_t t, const string& what, double value) {
        stringstream ss;
        ss << "hour " << t << ": " << what << " (value " << setprecision(10) << value << ")";
        violations.push_back(ss.str());
    };

    double prev_soc = init_soc_kWh;
    for (size_t t = 0; t < schedule.size(); t++) {
        const DispatchDecision& d = schedule[t];
        // energy balance
        const double supply = d.diesel_output_kW + d.battery_discharge_kW + d.solar_used_kW;
        const double demand = input.load_kW[t] + d.battery_charge_kW;
        if (std::fabs(supply - demand) > tol(demand))
            report(t, "energy balance violated", supply - demand);
        // solar
        if (d.solar_used_kW < -tol(0.0) || d.solar_used_kW > input.solar_available_kW[t] + tol(input.solar_available_kW[t]))
            report(t, "used solar outside of [0, available]", d.solar_used_kW);
        // battery power
        if (d.battery_charge_kW < -tol(0.0) || d.battery_charge_kW > config.get_battery_max_charge_kW() + tol(config.get_battery_max_charge_kW()))
            report(t, "charging power outside of its limits", d.battery_charge_kW);
        if (d.battery_discharge_kW < -tol(0.0) || d.battery_discharge_kW > config.get_battery_max_discharge_kW() + tol(config.get_battery_max_discharge_kW()))
            report(t, "discharging power outside of its limits", d.battery_discharge_kW);
        // SoC bounds and continuity
        if (d.soc_kWh < -tol(cap_bs_kWh) || d.soc_kWh > cap_bs_kWh + tol(cap_bs_kWh))
            report(t, "SoC outside of [0, capacity]", d.soc_kWh);
        const double expected_soc = prev_soc + eta_c * d.battery_charge_kW - d.battery_discharge_kW / eta_d;
        if (std::fabs(d.soc_kWh - expected_soc) > tol(cap_bs_kWh))
            report(t, "SoC continuity violated", d.soc_kWh - expected_soc);
        prev_soc = d.soc_kWh;
        // diesel gating (the on-variable is only integral up to the integrality tolerance of the solver)
        if (d.diesel_on) {
            if (d.diesel_output_kW < min_stable_kW - 10.0 * tol(cap_diesel_kW))
                report(t, "diesel on below its min. stable load", d.diesel_output_kW);
            if (d.diesel_output_kW > cap_diesel_kW + tol(cap_diesel_kW))
                report(t, "diesel above its capacity", d.diesel_output_kW);
        } else if (std::fabs(d.diesel_output_kW) > 10.0 * tol(cap_diesel_kW)) {
            report(t, "diesel off but producing", d.diesel_output_kW);
        }
    }
    // terminal SoC
    if (!schedule.empty() && schedule.back().soc_kWh < init_soc_kWh - tol(init_soc_kWh))
        report(schedule.size() - 1, "terminal SoC below the initial SoC", schedule.back().soc_kWh);

    return violations;
}

DispatchSummary summarizeSchedule(
    const HorizonInput& input,
    const AssetConfig& config,
    const vector<DispatchDecision>& schedule)
{
    const AssetParameters& p = config.get_parameters();
    DispatchSummary s;
    for (const DispatchDecision& d : schedule) {
        s.load_energy_kWh       += d.load_kW;
        s.diesel_energy_kWh     += d.diesel_output_kW;
        s.battery_charge_kWh    += d.battery_charge_kW;
        s.battery_discharge_kWh += d.battery_discharge_kW;
        s.solar_available_kWh   += d.solar_available_kW;
        s.solar_used_kWh        += d.solar_used_kW;
        s.curtailed_kWh         += d.curtailed_kW;
        if (d.diesel_on)
            s.diesel_running_hours++;
    }
    s.no_load_cost        = s.diesel_running_hours * config.get_diesel_no_load_cost_per_h();
    s.fuel_cost           = s.diesel_energy_kWh * p.fuel_cost_per_kWh  + s.diesel_running_hours * p.diesel_no_load_fuel_cost_per_h;
    s.carbon_cost         = s.diesel_energy_kWh * p.carbon_tax_per_kWh + s.diesel_running_hours * p.diesel_no_load_carbon_cost_per_h;
    s.curtailment_penalty = s.curtailed_kWh * p.curtailment_penalty_per_kWh;
    s.total_cost          = s.fuel_cost + s.carbon_cost + s.curtailment_penalty;
    s.fuel_L              = config.get_fuel_consumption_L(s.diesel_running_hours, s.diesel_energy_kWh);
    s.initial_soc_kWh     = config.get_battery_initial_soc_kWh();
    s.terminal_soc_kWh    = schedule.empty() ? s.initial_soc_kWh : schedule.back().soc_kWh;

    const double H = static_cast<double>(input.get_n_hours());
    if (H > 0.0) {
        s.diesel_capacity_factor = s.diesel_energy_kWh / (config.get_diesel_capacity_kW() * H);
        if (config.get_battery_max_discharge_kW() > 0.0)
            s.battery_capacity_factor = s.battery_discharge_kWh / (config.get_battery_max_discharge_kW() * H);
    }
    if (s.solar_available_kWh > 0.0)
        s.solar_capacity_factor = s.solar_used_kWh / s.solar_available_kWh;
    return s;
}

string createVariableDump(const MilpModel& model, const SolverOutcome& outcome) {
    stringstream ss;
    ss << setprecision(12);
    ss << "Index,Name,Type,LowerBound,UpperBound,ObjectiveCoefficient,Value\n";
    const vector<MilpVariable>& vars = model.get_variables();
    for (size_t j = 0; j < vars.size(); j++) {
        ss << j << "," << vars[j].name << ",";
        ss << (vars[j].type == MilpVariableType::Binary ? "binary" : "continuous") << ",";
        ss << vars[j].lower_bound << "," << vars[j].upper_bound << "," << vars[j].objective_coefficient << ",";
        if (j < outcome.values.size())
            ss << outcome.values[j];
        ss << "\n";
    }
    return ss.str();
}

}
