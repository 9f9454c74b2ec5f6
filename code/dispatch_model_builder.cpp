#include "dispatch_model_builder.h"

#include <sstream>
#include <string>
#include <vector>

#include "asset_config.h"
#include "dispatch_types.h"
#include "errors.h"
#include "milp_model.h"

using namespace std;

namespace DispatchOptimization {

DispatchModelLayout buildDispatchModel(const HorizonInput& input, const AssetConfig& config, MilpModel& model) {
    input.validate();
    if (model.get_n_variables() > 0) {
        throw logic_error("buildDispatchModel() requires an empty model.");
    }

    const unsigned long T = input.get_n_hours();
    const double inf = MilpModel::infinity;
    const double cap_diesel_kW = config.get_diesel_capacity_kW();
    const double min_stable_kW = config.get_diesel_min_stable_kW();
    const double max_charge_kW    = config.get_battery_max_charge_kW();
    const double max_discharge_kW = config.get_battery_max_discharge_kW();
    const double cap_bs_kWh = config.get_battery_capacity_kWh();
    const double eta_c = config.get_charge_efficiency();
    const double eta_d = config.get_discharge_efficiency();
    const double init_soc_kWh = config.get_battery_initial_soc_kWh();
    const double penalty = config.get_curtailment_penalty_per_kWh();

    DispatchModelLayout layout;
    layout.n_hours = T;
    layout.has_charge_mode = config.has_battery() &&
                             config.get_battery_exclusivity() == BatteryExclusivity::BinaryIndicator;

    //
    // Create the variables (block-wise)
    layout.v_pos_diesel_output_start = model.get_n_variables();
    for (unsigned long t = 0; t < T; t++)
        model.addVariable(0.0, cap_diesel_kW, MilpVariableType::Continuous, config.get_diesel_marginal_cost_per_kWh(), "diesel_output_" + to_string(t));
    layout.v_pos_diesel_on_start = model.get_n_variables();
    for (unsigned long t = 0; t < T; t++)
        model.addVariable(0.0, 1.0, MilpVariableType::Binary, config.get_diesel_no_load_cost_per_h(), "diesel_on_" + to_string(t));
    layout.v_pos_bs_charge_start = model.get_n_variables();
    for (unsigned long t = 0; t < T; t++)
        model.addVariable(0.0, max_charge_kW, MilpVariableType::Continuous, 0.0, "bs_charge_" + to_string(t));
    layout.v_pos_bs_discharge_start = model.get_n_variables();
    for (unsigned long t = 0; t < T; t++)
        model.addVariable(0.0, max_discharge_kW, MilpVariableType::Continuous, 0.0, "bs_discharge_" + to_string(t));
    // curtailment = available - used, i.e. penalty * available goes into the offset
    double curtailment_offset = 0.0;
    layout.v_pos_solar_used_start = model.get_n_variables();
    for (unsigned long t = 0; t < T; t++) {
        model.addVariable(0.0, input.solar_available_kW[t], MilpVariableType::Continuous, -penalty, "solar_used_" + to_string(t));
        curtailment_offset += penalty * input.solar_available_kW[t];
    }
    layout.v_pos_soc_start = model.get_n_variables();
    for (unsigned long t = 0; t < T; t++)
        model.addVariable(0.0, cap_bs_kWh, MilpVariableType::Continuous, 0.0, "soc_" + to_string(t));
    if (layout.has_charge_mode) {
        layout.v_pos_charge_mode_start = model.get_n_variables();
        for (unsigned long t = 0; t < T; t++)
            model.addVariable(0.0, 1.0, MilpVariableType::Binary, 0.0, "charge_mode_" + to_string(t));
    }
    model.setObjectiveOffset(curtailment_offset);

    //
    // Energy balance: diesel + discharge + solar_used - charge = load
    layout.r_pos_balance_start = model.get_n_constraints();
    for (unsigned long t = 0; t < T; t++) {
        size_t r = model.addConstraint(input.load_kW[t], input.load_kW[t], "balance_" + to_string(t));
        model.setCoefficient(r, layout.v_pos_diesel_output_start + t,  1.0);
        model.setCoefficient(r, layout.v_pos_bs_discharge_start  + t,  1.0);
        model.setCoefficient(r, layout.v_pos_solar_used_start    + t,  1.0);
        model.setCoefficient(r, layout.v_pos_bs_charge_start     + t, -1.0);
    }
    //
    // Diesel gating: min_stable * on <= diesel <= cap * on
    layout.r_pos_diesel_min_start = model.get_n_constraints();
    for (unsigned long t = 0; t < T; t++) {
        size_t r = model.addConstraint(0.0, inf, "diesel_min_" + to_string(t));
        model.setCoefficient(r, layout.v_pos_diesel_output_start + t, 1.0);
        model.setCoefficient(r, layout.v_pos_diesel_on_start     + t, -min_stable_kW);
    }
    layout.r_pos_diesel_max_start = model.get_n_constraints();
    for (unsigned long t = 0; t < T; t++) {
        size_t r = model.addConstraint(-inf, 0.0, "diesel_max_" + to_string(t));
        model.setCoefficient(r, layout.v_pos_diesel_output_start + t, 1.0);
        model.setCoefficient(r, layout.v_pos_diesel_on_start     + t, -cap_diesel_kW);
    }
    //
    // SoC continuity: soc[t] - soc[t-1] - eta_c * charge[t] + discharge[t] / eta_d = 0  (= init_soc for t = 0)
    layout.r_pos_soc_start = model.get_n_constraints();
    for (unsigned long t = 0; t < T; t++) {
        const double rhs = (t == 0) ? init_soc_kWh : 0.0;
        size_t r = model.addConstraint(rhs, rhs, "soc_continuity_" + to_string(t));
        model.setCoefficient(r, layout.v_pos_soc_start + t, 1.0);
        if (t > 0)
            model.setCoefficient(r, layout.v_pos_soc_start + t - 1, -1.0);
        model.setCoefficient(r, layout.v_pos_bs_charge_start    + t, -eta_c);
        model.setCoefficient(r, layout.v_pos_bs_discharge_start + t, 1.0 / eta_d);
    }
    //
    // Exclusive charging or discharging
    if (layout.has_charge_mode) {
        layout.r_pos_charge_mode_start = model.get_n_constraints();
        for (unsigned long t = 0; t < T; t++) {
            size_t r = model.addConstraint(-inf, 0.0, "charge_mode_" + to_string(t));
            model.setCoefficient(r, layout.v_pos_bs_charge_start   + t, 1.0);
            model.setCoefficient(r, layout.v_pos_charge_mode_start + t, -max_charge_kW);
        }
        layout.r_pos_discharge_mode_start = model.get_n_constraints();
        for (unsigned long t = 0; t < T; t++) {
            // discharge <= max_discharge * (1 - mode)
            size_t r = model.addConstraint(-inf, max_discharge_kW, "discharge_mode_" + to_string(t));
            model.setCoefficient(r, layout.v_pos_bs_discharge_start + t, 1.0);
            model.setCoefficient(r, layout.v_pos_charge_mode_start  + t, max_discharge_kW);
        }
    }
    //
    // Terminal SoC
    layout.r_pos_terminal_soc = model.addConstraint(init_soc_kWh, inf, "terminal_soc");
    model.setCoefficient(layout.r_pos_terminal_soc, layout.v_pos_soc_start + T - 1, 1.0);

    return layout;
}

vector<InfeasibilityHint> findInfeasibilityHints(const HorizonInput& input, const AssetConfig& config) {
    vector<InfeasibilityHint> hints;
    const double cap_diesel_kW    = config.get_diesel_capacity_kW();
    const double min_stable_kW    = config.get_diesel_min_stable_kW();
    const double max_charge_kW    = config.get_battery_max_charge_kW();
    const double max_discharge_kW = config.get_battery_max_discharge_kW();

    const size_t T = input.get_n_hours();
    for (size_t t = 0; t < T && t < input.solar_available_kW.size(); t++) {
        const double load  = input.load_kW[t];
        const double solar = input.solar_available_kW[t];
        if (load > cap_diesel_kW + max_discharge_kW + solar) {
            stringstream ss;
            ss << "load " << load << " kW exceeds diesel capacity " << cap_diesel_kW
               << " kW + max. discharge " << max_discharge_kW << " kW + available solar " << solar << " kW";
            hints.push_back({t, "capacity shortfall", ss.str()});
            continue;
        }
        const bool diesel_required = load > solar + max_discharge_kW;
        if (diesel_required && min_stable_kW > load + max_charge_kW) {
            stringstream ss;
            ss << "diesel has to run, but its min. stable load " << min_stable_kW
               << " kW exceeds load " << load << " kW + max. charge " << max_charge_kW << " kW";
            hints.push_back({t, "diesel minimum load", ss.str()});
        }
    }
    if (hints.empty() && T > 0) {
        stringstream ss;
        ss << "no single hour is infeasible; the energy budget of the battery (terminal SoC >= "
           << config.get_battery_initial_soc_kWh() << " kWh) is the suspected cause";
        hints.push_back({T - 1, "terminal state of charge", ss.str()});
    }
    return hints;
}

}
