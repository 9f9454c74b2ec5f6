/*
 * test_model_builder.cpp
 *
 * Unit tests for the MILP representation, the construction of the
 * dispatch model and the infeasibility hints.
 *
 */

#define BOOST_TEST_MODULE model_builder
#include <boost/test/unit_test.hpp>

#include <vector>

#include "asset_config.h"
#include "dispatch_model_builder.h"
#include "errors.h"
#include "milp_model.h"
#include "test_helpers.hpp"

using namespace testhelper;
using namespace DispatchOptimization;


BOOST_AUTO_TEST_CASE(milp_model_rows_and_objective) {
    MilpModel model;
    size_t x = model.addVariable(0.0, 10.0, MilpVariableType::Continuous, 2.0, "x");
    size_t y = model.addVariable(0.0, 1.0, MilpVariableType::Binary, -1.0, "y");
    model.setObjectiveOffset(5.0);
    size_t r = model.addConstraint(-MilpModel::infinity, 4.0, "r");
    model.setCoefficient(r, x, 1.0);
    model.setCoefficient(r, y, 3.0);
    model.setCoefficient(r, y, 1.0); // accumulates

    BOOST_CHECK_EQUAL(model.get_n_variables(), 2u);
    BOOST_CHECK_EQUAL(model.get_n_binary_variables(), 1u);
    BOOST_CHECK_CLOSE(model.evaluateObjective({3.0, 1.0}), 2.0 * 3.0 - 1.0 + 5.0, 1e-12);
    BOOST_CHECK_CLOSE(model.computeRowActivity(r, {3.0, 1.0}), 3.0 + 4.0, 1e-12);
}

BOOST_AUTO_TEST_CASE(variable_and_row_counts_with_indicator) {
    const HorizonInput input = makeHorizon({100.0, 120.0, 80.0, 60.0}, {0.0, 50.0, 90.0, 10.0});
    AssetParameters p = parametersWithBattery(200.0, 50.0);
    p.battery_exclusivity = BatteryExclusivity::BinaryIndicator;
    AssetConfig config(p);
    MilpModel model;
    DispatchModelLayout layout = buildDispatchModel(input, config, model);

    BOOST_CHECK(layout.has_charge_mode);
    BOOST_CHECK_EQUAL(layout.n_hours, 4u);
    // 7 blocks of variables per hour
    BOOST_CHECK_EQUAL(model.get_n_variables(), 7u * 4u);
    BOOST_CHECK_EQUAL(model.get_n_binary_variables(), 2u * 4u);
    // balance, diesel min/max, SoC, charge / discharge mode per hour + terminal SoC
    BOOST_CHECK_EQUAL(model.get_n_constraints(), 6u * 4u + 1u);
}

BOOST_AUTO_TEST_CASE(cost_dominance_has_no_charge_mode) {
    const HorizonInput input = makeHorizon({100.0, 120.0}, {0.0, 50.0});
    AssetParameters p = parametersWithBattery(200.0, 50.0);
    p.battery_exclusivity = BatteryExclusivity::CostDominance;
    MilpModel model;
    DispatchModelLayout layout = buildDispatchModel(input, AssetConfig(p), model);
    BOOST_CHECK(!layout.has_charge_mode);
    BOOST_CHECK_EQUAL(model.get_n_variables(), 6u * 2u);
    BOOST_CHECK_EQUAL(model.get_n_binary_variables(), 2u);
    BOOST_CHECK_EQUAL(model.get_n_constraints(), 4u * 2u + 1u);
}

BOOST_AUTO_TEST_CASE(no_battery_has_no_charge_mode) {
    const HorizonInput input = makeHorizon({100.0}, {0.0});
    MilpModel model;
    DispatchModelLayout layout = buildDispatchModel(input, AssetConfig(simpleParameters()), model);
    BOOST_CHECK(!layout.has_charge_mode);
    BOOST_CHECK_EQUAL(model.get_variables()[layout.v_pos_bs_charge_start].upper_bound, 0.0);
    BOOST_CHECK_EQUAL(model.get_variables()[layout.v_pos_soc_start].upper_bound, 0.0);
}

BOOST_AUTO_TEST_CASE(bounds_objective_and_offset) {
    const HorizonInput input = makeHorizon({100.0, 40.0}, {30.0, 70.0});
    AssetParameters p = parametersWithBattery(200.0, 50.0);
    p.diesel_no_load_fuel_cost_per_h = 3.0;
    p.curtailment_penalty_per_kWh    = 0.02;
    AssetConfig config(p);
    MilpModel model;
    DispatchModelLayout layout = buildDispatchModel(input, config, model);
    const std::vector<MilpVariable>& vars = model.get_variables();

    BOOST_CHECK_EQUAL(vars[layout.v_pos_diesel_output_start].upper_bound, 200.0);
    BOOST_CHECK_CLOSE(vars[layout.v_pos_diesel_output_start].objective_coefficient, 0.6, 1e-9);
    BOOST_CHECK(vars[layout.v_pos_diesel_on_start].type == MilpVariableType::Binary);
    BOOST_CHECK_CLOSE(vars[layout.v_pos_diesel_on_start].objective_coefficient, 3.0, 1e-9);
    BOOST_CHECK_EQUAL(vars[layout.v_pos_solar_used_start + 1].upper_bound, 70.0);
    BOOST_CHECK_CLOSE(vars[layout.v_pos_solar_used_start].objective_coefficient, -0.02, 1e-9);
    BOOST_CHECK_EQUAL(vars[layout.v_pos_soc_start].upper_bound, 200.0);
    // penalty * total available solar
    BOOST_CHECK_CLOSE(model.get_objective_offset(), 0.02 * 100.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(balance_and_soc_rows) {
    const HorizonInput input = makeHorizon({100.0, 40.0}, {30.0, 70.0});
    AssetParameters p = parametersWithBattery(200.0, 50.0);
    p.battery_round_trip_efficiency = 0.81;
    AssetConfig config(p);
    MilpModel model;
    DispatchModelLayout layout = buildDispatchModel(input, config, model);

    const MilpConstraint& balance = model.get_constraints()[layout.r_pos_balance_start + 1];
    BOOST_CHECK_EQUAL(balance.lower_bound, 40.0);
    BOOST_CHECK_EQUAL(balance.upper_bound, 40.0);

    // SoC row of hour 0: soc - 0.9 charge + discharge / 0.9 = initial SoC
    const MilpConstraint& soc0 = model.get_constraints()[layout.r_pos_soc_start];
    BOOST_CHECK_EQUAL(soc0.lower_bound, 100.0);
    std::vector<double> x(model.get_n_variables(), 0.0);
    x[layout.v_pos_soc_start]          = 100.0 + 0.9 * 10.0;
    x[layout.v_pos_bs_charge_start]    = 10.0;
    BOOST_CHECK_CLOSE(model.computeRowActivity(layout.r_pos_soc_start, x), 100.0, 1e-9);

    const MilpConstraint& terminal = model.get_constraints()[layout.r_pos_terminal_soc];
    BOOST_CHECK_EQUAL(terminal.lower_bound, 100.0);
    BOOST_CHECK_EQUAL(terminal.coefficients.size(), 1u);
    BOOST_CHECK_EQUAL(terminal.coefficients[0].first, layout.v_pos_soc_start + 1);
}

BOOST_AUTO_TEST_CASE(diesel_gating_rows) {
    const HorizonInput input = makeHorizon({100.0}, {0.0});
    AssetParameters p = simpleParameters();
    p.diesel_min_load_fraction = 0.25;
    MilpModel model;
    DispatchModelLayout layout = buildDispatchModel(input, AssetConfig(p), model);

    std::vector<double> x(model.get_n_variables(), 0.0);
    x[layout.v_pos_diesel_output_start] = 40.0;
    x[layout.v_pos_diesel_on_start]     = 1.0;
    // 40 - 50 * 1 < 0: violates the min. stable load row
    BOOST_CHECK_CLOSE(model.computeRowActivity(layout.r_pos_diesel_min_start, x), -10.0, 1e-9);
    BOOST_CHECK_CLOSE(model.computeRowActivity(layout.r_pos_diesel_max_start, x), 40.0 - 200.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(invalid_input_or_used_model) {
    AssetConfig config(simpleParameters());
    MilpModel model;
    BOOST_CHECK_THROW(buildDispatchModel(makeHorizon({100.0, 50.0}, {0.0}), config, model), ConfigurationError);
    buildDispatchModel(makeHorizon({100.0}, {0.0}), config, model);
    BOOST_CHECK_THROW(buildDispatchModel(makeHorizon({100.0}, {0.0}), config, model), std::logic_error);
}


BOOST_AUTO_TEST_SUITE(infeasibility_hints)

BOOST_AUTO_TEST_CASE(capacity_shortfall) {
    // hour 1: 400 > 200 + 50 + 20
    const HorizonInput input = makeHorizon({100.0, 400.0, 100.0}, {0.0, 20.0, 0.0});
    std::vector<InfeasibilityHint> hints = findInfeasibilityHints(input, AssetConfig(parametersWithBattery(100.0, 50.0)));
    BOOST_REQUIRE_EQUAL(hints.size(), 1u);
    BOOST_CHECK_EQUAL(hints[0].hour, 1u);
    BOOST_CHECK_EQUAL(hints[0].constraint_class, "capacity shortfall");
}

BOOST_AUTO_TEST_CASE(diesel_minimum_load) {
    // diesel must run (load 20 > 0 solar + 0 discharge), but its min. load 100 > 20 + 0
    AssetParameters p = simpleParameters();
    p.diesel_min_load_fraction = 0.5;
    std::vector<InfeasibilityHint> hints = findInfeasibilityHints(makeHorizon({20.0}, {0.0}), AssetConfig(p));
    BOOST_REQUIRE_EQUAL(hints.size(), 1u);
    BOOST_CHECK_EQUAL(hints[0].constraint_class, "diesel minimum load");
}

BOOST_AUTO_TEST_CASE(terminal_soc_fallback) {
    std::vector<InfeasibilityHint> hints = findInfeasibilityHints(makeHorizon({100.0, 100.0}, {0.0, 0.0}),
                                                                  AssetConfig(parametersWithBattery(100.0, 50.0)));
    BOOST_REQUIRE_EQUAL(hints.size(), 1u);
    BOOST_CHECK_EQUAL(hints[0].hour, 1u);
    BOOST_CHECK_EQUAL(hints[0].constraint_class, "terminal state of charge");
}

BOOST_AUTO_TEST_SUITE_END()
