/*
 * test_asset_config.cpp
 *
 * Unit tests for the asset configuration, the fuel curve
 * and the horizon input.
 *
 */

#define BOOST_TEST_MODULE asset_config
#include <boost/test/unit_test.hpp>

#include <cmath>
#include <limits>

#include "asset_config.h"
#include "dispatch_types.h"
#include "errors.h"
#include "test_helpers.hpp"

using namespace testhelper;


BOOST_AUTO_TEST_SUITE(asset_parameters)

BOOST_AUTO_TEST_CASE(default_parameters_are_valid) {
    BOOST_CHECK_NO_THROW(AssetConfig{AssetParameters()});
}

BOOST_AUTO_TEST_CASE(non_positive_diesel_capacity_is_rejected) {
    AssetParameters p = simpleParameters();
    p.diesel_capacity_kW = 0.0;
    BOOST_CHECK_THROW(AssetConfig{p}, ConfigurationError);
    p.diesel_capacity_kW = -10.0;
    BOOST_CHECK_THROW(AssetConfig{p}, ConfigurationError);
}

BOOST_AUTO_TEST_CASE(min_load_fraction_range) {
    AssetParameters p = simpleParameters();
    p.diesel_min_load_fraction = 1.0;
    BOOST_CHECK_THROW(AssetConfig{p}, ConfigurationError);
    p.diesel_min_load_fraction = -0.1;
    BOOST_CHECK_THROW(AssetConfig{p}, ConfigurationError);
    p.diesel_min_load_fraction = 0.99;
    BOOST_CHECK_NO_THROW(AssetConfig{p});
}

BOOST_AUTO_TEST_CASE(round_trip_efficiency_range) {
    AssetParameters p = parametersWithBattery(100.0, 50.0);
    p.battery_round_trip_efficiency = 0.0;
    BOOST_CHECK_THROW(AssetConfig{p}, ConfigurationError);
    p.battery_round_trip_efficiency = 1.01;
    BOOST_CHECK_THROW(AssetConfig{p}, ConfigurationError);
    p.battery_round_trip_efficiency = 1.0;
    BOOST_CHECK_NO_THROW(AssetConfig{p});
}

BOOST_AUTO_TEST_CASE(negative_and_non_finite_costs_are_rejected) {
    AssetParameters p = simpleParameters();
    p.fuel_cost_per_kWh = -0.1;
    BOOST_CHECK_THROW(AssetConfig{p}, ConfigurationError);
    p = simpleParameters();
    p.carbon_tax_per_kWh = std::numeric_limits<double>::quiet_NaN();
    BOOST_CHECK_THROW(AssetConfig{p}, ConfigurationError);
    p = simpleParameters();
    p.curtailment_penalty_per_kWh = std::numeric_limits<double>::infinity();
    BOOST_CHECK_THROW(AssetConfig{p}, ConfigurationError);
}

BOOST_AUTO_TEST_CASE(initial_soc_above_capacity_is_rejected) {
    AssetParameters p = parametersWithBattery(100.0, 50.0);
    p.battery_initial_soc_kWh = 100.5;
    BOOST_CHECK_THROW(AssetConfig{p}, ConfigurationError);
    p.battery_initial_soc_kWh = 100.0;
    BOOST_CHECK_NO_THROW(AssetConfig{p});
}

BOOST_AUTO_TEST_CASE(battery_without_discharge_power_is_rejected) {
    AssetParameters p = parametersWithBattery(100.0, 50.0);
    p.battery_max_discharge_kW = 0.0;
    BOOST_CHECK_THROW(AssetConfig{p}, ConfigurationError);
}

BOOST_AUTO_TEST_CASE(zero_capacity_means_no_battery) {
    AssetParameters p = simpleParameters();
    p.battery_max_charge_kW    = 100.0;
    p.battery_max_discharge_kW = 100.0;
    AssetConfig config(p);
    BOOST_CHECK(!config.has_battery());
    BOOST_CHECK_EQUAL(config.get_battery_max_charge_kW(), 0.0);
    BOOST_CHECK_EQUAL(config.get_battery_max_discharge_kW(), 0.0);
}

BOOST_AUTO_TEST_SUITE_END()


BOOST_AUTO_TEST_SUITE(efficiencies)

BOOST_AUTO_TEST_CASE(square_root_split) {
    AssetParameters p = parametersWithBattery(100.0, 50.0);
    p.battery_round_trip_efficiency = 0.81;
    p.efficiency_split = EfficiencySplit::SquareRoot;
    AssetConfig config(p);
    BOOST_CHECK_CLOSE(config.get_charge_efficiency(), 0.9, 1e-9);
    BOOST_CHECK_CLOSE(config.get_discharge_efficiency(), 0.9, 1e-9);
}

BOOST_AUTO_TEST_CASE(one_sided_splits) {
    AssetParameters p = parametersWithBattery(100.0, 50.0);
    p.battery_round_trip_efficiency = 0.81;
    p.efficiency_split = EfficiencySplit::ChargeLeg;
    AssetConfig charge_leg(p);
    BOOST_CHECK_CLOSE(charge_leg.get_charge_efficiency(), 0.81, 1e-9);
    BOOST_CHECK_EQUAL(charge_leg.get_discharge_efficiency(), 1.0);

    p.efficiency_split = EfficiencySplit::DischargeLeg;
    AssetConfig discharge_leg(p);
    BOOST_CHECK_EQUAL(discharge_leg.get_charge_efficiency(), 1.0);
    BOOST_CHECK_CLOSE(discharge_leg.get_discharge_efficiency(), 0.81, 1e-9);
}

BOOST_AUTO_TEST_CASE(enum_names) {
    BOOST_CHECK_EQUAL(std::string(efficiencySplitToString(EfficiencySplit::SquareRoot)), "sqrt");
    BOOST_CHECK_EQUAL(std::string(batteryExclusivityToString(BatteryExclusivity::CostDominance)), "dominance");
}

BOOST_AUTO_TEST_SUITE_END()


BOOST_AUTO_TEST_SUITE(fuel_curve)

BOOST_AUTO_TEST_CASE(derived_cost_coefficients) {
    FuelCurve curve; // 2.20 / L, 15 L/h + 0.24 L/kWh, 95 / t
    AssetParameters p;
    curve.applyTo(p);
    BOOST_CHECK_CLOSE(p.fuel_cost_per_kWh, 0.24 * 2.20, 1e-9);
    BOOST_CHECK_CLOSE(p.carbon_tax_per_kWh, 0.24 * 0.00268 * 95.0, 1e-9);
    BOOST_CHECK_CLOSE(p.diesel_no_load_fuel_cost_per_h, 15.0 * 2.20, 1e-9);
    BOOST_CHECK_CLOSE(p.diesel_no_load_carbon_cost_per_h, 15.0 * 0.00268 * 95.0, 1e-9);

    AssetConfig config(p);
    BOOST_CHECK_CLOSE(config.get_diesel_marginal_cost_per_kWh(), 0.24 * (2.20 + 0.2546), 1e-9);
    BOOST_CHECK_CLOSE(config.get_diesel_no_load_cost_per_h(), 15.0 * (2.20 + 0.2546), 1e-9);
}

BOOST_AUTO_TEST_CASE(fuel_consumption) {
    AssetParameters p;
    BOOST_CHECK(!AssetConfig(p).has_fuel_curve());
    BOOST_CHECK_EQUAL(AssetConfig(p).get_fuel_consumption_L(10, 1000.0), 0.0);
    FuelCurve().applyTo(p);
    AssetConfig config(p);
    BOOST_CHECK(config.has_fuel_curve());
    BOOST_CHECK_CLOSE(config.get_fuel_consumption_L(10, 1000.0), 10 * 15.0 + 1000.0 * 0.24, 1e-9);
    // kept when only the battery changes
    BOOST_CHECK(config.withBatteryCapacity(200.0, 0.5).has_fuel_curve());
}

BOOST_AUTO_TEST_SUITE_END()


BOOST_AUTO_TEST_SUITE(battery_capacity_change)

BOOST_AUTO_TEST_CASE(fraction_sets_initial_soc) {
    AssetConfig config(parametersWithBattery(100.0, 50.0));
    AssetConfig bigger = config.withBatteryCapacity(400.0, 0.25);
    BOOST_CHECK_EQUAL(bigger.get_battery_capacity_kWh(), 400.0);
    BOOST_CHECK_CLOSE(bigger.get_battery_initial_soc_kWh(), 100.0, 1e-9);
    // power limits are kept
    BOOST_CHECK_EQUAL(bigger.get_battery_max_discharge_kW(), 50.0);
}

BOOST_AUTO_TEST_CASE(negative_fraction_keeps_and_caps_soc) {
    AssetConfig config(parametersWithBattery(100.0, 50.0)); // initial SoC 50 kWh
    BOOST_CHECK_EQUAL(config.withBatteryCapacity(300.0).get_battery_initial_soc_kWh(), 50.0);
    BOOST_CHECK_EQUAL(config.withBatteryCapacity(20.0).get_battery_initial_soc_kWh(), 20.0);
    BOOST_CHECK_EQUAL(config.withBatteryCapacity(0.0).get_battery_initial_soc_kWh(), 0.0);
}

BOOST_AUTO_TEST_CASE(invalid_capacity_throws) {
    AssetConfig config(parametersWithBattery(100.0, 50.0));
    BOOST_CHECK_THROW(config.withBatteryCapacity(-1.0, 0.5), ConfigurationError);
}

BOOST_AUTO_TEST_SUITE_END()


BOOST_AUTO_TEST_SUITE(horizon_input)

BOOST_AUTO_TEST_CASE(validation) {
    BOOST_CHECK_NO_THROW(makeHorizon({1.0, 2.0}, {0.0, 0.0}).validate());
    BOOST_CHECK_THROW(makeHorizon({}, {}).validate(), ConfigurationError);
    BOOST_CHECK_THROW(makeHorizon({1.0, 2.0}, {0.0}).validate(), ConfigurationError);
    BOOST_CHECK_THROW(makeHorizon({1.0, -2.0}, {0.0, 0.0}).validate(), ConfigurationError);
    BOOST_CHECK_THROW(makeHorizon({1.0}, {std::numeric_limits<double>::quiet_NaN()}).validate(), ConfigurationError);

    HorizonInput with_ts = makeHorizon({1.0, 2.0}, {0.0, 0.0});
    with_ts.timestamps = {"2023-01-01 00:00"};
    BOOST_CHECK_THROW(with_ts.validate(), ConfigurationError);
}

BOOST_AUTO_TEST_CASE(window) {
    HorizonInput series = makeHorizon({1.0, 2.0, 3.0, 4.0}, {5.0, 6.0, 7.0, 8.0});
    series.timestamps = {"a", "b", "c", "d"};
    HorizonInput w = series.window(1, 2);
    BOOST_CHECK_EQUAL(w.get_n_hours(), 2u);
    BOOST_CHECK_EQUAL(w.offset, 1u);
    BOOST_CHECK_EQUAL(w.load_kW[0], 2.0);
    BOOST_CHECK_EQUAL(w.solar_available_kW[1], 7.0);
    BOOST_CHECK_EQUAL(w.timestamps[1], "c");

    // 0 means until the end, offsets accumulate
    HorizonInput rest = w.window(1, 0);
    BOOST_CHECK_EQUAL(rest.get_n_hours(), 1u);
    BOOST_CHECK_EQUAL(rest.offset, 2u);

    BOOST_CHECK_THROW(series.window(4, 1), ConfigurationError);
    BOOST_CHECK_THROW(series.window(2, 3), ConfigurationError);
}

BOOST_AUTO_TEST_CASE(totals) {
    HorizonInput series = makeHorizon({1.0, 2.0, 3.0}, {0.5, 0.5, 0.0});
    BOOST_CHECK_CLOSE(series.get_total_load_kWh(), 6.0, 1e-12);
    BOOST_CHECK_CLOSE(series.get_total_solar_kWh(), 1.0, 1e-12);
}

BOOST_AUTO_TEST_SUITE_END()
