#include "asset_config.h"

#include <cmath>
#include <string>

#include "errors.h"

using namespace std;


void FuelCurve::applyTo(AssetParameters& params) const {
    params.fuel_cost_per_kWh                = get_fuel_cost_per_kWh();
    params.carbon_tax_per_kWh               = get_carbon_tax_per_kWh();
    params.diesel_no_load_fuel_cost_per_h   = get_no_load_fuel_cost_per_h();
    params.diesel_no_load_carbon_cost_per_h = get_no_load_carbon_cost_per_h();
    params.fuel_curve_known         = true;
    params.diesel_intercept_L_per_h = intercept_L_per_h;
    params.diesel_slope_L_per_kWh   = slope_L_per_kWh;
}


namespace {

    void check_finite_non_negative(double value, const char* name) {
        if (!std::isfinite(value) || value < 0.0) {
            throw ConfigurationError(string("Parameter '") + name + "' must be finite and >= 0, but is " + to_string(value) + ".");
        }
    }

    // validates all parameters and returns them unchanged
    const AssetParameters& validated(const AssetParameters& p) {
        if (!std::isfinite(p.diesel_capacity_kW) || p.diesel_capacity_kW <= 0.0)
            throw ConfigurationError("Parameter 'diesel capacity kW' must be > 0, but is " + to_string(p.diesel_capacity_kW) + ".");
        if (!std::isfinite(p.diesel_min_load_fraction) || p.diesel_min_load_fraction < 0.0 || p.diesel_min_load_fraction >= 1.0)
            throw ConfigurationError("Parameter 'diesel min load fraction' must be in [0, 1), but is " + to_string(p.diesel_min_load_fraction) + ".");
        check_finite_non_negative(p.fuel_cost_per_kWh,                "fuel cost per kWh");
        check_finite_non_negative(p.carbon_tax_per_kWh,               "carbon tax per kWh");
        check_finite_non_negative(p.diesel_no_load_fuel_cost_per_h,   "diesel no-load fuel cost per h");
        check_finite_non_negative(p.diesel_no_load_carbon_cost_per_h, "diesel no-load carbon cost per h");
        check_finite_non_negative(p.battery_capacity_kWh,             "battery capacity kWh");
        check_finite_non_negative(p.battery_max_charge_kW,            "battery max charge kW");
        check_finite_non_negative(p.battery_max_discharge_kW,         "battery max discharge kW");
        check_finite_non_negative(p.battery_initial_soc_kWh,          "battery initial SoC kWh");
        check_finite_non_negative(p.curtailment_penalty_per_kWh,      "curtailment penalty per kWh");
        check_finite_non_negative(p.diesel_intercept_L_per_h,         "diesel intercept L per h");
        check_finite_non_negative(p.diesel_slope_L_per_kWh,           "diesel slope L per kWh");
        if (!std::isfinite(p.battery_round_trip_efficiency) || p.battery_round_trip_efficiency <= 0.0 || p.battery_round_trip_efficiency > 1.0)
            throw ConfigurationError("Parameter 'battery round-trip efficiency' must be in (0, 1], but is " + to_string(p.battery_round_trip_efficiency) + ".");
        if (p.battery_initial_soc_kWh > p.battery_capacity_kWh)
            throw ConfigurationError("Initial SoC (" + to_string(p.battery_initial_soc_kWh) + " kWh) exceeds the battery capacity (" +
                                     to_string(p.battery_capacity_kWh) + " kWh).");
        if (p.battery_capacity_kWh > 0.0 && p.battery_max_discharge_kW <= 0.0)
            throw ConfigurationError("Parameter 'battery max discharge kW' must be > 0 if a battery is present.");
        return p;
    }

}


AssetConfig::AssetConfig(const AssetParameters& params) : params(validated(params)) {}

double AssetConfig::get_charge_efficiency() const {
    switch (params.efficiency_split) {
        case EfficiencySplit::SquareRoot:   return std::sqrt(params.battery_round_trip_efficiency);
        case EfficiencySplit::ChargeLeg:    return params.battery_round_trip_efficiency;
        case EfficiencySplit::DischargeLeg: return 1.0;
    }
    return std::sqrt(params.battery_round_trip_efficiency);
}

double AssetConfig::get_discharge_efficiency() const {
    switch (params.efficiency_split) {
        case EfficiencySplit::SquareRoot:   return std::sqrt(params.battery_round_trip_efficiency);
        case EfficiencySplit::ChargeLeg:    return 1.0;
        case EfficiencySplit::DischargeLeg: return params.battery_round_trip_efficiency;
    }
    return std::sqrt(params.battery_round_trip_efficiency);
}

double AssetConfig::get_fuel_consumption_L(unsigned long running_hours, double diesel_energy_kWh) const {
    if (!params.fuel_curve_known)
        return 0.0;
    return running_hours * params.diesel_intercept_L_per_h + diesel_energy_kWh * params.diesel_slope_L_per_kWh;
}

AssetConfig AssetConfig::withBatteryCapacity(double capacity_kWh, double initial_soc_fraction) const {
    AssetParameters p = params;
    p.battery_capacity_kWh = capacity_kWh;
    if (initial_soc_fraction >= 0.0) {
        p.battery_initial_soc_kWh = initial_soc_fraction * capacity_kWh;
    } else if (p.battery_initial_soc_kWh > capacity_kWh) {
        p.battery_initial_soc_kWh = capacity_kWh;
    }
    return AssetConfig(p);
}

const char* efficiencySplitToString(EfficiencySplit split) {
    switch (split) {
        case EfficiencySplit::SquareRoot:   return "sqrt";
        case EfficiencySplit::ChargeLeg:    return "charge";
        case EfficiencySplit::DischargeLeg: return "discharge";
    }
    return "unknown";
}

const char* batteryExclusivityToString(BatteryExclusivity mode) {
    switch (mode) {
        case BatteryExclusivity::BinaryIndicator: return "indicator";
        case BatteryExclusivity::CostDominance:   return "dominance";
    }
    return "unknown";
}
