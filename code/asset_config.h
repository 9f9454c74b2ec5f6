/*
 * asset_config.h
 *
 * This file contains the description of the assets of the
 * microgrid (diesel generator, battery storage, solar) and
 * the economic parameters used in the objective function.
 *
 */

#ifndef ASSET_CONFIG_H
#define ASSET_CONFIG_H

#include <string>

/*!
 * This enum defines how the round-trip efficiency of the battery
 * is split onto the charge and the discharge path.
 */
enum struct EfficiencySplit : short {
    SquareRoot,   ///< eta_c = eta_d = sqrt(eta)
    ChargeLeg,    ///< eta_c = eta, eta_d = 1
    DischargeLeg  ///< eta_c = 1, eta_d = eta
};

/*!
 * This enum defines how simultaneous charging and discharging of the
 * battery storage is prevented.
 */
enum struct BatteryExclusivity : short {
    BinaryIndicator, ///< A binary charge mode variable per hour
    CostDominance    ///< No additional constraint, relies on the losses making it unattractive
};

/**
 * Raw asset and cost parameters as they are read from the configuration.
 * The values are not checked here, see class AssetConfig.
 */
struct AssetParameters {
    double diesel_capacity_kW             = 500.0;
    double diesel_min_load_fraction       = 0.3;   ///< Minimum stable load as fraction of diesel_capacity_kW
    double fuel_cost_per_kWh              = 0.0;   ///< Variable fuel cost per kWh of diesel output
    double carbon_tax_per_kWh             = 0.0;   ///< Variable carbon tax per kWh of diesel output
    double diesel_no_load_fuel_cost_per_h = 0.0;   ///< Fuel cost of every hour the generator is on (fuel curve intercept)
    double diesel_no_load_carbon_cost_per_h = 0.0; ///< Carbon tax of every hour the generator is on (fuel curve intercept)
    double battery_capacity_kWh           = 1000.0;
    double battery_max_charge_kW          = 250.0;
    double battery_max_discharge_kW       = 250.0;
    double battery_round_trip_efficiency  = 0.95;
    double battery_initial_soc_kWh        = 500.0;
    double curtailment_penalty_per_kWh    = 0.01;
    bool   fuel_curve_known               = false; ///< True if the cost coefficients were derived from a FuelCurve
    double diesel_intercept_L_per_h       = 0.0;   ///< Fuel curve, only used to report the fuel consumption
    double diesel_slope_L_per_kWh         = 0.0;   ///< Fuel curve, only used to report the fuel consumption
    EfficiencySplit efficiency_split      = EfficiencySplit::SquareRoot;
    BatteryExclusivity battery_exclusivity = BatteryExclusivity::BinaryIndicator;
};

/**
 * Linear fuel curve of the diesel generator:
 * fuel consumption [L/h] = intercept + slope * output [kW]
 *
 * It is used to derive the cost coefficients of the AssetParameters.
 */
struct FuelCurve {
    static constexpr double carbon_intensity_t_per_L = 0.00268; ///< t CO2 emitted per liter of diesel

    double fuel_price_per_L  = 2.20;
    double intercept_L_per_h = 15.0;
    double slope_L_per_kWh   = 0.24;
    double carbon_tax_per_t  = 95.0;

    double get_fuel_cost_per_kWh() const { return slope_L_per_kWh * fuel_price_per_L; }
    double get_carbon_tax_per_kWh() const { return slope_L_per_kWh * carbon_intensity_t_per_L * carbon_tax_per_t; }
    double get_no_load_fuel_cost_per_h() const { return intercept_L_per_h * fuel_price_per_L; }
    double get_no_load_carbon_cost_per_h() const { return intercept_L_per_h * carbon_intensity_t_per_L * carbon_tax_per_t; }

    /**
     * Writes the four derived cost coefficients and the curve itself into the given parameter set.
     */
    void applyTo(AssetParameters& params) const;
};

/**
 * Validated, immutable asset configuration of one dispatch run.
 * The constructor throws a ConfigurationError if a parameter is out of range.
 */
class AssetConfig {
    public:
        explicit AssetConfig(const AssetParameters& params);

        const AssetParameters& get_parameters() const { return params; }

        double get_diesel_capacity_kW() const { return params.diesel_capacity_kW; }
        double get_diesel_min_load_fraction() const { return params.diesel_min_load_fraction; }
        double get_diesel_min_stable_kW() const { return params.diesel_min_load_fraction * params.diesel_capacity_kW; }
        /// Variable cost (fuel + carbon) per kWh of diesel output
        double get_diesel_marginal_cost_per_kWh() const { return params.fuel_cost_per_kWh + params.carbon_tax_per_kWh; }
        /// Fixed cost (fuel + carbon) per hour with the generator on
        double get_diesel_no_load_cost_per_h() const { return params.diesel_no_load_fuel_cost_per_h + params.diesel_no_load_carbon_cost_per_h; }

        bool   has_battery() const { return params.battery_capacity_kWh > 0.0; }
        double get_battery_capacity_kWh() const { return params.battery_capacity_kWh; }
        /// Maximum charge power, 0 if no battery is present
        double get_battery_max_charge_kW() const { return has_battery() ? params.battery_max_charge_kW : 0.0; }
        /// Maximum discharge power, 0 if no battery is present
        double get_battery_max_discharge_kW() const { return has_battery() ? params.battery_max_discharge_kW : 0.0; }
        double get_battery_initial_soc_kWh() const { return params.battery_initial_soc_kWh; }
        double get_charge_efficiency() const;
        double get_discharge_efficiency() const;

        double get_curtailment_penalty_per_kWh() const { return params.curtailment_penalty_per_kWh; }
        bool   has_fuel_curve() const { return params.fuel_curve_known; }
        /// Fuel burned in liters, 0 if no fuel curve is known
        double get_fuel_consumption_L(unsigned long running_hours, double diesel_energy_kWh) const;
        EfficiencySplit get_efficiency_split() const { return params.efficiency_split; }
        BatteryExclusivity get_battery_exclusivity() const { return params.battery_exclusivity; }

        /**
         * Returns a copy of this configuration with a different battery capacity.
         * If initial_soc_fraction is negative, the initial SoC in kWh is kept (and capped at the new capacity),
         * otherwise it is set to initial_soc_fraction * new capacity.
         */
        AssetConfig withBatteryCapacity(double capacity_kWh, double initial_soc_fraction = -1.0) const;

    private:
        const AssetParameters params;
};

const char* efficiencySplitToString(EfficiencySplit split);
const char* batteryExclusivityToString(BatteryExclusivity mode);

#endif
