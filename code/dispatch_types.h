/*
 * dispatch_types.h
 *
 * This file contains the plain data types that are passed
 * into a dispatch run and the types of its result.
 *
 */

#ifndef DISPATCH_TYPES_H
#define DISPATCH_TYPES_H

#include <string>
#include <vector>

/**
 * The hourly time series of one optimization horizon.
 * Index h denotes hour h of the horizon, i.e. the interval [h, h+1).
 */
struct HorizonInput {
    std::vector<double> load_kW;             ///< Demand per hour in kW
    std::vector<double> solar_available_kW;  ///< Available solar power per hour in kW
    std::vector<std::string> timestamps;     ///< Optional time stamps (empty or of the same length as load_kW)
    unsigned long offset = 0;                ///< Index of hour 0 in the series this horizon was cut from

    size_t get_n_hours() const { return load_kW.size(); }

    /**
     * Checks that both series have the same, non-zero length and contain
     * only finite, non-negative values.
     * Throws a ConfigurationError otherwise.
     */
    void validate() const;

    /**
     * Returns the sub-horizon [first_hour, first_hour + n_hours).
     * If n_hours is 0, the window reaches until the end of the series.
     * Throws a ConfigurationError if the window does not fit into the series.
     */
    HorizonInput window(unsigned long first_hour, unsigned long n_hours) const;

    double get_total_load_kWh() const;
    double get_total_solar_kWh() const;
};

/**
 * The decisions of one hour as computed by the optimizer.
 */
struct DispatchDecision {
    unsigned long hour;           ///< Hour index within the horizon
    std::string timestamp;        ///< Time stamp of the hour (if known)
    double load_kW;
    double solar_available_kW;
    double diesel_output_kW;
    bool   diesel_on;
    double battery_charge_kW;
    double battery_discharge_kW;
    double solar_used_kW;
    double curtailed_kW;          ///< solar_available_kW - solar_used_kW
    double soc_kWh;               ///< State of charge at the end of the hour
};

/**
 * Aggregated key figures of one dispatch run.
 * All cost values are in the currency unit of the configuration.
 */
struct DispatchSummary {
    double total_cost                = 0.0; ///< Sum of fuel, carbon and curtailment penalty costs
    double fuel_cost                 = 0.0; ///< Fuel cost including the no-load fuel share
    double carbon_cost               = 0.0; ///< Carbon tax including the no-load carbon share
    double no_load_cost              = 0.0; ///< Part of fuel_cost + carbon_cost caused by the no-load consumption
    double curtailment_penalty       = 0.0;
    double objective_value           = 0.0; ///< Objective as reported by the solver
    double best_bound                = 0.0; ///< Best lower bound as reported by the solver
    double load_energy_kWh           = 0.0;
    double diesel_energy_kWh         = 0.0;
    double battery_charge_kWh        = 0.0;
    double battery_discharge_kWh     = 0.0;
    double solar_available_kWh       = 0.0;
    double solar_used_kWh            = 0.0;
    double curtailed_kWh             = 0.0;
    double initial_soc_kWh           = 0.0;
    double terminal_soc_kWh          = 0.0;
    unsigned long diesel_running_hours = 0;
    double diesel_capacity_factor    = 0.0; ///< diesel energy / (capacity * H)
    double battery_capacity_factor   = 0.0; ///< discharged energy / (max. discharge power * H)
    double solar_capacity_factor     = 0.0; ///< used solar energy / available solar energy
    double fuel_L                    = 0.0; ///< Fuel burned in liters (0 if the costs are not derived from a fuel curve)

    /// Money spent on the diesel supply (fuel and carbon), i.e. the total cost without the curtailment penalty
    double get_diesel_cost() const { return fuel_cost + carbon_cost; }
};

/**
 * Figures of the supply of the complete load by the diesel generator alone.
 * The generator is on in every hour of the horizon.
 */
struct DieselOnlyBaseline {
    double cost   = 0.0; ///< Fuel and carbon cost
    double fuel_L = 0.0; ///< Fuel burned in liters (0 if the costs are not derived from a fuel curve)
};

enum struct DispatchStatus : short {
    Optimal,  ///< Proven optimal within the configured MIP gap
    Feasible  ///< Time limit reached, best known solution returned
};

/**
 * Complete result of one dispatch run.
 * It contains no references to solver objects and can be copied freely.
 */
struct DispatchResult {
    DispatchStatus status = DispatchStatus::Optimal;
    bool proven_optimal = true;
    std::vector<std::string> warnings;
    std::vector<DispatchDecision> schedule;
    DispatchSummary summary;
    std::string solver_name;
    unsigned int solver_attempts = 0;
    double solve_time_s = 0.0;
    double mip_gap = 0.0; ///< Relative gap between objective and best bound at termination
};

const char* dispatchStatusToString(DispatchStatus status);

#endif
