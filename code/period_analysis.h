/*
 *
 * period_analysis.h
 *
 * Contains the batch analyses built on top of single dispatch runs:
 * - the analysis of a long series period by period (e.g. calendar months),
 *   compared to a diesel-only supply
 * - the sweep over battery capacities
 *
 * */

#ifndef PERIOD_ANALYSIS_H
#define PERIOD_ANALYSIS_H

#include <string>
#include <vector>

#include "asset_config.h"
#include "dispatch_types.h"
#include "optimization_unit_general.hpp"
#include "worker_threads.hpp"

namespace analysis {

    /**
     * One contiguous part of a series.
     */
    struct PeriodDefinition {
        std::string label;        ///< e.g. "2023-01" for a calendar month
        unsigned long first_hour; ///< Index of the first hour in the series
        unsigned long n_hours;
    };

    /**
     * Settings of the batch execution of multiple independent runs.
     */
    struct BatchSettings {
        unsigned int  n_threads = 0;             ///< 0 means: execute on the calling thread
        unsigned long max_concurrent_solves = 0; ///< 0 means: unbounded
        bool          stop_on_err = false;
    };

    struct PeriodReport {
        PeriodDefinition period;
        JobOutcome outcome = JobOutcome::Pending;
        bool   proven_optimal    = false;
        double baseline_cost     = 0.0; ///< Fuel and carbon cost of the diesel-only supply
        double optimized_cost    = 0.0; ///< Fuel and carbon cost of the optimized dispatch (0 if not succeeded)
        double curtailment_penalty = 0.0; ///< Not part of optimized_cost
        double savings           = 0.0; ///< baseline_cost - optimized_cost (0 if not succeeded)
        double savings_percent   = 0.0;
        double baseline_fuel_L   = 0.0;
        double fuel_L            = 0.0;
        double fuel_saved_L      = 0.0; ///< baseline_fuel_L - fuel_L (0 if not succeeded)
        double diesel_energy_kWh = 0.0;
        double curtailed_kWh     = 0.0;
        unsigned long diesel_running_hours = 0;
        std::string error_message;
        std::string variable_dump; ///< Only set for JobOutcome::InternalError
    };

    struct PeriodAnalysisReport {
        std::vector<PeriodReport> periods;
        double total_baseline_cost  = 0.0; ///< Sum over all succeeded periods
        double total_optimized_cost = 0.0; ///< Sum over all succeeded periods
        double total_savings        = 0.0;
        double total_savings_percent= 0.0;
        double total_baseline_fuel_L= 0.0; ///< Sum over all succeeded periods
        double total_fuel_L         = 0.0; ///< Sum over all succeeded periods
        double total_fuel_saved_L   = 0.0;
        unsigned long n_failed      = 0;
    };

    struct SweepPoint {
        double battery_capacity_kWh = 0.0;
        JobOutcome outcome = JobOutcome::Pending;
        bool   proven_optimal    = false;
        double total_cost        = 0.0; ///< Including the curtailment penalty
        double curtailment_penalty = 0.0;
        double baseline_cost     = 0.0; ///< Fuel and carbon cost of the diesel-only supply
        double savings           = 0.0; ///< baseline_cost - (total_cost - curtailment_penalty)
        double baseline_fuel_L   = 0.0;
        double fuel_L            = 0.0;
        double diesel_energy_kWh = 0.0;
        double curtailed_kWh     = 0.0;
        double battery_discharge_kWh = 0.0;
        unsigned long diesel_running_hours = 0;
        std::string error_message;
        std::string variable_dump; ///< Only set for JobOutcome::InternalError
    };

    /**
     * Splits the series whenever the month (characters 0-6, "YYYY-MM", of the time stamp) changes.
     * Throws a ConfigurationError if the series has no time stamps.
     */
    std::vector<PeriodDefinition> splitIntoCalendarMonths(const HorizonInput& series);

    /**
     * Splits the series into periods of period_length_h hours (the last one may be shorter).
     */
    std::vector<PeriodDefinition> splitIntoFixedLengthPeriods(const HorizonInput& series, unsigned long period_length_h);

    /**
     * Optimizes every period independently and compares it to the diesel-only baseline.
     * Failed periods are reported but do not stop the analysis (unless stop_on_err is set).
     */
    PeriodAnalysisReport runPeriodAnalysis(
        const HorizonInput& series,
        const AssetConfig& config,
        const SolverSettings& settings,
        const std::vector<PeriodDefinition>& periods,
        const BatchSettings& batch,
        const MilpSolverFactory& solver_factory = createDefaultMilpSolver
    );

    /**
     * Optimizes the same horizon for every given battery capacity.
     * The power limits are kept. If initial_soc_fraction is >= 0, the initial SoC is
     * set to this fraction of the capacity, otherwise the initial SoC of config is kept (and capped).
     */
    std::vector<SweepPoint> runBatteryCapacitySweep(
        const HorizonInput& horizon,
        const AssetConfig& config,
        const std::vector<double>& capacities_kWh,
        double initial_soc_fraction,
        const SolverSettings& settings,
        const BatchSettings& batch,
        const MilpSolverFactory& solver_factory = createDefaultMilpSolver
    );

}

#endif
