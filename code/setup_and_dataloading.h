/*
 *
 * setup_and_dataloading.h
 *
 * Contains all code required for loading the scenario
 * configuration and the hourly time series
 *
 * */

#ifndef SETUP_AND_DATALOADING_H
#define SETUP_AND_DATALOADING_H

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <boost/property_tree/ptree.hpp>

#include "asset_config.h"
#include "dispatch_types.h"
#include "global.h"
#include "optimization_unit_general.hpp"


/**
 * This namespace contains all functions required for loading the
 * scenario file and the time series
 **/
namespace configld {

    /**
     * All parameters of one scenario that do not belong into the (process-wide) class Global.
     * The asset parameters are only finalized with finalize_asset_parameters(),
     * as some of them are given in different forms (fraction vs. kW, fuel curve vs. direct costs).
     */
    struct ScenarioConfig {
        AssetParameters assets;     ///< Parameters that are taken over directly
        FuelCurve       fuel_curve; ///< Used for all cost coefficients that are not given directly
        std::optional<double> fuel_cost_per_kWh;   ///< Overrides the value derived from the fuel curve
        std::optional<double> carbon_tax_per_kWh;  ///< Overrides the value derived from the fuel curve
        std::optional<double> diesel_no_load_cost_per_h; ///< Overrides the value derived from the fuel curve
        std::optional<double> diesel_min_stable_kW;///< Overrides assets.diesel_min_load_fraction
        double initial_soc_fraction = 0.5;         ///< Initial SoC as fraction of the capacity
        std::optional<double> initial_soc_kWh;     ///< Overrides initial_soc_fraction
        double solar_capacity_kW = 400.0;          ///< Scaling of per unit solar series
        unsigned long first_hour = 0;              ///< First hour of the window to optimize
        unsigned long n_hours    = 0;              ///< Length of the window, 0 means until the end of the series
        SolverSettings solver;
        global::PeriodSplitMode period_mode = global::PeriodSplitMode::CalendarMonth;
        unsigned long period_length_h = 24 * 7;    ///< Used for global::PeriodSplitMode::FixedLength
        std::vector<double> sweep_capacities_kWh;
    };

    /**
     * Load the config file, that is passed as command line argument.
     * Process-wide settings (paths, etc.) are written into class Global,
     * everything else into config.
     *
     * @return: Returns false if the file cannot be parsed, the scenario is not found or a value is invalid
     */
    bool load_config_file(unsigned long scenario_id, const std::string& filepath, ScenarioConfig& config);

    /**
     * Parses all elements of one flat scenario dictionary into config.
     * Only scenario parameters are accepted here (no paths etc.).
     * Throws a ConfigurationError for unknown keys or invalid values.
     */
    void parse_scenario_tree(const boost::property_tree::ptree& tree, ScenarioConfig& config);

    /**
     * Returns the final asset parameters, i.e. with all derived values applied.
     * The values are not validated here, this happens in the constructor of AssetConfig.
     */
    AssetParameters finalize_asset_parameters(const ScenarioConfig& config);

    /**
     * Loads the hourly series from a CSV file.
     * The header must contain the column load_kw and one of the columns solar_kw or solar_pu.
     * solar_pu is multiplied with solar_capacity_kW.
     * If the first column is unnamed or named timestamp, it is read as time stamp.
     *
     * @return: Returns false if the file cannot be read or is malformed
     */
    bool load_series_from_csv(const std::string& filepath, double solar_capacity_kW, HorizonInput& series);

    /**
     * Loads the hourly series from the given table of a SQLite database.
     * Required columns: TimestepID, Timestamp, Load_kW, SolarAvailable_kW
     *
     * @return: Returns false if the database or the table cannot be read
     */
    bool load_series_from_database(const std::string& filepath, const std::string& table_name, HorizonInput& series);

    /**
     * @brief Outputs the build information and all parameter settings to the specified output stream.
     *
     * The output can be redirected to any valid std::ostream, such as
     * std::cout or a std::ofstream for the file parameter-settings.txt.
     *
     * @param current_outstream Reference to an output stream where the configuration should be written.
     * @param config The scenario configuration to print.
     */
    void output_variable_values(std::ostream& current_outstream, const ScenarioConfig& config);

}




#endif
