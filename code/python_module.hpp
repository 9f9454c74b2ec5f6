/**
 * @file python_module.hpp
 * @brief Definition and implementation of functions that connect the C++ dispatch optimization with Python via pybind11.
 *
 * This is a header-only file providing Python bindings for single dispatch runs,
 * e.g. for an interactive dashboard.
 */

#ifndef PYTHON_MODULE_HPP
#define PYTHON_MODULE_HPP

#include <string>
#include <vector>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h> // for converting C++ containers like std::vector

#include <boost/property_tree/ptree.hpp>

#include "asset_config.h"
#include "dispatch_engine.h"
#include "dispatch_types.h"
#include "errors.h"
#include "setup_and_dataloading.h"

namespace pyconn {

    /**
     * @brief Converts a flat Python dict into a property tree,
     * so that it can be parsed like one scenario of the config file.
     * Lists are converted into arrays, booleans into "true" / "false".
     */
    inline boost::property_tree::ptree dict_to_ptree(pybind11::dict d) {
        boost::property_tree::ptree tree;
        auto to_str = [](pybind11::handle value) -> std::string {
            if (pybind11::isinstance<pybind11::bool_>(value))
                return value.cast<bool>() ? "true" : "false";
            return pybind11::str(value).cast<std::string>();
        };
        for (auto item : d) {
            std::string key = pybind11::str(item.first).cast<std::string>();
            if (pybind11::isinstance<pybind11::list>(item.second) || pybind11::isinstance<pybind11::tuple>(item.second)) {
                boost::property_tree::ptree array;
                for (auto elem : item.second) {
                    boost::property_tree::ptree elem_node;
                    elem_node.put_value(to_str(elem));
                    array.push_back(std::make_pair("", elem_node));
                }
                tree.push_back(std::make_pair(key, array));
            } else {
                tree.push_back(std::make_pair(key, boost::property_tree::ptree(to_str(item.second))));
            }
        }
        return tree;
    }

    /**
     * @brief Reads the solver settings from a Python dict.
     *
     * Supported keys: "time_limit" (s), "mip_rel_gap", "retry_time_factor", "verbose"
     *
     * @throws ConfigurationError for unknown keys
     */
    inline SolverSettings parse_solver_dict(pybind11::dict d, SolverSettings settings) {
        for (auto item : d) {
            std::string key = pybind11::str(item.first).cast<std::string>();
            if (key == "time_limit") {
                settings.time_limit_s = item.second.cast<double>();
            } else if (key == "mip_rel_gap") {
                settings.relative_mip_gap = item.second.cast<double>();
            } else if (key == "retry_time_factor") {
                settings.retry_time_limit_factor = item.second.cast<double>();
            } else if (key == "verbose") {
                settings.verbose = item.second.cast<bool>();
            } else {
                throw ConfigurationError("Unknown solver option '" + key + "'.");
            }
        }
        return settings;
    }

    /**
     * @brief Optimizes the dispatch for one horizon.
     *
     * The solar series is given in kW (i.e. not per unit).
     * Solver values given in the config dict (e.g. 'solver time limit s') are overwritten by the solver dict.
     *
     * @return A dict with the keys status, proven_optimal, warnings, solver, solver_attempts,
     * solve_time_s, mip_gap, baseline_cost, baseline_fuel_L, summary (dict) and schedule (dict of lists, one list per column).
     * The savings in the summary compare the fuel and carbon cost with baseline_cost.
     *
     * @throws ConfigurationError, InfeasibleModelError, SolverError, InternalConsistencyError
     */
    inline pybind11::dict optimize(const std::vector<double>& load, const std::vector<double>& solar,
                                   pybind11::dict config_dict, pybind11::dict solver_dict)
    {
        configld::ScenarioConfig scenario;
        configld::parse_scenario_tree(dict_to_ptree(config_dict), scenario);
        SolverSettings settings = parse_solver_dict(solver_dict, scenario.solver);

        HorizonInput input;
        input.load_kW            = load;
        input.solar_available_kW = solar;
        const AssetConfig config( configld::finalize_asset_parameters(scenario) );

        DispatchResult result;
        {
            // release the GIL during the solver call
            pybind11::gil_scoped_release release;
            result = dispatch::runDispatch(input, config, settings);
        }
        const DieselOnlyBaseline baseline = dispatch::computeDieselOnlyBaseline(input, config);

        const DispatchSummary& s = result.summary;
        pybind11::dict summary;
        summary["total_cost"]            = s.total_cost;
        summary["fuel_cost"]             = s.fuel_cost;
        summary["carbon_cost"]           = s.carbon_cost;
        summary["no_load_cost"]          = s.no_load_cost;
        summary["curtailment_penalty"]   = s.curtailment_penalty;
        summary["savings"]               = baseline.cost - s.get_diesel_cost();
        summary["fuel_L"]                = s.fuel_L;
        summary["objective_value"]       = s.objective_value;
        summary["best_bound"]            = s.best_bound;
        summary["load_kWh"]              = s.load_energy_kWh;
        summary["diesel_kWh"]            = s.diesel_energy_kWh;
        summary["battery_charge_kWh"]    = s.battery_charge_kWh;
        summary["battery_discharge_kWh"] = s.battery_discharge_kWh;
        summary["solar_available_kWh"]   = s.solar_available_kWh;
        summary["solar_used_kWh"]        = s.solar_used_kWh;
        summary["curtailed_kWh"]         = s.curtailed_kWh;
        summary["initial_soc_kWh"]       = s.initial_soc_kWh;
        summary["terminal_soc_kWh"]      = s.terminal_soc_kWh;
        summary["diesel_running_hours"]  = s.diesel_running_hours;
        summary["diesel_capacity_factor"]  = s.diesel_capacity_factor;
        summary["battery_capacity_factor"] = s.battery_capacity_factor;
        summary["solar_capacity_factor"]   = s.solar_capacity_factor;

        std::vector<double> diesel, charge, discharge, solar_used, curtailed, soc;
        std::vector<bool> diesel_on;
        for (const DispatchDecision& d : result.schedule) {
            diesel.push_back(d.diesel_output_kW);
            diesel_on.push_back(d.diesel_on);
            charge.push_back(d.battery_charge_kW);
            discharge.push_back(d.battery_discharge_kW);
            solar_used.push_back(d.solar_used_kW);
            curtailed.push_back(d.curtailed_kW);
            soc.push_back(d.soc_kWh);
        }
        pybind11::dict schedule;
        schedule["load_kW"]              = load;
        schedule["solar_available_kW"]   = solar;
        schedule["diesel_output_kW"]     = diesel;
        schedule["diesel_on"]            = diesel_on;
        schedule["battery_charge_kW"]    = charge;
        schedule["battery_discharge_kW"] = discharge;
        schedule["solar_used_kW"]        = solar_used;
        schedule["curtailed_kW"]         = curtailed;
        schedule["soc_kWh"]              = soc;

        pybind11::dict ret;
        ret["status"]          = std::string(dispatchStatusToString(result.status));
        ret["proven_optimal"]  = result.proven_optimal;
        ret["warnings"]        = result.warnings;
        ret["solver"]          = result.solver_name;
        ret["solver_attempts"] = result.solver_attempts;
        ret["solve_time_s"]    = result.solve_time_s;
        ret["mip_gap"]         = result.mip_gap;
        ret["baseline_cost"]   = baseline.cost;
        ret["baseline_fuel_L"] = baseline.fuel_L;
        ret["summary"]         = summary;
        ret["schedule"]        = schedule;
        return ret;
    }

    /**
     * @brief Returns the cost of the diesel-only supply of the given load.
     */
    inline double diesel_only_cost(const std::vector<double>& load, pybind11::dict config_dict) {
        configld::ScenarioConfig scenario;
        configld::parse_scenario_tree(dict_to_ptree(config_dict), scenario);
        const AssetConfig config( configld::finalize_asset_parameters(scenario) );
        HorizonInput input;
        input.load_kW            = load;
        input.solar_available_kW = std::vector<double>(load.size(), 0.0);
        return dispatch::computeDieselOnlyBaseline(input, config).cost;
    }

}

#endif
