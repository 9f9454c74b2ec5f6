#include <iostream>
#include <fstream>
#include <string>
#include <sstream>
#include <chrono>
#include <filesystem>
#include <memory>
#include <vector>

#define BOOST_BIND_GLOBAL_PLACEHOLDERS
#ifndef PYTHON_MODULE
#include <boost/program_options.hpp>
#else
#include <pybind11/pybind11.h>
#include <pybind11/stl.h> // for converting C++ containers like std::vector
#endif

#include "global.h"

#include "asset_config.h"
#include "dispatch_engine.h"
#include "errors.h"
#include "helper.h"
#include "output.h"
#include "period_analysis.h"
#include "setup_and_dataloading.h"
#include "status_output.hpp"
#include "worker_threads.hpp"

#ifdef PYTHON_MODULE
#include "python_module.hpp"
#endif

using namespace std;
#ifndef PYTHON_MODULE
namespace bpopts = boost::program_options;
#endif


#ifndef PYTHON_MODULE

/*
 * Returns the exit code of the program for the outcome of a (failed) job
 */
int exit_code_for_outcome(JobOutcome outcome) {
    switch (outcome) {
        case JobOutcome::Succeeded:            return 0;
        case JobOutcome::InvalidConfiguration: return 1;
        case JobOutcome::Infeasible:           return 4;
        default:                               return 3;
    }
}

/*
 * Returns the exit code for a batch, i.e. the most severe one of all failed jobs
 * (severity: 3 > 1 > 4 > 0)
 */
template<typename T>
int exit_code_for_batch(const vector<T>& entries) {
    bool any_internal = false, any_config = false, any_infeasible = false;
    for (const T& e : entries) {
        int c = exit_code_for_outcome(e.outcome);
        if      (c == 3) any_internal   = true;
        else if (c == 1) any_config     = true;
        else if (c == 4) any_infeasible = true;
    }
    if (any_internal)   return 3;
    if (any_config)     return 1;
    if (any_infeasible) return 4;
    return 0;
}

/*
 * Writes the variable dumps of all failed batch entries
 */
template<typename T>
void output_batch_dumps(const vector<T>& entries, const string& label_prefix) {
    unsigned long i = 0;
    for (const T& e : entries) {
        if (!e.variable_dump.empty()) {
            filesystem::path fpath = output::outputVariableDump(label_prefix + "-" + to_string(i), e.variable_dump);
            StatusOutput::add_error_message("Variable dump written to " + fpath.string());
        }
        i++;
    }
}

#endif


/**
 * @brief Entry point of the dispatch optimization.
 *
 * This function loads the configuration and the time series, runs the
 * selected mode and writes all outputs.
 *
 * @param argc Number of command line arguments.
 * @param argv Array of command line argument strings.
 *
 * @return Return code indicating the execution result of the program:
 *   - **0**  Normal execution, no errors occurred
 *   - **1**  Wrong parameters or invalid configuration
 *   - **2**  Required file not found / error during database connections
 *   - **3**  Solver error or internal consistency error
 *   - **4**  The dispatch problem is infeasible
 *   - **5**  No optimization executed (e.g., help displayed)
 */
int main(int argc, char* argv[]) {

#ifndef PYTHON_MODULE
    //
    // parsing command line arguments
    //
    unsigned long scenario_id;
    string config_filepath;
    //
    bpopts::options_description opts_desc("Options");
    opts_desc.add_options()
        ("help,h",                                 "Show help")
        ("config",     bpopts::value<string>(),    "Path to the JSON configuration file")
        ("scenario",   bpopts::value<unsigned long>(), "ID of the scenario that should be used")
        ("mode",       bpopts::value<string>()->default_value("single"), "Run mode: 'single' optimizes one horizon, 'periods' optimizes every period of the series independently and compares it to the diesel-only supply, 'sweep' optimizes the horizon for multiple battery capacities")
        ("first-hour", bpopts::value<unsigned long>(), "First hour of the series that should be optimized. Overwrites the value of the config file.")
        ("hours",      bpopts::value<unsigned long>(), "Number of hours to optimize (0 = until the end of the series). Overwrites the value of the config file.")
        ("sweep-capacities", bpopts::value<string>(), "Comma separated list of battery capacities in kWh for the mode 'sweep'. Overwrites the value of the config file.")
        ("n_threads,n", bpopts::value<unsigned int>()->default_value(0), "Number of working threads for the modes 'periods' and 'sweep'. Defaults to 0, i.e. all runs are executed by the main thread.")
        ("max-concurrent-solves", bpopts::value<unsigned long>()->default_value(0), "The maximum number of solver calls that run at the same time. Defaults to 0 (unbounded).")
        ("stop-on-err,e",                          "Skip the remaining runs of a worker after the first failed run.")
        ("output",     bpopts::value<string>(),    "Output directory. Overwrites the value of the config file.")
        ("json",                                   "Additionally write the result as JSON file (mode 'single' only).")
        ("tui",                                    "Show the status screen (ncurses) instead of plain output.");
    bpopts::positional_options_description opts_desc_pos;
    opts_desc_pos.add("scenario", -1);
    bpopts::variables_map opts_vals;
    try {
        bpopts::command_line_parser parser{argc, argv};
        parser.options(opts_desc).positional(opts_desc_pos);
        bpopts::parsed_options parsed_options = parser.run();
        bpopts::store( parsed_options, opts_vals );
        bpopts::notify(opts_vals);
    } catch (const bpopts::error &err) {
        cerr << "Error when parsing command line arguments:" << "\n";
        cerr << err.what() << endl;
        return 1;
    }
    // now, command line arguments are parsed
    // we now set the internal variables accordingly
    if (opts_vals.count("help") > 0) {
        cerr << opts_desc << endl;
        cerr << "Usage: dispatch [-h] [--config PATH] [--mode single|periods|sweep] [[--scenario] IDscenario]" << endl;
        return 5;
    }
    if (opts_vals.count("config") > 0) {
        config_filepath = opts_vals["config"].as<string>();
    } else {
        config_filepath = "../config/dispatch_config.json";
    }
    if (opts_vals.count("scenario") > 0) {
        scenario_id = opts_vals["scenario"].as<unsigned long>();
    } else {
        scenario_id = 1;
    }
    string mode_str = opts_vals["mode"].as<string>();
    if (mode_str == "single") {
        Global::set_run_mode(global::RunMode::Single);
    } else if (mode_str == "periods") {
        Global::set_run_mode(global::RunMode::PeriodAnalysis);
    } else if (mode_str == "sweep") {
        Global::set_run_mode(global::RunMode::CapacitySweep);
    } else {
        cerr << "Error when parsing command line arguments: invalid option for --mode given!" << endl;
        return 1;
    }
    unsigned int n_threads = opts_vals["n_threads"].as<unsigned int>();
    Global::set_n_threads( n_threads );
    if (n_threads == 1) {
        cerr << "Warning: Defining only 1 working thread is useless, as the main thread will wait until the worker is finished.\nPlease increase the number of working threads or disable multi-threading by setting n_threads to 0." << std::endl;
    }
    Global::set_max_concurrent_solves( opts_vals["max-concurrent-solves"].as<unsigned long>() );
    Global::set_stop_on_err(      opts_vals.count("stop-on-err") > 0 );
    Global::set_create_json_output( opts_vals.count("json") > 0 );
    Global::set_use_tui(          opts_vals.count("tui") > 0 );

    // get time for time measurement
    auto t1 = std::chrono::system_clock::now();
    global::time_of_run_start = t1;

    cout << "Initializing the dispatch optimization for scenario ID " << scenario_id << endl;

    //
    // open and parse the config file
    //
    configld::ScenarioConfig config;
    if (!configld::load_config_file(scenario_id, config_filepath, config)) {
        return 1;
    }

    //
    // command line arguments overwrite the values of the config file
    //
    if (opts_vals.count("first-hour") > 0)
        config.first_hour = opts_vals["first-hour"].as<unsigned long>();
    if (opts_vals.count("hours") > 0)
        config.n_hours = opts_vals["hours"].as<unsigned long>();
    if (opts_vals.count("sweep-capacities") > 0) {
        try {
            config.sweep_capacities_kWh = parse_double_list( opts_vals["sweep-capacities"].as<string>() );
        } catch (const std::logic_error& e) {
            cerr << "Error when parsing values of command line argument --sweep-capacities: " << e.what() << endl;
            return 1;
        }
    }
    if (opts_vals.count("output") > 0)
        Global::set_output_path( opts_vals["output"].as<string>() );
    Global::set_scenario_id(scenario_id);
    Global::LockAllVariables();

    //
    // bevore starting the optimization:
    // check if all global variables are set -> if not, error!
    //
    if (!Global::AllVariablesInitialized()) {
        cout << "Some global variables are not initialized!" << endl;
        Global::PrintUninitializedVariables();
        return 1;
    }

    //
    // load the time series
    //
    HorizonInput series;
    if (Global::get_series_source() == global::SeriesSource::CSVFile) {
        filesystem::path fpath = filesystem::path(Global::get_input_path()) / Global::get_series_file_name();
        if (!configld::load_series_from_csv(fpath.string(), config.solar_capacity_kW, series))
            return 2;
    } else {
        filesystem::path fpath = filesystem::path(Global::get_input_path()) / Global::get_database_name();
        if (!configld::load_series_from_database(fpath.string(), Global::get_series_table_name(), series))
            return 2;
    }
    cout << "Loaded " << series.get_n_hours() << " hours of load and solar data." << endl;

    //
    // validate the configuration (fail fast before any solver call)
    //
    HorizonInput horizon;
    unique_ptr<AssetConfig> asset_config;
    try {
        series.validate();
        horizon = series.window(config.first_hour, config.n_hours);
        asset_config = make_unique<AssetConfig>( configld::finalize_asset_parameters(config) );
        dispatch::validateSolverSettings(config.solver);
    } catch (const ConfigurationError& e) {
        cerr << "Invalid configuration: " << e.what() << endl;
        return 1;
    }

    //
    // Output all variable values (first time to stdout / cout)
    //
    configld::output_variable_values(std::cout, config);

    try {
        output::initializeOutputDirectory(scenario_id);
    } catch (const filesystem::filesystem_error& e) {
        cerr << "Output directory cannot be created: " << e.what() << endl;
        return 2;
    }

    // get time for time measurement
    auto t2 = std::chrono::system_clock::now();

    //
    // Run the selected mode
    //
    if (Global::get_use_tui())
        StatusOutput::initialize_ncurses();
    StatusOutput::start_status_updater_thread();
    int return_code = 0;
    analysis::BatchSettings batch;
    batch.n_threads             = Global::get_n_threads();
    batch.max_concurrent_solves = Global::get_max_concurrent_solves();
    batch.stop_on_err           = Global::get_stop_on_err();

    if (Global::get_run_mode() == global::RunMode::Single) {
        const string label = "S" + to_string(scenario_id);
        try {
            DispatchResult result = dispatch::runDispatch(horizon, *asset_config, config.solver, createDefaultMilpSolver, label);
            const DieselOnlyBaseline baseline = dispatch::computeDieselOnlyBaseline(horizon, *asset_config);
            output::outputSchedule(result, horizon.offset);
            output::outputSummary(result, baseline);
            if (Global::get_create_json_output())
                output::outputResultJSON(result, label, baseline);
            stringstream ss;
            ss << "Optimization finished (" << dispatchStatusToString(result.status) << "): total cost = "
               << result.summary.total_cost << ", diesel-only cost = " << baseline.cost;
            if (asset_config->has_fuel_curve())
                ss << ", fuel = " << result.summary.fuel_L << " L (diesel-only: " << baseline.fuel_L << " L)";
            StatusOutput::add_status_output(ss.str());
        } catch (const ConfigurationError& e) {
            StatusOutput::add_error_message(string("Invalid configuration: ") + e.what());
            return_code = 1;
        } catch (const InfeasibleModelError& e) {
            StatusOutput::add_error_message(e.what());
            for (const InfeasibilityHint& hint : e.get_hints()) {
                StatusOutput::add_error_message("  hour " + to_string(hint.hour + horizon.offset) + " (" + hint.constraint_class + "): " + hint.detail);
            }
            return_code = 4;
        } catch (const SolverError& e) {
            StatusOutput::add_error_message(e.what());
            return_code = 3;
        } catch (const InternalConsistencyError& e) {
            if (!e.get_variable_dump().empty()) {
                filesystem::path fpath = output::outputVariableDump(label, e.get_variable_dump());
                StatusOutput::add_error_message("Variable dump written to " + fpath.string());
            }
            return_code = 3;
        }
    } else if (Global::get_run_mode() == global::RunMode::PeriodAnalysis) {
        vector<analysis::PeriodDefinition> periods;
        try {
            if (config.period_mode == global::PeriodSplitMode::CalendarMonth && horizon.timestamps.size() == horizon.get_n_hours()) {
                periods = analysis::splitIntoCalendarMonths(horizon);
            } else {
                if (config.period_mode == global::PeriodSplitMode::CalendarMonth)
                    StatusOutput::add_warning("The series has no time stamps, splitting into periods of " + to_string(config.period_length_h) + " hours instead.");
                periods = analysis::splitIntoFixedLengthPeriods(horizon, config.period_length_h);
            }
        } catch (const ConfigurationError& e) {
            StatusOutput::add_error_message(string("Invalid configuration: ") + e.what());
            return_code = 1;
        }
        if (return_code == 0) {
            analysis::PeriodAnalysisReport report = analysis::runPeriodAnalysis(horizon, *asset_config, config.solver, periods, batch);
            output::outputPeriods(report);
            output_batch_dumps(report.periods, "period");
            return_code = exit_code_for_batch(report.periods);
        }
    } else {
        if (config.sweep_capacities_kWh.empty()) {
            StatusOutput::add_error_message("No battery capacities given for the sweep (use 'sweep battery capacities kWh' or --sweep-capacities).");
            return_code = 1;
        } else {
            // keep the initial SoC in kWh if it is given in kWh, otherwise scale it with the capacity
            double initial_soc_fraction = config.initial_soc_kWh ? -1.0 : config.initial_soc_fraction;
            vector<analysis::SweepPoint> points = analysis::runBatteryCapacitySweep(
                horizon, *asset_config, config.sweep_capacities_kWh, initial_soc_fraction, config.solver, batch);
            output::outputSweep(points);
            output_batch_dumps(points, "sweep");
            return_code = exit_code_for_batch(points);
        }
    }
    StatusOutput::stop_status_updater_thread();
    if (Global::get_use_tui())
        StatusOutput::shutdown_ncurses();

    // get time for time measurement and send first values to the file
    auto t3 = std::chrono::system_clock::now();
    long s_setup = std::chrono::duration_cast<std::chrono::seconds>(t2-t1).count();
    long s_main  = std::chrono::duration_cast<std::chrono::seconds>(t3-t2).count();
    output::outputRuntimeInformation(s_setup, s_main);

    //
    // Output all variable values (second time to a file)
    //
    std::ofstream log_file(output::getOutputFilePath("parameter-settings.txt"));
    configld::output_variable_values(log_file, config);
    log_file.close();

    cout << "Run-time information:\n";
    cout << "  Setup and data loading: " << s_setup << "s\n";
    cout << "  Main run:               " << s_main  << "s\n";
    cout << "  Solver calls:           " << global::n_solver_calls_finished.load() << "\n";
    cout << "  Warnings / errors:      " << StatusOutput::get_n_warnings() << " / " << StatusOutput::get_n_errors() << std::endl;

    return return_code;

#else
    return 0;
#endif
}

#ifdef PYTHON_MODULE

using namespace pybind11::literals;

// Module definition
PYBIND11_MODULE(MicrogridDispatch, m) {
    m.doc() = "Python bindings for the C++ microgrid dispatch optimization.";

    pybind11::register_exception<ConfigurationError>(m, "ConfigurationError", PyExc_RuntimeError);
    pybind11::register_exception<InfeasibleModelError>(m, "InfeasibleModelError", PyExc_RuntimeError);
    pybind11::register_exception<InternalConsistencyError>(m, "InternalConsistencyError", PyExc_RuntimeError);
    pybind11::register_exception<SolverError>(m, "SolverError", PyExc_RuntimeError);

    m.def("optimize", &pyconn::optimize, "load"_a, "solar"_a, "config"_a = pybind11::dict(), "solver"_a = pybind11::dict(),
          "Optimizes the dispatch for the given hourly load and solar series (in kW). "
          "config uses the parameter names of the config file (e.g. 'battery capacity kWh'), "
          "solver accepts 'time_limit', 'mip_rel_gap', 'retry_time_factor' and 'verbose'. "
          "Returns the result as dict.");
    m.def("diesel_only_cost", &pyconn::diesel_only_cost, "load"_a, "config"_a = pybind11::dict(),
          "Returns the cost of supplying the load by the diesel generator only.");
}

#endif
