#include "setup_and_dataloading.h"


#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <list>
#include <sqlite3.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#define BOOST_BIND_GLOBAL_PLACEHOLDERS
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

using namespace std;
namespace bpt = boost::property_tree;


#include "errors.h"
#include "global.h"
#include "helper.h"


namespace {

    //
    // Reads the value of one config element and converts
    // conversion errors into a ConfigurationError with the parameter name
    //
    template<typename T>
    T read_value(const string& element_name, const bpt::ptree& element) {
        try {
            return element.get_value<T>();
        } catch (bpt::ptree_bad_data&) {
            throw ConfigurationError("Parameter '" + element_name + "' has the invalid value '" + element.data() + "' in config-json.");
        }
    }

    unsigned long read_non_negative_integer(const string& element_name, const bpt::ptree& element) {
        long value = read_value<long>(element_name, element);
        if (value < 0)
            throw ConfigurationError("Parameter '" + element_name + "' must be >= 0 in config-json.");
        return (unsigned long) value;
    }

    //
    // Parses one scenario parameter (i.e. no process-wide parameter like paths)
    // Returns false if the element name is unknown.
    //
    bool parse_scenario_element(const string& element_name, const bpt::ptree& scenario_dict, configld::ScenarioConfig& config) {
        if      ( element_name.compare("first hour")                      == 0 )
        {
            config.first_hour = read_non_negative_integer(element_name, scenario_dict);
        }
        else if ( element_name.compare("horizon hours")                   == 0 )
        {
            config.n_hours = read_non_negative_integer(element_name, scenario_dict);
        }
        else if ( element_name.compare("diesel capacity kW")              == 0 )
        {
            config.assets.diesel_capacity_kW = read_value<double>(element_name, scenario_dict);
        }
        else if ( element_name.compare("diesel min stable kW")            == 0 )
        {
            config.diesel_min_stable_kW = read_value<double>(element_name, scenario_dict);
        }
        else if ( element_name.compare("diesel min load fraction")        == 0 )
        {
            config.assets.diesel_min_load_fraction = read_value<double>(element_name, scenario_dict);
            config.diesel_min_stable_kW.reset();
        }
        else if ( element_name.compare("fuel price per L")                == 0 )
        {
            config.fuel_curve.fuel_price_per_L = read_value<double>(element_name, scenario_dict);
        }
        else if ( element_name.compare("diesel intercept L per h")        == 0 )
        {
            config.fuel_curve.intercept_L_per_h = read_value<double>(element_name, scenario_dict);
        }
        else if ( element_name.compare("diesel slope L per kWh")          == 0 )
        {
            config.fuel_curve.slope_L_per_kWh = read_value<double>(element_name, scenario_dict);
        }
        else if ( element_name.compare("carbon tax per t")                == 0 )
        {
            config.fuel_curve.carbon_tax_per_t = read_value<double>(element_name, scenario_dict);
        }
        else if ( element_name.compare("fuel cost per kWh")               == 0 )
        {
            config.fuel_cost_per_kWh = read_value<double>(element_name, scenario_dict);
        }
        else if ( element_name.compare("carbon tax per kWh")              == 0 )
        {
            config.carbon_tax_per_kWh = read_value<double>(element_name, scenario_dict);
        }
        else if ( element_name.compare("diesel no-load cost per h")       == 0 )
        {
            config.diesel_no_load_cost_per_h = read_value<double>(element_name, scenario_dict);
        }
        else if ( element_name.compare("battery capacity kWh")            == 0 )
        {
            config.assets.battery_capacity_kWh = read_value<double>(element_name, scenario_dict);
        }
        else if ( element_name.compare("battery max charge kW")           == 0 )
        {
            config.assets.battery_max_charge_kW = read_value<double>(element_name, scenario_dict);
        }
        else if ( element_name.compare("battery max discharge kW")        == 0 )
        {
            config.assets.battery_max_discharge_kW = read_value<double>(element_name, scenario_dict);
        }
        else if ( element_name.compare("battery power kW")                == 0 )
        {
            double p = read_value<double>(element_name, scenario_dict);
            config.assets.battery_max_charge_kW    = p;
            config.assets.battery_max_discharge_kW = p;
        }
        else if ( element_name.compare("battery round-trip efficiency")   == 0 )
        {
            config.assets.battery_round_trip_efficiency = read_value<double>(element_name, scenario_dict);
        }
        else if ( element_name.compare("battery initial SoC")             == 0 )
        {
            double fraction = read_value<double>(element_name, scenario_dict);
            if (!std::isfinite(fraction) || fraction < 0.0 || fraction > 1.0)
                throw ConfigurationError("Parameter 'battery initial SoC' must be in [0, 1] in config-json.");
            config.initial_soc_fraction = fraction;
            config.initial_soc_kWh.reset();
        }
        else if ( element_name.compare("battery initial SoC kWh")         == 0 )
        {
            config.initial_soc_kWh = read_value<double>(element_name, scenario_dict);
        }
        else if ( element_name.compare("battery efficiency split")        == 0 )
        {
            string selection = read_value<string>(element_name, scenario_dict);
            if (selection == "sqrt") {
                config.assets.efficiency_split = EfficiencySplit::SquareRoot;
            } else if (selection == "charge") {
                config.assets.efficiency_split = EfficiencySplit::ChargeLeg;
            } else if (selection == "discharge") {
                config.assets.efficiency_split = EfficiencySplit::DischargeLeg;
            } else {
                cerr << "Parameter 'battery efficiency split' is defined as '" << selection << "' in config-json, but this value is unknown." << endl;
                throw ConfigurationError("Parameter 'battery efficiency split' as defined in config-json is unknown.");
            }
        }
        else if ( element_name.compare("battery exclusive mode")          == 0 )
        {
            string selection = read_value<string>(element_name, scenario_dict);
            if (selection == "indicator") {
                config.assets.battery_exclusivity = BatteryExclusivity::BinaryIndicator;
            } else if (selection == "dominance") {
                config.assets.battery_exclusivity = BatteryExclusivity::CostDominance;
            } else {
                cerr << "Parameter 'battery exclusive mode' is defined as '" << selection << "' in config-json, but this value is unknown." << endl;
                throw ConfigurationError("Parameter 'battery exclusive mode' as defined in config-json is unknown.");
            }
        }
        else if ( element_name.compare("solar capacity kW")               == 0 )
        {
            config.solar_capacity_kW = read_value<double>(element_name, scenario_dict);
            if (!std::isfinite(config.solar_capacity_kW) || config.solar_capacity_kW < 0.0)
                throw ConfigurationError("Parameter 'solar capacity kW' must be >= 0 in config-json.");
        }
        else if ( element_name.compare("curtailment penalty per kWh")     == 0 )
        {
            config.assets.curtailment_penalty_per_kWh = read_value<double>(element_name, scenario_dict);
        }
        else if ( element_name.compare("solver time limit s")             == 0 )
        {
            config.solver.time_limit_s = read_value<double>(element_name, scenario_dict);
        }
        else if ( element_name.compare("solver relative MIP gap")         == 0 )
        {
            config.solver.relative_mip_gap = read_value<double>(element_name, scenario_dict);
        }
        else if ( element_name.compare("solver retry time factor")        == 0 )
        {
            config.solver.retry_time_limit_factor = read_value<double>(element_name, scenario_dict);
        }
        else if ( element_name.compare("solver verbose")                  == 0 )
        {
            config.solver.verbose = read_value<bool>(element_name, scenario_dict);
        }
        else if ( element_name.compare("period mode")                     == 0 )
        {
            string selection = read_value<string>(element_name, scenario_dict);
            if (selection == "calendar month") {
                config.period_mode = global::PeriodSplitMode::CalendarMonth;
            } else if (selection == "fixed length") {
                config.period_mode = global::PeriodSplitMode::FixedLength;
            } else {
                cerr << "Parameter 'period mode' is defined as '" << selection << "' in config-json, but this value is unknown." << endl;
                throw ConfigurationError("Parameter 'period mode' as defined in config-json is unknown.");
            }
        }
        else if ( element_name.compare("period length h")                 == 0 )
        {
            config.period_length_h = read_non_negative_integer(element_name, scenario_dict);
            if (config.period_length_h == 0)
                throw ConfigurationError("Parameter 'period length h' must be > 0 in config-json.");
        }
        else if ( element_name.compare("sweep battery capacities kWh")    == 0 )
        {
            config.sweep_capacities_kWh.clear();
            if (scenario_dict.empty()) {
                // given as comma separated string
                try {
                    config.sweep_capacities_kWh = parse_double_list(scenario_dict.data());
                } catch (std::logic_error&) {
                    throw ConfigurationError("Parameter 'sweep battery capacities kWh' is not a list of numbers in config-json.");
                }
            } else {
                // given as json array
                for (auto& elem : scenario_dict) {
                    config.sweep_capacities_kWh.push_back( read_value<double>(element_name, elem.second) );
                }
            }
        }
        else
        {
            return false;
        }
        return true;
    }

    bool is_comment(const string& element_name) {
        return element_name.rfind("comment", 0) == 0;
    }

}


//
// loads the global config file
//
bool configld::load_config_file(unsigned long scenario_id, const string& filepath, ScenarioConfig& config) {
    //
    // parse json
    bpt::ptree tree_root;
    try {
        bpt::read_json(filepath, tree_root);
    } catch (bpt::json_parser_error& j) {
        cerr << "Error when reading json file: " << j.what() << endl;
        return false;
    }
    try {
        // process-wide variables, they are only written to class Global if the scenario is found
        string input_path  = "";  bool input_path_set  = false;
        string output_path = "";  bool output_path_set = false;
        string series_file = "";  bool series_file_set = false;
        string db_name     = "";  bool db_name_set     = false;
        string db_table    = "";  bool db_table_set    = false;

        //
        // define internal functions (here i.e. a lambda function with complete capture-by-reference)
        auto parse_element = [&](const string& element_name, const bpt::ptree& scenario_dict) -> void {
            if      ( element_name.compare("data input path")   == 0 )
            {
                input_path      = scenario_dict.get_value<string>();
                input_path_set  = true;
            }
            else if ( element_name.compare("data output path")  == 0 )
            {
                output_path     = scenario_dict.get_value<string>();
                output_path_set = true;
            }
            else if ( element_name.compare("time series file")  == 0 )
            {
                series_file     = scenario_dict.get_value<string>();
                series_file_set = true;
                db_name_set     = false;
            }
            else if ( element_name.compare("database name")     == 0 )
            {
                db_name         = scenario_dict.get_value<string>();
                db_name_set     = true;
                series_file_set = false;
            }
            else if ( element_name.compare("database table")    == 0 )
            {
                db_table        = scenario_dict.get_value<string>();
                db_table_set    = true;
            }
            else if ( element_name.compare("id")                == 0 ||
                      element_name.compare("inherits from")     == 0 ||
                      is_comment(element_name) )
            {}
            else if ( !parse_scenario_element(element_name, scenario_dict, config) )
            {
                throw ConfigurationError("Unknown config parameter '" + element_name + "' in config-json.");
            }
            return;
        };

        //
        // read default values
        auto defaults = tree_root.get_child_optional("Default Scenario Values");
        if (defaults) {
            for (auto& scenario_dict_all : defaults.get()) {
                parse_element(scenario_dict_all.first, scenario_dict_all.second);
            }
        }

        //
        // search the correct scenario dictionary
        // and read all variables from there, overwrite defaults if it necessary
        auto find_scenario_id_and_parse = [&](unsigned long scenario_id_to_find) -> bool {
            for (auto& scenario_dict_all : tree_root.get_child("Scenarios")) {
                auto& scenario_dict = scenario_dict_all.second;
                if (scenario_dict.get<unsigned long>("id") == scenario_id_to_find) {
                    for (auto& s : scenario_dict) {
                        parse_element(s.first, s.second);
                    }
                    return true;
                }
            }
            return false;
        };
        list<unsigned long> scenarios_to_load;
        scenarios_to_load.push_front(scenario_id);
        // get all scenario IDs from which the selected one inherits
        bool inheritance_ended = false;
        unsigned long current_search_scenario_id = scenario_id;
        while (!inheritance_ended) {
            inheritance_ended = true;
            for (auto& scenario_dict_all : tree_root.get_child("Scenarios")) {
                auto& scenario_dict = scenario_dict_all.second;
                if (scenario_dict.get<unsigned long>("id") == current_search_scenario_id) {
                    auto e = scenario_dict.get_optional<unsigned long>("inherits from");
                    // check if there is a scenario from which we inherited
                    if (e.is_initialized()) {
                        unsigned long upper_scenario = e.get();
                        if (find(scenarios_to_load.begin(), scenarios_to_load.end(), upper_scenario) != scenarios_to_load.end()) {
                            cerr << "Error in config file: Ring closure in the inheritance for scenario ID " << upper_scenario << "!" << endl;
                            return false;
                        }
                        scenarios_to_load.push_front(upper_scenario);
                        current_search_scenario_id = upper_scenario;
                        inheritance_ended = false;
                    }
                    break; // quit the inner loop
                }
            }
        }
        // load all required scenario definitions, the most general one first
        for (unsigned long s : scenarios_to_load) {
            if (! find_scenario_id_and_parse(s) ) {
                cerr << "Scenario " << s << " was not found in the config file!" << endl;
                return false;
            }
        }

        //
        // Finally, add to global variable collection
        // Relative paths are interpreted relative to the location of the config file
        filesystem::path config_dir = filesystem::path(filepath).parent_path();
        auto resolve = [&](const string& p) -> string {
            filesystem::path fp(p);
            if (fp.is_relative())
                fp = config_dir / fp;
            return fp.lexically_normal().string();
        };
        Global::set_scenario_id(scenario_id);
        if (input_path_set)  Global::set_input_path(  resolve(input_path)  );
        if (output_path_set) Global::set_output_path( resolve(output_path) );
        if (series_file_set) {
            Global::set_series_file_name(series_file);
            Global::set_series_source(global::SeriesSource::CSVFile);
        }
        if (db_name_set) {
            Global::set_database_name(db_name);
            Global::set_series_source(global::SeriesSource::Database);
        }
        if (db_table_set)    Global::set_series_table_name(db_table);
        return true;

    } catch (ConfigurationError& e) {
        cerr << "Error in config file: " << e.what() << endl;
        return false;
    } catch (bpt::ptree_error& j) {
        cerr << "Error when parsing json file: " << j.what() << endl;
        return false;
    }
}


void configld::parse_scenario_tree(const bpt::ptree& tree, ScenarioConfig& config) {
    for (auto& element : tree) {
        if (is_comment(element.first))
            continue;
        if (!parse_scenario_element(element.first, element.second, config))
            throw ConfigurationError("Unknown parameter '" + element.first + "'.");
    }
}


AssetParameters configld::finalize_asset_parameters(const ScenarioConfig& config) {
    AssetParameters params = config.assets;
    //
    // cost coefficients: either all given directly or all derived from the fuel curve
    if (config.fuel_cost_per_kWh || config.carbon_tax_per_kWh || config.diesel_no_load_cost_per_h) {
        params.fuel_cost_per_kWh                = config.fuel_cost_per_kWh.value_or(0.0);
        params.carbon_tax_per_kWh               = config.carbon_tax_per_kWh.value_or(0.0);
        params.diesel_no_load_fuel_cost_per_h   = config.diesel_no_load_cost_per_h.value_or(0.0);
        params.diesel_no_load_carbon_cost_per_h = 0.0;
    } else {
        config.fuel_curve.applyTo(params);
    }
    //
    // minimum stable load
    if (config.diesel_min_stable_kW && params.diesel_capacity_kW > 0.0) {
        params.diesel_min_load_fraction = config.diesel_min_stable_kW.value() / params.diesel_capacity_kW;
    }
    //
    // initial SoC
    if (config.initial_soc_kWh) {
        params.battery_initial_soc_kWh = config.initial_soc_kWh.value();
    } else {
        params.battery_initial_soc_kWh = config.initial_soc_fraction * params.battery_capacity_kWh;
    }
    return params;
}



//
// Loading of the time series
//

bool configld::load_series_from_csv(const string& filepath, double solar_capacity_kW, HorizonInput& series) {
    ifstream series_input;
    series_input.open(filepath, ios::in);
    if (!series_input.good()) {
        cerr << "Time series file " << filepath << " cannot be opened!" << endl;
        return false;
    }
    //
    // parse the header
    string currLineString;
    if (!getline(series_input, currLineString)) {
        cerr << "Time series file " << filepath << " is empty!" << endl;
        return false;
    }
    vector<string> header = split_string(currLineString, ',');
    long col_load = -1, col_solar_kw = -1, col_solar_pu = -1, col_timestamp = -1;
    for (size_t c = 0; c < header.size(); c++) {
        string name = trim_string(header[c]);
        transform(name.begin(), name.end(), name.begin(), [](unsigned char ch) { return (char) tolower(ch); });
        if      (name == "load_kw")  col_load     = (long) c;
        else if (name == "solar_kw") col_solar_kw = (long) c;
        else if (name == "solar_pu") col_solar_pu = (long) c;
        else if (c == 0 && (name.empty() || name == "timestamp")) col_timestamp = 0;
    }
    if (col_load < 0 || (col_solar_kw < 0 && col_solar_pu < 0)) {
        cerr << "Time series file " << filepath << " needs the columns load_kw and solar_kw or solar_pu!" << endl;
        return false;
    }
    const bool   solar_per_unit = (col_solar_kw < 0);
    const size_t col_solar      = (size_t) (solar_per_unit ? col_solar_pu : col_solar_kw);
    //
    // parse all rows
    HorizonInput loaded;
    unsigned long line_number = 1;
    while (getline(series_input, currLineString)) {
        line_number++;
        if (trim_string(currLineString).empty())
            continue;
        vector<string> fields = split_string(currLineString, ',');
        if (fields.size() != header.size()) {
            cerr << "Error in time series file " << filepath << " in line " << line_number << ": expected "
                 << header.size() << " fields, but found " << fields.size() << endl;
            return false;
        }
        try {
            double load_kW  = stod(trim_string(fields[(size_t) col_load]));
            double solar    = stod(trim_string(fields[col_solar]));
            if (solar_per_unit)
                solar *= solar_capacity_kW;
            loaded.load_kW.push_back(load_kW);
            loaded.solar_available_kW.push_back(solar);
        } catch (std::logic_error&) {
            cerr << "Error in time series file " << filepath << " in line " << line_number << ": value is not a number" << endl;
            return false;
        }
        if (col_timestamp >= 0)
            loaded.timestamps.push_back(trim_string(fields[0]));
    }
    if (loaded.load_kW.empty()) {
        cerr << "Time series file " << filepath << " does not contain any hour!" << endl;
        return false;
    }
    series = std::move(loaded);
    return true;
}


//
// Switch off unused parameter warning for the following block,
// as the parameters are ignored most of the time
//
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-parameter"

struct SeriesCallbackData {
    HorizonInput* series;
    long last_timestep_id;
    string error;
};

int load_series_from_database_callback(void* data, int argc, char** argv, char** colName) {
    /*
     * This is the callback function for loading the hourly series
     *
     * Columns:
     * 0           1          2        3
     * TimestepID  Timestamp  Load_kW  SolarAvailable_kW
     */
    SeriesCallbackData* cbd = (SeriesCallbackData*) data;
    if (argc != 4) {
        cbd->error = "Number of columns not equal to 4 for one row!";
        return 1;
    }
    if (argv[0] == NULL || argv[2] == NULL || argv[3] == NULL) {
        cbd->error = "NULL value in the hourly series!";
        return 1;
    }
    try {
        long timestep_id = stol(argv[0]);
        if (cbd->last_timestep_id >= 0 && timestep_id != cbd->last_timestep_id + 1) {
            cbd->error = "TimestepIDs are not consecutive (" + to_string(cbd->last_timestep_id) + " is followed by " + to_string(timestep_id) + ")!";
            return 1;
        }
        cbd->last_timestep_id = timestep_id;
        cbd->series->load_kW.push_back( stod(argv[2]) );
        cbd->series->solar_available_kW.push_back( stod(argv[3]) );
        cbd->series->timestamps.push_back( argv[1] != NULL ? argv[1] : "" );
    } catch (std::logic_error&) {
        cbd->error = "Value in the hourly series is not a number!";
        return 1;
    }
    return 0;
}

int sql_check_if_table_exists_callback(void* data, int argc, char** argv, char** colName) {
    /*
     * This is the callback function for checking, if a table exists or not
     *
     * @param data: A reference to a boolean variable that will be set to true if the table exists
     */
    *((bool*) data) = true;
    return 0;
}

#pragma GCC diagnostic pop

bool configld::load_series_from_database(const string& filepath, const string& table_name, HorizonInput& series) {
    if (! filesystem::exists( filesystem::path(filepath) ) ) {
        cerr << "Database file " << filepath << " not found!" << endl;
        return false;
    }
    // the table name is part of the query, only allow plain names
    if (table_name.empty() || !all_of(table_name.begin(), table_name.end(), [](unsigned char c) { return isalnum(c) || c == '_'; })) {
        cerr << "Invalid table name '" << table_name << "'!" << endl;
        return false;
    }

    sqlite3* dbcon;
    int rc = sqlite3_open(filepath.c_str(), &dbcon);
    if (rc != 0) {
        cerr << "Error when opening database " << filepath << ": " << sqlite3_errmsg(dbcon) << endl;
        sqlite3_close(dbcon);
        return false;
    }

    //
    // check if the table exists
    bool table_exists = false;
    char* sqlErrorMsg = NULL;
    string sql_query = "SELECT name FROM sqlite_master WHERE type='table' AND name='" + table_name + "';";
    int ret_val = sqlite3_exec(dbcon, sql_query.c_str(), sql_check_if_table_exists_callback, &table_exists, &sqlErrorMsg);
    if (ret_val != 0) {
        cerr << "Error when executing command '" << sql_query << "': " << sqlErrorMsg << endl;
        sqlite3_free(sqlErrorMsg);
        sqlite3_close(dbcon);
        return false;
    }
    if (!table_exists) {
        cerr << "Table " << table_name << " does not exist in database " << filepath << "!" << endl;
        sqlite3_close(dbcon);
        return false;
    }

    //
    // load the series
    HorizonInput loaded;
    SeriesCallbackData cbd { &loaded, -1, "" };
    sql_query = "SELECT TimestepID, Timestamp, Load_kW, SolarAvailable_kW FROM " + table_name + " ORDER BY TimestepID;";
    ret_val = sqlite3_exec(dbcon, sql_query.c_str(), load_series_from_database_callback, &cbd, &sqlErrorMsg);
    if (ret_val != 0) {
        if (!cbd.error.empty())
            cerr << "Error when loading the hourly series from table " << table_name << ": " << cbd.error << endl;
        else
            cerr << "Error when executing command '" << sql_query << "': " << (sqlErrorMsg != NULL ? sqlErrorMsg : "") << endl;
        sqlite3_free(sqlErrorMsg);
        sqlite3_close(dbcon);
        return false;
    }
    sqlite3_close(dbcon);

    if (loaded.load_kW.empty()) {
        cerr << "Table " << table_name << " does not contain any hour!" << endl;
        return false;
    }
    series = std::move(loaded);
    return true;
}


//
// Implementation of configld::output_variable_values()
//
#define PRINT_VAR(varname) current_outstream << "    " << std::setw(48) << std::left << #varname << " = " << varname << "\n"
#define PRINT_ENUM_VAR(varname, lambda_expr) current_outstream << "    " << std::setw(48) << std::left << #varname << " = " << lambda_expr(varname) << "\n"

void configld::output_variable_values(ostream& current_outstream, const ScenarioConfig& config) {
    const AssetParameters assets = finalize_asset_parameters(config);
    current_outstream << "Build information:\n";
    current_outstream << "    Build at " << __DATE__ << " " << __TIME__ <<  "\n";
    #ifdef __GNUC__
    current_outstream << "    GCC was used as compiler.\n    GCC Version = " << __GNUC__ << "." << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
    #endif
    #ifdef __VERSION__
    current_outstream << "    Compiler version = " << __VERSION__ << "\n";
    #endif
    #ifdef __OPTIMIZE__
    current_outstream << "    Optimization was enabled during compile time.\n";
    #endif
    #ifdef USE_OR_TOOLS
    current_outstream << "    Solver backend = OR-Tools (SCIP)\n";
    #elif defined(USE_GUROBI)
    current_outstream << "    Solver backend = Gurobi\n";
    #endif
    current_outstream << "    C++ standard = " << __cplusplus << "\n\n";
    current_outstream << "List of parameter settings:\n";
    // Flow control
    current_outstream << "  Scenario selection and flow control:\n";
    PRINT_VAR(Global::get_scenario_id());
    PRINT_ENUM_VAR(Global::get_run_mode(), [](auto var){switch(var){case global::RunMode::Single: return "Single"; case global::RunMode::PeriodAnalysis: return "PeriodAnalysis"; case global::RunMode::CapacitySweep: return "CapacitySweep"; default: return "";}});
    PRINT_VAR(Global::get_n_threads());
    PRINT_VAR(Global::get_max_concurrent_solves());
    PRINT_VAR(Global::get_stop_on_err());
    PRINT_VAR(config.first_hour);
    PRINT_VAR(config.n_hours);
    PRINT_ENUM_VAR(config.period_mode, [](auto var){switch(var){case global::PeriodSplitMode::CalendarMonth: return "CalendarMonth"; case global::PeriodSplitMode::FixedLength: return "FixedLength"; default: return "";}});
    PRINT_VAR(config.period_length_h);
    current_outstream << "    " << std::setw(48) << std::left << "config.sweep_capacities_kWh" << " = ";
    for (size_t i = 0; i < config.sweep_capacities_kWh.size(); i++)
        current_outstream << (i > 0 ? "," : "") << config.sweep_capacities_kWh[i];
    current_outstream << "\n";
    // Data
    current_outstream << "  Data:\n";
    PRINT_VAR(Global::get_input_path());
    PRINT_VAR(Global::get_output_path());
    PRINT_ENUM_VAR(Global::get_series_source(), [](auto var){switch(var){case global::SeriesSource::CSVFile: return "CSVFile"; case global::SeriesSource::Database: return "Database"; default: return "";}});
    PRINT_VAR(Global::get_series_file_name());
    PRINT_VAR(Global::get_database_name());
    PRINT_VAR(Global::get_series_table_name());
    PRINT_VAR(config.solar_capacity_kW);
    // Assets
    current_outstream << "  Diesel generator:\n";
    PRINT_VAR(assets.diesel_capacity_kW);
    PRINT_VAR(assets.diesel_min_load_fraction);
    PRINT_VAR(config.fuel_curve.fuel_price_per_L);
    PRINT_VAR(config.fuel_curve.intercept_L_per_h);
    PRINT_VAR(config.fuel_curve.slope_L_per_kWh);
    PRINT_VAR(config.fuel_curve.carbon_tax_per_t);
    PRINT_VAR(assets.fuel_cost_per_kWh);
    PRINT_VAR(assets.carbon_tax_per_kWh);
    PRINT_VAR(assets.diesel_no_load_fuel_cost_per_h);
    PRINT_VAR(assets.diesel_no_load_carbon_cost_per_h);
    current_outstream << "  Battery storage:\n";
    PRINT_VAR(assets.battery_capacity_kWh);
    PRINT_VAR(assets.battery_max_charge_kW);
    PRINT_VAR(assets.battery_max_discharge_kW);
    PRINT_VAR(assets.battery_round_trip_efficiency);
    PRINT_VAR(assets.battery_initial_soc_kWh);
    PRINT_VAR(efficiencySplitToString(assets.efficiency_split));
    PRINT_VAR(batteryExclusivityToString(assets.battery_exclusivity));
    PRINT_VAR(assets.curtailment_penalty_per_kWh);
    // Solver
    current_outstream << "  Solver settings:\n";
    PRINT_VAR(config.solver.time_limit_s);
    PRINT_VAR(config.solver.relative_mip_gap);
    PRINT_VAR(config.solver.retry_time_limit_factor);
    PRINT_VAR(config.solver.verbose);
}
