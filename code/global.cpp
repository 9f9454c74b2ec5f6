#include "global.h"

using namespace global;


#include <iostream>
#include <string>

using namespace std;



void global::reset_counters() {
    n_solver_calls_started  = 0;
    n_solver_calls_finished = 0;
    n_jobs_total            = 0;
    n_jobs_finished         = 0;
}


bool          Global::is_locked             = false;
string        Global::input_path            = "";
string        Global::output_path           = "";
string        Global::series_file_name      = "";
string        Global::database_name         = "";
string        Global::series_table_name     = "hourly_series";
SeriesSource  Global::series_source         = SeriesSource::CSVFile;
unsigned long Global::scenario_id           = 1;
unsigned int  Global::n_threads             = 0;
unsigned long Global::max_concurrent_solves = 0;
bool          Global::stop_on_err           = false;
bool          Global::create_json_output    = false;
bool          Global::use_tui               = false;
RunMode       Global::run_mode              = RunMode::Single;

bool Global::input_path_init            = false;
bool Global::output_path_init           = false;
bool Global::series_file_name_init      = false;
bool Global::database_name_init         = false;
bool Global::series_table_name_init     = false;
bool Global::series_source_init         = false;
bool Global::scenario_id_init           = false;
bool Global::n_threads_init             = false;
bool Global::max_concurrent_solves_init = false;
bool Global::stop_on_err_init           = false;
bool Global::create_json_output_init    = false;
bool Global::use_tui_init               = false;
bool Global::run_mode_init              = false;

void Global::ResetAllVariables() {
    is_locked             = false;
    input_path            = "";
    output_path           = "";
    series_file_name      = "";
    database_name         = "";
    series_table_name     = "hourly_series";
    series_source         = SeriesSource::CSVFile;
    scenario_id           = 1;
    n_threads             = 0;
    max_concurrent_solves = 0;
    stop_on_err           = false;
    create_json_output    = false;
    use_tui               = false;
    run_mode              = RunMode::Single;
    input_path_init = output_path_init = series_file_name_init = database_name_init = false;
    series_table_name_init = series_source_init = scenario_id_init = n_threads_init = false;
    max_concurrent_solves_init = stop_on_err_init = create_json_output_init = use_tui_init = run_mode_init = false;
}

bool Global::AllVariablesInitialized() {
    if (input_path_init &&
        output_path_init &&
        series_source_init &&
        scenario_id_init &&
        n_threads_init &&
        run_mode_init)
    {
        if ((series_source == SeriesSource::CSVFile  && series_file_name_init) ||
            (series_source == SeriesSource::Database && database_name_init))
        {
            return true;
        }
    }
    return false;
}

void Global::PrintUninitializedVariables() {
    if (!input_path_init) {
        cout << "Variable input_path not initialized." << endl;
    }
    if (!output_path_init) {
        cout << "Variable output_path not initialized." << endl;
    }
    if (!series_source_init) {
        cout << "Variable series_source not initialized." << endl;
    }
    if (!scenario_id_init) {
        cout << "Variable scenario_id not initialized." << endl;
    }
    if (!n_threads_init) {
        cout << "Variable n_threads not initialized." << endl;
    }
    if (!run_mode_init) {
        cout << "Variable run_mode not initialized." << endl;
    }
    if (series_source == SeriesSource::CSVFile && !series_file_name_init) {
        cout << "Variable series_file_name not initialized." << endl;
    }
    if (series_source == SeriesSource::Database && !database_name_init) {
        cout << "Variable database_name not initialized." << endl;
    }
}

void Global::LockAllVariables() {
    is_locked = true;
}

void Global::UnlockAllVariables() {
    is_locked = false;
}

void Global::set_input_path(const string& path) {
    if (input_path_init && is_locked) {
        cerr << "Global variable input_path is already initialized!" << endl;
    } else {
        Global::input_path = path;
        Global::input_path_init = true;
    }
}

void Global::set_output_path(const string& path) {
    if (output_path_init && is_locked) {
        cerr << "Global variable output_path is already initialized!" << endl;
    } else {
        Global::output_path = path;
        Global::output_path_init = true;
    }
}

void Global::set_series_file_name(const string& fname) {
    if (series_file_name_init && is_locked) {
        cerr << "Global variable series_file_name is already initialized!" << endl;
    } else {
        Global::series_file_name = fname;
        Global::series_file_name_init = true;
    }
}

void Global::set_database_name(const string& fname) {
    if (database_name_init && is_locked) {
        cerr << "Global variable database_name is already initialized!" << endl;
    } else {
        Global::database_name = fname;
        Global::database_name_init = true;
    }
}

void Global::set_series_table_name(const string& tname) {
    if (series_table_name_init && is_locked) {
        cerr << "Global variable series_table_name is already initialized!" << endl;
    } else {
        Global::series_table_name = tname;
        Global::series_table_name_init = true;
    }
}

void Global::set_series_source(SeriesSource source) {
    if (series_source_init && is_locked) {
        cerr << "Global variable series_source is already initialized!" << endl;
    } else {
        Global::series_source = source;
        Global::series_source_init = true;
    }
}

void Global::set_scenario_id(unsigned long id) {
    if (scenario_id_init && is_locked) {
        cerr << "Global variable scenario_id is already initialized!" << endl;
    } else {
        Global::scenario_id = id;
        Global::scenario_id_init = true;
    }
}

void Global::set_n_threads(unsigned int n) {
    if (n_threads_init && is_locked) {
        cerr << "Global variable n_threads is already initialized!" << endl;
    } else {
        Global::n_threads = n;
        Global::n_threads_init = true;
    }
}

void Global::set_max_concurrent_solves(unsigned long n) {
    if (max_concurrent_solves_init && is_locked) {
        cerr << "Global variable max_concurrent_solves is already initialized!" << endl;
    } else {
        Global::max_concurrent_solves = n;
        Global::max_concurrent_solves_init = true;
    }
}

void Global::set_stop_on_err(bool value) {
    if (stop_on_err_init && is_locked) {
        cerr << "Global variable stop_on_err is already initialized!" << endl;
    } else {
        Global::stop_on_err = value;
        Global::stop_on_err_init = true;
    }
}

void Global::set_create_json_output(bool value) {
    if (create_json_output_init && is_locked) {
        cerr << "Global variable create_json_output is already initialized!" << endl;
    } else {
        Global::create_json_output = value;
        Global::create_json_output_init = true;
    }
}

void Global::set_use_tui(bool value) {
    if (use_tui_init && is_locked) {
        cerr << "Global variable use_tui is already initialized!" << endl;
    } else {
        Global::use_tui = value;
        Global::use_tui_init = true;
    }
}

void Global::set_run_mode(RunMode mode) {
    if (run_mode_init && is_locked) {
        cerr << "Global variable run_mode is already initialized!" << endl;
    } else {
        Global::run_mode = mode;
        Global::run_mode_init = true;
    }
}
