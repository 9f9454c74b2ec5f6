/*
 *
 * global.h
 *
 * Contains a namespace where all global variables are stored
 *
 * */

#ifndef GLOBAL_H
#define GLOBAL_H

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>

/*!
 * Namespace global
 *
 * It contains all global attributes and variables that
 * might change during program execution.
 *
 * Attention: There is no access protection for these variables!
 * For access protection use class Global.
 *
 * Attention: Do not confuse with class Global (mind the capital "G")!
 */
namespace global {

    inline std::chrono::time_point<std::chrono::system_clock> time_of_run_start; ///< The time when the main run started
    inline std::filesystem::path current_output_dir; ///< Directory where all output files of the current scenario are written to

    inline std::atomic<unsigned long> n_solver_calls_started{0};  ///< Number of solver calls that have been started (including retries)
    inline std::atomic<unsigned long> n_solver_calls_finished{0}; ///< Number of solver calls that have returned
    inline std::atomic<unsigned long> n_jobs_total{0};            ///< Number of dispatch jobs in the current batch
    inline std::atomic<unsigned long> n_jobs_finished{0};         ///< Number of finished dispatch jobs in the current batch

    /*!
     * This enum defines the run modes of the program.
     * It corresponds to the --mode cmd line parameter.
     */
    enum struct RunMode : short {
        Single,           ///< One dispatch run over the selected window
        PeriodAnalysis,   ///< One run per period, compared to the diesel-only baseline
        CapacitySweep     ///< One run per battery capacity
    };

    /*!
     * This enum defines how the series is split for the period analysis.
     */
    enum struct PeriodSplitMode : short {
        CalendarMonth, ///< Split whenever the month in the time stamp changes
        FixedLength    ///< Split into chunks of a fixed number of hours
    };

    /*!
     * This enum defines where the time series are read from.
     */
    enum struct SeriesSource : short {
        CSVFile,
        Database
    };

    void reset_counters(); ///< Resets all solver and job counters to 0

}


/*!
 * class Global
 *
 * This class contains all global variables that cannot change
 * after they have been set once and the variables have been locked.
 *
 * Attention: Not to be confused with namespace global (mind the lower case "g").
 */
class Global {
    public:
        static void ResetAllVariables();    ///< Resets all variables to their uninitialized state and unlocks them
        //
        static bool AllVariablesInitialized();
        static void PrintUninitializedVariables(); ///< Prints all variable names to stdout, that are not initialized
        //
        static void LockAllVariables();   ///< No (set) variable can be overwritten after this call, unset variables can still be set / overwritten once
        static void UnlockAllVariables(); ///< All variables can now be overwritten
        //
        // getter methods
        static const std::string& get_input_path()        { return input_path;        }
        static const std::string& get_output_path()       { return output_path;       }
        static const std::string& get_series_file_name()  { return series_file_name;  }
        static const std::string& get_database_name()     { return database_name;     }
        static const std::string& get_series_table_name() { return series_table_name; }
        static global::SeriesSource get_series_source()  { return series_source;     }
        static unsigned long get_scenario_id()           { return scenario_id;       }
        static unsigned int  get_n_threads()             { return n_threads;         }
        static unsigned long get_max_concurrent_solves() { return max_concurrent_solves; }
        static bool get_stop_on_err()                    { return stop_on_err;       }
        static bool get_create_json_output()             { return create_json_output;}
        static bool get_use_tui()                        { return use_tui;           }
        static global::RunMode get_run_mode()            { return run_mode;          }
        static bool is_output_path_initialized()         { return output_path_init;  }
        //
        // setter methods
        static void set_input_path(const std::string& path);
        static void set_output_path(const std::string& path);
        static void set_series_file_name(const std::string& fname);
        static void set_database_name(const std::string& fname);
        static void set_series_table_name(const std::string& tname);
        static void set_series_source(global::SeriesSource source);
        static void set_scenario_id(unsigned long id);
        static void set_n_threads(unsigned int n);
        static void set_max_concurrent_solves(unsigned long n);
        static void set_stop_on_err(bool value);
        static void set_create_json_output(bool value);
        static void set_use_tui(bool value);
        static void set_run_mode(global::RunMode mode);

    private:
        static bool is_locked;             ///< if set to true, values cannot be changed anymore
        //
        static std::string input_path;        ///< Directory where the input files (series file / database) are located
        static std::string output_path;       ///< Directory where the scenario output directories are created
        static std::string series_file_name;  ///< Name of the CSV file with the hourly series (relative to input_path)
        static std::string database_name;     ///< Name of the SQLite database with the hourly series (relative to input_path)
        static std::string series_table_name; ///< Name of the table in the database
        static global::SeriesSource series_source;
        static unsigned long scenario_id;
        static unsigned int  n_threads;             ///< Number of worker threads for batch runs (0 = calling thread only)
        static unsigned long max_concurrent_solves; ///< Max. number of solver calls running at the same time (0 = unbounded)
        static bool stop_on_err;                    ///< Skip the remaining jobs of a worker after the first failed job
        static bool create_json_output;             ///< Also write the result as JSON file
        static bool use_tui;                        ///< Use the ncurses status screen
        static global::RunMode run_mode;
        //
        static bool input_path_init;
        static bool output_path_init;
        static bool series_file_name_init;
        static bool database_name_init;
        static bool series_table_name_init;
        static bool series_source_init;
        static bool scenario_id_init;
        static bool n_threads_init;
        static bool max_concurrent_solves_init;
        static bool stop_on_err_init;
        static bool create_json_output_init;
        static bool use_tui_init;
        static bool run_mode_init;
};

#endif
