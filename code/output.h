/*
 * output.h
 *
 * This contains all functions for writing the results
 * of the dispatch runs to the disk.
 *
 */

#ifndef __OUTPUT_H
#define __OUTPUT_H

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

#include "dispatch_types.h"
#include "period_analysis.h"

namespace output {

    /**
     * This function initializes the output directory for the current scenario,
     * i.e. <output path>/S<scenario id>.
     * An existing directory with the same name is deleted.
     * The path is stored in global::current_output_dir.
     * @param scenario_id The current scenario ID
     */
    void initializeOutputDirectory(unsigned long scenario_id);

    /**
     * Returns the path of a file in the current output directory.
     * Throws a std::logic_error if initializeOutputDirectory() has not been called.
     */
    std::filesystem::path getOutputFilePath(const std::string& filename);

    //
    // The following functions write into an arbitrary stream.
    // They are used by the file output functions below.
    //

    /// Writes the hourly schedule as CSV, series_offset is added to the hour index in column SeriesHour
    void writeScheduleCSV(std::ostream& out, const DispatchResult& result, unsigned long series_offset);
    /// Writes the summary as two-column CSV (Metric,Value)
    void writeSummaryCSV(std::ostream& out, const DispatchResult& result, const DieselOnlyBaseline& baseline);
    /**
     * Writes the complete result (summary, warnings and schedule) as JSON.
     * As Boost.PropertyTree stores all values as strings, numbers and booleans
     * are written as JSON strings (e.g. "total_cost": "60.1", "diesel_on": "true").
     * Readers other than boost::property_tree::read_json have to convert them.
     */
    void writeResultJSON(std::ostream& out, const DispatchResult& result, const std::string& label, const DieselOnlyBaseline& baseline);
    /// Writes one line per period and a final line with the totals
    void writePeriodsCSV(std::ostream& out, const analysis::PeriodAnalysisReport& report);
    /// Writes one line per battery capacity
    void writeSweepCSV(std::ostream& out, const std::vector<analysis::SweepPoint>& points);

    //
    // File outputs into global::current_output_dir
    //
    void outputSchedule(const DispatchResult& result, unsigned long series_offset); ///< dispatch-schedule.csv
    void outputSummary(const DispatchResult& result, const DieselOnlyBaseline& baseline); ///< dispatch-summary.csv
    void outputResultJSON(const DispatchResult& result, const std::string& label, const DieselOnlyBaseline& baseline); ///< dispatch-result.json
    void outputPeriods(const analysis::PeriodAnalysisReport& report);              ///< periods-summary.csv
    void outputSweep(const std::vector<analysis::SweepPoint>& points);             ///< sweep-summary.csv

    /**
     * Writes the variable dump of an internal consistency error into
     * internal-consistency-dump-<run_label>.csv.
     * Characters of the label that are not alphanumeric are replaced by '_'.
     *
     * @return: The path of the written file
     */
    std::filesystem::path outputVariableDump(const std::string& run_label, const std::string& variable_dump);

    /**
     * Output information on the run time to the file runtime-information.csv.
     * This function must not be called before initializeOutputDirectory().
     *
     * @param seconds_setup: The duration of the setup and data loading in seconds
     * @param seconds_main_run: The duration of the main run in seconds
     */
    void outputRuntimeInformation(long seconds_setup, long seconds_main_run);

}

#endif
