/*
 * test_output.cpp
 *
 * Tests of the CSV and JSON writers and of the output directory handling.
 *
 */

#define BOOST_TEST_MODULE output
#include <boost/test/unit_test.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#define BOOST_BIND_GLOBAL_PLACEHOLDERS
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "dispatch_types.h"
#include "global.h"
#include "output.h"
#include "period_analysis.h"
#include "status_output.hpp"
#include "test_helpers.hpp"

using namespace testhelper;
namespace fs  = std::filesystem;
namespace bpt = boost::property_tree;


namespace {

    DispatchResult makeResult() {
        DispatchResult result;
        result.status         = DispatchStatus::Feasible;
        result.proven_optimal = false;
        result.warnings       = {"time limit of 30 s reached before optimality was proven (gap 1.50 %)"};
        result.solver_name    = "scripted";
        result.solver_attempts= 1;
        result.schedule = {
            {0, "2023-01-01 00:00", 100.0, 0.0,  100.0, true,  0.0, 0.0, 0.0,  0.0,  50.0},
            {1, "2023-01-01 01:00",  50.0, 80.0,   0.0, false, 20.0, 0.0, 70.0, 10.0, 68.0}
        };
        result.summary.total_cost        = 60.1;
        result.summary.fuel_cost         = 50.0;
        result.summary.carbon_cost       = 10.0;
        result.summary.curtailment_penalty = 0.1;
        result.summary.fuel_L            = 39.0;
        result.summary.diesel_energy_kWh = 100.0;
        result.summary.curtailed_kWh     = 10.0;
        return result;
    }

    DieselOnlyBaseline makeBaseline() {
        DieselOnlyBaseline baseline;
        baseline.cost   = 100.0;
        baseline.fuel_L = 63.0;
        return baseline;
    }

    std::vector<std::string> readLines(std::istream& in) {
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(in, line))
            lines.push_back(line);
        return lines;
    }

}


BOOST_AUTO_TEST_CASE(schedule_csv) {
    std::stringstream ss;
    output::writeScheduleCSV(ss, makeResult(), 24);
    std::vector<std::string> lines = readLines(ss);
    BOOST_REQUIRE_EQUAL(lines.size(), 3u);
    BOOST_CHECK_EQUAL(lines[0], "Hour,SeriesHour,Timestamp,Load_kW,SolarAvailable_kW,SolarUsed_kW,Curtailed_kW,"
                                "DieselOutput_kW,DieselOn,BatteryCharge_kW,BatteryDischarge_kW,SoC_kWh");
    BOOST_CHECK_EQUAL(lines[2], "1,25,2023-01-01 01:00,50.0000,80.0000,70.0000,10.0000,0.0000,0,20.0000,0.0000,68.0000");
}

BOOST_AUTO_TEST_CASE(summary_csv) {
    std::stringstream ss;
    output::writeSummaryCSV(ss, makeResult(), makeBaseline());
    std::string text = ss.str();
    BOOST_CHECK(text.rfind("Metric,Value\nStatus,FEASIBLE\nProvenOptimal,0\n", 0) == 0);
    BOOST_CHECK(text.find("TotalCost,60.1000\n") != std::string::npos);
    // the curtailment penalty is not money spent
    BOOST_CHECK(text.find("Savings,40.0000\n") != std::string::npos);
    BOOST_CHECK(text.find("CurtailmentPenalty,0.1000\n") != std::string::npos);
    BOOST_CHECK(text.find("Fuel_L,39.0000\nBaselineFuel_L,63.0000\nFuelSaved_L,24.0000\n") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(result_json_can_be_read_back) {
    std::stringstream ss;
    output::writeResultJSON(ss, makeResult(), "S0001", makeBaseline());
    bpt::ptree root;
    bpt::read_json(ss, root);
    BOOST_CHECK_EQUAL(root.get<std::string>("label"), "S0001");
    BOOST_CHECK_EQUAL(root.get<std::string>("status"), "FEASIBLE");
    BOOST_CHECK_EQUAL(root.get<bool>("proven_optimal"), false);
    BOOST_CHECK_EQUAL(root.get_child("warnings").size(), 1u);
    BOOST_CHECK_CLOSE(root.get<double>("summary.baseline_cost"), 100.0, 1e-9);
    BOOST_CHECK_CLOSE(root.get<double>("summary.total_cost"), 60.1, 1e-9);
    BOOST_CHECK_CLOSE(root.get<double>("summary.savings"), 40.0, 1e-9);
    BOOST_CHECK_CLOSE(root.get<double>("summary.fuel_saved_L"), 24.0, 1e-9);
    // Boost.PropertyTree writes all values as JSON strings
    BOOST_CHECK(ss.str().find("\"total_cost\": \"60.1") != std::string::npos);
    const bpt::ptree& schedule = root.get_child("schedule");
    BOOST_REQUIRE_EQUAL(schedule.size(), 2u);
    BOOST_CHECK_CLOSE(schedule.back().second.get<double>("soc_kWh"), 68.0, 1e-9);
    BOOST_CHECK_EQUAL(schedule.front().second.get<std::string>("timestamp"), "2023-01-01 00:00");
}

BOOST_AUTO_TEST_CASE(periods_csv) {
    analysis::PeriodAnalysisReport report;
    analysis::PeriodReport ok;
    ok.period         = {"2023-01", 0, 744};
    ok.outcome        = JobOutcome::Succeeded;
    ok.proven_optimal = true;
    ok.baseline_cost  = 200.0;
    ok.optimized_cost = 150.0;
    ok.savings        = 50.0;
    ok.savings_percent= 25.0;
    analysis::PeriodReport failed;
    failed.period        = {"2023-02", 744, 672};
    failed.outcome       = JobOutcome::Infeasible;
    failed.baseline_cost = 180.0;
    failed.error_message = "hour 3, capacity shortfall";
    report.periods = {ok, failed};
    report.total_baseline_cost  = 200.0;
    report.total_optimized_cost = 150.0;
    report.total_savings        = 50.0;
    report.total_savings_percent= 25.0;
    report.total_baseline_fuel_L= 80.0;
    report.total_fuel_L         = 60.0;
    report.total_fuel_saved_L   = 20.0;
    report.n_failed = 1;

    std::stringstream ss;
    output::writePeriodsCSV(ss, report);
    std::vector<std::string> lines = readLines(ss);
    BOOST_REQUIRE_EQUAL(lines.size(), 4u);
    BOOST_CHECK(lines[1].rfind("2023-01,0,744,succeeded,1,200.0000,150.0000,50.0000,25.0000,", 0) == 0);
    BOOST_CHECK(lines[2].find(",infeasible,") != std::string::npos);
    BOOST_CHECK(lines[2].find("\"hour 3, capacity shortfall\"") != std::string::npos);
    BOOST_CHECK_EQUAL(lines[3], "Total,,,1 succeeded,,200.0000,150.0000,50.0000,25.0000,,80.0000,60.0000,20.0000,,,,");
}

BOOST_AUTO_TEST_CASE(sweep_csv) {
    analysis::SweepPoint point;
    point.battery_capacity_kWh = 250.0;
    point.outcome    = JobOutcome::Succeeded;
    point.total_cost = 90.0;
    std::stringstream ss;
    output::writeSweepCSV(ss, {point});
    std::vector<std::string> lines = readLines(ss);
    BOOST_REQUIRE_EQUAL(lines.size(), 2u);
    BOOST_CHECK(lines[1].rfind("250.0000,succeeded,0,90.0000,", 0) == 0);
}

BOOST_AUTO_TEST_CASE(output_directory_and_files) {
    Global::ResetAllVariables();
    fs::path base = makeTempDir("output");
    Global::set_output_path(base.string());
    // an old directory of the same scenario is replaced
    fs::create_directories(base / "S0007");
    std::ofstream(base / "S0007" / "old.csv") << "old";

    output::initializeOutputDirectory(7);
    BOOST_CHECK_EQUAL(global::current_output_dir, base / "S0007");
    BOOST_CHECK(!fs::exists(base / "S0007" / "old.csv"));

    output::outputSchedule(makeResult(), 0);
    output::outputSummary(makeResult(), makeBaseline());
    BOOST_CHECK(fs::exists(base / "S0007" / "dispatch-schedule.csv"));
    BOOST_CHECK(fs::exists(base / "S0007" / "dispatch-summary.csv"));

    fs::path dump = output::outputVariableDump("battery 250 kWh", "Index,Name\n");
    BOOST_CHECK_EQUAL(dump.filename().string(), "internal-consistency-dump-battery_250_kWh.csv");
    BOOST_CHECK(fs::exists(dump));

    global::current_output_dir.clear();
    BOOST_CHECK_THROW(output::getOutputFilePath("x.csv"), std::logic_error);
    Global::ResetAllVariables();
    fs::remove_all(base);
}

BOOST_AUTO_TEST_CASE(status_output_counters_and_progress_line) {
    const unsigned long n_warnings = StatusOutput::get_n_warnings();
    const unsigned long n_errors   = StatusOutput::get_n_errors();
    StatusOutput::add_warning("solver gap not closed");
    StatusOutput::add_error_message("period 2023-02 failed");
    StatusOutput::add_status_output("period 2023-01 finished");
    BOOST_CHECK_EQUAL(StatusOutput::get_n_warnings(), n_warnings + 1);
    BOOST_CHECK_EQUAL(StatusOutput::get_n_errors(),   n_errors + 1);

    global::reset_counters();
    global::n_jobs_total            = 4;
    global::n_jobs_finished         = 1;
    global::n_solver_calls_started  = 3;
    global::n_solver_calls_finished = 1;
    const std::string line = StatusOutput::create_progress_line();
    BOOST_CHECK(line.find("jobs 1 / 4") != std::string::npos);
    BOOST_CHECK(line.find("solver calls 1 finished, 2 running") != std::string::npos);
    global::reset_counters();
}

BOOST_AUTO_TEST_CASE(status_output_keeps_only_the_last_messages) {
    for (size_t i = 0; i < StatusOutput::max_kept_messages + 20; i++)
        StatusOutput::add_status_output("sweep point " + std::to_string(i) + " finished");
    BOOST_CHECK_EQUAL(StatusOutput::get_n_kept_log_messages(), StatusOutput::max_kept_messages);
}
