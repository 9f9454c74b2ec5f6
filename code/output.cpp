#include "output.h"

#include <cctype>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

#define BOOST_BIND_GLOBAL_PLACEHOLDERS
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "global.h"
#include "worker_threads.hpp"

using namespace std;
namespace bpt = boost::property_tree;

//
// Helper function (not defined in header file).
// It removes a directory if this already exists
// and creates a new, empty directory
//
void create_dir_del_if_exists(filesystem::path dirpath) {
    // check if dir exists
    if (filesystem::is_directory(dirpath)) {
        // if yes, delete it
        filesystem::remove_all(dirpath);
    }
    // now, actually create output dir (maybe again)
    filesystem::create_directories(dirpath);
}

void output::initializeOutputDirectory(unsigned long scenario_id) {
    filesystem::path dirpath = Global::get_output_path();
    if (!filesystem::is_directory(dirpath)) {
        filesystem::create_directories(dirpath);
    }
    stringstream current_scenario_str;
    current_scenario_str << "S";
    current_scenario_str << setw(4) << setfill('0') << scenario_id;
    dirpath /= current_scenario_str.str();
    create_dir_del_if_exists(dirpath);
    // copy to global variable
    global::current_output_dir = dirpath;
}

filesystem::path output::getOutputFilePath(const string& filename) {
    if (global::current_output_dir.empty())
        throw logic_error("Output directory is not initialized.");
    return global::current_output_dir / filename;
}



//
// Stream outputs
//

void output::writeScheduleCSV(ostream& out, const DispatchResult& result, unsigned long series_offset) {
    out << "Hour,SeriesHour,Timestamp,Load_kW,SolarAvailable_kW,SolarUsed_kW,Curtailed_kW,DieselOutput_kW,DieselOn,BatteryCharge_kW,BatteryDischarge_kW,SoC_kWh\n";
    out << std::fixed << std::setprecision(4);
    for (const DispatchDecision& d : result.schedule) {
        out << d.hour << ",";
        out << d.hour + series_offset << ",";
        out << d.timestamp << ",";
        out << d.load_kW << ",";
        out << d.solar_available_kW << ",";
        out << d.solar_used_kW << ",";
        out << d.curtailed_kW << ",";
        out << d.diesel_output_kW << ",";
        out << (d.diesel_on ? 1 : 0) << ",";
        out << d.battery_charge_kW << ",";
        out << d.battery_discharge_kW << ",";
        out << d.soc_kWh << "\n";
    }
    out.unsetf(std::ios_base::floatfield);
}

void output::writeSummaryCSV(ostream& out, const DispatchResult& result, const DieselOnlyBaseline& baseline) {
    const DispatchSummary& s = result.summary;
    out << "Metric,Value\n";
    out << "Status,"                   << dispatchStatusToString(result.status) << "\n";
    out << "ProvenOptimal,"            << (result.proven_optimal ? 1 : 0) << "\n";
    out << "Solver,"                   << result.solver_name << "\n";
    out << "SolverAttempts,"           << result.solver_attempts << "\n";
    out << "SolveTime_s,"              << result.solve_time_s << "\n";
    out << "MIPGap,"                   << result.mip_gap << "\n";
    out << std::fixed << std::setprecision(4);
    out << "TotalCost,"                << s.total_cost << "\n";
    out << "FuelCost,"                 << s.fuel_cost << "\n";
    out << "CarbonCost,"               << s.carbon_cost << "\n";
    out << "NoLoadCost,"               << s.no_load_cost << "\n";
    out << "CurtailmentPenalty,"       << s.curtailment_penalty << "\n";
    out << "ObjectiveValue,"           << s.objective_value << "\n";
    out << "BestBound,"                << s.best_bound << "\n";
    out << "BaselineCost,"             << baseline.cost << "\n";
    out << "Savings,"                  << baseline.cost - s.get_diesel_cost() << "\n";
    out << "Fuel_L,"                   << s.fuel_L << "\n";
    out << "BaselineFuel_L,"           << baseline.fuel_L << "\n";
    out << "FuelSaved_L,"              << baseline.fuel_L - s.fuel_L << "\n";
    out << "Load_kWh,"                 << s.load_energy_kWh << "\n";
    out << "Diesel_kWh,"               << s.diesel_energy_kWh << "\n";
    out << "BatteryCharge_kWh,"        << s.battery_charge_kWh << "\n";
    out << "BatteryDischarge_kWh,"     << s.battery_discharge_kWh << "\n";
    out << "SolarAvailable_kWh,"       << s.solar_available_kWh << "\n";
    out << "SolarUsed_kWh,"            << s.solar_used_kWh << "\n";
    out << "Curtailed_kWh,"            << s.curtailed_kWh << "\n";
    out << "InitialSoC_kWh,"           << s.initial_soc_kWh << "\n";
    out << "TerminalSoC_kWh,"          << s.terminal_soc_kWh << "\n";
    out << "DieselRunningHours,"       << s.diesel_running_hours << "\n";
    out << "DieselCapacityFactor,"     << s.diesel_capacity_factor << "\n";
    out << "BatteryCapacityFactor,"    << s.battery_capacity_factor << "\n";
    out << "SolarCapacityFactor,"      << s.solar_capacity_factor << "\n";
    out.unsetf(std::ios_base::floatfield);
    out << std::setprecision(6);
}

void output::writeResultJSON(ostream& out, const DispatchResult& result, const string& label, const DieselOnlyBaseline& baseline) {
    const DispatchSummary& s = result.summary;
    bpt::ptree root;
    root.put("label",           label);
    root.put("status",          dispatchStatusToString(result.status));
    root.put("proven_optimal",  result.proven_optimal);
    root.put("solver",          result.solver_name);
    root.put("solver_attempts", result.solver_attempts);
    root.put("solve_time_s",    result.solve_time_s);
    root.put("mip_gap",         result.mip_gap);
    //
    bpt::ptree warnings;
    for (const string& w : result.warnings) {
        bpt::ptree w_node;
        w_node.put("", w);
        warnings.push_back(std::make_pair("", w_node));
    }
    root.add_child("warnings", warnings);
    //
    bpt::ptree summary;
    summary.put("total_cost",              s.total_cost);
    summary.put("fuel_cost",               s.fuel_cost);
    summary.put("carbon_cost",             s.carbon_cost);
    summary.put("no_load_cost",            s.no_load_cost);
    summary.put("curtailment_penalty",     s.curtailment_penalty);
    summary.put("objective_value",         s.objective_value);
    summary.put("best_bound",              s.best_bound);
    summary.put("baseline_cost",           baseline.cost);
    summary.put("savings",                 baseline.cost - s.get_diesel_cost());
    summary.put("fuel_L",                  s.fuel_L);
    summary.put("baseline_fuel_L",         baseline.fuel_L);
    summary.put("fuel_saved_L",            baseline.fuel_L - s.fuel_L);
    summary.put("load_kWh",                s.load_energy_kWh);
    summary.put("diesel_kWh",              s.diesel_energy_kWh);
    summary.put("battery_charge_kWh",      s.battery_charge_kWh);
    summary.put("battery_discharge_kWh",   s.battery_discharge_kWh);
    summary.put("solar_available_kWh",     s.solar_available_kWh);
    summary.put("solar_used_kWh",          s.solar_used_kWh);
    summary.put("curtailed_kWh",           s.curtailed_kWh);
    summary.put("initial_soc_kWh",         s.initial_soc_kWh);
    summary.put("terminal_soc_kWh",        s.terminal_soc_kWh);
    summary.put("diesel_running_hours",    s.diesel_running_hours);
    summary.put("diesel_capacity_factor",  s.diesel_capacity_factor);
    summary.put("battery_capacity_factor", s.battery_capacity_factor);
    summary.put("solar_capacity_factor",   s.solar_capacity_factor);
    root.add_child("summary", summary);
    //
    bpt::ptree schedule;
    for (const DispatchDecision& d : result.schedule) {
        bpt::ptree h;
        h.put("hour",                 d.hour);
        h.put("timestamp",            d.timestamp);
        h.put("load_kW",              d.load_kW);
        h.put("solar_available_kW",   d.solar_available_kW);
        h.put("solar_used_kW",        d.solar_used_kW);
        h.put("curtailed_kW",         d.curtailed_kW);
        h.put("diesel_output_kW",     d.diesel_output_kW);
        h.put("diesel_on",            d.diesel_on);
        h.put("battery_charge_kW",    d.battery_charge_kW);
        h.put("battery_discharge_kW", d.battery_discharge_kW);
        h.put("soc_kWh",              d.soc_kWh);
        schedule.push_back(std::make_pair("", h));
    }
    root.add_child("schedule", schedule);
    bpt::write_json(out, root, true);
}

void output::writePeriodsCSV(ostream& out, const analysis::PeriodAnalysisReport& report) {
    out << "Period,FirstHour,Hours,Outcome,ProvenOptimal,BaselineCost,OptimizedCost,Savings,SavingsPercent,CurtailmentPenalty,"
           "BaselineFuel_L,Fuel_L,FuelSaved_L,Diesel_kWh,Curtailed_kWh,DieselRunningHours,Error\n";
    out << std::fixed << std::setprecision(4);
    for (const analysis::PeriodReport& p : report.periods) {
        out << p.period.label << ",";
        out << p.period.first_hour << ",";
        out << p.period.n_hours << ",";
        out << jobOutcomeToString(p.outcome) << ",";
        out << (p.proven_optimal ? 1 : 0) << ",";
        out << p.baseline_cost << ",";
        out << p.optimized_cost << ",";
        out << p.savings << ",";
        out << p.savings_percent << ",";
        out << p.curtailment_penalty << ",";
        out << p.baseline_fuel_L << ",";
        out << p.fuel_L << ",";
        out << p.fuel_saved_L << ",";
        out << p.diesel_energy_kWh << ",";
        out << p.curtailed_kWh << ",";
        out << p.diesel_running_hours << ",";
        // error messages may contain commas
        out << "\"" << p.error_message << "\"\n";
    }
    out << "Total,,," << (report.periods.size() - report.n_failed) << " succeeded,,";
    out << report.total_baseline_cost << ",";
    out << report.total_optimized_cost << ",";
    out << report.total_savings << ",";
    out << report.total_savings_percent << ",,";
    out << report.total_baseline_fuel_L << ",";
    out << report.total_fuel_L << ",";
    out << report.total_fuel_saved_L << ",,,,\n";
    out.unsetf(std::ios_base::floatfield);
}

void output::writeSweepCSV(ostream& out, const vector<analysis::SweepPoint>& points) {
    out << "BatteryCapacity_kWh,Outcome,ProvenOptimal,TotalCost,CurtailmentPenalty,BaselineCost,Savings,"
           "BaselineFuel_L,Fuel_L,Diesel_kWh,Curtailed_kWh,BatteryDischarge_kWh,DieselRunningHours,Error\n";
    out << std::fixed << std::setprecision(4);
    for (const analysis::SweepPoint& p : points) {
        out << p.battery_capacity_kWh << ",";
        out << jobOutcomeToString(p.outcome) << ",";
        out << (p.proven_optimal ? 1 : 0) << ",";
        out << p.total_cost << ",";
        out << p.curtailment_penalty << ",";
        out << p.baseline_cost << ",";
        out << p.savings << ",";
        out << p.baseline_fuel_L << ",";
        out << p.fuel_L << ",";
        out << p.diesel_energy_kWh << ",";
        out << p.curtailed_kWh << ",";
        out << p.battery_discharge_kWh << ",";
        out << p.diesel_running_hours << ",";
        out << "\"" << p.error_message << "\"\n";
    }
    out.unsetf(std::ios_base::floatfield);
}



//
// File outputs
//

void output::outputSchedule(const DispatchResult& result, unsigned long series_offset) {
    ofstream f(getOutputFilePath("dispatch-schedule.csv"), std::ofstream::out);
    writeScheduleCSV(f, result, series_offset);
    f.close();
}

void output::outputSummary(const DispatchResult& result, const DieselOnlyBaseline& baseline) {
    ofstream f(getOutputFilePath("dispatch-summary.csv"), std::ofstream::out);
    writeSummaryCSV(f, result, baseline);
    f.close();
}

void output::outputResultJSON(const DispatchResult& result, const string& label, const DieselOnlyBaseline& baseline) {
    ofstream f(getOutputFilePath("dispatch-result.json"), std::ofstream::out);
    writeResultJSON(f, result, label, baseline);
    f.close();
}

void output::outputPeriods(const analysis::PeriodAnalysisReport& report) {
    ofstream f(getOutputFilePath("periods-summary.csv"), std::ofstream::out);
    writePeriodsCSV(f, report);
    f.close();
}

void output::outputSweep(const vector<analysis::SweepPoint>& points) {
    ofstream f(getOutputFilePath("sweep-summary.csv"), std::ofstream::out);
    writeSweepCSV(f, points);
    f.close();
}

filesystem::path output::outputVariableDump(const string& run_label, const string& variable_dump) {
    string fname_label = run_label;
    for (char& c : fname_label) {
        if (!isalnum(static_cast<unsigned char>(c)) && c != '-')
            c = '_';
    }
    filesystem::path fpath = getOutputFilePath("internal-consistency-dump-" + fname_label + ".csv");
    ofstream f(fpath, std::ofstream::out);
    f << variable_dump;
    f.close();
    return fpath;
}

void output::outputRuntimeInformation(long seconds_setup, long seconds_main_run) {
    ofstream f(getOutputFilePath("runtime-information.csv"), std::ofstream::out);
    f << "Setup and data loading in s,Main run in s,Solver calls started,Solver calls finished\n";
    f << seconds_setup << "," << seconds_main_run << ",";
    f << global::n_solver_calls_started.load() << "," << global::n_solver_calls_finished.load() << "\n";
    f.close();
}
