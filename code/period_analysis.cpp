#include "period_analysis.h"

#include <algorithm>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "dispatch_engine.h"
#include "errors.h"
#include "status_output.hpp"

using namespace std;


vector<analysis::PeriodDefinition> analysis::splitIntoCalendarMonths(const HorizonInput& series) {
    if (series.timestamps.size() != series.get_n_hours() || series.timestamps.empty()) {
        throw ConfigurationError("Splitting by calendar month requires a time stamp for every hour.");
    }
    vector<PeriodDefinition> periods;
    for (unsigned long h = 0; h < series.timestamps.size(); h++) {
        const string& ts = series.timestamps[h];
        if (ts.size() < 7) {
            throw ConfigurationError("Time stamp '" + ts + "' at hour " + to_string(h) + " does not start with YYYY-MM.");
        }
        const string month = ts.substr(0, 7);
        if (periods.empty() || periods.back().label != month) {
            periods.push_back({month, h, 1});
        } else {
            periods.back().n_hours++;
        }
    }
    return periods;
}

vector<analysis::PeriodDefinition> analysis::splitIntoFixedLengthPeriods(const HorizonInput& series, unsigned long period_length_h) {
    if (period_length_h == 0) {
        throw ConfigurationError("Parameter 'period length h' must be > 0.");
    }
    vector<PeriodDefinition> periods;
    const unsigned long n_total = series.get_n_hours();
    for (unsigned long first = 0; first < n_total; first += period_length_h) {
        const unsigned long n = std::min(period_length_h, n_total - first);
        periods.push_back({"hours " + to_string(first) + "-" + to_string(first + n - 1), first, n});
    }
    return periods;
}

analysis::PeriodAnalysisReport analysis::runPeriodAnalysis(
    const HorizonInput& series,
    const AssetConfig& config,
    const SolverSettings& settings,
    const vector<PeriodDefinition>& periods,
    const BatchSettings& batch,
    const MilpSolverFactory& solver_factory)
{
    PeriodAnalysisReport report;
    //
    // create one job per period
    vector<unique_ptr<DispatchJob>> jobs;
    vector<DispatchJob*> job_refs;
    for (unsigned long p = 0; p < periods.size(); p++) {
        HorizonInput window = series.window(periods[p].first_hour, periods[p].n_hours);
        jobs.push_back(make_unique<DispatchJob>(p, periods[p].label, window, config, settings));
        job_refs.push_back(jobs.back().get());
    }
    StatusOutput::add_status_output("Starting period analysis with " + to_string(jobs.size()) + " periods.");
    executeDispatchJobs(job_refs, batch.n_threads, batch.max_concurrent_solves, batch.stop_on_err, solver_factory);

    //
    // collect the results
    for (const auto& job : jobs) {
        PeriodReport pr;
        pr.period        = periods[job->jobID];
        pr.outcome       = job->outcome;
        const DieselOnlyBaseline baseline = dispatch::computeDieselOnlyBaseline(job->input, config);
        pr.baseline_cost   = baseline.cost;
        pr.baseline_fuel_L = baseline.fuel_L;
        if (job->outcome == JobOutcome::Succeeded) {
            const DispatchSummary& s = job->result.summary;
            pr.proven_optimal       = job->result.proven_optimal;
            pr.optimized_cost       = s.get_diesel_cost();
            pr.curtailment_penalty  = s.curtailment_penalty;
            pr.savings              = pr.baseline_cost - pr.optimized_cost;
            pr.savings_percent      = pr.baseline_cost > 0.0 ? 100.0 * pr.savings / pr.baseline_cost : 0.0;
            pr.fuel_L               = s.fuel_L;
            pr.fuel_saved_L         = pr.baseline_fuel_L - pr.fuel_L;
            pr.diesel_energy_kWh    = s.diesel_energy_kWh;
            pr.curtailed_kWh        = s.curtailed_kWh;
            pr.diesel_running_hours = s.diesel_running_hours;
            report.total_baseline_cost   += pr.baseline_cost;
            report.total_optimized_cost  += pr.optimized_cost;
            report.total_baseline_fuel_L += pr.baseline_fuel_L;
            report.total_fuel_L          += pr.fuel_L;
        } else {
            pr.error_message = job->error_message;
            pr.variable_dump = job->variable_dump;
            report.n_failed++;
        }
        report.periods.push_back(pr);
    }
    report.total_savings      = report.total_baseline_cost - report.total_optimized_cost;
    report.total_fuel_saved_L = report.total_baseline_fuel_L - report.total_fuel_L;
    if (report.total_baseline_cost > 0.0)
        report.total_savings_percent = 100.0 * report.total_savings / report.total_baseline_cost;

    stringstream ss;
    ss << "Period analysis finished: " << (report.periods.size() - report.n_failed) << " of " << report.periods.size()
       << " periods optimized, total savings = " << report.total_savings << " (" << report.total_savings_percent << " %)";
    if (config.has_fuel_curve())
        ss << ", fuel saved = " << report.total_fuel_saved_L << " L";
    StatusOutput::add_status_output(ss.str());
    return report;
}

vector<analysis::SweepPoint> analysis::runBatteryCapacitySweep(
    const HorizonInput& horizon,
    const AssetConfig& config,
    const vector<double>& capacities_kWh,
    double initial_soc_fraction,
    const SolverSettings& settings,
    const BatchSettings& batch,
    const MilpSolverFactory& solver_factory)
{
    const DieselOnlyBaseline baseline = dispatch::computeDieselOnlyBaseline(horizon, config);
    vector<SweepPoint> points(capacities_kWh.size());
    vector<unique_ptr<DispatchJob>> jobs;
    vector<DispatchJob*> job_refs;
    for (unsigned long i = 0; i < capacities_kWh.size(); i++) {
        points[i].battery_capacity_kWh = capacities_kWh[i];
        points[i].baseline_cost        = baseline.cost;
        points[i].baseline_fuel_L      = baseline.fuel_L;
        try {
            AssetConfig point_config = config.withBatteryCapacity(capacities_kWh[i], initial_soc_fraction);
            stringstream label;
            label << "battery " << capacities_kWh[i] << " kWh";
            jobs.push_back(make_unique<DispatchJob>(i, label.str(), horizon, point_config, settings));
            job_refs.push_back(jobs.back().get());
        } catch (const ConfigurationError& e) {
            points[i].outcome       = JobOutcome::InvalidConfiguration;
            points[i].error_message = e.what();
            StatusOutput::add_error_message("Sweep point " + to_string(capacities_kWh[i]) + " kWh skipped: " + e.what());
        }
    }
    StatusOutput::add_status_output("Starting battery capacity sweep with " + to_string(jobs.size()) + " runs.");
    executeDispatchJobs(job_refs, batch.n_threads, batch.max_concurrent_solves, batch.stop_on_err, solver_factory);

    for (const auto& job : jobs) {
        SweepPoint& sp = points[job->jobID];
        sp.outcome = job->outcome;
        if (job->outcome == JobOutcome::Succeeded) {
            const DispatchSummary& s = job->result.summary;
            sp.proven_optimal        = job->result.proven_optimal;
            sp.total_cost            = s.total_cost;
            sp.curtailment_penalty   = s.curtailment_penalty;
            sp.savings               = sp.baseline_cost - s.get_diesel_cost();
            sp.fuel_L                = s.fuel_L;
            sp.diesel_energy_kWh     = s.diesel_energy_kWh;
            sp.curtailed_kWh         = s.curtailed_kWh;
            sp.battery_discharge_kWh = s.battery_discharge_kWh;
            sp.diesel_running_hours  = s.diesel_running_hours;
        } else {
            sp.error_message = job->error_message;
            sp.variable_dump = job->variable_dump;
        }
    }
    return points;
}
