/*
 * test_period_analysis.cpp
 *
 * Tests of the period split, the period analysis and
 * the battery capacity sweep.
 *
 */

#define BOOST_TEST_MODULE period_analysis
#include <boost/test/unit_test.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "asset_config.h"
#include "errors.h"
#include "period_analysis.h"
#include "test_helpers.hpp"

using namespace testhelper;


namespace {

    // 2 h in January, 3 h in February, 1 h in March
    HorizonInput makeMonthSeries() {
        HorizonInput series = makeHorizon({10.0, 20.0, 30.0, 40.0, 50.0, 60.0}, {0.0, 0.0, 0.0, 0.0, 0.0, 0.0});
        series.timestamps = {"2023-01-31 22:00", "2023-01-31 23:00",
                             "2023-02-01 00:00", "2023-02-01 01:00", "2023-02-01 02:00",
                             "2023-03-01 00:00"};
        return series;
    }

    struct DieselOnlyFixture {
        std::atomic<int> n_running{0};
        std::atomic<int> max_running{0};
        MilpSolverFactory factory = [this]() {
            return std::unique_ptr<BaseMilpSolver>(new DieselOnlySolver(&n_running, &max_running, 0));
        };
    };

}


BOOST_AUTO_TEST_SUITE(period_split)

BOOST_AUTO_TEST_CASE(calendar_months) {
    std::vector<analysis::PeriodDefinition> periods = analysis::splitIntoCalendarMonths(makeMonthSeries());
    BOOST_REQUIRE_EQUAL(periods.size(), 3u);
    BOOST_CHECK_EQUAL(periods[0].label, "2023-01");
    BOOST_CHECK_EQUAL(periods[0].first_hour, 0u);
    BOOST_CHECK_EQUAL(periods[0].n_hours, 2u);
    BOOST_CHECK_EQUAL(periods[1].label, "2023-02");
    BOOST_CHECK_EQUAL(periods[1].first_hour, 2u);
    BOOST_CHECK_EQUAL(periods[1].n_hours, 3u);
    BOOST_CHECK_EQUAL(periods[2].n_hours, 1u);
}

BOOST_AUTO_TEST_CASE(calendar_months_require_time_stamps) {
    HorizonInput series = makeMonthSeries();
    series.timestamps.clear();
    BOOST_CHECK_THROW(analysis::splitIntoCalendarMonths(series), ConfigurationError);
    series = makeMonthSeries();
    series.timestamps[3] = "2023";
    BOOST_CHECK_THROW(analysis::splitIntoCalendarMonths(series), ConfigurationError);
}

BOOST_AUTO_TEST_CASE(fixed_length) {
    std::vector<analysis::PeriodDefinition> periods = analysis::splitIntoFixedLengthPeriods(makeMonthSeries(), 4);
    BOOST_REQUIRE_EQUAL(periods.size(), 2u);
    BOOST_CHECK_EQUAL(periods[0].label, "hours 0-3");
    BOOST_CHECK_EQUAL(periods[1].first_hour, 4u);
    BOOST_CHECK_EQUAL(periods[1].n_hours, 2u);
    BOOST_CHECK_EQUAL(periods[1].label, "hours 4-5");
    BOOST_CHECK_THROW(analysis::splitIntoFixedLengthPeriods(makeMonthSeries(), 0), ConfigurationError);
}

BOOST_AUTO_TEST_SUITE_END()


BOOST_FIXTURE_TEST_SUITE(batch_runs, DieselOnlyFixture)

BOOST_AUTO_TEST_CASE(period_analysis_against_baseline) {
    AssetParameters p = simpleParameters();
    p.diesel_no_load_fuel_cost_per_h = 2.0;
    const AssetConfig config(p);
    const HorizonInput series = makeMonthSeries();
    analysis::BatchSettings batch;
    batch.n_threads = 2;

    analysis::PeriodAnalysisReport report = analysis::runPeriodAnalysis(
        series, config, SolverSettings(), analysis::splitIntoCalendarMonths(series), batch, factory);
    BOOST_REQUIRE_EQUAL(report.periods.size(), 3u);
    BOOST_CHECK_EQUAL(report.n_failed, 0u);
    // January: 2 h on + 30 kWh
    BOOST_CHECK_CLOSE(report.periods[0].baseline_cost, 2.0 * 2.0 + 0.6 * 30.0, 1e-9);
    // the diesel-only dispatch is exactly the baseline
    for (const analysis::PeriodReport& pr : report.periods) {
        BOOST_CHECK(pr.outcome == JobOutcome::Succeeded);
        BOOST_CHECK_CLOSE(pr.optimized_cost, pr.baseline_cost, 1e-9);
        BOOST_CHECK_SMALL(pr.savings, 1e-9);
    }
    BOOST_CHECK_CLOSE(report.total_baseline_cost, 6.0 * 2.0 + 0.6 * 210.0, 1e-9);
    BOOST_CHECK_SMALL(report.total_savings, 1e-9);
}

BOOST_AUTO_TEST_CASE(savings_exclude_the_curtailment_penalty) {
    AssetParameters p = simpleParameters();
    FuelCurve curve;
    curve.applyTo(p);
    const AssetConfig config(p);
    // solar covers the load, 30 kW are curtailed
    const HorizonInput series = makeHorizon({50.0}, {80.0});
    auto script = std::make_shared<SolverScript>();
    script->statuses   = {SolverStatus::Optimal};
    script->assignment = {0.0, 0.0, 0.0, 0.0, 50.0, 0.0};

    analysis::PeriodAnalysisReport report = analysis::runPeriodAnalysis(
        series, config, SolverSettings(), analysis::splitIntoFixedLengthPeriods(series, 1), analysis::BatchSettings(),
        scriptedFactory(script));
    BOOST_REQUIRE_EQUAL(report.periods.size(), 1u);
    const analysis::PeriodReport& pr = report.periods[0];
    BOOST_REQUIRE(pr.outcome == JobOutcome::Succeeded);
    const double baseline_fuel_L = 15.0 + 50.0 * 0.24;
    BOOST_CHECK_CLOSE(pr.baseline_fuel_L, baseline_fuel_L, 1e-9);
    BOOST_CHECK_CLOSE(pr.baseline_cost, baseline_fuel_L * (2.20 + 0.00268 * 95.0), 1e-9);
    BOOST_CHECK_SMALL(pr.optimized_cost, 1e-9);
    BOOST_CHECK_CLOSE(pr.curtailment_penalty, 30.0 * 0.01, 1e-9);
    BOOST_CHECK_CLOSE(pr.savings, pr.baseline_cost, 1e-9);
    BOOST_CHECK_CLOSE(pr.savings_percent, 100.0, 1e-9);
    BOOST_CHECK_SMALL(pr.fuel_L, 1e-9);
    BOOST_CHECK_CLOSE(pr.fuel_saved_L, baseline_fuel_L, 1e-9);
    BOOST_CHECK_CLOSE(report.total_fuel_saved_L, baseline_fuel_L, 1e-9);
}

BOOST_AUTO_TEST_CASE(failed_periods_are_excluded_from_totals) {
    const AssetConfig config(simpleParameters());
    HorizonInput series = makeMonthSeries();
    series.load_kW[3] = 500.0; // February exceeds the diesel capacity
    auto script = std::make_shared<SolverScript>();
    script->statuses = {SolverStatus::Infeasible};

    analysis::PeriodAnalysisReport report = analysis::runPeriodAnalysis(
        series, config, SolverSettings(), analysis::splitIntoCalendarMonths(series), analysis::BatchSettings(),
        scriptedFactory(script));
    BOOST_CHECK_EQUAL(report.n_failed, 3u);
    BOOST_CHECK(report.periods[1].outcome == JobOutcome::Infeasible);
    BOOST_CHECK(!report.periods[1].error_message.empty());
    BOOST_CHECK_EQUAL(report.total_baseline_cost, 0.0);
    // the baseline of a failed period is still reported
    BOOST_CHECK_GT(report.periods[1].baseline_cost, 0.0);
}

BOOST_AUTO_TEST_CASE(sweep_with_invalid_capacity) {
    const AssetConfig config(parametersWithBattery(100.0, 50.0));
    const HorizonInput horizon = makeHorizon({100.0, 80.0}, {0.0, 0.0});
    std::vector<double> capacities = {0.0, -10.0, 200.0};

    std::vector<analysis::SweepPoint> points = analysis::runBatteryCapacitySweep(
        horizon, config, capacities, 0.5, SolverSettings(), analysis::BatchSettings(), factory);
    BOOST_REQUIRE_EQUAL(points.size(), 3u);
    BOOST_CHECK(points[0].outcome == JobOutcome::Succeeded);
    BOOST_CHECK(points[1].outcome == JobOutcome::InvalidConfiguration);
    BOOST_CHECK(!points[1].error_message.empty());
    BOOST_CHECK(points[2].outcome == JobOutcome::Succeeded);
    BOOST_CHECK_EQUAL(points[2].battery_capacity_kWh, 200.0);
    BOOST_CHECK_CLOSE(points[0].baseline_cost, 180.0 * 0.6, 1e-9);
    BOOST_CHECK_CLOSE(points[2].total_cost, 180.0 * 0.6, 1e-9);
    BOOST_CHECK_SMALL(points[2].savings, 1e-9);
    BOOST_CHECK_EQUAL(points[2].curtailment_penalty, 0.0);
}

BOOST_AUTO_TEST_SUITE_END()
