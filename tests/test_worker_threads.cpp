/*
 * test_worker_threads.cpp
 *
 * Tests of the batch execution of independent dispatch jobs.
 *
 */

#define BOOST_TEST_MODULE worker_threads
#include <boost/test/unit_test.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "asset_config.h"
#include "global.h"
#include "worker_threads.hpp"
#include "test_helpers.hpp"

using namespace testhelper;


namespace {

    struct JobSet {
        std::vector<std::unique_ptr<DispatchJob>> jobs;
        std::vector<DispatchJob*> refs;

        void add(const HorizonInput& input) {
            const unsigned long id = jobs.size();
            jobs.push_back(std::make_unique<DispatchJob>(id, "job " + std::to_string(id), input,
                                                         AssetConfig(simpleParameters()), SolverSettings()));
            refs.push_back(jobs.back().get());
        }
    };

    MilpSolverFactory dieselOnlyFactory(std::atomic<int>* n_running, std::atomic<int>* max_running, int sleep_ms) {
        return [=]() { return std::unique_ptr<BaseMilpSolver>(new DieselOnlySolver(n_running, max_running, sleep_ms)); };
    }

}


BOOST_AUTO_TEST_CASE(slot_limiter_counts) {
    SolveSlotLimiter limiter(2);
    limiter.acquire();
    limiter.acquire();
    BOOST_CHECK_EQUAL(limiter.get_n_running(), 2u);
    limiter.release();
    limiter.acquire();
    BOOST_CHECK_EQUAL(limiter.get_max_observed(), 2u);
    limiter.release();
    limiter.release();
    BOOST_CHECK_EQUAL(limiter.get_n_running(), 0u);
}

BOOST_AUTO_TEST_CASE(slot_limiter_blocks_until_release) {
    SolveSlotLimiter limiter(1);
    limiter.acquire();
    std::atomic<bool> acquired{false};
    std::thread other([&]() {
        limiter.acquire();
        acquired = true;
        limiter.release();
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    BOOST_CHECK(!acquired);
    limiter.release();
    other.join();
    BOOST_CHECK(acquired);
    BOOST_CHECK_EQUAL(limiter.get_max_observed(), 1u);
}

BOOST_AUTO_TEST_CASE(jobs_on_the_calling_thread) {
    JobSet set;
    set.add(makeHorizon({100.0, 50.0}, {0.0, 0.0}));
    set.add(makeHorizon({10.0}, {0.0}));
    std::atomic<int> n_running{0}, max_running{0};
    BOOST_CHECK(executeDispatchJobs(set.refs, 0, 0, false, dieselOnlyFactory(&n_running, &max_running, 0)));
    for (const auto& job : set.jobs)
        BOOST_CHECK(job->outcome == JobOutcome::Succeeded);
    BOOST_CHECK_CLOSE(set.jobs[0]->result.summary.total_cost, 150.0 * 0.6, 1e-9);
    BOOST_CHECK_CLOSE(set.jobs[1]->result.summary.total_cost, 10.0 * 0.6, 1e-9);
}

BOOST_AUTO_TEST_CASE(concurrent_solves_are_bounded) {
    JobSet set;
    for (int i = 0; i < 8; i++)
        set.add(makeHorizon({100.0 + i, 80.0}, {0.0, 0.0}));
    std::atomic<int> n_running{0}, max_running{0};
    bool ok = executeDispatchJobs(set.refs, 4, 2, false, dieselOnlyFactory(&n_running, &max_running, 30));
    BOOST_CHECK(ok);
    BOOST_CHECK_LE(max_running.load(), 2);
    BOOST_CHECK_GE(max_running.load(), 1);
    for (const auto& job : set.jobs) {
        BOOST_CHECK(job->outcome == JobOutcome::Succeeded);
        BOOST_CHECK_CLOSE(job->result.summary.diesel_energy_kWh, job->input.get_total_load_kWh(), 1e-9);
    }
}

BOOST_AUTO_TEST_CASE(failures_are_recorded_per_job) {
    JobSet set;
    set.add(makeHorizon({100.0}, {0.0}));
    set.add(makeHorizon({100.0, 50.0}, {0.0}));    // series of different length
    set.add(makeHorizon({100.0}, {0.0}));
    std::atomic<int> n_running{0}, max_running{0};
    BOOST_CHECK(!executeDispatchJobs(set.refs, 2, 0, false, dieselOnlyFactory(&n_running, &max_running, 0)));
    BOOST_CHECK(set.jobs[0]->outcome == JobOutcome::Succeeded);
    BOOST_CHECK(set.jobs[1]->outcome == JobOutcome::InvalidConfiguration);
    BOOST_CHECK(!set.jobs[1]->error_message.empty());
    BOOST_CHECK(set.jobs[2]->outcome == JobOutcome::Succeeded);
}

BOOST_AUTO_TEST_CASE(stop_on_error_skips_remaining_jobs) {
    JobSet set;
    set.add(makeHorizon({100.0, 50.0}, {0.0}));    // fails
    set.add(makeHorizon({100.0}, {0.0}));
    set.add(makeHorizon({100.0}, {0.0}));
    std::atomic<int> n_running{0}, max_running{0};
    BOOST_CHECK(!executeDispatchJobs(set.refs, 0, 0, true, dieselOnlyFactory(&n_running, &max_running, 0)));
    BOOST_CHECK(set.jobs[0]->outcome == JobOutcome::InvalidConfiguration);
    BOOST_CHECK(set.jobs[1]->outcome == JobOutcome::Skipped);
    BOOST_CHECK(set.jobs[2]->outcome == JobOutcome::Skipped);
}

BOOST_AUTO_TEST_CASE(stop_on_error_per_worker) {
    // round robin with 2 workers: jobs 0 and 2 on worker 0, jobs 1 and 3 on worker 1
    JobSet set;
    set.add(makeHorizon({100.0, 50.0}, {0.0}));    // fails
    set.add(makeHorizon({100.0}, {0.0}));
    set.add(makeHorizon({100.0}, {0.0}));
    set.add(makeHorizon({100.0}, {0.0}));
    std::atomic<int> n_running{0}, max_running{0};
    BOOST_CHECK(!executeDispatchJobs(set.refs, 2, 0, true, dieselOnlyFactory(&n_running, &max_running, 0)));
    BOOST_CHECK(set.jobs[0]->outcome == JobOutcome::InvalidConfiguration);
    BOOST_CHECK(set.jobs[2]->outcome == JobOutcome::Skipped);
    BOOST_CHECK(set.jobs[1]->outcome == JobOutcome::Succeeded);
    BOOST_CHECK(set.jobs[3]->outcome == JobOutcome::Succeeded);
}

BOOST_AUTO_TEST_CASE(job_counters) {
    global::reset_counters();
    JobSet set;
    set.add(makeHorizon({100.0}, {0.0}));
    set.add(makeHorizon({100.0}, {0.0}));
    std::atomic<int> n_running{0}, max_running{0};
    BOOST_CHECK(executeDispatchJobs(set.refs, 1, 0, false, dieselOnlyFactory(&n_running, &max_running, 0)));
    BOOST_CHECK_EQUAL(global::n_jobs_total.load(), 2u);
    BOOST_CHECK_EQUAL(global::n_jobs_finished.load(), 2u);
    BOOST_CHECK_EQUAL(global::n_solver_calls_finished.load(), 2u);
}

BOOST_AUTO_TEST_CASE(outcome_names) {
    BOOST_CHECK_EQUAL(std::string(jobOutcomeToString(JobOutcome::Skipped)), "skipped");
    BOOST_CHECK_EQUAL(std::string(jobOutcomeToString(JobOutcome::SolverFailed)), "solver failed");
}
