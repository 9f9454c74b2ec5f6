#include "worker_threads.hpp"

#include <exception>
#include <iostream>
#include <latch>
#include <list>
#include <condition_variable>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

#include "dispatch_engine.h"
#include "errors.h"
#include "global.h"
#include "status_output.hpp"


// ----------------------------------- //
//         Implementation of           //
//         SolveSlotLimiter            //
// ----------------------------------- //
SolveSlotLimiter::SolveSlotLimiter(unsigned long max_concurrent_solves)
    : max_concurrent_solves(max_concurrent_solves), n_running(0), max_observed(0)
{}

void SolveSlotLimiter::acquire() {
    std::unique_lock<std::mutex> lock(mtx);
    if (max_concurrent_solves > 0) {
        // a solve can always start if nothing is running at the moment
        cv.wait(lock, [this] { return n_running < max_concurrent_solves || n_running == 0; });
    }
    n_running++;
    if (n_running > max_observed)
        max_observed = n_running;
}

void SolveSlotLimiter::release() {
    {
        std::unique_lock<std::mutex> lock(mtx);
        if (n_running > 0)
            n_running--;
    }
    cv.notify_all();
}

unsigned long SolveSlotLimiter::get_n_running() const {
    std::unique_lock<std::mutex> lock(mtx);
    return n_running;
}

unsigned long SolveSlotLimiter::get_max_observed() const {
    std::unique_lock<std::mutex> lock(mtx);
    return max_observed;
}



// ----------------------------------- //
//         Implementation of           //
//           DispatchJob               //
// ----------------------------------- //
DispatchJob::DispatchJob(
    unsigned long jobID,
    const std::string& label,
    const HorizonInput& input,
    const AssetConfig& config,
    const SolverSettings& settings
) : jobID(jobID), label(label), input(input), config(config), settings(settings)
{}

bool DispatchJob::execute(const MilpSolverFactory& solver_factory, SolveSlotLimiter* limiter) {
    if (limiter != NULL)
        limiter->acquire();
    try {
        result  = dispatch::runDispatch(input, config, settings, solver_factory, label);
        outcome = JobOutcome::Succeeded;
    } catch (const ConfigurationError& e) {
        outcome = JobOutcome::InvalidConfiguration;
        error_message = e.what();
    } catch (const InfeasibleModelError& e) {
        outcome = JobOutcome::Infeasible;
        error_message = e.what();
        infeasibility_hints = e.get_hints();
    } catch (const SolverError& e) {
        outcome = JobOutcome::SolverFailed;
        error_message = e.what();
    } catch (const InternalConsistencyError& e) {
        outcome = JobOutcome::InternalError;
        error_message = e.what();
        variable_dump = e.get_variable_dump();
    } catch (const std::exception& e) {
        outcome = JobOutcome::InternalError;
        error_message = std::string("Unexpected exception: ") + e.what();
    }
    if (limiter != NULL)
        limiter->release();
    global::n_jobs_finished++;

    if (outcome == JobOutcome::Succeeded) {
        std::stringstream ss;
        ss << "Job " << label << " finished: " << dispatchStatusToString(result.status)
           << ", total cost = " << result.summary.total_cost;
        StatusOutput::add_status_output(ss.str());
        return true;
    }
    StatusOutput::add_error_message("Job " + label + " failed (" + jobOutcomeToString(outcome) + "): " + error_message);
    return false;
}

const char* jobOutcomeToString(JobOutcome outcome) {
    switch (outcome) {
        case JobOutcome::Pending:              return "pending";
        case JobOutcome::Succeeded:            return "succeeded";
        case JobOutcome::InvalidConfiguration: return "invalid configuration";
        case JobOutcome::Infeasible:           return "infeasible";
        case JobOutcome::SolverFailed:         return "solver failed";
        case JobOutcome::InternalError:        return "internal error";
        case JobOutcome::Skipped:              return "skipped";
    }
    return "unknown";
}

bool executeDispatchJobs(
    const std::vector<DispatchJob*>& jobs,
    unsigned int n_threads,
    unsigned long max_concurrent_solves,
    bool stop_on_err,
    const MilpSolverFactory& solver_factory)
{
    global::n_jobs_total    += jobs.size();
    SolveSlotLimiter limiter(max_concurrent_solves);
    if (n_threads == 0) {
        // everything on the calling thread
        bool all_ok = true;
        for (DispatchJob* job : jobs) {
            if (!all_ok && stop_on_err) {
                job->outcome = JobOutcome::Skipped;
                global::n_jobs_finished++;
                continue;
            }
            if (!job->execute(solver_factory, &limiter))
                all_ok = false;
        }
        return all_ok;
    }
    DispatchThreadGroupManager manager(jobs, n_threads, solver_factory, &limiter, stop_on_err);
    manager.startAllWorkerThreads();
    manager.executeAllJobs();
    bool all_ok = manager.waitForWorkersToFinish();
    manager.stopAllWorkerThreads();
    return all_ok;
}



// ----------------------------------- //
//         Implementation of           //
//     DispatchThreadGroupManager      //
// ----------------------------------- //
DispatchThreadGroupManager::DispatchThreadGroupManager(
    const std::vector<DispatchJob*>& jobs,
    unsigned int n_threads,
    const MilpSolverFactory& solver_factory,
    SolveSlotLimiter* limiter,
    bool stop_on_err
) : n_threads(n_threads), solver_factory(solver_factory), limiter(limiter), stop_on_err(stop_on_err)
{
    if (n_threads < 1)
        throw std::logic_error("Thread group manager cannot be started if the number of worker threads is set to 0.");

    all_workers_finished_latch = NULL;

    // create as much lists as we have workers where we iteratively add one job
    std::vector<std::list<DispatchJob*>> vlj(n_threads);
    unsigned int t = 0; // the current worker where the next job will be attached to
    for (DispatchJob* job : jobs) {
        vlj[t].push_back(job);
        // increment t
        t++;
        if (t >= n_threads)
            t = 0;
    }

    // Initialize the worker threads
    worker_threads.reserve(n_threads);
    for (unsigned int t = 0; t < n_threads; t++) {
        DispatchWorkerThread* new_thread = new DispatchWorkerThread( vlj[t], *this );
        worker_threads.push_back(new_thread);
    }
}

DispatchThreadGroupManager::~DispatchThreadGroupManager() {
    for (DispatchWorkerThread* thread : worker_threads) {
        thread->stop();
        delete thread;
    }
    worker_threads.clear();
    delete all_workers_finished_latch;
}

void DispatchThreadGroupManager::startAllWorkerThreads() {
    for (DispatchWorkerThread* wt : worker_threads) {
        wt->start();
    }
}

void DispatchThreadGroupManager::stopAllWorkerThreads() {
    for (DispatchWorkerThread* wt : worker_threads) {
        wt->stop();
    }
}

void DispatchThreadGroupManager::executeAllJobs() {
    // (Re-)Initialize the latch object
    if (all_workers_finished_latch != NULL)
        delete all_workers_finished_latch;
    all_workers_finished_latch = new std::latch(n_threads);
    // Notify all threads to start working
    for (DispatchWorkerThread* wt : worker_threads) {
        wt->executeAllConnJobs();
    }
}

bool DispatchThreadGroupManager::waitForWorkersToFinish() {
    if (all_workers_finished_latch == NULL)
        return true;
    all_workers_finished_latch->wait();
    //
    // return false, if an error occured
    for (DispatchWorkerThread* wt : worker_threads) {
        if (wt->errorHappened())
            return false;
    }
    return true;
}



// ----------------------------------- //
//         Implementation of           //
//       DispatchWorkerThread          //
// ----------------------------------- //
DispatchWorkerThread::DispatchWorkerThread(
    const std::list<DispatchJob*>& connected_jobs_,
    DispatchThreadGroupManager& caller
) : thread_group_manager(caller), connected_jobs(connected_jobs_.begin(), connected_jobs_.end())
{
    atomic_flag_stop    = false;
    atomic_flag_exec    = false;
    atomic_flag_running = false;
    atomic_flag_idling  = true;
    error_happened      = false;
}

DispatchWorkerThread::~DispatchWorkerThread() {
    // Stop the thread and clean up
    stop();
    // Join the threads and set the flags to false
    if (current_thread.joinable()) {
        current_thread.join();
    }
    {
        std::unique_lock<std::mutex> lock_obj(mtx);
        atomic_flag_running = false;
    }
}

void DispatchWorkerThread::start() {
    // Is the thread already started?
    bool start_thread = false;
    {
        std::unique_lock<std::mutex> lock_obj(mtx);
        if (!atomic_flag_running) {
            start_thread = true;
            atomic_flag_running = true;
        }
    }
    // Start the thread, if it is not already running
    if (start_thread) {
        current_thread = std::thread(&DispatchWorkerThread::run, this);
    }
}

void DispatchWorkerThread::stop() {
    {
        // lock the mutex in this scope
        std::unique_lock<std::mutex> lock_obj(mtx);
        // do the atomic operation
        atomic_flag_stop = true;
    }
    cv.notify_all();
}

void DispatchWorkerThread::executeAllConnJobs() {
    {
        // lock the mutex in this scope
        std::unique_lock<std::mutex> lock_obj(mtx);
        // set the flag
        atomic_flag_exec   = true;
        atomic_flag_idling = false;
    }
    cv.notify_all();
}

void DispatchWorkerThread::run() {
    bool exec_task = false; // thread-internal variable to store the value of atomic_flag_exec
    //
    while (true)
    {
        {
            // lock the mutex
            std::unique_lock<std::mutex> lock_obj(mtx);
            // wait for the variables to change ( the wait-method releases the mutex until the condition is met )
            cv.wait(lock_obj, [this] { return atomic_flag_stop || atomic_flag_exec; });

            // execute the main task if it is selected
            if (atomic_flag_exec) {
                exec_task = true;
                atomic_flag_exec = false;
            }

            // return if stop flag has been set and there is no pending task
            if (atomic_flag_stop && !exec_task) {
                return;
            }
        }
        // execute all connected jobs outside of the locked mutex
        if (exec_task) {
            exec_task = false; // do not execute it again
            for (DispatchJob* job : connected_jobs) {
                if (error_happened && thread_group_manager.stop_on_err) {
                    job->outcome = JobOutcome::Skipped;
                    global::n_jobs_finished++;
                    continue;
                }
                if (!job->execute(thread_group_manager.solver_factory, thread_group_manager.limiter)) {
                    error_happened = true;
                }
            }
        }
        // set atomic flag for idling to true AFTER the task has been executed
        {
            std::unique_lock<std::mutex> lock_obj(mtx);
            atomic_flag_idling = true;
        }
        // decrement the latch
        thread_group_manager.all_workers_finished_latch->count_down();
    }
}
