/*
 * worker_threads.hpp
 *
 * It contains the definition of classes required for
 * running independent dispatch jobs in worker threads.
 *
 */

#ifndef WORKER_THREADS_HPP
#define WORKER_THREADS_HPP

#include <atomic>
#include <condition_variable>
#include <latch>
#include <list>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// The following classes are defined in this header file:
class SolveSlotLimiter;
struct DispatchJob;
class DispatchThreadGroupManager;
class DispatchWorkerThread;

#include "asset_config.h"
#include "dispatch_types.h"
#include "errors.h"
#include "optimization_unit_general.hpp"

/*!
 * Limits the number of solver runs that are executed at the same time.
 * This class is thread-safe.
 */
class SolveSlotLimiter {
    public:
        /*!
         * @param max_concurrent_solves: Maximum number of parallel solves, 0 means unbounded
         */
        explicit SolveSlotLimiter(unsigned long max_concurrent_solves);

        void acquire(); ///< Blocks until a slot is free and takes it
        void release(); ///< Releases a slot taken with acquire()

        unsigned long get_n_running() const;
        unsigned long get_max_observed() const; ///< Maximum number of parallel solves seen so far

    private:
        const unsigned long max_concurrent_solves;
        unsigned long n_running;
        unsigned long max_observed;
        mutable std::mutex mtx;
        std::condition_variable cv;
};

/*!
 * Outcome of one dispatch job.
 */
enum struct JobOutcome : short {
    Pending,
    Succeeded,
    InvalidConfiguration,
    Infeasible,
    SolverFailed,
    InternalError,
    Skipped         ///< Not executed, as an earlier job of the same worker failed (stop on error)
};

/*!
 * One independent dispatch run with its own input, configuration and result.
 */
struct DispatchJob {
    DispatchJob(unsigned long jobID, const std::string& label, const HorizonInput& input,
                const AssetConfig& config, const SolverSettings& settings);

    const unsigned long jobID;
    const std::string label;
    const HorizonInput input;
    const AssetConfig config;
    const SolverSettings settings;

    JobOutcome outcome = JobOutcome::Pending;
    DispatchResult result;                             ///< Only valid if outcome == JobOutcome::Succeeded
    std::string error_message;                         ///< Set for all failed outcomes
    std::vector<InfeasibilityHint> infeasibility_hints; ///< Set for JobOutcome::Infeasible
    std::string variable_dump;                         ///< Set for JobOutcome::InternalError (if available)

    /*!
     * Executes the job, i.e. calls dispatch::runDispatch() and records
     * the result or the error in this object.
     *
     * @param solver_factory: Creates the solver instance
     * @param limiter: The solve slot limiter (can be NULL)
     *
     * @return: Returns true if the job succeeded
     */
    bool execute(const MilpSolverFactory& solver_factory, SolveSlotLimiter* limiter);
};

const char* jobOutcomeToString(JobOutcome outcome);

/*!
 * Executes all jobs, either on the calling thread (n_threads == 0) or
 * distributed over n_threads worker threads.
 *
 * @return: Returns true if all jobs succeeded
 */
bool executeDispatchJobs(
    const std::vector<DispatchJob*>& jobs,
    unsigned int n_threads,
    unsigned long max_concurrent_solves,
    bool stop_on_err,
    const MilpSolverFactory& solver_factory = createDefaultMilpSolver
);


/*!
 * This class represents one group of threads of the class DispatchWorkerThread.
 * It provides functionality for creating and managing all existing thread instances.
 *
 * This class is not thread-safe.
 */
class DispatchThreadGroupManager {
    private:
        friend class DispatchWorkerThread;

    public:
        /*!
         * This function initializes a new instance of the thread group manager.
         * The jobs are distributed round-robin over the worker threads.
         *
         * @param jobs: The jobs to execute. Every job is executed by exactly one worker.
         * @param n_threads: Number of worker threads (must be >= 1)
         * @param solver_factory: Creates the solver instances
         * @param limiter: Solve slot limiter shared by all workers (can be NULL)
         * @param stop_on_err: If true, a worker skips its remaining jobs after the first failed job
         */
        DispatchThreadGroupManager(const std::vector<DispatchJob*>& jobs, unsigned int n_threads,
                                   const MilpSolverFactory& solver_factory, SolveSlotLimiter* limiter, bool stop_on_err);

        ~DispatchThreadGroupManager();

        /*!
         * This function starts all worker threads.
         * This means that the threads are forked and start to idle and wait for tasks.
         * If called multiple times, it does not do anything.
         */
        void startAllWorkerThreads();

        /*!
         * This function stops all worker threads.
         * If called multiple times, it does not do anything.
         */
        void stopAllWorkerThreads();

        /*!
         * This method notifies the worker threads to start working on their jobs.
         */
        void executeAllJobs();

        /*!
         * This function waits until all workers are finished with the task
         * that has been started with executeAllJobs().
         *
         * @return: Returns false if any job failed
         */
        bool waitForWorkersToFinish();

    private:
        std::vector<DispatchWorkerThread*> worker_threads; ///< Vector of worker threads
        std::latch* all_workers_finished_latch;
        const unsigned int n_threads;
        const MilpSolverFactory solver_factory;
        SolveSlotLimiter* limiter;
        const bool stop_on_err;
};

/*!
 * This class represents a working thread that executes all
 * connected jobs on request.
 * The thread sleeps until it is activated using the public method
 * executeAllConnJobs().
 */
class DispatchWorkerThread {
    public:
        /*!
         * Constructs a new working thread for a list of jobs.
         * Attention: A job MUST ONLY be connected to ONE working thread!
         *
         * @param connected_jobs_: The list of jobs that are connected to this working thread
         * @param caller: The reference to the thread group manager object
         */
        DispatchWorkerThread(const std::list<DispatchJob*>& connected_jobs_, DispatchThreadGroupManager& caller);
        ~DispatchWorkerThread();
        void start(); ///< Starts this thread. This method has to be called before the call of executeAllConnJobs().
        void stop(); ///< Stops this working thread.

        /*!
         * This method notifies the thread to start working.
         * Basically, it sets atomic_flag_exec to true.
         */
        void executeAllConnJobs();

        /*!
         * This function returns true if the thread is idling, i.e., it is running, but not currently working and has also no planned work.
         */
        bool isIdling() const { return atomic_flag_idling; }

        /*!
         * Returns true if one of the connected jobs failed.
         */
        bool errorHappened() const { return error_happened; }

    private:
        DispatchThreadGroupManager& thread_group_manager; ///< Internal reference to the thread group manager
        std::vector<DispatchJob*> connected_jobs; ///< List of connected jobs
        std::thread current_thread;
        std::mutex mtx; ///< The mutex object per instance
        std::condition_variable cv; ///< The conditional variable to signal the requests for running, i.e., by calling executeAllConnJobs()
        std::atomic<bool> atomic_flag_stop;    ///< Set to true if the the working thread should stop
        std::atomic<bool> atomic_flag_exec;    ///< Set to true if the connected jobs should be executed
        std::atomic<bool> atomic_flag_running; ///< Set to true if the thread is invoked and running (working or idling)
        std::atomic<bool> atomic_flag_idling;  ///< Set to true if the thread is idling (i.e., running but without work and without planned work)
        std::atomic<bool> error_happened;      ///< Set to true if a job failed
        //
        void run(); ///< Main internal function for this thread. It is started and stopped with the start()- and stop()-method.
};

#endif
