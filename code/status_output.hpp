/*
 * status_output.hpp
 *
 * This file contains all code for the log and status output of the
 * program, optionally using the ncurses library.
 *
 */

#ifndef STATUS_OUTPUT_HPP
#define STATUS_OUTPUT_HPP

#include <ncurses.h>
#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * @class StatusOutput
 * @brief Thread-safe log, warning and progress output of the dispatch runs.
 *
 * With the status screen (--tui) the terminal is divided into three panes:
 * - Left: dispatch log
 * - Top-right: warnings and errors
 * - Bottom-right: progress of the current batch (jobs, solver calls), updated every second
 *
 * Without the status screen, log messages go to stdout, warnings and errors to stderr.
 * The progress line is additionally written to StatusOutput::progress_file_path.
 */
class StatusOutput {
    public:
        static constexpr const char* progress_file_path = "/tmp/dispatch-status.txt";
        static constexpr size_t max_kept_messages = 500; ///< Per pane, older messages are dropped

        static void add_status_output(const std::string& message);
        static void add_error_message(const std::string& error);
        /// Adds a warning to the error pane (prefixed with "Warning: ")
        static void add_warning(const std::string& warning);

        static unsigned long get_n_errors()   { return n_errors;   }
        static unsigned long get_n_warnings() { return n_warnings; }
        static size_t get_n_kept_log_messages();

        /**
         * @brief Creates the three panes of the status screen.
         * Messages added before are not shown on the screen.
         */
        static void initialize_ncurses();

        /**
         * @brief Restores the terminal. The kept errors and warnings are repeated on stderr,
         * as they disappear together with the screen.
         */
        static void shutdown_ncurses();

        static void start_status_updater_thread();
        static void stop_status_updater_thread();

        /**
         * @brief Returns the progress of the current batch as single line, e.g.
         * "12s - jobs 3 / 12 - solver calls 4 finished, 2 running"
         */
        static std::string create_progress_line();

    private:
        static void add_to_error_pane(const std::string& message);
        /// Appends a message and drops the oldest ones above max_kept_messages (caller holds the lock of the list)
        static void keep_message(std::vector<std::string>& messages, const std::string& message);
        /// Redraws a pane with a title and the last messages that fit into it (locks screen_mutex)
        static void redraw_message_pane(WINDOW* pane, const char* title, const std::vector<std::string>& messages);
        static void status_updater();

        static std::mutex log_mutex;
        static std::mutex error_mutex;
        static std::mutex screen_mutex; ///< ncurses is not thread-safe

        static std::vector<std::string> log_messages;
        static std::vector<std::string> error_messages;
        static std::atomic<unsigned long> n_errors;
        static std::atomic<unsigned long> n_warnings;

        static std::atomic<bool> running;
        static std::atomic<bool> ncurses_initialized;
        static std::thread updater_thread;

        static WINDOW* log_win;
        static WINDOW* error_win;
        static WINDOW* status_win;
};

#endif
