#include "status_output.hpp"

#include <chrono>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <sstream>

#include "global.h"

std::mutex StatusOutput::log_mutex;
std::mutex StatusOutput::error_mutex;
std::mutex StatusOutput::screen_mutex;

std::vector<std::string> StatusOutput::log_messages;
std::vector<std::string> StatusOutput::error_messages;
std::atomic<unsigned long> StatusOutput::n_errors{0};
std::atomic<unsigned long> StatusOutput::n_warnings{0};

std::atomic<bool> StatusOutput::running{false};
std::atomic<bool> StatusOutput::ncurses_initialized{false};
std::thread StatusOutput::updater_thread;

WINDOW* StatusOutput::log_win    = nullptr;
WINDOW* StatusOutput::error_win  = nullptr;
WINDOW* StatusOutput::status_win = nullptr;


void StatusOutput::initialize_ncurses() {
    if (ncurses_initialized)
        return;
    std::lock_guard<std::mutex> screen_lock(screen_mutex);
    initscr();
    noecho();
    cbreak();
    curs_set(0);
    refresh();

    int height, width;
    getmaxyx(stdscr, height, width);
    log_win    = newwin(height,              width / 2,         0,          0);
    error_win  = newwin(height / 2,          width - width / 2, 0,          width / 2);
    status_win = newwin(height - height / 2, width - width / 2, height / 2, width / 2);
    for (WINDOW* w : {log_win, error_win, status_win}) {
        box(w, 0, 0);
        wrefresh(w);
    }
    ncurses_initialized = true;
}

void StatusOutput::shutdown_ncurses() {
    if (!ncurses_initialized)
        return;
    {
        std::lock_guard<std::mutex> screen_lock(screen_mutex);
        ncurses_initialized = false;
        delwin(log_win);    log_win    = nullptr;
        delwin(error_win);  error_win  = nullptr;
        delwin(status_win); status_win = nullptr;
        endwin();
    }
    std::lock_guard<std::mutex> lock(error_mutex);
    for (const std::string& e : error_messages)
        std::cerr << e << "\n";
    std::cerr << std::flush;
}

void StatusOutput::add_status_output(const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    keep_message(log_messages, message);
    if (ncurses_initialized)
        redraw_message_pane(log_win, "Dispatch log", log_messages);
    else
        std::cout << message << std::endl;
}

void StatusOutput::add_error_message(const std::string& error) {
    n_errors++;
    add_to_error_pane(error);
}

void StatusOutput::add_warning(const std::string& warning) {
    n_warnings++;
    add_to_error_pane("Warning: " + warning);
}

void StatusOutput::add_to_error_pane(const std::string& message) {
    std::lock_guard<std::mutex> lock(error_mutex);
    keep_message(error_messages, message);
    if (ncurses_initialized)
        redraw_message_pane(error_win, "Warnings and errors", error_messages);
    else
        std::cerr << message << std::endl;
}

void StatusOutput::keep_message(std::vector<std::string>& messages, const std::string& message) {
    messages.push_back(message);
    if (messages.size() > max_kept_messages)
        messages.erase(messages.begin(), messages.begin() + (messages.size() - max_kept_messages));
}

size_t StatusOutput::get_n_kept_log_messages() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return log_messages.size();
}

void StatusOutput::redraw_message_pane(WINDOW* pane, const char* title, const std::vector<std::string>& messages) {
    std::lock_guard<std::mutex> screen_lock(screen_mutex);
    if (pane == nullptr)
        return;
    werase(pane);
    box(pane, 0, 0);
    mvwprintw(pane, 0, 2, " %s ", title);
    int height, width;
    getmaxyx(pane, height, width);
    const size_t n_lines = height > 2 ? (size_t) (height - 2) : 0;
    const size_t first   = messages.size() > n_lines ? messages.size() - n_lines : 0;
    int row = 1;
    for (size_t i = first; i < messages.size(); i++)
        mvwprintw(pane, row++, 1, "%.*s", width - 2, messages[i].c_str());
    wrefresh(pane);
}

std::string StatusOutput::create_progress_line() {
    const auto elapsed_s = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now() - global::time_of_run_start).count();
    const unsigned long started  = global::n_solver_calls_started;
    const unsigned long finished = global::n_solver_calls_finished;
    std::stringstream ss;
    ss << elapsed_s << "s - jobs " << global::n_jobs_finished << " / " << global::n_jobs_total
       << " - solver calls " << finished << " finished, " << (started >= finished ? started - finished : 0) << " running";
    return ss.str();
}

void StatusOutput::status_updater() {
    while (running) {
        const std::string progress = create_progress_line();
        {
            std::ofstream ofs(progress_file_path, std::ofstream::out);
            ofs << progress << "\n";
            ofs << "warnings = " << n_warnings << ", errors = " << n_errors << "\n";
        }
        if (ncurses_initialized) {
            redraw_message_pane(status_win, "Batch progress", {progress});
        } else {
            std::lock_guard<std::mutex> lock(log_mutex);
            std::cout << progress << "\r" << std::flush;
        }
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }
}

void StatusOutput::start_status_updater_thread() {
    if (!running) {
        running = true;
        updater_thread = std::thread(status_updater);
    }
}

void StatusOutput::stop_status_updater_thread() {
    if (running) {
        running = false;
        updater_thread.join();
        if (!ncurses_initialized)
            std::cout << std::endl;
    }
}
