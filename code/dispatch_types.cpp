#include "dispatch_types.h"

#include <cmath>
#include <numeric>
#include <string>
#include <vector>

#include "errors.h"

using namespace std;


void HorizonInput::validate() const {
    if (load_kW.size() == 0) {
        throw ConfigurationError("The horizon contains no hours.");
    }
    if (load_kW.size() != solar_available_kW.size()) {
        throw ConfigurationError("Load series (" + to_string(load_kW.size()) + " hours) and solar series (" +
                                 to_string(solar_available_kW.size()) + " hours) differ in length.");
    }
    if (timestamps.size() != 0 && timestamps.size() != load_kW.size()) {
        throw ConfigurationError("Number of time stamps (" + to_string(timestamps.size()) +
                                 ") does not match the number of hours (" + to_string(load_kW.size()) + ").");
    }
    for (size_t h = 0; h < load_kW.size(); h++) {
        if (!std::isfinite(load_kW[h]) || load_kW[h] < 0.0) {
            throw ConfigurationError("Load at hour " + to_string(h) + " is negative or not finite.");
        }
        if (!std::isfinite(solar_available_kW[h]) || solar_available_kW[h] < 0.0) {
            throw ConfigurationError("Available solar power at hour " + to_string(h) + " is negative or not finite.");
        }
    }
}

HorizonInput HorizonInput::window(unsigned long first_hour, unsigned long n_hours) const {
    const unsigned long n_total = load_kW.size();
    if (first_hour >= n_total) {
        throw ConfigurationError("First hour " + to_string(first_hour) + " is outside of the series with " +
                                 to_string(n_total) + " hours.");
    }
    if (n_hours == 0)
        n_hours = n_total - first_hour;
    if (first_hour + n_hours > n_total) {
        throw ConfigurationError("Window [" + to_string(first_hour) + ", " + to_string(first_hour + n_hours) +
                                 ") exceeds the series with " + to_string(n_total) + " hours.");
    }
    HorizonInput sub;
    sub.offset = offset + first_hour;
    sub.load_kW.assign(load_kW.begin() + first_hour, load_kW.begin() + first_hour + n_hours);
    if (solar_available_kW.size() >= first_hour + n_hours)
        sub.solar_available_kW.assign(solar_available_kW.begin() + first_hour, solar_available_kW.begin() + first_hour + n_hours);
    if (timestamps.size() >= first_hour + n_hours)
        sub.timestamps.assign(timestamps.begin() + first_hour, timestamps.begin() + first_hour + n_hours);
    return sub;
}

double HorizonInput::get_total_load_kWh() const {
    return std::accumulate(load_kW.begin(), load_kW.end(), 0.0);
}

double HorizonInput::get_total_solar_kWh() const {
    return std::accumulate(solar_available_kW.begin(), solar_available_kW.end(), 0.0);
}

const char* dispatchStatusToString(DispatchStatus status) {
    switch (status) {
        case DispatchStatus::Optimal:  return "OPTIMAL";
        case DispatchStatus::Feasible: return "FEASIBLE";
    }
    return "UNKNOWN";
}
