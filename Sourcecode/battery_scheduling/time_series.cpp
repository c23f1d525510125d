//
//  time_series.cpp
//  BatteryScheduling
//
//  Copyright © 2026 BatteryScheduling contributors. All rights reserved.
//

#include "time_series.hpp"

#include <cmath>
#include <sstream>

#include "errors.hpp"
#include "auxiliary.hpp"

using namespace std;

tPeriodWindow::tPeriodWindow (shared_ptr<const tTimeSeries> series, const tPeriodBoundary &boundary)
    : series_ (series), boundary_ (boundary) {
    if (!series_)
        throw tConfigurationError ("Period window requires a time series.");

    if ((boundary.begin < 0) || (boundary.end < boundary.begin) || (boundary.end > (int)series_->steps.size())) {
        stringstream message;
        message << "Period [" << boundary.begin << ", " << boundary.end << ") lies outside the series of "
                << series_->steps.size() << " steps.";
        throw tConfigurationError (message.str());
    }
}

void verify_series (const tTimeSeries &series) {
    if (!std::isfinite (series.step_duration) || (series.step_duration <= 0.0)) {
        stringstream message;
        message << "Step duration must be positive, got " << series.step_duration << " hours.";
        throw tDataGapError (message.str());
    }

    const double expected_spacing = hours_to_seconds (series.step_duration);

    for (size_t t = 0; t < series.steps.size(); ++t) {
        const tTimestep &step = series.steps[t];

        if (!std::isfinite (step.demand) || !std::isfinite (step.generation) ||
            !std::isfinite (step.buy_price) || !std::isfinite (step.sell_price)) {
            stringstream message;
            message << "Missing value at step " << t << " (" << format_timestamp (step.timestamp) << ").";
            throw tDataGapError (message.str());
        }

        if (t == 0)
            continue;

        double spacing = difftime (step.timestamp, series.steps[t - 1].timestamp);
        if (!approx_equal (spacing, expected_spacing, 0.5)) {
            stringstream message;
            message << "Timestep " << t << " (" << format_timestamp (step.timestamp) << ") is "
                    << spacing << " seconds after its predecessor, expected " << expected_spacing << ".";
            throw tDataGapError (message.str());
        }
    }
}

vector<tPeriodBoundary> monthly_periods (const tTimeSeries &series) {
    vector<tPeriodBoundary> periods;

    int begin = 0;
    for (int t = 1; t <= (int)series.steps.size(); ++t) {
        if ((t == (int)series.steps.size()) ||
            (month_of_timestamp (series.steps[t].timestamp) != month_of_timestamp (series.steps[begin].timestamp))) {
            periods.push_back (tPeriodBoundary (begin, t));
            begin = t;
        }
    }

    return periods;
}

vector<tPeriodBoundary> fixed_length_periods (const tTimeSeries &series, int steps_per_period) {
    if (steps_per_period <= 0) {
        stringstream message;
        message << "Steps per period must be positive, got " << steps_per_period << ".";
        throw tConfigurationError (message.str());
    }

    vector<tPeriodBoundary> periods;
    for (int begin = 0; begin < (int)series.steps.size(); begin += steps_per_period)
        periods.push_back (tPeriodBoundary (begin, min (begin + steps_per_period, (int)series.steps.size())));

    return periods;
}
