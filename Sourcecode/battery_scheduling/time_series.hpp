//
//  time_series.hpp
//  BatteryScheduling
//
//  Copyright © 2026 BatteryScheduling contributors. All rights reserved.
//

#ifndef time_series_hpp
#define time_series_hpp

#include <ctime>
#include <memory>
#include <vector>

// data structure for a single timestep of the site
struct tTimestep {
    std::time_t timestamp;      // UTC, beginning of the step
    double demand;              // in kWh
    double generation;          // in kWh
    double buy_price;           // per kWh imported
    double sell_price;          // per kWh exported

    tTimestep() : timestamp (0), demand (0.0), generation (0.0), buy_price (0.0), sell_price (0.0) {}
    tTimestep (std::time_t timestamp, double demand, double generation, double buy_price, double sell_price)
        : timestamp (timestamp), demand (demand), generation (generation), buy_price (buy_price), sell_price (sell_price) {}

    double net_load() const { return demand - generation; }
    double positive_load() const { return (net_load() > 0.0) ? net_load() : 0.0; }
    double negative_load() const { return (net_load() < 0.0) ? net_load() : 0.0; }
};

// ordered series of timesteps with a fixed step duration
struct tTimeSeries {
    std::vector<tTimestep> steps;
    double step_duration;       // in hours

    tTimeSeries() : step_duration (0.0) {}
    explicit tTimeSeries (double step_duration) : step_duration (step_duration) {}
};

// half-open range [begin, end) of step indices
struct tPeriodBoundary {
    int begin, end;

    tPeriodBoundary() : begin (0), end (0) {}
    tPeriodBoundary (int begin, int end) : begin (begin), end (end) {}

    int no_of_steps() const { return end - begin; }
};

// immutable view of one optimization period over a shared series
class tPeriodWindow {
public:
    tPeriodWindow (std::shared_ptr<const tTimeSeries> series, const tPeriodBoundary &boundary);

    int no_of_steps() const { return boundary_.no_of_steps(); }
    bool empty() const { return no_of_steps() == 0; }
    double step_duration() const { return series_->step_duration; }
    const tPeriodBoundary &boundary() const { return boundary_; }

    // t is relative to the beginning of the window
    const tTimestep &step (int t) const { return series_->steps[boundary_.begin + t]; }

private:
    std::shared_ptr<const tTimeSeries> series_;
    tPeriodBoundary boundary_;
};

// throws tDataGapError if a value is missing or not finite, if timestamps are not strictly increasing,
// or if two consecutive timestamps are not exactly one step duration apart
void verify_series (const tTimeSeries &series);

// one boundary per UTC calendar month touched by the series, in chronological order
std::vector<tPeriodBoundary> monthly_periods (const tTimeSeries &series);

// consecutive boundaries of steps_per_period steps; the last one may be shorter
std::vector<tPeriodBoundary> fixed_length_periods (const tTimeSeries &series, int steps_per_period);

#endif /* time_series_hpp */
