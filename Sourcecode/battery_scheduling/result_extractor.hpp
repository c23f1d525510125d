//
//  result_extractor.hpp
//  BatteryScheduling
//
//  Copyright © 2026 BatteryScheduling contributors. All rights reserved.
//

#ifndef result_extractor_hpp
#define result_extractor_hpp

#include <ctime>
#include <vector>

#include "model_builder.hpp"
#include "solver_adapter.hpp"
#include "time_series.hpp"

// data structure for the optimal dispatch of one period
struct tOptimizationResult {
    tPeriodBoundary boundary;
    std::vector<std::time_t> timestamps;                    // [no_of_steps]
    std::vector<std::vector<double> > channels;             // [no_of_dispatch_channels][no_of_steps]
    std::vector<int> charge_indicator;                      // [no_of_steps], 0 or 1
    std::vector<int> discharge_indicator;                   // [no_of_steps], 0 or 1

    double initial_soc, final_soc;                          // in kWh
    double objective_value;
    double cost_without_battery, cost_with_battery;
    double solve_time;                                      // in seconds

    tOptimizationResult();

    int no_of_steps() const { return (int)timestamps.size(); }
    double value (int channel, int t) const { return channels[channel][t]; }

    // (cost_with_battery - cost_without_battery) / |cost_without_battery| * 100;
    // throws tDegenerateCostError if cost_without_battery is zero
    double score_percent() const;
    double money_saved() const;
};

double score_percent (double cost_without_battery, double cost_with_battery);
double money_saved (double cost_without_battery, double cost_with_battery);

// sum_t buy_price[t] * positive_load[t] + sell_price[t] * negative_load[t]
double cost_without_battery (const tPeriodWindow &window);

// result of a period without any step: the SOC is carried through unchanged
tOptimizationResult empty_result (const tPeriodWindow &window, double initial_soc);

// unpacks a solved dispatch model; throws tSolverError if the solution does not match the model
tOptimizationResult extract_result (const tDispatchModel &dm, const tPeriodWindow &window, const tSolverSolution &solution);

#endif /* result_extractor_hpp */
