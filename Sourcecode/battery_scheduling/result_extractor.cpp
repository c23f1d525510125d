//
//  result_extractor.cpp
//  BatteryScheduling
//
//  Copyright © 2026 BatteryScheduling contributors. All rights reserved.
//

#include "result_extractor.hpp"

#include <cmath>
#include <sstream>

#include "errors.hpp"

using namespace std;

tOptimizationResult::tOptimizationResult() : initial_soc (0.0), final_soc (0.0), objective_value (0.0),
                                             cost_without_battery (0.0), cost_with_battery (0.0), solve_time (0.0) {
    channels.resize (no_of_dispatch_channels);
}

double tOptimizationResult::score_percent() const {
    return ::score_percent (cost_without_battery, cost_with_battery);
}

double tOptimizationResult::money_saved() const {
    return ::money_saved (cost_without_battery, cost_with_battery);
}

double score_percent (double cost_without_battery, double cost_with_battery) {
    if (cost_without_battery == 0.0)
        throw tDegenerateCostError ("Score undefined: the cost without battery is zero.");

    return (cost_with_battery - cost_without_battery) / fabs (cost_without_battery) * 100.0;
}

double money_saved (double cost_without_battery, double cost_with_battery) {
    return fabs (cost_without_battery - cost_with_battery);
}

double cost_without_battery (const tPeriodWindow &window) {
    double cost = 0.0;
    for (int t = 0; t < window.no_of_steps(); ++t)
        cost += window.step (t).buy_price * window.step (t).positive_load() +
                window.step (t).sell_price * window.step (t).negative_load();

    return cost;
}

tOptimizationResult empty_result (const tPeriodWindow &window, double initial_soc) {
    tOptimizationResult result;
    result.boundary = window.boundary();
    result.initial_soc = initial_soc;
    result.final_soc = initial_soc;

    for (int t = 0; t < window.no_of_steps(); ++t)
        result.timestamps.push_back (window.step (t).timestamp);

    return result;
}

tOptimizationResult extract_result (const tDispatchModel &dm, const tPeriodWindow &window, const tSolverSolution &solution) {
    if ((int)solution.values.size() != dm.model.no_of_variables()) {
        stringstream message;
        message << "Solution has " << solution.values.size() << " values, the model has "
                << dm.model.no_of_variables() << " variables.";
        throw tSolverError (message.str());
    }
    if (dm.no_of_steps != window.no_of_steps())
        throw tSolverError ("Dispatch model and period window differ in length.");

    tOptimizationResult result;
    result.boundary = window.boundary();
    result.initial_soc = dm.initial_soc;
    result.objective_value = solution.objective_value;
    result.solve_time = solution.solve_time;

    const int no_of_steps = dm.no_of_steps;

    for (int t = 0; t < no_of_steps; ++t)
        result.timestamps.push_back (window.step (t).timestamp);

    for (int c = 0; c < no_of_dispatch_channels; ++c) {
        result.channels[c].resize (no_of_steps);
        for (int t = 0; t < no_of_steps; ++t)
            result.channels[c][t] = solution.values[dm.variable (c, t)];
    }

    result.charge_indicator.resize (no_of_steps);
    result.discharge_indicator.resize (no_of_steps);
    for (int t = 0; t < no_of_steps; ++t) {
        result.charge_indicator[t]    = (solution.values[dm.charge_indicator_variables[t]] > 0.5) ? 1 : 0;
        result.discharge_indicator[t] = (solution.values[dm.discharge_indicator_variables[t]] > 0.5) ? 1 : 0;
    }

    result.final_soc = (no_of_steps > 0) ? result.channels[channel_soc][no_of_steps - 1] : dm.initial_soc;

    // costs
    result.cost_without_battery = cost_without_battery (window);

    result.cost_with_battery = 0.0;
    for (int t = 0; t < no_of_steps; ++t)
        result.cost_with_battery += window.step (t).buy_price * result.channels[channel_net_import][t] +
                                    window.step (t).sell_price * result.channels[channel_net_export][t];

    // that's it!
    return result;
}
