//
//  rolling_horizon.cpp
//  BatteryScheduling
//
//  Copyright © 2026 BatteryScheduling contributors. All rights reserved.
//

#include "rolling_horizon.hpp"

#include <chrono>
#include <sstream>

#include "errors.hpp"
#include "auxiliary.hpp"

using namespace std;
using namespace chrono;

tOptimizationResult optimize_period (const tBatterySpec &battery, const tPeriodWindow &window, double initial_soc,
                                     const tModelParameters &parameters, tMilpSolver &solver) {
    tDispatchModel dm = build_dispatch_model (battery, window, initial_soc, parameters);

    // nothing to decide: no constraint, zero objective, SOC carried through
    if (window.empty())
        return empty_result (window, initial_soc);

    tSolverSolution solution = solver.solve (dm.model);
    check_solve_status (solution.status, "Period solve");

    return extract_result (dm, window, solution);
}

void verify_periods (const tTimeSeries &series, const vector<tPeriodBoundary> &periods) {
    for (size_t p = 0; p < periods.size(); ++p) {
        const tPeriodBoundary &boundary = periods[p];

        if ((boundary.begin < 0) || (boundary.end < boundary.begin) || (boundary.end > (int)series.steps.size())) {
            stringstream message;
            message << "Period " << p << " [" << boundary.begin << ", " << boundary.end << ") lies outside the series of "
                    << series.steps.size() << " steps.";
            throw tConfigurationError (message.str());
        }

        if ((p > 0) && (boundary.begin != periods[p - 1].end)) {
            stringstream message;
            message << "Period " << p << " starts at step " << boundary.begin << ", but period " << p - 1
                    << " ends at step " << periods[p - 1].end << ".";
            throw tConfigurationError (message.str());
        }
    }
}

void run_rolling_horizon (const tBatterySpec &battery, shared_ptr<const tTimeSeries> series,
                          const vector<tPeriodBoundary> &periods, double initial_soc,
                          const tModelParameters &parameters, tMilpSolver &solver,
                          tHorizonRun &run, ostream *log) {
    if (!series)
        throw tConfigurationError ("Rolling horizon requires a time series.");

    verify_series (*series);
    verify_periods (*series, periods);

    if (run.no_of_periods() > (int)periods.size()) {
        stringstream message;
        message << "Run already holds " << run.no_of_periods() << " periods, only " << periods.size() << " are defined.";
        throw tConfigurationError (message.str());
    }

    int first_period = run.no_of_periods();
    if ((first_period > 0) &&
        ((run.period (first_period - 1).boundary.begin != periods[first_period - 1].begin) ||
         (run.period (first_period - 1).boundary.end != periods[first_period - 1].end)))
        throw tConfigurationError ("Completed periods in the run do not match the period boundaries.");

    // set up initial SOC
    double soc = run.final_soc (initial_soc);

    // strictly sequential: period p + 1 needs the final SOC of period p
    for (int p = first_period; p < (int)periods.size(); ++p) {
        tPeriodWindow window (series, periods[p]);

        time_point<steady_clock> start = steady_clock::now();
        if (log != nullptr)
            *log << "Optimizing period " << p << " of " << periods.size() << " (" << window.no_of_steps() << " steps"
                 << (window.empty() ? string() : ", from " + format_timestamp (window.step (0).timestamp))
                 << ")..." << flush;

        tOptimizationResult result = optimize_period (battery, window, soc, parameters, solver);
        run.append (result);
        soc = result.final_soc;

        if (log != nullptr)
            *log << "done: " << ((duration<double>)(steady_clock::now() - start)).count() << " seconds"
                 << " (solver " << result.solve_time << " s, cost " << result.cost_without_battery
                 << " -> " << result.cost_with_battery << ", final SOC " << result.final_soc << " kWh)." << endl;
    }

    // that's it!
}
