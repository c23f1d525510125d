//
//  main.cpp
//  BatteryScheduling
//
//  Copyright © 2026 BatteryScheduling contributors. All rights reserved.
//

#include <memory>
#include <vector>
#include <sstream>
#include <iostream>

#include "gurobi_c++.h"

#include "errors.hpp"
#include "results.hpp"
#include "auxiliary.hpp"
#include "configuration.hpp"
#include "gurobi_solver.hpp"
#include "input_data_io.hpp"
#include "rolling_horizon.hpp"

using namespace std;

static void report_run (const tHorizonRun &run) {
    cout << "*** " << run.no_of_periods() << " PERIODS, " << run.no_of_steps() << " STEPS ***" << endl;
    cout << "Cost without battery: " << run.total_cost_without_battery() << endl;
    cout << "Cost with battery:    " << run.total_cost_with_battery() << endl;
    cout << "Money saved:          " << run.money_saved() << endl;

    if (run.total_cost_without_battery() != 0.0)
        cout << "Score:                " << run.score_percent() << " %" << endl;
    else
        cout << "Score:                undefined (no cost without battery)" << endl;
}

int main (int argc, const char *argv[], const char *param_env[]) {
    tic();

    // read input file name
    if (argc != 2)
        error ("main", "Expected single command line argument with the time series file.");

    // read configuration
    tRunConfiguration configuration;
    tHorizonRun run;
    stringstream filename;
    int curr_period = 0;

    try {
        read_configuration (param_env, configuration);

        tBatterySpec battery = configuration.battery();
        double initial_soc = configuration.initial_soc();

        // read out results file; terminate if we are done
        filename << configuration.results_directory << "/results.txt";
        curr_period = run.read (filename.str().c_str());

        // read & verify data
        shared_ptr<const tTimeSeries> series (new tTimeSeries (read_data (argv[1], configuration.step_duration)));

        vector<tPeriodBoundary> periods = (configuration.period_mode == monthly_periods_mode)
                                              ? monthly_periods (*series)
                                              : fixed_length_periods (*series, configuration.steps_per_period);

        if (curr_period == (int)periods.size()) {
            cout << "Entire horizon calculated -- nothing left to do!" << endl;
            report_run (run);
            return 0;
        }
        if (curr_period > 0)
            cout << "Resuming with period " << curr_period << " at SOC " << run.final_soc (initial_soc) << " kWh." << endl;

        // run the model
        tGurobiSolver solver (configuration.solver_settings);
        run_rolling_horizon (battery, series, periods, initial_soc, configuration.model_parameters, solver, run, &cout);
    } catch (const tSchedulingError &e) {
        // keep what has been completed so that the run can be resumed; an unreadable record file is left alone
        if (run.no_of_periods() > curr_period) {
            cout << "writing " << run.no_of_periods() << " completed periods to \"" << filename.str().c_str() << "\"." << endl;
            run.write (filename.str().c_str());
        }
        error ("main", e.what());
    } catch (const GRBException &e) {
        error ("main", e.getMessage().c_str());
    }

    // write results files
    cout << "writing to \"" << filename.str().c_str() << "\"." << endl;
    run.write (filename.str().c_str());
    run.write_tables (configuration.results_directory.c_str());

    report_run (run);

    // that's it!
    cout << "*** OVERALL TIME: " << toc() << " SECONDS. ***" << endl;
    return 0;
}
