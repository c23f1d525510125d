//
//  data_and_parameters.hpp
//  BatteryScheduling
//
//  Copyright © 2026 BatteryScheduling contributors. All rights reserved.
//

#ifndef data_and_parameters_hpp
#define data_and_parameters_hpp

#include <string>

// *** DIRECTORY MANAGEMENT ***
const std::string   default_results_directory = ".";

// *** BATTERY DEFAULTS ***
const double        default_capacity               = 13.5;     // in kWh
const double        default_charge_power_limit     = 5.0;      // in kW
const double        default_discharge_power_limit  = 5.0;      // in kW
const double        default_charge_efficiency      = 0.95;
const double        default_discharge_efficiency   = 0.95;
const double        default_min_soc_fraction       = 0.1;
const double        default_max_soc_fraction       = 0.97;

// SOC at the beginning of the first period, as a fraction of the capacity
const double        default_initial_soc_fraction   = 0.5;

// *** MODEL PARAMETERS ***
const double        default_step_duration = 0.5;                // in hours

// big-M of the charge/discharge mode constraints; must exceed any SOC change within one step
const double        default_big_m = 10000.0;

const int           default_steps_per_period = 48 * 30;

// *** SOLVER PARAMETERS ***
const double        default_solver_time_limit = 0.0;            // in seconds, 0 = no limit
const int           default_solver_threads    = 4;
const double        default_solver_mip_gap    = 1e-6;

// tolerance used when verifying solutions returned by the solver
const double        feasibility_tolerance = 1e-6;

#endif /* data_and_parameters_hpp */
