//
//  configuration.hpp
//  BatteryScheduling
//
//  Copyright © 2026 BatteryScheduling contributors. All rights reserved.
//

#ifndef configuration_hpp
#define configuration_hpp

#include <string>

#include "battery_spec.hpp"
#include "model_builder.hpp"
#include "solver_adapter.hpp"

enum tPeriodMode { monthly_periods_mode, fixed_length_periods_mode };

// everything a run needs besides the time series; starts from the defaults in data_and_parameters.hpp
struct tRunConfiguration {
    double capacity;
    double charge_power_limit;
    double discharge_power_limit;
    double charge_efficiency;
    double discharge_efficiency;
    double min_soc_fraction;
    double max_soc_fraction;
    double initial_soc_fraction;

    double step_duration;
    tModelParameters model_parameters;

    tPeriodMode period_mode;
    int steps_per_period;

    tSolverSettings solver_settings;

    std::string results_directory;

    tRunConfiguration();

    // throws tConfigurationError
    tBatterySpec battery() const;
    double initial_soc() const;
};

// overrides the defaults with NAME=value entries of the environment;
// throws tConfigurationError for unknown INDICATOR_COUPLING or PERIOD_MODE values
void read_configuration (const char *param_env[], tRunConfiguration &configuration);

#endif /* configuration_hpp */
