//
//  configuration.cpp
//  BatteryScheduling
//
//  Copyright © 2026 BatteryScheduling contributors. All rights reserved.
//

#include "configuration.hpp"

#include <sstream>

#include "errors.hpp"
#include "auxiliary.hpp"
#include "data_and_parameters.hpp"

using namespace std;

tRunConfiguration::tRunConfiguration()
    : capacity (default_capacity),
      charge_power_limit (default_charge_power_limit),
      discharge_power_limit (default_discharge_power_limit),
      charge_efficiency (default_charge_efficiency),
      discharge_efficiency (default_discharge_efficiency),
      min_soc_fraction (default_min_soc_fraction),
      max_soc_fraction (default_max_soc_fraction),
      initial_soc_fraction (default_initial_soc_fraction),
      step_duration (default_step_duration),
      period_mode (monthly_periods_mode),
      steps_per_period (default_steps_per_period),
      results_directory (default_results_directory) {}

tBatterySpec tRunConfiguration::battery() const {
    return tBatterySpec (capacity, charge_power_limit, discharge_power_limit,
                         charge_efficiency, discharge_efficiency,
                         min_soc_fraction, max_soc_fraction);
}

double tRunConfiguration::initial_soc() const {
    if ((initial_soc_fraction < min_soc_fraction) || (initial_soc_fraction > max_soc_fraction)) {
        stringstream message;
        message << "Initial SOC fraction " << initial_soc_fraction << " lies outside ["
                << min_soc_fraction << ", " << max_soc_fraction << "].";
        throw tConfigurationError (message.str());
    }

    return initial_soc_fraction * capacity;
}

void read_configuration (const char *param_env[], tRunConfiguration &configuration) {
    // battery
    extract_param_double (param_env, "BATTERY_CAPACITY", configuration.capacity);
    extract_param_double (param_env, "CHARGE_POWER_LIMIT", configuration.charge_power_limit);
    extract_param_double (param_env, "DISCHARGE_POWER_LIMIT", configuration.discharge_power_limit);
    extract_param_double (param_env, "CHARGE_EFFICIENCY", configuration.charge_efficiency);
    extract_param_double (param_env, "DISCHARGE_EFFICIENCY", configuration.discharge_efficiency);
    extract_param_double (param_env, "MIN_SOC_FRACTION", configuration.min_soc_fraction);
    extract_param_double (param_env, "MAX_SOC_FRACTION", configuration.max_soc_fraction);
    extract_param_double (param_env, "INITIAL_SOC_FRACTION", configuration.initial_soc_fraction);

    // model
    extract_param_double (param_env, "STEP_DURATION", configuration.step_duration);
    extract_param_double (param_env, "BIG_M", configuration.model_parameters.big_m);

    string coupling;
    if (extract_param_string (param_env, "INDICATOR_COUPLING", coupling)) {
        if (coupling == "as_deployed") configuration.model_parameters.coupling = as_deployed;
        else if (coupling == "exclusive") configuration.model_parameters.coupling = exclusive;
        else throw tConfigurationError ("INDICATOR_COUPLING must be \"as_deployed\" or \"exclusive\", got \"" + coupling + "\".");
    }

    // periods
    string period_mode;
    if (extract_param_string (param_env, "PERIOD_MODE", period_mode)) {
        if (period_mode == "month") configuration.period_mode = monthly_periods_mode;
        else if (period_mode == "steps") configuration.period_mode = fixed_length_periods_mode;
        else throw tConfigurationError ("PERIOD_MODE must be \"month\" or \"steps\", got \"" + period_mode + "\".");
    }
    extract_param_int (param_env, "STEPS_PER_PERIOD", configuration.steps_per_period);

    // solver
    extract_param_double (param_env, "SOLVER_TIME_LIMIT", configuration.solver_settings.time_limit);
    extract_param_int (param_env, "SOLVER_THREADS", configuration.solver_settings.threads);
    extract_param_double (param_env, "SOLVER_MIP_GAP", configuration.solver_settings.mip_gap);

    int console_output = 0;
    if (extract_param_int (param_env, "SOLVER_OUTPUT", console_output))
        configuration.solver_settings.console_output = (console_output != 0);

    // output
    extract_param_string (param_env, "RESULTS_DIRECTORY", configuration.results_directory);
    configuration.solver_settings.failed_model_file = configuration.results_directory + "/error.lp";
}
