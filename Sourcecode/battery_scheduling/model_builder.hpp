//
//  model_builder.hpp
//  BatteryScheduling
//
//  Copyright © 2026 BatteryScheduling contributors. All rights reserved.
//

#ifndef model_builder_hpp
#define model_builder_hpp

#include <vector>

#include "milp_model.hpp"
#include "battery_spec.hpp"
#include "time_series.hpp"
#include "data_and_parameters.hpp"

// the nine continuous decision channels, in the order used throughout the results
enum tDispatchChannel {
    channel_soc = 0,
    channel_delta_charge,
    channel_delta_discharge,
    channel_grid_charge,
    channel_pv_charge,
    channel_local_discharge,
    channel_export_discharge,
    channel_net_import,
    channel_net_export,
    no_of_dispatch_channels
};

const char *channel_name (int channel);

// how the binary mode indicators bound the SOC deltas
//  as_deployed: charge_indicator bounds delta_discharge and discharge_indicator bounds delta_charge
//               (constraints 2-5 exactly as in the production model)
//  exclusive:   each indicator forces its own delta to zero when it is not set
enum tIndicatorCoupling { as_deployed, exclusive };

struct tModelParameters {
    double big_m;
    tIndicatorCoupling coupling;

    tModelParameters() : big_m (default_big_m), coupling (as_deployed) {}
    tModelParameters (double big_m, tIndicatorCoupling coupling) : big_m (big_m), coupling (coupling) {}
};

// the model of one period together with the variable index of every channel and step
struct tDispatchModel {
    tMilpModel model;
    int no_of_steps;
    double initial_soc;

    std::vector<std::vector<int> > channel_variables;       // [no_of_dispatch_channels][no_of_steps]
    std::vector<int> charge_indicator_variables;            // [no_of_steps]
    std::vector<int> discharge_indicator_variables;         // [no_of_steps]

    int variable (int channel, int t) const { return channel_variables[channel][t]; }
};

// max (SOC range, charge_power_limit * dt * charge_efficiency, discharge_power_limit * dt / discharge_efficiency)
double minimum_big_m (const tBatterySpec &battery, double step_duration);

// pure function of its arguments; throws tConfigurationError if initial_soc lies outside the SOC bounds
// or if big_m is below minimum_big_m()
tDispatchModel build_dispatch_model (const tBatterySpec &battery, const tPeriodWindow &window,
                                     double initial_soc, const tModelParameters &parameters);

#endif /* model_builder_hpp */
