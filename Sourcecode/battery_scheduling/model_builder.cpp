//
//  model_builder.cpp
//  BatteryScheduling
//
//  Copyright © 2026 BatteryScheduling contributors. All rights reserved.
//

#include "model_builder.hpp"

#include <cmath>
#include <algorithm>
#include <sstream>

#include "errors.hpp"

using namespace std;

const char *channel_name (int channel) {
    static const char *names[no_of_dispatch_channels] = {
        "soc", "delta_charge", "delta_discharge",
        "grid_charge_energy", "pv_charge_energy",
        "local_discharge_energy", "export_discharge_energy",
        "net_import", "net_export"
    };

    if ((channel < 0) || (channel >= no_of_dispatch_channels))
        return "unknown";
    return names[channel];
}

// smallest big-M that never binds the inactive branch of constraints 2-5: with both indicators off the SOC deltas
// are limited only by M, so M must cover the largest delta a step can produce, not only the SOC range
double minimum_big_m (const tBatterySpec &battery, double step_duration) {
    double max_delta_charge    = battery.charge_power_limit() * step_duration * battery.charge_efficiency();
    double max_delta_discharge = battery.discharge_power_limit() * step_duration / battery.discharge_efficiency();
    return max (battery.max_soc() - battery.min_soc(), max (max_delta_charge, max_delta_discharge));
}

static void check_inputs (const tBatterySpec &battery, double step_duration, double initial_soc, const tModelParameters &parameters) {
    if (!std::isfinite (initial_soc) || !battery.admissible_soc (initial_soc)) {
        stringstream message;
        message << "Initial SOC " << initial_soc << " kWh lies outside [" << battery.min_soc() << ", " << battery.max_soc() << "] kWh.";
        throw tConfigurationError (message.str());
    }

    const double required = minimum_big_m (battery, step_duration);
    if (!std::isfinite (parameters.big_m) || (parameters.big_m <= 0.0) || (parameters.big_m < required)) {
        stringstream message;
        message << "Big-M constant " << parameters.big_m << " must be finite and at least " << required
                << " kWh, the larger of the usable SOC range and the largest SOC change of one step.";
        throw tConfigurationError (message.str());
    }
}

tDispatchModel build_dispatch_model (const tBatterySpec &battery, const tPeriodWindow &window,
                                     double initial_soc, const tModelParameters &parameters) {
    check_inputs (battery, window.step_duration(), initial_soc, parameters);

    const int    no_of_steps = window.no_of_steps();
    const double dt = window.step_duration();
    const double M  = parameters.big_m;

    const double max_charge_energy    = battery.charge_power_limit() * dt;
    const double max_discharge_energy = battery.discharge_power_limit() * dt;

    tDispatchModel dm;
    dm.no_of_steps = no_of_steps;
    dm.initial_soc = initial_soc;
    dm.channel_variables.resize (no_of_dispatch_channels, vector<int> (no_of_steps, -1));
    dm.charge_indicator_variables.resize (no_of_steps, -1);
    dm.discharge_indicator_variables.resize (no_of_steps, -1);

    tMilpModel &model = dm.model;

    // set up decision variables
    for (int t = 0; t < no_of_steps; ++t) {
        dm.channel_variables[channel_soc][t]              = model.add_variable (indexed_name ("soc", t), battery.min_soc(), battery.max_soc());
        dm.channel_variables[channel_delta_charge][t]     = model.add_variable (indexed_name ("delta_charge", t), -milp_infinity, milp_infinity);
        dm.channel_variables[channel_delta_discharge][t]  = model.add_variable (indexed_name ("delta_discharge", t), -milp_infinity, milp_infinity);
        dm.channel_variables[channel_grid_charge][t]      = model.add_variable (indexed_name ("grid_charge_energy", t), 0.0, max_charge_energy);
        dm.channel_variables[channel_pv_charge][t]        = model.add_variable (indexed_name ("pv_charge_energy", t), 0.0, max_charge_energy);
        dm.channel_variables[channel_local_discharge][t]  = model.add_variable (indexed_name ("local_discharge_energy", t), -max_discharge_energy, 0.0);
        dm.channel_variables[channel_export_discharge][t] = model.add_variable (indexed_name ("export_discharge_energy", t), -max_discharge_energy, 0.0);
        dm.channel_variables[channel_net_import][t]       = model.add_variable (indexed_name ("net_import", t), -milp_infinity, milp_infinity);
        dm.channel_variables[channel_net_export][t]       = model.add_variable (indexed_name ("net_export", t), -milp_infinity, milp_infinity);

        dm.charge_indicator_variables[t]    = model.add_variable (indexed_name ("charge_indicator", t), 0.0, 1.0, binary_variable);
        dm.discharge_indicator_variables[t] = model.add_variable (indexed_name ("discharge_indicator", t), 0.0, 1.0, binary_variable);
    }

    // set up objective function; net_export <= 0, so the second term is the export revenue as a negative cost
    for (int t = 0; t < no_of_steps; ++t) {
        model.set_objective_coefficient (dm.variable (channel_net_import, t), window.step (t).buy_price);
        model.set_objective_coefficient (dm.variable (channel_net_export, t), window.step (t).sell_price);
    }

    for (int t = 0; t < no_of_steps; ++t) {
        const int soc   = dm.variable (channel_soc, t);
        const int dc    = dm.variable (channel_delta_charge, t);
        const int dd    = dm.variable (channel_delta_discharge, t);
        const int grid  = dm.variable (channel_grid_charge, t);
        const int pv    = dm.variable (channel_pv_charge, t);
        const int local = dm.variable (channel_local_discharge, t);
        const int exprt = dm.variable (channel_export_discharge, t);
        const int net_imp = dm.variable (channel_net_import, t);
        const int net_exp = dm.variable (channel_net_export, t);
        const int ci    = dm.charge_indicator_variables[t];
        const int di    = dm.discharge_indicator_variables[t];

        const double positive_load = window.step (t).positive_load();
        const double negative_load = window.step (t).negative_load();

        vector<tLinearTerm> terms;

        // set up constraints: SOC dynamics (1)
        terms.clear();
        terms.push_back (tLinearTerm (soc, 1.0));
        terms.push_back (tLinearTerm (dc, -1.0));
        terms.push_back (tLinearTerm (dd, -1.0));
        if (t == 0) {
            model.add_constraint (indexed_name ("soc_balance", t), terms, constraint_equal, initial_soc);
        } else {
            terms.push_back (tLinearTerm (dm.variable (channel_soc, t - 1), -1.0));
            model.add_constraint (indexed_name ("soc_balance", t), terms, constraint_equal, 0.0);
        }

        // set up constraints: big-M mode logic (2)-(5)
        if (parameters.coupling == as_deployed) {
            // dc >= -M ci
            terms.clear(); terms.push_back (tLinearTerm (dc, 1.0)); terms.push_back (tLinearTerm (ci, M));
            model.add_constraint (indexed_name ("charge_lower", t), terms, constraint_greater_equal, 0.0);

            // dc <= M (1 - di)
            terms.clear(); terms.push_back (tLinearTerm (dc, 1.0)); terms.push_back (tLinearTerm (di, M));
            model.add_constraint (indexed_name ("charge_upper", t), terms, constraint_less_equal, M);

            // dd <= M di
            terms.clear(); terms.push_back (tLinearTerm (dd, 1.0)); terms.push_back (tLinearTerm (di, -M));
            model.add_constraint (indexed_name ("discharge_upper", t), terms, constraint_less_equal, 0.0);

            // dd >= -M (1 - ci)
            terms.clear(); terms.push_back (tLinearTerm (dd, 1.0)); terms.push_back (tLinearTerm (ci, -M));
            model.add_constraint (indexed_name ("discharge_lower", t), terms, constraint_greater_equal, -M);
        } else {
            // -M ci <= dc <= M ci
            terms.clear(); terms.push_back (tLinearTerm (dc, 1.0)); terms.push_back (tLinearTerm (ci, M));
            model.add_constraint (indexed_name ("charge_lower", t), terms, constraint_greater_equal, 0.0);

            terms.clear(); terms.push_back (tLinearTerm (dc, 1.0)); terms.push_back (tLinearTerm (ci, -M));
            model.add_constraint (indexed_name ("charge_upper", t), terms, constraint_less_equal, 0.0);

            // -M di <= dd <= M di
            terms.clear(); terms.push_back (tLinearTerm (dd, 1.0)); terms.push_back (tLinearTerm (di, -M));
            model.add_constraint (indexed_name ("discharge_upper", t), terms, constraint_less_equal, 0.0);

            terms.clear(); terms.push_back (tLinearTerm (dd, 1.0)); terms.push_back (tLinearTerm (di, M));
            model.add_constraint (indexed_name ("discharge_lower", t), terms, constraint_greater_equal, 0.0);
        }

        // set up constraints: at most one mode per step (6)
        terms.clear(); terms.push_back (tLinearTerm (ci, 1.0)); terms.push_back (tLinearTerm (di, 1.0));
        model.add_constraint (indexed_name ("mode_exclusivity", t), terms, constraint_less_equal, 1.0);

        // set up constraints: conversion losses (7)-(8)
        terms.clear();
        terms.push_back (tLinearTerm (grid, 1.0));
        terms.push_back (tLinearTerm (pv, 1.0));
        terms.push_back (tLinearTerm (dc, -1.0 / battery.charge_efficiency()));
        model.add_constraint (indexed_name ("charge_conversion", t), terms, constraint_equal, 0.0);

        terms.clear();
        terms.push_back (tLinearTerm (local, 1.0));
        terms.push_back (tLinearTerm (exprt, 1.0));
        terms.push_back (tLinearTerm (dd, -battery.discharge_efficiency()));
        model.add_constraint (indexed_name ("discharge_conversion", t), terms, constraint_equal, 0.0);

        // set up constraints: power limits (9)-(10)
        terms.clear(); terms.push_back (tLinearTerm (grid, 1.0)); terms.push_back (tLinearTerm (pv, 1.0));
        model.add_constraint (indexed_name ("charge_power", t), terms, constraint_less_equal, max_charge_energy);

        terms.clear(); terms.push_back (tLinearTerm (local, 1.0)); terms.push_back (tLinearTerm (exprt, 1.0));
        model.add_constraint (indexed_name ("discharge_power", t), terms, constraint_greater_equal, -max_discharge_energy);

        // set up constraints: solar charging only from the local surplus (11), local discharge only up to the deficit (12)
        terms.clear(); terms.push_back (tLinearTerm (pv, 1.0));
        model.add_constraint (indexed_name ("pv_surplus", t), terms, constraint_less_equal, -negative_load);

        terms.clear(); terms.push_back (tLinearTerm (local, 1.0));
        model.add_constraint (indexed_name ("local_deficit", t), terms, constraint_greater_equal, -positive_load);

        // set up constraints: grid exchange (13)-(14)
        terms.clear();
        terms.push_back (tLinearTerm (net_imp, 1.0));
        terms.push_back (tLinearTerm (grid, -1.0));
        terms.push_back (tLinearTerm (local, -1.0));
        model.add_constraint (indexed_name ("import_balance", t), terms, constraint_equal, positive_load);

        terms.clear();
        terms.push_back (tLinearTerm (net_exp, 1.0));
        terms.push_back (tLinearTerm (pv, -1.0));
        terms.push_back (tLinearTerm (exprt, -1.0));
        model.add_constraint (indexed_name ("export_balance", t), terms, constraint_equal, negative_load);
    }

    // that's it!
    return dm;
}
