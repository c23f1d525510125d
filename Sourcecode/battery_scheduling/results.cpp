//
//  results.cpp
//  BatteryScheduling
//
//  Copyright © 2026 BatteryScheduling contributors. All rights reserved.
//

#include "results.hpp"

#include <cmath>
#include <limits>
#include <fstream>
#include <iomanip>
#include <sstream>

#include "errors.hpp"
#include "auxiliary.hpp"
#include "data_and_parameters.hpp"

using namespace std;

tHorizonRun::tHorizonRun() : cost_without_battery (0.0), cost_with_battery (0.0) {}

void tHorizonRun::append (const tOptimizationResult &result) {
    if (!period_results.empty()) {
        const tOptimizationResult &last = period_results.back();

        if (result.initial_soc != last.final_soc) {
            stringstream message;
            message << "Period " << period_results.size() << " starts at SOC " << result.initial_soc
                    << " kWh, the previous period ended at " << last.final_soc << " kWh.";
            throw tConfigurationError (message.str());
        }
        if (result.boundary.begin != last.boundary.end) {
            stringstream message;
            message << "Period " << period_results.size() << " starts at step " << result.boundary.begin
                    << ", the previous period ended at step " << last.boundary.end << ".";
            throw tConfigurationError (message.str());
        }
    }

    period_results.push_back (result);
    cost_without_battery += result.cost_without_battery;
    cost_with_battery += result.cost_with_battery;
}

int tHorizonRun::no_of_steps() const {
    int no_of_steps = 0;
    for (size_t p = 0; p < period_results.size(); ++p)
        no_of_steps += period_results[p].no_of_steps();

    return no_of_steps;
}

vector<time_t> tHorizonRun::timestamps() const {
    vector<time_t> series;
    for (size_t p = 0; p < period_results.size(); ++p)
        series.insert (series.end(), period_results[p].timestamps.begin(), period_results[p].timestamps.end());

    return series;
}

vector<double> tHorizonRun::channel (int channel) const {
    vector<double> series;
    for (size_t p = 0; p < period_results.size(); ++p)
        series.insert (series.end(), period_results[p].channels[channel].begin(), period_results[p].channels[channel].end());

    return series;
}

vector<int> tHorizonRun::charge_indicator() const {
    vector<int> series;
    for (size_t p = 0; p < period_results.size(); ++p)
        series.insert (series.end(), period_results[p].charge_indicator.begin(), period_results[p].charge_indicator.end());

    return series;
}

vector<int> tHorizonRun::discharge_indicator() const {
    vector<int> series;
    for (size_t p = 0; p < period_results.size(); ++p)
        series.insert (series.end(), period_results[p].discharge_indicator.begin(), period_results[p].discharge_indicator.end());

    return series;
}

double tHorizonRun::score_percent() const {
    return ::score_percent (cost_without_battery, cost_with_battery);
}

double tHorizonRun::money_saved() const {
    return ::money_saved (cost_without_battery, cost_with_battery);
}

double tHorizonRun::final_soc (double initial_soc) const {
    return period_results.empty() ? initial_soc : period_results.back().final_soc;
}

static void read_period (ifstream &fin, tOptimizationResult &result) {
    int no_of_steps;
    fin >> result.boundary.begin >> no_of_steps;
    if (!fin || (no_of_steps < 0))
        throw tDataGapError ("tHorizonRun::read: expected first step and number of steps.");
    result.boundary.end = result.boundary.begin + no_of_steps;

    fin >> result.initial_soc;
    fin >> result.objective_value >> result.cost_without_battery >> result.cost_with_battery >> result.solve_time;

    result.timestamps.resize (no_of_steps);
    for (int c = 0; c < no_of_dispatch_channels; ++c)
        result.channels[c].resize (no_of_steps);
    result.charge_indicator.resize (no_of_steps);
    result.discharge_indicator.resize (no_of_steps);

    for (int t = 0; t < no_of_steps; ++t) {
        long long timestamp;
        fin >> timestamp;
        result.timestamps[t] = (time_t)timestamp;

        for (int c = 0; c < no_of_dispatch_channels; ++c)
            fin >> result.channels[c][t];

        fin >> result.charge_indicator[t] >> result.discharge_indicator[t];
    }

    // every record ends with a line break; a final SOC that runs into the end of the file may have lost digits
    fin >> result.final_soc;
    if (!fin || fin.eof())
        throw tDataGapError ("tHorizonRun::read: period record truncated.");
}

void tHorizonRun::clear() {
    period_results.clear();
    cost_without_battery = 0.0;
    cost_with_battery = 0.0;
}

int tHorizonRun::read (const char *filename) {
    clear();

    ifstream fin (filename);
    if (!fin.is_open())
        return 0;

    // all or nothing: a record that cannot be read completely leaves the run empty
    try {
        for (;;) {
            int p;
            if (!(fin >> p)) {
                if (fin.eof()) break;
                throw tDataGapError ("tHorizonRun::read: expected to read number of period.");
            }
            if (p != no_of_periods()) throw tDataGapError ("tHorizonRun::read: expected to read number of period.");

            tOptimizationResult result;
            read_period (fin, result);
            append (result);
        }
    } catch (const tSchedulingError &) {
        clear();
        throw;
    }

    return no_of_periods();
}

void tHorizonRun::write (const char *filename) const {
    ofstream fout (filename);
    fout << setprecision (numeric_limits<double>::digits10 + 2);

    for (int p = 0; p < no_of_periods(); ++p) {
        const tOptimizationResult &result = period_results[p];

        fout << p << endl;
        fout << "\t" << result.boundary.begin << " " << result.no_of_steps() << endl;
        fout << "\t" << result.initial_soc << endl;
        fout << "\t" << result.objective_value << " " << result.cost_without_battery << " "
             << result.cost_with_battery << " " << result.solve_time << endl;

        for (int t = 0; t < result.no_of_steps(); ++t) {
            fout << "\t\t" << (long long)result.timestamps[t] << "\t";
            for (int c = 0; c < no_of_dispatch_channels; ++c)
                fout << result.channels[c][t] << " ";
            fout << "\t" << result.charge_indicator[t] << " " << result.discharge_indicator[t] << endl;
        }

        fout << "\t" << result.final_soc << endl;
        fout << endl;
    }
}

void tHorizonRun::write_tables (const char *directory) const {
    /*
     ******************************************************************************************************************************
     dispatch.csv         -- rows = steps, columns = timestamp, channels, indicators
     ******************************************************************************************************************************
     */

    {
        stringstream filename;
        filename << directory << "/dispatch.csv";
        ofstream fout (filename.str().c_str());

        fout << "Timestamp";
        for (int c = 0; c < no_of_dispatch_channels; ++c)
            fout << ", " << channel_name (c);
        fout << ", charge_indicator, discharge_indicator" << endl;

        for (int p = 0; p < no_of_periods(); ++p)
            for (int t = 0; t < period_results[p].no_of_steps(); ++t) {
                fout << format_timestamp (period_results[p].timestamps[t]);
                for (int c = 0; c < no_of_dispatch_channels; ++c)
                    fout << ", " << period_results[p].channels[c][t];
                fout << ", " << period_results[p].charge_indicator[t]
                     << ", " << period_results[p].discharge_indicator[t] << endl;
            }
    }

    /*
     ******************************************************************************************************************************
     periods.csv          -- rows = periods, columns = SOCs, costs, score, savings, solve time
     ******************************************************************************************************************************
     */

    {
        stringstream filename;
        filename << directory << "/periods.csv";
        ofstream fout (filename.str().c_str());

        fout << "Period #, First timestamp, Initial SOC, Final SOC, Cost without battery, Cost with battery, Score (%), Money saved, Solve time (s)" << endl;

        for (int p = 0; p < no_of_periods(); ++p) {
            const tOptimizationResult &result = period_results[p];

            fout << p << ", "
                 << (result.timestamps.empty() ? string ("") : format_timestamp (result.timestamps.front())) << ", "
                 << result.initial_soc << ", "
                 << result.final_soc << ", "
                 << result.cost_without_battery << ", "
                 << result.cost_with_battery << ", ";

            // a period without baseline cost has no score; leave the cell empty
            if (result.cost_without_battery != 0.0)
                fout << result.score_percent();
            fout << ", " << result.money_saved() << ", " << result.solve_time << endl;
        }
    }

    /*
     ******************************************************************************************************************************
     cumulative_costs.csv -- rows = periods, columns = cumulative costs without and with battery, cumulative score
     ******************************************************************************************************************************
     */

    {
        stringstream filename;
        filename << directory << "/cumulative_costs.csv";
        ofstream fout (filename.str().c_str());

        fout << "Period #, Last timestamp, Cumulative cost without battery, Cumulative cost with battery, Cumulative score (%)" << endl;

        double cum_without = 0.0, cum_with = 0.0;
        for (int p = 0; p < no_of_periods(); ++p) {
            const tOptimizationResult &result = period_results[p];
            cum_without += result.cost_without_battery;
            cum_with += result.cost_with_battery;

            fout << p << ", "
                 << (result.timestamps.empty() ? string ("") : format_timestamp (result.timestamps.back())) << ", "
                 << cum_without << ", " << cum_with << ", ";
            if (cum_without != 0.0)
                fout << ::score_percent (cum_without, cum_with);
            fout << endl;
        }
    }
}
