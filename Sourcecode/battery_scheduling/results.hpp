//
//  results.hpp
//  BatteryScheduling
//
//  Copyright © 2026 BatteryScheduling contributors. All rights reserved.
//

#ifndef results_hpp
#define results_hpp

#include <ctime>
#include <vector>

#include "result_extractor.hpp"

/*
   *******************************
   *** FILE FORMAT FOR RESULTS ***
   *******************************

   for each period:

   1) period # (first period starts with 0), first step #, number of steps

   2) initial SOC

   3) optimal objective value, cost without battery, cost with battery, solve time

   4) for each step of the period:

       4)a) timestamp (seconds since the epoch)
       4)b) the nine dispatch channels in channel order
       4)c) charge indicator, discharge indicator

   5) final SOC
*/

// data structure for all periods of a run, chained by their SOC
class tHorizonRun {
public:
    tHorizonRun();

    // throws tConfigurationError if the result does not start where the last one ended
    void append (const tOptimizationResult &result);

    int no_of_periods() const { return (int)period_results.size(); }
    const tOptimizationResult &period (int p) const { return period_results[p]; }
    const std::vector<tOptimizationResult> &periods() const { return period_results; }

    int no_of_steps() const;

    // horizon-long series, concatenated over all periods
    std::vector<std::time_t> timestamps() const;
    std::vector<double> channel (int channel) const;
    std::vector<int> charge_indicator() const;
    std::vector<int> discharge_indicator() const;

    double total_cost_without_battery() const { return cost_without_battery; }
    double total_cost_with_battery() const { return cost_with_battery; }

    // derived from the cumulative costs, not from the per-period scores
    double score_percent() const;
    double money_saved() const;

    // SOC after the last completed period; the given SOC if there is none
    double final_soc (double initial_soc) const;

    void clear();

    // record file: one block per period; read() returns the number of periods read, i.e., the period
    // that should be solved next. It throws tDataGapError if the file is malformed or truncated and
    // tConfigurationError if its periods do not chain; in both cases the run is left empty
    int read (const char *filename);
    void write (const char *filename) const;

    // dispatch.csv         -- rows = steps, columns = timestamp, channels, indicators
    // periods.csv          -- rows = periods, columns = SOCs, costs, score, savings, solve time
    // cumulative_costs.csv -- rows = periods, columns = cumulative costs without and with battery, cumulative score
    void write_tables (const char *directory) const;

private:
    std::vector<tOptimizationResult> period_results;
    double cost_without_battery;
    double cost_with_battery;
};

#endif /* results_hpp */
