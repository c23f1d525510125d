//
//  rolling_horizon.hpp
//  BatteryScheduling
//
//  Copyright © 2026 BatteryScheduling contributors. All rights reserved.
//

#ifndef rolling_horizon_hpp
#define rolling_horizon_hpp

#include <memory>
#include <vector>
#include <ostream>

#include "results.hpp"
#include "battery_spec.hpp"
#include "time_series.hpp"
#include "model_builder.hpp"
#include "solver_adapter.hpp"
#include "result_extractor.hpp"

// build, solve and extract one period
tOptimizationResult optimize_period (const tBatterySpec &battery, const tPeriodWindow &window, double initial_soc,
                                     const tModelParameters &parameters, tMilpSolver &solver);

// throws tConfigurationError unless the boundaries are increasing, contiguous and inside the series
void verify_periods (const tTimeSeries &series, const std::vector<tPeriodBoundary> &periods);

// optimizes the periods in chronological order, starting period p from the final SOC of period p - 1;
// every completed period is appended to 'run' before the next one starts, so if a period throws,
// the results of all earlier periods stay in 'run'. If 'run' already holds k periods (e.g., read back
// from a record file), the run continues with period k from their final SOC and initial_soc is ignored.
void run_rolling_horizon (const tBatterySpec &battery, std::shared_ptr<const tTimeSeries> series,
                          const std::vector<tPeriodBoundary> &periods, double initial_soc,
                          const tModelParameters &parameters, tMilpSolver &solver,
                          tHorizonRun &run, std::ostream *log = nullptr);

#endif /* rolling_horizon_hpp */
