//
//  input_data_io.hpp
//  BatteryScheduling
//
//  Copyright © 2026 BatteryScheduling contributors. All rights reserved.
//

#ifndef input_data_io_hpp
#define input_data_io_hpp

#include <istream>

#include "time_series.hpp"

// read the input data: CSV with header "timestamp,demand,generation,buy_price,sell_price";
// empty or unreadable values are kept as NaN so that verify_series() reports them as gaps
tTimeSeries read_series (std::istream &fin, double step_duration);
tTimeSeries read_series (const char *filename, double step_duration);

// read and conduct the sensibility checks of verify_series() on the data
tTimeSeries read_data (const char *filename, double step_duration);

#endif /* input_data_io_hpp */
