//
//  auxiliary.hpp
//  BatteryScheduling
//
//  Copyright © 2026 BatteryScheduling contributors. All rights reserved.
//

#ifndef auxiliary_hpp
#define auxiliary_hpp

#include <cmath>
#include <ctime>
#include <string>

// *** TIME CONVERSION METHODS ***
// all timestamps are UTC seconds since the epoch
inline double seconds_to_hours (double s) { return s / 3600.0; }
inline double hours_to_seconds (double h) { return h * 3600.0; }

// consecutive number of the calendar month of a timestamp, i.e., 12 * year + month
int month_of_timestamp (std::time_t timestamp);

// "YYYY-MM-DD HH:MM[:SS]" or plain epoch seconds; returns false if the text is neither
bool parse_timestamp (const std::string &text, std::time_t &timestamp);
std::string format_timestamp (std::time_t timestamp);

inline bool approx_equal (double a, double b, double tolerance = 0.000001) { return (std::fabs (a - b) < tolerance); }

// error messaging -- only for the top level of the program, terminates the process
void error (const char *method, const char *message);

// time measurement
// both functions can be called in a nested manner: tic(); tic(); toc(); toc();
void tic();
double toc();

// methods for reading in parameters from the environment (NAME=value)
bool extract_param_int (const char *param_env[], const char *param_name, int &param_value);
bool extract_param_double (const char *param_env[], const char *param_name, double &param_value);
bool extract_param_string (const char *param_env[], const char *param_name, std::string &param_value);

#endif /* auxiliary_hpp */
