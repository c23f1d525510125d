//
//  auxiliary.cpp
//  BatteryScheduling
//
//  Copyright © 2026 BatteryScheduling contributors. All rights reserved.
//

#include "auxiliary.hpp"

#include <stack>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>

using namespace std;
using namespace chrono;

int month_of_timestamp (time_t timestamp) {
    struct tm utc;
    gmtime_r (&timestamp, &utc);
    return 12 * (utc.tm_year + 1900) + utc.tm_mon;
}

bool parse_timestamp (const string &text, time_t &timestamp) {
    struct tm utc;
    memset (&utc, 0, sizeof (utc));

    int year, month, day, hour, minute, second = 0;
    int no_of_fields = sscanf (text.c_str(), "%d-%d-%d %d:%d:%d", &year, &month, &day, &hour, &minute, &second);
    if (no_of_fields < 5) {
        // plain epoch seconds
        char *end = nullptr;
        long long value = strtoll (text.c_str(), &end, 10);
        if ((end == text.c_str()) || (*end != '\0'))
            return false;
        timestamp = (time_t)value;
        return true;
    }

    utc.tm_year = year - 1900;
    utc.tm_mon  = month - 1;
    utc.tm_mday = day;
    utc.tm_hour = hour;
    utc.tm_min  = minute;
    utc.tm_sec  = second;
    timestamp = timegm (&utc);
    return true;
}

string format_timestamp (time_t timestamp) {
    struct tm utc;
    gmtime_r (&timestamp, &utc);

    char buffer[32];
    strftime (buffer, sizeof (buffer), "%Y-%m-%d %H:%M:%S", &utc);
    return string (buffer);
}

// error messaging
void error (const char *method, const char *message) {
    cerr << endl;
    cerr << "Error [" << method << "]: " << message << endl;
    cerr << "Program aborted." << endl;
    exit (1);
}

// time measurement
stack<time_point<steady_clock> > recorded_times;

void tic() {
    time_point<steady_clock> current_time = steady_clock::now();
    recorded_times.push (current_time);
}

double toc() {
    time_point<steady_clock> last_time = recorded_times.top();
    recorded_times.pop();
    return ((duration<double>)(steady_clock::now() - last_time)).count();
}

// methods for reading in parameters from the environment
// only an exact "NAME=" prefix matches, so BIG_M does not pick up BIG_M_SCALE
static bool find_param (const char *param_env[], const char *param_name, string &raw_value) {
    if (param_env == nullptr)
        return false;

    string prefix = string (param_name) + "=";
    for (int i = 0; param_env[i] != nullptr; ++i) {
        string str = param_env[i];

        if (str.compare (0, prefix.size(), prefix) == 0) {
            raw_value = str.substr (prefix.size());
            return true;
        }
    }

    return false;
}

bool extract_param_int (const char *param_env[], const char *param_name, int &param_value) {
    string raw_value;
    if (!find_param (param_env, param_name, raw_value))
        return false;

    param_value = atoi (raw_value.c_str());
    cout << "PARAMETER SETTING: " << param_name << " = " << param_value << ";" << endl;
    return true;
}

bool extract_param_double (const char *param_env[], const char *param_name, double &param_value) {
    string raw_value;
    if (!find_param (param_env, param_name, raw_value))
        return false;

    param_value = atof (raw_value.c_str());
    cout << "PARAMETER SETTING: " << param_name << " = " << param_value << ";" << endl;
    return true;
}

bool extract_param_string (const char *param_env[], const char *param_name, string &param_value) {
    string raw_value;
    if (!find_param (param_env, param_name, raw_value))
        return false;

    param_value = raw_value;
    cout << "PARAMETER SETTING: " << param_name << " = " << param_value << ";" << endl;
    return true;
}
