//
//  input_data_io.cpp
//  BatteryScheduling
//
//  Copyright © 2026 BatteryScheduling contributors. All rights reserved.
//

#include "input_data_io.hpp"

#include <limits>
#include <vector>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <iostream>

#include "errors.hpp"
#include "auxiliary.hpp"

using namespace std;

const int no_of_columns = 5;

static string trim (const string &str) {
    size_t first = str.find_first_not_of (" \t\r\"");
    if (first == string::npos)
        return string();
    size_t last = str.find_last_not_of (" \t\r\"");
    return str.substr (first, last - first + 1);
}

static double parse_value (const string &field) {
    string text = trim (field);
    if (text.empty())
        return numeric_limits<double>::quiet_NaN();

    char *end = nullptr;
    double value = strtod (text.c_str(), &end);
    if (*end != '\0')
        return numeric_limits<double>::quiet_NaN();

    return value;
}

tTimeSeries read_series (istream &fin, double step_duration) {
    tTimeSeries series (step_duration);

    string line;
    int line_no = 0;
    bool header_seen = false;

    while (getline (fin, line)) {
        ++line_no;
        if (trim (line).empty())
            continue;

        vector<string> fields;
        stringstream str (line);
        string field;
        while (getline (str, field, ','))
            fields.push_back (field);

        // the header is the first non-empty line
        if (!header_seen) {
            header_seen = true;
            if (trim (fields[0]) == "timestamp")
                continue;
        }

        if ((int)fields.size() < no_of_columns)
            fields.resize (no_of_columns);

        tTimestep step;
        if (!parse_timestamp (trim (fields[0]), step.timestamp)) {
            stringstream message;
            message << "Line " << line_no << ": unreadable timestamp \"" << trim (fields[0]) << "\".";
            throw tDataGapError (message.str());
        }

        step.demand     = parse_value (fields[1]);
        step.generation = parse_value (fields[2]);
        step.buy_price  = parse_value (fields[3]);
        step.sell_price = parse_value (fields[4]);

        series.steps.push_back (step);
    }

    return series;
}

tTimeSeries read_series (const char *filename, double step_duration) {
    ifstream fin (filename);
    if (!fin.is_open()) {
        stringstream message;
        message << "Could not open input file \"" << filename << "\".";
        throw tConfigurationError (message.str());
    }

    return read_series (fin, step_duration);
}

tTimeSeries read_data (const char *filename, double step_duration) {
    tic();
    cout << "Reading time series from \"" << filename << "\"..." << flush;
    tTimeSeries series = read_series (filename, step_duration);
    cout << "done: " << toc() << " seconds." << endl;

    tic();
    cout << "Verifying " << series.steps.size() << " timesteps..." << flush;
    verify_series (series);
    cout << "done: " << toc() << " seconds." << endl;

    return series;
}
