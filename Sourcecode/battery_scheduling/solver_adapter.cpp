//
//  solver_adapter.cpp
//  BatteryScheduling
//
//  Copyright © 2026 BatteryScheduling contributors. All rights reserved.
//

#include "solver_adapter.hpp"

#include "errors.hpp"

using namespace std;

const char *status_name (tSolveStatus status) {
    switch (status) {
        case solve_status_optimal:      return "optimal";
        case solve_status_infeasible:   return "infeasible";
        case solve_status_time_limit:   return "time limit reached";
        case solve_status_unavailable:  return "solver unavailable";
        case solve_status_error:        return "solver error";
    }
    return "unknown";
}

void check_solve_status (tSolveStatus status, const string &context) {
    string message = context + ": " + status_name (status) + ".";

    switch (status) {
        case solve_status_optimal:      return;
        case solve_status_infeasible:   throw tInfeasibleModelError (message);
        case solve_status_time_limit:   throw tSolverTimeoutError (message);
        case solve_status_unavailable:  throw tSolverUnavailableError (message);
        case solve_status_error:        throw tSolverError (message);
    }
    throw tSolverError (message);
}
