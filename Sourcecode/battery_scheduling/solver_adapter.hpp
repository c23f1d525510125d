//
//  solver_adapter.hpp
//  BatteryScheduling
//
//  Copyright © 2026 BatteryScheduling contributors. All rights reserved.
//

#ifndef solver_adapter_hpp
#define solver_adapter_hpp

#include <string>
#include <vector>

#include "milp_model.hpp"
#include "data_and_parameters.hpp"

enum tSolveStatus {
    solve_status_optimal,
    solve_status_infeasible,            // includes "infeasible or unbounded"
    solve_status_time_limit,
    solve_status_unavailable,
    solve_status_error
};

const char *status_name (tSolveStatus status);

// throws the error kind that belongs to a non-optimal status; 'context' prefixes the message
void check_solve_status (tSolveStatus status, const std::string &context);

struct tSolverSolution {
    tSolveStatus status;
    std::vector<double> values;         // [model.no_of_variables()]
    double objective_value;
    double solve_time;                  // wall-clock seconds, reported only

    tSolverSolution() : status (solve_status_error), objective_value (0.0), solve_time (0.0) {}
};

struct tSolverSettings {
    double time_limit;                  // in seconds, 0 = no limit
    int threads;
    double mip_gap;
    bool console_output;
    std::string failed_model_file;      // written on failure if not empty

    tSolverSettings() : time_limit (default_solver_time_limit), threads (default_solver_threads),
                        mip_gap (default_solver_mip_gap), console_output (false) {}
};

// narrow interface to an external MILP solver; solve() either returns an optimal solution or throws
// tSolverUnavailableError, tInfeasibleModelError, tSolverTimeoutError or tSolverError
class tMilpSolver {
public:
    virtual ~tMilpSolver() {}

    virtual tSolverSolution solve (const tMilpModel &model) = 0;
};

#endif /* solver_adapter_hpp */
