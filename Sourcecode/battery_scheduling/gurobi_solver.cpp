//
//  gurobi_solver.cpp
//  BatteryScheduling
//
//  Copyright © 2026 BatteryScheduling contributors. All rights reserved.
//

#include "gurobi_solver.hpp"

#include <chrono>
#include <cmath>
#include <sstream>

#include "gurobi_c++.h"

#include "errors.hpp"

using namespace std;
using namespace chrono;

static double to_grb_bound (double bound) {
    if (bound == milp_infinity) return GRB_INFINITY;
    if (bound == -milp_infinity) return -GRB_INFINITY;
    return bound;
}

static char to_grb_sense (tConstraintSense sense) {
    switch (sense) {
        case constraint_less_equal:    return GRB_LESS_EQUAL;
        case constraint_greater_equal: return GRB_GREATER_EQUAL;
        case constraint_equal:         return GRB_EQUAL;
    }
    return GRB_EQUAL;
}

static tSolveStatus from_grb_status (int status) {
    switch (status) {
        case GRB_OPTIMAL:       return solve_status_optimal;
        case GRB_INFEASIBLE:
        case GRB_INF_OR_UNBD:   return solve_status_infeasible;
        case GRB_TIME_LIMIT:    return solve_status_time_limit;
        default:                return solve_status_error;
    }
}

static string describe (const GRBException &e) {
    stringstream str;
    str << "Gurobi error " << e.getErrorCode() << ": " << e.getMessage();
    return str.str();
}

tGurobiSolver::tGurobiSolver (const tSolverSettings &settings) : settings_ (settings) {}

tGurobiSolver::~tGurobiSolver() {}

GRBEnv &tGurobiSolver::environment() {
    if (!env_) {
        try {
            unique_ptr<GRBEnv> env (new GRBEnv (true));
            env->set (GRB_IntParam_OutputFlag, settings_.console_output ? 1 : 0);
            env->start();
            env_ = std::move (env);
        } catch (const GRBException &e) {
            throw tSolverUnavailableError ("Could not start the Gurobi environment. " + describe (e));
        }
    }

    return *env_;
}

tSolverSolution tGurobiSolver::solve (const tMilpModel &milp) {
    GRBEnv &env = environment();

    tSolverSolution solution;

    try {
        // set up model
        GRBModel model = GRBModel (env);

        model.set (GRB_IntParam_Threads, settings_.threads);
        model.set (GRB_DoubleParam_MIPGap, settings_.mip_gap);
        // keep the big-M mode constraints tight (a binary at 1e-5 would release M * 1e-5 kWh) and the balances exact
        model.set (GRB_DoubleParam_IntFeasTol, 1e-9);
        model.set (GRB_DoubleParam_FeasibilityTol, 1e-9);
        if (settings_.time_limit > 0.0)
            model.set (GRB_DoubleParam_TimeLimit, settings_.time_limit);

        // set up decision variables
        vector<GRBVar> vars;
        vars.reserve (milp.no_of_variables());
        for (int i = 0; i < milp.no_of_variables(); ++i) {
            const tMilpVariable &v = milp.variable (i);
            vars.push_back (model.addVar (to_grb_bound (v.lb), to_grb_bound (v.ub), 0.0,
                                          (v.type == binary_variable) ? GRB_BINARY : GRB_CONTINUOUS, v.name));
        }

        // set up objective function
        GRBLinExpr expr = milp.get_objective_constant();
        for (int i = 0; i < milp.no_of_variables(); ++i)
            if (milp.variable (i).objective_coefficient != 0.0)
                expr += milp.variable (i).objective_coefficient * vars[i];
        model.setObjective (expr, GRB_MINIMIZE);

        // set up constraints
        for (int j = 0; j < milp.no_of_constraints(); ++j) {
            const tMilpConstraint &con = milp.constraint (j);

            expr = 0;
            for (size_t k = 0; k < con.terms.size(); ++k)
                expr += con.terms[k].coefficient * vars[con.terms[k].variable];
            model.addConstr (expr, to_grb_sense (con.sense), con.rhs, con.name);
        }

        // solve the problem
        time_point<steady_clock> start = steady_clock::now();
        model.optimize();
        solution.solve_time = ((duration<double>)(steady_clock::now() - start)).count();

        solution.status = from_grb_status (model.get (GRB_IntAttr_Status));
        if (solution.status != solve_status_optimal) {
            if (!settings_.failed_model_file.empty())
                model.write (settings_.failed_model_file);

            stringstream context;
            context << "Gurobi status " << model.get (GRB_IntAttr_Status) << " after " << solution.solve_time << " seconds";
            check_solve_status (solution.status, context.str());
        }

        solution.objective_value = model.get (GRB_DoubleAttr_ObjVal);

        solution.values.resize (milp.no_of_variables());
        for (int i = 0; i < milp.no_of_variables(); ++i)
            solution.values[i] = vars[i].get (GRB_DoubleAttr_X);
    } catch (const GRBException &e) {
        if (e.getErrorCode() == GRB_ERROR_NO_LICENSE)
            throw tSolverUnavailableError (describe (e));
        throw tSolverError (describe (e));
    }

    // that's it!
    return solution;
}
