//
//  gurobi_solver.hpp
//  BatteryScheduling
//
//  Copyright © 2026 BatteryScheduling contributors. All rights reserved.
//

#ifndef gurobi_solver_hpp
#define gurobi_solver_hpp

#include <memory>

#include "solver_adapter.hpp"

class GRBEnv;

// solves tMilpModels with Gurobi; the environment is started on the first call to solve()
class tGurobiSolver : public tMilpSolver {
public:
    explicit tGurobiSolver (const tSolverSettings &settings = tSolverSettings());
    ~tGurobiSolver();

    tSolverSolution solve (const tMilpModel &model);

    const tSolverSettings &settings() const { return settings_; }

private:
    GRBEnv &environment();

    tSolverSettings settings_;
    std::unique_ptr<GRBEnv> env_;

    tGurobiSolver (const tGurobiSolver &);
    tGurobiSolver &operator= (const tGurobiSolver &);
};

#endif /* gurobi_solver_hpp */
