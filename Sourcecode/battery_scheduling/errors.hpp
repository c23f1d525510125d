//
//  errors.hpp
//  BatteryScheduling
//
//  Copyright © 2026 BatteryScheduling contributors. All rights reserved.
//

#ifndef errors_hpp
#define errors_hpp

#include <string>
#include <stdexcept>

// every failure aborts the current period; the rolling horizon never retries
class tSchedulingError : public std::runtime_error {
public:
    explicit tSchedulingError (const std::string &message) : std::runtime_error (message) {}
};

// invalid battery specification, model parameters or period boundaries
class tConfigurationError : public tSchedulingError {
public:
    explicit tConfigurationError (const std::string &message) : tSchedulingError (message) {}
};

// missing or misaligned timestep in the supplied series
class tDataGapError : public tSchedulingError {
public:
    explicit tDataGapError (const std::string &message) : tSchedulingError (message) {}
};

// the solver cannot be invoked at all (no environment, no license)
class tSolverUnavailableError : public tSchedulingError {
public:
    explicit tSolverUnavailableError (const std::string &message) : tSchedulingError (message) {}
};

class tInfeasibleModelError : public tSchedulingError {
public:
    explicit tInfeasibleModelError (const std::string &message) : tSchedulingError (message) {}
};

class tSolverError : public tSchedulingError {
public:
    explicit tSolverError (const std::string &message) : tSchedulingError (message) {}
};

// time limit reached before optimality was proven
class tSolverTimeoutError : public tSolverError {
public:
    explicit tSolverTimeoutError (const std::string &message) : tSolverError (message) {}
};

// score_percent is undefined when the cost without battery is zero
class tDegenerateCostError : public tSchedulingError {
public:
    explicit tDegenerateCostError (const std::string &message) : tSchedulingError (message) {}
};

#endif /* errors_hpp */
