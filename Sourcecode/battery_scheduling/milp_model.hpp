//
//  milp_model.hpp
//  BatteryScheduling
//
//  Copyright © 2026 BatteryScheduling contributors. All rights reserved.
//

#ifndef milp_model_hpp
#define milp_model_hpp

#include <limits>
#include <string>
#include <vector>

// solver-neutral description of a mixed-integer linear program (minimisation)

const double milp_infinity = std::numeric_limits<double>::infinity();

enum tVariableType { continuous_variable, binary_variable };
enum tConstraintSense { constraint_less_equal, constraint_greater_equal, constraint_equal };

struct tMilpVariable {
    std::string name;
    double lb, ub;
    tVariableType type;
    double objective_coefficient;
};

struct tLinearTerm {
    int variable;
    double coefficient;

    tLinearTerm (int variable, double coefficient) : variable (variable), coefficient (coefficient) {}
};

// sum of terms {sense} rhs
struct tMilpConstraint {
    std::string name;
    std::vector<tLinearTerm> terms;
    tConstraintSense sense;
    double rhs;
};

class tMilpModel {
public:
    tMilpModel() : objective_constant (0.0) {}

    int add_variable (const std::string &name, double lb, double ub, tVariableType type = continuous_variable);
    int add_constraint (const std::string &name, const std::vector<tLinearTerm> &terms, tConstraintSense sense, double rhs);

    void set_objective_coefficient (int variable, double coefficient);
    void set_objective_constant (double constant) { objective_constant = constant; }

    int no_of_variables() const { return (int)variables.size(); }
    int no_of_constraints() const { return (int)constraints.size(); }
    const tMilpVariable &variable (int i) const { return variables[i]; }
    const tMilpConstraint &constraint (int i) const { return constraints[i]; }
    double get_objective_constant() const { return objective_constant; }

    // -1 if there is no such constraint
    int find_constraint (const std::string &name) const;

    double evaluate_objective (const std::vector<double> &values) const;
    double evaluate_lhs (int constraint, const std::vector<double> &values) const;

    // largest violation of any bound, integrality requirement or constraint; 0 for a feasible point
    double max_violation (const std::vector<double> &values) const;

private:
    std::vector<tMilpVariable> variables;
    std::vector<tMilpConstraint> constraints;
    double objective_constant;
};

// "name[index]"
std::string indexed_name (const char *name, int index);

#endif /* milp_model_hpp */
