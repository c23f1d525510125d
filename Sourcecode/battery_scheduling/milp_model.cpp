//
//  milp_model.cpp
//  BatteryScheduling
//
//  Copyright © 2026 BatteryScheduling contributors. All rights reserved.
//

#include "milp_model.hpp"

#include <cmath>
#include <sstream>
#include <algorithm>

#include "errors.hpp"

using namespace std;

int tMilpModel::add_variable (const string &name, double lb, double ub, tVariableType type) {
    if (lb > ub) {
        stringstream message;
        message << "Variable " << name << " has empty domain [" << lb << ", " << ub << "].";
        throw tConfigurationError (message.str());
    }

    tMilpVariable var;
    var.name = name;
    var.lb = lb;
    var.ub = ub;
    var.type = type;
    var.objective_coefficient = 0.0;
    variables.push_back (var);

    return (int)variables.size() - 1;
}

int tMilpModel::add_constraint (const string &name, const vector<tLinearTerm> &terms, tConstraintSense sense, double rhs) {
    for (size_t i = 0; i < terms.size(); ++i)
        if ((terms[i].variable < 0) || (terms[i].variable >= no_of_variables())) {
            stringstream message;
            message << "Constraint " << name << " refers to unknown variable " << terms[i].variable << ".";
            throw tConfigurationError (message.str());
        }

    tMilpConstraint con;
    con.name = name;
    con.terms = terms;
    con.sense = sense;
    con.rhs = rhs;
    constraints.push_back (con);

    return (int)constraints.size() - 1;
}

void tMilpModel::set_objective_coefficient (int variable, double coefficient) {
    variables.at (variable).objective_coefficient = coefficient;
}

int tMilpModel::find_constraint (const string &name) const {
    for (int i = 0; i < no_of_constraints(); ++i)
        if (constraints[i].name == name)
            return i;

    return -1;
}

double tMilpModel::evaluate_objective (const vector<double> &values) const {
    double obj_value = objective_constant;
    for (int i = 0; i < no_of_variables(); ++i)
        obj_value += variables[i].objective_coefficient * values.at (i);

    return obj_value;
}

double tMilpModel::evaluate_lhs (int constraint, const vector<double> &values) const {
    const tMilpConstraint &con = constraints.at (constraint);

    double lhs = 0.0;
    for (size_t k = 0; k < con.terms.size(); ++k)
        lhs += con.terms[k].coefficient * values.at (con.terms[k].variable);

    return lhs;
}

double tMilpModel::max_violation (const vector<double> &values) const {
    if ((int)values.size() != no_of_variables())
        return milp_infinity;

    double violation = 0.0;

    for (int i = 0; i < no_of_variables(); ++i) {
        violation = max (violation, variables[i].lb - values[i]);
        violation = max (violation, values[i] - variables[i].ub);
        if (variables[i].type == binary_variable)
            violation = max (violation, fabs (values[i] - floor (values[i] + 0.5)));
    }

    for (int j = 0; j < no_of_constraints(); ++j) {
        double lhs = evaluate_lhs (j, values);
        switch (constraints[j].sense) {
            case constraint_less_equal:    violation = max (violation, lhs - constraints[j].rhs); break;
            case constraint_greater_equal: violation = max (violation, constraints[j].rhs - lhs); break;
            case constraint_equal:         violation = max (violation, fabs (lhs - constraints[j].rhs)); break;
        }
    }

    return violation;
}

string indexed_name (const char *name, int index) {
    stringstream str;
    str << name << "[" << index << "]";
    return str.str();
}
