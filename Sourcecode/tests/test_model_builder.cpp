// tests/test_model_builder.cpp
/**
 * Unit Test: build_dispatch_model
 *
 * The model is inspected directly, and hand-built schedules are checked
 * against it with tMilpModel::max_violation(), so no solver is needed.
 *
 * Test Coverage:
 *   1. Variable and constraint counts, names, bounds
 *   2. Objective coefficients
 *   3. SOC chaining inside the period
 *   4. Big-M mode logic, as deployed and exclusive
 *   5. Input validation (initial SOC, big-M)
 *   5b. Big-M against the power limits of a narrow SOC range
 *   6. Zero-length window
 *   7. Purity: identical inputs give identical models
 */

#include "model_builder.hpp"
#include "errors.hpp"
#include "test_harness.hpp"
#include "test_fixtures.hpp"

const int no_of_variables_per_step = 11;
const int no_of_constraints_per_step = 14;

// A schedule for a step with zero net load that charges 'grid' from the grid
// and exports 'exported' (<= 0) from the battery in the same step.
std::vector<double> simultaneous_schedule(const tDispatchModel& dm, const tBatterySpec& battery,
                                          double grid, double exported, double ci, double di) {
    std::vector<double> values(dm.model.no_of_variables(), 0.0);

    double dc = grid * battery.charge_efficiency();
    double dd = exported / battery.discharge_efficiency();

    values[dm.variable(channel_grid_charge, 0)] = grid;
    values[dm.variable(channel_export_discharge, 0)] = exported;
    values[dm.variable(channel_delta_charge, 0)] = dc;
    values[dm.variable(channel_delta_discharge, 0)] = dd;
    values[dm.variable(channel_soc, 0)] = dm.initial_soc + dc + dd;
    values[dm.variable(channel_net_import, 0)] = grid;
    values[dm.variable(channel_net_export, 0)] = exported;
    values[dm.charge_indicator_variables[0]] = ci;
    values[dm.discharge_indicator_variables[0]] = di;
    return values;
}

// Test 1: structure
void test_structure(TestResult& result) {
    std::cout << "\n=== Test 1: Structure ===\n";

    tBatterySpec battery(10.0, 4.0, 3.0, 0.9, 0.8, 0.1, 0.9);
    std::shared_ptr<tTimeSeries> series = flat_series(6, 0.5, 2.0, 0.5, 0.3, 0.1);
    tPeriodWindow window(series, tPeriodBoundary(0, 6));

    tDispatchModel dm = build_dispatch_model(battery, window, 5.0, tModelParameters());

    result.check(dm.no_of_steps == 6, "model covers six steps");
    result.check(dm.model.no_of_variables() == 6 * no_of_variables_per_step, "eleven variables per step");
    result.check(dm.model.no_of_constraints() == 6 * no_of_constraints_per_step, "fourteen constraints per step");

    const tMilpVariable& soc = dm.model.variable(dm.variable(channel_soc, 2));
    result.check(soc.name == "soc[2]", "variables carry indexed names");
    result.check(is_close(soc.lb, 1.0) && is_close(soc.ub, 9.0), "SOC bounded by [min_soc, max_soc]");

    const tMilpVariable& grid = dm.model.variable(dm.variable(channel_grid_charge, 2));
    result.check(is_close(grid.lb, 0.0) && is_close(grid.ub, 2.0), "grid charge bounded by [0, 4 kW * 0.5 h]");

    const tMilpVariable& exported = dm.model.variable(dm.variable(channel_export_discharge, 2));
    result.check(is_close(exported.lb, -1.5) && is_close(exported.ub, 0.0), "export discharge bounded by [-3 kW * 0.5 h, 0]");

    const tMilpVariable& dc = dm.model.variable(dm.variable(channel_delta_charge, 2));
    result.check(dc.lb == -milp_infinity && dc.ub == milp_infinity, "delta charge is free");

    result.check(dm.model.variable(dm.charge_indicator_variables[2]).type == binary_variable &&
                 dm.model.variable(dm.discharge_indicator_variables[2]).type == binary_variable,
                 "mode indicators are binary");

    const char* names[] = {"soc_balance", "charge_lower", "charge_upper", "discharge_upper", "discharge_lower",
                           "mode_exclusivity", "charge_conversion", "discharge_conversion", "charge_power",
                           "discharge_power", "pv_surplus", "local_deficit", "import_balance", "export_balance"};
    bool all_found = true;
    for (int k = 0; k < no_of_constraints_per_step; ++k)
        for (int t = 0; t < 6; ++t)
            all_found = all_found && (dm.model.find_constraint(indexed_name(names[k], t)) >= 0);
    result.check(all_found, "every constraint exists for every step");

    const tMilpConstraint& pv_surplus = dm.model.constraint(dm.model.find_constraint("pv_surplus[0]"));
    result.check(is_close(pv_surplus.rhs, 0.0), "no solar surplus: pv charge bounded by 0");

    const tMilpConstraint& local_deficit = dm.model.constraint(dm.model.find_constraint("local_deficit[0]"));
    result.check(is_close(local_deficit.rhs, -1.5) && local_deficit.sense == constraint_greater_equal,
                 "local discharge bounded below by -positive load");
}

// Test 2: objective
void test_objective(TestResult& result) {
    std::cout << "\n=== Test 2: Objective ===\n";

    tBatterySpec battery(10.0, 4.0, 3.0, 0.9, 0.8, 0.1, 0.9);
    std::shared_ptr<tTimeSeries> series = flat_series(4, 1.0, 2.0, 0.0, 0.3, 0.1);
    series->steps[3].buy_price = 0.5;
    series->steps[3].sell_price = -0.02;
    tPeriodWindow window(series, tPeriodBoundary(0, 4));

    tDispatchModel dm = build_dispatch_model(battery, window, 5.0, tModelParameters());

    result.check(is_close(dm.model.variable(dm.variable(channel_net_import, 3)).objective_coefficient, 0.5),
                 "net import priced at the buy price");
    result.check(is_close(dm.model.variable(dm.variable(channel_net_export, 3)).objective_coefficient, -0.02),
                 "net export priced at the sell price");

    int priced = 0;
    for (int i = 0; i < dm.model.no_of_variables(); ++i)
        if (dm.model.variable(i).objective_coefficient != 0.0) ++priced;
    result.check(priced == 8, "only net import and net export enter the objective");
}

// Test 3: SOC chaining
void test_soc_chaining(TestResult& result) {
    std::cout << "\n=== Test 3: SOC Chaining ===\n";

    tBatterySpec battery(10.0, 4.0, 3.0, 0.9, 0.8, 0.1, 0.9);
    std::shared_ptr<tTimeSeries> series = flat_series(3, 1.0, 2.0, 0.0, 0.3, 0.1);
    tPeriodWindow window(series, tPeriodBoundary(0, 3));

    tDispatchModel dm = build_dispatch_model(battery, window, 4.25, tModelParameters());

    const tMilpConstraint& first = dm.model.constraint(dm.model.find_constraint("soc_balance[0]"));
    result.check(is_close(first.rhs, 4.25) && first.sense == constraint_equal && first.terms.size() == 3,
                 "first step starts from the initial SOC");

    const tMilpConstraint& second = dm.model.constraint(dm.model.find_constraint("soc_balance[1]"));
    bool refers_to_previous = false;
    for (size_t k = 0; k < second.terms.size(); ++k)
        if (second.terms[k].variable == dm.variable(channel_soc, 0) && second.terms[k].coefficient == -1.0)
            refers_to_previous = true;
    result.check(refers_to_previous && is_close(second.rhs, 0.0), "later steps start from the previous SOC");

    tScriptedSolver solver(tScriptedSolver::charge_first_step);
    tSolverSolution solution = solver.solve(dm.model);
    result.check(dm.model.max_violation(solution.values) < 1e-9, "grid charging schedule is feasible");
    result.check(is_close(solution.values[dm.variable(channel_soc, 2)], 4.25 + 4.0 * 0.9),
                 "SOC carries the charged energy to the end of the period");
}

// Test 4: big-M mode logic
void test_mode_logic(TestResult& result) {
    std::cout << "\n=== Test 4: Big-M Mode Logic ===\n";

    tBatterySpec battery(10.0, 4.0, 4.0, 0.9, 0.8, 0.1, 0.9);
    std::shared_ptr<tTimeSeries> series = flat_series(1, 1.0, 0.0, 0.0, 0.3, 0.1);
    tPeriodWindow window(series, tPeriodBoundary(0, 1));

    tDispatchModel deployed = build_dispatch_model(battery, window, 5.0, tModelParameters(100.0, as_deployed));
    tDispatchModel direct = build_dispatch_model(battery, window, 5.0, tModelParameters(100.0, exclusive));

    // charge 1 kWh from the grid and export 0.8 kWh in the same step, both indicators off
    std::vector<double> both_off = simultaneous_schedule(deployed, battery, 1.0, -0.8, 0.0, 0.0);
    result.check(deployed.model.max_violation(both_off) < 1e-9,
                 "as deployed: with both indicators off, charging and discharging may coincide");
    result.check(direct.model.max_violation(both_off) > 0.5,
                 "exclusive: with both indicators off, no SOC change is possible");

    std::vector<double> charging = simultaneous_schedule(deployed, battery, 1.0, 0.0, 1.0, 0.0);
    result.check(deployed.model.max_violation(charging) < 1e-9, "as deployed: charging with charge indicator set");
    result.check(direct.model.max_violation(charging) < 1e-9, "exclusive: charging with charge indicator set");

    std::vector<double> charging_while_discharge_mode = simultaneous_schedule(deployed, battery, 1.0, 0.0, 0.0, 1.0);
    result.check(deployed.model.max_violation(charging_while_discharge_mode) > 0.5,
                 "as deployed: discharge indicator forbids charging");
    result.check(direct.model.max_violation(charging_while_discharge_mode) > 0.5,
                 "exclusive: discharge indicator forbids charging");

    std::vector<double> discharging_while_charge_mode = simultaneous_schedule(deployed, battery, 0.0, -0.8, 1.0, 0.0);
    result.check(deployed.model.max_violation(discharging_while_charge_mode) > 0.5,
                 "as deployed: charge indicator forbids discharging");
    result.check(direct.model.max_violation(discharging_while_charge_mode) > 0.5,
                 "exclusive: charge indicator forbids discharging");

    std::vector<double> both_on = simultaneous_schedule(deployed, battery, 0.0, 0.0, 1.0, 1.0);
    result.check(deployed.model.max_violation(both_on) >= 1.0 - 1e-9, "both indicators set violates mode exclusivity");
}

// Test 5: input validation
void test_validation(TestResult& result) {
    std::cout << "\n=== Test 5: Input Validation ===\n";

    tBatterySpec battery(10.0, 4.0, 4.0, 0.9, 0.8, 0.1, 0.9);
    std::shared_ptr<tTimeSeries> series = flat_series(2, 1.0, 1.0, 0.0, 0.3, 0.1);
    tPeriodWindow window(series, tPeriodBoundary(0, 2));

    const double initial_socs[] = {0.5, 9.5};
    for (int i = 0; i < 2; ++i) {
        try {
            build_dispatch_model(battery, window, initial_socs[i], tModelParameters());
            result.fail("initial SOC " + std::to_string(initial_socs[i]) + " accepted");
        } catch (const tConfigurationError& e) {
            result.pass(std::string("initial SOC outside the bounds rejected: ") + e.what());
        }
    }

    try {
        build_dispatch_model(battery, window, 5.0, tModelParameters(5.0, as_deployed));
        result.fail("big-M below the SOC range accepted");
    } catch (const tConfigurationError& e) {
        result.pass(std::string("big-M below the SOC range rejected: ") + e.what());
    }

    try {
        tDispatchModel dm = build_dispatch_model(battery, window, 9.0, tModelParameters(8.0, as_deployed));
        result.check(dm.no_of_steps == 2, "initial SOC at max_soc and big-M covering the range accepted");
    } catch (const std::exception& e) {
        result.fail(std::string("boundary inputs rejected: ") + e.what());
    }
}

// Test 5b: big-M must cover a full-power step, not only the SOC range
void test_big_m_power_limits(TestResult& result) {
    std::cout << "\n=== Test 5b: Big-M and Power Limits ===\n";

    // 10 kW both ways but only 1 kWh of usable SOC range
    tBatterySpec battery(10.0, 10.0, 10.0, 1.0, 1.0, 0.4, 0.5);
    std::shared_ptr<tTimeSeries> series = flat_series(1, 1.0, 0.0, 0.0, -0.1, 0.3);
    tPeriodWindow window(series, tPeriodBoundary(0, 1));

    result.check(is_close(minimum_big_m(battery, 1.0), 10.0), "one hour at 10 kW dominates the 1 kWh range");
    result.check(is_close(minimum_big_m(battery, 0.05), 1.0), "short steps fall back to the SOC range");

    try {
        build_dispatch_model(battery, window, 4.5, tModelParameters(1.0, as_deployed));
        result.fail("big-M covering only the SOC range accepted");
    } catch (const tConfigurationError& e) {
        result.pass(std::string("big-M covering only the SOC range rejected: ") + e.what());
    }

    try {
        tDispatchModel dm = build_dispatch_model(battery, window, 4.5, tModelParameters(10.0, as_deployed));

        // buy 10 kWh and export 10 kWh through the battery in one step, both indicators off
        std::vector<double> cycling = simultaneous_schedule(dm, battery, 10.0, -10.0, 0.0, 0.0);
        result.check(dm.model.max_violation(cycling) < 1e-9, "smallest admissible big-M leaves the inactive branch slack");
        result.check(is_close(dm.model.evaluate_objective(cycling), -4.0), "cycling earns 10 * 0.1 + 10 * 0.3");
    } catch (const tConfigurationError& e) {
        result.fail(std::string("big-M covering a full-power step rejected: ") + e.what());
    }
}

// Test 6: zero-length window
void test_empty_window(TestResult& result) {
    std::cout << "\n=== Test 6: Zero-Length Window ===\n";

    tBatterySpec battery(10.0, 4.0, 4.0, 0.9, 0.8, 0.1, 0.9);
    std::shared_ptr<tTimeSeries> series = flat_series(5, 1.0, 1.0, 0.0, 0.3, 0.1);
    tPeriodWindow window(series, tPeriodBoundary(2, 2));

    tDispatchModel dm = build_dispatch_model(battery, window, 3.0, tModelParameters());
    result.check(dm.model.no_of_variables() == 0 && dm.model.no_of_constraints() == 0, "no variables, no constraints");
    result.check(is_close(dm.model.evaluate_objective(std::vector<double>()), 0.0), "zero objective");
    result.check(is_close(dm.initial_soc, 3.0), "initial SOC recorded");
}

// Test 7: purity
void test_purity(TestResult& result) {
    std::cout << "\n=== Test 7: Identical Inputs, Identical Models ===\n";

    tBatterySpec battery(10.0, 4.0, 4.0, 0.9, 0.8, 0.1, 0.9);
    std::shared_ptr<tTimeSeries> series = flat_series(8, 0.5, 1.0, 3.0, 0.3, 0.1);
    tPeriodWindow window(series, tPeriodBoundary(0, 8));

    tDispatchModel a = build_dispatch_model(battery, window, 5.0, tModelParameters());
    tDispatchModel b = build_dispatch_model(battery, window, 5.0, tModelParameters());

    bool identical = (a.model.no_of_variables() == b.model.no_of_variables()) &&
                     (a.model.no_of_constraints() == b.model.no_of_constraints());
    for (int i = 0; identical && i < a.model.no_of_variables(); ++i)
        identical = (a.model.variable(i).name == b.model.variable(i).name) &&
                    (a.model.variable(i).lb == b.model.variable(i).lb) &&
                    (a.model.variable(i).ub == b.model.variable(i).ub) &&
                    (a.model.variable(i).objective_coefficient == b.model.variable(i).objective_coefficient);
    for (int j = 0; identical && j < a.model.no_of_constraints(); ++j) {
        const tMilpConstraint& ca = a.model.constraint(j);
        const tMilpConstraint& cb = b.model.constraint(j);
        identical = (ca.name == cb.name) && (ca.sense == cb.sense) && (ca.rhs == cb.rhs) && (ca.terms.size() == cb.terms.size());
        for (size_t k = 0; identical && k < ca.terms.size(); ++k)
            identical = (ca.terms[k].variable == cb.terms[k].variable) && (ca.terms[k].coefficient == cb.terms[k].coefficient);
    }
    result.check(identical, "two builds from the same inputs are identical");
    result.check(series->steps.size() == 8 && is_close(series->steps[0].generation, 3.0), "series left untouched");
}

int main() {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║            Dispatch Model Builder Unit Tests                ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";

    TestResult result;

    test_structure(result);
    test_objective(result);
    test_soc_chaining(result);
    test_mode_logic(result);
    test_validation(result);
    test_big_m_power_limits(result);
    test_empty_window(result);
    test_purity(result);

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
