#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "errors.h"
#include "solver.h"
#include "test_helpers.h"
#include "z3_backend.h"

// Бэкенд с заранее заданным ответом
class ScriptedBackend : public SolverBackend {
public:
    explicit ScriptedBackend(BackendResult r) : result_(std::move(r)) {}

    std::string name() const override { return "scripted"; }

    BackendResult solve(const ConstraintModel&, const SolveLimits& limits) override {
        lastLimits = limits;
        return result_;
    }

    SolveLimits lastLimits{-1.0, false};

private:
    BackendResult result_;
};

// x0 + x1 = 1, цель 5*x0
static ConstraintModel exactlyOneModel() {
    ConstraintModel model;
    int x0 = model.addVariable(ModelVariable{VariableKind::Auxiliary, -1, -1, "x0"});
    int x1 = model.addVariable(ModelVariable{VariableKind::Auxiliary, -1, -1, "x1"});
    model.addConstraint(LinearConstraint{{{x0, 1}, {x1, 1}}, ConstraintSense::Equal, 1, "one"});
    model.addObjectiveTerm(x0, 5);
    return model;
}

static BackendResult answer(SolveStatus status, std::vector<bool> assignment, bool has = true) {
    return BackendResult{status, has, std::move(assignment), "test"};
}

class SolverEngineTest : public ::testing::Test {
protected:
    void SetUp() override { quietLogs(); }

    SolveOutcome run(BackendResult r) {
        SolverEngine engine(std::make_unique<ScriptedBackend>(std::move(r)));
        SolveOutcome out = engine.solve(model, cfg);
        EXPECT_EQ(engine.status(), out.status);
        return out;
    }

    ConstraintModel model = exactlyOneModel();
    EngineConfig cfg;
};

TEST_F(SolverEngineTest, OptimalCarriesAssignmentAndObjective) {
    SolveOutcome out = run(answer(SolveStatus::Optimal, {true, false}));

    EXPECT_EQ(out.status, SolveStatus::Optimal);
    EXPECT_TRUE(out.usable());
    EXPECT_EQ(out.assignment, (std::vector<bool>{true, false}));
    EXPECT_EQ(out.objective, 5);
    EXPECT_EQ(out.backend, "scripted");
}

TEST_F(SolverEngineTest, InfeasibleHasNoIncumbent) {
    SolveOutcome out = run(answer(SolveStatus::Infeasible, {}, false));

    EXPECT_EQ(out.status, SolveStatus::Infeasible);
    EXPECT_FALSE(out.usable());
}

TEST_F(SolverEngineTest, InfeasibleIgnoresStrayAssignment) {
    SolveOutcome out = run(answer(SolveStatus::Infeasible, {false, true}));

    EXPECT_FALSE(out.usable());
    EXPECT_TRUE(out.assignment.empty());
}

TEST_F(SolverEngineTest, TimedOutWithIncumbentIsUsable) {
    SolveOutcome out = run(answer(SolveStatus::TimedOut, {false, true}));

    EXPECT_EQ(out.status, SolveStatus::TimedOut);
    EXPECT_TRUE(out.usable());
    EXPECT_EQ(out.objective, 0);
}

TEST_F(SolverEngineTest, TimedOutWithBrokenIncumbentIsDropped) {
    SolveOutcome out = run(answer(SolveStatus::TimedOut, {true, true}));

    EXPECT_EQ(out.status, SolveStatus::TimedOut);
    EXPECT_FALSE(out.usable());
}

TEST_F(SolverEngineTest, TimedOutWithoutIncumbentIsNotUsable) {
    SolveOutcome out = run(answer(SolveStatus::TimedOut, {}, false));
    EXPECT_FALSE(out.usable());
}

TEST_F(SolverEngineTest, OptimalWithViolatedConstraintIsSolverError) {
    EXPECT_THROW(run(answer(SolveStatus::Optimal, {false, false})), SolverError);
    EXPECT_THROW(run(answer(SolveStatus::Feasible, {true})), SolverError);
}

TEST_F(SolverEngineTest, FeasibleWithoutAssignmentIsSolverError) {
    EXPECT_THROW(run(answer(SolveStatus::Feasible, {}, false)), SolverError);
}

TEST_F(SolverEngineTest, NonFinalStatusIsSolverError) {
    EXPECT_THROW(run(answer(SolveStatus::Solving, {true, false})), SolverError);
}

TEST_F(SolverEngineTest, EngineRunsOnlyOnce) {
    SolverEngine engine(std::make_unique<ScriptedBackend>(answer(SolveStatus::Optimal, {true, false})));
    EXPECT_EQ(engine.status(), SolveStatus::Unsolved);

    engine.solve(model, cfg);
    EXPECT_THROW(engine.solve(model, cfg), std::logic_error);
}

TEST_F(SolverEngineTest, NullBackendIsRejected) {
    std::unique_ptr<SolverBackend> none;
    EXPECT_THROW(SolverEngine engine(std::move(none)), std::invalid_argument);
}

TEST_F(SolverEngineTest, PassesLimitsToBackend) {
    cfg.timeLimitSeconds = 2.5;
    cfg.optimize = false;

    auto backend = std::make_unique<ScriptedBackend>(answer(SolveStatus::Feasible, {false, true}));
    ScriptedBackend* raw = backend.get();
    SolverEngine engine(std::move(backend));
    engine.solve(model, cfg);

    EXPECT_DOUBLE_EQ(raw->lastLimits.timeLimitSeconds, 2.5);
    EXPECT_FALSE(raw->lastLimits.optimize);
}

TEST(SolveStatusTest, Names) {
    EXPECT_EQ(solveStatusToString(SolveStatus::Unsolved), "UNSOLVED");
    EXPECT_EQ(solveStatusToString(SolveStatus::TimedOut), "TIMED_OUT");
    EXPECT_EQ(solveStatusToString(SolveStatus::Infeasible), "INFEASIBLE");
}

// ==================== Z3 ====================

class Z3BackendTest : public ::testing::Test {
protected:
    void SetUp() override { quietLogs(); }

    Z3Backend backend;
};

TEST_F(Z3BackendTest, FindsOptimum) {
    ConstraintModel model = exactlyOneModel();
    BackendResult r = backend.solve(model, SolveLimits{10.0, true});

    EXPECT_EQ(r.status, SolveStatus::Optimal);
    ASSERT_TRUE(r.hasAssignment);
    EXPECT_EQ(r.assignment, (std::vector<bool>{false, true}));
}

TEST_F(Z3BackendTest, FeasibilityOnlyWithoutOptimization) {
    ConstraintModel model = exactlyOneModel();
    BackendResult r = backend.solve(model, SolveLimits{0.0, false});

    EXPECT_EQ(r.status, SolveStatus::Feasible);
    ASSERT_TRUE(r.hasAssignment);
    EXPECT_TRUE(model.isSatisfiedBy(r.assignment));
}

TEST_F(Z3BackendTest, NoObjectiveMeansOptimal) {
    ConstraintModel model;
    int x = model.addVariable(ModelVariable{VariableKind::Auxiliary, -1, -1, "x"});
    model.addConstraint(LinearConstraint{{{x, 1}}, ConstraintSense::Equal, 1, "x_set"});

    BackendResult r = backend.solve(model, SolveLimits{0.0, true});
    EXPECT_EQ(r.status, SolveStatus::Optimal);
    EXPECT_EQ(r.assignment, std::vector<bool>{true});
}

TEST_F(Z3BackendTest, DetectsInfeasibility) {
    ConstraintModel model;
    int x = model.addVariable(ModelVariable{VariableKind::Auxiliary, -1, -1, "x"});
    int y = model.addVariable(ModelVariable{VariableKind::Auxiliary, -1, -1, "y"});
    model.addConstraint(LinearConstraint{{{x, 1}, {y, 1}}, ConstraintSense::Equal, 2, "both"});
    model.addConstraint(LinearConstraint{{{x, 1}, {y, 1}}, ConstraintSense::AtMost, 1, "one"});

    BackendResult r = backend.solve(model, SolveLimits{10.0, true});
    EXPECT_EQ(r.status, SolveStatus::Infeasible);
    EXPECT_FALSE(r.hasAssignment);
}

TEST_F(Z3BackendTest, HandlesNegativeCoefficients) {
    // x = 1, x - a <= 0, цель a: a вынужденно 1
    ConstraintModel model;
    int x = model.addVariable(ModelVariable{VariableKind::Auxiliary, -1, -1, "x"});
    int a = model.addVariable(ModelVariable{VariableKind::Auxiliary, -1, -1, "a"});
    model.addConstraint(LinearConstraint{{{x, 1}}, ConstraintSense::Equal, 1, "x_set"});
    model.addConstraint(LinearConstraint{{{x, 1}, {a, -1}}, ConstraintSense::AtMost, 0, "link"});
    model.addObjectiveTerm(a, 1);

    BackendResult r = backend.solve(model, SolveLimits{10.0, true});
    EXPECT_EQ(r.status, SolveStatus::Optimal);
    EXPECT_EQ(r.assignment, (std::vector<bool>{true, true}));
}

TEST_F(Z3BackendTest, EngineWithZ3EndToEnd) {
    ConstraintModel model = exactlyOneModel();
    EngineConfig cfg;
    SolverEngine engine(makeDefaultBackend());

    SolveOutcome out = engine.solve(model, cfg);
    EXPECT_EQ(out.status, SolveStatus::Optimal);
    EXPECT_EQ(out.objective, 0);
    EXPECT_EQ(out.backend, "z3");
}

TEST_F(Z3BackendTest, HugeTimeLimitMeansNoLimit) {
    ConstraintModel model = exactlyOneModel();
    BackendResult r = backend.solve(model, SolveLimits{1e7, true});

    EXPECT_EQ(r.status, SolveStatus::Optimal);
    EXPECT_EQ(r.assignment, (std::vector<bool>{false, true}));
}

TEST(Z3TimeoutTest, RemainingMilliseconds) {
    EXPECT_EQ(z3TimeoutMs(0.0, 3.0), 0u);
    EXPECT_EQ(z3TimeoutMs(2.0, 0.5), 1501u);
    EXPECT_EQ(z3TimeoutMs(1.0, 2.0), 1u);

    // не влезает в unsigned миллисекунд
    EXPECT_EQ(z3TimeoutMs(1e7, 0.0), 0u);
    EXPECT_EQ(z3TimeoutMs(1e300, 0.0), 0u);
    EXPECT_GT(z3TimeoutMs(4e6, 0.0), 1u);
}

TEST(Z3TimeoutTest, UnknownReasonNamesCause) {
    std::string limited = describeUnknown("timeout", SolveLimits{5.0, true});
    EXPECT_NE(limited.find("time limit"), std::string::npos);
    EXPECT_NE(limited.find("timeout"), std::string::npos);

    std::string unlimited = describeUnknown("incomplete", SolveLimits{0.0, true});
    EXPECT_NE(unlimited.find("gave up"), std::string::npos);
    EXPECT_NE(unlimited.find("incomplete"), std::string::npos);
}
