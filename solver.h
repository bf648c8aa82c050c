#pragma once

#include <memory>
#include <string>
#include <vector>

#include "config.h"
#include "constraint_model.h"

enum class SolveStatus {
    Unsolved,
    Solving,
    Optimal,
    Feasible,
    Infeasible,
    TimedOut
};

std::string solveStatusToString(SolveStatus status);

struct SolveLimits {
    double timeLimitSeconds; // 0 = без ограничения
    bool optimize;
};

// Что вернул бэкенд. status: один из финальных (Optimal/Feasible/Infeasible/TimedOut).
struct BackendResult {
    SolveStatus status;
    bool hasAssignment;
    std::vector<bool> assignment;
    std::string detail;
};

// Узкий интерфейс к CP-солверу: модель -> статус + значения переменных
class SolverBackend {
public:
    virtual ~SolverBackend() = default;

    virtual std::string name() const = 0;
    virtual BackendResult solve(const ConstraintModel& model, const SolveLimits& limits) = 0;
};

std::unique_ptr<SolverBackend> makeDefaultBackend();

struct SolveOutcome {
    SolveStatus status;
    bool hasIncumbent;
    std::vector<bool> assignment;
    long long objective;
    double wallSeconds;
    std::string backend;
    std::string detail;

    // TIMED_OUT с решением идёт дальше как FEASIBLE, без решения как INFEASIBLE
    bool usable() const { return hasIncumbent; }
};

// UNSOLVED -> SOLVING -> {OPTIMAL, FEASIBLE, INFEASIBLE, TIMED_OUT}.
// Один объект на один запуск.
class SolverEngine {
public:
    explicit SolverEngine(std::unique_ptr<SolverBackend> backend);

    SolveOutcome solve(const ConstraintModel& model, const EngineConfig& cfg);

    SolveStatus status() const { return status_; }

private:
    std::unique_ptr<SolverBackend> backend_;
    SolveStatus status_;
};
