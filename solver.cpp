#include "solver.h"

#include "errors.h"
#include "logger.h"
#include "z3_backend.h"

#include <chrono>
#include <stdexcept>
#include <utility>

std::string solveStatusToString(SolveStatus status) {
    switch (status) {
        case SolveStatus::Unsolved:   return "UNSOLVED";
        case SolveStatus::Solving:    return "SOLVING";
        case SolveStatus::Optimal:    return "OPTIMAL";
        case SolveStatus::Feasible:   return "FEASIBLE";
        case SolveStatus::Infeasible: return "INFEASIBLE";
        case SolveStatus::TimedOut:   return "TIMED_OUT";
    }
    return "UNKNOWN";
}

std::unique_ptr<SolverBackend> makeDefaultBackend() {
    return std::make_unique<Z3Backend>();
}

SolverEngine::SolverEngine(std::unique_ptr<SolverBackend> backend)
    : backend_(std::move(backend)),
      status_(SolveStatus::Unsolved) {
    if (!backend_) {
        throw std::invalid_argument("SolverEngine requires a backend");
    }
}

SolveOutcome SolverEngine::solve(const ConstraintModel& model, const EngineConfig& cfg) {
    if (status_ != SolveStatus::Unsolved) {
        throw std::logic_error("SolverEngine::solve called twice");
    }
    status_ = SolveStatus::Solving;

    SolveLimits limits{cfg.timeLimitSeconds, cfg.optimize};

    logInfo("Запуск солвера " + backend_->name() +
            " (лимит=" + (limits.timeLimitSeconds > 0
                              ? std::to_string(limits.timeLimitSeconds) + " c"
                              : std::string("нет")) +
            ", оптимизация=" + (limits.optimize ? "да" : "нет") + ")");

    auto started = std::chrono::steady_clock::now();
    BackendResult r = backend_->solve(model, limits);
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    if (r.status == SolveStatus::Unsolved || r.status == SolveStatus::Solving) {
        throw SolverError("Backend " + backend_->name() + " returned non-final status " +
                          solveStatusToString(r.status));
    }

    SolveOutcome out;
    out.status       = r.status;
    out.hasIncumbent = false;
    out.objective    = 0;
    out.wallSeconds  = elapsed;
    out.backend      = backend_->name();
    out.detail       = r.detail;

    bool mustHaveAssignment = r.status == SolveStatus::Optimal || r.status == SolveStatus::Feasible;

    // у INFEASIBLE назначения нет по определению
    if (r.hasAssignment && r.status != SolveStatus::Infeasible) {
        std::string what;
        if (r.assignment.size() != model.variables().size()) {
            what = "размер назначения не совпадает с моделью";
        } else if (const LinearConstraint* bad = model.firstViolated(r.assignment)) {
            what = bad->label;
        }

        if (!what.empty()) {
            if (mustHaveAssignment) {
                throw SolverError("Backend " + backend_->name() +
                                  " returned an assignment violating " + what);
            }
            logWarning("Промежуточное решение солвера отброшено: нарушено " + what);
        } else {
            out.hasIncumbent = true;
            out.assignment   = std::move(r.assignment);
            out.objective    = model.objectiveValue(out.assignment);
        }
    } else if (mustHaveAssignment) {
        throw SolverError("Backend " + backend_->name() + " reported " +
                          solveStatusToString(r.status) + " without an assignment");
    }

    status_ = out.status;

    std::string summary = "Солвер завершён: статус=" + solveStatusToString(out.status) +
                          ", решение=" + (out.hasIncumbent ? "есть" : "нет") +
                          ", цель=" + std::to_string(out.objective) +
                          ", время=" + std::to_string(elapsed) + " c";
    if (out.hasIncumbent) {
        logInfo(summary);
    } else {
        logWarning(summary);
    }

    return out;
}
