// generator.cpp
#include "generator.h"

#include "candidates.h"
#include "logger.h"
#include "model_builder.h"
#include "solution_mapper.h"

#include <chrono>
#include <utility>

std::string failureKindToString(FailureKind kind) {
    switch (kind) {
        case FailureKind::None:                return "none";
        case FailureKind::InfeasibleCandidate: return "infeasible_candidate";
        case FailureKind::Infeasible:          return "infeasible";
        case FailureKind::ConflictDetected:    return "conflict_detected";
        case FailureKind::SolverError:         return "solver_error";
    }
    return "unknown";
}

std::string catalogSourceToString(CatalogSource source) {
    switch (source) {
        case CatalogSource::Request:  return "request";
        case CatalogSource::Demo:     return "demo";
        case CatalogSource::Database: return "database";
    }
    return "unknown";
}

bool shouldStoreTimetable(CatalogSource source, const GenerationResult& result) {
    return result.ok && source == CatalogSource::Database;
}

static GenerationResult emptyResult() {
    GenerationResult r;
    r.ok           = false;
    r.solverStatus = SolveStatus::Unsolved;
    r.failure      = FailureKind::None;
    r.stats        = GenerationStats{0, 0, 0, 0, 0.0, 0.0, ""};

    r.instanceId   = -1;
    r.offeringId   = -1;
    r.sessionIndex = -1;

    r.conflictResource   = ConflictResource::Assignment;
    r.conflictResourceId = -1;
    r.conflictTimeSlotId = -1;
    r.conflictFirstId    = -1;
    r.conflictSecondId   = -1;
    return r;
}

static void fail(GenerationResult& r, FailureKind kind, const std::string& message) {
    r.ok      = false;
    r.failure = kind;
    r.message = message;
    r.slots.clear();
    logError("Генерация не удалась [" + failureKindToString(kind) + "]: " + message);
}

// ============================================================================
//                              ГЕНЕРАЦИЯ РАСПИСАНИЯ
// ============================================================================

GenerationResult generateTimetable(
    const Catalog& catalog,
    const EngineConfig& cfg,
    std::unique_ptr<SolverBackend> backend
) {
    auto started = std::chrono::steady_clock::now();

    logInfo("=== Запуск генерации расписания ===");
    logInfo("Оферингов: " + std::to_string(catalog.offerings().size()) +
            ", групп: " + std::to_string(catalog.sections().size()) +
            ", слотов: " + std::to_string(catalog.timeSlots().size()) +
            ", аудиторий: " + std::to_string(catalog.rooms().size()));

    GenerationResult result = emptyResult();
    SolverEngine engine(std::move(backend));

    try {
        // 1) кандидаты
        CandidateSet candidates = generateCandidates(catalog, cfg);
        result.stats.instances = (int)candidates.instances.size();

        // 2) модель
        ConstraintModel model = buildConstraintModel(catalog, candidates, cfg);
        result.stats.variables   = (int)model.variables().size();
        result.stats.constraints = (int)model.constraints().size();

        // 3) солвер
        SolveOutcome outcome = engine.solve(model, cfg);
        result.solverStatus       = outcome.status;
        result.stats.backend      = outcome.backend;
        result.stats.solveSeconds = outcome.wallSeconds;
        result.stats.objective    = outcome.objective;

        if (!outcome.usable()) {
            fail(result, FailureKind::Infeasible,
                 "No timetable possible with current data/constraints (solver status " +
                     solveStatusToString(outcome.status) + ")");
        } else {
            // 4) записи
            result.slots = mapSolution(catalog, candidates, model, outcome.assignment);
            result.ok = true;
            result.message = "Timetable generated: " + std::to_string(result.slots.size()) +
                             " sessions, solver status " + solveStatusToString(outcome.status);
        }
    } catch (const InfeasibleCandidateError& e) {
        result.instanceId   = e.instanceId;
        result.offeringId   = e.offeringId;
        result.sessionIndex = e.sessionIndex;
        fail(result, FailureKind::InfeasibleCandidate, e.what());
    } catch (const ConflictDetectedError& e) {
        result.conflictResource   = e.resource;
        result.conflictResourceId = e.resourceId;
        result.conflictTimeSlotId = e.timeSlotId;
        result.conflictFirstId    = e.firstId;
        result.conflictSecondId   = e.secondId;
        fail(result, FailureKind::ConflictDetected, e.what());
    } catch (const SolverError& e) {
        fail(result, FailureKind::SolverError, e.what());
    }

    result.stats.totalSeconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    if (result.ok) {
        logInfo("Генерация завершена: записей=" + std::to_string(result.slots.size()) +
                ", статус солвера=" + solveStatusToString(result.solverStatus) +
                ", время=" + std::to_string(result.stats.totalSeconds) + " c");
    }
    return result;
}
