#pragma once

#include <memory>
#include <string>
#include <vector>

#include "catalog.h"
#include "config.h"
#include "errors.h"
#include "model.h"
#include "solver.h"

enum class FailureKind {
    None,
    InfeasibleCandidate, // у занятия нет допустимых размещений
    Infeasible,          // INFEASIBLE или TIMED_OUT без решения
    ConflictDetected,    // проверка после солвера нашла пересечение
    SolverError          // сбой бэкенда
};

std::string failureKindToString(FailureKind kind);

struct GenerationStats {
    int instances;
    int variables;
    int constraints;
    long long objective;
    double solveSeconds;
    double totalSeconds;
    std::string backend;
};

struct GenerationResult {
    bool ok;
    SolveStatus solverStatus;
    FailureKind failure;
    std::string message;
    std::vector<TimetableSlot> slots;
    GenerationStats stats;

    // FailureKind::InfeasibleCandidate
    int instanceId;
    int offeringId;
    int sessionIndex;

    // FailureKind::ConflictDetected
    ConflictResource conflictResource;
    int conflictResourceId;
    int conflictTimeSlotId;
    int conflictFirstId;
    int conflictSecondId;
};

// Один полный прогон: кандидаты -> модель -> солвер -> записи.
// Ошибки движка не пробрасываются, а попадают в GenerationResult;
// CatalogError и прочие ошибки входных данных летят наружу.
GenerationResult generateTimetable(
    const Catalog& catalog,
    const EngineConfig& cfg,
    std::unique_ptr<SolverBackend> backend = makeDefaultBackend()
);

// Откуда взят каталог прогона
enum class CatalogSource {
    Request,  // тело запроса или файл
    Demo,     // встроенный демо-каталог
    Database  // справочники из PostgreSQL
};

std::string catalogSourceToString(CatalogSource source);

// Сохранённое расписание ссылается на id справочников БД, поэтому
// заменять его можно только удачным прогоном по каталогу из БД.
bool shouldStoreTimetable(CatalogSource source, const GenerationResult& result);
