#pragma once

#include <string>
#include <vector>

#include "catalog.h"
#include "config.h"
#include "errors.h"
#include "model.h"

struct CandidateSet {
    std::vector<SessionInstance> instances;
    std::vector<std::vector<Candidate>> candidates; // candidates[i] для instances[i]
};

// Результат проверки одного размещения по жёстким правилам
struct PlacementCheck {
    bool ok;
    MoveRule rule;            // первое нарушенное правило, если !ok
    std::string reason;
    std::vector<int> slotIds; // покрытые слоты, если ok
};

int blockLengthFor(const Course& course, const EngineConfig& cfg);

// Слоты блока длины blockLength, начиная со startSlotId: один день,
// подряд идущие пары, все доступны. Пусто, если блок не собрать.
std::vector<int> resolveBlock(const Catalog& catalog, int startSlotId, int blockLength);

// Вместимость, тип, недоступность, перерывы, непрерывность блока.
// Пересечения с другими занятиями здесь НЕ проверяются.
PlacementCheck checkPlacement(
    const Catalog& catalog,
    const SessionInstance& instance,
    int startSlotId,
    int roomId
);

// Разворачивает оферинги в занятия (без кандидатов)
std::vector<SessionInstance> expandOfferings(const Catalog& catalog, const EngineConfig& cfg);

// Кидает InfeasibleCandidateError, если у какого-то занятия пустое множество кандидатов
CandidateSet generateCandidates(const Catalog& catalog, const EngineConfig& cfg);
