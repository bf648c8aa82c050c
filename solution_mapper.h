#pragma once

#include <vector>

#include "candidates.h"
#include "catalog.h"
#include "constraint_model.h"
#include "model.h"

// Назначение солвера -> записи расписания, пронумерованные 1..n
// в порядке (день, первая пара, аудитория, оферинг, номер занятия).
// Кидает ConflictDetectedError, если у занятия не ровно одно размещение
// или записи пересекаются; частичный результат не возвращается.
std::vector<TimetableSlot> mapSolution(
    const Catalog& catalog,
    const CandidateSet& candidates,
    const ConstraintModel& model,
    const std::vector<bool>& assignment
);

// Повторная проверка непересечения преподавателей, аудиторий и групп
void checkIntegrity(const Catalog& catalog, const std::vector<TimetableSlot>& records);
