#pragma once

#include "candidates.h"
#include "catalog.h"
#include "config.h"
#include "constraint_model.h"

// Строит 0/1-модель по занятиям и их кандидатам:
// полнота назначения, непересечение преподавателей/аудиторий/групп,
// недельная нагрузка + мягкая цель (крайние пары, баланс по дням, предпочтения).
ConstraintModel buildConstraintModel(
    const Catalog& catalog,
    const CandidateSet& candidates,
    const EngineConfig& cfg
);
