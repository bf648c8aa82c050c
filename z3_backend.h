#pragma once

#include <string>

#include "solver.h"

// Бэкенд на Z3: сначала ищем любое допустимое решение (z3::solver),
// затем, если есть цель и осталось время, улучшаем его через z3::optimize.
class Z3Backend : public SolverBackend {
public:
    std::string name() const override { return "z3"; }

    BackendResult solve(const ConstraintModel& model, const SolveLimits& limits) override;
};

// Таймаут Z3 в миллисекундах на остаток лимита; 0 = без лимита.
// Лимит, не влезающий в unsigned, тоже считается "без лимита".
unsigned z3TimeoutMs(double limitSeconds, double elapsedSeconds);

// Текст для unknown от Z3: истёк лимит или солвер сдался сам
std::string describeUnknown(const std::string& reason, const SolveLimits& limits);
