#pragma once

#include <map>
#include <string>
#include <vector>

// 0/1-модель без привязки к конкретному солверу:
// булевы переменные, линейные ограничения, линейная цель (минимизация).

enum class VariableKind {
    Placement, // (занятие, кандидат)
    Auxiliary  // вспомогательные для мягких ограничений
};

struct ModelVariable {
    VariableKind kind;
    int instanceIndex;  // -1 для Auxiliary
    int candidateIndex; // -1 для Auxiliary
    std::string name;
};

struct LinearTerm {
    int var;
    int coeff;
};

enum class ConstraintSense {
    Equal,
    AtMost
};

struct LinearConstraint {
    std::vector<LinearTerm> terms;
    ConstraintSense sense;
    int bound;
    std::string label; // для логов и диагностики
};

class ConstraintModel {
public:
    int addVariable(const ModelVariable& v);
    void addConstraint(LinearConstraint c);
    void addObjectiveTerm(int var, int coeff);

    const std::vector<ModelVariable>& variables() const { return variables_; }
    const std::vector<LinearConstraint>& constraints() const { return constraints_; }

    // Слагаемые цели с ненулевым коэффициентом, по возрастанию номера переменной
    std::vector<LinearTerm> objective() const;
    bool hasObjective() const;

    // Переменные размещений одного занятия
    const std::vector<int>& instanceVariables(int instanceIndex) const;
    int instanceCount() const { return (int)instanceVars_.size(); }

    bool isSatisfiedBy(const std::vector<bool>& assignment) const;

    // Первое нарушенное ограничение или nullptr
    const LinearConstraint* firstViolated(const std::vector<bool>& assignment) const;

    long long objectiveValue(const std::vector<bool>& assignment) const;

private:
    std::vector<ModelVariable> variables_;
    std::vector<LinearConstraint> constraints_;
    std::map<int, long long> objective_;
    std::vector<std::vector<int>> instanceVars_;
};
