#include "constraint_model.h"

#include <stdexcept>
#include <utility>

int ConstraintModel::addVariable(const ModelVariable& v) {
    int index = (int)variables_.size();
    variables_.push_back(v);

    if (v.kind == VariableKind::Placement) {
        if (v.instanceIndex < 0) {
            throw std::invalid_argument("Placement variable without instance: " + v.name);
        }
        if ((int)instanceVars_.size() <= v.instanceIndex) {
            instanceVars_.resize(v.instanceIndex + 1);
        }
        instanceVars_[v.instanceIndex].push_back(index);
    }
    return index;
}

void ConstraintModel::addConstraint(LinearConstraint c) {
    for (const LinearTerm& t : c.terms) {
        if (t.var < 0 || t.var >= (int)variables_.size()) {
            throw std::out_of_range("Constraint " + c.label + " references unknown variable " +
                                    std::to_string(t.var));
        }
    }
    constraints_.push_back(std::move(c));
}

void ConstraintModel::addObjectiveTerm(int var, int coeff) {
    if (var < 0 || var >= (int)variables_.size()) {
        throw std::out_of_range("Objective references unknown variable " + std::to_string(var));
    }
    if (coeff == 0) return;
    objective_[var] += coeff;
}

std::vector<LinearTerm> ConstraintModel::objective() const {
    std::vector<LinearTerm> terms;
    for (const auto& p : objective_) {
        if (p.second != 0) terms.push_back({p.first, (int)p.second});
    }
    return terms;
}

bool ConstraintModel::hasObjective() const {
    for (const auto& p : objective_) {
        if (p.second != 0) return true;
    }
    return false;
}

const std::vector<int>& ConstraintModel::instanceVariables(int instanceIndex) const {
    static const std::vector<int> empty;
    if (instanceIndex < 0 || instanceIndex >= (int)instanceVars_.size()) return empty;
    return instanceVars_[instanceIndex];
}

const LinearConstraint* ConstraintModel::firstViolated(const std::vector<bool>& assignment) const {
    if (assignment.size() != variables_.size()) {
        throw std::invalid_argument("Assignment size " + std::to_string(assignment.size()) +
                                    " does not match model size " +
                                    std::to_string(variables_.size()));
    }

    for (const LinearConstraint& c : constraints_) {
        long long sum = 0;
        for (const LinearTerm& t : c.terms) {
            if (assignment[t.var]) sum += t.coeff;
        }
        bool ok = (c.sense == ConstraintSense::Equal) ? (sum == c.bound) : (sum <= c.bound);
        if (!ok) return &c;
    }
    return nullptr;
}

bool ConstraintModel::isSatisfiedBy(const std::vector<bool>& assignment) const {
    if (assignment.size() != variables_.size()) return false;
    return firstViolated(assignment) == nullptr;
}

long long ConstraintModel::objectiveValue(const std::vector<bool>& assignment) const {
    long long value = 0;
    for (const auto& p : objective_) {
        if (p.first < (int)assignment.size() && assignment[p.first]) value += p.second;
    }
    return value;
}
