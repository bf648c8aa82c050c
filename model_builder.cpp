// model_builder.cpp
#include "model_builder.h"

#include "logger.h"

#include <map>
#include <set>
#include <utility>

namespace {

// (ресурс, слот) -> переменные, покрывающие слот
using OccupancyTable = std::map<std::pair<int, int>, std::vector<int>>;

void addAtMostOne(
    ConstraintModel& model,
    const OccupancyTable& table,
    const std::string& what
) {
    for (const auto& p : table) {
        if (p.second.size() < 2) continue;

        LinearConstraint c;
        c.sense = ConstraintSense::AtMost;
        c.bound = 1;
        c.label = what + "_" + std::to_string(p.first.first) + "@" + std::to_string(p.first.second);
        for (int var : p.second) c.terms.push_back({var, 1});
        model.addConstraint(std::move(c));
    }
}

void addCompleteness(ConstraintModel& model, const CandidateSet& cs) {
    for (size_t i = 0; i < cs.instances.size(); ++i) {
        LinearConstraint c;
        c.sense = ConstraintSense::Equal;
        c.bound = 1;
        c.label = "assign_" + std::to_string(cs.instances[i].id);
        for (int var : model.instanceVariables((int)i)) c.terms.push_back({var, 1});
        model.addConstraint(std::move(c));
    }
}

void addWeeklyLoad(
    ConstraintModel& model,
    const Catalog& catalog,
    const CandidateSet& cs
) {
    std::map<int, std::vector<LinearTerm>> perTeacher;
    std::map<int, int> demand; // сколько часов требуется при любом размещении

    for (size_t i = 0; i < cs.instances.size(); ++i) {
        const SessionInstance& inst = cs.instances[i];
        demand[inst.teacherId] += inst.hours;
        for (int var : model.instanceVariables((int)i)) {
            perTeacher[inst.teacherId].push_back({var, inst.hours});
        }
    }

    for (auto& p : perTeacher) {
        const Teacher* t = catalog.findTeacherById(p.first);
        if (!t || t->maxWeeklyLoad <= 0) continue;

        if (demand[p.first] > t->maxWeeklyLoad) {
            logWarning("Преподаватель " + t->name + ": требуется " +
                       std::to_string(demand[p.first]) + " ч в неделю при лимите " +
                       std::to_string(t->maxWeeklyLoad) + " ч, модель будет несовместна.");
        }

        LinearConstraint c;
        c.sense = ConstraintSense::AtMost;
        c.bound = t->maxWeeklyLoad;
        c.label = "load_teacher_" + std::to_string(t->id);
        c.terms = std::move(p.second);
        model.addConstraint(std::move(c));
    }
}

// Крайние пары, предпочтения, предпочтительная аудитория
void addPlacementObjective(
    ConstraintModel& model,
    const Catalog& catalog,
    const CandidateSet& cs,
    const ObjectiveWeights& w
) {
    std::map<int, int> timePref;                    // slotId -> вес
    std::map<std::pair<int, int>, int> sectionPref; // (sectionId, slotId) -> вес

    for (const Constraint& c : catalog.activePreferences()) {
        if (c.type == ConstraintType::TimePreference) {
            timePref[c.timeSlotId] += c.weight;
        } else if (c.type == ConstraintType::SectionPreference) {
            sectionPref[{c.sectionId, c.timeSlotId}] += c.weight;
        }
    }

    for (int var = 0; var < (int)model.variables().size(); ++var) {
        const ModelVariable& mv = model.variables()[var];
        if (mv.kind != VariableKind::Placement) continue;

        const SessionInstance& inst = cs.instances[mv.instanceIndex];
        const Candidate& cand = cs.candidates[mv.instanceIndex][mv.candidateIndex];

        int coeff = 0;

        bool edge = false;
        for (int slotId : cand.slotIds) {
            if (catalog.isEdgePeriod(slotId)) edge = true;

            auto tp = timePref.find(slotId);
            if (tp != timePref.end()) coeff -= w.preferenceScale * tp->second;

            auto sp = sectionPref.find({inst.sectionId, slotId});
            if (sp != sectionPref.end()) coeff -= w.preferenceScale * sp->second;
        }
        if (edge) coeff += w.edgePeriodPenalty;

        const Offering* o = catalog.findOfferingById(inst.offeringId);
        if (o && o->preferredRoomId >= 0 && o->preferredRoomId == cand.roomId) {
            coeff -= w.preferredRoomBonus;
        }

        model.addObjectiveTerm(var, coeff);
    }
}

// Сумма квадратов числа занятий группы по дням.
// atLeast[k] = 1, если в день стоит >= k занятий; n^2 = sum_{k<=n} (2k - 1).
void addDailyBalance(
    ConstraintModel& model,
    const Catalog& catalog,
    const CandidateSet& cs,
    int penalty
) {
    if (penalty <= 0) return;

    // (sectionId, day) -> переменные и различные занятия
    std::map<std::pair<int, int>, std::vector<int>> dayVars;
    std::map<std::pair<int, int>, std::set<int>> dayInstances;

    for (int var = 0; var < (int)model.variables().size(); ++var) {
        const ModelVariable& mv = model.variables()[var];
        if (mv.kind != VariableKind::Placement) continue;

        const SessionInstance& inst = cs.instances[mv.instanceIndex];
        const Candidate& cand = cs.candidates[mv.instanceIndex][mv.candidateIndex];
        const TimeSlot* start = catalog.findTimeSlotById(cand.startSlotId);

        std::pair<int, int> key(inst.sectionId, start->dayOfWeek);
        dayVars[key].push_back(var);
        dayInstances[key].insert(mv.instanceIndex);
    }

    std::set<int> sectionIds;
    for (const auto& p : dayVars) sectionIds.insert(p.first.first);

    // дни без доступных слотов кандидатов не дают
    const std::vector<int> days = catalog.assignableDays();

    for (int sectionId : sectionIds) {
        for (int day : days) {
            auto it = dayVars.find({sectionId, day});
            if (it == dayVars.end()) continue;

            int maxCount = (int)dayInstances[it->first].size();

            for (int k = 1; k <= maxCount; ++k) {
                int aux = model.addVariable(ModelVariable{
                    VariableKind::Auxiliary, -1, -1,
                    "atleast_s" + std::to_string(sectionId) + "_d" + std::to_string(day) +
                        "_k" + std::to_string(k)
                });

                // sum(day) - maxCount * aux <= k - 1
                LinearConstraint c;
                c.sense = ConstraintSense::AtMost;
                c.bound = k - 1;
                c.label = "balance_s" + std::to_string(sectionId) + "_d" + std::to_string(day) +
                          "_k" + std::to_string(k);
                for (int var : it->second) c.terms.push_back({var, 1});
                c.terms.push_back({aux, -maxCount});
                model.addConstraint(std::move(c));

                model.addObjectiveTerm(aux, penalty * (2 * k - 1));
            }
        }
    }
}

} // namespace

ConstraintModel buildConstraintModel(
    const Catalog& catalog,
    const CandidateSet& cs,
    const EngineConfig& cfg
) {
    ConstraintModel model;

    OccupancyTable teacherSlots;
    OccupancyTable roomSlots;
    OccupancyTable sectionSlots;

    // 1) переменные: одна на (занятие, кандидат)
    for (size_t i = 0; i < cs.instances.size(); ++i) {
        const SessionInstance& inst = cs.instances[i];
        const std::vector<Candidate>& cands = cs.candidates[i];

        for (size_t c = 0; c < cands.size(); ++c) {
            const Candidate& cand = cands[c];
            int var = model.addVariable(ModelVariable{
                VariableKind::Placement, (int)i, (int)c,
                "x_" + std::to_string(inst.id) + "_" + std::to_string(cand.startSlotId) +
                    "_" + std::to_string(cand.roomId)
            });

            // блок лабораторной покрывает все свои слоты
            for (int slotId : cand.slotIds) {
                teacherSlots[{inst.teacherId, slotId}].push_back(var);
                roomSlots[{cand.roomId, slotId}].push_back(var);
                sectionSlots[{inst.sectionId, slotId}].push_back(var);
            }
        }
    }

    // 2) жёсткие ограничения
    addCompleteness(model, cs);
    addAtMostOne(model, teacherSlots, "teacher");
    addAtMostOne(model, roomSlots, "room");
    addAtMostOne(model, sectionSlots, "section");
    addWeeklyLoad(model, catalog, cs);

    size_t placementVars = model.variables().size();

    // 3) мягкая цель
    addPlacementObjective(model, catalog, cs, cfg.weights);
    addDailyBalance(model, catalog, cs, cfg.weights.dailyBalancePenalty);

    logInfo("Модель: переменных размещения=" + std::to_string(placementVars) +
            ", вспомогательных=" + std::to_string(model.variables().size() - placementVars) +
            ", ограничений=" + std::to_string(model.constraints().size()) +
            ", слагаемых цели=" + std::to_string(model.objective().size()));

    return model;
}
