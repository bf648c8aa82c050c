// solution_mapper.cpp
#include "solution_mapper.h"

#include "errors.h"
#include "logger.h"
#include "validator.h"

#include <algorithm>
#include <tuple>

namespace {

std::tuple<int, int, int, int, int> orderKey(const Catalog& catalog, const TimetableSlot& rec) {
    const TimeSlot* first = catalog.findTimeSlotById(rec.timeSlotIds.front());
    return std::make_tuple(first->dayOfWeek, first->period, rec.roomId, rec.offeringId, rec.sessionIndex);
}

std::string resourceLabel(ConflictResource r) {
    switch (r) {
        case ConflictResource::Teacher: return "преподаватель";
        case ConflictResource::Room:    return "аудитория";
        case ConflictResource::Section: return "группа";
        default:                        return "занятие";
    }
}

} // namespace

void checkIntegrity(const Catalog& catalog, const std::vector<TimetableSlot>& records) {
    std::vector<Overlap> overlaps = findOverlaps(catalog, records);
    if (overlaps.empty()) return;

    for (const Overlap& ov : overlaps) {
        logError("[ConflictDetected] " + resourceLabel(ov.resource) + " id=" +
                 std::to_string(ov.resourceId) + ", слот id=" + std::to_string(ov.timeSlotId) +
                 ": записи #" + std::to_string(ov.firstId) + " и #" + std::to_string(ov.secondId));
    }

    const Overlap& ov = overlaps.front();
    throw ConflictDetectedError(
        "Records " + std::to_string(ov.firstId) + " and " + std::to_string(ov.secondId) +
            " overlap on " + conflictResourceToString(ov.resource) + " " +
            std::to_string(ov.resourceId) + " at time slot " + std::to_string(ov.timeSlotId),
        ov.resource,
        ov.resourceId,
        ov.timeSlotId,
        ov.firstId,
        ov.secondId
    );
}

std::vector<TimetableSlot> mapSolution(
    const Catalog& catalog,
    const CandidateSet& candidates,
    const ConstraintModel& model,
    const std::vector<bool>& assignment
) {
    std::vector<TimetableSlot> records;
    records.reserve(candidates.instances.size());

    for (size_t i = 0; i < candidates.instances.size(); ++i) {
        const SessionInstance& inst = candidates.instances[i];

        int chosen = -1;
        int trueCount = 0;
        for (int var : model.instanceVariables((int)i)) {
            if (var < (int)assignment.size() && assignment[var]) {
                if (chosen < 0) chosen = var;
                ++trueCount;
            }
        }

        if (trueCount != 1) {
            logError("[ConflictDetected] У занятия id=" + std::to_string(inst.id) +
                     " выбрано размещений: " + std::to_string(trueCount));
            throw ConflictDetectedError(
                "Session instance " + std::to_string(inst.id) + " of offering " +
                    std::to_string(inst.offeringId) + " has " + std::to_string(trueCount) +
                    " selected placements instead of exactly one",
                ConflictResource::Assignment,
                inst.offeringId,
                -1,
                inst.id,
                -1
            );
        }

        const ModelVariable& mv = model.variables()[chosen];
        const Candidate& cand = candidates.candidates[i][mv.candidateIndex];

        TimetableSlot rec;
        rec.id           = 0;
        rec.offeringId   = inst.offeringId;
        rec.sessionIndex = inst.sessionIndex;
        rec.sectionId    = inst.sectionId;
        rec.roomId       = cand.roomId;
        rec.timeSlotIds  = cand.slotIds;
        records.push_back(rec);
    }

    std::sort(records.begin(), records.end(),
        [&catalog](const TimetableSlot& a, const TimetableSlot& b) {
            return orderKey(catalog, a) < orderKey(catalog, b);
        });

    for (size_t k = 0; k < records.size(); ++k) {
        records[k].id = (int)k + 1;
    }

    checkIntegrity(catalog, records);

    logInfo("Записей расписания: " + std::to_string(records.size()));
    return records;
}
