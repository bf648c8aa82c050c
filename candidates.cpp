// candidates.cpp
#include "candidates.h"

#include "logger.h"

#include <algorithm>
#include <utility>

// --- маленькие хелперы ---

static PlacementCheck passed(std::vector<int> slotIds) {
    return PlacementCheck{true, MoveRule::UnknownSlot, "", std::move(slotIds)};
}

static PlacementCheck violated(MoveRule rule, const std::string& reason) {
    return PlacementCheck{false, rule, reason, {}};
}

static std::string describeSlot(const TimeSlot& ts) {
    return dayName(ts.dayOfWeek) + ", пара " + std::to_string(ts.period) +
           " (" + formatTime(ts.startMinutes) + "-" + formatTime(ts.endMinutes) + ")";
}

static bool isLabRoom(const Room& room) {
    return room.roomType == "lab";
}

// Стартовый слот и непрерывность блока
static PlacementCheck checkSlots(
    const Catalog& catalog,
    const SessionInstance& instance,
    int startSlotId
) {
    const TimeSlot* start = catalog.findTimeSlotById(startSlotId);
    if (!start) {
        return violated(MoveRule::UnknownTimeSlot,
                        "Слот id=" + std::to_string(startSlotId) + " не существует.");
    }
    if (!catalog.isAssignable(*start)) {
        return violated(MoveRule::BreakSlot,
                        "Слот " + describeSlot(*start) + " является перерывом или неактивен.");
    }

    // блок задевает перерыв или выключенную пару того же дня
    for (int k = 1; k < instance.blockLength; ++k) {
        const TimeSlot* next = catalog.findTimeSlotAt(start->dayOfWeek, start->period + k);
        if (next && !catalog.isAssignable(*next)) {
            return violated(MoveRule::BreakSlot,
                            "Блок от слота " + describeSlot(*start) + " задевает перерыв " +
                            describeSlot(*next) + ".");
        }
    }

    std::vector<int> slots = resolveBlock(catalog, startSlotId, instance.blockLength);
    if (slots.empty()) {
        return violated(MoveRule::BlockNotContiguous,
                        "Начиная со слота " + describeSlot(*start) + " нельзя собрать " +
                        std::to_string(instance.blockLength) + " подряд идущих пар без перерыва.");
    }
    return passed(std::move(slots));
}

// Аудитория подходит группе и курсу
static PlacementCheck checkRoom(
    const Catalog& catalog,
    const SessionInstance& instance,
    const Room& room
) {
    if (!room.isActive) {
        return violated(MoveRule::RoomInactive,
                        "Аудитория " + room.number + " неактивна.");
    }

    const Section* section = catalog.findSectionById(instance.sectionId);
    if (section && section->studentCount > room.capacity) {
        return violated(MoveRule::RoomCapacity,
                        "Аудитория " + room.number + " слишком мала для группы " + section->name +
                        ": capacity=" + std::to_string(room.capacity) +
                        ", studentCount=" + std::to_string(section->studentCount) + ".");
    }

    const Course* course = catalog.findCourseById(instance.courseId);
    if (course && course->isLab && !isLabRoom(room)) {
        return violated(MoveRule::RoomType,
                        "Лабораторный курс " + course->code + " нельзя ставить в аудиторию " +
                        room.number + " типа '" + room.roomType + "'.");
    }
    return passed({});
}

// Жёсткие ограничения недоступности на всех слотах блока
static PlacementCheck checkAvailability(
    const Catalog& catalog,
    const SessionInstance& instance,
    const Room& room,
    const std::vector<int>& slots
) {
    for (int slotId : slots) {
        if (catalog.isTeacherUnavailable(instance.teacherId, slotId)) {
            const Teacher* t = catalog.findTeacherById(instance.teacherId);
            const TimeSlot* ts = catalog.findTimeSlotById(slotId);
            return violated(MoveRule::TeacherUnavailable,
                            "Преподаватель " + (t ? t->name : std::to_string(instance.teacherId)) +
                            " недоступен: " + (ts ? describeSlot(*ts) : std::to_string(slotId)) + ".");
        }
    }
    for (int slotId : slots) {
        if (catalog.isRoomUnavailable(room.id, slotId)) {
            const TimeSlot* ts = catalog.findTimeSlotById(slotId);
            return violated(MoveRule::RoomUnavailable,
                            "Аудитория " + room.number + " недоступна: " +
                            (ts ? describeSlot(*ts) : std::to_string(slotId)) + ".");
        }
    }
    return passed({});
}

int blockLengthFor(const Course& course, const EngineConfig& cfg) {
    if (!course.isLab) return 1;
    if (course.sessionDuration >= 2) return course.sessionDuration;
    return cfg.defaultLabBlockLength;
}

std::vector<int> resolveBlock(const Catalog& catalog, int startSlotId, int blockLength) {
    std::vector<int> slots;

    const TimeSlot* start = catalog.findTimeSlotById(startSlotId);
    if (!start || !catalog.isAssignable(*start) || blockLength < 1) return slots;

    slots.push_back(start->id);
    for (int k = 1; k < blockLength; ++k) {
        const TimeSlot* next = catalog.findTimeSlotAt(start->dayOfWeek, start->period + k);
        if (!next || !catalog.isAssignable(*next)) {
            return {};
        }
        slots.push_back(next->id);
    }
    return slots;
}

PlacementCheck checkPlacement(
    const Catalog& catalog,
    const SessionInstance& instance,
    int startSlotId,
    int roomId
) {
    PlacementCheck slots = checkSlots(catalog, instance, startSlotId);
    if (!slots.ok) return slots;

    const Room* room = catalog.findRoomById(roomId);
    if (!room) {
        return violated(MoveRule::UnknownRoom,
                        "Аудитория id=" + std::to_string(roomId) + " не существует.");
    }

    PlacementCheck roomCheck = checkRoom(catalog, instance, *room);
    if (!roomCheck.ok) return roomCheck;

    PlacementCheck availability = checkAvailability(catalog, instance, *room, slots.slotIds);
    if (!availability.ok) return availability;

    return slots;
}

std::vector<SessionInstance> expandOfferings(const Catalog& catalog, const EngineConfig& cfg) {
    std::vector<const Offering*> ordered;
    for (const Offering& o : catalog.offerings()) ordered.push_back(&o);
    std::sort(ordered.begin(), ordered.end(),
        [](const Offering* a, const Offering* b) { return a->id < b->id; });

    std::vector<SessionInstance> instances;
    int nextId = 1;

    for (const Offering* o : ordered) {
        if (!catalog.isSchedulable(*o)) {
            logWarning("Оферинг id=" + std::to_string(o->id) +
                       " пропущен: курс, преподаватель или группа неактивны.");
            continue;
        }

        int sessions = catalog.sessionsPerWeek(*o);
        if (sessions <= 0) {
            logWarning("Оферинг id=" + std::to_string(o->id) +
                       " пропущен: 0 занятий в неделю.");
            continue;
        }

        const Course* course = catalog.findCourseById(o->courseId);
        int blockLength = blockLengthFor(*course, cfg);

        for (int s = 0; s < sessions; ++s) {
            SessionInstance inst;
            inst.id           = nextId++;
            inst.offeringId   = o->id;
            inst.sessionIndex = s;
            inst.courseId     = o->courseId;
            inst.teacherId    = o->teacherId;
            inst.sectionId    = o->sectionId;
            inst.blockLength  = blockLength;
            inst.hours        = blockLength * cfg.hoursPerPeriod;
            instances.push_back(inst);
        }
    }

    return instances;
}

CandidateSet generateCandidates(const Catalog& catalog, const EngineConfig& cfg) {
    CandidateSet result;
    result.instances = expandOfferings(catalog, cfg);

    // слоты по (день, пара), аудитории по id: прогон детерминирован
    std::vector<const TimeSlot*> slotOrder;
    for (const TimeSlot& ts : catalog.timeSlots()) {
        if (catalog.isAssignable(ts)) slotOrder.push_back(&ts);
    }
    std::sort(slotOrder.begin(), slotOrder.end(),
        [](const TimeSlot* a, const TimeSlot* b) {
            if (a->dayOfWeek != b->dayOfWeek) return a->dayOfWeek < b->dayOfWeek;
            return a->period < b->period;
        });

    std::vector<const Room*> roomOrder;
    for (const Room& r : catalog.rooms()) roomOrder.push_back(&r);
    std::sort(roomOrder.begin(), roomOrder.end(),
        [](const Room* a, const Room* b) { return a->id < b->id; });

    size_t total = 0;
    std::vector<size_t> emptyInstances;

    for (size_t i = 0; i < result.instances.size(); ++i) {
        const SessionInstance& inst = result.instances[i];
        std::vector<Candidate> candidates;

        std::vector<const Room*> rooms;
        for (const Room* r : roomOrder) {
            if (checkRoom(catalog, inst, *r).ok) rooms.push_back(r);
        }

        for (const TimeSlot* ts : slotOrder) {
            PlacementCheck slots = checkSlots(catalog, inst, ts->id);
            if (!slots.ok) continue;

            for (const Room* r : rooms) {
                if (!checkAvailability(catalog, inst, *r, slots.slotIds).ok) continue;
                candidates.push_back(Candidate{ts->id, r->id, slots.slotIds});
            }
        }

        if (candidates.empty()) {
            emptyInstances.push_back(i);
        }
        total += candidates.size();
        result.candidates.push_back(std::move(candidates));
    }

    for (size_t i : emptyInstances) {
        const SessionInstance& inst = result.instances[i];
        const Course* course = catalog.findCourseById(inst.courseId);
        const Section* section = catalog.findSectionById(inst.sectionId);
        logError("[InfeasibleCandidate] Нет допустимых размещений для занятия #" +
                 std::to_string(inst.sessionIndex + 1) + " оферинга id=" +
                 std::to_string(inst.offeringId) + " (курс " + course->code +
                 ", группа " + section->name + ", блок " +
                 std::to_string(inst.blockLength) + ").");
    }

    if (!emptyInstances.empty()) {
        const SessionInstance& inst = result.instances[emptyInstances.front()];
        const Course* course = catalog.findCourseById(inst.courseId);
        throw InfeasibleCandidateError(
            "No legal (time slot, room) placement for session " +
                std::to_string(inst.sessionIndex + 1) + " of offering " +
                std::to_string(inst.offeringId) + " (course " + course->code + ")",
            inst.id,
            inst.offeringId,
            inst.sessionIndex
        );
    }

    logInfo("Кандидаты: занятий=" + std::to_string(result.instances.size()) +
            ", размещений всего=" + std::to_string(total));
    return result;
}
