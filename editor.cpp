// editor.cpp
#include "editor.h"

#include "candidates.h"
#include "errors.h"
#include "logger.h"

#include <algorithm>

static bool sharesSlot(const TimetableSlot& a, const std::vector<int>& slotIds) {
    for (int s : a.timeSlotIds) {
        if (std::find(slotIds.begin(), slotIds.end(), s) != slotIds.end()) return true;
    }
    return false;
}

static InvalidMoveError rejected(MoveRule rule, const std::string& reason) {
    logWarning("[InvalidMove] " + moveRuleToString(rule) + ": " + reason);
    return InvalidMoveError(reason, rule);
}

TimetableEditor::TimetableEditor(const Catalog& catalog, Timetable& timetable, const EngineConfig& cfg)
    : catalog_(catalog),
      timetable_(timetable),
      cfg_(cfg) {}

SessionInstance TimetableEditor::instanceFor(const TimetableSlot& record) const {
    const Offering* o = catalog_.findOfferingById(record.offeringId);
    const Course* course = o ? catalog_.findCourseById(o->courseId) : nullptr;
    if (!o || !course) {
        throw rejected(MoveRule::UnknownSlot,
                       "Запись #" + std::to_string(record.id) +
                       " ссылается на несуществующий оферинг id=" +
                       std::to_string(record.offeringId) + ".");
    }

    SessionInstance inst;
    inst.id           = record.id;
    inst.offeringId   = o->id;
    inst.sessionIndex = record.sessionIndex;
    inst.courseId     = course->id;
    inst.teacherId    = o->teacherId;
    inst.sectionId    = record.sectionId;
    inst.blockLength  = blockLengthFor(*course, cfg_);
    inst.hours        = inst.blockLength * cfg_.hoursPerPeriod;
    return inst;
}

void TimetableEditor::checkConflicts(
    const TimetableSlot& moved,
    const SessionInstance& instance
) const {
    const std::vector<TimetableSlot>& all = timetable_.slots();

    // аудитория
    for (const TimetableSlot& other : all) {
        if (other.id == moved.id) continue;
        if (other.roomId == moved.roomId && sharesSlot(other, moved.timeSlotIds)) {
            const Room* room = catalog_.findRoomById(moved.roomId);
            throw rejected(MoveRule::RoomConflict,
                           "Аудитория " + (room ? room->number : std::to_string(moved.roomId)) +
                           " уже занята записью #" + std::to_string(other.id) + ".");
        }
    }

    // преподаватель
    for (const TimetableSlot& other : all) {
        if (other.id == moved.id) continue;
        const Offering* o = catalog_.findOfferingById(other.offeringId);
        if (o && o->teacherId == instance.teacherId && sharesSlot(other, moved.timeSlotIds)) {
            const Teacher* t = catalog_.findTeacherById(instance.teacherId);
            throw rejected(MoveRule::TeacherConflict,
                           "Преподаватель " + (t ? t->name : std::to_string(instance.teacherId)) +
                           " в это время ведёт запись #" + std::to_string(other.id) + ".");
        }
    }

    // группа
    for (const TimetableSlot& other : all) {
        if (other.id == moved.id) continue;
        if (other.sectionId == moved.sectionId && sharesSlot(other, moved.timeSlotIds)) {
            const Section* s = catalog_.findSectionById(moved.sectionId);
            throw rejected(MoveRule::SectionConflict,
                           "У группы " + (s ? s->name : std::to_string(moved.sectionId)) +
                           " в это время запись #" + std::to_string(other.id) + ".");
        }
    }
}

TimetableSlot TimetableEditor::move(int slotId, int newTimeSlotId, int newRoomId) {
    const TimetableSlot* current = timetable_.findById(slotId);
    if (!current) {
        throw rejected(MoveRule::UnknownSlot,
                       "Запись расписания #" + std::to_string(slotId) + " не существует.");
    }
    if (!catalog_.findTimeSlotById(newTimeSlotId)) {
        throw rejected(MoveRule::UnknownTimeSlot,
                       "Слот id=" + std::to_string(newTimeSlotId) + " не существует.");
    }
    if (!catalog_.findRoomById(newRoomId)) {
        throw rejected(MoveRule::UnknownRoom,
                       "Аудитория id=" + std::to_string(newRoomId) + " не существует.");
    }

    SessionInstance inst = instanceFor(*current);

    PlacementCheck check = checkPlacement(catalog_, inst, newTimeSlotId, newRoomId);
    if (!check.ok) {
        throw rejected(check.rule, check.reason);
    }

    TimetableSlot moved = *current;
    moved.roomId      = newRoomId;
    moved.timeSlotIds = check.slotIds;

    checkConflicts(moved, inst);

    timetable_.update(moved);

    logInfo("Запись #" + std::to_string(moved.id) + " перенесена: слот id=" +
            std::to_string(newTimeSlotId) + ", аудитория id=" + std::to_string(newRoomId) +
            ", версия " + std::to_string(timetable_.version()));
    return moved;
}
