#include "api_dto.h"

#include <cstdlib>
#include <stdexcept>

std::vector<TimetableSlotView> buildSlotViews(
    const Catalog& catalog,
    const std::vector<TimetableSlot>& slots
) {
    std::vector<TimetableSlotView> result;

    for (const TimetableSlot& s : slots) {
        const Offering* o  = catalog.findOfferingById(s.offeringId);
        const Course*   c  = o ? catalog.findCourseById(o->courseId) : nullptr;
        const Teacher*  t  = o ? catalog.findTeacherById(o->teacherId) : nullptr;
        const Section*  g  = catalog.findSectionById(s.sectionId);
        const Room*     r  = catalog.findRoomById(s.roomId);
        const TimeSlot* first = s.timeSlotIds.empty() ? nullptr
                                                      : catalog.findTimeSlotById(s.timeSlotIds.front());
        const TimeSlot* last  = s.timeSlotIds.empty() ? nullptr
                                                      : catalog.findTimeSlotById(s.timeSlotIds.back());

        TimetableSlotView v;
        v.slotId       = s.id;
        v.offeringId   = s.offeringId;
        v.sessionIndex = s.sessionIndex;
        v.courseCode   = c ? c->code : "?";
        v.courseName   = c ? c->name : "Неизвестный курс";
        v.isLab        = c ? c->isLab : false;
        v.teacherName  = t ? t->name : "Неизвестный преподаватель";
        v.teacherCode  = t ? t->code : "";
        v.sectionName  = g ? g->name : "Неизвестная группа";
        v.roomNumber   = r ? r->number : "Не назначена";
        v.roomName     = r ? r->name : "";
        v.timeSlotIds  = s.timeSlotIds;

        if (first && last) {
            v.dayOfWeek   = first->dayOfWeek;
            v.dayName     = dayName(first->dayOfWeek);
            v.firstPeriod = first->period;
            v.lastPeriod  = last->period;
            v.startTime   = formatTime(first->startMinutes);
            v.endTime     = formatTime(last->endMinutes);
        } else {
            v.dayOfWeek   = -1;
            v.dayName     = "Неизвестно";
            v.firstPeriod = -1;
            v.lastPeriod  = -1;
            v.startTime   = "--:--";
            v.endTime     = "--:--";
        }

        result.push_back(v);
    }

    return result;
}

std::string slotFilterKindToString(SlotFilterKind kind) {
    switch (kind) {
        case SlotFilterKind::All:     return "all";
        case SlotFilterKind::Section: return "section";
        case SlotFilterKind::Teacher: return "teacher";
        case SlotFilterKind::Room:    return "room";
    }
    return "unknown";
}

SlotFilter parseSlotFilter(const std::string& type, const std::string& id) {
    SlotFilter f{SlotFilterKind::All, -1};
    if (type.empty() || type == "all") return f;

    if (type == "section") {
        f.kind = SlotFilterKind::Section;
    } else if (type == "teacher") {
        f.kind = SlotFilterKind::Teacher;
    } else if (type == "room") {
        f.kind = SlotFilterKind::Room;
    } else {
        throw std::invalid_argument("Unknown filter type '" + type + "'");
    }

    char* end = nullptr;
    long value = std::strtol(id.c_str(), &end, 10);
    if (id.empty() || !end || *end != '\0' || value < 0) {
        throw std::invalid_argument("Filter id must be a non-negative integer, got '" + id + "'");
    }
    f.id = (int)value;
    return f;
}

std::vector<TimetableSlot> filterSlots(
    const Catalog& catalog,
    const std::vector<TimetableSlot>& slots,
    const SlotFilter& filter
) {
    if (filter.kind == SlotFilterKind::All) return slots;

    std::vector<TimetableSlot> result;
    for (const TimetableSlot& s : slots) {
        bool match = false;
        switch (filter.kind) {
            case SlotFilterKind::Section:
                match = s.sectionId == filter.id;
                break;
            case SlotFilterKind::Room:
                match = s.roomId == filter.id;
                break;
            case SlotFilterKind::Teacher: {
                const Offering* o = catalog.findOfferingById(s.offeringId);
                match = o && o->teacherId == filter.id;
                break;
            }
            case SlotFilterKind::All:
                match = true;
                break;
        }
        if (match) result.push_back(s);
    }
    return result;
}
