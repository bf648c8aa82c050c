#include "catalog.h"

#include "errors.h"
#include "logger.h"

#include <algorithm>
#include <cstdio>
#include <utility>

// --- маленькие хелперы ---

template <typename T>
static void indexById(
    const std::vector<T>& items,
    std::map<int, size_t>& index,
    const char* what
) {
    for (size_t i = 0; i < items.size(); ++i) {
        if (!index.emplace(items[i].id, i).second) {
            throw CatalogError(std::string("Duplicate ") + what +
                               " id " + std::to_string(items[i].id));
        }
    }
}

template <typename T>
static const T* lookupById(
    const std::vector<T>& items,
    const std::map<int, size_t>& index,
    int id
) {
    auto it = index.find(id);
    if (it == index.end()) return nullptr;
    return &items[it->second];
}

bool operator==(const TimetableSlot& a, const TimetableSlot& b) {
    return a.id == b.id &&
           a.offeringId == b.offeringId &&
           a.sessionIndex == b.sessionIndex &&
           a.sectionId == b.sectionId &&
           a.roomId == b.roomId &&
           a.timeSlotIds == b.timeSlotIds;
}

std::string constraintTypeToString(ConstraintType type) {
    switch (type) {
        case ConstraintType::TeacherUnavailable: return "teacher_unavailable";
        case ConstraintType::RoomUnavailable:    return "room_unavailable";
        case ConstraintType::SectionPreference:  return "section_preference";
        case ConstraintType::TimePreference:     return "time_preference";
    }
    return "unknown";
}

bool constraintTypeFromString(const std::string& s, ConstraintType& out) {
    if (s == "teacher_unavailable") { out = ConstraintType::TeacherUnavailable; return true; }
    if (s == "room_unavailable")    { out = ConstraintType::RoomUnavailable;    return true; }
    if (s == "section_preference")  { out = ConstraintType::SectionPreference;  return true; }
    if (s == "time_preference")     { out = ConstraintType::TimePreference;     return true; }
    return false;
}

std::string formatTime(int minutesFromMidnight) {
    int h = minutesFromMidnight / 60;
    int m = minutesFromMidnight % 60;
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", h, m);
    return std::string(buf);
}

int parseTime(const std::string& hhmm) {
    int h = 0;
    int m = 0;
    char tail = 0;
    if (std::sscanf(hhmm.c_str(), "%d:%d%c", &h, &m, &tail) != 2 ||
        h < 0 || h > 23 || m < 0 || m > 59) {
        throw CatalogError("Invalid time value '" + hhmm + "', expected HH:MM");
    }
    return h * 60 + m;
}

std::string dayName(int dayOfWeek) {
    static const char* names[] = {
        "Понедельник", "Вторник", "Среда", "Четверг",
        "Пятница", "Суббота", "Воскресенье"
    };
    if (dayOfWeek < 0 || dayOfWeek > 6) return "День " + std::to_string(dayOfWeek);
    return names[dayOfWeek];
}

// ==================== Catalog ====================

Catalog::Catalog(CatalogData data)
    : data_(std::move(data)) {
    buildIndexes();
    checkReferences();

    // крайние пары каждого дня
    std::map<int, std::pair<const TimeSlot*, const TimeSlot*>> bounds;
    for (const TimeSlot& ts : data_.timeSlots) {
        if (!isAssignable(ts)) continue;
        auto it = bounds.find(ts.dayOfWeek);
        if (it == bounds.end()) {
            bounds[ts.dayOfWeek] = {&ts, &ts};
            continue;
        }
        if (ts.period < it->second.first->period)  it->second.first = &ts;
        if (ts.period > it->second.second->period) it->second.second = &ts;
    }
    for (const auto& b : bounds) {
        edgeSlots_.insert(b.second.first->id);
        edgeSlots_.insert(b.second.second->id);
    }

    for (const Constraint& c : data_.constraints) {
        if (!c.isActive) continue;

        int slotId = resolveConstraintSlot(c);
        if (slotId < 0) {
            logWarning("Ограничение id=" + std::to_string(c.id) + " (" + c.name +
                       ") ссылается на несуществующий слот (день " +
                       std::to_string(c.dayOfWeek) + ", пара " +
                       std::to_string(c.period) + "), пропускаем.");
            continue;
        }

        switch (c.type) {
            case ConstraintType::TeacherUnavailable:
                teacherUnavailable_.insert({c.teacherId, slotId});
                break;
            case ConstraintType::RoomUnavailable:
                roomUnavailable_.insert({c.roomId, slotId});
                break;
            case ConstraintType::SectionPreference:
            case ConstraintType::TimePreference: {
                Constraint resolved = c;
                resolved.timeSlotId = slotId;
                preferences_.push_back(resolved);
                break;
            }
        }
    }

    logDebug("Каталог: преподавателей=" + std::to_string(data_.teachers.size()) +
             ", курсов=" + std::to_string(data_.courses.size()) +
             ", групп=" + std::to_string(data_.sections.size()) +
             ", аудиторий=" + std::to_string(data_.rooms.size()) +
             ", слотов=" + std::to_string(data_.timeSlots.size()) +
             ", оферингов=" + std::to_string(data_.offerings.size()) +
             ", ограничений=" + std::to_string(data_.constraints.size()));
}

void Catalog::buildIndexes() {
    indexById(data_.teachers,  teacherIndex_,  "teacher");
    indexById(data_.courses,   courseIndex_,   "course");
    indexById(data_.sections,  sectionIndex_,  "section");
    indexById(data_.rooms,     roomIndex_,     "room");
    indexById(data_.timeSlots, timeSlotIndex_, "time slot");
    indexById(data_.offerings, offeringIndex_, "offering");

    for (size_t i = 0; i < data_.timeSlots.size(); ++i) {
        const TimeSlot& ts = data_.timeSlots[i];
        if (!dayPeriodIndex_.emplace(std::make_pair(ts.dayOfWeek, ts.period), i).second) {
            throw CatalogError("Duplicate time slot for day " + std::to_string(ts.dayOfWeek) +
                               ", period " + std::to_string(ts.period));
        }
    }
}

void Catalog::checkReferences() const {
    for (const Section& s : data_.sections) {
        if (s.studentCount < 0) {
            throw CatalogError("Section " + s.name + " has negative student count");
        }
    }
    for (const Room& r : data_.rooms) {
        if (r.capacity < 0) {
            throw CatalogError("Room " + r.number + " has negative capacity");
        }
    }
    for (const Course& c : data_.courses) {
        if (c.sessionsPerWeek < 0 || c.sessionDuration < 0) {
            throw CatalogError("Course " + c.code + " has negative session settings");
        }
    }

    for (const Offering& o : data_.offerings) {
        std::string prefix = "Offering " + std::to_string(o.id) + " references unknown ";
        if (!findCourseById(o.courseId))   throw CatalogError(prefix + "course " + std::to_string(o.courseId));
        if (!findTeacherById(o.teacherId)) throw CatalogError(prefix + "teacher " + std::to_string(o.teacherId));
        if (!findSectionById(o.sectionId)) throw CatalogError(prefix + "section " + std::to_string(o.sectionId));
        if (o.preferredRoomId >= 0 && !findRoomById(o.preferredRoomId)) {
            throw CatalogError(prefix + "room " + std::to_string(o.preferredRoomId));
        }
        if (o.sessionsPerWeek < 0) {
            throw CatalogError("Offering " + std::to_string(o.id) + " has negative sessions per week");
        }
    }

    for (const Constraint& c : data_.constraints) {
        std::string prefix = "Constraint " + std::to_string(c.id) + " (" +
                             constraintTypeToString(c.type) + ") ";

        if (c.type == ConstraintType::TeacherUnavailable && !findTeacherById(c.teacherId)) {
            throw CatalogError(prefix + "references unknown teacher " + std::to_string(c.teacherId));
        }
        if (c.type == ConstraintType::RoomUnavailable && !findRoomById(c.roomId)) {
            throw CatalogError(prefix + "references unknown room " + std::to_string(c.roomId));
        }
        if (c.type == ConstraintType::SectionPreference && !findSectionById(c.sectionId)) {
            throw CatalogError(prefix + "references unknown section " + std::to_string(c.sectionId));
        }

        if (c.timeSlotId >= 0) {
            if (!findTimeSlotById(c.timeSlotId)) {
                throw CatalogError(prefix + "references unknown time slot " + std::to_string(c.timeSlotId));
            }
        } else if (c.dayOfWeek < 0 || c.period < 0) {
            throw CatalogError(prefix + "has neither time slot id nor day/period");
        }
    }
}

const Teacher* Catalog::findTeacherById(int id) const {
    return lookupById(data_.teachers, teacherIndex_, id);
}

const Course* Catalog::findCourseById(int id) const {
    return lookupById(data_.courses, courseIndex_, id);
}

const Section* Catalog::findSectionById(int id) const {
    return lookupById(data_.sections, sectionIndex_, id);
}

const Room* Catalog::findRoomById(int id) const {
    return lookupById(data_.rooms, roomIndex_, id);
}

const TimeSlot* Catalog::findTimeSlotById(int id) const {
    return lookupById(data_.timeSlots, timeSlotIndex_, id);
}

const Offering* Catalog::findOfferingById(int id) const {
    return lookupById(data_.offerings, offeringIndex_, id);
}

const TimeSlot* Catalog::findTimeSlotAt(int dayOfWeek, int period) const {
    auto it = dayPeriodIndex_.find({dayOfWeek, period});
    if (it == dayPeriodIndex_.end()) return nullptr;
    return &data_.timeSlots[it->second];
}

bool Catalog::isAssignable(const TimeSlot& slot) const {
    return slot.isActive && !slot.isBreak;
}

bool Catalog::isEdgePeriod(int timeSlotId) const {
    return edgeSlots_.count(timeSlotId) > 0;
}

std::vector<int> Catalog::assignableDays() const {
    std::set<int> days;
    for (const TimeSlot& ts : data_.timeSlots) {
        if (isAssignable(ts)) days.insert(ts.dayOfWeek);
    }
    return std::vector<int>(days.begin(), days.end());
}

bool Catalog::isTeacherUnavailable(int teacherId, int timeSlotId) const {
    return teacherUnavailable_.count({teacherId, timeSlotId}) > 0;
}

bool Catalog::isRoomUnavailable(int roomId, int timeSlotId) const {
    return roomUnavailable_.count({roomId, timeSlotId}) > 0;
}

int Catalog::resolveConstraintSlot(const Constraint& c) const {
    if (c.timeSlotId >= 0) {
        return findTimeSlotById(c.timeSlotId) ? c.timeSlotId : -1;
    }
    const TimeSlot* ts = findTimeSlotAt(c.dayOfWeek, c.period);
    return ts ? ts->id : -1;
}

bool Catalog::isSchedulable(const Offering& offering) const {
    const Course* course = findCourseById(offering.courseId);
    const Teacher* teacher = findTeacherById(offering.teacherId);
    const Section* section = findSectionById(offering.sectionId);
    return course && teacher && section &&
           course->isActive && teacher->isActive && section->isActive;
}

int Catalog::sessionsPerWeek(const Offering& offering) const {
    if (offering.sessionsPerWeek > 0) return offering.sessionsPerWeek;
    const Course* course = findCourseById(offering.courseId);
    return course ? course->sessionsPerWeek : 0;
}
