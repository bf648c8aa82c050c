#include "api_json.h"

#include <stdexcept>

using nlohmann::json;

// --- чтение полей с понятными ошибками ---

static const json& requireField(const json& j, const char* key, const std::string& where) {
    if (!j.is_object() || !j.contains(key)) {
        throw CatalogError(where + ": missing field '" + key + "'");
    }
    return j.at(key);
}

static int requireInt(const json& j, const char* key, const std::string& where) {
    const json& v = requireField(j, key, where);
    if (!v.is_number_integer()) {
        throw CatalogError(where + ": field '" + key + "' must be an integer");
    }
    return v.get<int>();
}

static std::string where(const char* collection, size_t index) {
    return std::string(collection) + "[" + std::to_string(index) + "]";
}

static const json& arrayOrEmpty(const json& j, const char* key) {
    static const json empty = json::array();
    if (!j.contains(key)) return empty;
    const json& v = j.at(key);
    if (!v.is_array()) {
        throw CatalogError(std::string("Catalog field '") + key + "' must be an array");
    }
    return v;
}

// j.value(...) кидает json::type_error на неверном типе; переводим в CatalogError
template <typename T>
static T optionalField(const json& j, const char* key, const T& fallback, const std::string& at) {
    try {
        return j.value(key, fallback);
    } catch (const json::exception& e) {
        throw CatalogError(at + ": field '" + key + "' has wrong type (" + e.what() + ")");
    }
}

// ==================== каталог ====================

CatalogData catalogDataFromJson(const json& j) {
    if (!j.is_object()) {
        throw CatalogError("Catalog must be a JSON object");
    }

    CatalogData data;

    const json& teachers = arrayOrEmpty(j, "teachers");
    for (size_t i = 0; i < teachers.size(); ++i) {
        const json& jt = teachers[i];
        std::string at = where("teachers", i);
        Teacher t;
        t.id            = requireInt(jt, "id", at);
        t.name          = optionalField<std::string>(jt, "name", "", at);
        t.code          = optionalField<std::string>(jt, "code", "", at);
        t.designation   = optionalField<std::string>(jt, "designation", "", at);
        t.maxWeeklyLoad = optionalField<int>(jt, "maxWeeklyLoad", 0, at);
        t.isActive      = optionalField<bool>(jt, "isActive", true, at);
        data.teachers.push_back(t);
    }

    const json& courses = arrayOrEmpty(j, "courses");
    for (size_t i = 0; i < courses.size(); ++i) {
        const json& jc = courses[i];
        std::string at = where("courses", i);
        Course c;
        c.id              = requireInt(jc, "id", at);
        c.code            = optionalField<std::string>(jc, "code", "", at);
        c.name            = optionalField<std::string>(jc, "name", "", at);
        c.creditHours     = optionalField<int>(jc, "creditHours", 0, at);
        c.sessionsPerWeek = requireInt(jc, "sessionsPerWeek", at);
        c.sessionDuration = optionalField<int>(jc, "sessionDuration", 1, at);
        c.isLab           = optionalField<bool>(jc, "isLab", false, at);
        c.program         = optionalField<std::string>(jc, "program", "", at);
        c.semester        = optionalField<std::string>(jc, "semester", "", at);
        c.isActive        = optionalField<bool>(jc, "isActive", true, at);
        data.courses.push_back(c);
    }

    const json& sections = arrayOrEmpty(j, "sections");
    for (size_t i = 0; i < sections.size(); ++i) {
        const json& js = sections[i];
        std::string at = where("sections", i);
        Section s;
        s.id           = requireInt(js, "id", at);
        s.name         = optionalField<std::string>(js, "name", "", at);
        s.program      = optionalField<std::string>(js, "program", "", at);
        s.semester     = optionalField<std::string>(js, "semester", "", at);
        s.letter       = optionalField<std::string>(js, "letter", "", at);
        s.studentCount = optionalField<int>(js, "studentCount", 0, at);
        s.isActive     = optionalField<bool>(js, "isActive", true, at);
        data.sections.push_back(s);
    }

    const json& rooms = arrayOrEmpty(j, "rooms");
    for (size_t i = 0; i < rooms.size(); ++i) {
        const json& jr = rooms[i];
        std::string at = where("rooms", i);
        Room r;
        r.id       = requireInt(jr, "id", at);
        r.number   = optionalField<std::string>(jr, "number", "", at);
        r.name     = optionalField<std::string>(jr, "name", "", at);
        r.roomType = optionalField<std::string>(jr, "roomType", "classroom", at);
        r.capacity = requireInt(jr, "capacity", at);
        r.isActive = optionalField<bool>(jr, "isActive", true, at);
        data.rooms.push_back(r);
    }

    const json& slots = arrayOrEmpty(j, "timeSlots");
    for (size_t i = 0; i < slots.size(); ++i) {
        const json& js = slots[i];
        std::string at = where("timeSlots", i);
        TimeSlot ts;
        ts.id           = requireInt(js, "id", at);
        ts.dayOfWeek    = requireInt(js, "dayOfWeek", at);
        ts.period       = requireInt(js, "period", at);
        ts.startMinutes = parseTime(optionalField<std::string>(js, "startTime", "00:00", at));
        ts.endMinutes   = parseTime(optionalField<std::string>(js, "endTime", "00:00", at));
        ts.isBreak      = optionalField<bool>(js, "isBreak", false, at);
        ts.isActive     = optionalField<bool>(js, "isActive", true, at);
        data.timeSlots.push_back(ts);
    }

    const json& offerings = arrayOrEmpty(j, "offerings");
    for (size_t i = 0; i < offerings.size(); ++i) {
        const json& jo = offerings[i];
        std::string at = where("offerings", i);
        Offering o;
        o.id              = requireInt(jo, "id", at);
        o.courseId        = requireInt(jo, "courseId", at);
        o.teacherId       = requireInt(jo, "teacherId", at);
        o.sectionId       = requireInt(jo, "sectionId", at);
        o.sessionsPerWeek = optionalField<int>(jo, "sessionsPerWeek", 0, at);
        o.preferredRoomId = optionalField<int>(jo, "preferredRoomId", -1, at);
        data.offerings.push_back(o);
    }

    const json& constraints = arrayOrEmpty(j, "constraints");
    for (size_t i = 0; i < constraints.size(); ++i) {
        const json& jc = constraints[i];
        std::string at = where("constraints", i);
        Constraint c;
        c.id = requireInt(jc, "id", at);

        const json& type = requireField(jc, "type", at);
        if (!type.is_string() || !constraintTypeFromString(type.get<std::string>(), c.type)) {
            throw CatalogError(at + ": unknown constraint type " + type.dump());
        }

        c.name       = optionalField<std::string>(jc, "name", "", at);
        c.teacherId  = optionalField<int>(jc, "teacherId", -1, at);
        c.roomId     = optionalField<int>(jc, "roomId", -1, at);
        c.sectionId  = optionalField<int>(jc, "sectionId", -1, at);
        c.timeSlotId = optionalField<int>(jc, "timeSlotId", -1, at);
        c.dayOfWeek  = optionalField<int>(jc, "dayOfWeek", -1, at);
        c.period     = optionalField<int>(jc, "period", -1, at);
        c.weight     = optionalField<int>(jc, "weight", 0, at);
        c.isActive   = optionalField<bool>(jc, "isActive", true, at);
        data.constraints.push_back(c);
    }

    return data;
}

json catalogDataToJson(const CatalogData& data) {
    json j;

    j["teachers"] = json::array();
    for (const Teacher& t : data.teachers) {
        j["teachers"].push_back({
            {"id", t.id}, {"name", t.name}, {"code", t.code},
            {"designation", t.designation}, {"maxWeeklyLoad", t.maxWeeklyLoad},
            {"isActive", t.isActive}
        });
    }

    j["courses"] = json::array();
    for (const Course& c : data.courses) {
        j["courses"].push_back({
            {"id", c.id}, {"code", c.code}, {"name", c.name},
            {"creditHours", c.creditHours}, {"sessionsPerWeek", c.sessionsPerWeek},
            {"sessionDuration", c.sessionDuration}, {"isLab", c.isLab},
            {"program", c.program}, {"semester", c.semester}, {"isActive", c.isActive}
        });
    }

    j["sections"] = json::array();
    for (const Section& s : data.sections) {
        j["sections"].push_back({
            {"id", s.id}, {"name", s.name}, {"program", s.program},
            {"semester", s.semester}, {"letter", s.letter},
            {"studentCount", s.studentCount}, {"isActive", s.isActive}
        });
    }

    j["rooms"] = json::array();
    for (const Room& r : data.rooms) {
        j["rooms"].push_back({
            {"id", r.id}, {"number", r.number}, {"name", r.name},
            {"roomType", r.roomType}, {"capacity", r.capacity}, {"isActive", r.isActive}
        });
    }

    j["timeSlots"] = json::array();
    for (const TimeSlot& ts : data.timeSlots) {
        j["timeSlots"].push_back({
            {"id", ts.id}, {"dayOfWeek", ts.dayOfWeek}, {"period", ts.period},
            {"startTime", formatTime(ts.startMinutes)}, {"endTime", formatTime(ts.endMinutes)},
            {"isBreak", ts.isBreak}, {"isActive", ts.isActive}
        });
    }

    j["offerings"] = json::array();
    for (const Offering& o : data.offerings) {
        j["offerings"].push_back({
            {"id", o.id}, {"courseId", o.courseId}, {"teacherId", o.teacherId},
            {"sectionId", o.sectionId}, {"sessionsPerWeek", o.sessionsPerWeek},
            {"preferredRoomId", o.preferredRoomId}
        });
    }

    j["constraints"] = json::array();
    for (const Constraint& c : data.constraints) {
        j["constraints"].push_back({
            {"id", c.id}, {"name", c.name}, {"type", constraintTypeToString(c.type)},
            {"teacherId", c.teacherId}, {"roomId", c.roomId}, {"sectionId", c.sectionId},
            {"timeSlotId", c.timeSlotId}, {"dayOfWeek", c.dayOfWeek}, {"period", c.period},
            {"weight", c.weight}, {"isActive", c.isActive}
        });
    }

    return j;
}

// ==================== ответы ====================

json slotToJson(const TimetableSlot& slot) {
    return {
        {"id", slot.id},
        {"offeringId", slot.offeringId},
        {"sessionIndex", slot.sessionIndex},
        {"sectionId", slot.sectionId},
        {"roomId", slot.roomId},
        {"timeSlotIds", slot.timeSlotIds}
    };
}

json slotViewToJson(const TimetableSlotView& v) {
    return {
        {"id", v.slotId},
        {"offeringId", v.offeringId},
        {"sessionIndex", v.sessionIndex},
        {"courseCode", v.courseCode},
        {"courseName", v.courseName},
        {"isLab", v.isLab},
        {"teacherName", v.teacherName},
        {"teacherCode", v.teacherCode},
        {"sectionName", v.sectionName},
        {"roomNumber", v.roomNumber},
        {"roomName", v.roomName},
        {"dayOfWeek", v.dayOfWeek},
        {"dayName", v.dayName},
        {"firstPeriod", v.firstPeriod},
        {"lastPeriod", v.lastPeriod},
        {"startTime", v.startTime},
        {"endTime", v.endTime},
        {"timeSlotIds", v.timeSlotIds}
    };
}

static json slotViewsToJson(const Catalog& catalog, const std::vector<TimetableSlot>& slots) {
    json arr = json::array();
    for (const TimetableSlotView& v : buildSlotViews(catalog, slots)) {
        arr.push_back(slotViewToJson(v));
    }
    return arr;
}

json timetableToJson(const Catalog& catalog, const Timetable& timetable) {
    return {
        {"version", timetable.version()},
        {"slots", slotViewsToJson(catalog, timetable.slots())}
    };
}

json timetableToJson(const Catalog& catalog, const Timetable& timetable, const SlotFilter& filter) {
    if (filter.kind == SlotFilterKind::All) {
        return timetableToJson(catalog, timetable);
    }
    return {
        {"version", timetable.version()},
        {"filter", {{"type", slotFilterKindToString(filter.kind)}, {"id", filter.id}}},
        {"slots", slotViewsToJson(catalog, filterSlots(catalog, timetable.slots(), filter))}
    };
}

json generationResultToJson(const Catalog& catalog, const GenerationResult& result) {
    json j;
    j["ok"]           = result.ok;
    j["solverStatus"] = solveStatusToString(result.solverStatus);
    j["failure"]      = failureKindToString(result.failure);
    j["message"]      = result.message;
    j["slots"]        = slotViewsToJson(catalog, result.slots);
    j["stats"] = {
        {"instances", result.stats.instances},
        {"variables", result.stats.variables},
        {"constraints", result.stats.constraints},
        {"objective", result.stats.objective},
        {"solveSeconds", result.stats.solveSeconds},
        {"totalSeconds", result.stats.totalSeconds},
        {"backend", result.stats.backend}
    };

    if (result.failure == FailureKind::InfeasibleCandidate) {
        j["instance"] = {
            {"instanceId", result.instanceId},
            {"offeringId", result.offeringId},
            {"sessionIndex", result.sessionIndex}
        };
    } else if (result.failure == FailureKind::ConflictDetected) {
        j["conflict"] = {
            {"resource", conflictResourceToString(result.conflictResource)},
            {"resourceId", result.conflictResourceId},
            {"timeSlotId", result.conflictTimeSlotId},
            {"firstId", result.conflictFirstId},
            {"secondId", result.conflictSecondId}
        };
    }
    return j;
}

json validationToJson(const ValidationResult& result) {
    return {
        {"ok", result.ok},
        {"errors", result.errors},
        {"warnings", result.warnings}
    };
}

json invalidMoveToJson(const InvalidMoveError& e) {
    return {
        {"ok", false},
        {"rule", moveRuleToString(e.rule)},
        {"error", e.what()}
    };
}

json errorToJson(const std::string& message) {
    return {
        {"ok", false},
        {"error", message}
    };
}
