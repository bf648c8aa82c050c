#include "validator.h"
#include "candidates.h"
#include "logger.h"
#include <map>
#include <utility>

static std::string findTimeSlotDescription(const Catalog& catalog, int timeSlotId) {
    // вид "Вторник 09:50-10:40"
    const TimeSlot* ts = catalog.findTimeSlotById(timeSlotId);
    if (!ts) return "слот id=" + std::to_string(timeSlotId);
    return dayName(ts->dayOfWeek) + " " + formatTime(ts->startMinutes) + "-" + formatTime(ts->endMinutes);
}

static std::string findResourceName(const Catalog& catalog, ConflictResource resource, int id) {
    switch (resource) {
        case ConflictResource::Teacher: {
            const Teacher* t = catalog.findTeacherById(id);
            return t ? t->name : "id=" + std::to_string(id);
        }
        case ConflictResource::Room: {
            const Room* r = catalog.findRoomById(id);
            return r ? r->number : "id=" + std::to_string(id);
        }
        case ConflictResource::Section: {
            const Section* s = catalog.findSectionById(id);
            return s ? s->name : "id=" + std::to_string(id);
        }
        case ConflictResource::Assignment:
            break;
    }
    return "id=" + std::to_string(id);
}

static std::string describeRecord(const Catalog& catalog, const TimetableSlot& rec) {
    const Offering* o = catalog.findOfferingById(rec.offeringId);
    const Course* c = o ? catalog.findCourseById(o->courseId) : nullptr;
    return "запись #" + std::to_string(rec.id) + " (" + (c ? c->code : "?") +
           ", занятие " + std::to_string(rec.sessionIndex + 1) + ")";
}

std::vector<Overlap> findOverlaps(const Catalog& catalog, const std::vector<TimetableSlot>& records) {
    // (ресурс, слот) -> id записей
    std::map<std::pair<int, int>, std::vector<int>> teacherTable;
    std::map<std::pair<int, int>, std::vector<int>> roomTable;
    std::map<std::pair<int, int>, std::vector<int>> sectionTable;

    for (const TimetableSlot& rec : records) {
        const Offering* o = catalog.findOfferingById(rec.offeringId);
        for (int slotId : rec.timeSlotIds) {
            if (o) teacherTable[{o->teacherId, slotId}].push_back(rec.id);
            roomTable[{rec.roomId, slotId}].push_back(rec.id);
            sectionTable[{rec.sectionId, slotId}].push_back(rec.id);
        }
    }

    std::vector<Overlap> overlaps;
    auto collect = [&overlaps](ConflictResource resource,
                               const std::map<std::pair<int, int>, std::vector<int>>& table) {
        for (const auto& p : table) {
            const std::vector<int>& ids = p.second;
            for (size_t j = 1; j < ids.size(); ++j) {
                int a = ids[0] < ids[j] ? ids[0] : ids[j];
                int b = ids[0] < ids[j] ? ids[j] : ids[0];
                overlaps.push_back(Overlap{resource, p.first.first, p.first.second, a, b});
            }
        }
    };

    collect(ConflictResource::Teacher, teacherTable);
    collect(ConflictResource::Room, roomTable);
    collect(ConflictResource::Section, sectionTable);
    return overlaps;
}

void TimetableValidator::checkOverlaps(
    const Catalog& catalog,
    const std::vector<TimetableSlot>& records,
    ValidationResult& result
) {
    for (const Overlap& ov : findOverlaps(catalog, records)) {
        result.ok = false;

        std::string who;
        std::string tag;
        switch (ov.resource) {
            case ConflictResource::Teacher: who = "преподавателя "; tag = "[TeacherConflict] "; break;
            case ConflictResource::Room:    who = "аудитории ";     tag = "[RoomConflict] ";    break;
            default:                        who = "группы ";        tag = "[SectionConflict] "; break;
        }

        std::string errorMessage =
            "Конфликт для " + who + findResourceName(catalog, ov.resource, ov.resourceId) +
            " в " + findTimeSlotDescription(catalog, ov.timeSlotId) +
            ": записи #" + std::to_string(ov.firstId) + " и #" + std::to_string(ov.secondId) +
            " стоят одновременно.";

        result.errors.push_back(errorMessage);
        logError(tag + errorMessage);
    }
}

void TimetableValidator::checkRooms(
    const Catalog& catalog,
    const std::vector<TimetableSlot>& records,
    ValidationResult& result
) {
    for (const TimetableSlot& rec : records) {
        const Room* room = catalog.findRoomById(rec.roomId);
        const Section* section = catalog.findSectionById(rec.sectionId);

        if (!room || !section) {
            result.ok = false;
            std::string msg = "Ошибка данных: не найдена аудитория или группа по id (roomId=" +
                              std::to_string(rec.roomId) + ", sectionId=" +
                              std::to_string(rec.sectionId) + ") у " +
                              describeRecord(catalog, rec) + ".";
            result.errors.push_back(msg);
            logError("[RoomDataError] " + msg);
            continue;
        }

        if (!room->isActive) {
            result.ok = false;
            std::string msg = "Аудитория " + room->number + " неактивна, но используется в " +
                              describeRecord(catalog, rec) + ".";
            result.errors.push_back(msg);
            logError("[RoomInactive] " + msg);
        }

        if (section->studentCount > room->capacity) {
            result.ok = false;
            std::string msg =
                "Аудитория " + room->number + " слишком мала для группы " + section->name +
                ": capacity=" + std::to_string(room->capacity) +
                ", studentCount=" + std::to_string(section->studentCount) + ".";
            result.errors.push_back(msg);
            logError("[RoomCapacity] " + msg);
        }

        const Offering* o = catalog.findOfferingById(rec.offeringId);
        const Course* course = o ? catalog.findCourseById(o->courseId) : nullptr;
        if (course && course->isLab && room->roomType != "lab") {
            result.ok = false;
            std::string msg =
                "Лабораторный курс " + course->code + " стоит в аудитории " + room->number +
                " типа '" + room->roomType + "'.";
            result.errors.push_back(msg);
            logError("[RoomType] " + msg);
        }
    }
}

void TimetableValidator::checkBlocks(
    const Catalog& catalog,
    const std::vector<TimetableSlot>& records,
    const EngineConfig& cfg,
    ValidationResult& result
) {
    for (const TimetableSlot& rec : records) {
        const Offering* o = catalog.findOfferingById(rec.offeringId);
        if (!o) {
            result.ok = false;
            std::string msg = "Ошибка данных: запись #" + std::to_string(rec.id) +
                              " ссылается на несуществующий оферинг id=" +
                              std::to_string(rec.offeringId) + ".";
            result.errors.push_back(msg);
            logError("[OfferingMissing] " + msg);
            continue;
        }

        const Course* course = catalog.findCourseById(o->courseId);
        int expected = course ? blockLengthFor(*course, cfg) : 1;

        std::string problem;
        if ((int)rec.timeSlotIds.size() != expected) {
            problem = "занимает " + std::to_string(rec.timeSlotIds.size()) + " пар вместо " +
                      std::to_string(expected);
        } else if (rec.timeSlotIds.empty()) {
            problem = "не занимает ни одной пары";
        } else {
            const TimeSlot* first = catalog.findTimeSlotById(rec.timeSlotIds.front());
            for (size_t k = 0; k < rec.timeSlotIds.size() && problem.empty(); ++k) {
                const TimeSlot* ts = catalog.findTimeSlotById(rec.timeSlotIds[k]);
                if (!ts || !first) {
                    problem = "ссылается на несуществующий слот id=" +
                              std::to_string(rec.timeSlotIds[k]);
                } else if (!catalog.isAssignable(*ts)) {
                    problem = "стоит на перерыве или неактивной паре " +
                              findTimeSlotDescription(catalog, ts->id);
                } else if (ts->dayOfWeek != first->dayOfWeek ||
                           ts->period != first->period + (int)k) {
                    problem = "блок не идёт подряд в один день";
                }
            }
        }

        if (!problem.empty()) {
            result.ok = false;
            std::string msg = "Некорректный блок: " + describeRecord(catalog, rec) + " " + problem + ".";
            result.errors.push_back(msg);
            logError("[BlockContiguity] " + msg);
        }
    }
}

void TimetableValidator::checkAvailability(
    const Catalog& catalog,
    const std::vector<TimetableSlot>& records,
    ValidationResult& result
) {
    for (const TimetableSlot& rec : records) {
        const Offering* o = catalog.findOfferingById(rec.offeringId);

        for (int slotId : rec.timeSlotIds) {
            if (o && catalog.isTeacherUnavailable(o->teacherId, slotId)) {
                result.ok = false;
                std::string msg = "Преподаватель " +
                                  findResourceName(catalog, ConflictResource::Teacher, o->teacherId) +
                                  " недоступен в " + findTimeSlotDescription(catalog, slotId) +
                                  ", но стоит в " + describeRecord(catalog, rec) + ".";
                result.errors.push_back(msg);
                logError("[TeacherUnavailable] " + msg);
            }
            if (catalog.isRoomUnavailable(rec.roomId, slotId)) {
                result.ok = false;
                std::string msg = "Аудитория " +
                                  findResourceName(catalog, ConflictResource::Room, rec.roomId) +
                                  " недоступна в " + findTimeSlotDescription(catalog, slotId) +
                                  ", но занята в " + describeRecord(catalog, rec) + ".";
                result.errors.push_back(msg);
                logError("[RoomUnavailable] " + msg);
            }
        }
    }
}

void TimetableValidator::checkWeeklyLoad(
    const Catalog& catalog,
    const std::vector<TimetableSlot>& records,
    const EngineConfig& cfg,
    ValidationResult& result
) {
    // teacherId -> часов в неделю
    std::map<int, int> hours;

    for (const TimetableSlot& rec : records) {
        const Offering* o = catalog.findOfferingById(rec.offeringId);
        if (!o) continue;
        hours[o->teacherId] += (int)rec.timeSlotIds.size() * cfg.hoursPerPeriod;
    }

    for (const std::pair<const int, int>& p : hours) {
        const Teacher* t = catalog.findTeacherById(p.first);
        if (!t || t->maxWeeklyLoad <= 0) continue;

        if (p.second > t->maxWeeklyLoad) {
            result.ok = false;
            std::string msg =
                "У преподавателя " + t->name + " " + std::to_string(p.second) +
                " ч в неделю, что превышает допустимый максимум " +
                std::to_string(t->maxWeeklyLoad) + " ч.";
            result.errors.push_back(msg);
            logError("[WeeklyLoad] " + msg);
        }
    }
}

void TimetableValidator::checkAllSessionsAssigned(
    const Catalog& catalog,
    const std::vector<TimetableSlot>& records,
    const EngineConfig& cfg,
    ValidationResult& result
) {
    // (offeringId, sessionIndex) -> сколько раз встретилось
    std::map<std::pair<int, int>, int> counts;
    for (const TimetableSlot& rec : records) {
        counts[{rec.offeringId, rec.sessionIndex}]++;
    }

    std::map<std::pair<int, int>, bool> expected;
    for (const SessionInstance& inst : expandOfferings(catalog, cfg)) {
        expected[{inst.offeringId, inst.sessionIndex}] = true;
    }

    for (const auto& p : expected) {
        auto it = counts.find(p.first);
        int n = it == counts.end() ? 0 : it->second;

        if (n == 0) {
            result.ok = false;
            std::string msg = "Занятие " + std::to_string(p.first.second + 1) +
                              " оферинга id=" + std::to_string(p.first.first) +
                              " не назначено ни в один слот.";
            result.errors.push_back(msg);
            logError("[SessionNotAssigned] " + msg);
        } else if (n > 1) {
            result.ok = false;
            std::string msg = "Занятие " + std::to_string(p.first.second + 1) +
                              " оферинга id=" + std::to_string(p.first.first) +
                              " назначено " + std::to_string(n) + " раз(а) в расписании.";
            result.errors.push_back(msg);
            logError("[SessionMultiAssigned] " + msg);
        }
    }

    // оферинг выключили или уменьшили число занятий после генерации
    for (const auto& p : counts) {
        if (expected.count(p.first)) continue;
        std::string msg = "Занятие " + std::to_string(p.first.second + 1) +
                          " оферинга id=" + std::to_string(p.first.first) +
                          " есть в расписании, но больше не требуется.";
        result.warnings.push_back(msg);
        logWarning("[SessionNotRequired] " + msg);
    }
}

ValidationResult TimetableValidator::checkAll(
    const Catalog& catalog,
    const std::vector<TimetableSlot>& records,
    const EngineConfig& cfg
) {
    ValidationResult result;
    result.ok = true;

    logInfo("=== Запуск проверки расписания ===");
    logInfo("Записей: " + std::to_string(records.size()) +
            ", оферингов: " + std::to_string(catalog.offerings().size()) +
            ", преподавателей: " + std::to_string(catalog.teachers().size()) +
            ", аудиторий: " + std::to_string(catalog.rooms().size()) +
            ", слотов: " + std::to_string(catalog.timeSlots().size()));

    checkAllSessionsAssigned(catalog, records, cfg, result);
    checkOverlaps(catalog, records, result);
    checkRooms(catalog, records, result);
    checkBlocks(catalog, records, cfg, result);
    checkAvailability(catalog, records, result);
    checkWeeklyLoad(catalog, records, cfg, result);

    if (result.ok) {
        logInfo("Проверка расписания завершена: ошибок не обнаружено.");
    } else {
        logWarning("Проверка расписания завершена: обнаружено ошибок = " +
                   std::to_string(result.errors.size()));
    }

    return result;
}
