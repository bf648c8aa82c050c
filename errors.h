#pragma once

#include <stdexcept>
#include <string>

// Некорректные входные данные (битые ссылки, дубликаты id, кривой JSON)
class CatalogError : public std::runtime_error {
public:
    explicit CatalogError(const std::string& msg) : std::runtime_error(msg) {}
};

// У занятия нет ни одного допустимого размещения, солвер не запускаем
class InfeasibleCandidateError : public std::runtime_error {
public:
    InfeasibleCandidateError(
        const std::string& msg,
        int instanceId,
        int offeringId,
        int sessionIndex
    )
        : std::runtime_error(msg),
          instanceId(instanceId),
          offeringId(offeringId),
          sessionIndex(sessionIndex) {}

    int instanceId;
    int offeringId;
    int sessionIndex;
};

class SolverError : public std::runtime_error {
public:
    explicit SolverError(const std::string& msg) : std::runtime_error(msg) {}
};

enum class ConflictResource {
    Teacher,
    Room,
    Section,
    Assignment // у занятия не ровно одно размещение
};

std::string conflictResourceToString(ConflictResource r);

// Проверка после солвера нашла пересечение: дефект модели
class ConflictDetectedError : public std::runtime_error {
public:
    ConflictDetectedError(
        const std::string& msg,
        ConflictResource resource,
        int resourceId,
        int timeSlotId,
        int firstId,
        int secondId
    )
        : std::runtime_error(msg),
          resource(resource),
          resourceId(resourceId),
          timeSlotId(timeSlotId),
          firstId(firstId),
          secondId(secondId) {}

    ConflictResource resource;
    int resourceId;
    int timeSlotId;
    int firstId;   // id первой записи (для Assignment id занятия)
    int secondId;  // id второй записи, -1 для Assignment
};

enum class MoveRule {
    UnknownSlot,
    UnknownTimeSlot,
    UnknownRoom,
    BreakSlot,
    BlockNotContiguous,
    RoomCapacity,
    RoomType,
    RoomInactive,
    TeacherUnavailable,
    RoomUnavailable,
    RoomConflict,
    TeacherConflict,
    SectionConflict
};

std::string moveRuleToString(MoveRule rule);

// Ручной перенос нарушает правило: ожидаемая ошибка для пользователя
class InvalidMoveError : public std::runtime_error {
public:
    InvalidMoveError(const std::string& msg, MoveRule rule)
        : std::runtime_error(msg), rule(rule) {}

    MoveRule rule;
};
