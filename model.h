#pragma once

#include <string>
#include <vector>

struct Teacher {
    int id;
    std::string name;
    std::string code;
    std::string designation;
    int maxWeeklyLoad;   // часов в неделю, <= 0: без ограничения
    bool isActive;
};

struct Course {
    int id;
    std::string code;
    std::string name;
    int creditHours;
    int sessionsPerWeek;
    int sessionDuration; // в периодах (1 для лекций, 2+ для лабораторных)
    bool isLab;
    std::string program;
    std::string semester;
    bool isActive;
};

struct Section {
    int id;
    std::string name;    // например "CS-III-A"
    std::string program;
    std::string semester;
    std::string letter;
    int studentCount;
    bool isActive;
};

struct Room {
    int id;
    std::string number;
    std::string name;
    std::string roomType; // "classroom", "lab", "seminar", ...
    int capacity;
    bool isActive;
};

struct TimeSlot {
    int id;
    int dayOfWeek;     // 0 = понедельник
    int period;        // номер пары в дне
    int startMinutes;
    int endMinutes;
    bool isBreak;
    bool isActive;
};

struct Offering {
    int id;
    int courseId;
    int teacherId;
    int sectionId;
    int sessionsPerWeek; // 0: взять из курса
    int preferredRoomId; // -1: нет предпочтения
};

enum class ConstraintType {
    TeacherUnavailable,
    RoomUnavailable,
    SectionPreference,
    TimePreference
};

// Ограничение, заведённое администратором.
// Слот задаётся либо timeSlotId, либо парой (dayOfWeek, period).
struct Constraint {
    int id;
    std::string name;
    ConstraintType type;
    int teacherId;   // -1, если не используется
    int roomId;
    int sectionId;
    int timeSlotId;
    int dayOfWeek;
    int period;
    int weight;      // только для предпочтений
    bool isActive;
};

// Одно занятие оферинга, которое нужно поставить в сетку
struct SessionInstance {
    int id;
    int offeringId;
    int sessionIndex;
    int courseId;
    int teacherId;
    int sectionId;
    int blockLength; // сколько подряд идущих пар занимает
    int hours;
};

// Допустимое размещение занятия: стартовый слот + аудитория
struct Candidate {
    int startSlotId;
    int roomId;
    std::vector<int> slotIds; // все слоты блока по порядку
};

// Итоговая запись расписания
struct TimetableSlot {
    int id;
    int offeringId;
    int sessionIndex;
    int sectionId;
    int roomId;
    std::vector<int> timeSlotIds;
};

bool operator==(const TimetableSlot& a, const TimetableSlot& b);

std::string constraintTypeToString(ConstraintType type);
bool constraintTypeFromString(const std::string& s, ConstraintType& out);
