#pragma once

#include <string>
#include <vector>

#include "catalog.h"
#include "model.h"

// Запись расписания с подставленными названиями, для отображения и экспорта
struct TimetableSlotView {
    int slotId;
    int offeringId;
    int sessionIndex;
    std::string courseCode;
    std::string courseName;
    bool isLab;
    std::string teacherName;
    std::string teacherCode;
    std::string sectionName;
    std::string roomNumber;
    std::string roomName;
    int dayOfWeek;
    std::string dayName;    // "Понедельник"
    int firstPeriod;
    int lastPeriod;
    std::string startTime;  // "09:00"
    std::string endTime;    // "10:40" (конец последней пары блока)
    std::vector<int> timeSlotIds;
};

std::vector<TimetableSlotView> buildSlotViews(
    const Catalog& catalog,
    const std::vector<TimetableSlot>& slots
);

// Просмотр расписания целиком или по одной группе, преподавателю, аудитории
enum class SlotFilterKind { All, Section, Teacher, Room };

struct SlotFilter {
    SlotFilterKind kind;
    int id;
};

std::string slotFilterKindToString(SlotFilterKind kind);

// type: "", "section", "teacher" или "room"; id обязателен для непустого типа.
// Кидает std::invalid_argument.
SlotFilter parseSlotFilter(const std::string& type, const std::string& id);

std::vector<TimetableSlot> filterSlots(
    const Catalog& catalog,
    const std::vector<TimetableSlot>& slots,
    const SlotFilter& filter
);
