#pragma once

#include "catalog.h"
#include "config.h"
#include "model.h"
#include "timetable.h"

// Ручной перенос занятия (drag-and-drop в интерфейсе).
// Проверяет те же жёсткие правила, что и генерация, против остальных записей.
class TimetableEditor {
public:
    TimetableEditor(const Catalog& catalog, Timetable& timetable, const EngineConfig& cfg);

    // Новая пара (первая пара блока для лабораторных) и аудитория.
    // При нарушении кидает InvalidMoveError с первым нарушенным правилом,
    // расписание при этом не меняется.
    TimetableSlot move(int slotId, int newTimeSlotId, int newRoomId);

private:
    SessionInstance instanceFor(const TimetableSlot& record) const;

    void checkConflicts(
        const TimetableSlot& moved,
        const SessionInstance& instance
    ) const;

    const Catalog& catalog_;
    Timetable& timetable_;
    EngineConfig cfg_;
};
