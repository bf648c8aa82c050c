#pragma once

#include <vector>

#include "model.h"

// Текущее расписание и его версия.
// Версия растёт при каждой полной замене и при каждом переносе.
class Timetable {
public:
    Timetable() : version_(0) {}

    const std::vector<TimetableSlot>& slots() const { return slots_; }
    long long version() const { return version_; }
    bool empty() const { return slots_.empty(); }

    void replaceAll(std::vector<TimetableSlot> slots);

    const TimetableSlot* findById(int id) const;

    // Кидает std::out_of_range, если записи с таким id нет
    void update(const TimetableSlot& slot);

private:
    std::vector<TimetableSlot> slots_;
    long long version_;
};
