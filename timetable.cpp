#include "timetable.h"

#include <stdexcept>
#include <string>
#include <utility>

void Timetable::replaceAll(std::vector<TimetableSlot> slots) {
    slots_ = std::move(slots);
    ++version_;
}

const TimetableSlot* Timetable::findById(int id) const {
    for (const TimetableSlot& s : slots_) {
        if (s.id == id) return &s;
    }
    return nullptr;
}

void Timetable::update(const TimetableSlot& slot) {
    for (TimetableSlot& s : slots_) {
        if (s.id == slot.id) {
            s = slot;
            ++version_;
            return;
        }
    }
    throw std::out_of_range("Timetable slot " + std::to_string(slot.id) + " not found");
}
