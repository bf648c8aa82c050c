#pragma once

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "model.h"

// Сырые данные одного прогона (из БД, JSON или демо-набора)
struct CatalogData {
    std::vector<Teacher>    teachers;
    std::vector<Course>     courses;
    std::vector<Section>    sections;
    std::vector<Room>       rooms;
    std::vector<TimeSlot>   timeSlots;
    std::vector<Offering>   offerings;
    std::vector<Constraint> constraints;
};

// Неизменяемый снимок справочников для одного запуска генерации.
// Конструктор проверяет ссылочную целостность и кидает CatalogError.
class Catalog {
public:
    explicit Catalog(CatalogData data);

    const std::vector<Teacher>&    teachers()    const { return data_.teachers; }
    const std::vector<Course>&     courses()     const { return data_.courses; }
    const std::vector<Section>&    sections()    const { return data_.sections; }
    const std::vector<Room>&       rooms()       const { return data_.rooms; }
    const std::vector<TimeSlot>&   timeSlots()   const { return data_.timeSlots; }
    const std::vector<Offering>&   offerings()   const { return data_.offerings; }
    const std::vector<Constraint>& constraints() const { return data_.constraints; }

    const Teacher*  findTeacherById(int id) const;
    const Course*   findCourseById(int id) const;
    const Section*  findSectionById(int id) const;
    const Room*     findRoomById(int id) const;
    const TimeSlot* findTimeSlotById(int id) const;
    const Offering* findOfferingById(int id) const;
    const TimeSlot* findTimeSlotAt(int dayOfWeek, int period) const;

    // Слот можно занимать: активен и не перерыв
    bool isAssignable(const TimeSlot& slot) const;

    // Первая или последняя доступная пара своего дня
    bool isEdgePeriod(int timeSlotId) const;

    // Дни недели, в которых есть хотя бы один доступный слот
    std::vector<int> assignableDays() const;

    bool isTeacherUnavailable(int teacherId, int timeSlotId) const;
    bool isRoomUnavailable(int roomId, int timeSlotId) const;

    // id слота, на который ссылается ограничение, или -1
    int resolveConstraintSlot(const Constraint& c) const;

    // Активные предпочтения (section_preference / time_preference)
    const std::vector<Constraint>& activePreferences() const { return preferences_; }

    // Курс, преподаватель и группа оферинга активны
    bool isSchedulable(const Offering& offering) const;

    int sessionsPerWeek(const Offering& offering) const;

    const CatalogData& data() const { return data_; }

private:
    void buildIndexes();
    void checkReferences() const;

    CatalogData data_;

    std::map<int, size_t> teacherIndex_;
    std::map<int, size_t> courseIndex_;
    std::map<int, size_t> sectionIndex_;
    std::map<int, size_t> roomIndex_;
    std::map<int, size_t> timeSlotIndex_;
    std::map<int, size_t> offeringIndex_;
    std::map<std::pair<int, int>, size_t> dayPeriodIndex_;

    std::set<int> edgeSlots_;
    std::set<std::pair<int, int>> teacherUnavailable_; // (teacherId, slotId)
    std::set<std::pair<int, int>> roomUnavailable_;    // (roomId, slotId)
    std::vector<Constraint> preferences_;
};

// "09:50" <-> минуты от полуночи
std::string formatTime(int minutesFromMidnight);
int parseTime(const std::string& hhmm);

std::string dayName(int dayOfWeek);
