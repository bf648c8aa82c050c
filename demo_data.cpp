#include "demo_data.h"

namespace {

struct PeriodTemplate {
    int period;
    const char* start;
    const char* end;
};

// сетка пар одного дня; между 3 и 4 парой перерыв, между 5 и 6 обед
const PeriodTemplate kPeriods[] = {
    {1, "09:00", "09:50"},
    {2, "09:50", "10:40"},
    {3, "10:40", "11:30"},
    {4, "11:45", "12:35"},
    {5, "12:35", "13:25"},
    {6, "14:10", "15:00"},
    {7, "15:00", "15:50"},
    {8, "15:50", "16:40"},
};

const int kDays = 5;

} // namespace

CatalogData buildDemoCatalog() {
    CatalogData d;

    int slotId = 1;
    for (int day = 0; day < kDays; ++day) {
        for (const PeriodTemplate& p : kPeriods) {
            d.timeSlots.push_back(TimeSlot{
                slotId++, day, p.period, parseTime(p.start), parseTime(p.end), false, true
            });
        }
    }

    d.teachers = {
        {1, "Dr. Sarah Johnson",   "SJ", "Professor",           12, true},
        {2, "Dr. Michael Chen",    "MC", "Professor",           12, true},
        {3, "Dr. Emily Rodriguez", "ER", "Associate Professor", 14, true},
        {4, "Prof. David Kim",     "DK", "Assistant Professor", 16, true},
        {5, "Dr. Lisa Wang",       "LW", "Assistant Professor", 16, true},
        {6, "Prof. James Wilson",  "JW", "Assistant Professor", 16, true},
    };

    d.courses = {
        {1, "CS101",  "Introduction to Computer Science", 4, 4, 1, false, "CS",  "I", true},
        {2, "CS102",  "Programming Fundamentals",         4, 4, 1, false, "CS",  "I", true},
        {3, "CS103",  "Programming Lab",                  2, 2, 2, true,  "CS",  "I", true},
        {4, "BUS101", "Introduction to Business",         4, 4, 1, false, "BUS", "I", true},
        {5, "BUS102", "Business Communication",           3, 3, 1, false, "BUS", "I", true},
        {6, "ENG101", "Engineering Mathematics",          4, 4, 1, false, "ENG", "I", true},
        {7, "ENG102", "Engineering Physics",              4, 3, 1, false, "ENG", "I", true},
        {8, "ENG103", "Physics Lab",                      2, 2, 2, true,  "ENG", "I", true},
    };

    d.sections = {
        {1, "CS-I-A",  "CS",  "I", "A", 30, true},
        {2, "BUS-I-A", "BUS", "I", "A", 35, true},
        {3, "ENG-I-A", "ENG", "I", "A", 25, true},
    };

    d.rooms = {
        {1, "101",   "Classroom 101",  "classroom", 40, true},
        {2, "102",   "Classroom 102",  "classroom", 40, true},
        {3, "103",   "Classroom 103",  "classroom", 40, true},
        {4, "LAB1",  "Computer Lab 1", "lab",       30, true},
        {5, "SLAB1", "Science Lab 1",  "lab",       25, true},
    };

    // id, course, teacher, section, sessionsPerWeek (0 = из курса), preferredRoom
    d.offerings = {
        {1, 1, 1, 1, 0, 1},
        {2, 2, 2, 1, 0, -1},
        {3, 3, 3, 1, 0, 4},
        {4, 4, 4, 2, 0, 2},
        {5, 5, 4, 2, 0, -1},
        {6, 6, 5, 3, 0, 3},
        {7, 7, 6, 3, 0, -1},
        {8, 8, 3, 3, 0, 5},
    };

    d.constraints = {
        {1, "SJ: утро понедельника занято", ConstraintType::TeacherUnavailable,
            1, -1, -1, -1, 0, 1, 0, true},
        {2, "SJ: утро понедельника занято", ConstraintType::TeacherUnavailable,
            1, -1, -1, -1, 0, 2, 0, true},
        {3, "LAB1 на обслуживании в пятницу", ConstraintType::RoomUnavailable,
            -1, 4, -1, -1, 4, 7, 0, true},
        {4, "BUS-I-A: лучше с утра во вторник", ConstraintType::SectionPreference,
            -1, -1, 2, -1, 1, 2, 3, true},
        {5, "Избегать последней пары пятницы", ConstraintType::TimePreference,
            -1, -1, -1, -1, 4, 8, -2, true},
    };

    return d;
}
