#include "db.h"

#include <cstdlib>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <pqxx/pqxx>

namespace db {

// ==================== DbConfig::fromEnv ====================

static std::string getEnvOrThrow(const char* name) {
    const char* val = std::getenv(name);
    if (!val) {
        std::string msg = "Environment variable ";
        msg += name;
        msg += " is not set";
        throw std::runtime_error(msg);
    }
    return std::string(val);
}

DbConfig DbConfig::fromEnv() {
    DbConfig cfg;
    cfg.host     = getEnvOrThrow("TIMETABLE_DB_HOST");
    cfg.dbname   = getEnvOrThrow("TIMETABLE_DB_NAME");
    cfg.user     = getEnvOrThrow("TIMETABLE_DB_USER");
    cfg.password = getEnvOrThrow("TIMETABLE_DB_PASSWORD");

    const char* portStr = std::getenv("TIMETABLE_DB_PORT");
    cfg.port = portStr ? std::stoi(portStr) : 5432; // по умолчанию 5432

    return cfg;
}

bool DbConfig::isConfigured() {
    return std::getenv("TIMETABLE_DB_HOST") && std::getenv("TIMETABLE_DB_NAME");
}

// ==================== ConnectionFactory ====================

ConnectionFactory::ConnectionFactory(const DbConfig& cfg)
    : config(cfg) {}

std::unique_ptr<pqxx::connection> ConnectionFactory::createConnection() const {
    std::stringstream ss;
    ss << "host=" << config.host
       << " port=" << config.port
       << " dbname=" << config.dbname
       << " user=" << config.user
       << " password=" << config.password;

    return std::make_unique<pqxx::connection>(ss.str());
}

// ==================== CatalogRepository ====================

CatalogData CatalogRepository::loadCatalog() {
    auto conn = factory_.createConnection();
    pqxx::read_transaction tx{*conn};

    CatalogData data;

    for (const auto& r : tx.exec(
             "SELECT id, name, code, designation, max_weekly_load, is_active "
             "FROM teacher ORDER BY id")) {
        Teacher t;
        t.id            = r["id"].as<int>();
        t.name          = r["name"].as<std::string>();
        t.code          = r["code"].as<std::string>();
        t.designation   = r["designation"].as<std::string>();
        t.maxWeeklyLoad = r["max_weekly_load"].as<int>();
        t.isActive      = r["is_active"].as<bool>();
        data.teachers.push_back(t);
    }

    for (const auto& r : tx.exec(
             "SELECT id, code, name, credit_hours, sessions_per_week, session_duration, "
             "       is_lab, program, semester, is_active "
             "FROM course ORDER BY id")) {
        Course c;
        c.id              = r["id"].as<int>();
        c.code            = r["code"].as<std::string>();
        c.name            = r["name"].as<std::string>();
        c.creditHours     = r["credit_hours"].as<int>();
        c.sessionsPerWeek = r["sessions_per_week"].as<int>();
        c.sessionDuration = r["session_duration"].as<int>();
        c.isLab           = r["is_lab"].as<bool>();
        c.program         = r["program"].as<std::string>();
        c.semester        = r["semester"].as<std::string>();
        c.isActive        = r["is_active"].as<bool>();
        data.courses.push_back(c);
    }

    for (const auto& r : tx.exec(
             "SELECT id, name, program, semester, section_letter, student_count, is_active "
             "FROM section ORDER BY id")) {
        Section s;
        s.id           = r["id"].as<int>();
        s.name         = r["name"].as<std::string>();
        s.program      = r["program"].as<std::string>();
        s.semester     = r["semester"].as<std::string>();
        s.letter       = r["section_letter"].as<std::string>();
        s.studentCount = r["student_count"].as<int>();
        s.isActive     = r["is_active"].as<bool>();
        data.sections.push_back(s);
    }

    for (const auto& r : tx.exec(
             "SELECT id, number, name, room_type, capacity, is_active "
             "FROM room ORDER BY id")) {
        Room room;
        room.id       = r["id"].as<int>();
        room.number   = r["number"].as<std::string>();
        room.name     = r["name"].as<std::string>();
        room.roomType = r["room_type"].as<std::string>();
        room.capacity = r["capacity"].as<int>();
        room.isActive = r["is_active"].as<bool>();
        data.rooms.push_back(room);
    }

    for (const auto& r : tx.exec(
             "SELECT id, day_of_week, period_number, "
             "       EXTRACT(HOUR FROM start_time)::int * 60 + EXTRACT(MINUTE FROM start_time)::int AS start_minutes, "
             "       EXTRACT(HOUR FROM end_time)::int * 60 + EXTRACT(MINUTE FROM end_time)::int AS end_minutes, "
             "       is_break, is_active "
             "FROM time_slot ORDER BY day_of_week, period_number")) {
        TimeSlot ts;
        ts.id           = r["id"].as<int>();
        ts.dayOfWeek    = r["day_of_week"].as<int>();
        ts.period       = r["period_number"].as<int>();
        ts.startMinutes = r["start_minutes"].as<int>();
        ts.endMinutes   = r["end_minutes"].as<int>();
        ts.isBreak      = r["is_break"].as<bool>();
        ts.isActive     = r["is_active"].as<bool>();
        data.timeSlots.push_back(ts);
    }

    for (const auto& r : tx.exec(
             "SELECT id, course_id, teacher_id, section_id, sessions_per_week, "
             "       COALESCE(preferred_room_id, -1) AS preferred_room_id "
             "FROM offering ORDER BY id")) {
        Offering o;
        o.id              = r["id"].as<int>();
        o.courseId        = r["course_id"].as<int>();
        o.teacherId       = r["teacher_id"].as<int>();
        o.sectionId       = r["section_id"].as<int>();
        o.sessionsPerWeek = r["sessions_per_week"].as<int>();
        o.preferredRoomId = r["preferred_room_id"].as<int>();
        data.offerings.push_back(o);
    }

    for (const auto& r : tx.exec(
             "SELECT id, name, constraint_type, "
             "       COALESCE(teacher_id, -1)    AS teacher_id, "
             "       COALESCE(room_id, -1)       AS room_id, "
             "       COALESCE(section_id, -1)    AS section_id, "
             "       COALESCE(time_slot_id, -1)  AS time_slot_id, "
             "       COALESCE(day_of_week, -1)   AS day_of_week, "
             "       COALESCE(period_number, -1) AS period_number, "
             "       weight, is_active "
             "FROM timetable_constraint ORDER BY id")) {
        Constraint c;
        c.id = r["id"].as<int>();

        std::string type = r["constraint_type"].as<std::string>();
        if (!constraintTypeFromString(type, c.type)) {
            throw std::runtime_error("Constraint " + std::to_string(c.id) +
                                     " has unknown type '" + type + "'");
        }

        c.name       = r["name"].as<std::string>();
        c.teacherId  = r["teacher_id"].as<int>();
        c.roomId     = r["room_id"].as<int>();
        c.sectionId  = r["section_id"].as<int>();
        c.timeSlotId = r["time_slot_id"].as<int>();
        c.dayOfWeek  = r["day_of_week"].as<int>();
        c.period     = r["period_number"].as<int>();
        c.weight     = r["weight"].as<int>();
        c.isActive   = r["is_active"].as<bool>();
        data.constraints.push_back(c);
    }

    return data;
}

// ==================== TimetableRepository ====================

void TimetableRepository::replaceTimetable(const std::vector<TimetableSlot>& slots) {
    auto conn = factory_.createConnection();
    pqxx::work tx{*conn};

    // timetable_slot_period чистится каскадно
    tx.exec0("DELETE FROM timetable_slot");

    for (const TimetableSlot& s : slots) {
        tx.exec_params0(
            R"SQL(
                INSERT INTO timetable_slot (id, offering_id, session_index, section_id, room_id)
                VALUES ($1, $2, $3, $4, $5)
            )SQL",
            s.id, s.offeringId, s.sessionIndex, s.sectionId, s.roomId
        );
        for (size_t k = 0; k < s.timeSlotIds.size(); ++k) {
            tx.exec_params0(
                "INSERT INTO timetable_slot_period (slot_id, position, time_slot_id) "
                "VALUES ($1, $2, $3)",
                s.id, (int)k, s.timeSlotIds[k]
            );
        }
    }

    tx.commit();
}

std::vector<TimetableSlot> TimetableRepository::loadTimetable() {
    auto conn = factory_.createConnection();
    pqxx::read_transaction tx{*conn};

    pqxx::result rows = tx.exec(
        "SELECT id, offering_id, session_index, section_id, room_id "
        "FROM timetable_slot ORDER BY id"
    );
    pqxx::result periods = tx.exec(
        "SELECT slot_id, time_slot_id "
        "FROM timetable_slot_period ORDER BY slot_id, position"
    );

    std::map<int, std::vector<int>> slotPeriods;
    for (const auto& p : periods) {
        slotPeriods[p["slot_id"].as<int>()].push_back(p["time_slot_id"].as<int>());
    }

    std::vector<TimetableSlot> result;
    for (const auto& r : rows) {
        TimetableSlot s;
        s.id           = r["id"].as<int>();
        s.offeringId   = r["offering_id"].as<int>();
        s.sessionIndex = r["session_index"].as<int>();
        s.sectionId    = r["section_id"].as<int>();
        s.roomId       = r["room_id"].as<int>();
        s.timeSlotIds  = slotPeriods[s.id];
        result.push_back(std::move(s));
    }

    return result;
}

bool TimetableRepository::updateSlot(const TimetableSlot& slot) {
    auto conn = factory_.createConnection();
    pqxx::work tx{*conn};

    pqxx::result updated = tx.exec_params(
        "UPDATE timetable_slot SET room_id = $2 WHERE id = $1",
        slot.id, slot.roomId
    );
    if (updated.affected_rows() == 0) {
        return false;
    }

    tx.exec_params0("DELETE FROM timetable_slot_period WHERE slot_id = $1", slot.id);
    for (size_t k = 0; k < slot.timeSlotIds.size(); ++k) {
        tx.exec_params0(
            "INSERT INTO timetable_slot_period (slot_id, position, time_slot_id) "
            "VALUES ($1, $2, $3)",
            slot.id, (int)k, slot.timeSlotIds[k]
        );
    }

    tx.commit();
    return true;
}

long TimetableRepository::recordGeneration(const GenerationLogEntry& entry) {
    auto conn = factory_.createConnection();
    pqxx::work tx{*conn};

    const char* sql = R"SQL(
        INSERT INTO timetable_generation (status, solver_status, total_slots, solve_seconds, notes)
        VALUES ($1, $2, $3, $4, $5)
        RETURNING id;
    )SQL";

    pqxx::row row = tx.exec_params1(
        sql,
        entry.status,
        entry.solverStatus,
        entry.totalSlots,
        entry.solveSeconds,
        entry.notes
    );

    tx.commit();

    long id = row["id"].as<long>();
    return id;
}

std::vector<GenerationLogEntry> TimetableRepository::recentGenerations(int limit) {
    auto conn = factory_.createConnection();
    pqxx::read_transaction tx{*conn};

    const char* sql = R"SQL(
        SELECT id, status, solver_status, total_slots, solve_seconds, notes,
               to_char(created_at, 'YYYY-MM-DD HH24:MI:SS') AS created_at
        FROM timetable_generation
        ORDER BY created_at DESC, id DESC
        LIMIT $1;
    )SQL";

    pqxx::result rows = tx.exec_params(sql, limit);

    std::vector<GenerationLogEntry> result;
    for (const auto& r : rows) {
        GenerationLogEntry e;
        e.id           = r["id"].as<long>();
        e.status       = r["status"].as<std::string>();
        e.solverStatus = r["solver_status"].as<std::string>();
        e.totalSlots   = r["total_slots"].as<int>();
        e.solveSeconds = r["solve_seconds"].as<double>();
        e.notes        = r["notes"].as<std::string>();
        e.createdAt    = r["created_at"].as<std::string>();
        result.push_back(std::move(e));
    }

    return result;
}

} // namespace db
