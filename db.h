#pragma once

#include <pqxx/pqxx>

#include <memory>
#include <string>
#include <vector>

#include "catalog.h"
#include "model.h"

namespace db {

// --- Конфиг подключения к БД ---
struct DbConfig {
    std::string host;
    int         port;
    std::string dbname;
    std::string user;
    std::string password;

    static DbConfig fromEnv();

    // Заданы ли переменные TIMETABLE_DB_* (без них сервер работает только в памяти)
    static bool isConfigured();
};

// --- Фабрика соединений ---
class ConnectionFactory {
public:
    explicit ConnectionFactory(const DbConfig& cfg);

    std::unique_ptr<pqxx::connection> createConnection() const;

private:
    DbConfig config;
};

// --- Справочники для одного прогона ---
class CatalogRepository {
public:
    explicit CatalogRepository(ConnectionFactory& factory)
        : factory_(factory) {}

    // Все таблицы читаются в одной транзакции
    CatalogData loadCatalog();

private:
    ConnectionFactory& factory_;
};

// --- Запись журнала генерации ---
struct GenerationLogEntry {
    std::string status;        // "success" / "failed"
    std::string solverStatus;  // "OPTIMAL", "INFEASIBLE", ...
    int totalSlots;
    double solveSeconds;
    std::string notes;

    // заполняются только при чтении журнала
    long id;
    std::string createdAt;  // "YYYY-MM-DD HH:MM:SS"
};

// --- Сохранённое расписание ---
class TimetableRepository {
public:
    explicit TimetableRepository(ConnectionFactory& factory)
        : factory_(factory) {}

    // Полная замена расписания
    void replaceTimetable(const std::vector<TimetableSlot>& slots);

    std::vector<TimetableSlot> loadTimetable();

    // После ручного переноса; false, если записи с таким id нет
    bool updateSlot(const TimetableSlot& slot);

    long recordGeneration(const GenerationLogEntry& entry);

    // Последние прогоны, новые первыми
    std::vector<GenerationLogEntry> recentGenerations(int limit);

private:
    ConnectionFactory& factory_;
};

} // namespace db
