#pragma once

#include <string>

#include <nlohmann/json.hpp>

// Веса мягких ограничений, целые.
struct ObjectiveWeights {
    int edgePeriodPenalty   = 1; // занятие на первой/последней паре дня
    int dailyBalancePenalty = 1; // неравномерность по дням (сумма квадратов)
    int preferenceScale     = 1; // множитель весов section/time preference
    int preferredRoomBonus  = 1; // оферинг попал в свою аудиторию
};

struct EngineConfig {
    double timeLimitSeconds   = 0.0; // 0 = без ограничения
    bool optimize             = true;
    int defaultLabBlockLength = 2;
    int hoursPerPeriod        = 1;
    ObjectiveWeights weights;

    // Читает поля из JSON-объекта, отсутствующие оставляет как есть
    static EngineConfig fromJson(const nlohmann::json& j, const EngineConfig& base);
    static EngineConfig fromJson(const nlohmann::json& j);

    // Переопределения из окружения (TIMETABLE_SOLVER_*)
    void applyEnv();
};

nlohmann::json engineConfigToJson(const EngineConfig& cfg);

struct ServerConfig {
    std::string host;
    int port;
    std::string certPath;
    std::string keyPath;

    static ServerConfig fromEnv();
};
