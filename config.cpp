#include "config.h"

#include "logger.h"

#include <cstdlib>
#include <stdexcept>

static const char* getEnvOrNull(const char* name) {
    const char* val = std::getenv(name);
    if (!val || !*val) return nullptr;
    return val;
}

static void checkEngineConfig(const EngineConfig& cfg) {
    if (cfg.timeLimitSeconds < 0) {
        throw std::runtime_error("Invalid engine config: timeLimitSeconds must be >= 0");
    }
    if (cfg.defaultLabBlockLength < 1) {
        throw std::runtime_error("Invalid engine config: defaultLabBlockLength must be >= 1");
    }
    if (cfg.hoursPerPeriod < 1) {
        throw std::runtime_error("Invalid engine config: hoursPerPeriod must be >= 1");
    }
}

EngineConfig EngineConfig::fromJson(const nlohmann::json& j, const EngineConfig& base) {
    EngineConfig cfg = base;
    if (!j.is_object()) {
        return cfg;
    }

    cfg.timeLimitSeconds      = j.value("timeLimitSeconds", cfg.timeLimitSeconds);
    cfg.optimize              = j.value("optimize", cfg.optimize);
    cfg.defaultLabBlockLength = j.value("defaultLabBlockLength", cfg.defaultLabBlockLength);
    cfg.hoursPerPeriod        = j.value("hoursPerPeriod", cfg.hoursPerPeriod);

    if (j.contains("weights") && j["weights"].is_object()) {
        const nlohmann::json& jw = j["weights"];
        cfg.weights.edgePeriodPenalty   = jw.value("edgePeriodPenalty", cfg.weights.edgePeriodPenalty);
        cfg.weights.dailyBalancePenalty = jw.value("dailyBalancePenalty", cfg.weights.dailyBalancePenalty);
        cfg.weights.preferenceScale     = jw.value("preferenceScale", cfg.weights.preferenceScale);
        cfg.weights.preferredRoomBonus  = jw.value("preferredRoomBonus", cfg.weights.preferredRoomBonus);
    }

    checkEngineConfig(cfg);
    return cfg;
}

EngineConfig EngineConfig::fromJson(const nlohmann::json& j) {
    return fromJson(j, EngineConfig());
}

void EngineConfig::applyEnv() {
    if (const char* limit = getEnvOrNull("TIMETABLE_SOLVER_TIME_LIMIT")) {
        timeLimitSeconds = std::stod(limit);
        logInfo("Лимит времени солвера из окружения: " + std::string(limit) + " c");
    }
    if (const char* opt = getEnvOrNull("TIMETABLE_SOLVER_OPTIMIZE")) {
        std::string v(opt);
        optimize = !(v == "0" || v == "false" || v == "no");
    }
    checkEngineConfig(*this);
}

nlohmann::json engineConfigToJson(const EngineConfig& cfg) {
    return {
        {"timeLimitSeconds", cfg.timeLimitSeconds},
        {"optimize", cfg.optimize},
        {"defaultLabBlockLength", cfg.defaultLabBlockLength},
        {"hoursPerPeriod", cfg.hoursPerPeriod},
        {"weights", {
            {"edgePeriodPenalty", cfg.weights.edgePeriodPenalty},
            {"dailyBalancePenalty", cfg.weights.dailyBalancePenalty},
            {"preferenceScale", cfg.weights.preferenceScale},
            {"preferredRoomBonus", cfg.weights.preferredRoomBonus}
        }}
    };
}

ServerConfig ServerConfig::fromEnv() {
    ServerConfig cfg;

    const char* host = getEnvOrNull("TIMETABLE_HTTP_HOST");
    cfg.host = host ? host : "127.0.0.1";

    const char* portStr = getEnvOrNull("TIMETABLE_HTTP_PORT");
    cfg.port = portStr ? std::stoi(portStr) : 8443; // по умолчанию 8443

    const char* cert = getEnvOrNull("TIMETABLE_TLS_CERT");
    cfg.certPath = cert ? cert : "server-cert.pem";

    const char* key = getEnvOrNull("TIMETABLE_TLS_KEY");
    cfg.keyPath = key ? key : "server-key.pem";

    return cfg;
}
