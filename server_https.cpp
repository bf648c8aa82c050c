// server_https.cpp
#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <pqxx/pqxx>

#include "db.h"

#include "api_dto.h"
#include "api_json.h"
#include "catalog.h"
#include "config.h"
#include "demo_data.h"
#include "editor.h"
#include "errors.h"
#include "generator.h"
#include "logger.h"
#include "timetable.h"
#include "validator.h"

using nlohmann::json;

// --------- состояние сервера ---------

// Каталог последней удачной генерации и текущее расписание.
// Генерация и переносы идут строго по одному под mu.
struct ServerState {
    std::mutex mu;
    std::unique_ptr<Catalog> catalog;
    Timetable timetable;
    EngineConfig engine;          // база для запросов (окружение)
    EngineConfig timetableEngine; // с ним построено текущее расписание
    CatalogSource catalogSource = CatalogSource::Database;
    std::unique_ptr<db::ConnectionFactory> dbFactory; // nullptr: работаем только в памяти
};

// --------- хелперы ответа ---------

static void setCors(httplib::Response& res, const char* methods) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", methods);
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
}

static void sendJson(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json; charset=utf-8");
}

static void addPreflight(httplib::SSLServer& svr, const char* path, const char* methods) {
    std::string allowed(methods);
    svr.Options(path, [allowed](const httplib::Request&, httplib::Response& res) {
        setCors(res, allowed.c_str());
        res.status = 204;
    });
}

// Пустое тело запроса считаем пустым объектом
static json parseBody(const httplib::Request& req) {
    if (req.body.empty()) return json::object();
    json body = json::parse(req.body);
    if (!body.is_object()) {
        throw CatalogError("Request body must be a JSON object");
    }
    return body;
}

static int queryInt(const httplib::Request& req, const char* key, int fallback) {
    if (!req.has_param(key)) return fallback;
    std::string raw = req.get_param_value(key);
    char* end = nullptr;
    long value = std::strtol(raw.c_str(), &end, 10);
    if (raw.empty() || !end || *end != '\0') {
        throw std::invalid_argument(std::string("Query parameter '") + key + "' must be an integer");
    }
    return (int)value;
}

static json generationLogToJson(const db::GenerationLogEntry& e) {
    return {
        {"id", e.id},
        {"status", e.status},
        {"solverStatus", e.solverStatus},
        {"totalSlots", e.totalSlots},
        {"solveSeconds", e.solveSeconds},
        {"notes", e.notes},
        {"createdAt", e.createdAt}
    };
}

static int requireBodyInt(const json& body, const char* key) {
    if (!body.contains(key) || !body.at(key).is_number_integer()) {
        throw CatalogError(std::string("Field '") + key + "' must be an integer");
    }
    return body.at(key).get<int>();
}

// --------- загрузка из БД при старте ---------

static void restoreFromDb(ServerState& state) {
    if (!state.dbFactory) return;

    try {
        db::CatalogRepository catalogRepo{*state.dbFactory};
        db::TimetableRepository timetableRepo{*state.dbFactory};

        auto catalog = std::make_unique<Catalog>(catalogRepo.loadCatalog());
        std::vector<TimetableSlot> slots = timetableRepo.loadTimetable();

        state.catalog = std::move(catalog);
        state.timetable.replaceAll(std::move(slots));
        state.timetableEngine = state.engine;
        state.catalogSource = CatalogSource::Database;

        logInfo("Из БД загружено расписание: записей=" +
                std::to_string(state.timetable.slots().size()));
    } catch (const std::exception& ex) {
        logError(std::string("Не удалось загрузить расписание из БД: ") + ex.what());
    }
}

// Сохраняет результат генерации; ошибки БД не отменяют генерацию в памяти.
// Расписание пишется только для каталога из БД, журнал ведётся для всех прогонов.
static bool persistGeneration(ServerState& state, const GenerationResult& result, CatalogSource source) {
    if (!state.dbFactory) return false;

    db::TimetableRepository repo{*state.dbFactory};
    bool saved = false;

    if (shouldStoreTimetable(source, result)) {
        try {
            repo.replaceTimetable(result.slots);
            saved = true;
        } catch (const std::exception& ex) {
            logError(std::string("Failed to save timetable: ") + ex.what());
        }
    } else if (result.ok) {
        logInfo("Каталог не из БД (" + catalogSourceToString(source) +
                "), сохранённое расписание не трогаем");
    }

    try {
        db::GenerationLogEntry entry{};
        entry.status       = result.ok ? "success" : "failed";
        entry.solverStatus = solveStatusToString(result.solverStatus);
        entry.totalSlots   = (int)result.slots.size();
        entry.solveSeconds = result.stats.solveSeconds;
        entry.notes        = "[" + catalogSourceToString(source) + "] " + result.message;
        long id = repo.recordGeneration(entry);

        logInfo("Журнал генерации: запись id=" + std::to_string(id));
    } catch (const std::exception& ex) {
        logError(std::string("Failed to record generation: ") + ex.what());
    }
    return saved;
}

// --------- маршруты ---------

static void registerRoutes(httplib::SSLServer& svr, ServerState& state) {

    // --- корень ---
    svr.Get("/", [](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_content(
            "HTTPS timetable server is running.\n"
            "POST /api/timetable/generate   (тело: {\"catalog\":{...}, \"engine\":{...}} или {\"demo\":true};\n"
            "                                без каталога берём справочники из БД)\n"
            "GET  /api/timetable            (текущее расписание; ?filterType=section|teacher|room&filterId=N)\n"
            "GET  /api/timetable/slot/N     (одна запись)\n"
            "GET  /api/timetable/generations (журнал генераций из БД; ?limit=N)\n"
            "GET  /api/catalog              (каталог текущего расписания)\n"
            "POST /api/timetable/move       ({\"slotId\":N, \"timeSlotId\":N, \"roomId\":N})\n"
            "GET  /api/timetable/conflicts  (проверка текущего расписания)\n"
            "GET  /api/health/db            (проверка подключения к БД)\n",
            "text/plain; charset=utf-8"
        );
    });

    // --- POST /api/timetable/generate ---
    svr.Post("/api/timetable/generate", [&state](const httplib::Request& req, httplib::Response& res) {
        setCors(res, "POST, OPTIONS");

        try {
            json body;
            EngineConfig engine;
            std::unique_ptr<Catalog> catalog;
            CatalogSource source = CatalogSource::Database;

            try {
                body = parseBody(req);
                engine = EngineConfig::fromJson(body.value("engine", json::object()), state.engine);

                if (body.contains("catalog")) {
                    catalog = std::make_unique<Catalog>(catalogDataFromJson(body["catalog"]));
                    source = CatalogSource::Request;
                } else if (body.value("demo", false)) {
                    catalog = std::make_unique<Catalog>(buildDemoCatalog());
                    source = CatalogSource::Demo;
                }
            } catch (const json::exception& ex) {
                logError(std::string("Error in POST /api/timetable/generate: ") + ex.what());
                sendJson(res, 400, errorToJson("invalid JSON"));
                return;
            } catch (const std::runtime_error& ex) {
                // CatalogError и ошибки EngineConfig
                logError(std::string("Error in POST /api/timetable/generate: ") + ex.what());
                sendJson(res, 400, errorToJson(ex.what()));
                return;
            }

            std::lock_guard<std::mutex> lock(state.mu);

            if (!catalog) {
                if (!state.dbFactory) {
                    sendJson(res, 400, errorToJson("no catalog in request and no database configured"));
                    return;
                }
                db::CatalogRepository repo{*state.dbFactory};
                catalog = std::make_unique<Catalog>(repo.loadCatalog());
            }

            logInfo("POST /api/timetable/generate оферингов=" +
                    std::to_string(catalog->offerings().size()) +
                    " слотов=" + std::to_string(catalog->timeSlots().size()));

            GenerationResult result = generateTimetable(*catalog, engine);
            bool persisted = persistGeneration(state, result, source);

            json resp = generationResultToJson(*catalog, result);
            resp["persisted"] = persisted;

            if (!result.ok) {
                // старое расписание остаётся как было
                sendJson(res, 422, resp);
                return;
            }

            state.catalog = std::move(catalog);
            state.timetable.replaceAll(result.slots);
            state.timetableEngine = engine;
            state.catalogSource = source;
            resp["version"] = state.timetable.version();

            sendJson(res, 200, resp);
        } catch (const CatalogError& ex) {
            logError(std::string("Error in POST /api/timetable/generate: ") + ex.what());
            sendJson(res, 400, errorToJson(ex.what()));
        } catch (const std::exception& ex) {
            logError(std::string("Error in POST /api/timetable/generate: ") + ex.what());
            sendJson(res, 500, errorToJson("internal server error"));
        }
    });
    addPreflight(svr, "/api/timetable/generate", "POST, OPTIONS");

    // --- GET /api/timetable ---
    svr.Get("/api/timetable", [&state](const httplib::Request& req, httplib::Response& res) {
        setCors(res, "GET, OPTIONS");

        SlotFilter filter{SlotFilterKind::All, -1};
        try {
            filter = parseSlotFilter(req.get_param_value("filterType"), req.get_param_value("filterId"));
        } catch (const std::invalid_argument& ex) {
            sendJson(res, 400, errorToJson(ex.what()));
            return;
        }

        try {
            std::lock_guard<std::mutex> lock(state.mu);
            if (!state.catalog) {
                sendJson(res, 404, errorToJson("no_timetable"));
                return;
            }
            sendJson(res, 200, timetableToJson(*state.catalog, state.timetable, filter));
        } catch (const std::exception& ex) {
            logError(std::string("Error in GET /api/timetable: ") + ex.what());
            sendJson(res, 500, errorToJson("internal server error"));
        }
    });
    addPreflight(svr, "/api/timetable", "GET, OPTIONS");

    // --- GET /api/timetable/slot/<id> ---
    svr.Get(R"(/api/timetable/slot/(\d+))", [&state](const httplib::Request& req, httplib::Response& res) {
        setCors(res, "GET, OPTIONS");

        try {
            int slotId = std::stoi(req.matches[1]);

            std::lock_guard<std::mutex> lock(state.mu);
            const TimetableSlot* slot = state.catalog ? state.timetable.findById(slotId) : nullptr;
            if (!slot) {
                sendJson(res, 404, errorToJson("slot not found"));
                return;
            }

            std::vector<TimetableSlotView> views = buildSlotViews(*state.catalog, {*slot});
            json resp = slotViewToJson(views.front());
            resp["version"] = state.timetable.version();
            sendJson(res, 200, resp);
        } catch (const std::out_of_range&) {
            sendJson(res, 404, errorToJson("slot not found"));
        } catch (const std::exception& ex) {
            logError(std::string("Error in GET /api/timetable/slot: ") + ex.what());
            sendJson(res, 500, errorToJson("internal server error"));
        }
    });
    addPreflight(svr, R"(/api/timetable/slot/(\d+))", "GET, OPTIONS");

    // --- GET /api/timetable/generations ---
    svr.Get("/api/timetable/generations", [&state](const httplib::Request& req, httplib::Response& res) {
        setCors(res, "GET, OPTIONS");

        if (!state.dbFactory) {
            sendJson(res, 503, errorToJson("database is not configured"));
            return;
        }

        int limit = 10;
        try {
            limit = queryInt(req, "limit", 10);
        } catch (const std::invalid_argument& ex) {
            sendJson(res, 400, errorToJson(ex.what()));
            return;
        }
        if (limit < 1 || limit > 100) {
            sendJson(res, 400, errorToJson("limit must be between 1 and 100"));
            return;
        }

        try {
            db::TimetableRepository repo{*state.dbFactory};
            std::vector<db::GenerationLogEntry> entries = repo.recentGenerations(limit);

            json arr = json::array();
            for (const auto& e : entries) arr.push_back(generationLogToJson(e));
            sendJson(res, 200, {{"generations", arr}});
        } catch (const std::exception& ex) {
            logError(std::string("Error in GET /api/timetable/generations: ") + ex.what());
            sendJson(res, 500, errorToJson("internal server error"));
        }
    });
    addPreflight(svr, "/api/timetable/generations", "GET, OPTIONS");

    // --- GET /api/catalog ---
    svr.Get("/api/catalog", [&state](const httplib::Request&, httplib::Response& res) {
        setCors(res, "GET, OPTIONS");

        try {
            std::lock_guard<std::mutex> lock(state.mu);
            if (!state.catalog) {
                sendJson(res, 404, errorToJson("no_timetable"));
                return;
            }
            json resp = catalogDataToJson(state.catalog->data());
            resp["source"] = catalogSourceToString(state.catalogSource);
            sendJson(res, 200, resp);
        } catch (const std::exception& ex) {
            logError(std::string("Error in GET /api/catalog: ") + ex.what());
            sendJson(res, 500, errorToJson("internal server error"));
        }
    });
    addPreflight(svr, "/api/catalog", "GET, OPTIONS");

    // --- POST /api/timetable/move ---
    svr.Post("/api/timetable/move", [&state](const httplib::Request& req, httplib::Response& res) {
        setCors(res, "POST, OPTIONS");

        int slotId = 0;
        int timeSlotId = 0;
        int roomId = 0;
        try {
            json body = parseBody(req);
            slotId     = requireBodyInt(body, "slotId");
            timeSlotId = requireBodyInt(body, "timeSlotId");
            roomId     = requireBodyInt(body, "roomId");
        } catch (const std::exception& ex) {
            logError(std::string("Error in POST /api/timetable/move: ") + ex.what());
            sendJson(res, 400, errorToJson(ex.what()));
            return;
        }

        try {
            std::lock_guard<std::mutex> lock(state.mu);
            if (!state.catalog) {
                sendJson(res, 404, errorToJson("no_timetable"));
                return;
            }

            TimetableEditor editor(*state.catalog, state.timetable, state.timetableEngine);
            TimetableSlot updated = editor.move(slotId, timeSlotId, roomId);

            // в БД лежит расписание по её же справочникам
            bool persisted = false;
            if (state.dbFactory && state.catalogSource == CatalogSource::Database) {
                try {
                    db::TimetableRepository repo{*state.dbFactory};
                    persisted = repo.updateSlot(updated);
                } catch (const std::exception& ex) {
                    logError(std::string("Failed to save moved slot: ") + ex.what());
                }
            }

            json resp = {
                {"ok", true},
                {"slot", slotToJson(updated)},
                {"version", state.timetable.version()},
                {"persisted", persisted}
            };
            sendJson(res, 200, resp);
        } catch (const InvalidMoveError& ex) {
            sendJson(res, 409, invalidMoveToJson(ex));
        } catch (const std::exception& ex) {
            logError(std::string("Error in POST /api/timetable/move: ") + ex.what());
            sendJson(res, 500, errorToJson("internal server error"));
        }
    });
    addPreflight(svr, "/api/timetable/move", "POST, OPTIONS");

    // --- GET /api/timetable/conflicts ---
    svr.Get("/api/timetable/conflicts", [&state](const httplib::Request&, httplib::Response& res) {
        setCors(res, "GET, OPTIONS");

        try {
            std::lock_guard<std::mutex> lock(state.mu);
            if (!state.catalog) {
                sendJson(res, 404, errorToJson("no_timetable"));
                return;
            }

            TimetableValidator validator;
            ValidationResult vr = validator.checkAll(*state.catalog, state.timetable.slots(), state.timetableEngine);

            json resp = validationToJson(vr);
            resp["version"] = state.timetable.version();
            sendJson(res, 200, resp);
        } catch (const std::exception& ex) {
            logError(std::string("Error in GET /api/timetable/conflicts: ") + ex.what());
            sendJson(res, 500, errorToJson("internal server error"));
        }
    });
    addPreflight(svr, "/api/timetable/conflicts", "GET, OPTIONS");

    // --- GET /api/health/db ---
    svr.Get("/api/health/db", [&state](const httplib::Request&, httplib::Response& res) {
        setCors(res, "GET, OPTIONS");

        if (!state.dbFactory) {
            sendJson(res, 503, {{"ok", false}, {"error", "database is not configured"}});
            return;
        }

        try {
            auto conn = state.dbFactory->createConnection();
            pqxx::work tx{*conn};
            auto r = tx.exec("SELECT 1");
            tx.commit();

            sendJson(res, 200, {{"ok", true}, {"result", r[0][0].as<int>()}});
        } catch (const std::exception& ex) {
            logError(std::string("DB health check failed: ") + ex.what());
            sendJson(res, 500, {{"ok", false}, {"error", ex.what()}});
        }
    });
    addPreflight(svr, "/api/health/db", "GET, OPTIONS");
}

int main() {
    try {
        ServerConfig serverCfg = ServerConfig::fromEnv();
        logInfo("=== Запуск HTTPS сервера на " + serverCfg.host + ":" +
                std::to_string(serverCfg.port) + " ===");

        ServerState state;
        state.engine.applyEnv();

        if (db::DbConfig::isConfigured()) {
            db::DbConfig dbCfg = db::DbConfig::fromEnv();
            state.dbFactory = std::make_unique<db::ConnectionFactory>(dbCfg);
            logInfo("Успешно инициализирована конфигурация БД");
            restoreFromDb(state);
        } else {
            logWarning("TIMETABLE_DB_* не заданы, расписание хранится только в памяти");
        }

        httplib::SSLServer svr(serverCfg.certPath.c_str(), serverCfg.keyPath.c_str());

        if (!svr.is_valid()) {
            logError("SSLServer невалиден. Проверь " + serverCfg.certPath + " и " + serverCfg.keyPath);
            return 1;
        }

        registerRoutes(svr, state);

        bool ok = svr.listen(serverCfg.host.c_str(), serverCfg.port);
        if (!ok) {
            logError("Не удалось запустить HTTPS сервер на порту " + std::to_string(serverCfg.port));
            return 1;
        }

    } catch (const std::exception& ex) {
        logError(std::string("Fatal error on startup: ") + ex.what());
        return 1;
    }

    return 0;
}
