#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "api_json.h"
#include "catalog.h"
#include "config.h"
#include "demo_data.h"
#include "errors.h"
#include "generator.h"
#include "logger.h"

using nlohmann::json;

static void printUsage() {
    std::cerr << "usage: timetable_cli [catalog.json] [--time-limit S] [--no-optimize]\n"
                 "без catalog.json используется встроенный демо-каталог\n";
}

int main(int argc, char** argv) {
    std::string catalogPath;
    EngineConfig cfg;
    bool timeLimitSet = false;
    bool noOptimize = false;
    double timeLimit = 0.0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else if (arg == "--no-optimize") {
            noOptimize = true;
        } else if (arg == "--time-limit") {
            if (i + 1 >= argc) {
                printUsage();
                return 1;
            }
            char* end = nullptr;
            timeLimit = std::strtod(argv[++i], &end);
            if (!end || *end != '\0' || timeLimit < 0) {
                std::cerr << "invalid --time-limit value: " << argv[i] << "\n";
                return 1;
            }
            timeLimitSet = true;
        } else if (catalogPath.empty() && arg.rfind("--", 0) != 0) {
            catalogPath = arg;
        } else {
            printUsage();
            return 1;
        }
    }

    try {
        // порядок: умолчания -> окружение -> "engine" из файла -> флаги
        cfg.applyEnv();

        CatalogData data;
        if (catalogPath.empty()) {
            logInfo("Каталог не задан, используем демо-каталог");
            data = buildDemoCatalog();
        } else {
            std::ifstream in(catalogPath);
            if (!in) {
                throw CatalogError("Cannot open catalog file " + catalogPath);
            }
            json j = json::parse(in);
            data = catalogDataFromJson(j);
            if (j.contains("engine")) {
                cfg = EngineConfig::fromJson(j["engine"], cfg);
            }
        }

        if (timeLimitSet) cfg.timeLimitSeconds = timeLimit;
        if (noOptimize) cfg.optimize = false;

        Catalog catalog(std::move(data));
        GenerationResult result = generateTimetable(catalog, cfg);

        json out = generationResultToJson(catalog, result);
        out["engine"] = engineConfigToJson(cfg);
        std::cout << out.dump(2) << std::endl;

        return result.ok ? 0 : 2;
    } catch (const json::exception& ex) {
        logError(std::string("Invalid catalog JSON: ") + ex.what());
        std::cout << errorToJson(ex.what()).dump(2) << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        logError(std::string("Fatal error: ") + ex.what());
        std::cout << errorToJson(ex.what()).dump(2) << std::endl;
        return 1;
    }
}
