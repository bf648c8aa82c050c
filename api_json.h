#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "api_dto.h"
#include "catalog.h"
#include "errors.h"
#include "generator.h"
#include "model.h"
#include "timetable.h"
#include "validator.h"

// Каталог из JSON. Времена слотов в формате "HH:MM".
// Кидает CatalogError на отсутствующих полях и неверных типах.
CatalogData catalogDataFromJson(const nlohmann::json& j);
nlohmann::json catalogDataToJson(const CatalogData& data);

nlohmann::json slotToJson(const TimetableSlot& slot);
nlohmann::json slotViewToJson(const TimetableSlotView& view);

// {"version": N, "slots": [...]} с подставленными названиями
nlohmann::json timetableToJson(const Catalog& catalog, const Timetable& timetable);

// То же, но только записи под фильтром; добавляет "filter": {"type", "id"}
nlohmann::json timetableToJson(const Catalog& catalog, const Timetable& timetable,
                               const SlotFilter& filter);

nlohmann::json generationResultToJson(const Catalog& catalog, const GenerationResult& result);

nlohmann::json validationToJson(const ValidationResult& result);

nlohmann::json invalidMoveToJson(const InvalidMoveError& e);

nlohmann::json errorToJson(const std::string& message);
