#pragma once

#include <string>
#include <vector>

#include "catalog.h"
#include "config.h"
#include "errors.h"
#include "model.h"

struct ValidationResult {
    bool ok;                             // true, если ошибок нет
    std::vector<std::string> errors;     // нарушения жёстких правил
    std::vector<std::string> warnings;   // замечания, расписание при этом допустимо
};

// Две записи занимают один ресурс в одном слоте
struct Overlap {
    ConflictResource resource;
    int resourceId;
    int timeSlotId;
    int firstId;   // id записей, firstId < secondId
    int secondId;
};

// Пересечения по преподавателям, аудиториям и группам (в таком порядке).
// Внутри ресурса порядок по (resourceId, timeSlotId).
std::vector<Overlap> findOverlaps(const Catalog& catalog, const std::vector<TimetableSlot>& records);

// Отчёт о конфликтах для уже существующего расписания
class TimetableValidator {
    public:
        ValidationResult checkAll(
            const Catalog& catalog,
            const std::vector<TimetableSlot>& records,
            const EngineConfig& cfg
        );

    private:
        void checkOverlaps(
            const Catalog& catalog,
            const std::vector<TimetableSlot>& records,
            ValidationResult& result
        );

        void checkRooms(
            const Catalog& catalog,
            const std::vector<TimetableSlot>& records,
            ValidationResult& result
        );

        void checkBlocks(
            const Catalog& catalog,
            const std::vector<TimetableSlot>& records,
            const EngineConfig& cfg,
            ValidationResult& result
        );

        void checkAvailability(
            const Catalog& catalog,
            const std::vector<TimetableSlot>& records,
            ValidationResult& result
        );

        void checkWeeklyLoad(
            const Catalog& catalog,
            const std::vector<TimetableSlot>& records,
            const EngineConfig& cfg,
            ValidationResult& result
        );

        void checkAllSessionsAssigned(
            const Catalog& catalog,
            const std::vector<TimetableSlot>& records,
            const EngineConfig& cfg,
            ValidationResult& result
        );
    };
