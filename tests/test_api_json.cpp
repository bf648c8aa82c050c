#include <gtest/gtest.h>

#include <stdexcept>

#include <nlohmann/json.hpp>

#include "api_dto.h"
#include "api_json.h"
#include "config.h"
#include "test_helpers.h"

using nlohmann::json;

static json sampleCatalog() {
    return json::parse(R"({
        "teachers": [{"id": 1, "name": "Dr. Sarah Johnson", "code": "SJ", "maxWeeklyLoad": 12}],
        "courses": [
            {"id": 10, "code": "CS101", "name": "Intro", "sessionsPerWeek": 2},
            {"id": 11, "code": "CS103", "name": "Lab", "sessionsPerWeek": 1, "isLab": true, "sessionDuration": 2}
        ],
        "sections": [{"id": 5, "name": "CS-I-A", "studentCount": 30}],
        "rooms": [
            {"id": 1, "number": "101", "capacity": 40},
            {"id": 2, "number": "LAB1", "roomType": "lab", "capacity": 30, "isActive": false}
        ],
        "timeSlots": [
            {"id": 1, "dayOfWeek": 0, "period": 1, "startTime": "09:00", "endTime": "09:50"},
            {"id": 2, "dayOfWeek": 0, "period": 2, "startTime": "09:50", "endTime": "10:40"},
            {"id": 3, "dayOfWeek": 0, "period": 3, "startTime": "10:40", "endTime": "10:55", "isBreak": true}
        ],
        "offerings": [
            {"id": 100, "courseId": 10, "teacherId": 1, "sectionId": 5},
            {"id": 101, "courseId": 11, "teacherId": 1, "sectionId": 5, "preferredRoomId": 2}
        ],
        "constraints": [
            {"id": 1, "type": "teacher_unavailable", "teacherId": 1, "dayOfWeek": 0, "period": 1},
            {"id": 2, "type": "time_preference", "timeSlotId": 2, "weight": 3}
        ]
    })");
}

class ApiJsonTest : public ::testing::Test {
protected:
    void SetUp() override { quietLogs(); }
};

TEST_F(ApiJsonTest, ParsesCatalog) {
    CatalogData data = catalogDataFromJson(sampleCatalog());

    ASSERT_EQ(data.teachers.size(), 1u);
    EXPECT_EQ(data.teachers[0].maxWeeklyLoad, 12);
    EXPECT_TRUE(data.teachers[0].isActive);

    ASSERT_EQ(data.courses.size(), 2u);
    EXPECT_EQ(data.courses[0].sessionDuration, 1);
    EXPECT_TRUE(data.courses[1].isLab);
    EXPECT_EQ(data.courses[1].sessionDuration, 2);

    EXPECT_EQ(data.rooms[0].roomType, "classroom");
    EXPECT_FALSE(data.rooms[1].isActive);

    EXPECT_EQ(data.timeSlots[1].startMinutes, 9 * 60 + 50);
    EXPECT_EQ(data.timeSlots[1].endMinutes, 10 * 60 + 40);
    EXPECT_TRUE(data.timeSlots[2].isBreak);

    EXPECT_EQ(data.offerings[0].preferredRoomId, -1);
    EXPECT_EQ(data.offerings[0].sessionsPerWeek, 0);
    EXPECT_EQ(data.offerings[1].preferredRoomId, 2);

    EXPECT_EQ(data.constraints[0].type, ConstraintType::TeacherUnavailable);
    EXPECT_EQ(data.constraints[0].timeSlotId, -1);
    EXPECT_EQ(data.constraints[0].period, 1);
    EXPECT_EQ(data.constraints[1].weight, 3);

    Catalog catalog(data);
    EXPECT_TRUE(catalog.isTeacherUnavailable(1, 1));
}

TEST_F(ApiJsonTest, MissingCollectionsAreEmpty) {
    CatalogData data = catalogDataFromJson(json::object());
    EXPECT_TRUE(data.teachers.empty());
    EXPECT_TRUE(data.constraints.empty());
}

TEST_F(ApiJsonTest, RejectsMalformedCatalog) {
    json noId = sampleCatalog();
    noId["teachers"][0].erase("id");
    EXPECT_THROW(catalogDataFromJson(noId), CatalogError);

    json badType = sampleCatalog();
    badType["constraints"][0]["type"] = "teacher_busy";
    EXPECT_THROW(catalogDataFromJson(badType), CatalogError);

    json badCapacity = sampleCatalog();
    badCapacity["rooms"][0]["capacity"] = "big";
    EXPECT_THROW(catalogDataFromJson(badCapacity), CatalogError);

    json badFlag = sampleCatalog();
    badFlag["rooms"][0]["isActive"] = "yes";
    EXPECT_THROW(catalogDataFromJson(badFlag), CatalogError);

    json badTime = sampleCatalog();
    badTime["timeSlots"][0]["startTime"] = "9 am";
    EXPECT_THROW(catalogDataFromJson(badTime), CatalogError);

    json notArray = sampleCatalog();
    notArray["rooms"] = json::object();
    EXPECT_THROW(catalogDataFromJson(notArray), CatalogError);

    EXPECT_THROW(catalogDataFromJson(json::array()), CatalogError);
}

TEST_F(ApiJsonTest, WrittenCatalogReadsBack) {
    CatalogData data = catalogDataFromJson(sampleCatalog());
    CatalogData again = catalogDataFromJson(catalogDataToJson(data));

    EXPECT_EQ(again.timeSlots[2].startMinutes, data.timeSlots[2].startMinutes);
    EXPECT_EQ(again.constraints[1].type, ConstraintType::TimePreference);
    EXPECT_EQ(again.offerings[1].preferredRoomId, 2);
    EXPECT_EQ(again.rooms[1].roomType, "lab");
}

TEST_F(ApiJsonTest, SlotViewsResolveNames) {
    Catalog catalog(catalogDataFromJson(sampleCatalog()));
    std::vector<TimetableSlot> slots = {TimetableSlot{1, 101, 0, 5, 2, {1, 2}}};

    std::vector<TimetableSlotView> views = buildSlotViews(catalog, slots);
    ASSERT_EQ(views.size(), 1u);
    EXPECT_EQ(views[0].courseCode, "CS103");
    EXPECT_TRUE(views[0].isLab);
    EXPECT_EQ(views[0].teacherCode, "SJ");
    EXPECT_EQ(views[0].sectionName, "CS-I-A");
    EXPECT_EQ(views[0].roomNumber, "LAB1");
    EXPECT_EQ(views[0].firstPeriod, 1);
    EXPECT_EQ(views[0].lastPeriod, 2);
    EXPECT_EQ(views[0].startTime, "09:00");
    EXPECT_EQ(views[0].endTime, "10:40");

    json j = slotViewToJson(views[0]);
    EXPECT_EQ(j["timeSlotIds"], json::array({1, 2}));
    EXPECT_EQ(j["dayOfWeek"], 0);
}

TEST_F(ApiJsonTest, TimetableCarriesVersion) {
    Catalog catalog(catalogDataFromJson(sampleCatalog()));
    Timetable timetable;
    timetable.replaceAll({TimetableSlot{1, 100, 0, 5, 1, {2}}});

    json j = timetableToJson(catalog, timetable);
    EXPECT_EQ(j["version"], 1);
    ASSERT_EQ(j["slots"].size(), 1u);
    EXPECT_EQ(j["slots"][0]["courseCode"], "CS101");
}

TEST_F(ApiJsonTest, TimetableFilteredByEntity) {
    Catalog catalog = CatalogBuilder()
        .teacher(1).teacher(2)
        .course(10, 2)
        .section(5).section(6)
        .room(1).room(2)
        .week(1, 3)
        .offering(1, 10, 1, 5)
        .offering(2, 10, 2, 6)
        .build();

    Timetable timetable;
    timetable.replaceAll({
        TimetableSlot{1, 1, 0, 5, 1, {11}},
        TimetableSlot{2, 2, 0, 6, 2, {11}},
        TimetableSlot{3, 1, 1, 5, 2, {12}},
        TimetableSlot{4, 2, 1, 6, 1, {13}}
    });

    json bySection = timetableToJson(catalog, timetable, parseSlotFilter("section", "6"));
    ASSERT_EQ(bySection["slots"].size(), 2u);
    EXPECT_EQ(bySection["slots"][0]["id"], 2);
    EXPECT_EQ(bySection["slots"][1]["id"], 4);
    EXPECT_EQ(bySection["filter"]["type"], "section");
    EXPECT_EQ(bySection["filter"]["id"], 6);

    // преподаватель берётся из оферинга
    json byTeacher = timetableToJson(catalog, timetable, parseSlotFilter("teacher", "1"));
    ASSERT_EQ(byTeacher["slots"].size(), 2u);
    EXPECT_EQ(byTeacher["slots"][0]["id"], 1);
    EXPECT_EQ(byTeacher["slots"][1]["id"], 3);

    json byRoom = timetableToJson(catalog, timetable, parseSlotFilter("room", "2"));
    ASSERT_EQ(byRoom["slots"].size(), 2u);
    EXPECT_EQ(byRoom["slots"][0]["id"], 2);
    EXPECT_EQ(byRoom["slots"][1]["id"], 3);

    json unknownRoom = timetableToJson(catalog, timetable, parseSlotFilter("room", "99"));
    EXPECT_TRUE(unknownRoom["slots"].empty());

    json all = timetableToJson(catalog, timetable, parseSlotFilter("", ""));
    EXPECT_EQ(all["slots"].size(), 4u);
    EXPECT_FALSE(all.contains("filter"));
    EXPECT_EQ(all["version"], 1);
}

TEST_F(ApiJsonTest, RejectsBadFilter) {
    EXPECT_THROW(parseSlotFilter("group", "1"), std::invalid_argument);
    EXPECT_THROW(parseSlotFilter("section", ""), std::invalid_argument);
    EXPECT_THROW(parseSlotFilter("section", "5x"), std::invalid_argument);
    EXPECT_THROW(parseSlotFilter("teacher", "-3"), std::invalid_argument);

    SlotFilter f = parseSlotFilter("teacher", "7");
    EXPECT_EQ(f.kind, SlotFilterKind::Teacher);
    EXPECT_EQ(f.id, 7);
    EXPECT_EQ(parseSlotFilter("all", "").kind, SlotFilterKind::All);
}

TEST_F(ApiJsonTest, GenerationFailureReport) {
    Catalog catalog(catalogDataFromJson(sampleCatalog()));

    GenerationResult r{};
    r.ok           = false;
    r.solverStatus = SolveStatus::Unsolved;
    r.failure      = FailureKind::InfeasibleCandidate;
    r.message      = "no placement";
    r.instanceId   = 3;
    r.offeringId   = 101;
    r.sessionIndex = 0;

    json j = generationResultToJson(catalog, r);
    EXPECT_EQ(j["ok"], false);
    EXPECT_EQ(j["failure"], "infeasible_candidate");
    EXPECT_EQ(j["solverStatus"], "UNSOLVED");
    EXPECT_EQ(j["instance"]["offeringId"], 101);
    EXPECT_FALSE(j.contains("conflict"));
    EXPECT_TRUE(j["slots"].empty());
}

TEST_F(ApiJsonTest, InvalidMoveReport) {
    InvalidMoveError e("Аудитория 101 уже занята", MoveRule::RoomConflict);
    json j = invalidMoveToJson(e);

    EXPECT_EQ(j["ok"], false);
    EXPECT_EQ(j["rule"], "room_conflict");
    EXPECT_EQ(j["error"], "Аудитория 101 уже занята");
}

TEST_F(ApiJsonTest, EngineConfigFromJson) {
    json j = json::parse(R"({
        "timeLimitSeconds": 5.5,
        "optimize": false,
        "weights": {"edgePeriodPenalty": 7}
    })");

    EngineConfig cfg = EngineConfig::fromJson(j);
    EXPECT_DOUBLE_EQ(cfg.timeLimitSeconds, 5.5);
    EXPECT_FALSE(cfg.optimize);
    EXPECT_EQ(cfg.weights.edgePeriodPenalty, 7);
    EXPECT_EQ(cfg.weights.dailyBalancePenalty, 1);
    EXPECT_EQ(cfg.defaultLabBlockLength, 2);

    json back = engineConfigToJson(cfg);
    EXPECT_EQ(back["weights"]["edgePeriodPenalty"], 7);

    EXPECT_THROW(EngineConfig::fromJson(json::parse(R"({"timeLimitSeconds": -1})")),
                 std::runtime_error);
    EXPECT_THROW(EngineConfig::fromJson(json::parse(R"({"defaultLabBlockLength": 0})")),
                 std::runtime_error);
}

TEST_F(ApiJsonTest, EngineConfigKeepsBaseFields) {
    EngineConfig base;
    base.timeLimitSeconds = 30;
    base.hoursPerPeriod = 2;
    base.weights.preferredRoomBonus = 9;

    EngineConfig cfg = EngineConfig::fromJson(json::parse(R"({"optimize": false})"), base);
    EXPECT_DOUBLE_EQ(cfg.timeLimitSeconds, 30);
    EXPECT_EQ(cfg.hoursPerPeriod, 2);
    EXPECT_EQ(cfg.weights.preferredRoomBonus, 9);
    EXPECT_FALSE(cfg.optimize);

    // не объект: берём базу как есть
    EngineConfig same = EngineConfig::fromJson(json::array(), base);
    EXPECT_DOUBLE_EQ(same.timeLimitSeconds, 30);
    EXPECT_TRUE(same.optimize);

    EngineConfig defaults = EngineConfig::fromJson(json::object());
    EXPECT_DOUBLE_EQ(defaults.timeLimitSeconds, 0.0);
    EXPECT_TRUE(defaults.optimize);
    EXPECT_EQ(defaults.hoursPerPeriod, 1);
}
