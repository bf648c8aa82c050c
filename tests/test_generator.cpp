#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "catalog.h"
#include "demo_data.h"
#include "generator.h"
#include "test_helpers.h"
#include "validator.h"

class GeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        quietLogs();
        cfg.timeLimitSeconds = 60;
    }

    void expectValid(const Catalog& catalog, const GenerationResult& r) {
        TimetableValidator validator;
        ValidationResult v = validator.checkAll(catalog, r.slots, cfg);
        EXPECT_TRUE(v.ok);
        for (const std::string& e : v.errors) ADD_FAILURE() << e;
    }

    EngineConfig cfg;
};

// Бэкенд с заранее заданным ответом
class CannedBackend : public SolverBackend {
public:
    explicit CannedBackend(BackendResult r) : result_(std::move(r)) {}

    std::string name() const override { return "canned"; }

    BackendResult solve(const ConstraintModel&, const SolveLimits&) override { return result_; }

private:
    BackendResult result_;
};

static CatalogBuilder twoTeachersOneRoom() {
    CatalogBuilder b;
    b.teacher(1).teacher(2).course(10, 1).course(11, 1).section(5).room(1).week(1, 3)
     .offering(1, 10, 1, 5)
     .offering(2, 11, 2, 5);
    return b;
}

TEST_F(GeneratorTest, TwoTeachersShareOneRoom) {
    Catalog catalog = twoTeachersOneRoom().build();
    GenerationResult r = generateTimetable(catalog, cfg);

    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_EQ(r.failure, FailureKind::None);
    EXPECT_TRUE(r.solverStatus == SolveStatus::Optimal || r.solverStatus == SolveStatus::Feasible);
    ASSERT_EQ(r.slots.size(), 2u);
    EXPECT_NE(r.slots[0].timeSlotIds, r.slots[1].timeSlotIds);
    EXPECT_EQ(r.slots[0].id, 1);
    EXPECT_EQ(r.slots[1].id, 2);
    EXPECT_EQ(r.stats.instances, 2);
    EXPECT_EQ(r.stats.backend, "z3");
    expectValid(catalog, r);
}

TEST_F(GeneratorTest, RepeatedRunsGiveSameTimetable) {
    Catalog catalog = twoTeachersOneRoom().build();

    GenerationResult first = generateTimetable(catalog, cfg);
    GenerationResult second = generateTimetable(catalog, cfg);

    ASSERT_TRUE(first.ok);
    ASSERT_TRUE(second.ok);
    EXPECT_EQ(first.slots, second.slots);
}

TEST_F(GeneratorTest, TeacherNeverAvailableFailsBeforeSolver) {
    CatalogBuilder b = twoTeachersOneRoom();
    b.unavailableTeacher(2, 11).unavailableTeacher(2, 12).unavailableTeacher(2, 13);
    Catalog catalog = b.build();

    GenerationResult r = generateTimetable(catalog, cfg);

    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.failure, FailureKind::InfeasibleCandidate);
    EXPECT_EQ(r.solverStatus, SolveStatus::Unsolved);
    EXPECT_EQ(r.offeringId, 2);
    EXPECT_EQ(r.sessionIndex, 0);
    EXPECT_TRUE(r.slots.empty());
    EXPECT_FALSE(r.message.empty());
}

TEST_F(GeneratorTest, LabWithIsolatedSlotsFailsBeforeSolver) {
    CatalogBuilder b;
    b.teacher(1).course(10, 1, true).section(5).room(1, 40, "lab")
     .slot(11, 0, 1).slot(13, 0, 3).slot(22, 1, 2)
     .offering(1, 10, 1, 5);
    Catalog catalog = b.build();

    GenerationResult r = generateTimetable(catalog, cfg);

    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.failure, FailureKind::InfeasibleCandidate);
    EXPECT_EQ(r.offeringId, 1);
}

TEST_F(GeneratorTest, OverbookedSectionIsInfeasible) {
    CatalogBuilder b;
    b.teacher(1).teacher(2).teacher(3).course(10, 1).section(5).room(1).room(2).week(1, 2)
     .offering(1, 10, 1, 5)
     .offering(2, 10, 2, 5)
     .offering(3, 10, 3, 5);
    Catalog catalog = b.build();

    GenerationResult r = generateTimetable(catalog, cfg);

    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.failure, FailureKind::Infeasible);
    EXPECT_EQ(r.solverStatus, SolveStatus::Infeasible);
    EXPECT_TRUE(r.slots.empty());
}

TEST_F(GeneratorTest, WeeklyLoadIsHard) {
    CatalogBuilder b;
    b.teacher(1, 1).course(10, 1).section(5).section(6).room(1).room(2).week(2, 3)
     .offering(1, 10, 1, 5)
     .offering(2, 10, 1, 6);
    Catalog catalog = b.build();

    GenerationResult r = generateTimetable(catalog, cfg);
    EXPECT_EQ(r.failure, FailureKind::Infeasible);
}

TEST_F(GeneratorTest, AvoidsEdgePeriods) {
    CatalogBuilder b;
    b.teacher(1).course(10, 1).section(5).room(1).week(1, 3).offering(1, 10, 1, 5);
    Catalog catalog = b.build();

    GenerationResult r = generateTimetable(catalog, cfg);

    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.solverStatus, SolveStatus::Optimal);
    ASSERT_EQ(r.slots.size(), 1u);
    EXPECT_EQ(r.slots[0].timeSlotIds, std::vector<int>{12});
}

TEST_F(GeneratorTest, TimePreferenceWins) {
    CatalogBuilder b;
    b.teacher(1).course(10, 1).section(5).room(1).week(1, 3).offering(1, 10, 1, 5)
     .timePreference(13, 10);
    Catalog catalog = b.build();

    GenerationResult r = generateTimetable(catalog, cfg);

    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.slots[0].timeSlotIds, std::vector<int>{13});
}

TEST_F(GeneratorTest, PreferredRoomIsUsed) {
    CatalogBuilder b;
    b.teacher(1).course(10, 1).section(5).room(1).room(2).week(1, 3)
     .offering(1, 10, 1, 5, 0, 2);
    Catalog catalog = b.build();

    GenerationResult r = generateTimetable(catalog, cfg);

    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.slots[0].roomId, 2);
    EXPECT_EQ(r.slots[0].timeSlotIds, std::vector<int>{12});
}

TEST_F(GeneratorTest, LabSessionsGetContiguousBlocks) {
    CatalogBuilder b;
    b.teacher(1).teacher(2).course(10, 1).course(12, 2, true).section(5)
     .room(1).room(3, 40, "lab").week(2, 4)
     .offering(1, 10, 2, 5)
     .offering(2, 12, 1, 5);
    Catalog catalog = b.build();

    GenerationResult r = generateTimetable(catalog, cfg);

    ASSERT_TRUE(r.ok) << r.message;
    ASSERT_EQ(r.slots.size(), 3u);
    for (const TimetableSlot& s : r.slots) {
        if (s.offeringId != 2) continue;
        ASSERT_EQ(s.timeSlotIds.size(), 2u);
        EXPECT_EQ(s.roomId, 3);
        EXPECT_EQ(s.timeSlotIds[1], s.timeSlotIds[0] + 1);
    }
    expectValid(catalog, r);
}

TEST_F(GeneratorTest, DemoCatalogProducesValidTimetable) {
    cfg.optimize = false;
    Catalog catalog(buildDemoCatalog());

    GenerationResult r = generateTimetable(catalog, cfg);

    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_EQ(r.slots.size(), 26u);
    EXPECT_EQ(r.solverStatus, SolveStatus::Feasible);
    expectValid(catalog, r);

    std::set<int> ids;
    for (const TimetableSlot& s : r.slots) ids.insert(s.id);
    EXPECT_EQ(ids.size(), r.slots.size());
    EXPECT_EQ(*ids.begin(), 1);
    EXPECT_EQ(*ids.rbegin(), 26);
}

TEST_F(GeneratorTest, BackendBreakingConstraintsIsSolverError) {
    Catalog catalog = twoTeachersOneRoom().build();
    // 6 размещений + 2 вспомогательные переменные баланса, всё ложно
    BackendResult broken{SolveStatus::Optimal, true, std::vector<bool>(8, false), "broken"};

    GenerationResult r = generateTimetable(catalog, cfg, std::make_unique<CannedBackend>(broken));

    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.failure, FailureKind::SolverError);
    EXPECT_TRUE(r.slots.empty());
}

TEST_F(GeneratorTest, TimeoutWithoutSolutionIsInfeasible) {
    Catalog catalog = twoTeachersOneRoom().build();
    BackendResult timeout{SolveStatus::TimedOut, false, {}, "timeout"};

    GenerationResult r = generateTimetable(catalog, cfg, std::make_unique<CannedBackend>(timeout));

    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.failure, FailureKind::Infeasible);
    EXPECT_EQ(r.solverStatus, SolveStatus::TimedOut);
    EXPECT_NE(r.message.find("TIMED_OUT"), std::string::npos);
}

TEST(FailureKindTest, Names) {
    EXPECT_EQ(failureKindToString(FailureKind::InfeasibleCandidate), "infeasible_candidate");
    EXPECT_EQ(failureKindToString(FailureKind::ConflictDetected), "conflict_detected");
}

TEST_F(GeneratorTest, HugeTimeLimitStillSolves) {
    Catalog catalog = twoTeachersOneRoom().build();
    cfg.timeLimitSeconds = 1e7;

    GenerationResult r = generateTimetable(catalog, cfg);

    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_EQ(r.solverStatus, SolveStatus::Optimal);
    EXPECT_EQ(r.slots.size(), 2u);
}

TEST(CatalogSourceTest, OnlyDatabaseRunsReplaceStoredTimetable) {
    GenerationResult good;
    good.ok = true;
    GenerationResult bad;
    bad.ok = false;

    EXPECT_TRUE(shouldStoreTimetable(CatalogSource::Database, good));
    EXPECT_FALSE(shouldStoreTimetable(CatalogSource::Database, bad));
    EXPECT_FALSE(shouldStoreTimetable(CatalogSource::Request, good));
    EXPECT_FALSE(shouldStoreTimetable(CatalogSource::Demo, good));

    EXPECT_EQ(catalogSourceToString(CatalogSource::Demo), "demo");
    EXPECT_EQ(catalogSourceToString(CatalogSource::Database), "database");
}
