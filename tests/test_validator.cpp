#include <gtest/gtest.h>

#include "test_helpers.h"
#include "validator.h"

class ValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        quietLogs();
        b.teacher(1, 2).teacher(2)
         .course(10, 1).course(11, 1, true)
         .section(5, 30).section(6, 20)
         .room(1, 40).room(2, 10).room(3, 40, "lab").room(4, 40, "classroom", false)
         .week(2, 4)
         .offering(1, 10, 1, 5)
         .offering(2, 11, 2, 6)
         .offering(3, 10, 1, 6)
         .unavailableTeacher(2, 14);

        records = {
            TimetableSlot{1, 1, 0, 5, 1, {11}},
            TimetableSlot{2, 2, 0, 6, 3, {12, 13}},
            TimetableSlot{3, 3, 0, 6, 1, {14}}
        };
    }

    ValidationResult check() {
        Catalog catalog = b.build();
        TimetableValidator validator;
        return validator.checkAll(catalog, records, cfg);
    }

    CatalogBuilder b;
    EngineConfig cfg;
    std::vector<TimetableSlot> records;
};

TEST_F(ValidatorTest, CleanTimetablePasses) {
    ValidationResult r = check();
    EXPECT_TRUE(r.ok);
    EXPECT_TRUE(r.errors.empty());
    EXPECT_TRUE(r.warnings.empty());
}

TEST_F(ValidatorTest, MissingSessionIsError) {
    records.pop_back();
    ValidationResult r = check();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.errors.size(), 1u);
}

TEST_F(ValidatorTest, DuplicatedSessionIsError) {
    records[2].offeringId = 1;
    records[2].sectionId = 5;
    ValidationResult r = check();
    EXPECT_FALSE(r.ok);
    // занятие оферинга 1 дважды, занятие оферинга 3 отсутствует
    EXPECT_EQ(r.errors.size(), 2u);
}

TEST_F(ValidatorTest, SessionNoLongerRequiredIsWarning) {
    records.push_back(TimetableSlot{4, 2, 1, 6, 3, {21, 22}});
    ValidationResult r = check();
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.warnings.size(), 1u);
}

TEST_F(ValidatorTest, OverlapsAreReportedPerResource) {
    records[2].timeSlotIds = {11};
    ValidationResult r = check();
    EXPECT_FALSE(r.ok);
    // преподаватель 1 и аудитория 1 в слоте 11
    EXPECT_EQ(r.errors.size(), 2u);

    std::vector<Overlap> overlaps = findOverlaps(b.build(), records);
    ASSERT_EQ(overlaps.size(), 2u);
    EXPECT_EQ(overlaps[0].resource, ConflictResource::Teacher);
    EXPECT_EQ(overlaps[0].resourceId, 1);
    EXPECT_EQ(overlaps[1].resource, ConflictResource::Room);
    EXPECT_EQ(overlaps[1].timeSlotId, 11);
    EXPECT_EQ(overlaps[1].firstId, 1);
    EXPECT_EQ(overlaps[1].secondId, 3);
}

TEST_F(ValidatorTest, RoomTooSmall) {
    records[0].roomId = 2;
    ValidationResult r = check();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.errors.size(), 1u);
}

TEST_F(ValidatorTest, LabInClassroom) {
    records[1].roomId = 1;
    ValidationResult r = check();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.errors.size(), 1u);
}

TEST_F(ValidatorTest, InactiveRoom) {
    records[0].roomId = 4;
    ValidationResult r = check();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.errors.size(), 1u);
}

TEST_F(ValidatorTest, BrokenLabBlock) {
    records[1].timeSlotIds = {11, 13};
    ValidationResult r = check();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.errors.size(), 1u);

    records[1].timeSlotIds = {12};
    r = check();
    EXPECT_EQ(r.errors.size(), 1u);
}

TEST_F(ValidatorTest, UnavailableTeacher) {
    records[1].timeSlotIds = {13, 14};
    records[2].timeSlotIds = {12};
    ValidationResult r = check();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.errors.size(), 1u);
}

TEST_F(ValidatorTest, WeeklyLoadExceeded) {
    b.data().teachers[0].maxWeeklyLoad = 1;
    ValidationResult r = check();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.errors.size(), 1u);
}
