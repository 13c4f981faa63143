#include "diagnostics.hpp"
#include "demo_instances.hpp"
#include "model_builder.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

namespace {

TEST(DiagnosticsTest, ListsRoomsLargeEnoughForEachSection) {
    Catalog cat = buildCatalog(makeDemoCatalog(DemoSize::S));
    SectionRoomReport report = sectionRoomCompatibility(cat);

    ASSERT_EQ(report.sections.size(), 3u);
    EXPECT_EQ(report.sections[0].sectionId, "S1");
    EXPECT_EQ(report.sections[0].roomIds, (std::vector<std::string>{"R101", "R102"}));
    EXPECT_EQ(report.sections[1].roomIds, (std::vector<std::string>{"R101", "R102", "LAB1"}));
    EXPECT_TRUE(report.sections[2].roomIds.empty());
    EXPECT_EQ(report.sectionsWithRooms, 2u);
    EXPECT_EQ(report.sectionsWithoutRooms, 1u);
}

TEST(DiagnosticsTest, CountsRoomTypesAndCombinedCourses) {
    Catalog cat = buildCatalog(makeDemoCatalog(DemoSize::S));
    RoomTypeSummary summary = roomTypeSummary(cat);

    // PHY101 counts as both lecture and lab.
    EXPECT_EQ(summary.lectureCourses, 4u);
    EXPECT_EQ(summary.labCourses, 2u);
    EXPECT_EQ(summary.totalCourses, 5u);
    EXPECT_EQ(summary.lectureRooms, 2u);
    EXPECT_EQ(summary.labRooms, 2u);
    EXPECT_FALSE(summary.missingLabRooms);
    EXPECT_FALSE(summary.labRoomsScarce);
    EXPECT_FALSE(summary.missingLectureRooms);
}

TEST(DiagnosticsTest, FlagsRoomShortages) {
    CatalogRecords rec = makeGridRecords(1, 0, 1, true);
    rec.courses[0].type = "Lab";
    RoomTypeSummary missing = roomTypeSummary(buildCatalog(rec));
    EXPECT_TRUE(missing.missingLabRooms);
    EXPECT_FALSE(missing.labRoomsScarce);
    EXPECT_TRUE(missing.missingLectureRooms);

    CatalogRecords scarce = makeGridRecords(4, 1, 1, false);
    for (CourseRecord& c : scarce.courses) c.type = "Lab";
    scarce.rooms.push_back({"B1", "Lab", "30"});
    RoomTypeSummary few = roomTypeSummary(buildCatalog(scarce));
    EXPECT_FALSE(few.missingLabRooms);
    EXPECT_TRUE(few.labRoomsScarce);
    EXPECT_FALSE(few.missingLectureRooms);
}

TEST(DiagnosticsTest, HybridRoomCountsAsBothKinds) {
    CatalogRecords rec = makeGridRecords(1, 0, 1, true);
    rec.courses[0].type = "Lab";
    rec.rooms.push_back({"H1", "Lecture and Lab", "40"});
    RoomTypeSummary summary = roomTypeSummary(buildCatalog(rec));

    EXPECT_EQ(summary.lectureRooms, 1u);
    EXPECT_EQ(summary.labRooms, 1u);
    EXPECT_EQ(summary.totalRooms, 1u);
    EXPECT_FALSE(summary.missingLabRooms);
    EXPECT_FALSE(summary.missingLectureRooms);
}

TEST(DiagnosticsTest, ReportsInstructorCoverage) {
    Catalog cat = buildCatalog(makeDemoCatalog(DemoSize::S));
    InstructorCoverage coverage = instructorCoverage(cat);

    ASSERT_EQ(coverage.instructors.size(), 3u);
    EXPECT_EQ(coverage.instructors[0].instructorId, "I01");
    EXPECT_EQ(coverage.instructors[0].qualifications, 2u);
    EXPECT_EQ(coverage.totalQualifications, 5u);
    EXPECT_EQ(coverage.coveredCourses, 4u);
    EXPECT_EQ(coverage.uncoveredCourses, (std::vector<std::string>{"ENG101"}));
}

TEST(DiagnosticsTest, CountsTimeslotsPerDayInWeekOrder) {
    CatalogRecords rec = makeGridRecords(0, 0, 2, false);
    rec.timeslots.push_back({"T9", "Wednesday", "08:00", "09:00"});
    std::vector<std::pair<std::string, size_t>> perDay = timeslotSummary(buildCatalog(rec));

    ASSERT_EQ(perDay.size(), 2u);
    EXPECT_EQ(perDay[0], (std::pair<std::string, size_t>("Sunday", 2)));
    EXPECT_EQ(perDay[1], (std::pair<std::string, size_t>("Wednesday", 1)));

    EXPECT_EQ(timeslotSummary(buildCatalog(makeDemoCatalog(DemoSize::S))).size(), 5u);
}

TEST(DiagnosticsTest, DemoSizesParse) {
    EXPECT_EQ(parseDemoSize("m"), DemoSize::M);
    EXPECT_THROW(parseDemoSize("XL"), std::invalid_argument);
    EXPECT_NO_THROW(buildProblem(makeDemoCatalog(DemoSize::L)));
}

}  // namespace
