#include "domains.hpp"
#include "model_builder.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

namespace {

CatalogRecords mixedRoomRecords() {
    CatalogRecords rec;
    rec.courses.push_back({"LEC", "Lecture Course", "Lecture", "3"});
    rec.courses.push_back({"LAB", "Lab Course", "Lab", "1"});
    rec.courses.push_back({"MIX", "Combined Course", "Lecture and Lab", "4"});
    rec.instructors.push_back({"I1", "First", "LEC, MIX", ""});
    rec.instructors.push_back({"I2", "Second", "LAB, MIX", ""});
    rec.rooms.push_back({"H1", "Lecture", "100"});
    rec.rooms.push_back({"H2", "Lecture", "30"});
    rec.rooms.push_back({"L1", "Lab", "40"});
    rec.timeslots.push_back({"T1", "Sunday", "08:00", "09:30"});
    rec.timeslots.push_back({"T2", "Monday", "08:00", "09:30"});
    rec.sections.push_back({"S1", "35", "LEC, LAB, MIX"});
    return rec;
}

TEST(DomainsTest, OneVariablePerSectionCourseInOrder) {
    CatalogRecords rec = mixedRoomRecords();
    rec.sections.push_back({"S2", "10", "MIX"});
    CspProblem problem = buildProblem(rec);

    ASSERT_EQ(problem.variables.size(), 4u);
    ASSERT_EQ(problem.domains.size(), 4u);
    EXPECT_EQ(problem.variables[0].section, 0);
    EXPECT_EQ(problem.variables[0].course, 0);
    EXPECT_EQ(problem.variables[2].course, 2);
    EXPECT_EQ(problem.variables[3].section, 1);
    EXPECT_EQ(problem.variables[3].studentCount, 10);
    EXPECT_EQ(problem.courseOf(1).id, "LAB");
    EXPECT_EQ(problem.sectionOf(3).id, "S2");
}

TEST(DomainsTest, RoomsMatchTypeAndCapacity) {
    CspProblem problem = buildProblem(mixedRoomRecords());

    // 35 students: H2 is too small for the lecture.
    EXPECT_EQ(problem.variables[0].roomMatch, RoomMatch::MATCHED);
    for (const DomainValue& v : problem.domains[0]) EXPECT_EQ(v.room, 0);
    EXPECT_EQ(problem.domains[0].size(), 2u);

    for (const DomainValue& v : problem.domains[1]) EXPECT_EQ(v.room, 2);

    // Combined course accepts lecture and lab rooms with enough seats.
    RoomMatch stage;
    EXPECT_EQ(matchRooms(problem.catalog, CourseType::COMBINED, 35, 10, stage), (std::vector<int>{0, 2}));
    EXPECT_EQ(stage, RoomMatch::MATCHED);
}

TEST(DomainsTest, CapacityIsRelaxedBeforeTypeIsDropped) {
    Catalog cat = buildCatalog(mixedRoomRecords());
    RoomMatch stage;

    EXPECT_EQ(matchRooms(cat, CourseType::LECTURE, 500, 10, stage), (std::vector<int>{0, 1}));
    EXPECT_EQ(stage, RoomMatch::CAPACITY_RELAXED);

    EXPECT_EQ(matchRooms(cat, CourseType::LAB, 500, 10, stage), (std::vector<int>{2}));
    EXPECT_EQ(stage, RoomMatch::CAPACITY_RELAXED);
}

TEST(DomainsTest, HybridRoomServesLabAndLectureCourses) {
    CatalogRecords rec = makeGridRecords(2, 0, 1, true);
    rec.courses[0].type = "Lab";
    rec.rooms.push_back({"R1", "Lecture/Lab", "50"});
    rec.rooms.push_back({"R2", "Lecture", "50"});
    CspProblem problem = buildProblem(rec);

    // Lab course: only the hybrid room, found without relaxation.
    EXPECT_EQ(problem.variables[0].roomMatch, RoomMatch::MATCHED);
    ASSERT_EQ(problem.domains[0].size(), 1u);
    EXPECT_EQ(problem.domains[0][0].room, 0);

    // Lecture course: both rooms.
    EXPECT_EQ(problem.variables[1].roomMatch, RoomMatch::MATCHED);
    ASSERT_EQ(problem.domains[1].size(), 2u);
    EXPECT_EQ(problem.domains[1][1].room, 1);

    EXPECT_TRUE(roomTypeCompatible(Room::Type::COMBINED, CourseType::LAB));
    EXPECT_TRUE(roomTypeCompatible(Room::Type::COMBINED, CourseType::LECTURE));
    EXPECT_TRUE(roomTypeCompatible(Room::Type::COMBINED, CourseType::COMBINED));
    EXPECT_FALSE(roomTypeCompatible(Room::Type::COMBINED, CourseType::OTHER));
    EXPECT_FALSE(roomTypeCompatible(Room::Type::LECTURE, CourseType::LAB));
}

TEST(DomainsTest, FallbackTakesBoundedPrefixOfRooms) {
    CatalogRecords rec = makeGridRecords(1, 0, 1, true);
    rec.courses[0].type = "Seminar";
    for (int r = 1; r <= 12; ++r) rec.rooms.push_back({"X" + std::to_string(r), "Studio", "5"});

    CspProblem problem = buildProblem(rec);
    ASSERT_EQ(problem.domains[0].size(), 10u);
    EXPECT_EQ(problem.variables[0].roomMatch, RoomMatch::FALLBACK);
    for (int i = 0; i < 10; ++i) EXPECT_EQ(problem.domains[0][i].room, i);

    DomainOptions narrow;
    narrow.fallbackRoomLimit = 3;
    EXPECT_EQ(buildProblem(rec, narrow).domains[0].size(), 3u);

    DomainOptions invalid;
    invalid.fallbackRoomLimit = 0;
    EXPECT_THROW(buildProblem(rec, invalid), std::invalid_argument);
}

TEST(DomainsTest, UnqualifiedCourseGetsPlaceholderInstructor) {
    CspProblem problem = buildProblem(makeGridRecords(1, 2, 2, false));

    ASSERT_EQ(problem.domains[0].size(), 4u);
    EXPECT_TRUE(problem.variables[0].placeholderInstructor);
    for (const DomainValue& v : problem.domains[0]) {
        EXPECT_EQ(v.instructor, kPlaceholderInstructor);
        EXPECT_EQ(problem.instructorId(v), "UNASSIGNED");
        EXPECT_EQ(problem.instructorName(v), "Unassigned");
    }
}

TEST(DomainsTest, CandidatesAreRoomMajorThenTimeslotThenInstructor) {
    CatalogRecords rec = mixedRoomRecords();
    rec.sections[0] = {"S1", "20", "MIX"};
    CspProblem problem = buildProblem(rec);

    // Rooms H1, H2, L1; timeslots T1, T2; instructors I1, I2.
    const std::vector<DomainValue>& d = problem.domains[0];
    ASSERT_EQ(d.size(), 12u);
    EXPECT_EQ(d[0], (DomainValue{0, 0, 0}));
    EXPECT_EQ(d[1], (DomainValue{0, 0, 1}));
    EXPECT_EQ(d[2], (DomainValue{0, 1, 0}));
    EXPECT_EQ(d[4], (DomainValue{1, 0, 0}));
    EXPECT_EQ(d[11], (DomainValue{2, 1, 1}));
    EXPECT_EQ(problem.totalCandidates(), 12u);
}

TEST(DomainsTest, ConstructionIsDeterministic) {
    CspProblem a = buildProblem(mixedRoomRecords());
    CspProblem b = buildProblem(mixedRoomRecords());
    EXPECT_EQ(a.domains, b.domains);
}

TEST(DomainsTest, EmptyDomainFails) {
    CatalogRecords noSlots = makeGridRecords(2, 1, 0, true);
    try {
        buildProblem(noSlots);
        FAIL() << "expected EmptyDomainError";
    } catch (const EmptyDomainError& e) {
        EXPECT_EQ(e.sectionId(), "S1");
        EXPECT_EQ(e.courseId(), "C1");
    }

    EXPECT_THROW(buildProblem(makeGridRecords(1, 0, 3, true)), EmptyDomainError);
}

TEST(DomainsTest, CatalogWithoutSectionsHasNoVariables) {
    CatalogRecords rec = makeGridRecords(0, 0, 0, false);
    CspProblem problem = buildProblem(rec);
    EXPECT_TRUE(problem.variables.empty());
    EXPECT_EQ(problem.totalCandidates(), 0u);
}

}  // namespace
