#include <vector>
#include <string>
#include <stdexcept>
#include "model.hpp"
#include "demo_instances.hpp"

static const char* kDemoDays[] = {"Sunday", "Monday", "Tuesday", "Wednesday", "Thursday"};

// periodsPerDay 90-minute periods (at most six) on every teaching day.
static void addStandardWeek(CatalogRecords& rec, int periodsPerDay) {
    static const char* kStarts[] = {"08:30", "10:15", "12:00", "13:45", "15:30", "17:15"};
    static const char* kEnds[]   = {"10:00", "11:45", "13:30", "15:15", "17:00", "18:45"};
    int id = 1;
    for (const char* day : kDemoDays) {
        for (int p = 0; p < periodsPerDay && p < 6; ++p) {
            rec.timeslots.push_back({"T" + std::to_string(id++), day, kStarts[p], kEnds[p]});
        }
    }
}

///////////////////////////
///     DEMO: SMALL     ///
///////////////////////////
static CatalogRecords makeDemoSmall() {
    CatalogRecords rec;

    rec.courses.push_back({"CS101", "Introduction to Programming", "Lecture", "3"});
    rec.courses.push_back({"CS101L", "Programming Lab", "Lab", "1"});
    rec.courses.push_back({"MATH101", "Calculus I", "Lecture", "4"});
    rec.courses.push_back({"PHY101", "Physics I", "Lecture and Lab", "4"});
    rec.courses.push_back({"ENG101", "Technical Writing", "Lecture", "2"});

    // Nobody teaches ENG101: it gets the placeholder instructor.
    rec.instructors.push_back({"I01", "Dr. Sara Ali", "CS101, CS101L", "Morning"});
    rec.instructors.push_back({"I02", "Dr. Omar Hassan", "MATH101", "Any"});
    rec.instructors.push_back({"I03", "Dr. Mona Adel", "PHY101, CS101L", "Afternoon"});

    rec.rooms.push_back({"R101", "Lecture", "60"});
    rec.rooms.push_back({"R102", "Lecture", "40"});
    rec.rooms.push_back({"LAB1", "Lab", "30"});
    rec.rooms.push_back({"LAB2", "Lab", "25"});

    addStandardWeek(rec, 3);

    rec.sections.push_back({"S1", "35", "CS101, CS101L, MATH101, ENG101"});
    rec.sections.push_back({"S2", "28", "CS101, MATH101, PHY101"});
    // Larger than every room: capacity is relaxed for its courses.
    rec.sections.push_back({"S3", "75", "MATH101, PHY101, ENG101"});

    return rec;
}

///////////////////////////
///   DEMO: GENERATED   ///
///////////////////////////
/**
 * @brief Generate a catalog with a fixed shape.
 *
 * Every third course is a lab; each instructor is qualified for two
 * consecutive courses; each section takes four courses starting at an
 * offset that rotates with the section number.
 */
static CatalogRecords makeDemoGenerated(int numCourses, int numInstructors, int numLectureRooms, int numLabRooms,
                                        int numSections, int periodsPerDay) {
    CatalogRecords rec;

    for (int c = 0; c < numCourses; ++c) {
        bool lab = (c % 3 == 2);
        std::string id = "C" + std::to_string(100 + c);
        rec.courses.push_back({id, (lab ? "Lab " : "Course ") + std::to_string(100 + c),
                               lab ? "Lab" : "Lecture", lab ? "1" : "3"});
    }

    for (int i = 0; i < numInstructors; ++i) {
        int first = (2 * i) % numCourses;
        int second = (2 * i + 1) % numCourses;
        rec.instructors.push_back({"I" + std::to_string(i + 1), "Instructor " + std::to_string(i + 1),
                                   "C" + std::to_string(100 + first) + ", C" + std::to_string(100 + second),
                                   ""});
    }

    for (int r = 0; r < numLectureRooms; ++r) {
        rec.rooms.push_back({"L" + std::to_string(r + 1), "Lecture", std::to_string(40 + 10 * (r % 3))});
    }
    for (int r = 0; r < numLabRooms; ++r) {
        rec.rooms.push_back({"B" + std::to_string(r + 1), "Lab", "30"});
    }

    addStandardWeek(rec, periodsPerDay);

    for (int s = 0; s < numSections; ++s) {
        std::string courses;
        for (int k = 0; k < 4; ++k) {
            if (k > 0) courses += ", ";
            courses += "C" + std::to_string(100 + (s + k) % numCourses);
        }
        rec.sections.push_back({"S" + std::to_string(s + 1), std::to_string(20 + (s * 7) % 25), courses});
    }

    return rec;
}

CatalogRecords makeDemoCatalog(DemoSize size) {
    switch (size) {
        case DemoSize::S: return makeDemoSmall();
        case DemoSize::M: return makeDemoGenerated(12, 8, 4, 2, 12, 4);
        case DemoSize::L: return makeDemoGenerated(30, 20, 8, 4, 40, 6);
    }
    return makeDemoSmall();
}

DemoSize parseDemoSize(const std::string& text) {
    if (text == "S" || text == "s") return DemoSize::S;
    if (text == "M" || text == "m") return DemoSize::M;
    if (text == "L" || text == "l") return DemoSize::L;
    throw std::invalid_argument("unknown demo size '" + text + "' (expected S, M or L)");
}
