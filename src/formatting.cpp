///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "formatting.hpp"
#include "diagnostics.hpp"
#include <iostream>
#include <iomanip>
#include <algorithm>

///////////////////////////
///       HELPERS       ///
///////////////////////////

/**
 * @brief Label for the stage that produced a variable's rooms.
 */
static std::string formatRoomMatch(RoomMatch m) {
    switch (m) {
        case RoomMatch::MATCHED:          return "matched";
        case RoomMatch::CAPACITY_RELAXED: return "capacity relaxed";
        case RoomMatch::FALLBACK:         return "fallback";
    }
    return "unknown";
}

/**
 * @brief Print the header row for a per-section schedule table.
 *
 * Uses fixed-width columns to align day, time, course, type, instructor and room.
 */
static void printSectionTableHeader() {
    std::cout << "    "
              << std::left << std::setw(10) << "Day"
              << " | " << std::left << std::setw(11) << "Time"
              << " | " << std::left << std::setw(8)  << "Course"
              << " | " << std::left << std::setw(15) << "Type"
              << " | " << std::left << std::setw(20) << "Instructor"
              << " | " << std::left << std::setw(6)  << "Room"
              << "\n";

    // Underline with a matching ASCII separator line.
    std::cout << "    "
              << std::string(10, '-')
              << "-+-" << std::string(11, '-')
              << "-+-" << std::string(8, '-')
              << "-+-" << std::string(15, '-')
              << "-+-" << std::string(20, '-')
              << "-+-" << std::string(6, '-')
              << "\n";
}

void printBanner(const std::string& title) {
    std::cout << "========================================\n";
    std::cout << title << "\n";
    std::cout << "========================================\n";
}

/**
 * @brief Print variable/domain counts and any relaxed domains.
 */
void printProblemSummary(const CspProblem& problem) {
    const Catalog& cat = problem.catalog;
    std::cout << "Courses: " << cat.courses.size()
              << " | Instructors: " << cat.instructors.size()
              << " | Rooms: " << cat.rooms.size()
              << " | Timeslots: " << cat.timeslots.size()
              << " | Sections: " << cat.sections.size() << "\n";

    size_t total = problem.totalCandidates();
    double average = problem.variables.empty() ? 0.0 : (double)total / problem.variables.size();
    std::cout << "Variables: " << problem.variables.size()
              << " | Candidates: " << total
              << " | Average domain: " << std::fixed << std::setprecision(1) << average << "\n";

    for (size_t i = 0; i < problem.variables.size(); ++i) {
        const Variable& v = problem.variables[i];
        if (v.roomMatch == RoomMatch::MATCHED && !v.placeholderInstructor) continue;
        std::cout << "  note: " << cat.sections[v.section].id << "/" << cat.courses[v.course].id
                  << " rooms " << formatRoomMatch(v.roomMatch)
                  << (v.placeholderInstructor ? ", no qualified instructor" : "") << "\n";
    }
}

/**
 * @brief Print the data-quality reports for a catalog.
 */
void printCatalogDiagnostics(const Catalog& cat) {
    SectionRoomReport fit = sectionRoomCompatibility(cat);
    std::cout << "Section/room capacity:\n";
    for (const SectionRoomFit& s : fit.sections) {
        std::cout << "  " << std::left << std::setw(8) << s.sectionId
                  << " students=" << std::setw(4) << s.studentCount
                  << " rooms=" << s.roomIds.size() << "\n";
    }
    std::cout << "  with rooms: " << fit.sectionsWithRooms
              << ", without: " << fit.sectionsWithoutRooms << "\n";

    RoomTypeSummary types = roomTypeSummary(cat);
    std::cout << "Room types: lecture courses=" << types.lectureCourses
              << " lab courses=" << types.labCourses
              << " | lecture rooms=" << types.lectureRooms
              << " lab rooms=" << types.labRooms << "\n";
    if (types.missingLabRooms) std::cout << "  WARNING: lab courses but no lab rooms\n";
    if (types.labRoomsScarce)  std::cout << "  WARNING: many lab courses for few lab rooms\n";
    if (types.missingLectureRooms) std::cout << "  WARNING: no lecture rooms\n";

    InstructorCoverage coverage = instructorCoverage(cat);
    std::cout << "Instructors: " << coverage.instructors.size()
              << " | qualifications=" << coverage.totalQualifications
              << " | courses covered=" << coverage.coveredCourses << "/" << cat.courses.size() << "\n";
    for (const std::string& id : coverage.uncoveredCourses) {
        std::cout << "  no qualified instructor: " << id << "\n";
    }

    std::cout << "Timeslots per day:";
    for (const auto& day : timeslotSummary(cat)) {
        std::cout << " " << day.first << "=" << day.second;
    }
    std::cout << "\n";
}

void printSearchSummary(const SearchResult& result, double elapsedMs) {
    std::cout << "Status: " << toString(result.status) << "\n";
    std::cout << "Iterations: " << result.iterations << "\n";
    std::cout << "Assigned: " << result.assignedCount() << "/" << result.variableCount() << "\n";
    std::cout << "Time: " << elapsedMs << " ms\n";
}

/**
 * @brief Print one table per section, in section id order.
 *
 * Records are expected in projectSchedule() order, so each section's rows
 * come out by day and start time.
 */
void printSectionSchedules(const std::vector<ScheduleRecord>& records) {
    std::vector<std::string> sectionIds;
    for (const ScheduleRecord& r : records) sectionIds.push_back(r.sectionId);
    std::sort(sectionIds.begin(), sectionIds.end());
    sectionIds.erase(std::unique(sectionIds.begin(), sectionIds.end()), sectionIds.end());

    for (const std::string& id : sectionIds) {
        std::cout << "----------------------------------------\n";
        std::cout << "Schedule for section " << id << ":\n";
        printSectionTableHeader();

        for (const ScheduleRecord& r : records) {
            if (r.sectionId != id) continue;
            std::cout << "    "
                      << std::left << std::setw(10) << r.day
                      << " | " << std::left << std::setw(11) << (r.startTime + "-" + r.endTime)
                      << " | " << std::left << std::setw(8)  << r.courseCode
                      << " | " << std::left << std::setw(15) << r.activityType
                      << " | " << std::left << std::setw(20) << r.instructor
                      << " | " << std::left << std::setw(6)  << r.room
                      << "\n";
        }
        std::cout << "\n";
    }
}

void printStatistics(const ScheduleStatistics& stats) {
    std::cout << "Total classes: " << stats.totalClasses << "\n";
    std::cout << "Unique courses: " << stats.uniqueCourses << "\n";
    std::cout << "Unique sections: " << stats.uniqueSections << "\n";
    std::cout << "Instructors: " << stats.uniqueInstructors << "\n";
    std::cout << "Rooms used: " << stats.roomsUsed << "\n";

    std::cout << "By type:\n";
    for (const auto& t : stats.byActivityType) {
        std::cout << "  " << t.first << ": " << t.second << "\n";
    }
    std::cout << "By day:\n";
    for (const auto& d : stats.byDay) {
        std::cout << "  " << d.first << ": " << d.second << "\n";
    }
}
