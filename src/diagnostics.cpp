///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "diagnostics.hpp"
#include <algorithm>
#include <array>
#include <set>


///////////////////////////
///     DIAGNOSTICS     ///
///////////////////////////
SectionRoomReport sectionRoomCompatibility(const Catalog& cat) {
    SectionRoomReport report;
    for (const Section& sec : cat.sections) {
        SectionRoomFit fit{sec.id, sec.studentCount, {}};
        for (const Room& room : cat.rooms) {
            if (room.capacity >= sec.studentCount) fit.roomIds.push_back(room.id);
        }
        if (fit.roomIds.empty()) {
            report.sectionsWithoutRooms++;
        } else {
            report.sectionsWithRooms++;
        }
        report.sections.push_back(fit);
    }
    return report;
}

/**
 * @brief Count lecture/lab courses and rooms and flag obvious shortages.
 */
RoomTypeSummary roomTypeSummary(const Catalog& cat) {
    RoomTypeSummary summary;

    for (const Course& c : cat.courses) {
        if (c.type == CourseType::LECTURE || c.type == CourseType::COMBINED) summary.lectureCourses++;
        if (c.type == CourseType::LAB || c.type == CourseType::COMBINED) summary.labCourses++;
    }
    summary.totalCourses = cat.courses.size();

    for (const Room& r : cat.rooms) {
        if (r.type == Room::Type::LECTURE || r.type == Room::Type::COMBINED) summary.lectureRooms++;
        if (r.type == Room::Type::LAB || r.type == Room::Type::COMBINED) summary.labRooms++;
    }
    summary.totalRooms = cat.rooms.size();

    summary.missingLabRooms = summary.labRooms == 0 && summary.labCourses > 0;
    summary.labRoomsScarce = !summary.missingLabRooms && summary.labCourses > summary.labRooms * 3;
    summary.missingLectureRooms = summary.lectureRooms == 0;
    return summary;
}

InstructorCoverage instructorCoverage(const Catalog& cat) {
    InstructorCoverage coverage;
    std::set<std::string> covered;

    for (const Instructor& ins : cat.instructors) {
        coverage.instructors.push_back({ins.id, ins.name, ins.qualifiedCourses.size()});
        coverage.totalQualifications += ins.qualifiedCourses.size();
        covered.insert(ins.qualifiedCourses.begin(), ins.qualifiedCourses.end());
    }
    coverage.coveredCourses = covered.size();

    for (const Course& c : cat.courses) {
        if (!covered.count(c.id)) coverage.uncoveredCourses.push_back(c.id);
    }
    std::sort(coverage.uncoveredCourses.begin(), coverage.uncoveredCourses.end());
    return coverage;
}

std::vector<std::pair<std::string, size_t>> timeslotSummary(const Catalog& cat) {
    std::array<size_t, DAYS> perDay{};
    for (const TimeSlot& ts : cat.timeslots) perDay[ts.day]++;

    std::vector<std::pair<std::string, size_t>> summary;
    for (int d = 0; d < DAYS; ++d) {
        if (perDay[d] > 0) summary.emplace_back(dayName(d), perDay[d]);
    }
    return summary;
}
