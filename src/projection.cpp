///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "projection.hpp"
#include <algorithm>
#include <array>
#include <set>


///////////////////////////
///       OUTPUT        ///
///////////////////////////
/**
 * @brief Resolve every assigned variable against the catalog and sort.
 *
 * Start minutes are kept alongside each record only for sorting, so that
 * "9:00" orders before "10:00".
 */
std::vector<ScheduleRecord> projectSchedule(const Assignment& assignment) {
    const CspProblem& problem = assignment.problem();
    const Catalog& cat = problem.catalog;

    std::vector<std::pair<int, ScheduleRecord>> rows;
    rows.reserve(assignment.size());

    for (int var : assignment.assignedVariables()) {
        const Variable& v = problem.variables[var];
        const DomainValue& value = assignment.valueOf(var);
        const Section& sec = cat.sections[v.section];
        const Course& course = cat.courses[v.course];
        const TimeSlot& ts = cat.timeslots[value.timeslot];

        ScheduleRecord rec;
        rec.sectionId = sec.id;
        rec.courseCode = course.id;
        rec.courseName = v.courseName;
        rec.activityType = course.typeTag;
        rec.day = dayName(ts.day);
        rec.dayRank = ts.day;
        rec.startTime = ts.startTime;
        rec.endTime = ts.endTime;
        rec.room = cat.rooms[value.room].id;
        rec.instructor = problem.instructorName(value);
        rec.instructorId = problem.instructorId(value);
        rec.studentCount = v.studentCount;
        rows.emplace_back(ts.startMinute, rec);
    }

    std::stable_sort(rows.begin(), rows.end(),
                     [](const std::pair<int, ScheduleRecord>& a, const std::pair<int, ScheduleRecord>& b) {
                         if (a.second.dayRank != b.second.dayRank) return a.second.dayRank < b.second.dayRank;
                         if (a.first != b.first) return a.first < b.first;
                         return a.second.sectionId < b.second.sectionId;
                     });

    std::vector<ScheduleRecord> records;
    records.reserve(rows.size());
    for (auto& row : rows) records.push_back(std::move(row.second));
    return records;
}

ScheduleStatistics summarizeSchedule(const std::vector<ScheduleRecord>& records) {
    ScheduleStatistics stats;
    std::set<std::string> courses, sections, instructors, rooms;
    std::array<size_t, DAYS> perDay{};

    for (const ScheduleRecord& r : records) {
        courses.insert(r.courseCode);
        sections.insert(r.sectionId);
        instructors.insert(r.instructor);
        rooms.insert(r.room);
        stats.byActivityType[r.activityType]++;
        if (r.dayRank >= 0 && r.dayRank < DAYS) perDay[r.dayRank]++;
    }

    stats.totalClasses = records.size();
    stats.uniqueCourses = courses.size();
    stats.uniqueSections = sections.size();
    stats.uniqueInstructors = instructors.size();
    stats.roomsUsed = rooms.size();

    for (int d = 0; d < DAYS; ++d) {
        if (perDay[d] > 0) stats.byDay.emplace_back(dayName(d), perDay[d]);
    }
    return stats;
}
