#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "domains.hpp"
#include "constraints.hpp"
#include <map>
#include <string>
#include <utility>
#include <vector>


///////////////////////////
///       OUTPUT        ///
///////////////////////////
/**
 * @brief One scheduled class, flattened for reports and viewers.
 */
struct ScheduleRecord {
    std::string sectionId; ///< Section_ID
    std::string courseCode; ///< Course_Code
    std::string courseName; ///< Course_Name
    std::string activityType; ///< Activity_Type: the course's type tag.
    std::string day; ///< Day name.
    int dayRank; ///< Day position in the teaching week (0..DAYS-1).
    std::string startTime; ///< Start_Time
    std::string endTime; ///< End_Time
    std::string room; ///< Room id.
    std::string instructor; ///< Instructor name ("Unassigned" for the placeholder).
    std::string instructorId; ///< Instructor id ("UNASSIGNED" for the placeholder).
    int studentCount; ///< Student_Count
};

/**
 * @brief Flatten an assignment into records, one per assigned variable.
 *
 * Works on complete and partial assignments alike. Records are ordered by
 * day, then start time, then section id.
 */
std::vector<ScheduleRecord> projectSchedule(const Assignment& assignment);

/**
 * @brief Summary counts over a projected schedule.
 */
struct ScheduleStatistics {
    size_t totalClasses = 0;
    size_t uniqueCourses = 0;
    size_t uniqueSections = 0;
    size_t uniqueInstructors = 0; ///< Distinct instructor names.
    size_t roomsUsed = 0;

    /// Classes per activity type, sorted by type text.
    std::map<std::string, size_t> byActivityType;

    /// Classes per day in week order; days without classes are left out.
    std::vector<std::pair<std::string, size_t>> byDay;
};

/**
 * @brief Compute summary counts for a projected schedule.
 */
ScheduleStatistics summarizeSchedule(const std::vector<ScheduleRecord>& records);
