#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <string>
#include <utility>
#include <vector>


///////////////////////////
///     DIAGNOSTICS     ///
///////////////////////////
/**
 * @brief Rooms large enough for one section, ignoring room type.
 */
struct SectionRoomFit {
    std::string sectionId;
    int studentCount;
    std::vector<std::string> roomIds; ///< Catalog order.
};

struct SectionRoomReport {
    std::vector<SectionRoomFit> sections; ///< Catalog order.
    size_t sectionsWithRooms = 0;
    size_t sectionsWithoutRooms = 0;
};

/**
 * @brief Course types versus room types.
 *
 * Counting is by tag substring, so a combined course counts both as a
 * lecture course and as a lab course.
 */
struct RoomTypeSummary {
    size_t lectureCourses = 0;
    size_t labCourses = 0;
    size_t totalCourses = 0;
    size_t lectureRooms = 0;
    size_t labRooms = 0;
    size_t totalRooms = 0;

    bool missingLabRooms = false; ///< Lab courses exist but no lab room does.
    bool labRoomsScarce = false; ///< More than three lab courses per lab room.
    bool missingLectureRooms = false; ///< No lecture room at all.
};

struct InstructorLoad {
    std::string instructorId;
    std::string name;
    size_t qualifications;
};

struct InstructorCoverage {
    std::vector<InstructorLoad> instructors; ///< Catalog order.
    size_t totalQualifications = 0;
    size_t coveredCourses = 0;
    std::vector<std::string> uncoveredCourses; ///< Sorted course ids.
};

/**
 * @brief Sections versus room capacity.
 */
SectionRoomReport sectionRoomCompatibility(const Catalog& cat);

/**
 * @brief Lecture/lab demand versus lecture/lab rooms.
 */
RoomTypeSummary roomTypeSummary(const Catalog& cat);

/**
 * @brief Qualifications per instructor and courses nobody can teach.
 */
InstructorCoverage instructorCoverage(const Catalog& cat);

/**
 * @brief Number of timeslots per day, in week order (empty days left out).
 */
std::vector<std::pair<std::string, size_t>> timeslotSummary(const Catalog& cat);
