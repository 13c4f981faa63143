#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <string>
#include <vector>
#include <unordered_map>


///////////////////////////
///   RAW CATALOG DATA  ///
///////////////////////////
/**
 * @brief Course row as handed over by a tabular loader.
 *
 * All raw records keep their fields as text; parsing and validation happen
 * in buildCatalog().
 */
struct CourseRecord {
    std::string courseId;
    std::string courseName;
    std::string type; ///< "Lecture", "Lab", "Lecture and Lab", ...
    std::string credits;
};

/**
 * @brief Instructor row as handed over by a tabular loader.
 */
struct InstructorRecord {
    std::string instructorId;
    std::string name;
    std::string qualifiedCourses; ///< Delimited course id list ("CS101, CS102").
    std::string preferredSlots;
};

/**
 * @brief Room row as handed over by a tabular loader.
 */
struct RoomRecord {
    std::string roomId;
    std::string type;
    std::string capacity;
};

/**
 * @brief Timeslot row as handed over by a tabular loader.
 */
struct TimeSlotRecord {
    std::string timeSlotId;
    std::string day;
    std::string startTime; ///< "HH:MM", 24h.
    std::string endTime;
};

/**
 * @brief Section row as handed over by a tabular loader.
 */
struct SectionRecord {
    std::string sectionId;
    std::string studentCount;
    std::string courses; ///< Delimited course id list, in required order.
};

/**
 * @brief The five raw collections a catalog is built from.
 */
struct CatalogRecords {
    std::vector<CourseRecord> courses;
    std::vector<InstructorRecord> instructors;
    std::vector<RoomRecord> rooms;
    std::vector<TimeSlotRecord> timeslots;
    std::vector<SectionRecord> sections;
};


///////////////////////////
///       MODELS        ///
///////////////////////////
// Teaching week: 5 days, Sunday first.
static constexpr int DAYS = 5;

/**
 * @brief Kind of teaching a course requires.
 */
enum class CourseType { LECTURE, LAB, COMBINED, OTHER };

/**
 * @brief A course from the catalog.
 */
struct Course {
    std::string id; ///< Unique course code (e.g., "CS101").
    std::string name; ///< Human-readable course name.
    std::string typeTag; ///< Type text exactly as given in the catalog.
    CourseType type; ///< Parsed type used for room matching.
    int credits; ///< Credit count.
};

/**
 * @brief Instructor with the set of courses they are qualified to teach.
 *
 * preferredSlots is carried through from the catalog but never consulted
 * by domain construction or search.
 */
struct Instructor {
    std::string id; ///< Unique instructor identifier.
    std::string name; ///< Instructor's name.
    std::vector<std::string> qualifiedCourses; ///< Course ids, catalog order.
    std::string preferredSlots; ///< Free-form preference text.

    bool isQualifiedFor(const std::string& courseId) const;
};

/**
 * @brief A teaching room.
 */
struct Room {
    std::string id; ///< Unique room identifier (e.g., "R101").
    std::string typeTag; ///< Type text exactly as given in the catalog.

    /// Room type used to enforce compatibility with the course type.
    /// COMBINED rooms (tag names both lecture and lab) serve either kind.
    enum class Type { LECTURE, LAB, COMBINED, OTHER } type;

    int capacity; ///< Maximum number of students the room can hold.
};

/**
 * @brief One weekly teaching period.
 */
struct TimeSlot {
    std::string id; ///< Unique timeslot identifier.
    int day; ///< Day rank in the teaching week (0..DAYS-1).
    std::string startTime; ///< Start time text as given.
    std::string endTime; ///< End time text as given.
    int startMinute; ///< Start time in minutes after midnight.
    int endMinute; ///< End time in minutes after midnight.
};

/**
 * @brief A student section that must attend an ordered list of courses.
 *
 * A section is an atomic unit in scheduling: all its students share the
 * same timetable, so two of its courses can never share a timeslot.
 */
struct Section {
    std::string id; ///< Unique section identifier.
    int studentCount; ///< Number of students in the section.
    std::vector<int> courses; ///< Indices into Catalog::courses, required order.
};

/**
 * @brief Normalized catalog: typed entities plus id lookup tables.
 *
 * Entity vectors keep the insertion order of the raw records; that order is
 * what every later stage (variables, domains, fallback room prefix) follows.
 */
struct Catalog {
    std::vector<Course> courses; ///< All courses.
    std::vector<Instructor> instructors; ///< All instructors.
    std::vector<Room> rooms; ///< All rooms.
    std::vector<TimeSlot> timeslots; ///< All timeslots.
    std::vector<Section> sections; ///< All sections.

    std::unordered_map<std::string, int> courseIndex; ///< Course id -> index.
    std::unordered_map<std::string, int> instructorIndex; ///< Instructor id -> index.
    std::unordered_map<std::string, int> roomIndex; ///< Room id -> index.
    std::unordered_map<std::string, int> timeslotIndex; ///< Timeslot id -> index.
    std::unordered_map<std::string, int> sectionIndex; ///< Section id -> index.

    /// Index of the course with the given id, or -1.
    int findCourse(const std::string& id) const;

    /// Index of the room with the given id, or -1.
    int findRoom(const std::string& id) const;
};


///////////////////////////
///       HELPERS       ///
///////////////////////////
/// Name of a day rank ("Sunday" .. "Thursday").
const std::string& dayName(int day);

/// Day rank of a day name (case-insensitive), or -1 if not a teaching day.
int dayRank(const std::string& name);

/// Parse a course type tag by substring, the way catalog tags are written.
CourseType parseCourseType(const std::string& tag);

/// Parse a room type tag by substring.
Room::Type parseRoomType(const std::string& tag);
