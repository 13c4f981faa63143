#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "errors.hpp"
#include <string>
#include <vector>


///////////////////////////
///   CSP COMPONENTS    ///
///////////////////////////
/// Instructor index used by the synthetic "Unassigned" candidate.
static constexpr int kPlaceholderInstructor = -1;

/// Default size of the last-resort room prefix.
static constexpr int kDefaultFallbackRoomLimit = 10;

/**
 * @brief How a variable's room list was obtained.
 */
enum class RoomMatch {
    MATCHED, ///< Type-compatible rooms with enough seats.
    CAPACITY_RELAXED, ///< Type-compatible rooms, capacity ignored.
    FALLBACK ///< Prefix of all rooms, type and capacity ignored.
};

/**
 * @brief One (section, course) pair that needs exactly one placement.
 */
struct Variable {
    int section; ///< Index into Catalog::sections.
    int course; ///< Index into Catalog::courses.
    int studentCount; ///< Copied from the section.
    CourseType courseType; ///< Copied from the course.
    std::string courseName; ///< Copied from the course.
    RoomMatch roomMatch; ///< Stage that produced the room list.
    bool placeholderInstructor; ///< True if nobody is qualified for the course.
};

/**
 * @brief One candidate placement of a variable.
 *
 * Indices point into the catalog; ids, day and times are resolved from it.
 */
struct DomainValue {
    int room; ///< Index into Catalog::rooms.
    int timeslot; ///< Index into Catalog::timeslots.
    int instructor; ///< Index into Catalog::instructors or kPlaceholderInstructor.

    bool operator==(const DomainValue& o) const {
        return room == o.room && timeslot == o.timeslot && instructor == o.instructor;
    }
    bool operator!=(const DomainValue& o) const { return !(*this == o); }
};

/**
 * @brief Options for domain construction.
 */
struct DomainOptions {
    /// Number of rooms taken, in catalog order, when type matching fails.
    int fallbackRoomLimit = kDefaultFallbackRoomLimit;
};

/**
 * @brief A built CSP: catalog, variables and their fixed, ordered domains.
 *
 * Built once per solve and never modified afterwards. domains[i] belongs to
 * variables[i] and its order is the candidate-trial order.
 */
struct CspProblem {
    Catalog catalog;
    std::vector<Variable> variables;
    std::vector<std::vector<DomainValue>> domains;

    const Section& sectionOf(int var) const { return catalog.sections[variables[var].section]; }
    const Course& courseOf(int var) const { return catalog.courses[variables[var].course]; }

    /// Id of the candidate's instructor, or "UNASSIGNED" for the placeholder.
    const std::string& instructorId(const DomainValue& v) const;

    /// Name of the candidate's instructor, or "Unassigned" for the placeholder.
    const std::string& instructorName(const DomainValue& v) const;

    /// Total number of candidates over all variables.
    size_t totalCandidates() const;
};


///////////////////////////
/// DOMAIN CONSTRUCTION ///
///////////////////////////
/**
 * @brief Whether a room type can host a course type.
 *
 * Lecture rooms host lecture courses, lab rooms host lab courses, and a
 * combined course can use either. A combined room counts as both a lecture
 * and a lab room. OTHER matches nothing.
 */
bool roomTypeCompatible(Room::Type room, CourseType course);

/**
 * @brief Ordered room candidates for one variable.
 *
 * Applies type+capacity matching, then the capacity relaxation, then the
 * bounded prefix of all rooms (catalog order). Reports the stage used.
 */
std::vector<int> matchRooms(const Catalog& cat, CourseType type, int studentCount, int fallbackLimit,
                            RoomMatch& stage);

/**
 * @brief Qualified instructor indices for a course, in catalog order.
 *
 * Returns { kPlaceholderInstructor } when nobody is qualified.
 */
std::vector<int> matchInstructors(const Catalog& cat, const std::string& courseId);

/**
 * @brief Create variables and domains for a catalog.
 *
 * One variable per (section, required course), in section order and then
 * required-course order. Each domain is rooms x timeslots x instructors,
 * room-major.
 *
 * @throws EmptyDomainError if a variable ends without candidates.
 * @throws std::invalid_argument if options.fallbackRoomLimit is not positive.
 */
CspProblem buildProblem(Catalog catalog, const DomainOptions& options = DomainOptions());

/**
 * @brief Convenience: buildCatalog() followed by buildProblem().
 */
CspProblem buildProblem(const CatalogRecords& records, const DomainOptions& options = DomainOptions());
