///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "domains.hpp"
#include "model_builder.hpp"
#include <stdexcept>


///////////////////////////
///   CSP COMPONENTS    ///
///////////////////////////
const std::string& CspProblem::instructorId(const DomainValue& v) const {
    static const std::string kUnassignedId = "UNASSIGNED";
    if (v.instructor == kPlaceholderInstructor) return kUnassignedId;
    return catalog.instructors[v.instructor].id;
}

const std::string& CspProblem::instructorName(const DomainValue& v) const {
    static const std::string kUnassignedName = "Unassigned";
    if (v.instructor == kPlaceholderInstructor) return kUnassignedName;
    return catalog.instructors[v.instructor].name;
}

size_t CspProblem::totalCandidates() const {
    size_t total = 0;
    for (const auto& d : domains) total += d.size();
    return total;
}


///////////////////////////
/// DOMAIN CONSTRUCTION ///
///////////////////////////
bool roomTypeCompatible(Room::Type room, CourseType course) {
    bool lectureRoom = room == Room::Type::LECTURE || room == Room::Type::COMBINED;
    bool labRoom = room == Room::Type::LAB || room == Room::Type::COMBINED;
    switch (course) {
        case CourseType::LECTURE:  return lectureRoom;
        case CourseType::LAB:      return labRoom;
        case CourseType::COMBINED: return lectureRoom || labRoom;
        case CourseType::OTHER:    return false;
    }
    return false;
}

/**
 * @brief Pick the rooms a variable may use.
 *
 * Three stages, each only reached when the previous one found nothing:
 * type and capacity, type only, then the first fallbackLimit rooms of the
 * catalog regardless of type or capacity.
 */
std::vector<int> matchRooms(const Catalog& cat, CourseType type, int studentCount, int fallbackLimit,
                            RoomMatch& stage) {
    std::vector<int> rooms;
    int numRooms = (int)cat.rooms.size();

    stage = RoomMatch::MATCHED;
    for (int r = 0; r < numRooms; ++r) {
        const Room& room = cat.rooms[r];
        if (roomTypeCompatible(room.type, type) && room.capacity >= studentCount) {
            rooms.push_back(r);
        }
    }
    if (!rooms.empty()) return rooms;

    stage = RoomMatch::CAPACITY_RELAXED;
    for (int r = 0; r < numRooms; ++r) {
        if (roomTypeCompatible(cat.rooms[r].type, type)) {
            rooms.push_back(r);
        }
    }
    if (!rooms.empty()) return rooms;

    stage = RoomMatch::FALLBACK;
    for (int r = 0; r < numRooms && r < fallbackLimit; ++r) {
        rooms.push_back(r);
    }
    return rooms;
}

std::vector<int> matchInstructors(const Catalog& cat, const std::string& courseId) {
    std::vector<int> instructors;
    for (int i = 0; i < (int)cat.instructors.size(); ++i) {
        if (cat.instructors[i].isQualifiedFor(courseId)) {
            instructors.push_back(i);
        }
    }
    if (instructors.empty()) {
        instructors.push_back(kPlaceholderInstructor);
    }
    return instructors;
}

CspProblem buildProblem(Catalog catalog, const DomainOptions& options) {
    if (options.fallbackRoomLimit <= 0) {
        throw std::invalid_argument("fallbackRoomLimit must be positive");
    }

    CspProblem problem;
    problem.catalog = std::move(catalog);
    const Catalog& cat = problem.catalog;
    int numTimeslots = (int)cat.timeslots.size();

    for (int s = 0; s < (int)cat.sections.size(); ++s) {
        const Section& sec = cat.sections[s];
        for (int c : sec.courses) {
            const Course& course = cat.courses[c];

            Variable var;
            var.section = s;
            var.course = c;
            var.studentCount = sec.studentCount;
            var.courseType = course.type;
            var.courseName = course.name;

            std::vector<int> rooms = matchRooms(cat, course.type, sec.studentCount,
                                                options.fallbackRoomLimit, var.roomMatch);
            std::vector<int> instructors = matchInstructors(cat, course.id);
            var.placeholderInstructor = instructors.front() == kPlaceholderInstructor;

            // Room-major, then timeslot, then instructor: this is also the
            // order in which the search tries candidates.
            std::vector<DomainValue> domain;
            domain.reserve(rooms.size() * numTimeslots * instructors.size());
            for (int r : rooms) {
                for (int t = 0; t < numTimeslots; ++t) {
                    for (int i : instructors) {
                        domain.push_back(DomainValue{r, t, i});
                    }
                }
            }

            if (domain.empty()) {
                throw EmptyDomainError(sec.id, course.id);
            }

            problem.variables.push_back(var);
            problem.domains.push_back(std::move(domain));
        }
    }

    return problem;
}

CspProblem buildProblem(const CatalogRecords& records, const DomainOptions& options) {
    return buildProblem(buildCatalog(records), options);
}
