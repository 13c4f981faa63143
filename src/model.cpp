///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "errors.hpp"
#include <algorithm>
#include <array>
#include <cctype>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Day names of the teaching week, indexed by day rank.
 */
static const std::array<std::string, DAYS> kDayNames = {
        "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday"
};

static std::string toLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return out;
}

static bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

const std::string& dayName(int day) {
    static const std::string kUnknown = "Unknown";
    if (day < 0 || day >= DAYS) return kUnknown;
    return kDayNames[day];
}

int dayRank(const std::string& name) {
    std::string lower = toLower(name);
    for (int d = 0; d < DAYS; ++d) {
        if (toLower(kDayNames[d]) == lower) return d;
    }
    return -1;
}

/**
 * @brief Parse a course type tag.
 *
 * A tag naming both lecture and lab ("Lecture and Lab") is a combined
 * course; anything naming neither is OTHER and matches no room type.
 */
CourseType parseCourseType(const std::string& tag) {
    std::string lower = toLower(tag);
    bool lecture = contains(lower, "lecture");
    bool lab = contains(lower, "lab");
    if (lecture && lab) return CourseType::COMBINED;
    if (lecture) return CourseType::LECTURE;
    if (lab) return CourseType::LAB;
    return CourseType::OTHER;
}

Room::Type parseRoomType(const std::string& tag) {
    std::string lower = toLower(tag);
    bool lecture = contains(lower, "lecture");
    bool lab = contains(lower, "lab");
    if (lecture && lab) return Room::Type::COMBINED;
    if (lecture) return Room::Type::LECTURE;
    if (lab) return Room::Type::LAB;
    return Room::Type::OTHER;
}


///////////////////////////
///       MODELS        ///
///////////////////////////
bool Instructor::isQualifiedFor(const std::string& courseId) const {
    return std::find(qualifiedCourses.begin(), qualifiedCourses.end(), courseId) != qualifiedCourses.end();
}

int Catalog::findCourse(const std::string& id) const {
    auto it = courseIndex.find(id);
    return it == courseIndex.end() ? -1 : it->second;
}

int Catalog::findRoom(const std::string& id) const {
    auto it = roomIndex.find(id);
    return it == roomIndex.end() ? -1 : it->second;
}


///////////////////////////
///       ERRORS        ///
///////////////////////////
ConstructionError::ConstructionError(const std::string& entity, const std::string& field, const std::string& detail)
        : std::runtime_error(entity + ": field '" + field + "': " + detail),
          entity_(entity),
          field_(field) {}

EmptyDomainError::EmptyDomainError(const std::string& sectionId, const std::string& courseId)
        : std::runtime_error("No candidates for section " + sectionId + ", course " + courseId +
                             " (room or timeslot catalog is empty)"),
          sectionId_(sectionId),
          courseId_(courseId) {}
