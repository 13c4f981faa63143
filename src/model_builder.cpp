///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model_builder.hpp"
#include <cctype>
#include <limits>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static std::string trim(const std::string& s) {
    size_t first = 0;
    while (first < s.size() && std::isspace((unsigned char)s[first])) ++first;
    size_t last = s.size();
    while (last > first && std::isspace((unsigned char)s[last - 1])) --last;
    return s.substr(first, last - first);
}

/**
 * @brief Parse a non-negative integer field, rejecting any trailing text.
 */
static int parseCount(const std::string& entity, const std::string& field, const std::string& text) {
    std::string value = trim(text);
    if (value.empty()) {
        throw ConstructionError(entity, field, "missing value");
    }
    long long result = 0;
    for (char c : value) {
        if (!std::isdigit((unsigned char)c)) {
            throw ConstructionError(entity, field, "not a non-negative integer: '" + value + "'");
        }
        result = result * 10 + (c - '0');
        if (result > std::numeric_limits<int>::max()) {
            throw ConstructionError(entity, field, "value out of range: '" + value + "'");
        }
    }
    return (int)result;
}

/**
 * @brief Parse "H:MM" or "HH:MM" into minutes after midnight.
 */
static int parseTime(const std::string& entity, const std::string& field, const std::string& text) {
    std::string value = trim(text);
    size_t colon = value.find(':');
    if (colon == std::string::npos || colon == 0 || colon > 2 || value.size() - colon - 1 != 2) {
        throw ConstructionError(entity, field, "not a HH:MM time: '" + value + "'");
    }
    for (size_t i = 0; i < value.size(); ++i) {
        if (i != colon && !std::isdigit((unsigned char)value[i])) {
            throw ConstructionError(entity, field, "not a HH:MM time: '" + value + "'");
        }
    }
    int hours = std::stoi(value.substr(0, colon));
    int minutes = std::stoi(value.substr(colon + 1));
    if (hours > 23 || minutes > 59) {
        throw ConstructionError(entity, field, "time out of range: '" + value + "'");
    }
    return hours * 60 + minutes;
}

/**
 * @brief Validate an id field and register it in an id -> index table.
 */
static std::string registerId(const std::string& kind, const std::string& field, const std::string& text,
                              int index, std::unordered_map<std::string, int>& table) {
    std::string id = trim(text);
    if (id.empty()) {
        throw ConstructionError(kind + " #" + std::to_string(index), field, "missing id");
    }
    if (!table.emplace(id, index).second) {
        throw ConstructionError(kind + " " + id, field, "duplicate id");
    }
    return id;
}

std::vector<std::string> splitIdList(const std::string& text) {
    std::vector<std::string> ids;
    std::string current;
    for (char c : text) {
        if (c == ',' || c == ';') {
            std::string id = trim(current);
            if (!id.empty()) ids.push_back(id);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    std::string id = trim(current);
    if (!id.empty()) ids.push_back(id);
    return ids;
}


///////////////////////////
///    MODEL BUILDER    ///
///////////////////////////
/**
 * @brief Build the typed catalog from raw records.
 *
 * Order matters: courses are registered first so that instructor
 * qualifications and section course lists can be checked against them.
 * Timeslots and rooms are independent of everything else.
 */
Catalog buildCatalog(const CatalogRecords& records) {
    Catalog cat;

    // Courses.
    for (const CourseRecord& r : records.courses) {
        int idx = (int)cat.courses.size();
        Course c;
        c.id = registerId("Course", "CourseID", r.courseId, idx, cat.courseIndex);
        c.name = trim(r.courseName);
        c.typeTag = trim(r.type);
        c.type = parseCourseType(c.typeTag);
        c.credits = parseCount("Course " + c.id, "Credits", r.credits);
        cat.courses.push_back(c);
    }

    // Instructors: every qualification must name a known course.
    for (const InstructorRecord& r : records.instructors) {
        int idx = (int)cat.instructors.size();
        Instructor ins;
        ins.id = registerId("Instructor", "InstructorID", r.instructorId, idx, cat.instructorIndex);
        ins.name = trim(r.name);
        ins.preferredSlots = trim(r.preferredSlots);
        for (const std::string& courseId : splitIdList(r.qualifiedCourses)) {
            if (cat.findCourse(courseId) < 0) {
                throw ConstructionError("Instructor " + ins.id, "QualifiedCourses",
                                        "unknown course '" + courseId + "'");
            }
            if (!ins.isQualifiedFor(courseId)) {
                ins.qualifiedCourses.push_back(courseId);
            }
        }
        cat.instructors.push_back(ins);
    }

    // Rooms.
    for (const RoomRecord& r : records.rooms) {
        int idx = (int)cat.rooms.size();
        Room room;
        room.id = registerId("Room", "RoomID", r.roomId, idx, cat.roomIndex);
        room.typeTag = trim(r.type);
        room.type = parseRoomType(room.typeTag);
        room.capacity = parseCount("Room " + room.id, "Capacity", r.capacity);
        cat.rooms.push_back(room);
    }

    // Timeslots.
    for (const TimeSlotRecord& r : records.timeslots) {
        int idx = (int)cat.timeslots.size();
        TimeSlot ts;
        ts.id = registerId("TimeSlot", "TimeSlotID", r.timeSlotId, idx, cat.timeslotIndex);
        std::string entity = "TimeSlot " + ts.id;

        ts.day = dayRank(trim(r.day));
        if (ts.day < 0) {
            throw ConstructionError(entity, "Day", "not a teaching day: '" + trim(r.day) + "'");
        }
        ts.startTime = trim(r.startTime);
        ts.endTime = trim(r.endTime);
        ts.startMinute = parseTime(entity, "StartTime", ts.startTime);
        ts.endMinute = parseTime(entity, "EndTime", ts.endTime);
        if (ts.endMinute <= ts.startMinute) {
            throw ConstructionError(entity, "EndTime", "ends before it starts");
        }
        cat.timeslots.push_back(ts);
    }

    // Sections: resolve course ids to indices, keeping the required order.
    for (const SectionRecord& r : records.sections) {
        int idx = (int)cat.sections.size();
        Section sec;
        sec.id = registerId("Section", "SectionID", r.sectionId, idx, cat.sectionIndex);
        std::string entity = "Section " + sec.id;
        sec.studentCount = parseCount(entity, "StudentCount", r.studentCount);

        for (const std::string& courseId : splitIdList(r.courses)) {
            int cIdx = cat.findCourse(courseId);
            if (cIdx < 0) {
                throw ConstructionError(entity, "Courses", "unknown course '" + courseId + "'");
            }
            for (int existing : sec.courses) {
                if (existing == cIdx) {
                    throw ConstructionError(entity, "Courses", "course '" + courseId + "' listed twice");
                }
            }
            sec.courses.push_back(cIdx);
        }
        cat.sections.push_back(sec);
    }

    return cat;
}
