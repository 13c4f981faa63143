#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <stdexcept>
#include <string>


///////////////////////////
///       ERRORS        ///
///////////////////////////
/**
 * @brief Raised when raw catalog records cannot be turned into a model.
 *
 * Covers references to entities missing from the catalog and required
 * fields that cannot be parsed. Model building stops at the first error;
 * no partial catalog is returned.
 */
class ConstructionError : public std::runtime_error {
public:
    ConstructionError(const std::string& entity, const std::string& field, const std::string& detail);

    /// Record kind and id that failed, e.g. "Section S1".
    const std::string& entity() const { return entity_; }

    /// Name of the offending field, e.g. "Courses".
    const std::string& field() const { return field_; }

private:
    std::string entity_;
    std::string field_;
};

/**
 * @brief Raised when a variable has no candidates after every relaxation.
 *
 * Only reachable when the global room or timeslot catalog is empty.
 */
class EmptyDomainError : public std::runtime_error {
public:
    EmptyDomainError(const std::string& sectionId, const std::string& courseId);

    const std::string& sectionId() const { return sectionId_; }
    const std::string& courseId() const { return courseId_; }

private:
    std::string sectionId_;
    std::string courseId_;
};
