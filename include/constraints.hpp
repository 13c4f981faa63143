#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "domains.hpp"
#include <optional>
#include <vector>


///////////////////////////
///     CONSTRAINTS     ///
///////////////////////////
/**
 * @brief Partial assignment of candidates to variables.
 *
 * Holds one optional slot per variable of a CspProblem and the list of
 * assigned variables in assignment order. Hard constraints checked by
 * isConsistent():
 *  - no two variables in the same room at the same timeslot,
 *  - no real instructor teaching two variables at the same timeslot,
 *  - no section attending two variables at the same timeslot.
 *
 * The placeholder instructor is exempt from the instructor rule.
 */
class Assignment {
public:
    /**
     * @brief Construct an empty assignment for a given problem.
     */
    explicit Assignment(const CspProblem& problem);

    /**
     * @brief Check a candidate for a variable against every assigned variable.
     *
     * Cost is linear in the number of assigned variables.
     */
    bool isConsistent(int var, const DomainValue& value) const;

    /**
     * @brief Record a candidate for an unassigned variable.
     *
     * Does not check consistency; callers test isConsistent() first.
     */
    void assign(int var, const DomainValue& value);

    /**
     * @brief Remove the most recent assignment of a variable.
     *
     * Assignments are undone in reverse order by the search, so var is
     * normally the last one assigned.
     */
    void unassign(int var);

    bool isAssigned(int var) const { return values_[var].has_value(); }

    /// Candidate of an assigned variable. Requires isAssigned(var).
    const DomainValue& valueOf(int var) const { return *values_[var]; }

    /// Assigned variable indices, in assignment order.
    const std::vector<int>& assignedVariables() const { return order_; }

    size_t size() const { return order_.size(); }

    bool isComplete() const { return order_.size() == values_.size(); }

    /**
     * @brief Access the problem this assignment belongs to.
     */
    const CspProblem& problem() const { return *problem_; }

private:
    /// Problem this assignment belongs to (owned externally).
    const CspProblem* problem_;

    /// values_[var] = chosen candidate, or empty.
    std::vector<std::optional<DomainValue>> values_;

    /// Assigned variables, oldest first.
    std::vector<int> order_;
};

/**
 * @brief Check that no two assigned variables clash.
 *
 * Independent of the incremental check used during search; used to validate
 * finished or partial results.
 */
bool isClashFree(const Assignment& assignment);
