///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "constraints.hpp"
#include <algorithm>


///////////////////////////
///     CONSTRAINTS     ///
///////////////////////////
/**
 * @brief Initialize an empty assignment with one slot per variable.
 */
Assignment::Assignment(const CspProblem& problem)
        : problem_(&problem),
          values_(problem.variables.size()) {
    order_.reserve(problem.variables.size());
}

/**
 * @brief Scan every assigned variable for a room, instructor or section clash.
 */
bool Assignment::isConsistent(int var, const DomainValue& value) const {
    int section = problem_->variables[var].section;

    for (int other : order_) {
        const DomainValue& assigned = *values_[other];
        if (assigned.timeslot != value.timeslot) continue;

        // Room already taken at this time.
        if (assigned.room == value.room)
            return false;

        // Same instructor at the same time, unless both are the placeholder.
        if (value.instructor != kPlaceholderInstructor && assigned.instructor == value.instructor)
            return false;

        // Section already attends something at this time.
        if (problem_->variables[other].section == section)
            return false;
    }
    return true;
}

void Assignment::assign(int var, const DomainValue& value) {
    values_[var] = value;
    order_.push_back(var);
}

void Assignment::unassign(int var) {
    if (!values_[var]) return;
    values_[var].reset();
    if (!order_.empty() && order_.back() == var) {
        order_.pop_back();
    } else {
        order_.erase(std::find(order_.begin(), order_.end(), var));
    }
}

/**
 * @brief Pairwise check of all assigned variables.
 */
bool isClashFree(const Assignment& assignment) {
    const CspProblem& problem = assignment.problem();
    const std::vector<int>& vars = assignment.assignedVariables();

    for (size_t i = 0; i < vars.size(); ++i) {
        const DomainValue& a = assignment.valueOf(vars[i]);
        for (size_t j = i + 1; j < vars.size(); ++j) {
            const DomainValue& b = assignment.valueOf(vars[j]);
            if (a.timeslot != b.timeslot) continue;
            if (a.room == b.room) return false;
            if (a.instructor != kPlaceholderInstructor && a.instructor == b.instructor) return false;
            if (problem.variables[vars[i]].section == problem.variables[vars[j]].section) return false;
        }
    }
    return true;
}
