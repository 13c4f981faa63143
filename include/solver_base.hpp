#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "domains.hpp"
#include "constraints.hpp"
#include <functional>
#include <string>


///////////////////////////
///        TYPES        ///
///////////////////////////
/// Default iteration budget of a solve call.
static constexpr long kDefaultMaxIterations = 1000;

/**
 * @brief Progress hook: (iterations so far, assigned variables, total variables).
 */
using ProgressCallback = std::function<void(long, size_t, size_t)>;

/**
 * @brief Configuration of a solve call.
 */
struct SolverConfig {
    /// Hard cap on search steps; the search stops when the counter reaches it.
    long maxIterations = kDefaultMaxIterations;

    /// Call onProgress every progressInterval steps (0 disables).
    long progressInterval = 100;

    /// Optional progress hook; never called when empty.
    ProgressCallback onProgress;
};

/**
 * @brief Search engine states.
 *
 * SEARCHING is the initial state; the others are terminal.
 */
enum class SearchStatus {
    SEARCHING,
    SOLVED, ///< Every variable assigned.
    EXHAUSTED, ///< No candidate works anywhere in the explored space.
    BUDGET_EXCEEDED, ///< Iteration cap hit before a decision.
    CANCELLED ///< Stopped by a sibling worker's success (parallel solvers only).
};

/// Human-readable name of a status.
std::string toString(SearchStatus status);

/**
 * @brief Outcome of a solve call.
 *
 * A status other than SOLVED means the search is incomplete; this is a
 * normal result, and assignment then holds the partial assignment:
 *  - BUDGET_EXCEEDED: the assignment as it stood when the budget ran out,
 *  - EXHAUSTED: the deepest partial assignment reached.
 */
struct SearchResult {
    SearchStatus status;
    Assignment assignment;
    long iterations; ///< Search steps taken.

    bool solved() const { return status == SearchStatus::SOLVED; }
    bool isIncomplete() const { return status != SearchStatus::SOLVED; }
    size_t assignedCount() const { return assignment.size(); }
    size_t variableCount() const { return assignment.problem().variables.size(); }
};


///////////////////////////
///      INTERFACE      ///
///////////////////////////
/**
 * @brief Common interface for timetable solvers.
 *
 * Implementations may be sequential or multithreaded, but all expose the
 * same solve() contract.
 */
class ISolver {
public:
    virtual ~ISolver() = default;

    /**
     * @brief Search for a clash-free assignment of every variable.
     *
     * The problem must outlive the returned result, whose assignment
     * refers to it.
     */
    virtual SearchResult solve(const CspProblem& problem) = 0;
};

/**
 * @brief Throw std::invalid_argument for an unusable configuration.
 */
void validateConfig(const SolverConfig& config);
