#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "domains.hpp"
#include "constraints.hpp"
#include "solver_base.hpp"
#include <atomic>
#include <vector>


///////////////////////////
///    SEARCH STATE     ///
///////////////////////////
/**
 * @brief Mutable state of one depth-first search.
 *
 * Owned by a single call stack; parallel solvers give every worker its own.
 */
struct SearchContext {
    SearchContext(const CspProblem& problem, long maxIterations, const std::atomic<bool>* cancel);

    Assignment assignment; ///< Current partial assignment.
    Assignment best; ///< Deepest partial assignment seen (or state at budget stop).
    long iterations = 0; ///< Steps taken so far; only ever increases.
    long maxIterations; ///< Step at which the search gives up.
    SearchStatus status = SearchStatus::SEARCHING;
    const std::atomic<bool>* cancel; ///< Optional stop request, may be null.
};

/**
 * @brief Assign a candidate for the lifetime of a scope.
 *
 * The destructor undoes the assignment unless commit() was called, so every
 * exit path of a search step restores the previous state.
 */
class ScopedAssignment {
public:
    ScopedAssignment(Assignment& assignment, int var, const DomainValue& value);
    ~ScopedAssignment();

    ScopedAssignment(const ScopedAssignment&) = delete;
    ScopedAssignment& operator=(const ScopedAssignment&) = delete;

    /// Keep the assignment when the scope ends.
    void commit() { committed_ = true; }

private:
    Assignment& assignment_;
    int var_;
    bool committed_ = false;
};


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Single-threaded backtracking solver.
 *
 * Depth-first search with chronological backtracking. Variables are picked
 * by minimum remaining values over the static domain sizes (ties broken by
 * construction order) and candidates are tried in domain order. The search
 * stops at the first complete assignment or when the iteration budget runs
 * out. No randomness is involved, so identical inputs give identical results.
 */
class SequentialBacktrackingSolver : public ISolver {
public:
    /**
     * @brief Construct a sequential solver.
     *
     * @throws std::invalid_argument if the configuration is unusable.
     */
    explicit SequentialBacktrackingSolver(SolverConfig config = SolverConfig());

    /**
     * @brief Solve the whole problem.
     */
    SearchResult solve(const CspProblem& problem) override;

    /**
     * @brief Solve the subtree rooted at some candidates of the root variable.
     *
     * The root variable is the first variable MRV picks on an empty
     * assignment (see rootVariable()); only the listed indices into its
     * domain are tried at the first level. Used by the parallel solvers to
     * split the search into disjoint parts.
     *
     * @param cancel Optional flag; when it becomes true the search stops with
     *               status CANCELLED at its next step.
     */
    SearchResult solveSubtree(const CspProblem& problem, const std::vector<int>& rootCandidates,
                              const std::atomic<bool>* cancel = nullptr) const;

    /**
     * @brief Variables ordered by static domain size, ties by construction order.
     */
    static std::vector<int> mrvOrder(const CspProblem& problem);

    /**
     * @brief Variable chosen first on an empty assignment, or -1 if none.
     */
    static int rootVariable(const CspProblem& problem);

    const SolverConfig& config() const { return config_; }

private:
    /// Iteration budget and progress reporting.
    SolverConfig config_;

    /**
     * @brief Run a search with an optional root-candidate filter.
     */
    SearchResult run(const CspProblem& problem, const std::vector<int>* rootCandidates,
                     const std::atomic<bool>* cancel) const;

    /**
     * @brief One recursive search step.
     *
     * @param order       Variables in MRV order.
     * @param candidates  Domain indices to try at this step, or null for all.
     * @return true once every variable is assigned.
     */
    bool backtrack(SearchContext& ctx, const std::vector<int>& order, const std::vector<int>* candidates) const;

    /**
     * @brief Try one candidate for var and recurse.
     *
     * @return true if the search is solved below this candidate.
     */
    bool tryCandidate(SearchContext& ctx, const std::vector<int>& order, int var, const DomainValue& value) const;

    /**
     * @brief First unassigned variable in MRV order, or -1.
     */
    static int selectUnassigned(const Assignment& assignment, const std::vector<int>& order);
};
