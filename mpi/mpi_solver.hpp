#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "domains.hpp"
#include "constraints.hpp"
#include "solver_base.hpp"
#include "../sequential/sequential_solver.hpp"
#include <optional>
#include <vector>


///////////////////////////
///       SOLVER        ///
///////////////////////////
/**
 * @brief MPI solver splitting the root candidates across ranks.
 *
 * Rank r searches the root-variable candidates i with i % size == r using
 * the sequential engine and its own iteration budget. A rank that completes
 * an assignment tells every other rank, which stop at their next poll. The
 * lowest rank holding a complete assignment sends it to rank 0.
 */
class MPISearchSolver {
public:
    /**
     * @brief Construct an MPI solver.
     *
     * @param config       Per-rank iteration budget and progress reporting.
     * @param pollInterval Steps between checks for other ranks' success.
     * @throws std::invalid_argument on a bad configuration or poll interval.
     */
    explicit MPISearchSolver(SolverConfig config, long pollInterval = 64);

    /**
     * @brief Solve the problem cooperatively across all MPI ranks.
     *
     * Must be called on every rank with the same problem. Rank 0 returns the
     * combined result: SOLVED if any rank solved, else BUDGET_EXCEEDED if any
     * rank ran out of budget, else EXHAUSTED. Without a solution the
     * assignment is the largest partial over all ranks (lowest rank on
     * ties). Iterations are summed over ranks. Other ranks return
     * std::nullopt.
     */
    std::optional<SearchResult> solve(const CspProblem& problem);

    /**
     * @brief Serialize an assignment into a flat integer buffer.
     *
     * Encodes (variable, room, timeslot, instructor) for each assigned
     * variable in assignment order.
     */
    static void serializeAssignment(const Assignment& assignment, std::vector<int>& buffer);

    /**
     * @brief Rebuild an assignment from a buffer made by serializeAssignment().
     */
    static Assignment deserializeAssignment(const CspProblem& problem, const std::vector<int>& buffer);

private:
    /// Budget and progress settings supplied by the caller.
    SolverConfig config_;

    /// Number of steps between polls for a success message.
    long pollInterval_;
};
