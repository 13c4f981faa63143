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
#include <mutex>
#include <atomic>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Multithreaded backtracking solver with first-success-wins.
 *
 * The candidates of the root variable are dealt round-robin to the workers,
 * so each worker explores a disjoint part of the search tree. Every worker
 * runs the sequential engine with its own assignment and its own iteration
 * budget. The first worker to complete an assignment publishes it and raises
 * a shared flag that stops all other workers at their next step.
 */
class ThreadedBacktrackingSolver : public ISolver {
public:
    /**
     * @brief Create a threaded backtracking solver.
     *
     * @param config     Per-worker iteration budget and progress reporting.
     *                   onProgress is called from several threads at once.
     * @param numThreads Number of worker threads (at least 1).
     * @throws std::invalid_argument on a bad configuration or thread count.
     */
    ThreadedBacktrackingSolver(SolverConfig config, int numThreads);

    /**
     * @brief Solve the given problem.
     *
     * If no worker succeeds, the status is BUDGET_EXCEEDED when any worker
     * ran out of budget and EXHAUSTED otherwise; the partial assignment is
     * the largest one among the workers. Iterations are summed over workers.
     *
     * config.maxIterations bounds each worker separately, so every worker
     * stops within that many steps and the summed count is at most
     * min(numThreads, root candidates) * maxIterations.
     */
    SearchResult solve(const CspProblem& problem) override;

    /**
     * @brief Split root-candidate indices round-robin into numParts lists.
     */
    static std::vector<std::vector<int>> partitionRootCandidates(size_t candidateCount, int numParts);

    /// Per-worker budget and progress settings.
    const SolverConfig& config() const { return engine_.config(); }

private:
    SequentialBacktrackingSolver engine_; ///< Search engine shared read-only by workers.
    int numThreads_;     ///< Number of worker threads.

    std::mutex winnerMutex_; ///< Guards winner_.
    std::atomic<bool> found_{false}; ///< Signals early termination to all workers.
    std::optional<SearchResult> winner_; ///< First complete result published.

    /**
     * @brief Body of one worker: search its share and publish a success.
     */
    SearchResult runWorker(const CspProblem& problem, const std::vector<int>& rootCandidates);
};
