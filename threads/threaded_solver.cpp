///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "threaded_solver.hpp"
#include <algorithm>
#include <future>
#include <stdexcept>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Construct the threaded solver; each worker gets config's budget.
 */
ThreadedBacktrackingSolver::ThreadedBacktrackingSolver(SolverConfig config, int numThreads)
        : engine_(std::move(config)),
          numThreads_(numThreads) {
    if (numThreads_ < 1) {
        throw std::invalid_argument("numThreads must be at least 1");
    }
}

std::vector<std::vector<int>> ThreadedBacktrackingSolver::partitionRootCandidates(size_t candidateCount,
                                                                                  int numParts) {
    std::vector<std::vector<int>> parts(numParts);
    for (size_t i = 0; i < candidateCount; ++i) {
        parts[i % numParts].push_back((int)i);
    }
    return parts;
}

/**
 * @brief Entry point for solving a problem.
 *
 * Resets shared state, launches one async task per non-empty share of root
 * candidates and combines their results once all have stopped. Each task
 * carries the full per-worker budget; the reported iterations are the sum.
 */
SearchResult ThreadedBacktrackingSolver::solve(const CspProblem& problem) {
    found_ = false;
    winner_.reset();

    int root = SequentialBacktrackingSolver::rootVariable(problem);
    if (root < 0) {
        // Nothing to split; the sequential engine handles the empty problem.
        return engine_.solve(problem);
    }

    size_t candidateCount = problem.domains[root].size();
    int workers = std::min<int>(numThreads_, (int)candidateCount);
    std::vector<std::vector<int>> shares = partitionRootCandidates(candidateCount, workers);

    std::vector<std::future<SearchResult>> tasks;
    tasks.reserve(workers);
    for (int w = 0; w < workers; ++w) {
        const std::vector<int>& share = shares[w];
        tasks.push_back(std::async(std::launch::async,
                                   [this, &problem, &share]() {
                                       return this->runWorker(problem, share);
                                   }));
    }

    // Collect every worker before returning; get() rethrows worker exceptions.
    std::vector<SearchResult> results;
    results.reserve(workers);
    for (auto& t : tasks) results.push_back(t.get());

    long totalIterations = 0;
    for (const SearchResult& r : results) totalIterations += r.iterations;

    if (winner_) {
        SearchResult result = *winner_;
        result.iterations = totalIterations;
        return result;
    }

    bool budgetHit = false;
    const SearchResult* largest = &results.front();
    for (const SearchResult& r : results) {
        if (r.status == SearchStatus::BUDGET_EXCEEDED) budgetHit = true;
        if (r.assignedCount() > largest->assignedCount()) largest = &r;
    }
    return SearchResult{budgetHit ? SearchStatus::BUDGET_EXCEEDED : SearchStatus::EXHAUSTED,
                        largest->assignment, totalIterations};
}

/**
 * @brief Search one share of the root candidates.
 *
 * The first worker to finish with a complete assignment becomes the winner
 * and raises found_; later successes are discarded.
 */
SearchResult ThreadedBacktrackingSolver::runWorker(const CspProblem& problem, const std::vector<int>& rootCandidates) {
    SearchResult result = engine_.solveSubtree(problem, rootCandidates, &found_);
    if (result.solved()) {
        std::lock_guard<std::mutex> lock(winnerMutex_);
        if (!winner_) {
            winner_ = result;
            found_ = true;
        }
    }
    return result;
}
