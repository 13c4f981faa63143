///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "sequential_solver.hpp"
#include <algorithm>
#include <numeric>


///////////////////////////
///    SEARCH STATE     ///
///////////////////////////
SearchContext::SearchContext(const CspProblem& problem, long maxIterations, const std::atomic<bool>* cancel)
        : assignment(problem),
          best(problem),
          maxIterations(maxIterations),
          cancel(cancel) {}

ScopedAssignment::ScopedAssignment(Assignment& assignment, int var, const DomainValue& value)
        : assignment_(assignment),
          var_(var) {
    assignment_.assign(var, value);
}

ScopedAssignment::~ScopedAssignment() {
    if (!committed_) {
        assignment_.unassign(var_);
    }
}


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Construct a sequential backtracking solver with an iteration budget.
 */
SequentialBacktrackingSolver::SequentialBacktrackingSolver(SolverConfig config)
        : config_(std::move(config)) {
    validateConfig(config_);
}

SearchResult SequentialBacktrackingSolver::solve(const CspProblem& problem) {
    return run(problem, nullptr, nullptr);
}

SearchResult SequentialBacktrackingSolver::solveSubtree(const CspProblem& problem,
                                                        const std::vector<int>& rootCandidates,
                                                        const std::atomic<bool>* cancel) const {
    return run(problem, &rootCandidates, cancel);
}

/**
 * @brief Order variables by domain size, smallest first.
 *
 * Domain sizes never change during search, so this static order is exactly
 * what picking the smallest unassigned domain at every step produces.
 * stable_sort keeps construction order among equal sizes.
 */
std::vector<int> SequentialBacktrackingSolver::mrvOrder(const CspProblem& problem) {
    std::vector<int> order(problem.variables.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&problem](int a, int b) {
                         return problem.domains[a].size() < problem.domains[b].size();
                     });
    return order;
}

int SequentialBacktrackingSolver::rootVariable(const CspProblem& problem) {
    std::vector<int> order = mrvOrder(problem);
    return order.empty() ? -1 : order.front();
}

int SequentialBacktrackingSolver::selectUnassigned(const Assignment& assignment, const std::vector<int>& order) {
    for (int var : order) {
        if (!assignment.isAssigned(var)) return var;
    }
    return -1;
}

/**
 * @brief Set up a fresh search context and run the search to a terminal state.
 */
SearchResult SequentialBacktrackingSolver::run(const CspProblem& problem, const std::vector<int>* rootCandidates,
                                               const std::atomic<bool>* cancel) const {
    SearchContext ctx(problem, config_.maxIterations, cancel);
    std::vector<int> order = mrvOrder(problem);

    bool solved = backtrack(ctx, order, rootCandidates);

    if (solved) {
        return SearchResult{SearchStatus::SOLVED, ctx.assignment, ctx.iterations};
    }
    if (ctx.status == SearchStatus::SEARCHING) {
        ctx.status = SearchStatus::EXHAUSTED;
    }
    return SearchResult{ctx.status, ctx.best, ctx.iterations};
}

/**
 * @brief One step of the depth-first search.
 *
 * Counts the step, stops on cancellation or budget, detects completion,
 * then tries the candidates of the next MRV variable in domain order.
 */
bool SequentialBacktrackingSolver::backtrack(SearchContext& ctx, const std::vector<int>& order,
                                             const std::vector<int>* candidates) const {
    ++ctx.iterations;

    if (config_.onProgress && config_.progressInterval > 0 && ctx.iterations % config_.progressInterval == 0) {
        config_.onProgress(ctx.iterations, ctx.assignment.size(), order.size());
    }

    if (ctx.cancel && ctx.cancel->load()) {
        ctx.status = SearchStatus::CANCELLED;
        return false;
    }

    // Budget reached: keep what is assigned right now and unwind.
    if (ctx.iterations >= ctx.maxIterations) {
        ctx.status = SearchStatus::BUDGET_EXCEEDED;
        ctx.best = ctx.assignment;
        return false;
    }

    if (ctx.assignment.isComplete()) {
        ctx.status = SearchStatus::SOLVED;
        return true;
    }

    int var = selectUnassigned(ctx.assignment, order);
    const std::vector<DomainValue>& domain = ctx.assignment.problem().domains[var];

    if (candidates) {
        for (int idx : *candidates) {
            if (idx < 0 || idx >= (int)domain.size()) continue;
            if (tryCandidate(ctx, order, var, domain[idx])) return true;
            if (ctx.status != SearchStatus::SEARCHING) return false;
        }
    } else {
        for (const DomainValue& value : domain) {
            if (tryCandidate(ctx, order, var, value)) return true;
            if (ctx.status != SearchStatus::SEARCHING) return false;
        }
    }

    // No candidate works below this point: plain chronological backtrack.
    return false;
}

bool SequentialBacktrackingSolver::tryCandidate(SearchContext& ctx, const std::vector<int>& order, int var,
                                                const DomainValue& value) const {
    if (!ctx.assignment.isConsistent(var, value)) return false;

    ScopedAssignment scoped(ctx.assignment, var, value);
    if (ctx.assignment.size() > ctx.best.size()) {
        ctx.best = ctx.assignment;
    }

    if (backtrack(ctx, order, nullptr)) {
        scoped.commit();
        return true;
    }
    return false;
}
