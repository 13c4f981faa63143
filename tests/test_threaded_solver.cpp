#include "threaded_solver.hpp"
#include "demo_instances.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

namespace {

SolverConfig budget(long maxIterations) {
    SolverConfig config;
    config.maxIterations = maxIterations;
    return config;
}

TEST(ThreadedSolverTest, PartitionsRootCandidatesRoundRobin) {
    std::vector<std::vector<int>> parts = ThreadedBacktrackingSolver::partitionRootCandidates(5, 2);
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], (std::vector<int>{0, 2, 4}));
    EXPECT_EQ(parts[1], (std::vector<int>{1, 3}));

    parts = ThreadedBacktrackingSolver::partitionRootCandidates(2, 4);
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_TRUE(parts[3].empty());
}

TEST(ThreadedSolverTest, SolvesSmallDemoWithoutClashes) {
    CspProblem problem = buildProblem(makeDemoCatalog(DemoSize::S));
    ThreadedBacktrackingSolver solver(budget(kDefaultMaxIterations), 4);
    SearchResult result = solver.solve(problem);

    ASSERT_TRUE(result.solved());
    EXPECT_TRUE(result.assignment.isComplete());
    expectNoClashes(result.assignment);
    EXPECT_GT(result.iterations, 0);
}

TEST(ThreadedSolverTest, SolverCanBeReused) {
    CspProblem problem = buildProblem(makeGridRecords(3, 2, 2, true));
    ThreadedBacktrackingSolver solver(budget(100), 2);

    EXPECT_TRUE(solver.solve(problem).solved());
    SearchResult again = solver.solve(problem);
    ASSERT_TRUE(again.solved());
    expectNoClashes(again.assignment);
}

TEST(ThreadedSolverTest, ReportsExhaustionWhenNoWorkerSucceeds) {
    CspProblem problem = buildProblem(makeGridRecords(2, 1, 1, true));
    ThreadedBacktrackingSolver solver(budget(1000), 2);
    SearchResult result = solver.solve(problem);

    EXPECT_EQ(result.status, SearchStatus::EXHAUSTED);
    EXPECT_EQ(result.assignedCount(), 1u);
    EXPECT_EQ(result.iterations, 2);
}

TEST(ThreadedSolverTest, EachWorkerHasItsOwnBudget) {
    CspProblem problem = buildProblem(makeGridRecords(8, 1, 7, true));
    ThreadedBacktrackingSolver solver(budget(50), 3);
    SearchResult result = solver.solve(problem);

    // Seven root candidates over three workers: every worker stops at 50.
    EXPECT_EQ(result.status, SearchStatus::BUDGET_EXCEEDED);
    EXPECT_EQ(result.iterations, 150);
    EXPECT_LE(result.iterations, 3 * solver.config().maxIterations);
    expectNoClashes(result.assignment);
}

TEST(ThreadedSolverTest, EmptyProblemIsSolved) {
    CspProblem problem = buildProblem(makeGridRecords(0, 0, 0, false));
    ThreadedBacktrackingSolver solver(budget(10), 2);
    EXPECT_TRUE(solver.solve(problem).solved());
}

TEST(ThreadedSolverTest, RejectsInvalidThreadCount) {
    EXPECT_THROW(ThreadedBacktrackingSolver(SolverConfig(), 0), std::invalid_argument);
    EXPECT_THROW(ThreadedBacktrackingSolver(budget(0), 2), std::invalid_argument);
}

}  // namespace
