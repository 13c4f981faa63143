#include "mpi_solver.hpp"
#include "demo_instances.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <mpi.h>
#include <stdexcept>

namespace {

int worldRank() {
    int rank = 0;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    return rank;
}

int worldSize() {
    int size = 1;
    MPI_Comm_size(MPI_COMM_WORLD, &size);
    return size;
}

std::optional<SearchResult> solveWith(const CspProblem& problem, long maxIterations, long pollInterval = 64) {
    SolverConfig config;
    config.maxIterations = maxIterations;
    MPISearchSolver solver(config, pollInterval);
    return solver.solve(problem);
}

// Iteration counts below are those of a single-rank run.

TEST(MPISolverTest, TwoRoomsShareOneSlotOnRankZero) {
    CspProblem problem = buildProblem(makeGridRecords(2, 2, 1, true));
    std::optional<SearchResult> result = solveWith(problem, 1000);
    if (worldRank() != 0) {
        EXPECT_FALSE(result.has_value());
        return;
    }

    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->solved());
    EXPECT_EQ(result->assignedCount(), 2u);
    EXPECT_EQ(result->assignment.valueOf(0).timeslot, result->assignment.valueOf(1).timeslot);
    EXPECT_NE(result->assignment.valueOf(0).room, result->assignment.valueOf(1).room);
    expectNoClashes(result->assignment);
    if (worldSize() == 1) EXPECT_EQ(result->iterations, 3);
}

TEST(MPISolverTest, TwoClassesOneRoomOneSlotIsExhausted) {
    CspProblem problem = buildProblem(makeGridRecords(2, 1, 1, true));
    std::optional<SearchResult> result = solveWith(problem, 1000);
    if (worldRank() != 0) return;

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, SearchStatus::EXHAUSTED);
    EXPECT_EQ(result->assignedCount(), 1u);
    if (worldSize() == 1) EXPECT_EQ(result->iterations, 2);
}

TEST(MPISolverTest, ExhaustedSearchReportsDeepestPartialOfAnyRank) {
    // Six classes, five slots of one room: five placements at most.
    CspProblem problem = buildProblem(makeGridRecords(6, 1, 5, true));
    std::optional<SearchResult> result = solveWith(problem, 100000);
    if (worldRank() != 0) return;

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, SearchStatus::EXHAUSTED);
    EXPECT_EQ(result->assignedCount(), 5u);
    expectNoClashes(result->assignment);
}

TEST(MPISolverTest, StopsAtBudgetWithPartialAssignment) {
    CspProblem problem = buildProblem(makeGridRecords(8, 1, 7, true));
    std::optional<SearchResult> result = solveWith(problem, 50, 1);
    if (worldRank() != 0) return;

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, SearchStatus::BUDGET_EXCEEDED);
    EXPECT_GT(result->assignedCount(), 0u);
    expectNoClashes(result->assignment);
    if (worldSize() == 1) EXPECT_EQ(result->iterations, 50);
}

TEST(MPISolverTest, SolvesSmallDemo) {
    CspProblem problem = buildProblem(makeDemoCatalog(DemoSize::S));
    std::optional<SearchResult> result = solveWith(problem, kDefaultMaxIterations, 1);
    if (worldRank() != 0) return;

    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->solved());
    EXPECT_TRUE(result->assignment.isComplete());
    expectNoClashes(result->assignment);
}

TEST(MPISolverTest, ForwardsProgressAtCallerInterval) {
    CspProblem problem = buildProblem(makeGridRecords(2, 2, 1, true));
    long calls = 0;

    SolverConfig config;
    config.progressInterval = 1;
    config.onProgress = [&calls](long, size_t, size_t) { ++calls; };
    MPISearchSolver solver(config, 1);
    std::optional<SearchResult> result = solver.solve(problem);

    if (worldSize() == 1) {
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(calls, result->iterations);
    }
}

TEST(MPISolverTest, AssignmentBufferKeepsOrderAndValues) {
    CspProblem problem = buildProblem(makeGridRecords(3, 2, 2, false));
    Assignment original(problem);
    original.assign(2, {1, 0, kPlaceholderInstructor});
    original.assign(0, {0, 1, kPlaceholderInstructor});

    std::vector<int> buffer;
    MPISearchSolver::serializeAssignment(original, buffer);
    EXPECT_EQ(buffer, (std::vector<int>{2, 1, 0, kPlaceholderInstructor, 0, 0, 1, kPlaceholderInstructor}));

    Assignment restored = MPISearchSolver::deserializeAssignment(problem, buffer);
    EXPECT_EQ(restored.assignedVariables(), (std::vector<int>{2, 0}));
    EXPECT_EQ(restored.valueOf(2), (DomainValue{1, 0, kPlaceholderInstructor}));
    EXPECT_EQ(restored.valueOf(0), (DomainValue{0, 1, kPlaceholderInstructor}));
    EXPECT_FALSE(restored.isAssigned(1));

    MPISearchSolver::serializeAssignment(Assignment(problem), buffer);
    EXPECT_TRUE(buffer.empty());
}

TEST(MPISolverTest, RejectsInvalidSettings) {
    EXPECT_THROW(MPISearchSolver(SolverConfig(), 0), std::invalid_argument);

    SolverConfig zero;
    zero.maxIterations = 0;
    EXPECT_THROW(MPISearchSolver{zero}, std::invalid_argument);
}

}  // namespace

int main(int argc, char** argv) {
    MPI_Init(&argc, &argv);
    ::testing::InitGoogleTest(&argc, argv);
    int rc = RUN_ALL_TESTS();
    MPI_Finalize();
    return rc;
}
