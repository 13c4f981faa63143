///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "mpi_solver.hpp"
#include <mpi.h>
#include <atomic>
#include <limits>
#include <stdexcept>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Construct the MPI solver.
 *
 * @param config       Budget applied on every rank separately.
 * @param pollInterval Steps between non-blocking checks for success messages.
 */
MPISearchSolver::MPISearchSolver(SolverConfig config, long pollInterval)
        : config_(std::move(config)),
          pollInterval_(pollInterval) {
    validateConfig(config_);
    if (pollInterval_ <= 0) {
        throw std::invalid_argument("pollInterval must be positive");
    }
}

/**
 * @brief Serialize an assignment into a flat integer buffer.
 *
 * Encodes each assigned variable as four consecutive integers:
 * (variable, room, timeslot, instructor), suitable for MPI send/recv.
 */
void MPISearchSolver::serializeAssignment(const Assignment& assignment, std::vector<int>& buffer) {
    buffer.clear();
    buffer.reserve(4 * assignment.size());
    for (int var : assignment.assignedVariables()) {
        const DomainValue& v = assignment.valueOf(var);
        buffer.push_back(var);
        buffer.push_back(v.room);
        buffer.push_back(v.timeslot);
        buffer.push_back(v.instructor);
    }
}

/**
 * @brief Deserialize a flat integer buffer into an assignment.
 *
 * Replays the assignments in the order they were serialized, assuming
 * groups of four ints per variable.
 */
Assignment MPISearchSolver::deserializeAssignment(const CspProblem& problem, const std::vector<int>& buffer) {
    Assignment assignment(problem);
    size_t count = buffer.size() / 4;
    for (size_t i = 0; i < count; ++i) {
        DomainValue v{buffer[4 * i + 1], buffer[4 * i + 2], buffer[4 * i + 3]};
        assignment.assign(buffer[4 * i + 0], v);
    }
    return assignment;
}

/**
 * @brief Solve with disjoint root-candidate shares on every rank.
 *
 * Each rank searches its share until it succeeds, fails, runs out of budget
 * or hears that another rank succeeded. Success notifications are counted
 * so every message sent is also received before the collective phase ends.
 * Statuses and iteration counts are then combined with MPI_Allreduce and
 * the lowest successful rank ships its assignment to rank 0. Without a
 * success, the rank holding the largest partial assignment ships it.
 */
std::optional<SearchResult> MPISearchSolver::solve(const CspProblem& problem) {
    int rank, size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    const int TAG_FOUND = 400;
    const int TAG_META = 401;
    const int TAG_DATA = 402;

    // This rank's stripe of the root variable's candidates.
    std::vector<int> share;
    int root = SequentialBacktrackingSolver::rootVariable(problem);
    if (root >= 0) {
        int candidateCount = (int)problem.domains[root].size();
        for (int i = rank; i < candidateCount; i += size) {
            share.push_back(i);
        }
    }

    std::atomic<bool> stop{false};
    int foundReceived = 0;

    // Drain any success notifications that have arrived so far.
    auto pollForSuccess = [&]() {
        int flag = 0;
        MPI_Status status;
        MPI_Iprobe(MPI_ANY_SOURCE, TAG_FOUND, MPI_COMM_WORLD, &flag, &status);
        while (flag) {
            int from = -1;
            MPI_Recv(&from, 1, MPI_INT, status.MPI_SOURCE, TAG_FOUND, MPI_COMM_WORLD, MPI_STATUS_IGNORE);
            ++foundReceived;
            stop = true;
            MPI_Iprobe(MPI_ANY_SOURCE, TAG_FOUND, MPI_COMM_WORLD, &flag, &status);
        }
    };

    // The engine calls back every step; poll every pollInterval_ steps and
    // forward the caller's own progress hook at its own interval.
    SolverConfig local;
    local.maxIterations = config_.maxIterations;
    local.progressInterval = 1;
    local.onProgress = [&](long iterations, size_t assigned, size_t total) {
        if (iterations % pollInterval_ == 0) {
            pollForSuccess();
        }
        if (config_.onProgress && config_.progressInterval > 0 && iterations % config_.progressInterval == 0) {
            config_.onProgress(iterations, assigned, total);
        }
    };

    SequentialBacktrackingSolver engine(local);
    SearchResult localResult = engine.solveSubtree(problem, share, &stop);

    // Tell every other rank to stop.
    int self = rank;
    std::vector<MPI_Request> requests;
    requests.reserve(size);
    if (localResult.solved()) {
        for (int r = 0; r < size; ++r) {
            if (r == rank) continue;
            requests.emplace_back();
            MPI_Isend(&self, 1, MPI_INT, r, TAG_FOUND, MPI_COMM_WORLD, &requests.back());
        }
    }

    // Receive every notification addressed to this rank.
    int solvedHere = localResult.solved() ? 1 : 0;
    int solvedTotal = 0;
    MPI_Allreduce(&solvedHere, &solvedTotal, 1, MPI_INT, MPI_SUM, MPI_COMM_WORLD);
    while (foundReceived < solvedTotal - solvedHere) {
        int from = -1;
        MPI_Recv(&from, 1, MPI_INT, MPI_ANY_SOURCE, TAG_FOUND, MPI_COMM_WORLD, MPI_STATUS_IGNORE);
        ++foundReceived;
    }
    if (!requests.empty()) {
        MPI_Waitall((int)requests.size(), requests.data(), MPI_STATUSES_IGNORE);
    }

    // Combined status: 2 = solved somewhere, 1 = some rank hit its budget.
    int localCode = 0;
    if (localResult.status == SearchStatus::SOLVED) localCode = 2;
    else if (localResult.status == SearchStatus::BUDGET_EXCEEDED) localCode = 1;
    int globalCode = 0;
    MPI_Allreduce(&localCode, &globalCode, 1, MPI_INT, MPI_MAX, MPI_COMM_WORLD);

    long localIterations = localResult.iterations;
    long totalIterations = 0;
    MPI_Allreduce(&localIterations, &totalIterations, 1, MPI_LONG, MPI_SUM, MPI_COMM_WORLD);

    // Determine which rank holds the winning assignment.
    int candidateRank = localResult.solved() ? rank : std::numeric_limits<int>::max();
    int winnerRank = std::numeric_limits<int>::max();
    MPI_Allreduce(&candidateRank, &winnerRank, 1, MPI_INT, MPI_MIN, MPI_COMM_WORLD);

    // Without a winner, the rank with the largest partial assignment reports.
    struct DepthRank { int count; int rank; };
    DepthRank localDepth{(int)localResult.assignedCount(), rank};
    DepthRank deepest{0, 0};
    MPI_Allreduce(&localDepth, &deepest, 1, MPI_2INT, MPI_MAXLOC, MPI_COMM_WORLD);

    bool solved = winnerRank != std::numeric_limits<int>::max();
    int sourceRank = solved ? winnerRank : deepest.rank;

    // Source is some non-root rank: send its assignment to rank 0.
    if (rank == sourceRank && rank != 0) {
        std::vector<int> buf;
        serializeAssignment(localResult.assignment, buf);
        int len = (int)buf.size();

        MPI_Send(&len, 1, MPI_INT, 0, TAG_META, MPI_COMM_WORLD);
        if (len > 0) {
            MPI_Send(buf.data(), len, MPI_INT, 0, TAG_DATA, MPI_COMM_WORLD);
        }
    }

    if (rank != 0) {
        return std::nullopt;
    }

    SearchStatus status = SearchStatus::SOLVED;
    if (!solved) {
        status = globalCode == 1 ? SearchStatus::BUDGET_EXCEEDED : SearchStatus::EXHAUSTED;
    }
    if (sourceRank == 0) {
        return SearchResult{status, localResult.assignment, totalIterations};
    }

    int len = 0;
    MPI_Recv(&len, 1, MPI_INT, sourceRank, TAG_META, MPI_COMM_WORLD, MPI_STATUS_IGNORE);
    std::vector<int> buf(len);
    if (len > 0) {
        MPI_Recv(buf.data(), len, MPI_INT, sourceRank, TAG_DATA, MPI_COMM_WORLD, MPI_STATUS_IGNORE);
    }
    return SearchResult{status, deserializeAssignment(problem, buf), totalIterations};
}
