///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "threaded_solver.hpp"
#include "domains.hpp"
#include "projection.hpp"
#include "formatting.hpp"
#include "demo_instances.hpp"
#include <iostream>
#include <chrono>
#include <string>


///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Demo entry point for the threaded timetabling solver.
 *
 * Usage: threaded_timetabling [S|M|L] [max_iterations] [threads]
 *
 * Builds a demo catalog, runs the multithreaded solver, measures its
 * runtime, and prints the resulting schedule (if one is found).
 */
int main(int argc, char** argv) {
    try {
        DemoSize size = argc > 1 ? parseDemoSize(argv[1]) : DemoSize::M;

        // Configure the threaded solver:
        //  - maxIterations -> budget of every worker,
        //  - numThreads    -> workers sharing the root variable's candidates.
        SolverConfig config;
        config.maxIterations = argc > 2 ? std::stol(argv[2]) : 10000;
        config.progressInterval = 0;
        int numThreads = argc > 3 ? std::stoi(argv[3]) : 4;
        ThreadedBacktrackingSolver solver(config, numThreads);

        CspProblem problem = buildProblem(makeDemoCatalog(size));
        printBanner("THREADED TIMETABLING SOLVER");
        printProblemSummary(problem);
        std::cout << "Threads: " << numThreads << "\n";

        // Measure wall-clock time for the threaded solver.
        auto start = std::chrono::high_resolution_clock::now();
        SearchResult result = solver.solve(problem);
        auto end = std::chrono::high_resolution_clock::now();
        double ms = std::chrono::duration<double, std::milli>(end - start).count();

        printSearchSummary(result, ms);

        if (!result.solved()) {
            std::cout << "No valid timetable found (threaded).\n";
        } else {
            std::cout << "Valid timetable found (threaded).\n\n";
            std::vector<ScheduleRecord> schedule = projectSchedule(result.assignment);
            printSectionSchedules(schedule);
            printStatistics(summarizeSchedule(schedule));
        }

        std::cout << "========================================\n";
        return result.solved() ? 0 : 2;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
