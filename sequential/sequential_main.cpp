///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "sequential_solver.hpp"
#include "model_builder.hpp"
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
 * @brief Demo entry point for the sequential timetabling solver.
 *
 * Usage: sequential_timetabling [S|M|L] [max_iterations]
 *
 * Builds a demo catalog, prints its diagnostics, runs the single-threaded
 * backtracking solver with progress output, measures its runtime, and prints
 * the resulting (possibly partial) schedule with statistics.
 */
int main(int argc, char** argv) {
    try {
        // Select demo catalog size and iteration budget.
        DemoSize size = argc > 1 ? parseDemoSize(argv[1]) : DemoSize::S;
        SolverConfig config;
        config.maxIterations = argc > 2 ? std::stol(argv[2]) : kDefaultMaxIterations;
        config.progressInterval = 100;
        config.onProgress = [](long iterations, size_t assigned, size_t total) {
            std::cout << "  Iteration " << iterations << ": " << assigned << "/" << total << " assigned\n";
        };

        // Catalog -> variables and domains; fails fast on bad records.
        Catalog catalog = buildCatalog(makeDemoCatalog(size));
        printBanner("CATALOG DIAGNOSTICS");
        printCatalogDiagnostics(catalog);

        CspProblem problem = buildProblem(std::move(catalog));
        printBanner("SEQUENTIAL TIMETABLING SOLVER");
        printProblemSummary(problem);
        std::cout << "Max iterations: " << config.maxIterations << "\n";

        SequentialBacktrackingSolver solver(config);

        // Measure wall-clock time of the sequential search.
        auto start = std::chrono::high_resolution_clock::now();
        SearchResult result = solver.solve(problem);
        auto end = std::chrono::high_resolution_clock::now();
        double ms = std::chrono::duration<double, std::milli>(end - start).count();

        printSearchSummary(result, ms);

        std::vector<ScheduleRecord> schedule = projectSchedule(result.assignment);
        if (result.solved()) {
            std::cout << "Valid timetable found (sequential).\n\n";
        } else {
            std::cout << "No complete timetable found (sequential); partial assignment follows.\n"
                      << "Increase max_iterations or add rooms, timeslots or instructors.\n\n";
        }
        printSectionSchedules(schedule);
        printBanner("SCHEDULE STATISTICS");
        printStatistics(summarizeSchedule(schedule));
        std::cout << "========================================\n";
        return result.solved() ? 0 : 2;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
