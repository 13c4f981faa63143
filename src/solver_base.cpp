///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "solver_base.hpp"
#include <stdexcept>


///////////////////////////
///        TYPES        ///
///////////////////////////
std::string toString(SearchStatus status) {
    switch (status) {
        case SearchStatus::SEARCHING:       return "Searching";
        case SearchStatus::SOLVED:          return "Solved";
        case SearchStatus::EXHAUSTED:       return "Exhausted";
        case SearchStatus::BUDGET_EXCEEDED: return "BudgetExceeded";
        case SearchStatus::CANCELLED:       return "Cancelled";
    }
    return "Unknown";
}

void validateConfig(const SolverConfig& config) {
    if (config.maxIterations <= 0) {
        throw std::invalid_argument("maxIterations must be positive, got " + std::to_string(config.maxIterations));
    }
    if (config.progressInterval < 0) {
        throw std::invalid_argument("progressInterval must not be negative");
    }
}
