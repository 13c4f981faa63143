#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "domains.hpp"
#include "solver_base.hpp"
#include "projection.hpp"
#include <string>


///////////////////////////
///       HELPERS       ///
///////////////////////////
void printBanner(const std::string& title);
void printProblemSummary(const CspProblem& problem);
void printCatalogDiagnostics(const Catalog& cat);
void printSearchSummary(const SearchResult& result, double elapsedMs);
void printSectionSchedules(const std::vector<ScheduleRecord>& records);
void printStatistics(const ScheduleStatistics& stats);
