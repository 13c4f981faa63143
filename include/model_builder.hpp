#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "errors.hpp"
#include <string>
#include <vector>


///////////////////////////
///    MODEL BUILDER    ///
///////////////////////////
/**
 * @brief Normalize raw catalog records into typed lookup tables.
 *
 * Courses are built first so instructor qualifications and section course
 * lists can be resolved against them. Every text field is trimmed.
 *
 * @throws ConstructionError on an empty or duplicate id, an unparseable
 *         numeric/day/time field, or a reference to an unknown course.
 */
Catalog buildCatalog(const CatalogRecords& records);

/**
 * @brief Split a delimited id list ("A, B;C") into trimmed, non-empty ids.
 */
std::vector<std::string> splitIdList(const std::string& text);
