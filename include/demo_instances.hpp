#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <string>


///////////////////////////
///        DEMOS        ///
///////////////////////////
/**
 * @brief Sizes of the synthetic demo catalogs.
 */
enum class DemoSize { S, M, L };

/**
 * @brief Build a synthetic catalog as raw records.
 *
 * S is written out by hand and exercises every domain relaxation (an
 * uncovered course, a combined course, a section too large for any room).
 * M and L are generated deterministically.
 */
CatalogRecords makeDemoCatalog(DemoSize size);

/**
 * @brief Parse "S", "M" or "L" (case-insensitive).
 *
 * @throws std::invalid_argument for anything else.
 */
DemoSize parseDemoSize(const std::string& text);
