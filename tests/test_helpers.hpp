#pragma once

#include "model.hpp"
#include "constraints.hpp"

/**
 * @brief Records with one lecture course per section.
 *
 * Section Si (20 students) takes course Ci only. There are numRooms lecture
 * rooms (50 seats) and numSlots Sunday timeslots. With withInstructors,
 * instructor Ii is qualified for Ci only; otherwise nobody is qualified.
 */
CatalogRecords makeGridRecords(int numSections, int numRooms, int numSlots, bool withInstructors);

/**
 * @brief Check room, instructor and section clash freedom pair by pair.
 */
void expectNoClashes(const Assignment& assignment);
