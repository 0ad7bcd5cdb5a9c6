// File: include/qs/core/cluster/partition.hpp
#pragma once

#include <vector>

#include "qs/core/types.hpp"

namespace qs {

// Splits frozen per-event states into independent/dependent index lists, both
// in input order. Takes ownership of the states.
DeclusterResult partition_states(std::vector<ClassificationState> states);

}  // namespace qs
