// File: src/core/cluster/partition.cpp
#include "qs/core/cluster/partition.hpp"

#include <utility>

namespace qs {

DeclusterResult partition_states(std::vector<ClassificationState> states) {
  DeclusterResult out;
  for (std::size_t i = 0; i < states.size(); ++i) {
    if (states[i].dependent()) {
      out.dependent.push_back(i);
    } else {
      out.independent.push_back(i);
    }
  }
  out.states = std::move(states);
  return out;
}

}  // namespace qs
