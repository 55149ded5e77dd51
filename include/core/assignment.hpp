#pragma once

#include <limits>
#include <vector>

namespace pcc {

using CostMatrix = std::vector<std::vector<double>>;

// Marks a pair that must never be matched
constexpr double kInfeasible = std::numeric_limits<double>::infinity();

// Optimal minimum-cost assignment for a rectangular matrix (Hungarian method with potentials).
// Returns, for each row, the assigned column or -1. As many feasible pairs as possible are matched,
// then total cost is minimized. Rows whose only option is infeasible come back as -1.
std::vector<int> SolveAssignment(const CostMatrix& cost);

} // namespace pcc
