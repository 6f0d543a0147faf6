// held_karp.h
#pragma once
#include <vector>

#include "types.h"

namespace rp {

// Tables are n * 2^n entries; refuse anything that would not fit in memory.
constexpr int kMaxExactNodes = 20;

// Minimum-cost closed tour over all nodes of M, starting and ending at start.
//
// cost[mask][last] is the cheapest path from start through exactly the nodes
// in mask, ending at last. Masks are filled in ascending order, so every
// subset is final before a superset reads it. Ties (equal cost) keep the
// lowest predecessor index and the lowest closing node, which makes the
// returned order deterministic.
//
// kUnreachable entries are forbidden edges; they propagate as +inf. When no
// finite tour exists the solution has feasible == false, cost == +inf and the
// identity order.
//
// Throws std::invalid_argument for an empty matrix, a bad start index or
// n > kMaxExactNodes.
TourSolution solve_tour(const DistanceMatrix& M, int start = 0);

// Closed cost of visiting order (order[0] -> ... -> order.back() -> order[0]).
double tour_cost(const DistanceMatrix& M, const std::vector<int>& order);

} // namespace rp
