// route_optimizer.h
#pragma once
#include <ostream>
#include <vector>
#include <nlohmann/json.hpp>

#include "types.h"
#include "distance_lookup.h"

namespace rp {

// Public entry point: matrix build + exact tour + mapping back to addresses.
// Nothing thrown below this class reaches the caller; every call returns a
// structured result.
class RoutePlanner {
public:
  RoutePlanner(DistanceLookup& lookup, PlannerConfig config = {});

  // addresses[0] is the fixed start. N <= 1 returns the input unchanged
  // without touching the lookup.
  OptimizationResult optimize_route(const std::vector<Address>& addresses);

  // Same pipeline from a prebuilt matrix (meters, aligned with addresses).
  OptimizationResult optimize_with_matrix(const std::vector<Address>& addresses,
                                          const DistanceMatrix& matrix) const;

private:
  DistanceLookup& lookup_;
  PlannerConfig cfg_;

  OptimizationResult solve_and_map(const std::vector<Address>& addresses,
                                   const DistanceMatrix& matrix) const;
};

// {"status": ..., "optimized_route": [...], "distance (in km)": ...}
// plus "message" when the result carries one.
nlohmann::json to_json(const OptimizationResult& r);

// The result document alone, indented, newline-terminated.
void write_result_json(const OptimizationResult& r, std::ostream& out);

} // namespace rp
