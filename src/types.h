// types.h
#pragma once
#include <iostream>
#include <vector>
#include <string>
#include <limits>

namespace rp {

// Opaque address string. Index in the input list is the node index (0 = depot).
using Address = std::string;

// Marks a pair the lookup could not resolve. Forbidden edge for the solver.
constexpr double kUnreachable = std::numeric_limits<double>::infinity();

// Square, row-major matrix of travel distances in meters. 0 is the start node.
struct DistanceMatrix {
  int n = 0;
  // access with m[src * n + dst]
  std::vector<double> m;

  DistanceMatrix() = default;
  explicit DistanceMatrix(int size) : n(size), m(static_cast<size_t>(size) * size, 0.0) {}

  inline double at(int i, int j) const { return m[static_cast<size_t>(i) * n + j]; }
  inline void set(int i, int j, double v) { m[static_cast<size_t>(i) * n + j] = v; }
};

struct TourSolution {
  std::vector<int> order; // starts with the start node, return leg implicit
  double cost = 0.0;      // closed tour cost, same units as the matrix
  bool feasible = true;   // false when every closed tour uses a forbidden edge
};

enum class RouteStatus { Success, Error, Infeasible };

struct OptimizationResult {
  RouteStatus status = RouteStatus::Success;
  std::vector<Address> optimized_route;
  double distance_km = 0.0;
  std::string message; // empty on success
};

inline const char* to_string(RouteStatus s) {
  switch (s) {
    case RouteStatus::Success: return "success";
    case RouteStatus::Error: return "error";
    case RouteStatus::Infeasible: return "infeasible";
  }
  return "error";
}

struct PlannerConfig {
  int max_exact_stops = 16;   // Held-Karp is exponential; reject bigger inputs
  bool log_progress = false;
  std::ostream* log = &std::cout; // progress lines; errors always go to std::cerr
};

} // namespace rp
