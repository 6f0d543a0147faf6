// validation.h
#pragma once
#include <string>
#include <vector>
#include <stdexcept>

#include "types.h"

namespace rp {

// ---- Input addresses ----
// Non-blank entries, and no more stops than the exact solver is allowed to take.
void validate_addresses(const std::vector<Address>& addresses,
                        const PlannerConfig& config);

// ---- Matrix sanity ----
// n > 0, storage n*n, no NaN, no negative distance, zero diagonal.
// kUnreachable (+inf) is allowed anywhere off the diagonal.
void validate_matrix(const DistanceMatrix& matrix);
void validate_matrix_address_alignment(const std::vector<Address>& addresses,
                                       const DistanceMatrix& matrix);

// Nodes without any usable outgoing or incoming edge. Any such node makes
// every closed tour infinite.
std::vector<int> find_isolated_nodes(const DistanceMatrix& matrix);

} // namespace rp
