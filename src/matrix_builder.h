// matrix_builder.h
#pragma once
#include <stdexcept>
#include <string>
#include <vector>

#include "types.h"
#include "distance_lookup.h"

namespace rp {

// The lookup subsystem failed as a whole (network, auth, malformed reply).
class LookupError : public std::runtime_error {
public:
  explicit LookupError(const std::string& what) : std::runtime_error(what) {}
};

struct MatrixBuildStats {
  int lookups = 0;          // lookup calls made (0 or 1)
  int unreachable_pairs = 0; // off-diagonal pairs stored as kUnreachable
};

// One batched lookup (origins == destinations == addresses). Pairs the
// lookup cannot resolve become kUnreachable; a failed batch throws LookupError.
DistanceMatrix build_distance_matrix(const std::vector<Address>& addresses,
                                     DistanceLookup& lookup,
                                     MatrixBuildStats* stats = nullptr);

} // namespace rp
