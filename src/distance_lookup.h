// distance_lookup.h
#pragma once
#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>
#include <nlohmann/json.hpp>

#include "types.h"

namespace rp {

// Per-pair outcome, mirrors the element status of the Distance Matrix API.
enum class ElementStatus { Ok, NotFound, ZeroResults, MaxRouteLengthExceeded, Unknown };

ElementStatus parse_element_status(const std::string& s);

struct PairDistance {
  ElementStatus status = ElementStatus::Unknown;
  double meters = 0.0; // only meaningful when status == Ok
};

// Answer of one (possibly chunked) lookup. A failed batch carries no rows:
// "the lookup subsystem is down" is kept apart from "no route for this pair".
struct LookupBatch {
  bool ok = false;
  std::string error;                           // set when !ok
  std::vector<std::vector<PairDistance>> rows; // [origin][destination]

  static LookupBatch failure(std::string why) {
    LookupBatch b;
    b.ok = false;
    b.error = std::move(why);
    return b;
  }
};

// Pairwise travel distance source used to build the matrix.
class DistanceLookup {
public:
  virtual ~DistanceLookup() = default;

  virtual LookupBatch lookup(const std::vector<Address>& origins,
                             const std::vector<Address>& destinations) = 0;
};

// Decodes a Distance Matrix API document:
// {"status": "OK", "rows": [{"elements": [{"status": "OK", "distance": {"value": 1234}}]}]}
// Top-level status other than OK, or a shape that does not match the request,
// is reported as a failed batch.
LookupBatch parse_distance_matrix_response(const nlohmann::json& doc,
                                           size_t n_origins,
                                           size_t n_destinations);

// Serves a precomputed matrix. Used for offline runs and tests.
class StaticDistanceLookup : public DistanceLookup {
public:
  StaticDistanceLookup(std::vector<Address> addresses, DistanceMatrix matrix);

  // {"addresses": [...], "distances": [[...], ...]}; null entries are "no route".
  static StaticDistanceLookup from_json(const nlohmann::json& j);

  // Makes lookups for this ordered pair report NOT_FOUND.
  void fail_pair(const Address& from, const Address& to);
  // Makes every following lookup fail at the batch level.
  void fail_batch(std::string why) { batch_error_ = std::move(why); }

  LookupBatch lookup(const std::vector<Address>& origins,
                     const std::vector<Address>& destinations) override;

  int calls() const { return calls_; }

private:
  std::vector<Address> addresses_;
  DistanceMatrix matrix_;
  std::unordered_map<Address, int> index_;
  std::unordered_set<std::string> failed_pairs_;
  std::string batch_error_;
  int calls_ = 0;

  static std::string pair_key(const Address& a, const Address& b) { return a + "\x1f" + b; }
};

} // namespace rp
