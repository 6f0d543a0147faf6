// google_distance_client.h
#pragma once
#include <iostream>
#include <string>
#include <vector>
#include <utility>

#include "distance_lookup.h"

namespace rp {

struct GoogleClientConfig {
  std::string api_key;                 // required
  std::string endpoint = "https://maps.googleapis.com/maps/api/distancematrix/json";
  std::string travel_mode = "driving";
  std::string units = "metric";
  int timeout_seconds = 30;            // per HTTP request; 0 = no limit
  int max_elements_per_request = 100;  // API limit on origins x destinations
  int max_addresses_per_side = 25;     // API limit on origins and on destinations
  bool log_requests = false;
  std::ostream* log = &std::cout;
};

// DistanceLookup backed by the Google Distance Matrix API (libcurl).
// Big requests are split into chunks within the API limits; if any chunk
// fails the whole batch fails.
class GoogleDistanceClient : public DistanceLookup {
public:
  explicit GoogleDistanceClient(GoogleClientConfig cfg);

  LookupBatch lookup(const std::vector<Address>& origins,
                     const std::vector<Address>& destinations) override;

  // Exposed for tests: the request URL for one chunk.
  std::string build_url(const std::vector<Address>& origins,
                        const std::vector<Address>& destinations) const;

private:
  GoogleClientConfig cfg_;

  LookupBatch fetch_chunk(const std::vector<Address>& origins,
                          const std::vector<Address>& destinations);
};

// Chunk sizes (origins per request, destinations per request) honoring both
// the per-side and the per-request element limits.
std::pair<size_t, size_t> distance_matrix_chunk_shape(size_t n_origins,
                                                      size_t n_destinations,
                                                      int max_elements,
                                                      int max_per_side);

// One answered request: its block starts at rows[origin_offset][destination_offset].
struct ChunkAnswer {
  size_t origin_offset = 0;
  size_t destination_offset = 0;
  LookupBatch batch;
};

// Stitches chunk answers into one n_origins x n_destinations batch. Fails with
// the first failed chunk's error; throws std::invalid_argument if a chunk
// does not fit inside the full shape.
LookupBatch merge_chunk_answers(size_t n_origins, size_t n_destinations,
                                const std::vector<ChunkAnswer>& chunks);

} // namespace rp
