#pragma once
#include "types.h"
#include "distance_lookup.h"
#include "google_distance_client.h"
#include "matrix_builder.h"
#include "held_karp.h"
#include "validation.h"
#include "route_optimizer.h"
#include "config.h"
#include "utils.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <iostream>
#include <numeric>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include <ortools/graph/hamiltonian_path.h>

namespace rp_tests {

using namespace rp;

struct TestRun {
  int checks = 0;
  int failures = 0;
};

inline TestRun& run() { static TestRun r; return r; }

inline void expect(bool ok, const std::string& what) {
  ++run().checks;
  if (!ok) {
    ++run().failures;
    std::cout << "   ✗ " << what << "\n";
  }
}

inline bool near(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) <= eps;
}

inline DistanceMatrix matrix_from(const std::vector<std::vector<double>>& rows) {
  DistanceMatrix M(static_cast<int>(rows.size()));
  for (int i = 0; i < M.n; ++i)
    for (int j = 0; j < M.n; ++j) M.set(i, j, rows[i][j]);
  return M;
}

inline bool is_permutation_from_zero(const std::vector<int>& order, int n) {
  if (static_cast<int>(order.size()) != n || order.empty() || order[0] != 0) return false;
  std::vector<int> sorted = order;
  std::sort(sorted.begin(), sorted.end());
  for (int i = 0; i < n; ++i) if (sorted[i] != i) return false;
  return true;
}

// Unit square A-B-C-D, diagonals sqrt(2).
inline DistanceMatrix unit_square() {
  const double d = std::sqrt(2.0);
  return matrix_from({{0, 1, d, 1},
                      {1, 0, 1, d},
                      {d, 1, 0, 1},
                      {1, d, 1, 0}});
}

// Depot, A, B, C: cycle Depot-A-C-B-Depot costs 1 + 2 + 3 + 4 = 10 meters.
inline DistanceMatrix depot_cycle_meters() {
  return matrix_from({{0, 1, 4, 20},
                      {1, 0, 20, 2},
                      {4, 20, 0, 3},
                      {20, 2, 3, 0}});
}

// ---------------- held_karp ----------------

inline void test_two_nodes_cost_is_out_and_back() {
  const auto M = matrix_from({{0, 3}, {5, 0}});
  const auto s = solve_tour(M);
  expect(s.feasible, "two nodes: feasible");
  expect(near(s.cost, 8.0), "two nodes: cost == m[0][1] + m[1][0]");
  expect(s.order == std::vector<int>({0, 1}), "two nodes: order [0, 1]");
}

inline void test_single_node_tour() {
  const auto s = solve_tour(DistanceMatrix(1));
  expect(s.feasible && s.cost == 0.0, "single node: cost 0");
  expect(s.order == std::vector<int>({0}), "single node: order [0]");
}

inline void test_unit_square_optimum() {
  const auto M = unit_square();
  const auto s = solve_tour(M);
  expect(near(s.cost, 4.0), "unit square: optimal cost 4");
  expect(is_permutation_from_zero(s.order, 4), "unit square: order is a permutation from 0");
  expect(near(tour_cost(M, s.order), s.cost), "unit square: reported cost matches order");
}

inline void test_symmetric_reverse_has_same_cost() {
  const auto M = unit_square();
  const auto s = solve_tour(M);
  std::vector<int> rev = s.order;
  std::reverse(rev.begin() + 1, rev.end());
  expect(near(tour_cost(M, rev), s.cost), "symmetric matrix: reversed tour costs the same");
}

inline void test_infinite_edge_is_avoided() {
  auto M = unit_square();
  M.set(0, 1, kUnreachable);
  M.set(1, 0, kUnreachable);
  const auto s = solve_tour(M);
  expect(s.feasible, "forbidden A-B: still feasible");
  expect(near(s.cost, 2.0 + 2.0 * std::sqrt(2.0)), "forbidden A-B: cost of the alternative cycle");
  bool uses_ab = false;
  for (size_t i = 0; i < s.order.size(); ++i) {
    const int a = s.order[i], b = s.order[(i + 1) % s.order.size()];
    if ((a == 0 && b == 1) || (a == 1 && b == 0)) uses_ab = true;
  }
  expect(!uses_ab, "forbidden A-B: tour never uses the forbidden edge");
}

inline void test_solver_is_deterministic() {
  const auto M = depot_cycle_meters();
  const auto a = solve_tour(M);
  const auto b = solve_tour(M);
  expect(a.order == b.order && a.cost == b.cost, "same matrix twice: identical order and cost");
  // Closing-node ties go to the lowest index, which gives the reversed cycle.
  expect(a.order == std::vector<int>({0, 2, 3, 1}), "depot cycle: order [0, 2, 3, 1]");
  expect(near(a.cost, 10.0), "depot cycle: cost 10");
}

inline void test_no_finite_tour() {
  auto M = unit_square();
  for (int j = 0; j < 4; ++j) if (j != 2) M.set(2, j, kUnreachable);
  const auto s = solve_tour(M);
  expect(!s.feasible, "node without exits: infeasible");
  expect(std::isinf(s.cost) && !std::isnan(s.cost), "node without exits: cost is +inf, not NaN");
  expect(s.order == std::vector<int>({0, 1, 2, 3}), "node without exits: identity order");
  expect(find_isolated_nodes(M) == std::vector<int>({2}), "node without exits: reported as isolated");
}

inline void test_custom_start_index() {
  const auto M = depot_cycle_meters();
  const auto s = solve_tour(M, 2);
  expect(!s.order.empty() && s.order[0] == 2, "start=2: order begins at 2");
  expect(near(s.cost, 10.0), "start=2: same optimal cycle cost");
}

inline void test_solver_rejects_bad_input() {
  bool threw = false;
  try { solve_tour(DistanceMatrix(3), 5); } catch (const std::invalid_argument&) { threw = true; }
  expect(threw, "start out of range throws invalid_argument");

  threw = false;
  try { solve_tour(DistanceMatrix(kMaxExactNodes + 1)); } catch (const std::invalid_argument&) { threw = true; }
  expect(threw, "too many nodes throws invalid_argument");
}

// Exhaustive check over all orders starting at 0.
inline double brute_force_cost(const DistanceMatrix& M) {
  std::vector<int> order(M.n);
  std::iota(order.begin(), order.end(), 0);
  double best = kUnreachable;
  do {
    best = std::min(best, tour_cost(M, order));
  } while (std::next_permutation(order.begin() + 1, order.end()));
  return best;
}

inline void test_matches_brute_force() {
  std::mt19937 rng(12345);
  std::uniform_real_distribution<double> dist(1.0, 1000.0);
  for (int n = 3; n <= 7; ++n) {
    DistanceMatrix M(n);
    for (int i = 0; i < n; ++i)
      for (int j = 0; j < n; ++j)
        if (i != j) M.set(i, j, dist(rng));
    const auto s = solve_tour(M);
    expect(near(s.cost, brute_force_cost(M), 1e-6), "random n=" + std::to_string(n) + ": matches brute force");
    expect(is_permutation_from_zero(s.order, n), "random n=" + std::to_string(n) + ": valid permutation");
  }
}

inline void test_matches_ortools_hamiltonian_solver() {
  std::mt19937 rng(4242);
  std::uniform_int_distribution<int> dist(1, 5000);
  for (int n = 2; n <= 10; ++n) {
    std::vector<std::vector<int64_t>> cost(n, std::vector<int64_t>(n, 0));
    DistanceMatrix M(n);
    for (int i = 0; i < n; ++i)
      for (int j = 0; j < n; ++j)
        if (i != j) {
          cost[i][j] = dist(rng);
          M.set(i, j, static_cast<double>(cost[i][j]));
        }

    operations_research::HamiltonianPathSolver<int64_t, std::vector<std::vector<int64_t>>> oracle(cost);
    const int64_t expected = oracle.TravelingSalesmanCost();
    const auto s = solve_tour(M);
    expect(near(s.cost, static_cast<double>(expected)),
           "asymmetric n=" + std::to_string(n) + ": same optimum as OR-Tools");
  }
}

// ---------------- distance_lookup / client ----------------

inline void test_parse_ok_response() {
  const json doc = json::parse(R"({
    "status": "OK",
    "rows": [
      {"elements": [{"status": "OK", "distance": {"value": 0}},
                    {"status": "NOT_FOUND"}]},
      {"elements": [{"status": "OK", "distance": {"text": "1.2 km", "value": 1234}},
                    {"status": "OK", "distance": {"value": 0}}]}
    ]})");
  const auto b = parse_distance_matrix_response(doc, 2, 2);
  expect(b.ok, "OK response parses");
  expect(b.rows.size() == 2 && b.rows[0].size() == 2, "OK response: 2x2 rows");
  expect(b.rows[0][1].status == ElementStatus::NotFound, "NOT_FOUND element kept per pair");
  expect(b.rows[1][0].status == ElementStatus::Ok && b.rows[1][0].meters == 1234.0, "distance.value read in meters");
}

inline void test_parse_failed_response() {
  const json denied = {{"status", "REQUEST_DENIED"}, {"error_message", "The provided API key is invalid."}};
  const auto b = parse_distance_matrix_response(denied, 2, 2);
  expect(!b.ok, "REQUEST_DENIED is a batch failure");
  expect(b.error.find("REQUEST_DENIED") != std::string::npos &&
         b.error.find("API key") != std::string::npos, "batch failure keeps status and error_message");

  const json short_rows = {{"status", "OK"}, {"rows", json::array({{{"elements", json::array()}}})}};
  expect(!parse_distance_matrix_response(short_rows, 2, 2).ok, "row count mismatch is a batch failure");
  expect(!parse_distance_matrix_response(json::array(), 1, 1).ok, "non-object response is a batch failure");

  const json no_value = {{"status", "OK"},
                         {"rows", json::array({{{"elements", json::array({{{"status", "OK"}}})}}})}};
  const auto nv = parse_distance_matrix_response(no_value, 1, 1);
  expect(nv.ok && nv.rows[0][0].status == ElementStatus::Unknown, "OK element without distance is unusable");
}

inline void test_static_lookup_from_json() {
  const json j = json::parse(R"({"addresses": ["Depot", "A"], "distances": [[0, 700], [null, 0]]})");
  auto lookup = StaticDistanceLookup::from_json(j);
  const auto b = lookup.lookup({"Depot", "A"}, {"Depot", "A"});
  expect(b.ok && b.rows[0][1].status == ElementStatus::Ok && b.rows[0][1].meters == 700.0, "matrix file: distance served");
  expect(b.rows[1][0].status != ElementStatus::Ok, "matrix file: null means no route");

  bool threw = false;
  try { StaticDistanceLookup::from_json(json::parse(R"({"addresses": ["x"], "distances": [[0, 1]]})")); }
  catch (const std::runtime_error&) { threw = true; }
  expect(threw, "matrix file: ragged rows rejected");
}

inline void test_chunk_shape() {
  expect(distance_matrix_chunk_shape(3, 3, 100, 25) == std::make_pair<size_t, size_t>(3, 3), "3x3 fits one request");
  expect(distance_matrix_chunk_shape(16, 16, 100, 25) == std::make_pair<size_t, size_t>(6, 16), "16x16 splits origins by 6");
  expect(distance_matrix_chunk_shape(30, 30, 100, 25) == std::make_pair<size_t, size_t>(4, 25), "30x30 caps destinations at 25");
  expect(distance_matrix_chunk_shape(5, 5, 1, 25) == std::make_pair<size_t, size_t>(1, 1), "element limit 1 gives 1x1 chunks");
}

inline void test_request_url() {
  GoogleClientConfig gc;
  gc.api_key = "k";
  GoogleDistanceClient client(gc);
  const std::string url = client.build_url({"Kochi, Kerala", "Thrissur"}, {"Aluva"});
  expect(url.rfind(gc.endpoint + "?", 0) == 0, "url starts with endpoint");
  expect(url.find("origins=Kochi%2C%20Kerala%7CThrissur") != std::string::npos, "origins escaped and joined with |");
  expect(url.find("destinations=Aluva") != std::string::npos, "destinations present");
  expect(url.find("mode=driving") != std::string::npos && url.find("key=k") != std::string::npos, "mode and key present");

  GoogleClientConfig odd;
  odd.api_key = "a b&c";
  odd.travel_mode = "transit&x=1";
  const std::string escaped = GoogleDistanceClient(odd).build_url({"Aluva"}, {"Thrissur"});
  expect(escaped.find("key=a%20b%26c") != std::string::npos, "api key is escaped");
  expect(escaped.find("mode=transit%26x%3D1") != std::string::npos, "travel mode is escaped");
  expect(escaped.find("&x=1") == std::string::npos, "no parameter injected through the mode");

  bool threw = false;
  try { GoogleDistanceClient no_key(GoogleClientConfig{}); } catch (const std::invalid_argument&) { threw = true; }
  expect(threw, "client without API key is rejected");
}

// Rows of `rows` origins starting at `origin`, all 16 destinations, meters = origin * 100 + destination.
inline LookupBatch numbered_rows(size_t origin, size_t rows, size_t destinations) {
  LookupBatch b;
  b.ok = true;
  for (size_t i = 0; i < rows; ++i) {
    std::vector<PairDistance> row;
    for (size_t k = 0; k < destinations; ++k)
      row.push_back({ElementStatus::Ok, static_cast<double>((origin + i) * 100 + k)});
    b.rows.push_back(row);
  }
  return b;
}

inline void test_merge_chunk_answers() {
  // 16x16 under the default limits: three requests of 6, 6 and 4 origins.
  const auto shape = distance_matrix_chunk_shape(16, 16, 100, 25);
  std::vector<ChunkAnswer> chunks;
  for (size_t o = 0; o < 16; o += shape.first)
    chunks.push_back({o, 0, numbered_rows(o, std::min<size_t>(shape.first, 16 - o), 16)});
  expect(chunks.size() == 3 && chunks.back().batch.rows.size() == 4, "16x16 request is three chunks, last one 4 rows");

  const LookupBatch merged = merge_chunk_answers(16, 16, chunks);
  expect(merged.ok && merged.rows.size() == 16, "merged batch has every origin");
  bool all_in_place = true;
  for (size_t i = 0; i < merged.rows.size(); ++i) {
    if (merged.rows[i].size() != 16) { all_in_place = false; break; }
    for (size_t k = 0; k < 16; ++k)
      if (merged.rows[i][k].status != ElementStatus::Ok || merged.rows[i][k].meters != static_cast<double>(i * 100 + k))
        all_in_place = false;
  }
  expect(all_in_place, "every element lands at its origin/destination");

  // Column split: two destination blocks for the same origins.
  LookupBatch left = numbered_rows(0, 2, 3);
  LookupBatch right = numbered_rows(0, 2, 2);
  right.rows[1][1].status = ElementStatus::ZeroResults;
  const LookupBatch cols = merge_chunk_answers(2, 5, {{0, 0, left}, {0, 3, right}});
  expect(cols.ok && cols.rows[1][2].meters == 102.0 && cols.rows[0][4].meters == 1.0,
         "destination blocks are placed by offset");
  expect(cols.rows[1][4].status == ElementStatus::ZeroResults, "element status survives the merge");

  chunks[1].batch = LookupBatch::failure("OVER_QUERY_LIMIT");
  const LookupBatch failed = merge_chunk_answers(16, 16, chunks);
  expect(!failed.ok && failed.error == "OVER_QUERY_LIMIT" && failed.rows.empty(), "one failed chunk fails the batch");

  bool threw = false;
  try { merge_chunk_answers(4, 16, {{0, 0, numbered_rows(0, 6, 16)}}); } catch (const std::invalid_argument&) { threw = true; }
  expect(threw, "chunk larger than the merged shape is rejected");

  const LookupBatch empty = merge_chunk_answers(0, 0, {});
  expect(empty.ok && empty.rows.empty(), "no chunks for an empty request");
}

// ---------------- matrix_builder ----------------

inline StaticDistanceLookup depot_lookup() {
  return StaticDistanceLookup({"Depot", "A", "B", "C"}, depot_cycle_meters());
}

inline void test_builder_single_pair_failure() {
  auto lookup = depot_lookup();
  lookup.fail_pair("A", "C");
  MatrixBuildStats st;
  const auto M = build_distance_matrix({"Depot", "A", "B", "C"}, lookup, &st);
  expect(M.n == 4 && lookup.calls() == 1, "one batched lookup for the whole matrix");
  expect(std::isinf(M.at(1, 3)) && M.at(1, 3) > 0, "failed pair stored as +inf");
  expect(st.unreachable_pairs == 1, "exactly one unreachable pair");
  expect(M.at(3, 1) == 2.0 && M.at(0, 0) == 0.0, "other entries untouched, diagonal 0");

  const auto s = solve_tour(M);
  // A->C is gone; Depot-B-C-A-Depot still costs 10.
  expect(s.feasible && near(s.cost, 10.0), "solver routes around the failed pair");
  expect(s.order == std::vector<int>({0, 2, 3, 1}), "remaining direction of the cycle is used");
}

inline void test_builder_batch_failure_throws() {
  auto lookup = depot_lookup();
  lookup.fail_batch("OVER_QUERY_LIMIT");
  bool threw = false;
  try { build_distance_matrix({"Depot", "A"}, lookup); }
  catch (const LookupError& e) { threw = std::string(e.what()).find("OVER_QUERY_LIMIT") != std::string::npos; }
  expect(threw, "batch failure propagates as LookupError");
}

// Returns canned rows, including values that must be rejected.
class CannedLookup : public DistanceLookup {
public:
  std::vector<std::vector<PairDistance>> rows;
  LookupBatch lookup(const std::vector<Address>&, const std::vector<Address>&) override {
    LookupBatch b;
    b.ok = true;
    b.rows = rows;
    return b;
  }
};

inline void test_builder_rejects_bad_values() {
  CannedLookup lookup;
  const PairDistance ok{ElementStatus::Ok, 10.0};
  lookup.rows = {{ok, {ElementStatus::Ok, -5.0}, {ElementStatus::Ok, std::nan("")}},
                 {ok, {ElementStatus::ZeroResults, 0.0}, ok},
                 {ok, ok, {ElementStatus::NotFound, 0.0}}};
  MatrixBuildStats st;
  const auto M = build_distance_matrix({"x", "y", "z"}, lookup, &st);
  expect(std::isinf(M.at(0, 1)) && std::isinf(M.at(0, 2)), "negative and NaN distances become +inf");
  expect(M.at(1, 1) == 0.0 && M.at(2, 2) == 0.0, "diagonal is 0 even if the self lookup failed");
  expect(st.unreachable_pairs == 2, "diagonal failures are not counted");

  lookup.rows.pop_back();
  bool threw = false;
  try { build_distance_matrix({"x", "y", "z"}, lookup); } catch (const LookupError&) { threw = true; }
  expect(threw, "short lookup answer is a LookupError");
}

// ---------------- route_optimizer ----------------

inline void test_trivial_inputs_skip_lookup() {
  auto lookup = depot_lookup();
  RoutePlanner planner(lookup);
  const auto one = planner.optimize_route({"Depot"});
  expect(one.status == RouteStatus::Success, "one address: success");
  expect(one.optimized_route == std::vector<Address>({"Depot"}) && one.distance_km == 0.0, "one address: unchanged, 0 km");
  const auto none = planner.optimize_route({});
  expect(none.status == RouteStatus::Success && none.optimized_route.empty(), "no address: success, empty route");
  expect(lookup.calls() == 0, "trivial inputs make no lookup calls");
}

inline void test_end_to_end_depot_cycle() {
  auto lookup = depot_lookup();
  RoutePlanner planner(lookup);
  const auto r = planner.optimize_route({"Depot", "A", "B", "C"});
  expect(r.status == RouteStatus::Success, "depot cycle: success");
  expect(near(r.distance_km, 0.01, 1e-12), "depot cycle: 10 m reported as 0.01 km");
  expect(r.optimized_route == std::vector<Address>({"Depot", "B", "C", "A"}), "depot cycle: [Depot, B, C, A]");

  const json j = to_json(r);
  expect(j["status"] == "success" && j.contains("distance (in km)") && !j.contains("message"), "json result shape");
}

inline void test_batch_failure_becomes_error_result() {
  auto lookup = depot_lookup();
  lookup.fail_batch("REQUEST_DENIED");
  RoutePlanner planner(lookup);
  const std::vector<Address> in = {"Depot", "C", "A"};
  const auto r = planner.optimize_route(in);
  expect(r.status == RouteStatus::Error, "batch failure: status error");
  expect(r.optimized_route == in && r.distance_km == 0.0, "batch failure: original order, 0 km");
  expect(r.message.find("REQUEST_DENIED") != std::string::npos, "batch failure: message kept");
  expect(to_json(r)["status"] == "error", "batch failure: json status error");
}

inline void test_infeasible_tour_result() {
  auto M = depot_cycle_meters();
  for (int i = 0; i < 4; ++i) if (i != 3) M.set(i, 3, kUnreachable);
  StaticDistanceLookup lookup({"Depot", "A", "B", "C"}, M);
  RoutePlanner planner(lookup);
  const auto r = planner.optimize_route({"Depot", "A", "B", "C"});
  expect(r.status == RouteStatus::Infeasible, "unreachable stop: status infeasible");
  expect(r.optimized_route == std::vector<Address>({"Depot", "A", "B", "C"}), "infeasible: original order");
  expect(r.message.find("\"C\"") != std::string::npos, "infeasible: names the unreachable stop");
  expect(to_json(r)["status"] == "infeasible", "infeasible: json status");
}

inline void test_unknown_address_degrades_to_unreachable() {
  auto lookup = depot_lookup();
  RoutePlanner planner(lookup);
  const auto r = planner.optimize_route({"Depot", "A", "Nowhere"});
  expect(r.status == RouteStatus::Infeasible, "address unknown to the lookup: infeasible, not an error");
}

inline void test_duplicate_addresses_are_distinct_nodes() {
  auto lookup = depot_lookup();
  RoutePlanner planner(lookup);
  const auto r = planner.optimize_route({"Depot", "A", "A"});
  expect(r.status == RouteStatus::Success && r.optimized_route.size() == 3, "duplicates: every node visited");
  expect(near(r.distance_km, 0.002, 1e-12), "duplicates: zero distance between copies");
}

inline void test_validation_errors_become_error_results() {
  auto lookup = depot_lookup();
  PlannerConfig pc;
  pc.max_exact_stops = 3;
  RoutePlanner planner(lookup, pc);
  const auto big = planner.optimize_route({"Depot", "A", "B", "C"});
  expect(big.status == RouteStatus::Error && lookup.calls() == 0, "too many stops: error before any lookup");

  const auto blank = planner.optimize_route({"Depot", "  "});
  expect(blank.status == RouteStatus::Error, "blank address: error");

  RoutePlanner open(lookup);
  auto M = depot_cycle_meters();
  M.set(1, 2, -1.0);
  const auto neg = open.optimize_with_matrix({"Depot", "A", "B", "C"}, M);
  expect(neg.status == RouteStatus::Error, "negative distance in a prebuilt matrix: error");
  const auto misaligned = open.optimize_with_matrix({"Depot", "A"}, depot_cycle_meters());
  expect(misaligned.status == RouteStatus::Error, "matrix/address size mismatch: error");
}

inline void test_progress_log_stays_off_result_stream() {
  auto lookup = depot_lookup();
  std::ostringstream progress;
  PlannerConfig pc;
  pc.log_progress = true;
  pc.log = &progress;
  RoutePlanner planner(lookup, pc);
  const auto r = planner.optimize_route({"Depot", "A", "B", "C"});

  std::ostringstream result;
  write_result_json(r, result);
  const json parsed = json::parse(result.str(), nullptr, /*allow_exceptions=*/false);
  expect(!parsed.is_discarded(), "result stream is one JSON document");
  expect(parsed == to_json(r), "result stream matches to_json");
  expect(result.str().find("[route_planner]") == std::string::npos, "no progress lines in the result stream");
  expect(progress.str().find("[route_planner] tour over 4 stops") != std::string::npos, "progress goes to the log stream");
}

// ---------------- config ----------------

inline void test_parse_config() {
  const AppConfig d = parse_config(json::object());
  expect(d.planner.max_exact_stops == 16 && d.google.travel_mode == "driving" &&
         d.google.max_elements_per_request == 100, "config defaults");

  const AppConfig c = parse_config({{"GOOGLE_MAPS_API_KEY", "abc"}, {"TRAVEL_MODE", "walking"},
                                    {"MAX_EXACT_STOPS", 12}, {"REQUEST_TIMEOUT_SECONDS", 5},
                                    {"LOG_PROGRESS", true}});
  expect(c.google.api_key == "abc" && c.google.travel_mode == "walking", "config overrides google settings");
  expect(c.planner.max_exact_stops == 12 && c.google.timeout_seconds == 5 && c.google.log_requests, "config overrides planner settings");

  bool threw = false;
  try { parse_config({{"MAX_ELEMENTS_PER_REQUEST", 0}}); } catch (const std::runtime_error&) { threw = true; }
  expect(threw, "non-positive element limit rejected");
}

inline int run_all() {
  const std::vector<std::pair<const char*, std::function<void()>>> tests = {
    {"two_nodes_cost_is_out_and_back", test_two_nodes_cost_is_out_and_back},
    {"single_node_tour", test_single_node_tour},
    {"unit_square_optimum", test_unit_square_optimum},
    {"symmetric_reverse_has_same_cost", test_symmetric_reverse_has_same_cost},
    {"infinite_edge_is_avoided", test_infinite_edge_is_avoided},
    {"solver_is_deterministic", test_solver_is_deterministic},
    {"no_finite_tour", test_no_finite_tour},
    {"custom_start_index", test_custom_start_index},
    {"solver_rejects_bad_input", test_solver_rejects_bad_input},
    {"matches_brute_force", test_matches_brute_force},
    {"matches_ortools_hamiltonian_solver", test_matches_ortools_hamiltonian_solver},
    {"parse_ok_response", test_parse_ok_response},
    {"parse_failed_response", test_parse_failed_response},
    {"static_lookup_from_json", test_static_lookup_from_json},
    {"chunk_shape", test_chunk_shape},
    {"request_url", test_request_url},
    {"merge_chunk_answers", test_merge_chunk_answers},
    {"builder_single_pair_failure", test_builder_single_pair_failure},
    {"builder_batch_failure_throws", test_builder_batch_failure_throws},
    {"builder_rejects_bad_values", test_builder_rejects_bad_values},
    {"trivial_inputs_skip_lookup", test_trivial_inputs_skip_lookup},
    {"end_to_end_depot_cycle", test_end_to_end_depot_cycle},
    {"batch_failure_becomes_error_result", test_batch_failure_becomes_error_result},
    {"infeasible_tour_result", test_infeasible_tour_result},
    {"unknown_address_degrades_to_unreachable", test_unknown_address_degrades_to_unreachable},
    {"duplicate_addresses_are_distinct_nodes", test_duplicate_addresses_are_distinct_nodes},
    {"validation_errors_become_error_results", test_validation_errors_become_error_results},
    {"progress_log_stays_off_result_stream", test_progress_log_stays_off_result_stream},
    {"parse_config", test_parse_config},
  };

  for (const auto& t : tests) {
    const int before = run().failures;
    try {
      t.second();
    } catch (const std::exception& e) {
      expect(false, std::string("unexpected exception: ") + e.what());
    }
    std::cout << (run().failures == before ? "[ok]   " : "[FAIL] ") << t.first << "\n";
  }
  std::cout << "[tests] " << run().checks << " checks, " << run().failures << " failed\n";
  return run().failures;
}

} // namespace rp_tests
