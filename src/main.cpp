// main.cpp
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "config.h"
#include "distance_lookup.h"
#include "google_distance_client.h"
#include "route_optimizer.h"
#include "utils.h"

using json = nlohmann::json;
using namespace rp;

// ---------------- Minimal CLI ----------------
struct Flags {
  std::string addresses_path;  // required
  std::string config_path;     // optional
  std::string matrix_path;     // optional: offline distances instead of the API
  std::string out_path;        // optional: stdout when empty
  bool verbose = true;         // flipped by --quiet
};

static void print_usage() {
  std::cout <<
R"(Usage:
  route_planner --addresses addresses.json [--config config.json] [--matrix matrix.json] [--out result.json] [--quiet]

Required:
  --addresses PATH   JSON array of address strings (or objects with "full_address"); first = start

Optional:
  --config PATH      Planner / Distance Matrix API settings
  --matrix PATH      Precomputed distances {"addresses": [...], "distances": [[...]]}, no API calls
  --out PATH         Write the result JSON here instead of stdout
  --quiet            Less logging
  --help
)";
}

static Flags parse_flags(int argc, char** argv) {
  Flags f;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto need = [&](const char* name) {
      if (i + 1 >= argc) { std::cerr << "Missing value for " << name << "\n"; std::exit(2); }
      return std::string(argv[++i]);
    };
    if (a == "--help" || a == "-h") { print_usage(); std::exit(0); }
    else if (a == "--addresses") f.addresses_path = need("--addresses");
    else if (a == "--config")    f.config_path = need("--config");
    else if (a == "--matrix")    f.matrix_path = need("--matrix");
    else if (a == "--out")       f.out_path = need("--out");
    else if (a == "--quiet")     f.verbose = false;
    else { std::cerr << "Unknown flag: " << a << "\n"; print_usage(); std::exit(2); }
  }
  if (f.addresses_path.empty()) {
    std::cerr << "Missing required --addresses.\n"; print_usage(); std::exit(2);
  }
  return f;
}

static std::vector<Address> parse_addresses(const json& j) {
  if (!j.is_array()) throw std::runtime_error("addresses must be a JSON array");
  std::vector<Address> out;
  out.reserve(j.size());
  for (const auto& a : j) {
    if (a.is_string()) out.push_back(a.get<std::string>());
    else if (a.is_object() && a.contains("full_address")) out.push_back(a["full_address"].get<std::string>());
    else throw std::runtime_error("address entries must be strings or objects with full_address");
  }
  return out;
}

// ---------------- Main ----------------
int main(int argc, char** argv) {
  std::ios::sync_with_stdio(false);
  const Flags flags = parse_flags(argc, argv);

  std::vector<Address> addresses;
  AppConfig cfg;
  json matrix_json;
  try {
    addresses = parse_addresses(load_json(flags.addresses_path));
    if (!flags.config_path.empty()) cfg = parse_config(load_json(flags.config_path));
    if (!flags.matrix_path.empty()) matrix_json = load_json(flags.matrix_path);
  } catch (const std::exception& e) {
    std::cerr << "Failed to load inputs: " << e.what() << "\n"; return 1;
  }
  cfg.planner.log_progress = cfg.planner.log_progress || flags.verbose;
  cfg.google.log_requests = cfg.planner.log_progress;
  // stdout carries only the result document when no --out is given
  std::ostream& progress = flags.out_path.empty() ? std::cerr : std::cout;
  cfg.planner.log = &progress;
  cfg.google.log = &progress;

  if (flags.verbose) {
    progress << "🧭 Route planner: " << addresses.size() << " stop(s)"
              << " max_exact=" << cfg.planner.max_exact_stops
              << (flags.matrix_path.empty() ? " source=api" : " source=matrix") << "\n";
  }

  std::unique_ptr<DistanceLookup> lookup;
  try {
    if (!flags.matrix_path.empty()) {
      lookup = std::make_unique<StaticDistanceLookup>(StaticDistanceLookup::from_json(matrix_json));
    } else {
      if (cfg.google.api_key.empty()) {
        const char* env = std::getenv("GOOGLE_MAPS_DISTANCE_MATRIX_API_KEY");
        if (env) cfg.google.api_key = env;
      }
      lookup = std::make_unique<GoogleDistanceClient>(cfg.google);
    }
  } catch (const std::exception& e) {
    std::cerr << "Failed to set up distance lookup: " << e.what() << "\n"; return 1;
  }

  const CURLcode init = curl_global_init(CURL_GLOBAL_DEFAULT);
  if (init != CURLE_OK) {
    std::cerr << "curl_global_init failed: " << curl_easy_strerror(init) << "\n"; return 1;
  }
  RoutePlanner planner(*lookup, cfg.planner);
  const OptimizationResult result = planner.optimize_route(addresses);
  curl_global_cleanup();

  if (flags.out_path.empty()) {
    write_result_json(result, std::cout);
  } else {
    try { save_json(flags.out_path, to_json(result)); }
    catch (const std::exception& e) { std::cerr << "Failed to write result: " << e.what() << "\n"; return 4; }
    if (flags.verbose) progress << "✅ Result written to " << flags.out_path << "\n";
  }

  if (result.status != RouteStatus::Success) {
    std::cerr << "Optimization " << to_string(result.status) << ": " << result.message << "\n";
    return 3;
  }
  if (flags.verbose) progress << "🏁 Done.\n";
  return 0;
}
