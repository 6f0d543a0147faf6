// config.h
#pragma once
#include <nlohmann/json.hpp>

#include "types.h"
#include "google_distance_client.h"

namespace rp {

struct AppConfig {
  PlannerConfig planner;
  GoogleClientConfig google;
};

// Keys (all optional):
// {"GOOGLE_MAPS_API_KEY": "...", "TRAVEL_MODE": "driving", "UNITS": "metric",
//  "DISTANCE_MATRIX_URL": "...", "REQUEST_TIMEOUT_SECONDS": 30,
//  "MAX_ELEMENTS_PER_REQUEST": 100, "MAX_EXACT_STOPS": 16, "LOG_PROGRESS": false}
AppConfig parse_config(const nlohmann::json& j);

} // namespace rp
