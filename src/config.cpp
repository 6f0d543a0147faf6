#include "config.h"

#include <stdexcept>
#include <string>

namespace rp
{

    AppConfig parse_config(const nlohmann::json &j)
    {
        if (!j.is_null() && !j.is_object())
            throw std::runtime_error("config must be a JSON object");

        AppConfig c;
        if (j.is_null())
            return c;

        c.planner.max_exact_stops = j.value("MAX_EXACT_STOPS", c.planner.max_exact_stops);
        c.planner.log_progress = j.value("LOG_PROGRESS", c.planner.log_progress);

        c.google.api_key = j.value("GOOGLE_MAPS_API_KEY", std::string{});
        c.google.endpoint = j.value("DISTANCE_MATRIX_URL", c.google.endpoint);
        c.google.travel_mode = j.value("TRAVEL_MODE", c.google.travel_mode);
        c.google.units = j.value("UNITS", c.google.units);
        c.google.timeout_seconds = j.value("REQUEST_TIMEOUT_SECONDS", c.google.timeout_seconds);
        c.google.max_elements_per_request = j.value("MAX_ELEMENTS_PER_REQUEST", c.google.max_elements_per_request);
        c.google.log_requests = c.planner.log_progress;

        if (c.planner.max_exact_stops < 0)
            throw std::runtime_error("MAX_EXACT_STOPS must be >= 0");
        if (c.google.timeout_seconds < 0)
            throw std::runtime_error("REQUEST_TIMEOUT_SECONDS must be >= 0");
        if (c.google.max_elements_per_request <= 0)
            throw std::runtime_error("MAX_ELEMENTS_PER_REQUEST must be > 0");
        return c;
    }

} // namespace rp
