#include "distance_lookup.h"

#include <cmath>
#include <stdexcept>

using json = nlohmann::json;

namespace rp
{

    ElementStatus parse_element_status(const std::string &s)
    {
        if (s == "OK")
            return ElementStatus::Ok;
        if (s == "NOT_FOUND")
            return ElementStatus::NotFound;
        if (s == "ZERO_RESULTS")
            return ElementStatus::ZeroResults;
        if (s == "MAX_ROUTE_LENGTH_EXCEEDED")
            return ElementStatus::MaxRouteLengthExceeded;
        return ElementStatus::Unknown;
    }

    static PairDistance parse_element(const json &e)
    {
        PairDistance p;
        if (!e.is_object())
            return p; // Unknown
        p.status = parse_element_status(e.value("status", std::string{}));
        if (p.status != ElementStatus::Ok)
            return p;

        // An OK element without a numeric distance is as good as no route.
        if (!e.contains("distance") || !e["distance"].is_object() ||
            !e["distance"].contains("value") || !e["distance"]["value"].is_number())
        {
            p.status = ElementStatus::Unknown;
            return p;
        }
        p.meters = e["distance"]["value"].get<double>();
        return p;
    }

    LookupBatch parse_distance_matrix_response(const json &doc,
                                               size_t n_origins,
                                               size_t n_destinations)
    {
        if (!doc.is_object())
            return LookupBatch::failure("distance matrix response is not a JSON object");

        const std::string status = doc.value("status", std::string{"MISSING_STATUS"});
        if (status != "OK")
        {
            std::string why = "distance matrix request failed: " + status;
            const std::string details = doc.value("error_message", std::string{});
            if (!details.empty())
                why += " (" + details + ")";
            return LookupBatch::failure(why);
        }

        if (!doc.contains("rows") || !doc["rows"].is_array() || doc["rows"].size() != n_origins)
            return LookupBatch::failure("distance matrix response has " +
                                        std::to_string(doc.contains("rows") ? doc["rows"].size() : 0) +
                                        " rows, expected " + std::to_string(n_origins));

        LookupBatch out;
        out.ok = true;
        out.rows.reserve(n_origins);
        for (const auto &row : doc["rows"])
        {
            if (!row.is_object() || !row.contains("elements") || !row["elements"].is_array() ||
                row["elements"].size() != n_destinations)
            {
                return LookupBatch::failure("distance matrix row does not have " +
                                            std::to_string(n_destinations) + " elements");
            }
            std::vector<PairDistance> r;
            r.reserve(n_destinations);
            for (const auto &e : row["elements"])
                r.push_back(parse_element(e));
            out.rows.push_back(std::move(r));
        }
        return out;
    }

    // ---------------- StaticDistanceLookup ----------------

    StaticDistanceLookup::StaticDistanceLookup(std::vector<Address> addresses, DistanceMatrix matrix)
        : addresses_(std::move(addresses)), matrix_(std::move(matrix))
    {
        if (static_cast<int>(addresses_.size()) != matrix_.n)
            throw std::invalid_argument("static lookup: " + std::to_string(addresses_.size()) +
                                        " addresses for a " + std::to_string(matrix_.n) + "x" +
                                        std::to_string(matrix_.n) + " matrix");
        // First occurrence wins for duplicate addresses.
        for (int i = 0; i < static_cast<int>(addresses_.size()); ++i)
            index_.emplace(addresses_[i], i);
    }

    StaticDistanceLookup StaticDistanceLookup::from_json(const json &j)
    {
        const auto addresses = j.at("addresses").get<std::vector<Address>>();
        const auto &rows = j.at("distances");
        if (!rows.is_array())
            throw std::runtime_error("static lookup: 'distances' must be a 2D array");

        const int n = static_cast<int>(addresses.size());
        if (static_cast<int>(rows.size()) != n)
            throw std::runtime_error("static lookup: matrix row count mismatch");

        DistanceMatrix M(n);
        for (int i = 0; i < n; ++i)
        {
            const auto &row = rows[i];
            if (!row.is_array() || static_cast<int>(row.size()) != n)
                throw std::runtime_error("static lookup: matrix row size mismatch");
            for (int k = 0; k < n; ++k)
                M.set(i, k, row[k].is_null() ? kUnreachable : row[k].get<double>());
        }
        return StaticDistanceLookup(addresses, std::move(M));
    }

    void StaticDistanceLookup::fail_pair(const Address &from, const Address &to)
    {
        failed_pairs_.insert(pair_key(from, to));
    }

    LookupBatch StaticDistanceLookup::lookup(const std::vector<Address> &origins,
                                             const std::vector<Address> &destinations)
    {
        ++calls_;
        if (!batch_error_.empty())
            return LookupBatch::failure(batch_error_);

        LookupBatch out;
        out.ok = true;
        out.rows.reserve(origins.size());
        for (const auto &o : origins)
        {
            std::vector<PairDistance> r;
            r.reserve(destinations.size());
            auto io = index_.find(o);
            for (const auto &d : destinations)
            {
                PairDistance p;
                auto id = index_.find(d);
                if (io == index_.end() || id == index_.end() || failed_pairs_.count(pair_key(o, d)))
                {
                    p.status = ElementStatus::NotFound;
                }
                else
                {
                    const double v = matrix_.at(io->second, id->second);
                    if (std::isfinite(v))
                    {
                        p.status = ElementStatus::Ok;
                        p.meters = v;
                    }
                    else
                    {
                        p.status = ElementStatus::ZeroResults;
                    }
                }
                r.push_back(p);
            }
            out.rows.push_back(std::move(r));
        }
        return out;
    }

} // namespace rp
