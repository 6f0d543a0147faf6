#include "google_distance_client.h"

#include <algorithm>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <curl/curl.h>

using json = nlohmann::json;

namespace rp
{
    namespace
    {
        size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata)
        {
            auto *out = static_cast<std::string *>(userdata);
            out->append(ptr, size * nmemb);
            return size * nmemb;
        }

        struct CurlDeleter
        {
            void operator()(CURL *c) const { curl_easy_cleanup(c); }
        };
        using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

        std::string escape(CURL *curl, const std::string &s)
        {
            char *enc = curl_easy_escape(curl, s.c_str(), static_cast<int>(s.size()));
            if (!enc)
                throw std::runtime_error("curl_easy_escape failed");
            std::string out(enc);
            curl_free(enc);
            return out;
        }

        // Distance Matrix API joins several locations with '|'
        std::string join_escaped(CURL *curl, const std::vector<Address> &addresses)
        {
            std::string out;
            for (size_t i = 0; i < addresses.size(); ++i)
            {
                if (i > 0)
                    out += "%7C";
                out += escape(curl, addresses[i]);
            }
            return out;
        }

        std::vector<Address> slice(const std::vector<Address> &v, size_t from, size_t count)
        {
            const size_t to = std::min(v.size(), from + count);
            return std::vector<Address>(v.begin() + from, v.begin() + to);
        }

    } // namespace

    std::pair<size_t, size_t> distance_matrix_chunk_shape(size_t n_origins,
                                                          size_t n_destinations,
                                                          int max_elements,
                                                          int max_per_side)
    {
        const size_t side = static_cast<size_t>(std::max(1, max_per_side));
        const size_t elems = static_cast<size_t>(std::max(1, max_elements));

        size_t dest_chunk = std::max<size_t>(1, std::min({n_destinations, side, elems}));
        size_t orig_chunk = std::max<size_t>(1, std::min({n_origins, side, elems / dest_chunk}));
        return {orig_chunk, dest_chunk};
    }

    LookupBatch merge_chunk_answers(size_t n_origins, size_t n_destinations,
                                    const std::vector<ChunkAnswer> &chunks)
    {
        LookupBatch out;
        out.ok = true;
        out.rows.assign(n_origins, std::vector<PairDistance>(n_destinations));

        for (const auto &c : chunks)
        {
            if (!c.batch.ok)
                return LookupBatch::failure(c.batch.error);
            const auto &rows = c.batch.rows;
            if (c.origin_offset + rows.size() > n_origins)
                throw std::invalid_argument("chunk origins exceed the merged shape");
            for (size_t i = 0; i < rows.size(); ++i)
            {
                if (c.destination_offset + rows[i].size() > n_destinations)
                    throw std::invalid_argument("chunk destinations exceed the merged shape");
                for (size_t k = 0; k < rows[i].size(); ++k)
                    out.rows[c.origin_offset + i][c.destination_offset + k] = rows[i][k];
            }
        }
        return out;
    }

    GoogleDistanceClient::GoogleDistanceClient(GoogleClientConfig cfg)
        : cfg_(std::move(cfg))
    {
        if (cfg_.api_key.empty())
            throw std::invalid_argument("GoogleDistanceClient: missing API key");
        if (cfg_.max_elements_per_request <= 0 || cfg_.max_addresses_per_side <= 0)
            throw std::invalid_argument("GoogleDistanceClient: request limits must be positive");
    }

    std::string GoogleDistanceClient::build_url(const std::vector<Address> &origins,
                                                const std::vector<Address> &destinations) const
    {
        CurlHandle curl(curl_easy_init());
        if (!curl)
            throw std::runtime_error("Failed to initialize curl");

        std::string url = cfg_.endpoint;
        url += "?origins=" + join_escaped(curl.get(), origins);
        url += "&destinations=" + join_escaped(curl.get(), destinations);
        url += "&mode=" + escape(curl.get(), cfg_.travel_mode);
        url += "&units=" + escape(curl.get(), cfg_.units);
        url += "&key=" + escape(curl.get(), cfg_.api_key);
        return url;
    }

    LookupBatch GoogleDistanceClient::fetch_chunk(const std::vector<Address> &origins,
                                                  const std::vector<Address> &destinations)
    {
        const std::string url = build_url(origins, destinations);

        CurlHandle curl(curl_easy_init());
        if (!curl)
            return LookupBatch::failure("Failed to initialize curl");

        std::string response_data;
        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_data);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(cfg_.timeout_seconds));
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);

        const CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK)
            return LookupBatch::failure(std::string("curl_easy_perform() failed: ") + curl_easy_strerror(res));

        long http_code = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
        if (http_code != 200)
            return LookupBatch::failure("HTTP error: " + std::to_string(http_code));

        json doc = json::parse(response_data, /*cb=*/nullptr, /*allow_exceptions=*/false);
        if (doc.is_discarded())
            return LookupBatch::failure("distance matrix response is not valid JSON");

        return parse_distance_matrix_response(doc, origins.size(), destinations.size());
    }

    LookupBatch GoogleDistanceClient::lookup(const std::vector<Address> &origins,
                                             const std::vector<Address> &destinations)
    {
        if (origins.empty() || destinations.empty())
            return merge_chunk_answers(origins.size(), destinations.size(), {});

        const auto shape = distance_matrix_chunk_shape(origins.size(), destinations.size(),
                                                       cfg_.max_elements_per_request,
                                                       cfg_.max_addresses_per_side);
        const size_t orig_chunk = shape.first;
        const size_t dest_chunk = shape.second;

        std::vector<ChunkAnswer> chunks;
        for (size_t o = 0; o < origins.size(); o += orig_chunk)
        {
            const auto orig = slice(origins, o, orig_chunk);
            for (size_t d = 0; d < destinations.size(); d += dest_chunk)
            {
                const auto dest = slice(destinations, d, dest_chunk);
                ChunkAnswer part{o, d, fetch_chunk(orig, dest)};
                if (!part.batch.ok)
                {
                    std::cerr << "[distance_client] chunk origins[" << o << "..] destinations[" << d
                              << "..] failed: " << part.batch.error << "\n";
                    return part.batch;
                }
                chunks.push_back(std::move(part));
            }
        }

        if (cfg_.log_requests)
        {
            *cfg_.log << "[distance_client] " << origins.size() << "x" << destinations.size()
                      << " elements in " << chunks.size() << " request(s)\n";
        }
        return merge_chunk_answers(origins.size(), destinations.size(), chunks);
    }

} // namespace rp
