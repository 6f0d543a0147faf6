#include "validation.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace rp
{

    inline bool is_blank(const std::string &s)
    {
        return std::all_of(s.begin(), s.end(), [](unsigned char c)
                           { return std::isspace(c); });
    }

    [[noreturn]] static void fail(const std::string &msg)
    {
        throw std::runtime_error(msg);
    }

    void validate_addresses(const std::vector<Address> &addresses,
                            const PlannerConfig &config)
    {
        for (size_t i = 0; i < addresses.size(); ++i)
        {
            if (is_blank(addresses[i]))
                fail("Address #" + std::to_string(i) + " is empty.");
        }
        if (config.max_exact_stops > 0 &&
            static_cast<int>(addresses.size()) > config.max_exact_stops)
        {
            std::ostringstream oss;
            oss << addresses.size() << " stops exceed the exact optimizer limit of "
                << config.max_exact_stops << " (MAX_EXACT_STOPS).";
            fail(oss.str());
        }
    }

    void validate_matrix(const DistanceMatrix &matrix)
    {
        const int n = matrix.n;
        if (n <= 0)
            fail("Distance matrix is empty.");
        if (matrix.m.size() != static_cast<size_t>(n) * n)
            fail("Distance matrix storage has " + std::to_string(matrix.m.size()) +
                 " entries, expected " + std::to_string(n) + "x" + std::to_string(n) + ".");

        for (int i = 0; i < n; ++i)
        {
            for (int j = 0; j < n; ++j)
            {
                const double d = matrix.at(i, j);
                if (std::isnan(d))
                    fail("Distance matrix has NaN at [" + std::to_string(i) + "][" + std::to_string(j) + "].");
                if (d < 0.0)
                    fail("Distance matrix has a negative distance at [" + std::to_string(i) + "][" +
                         std::to_string(j) + "].");
                if (i == j && d != 0.0)
                    fail("Distance matrix diagonal [" + std::to_string(i) + "][" + std::to_string(i) +
                         "] is not zero.");
            }
        }
    }

    void validate_matrix_address_alignment(const std::vector<Address> &addresses,
                                           const DistanceMatrix &matrix)
    {
        if (static_cast<int>(addresses.size()) != matrix.n)
        {
            fail("Matrix size (" + std::to_string(matrix.n) + ") does not match address count (" +
                 std::to_string(addresses.size()) + ").");
        }
    }

    std::vector<int> find_isolated_nodes(const DistanceMatrix &matrix)
    {
        std::vector<int> out;
        const int n = matrix.n;
        if (n < 2)
            return out;
        for (int i = 0; i < n; ++i)
        {
            bool has_out = false, has_in = false;
            for (int j = 0; j < n; ++j)
            {
                if (i == j)
                    continue;
                has_out = has_out || std::isfinite(matrix.at(i, j));
                has_in = has_in || std::isfinite(matrix.at(j, i));
            }
            if (!has_out || !has_in)
                out.push_back(i);
        }
        return out;
    }

} // namespace rp
