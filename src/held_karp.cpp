#include "held_karp.h"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>

namespace rp
{

    TourSolution solve_tour(const DistanceMatrix &M, int start)
    {
        const int n = M.n;
        if (n <= 0)
            throw std::invalid_argument("solve_tour: empty distance matrix");
        if (static_cast<size_t>(n) * n != M.m.size())
            throw std::invalid_argument("solve_tour: matrix storage does not match n=" + std::to_string(n));
        if (start < 0 || start >= n)
            throw std::invalid_argument("solve_tour: start index " + std::to_string(start) + " out of range");
        if (n > kMaxExactNodes)
            throw std::invalid_argument("solve_tour: " + std::to_string(n) + " nodes exceed the exact solver limit of " +
                                        std::to_string(kMaxExactNodes));

        TourSolution out;
        if (n == 1)
        {
            out.order = {start};
            out.cost = 0.0;
            return out;
        }

        const size_t masks = size_t{1} << n;
        const unsigned start_bit = 1u << start;
        const unsigned full = static_cast<unsigned>(masks - 1);

        // cost[mask * n + last], parent[mask * n + last]
        std::vector<double> cost(masks * n, kUnreachable);
        std::vector<int> parent(masks * n, -1);
        cost[static_cast<size_t>(start_bit) * n + start] = 0.0;

        for (unsigned mask = 1; mask <= full; ++mask)
        {
            if (!(mask & start_bit) || mask == start_bit)
                continue;

            for (int last = 0; last < n; ++last)
            {
                if (last == start || !(mask & (1u << last)))
                    continue;

                const unsigned prev = mask ^ (1u << last);
                const size_t prev_base = static_cast<size_t>(prev) * n;
                double best = kUnreachable;
                int best_city = -1;

                // (prev, start) is only finite for prev == {start}
                for (int city = 0; city < n; ++city)
                {
                    if (!(prev & (1u << city)))
                        continue;
                    const double cand = cost[prev_base + city] + M.at(city, last);
                    if (cand < best)
                    {
                        best = cand;
                        best_city = city;
                    }
                }

                cost[static_cast<size_t>(mask) * n + last] = best;
                parent[static_cast<size_t>(mask) * n + last] = best_city;
            }
        }

        // ---- close the tour ----
        double best_total = kUnreachable;
        int best_last = -1;
        const size_t full_base = static_cast<size_t>(full) * n;
        for (int last = 0; last < n; ++last)
        {
            if (last == start)
                continue;
            const double total = cost[full_base + last] + M.at(last, start);
            if (total < best_total)
            {
                best_total = total;
                best_last = last;
            }
        }

        if (best_last < 0)
        {
            out.feasible = false;
            out.cost = kUnreachable;
            out.order.resize(n);
            std::iota(out.order.begin(), out.order.end(), 0);
            return out;
        }

        // ---- walk parents back to start ----
        std::vector<int> rev;
        rev.reserve(n);
        unsigned mask = full;
        int cur = best_last;
        while (cur != start)
        {
            rev.push_back(cur);
            const int p = parent[static_cast<size_t>(mask) * n + cur];
            if (p < 0)
                throw std::logic_error("solve_tour: broken predecessor chain");
            mask ^= 1u << cur;
            cur = p;
        }
        rev.push_back(start);
        std::reverse(rev.begin(), rev.end());

        out.order = std::move(rev);
        out.cost = best_total;
        out.feasible = true;
        return out;
    }

    double tour_cost(const DistanceMatrix &M, const std::vector<int> &order)
    {
        if (order.size() < 2)
            return 0.0;
        double total = 0.0;
        for (size_t i = 0; i < order.size(); ++i)
            total += M.at(order[i], order[(i + 1) % order.size()]);
        return total;
    }

} // namespace rp
