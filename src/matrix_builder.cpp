#include "matrix_builder.h"

#include <cmath>

namespace rp
{

    DistanceMatrix build_distance_matrix(const std::vector<Address> &addresses,
                                         DistanceLookup &lookup,
                                         MatrixBuildStats *stats)
    {
        const int N = static_cast<int>(addresses.size());
        if (N == 0)
            throw std::invalid_argument("build_distance_matrix: no addresses");

        MatrixBuildStats local;
        MatrixBuildStats &st = stats ? *stats : local;
        st = MatrixBuildStats{};

        DistanceMatrix M(N);
        if (N == 1)
            return M;

        LookupBatch batch = lookup.lookup(addresses, addresses);
        st.lookups = 1;
        if (!batch.ok)
            throw LookupError(batch.error.empty() ? "distance lookup failed" : batch.error);

        if (static_cast<int>(batch.rows.size()) != N)
            throw LookupError("distance lookup returned " + std::to_string(batch.rows.size()) +
                              " rows for " + std::to_string(N) + " origins");

        for (int i = 0; i < N; ++i)
        {
            const auto &row = batch.rows[i];
            if (static_cast<int>(row.size()) != N)
                throw LookupError("distance lookup row " + std::to_string(i) + " has " +
                                  std::to_string(row.size()) + " elements, expected " + std::to_string(N));
            for (int j = 0; j < N; ++j)
            {
                if (i == j)
                    continue; // diagonal stays 0, even for a failed self lookup

                const PairDistance &p = row[j];
                const bool usable = p.status == ElementStatus::Ok && std::isfinite(p.meters) && p.meters >= 0.0;
                if (usable)
                {
                    M.set(i, j, p.meters);
                }
                else
                {
                    M.set(i, j, kUnreachable);
                    ++st.unreachable_pairs;
                }
            }
        }
        return M;
    }

} // namespace rp
