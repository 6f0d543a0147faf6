#include "route_optimizer.h"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "held_karp.h"
#include "matrix_builder.h"
#include "utils.h"
#include "validation.h"

namespace rp
{
    namespace
    {
        OptimizationResult trivial(const std::vector<Address> &addresses)
        {
            OptimizationResult r;
            r.status = RouteStatus::Success;
            r.optimized_route = addresses;
            r.distance_km = 0.0;
            return r;
        }

        OptimizationResult failed(RouteStatus status,
                                  const std::vector<Address> &addresses,
                                  std::string message)
        {
            OptimizationResult r;
            r.status = status;
            r.optimized_route = addresses; // unoptimized
            r.distance_km = 0.0;
            r.message = std::move(message);
            return r;
        }

        std::string describe_isolated(const std::vector<Address> &addresses,
                                      const std::vector<int> &isolated)
        {
            std::ostringstream oss;
            oss << "No feasible tour: every closed route uses a pair without a known distance.";
            if (!isolated.empty())
            {
                oss << " Unreachable stop(s):";
                for (size_t i = 0; i < isolated.size(); ++i)
                    oss << (i ? ", " : " ") << '"' << addresses[isolated[i]] << '"';
                oss << ".";
            }
            return oss.str();
        }

    } // namespace

    RoutePlanner::RoutePlanner(DistanceLookup &lookup, PlannerConfig config)
        : lookup_(lookup), cfg_(config) {}

    OptimizationResult RoutePlanner::optimize_route(const std::vector<Address> &addresses)
    {
        if (addresses.size() <= 1)
            return trivial(addresses);

        try
        {
            validate_addresses(addresses, cfg_);

            const long long t0 = NowMillis();
            MatrixBuildStats stats;
            const DistanceMatrix M = build_distance_matrix(addresses, lookup_, &stats);
            const long long t1 = NowMillis();

            if (cfg_.log_progress)
            {
                *cfg_.log << "[route_planner] matrix " << M.n << "x" << M.n
                          << " in " << (t1 - t0) << " ms"
                          << " unreachable_pairs=" << stats.unreachable_pairs << "\n";
            }
            return solve_and_map(addresses, M);
        }
        catch (const LookupError &e)
        {
            std::cerr << "[route_planner] distance lookup failed: " << e.what() << "\n";
            return failed(RouteStatus::Error, addresses, e.what());
        }
        catch (const std::exception &e)
        {
            std::cerr << "[route_planner] optimization failed: " << e.what() << "\n";
            return failed(RouteStatus::Error, addresses, e.what());
        }
    }

    OptimizationResult RoutePlanner::optimize_with_matrix(const std::vector<Address> &addresses,
                                                          const DistanceMatrix &matrix) const
    {
        if (addresses.size() <= 1)
            return trivial(addresses);

        try
        {
            validate_addresses(addresses, cfg_);
            validate_matrix_address_alignment(addresses, matrix);
            return solve_and_map(addresses, matrix);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[route_planner] optimization failed: " << e.what() << "\n";
            return failed(RouteStatus::Error, addresses, e.what());
        }
    }

    OptimizationResult RoutePlanner::solve_and_map(const std::vector<Address> &addresses,
                                                   const DistanceMatrix &M) const
    {
        validate_matrix(M);

        const long long t0 = NowMillis();
        const TourSolution tour = solve_tour(M, /*start=*/0);
        const long long t1 = NowMillis();

        if (!tour.feasible)
        {
            if (cfg_.log_progress)
                *cfg_.log << "[route_planner] no finite tour over " << M.n << " stops\n";
            return failed(RouteStatus::Infeasible, addresses,
                          describe_isolated(addresses, find_isolated_nodes(M)));
        }

        OptimizationResult r;
        r.status = RouteStatus::Success;
        r.optimized_route.reserve(tour.order.size());
        for (int idx : tour.order)
            r.optimized_route.push_back(addresses[idx]);
        r.distance_km = meters_to_km(tour.cost);

        if (cfg_.log_progress)
        {
            std::ostream &log = *cfg_.log;
            const auto flags = log.flags();
            const auto precision = log.precision();
            log << "[route_planner] tour over " << M.n << " stops: "
                << std::fixed << std::setprecision(3) << r.distance_km << " km"
                << " (" << (t1 - t0) << " ms)\n";
            log.flags(flags);
            log.precision(precision);
        }
        return r;
    }

    nlohmann::json to_json(const OptimizationResult &r)
    {
        nlohmann::json j = {
            {"status", to_string(r.status)},
            {"optimized_route", r.optimized_route},
            {"distance (in km)", r.distance_km}};
        if (!r.message.empty())
            j["message"] = r.message;
        return j;
    }

    void write_result_json(const OptimizationResult &r, std::ostream &out)
    {
        out << std::setw(2) << to_json(r) << "\n";
    }

} // namespace rp
