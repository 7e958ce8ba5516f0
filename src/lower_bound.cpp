#include "lower_bound.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>

#include <ortools/graph/assignment.h>

using operations_research::SimpleLinearSumAssignment;

namespace ga
{

    std::optional<double> minimum_total_cost(const CostMatrix &M, const LowerBoundParams &params)
    {
        if (M.rows <= 0 || M.cols <= 0)
            return std::nullopt;

        // Pad to a square problem; dummy rows/cols cost nothing so the real
        // side with fewer nodes is matched in full.
        const int n = std::max(M.rows, M.cols);

        SimpleLinearSumAssignment assignment;
        for (int i = 0; i < n; ++i)
        {
            for (int j = 0; j < n; ++j)
            {
                int64_t cost = 0;
                if (i < M.rows && j < M.cols)
                    cost = static_cast<int64_t>(std::llround(M.at(i, j) * params.cost_scale));
                assignment.AddArcWithCost(i, j, cost);
            }
        }

        const auto status = assignment.Solve();
        if (status != SimpleLinearSumAssignment::OPTIMAL)
        {
            if (params.log_search)
                std::cout << "[lower-bound] solver status=" << static_cast<int>(status) << "\n";
            return std::nullopt;
        }

        // Real costs of the matched pairs, not the scaled optimum.
        double total = 0.0;
        for (int i = 0; i < M.rows; ++i)
        {
            const int j = assignment.RightMate(i);
            if (j < M.cols)
                total += M.at(i, j);
        }

        if (params.log_search)
            std::cout << "[lower-bound] n=" << n << " optimal_cost=" << total << "\n";
        return total;
    }

} // namespace ga
