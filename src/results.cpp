// results.cpp
#include "results.h"
#include "fitness.h"
#include "utils.h"

#include <algorithm>

namespace ga
{

    std::vector<std::vector<int>> solution_matrix(const CostMatrix &M, const Candidate &c)
    {
        std::vector<std::vector<int>> sol(M.rows, std::vector<int>(M.cols, 0));
        for (const auto &a : c.assignment)
            sol[a.row][a.col] = 1;
        return sol;
    }

    double assignment_rating(const json &pairs)
    {
        if (!pairs.is_array() || pairs.empty())
            return 0.0;
        size_t good = 0;
        for (const auto &p : pairs)
            if (p.at("cost").get<double>() < 3)
                ++good;
        return static_cast<double>(good) / static_cast<double>(pairs.size());
    }

    json top_results_with_real_agents(const Problem &P, Population pop, int n)
    {
        sort_by_distance(pop);
        if ((int)pop.size() > n)
            pop.resize(n);

        json out = json::array();
        for (const auto &c : pop)
        {
            json pairs = json::array();
            for (const auto &a : c.assignment)
            {
                pairs.push_back({{"agent", P.agents[a.row]},
                                 {"task", P.tasks[a.col]},
                                 {"cost", a.cost}});
            }
            out.push_back({{"totalCost", c.total_cost},
                           {"distance", c.distance},
                           {"assignment", std::move(pairs)}});
        }
        return out;
    }

    json top_results_with_dummy_names(const Problem &P, Population pop, int n)
    {
        sort_by_distance(pop);

        // unique by distance, first of each run of equal distances
        Population unique;
        for (auto &c : pop)
        {
            if (!unique.empty() && unique.back().distance == c.distance)
                continue;
            unique.push_back(std::move(c));
            if ((int)unique.size() == n)
                break;
        }

        json out = json::array();
        for (const auto &c : unique)
        {
            const auto sol = solution_matrix(P.matrix, c);

            json pairs = json::array();
            for (int i = 0; i < P.matrix.rows; ++i)
            {
                for (int j = 0; j < P.matrix.cols; ++j)
                {
                    if (sol[i][j] != 1)
                        continue;
                    pairs.push_back({{"agent", {{"agentId", P.row_names[i]}, {"email", P.row_names[i]}}},
                                     {"task", {{"taskId", P.col_names[j]}, {"taskName", P.col_names[j]}}},
                                     {"cost", P.matrix.at(i, j)}});
                }
            }

            const double rating = assignment_rating(pairs);
            out.push_back({{"solution", sol},
                           {"assignment", std::move(pairs)},
                           {"assignmentRating", rating},
                           {"totalCost", c.total_cost},
                           {"distance", c.distance}});
        }
        return out;
    }

    json format_results(const Problem &P, const Population &pop, int n)
    {
        if (P.real_agents)
            return top_results_with_real_agents(P, pop, n);
        return top_results_with_dummy_names(P, pop, n);
    }

} // namespace ga
