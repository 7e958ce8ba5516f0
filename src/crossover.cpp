// crossover.cpp
#include "crossover.h"
#include "population.h"
#include <iostream>

namespace ga
{

    long find_lowest_cost_compatible(const std::vector<Assignment> &pool,
                                     const std::vector<Assignment> &chosen)
    {
        long best = -1;
        for (size_t i = 0; i < pool.size(); ++i)
        {
            if (!is_compatible(pool[i], chosen))
                continue;
            if (best < 0 || pool[i].cost < pool[best].cost)
                best = static_cast<long>(i);
        }
        return best;
    }

    Population crossover(const Population &parents, RunContext &ctx)
    {
        if (parents.size() <= 1)
            return parents;

        const size_t assignment_length = parents[0].assignment.size();
        if (assignment_length == 0)
            return parents;

        // Flatten every parent's pairings into one pool; duplicates are expected.
        std::vector<Assignment> pool;
        for (const auto &p : parents)
            pool.insert(pool.end(), p.assignment.begin(), p.assignment.end());

        Population offspring;
        offspring.reserve(parents.size());

        while (!pool.empty())
        {
            std::vector<Assignment> next;
            next.reserve(assignment_length);

            while (next.size() < assignment_length)
            {
                const long idx = find_lowest_cost_compatible(pool, next);
                if (idx < 0)
                    break; // dead end, pairings taken so far stay consumed

                next.push_back(pool[idx]);
                pool.erase(pool.begin() + idx);
            }

            if (next.size() == assignment_length)
            {
                Candidate child;
                child.total_cost = total_cost(next);
                child.assignment = std::move(next);
                offspring.push_back(std::move(child));
            }
        }

        if (offspring.empty())
        {
            if (ctx.verbose)
                std::cout << "\t[crossover] no offspring completed\n";
            return parents;
        }

        if (offspring.size() < parents.size())
        {
            const size_t missing = parents.size() - offspring.size();
            if (ctx.verbose)
                std::cout << "\t[crossover] offspring padded with " << missing << " duplicates\n";

            while (offspring.size() < parents.size())
            {
                const int pick = ctx.rng.int_between(0, static_cast<int>(offspring.size()) - 1);
                Candidate dup = offspring[pick];
                offspring.push_back(std::move(dup));
            }
        }

        Population out;
        out.reserve(offspring.size() + parents.size());
        out.insert(out.end(), offspring.begin(), offspring.end());
        out.insert(out.end(), parents.begin(), parents.end());
        return out;
    }

} // namespace ga
