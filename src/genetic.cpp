// genetic.cpp
#include "genetic.h"
#include "crossover.h"
#include "fitness.h"
#include "mutation.h"
#include "population.h"
#include "selection.h"

#include <iostream>
#include "utils.h"

namespace ga
{

    Population advance_generation(Population pop, double mutation_chance, RunContext &ctx)
    {
        const size_t before = pop.size();

        sort_by_distance(pop);
        mutate(pop, mutation_chance, ctx);
        evaluate_population(pop, ctx.groups);
        sort_by_distance(pop);

        const Population parents = select_parents(pop, ctx.rng);

        Population next = crossover(parents, ctx);
        if (next.size() < before)
        {
            if (ctx.verbose)
                std::cout << "\t[crossover] no offspring created, keeping mutated population\n";
            next = std::move(pop);
        }
        evaluate_population(next, ctx.groups);
        return next;
    }

    GeneticResult run_genetic(RunContext &ctx, const GeneticOptions &opts)
    {
        const long long t0 = NowMillis();

        GeneticResult res;
        Population population = generate_population(ctx, opts.population_size);

        int generation = 0;
        while (generation < opts.max_generations)
        {
            evaluate_population(population, ctx.groups);
            population = advance_generation(std::move(population), opts.mutation_chance, ctx);
            sort_by_distance(population);

            const Candidate &best = population.front();
            res.best_distance.push_back(best.distance);

            const int every = opts.log_every > 0 ? opts.log_every : 1;
            if (ctx.verbose && (generation % every == 0))
            {
                const auto prec = std::cout.precision(6);
                std::cout << "[gen " << (generation + 1) << "] "
                          << "best_distance=" << best.distance
                          << " best_cost=" << best.total_cost
                          << " population=" << population.size() << "\n";
                std::cout.precision(prec);
            }

            ++generation;
            if (best.distance < opts.distance_threshold)
            {
                res.converged = true;
                break;
            }
        }

        if (generation == 0)
        {
            evaluate_population(population, ctx.groups);
            sort_by_distance(population);
        }

        res.generations = generation;
        res.population = std::move(population);

        if (ctx.verbose && !res.population.empty())
        {
            const Candidate &best = res.population.front();
            std::cout << "[done] generations=" << res.generations
                      << " converged=" << (res.converged ? "yes" : "no")
                      << " best_distance=" << best.distance
                      << " best_cost=" << best.total_cost
                      << " elapsed=" << (NowMillis() - t0) << "ms\n";
        }
        return res;
    }

} // namespace ga
