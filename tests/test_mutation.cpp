// tests/test_mutation.cpp

#include "fitness.h"
#include "mutation.h"
#include "population.h"
#include "test_helpers.h"

#include <gtest/gtest.h>

using namespace ga;
using namespace ga::test;

TEST(Mutate, ZeroChanceLeavesPopulationAlone) {
  TestRun run(kThreeByThree);
  auto pop = generate_population(run.ctx, 10);
  evaluate_population(pop, run.groups);
  const auto before = pop;

  EXPECT_EQ(mutate(pop, 0.0, run.ctx), 0);
  EXPECT_EQ(pop, before);
}

TEST(Mutate, FullChanceReplacesEveryone) {
  TestRun run({{1, 2, 3, 4}, {4, 3, 2, 1}, {2, 2, 2, 2}, {9, 1, 9, 1}});
  auto pop = generate_population(run.ctx, 8);
  for (auto& c : pop) c.distance = -1.0; // stale on purpose

  EXPECT_EQ(mutate(pop, 1.0, run.ctx), 8);
  for (const auto& c : pop) {
    EXPECT_EQ((int)c.assignment.size(), run.ctx.max_assignments);
    EXPECT_DOUBLE_EQ(c.total_cost, total_cost(c.assignment));
    Candidate check = c;
    evaluate_distance(check, run.groups);
    EXPECT_DOUBLE_EQ(c.distance, check.distance);
  }
}

TEST(Mutate, CountTracksChance) {
  TestRun run(kThreeByThree, {}, 5);
  auto pop = generate_population(run.ctx, 400);
  evaluate_population(pop, run.groups);
  const int n = mutate(pop, 0.3, run.ctx);
  EXPECT_GT(n, 60);
  EXPECT_LT(n, 180);
}

TEST(Mutate, SameSeedSameMutations) {
  TestRun a(kThreeByThree, {}, 17), b(kThreeByThree, {}, 17);
  auto pa = generate_population(a.ctx, 20);
  auto pb = generate_population(b.ctx, 20);
  evaluate_population(pa, a.groups);
  evaluate_population(pb, b.groups);
  EXPECT_EQ(mutate(pa, 0.5, a.ctx), mutate(pb, 0.5, b.ctx));
  EXPECT_EQ(pa, pb);
}
