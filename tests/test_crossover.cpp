// tests/test_crossover.cpp: greedy pool-draining crossover

#include "crossover.h"
#include "fitness.h"
#include "population.h"
#include "test_helpers.h"

#include <gtest/gtest.h>

using namespace ga;
using namespace ga::test;

TEST(Crossover, SingleParentIsReturnedUnchanged) {
  TestRun run(kThreeByThree);
  auto p = make_candidate(run.matrix, {{0, 1}, {1, 2}, {2, 0}});
  evaluate_distance(p, run.groups);

  const Population parents = {p};
  EXPECT_EQ(crossover(parents, run.ctx), parents);
  EXPECT_TRUE(crossover(Population{}, run.ctx).empty());
}

TEST(Crossover, CheapestPairingsFormTheFirstOffspring) {
  TestRun run(kThreeByThree);
  const auto p1 = make_candidate(run.matrix, {{0, 0}, {1, 1}, {2, 2}}); // 1 + 1 + 1
  const auto p2 = make_candidate(run.matrix, {{0, 1}, {1, 2}, {2, 0}}); // 2 + 3 + 3

  const auto out = crossover({p1, p2}, run.ctx);
  ASSERT_EQ(out.size(), 4u);

  EXPECT_EQ(out[0].assignment, p1.assignment);
  EXPECT_DOUBLE_EQ(out[0].total_cost, 3.0);

  const std::vector<Assignment> second = {{0, 1, 2.0}, {1, 2, 3.0}, {2, 0, 3.0}};
  EXPECT_EQ(out[1].assignment, second);
  EXPECT_DOUBLE_EQ(out[1].total_cost, 8.0);

  // parents ride along after the offspring
  EXPECT_EQ(out[2], p1);
  EXPECT_EQ(out[3], p2);
}

TEST(Crossover, DeadEndsAreDroppedAndGapsPadded) {
  // p2 reuses column 1, so once the cheap pairings are gone the rest conflict.
  TestRun run({{1, 5, 9}, {9, 1, 9}, {9, 5, 9}});
  const auto p1 = make_candidate(run.matrix, {{0, 0}, {1, 1}});
  const auto p2 = make_candidate(run.matrix, {{0, 1}, {2, 1}});

  const auto out = crossover({p1, p2}, run.ctx);
  ASSERT_EQ(out.size(), 4u);

  const std::vector<Assignment> only = {{0, 0, 1.0}, {1, 1, 1.0}};
  EXPECT_EQ(out[0].assignment, only);
  EXPECT_EQ(out[1].assignment, only); // padded duplicate
  EXPECT_EQ(out[2], p1);
  EXPECT_EQ(out[3], p2);
}

TEST(Crossover, NoCompletedOffspringReturnsParents) {
  TestRun run({{1, 2}, {3, 4}});
  // Both parents sit on row 0 only; no two pooled pairings are compatible.
  const auto p = make_candidate(run.matrix, {{0, 0}, {0, 1}});
  const Population parents = {p, p};
  EXPECT_EQ(crossover(parents, run.ctx), parents);
}

TEST(Crossover, OffspringAreStructurallyValid) {
  TestRun run({{4, 8, 1, 3, 7},
               {2, 6, 9, 5, 1},
               {8, 3, 2, 7, 4},
               {5, 1, 6, 2, 9},
               {3, 9, 4, 8, 2}}, {}, 23);
  for (int round = 0; round < 20; ++round) {
    auto parents = generate_population(run.ctx, 6);
    const auto out = crossover(parents, run.ctx);
    ASSERT_GE(out.size(), parents.size());
    const size_t offspring = out.size() - parents.size();
    for (size_t i = 0; i < offspring; ++i) {
      EXPECT_LE(out[i].assignment.size(), parents[0].assignment.size());
      EXPECT_TRUE(is_structurally_valid(out[i], run.ctx.max_assignments));
      EXPECT_DOUBLE_EQ(out[i].total_cost, total_cost(out[i].assignment));
    }
  }
}

TEST(Crossover, OutputIsOffspringPlusParentsOrParentsAlone) {
  TestRun run(kThreeByThree, {}, 8);
  auto parents = generate_population(run.ctx, 5);
  const auto out = crossover(parents, run.ctx);
  EXPECT_TRUE(out.size() == 2 * parents.size() || out == parents);
}

TEST(FindLowestCost, FirstOccurrenceWinsTies) {
  const std::vector<Assignment> pool = {{0, 0, 2.0}, {1, 1, 1.0}, {2, 2, 1.0}, {0, 1, 1.0}};
  EXPECT_EQ(find_lowest_cost_compatible(pool, {}), 1);
  EXPECT_EQ(find_lowest_cost_compatible(pool, {{1, 0, 5.0}}), 2);
  EXPECT_EQ(find_lowest_cost_compatible(pool, {{9, 1, 0.0}, {9, 2, 0.0}}), 0);
  EXPECT_EQ(find_lowest_cost_compatible(pool, {{0, 9, 0.0}, {1, 8, 0.0}, {2, 7, 0.0}}), -1);
}
