// tests/test_results.cpp: output shapes

#include "fitness.h"
#include "problem.h"
#include "results.h"
#include "test_helpers.h"
#include "utils.h"

#include <gtest/gtest.h>

using namespace ga;
using namespace ga::test;

static Candidate scored(const CostMatrix& M, const std::vector<std::pair<int, int>>& cells) {
  Candidate c = make_candidate(M, cells);
  evaluate_distance(c, {});
  return c;
}

TEST(RealAgents, EchoesAgentAndTaskObjects) {
  const json agents = json::parse(R"([
    {"agentId": "ann", "email": "ann@example.org", "answers": [
      {"taskId": "t1", "taskName": "Kiln", "cost": 1},
      {"taskId": "t2", "taskName": "Wheel", "cost": 4}]},
    {"agentId": "bob", "answers": [
      {"taskId": "t1", "taskName": "Kiln", "cost": 2},
      {"taskId": "t2", "taskName": "Wheel", "cost": 3}]}
  ])");
  const Problem P = build_problem(agents);
  const Population pop = {scored(P.matrix, {{0, 1}, {1, 0}}), scored(P.matrix, {{0, 0}, {1, 1}})};

  const json out = format_results(P, pop, 5);
  ASSERT_EQ(out.size(), 2u);
  // sorted: cost 4 before cost 6
  EXPECT_DOUBLE_EQ(out[0]["totalCost"].get<double>(), 4.0);
  EXPECT_DOUBLE_EQ(out[0]["distance"].get<double>(), 3.0);
  EXPECT_DOUBLE_EQ(out[1]["totalCost"].get<double>(), 6.0);

  const json& first = out[0]["assignment"][0];
  EXPECT_EQ(first["agent"], agents[0]);
  EXPECT_EQ(first["task"], json::parse(R"({"taskId": "t1", "taskName": "Kiln"})"));
  EXPECT_DOUBLE_EQ(first["cost"].get<double>(), 1.0);
  EXPECT_FALSE(out[0].contains("solution"));
}

TEST(RealAgents, KeepsEqualDistances) {
  const Problem P = build_problem(json::parse(R"([
    {"agentId": "ann", "answers": [{"taskId": "t1", "cost": 1}, {"taskId": "t2", "cost": 1}]}
  ])"));
  const Population pop = {scored(P.matrix, {{0, 0}}), scored(P.matrix, {{0, 1}}), scored(P.matrix, {{0, 0}})};
  EXPECT_EQ(top_results_with_real_agents(P, pop, 2).size(), 2u);
}

TEST(DummyNames, SolutionMatrixAndRowMajorPairs) {
  const Problem P = build_problem(json::parse("[[1, 2, 3], [2, 1, 3], [3, 3, 1]]"),
                                  json::parse(R"(["ann", "bob", "cy"])"),
                                  json::parse(R"(["x", "y", "z"])"));
  const Population pop = {scored(P.matrix, {{2, 2}, {0, 1}, {1, 0}})};

  const json out = format_results(P, pop, 3);
  ASSERT_EQ(out.size(), 1u);
  const json& r = out[0];
  EXPECT_EQ(r["solution"], json::parse("[[0, 1, 0], [1, 0, 0], [0, 0, 1]]"));

  const json& pairs = r["assignment"];
  ASSERT_EQ(pairs.size(), 3u);
  EXPECT_EQ(pairs[0]["agent"], json::parse(R"({"agentId": "ann", "email": "ann"})"));
  EXPECT_EQ(pairs[0]["task"], json::parse(R"({"taskId": "y", "taskName": "y"})"));
  EXPECT_EQ(pairs[1]["agent"]["agentId"], "bob");
  EXPECT_EQ(pairs[1]["task"]["taskId"], "x");
  EXPECT_EQ(pairs[2]["agent"]["agentId"], "cy");
  EXPECT_DOUBLE_EQ(pairs[2]["cost"].get<double>(), 1.0);

  EXPECT_DOUBLE_EQ(r["assignmentRating"].get<double>(), 1.0);
  EXPECT_DOUBLE_EQ(r["totalCost"].get<double>(), 5.0);
}

TEST(DummyNames, DropsRepeatedDistancesAndLimitsCount) {
  const CostMatrix M = make_matrix(kThreeByThree);
  const Problem P = build_problem(json::parse("[[1, 2, 3], [2, 1, 3], [3, 3, 1]]"));
  const Population pop = {
    scored(M, {{0, 0}, {1, 1}, {2, 2}}),   // 3
    scored(M, {{0, 1}, {1, 0}, {2, 2}}),   // 5
    scored(M, {{0, 0}, {1, 1}, {2, 2}}),   // 3 again
    scored(M, {{0, 2}, {1, 0}, {2, 1}}),   // 8
  };

  const json all = top_results_with_dummy_names(P, pop, 10);
  ASSERT_EQ(all.size(), 3u);
  EXPECT_DOUBLE_EQ(all[0]["totalCost"].get<double>(), 3.0);
  EXPECT_DOUBLE_EQ(all[1]["totalCost"].get<double>(), 5.0);
  EXPECT_DOUBLE_EQ(all[2]["totalCost"].get<double>(), 8.0);

  EXPECT_EQ(top_results_with_dummy_names(P, pop, 2).size(), 2u);
}

TEST(AssignmentRating, ShareOfCheapPairs) {
  EXPECT_DOUBLE_EQ(assignment_rating(json::array()), 0.0);
  EXPECT_DOUBLE_EQ(assignment_rating(json::parse(R"([{"cost": 1}, {"cost": 3}, {"cost": 2.5}, {"cost": 7}])")),
                   0.5);
}
