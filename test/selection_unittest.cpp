#include <gtest/gtest.h>

#include <selection.hpp>
#include <test_util.hpp>

using namespace mealvote_test;

struct SmartSelectionTest : public ::testing::Test
{
  // r0 italian easy 10.00, r1 italian hard 20.00, r2 thai easy 15.00, r3 mexican medium no cost
  SmartSelectionTest()
  {
    recipes = {candidate("r0", "Pasta", 1000, "italian", difficulty::easy),
               candidate("r1", "Lasagne", 2000, "italian", difficulty::hard),
               candidate("r2", "Curry", 1500, "thai", difficulty::easy),
               candidate("r3", "Tacos", difficulty::medium)};
    recipes[3].cuisine_ = "mexican";

    // r1: 6, r0: 4, r2: 3, r3: 1
    votes = {vote("m0", "r1", vote_type::super_like),
             vote("m1", "r1", vote_type::super_like),
             vote("m2", "r1", vote_type::super_like),
             vote("m0", "r0", vote_type::super_like),
             vote("m1", "r0", vote_type::super_like),
             vote("m0", "r2", vote_type::super_like),
             vote("m1", "r2", vote_type::like),
             vote("m0", "r3", vote_type::like)};
  }

  std::vector< candidate > recipes;
  std::vector< vote > votes;
};

TEST(SmartSelectionBudgetTest, BudgetConstraint)
{
  std::vector< candidate > recipes = {candidate("r0", "A", 1000),
                                      candidate("r1", "B", 2000),
                                      candidate("r2", "C", 1500)};
  auto votes = unanimous(recipes, 1, vote_type::like);

  auto selected = smartSelectWithBudget(recipes, votes, 3, 2500, false);
  ASSERT_LE(totalCost(selected), 2500);
  ASSERT_EQ(ids(selected), (std::vector< std::string >{"r0", "r2"}));
}

TEST_F(SmartSelectionTest, NoBudgetOrdersByScore)
{
  auto selected = smartSelect(recipes, votes, 10, false);
  ASSERT_EQ(ids(selected), (std::vector< std::string >{"r1", "r0", "r2", "r3"}));
}

TEST_F(SmartSelectionTest, GreedySkipsWhatDoesNotFit)
{
  // r1 (20.00) first, r0 (10.00) would exceed 25.00, r2 neither, r3 costs nothing
  auto selected = smartSelectWithBudget(recipes, votes, 3, 2500, false);
  ASSERT_EQ(ids(selected), (std::vector< std::string >{"r1", "r3"}));
  ASSERT_LE(totalCost(selected), 2500);
}

TEST_F(SmartSelectionTest, BudgetStopsAtCount)
{
  auto selected = smartSelectWithBudget(recipes, votes, 1, 100000, false);
  ASSERT_EQ(ids(selected), (std::vector< std::string >{"r1"}));
}

TEST_F(SmartSelectionTest, ZeroBudgetOnlyFreeCandidates)
{
  auto selected = smartSelectWithBudget(recipes, votes, 4, 0);
  ASSERT_EQ(ids(selected), (std::vector< std::string >{"r3"}));
}

TEST_F(SmartSelectionTest, TrackingVarietyKeepsOrder)
{
  ASSERT_EQ(ids(smartSelect(recipes, votes, 3, true)), ids(smartSelect(recipes, votes, 3, false)));
  ASSERT_EQ(ids(smartSelectWithBudget(recipes, votes, 3, 3500, true)),
            ids(smartSelectWithBudget(recipes, votes, 3, 3500, false)));
}

TEST_F(SmartSelectionTest, WeightedVarietyPrefersNewCuisines)
{
  selection_options options;
  options.variety_ = variety_mode::weighted;

  // after r1 (italian, hard): r0 4 + 5 = 9, r2 3 + 15 = 18, r3 1 + 15 = 16
  // after r2 (thai, easy): r0 4 + 0 = 4, r3 1 + 15 = 16
  auto selected = smartSelect(recipes, votes, 3, options);
  ASSERT_EQ(ids(selected), (std::vector< std::string >{"r1", "r2", "r3"}));
}

TEST_F(SmartSelectionTest, VetoedNeverSelected)
{
  votes.emplace_back(vote("m3", "r1", vote_type::veto));

  selection_options options;
  options.variety_ = variety_mode::weighted;
  for(int count = 0; count <= 5; ++count)
  {
    for(const auto &c : smartSelect(recipes, votes, count, options))
      ASSERT_NE(c.id_, "r1");
    for(const auto &c : smartSelectWithBudget(recipes, votes, count, 100000))
      ASSERT_NE(c.id_, "r1");
    for(const auto &c : selectTop(recipes, votes, count))
      ASSERT_NE(c.id_, "r1");
  }
}

TEST_F(SmartSelectionTest, NegativeScoresDropped)
{
  votes.emplace_back(vote("m2", "r0", vote_type::dislike));
  auto selected = smartSelect(recipes, votes, 4);
  ASSERT_EQ(ids(selected), (std::vector< std::string >{"r1", "r2", "r3"}));
}

TEST_F(SmartSelectionTest, DegenerateInput)
{
  ASSERT_TRUE(smartSelect(recipes, votes, 0).empty());
  ASSERT_TRUE(smartSelect(recipes, votes, -3).empty());
  ASSERT_TRUE(smartSelect({}, {}, 3).empty());

  std::vector< vote > vetoes;
  for(const auto &c : recipes)
    vetoes.emplace_back(vote("m0", c.id_, vote_type::veto));
  ASSERT_TRUE(smartSelectWithBudget(recipes, vetoes, 3, 5000).empty());
}

TEST(BudgetStatusTest, Thresholds)
{
  ASSERT_EQ(budgetStatus(false, 0, 1234).status_, budget_status::no_budget);
  ASSERT_EQ(budgetStatus(true, 10000, 5000).status_, budget_status::under_budget);
  ASSERT_EQ(budgetStatus(true, 10000, 9000).status_, budget_status::under_budget);
  ASSERT_EQ(budgetStatus(true, 10000, 9001).status_, budget_status::near_limit);
  ASSERT_EQ(budgetStatus(true, 10000, 10000).status_, budget_status::near_limit);

  budget_status over = budgetStatus(true, 10000, 12500);
  ASSERT_EQ(over.status_, budget_status::over_budget);
  ASSERT_EQ(over.overBy_, 2500);
}

TEST(VotingCompleteTest, CountsVotes)
{
  auto recipes = makeCandidates(3);
  auto votes   = unanimous(recipes, 2, vote_type::ok);

  ASSERT_TRUE(isVotingComplete(2, recipes, votes));
  ASSERT_FALSE(isVotingComplete(3, recipes, votes));
  ASSERT_TRUE(isVotingComplete(0, recipes, {}));
}
