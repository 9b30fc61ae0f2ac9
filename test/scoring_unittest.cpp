#include <gtest/gtest.h>

#include <scoring.hpp>
#include <test_util.hpp>

using namespace mealvote_test;

TEST(ScoringTest, AllLikes)
{
  auto recipes = makeCandidates(3);
  auto votes   = unanimous(recipes, 3, vote_type::like);

  auto results = scoreCandidates(recipes, votes);
  ASSERT_EQ(results.size(), 3u);
  for(const auto &r : results)
  {
    ASSERT_EQ(r.score_, 3);
    ASSERT_FALSE(r.hasVeto_);
  }
  // equal scores keep input order
  ASSERT_EQ(results[0].candidate_.id_, "r0");
  ASSERT_EQ(results[2].candidate_.id_, "r2");
}

TEST(ScoringTest, WithVeto)
{
  auto recipes = makeCandidates(1);
  std::vector< vote > votes = {vote("m0", "r0", vote_type::like),
                               vote("m1", "r0", vote_type::like),
                               vote("m2", "r0", vote_type::veto)};

  auto results = scoreCandidates(recipes, votes);
  ASSERT_TRUE(results[0].hasVeto_);
  ASSERT_EQ(results[0].score_, 2);  // the veto never enters the sum
}

TEST(ScoringTest, MixedVotes)
{
  auto recipes = makeCandidates(1);
  std::vector< vote > votes = {vote("m0", "r0", vote_type::super_like),
                               vote("m1", "r0", vote_type::like),
                               vote("m2", "r0", vote_type::ok),
                               vote("m3", "r0", vote_type::dislike)};

  ASSERT_EQ(scoreCandidates(recipes, votes)[0].score_, -97);
}

TEST(ScoringTest, OrderingVetoLast)
{
  auto recipes = makeCandidates(3);
  std::vector< vote > votes = {vote("m0", "r0", vote_type::super_like),
                               vote("m1", "r0", vote_type::veto),
                               vote("m0", "r1", vote_type::dislike),
                               vote("m0", "r2", vote_type::like)};

  auto results = scoreCandidates(recipes, votes);
  ASSERT_EQ(results[0].candidate_.id_, "r2");
  ASSERT_EQ(results[1].candidate_.id_, "r1");
  ASSERT_EQ(results[2].candidate_.id_, "r0");
  ASSERT_TRUE(results[2].hasVeto_);
}

TEST(ScoringTest, UnknownCandidatesAndDuplicates)
{
  auto recipes = makeCandidates(1);
  std::vector< vote > votes = {vote("m0", "elsewhere", vote_type::veto),
                               vote("m0", "r0", vote_type::like),
                               vote("m0", "r0", vote_type::like)};

  auto results = scoreCandidates(recipes, votes);
  ASSERT_EQ(results.size(), 1u);
  ASSERT_EQ(results[0].score_, 2);
  ASSERT_FALSE(results[0].hasVeto_);
}

TEST(ScoringTest, EmptyInput)
{
  ASSERT_TRUE(scoreCandidates({}, {}).empty());

  auto results = scoreCandidates(makeCandidates(2), {});
  ASSERT_EQ(results.size(), 2u);
  ASSERT_EQ(results[0].score_, 0);
  ASSERT_FALSE(results[1].hasVeto_);
}

TEST(ScoringTest, Deterministic)
{
  auto recipes = makeCandidates(4);
  std::vector< vote > votes = {vote("m0", "r3", vote_type::like),
                               vote("m1", "r1", vote_type::like),
                               vote("m1", "r2", vote_type::veto)};

  auto a = scoreCandidates(recipes, votes);
  auto b = scoreCandidates(recipes, votes);
  ASSERT_EQ(a.size(), b.size());
  for(std::size_t i = 0; i < a.size(); ++i)
  {
    ASSERT_EQ(a[i].candidate_.id_, b[i].candidate_.id_);
    ASSERT_EQ(a[i].score_, b[i].score_);
  }
}

TEST(SelectTopTest, ExcludesVetoed)
{
  auto recipes = makeCandidates(3);
  std::vector< vote > votes = {vote("m0", "r0", vote_type::like),
                               vote("m0", "r1", vote_type::like),
                               vote("m0", "r2", vote_type::veto)};

  auto selected = selectTop(recipes, votes, 3);
  ASSERT_EQ(ids(selected), (std::vector< std::string >{"r0", "r1"}));
}

TEST(SelectTopTest, ExcludesNegativeScores)
{
  auto recipes = makeCandidates(3);
  std::vector< vote > votes = {vote("m0", "r0", vote_type::like),
                               vote("m1", "r0", vote_type::like),
                               vote("m0", "r1", vote_type::like),
                               vote("m1", "r1", vote_type::ok),
                               vote("m0", "r2", vote_type::dislike),
                               vote("m1", "r2", vote_type::ok)};

  auto selected = selectTop(recipes, votes, 3);
  ASSERT_EQ(ids(selected), (std::vector< std::string >{"r0", "r1"}));
}

TEST(SelectTopTest, CountLimits)
{
  auto recipes = makeCandidates(5);
  auto votes   = unanimous(recipes, 2, vote_type::like);

  ASSERT_TRUE(selectTop(recipes, votes, 0).empty());
  ASSERT_TRUE(selectTop(recipes, votes, -1).empty());
  ASSERT_EQ(selectTop(recipes, votes, 2).size(), 2u);
  ASSERT_EQ(selectTop(recipes, votes, 10).size(), 5u);
}

TEST(ScoringTest, DuplicateIdsShareTally)
{
  std::vector< candidate > recipes = {candidate("r0", "Soup"), candidate("r1", "Bread"),
                                      candidate("r0", "Soup again")};
  std::vector< vote > votes = {vote("m0", "r0", vote_type::like),
                               vote("m1", "r0", vote_type::like),
                               vote("m1", "r1", vote_type::veto)};

  auto results = scoreCandidates(recipes, votes);
  ASSERT_EQ(results.size(), 3u);
  ASSERT_EQ(results[0].candidate_.title_, "Soup");
  ASSERT_EQ(results[0].score_, 2);
  ASSERT_EQ(results[1].candidate_.title_, "Soup again");
  ASSERT_EQ(results[1].score_, 2);
  ASSERT_EQ(results[2].candidate_.id_, "r1");
  ASSERT_TRUE(results[2].hasVeto_);
  ASSERT_EQ(results[2].score_, 0);
}
