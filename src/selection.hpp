#include <vector>
#include "candidate.hpp"
#include "scoring.hpp"
#include "vote.hpp"

#ifndef MEALVOTE_SELECTION_HPP
#define MEALVOTE_SELECTION_HPP

// how the variety step of smartSelect() treats cuisine / difficulty
//   none     - skipped
//   tracking - bonuses are tracked but do not change the order (default)
//   weighted - greedy pick by score + variety bonus
enum class variety_mode : char { none = 0, tracking, weighted };

struct selection_options {
    bool hasBudget_ = false;
    long budgetLimit_ = 0;                          // cents, valid if hasBudget_
    variety_mode variety_ = variety_mode::tracking;

    static constexpr int cuisineBonus_    = 10;     // cuisine not selected yet
    static constexpr int difficultyBonus_ = 5;      // difficulty not selected yet
};

// Vetoed and negatively scored candidates are dropped, the rest is packed
// greedily by score into the budget and walked for variety, then cut to count.
// The budget step takes the best scores first; it does not look for the
// cheapest combination, a cheaper later candidate is only taken if it still fits.
std::vector<candidate> smartSelect(const std::vector<candidate> &candidates,
                                   const std::vector<vote> &votes,
                                   int count, const selection_options &options);

std::vector<candidate> smartSelect(const std::vector<candidate> &candidates,
                                   const std::vector<vote> &votes,
                                   int count, bool preferVariety = true);

std::vector<candidate> smartSelectWithBudget(const std::vector<candidate> &candidates,
                                             const std::vector<vote> &votes,
                                             int count, long budgetLimit, bool preferVariety = true);

// greedy budget step, input must not contain vetoed candidates
std::vector<scored_candidate> packIntoBudget(std::vector<scored_candidate> scored, long budget, int count);

// variety step, returns at most count entries
std::vector<scored_candidate> applyVariety(std::vector<scored_candidate> scored, int count, variety_mode mode);

// ---- round bookkeeping ----

struct budget_status {
    enum status : char { no_budget = 0, under_budget, near_limit, over_budget };

    status status_;
    long overBy_;       // cents above the limit if over_budget, 0 otherwise

    static constexpr double nearLimitRatio_ = 0.9;
};

long totalCost(const std::vector<candidate> &candidates);  // unknown costs count as 0
budget_status budgetStatus(bool hasLimit, long limit, long spent);
bool isVotingComplete(int members, const std::vector<candidate> &candidates, const std::vector<vote> &votes);

#endif // MEALVOTE_SELECTION_HPP
