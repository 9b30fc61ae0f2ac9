#include <algorithm>
#include <map>
#include "selection.hpp"

constexpr int selection_options::cuisineBonus_;
constexpr int selection_options::difficultyBonus_;
constexpr double budget_status::nearLimitRatio_;

namespace {

// cuisine and difficulty counts of what has been selected so far
struct variety_tracker {
    std::map<std::string, int> cuisines_;
    std::map<difficulty, int> levels_;

    int bonus(const candidate &c) const {
        int b = 0;
        if(cuisines_.find(c.cuisineOrUnknown()) == cuisines_.end()) b += selection_options::cuisineBonus_;
        if(levels_.find(c.level_) == levels_.end()) b += selection_options::difficultyBonus_;
        return b;
    }

    void add(const candidate &c) {
        ++cuisines_[c.cuisineOrUnknown()];
        ++levels_[c.level_];
    }
};

std::vector<candidate> unwrap(const std::vector<scored_candidate> &scored, int count) {
    std::vector<candidate> out;
    for(int i = 0; i < static_cast<int>(scored.size()) && i < count; ++i) out.push_back(scored[i].candidate_);
    return out;
}

} // namespace

std::vector<scored_candidate> packIntoBudget(std::vector<scored_candidate> scored, long budget, int count) {
    sortByScore(scored);

    std::vector<scored_candidate> selected;
    long total = 0;
    for(const auto &s : scored) {
        if(static_cast<int>(selected.size()) >= count) break;
        const long cost = s.candidate_.costOrZero();
        if(total + cost > budget) continue; // skip, a later one may still fit
        selected.push_back(s);
        total += cost;
    }
    return selected;
}

std::vector<scored_candidate> applyVariety(std::vector<scored_candidate> scored, int count, variety_mode mode) {
    sortByScore(scored);
    if(count <= 0) return std::vector<scored_candidate>();
    if(mode == variety_mode::none) {
        if(static_cast<int>(scored.size()) > count) scored.erase(scored.begin() + count, scored.end());
        return scored;
    }

    std::vector<scored_candidate> selected;
    variety_tracker seen;

    if(mode == variety_mode::tracking) {
        // order is left untouched, only the counts are kept
        for(const auto &s : scored) {
            if(static_cast<int>(selected.size()) >= count) break;
            selected.push_back(s);
            seen.add(s.candidate_);
        }
        return selected;
    }

    // weighted: repeatedly take the best score + bonus, earlier (higher score) wins ties
    std::vector<bool> taken(scored.size(), false);
    while(static_cast<int>(selected.size()) < count) {
        int best = -1;
        long bestValue = 0;
        for(std::size_t i = 0; i < scored.size(); ++i) {
            if(taken[i]) continue;
            const long value = scored[i].score_ + seen.bonus(scored[i].candidate_);
            if(best < 0 || value > bestValue) {
                best = static_cast<int>(i);
                bestValue = value;
            }
        }
        if(best < 0) break;
        taken[best] = true;
        selected.push_back(scored[best]);
        seen.add(scored[best].candidate_);
    }
    return selected;
}

std::vector<candidate> smartSelect(const std::vector<candidate> &candidates,
                                   const std::vector<vote> &votes,
                                   int count, const selection_options &options) {
    if(count <= 0) return std::vector<candidate>();

    std::vector<scored_candidate> scored = scoreCandidates(candidates, votes);

    // order of the steps matters for reproducibility
    scored.erase(std::remove_if(scored.begin(), scored.end(),
                                [](const scored_candidate &s) { return s.hasVeto_; }), scored.end());
    scored.erase(std::remove_if(scored.begin(), scored.end(),
                                [](const scored_candidate &s) { return s.score_ < 0; }), scored.end());

    if(options.hasBudget_) scored = packIntoBudget(scored, options.budgetLimit_, count);
    if(options.variety_ != variety_mode::none) scored = applyVariety(scored, count, options.variety_);

    return unwrap(scored, count);
}

std::vector<candidate> smartSelect(const std::vector<candidate> &candidates,
                                   const std::vector<vote> &votes,
                                   int count, bool preferVariety) {
    selection_options options;
    options.variety_ = preferVariety ? variety_mode::tracking : variety_mode::none;
    return smartSelect(candidates, votes, count, options);
}

std::vector<candidate> smartSelectWithBudget(const std::vector<candidate> &candidates,
                                             const std::vector<vote> &votes,
                                             int count, long budgetLimit, bool preferVariety) {
    selection_options options;
    options.hasBudget_ = true;
    options.budgetLimit_ = budgetLimit;
    options.variety_ = preferVariety ? variety_mode::tracking : variety_mode::none;
    return smartSelect(candidates, votes, count, options);
}

long totalCost(const std::vector<candidate> &candidates) {
    long total = 0;
    for(const auto &c : candidates) total += c.costOrZero();
    return total;
}

budget_status budgetStatus(bool hasLimit, long limit, long spent) {
    if(!hasLimit) return budget_status{budget_status::no_budget, 0};
    if(spent > limit) return budget_status{budget_status::over_budget, spent - limit};
    if(static_cast<double>(spent) > static_cast<double>(limit) * budget_status::nearLimitRatio_)
        return budget_status{budget_status::near_limit, 0};
    return budget_status{budget_status::under_budget, 0};
}

bool isVotingComplete(int members, const std::vector<candidate> &candidates, const std::vector<vote> &votes) {
    const long expected = static_cast<long>(members) * static_cast<long>(candidates.size());
    return static_cast<long>(votes.size()) >= expected;
}
