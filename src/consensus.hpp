#include <array>
#include <string>
#include <vector>
#include "candidate.hpp"
#include "vote.hpp"

#ifndef MEALVOTE_CONSENSUS_HPP
#define MEALVOTE_CONSENSUS_HPP

struct consensus_metrics {
    int totalVotes_ = 0;
    long score_ = 0;
    double consensusLevel_ = 0.0;      // 0-100, share of the most common category
    double positivePercentage_ = 0.0;  // 0-100, share of like + super_like
    bool hasVeto_ = false;
    std::array<int, numVoteTypes> counts_ {{0, 0, 0, 0, 0}}; // indexed by vote_type

    int count(vote_type type) const { return counts_[static_cast<int>(type)]; }
};

// weights of recommendationStrength()
struct consensus_weights {
    double score_     = defaultScore_;
    double consensus_ = defaultConsensus_;
    double positive_  = defaultPositive_;
    long scoreCap_    = defaultScoreCap_;   // score at which the score term saturates

    static constexpr double defaultScore_     = 0.4;
    static constexpr double defaultConsensus_ = 0.3;
    static constexpr double defaultPositive_  = 0.3;
    static constexpr long   defaultScoreCap_  = 20;
};

constexpr double defaultMinimumConsensus = 60.0;

consensus_metrics consensusMetrics(const candidate &c, const std::vector<vote> &votes);

// 0 if vetoed, otherwise weighted sum of clamped score, consensus and positive share
double recommendationStrength(const consensus_metrics &m, const consensus_weights &w = consensus_weights());

// candidates without veto whose consensus level reaches threshold, input order kept
std::vector<candidate> filterByMinimumConsensus(const std::vector<candidate> &candidates,
                                                const std::vector<vote> &votes,
                                                double threshold = defaultMinimumConsensus);

std::string describe(const consensus_metrics &m);

#endif // MEALVOTE_CONSENSUS_HPP
