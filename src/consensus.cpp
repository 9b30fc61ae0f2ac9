#include <algorithm>
#include <iomanip>
#include <sstream>
#include "consensus.hpp"

constexpr double consensus_weights::defaultScore_;
constexpr double consensus_weights::defaultConsensus_;
constexpr double consensus_weights::defaultPositive_;
constexpr long   consensus_weights::defaultScoreCap_;

consensus_metrics consensusMetrics(const candidate &c, const std::vector<vote> &votes) {
    consensus_metrics m;
    int positive = 0;

    for(const auto &v : votes) {
        if(v.candidate_ != c.id_) continue;
        ++m.totalVotes_;
        ++m.counts_[static_cast<int>(v.type_)];
        if(isPositive(v.type_)) ++positive;

        vote_outcome o = outcomeOf(v.type_);
        if(o.isVeto()) m.hasVeto_ = true;
        else m.score_ += o.score();
    }

    if(m.totalVotes_ == 0) return m; // everything stays 0

    const int maxCount = *std::max_element(m.counts_.begin(), m.counts_.end());
    m.consensusLevel_ = 100.0 * maxCount / m.totalVotes_;
    m.positivePercentage_ = 100.0 * positive / m.totalVotes_;
    return m;
}

double recommendationStrength(const consensus_metrics &m, const consensus_weights &w) {
    if(m.hasVeto_) return 0.0;

    const long clamped = std::min(std::max(m.score_, 0L), w.scoreCap_);
    const double normalized = w.scoreCap_ > 0 ? 100.0 * clamped / w.scoreCap_ : 0.0;

    return normalized * w.score_
         + m.consensusLevel_ * w.consensus_
         + m.positivePercentage_ * w.positive_;
}

std::vector<candidate> filterByMinimumConsensus(const std::vector<candidate> &candidates,
                                                const std::vector<vote> &votes,
                                                double threshold) {
    std::vector<candidate> kept;
    for(const auto &c : candidates) {
        consensus_metrics m = consensusMetrics(c, votes);
        if(!m.hasVeto_ && m.consensusLevel_ >= threshold) kept.push_back(c);
    }
    return kept;
}

std::string describe(const consensus_metrics &m) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1)
        << "Total Votes: " << m.totalVotes_ << "\n"
        << "Score: " << m.score_ << "\n"
        << "Consensus Level: " << m.consensusLevel_ << "%\n"
        << "Positive: " << m.positivePercentage_ << "%\n"
        << "Vetoed: " << (m.hasVeto_ ? "true" : "false");
    return out.str();
}
