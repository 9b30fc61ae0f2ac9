#include <algorithm>
#include <unordered_map>
#include "scoring.hpp"

std::vector<scored_candidate> scoreCandidates(const std::vector<candidate> &candidates,
                                              const std::vector<vote> &votes) {
    std::vector<scored_candidate> results;
    results.reserve(candidates.size());

    // candidate id -> positions in results, duplicated ids get the same tally
    std::unordered_map<std::string, std::vector<std::size_t>> index;
    for(std::size_t i = 0; i < candidates.size(); ++i) {
        results.emplace_back(scored_candidate(candidates[i]));
        index[candidates[i].id_].push_back(i);
    }

    for(const auto &v : votes) {
        auto it = index.find(v.candidate_);
        if(it == index.end()) continue; // vote on a candidate outside this round

        vote_outcome o = outcomeOf(v.type_);
        for(std::size_t i : it->second) {
            if(o.isVeto()) results[i].hasVeto_ = true;
            else results[i].score_ += o.score();
        }
    }

    std::stable_sort(results.begin(), results.end(),
        [](const scored_candidate &l, const scored_candidate &r) {
            if(l.hasVeto_ != r.hasVeto_) return !l.hasVeto_; // non-vetoed first
            return l.score_ > r.score_;
        });
    return results;
}

void sortByScore(std::vector<scored_candidate> &scored) {
    std::stable_sort(scored.begin(), scored.end(),
        [](const scored_candidate &l, const scored_candidate &r) { return l.score_ > r.score_; });
}

std::vector<candidate> selectTop(const std::vector<candidate> &candidates,
                                 const std::vector<vote> &votes, int count) {
    std::vector<candidate> top;
    if(count <= 0) return top;

    for(const auto &s : scoreCandidates(candidates, votes)) {
        if(s.hasVeto_ || s.score_ < 0) continue;
        top.push_back(s.candidate_);
        if(static_cast<int>(top.size()) == count) break;
    }
    return top;
}
