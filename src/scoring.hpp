#include <vector>
#include "candidate.hpp"
#include "vote.hpp"

#ifndef MEALVOTE_SCORING_HPP
#define MEALVOTE_SCORING_HPP

struct scored_candidate {
    // ctor
    scored_candidate(const candidate &c, const long score = 0, const bool hasVeto = false)
        : candidate_(c), score_(score), hasVeto_(hasVeto) {}

    candidate candidate_;
    long score_;     // sum of non-veto vote weights
    bool hasVeto_;   // at least one veto vote
};

// Modified Borda count: sums vote weights per candidate, vetoes are flagged, not summed.
// Votes on unknown candidates are ignored, duplicate votes are all counted.
// Result: non-vetoed first, then score descending; ties keep input order.
std::vector<scored_candidate> scoreCandidates(const std::vector<candidate> &candidates,
                                              const std::vector<vote> &votes);

// the first count candidates that are neither vetoed nor negatively scored
std::vector<candidate> selectTop(const std::vector<candidate> &candidates,
                                 const std::vector<vote> &votes, int count);

// sorts by score descending, stable
void sortByScore(std::vector<scored_candidate> &scored);

#endif // MEALVOTE_SCORING_HPP
