#include <vector>
#include <Eigen/Dense>
#include "candidate.hpp"
#include "vote.hpp"

#ifndef MEALVOTE_SCHULZE_HPP
#define MEALVOTE_SCHULZE_HPP

// (i,j) = number of voters who rate candidates[i] strictly above candidates[j].
// A missing vote counts as "ok", a veto ranks below everything. O(V * N^2).
Eigen::MatrixXi buildPairwiseMatrix(const std::vector<candidate> &candidates,
                                    const std::vector<vote> &votes);

// Schulze strongest paths, Floyd-Warshall style closure. O(N^3), meant for
// tens of candidates; beyond ~50 this gets slow and callers should pre-filter.
Eigen::MatrixXi computeStrongestPaths(const Eigen::MatrixXi &pairwise);

// wins(i) = number of j with paths(i,j) > paths(j,i)
Eigen::VectorXi schulzeWins(const Eigen::MatrixXi &paths);

// candidate indices ordered by wins descending, ties keep input order
std::vector<int> schulzeOrder(const Eigen::MatrixXi &paths);

// candidates ordered by Schulze wins, ties keep input order.
// Vetoes are not filtered here, pre-filter if needed.
std::vector<candidate> schulzeRank(const std::vector<candidate> &candidates,
                                   const std::vector<vote> &votes);

// same, from already computed strongest paths over candidates
std::vector<candidate> schulzeRank(const std::vector<candidate> &candidates,
                                   const Eigen::MatrixXi &paths);

#endif // MEALVOTE_SCHULZE_HPP
