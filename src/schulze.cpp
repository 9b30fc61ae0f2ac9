#include <algorithm>
#include <map>
#include <numeric>
#include "schulze.hpp"

Eigen::MatrixXi buildPairwiseMatrix(const std::vector<candidate> &candidates,
                                    const std::vector<vote> &votes) {
    const int n = candidates.size();
    Eigen::MatrixXi matrix = Eigen::MatrixXi::Zero(n, n);

    // ballots per voter: candidate id -> outcome of the first vote on it
    std::map<std::string, std::map<std::string, vote_outcome>> ballots;
    for(const auto &v : votes) {
        ballots[v.voter_].emplace(v.candidate_, outcomeOf(v.type_));
    }

    std::vector<vote_outcome> row(n, vote_outcome::scored(0));
    for(const auto &b : ballots) {
        for(int i = 0; i < n; ++i) {
            auto it = b.second.find(candidates[i].id_);
            row[i] = it != b.second.end() ? it->second : vote_outcome::scored(0);
        }
        for(int i = 0; i < n; ++i) {
            for(int j = 0; j < n; ++j) {
                if(i != j && row[i] > row[j]) ++matrix(i, j);
            }
        }
    }
    return matrix;
}

Eigen::MatrixXi computeStrongestPaths(const Eigen::MatrixXi &pairwise) {
    const int n = pairwise.rows();
    Eigen::MatrixXi paths = pairwise;

    for(int k = 0; k < n; ++k) {             // intermediate
        for(int i = 0; i < n; ++i) {
            if(i == k) continue;
            for(int j = 0; j < n; ++j) {
                if(j == i || j == k) continue;
                paths(i, j) = std::max(paths(i, j), std::min(paths(i, k), paths(k, j)));
            }
        }
    }
    return paths;
}

Eigen::VectorXi schulzeWins(const Eigen::MatrixXi &paths) {
    const int n = paths.rows();
    Eigen::VectorXi wins = Eigen::VectorXi::Zero(n);
    for(int i = 0; i < n; ++i) {
        for(int j = 0; j < n; ++j) {
            if(i != j && paths(i, j) > paths(j, i)) ++wins(i);
        }
    }
    return wins;
}

std::vector<int> schulzeOrder(const Eigen::MatrixXi &paths) {
    Eigen::VectorXi wins = schulzeWins(paths);

    std::vector<int> order(paths.rows());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&wins](int l, int r) { return wins(l) > wins(r); });
    return order;
}

std::vector<candidate> schulzeRank(const std::vector<candidate> &candidates,
                                   const Eigen::MatrixXi &paths) {
    std::vector<candidate> ranked;
    ranked.reserve(candidates.size());
    for(int i : schulzeOrder(paths)) ranked.push_back(candidates[i]);
    return ranked;
}

std::vector<candidate> schulzeRank(const std::vector<candidate> &candidates,
                                   const std::vector<vote> &votes) {
    if(candidates.empty()) return std::vector<candidate>();
    return schulzeRank(candidates, computeStrongestPaths(buildPairwiseMatrix(candidates, votes)));
}
