#include <string>
#include <vector>
#include <fstream>
#include <sstream>
#include <Eigen/Dense>
#include "candidate.hpp"
#include "scoring.hpp"
#include "selection.hpp"
#include "vote.hpp"

#ifndef MEALVOTE_VOTING_ROUND_HPP
#define MEALVOTE_VOTING_ROUND_HPP

class voting_round {
    public:
    // ctor, takes path to round file (and delim char), stores data in class members
    voting_round(const std::string path, const char delim = ';', const std::string protocolDir = ".");
    // dtor
    ~voting_round();

    voting_round(const voting_round &) = delete;
    voting_round &operator=(const voting_round &) = delete;

    void score();                            // Borda scores and top candidates
    void rankSchulze();                      // pairwise matrix, strongest paths, ranking
    void analyseConsensus();                 // consensus metrics per candidate
    void select();                           // budget and variety constrained selection
    bool finished() const;                   // true if a selection exists and respects budget and count
    void exportResults(const std::string path = "selection.out") const; // exports results compactly

    // getters
    std::string name() const { return name_; }
    std::string protocolPath() const { return protocolPath_; }
    int numCandidates() const { return candidates_.size(); }
    int numVotes() const { return votes_.size(); }
    int numMembers() const { return numMembers_; }
    int mealCount() const { return mealCount_; }
    const selection_options &options() const { return options_; }
    std::vector<candidate> candidates() const { return candidates_; }
    std::vector<vote> votes() const { return votes_; }
    std::vector<scored_candidate> scores() const { return scores_; }
    std::vector<candidate> ranking() const { return ranking_; }
    std::vector<candidate> selection() const { return selection_; }
    const Eigen::MatrixXi &pairwise() const { return pairwise_; }
    const Eigen::MatrixXi &paths() const { return paths_; }

    private:
    void readCandidate(std::stringstream &lineStream, int line);
    void readVote(std::stringstream &lineStream, int line);

    std::string name_;                       // name of the round (from input file)
    int mealCount_;                          // number of meals to pick (from input file)
    int numMembers_;                         // family size, for completeness check (from input file)
    selection_options options_;              // budget and variety mode (from input file)

    std::vector<candidate> candidates_;      // recipes on the ballot
    std::vector<vote> votes_;                // all votes, including ones on unknown candidates

    std::vector<scored_candidate> scores_;   // result of score()
    Eigen::MatrixXi pairwise_;               // result of rankSchulze()
    Eigen::MatrixXi paths_;                  // result of rankSchulze()
    std::vector<candidate> ranking_;         // result of rankSchulze()
    std::vector<candidate> selection_;       // result of select()

    char delim_;                             // cell delimiter of the round file
    std::ofstream *logger_;                  // markdown protocol of the round
    std::string protocolPath_;

    template <typename T>
    void outputMatrix(const Eigen::Matrix<T, -1, -1> &m);
};

#endif // MEALVOTE_VOTING_ROUND_HPP
