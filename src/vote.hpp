#include <ctime>
#include <string>

#ifndef MEALVOTE_VOTE_HPP
#define MEALVOTE_VOTE_HPP

// closed set of vote categories, see scoreOf() for the weights
enum class vote_type : char { super_like = 0, like, ok, dislike, veto };

constexpr int numVoteTypes = 5;

// result of a single vote: either a plain score or a veto
// a veto is never turned into a number, it only compares below every score
class vote_outcome {
    public:
    static vote_outcome scored(int score) { return vote_outcome(false, score); }
    static vote_outcome vetoed() { return vote_outcome(true, 0); }

    bool isVeto() const { return veto_; }
    int score() const { return score_; } // 0 for a veto, check isVeto() first

    bool operator<(const vote_outcome &o) const;
    bool operator>(const vote_outcome &o) const { return o < *this; }
    bool operator==(const vote_outcome &o) const;
    bool operator!=(const vote_outcome &o) const { return !(*this == o); }

    private:
    vote_outcome(bool veto, int score) : veto_(veto), score_(score) {}

    bool veto_;
    int score_;
};

struct vote {
    // ctor
    vote(const std::string voter, const std::string candidate, const vote_type type,
         const std::string comment = "", const std::time_t timestamp = 0)
        : voter_(voter), candidate_(candidate), type_(type), comment_(comment), timestamp_(timestamp) {}

    std::string voter_;
    std::string candidate_;
    vote_type type_;
    std::string comment_;    // optional free text
    std::time_t timestamp_;  // seconds since epoch, 0 if unknown
};

vote_outcome outcomeOf(vote_type type);
int scoreOf(vote_type type);                  // weight of a non-veto category, 0 for veto
bool isPositive(vote_type type);              // like or super_like

std::string voteTypeName(vote_type type);     // canonical name, e.g. "super_like"
std::string voteTypeLabel(vote_type type);    // display label, e.g. "Love It!"
vote_type parseVoteType(const std::string &name); // throws std::invalid_argument

#endif // MEALVOTE_VOTE_HPP
