#include <string>

#ifndef MEALVOTE_CANDIDATE_HPP
#define MEALVOTE_CANDIDATE_HPP

enum class difficulty : char { easy = 0, medium, hard };

std::string difficultyName(difficulty d);
difficulty parseDifficulty(const std::string &name); // throws std::invalid_argument

// item being voted on, read-only for the engine
struct candidate {
    // ctors
    candidate(const std::string id, const std::string title = "", const difficulty level = difficulty::medium)
        : id_(id), title_(title), hasCost_(false), cost_(0), level_(level) {}
    candidate(const std::string id, const std::string title, const long cost,
              const std::string cuisine = "", const difficulty level = difficulty::medium)
        : id_(id), title_(title), hasCost_(true), cost_(cost), cuisine_(cuisine), level_(level) {}

    long costOrZero() const { return hasCost_ ? cost_ : 0; }
    std::string cuisineOrUnknown() const { return cuisine_.empty() ? "unknown" : cuisine_; }

    std::string id_;
    std::string title_;      // only used in protocols
    bool hasCost_;
    long cost_;              // total estimated cost in cents, valid if hasCost_
    std::string cuisine_;    // empty if unknown
    difficulty level_;
};

#endif // MEALVOTE_CANDIDATE_HPP
