#include <stdexcept>
#include "candidate.hpp"

std::string difficultyName(difficulty d) {
    switch (d) {
        case difficulty::easy:   return "easy";
        case difficulty::medium: return "medium";
        case difficulty::hard:   return "hard";
    }
    return "unknown";
}

difficulty parseDifficulty(const std::string &name) {
    if(name == "easy")   return difficulty::easy;
    if(name == "medium") return difficulty::medium;
    if(name == "hard")   return difficulty::hard;
    throw std::invalid_argument("unknown difficulty: " + name);
}
