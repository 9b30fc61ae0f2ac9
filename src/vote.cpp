#include <stdexcept>
#include "vote.hpp"

bool vote_outcome::operator<(const vote_outcome &o) const {
    if(veto_ || o.veto_) return veto_ && !o.veto_; // veto is below every score
    return score_ < o.score_;
}

bool vote_outcome::operator==(const vote_outcome &o) const {
    if(veto_ || o.veto_) return veto_ == o.veto_;
    return score_ == o.score_;
}

int scoreOf(vote_type type) {
    switch (type) {
        case vote_type::super_like: return 2;
        case vote_type::like:       return 1;
        case vote_type::ok:         return 0;
        case vote_type::dislike:    return -100; // soft veto, outweighs any realistic sum of likes
        case vote_type::veto:       return 0;    // disqualifies, never summed
    }
    return 0;
}

vote_outcome outcomeOf(vote_type type) {
    if(type == vote_type::veto) return vote_outcome::vetoed();
    return vote_outcome::scored(scoreOf(type));
}

bool isPositive(vote_type type) {
    return type == vote_type::like || type == vote_type::super_like;
}

std::string voteTypeName(vote_type type) {
    switch (type) {
        case vote_type::super_like: return "super_like";
        case vote_type::like:       return "like";
        case vote_type::ok:         return "ok";
        case vote_type::dislike:    return "dislike";
        case vote_type::veto:       return "veto";
    }
    return "unknown";
}

std::string voteTypeLabel(vote_type type) {
    switch (type) {
        case vote_type::super_like: return "Love It!";
        case vote_type::like:       return "Like";
        case vote_type::ok:         return "It's OK";
        case vote_type::dislike:    return "Dislike";
        case vote_type::veto:       return "Never";
    }
    return "?";
}

vote_type parseVoteType(const std::string &name) {
    if(name == "super_like" || name == "superLike") return vote_type::super_like;
    if(name == "like")    return vote_type::like;
    if(name == "ok")      return vote_type::ok;
    if(name == "dislike") return vote_type::dislike;
    if(name == "veto")    return vote_type::veto;
    throw std::invalid_argument("unknown vote category: " + name);
}
