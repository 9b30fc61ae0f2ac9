#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <stdexcept>
#include <unordered_set>
#include "consensus.hpp"
#include "schulze.hpp"
#include "voting_round.hpp"

namespace {

// delete '\n' or CR (ASCII 13) at end of a cell (some files carry invisible line ends)
std::string chomp(std::string s) {
    while(!s.empty() && (s[s.length()-1] == '\n' || s[s.length()-1] == (char)13)) s.erase(s.length()-1);
    return s;
}

// reads the next cell, leaves it empty if the line has no more cells
void nextCell(std::stringstream &lineStream, std::string &cell, const char delim) {
    if(!std::getline(lineStream, cell, delim)) cell.clear();
}

std::string money(long cents) {
    std::ostringstream out;
    out << (cents < 0 ? "-" : "") << std::labs(cents) / 100 << "." << std::setw(2) << std::setfill('0') << std::labs(cents) % 100;
    return out.str();
}

} // namespace

// ctor, takes path to round file in csv format (and delim char), stores data in class members
voting_round::voting_round(const std::string path, const char delim, const std::string protocolDir)
    : mealCount_(0), numMembers_(0), delim_(delim), logger_(nullptr) {

    std::ifstream in(path);
    if(!in) throw std::runtime_error("cannot open round file: " + path);

    std::string line, cell;
    std::string variety_msg; // for logger

    // header: name;budget;meals;variety;members
    std::getline(in, line);
    std::stringstream lineStream(chomp(line));
    std::getline(lineStream, cell, delim); // title (first cell)
    name_ = cell;
    if(name_.empty()) throw std::runtime_error(path + ":1: round name missing");

    // trailing fields may be left out, a missing field reads as empty
    nextCell(lineStream, cell, delim); // budget in cents, empty for none
    if(!cell.empty()) {
        options_.hasBudget_ = true;
        options_.budgetLimit_ = std::stol(cell);
    }
    nextCell(lineStream, cell, delim);
    mealCount_ = cell.empty() ? 0 : std::stoi(cell);

    nextCell(lineStream, cell, delim);
    switch (cell.empty() ? 1 : std::stoi(cell)) {
        case 0:
            options_.variety_ = variety_mode::none;
            variety_msg = "No variety step.";
            break;
        case 1:
            options_.variety_ = variety_mode::tracking;
            variety_msg = "Cuisines and difficulties are tracked, order by score.";
            break;
        case 2:
            options_.variety_ = variety_mode::weighted;
            variety_msg = "Score plus variety bonus (+10 new cuisine, +5 new difficulty).";
            break;
        default:
            options_.variety_ = variety_mode::tracking; // default, although input is invalid
            variety_msg = "Invalid variety mode in file, cuisines and difficulties are tracked only.";
            break;
    }

    nextCell(lineStream, cell, delim);
    if(!cell.empty()) numMembers_ = std::stoi(cell);

    // records
    int lineNo = 1;
    while(std::getline(in, line)) {
        ++lineNo;
        line = chomp(line);
        if(line.empty() || line[0] == '#') continue;

        std::stringstream recordStream(line);
        std::getline(recordStream, cell, delim);
        if(cell == "C") readCandidate(recordStream, lineNo);
        else if(cell == "V") readVote(recordStream, lineNo);
        else throw std::runtime_error(path + ":" + std::to_string(lineNo) + ": unknown record type '" + cell + "'");
    }

    // construct logger, only once the file parsed
    std::string file = "Protocol_" + name_ + ".md";
    std::replace(file.begin(), file.end(), ' ', '_');
    protocolPath_ = protocolDir + "/" + file;
    logger_ = new std::ofstream(protocolPath_);

    // init protocol
    *logger_ << "# " << name_ << " - Voting Protocol\n"
             << "## Input\n"
             << "* Input from file: `" << path << "`\n"
             << "* Candidates: " << candidates_.size() << "\n"
             << "* Votes: " << votes_.size() << "\n"
             << "* Meals to pick: " << mealCount_ << "\n"
             << "* Budget: " << (options_.hasBudget_ ? money(options_.budgetLimit_) : std::string("none")) << "\n"
             << "* Variety: " << variety_msg << "\n";
    if(numMembers_ > 0) {
        *logger_ << "* Voting complete: " << (isVotingComplete(numMembers_, candidates_, votes_) ? "yes" : "no")
                 << " (" << numMembers_ << " members)\n";
    }

    std::unordered_set<std::string> ids;
    for(const auto &c : candidates_) ids.insert(c.id_);
    int unknown = 0;
    for(const auto &v : votes_) if(ids.find(v.candidate_) == ids.end()) ++unknown;
    if(unknown > 0) *logger_ << "* Ignored " << unknown << " vote(s) on candidates not in this round.\n";
    *logger_ << "\n" << std::flush;
}

//dtor
voting_round::~voting_round() {
    delete logger_;
}

// C;id;title;cost;cuisine;difficulty
void voting_round::readCandidate(std::stringstream &lineStream, int line) {
    std::string id, title, cost, cuisine, level;
    std::getline(lineStream, id, delim_);
    std::getline(lineStream, title, delim_);
    std::getline(lineStream, cost, delim_);
    std::getline(lineStream, cuisine, delim_);
    std::getline(lineStream, level, delim_);
    if(id.empty()) throw std::runtime_error("line " + std::to_string(line) + ": candidate without id");

    const difficulty d = level.empty() ? difficulty::medium : parseDifficulty(level);
    if(cost.empty()) {
        candidate c(id, title, d);
        c.cuisine_ = cuisine;
        candidates_.push_back(c);
    } else {
        candidates_.emplace_back(candidate(id, title, std::stol(cost), cuisine, d));
    }
}

// V;voter;candidate;category;comment;timestamp
void voting_round::readVote(std::stringstream &lineStream, int line) {
    std::string voter, cand, category, comment, timestamp;
    std::getline(lineStream, voter, delim_);
    std::getline(lineStream, cand, delim_);
    std::getline(lineStream, category, delim_);
    std::getline(lineStream, comment, delim_);
    std::getline(lineStream, timestamp, delim_);
    if(voter.empty() || cand.empty())
        throw std::runtime_error("line " + std::to_string(line) + ": vote needs voter and candidate");

    votes_.emplace_back(vote(voter, cand, parseVoteType(category), comment,
                             timestamp.empty() ? 0 : static_cast<std::time_t>(std::stoll(timestamp))));
}

// computes modified Borda scores, stores them in scores_
void voting_round::score() {
    *logger_ << "## Scores\n";
    scores_ = scoreCandidates(candidates_, votes_);

    *logger_ << "| # | Candidate | Score | Veto |\n"
             << "|:---:|:---:|:---:|:---:|\n";
    for(std::size_t i = 0; i < scores_.size(); ++i) {
        const auto &s = scores_[i];
        *logger_ << "| " << i+1 << " | " << s.candidate_.id_ << " | "
                 << s.score_ << " | " << (s.hasVeto_ ? "yes" : "") << " |\n";
    }

    *logger_ << "\n* Top " << mealCount_ << " by score: ";
    for(const auto &c : selectTop(candidates_, votes_, mealCount_)) *logger_ << c.id_ << ", ";
    *logger_ << "\n\n" << std::flush;
}

// Schulze method, stores pairwise_, paths_ and ranking_
void voting_round::rankSchulze() {
    *logger_ << "## Schulze\n";
    pairwise_ = buildPairwiseMatrix(candidates_, votes_);
    paths_ = computeStrongestPaths(pairwise_);
    std::vector<int> order = schulzeOrder(paths_);
    ranking_.clear();
    for(int i : order) ranking_.push_back(candidates_[i]);

    *logger_ << "### Pairwise preferences\n";
    outputMatrix(pairwise_);
    *logger_ << "\n### Strongest paths\n";
    outputMatrix(paths_);

    Eigen::VectorXi wins = schulzeWins(paths_);
    *logger_ << "\n### Ranking\n";
    for(std::size_t r = 0; r < order.size(); ++r) {
        *logger_ << r+1 << ". " << candidates_[order[r]].id_ << " (" << wins(order[r]) << " wins)\n";
    }
    *logger_ << "\n" << std::flush;
}

void voting_round::analyseConsensus() {
    *logger_ << "## Consensus\n"
             << "| Candidate | ";
    for(int t = 0; t < numVoteTypes; ++t) *logger_ << voteTypeLabel(static_cast<vote_type>(t)) << " | ";
    *logger_ << "Consensus | Positive | Strength |\n|";
    for(int t = 0; t < numVoteTypes + 4; ++t) *logger_ << ":---:|";
    *logger_ << "\n";

    for(const auto &c : candidates_) {
        consensus_metrics m = consensusMetrics(c, votes_);
        *logger_ << "| " << c.id_ << " | ";
        for(int t = 0; t < numVoteTypes; ++t) *logger_ << m.counts_[t] << " | ";
        *logger_ << std::fixed << std::setprecision(1)
                 << m.consensusLevel_ << " | " << m.positivePercentage_ << " | "
                 << recommendationStrength(m) << " |\n";
    }
    *logger_ << std::defaultfloat
             << "\n* Candidates with at least " << defaultMinimumConsensus << "% consensus: ";
    for(const auto &c : filterByMinimumConsensus(candidates_, votes_)) *logger_ << c.id_ << ", ";
    *logger_ << "\n\n" << std::flush;
}

// final pick of mealCount_ candidates, stores it in selection_
void voting_round::select() {
    *logger_ << "## Selection\n";
    selection_ = smartSelect(candidates_, votes_, mealCount_, options_);

    for(std::size_t i = 0; i < selection_.size(); ++i) {
        const auto &c = selection_[i];
        *logger_ << i+1 << ". " << c.id_;
        if(!c.title_.empty()) *logger_ << " - " << c.title_;
        *logger_ << " (" << c.cuisineOrUnknown() << ", " << difficultyName(c.level_);
        if(c.hasCost_) *logger_ << ", " << money(c.cost_);
        *logger_ << ")\n";
    }
    if(static_cast<int>(selection_.size()) < mealCount_) {
        *logger_ << "\n* Only " << selection_.size() << " of " << mealCount_ << " meals could be filled.\n";
    }

    const long spent = totalCost(selection_);
    budget_status b = budgetStatus(options_.hasBudget_, options_.budgetLimit_, spent);
    *logger_ << "\n* Estimated cost: " << money(spent) << "\n* Budget status: ";
    switch (b.status_) {
        case budget_status::no_budget:    *logger_ << "no budget"; break;
        case budget_status::under_budget: *logger_ << "under budget"; break;
        case budget_status::near_limit:   *logger_ << "near limit"; break;
        case budget_status::over_budget:  *logger_ << "over budget by " << money(b.overBy_); break;
    }
    *logger_ << "\n\n" << std::flush;
}

// returns true if a selection was made that fits count and budget
bool voting_round::finished() const {
    if(selection_.empty() || static_cast<int>(selection_.size()) > mealCount_) return false;
    return !options_.hasBudget_ || totalCost(selection_) <= options_.budgetLimit_;
}

// outputs matrix as markdown table, rows and columns labelled by candidate id
template <typename T>
void voting_round::outputMatrix(const Eigen::Matrix<T, -1, -1> &m) {
    std::string sep = "";
    for(int j = 0; j <= m.cols(); ++j) sep += ":---:|";
    sep = "|" + sep;

    *logger_ << "|  | ";
    for(int j = 0; j < m.cols(); ++j) *logger_ << candidates_[j].id_ << " | ";
    *logger_ << "\n" << sep << "\n";

    for(int i = 0; i < m.rows(); ++i) {
        *logger_ << "| " << candidates_[i].id_ << " | ";
        for(int j = 0; j < m.cols(); ++j) {
            if(i == j) *logger_ << "- | ";
            else *logger_ << m(i, j) << " | ";
        }
        *logger_ << "\n";
    }
}

void voting_round::exportResults(const std::string path) const {
    std::ofstream out(path);
    // selection
    for(const auto &c : selection_) out << c.id_ << delim_;
    out << "\n";
    // schulze ranking
    for(const auto &c : ranking_) out << c.id_ << delim_;
    out << "\n";
    // scores in score order, vetoed as "veto"
    for(const auto &s : scores_) {
        out << s.candidate_.id_ << "=";
        if(s.hasVeto_) out << voteTypeName(vote_type::veto);
        else out << s.score_;
        out << delim_;
    }
    out << "\n";
}
