#include <exception>
#include <iostream>
#include "voting_round.hpp"

int main(int argc, char** argv) {
    try {
        voting_round week(argc > 1 ? argv[1] : "../data/family_week.csv", argc > 2 ? argv[2][0] : ';');
        week.score();
        week.rankSchulze();
        week.analyseConsensus();
        week.select();
        week.exportResults();
        std::cout << "Protocol written to " << week.protocolPath() << "\n";
        return week.finished() ? 0 : 2;
    } catch(const std::exception &e) {
        std::cerr << "mealvote_round: " << e.what() << "\n";
        return 1;
    }
}
