#include <vector>
#include <string>
#include <iostream>

#include "Approval_Voting.h"

static int fail(const char* msg) { std::cout << "FAIL: " << msg << "\n"; return 1; }

static void addBallots(CandidateRegistry& reg, std::vector<Ballot>& ballots,
                       int count, const std::vector<std::string>& names)
{
    Ballot b;
    for (const auto& n : names) b.approved.push_back(reg.add(n));
    for (int i = 0; i < count; ++i) ballots.push_back(b);
}

static bool sameResult(const ElectionResult& a, const ElectionResult& b)
{
    if (a.winners != b.winners) return false;
    if (a.rounds.size() != b.rounds.size()) return false;
    for (std::size_t i = 0; i < a.rounds.size(); ++i) {
        const Round& x = a.rounds[i];
        const Round& y = b.rounds[i];
        // bit-identical, not approximately equal
        if (x.winner != y.winner || x.weightedVotes != y.weightedVotes) return false;
        if (x.scores != y.scores) return false;
    }
    if (a.ballots.size() != b.ballots.size()) return false;
    for (std::size_t i = 0; i < a.ballots.size(); ++i) {
        if (a.ballots[i].weight != b.ballots[i].weight) return false;
        if (a.ballots[i].approved != b.ballots[i].approved) return false;
    }
    return true;
}

int main()
{
    CandidateRegistry reg;
    std::vector<Ballot> ballots;
    addBallots(reg, ballots, 7, {"Red", "Green"});
    addBallots(reg, ballots, 3, {"Blue", "Green", "Yellow"});
    addBallots(reg, ballots, 5, {"Yellow"});
    addBallots(reg, ballots, 2, {"Red", "Blue"});
    addBallots(reg, ballots, 4, {"Purple", "Green"});

    // Two fresh runs over identical input
    {
        auto a = runApprovalElection(reg, ballots, 4);
        auto b = runApprovalElection(reg, ballots, 4);
        if (!sameResult(a, b)) return fail("identical input gave different results");
    }

    // Reusing mutated ballots needs a reset first
    {
        auto first = runApprovalElection(reg, ballots, 3);
        std::vector<Ballot> reused = first.ballots;
        bool anyReduced = false;
        for (const auto& b : reused) if (b.weight < 1.0) anyReduced = true;
        if (!anyReduced) return fail("weights should be reduced after a 3-seat run");

        resetBallotWeights(reused);
        for (const auto& b : reused) if (b.weight != 1.0) return fail("reset should restore weight 1.0");

        auto second = runApprovalElection(reg, reused, 3);
        if (!sameResult(first, second)) return fail("reset ballots should reproduce the first run");
    }

    // The caller's ballot list is not touched by a run
    {
        auto result = runApprovalElection(reg, ballots, 2);
        (void)result;
        for (const auto& b : ballots) if (b.weight != 1.0) return fail("input ballots should keep weight 1.0");
    }

    std::cout << "DeterminismTests: All tests passed.\n";
    return 0;
}
