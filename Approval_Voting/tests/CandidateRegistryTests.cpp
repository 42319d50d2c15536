#include <vector>
#include <string>
#include <iostream>
#include <stdexcept>
#include <functional>
#include <unordered_set>

#include "Approval_Voting.h"

static int fail(const char* msg) { std::cout << "FAIL: " << msg << "\n"; return 1; }

int main()
{
    CandidateRegistry reg;
    const CandidateId alice = reg.add("Alice");
    const CandidateId bob = reg.add("Bob");

    if (alice != 0 || bob != 1) return fail("ids should follow registration order from 0");
    if (reg.add("Alice") != alice) return fail("same name should return the same id");
    if (reg.size() != 2) return fail("duplicate name should not grow the registry");
    if (reg.add("alice") == alice) return fail("names are case-sensitive");

    if (!reg.contains("Bob") || reg.contains("Carol")) return fail("contains() mismatch");
    if (reg.idOf("Bob") != bob) return fail("idOf(Bob) mismatch");
    if (reg.nameOf(alice) != "Alice") return fail("nameOf(0) mismatch");

    // Candidates built separately compare by name
    if (!(reg.candidate(bob) == Candidate{"Bob"})) return fail("candidate equality should be by name");
    if (reg.candidate(alice) != Candidate{"Alice"}) return fail("candidate inequality mismatch");

    // Separately built candidates with the same name hash identically
    {
        const std::hash<Candidate> h;
        if (h(Candidate{"Bob"}) != h(reg.candidate(bob))) return fail("equal names should hash identically");

        std::unordered_set<Candidate> seen;
        seen.insert(Candidate{"Alice"});
        seen.insert(Candidate{"Alice"});
        seen.insert(Candidate{"Bob"});
        if (seen.size() != 2) return fail("unordered_set should collapse candidates with the same name");
        if (seen.count(reg.candidate(alice)) != 1) return fail("registry candidate should be found by name");
    }

    bool threw = false;
    try {
        (void)reg.idOf("Carol");
    } catch (const std::out_of_range&) {
        threw = true;
    }
    if (!threw) return fail("idOf unknown name should throw std::out_of_range");

    // Results carry their own copy of the names
    {
        std::vector<Ballot> ballots(1);
        ballots[0].approved = { bob };
        auto result = runApprovalElection(reg, ballots, 1);
        reg.add("Dave");
        if (result.registry.size() != 3) return fail("result registry should not see later additions");
        if (result.registry.nameOf(result.winners[0]) != "Bob") return fail("result should name Bob");
    }

    std::cout << "CandidateRegistryTests: All tests passed.\n";
    return 0;
}
