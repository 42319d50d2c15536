// Approval_Voting.h : Include file for standard system include files,
// or project specific include files.

#pragma once

#include <cstddef>
#include <functional>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using CandidateId = std::size_t;

struct Candidate {
    std::string name;
};

inline bool operator==(const Candidate& a, const Candidate& b) { return a.name == b.name; }
inline bool operator!=(const Candidate& a, const Candidate& b) { return !(a == b); }

// Hashes by name, consistent with operator==.
namespace std {
template <>
struct hash<Candidate> {
    std::size_t operator()(const Candidate& c) const noexcept { return std::hash<std::string>()(c.name); }
};
}

// Name -> stable id, assigned in first-registration order starting at 0.
class CandidateRegistry {
public:
    // Returns the existing id when the name is already known.
    CandidateId add(const std::string& name);

    bool contains(const std::string& name) const;
    CandidateId idOf(const std::string& name) const; // throws std::out_of_range
    const std::string& nameOf(CandidateId id) const;
    const Candidate& candidate(CandidateId id) const { return candidates_.at(id); }
    std::size_t size() const { return candidates_.size(); }

private:
    std::vector<Candidate> candidates_;
    std::map<std::string, CandidateId> ids_;
};

struct Ballot {
    std::vector<CandidateId> approved; // order only matters for tie-breaking
    double weight = 1.0;
};

// Scores in the order candidates were first seen during the round.
using RoundScores = std::vector<std::pair<CandidateId, double>>;

struct Round {
    CandidateId winner = 0;
    RoundScores scores;
    double weightedVotes = 0.0; // sum of ballot weights before reweighting
};

struct ElectionResult {
    std::vector<CandidateId> winners; // election order
    std::vector<Round> rounds;
    std::vector<Ballot> ballots;      // weights as left by the last round
    CandidateRegistry registry;
};

class BallotParseError : public std::runtime_error {
public:
    BallotParseError(int line, const std::string& what);
    int line() const { return line_; }

private:
    int line_;
};

class InsufficientCandidatesError : public std::runtime_error {
public:
    InsufficientCandidatesError(int seats, int filled);
    int seats() const { return seats_; }
    int filled() const { return filled_; }

private:
    int seats_;
    int filled_;
};

// Approval voting for one seat, Sequential Proportional Approval Voting (SPAV) for more.
// Ballot order matters: a tie goes to the candidate seen first while scoring.
// Throws InsufficientCandidatesError when no eligible candidate is left with seats unfilled.
ElectionResult runApprovalElection(const CandidateRegistry& registry, std::vector<Ballot> ballots, int seats);

// Set every weight back to 1.0 before reusing ballots for another run.
void resetBallotWeights(std::vector<Ballot>& ballots);

// Read ballots in "count,name1,name2,..." form. '#' starts a comment.
// A first field that is not an integer is taken as a candidate on a single ballot.
// Throws BallotParseError; no partial list is returned.
std::vector<Ballot> parseBallots(std::istream& in, CandidateRegistry& registry);

// Same as parseBallots for a file path; "-" reads stdin.
std::vector<Ballot> loadBallotFile(const std::string& path, CandidateRegistry& registry);

// Human-readable per-round tables followed by the seat list.
void printElectionReport(std::ostream& out, const ElectionResult& result);

// Print CSV header for election rounds
void printCsvHeader(std::ostream& out);

// One CSV row per scored candidate in the round.
void printCsvRound(std::ostream& out, int round, const Round& r, const CandidateRegistry& registry);

// Parse a seat count: whole integer in [0, 1000000]. Throws std::invalid_argument.
int parseSeats(const std::string& text);
