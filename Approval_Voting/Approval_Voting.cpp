// Approval_Voting.cpp : Defines the entry point for the application.
//

#include "Approval_Voting.h"

#include <cstdlib>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <new> // for std::bad_alloc
#include <sstream>

using namespace std;

// Numeric epsilon for FP comparisons in display logic
constexpr double kEps = 1e-9;

constexpr int kMaxSeats = 1000000;

// Upper bound on ballots expanded from one file
constexpr long long kMaxBallots = 10000000;

// --- Candidates ---

CandidateId CandidateRegistry::add(const std::string& name)
{
    auto it = ids_.find(name);
    if (it != ids_.end()) return it->second;
    const CandidateId id = candidates_.size();
    candidates_.push_back(Candidate{name});
    ids_.emplace(name, id);
    return id;
}

bool CandidateRegistry::contains(const std::string& name) const
{
    return ids_.count(name) != 0;
}

CandidateId CandidateRegistry::idOf(const std::string& name) const
{
    auto it = ids_.find(name);
    if (it == ids_.end()) throw std::out_of_range("unknown candidate: " + name);
    return it->second;
}

const std::string& CandidateRegistry::nameOf(CandidateId id) const
{
    return candidates_.at(id).name;
}

BallotParseError::BallotParseError(int line, const std::string& what)
    : std::runtime_error("line " + std::to_string(line) + ": " + what), line_(line)
{
}

InsufficientCandidatesError::InsufficientCandidatesError(int seats, int filled)
    : std::runtime_error("not enough approved candidates to fill " + std::to_string(seats) +
                         " seat(s); only " + std::to_string(filled) + " could be elected"),
      seats_(seats), filled_(filled)
{
}

// --- Election ---

// Step 1: score every candidate not yet elected, in first-seen order.
// slot[id] is the candidate's index into the returned list, or npos when unseen.
static RoundScores scoreRound(const std::vector<Ballot>& ballots,
                              const std::vector<bool>& elected,
                              std::size_t candidateCount)
{
    constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();
    std::vector<std::size_t> slot(candidateCount, npos);
    RoundScores scores;

    for (const auto& b : ballots) {
        for (CandidateId c : b.approved) {
            if (elected[c]) continue;
            if (slot[c] == npos) {
                slot[c] = scores.size();
                scores.emplace_back(c, 0.0);
            }
            scores[slot[c]].second += b.weight;
        }
    }
    return scores;
}

// Step 2: strictly highest score wins; among equals the earliest entry is kept.
static CandidateId selectWinner(const RoundScores& scores)
{
    auto best = scores.begin();
    for (auto it = scores.begin(); it != scores.end(); ++it) {
        if (it->second > best->second) best = it;
    }
    return best->first;
}

static double totalWeight(const std::vector<Ballot>& ballots)
{
    double sum = 0.0;
    for (const auto& b : ballots) sum += b.weight;
    return sum;
}

// Step 4: weight = 1 / (1 + number of elected candidates the ballot approves).
static void reweightBallots(std::vector<Ballot>& ballots, const std::vector<bool>& elected)
{
    for (auto& b : ballots) {
        int m = 0;
        for (CandidateId c : b.approved) if (elected[c]) ++m;
        b.weight = 1.0 / (1.0 + m);
    }
}

void resetBallotWeights(std::vector<Ballot>& ballots)
{
    for (auto& b : ballots) b.weight = 1.0;
}

ElectionResult runApprovalElection(const CandidateRegistry& registry, std::vector<Ballot> ballots, int seats)
{
    if (seats < 0) throw std::invalid_argument("seats must not be negative");

    const std::size_t candidateCount = registry.size();
    for (const auto& b : ballots) {
        for (CandidateId c : b.approved) {
            if (c >= candidateCount) throw std::invalid_argument("ballot refers to an unregistered candidate");
        }
    }

    ElectionResult result;
    result.registry = registry;
    std::vector<bool> elected(candidateCount, false);

    while (static_cast<int>(result.winners.size()) < seats) {
        RoundScores scores = scoreRound(ballots, elected, candidateCount);
        if (scores.empty()) {
            throw InsufficientCandidatesError(seats, static_cast<int>(result.winners.size()));
        }

        const CandidateId winner = selectWinner(scores);
        const double weightedVotes = totalWeight(ballots);

        result.winners.push_back(winner);
        elected[winner] = true;
        result.rounds.push_back(Round{winner, std::move(scores), weightedVotes});

        reweightBallots(ballots, elected);
    }

    result.ballots = std::move(ballots);
    return result;
}

// --- Ballot file ---

// Helper to trim leading/trailing whitespace
static std::string trim(const std::string& s)
{
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// Split on ',' honouring double quotes ("" inside quotes is a literal quote).
static std::vector<std::string> splitFields(const std::string& line, int lineNo)
{
    std::vector<std::string> fields;
    std::string cur;
    bool quoted = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (quoted) {
            if (ch == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cur.push_back('"');
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                cur.push_back(ch);
            }
        } else if (ch == '"') {
            quoted = true;
        } else if (ch == ',') {
            fields.push_back(std::move(cur));
            cur.clear();
        } else {
            cur.push_back(ch);
        }
    }
    if (quoted) throw BallotParseError(lineNo, "unterminated quoted field");
    fields.push_back(std::move(cur));
    return fields;
}

// True if the whole token is an integer; the value goes to out.
static bool parseCount(const std::string& token, long long& out, int lineNo)
{
    if (token.empty()) return false;
    std::size_t idx = 0;
    long long v = 0;
    try {
        v = std::stoll(token, &idx, 10);
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        throw BallotParseError(lineNo, "ballot count out of range: " + token);
    }
    if (idx != token.size()) return false;
    out = v;
    return true;
}

std::vector<Ballot> parseBallots(std::istream& in, CandidateRegistry& registry)
{
    std::vector<Ballot> ballots;
    CandidateRegistry scratch = registry; // committed only if every line parses

    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        const auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        if (trim(line).empty()) continue;

        std::vector<std::string> fields = splitFields(line, lineNo);

        long long count = 1;
        std::size_t firstName = 0;
        if (parseCount(trim(fields.front()), count, lineNo)) {
            if (count < 0) throw BallotParseError(lineNo, "negative ballot count: " + std::to_string(count));
            firstName = 1;
        }
        if (count > kMaxBallots - static_cast<long long>(ballots.size())) {
            throw BallotParseError(lineNo, "ballot count out of range: " + std::to_string(count) +
                                   " (at most " + std::to_string(kMaxBallots) + " ballots per file)");
        }

        Ballot ballot;
        for (std::size_t i = firstName; i < fields.size(); ++i) {
            const std::string name = trim(fields[i]);
            if (name.empty()) continue;
            ballot.approved.push_back(scratch.add(name));
        }

        for (long long k = 0; k < count; ++k) ballots.push_back(ballot);
    }
    if (in.bad()) throw std::runtime_error("error while reading ballots");

    registry = std::move(scratch);
    return ballots;
}

std::vector<Ballot> loadBallotFile(const std::string& path, CandidateRegistry& registry)
{
    if (path == "-") return parseBallots(std::cin, registry);

    std::ifstream file(path);
    if (!file) throw std::runtime_error("cannot open ballot file: " + path);
    return parseBallots(file, registry);
}

// --- Reporting ---

static std::string formatVotes(double v)
{
    std::ostringstream os;
    os << std::setprecision(10) << v;
    return os.str();
}

static std::string formatPercent(double part, double whole)
{
    if (std::abs(whole) <= kEps) return "n/a";
    std::ostringstream os;
    os << std::fixed << std::setprecision(2) << (100.0 * part / whole) << "%";
    return os.str();
}

static void printRoundTable(std::ostream& out, const Round& r, const CandidateRegistry& registry)
{
    const std::vector<std::string> headers = {
        "Name", "Approve", "Do Not Approve", "Percent Approve", "Percent Do Not Approve"
    };

    // Highest score first; stable so ties stay in first-seen order
    RoundScores ordered = r.scores;
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    std::vector<std::vector<std::string>> rows;
    for (const auto& [cand, score] : ordered) {
        const double against = r.weightedVotes - score;
        std::string name = registry.nameOf(cand);
        if (cand == r.winner) name += " (winner)";
        rows.push_back({ name, formatVotes(score), formatVotes(against),
                         formatPercent(score, r.weightedVotes), formatPercent(against, r.weightedVotes) });
    }

    std::vector<std::size_t> width(headers.size());
    for (std::size_t i = 0; i < headers.size(); ++i) width[i] = headers[i].size();
    for (const auto& row : rows)
        for (std::size_t i = 0; i < row.size(); ++i) width[i] = std::max(width[i], row[i].size());

    // Name column left-aligned, numbers right-aligned
    auto printRow = [&](const std::vector<std::string>& row) {
        for (std::size_t i = 0; i < row.size(); ++i) {
            if (i > 0) out << "  ";
            if (i == 0) out << std::left; else out << std::right;
            out << std::setw(static_cast<int>(width[i])) << row[i];
        }
        out << std::right << "\n";
    };

    printRow(headers);
    for (std::size_t i = 0; i < width.size(); ++i) {
        if (i > 0) out << "  ";
        out << std::string(width[i], '-');
    }
    out << "\n";
    for (const auto& row : rows) printRow(row);
}

void printElectionReport(std::ostream& out, const ElectionResult& result)
{
    out << result.ballots.size() << " ballots cast\n";
    out << "Columns represent weighted preferences.\n";

    for (std::size_t i = 0; i < result.rounds.size(); ++i) {
        out << "Round " << (i + 1) << ":\n";
        printRoundTable(out, result.rounds[i], result.registry);
    }

    for (std::size_t i = 0; i < result.winners.size(); ++i) {
        out << "Seat " << (i + 1) << ": " << result.registry.nameOf(result.winners[i]) << " wins\n";
    }
}

// Candidate names are always quoted; embedded quotes are doubled.
static std::string csvQuote(const std::string& name)
{
    std::string quoted = "\"";
    for (char ch : name) {
        quoted += ch;
        if (ch == '"') quoted += '"';
    }
    quoted += '"';
    return quoted;
}

void printCsvHeader(std::ostream& out)
{
    out << "Round";
    out << ",Candidate";
    out << ",Approve";
    out << ",DoNotApprove";
    out << ",WeightedVotes";
    out << ",Status";
    out << "\n";
}

void printCsvRound(std::ostream& out, int round, const Round& r, const CandidateRegistry& registry)
{
    const std::ios_base::fmtflags flags = out.flags();
    const std::streamsize precision = out.precision();
    for (const auto& [cand, score] : r.scores) {
        out << round;
        out << "," << csvQuote(registry.nameOf(cand));
        out << "," << std::fixed << std::setprecision(4) << score;
        out << "," << std::fixed << std::setprecision(4) << (r.weightedVotes - score);
        out << "," << std::fixed << std::setprecision(4) << r.weightedVotes;
        out << "," << (cand == r.winner ? "Elected" : "Continuing");
        out << "\n";
    }
    out.flags(flags);
    out.precision(precision);
}

// --- Command line ---

int parseSeats(const std::string& text)
{
    const auto s = trim(text);
    if (s.empty()) throw std::invalid_argument("seat count is empty");

    std::size_t idx = 0;
    long long v = 0;
    try {
        v = std::stoll(s, &idx, 10);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid seat count: " + s);
    }
    if (idx != s.size()) throw std::invalid_argument("invalid characters in seat count: " + s);
    if (v < 0 || v > kMaxSeats) {
        throw std::invalid_argument("seats must be between 0 and 1,000,000: " + s);
    }
    return static_cast<int>(v);
}

#ifndef APPROVAL_NO_MAIN

struct Options {
    std::string ballotFile;
    int seats = 1;
    bool csv = false;
    bool quiet = false;
};

static void printUsage(std::ostream& out, const char* prog)
{
    out << "Usage: " << prog << " <ballot_file> [--seats N] [--csv] [--quiet]\n";
    out << "  ballot_file  lines of count,name1,name2,... ('-' reads stdin)\n";
    out << "  --seats N    number of winners (default 1)\n";
    out << "  --csv        print rounds as CSV\n";
    out << "  --quiet      print only the winners\n";
}

static bool parseSeatOption(const std::string& value, const char* prog, Options& opts, int& exitCode)
{
    try {
        opts.seats = parseSeats(value);
    } catch (const std::invalid_argument& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        printUsage(std::cerr, prog);
        exitCode = 2;
        return false;
    }
    return true;
}

// Returns false when the program should stop with the given exit code.
static bool parseOptions(int argc, char* argv[], Options& opts, int& exitCode)
{
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(std::cout, argv[0]);
            exitCode = EXIT_SUCCESS;
            return false;
        } else if (arg == "--seats") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --seats needs a value\n";
                printUsage(std::cerr, argv[0]);
                exitCode = 2;
                return false;
            }
            if (!parseSeatOption(argv[++i], argv[0], opts, exitCode)) return false;
        } else if (arg.rfind("--seats=", 0) == 0) {
            if (!parseSeatOption(arg.substr(8), argv[0], opts, exitCode)) return false;
        } else if (arg == "--csv") {
            opts.csv = true;
        } else if (arg == "--quiet") {
            opts.quiet = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: unknown option " << arg << "\n";
            printUsage(std::cerr, argv[0]);
            exitCode = 2;
            return false;
        } else if (opts.ballotFile.empty()) {
            opts.ballotFile = arg;
        } else {
            std::cerr << "Error: unexpected argument " << arg << "\n";
            printUsage(std::cerr, argv[0]);
            exitCode = 2;
            return false;
        }
    }

    if (opts.ballotFile.empty()) {
        printUsage(std::cerr, argv[0]);
        exitCode = 2;
        return false;
    }
    return true;
}

int main(int argc, char* argv[])
{
    try {
        Options opts;
        int exitCode = EXIT_SUCCESS;
        if (!parseOptions(argc, argv, opts, exitCode)) return exitCode;

        CandidateRegistry registry;
        std::vector<Ballot> ballots = loadBallotFile(opts.ballotFile, registry);
        std::cerr << "Loaded " << ballots.size() << " ballot(s), "
                  << registry.size() << " candidate(s).\n";

        const ElectionResult result = runApprovalElection(registry, std::move(ballots), opts.seats);

        if (opts.quiet) {
            for (CandidateId w : result.winners) std::cout << result.registry.nameOf(w) << "\n";
        } else if (opts.csv) {
            printCsvHeader(std::cout);
            for (std::size_t i = 0; i < result.rounds.size(); ++i) {
                printCsvRound(std::cout, static_cast<int>(i + 1), result.rounds[i], result.registry);
            }
        } else {
            printElectionReport(std::cout, result);
        }
        return EXIT_SUCCESS;
    } catch (const BallotParseError& ex) {
        std::cerr << "Error: malformed ballot file, " << ex.what() << "\n";
        return EXIT_FAILURE;
    } catch (const InsufficientCandidatesError& ex) {
        std::cerr << "Error: election cannot complete: " << ex.what() << "\n";
        return EXIT_FAILURE;
    } catch (const std::invalid_argument& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 2;
    } catch (const std::bad_alloc& ex) {
        std::cerr << "Error: memory allocation failed (std::bad_alloc). " << ex.what() << "\n";
        return EXIT_FAILURE;
    } catch (const std::exception& ex) {
        std::cerr << "Unhandled exception: " << ex.what() << "\n";
        return EXIT_FAILURE;
    }
}
#endif
