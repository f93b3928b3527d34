// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "scoring.h"

#include "guesses.h"
#include "util.h"
#include "utilstrencodings.h"

#include <algorithm>
#include <cmath>
#include <string.h>

static bool NearlyEqual(double a, double b)
{
    return std::fabs(a - b) <= GUESSES_TIE_EPSILON * std::max(std::fabs(a), std::fabs(b));
}

CMatch MakeBruteforceMatch(const std::u32string& password, size_t i, size_t j)
{
    CBruteforceMatch bf;
    bf.nCardinality = BruteforceCardinality(password.substr(i, j - i + 1));
    CMatch match(PATTERN_BRUTEFORCE, i, j, EncodeUTF8(password, i, j + 1), bf);
    EstimateGuesses(match, password.size());
    return match;
}

namespace
{
/** A candidate ending at some position, with what it would cost to end there */
struct CCandidateCost {
    const CMatch* pmatch;
    double nCost;
    int nTies;
};

/** Cheaper first, then fewer alternatives, earlier start, pattern name, descriptor */
bool BetterCandidate(const CCandidateCost& a, const CCandidateCost& b)
{
    if (!NearlyEqual(a.nCost, b.nCost))
        return a.nCost < b.nCost;
    if (a.nTies != b.nTies)
        return a.nTies < b.nTies;
    if (a.pmatch->i != b.pmatch->i)
        return a.pmatch->i < b.pmatch->i;
    int nCmp = strcmp(GetPatternName(a.pmatch->pattern), GetPatternName(b.pmatch->pattern));
    if (nCmp != 0)
        return nCmp < 0;
    return a.pmatch->GetDescriptor() < b.pmatch->GetDescriptor();
}
} // anon namespace

COptimalSequence MostGuessableMatchSequence(const std::u32string& password, const std::vector<CMatch>& vMatches)
{
    COptimalSequence result;
    size_t n = password.size();
    if (n == 0)
        return result;

    // candidates with estimates, grouped by the position they end at
    std::vector<CMatch> vEstimated(vMatches);
    std::vector<std::vector<size_t> > vByEnd(n);
    for (size_t m = 0; m < vEstimated.size(); m++) {
        if (vEstimated[m].j >= n || vEstimated[m].i > vEstimated[m].j)
            continue;
        EstimateGuesses(vEstimated[m], n);
        vByEnd[vEstimated[m].j].push_back(m);
    }

    // optimal[k] explains password[0, k); vChoice[k] is the last match of it
    std::vector<double> optimal(n + 1, 1);
    std::vector<CMatch> vChoice(n + 1);
    size_t nGapStart = 0;

    for (size_t k = 1; k <= n; k++) {
        const std::vector<size_t>& vEnding = vByEnd[k - 1];
        if (!vEnding.empty()) {
            bool fHaveBest = false;
            CCandidateCost best;
            for (size_t a = 0; a < vEnding.size(); a++) {
                const CMatch& match = vEstimated[vEnding[a]];
                CCandidateCost cand;
                cand.pmatch = &match;
                cand.nTies = 0;
                for (size_t b = 0; b < vEnding.size(); b++) {
                    const CMatch& other = vEstimated[vEnding[b]];
                    if (other.i == match.i && NearlyEqual(other.nGuesses, match.nGuesses))
                        cand.nTies++;
                }
                cand.nCost = SaturatingMul(SaturatingMul(optimal[match.i], match.nGuesses), cand.nTies);
                if (!fHaveBest || BetterCandidate(cand, best)) {
                    best = cand;
                    fHaveBest = true;
                }
            }
            optimal[k] = best.nCost;
            vChoice[k] = *best.pmatch;
            vChoice[k].nAlternatives = best.nTies;
            nGapStart = k;
        } else {
            vChoice[k] = MakeBruteforceMatch(password, nGapStart, k - 1);
            optimal[k] = SaturatingMul(optimal[nGapStart], vChoice[k].nGuesses);
        }
    }

    for (size_t k = n; k > 0; k = vChoice[k].i)
        result.vSequence.push_back(vChoice[k]);
    std::reverse(result.vSequence.begin(), result.vSequence.end());

    result.nGuesses = optimal[n];
    result.nGuessesLog10 = std::log10(result.nGuesses);
    LogPrint("scoring", "%s: %u matches, guesses=%g\n", __func__, result.vSequence.size(), result.nGuesses);
    return result;
}

int GuessesToScore(double nGuesses)
{
    int nScore = 0;
    while (nScore < 4 && nGuesses >= SCORE_THRESHOLDS[nScore])
        nScore++;
    return nScore;
}
