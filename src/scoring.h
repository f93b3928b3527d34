// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PWGUESS_SCORING_H
#define PWGUESS_SCORING_H

#include "match.h"

#include <string>
#include <vector>

/** Upper bounds (exclusive) of scores 0..3; anything above scores 4 */
static const double SCORE_THRESHOLDS[] = {1e3, 1e6, 1e8, 1e10};

/** Two guess counts closer than this (relatively) count as a tie */
static const double GUESSES_TIE_EPSILON = 1e-9;

/** The cheapest explanation of a whole password */
class COptimalSequence
{
public:
    //! non-overlapping, ordered, covering every code point
    std::vector<CMatch> vSequence;
    double nGuesses;
    double nGuessesLog10;

    COptimalSequence() : nGuesses(1), nGuessesLog10(0) {}
};

/** Bruteforce filler for password[i, j] with its estimate */
CMatch MakeBruteforceMatch(const std::u32string& password, size_t i, size_t j);

/**
 * Pick the cheapest non-overlapping cover of the password from the
 * candidates, filling uncovered stretches with bruteforce matches. The
 * candidates need not carry estimates.
 */
COptimalSequence MostGuessableMatchSequence(const std::u32string& password, const std::vector<CMatch>& vMatches);

int GuessesToScore(double nGuesses);

#endif // PWGUESS_SCORING_H
