// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PWGUESS_GUESSES_H
#define PWGUESS_GUESSES_H

#include "match.h"

#include <string>

/** Guess floors for a match shorter than the whole password */
static const double MIN_SUBMATCH_GUESSES_SINGLE_CHAR = 10;
static const double MIN_SUBMATCH_GUESSES_MULTI_CHAR = 50;

/** Years closer than this to the reference year still cost this many guesses */
static const int MIN_YEAR_SPACE = 20;

static const int BRUTEFORCE_CARDINALITY_LOWER = 26;
static const int BRUTEFORCE_CARDINALITY_UPPER = 26;
static const int BRUTEFORCE_CARDINALITY_DIGIT = 10;
static const int BRUTEFORCE_CARDINALITY_SYMBOL = 33;
static const int BRUTEFORCE_CARDINALITY_UNICODE = 100;

/** Year the date and recent_year estimates are measured from, fixed per process */
int GetReferenceYear();

/** Binomial coefficient over doubles, 0 when k > n */
double nCk(double n, double k);

/** a * b, clamped to the largest finite double */
double SaturatingMul(double a, double b);

int BruteforceCardinality(const std::u32string& token);
double UppercaseVariations(const std::u32string& word);
double LeetVariations(const CMatch& match);

double BruteforceGuesses(const CMatch& match);
double DictionaryGuesses(const CMatch& match);
double SpatialGuesses(const CMatch& match);
double RepeatGuesses(const CMatch& match);
double SequenceGuesses(const CMatch& match);
double RegexGuesses(const CMatch& match);
double DateGuesses(const CMatch& match);

/**
 * Fill in nGuesses and nGuessesLog10 of a match found in a password of
 * nPasswordLength code points. Matches that already carry an estimate are
 * left alone. Returns the estimate.
 */
double EstimateGuesses(CMatch& match, size_t nPasswordLength);

#endif // PWGUESS_GUESSES_H
