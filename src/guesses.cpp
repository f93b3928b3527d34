// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "guesses.h"

#include "util.h"
#include "utilstrencodings.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdlib.h>

static const double MAX_GUESSES = std::numeric_limits<double>::max();

int GetReferenceYear()
{
    static const int nReferenceYear = GetYear(GetTime());
    return nReferenceYear;
}

double nCk(double n, double k)
{
    if (k > n)
        return 0;
    if (k == 0)
        return 1;
    double r = 1;
    for (double d = 1; d <= k; d++) {
        r *= n;
        r /= d;
        n -= 1;
    }
    return r;
}

double SaturatingMul(double a, double b)
{
    double r = a * b;
    if (!(r <= MAX_GUESSES))
        return MAX_GUESSES;
    return r;
}

/** sum of C(a + b, k) for k in 1..min(a, b), or 2 when either side is empty */
static double VariationsOf(int a, int b)
{
    if (a == 0 || b == 0)
        return 2;
    double nVariations = 0;
    for (int k = 1; k <= std::min(a, b); k++)
        nVariations += nCk(a + b, k);
    return nVariations;
}

int BruteforceCardinality(const std::u32string& token)
{
    bool fLower = false, fUpper = false, fDigit = false, fSymbol = false, fUnicode = false;
    for (size_t n = 0; n < token.size(); n++) {
        char32_t c = token[n];
        if (IsAsciiLower(c))
            fLower = true;
        else if (IsAsciiUpper(c))
            fUpper = true;
        else if (IsAsciiDigit(c))
            fDigit = true;
        else if (c < 0x80)
            fSymbol = true;
        else
            fUnicode = true;
    }
    int nCardinality = 0;
    if (fLower) nCardinality += BRUTEFORCE_CARDINALITY_LOWER;
    if (fUpper) nCardinality += BRUTEFORCE_CARDINALITY_UPPER;
    if (fDigit) nCardinality += BRUTEFORCE_CARDINALITY_DIGIT;
    if (fSymbol) nCardinality += BRUTEFORCE_CARDINALITY_SYMBOL;
    if (fUnicode) nCardinality += BRUTEFORCE_CARDINALITY_UNICODE;
    return nCardinality;
}

double UppercaseVariations(const std::u32string& word)
{
    int nUpper = 0, nLower = 0;
    for (size_t n = 0; n < word.size(); n++) {
        if (IsUpperChar(word[n]))
            nUpper++;
        else if (IsLowerChar(word[n]))
            nLower++;
    }
    if (nUpper == 0)
        return 1;

    // first letter upper and nothing else, or last letter upper and nothing else
    size_t nLen = word.size();
    if (nLen > 1 && nUpper == 1 && (IsUpperChar(word[0]) || IsUpperChar(word[nLen - 1])))
        return 2;

    if (nLower == 0)
        return std::max<double>(2, std::min<size_t>(nLen, 10));

    double nVariations = 0;
    for (int k = 1; k <= std::min(nUpper, nLower); k++)
        nVariations += nCk(nUpper + nLower, k);
    return nVariations;
}

double LeetVariations(const CMatch& match)
{
    if (match.pattern != PATTERN_LEET)
        return 1;
    const CDictionaryMatch& dict = match.Get<CDictionaryMatch>();
    std::u32string token = ToLower(DecodeUTF8(match.strToken));
    double nVariations = 1;
    for (std::map<std::string, std::string>::const_iterator it = dict.mapSub.begin(); it != dict.mapSub.end(); ++it) {
        std::u32string subbed = DecodeUTF8(it->first);
        std::u32string unsubbed = DecodeUTF8(it->second);
        if (subbed.empty() || unsubbed.empty())
            continue;
        int nSubbed = std::count(token.begin(), token.end(), subbed[0]);
        int nUnsubbed = std::count(token.begin(), token.end(), unsubbed[0]);
        nVariations = SaturatingMul(nVariations, VariationsOf(nSubbed, nUnsubbed));
    }
    return nVariations;
}

double BruteforceGuesses(const CMatch& match)
{
    const CBruteforceMatch& bf = match.Get<CBruteforceMatch>();
    double nGuesses = std::pow(static_cast<double>(bf.nCardinality), static_cast<double>(match.Length()));
    if (!(nGuesses <= MAX_GUESSES))
        nGuesses = MAX_GUESSES;
    return std::max(nGuesses, 1.0);
}

double DictionaryGuesses(const CMatch& match)
{
    const CDictionaryMatch& dict = match.Get<CDictionaryMatch>();
    double nGuesses = dict.nRank;
    nGuesses = SaturatingMul(nGuesses, UppercaseVariations(DecodeUTF8(match.strToken)));
    nGuesses = SaturatingMul(nGuesses, LeetVariations(match));
    if (match.pattern == PATTERN_REVERSE_DICTIONARY)
        nGuesses = SaturatingMul(nGuesses, 2);
    return nGuesses;
}

double SpatialGuesses(const CMatch& match)
{
    const CSpatialMatch& spatial = match.Get<CSpatialMatch>();
    int nLength = match.Length();
    double nGuesses = 0;
    // every shorter run with up to nTurns turns, from every starting key
    for (int i = 2; i <= nLength; i++) {
        int nPossibleTurns = std::min(spatial.nTurns, i - 1);
        for (int j = 1; j <= nPossibleTurns; j++)
            nGuesses += nCk(i - 1, j - 1) * spatial.nStartingPositions * std::pow(spatial.nAverageDegree, j);
    }
    if (spatial.nShiftedCount > 0) {
        int nShifted = spatial.nShiftedCount;
        int nUnshifted = nLength - nShifted;
        nGuesses = SaturatingMul(nGuesses, VariationsOf(nShifted, nUnshifted));
    }
    if (!(nGuesses <= MAX_GUESSES))
        nGuesses = MAX_GUESSES;
    return nGuesses;
}

double RepeatGuesses(const CMatch& match)
{
    const CRepeatMatch& repeat = match.Get<CRepeatMatch>();
    return SaturatingMul(repeat.nBaseGuesses, repeat.nRepeatCount);
}

double SequenceGuesses(const CMatch& match)
{
    const CSequenceMatch& seq = match.Get<CSequenceMatch>();
    std::u32string token = DecodeUTF8(match.strToken);
    if (token.empty())
        return 1;
    char32_t cFirst = token[0];
    double nBase;
    if (cFirst == 'a' || cFirst == 'A' || cFirst == 'z' || cFirst == 'Z' ||
        cFirst == '0' || cFirst == '1' || cFirst == '9')
        nBase = 4;
    else if (IsAsciiDigit(cFirst))
        nBase = 10;
    else
        nBase = 26;
    if (!seq.fAscending)
        nBase *= 2;
    return nBase * token.size();
}

double RegexGuesses(const CMatch& match)
{
    const CRegexMatch& regex = match.Get<CRegexMatch>();
    if (regex.strRegexName == "recent_year") {
        int nYearSpace = abs(atoi(regex.strValue) - GetReferenceYear());
        return std::max(nYearSpace, MIN_YEAR_SPACE);
    }
    return std::max(regex.nRange, 1.0);
}

double DateGuesses(const CMatch& match)
{
    const CDateMatch& date = match.Get<CDateMatch>();
    double nYearSpace = std::max(abs(date.nYear - GetReferenceYear()), MIN_YEAR_SPACE);
    double nGuesses = nYearSpace * 365;
    if (!date.strSeparator.empty())
        nGuesses *= 4;
    return nGuesses;
}

double EstimateGuesses(CMatch& match, size_t nPasswordLength)
{
    if (match.nGuesses > 0)
        return match.nGuesses;

    double nMinGuesses = 1;
    if (match.Length() < nPasswordLength)
        nMinGuesses = match.Length() == 1 ? MIN_SUBMATCH_GUESSES_SINGLE_CHAR : MIN_SUBMATCH_GUESSES_MULTI_CHAR;

    double nGuesses = 1;
    switch (match.pattern) {
    case PATTERN_DICTIONARY:
    case PATTERN_REVERSE_DICTIONARY:
    case PATTERN_LEET: {
        CDictionaryMatch& dict = match.Get<CDictionaryMatch>();
        dict.nUppercaseVariations = UppercaseVariations(DecodeUTF8(match.strToken));
        dict.nLeetVariations = LeetVariations(match);
        nGuesses = DictionaryGuesses(match);
        break;
    }
    case PATTERN_SPATIAL: nGuesses = SpatialGuesses(match); break;
    case PATTERN_REPEAT: nGuesses = RepeatGuesses(match); break;
    case PATTERN_SEQUENCE: nGuesses = SequenceGuesses(match); break;
    case PATTERN_REGEX: nGuesses = RegexGuesses(match); break;
    case PATTERN_DATE: nGuesses = DateGuesses(match); break;
    case PATTERN_BRUTEFORCE: nGuesses = BruteforceGuesses(match); break;
    }

    match.nGuesses = std::max(nGuesses, nMinGuesses);
    match.nGuessesLog10 = std::log10(match.nGuesses);
    return match.nGuesses;
}
