// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PWGUESS_MATCH_H
#define PWGUESS_MATCH_H

#include <map>
#include <stddef.h>
#include <string>
#include <vector>

#include <boost/variant.hpp>

enum MatchPattern {
    PATTERN_DICTIONARY,
    PATTERN_REVERSE_DICTIONARY,
    PATTERN_LEET,
    PATTERN_SPATIAL,
    PATTERN_REPEAT,
    PATTERN_SEQUENCE,
    PATTERN_REGEX,
    PATTERN_DATE,
    PATTERN_BRUTEFORCE,
};

/** Lower-case tag name of a pattern ("dictionary", "spatial", ...) */
const char* GetPatternName(MatchPattern pattern);

/** Shared by plain, reversed and leet dictionary matches */
class CDictionaryMatch
{
public:
    std::string strDictionaryName;
    std::string strMatchedWord;
    int nRank;
    double nUppercaseVariations;
    double nLeetVariations;
    //! leet character found in the password -> letter it stands for
    std::map<std::string, std::string> mapSub;

    CDictionaryMatch() : nRank(0), nUppercaseVariations(1), nLeetVariations(1) {}
    CDictionaryMatch(const std::string& strDictionaryNameIn, const std::string& strMatchedWordIn, int nRankIn)
        : strDictionaryName(strDictionaryNameIn), strMatchedWord(strMatchedWordIn), nRank(nRankIn),
          nUppercaseVariations(1), nLeetVariations(1) {}
};

class CSpatialMatch
{
public:
    std::string strGraph;
    int nTurns;
    int nShiftedCount;
    double nStartingPositions;
    double nAverageDegree;

    CSpatialMatch() : nTurns(0), nShiftedCount(0), nStartingPositions(0), nAverageDegree(0) {}
};

class CRepeatMatch
{
public:
    std::string strBaseToken;
    double nBaseGuesses;
    int nRepeatCount;

    CRepeatMatch() : nBaseGuesses(1), nRepeatCount(0) {}
};

class CSequenceMatch
{
public:
    std::string strSequenceName;
    int nSequenceSpace;
    bool fAscending;
    int nDelta;

    CSequenceMatch() : nSequenceSpace(0), fAscending(true), nDelta(1) {}
};

class CRegexMatch
{
public:
    std::string strRegexName;
    std::string strValue;
    double nRange;

    CRegexMatch() : nRange(0) {}
};

class CDateMatch
{
public:
    int nDay;
    int nMonth;
    int nYear;
    std::string strSeparator;

    CDateMatch() : nDay(0), nMonth(0), nYear(0) {}
};

class CBruteforceMatch
{
public:
    int nCardinality;

    CBruteforceMatch() : nCardinality(0) {}
};

typedef boost::variant<CDictionaryMatch, CSpatialMatch, CRepeatMatch, CSequenceMatch,
    CRegexMatch, CDateMatch, CBruteforceMatch> MatchDetail;

/**
 * A pattern recognized over the code points [i, j] of a password.
 * nGuesses is zero until the match has been estimated.
 */
class CMatch
{
public:
    MatchPattern pattern;
    size_t i;
    size_t j;
    std::string strToken;
    double nGuesses;
    double nGuessesLog10;
    //! equally cheap explanations of the same span, 1 when unambiguous
    int nAlternatives;
    MatchDetail detail;

    CMatch();
    CMatch(MatchPattern patternIn, size_t iIn, size_t jIn, const std::string& strTokenIn, const MatchDetail& detailIn);

    size_t Length() const { return j - i + 1; }

    template <typename T>
    const T& Get() const
    {
        return boost::get<T>(detail);
    }

    template <typename T>
    T& Get()
    {
        return boost::get<T>(detail);
    }

    bool IsDictionary() const
    {
        return pattern == PATTERN_DICTIONARY || pattern == PATTERN_REVERSE_DICTIONARY || pattern == PATTERN_LEET;
    }

    /**
     * Identifies what explains the span (pattern plus its source, such as
     * dictionary and word), so that two matches with equal descriptors on
     * the same span are the same explanation.
     */
    std::string GetDescriptor() const;
    std::string ToString() const;
};

/** Order by start, then end, then descriptor */
bool CompareMatches(const CMatch& a, const CMatch& b);

/** Sort and drop repeated (span, descriptor) entries */
void SortAndUniqueMatches(std::vector<CMatch>& vMatches);

#endif // PWGUESS_MATCH_H
