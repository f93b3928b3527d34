// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "guesses.h"
#include "util.h"
#include "utilstrencodings.h"

#include <cmath>
#include <limits>

#include <boost/test/unit_test.hpp>

static CMatch MakeDictionaryMatch(MatchPattern pattern, const std::string& strToken, int nRank)
{
    size_t nLength = UTF8Length(strToken);
    return CMatch(pattern, 0, nLength - 1, strToken, CDictionaryMatch("passwords", ToLowerUTF8(strToken), nRank));
}

BOOST_AUTO_TEST_SUITE(guesses_tests)

BOOST_AUTO_TEST_CASE(binomials)
{
    BOOST_CHECK_EQUAL(nCk(0, 0), 1);
    BOOST_CHECK_EQUAL(nCk(1, 0), 1);
    BOOST_CHECK_EQUAL(nCk(5, 0), 1);
    BOOST_CHECK_EQUAL(nCk(0, 1), 0);
    BOOST_CHECK_EQUAL(nCk(0, 5), 0);
    BOOST_CHECK_EQUAL(nCk(2, 1), 2);
    BOOST_CHECK_EQUAL(nCk(4, 2), 6);
    BOOST_CHECK_EQUAL(nCk(33, 7), 4272048);

    BOOST_CHECK_EQUAL(SaturatingMul(3, 4), 12);
    BOOST_CHECK_EQUAL(SaturatingMul(std::numeric_limits<double>::max(), 2), std::numeric_limits<double>::max());
}

BOOST_AUTO_TEST_CASE(cardinality)
{
    BOOST_CHECK_EQUAL(BruteforceCardinality(DecodeUTF8("abc")), 26);
    BOOST_CHECK_EQUAL(BruteforceCardinality(DecodeUTF8("aB")), 52);
    BOOST_CHECK_EQUAL(BruteforceCardinality(DecodeUTF8("a1")), 36);
    BOOST_CHECK_EQUAL(BruteforceCardinality(DecodeUTF8("!")), 33);
    BOOST_CHECK_EQUAL(BruteforceCardinality(DecodeUTF8("aB1!")), 95);
    BOOST_CHECK_EQUAL(BruteforceCardinality(DecodeUTF8("\xc3\xa9")), 100);
    BOOST_CHECK_EQUAL(BruteforceCardinality(std::u32string()), 0);
}

BOOST_AUTO_TEST_CASE(uppercase_variations)
{
    BOOST_CHECK_EQUAL(UppercaseVariations(DecodeUTF8("")), 1);
    BOOST_CHECK_EQUAL(UppercaseVariations(DecodeUTF8("a")), 1);
    BOOST_CHECK_EQUAL(UppercaseVariations(DecodeUTF8("abcdef")), 1);
    BOOST_CHECK_EQUAL(UppercaseVariations(DecodeUTF8("123")), 1);
    BOOST_CHECK_EQUAL(UppercaseVariations(DecodeUTF8("Abcdef")), 2);
    BOOST_CHECK_EQUAL(UppercaseVariations(DecodeUTF8("abcdeF")), 2);
    BOOST_CHECK_EQUAL(UppercaseVariations(DecodeUTF8("A")), 2);
    BOOST_CHECK_EQUAL(UppercaseVariations(DecodeUTF8("ABCDEF")), 6);
    BOOST_CHECK_EQUAL(UppercaseVariations(DecodeUTF8("ABCDEFGHIJKLMNOP")), 10);
    BOOST_CHECK_EQUAL(UppercaseVariations(DecodeUTF8("aBcdef")), nCk(6, 1));
    BOOST_CHECK_EQUAL(UppercaseVariations(DecodeUTF8("aBcDef")), nCk(6, 1) + nCk(6, 2));
    BOOST_CHECK_EQUAL(UppercaseVariations(DecodeUTF8("ABCDEf")), nCk(6, 1));
    BOOST_CHECK_EQUAL(UppercaseVariations(DecodeUTF8("aBCDEf")), nCk(6, 1) + nCk(6, 2));
    BOOST_CHECK_EQUAL(UppercaseVariations(DecodeUTF8("ABCdef")), nCk(6, 1) + nCk(6, 2) + nCk(6, 3));
}

BOOST_AUTO_TEST_CASE(leet_variations)
{
    CMatch match = MakeDictionaryMatch(PATTERN_DICTIONARY, "password", 2);
    BOOST_CHECK_EQUAL(LeetVariations(match), 1);

    match = MakeDictionaryMatch(PATTERN_LEET, "p4ssw0rd", 2);
    CDictionaryMatch& dict = match.Get<CDictionaryMatch>();
    dict.strMatchedWord = "password";
    dict.mapSub["4"] = "a";
    dict.mapSub["0"] = "o";
    BOOST_CHECK_EQUAL(LeetVariations(match), 4);

    // a letter both substituted and kept counts its combinations
    match = MakeDictionaryMatch(PATTERN_LEET, "4a4a", 5);
    match.Get<CDictionaryMatch>().mapSub["4"] = "a";
    BOOST_CHECK_EQUAL(LeetVariations(match), nCk(4, 1) + nCk(4, 2));
}

BOOST_AUTO_TEST_CASE(dictionary_guesses)
{
    CMatch match = MakeDictionaryMatch(PATTERN_DICTIONARY, "aaaaa", 32);
    BOOST_CHECK_EQUAL(DictionaryGuesses(match), 32);

    match = MakeDictionaryMatch(PATTERN_DICTIONARY, "AAAaaa", 32);
    BOOST_CHECK_EQUAL(DictionaryGuesses(match), 32 * UppercaseVariations(DecodeUTF8("AAAaaa")));

    match = MakeDictionaryMatch(PATTERN_REVERSE_DICTIONARY, "aaa", 32);
    BOOST_CHECK_EQUAL(DictionaryGuesses(match), 64);

    match = MakeDictionaryMatch(PATTERN_LEET, "aaa@@@", 32);
    match.Get<CDictionaryMatch>().mapSub["@"] = "a";
    BOOST_CHECK_EQUAL(DictionaryGuesses(match), 32 * LeetVariations(match));
}

BOOST_AUTO_TEST_CASE(other_guesses)
{
    CMatch match;

    CRepeatMatch repeat;
    repeat.strBaseToken = "a";
    repeat.nBaseGuesses = 11;
    repeat.nRepeatCount = 3;
    match = CMatch(PATTERN_REPEAT, 0, 2, "aaa", repeat);
    BOOST_CHECK_EQUAL(RepeatGuesses(match), 33);

    CSequenceMatch seq;
    seq.strSequenceName = "lower";
    seq.nSequenceSpace = 26;
    match = CMatch(PATTERN_SEQUENCE, 0, 2, "abc", seq);
    BOOST_CHECK_EQUAL(SequenceGuesses(match), 4 * 3);
    match = CMatch(PATTERN_SEQUENCE, 0, 2, "jkl", seq);
    BOOST_CHECK_EQUAL(SequenceGuesses(match), 26 * 3);
    seq.strSequenceName = "digits";
    match = CMatch(PATTERN_SEQUENCE, 0, 2, "567", seq);
    BOOST_CHECK_EQUAL(SequenceGuesses(match), 10 * 3);
    seq.fAscending = false;
    seq.nDelta = -1;
    match = CMatch(PATTERN_SEQUENCE, 0, 2, "765", seq);
    BOOST_CHECK_EQUAL(SequenceGuesses(match), 2 * 10 * 3);

    CRegexMatch regex;
    regex.strRegexName = "recent_year";
    regex.strValue = "1972";
    match = CMatch(PATTERN_REGEX, 0, 3, "1972", regex);
    BOOST_CHECK_EQUAL(RegexGuesses(match), std::abs(GetReferenceYear() - 1972));
    regex.strValue = strprintf("%d", GetReferenceYear());
    match = CMatch(PATTERN_REGEX, 0, 3, regex.strValue, regex);
    BOOST_CHECK_EQUAL(RegexGuesses(match), MIN_YEAR_SPACE);

    CDateMatch date;
    date.nYear = 1923;
    date.nMonth = 1;
    date.nDay = 1;
    date.strSeparator = "";
    match = CMatch(PATTERN_DATE, 0, 5, "1123", date);
    BOOST_CHECK_EQUAL(DateGuesses(match), 365 * std::abs(GetReferenceYear() - 1923));
    date.nYear = GetReferenceYear();
    date.strSeparator = "/";
    match = CMatch(PATTERN_DATE, 0, 7, "1/1/2000", date);
    BOOST_CHECK_EQUAL(DateGuesses(match), 365 * MIN_YEAR_SPACE * 4);

    CBruteforceMatch bf;
    bf.nCardinality = 26;
    match = CMatch(PATTERN_BRUTEFORCE, 0, 3, "abcd", bf);
    BOOST_CHECK_EQUAL(BruteforceGuesses(match), std::pow(26.0, 4));
}

BOOST_AUTO_TEST_CASE(spatial_guesses)
{
    CSpatialMatch spatial;
    spatial.strGraph = "qwerty";
    spatial.nTurns = 1;
    spatial.nStartingPositions = 94;
    spatial.nAverageDegree = 4.6;
    CMatch match(PATTERN_SPATIAL, 0, 5, "zxcvbn", spatial);
    double nBase = 5 * 94 * 4.6;
    BOOST_CHECK_CLOSE(SpatialGuesses(match), nBase, 1e-9);

    // shifted keys multiply by their placements
    match.Get<CSpatialMatch>().nShiftedCount = 2;
    match.strToken = "ZxCvbn";
    BOOST_CHECK_CLOSE(SpatialGuesses(match), nBase * (nCk(6, 2) + nCk(6, 1)), 1e-9);

    // an all-shifted run counts double
    match.Get<CSpatialMatch>().nShiftedCount = 6;
    match.strToken = "ZXCVBN";
    BOOST_CHECK_CLOSE(SpatialGuesses(match), nBase * 2, 1e-9);
}

BOOST_AUTO_TEST_CASE(estimate_guesses)
{
    // an estimate already made is kept
    CMatch match = MakeDictionaryMatch(PATTERN_DICTIONARY, "a", 1);
    match.nGuesses = 1234;
    BOOST_CHECK_EQUAL(EstimateGuesses(match, 5), 1234);

    // submatch floors
    match = MakeDictionaryMatch(PATTERN_DICTIONARY, "a", 1);
    BOOST_CHECK_EQUAL(EstimateGuesses(match, 5), MIN_SUBMATCH_GUESSES_SINGLE_CHAR);
    match = MakeDictionaryMatch(PATTERN_DICTIONARY, "ab", 1);
    BOOST_CHECK_EQUAL(EstimateGuesses(match, 5), MIN_SUBMATCH_GUESSES_MULTI_CHAR);
    match = MakeDictionaryMatch(PATTERN_DICTIONARY, "ab", 1);
    BOOST_CHECK_EQUAL(EstimateGuesses(match, 2), 1);
    BOOST_CHECK_EQUAL(match.nGuessesLog10, 0);

    // the dictionary variation fields are filled in
    match = MakeDictionaryMatch(PATTERN_DICTIONARY, "Password", 2);
    BOOST_CHECK_EQUAL(EstimateGuesses(match, 8), 4);
    BOOST_CHECK_EQUAL(match.Get<CDictionaryMatch>().nUppercaseVariations, 2);
    BOOST_CHECK_CLOSE(match.nGuessesLog10, std::log10(4.0), 1e-9);
}

BOOST_AUTO_TEST_SUITE_END()
