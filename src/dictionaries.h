// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PWGUESS_DICTIONARIES_H
#define PWGUESS_DICTIONARIES_H

#include "sync.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>
#include <boost/lexical_cast.hpp>

/** Word -> rank, 1 being the most frequent */
class CRankedDictionary
{
public:
    CRankedDictionary() : nMaxWordLength(0) {}

    /**
     * Rank words in list order. Words are lower-cased; empty words are
     * skipped and a repeated word keeps its first rank.
     */
    CRankedDictionary(const std::string& strNameIn, const std::vector<std::string>& vWords);

    const std::string& GetName() const { return strName; }

    /** Rank of a lower-case word, 0 if absent */
    int GetRank(const std::string& strWord) const;

    /** Whether some word starts with strPrefix */
    bool HasPrefix(const std::string& strPrefix) const;

    /** Longest word in code points; longer substrings cannot match */
    size_t GetMaxWordLength() const { return nMaxWordLength; }
    size_t size() const { return mapRanks.size(); }
    bool empty() const { return mapRanks.empty(); }

private:
    std::string strName;
    std::map<std::string, int> mapRanks;
    size_t nMaxWordLength;
};

/**
 * Immutable, ordered set of dictionaries the matchers search. Published as
 * DictionarySnapshotRef and never modified afterwards.
 */
class CDictionarySnapshot
{
public:
    explicit CDictionarySnapshot(const std::vector<CRankedDictionary>& vDictionariesIn) : vDictionaries(vDictionariesIn) {}

    const std::vector<CRankedDictionary>& Dictionaries() const { return vDictionaries; }
    const CRankedDictionary* Find(const std::string& strName) const;

private:
    std::vector<CRankedDictionary> vDictionaries;
};

typedef std::shared_ptr<const CDictionarySnapshot> DictionarySnapshotRef;

static const char* const USER_INPUTS_DICTIONARY = "user_inputs";

/** passwords, english_wikipedia, female_names, surnames, us_tv_and_film, male_names */
const std::vector<CRankedDictionary>& DefaultRankedDictionaries();

/**
 * Default dictionaries, then vExtra, then user_inputs (only when
 * vUserInputs is not empty).
 */
DictionarySnapshotRef BuildDictionarySnapshot(const std::vector<std::string>& vUserInputs,
    const std::vector<CRankedDictionary>& vExtra = std::vector<CRankedDictionary>());

/**
 * Read a word list, one word per line, most frequent first. Blank lines
 * and lines starting with '#' are ignored.
 */
bool LoadWordListFile(const std::string& strName, const boost::filesystem::path& path, CRankedDictionary& dictRet);

/** Lower-cased text form of a user input */
std::string SanitizeUserInput(const std::string& strInput);
std::string SanitizeUserInput(const char* pszInput);

/** Anything streamable (numbers, dates, ...) is coerced to its text form */
template <typename T>
std::string SanitizeUserInput(const T& input)
{
    return SanitizeUserInput(boost::lexical_cast<std::string>(input));
}

/**
 * Owns the current snapshot. Readers take a reference and keep using it
 * while a rebuild publishes a new one.
 */
class CDictionaryProvider
{
public:
    CDictionaryProvider();

    DictionarySnapshotRef GetSnapshot() const;

    /** Rebuild with new user inputs and publish */
    DictionarySnapshotRef SetUserInputs(const std::vector<std::string>& vUserInputs);

    /** Add an extra list ahead of user_inputs and publish */
    DictionarySnapshotRef AddDictionary(const CRankedDictionary& dict);

    std::vector<std::string> GetUserInputs() const;

private:
    mutable CCriticalSection cs;
    std::vector<std::string> vUserInputs;
    std::vector<CRankedDictionary> vExtra;
    DictionarySnapshotRef snapshot;
};

#endif // PWGUESS_DICTIONARIES_H
