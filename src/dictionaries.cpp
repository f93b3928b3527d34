// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "dictionaries.h"

#include "frequency_lists.h"
#include "util.h"
#include "utilstrencodings.h"

#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem/fstream.hpp>

CRankedDictionary::CRankedDictionary(const std::string& strNameIn, const std::vector<std::string>& vWords)
    : strName(strNameIn), nMaxWordLength(0)
{
    int nRank = 0;
    for (std::vector<std::string>::const_iterator it = vWords.begin(); it != vWords.end(); ++it) {
        if (it->empty())
            continue;
        std::u32string word = ToLower(DecodeUTF8(*it));
        if (mapRanks.insert(std::make_pair(EncodeUTF8(word), nRank + 1)).second) {
            nRank++;
            if (word.size() > nMaxWordLength)
                nMaxWordLength = word.size();
        }
    }
}

int CRankedDictionary::GetRank(const std::string& strWord) const
{
    std::map<std::string, int>::const_iterator it = mapRanks.find(strWord);
    if (it == mapRanks.end())
        return 0;
    return it->second;
}

bool CRankedDictionary::HasPrefix(const std::string& strPrefix) const
{
    std::map<std::string, int>::const_iterator it = mapRanks.lower_bound(strPrefix);
    return it != mapRanks.end() && it->first.compare(0, strPrefix.size(), strPrefix) == 0;
}

const CRankedDictionary* CDictionarySnapshot::Find(const std::string& strName) const
{
    for (std::vector<CRankedDictionary>::const_iterator it = vDictionaries.begin(); it != vDictionaries.end(); ++it) {
        if (it->GetName() == strName)
            return &(*it);
    }
    return NULL;
}

struct FrequencyListEntry {
    const char* pszName;
    const char* const* ppszWords;
};

static const FrequencyListEntry frequencyLists[] = {
    {"passwords", FREQUENCY_LIST_PASSWORDS},
    {"english_wikipedia", FREQUENCY_LIST_ENGLISH_WIKIPEDIA},
    {"female_names", FREQUENCY_LIST_FEMALE_NAMES},
    {"surnames", FREQUENCY_LIST_SURNAMES},
    {"us_tv_and_film", FREQUENCY_LIST_US_TV_AND_FILM},
    {"male_names", FREQUENCY_LIST_MALE_NAMES},
};

static std::vector<CRankedDictionary> BuildDefaultDictionaries()
{
    std::vector<CRankedDictionary> vDictionaries;
    for (size_t n = 0; n < sizeof(frequencyLists) / sizeof(frequencyLists[0]); n++) {
        std::vector<std::string> vWords;
        for (const char* const* ppsz = frequencyLists[n].ppszWords; *ppsz != NULL; ppsz++)
            vWords.push_back(*ppsz);
        vDictionaries.push_back(CRankedDictionary(frequencyLists[n].pszName, vWords));
        LogPrint("dict", "%s: %s has %u words\n", __func__, frequencyLists[n].pszName, vDictionaries.back().size());
    }
    return vDictionaries;
}

const std::vector<CRankedDictionary>& DefaultRankedDictionaries()
{
    static const std::vector<CRankedDictionary> vDefault = BuildDefaultDictionaries();
    return vDefault;
}

DictionarySnapshotRef BuildDictionarySnapshot(const std::vector<std::string>& vUserInputs,
    const std::vector<CRankedDictionary>& vExtra)
{
    std::vector<CRankedDictionary> vDictionaries = DefaultRankedDictionaries();
    vDictionaries.insert(vDictionaries.end(), vExtra.begin(), vExtra.end());

    std::vector<std::string> vSanitized;
    for (std::vector<std::string>::const_iterator it = vUserInputs.begin(); it != vUserInputs.end(); ++it)
        vSanitized.push_back(SanitizeUserInput(*it));
    CRankedDictionary userInputs(USER_INPUTS_DICTIONARY, vSanitized);
    if (!userInputs.empty())
        vDictionaries.push_back(userInputs);

    return std::make_shared<CDictionarySnapshot>(vDictionaries);
}

bool LoadWordListFile(const std::string& strName, const boost::filesystem::path& path, CRankedDictionary& dictRet)
{
    boost::filesystem::ifstream stream(path);
    if (!stream.good())
        return error("%s: cannot open word list %s", __func__, path.string());

    std::vector<std::string> vWords;
    std::string strLine;
    while (std::getline(stream, strLine)) {
        boost::algorithm::trim(strLine);
        if (strLine.empty() || strLine[0] == '#')
            continue;
        vWords.push_back(strLine);
    }
    if (stream.bad())
        return error("%s: read error in %s", __func__, path.string());

    dictRet = CRankedDictionary(strName, vWords);
    LogPrint("dict", "%s: loaded %u words into %s from %s\n", __func__, dictRet.size(), strName, path.string());
    return true;
}

std::string SanitizeUserInput(const std::string& strInput)
{
    return ToLowerUTF8(strInput);
}

std::string SanitizeUserInput(const char* pszInput)
{
    if (pszInput == NULL)
        return std::string();
    return SanitizeUserInput(std::string(pszInput));
}

CDictionaryProvider::CDictionaryProvider()
{
    snapshot = BuildDictionarySnapshot(vUserInputs, vExtra);
}

DictionarySnapshotRef CDictionaryProvider::GetSnapshot() const
{
    LOCK(cs);
    return snapshot;
}

DictionarySnapshotRef CDictionaryProvider::SetUserInputs(const std::vector<std::string>& vUserInputsIn)
{
    LOCK(cs);
    vUserInputs = vUserInputsIn;
    snapshot = BuildDictionarySnapshot(vUserInputs, vExtra);
    LogPrint("dict", "%s: published snapshot with %u user inputs\n", __func__, vUserInputs.size());
    return snapshot;
}

DictionarySnapshotRef CDictionaryProvider::AddDictionary(const CRankedDictionary& dict)
{
    LOCK(cs);
    vExtra.push_back(dict);
    snapshot = BuildDictionarySnapshot(vUserInputs, vExtra);
    LogPrint("dict", "%s: published snapshot with extra list %s\n", __func__, dict.GetName());
    return snapshot;
}

std::vector<std::string> CDictionaryProvider::GetUserInputs() const
{
    LOCK(cs);
    return vUserInputs;
}
