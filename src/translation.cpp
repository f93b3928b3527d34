// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "translation.h"

#include "util.h"

#include <algorithm>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem/fstream.hpp>

struct CatalogEntry {
    const char* pszKey;
    const char* pszText;
};

static const CatalogEntry englishCatalog[] = {
    // warnings
    {"straight_rows", "Straight rows of keys are easy to guess"},
    {"short_keyboard_patterns", "Short keyboard patterns are easy to guess"},
    {"repeats_aaa", "Repeats like \"aaa\" are easy to guess"},
    {"repeats_abcabc", "Repeats like \"abcabcabc\" are only slightly harder to guess than \"abc\""},
    {"sequences", "Sequences like abc or 6543 are easy to guess"},
    {"recent_years", "Recent years are easy to guess"},
    {"dates", "Dates are often easy to guess"},
    {"top10_password", "This is a top-10 common password"},
    {"top100_password", "This is a top-100 common password"},
    {"very_common_password", "This is a very common password"},
    {"similar_to_common", "This is similar to a commonly used password"},
    {"word_by_itself", "A word by itself is easy to guess"},
    {"names_by_themselves", "Names and surnames by themselves are easy to guess"},
    {"common_names", "Common names and surnames are easy to guess"},
    // suggestions
    {"use_few_words", "Use a few words, avoid common phrases"},
    {"no_need_symbols", "No need for symbols, digits, or uppercase letters"},
    {"add_another_word", "Add another word or two. Uncommon words are better."},
    {"longer_keyboard_pattern", "Use a longer keyboard pattern with more turns"},
    {"avoid_repeats", "Avoid repeated words and characters"},
    {"avoid_sequences", "Avoid sequences"},
    {"avoid_recent_years", "Avoid recent years"},
    {"avoid_associated_years", "Avoid years that are associated with you"},
    {"avoid_associated_dates", "Avoid dates and years that are associated with you"},
    {"capitalization", "Capitalization doesn't help very much"},
    {"all_uppercase", "All-uppercase is almost as easy to guess as all-lowercase"},
    {"reversed_words", "Reversed words aren't much harder to guess"},
    {"predictable_substitutions", "Predictable substitutions like '@' instead of 'a' don't help very much"},
    // crack times, %d is the count
    {"time.instant", "less than a second"},
    {"time.second", "%d second"},
    {"time.seconds", "%d seconds"},
    {"time.minute", "%d minute"},
    {"time.minutes", "%d minutes"},
    {"time.hour", "%d hour"},
    {"time.hours", "%d hours"},
    {"time.day", "%d day"},
    {"time.days", "%d days"},
    {"time.month", "%d month"},
    {"time.months", "%d months"},
    {"time.year", "%d year"},
    {"time.years", "%d years"},
    {"time.centuries", "centuries"},
};

static TranslationCatalog BuildEnglishCatalog()
{
    TranslationCatalog catalog;
    for (size_t n = 0; n < sizeof(englishCatalog) / sizeof(englishCatalog[0]); n++)
        catalog[englishCatalog[n].pszKey] = englishCatalog[n].pszText;
    return catalog;
}

const TranslationCatalog& DefaultEnglishCatalog()
{
    static const TranslationCatalog catalog = BuildEnglishCatalog();
    return catalog;
}

std::string NormalizeLanguageTag(const std::string& strTag)
{
    std::string strRet = boost::algorithm::trim_copy(strTag);
    std::replace(strRet.begin(), strRet.end(), '-', '_');
    // language part lower case, region or script left as given
    size_t nSep = strRet.find('_');
    std::string strBase = boost::algorithm::to_lower_copy(strRet.substr(0, nSep));
    if (nSep == std::string::npos)
        return strBase;
    return strBase + strRet.substr(nSep);
}

static std::string BaseLanguage(const std::string& strLang)
{
    return strLang.substr(0, strLang.find('_'));
}

CTranslator::CTranslator()
{
    mapCatalogs[DEFAULT_LANGUAGE] = DefaultEnglishCatalog();
    AddAlias("zh", "zh_CN");
}

void CTranslator::AddCatalog(const std::string& strLang, const TranslationCatalog& catalog)
{
    LOCK(cs);
    TranslationCatalog& target = mapCatalogs[NormalizeLanguageTag(strLang)];
    for (TranslationCatalog::const_iterator it = catalog.begin(); it != catalog.end(); ++it)
        target[it->first] = it->second;
}

bool CTranslator::LoadCatalogFile(const std::string& strLang, const boost::filesystem::path& path)
{
    boost::filesystem::ifstream stream(path);
    if (!stream.good())
        return error("%s: cannot open catalog %s", __func__, path.string());

    TranslationCatalog catalog;
    std::string strLine;
    int nLine = 0;
    while (std::getline(stream, strLine)) {
        nLine++;
        boost::algorithm::trim(strLine);
        if (strLine.empty() || strLine[0] == '#')
            continue;
        size_t nEq = strLine.find('=');
        if (nEq == std::string::npos || nEq == 0)
            return error("%s: %s:%d: expected key=text", __func__, path.string(), nLine);
        catalog[boost::algorithm::trim_copy(strLine.substr(0, nEq))] = boost::algorithm::trim_copy(strLine.substr(nEq + 1));
    }

    AddCatalog(strLang, catalog);
    LogPrint("i18n", "%s: %u entries for %s from %s\n", __func__, catalog.size(), NormalizeLanguageTag(strLang), path.string());
    return true;
}

void CTranslator::AddAlias(const std::string& strBaseLang, const std::string& strTag)
{
    LOCK(cs);
    std::vector<std::string>& vAliases = mapAliases[NormalizeLanguageTag(strBaseLang)];
    std::string strNormalized = NormalizeLanguageTag(strTag);
    if (std::find(vAliases.begin(), vAliases.end(), strNormalized) == vAliases.end())
        vAliases.push_back(strNormalized);
}

bool CTranslator::HaveCatalog(const std::string& strLang) const
{
    LOCK(cs);
    return mapCatalogs.count(NormalizeLanguageTag(strLang)) > 0;
}

std::vector<std::string> CTranslator::GetFallbackChain(const std::string& strLang) const
{
    LOCK(cs);
    std::string strTag = NormalizeLanguageTag(strLang);
    std::string strBase = BaseLanguage(strTag);

    std::vector<std::string> vCandidates;
    vCandidates.push_back(strTag);
    std::map<std::string, std::vector<std::string> >::const_iterator it = mapAliases.find(strBase);
    if (it != mapAliases.end())
        vCandidates.insert(vCandidates.end(), it->second.begin(), it->second.end());
    vCandidates.push_back(strBase);
    vCandidates.push_back(DEFAULT_LANGUAGE);

    std::vector<std::string> vChain;
    for (size_t n = 0; n < vCandidates.size(); n++) {
        if (vCandidates[n].empty())
            continue;
        if (std::find(vChain.begin(), vChain.end(), vCandidates[n]) == vChain.end())
            vChain.push_back(vCandidates[n]);
    }
    return vChain;
}

std::string CTranslator::Translate(const std::string& strLang, const std::string& strKey) const
{
    return GetTranslation(strLang)(strKey);
}

namespace
{
class CCatalogLookup
{
public:
    explicit CCatalogLookup(const std::vector<TranslationCatalog>& vChainIn) : vChain(vChainIn) {}

    std::string operator()(const std::string& strKey) const
    {
        for (size_t n = 0; n < vChain.size(); n++) {
            TranslationCatalog::const_iterator it = vChain[n].find(strKey);
            if (it != vChain[n].end())
                return it->second;
        }
        return strKey;
    }

private:
    std::vector<TranslationCatalog> vChain;
};
} // anon namespace

TranslationFn CTranslator::GetTranslation(const std::string& strLang) const
{
    LOCK(cs);
    std::vector<std::string> vTags = GetFallbackChain(strLang);
    std::vector<TranslationCatalog> vChain;
    for (size_t n = 0; n < vTags.size(); n++) {
        std::map<std::string, TranslationCatalog>::const_iterator it = mapCatalogs.find(vTags[n]);
        if (it != mapCatalogs.end())
            vChain.push_back(it->second);
    }
    LogPrint("i18n", "%s: %s resolves through %u catalogs\n", __func__, strLang, vChain.size());
    return CCatalogLookup(vChain);
}
