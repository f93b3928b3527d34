// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "match.h"

#include "util.h"

#include <algorithm>

const char* GetPatternName(MatchPattern pattern)
{
    switch (pattern) {
    case PATTERN_DICTIONARY: return "dictionary";
    case PATTERN_REVERSE_DICTIONARY: return "reverse_dictionary";
    case PATTERN_LEET: return "leet";
    case PATTERN_SPATIAL: return "spatial";
    case PATTERN_REPEAT: return "repeat";
    case PATTERN_SEQUENCE: return "sequence";
    case PATTERN_REGEX: return "regex";
    case PATTERN_DATE: return "date";
    case PATTERN_BRUTEFORCE: return "bruteforce";
    }
    return NULL;
}

CMatch::CMatch() : pattern(PATTERN_BRUTEFORCE), i(0), j(0), nGuesses(0), nGuessesLog10(0), nAlternatives(1), detail(CBruteforceMatch())
{
}

CMatch::CMatch(MatchPattern patternIn, size_t iIn, size_t jIn, const std::string& strTokenIn, const MatchDetail& detailIn)
    : pattern(patternIn), i(iIn), j(jIn), strToken(strTokenIn), nGuesses(0), nGuessesLog10(0), nAlternatives(1), detail(detailIn)
{
}

namespace
{
class CDescriptorVisitor : public boost::static_visitor<std::string>
{
public:
    std::string operator()(const CDictionaryMatch& m) const
    {
        std::string str = m.strDictionaryName + "/" + m.strMatchedWord;
        for (std::map<std::string, std::string>::const_iterator it = m.mapSub.begin(); it != m.mapSub.end(); ++it)
            str += "/" + it->first + "->" + it->second;
        return str;
    }

    std::string operator()(const CSpatialMatch& m) const { return m.strGraph; }
    std::string operator()(const CRepeatMatch& m) const { return m.strBaseToken; }
    std::string operator()(const CSequenceMatch& m) const { return m.strSequenceName; }
    std::string operator()(const CRegexMatch& m) const { return m.strRegexName; }

    std::string operator()(const CDateMatch& m) const
    {
        return strprintf("%04d-%02d-%02d/%s", m.nYear, m.nMonth, m.nDay, m.strSeparator);
    }

    std::string operator()(const CBruteforceMatch& m) const { return strprintf("%d", m.nCardinality); }
};
} // anon namespace

std::string CMatch::GetDescriptor() const
{
    return std::string(GetPatternName(pattern)) + ":" + boost::apply_visitor(CDescriptorVisitor(), detail);
}

std::string CMatch::ToString() const
{
    return strprintf("CMatch(%s, [%u,%u], token=%s, guesses=%g)", GetDescriptor(), i, j, strToken, nGuesses);
}

bool CompareMatches(const CMatch& a, const CMatch& b)
{
    if (a.i != b.i)
        return a.i < b.i;
    if (a.j != b.j)
        return a.j < b.j;
    return a.GetDescriptor() < b.GetDescriptor();
}

static bool SameExplanation(const CMatch& a, const CMatch& b)
{
    return a.i == b.i && a.j == b.j && a.GetDescriptor() == b.GetDescriptor();
}

void SortAndUniqueMatches(std::vector<CMatch>& vMatches)
{
    std::sort(vMatches.begin(), vMatches.end(), CompareMatches);
    vMatches.erase(std::unique(vMatches.begin(), vMatches.end(), SameExplanation), vMatches.end());
}
