// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "matching.h"

#include "guesses.h"
#include "scoring.h"
#include "util.h"
#include "utilstrencodings.h"

#include <algorithm>
#include <regex>
#include <set>
#include <stdlib.h>

static std::map<char32_t, std::u32string> BuildLeetTable()
{
    std::map<char32_t, std::u32string> table;
    table['a'] = U"4@";
    table['b'] = U"8";
    table['c'] = U"({[<";
    table['e'] = U"3";
    table['g'] = U"69";
    table['i'] = U"1!|";
    table['l'] = U"1|7";
    table['o'] = U"0";
    table['s'] = U"$5";
    table['t'] = U"+7";
    table['x'] = U"%";
    table['z'] = U"2";
    return table;
}

const std::map<char32_t, std::u32string>& LeetTable()
{
    static const std::map<char32_t, std::u32string> table = BuildLeetTable();
    return table;
}

std::map<char32_t, std::u32string> RelevantLeetSubtable(const std::u32string& password)
{
    std::set<char32_t> setChars(password.begin(), password.end());
    std::map<char32_t, std::u32string> subtable;
    const std::map<char32_t, std::u32string>& table = LeetTable();
    for (std::map<char32_t, std::u32string>::const_iterator it = table.begin(); it != table.end(); ++it) {
        std::u32string relevant;
        for (size_t n = 0; n < it->second.size(); n++) {
            if (setChars.count(it->second[n]))
                relevant.push_back(it->second[n]);
        }
        if (!relevant.empty())
            subtable[it->first] = relevant;
    }
    return subtable;
}

std::vector<LeetSub> EnumerateLeetSubs(const std::map<char32_t, std::u32string>& table)
{
    std::vector<LeetSub> vSubs(1);
    for (std::map<char32_t, std::u32string>::const_iterator it = table.begin(); it != table.end(); ++it) {
        char32_t cLetter = it->first;
        std::vector<LeetSub> vNext;
        std::set<LeetSub> setSeen;
        for (size_t n = 0; n < it->second.size(); n++) {
            char32_t cLeet = it->second[n];
            for (std::vector<LeetSub>::const_iterator si = vSubs.begin(); si != vSubs.end(); ++si) {
                // a leet character already taken by another letter forks the
                // enumeration: keep the old reading and add the new one
                std::vector<LeetSub> vCandidates;
                if (si->count(cLeet))
                    vCandidates.push_back(*si);
                LeetSub sub = *si;
                sub[cLeet] = cLetter;
                vCandidates.push_back(sub);
                for (size_t c = 0; c < vCandidates.size(); c++) {
                    if (setSeen.insert(vCandidates[c]).second)
                        vNext.push_back(vCandidates[c]);
                }
            }
        }
        vSubs.swap(vNext);
    }
    return vSubs;
}

static void DictionaryMatchLower(const std::u32string& password, const std::u32string& lower,
    const CDictionarySnapshot& snapshot, std::vector<CMatch>& vMatches)
{
    size_t nLength = password.size();
    const std::vector<CRankedDictionary>& vDictionaries = snapshot.Dictionaries();
    for (std::vector<CRankedDictionary>::const_iterator dict = vDictionaries.begin(); dict != vDictionaries.end(); ++dict) {
        size_t nMaxLength = dict->GetMaxWordLength();
        for (size_t i = 0; i < nLength; i++) {
            for (size_t j = i; j < nLength && j - i + 1 <= nMaxLength; j++) {
                std::string strWord = EncodeUTF8(lower, i, j + 1);
                int nRank = dict->GetRank(strWord);
                if (nRank == 0)
                    continue;
                vMatches.push_back(CMatch(PATTERN_DICTIONARY, i, j, EncodeUTF8(password, i, j + 1),
                    CDictionaryMatch(dict->GetName(), strWord, nRank)));
            }
        }
    }
}

std::vector<CMatch> DictionaryMatch(const std::u32string& password, const CDictionarySnapshot& snapshot)
{
    std::vector<CMatch> vMatches;
    DictionaryMatchLower(password, ToLower(password), snapshot, vMatches);
    std::sort(vMatches.begin(), vMatches.end(), CompareMatches);
    return vMatches;
}

std::vector<CMatch> ReverseDictionaryMatch(const std::u32string& password, const CDictionarySnapshot& snapshot)
{
    std::u32string reversed(password.rbegin(), password.rend());
    std::vector<CMatch> vMatches = DictionaryMatch(reversed, snapshot);
    size_t nLength = password.size();
    for (std::vector<CMatch>::iterator it = vMatches.begin(); it != vMatches.end(); ++it) {
        size_t i = nLength - 1 - it->j;
        size_t j = nLength - 1 - it->i;
        it->pattern = PATTERN_REVERSE_DICTIONARY;
        it->i = i;
        it->j = j;
        it->strToken = EncodeUTF8(password, i, j + 1);
    }
    std::sort(vMatches.begin(), vMatches.end(), CompareMatches);
    return vMatches;
}

std::vector<CMatch> LeetMatch(const std::u32string& password, const CDictionarySnapshot& snapshot)
{
    std::vector<CMatch> vMatches;
    std::u32string lower = ToLower(password);
    std::vector<LeetSub> vSubs = EnumerateLeetSubs(RelevantLeetSubtable(password));

    const std::vector<CRankedDictionary>& vDictionaries = snapshot.Dictionaries();
    size_t nMaxLength = 0;
    for (std::vector<CRankedDictionary>::const_iterator dict = vDictionaries.begin(); dict != vDictionaries.end(); ++dict)
        nMaxLength = std::max(nMaxLength, dict->GetMaxWordLength());

    // different subs often translate a substring the same way
    std::set<std::pair<size_t, std::u32string> > setLookedUp;
    size_t nLength = password.size();
    for (std::vector<LeetSub>::const_iterator sub = vSubs.begin(); sub != vSubs.end(); ++sub) {
        if (sub->empty())
            break;
        std::u32string translated = lower;
        // vSubstituted[n] counts the substituted positions before n
        std::vector<size_t> vSubstituted(nLength + 1, 0);
        for (size_t n = 0; n < nLength; n++) {
            LeetSub::const_iterator mi = sub->find(translated[n]);
            vSubstituted[n + 1] = vSubstituted[n];
            if (mi != sub->end()) {
                translated[n] = mi->second;
                vSubstituted[n + 1]++;
            }
        }

        for (size_t i = 0; i < nLength; i++) {
            for (size_t j = i; j < nLength && j - i + 1 <= nMaxLength; j++) {
                std::u32string word = translated.substr(i, j - i + 1);
                std::string strWord = EncodeUTF8(word);
                bool fPrefix = false;
                for (size_t d = 0; d < vDictionaries.size() && !fPrefix; d++)
                    fPrefix = vDictionaries[d].HasPrefix(strWord);
                if (!fPrefix)
                    break;
                // single characters are left to the dictionary matcher
                if (j == i || vSubstituted[j + 1] == vSubstituted[i])
                    continue;
                if (!setLookedUp.insert(std::make_pair(i, word)).second)
                    continue;

                for (std::vector<CRankedDictionary>::const_iterator dict = vDictionaries.begin(); dict != vDictionaries.end(); ++dict) {
                    int nRank = dict->GetRank(strWord);
                    if (nRank == 0)
                        continue;
                    CDictionaryMatch leet(dict->GetName(), strWord, nRank);
                    // only the substitutions that occur inside the token
                    for (size_t n = i; n <= j; n++) {
                        LeetSub::const_iterator mi = sub->find(lower[n]);
                        if (mi != sub->end())
                            leet.mapSub[EncodeUTF8(std::u32string(1, mi->first))] = EncodeUTF8(std::u32string(1, mi->second));
                    }
                    vMatches.push_back(CMatch(PATTERN_LEET, i, j, EncodeUTF8(password, i, j + 1), leet));
                }
            }
        }
    }

    SortAndUniqueMatches(vMatches);
    LogPrint("matching", "%s: %u subs, %u lookups, %u matches\n", __func__, vSubs.size(), setLookedUp.size(), vMatches.size());
    return vMatches;
}

static void SpatialMatchGraph(const std::u32string& password, const CAdjacencyGraph& graph, std::vector<CMatch>& vMatches)
{
    size_t nLength = password.size();
    size_t i = 0;
    while (i + 1 < nLength) {
        size_t j = i + 1;
        int nLastDirection = -1;
        int nTurns = 0;
        int nShiftedCount = (graph.IsSlanted() && graph.IsShifted(password[i])) ? 1 : 0;

        while (true) {
            bool fFound = false;
            const std::vector<std::string>* pvAdjacent = graph.GetAdjacent(password[j - 1]);
            if (j < nLength && pvAdjacent != NULL && password[j] < 0x80) {
                char c = static_cast<char>(password[j]);
                for (size_t nDirection = 0; nDirection < pvAdjacent->size(); nDirection++) {
                    size_t nPos = (*pvAdjacent)[nDirection].find(c);
                    if (nPos == std::string::npos)
                        continue;
                    fFound = true;
                    if (nPos == 1)
                        nShiftedCount++;
                    if (nLastDirection != int(nDirection)) {
                        nTurns++;
                        nLastDirection = nDirection;
                    }
                    break;
                }
            }
            if (fFound) {
                j++;
                continue;
            }
            if (j - i >= MIN_SPATIAL_LENGTH) {
                CSpatialMatch spatial;
                spatial.strGraph = graph.GetName();
                spatial.nTurns = nTurns;
                spatial.nShiftedCount = nShiftedCount;
                spatial.nStartingPositions = graph.GetStartingPositions();
                spatial.nAverageDegree = graph.GetAverageDegree();
                vMatches.push_back(CMatch(PATTERN_SPATIAL, i, j - 1, EncodeUTF8(password, i, j), spatial));
            }
            i = j;
            break;
        }
    }
}

std::vector<CMatch> SpatialMatch(const std::u32string& password, const CKeyboardGraphs& graphs)
{
    std::vector<CMatch> vMatches;
    const std::vector<CAdjacencyGraph>& vGraphs = graphs.Graphs();
    for (size_t n = 0; n < vGraphs.size(); n++)
        SpatialMatchGraph(password, vGraphs[n], vMatches);
    std::sort(vMatches.begin(), vMatches.end(), CompareMatches);
    return vMatches;
}

/** Number of back-to-back copies of password[p, p + nLen) starting at p */
static size_t CountCopies(const std::u32string& password, size_t p, size_t nLen)
{
    size_t nCopies = 1;
    while (p + (nCopies + 1) * nLen <= password.size() &&
           password.compare(p + nCopies * nLen, nLen, password, p, nLen) == 0)
        nCopies++;
    return nCopies;
}

/** Shortest unit that the whole token is two or more copies of */
static size_t SmallestPeriod(const std::u32string& token)
{
    for (size_t nLen = 1; nLen * 2 <= token.size(); nLen++) {
        if (token.size() % nLen == 0 && CountCopies(token, 0, nLen) * nLen == token.size())
            return nLen;
    }
    return token.size();
}

std::vector<CMatch> RepeatMatch(const std::u32string& password, const CDictionarySnapshot& snapshot, const CKeyboardGraphs& graphs)
{
    std::vector<CMatch> vMatches;
    size_t nLength = password.size();
    size_t nLastIndex = 0;

    while (nLastIndex < nLength) {
        // leftmost start with a repeated unit, then its longest (greedy) and
        // shortest (lazy) unit, each extended over as many copies as follow
        size_t p = nLastIndex;
        size_t nGreedyLen = 0, nLazyLen = 0;
        for (; p < nLength && nLazyLen == 0; p++) {
            for (size_t nLen = 1; p + 2 * nLen <= nLength; nLen++) {
                if (password.compare(p + nLen, nLen, password, p, nLen) == 0) {
                    if (nLazyLen == 0)
                        nLazyLen = nLen;
                    nGreedyLen = nLen;
                }
            }
        }
        if (nLazyLen == 0)
            break;
        p--;

        size_t nGreedyTotal = nGreedyLen * CountCopies(password, p, nGreedyLen);
        size_t nLazyTotal = nLazyLen * CountCopies(password, p, nLazyLen);

        std::u32string token, base;
        if (nGreedyTotal > nLazyTotal) {
            token = password.substr(p, nGreedyTotal);
            base = token.substr(0, SmallestPeriod(token));
        } else {
            token = password.substr(p, nLazyTotal);
            base = token.substr(0, nLazyLen);
        }

        COptimalSequence baseAnalysis = MostGuessableMatchSequence(base, OmniMatch(base, snapshot, graphs));

        CRepeatMatch repeat;
        repeat.strBaseToken = EncodeUTF8(base);
        repeat.nBaseGuesses = baseAnalysis.nGuesses;
        repeat.nRepeatCount = token.size() / base.size();
        size_t j = p + token.size() - 1;
        vMatches.push_back(CMatch(PATTERN_REPEAT, p, j, EncodeUTF8(token), repeat));
        nLastIndex = j + 1;
    }
    return vMatches;
}

struct SequenceClass {
    const char* pszName;
    char32_t cFirst;
    int nSpace;
};

static const SequenceClass sequenceClasses[] = {
    {"lower", 'a', 26},
    {"upper", 'A', 26},
    {"digits", '0', 10},
};

static const SequenceClass* GetSequenceClass(char32_t c)
{
    for (size_t n = 0; n < sizeof(sequenceClasses) / sizeof(sequenceClasses[0]); n++) {
        const SequenceClass& cls = sequenceClasses[n];
        if (c >= cls.cFirst && c < cls.cFirst + char32_t(cls.nSpace))
            return &cls;
    }
    return NULL;
}

/** +1 or -1 if b follows a within one class (wrapping around), else 0 */
static int SequenceStep(char32_t a, char32_t b)
{
    const SequenceClass* cls = GetSequenceClass(a);
    if (cls == NULL || cls != GetSequenceClass(b))
        return 0;
    int nDiff = ((int(b) - int(a)) % cls->nSpace + cls->nSpace) % cls->nSpace;
    if (nDiff == 1)
        return 1;
    if (nDiff == cls->nSpace - 1)
        return -1;
    return 0;
}

std::vector<CMatch> SequenceMatch(const std::u32string& password)
{
    std::vector<CMatch> vMatches;
    size_t nLength = password.size();
    size_t k = 1;
    while (k < nLength) {
        int nStep = SequenceStep(password[k - 1], password[k]);
        if (nStep == 0) {
            k++;
            continue;
        }
        size_t i = k - 1;
        while (k < nLength && SequenceStep(password[k - 1], password[k]) == nStep)
            k++;
        // the run is password[i, k); the next run may start on its last character
        if (k - i >= MIN_SEQUENCE_LENGTH) {
            const SequenceClass* cls = GetSequenceClass(password[i]);
            CSequenceMatch seq;
            seq.strSequenceName = cls->pszName;
            seq.nSequenceSpace = cls->nSpace;
            seq.fAscending = nStep > 0;
            seq.nDelta = nStep;
            vMatches.push_back(CMatch(PATTERN_SEQUENCE, i, k - 1, EncodeUTF8(password, i, k), seq));
        }
    }
    return vMatches;
}

std::vector<CMatch> RegexMatch(const std::u32string& password)
{
    static const std::regex rxRecentYear("19\\d\\d|20\\d\\d");

    std::vector<CMatch> vMatches;
    std::string strAscii = AsciiProjection(password);
    int nReferenceYear = GetReferenceYear();
    for (std::sregex_iterator it(strAscii.begin(), strAscii.end(), rxRecentYear), end; it != end; ++it) {
        std::string strYear = it->str();
        if (atoi(strYear) > nReferenceYear)
            continue;
        size_t i = it->position();
        size_t j = i + strYear.size() - 1;
        CRegexMatch regex;
        regex.strRegexName = "recent_year";
        regex.strValue = strYear;
        regex.nRange = std::max(abs(atoi(strYear) - nReferenceYear), MIN_YEAR_SPACE);
        vMatches.push_back(CMatch(PATTERN_REGEX, i, j, EncodeUTF8(password, i, j + 1), regex));
    }
    return vMatches;
}

/** Positions splitting a separator-free date of 4 to 8 digits into three numbers */
static const int dateSplits[5][4][2] = {
    {{1, 2}, {2, 3}, {0, 0}, {0, 0}},         // 4 digits
    {{1, 3}, {2, 3}, {0, 0}, {0, 0}},         // 5
    {{1, 2}, {2, 4}, {4, 5}, {0, 0}},         // 6
    {{1, 3}, {2, 3}, {4, 5}, {4, 6}},         // 7
    {{2, 4}, {4, 6}, {0, 0}, {0, 0}},         // 8
};

static int TwoToFourDigitYear(int nYear)
{
    if (nYear > 99)
        return nYear;
    if (nYear > 50)
        return nYear + 1900;
    return nYear + 2000;
}

static bool MapIntsToDM(int a, int b, CDateMatch& dateRet)
{
    if (a >= 1 && a <= 31 && b >= 1 && b <= 12) {
        dateRet.nDay = a;
        dateRet.nMonth = b;
        return true;
    }
    if (b >= 1 && b <= 31 && a >= 1 && a <= 12) {
        dateRet.nDay = b;
        dateRet.nMonth = a;
        return true;
    }
    return false;
}

static bool MapIntsToDMY(const int ints[3], CDateMatch& dateRet)
{
    // the middle number is always a day or a month
    if (ints[1] > 31 || ints[1] <= 0)
        return false;

    int nOver12 = 0, nOver31 = 0, nUnder1 = 0;
    for (int n = 0; n < 3; n++) {
        if ((ints[n] > 99 && ints[n] < DATE_MIN_YEAR) || ints[n] > DATE_MAX_YEAR)
            return false;
        if (ints[n] > 31)
            nOver31++;
        if (ints[n] > 12)
            nOver12++;
        if (ints[n] <= 0)
            nUnder1++;
    }
    if (nOver31 >= 2 || nOver12 == 3 || nUnder1 >= 2)
        return false;

    // year last, then year first
    const int years[2] = {ints[2], ints[0]};
    const int rests[2][2] = {{ints[0], ints[1]}, {ints[1], ints[2]}};
    for (int n = 0; n < 2; n++) {
        if (years[n] >= DATE_MIN_YEAR && years[n] <= DATE_MAX_YEAR) {
            if (!MapIntsToDM(rests[n][0], rests[n][1], dateRet))
                return false;
            dateRet.nYear = years[n];
            return true;
        }
    }
    for (int n = 0; n < 2; n++) {
        if (MapIntsToDM(rests[n][0], rests[n][1], dateRet)) {
            dateRet.nYear = TwoToFourDigitYear(years[n]);
            return true;
        }
    }
    return false;
}

std::vector<CMatch> DateMatch(const std::u32string& password)
{
    static const std::regex rxNoSeparator("^\\d{4,8}$");
    static const std::regex rxWithSeparator("^(\\d{1,4})([\\s/\\\\_.-])(\\d{1,2})\\2(\\d{1,4})$");

    std::vector<CMatch> vCandidates;
    std::string strAscii = AsciiProjection(password);
    size_t nLength = password.size();
    int nReferenceYear = GetReferenceYear();

    for (size_t i = 0; i + 4 <= nLength; i++) {
        for (size_t j = i + 3; j <= i + 7 && j < nLength; j++) {
            std::string strToken = strAscii.substr(i, j - i + 1);
            if (!std::regex_match(strToken, rxNoSeparator))
                continue;
            const int (*splits)[2] = dateSplits[strToken.size() - 4];
            bool fFound = false;
            CDateMatch best;
            for (int s = 0; s < 4 && splits[s][0] != 0; s++) {
                int k = splits[s][0], l = splits[s][1];
                const int ints[3] = {atoi(strToken.substr(0, k)), atoi(strToken.substr(k, l - k)), atoi(strToken.substr(l))};
                CDateMatch date;
                if (!MapIntsToDMY(ints, date))
                    continue;
                if (!fFound || abs(date.nYear - nReferenceYear) < abs(best.nYear - nReferenceYear))
                    best = date;
                fFound = true;
            }
            if (fFound)
                vCandidates.push_back(CMatch(PATTERN_DATE, i, j, EncodeUTF8(password, i, j + 1), best));
        }
    }

    for (size_t i = 0; i + 6 <= nLength; i++) {
        for (size_t j = i + 5; j <= i + 9 && j < nLength; j++) {
            std::string strToken = strAscii.substr(i, j - i + 1);
            std::smatch rxMatch;
            if (!std::regex_match(strToken, rxMatch, rxWithSeparator))
                continue;
            const int ints[3] = {atoi(rxMatch.str(1)), atoi(rxMatch.str(3)), atoi(rxMatch.str(4))};
            CDateMatch date;
            if (!MapIntsToDMY(ints, date))
                continue;
            date.strSeparator = rxMatch.str(2);
            vCandidates.push_back(CMatch(PATTERN_DATE, i, j, EncodeUTF8(password, i, j + 1), date));
        }
    }

    // drop dates that lie inside another date
    std::vector<CMatch> vMatches;
    for (size_t n = 0; n < vCandidates.size(); n++) {
        bool fSubmatch = false;
        for (size_t m = 0; m < vCandidates.size() && !fSubmatch; m++) {
            if (m != n && vCandidates[m].i <= vCandidates[n].i && vCandidates[m].j >= vCandidates[n].j)
                fSubmatch = true;
        }
        if (!fSubmatch)
            vMatches.push_back(vCandidates[n]);
    }
    std::sort(vMatches.begin(), vMatches.end(), CompareMatches);
    return vMatches;
}

std::vector<CMatch> OmniMatch(const std::u32string& password, const CDictionarySnapshot& snapshot, const CKeyboardGraphs& graphs)
{
    std::vector<CMatch> vMatches = DictionaryMatch(password, snapshot);

    std::vector<CMatch> vMore = ReverseDictionaryMatch(password, snapshot);
    vMatches.insert(vMatches.end(), vMore.begin(), vMore.end());
    vMore = LeetMatch(password, snapshot);
    vMatches.insert(vMatches.end(), vMore.begin(), vMore.end());
    vMore = SpatialMatch(password, graphs);
    vMatches.insert(vMatches.end(), vMore.begin(), vMore.end());
    vMore = RepeatMatch(password, snapshot, graphs);
    vMatches.insert(vMatches.end(), vMore.begin(), vMore.end());
    vMore = SequenceMatch(password);
    vMatches.insert(vMatches.end(), vMore.begin(), vMore.end());
    vMore = RegexMatch(password);
    vMatches.insert(vMatches.end(), vMore.begin(), vMore.end());
    vMore = DateMatch(password);
    vMatches.insert(vMatches.end(), vMore.begin(), vMore.end());

    SortAndUniqueMatches(vMatches);
    LogPrint("matching", "%s: %u candidates over %u characters\n", __func__, vMatches.size(), password.size());
    return vMatches;
}
