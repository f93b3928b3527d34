// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "strengthjson.h"

namespace
{
/** Adds the pattern specific fields of a match to a JSON object */
class CDetailToJSONVisitor : public boost::static_visitor<void>
{
private:
    UniValue& entry;

public:
    explicit CDetailToJSONVisitor(UniValue& entryIn) : entry(entryIn) {}

    void operator()(const CDictionaryMatch& dict) const
    {
        entry.pushKV("dictionary_name", dict.strDictionaryName);
        entry.pushKV("matched_word", dict.strMatchedWord);
        entry.pushKV("rank", dict.nRank);
        entry.pushKV("uppercase_variations", dict.nUppercaseVariations);
        entry.pushKV("l33t_variations", dict.nLeetVariations);
        if (!dict.mapSub.empty()) {
            UniValue sub(UniValue::VOBJ);
            for (std::map<std::string, std::string>::const_iterator it = dict.mapSub.begin(); it != dict.mapSub.end(); ++it)
                sub.pushKV(it->first, it->second);
            entry.pushKV("sub", sub);
        }
    }

    void operator()(const CSpatialMatch& spatial) const
    {
        entry.pushKV("graph", spatial.strGraph);
        entry.pushKV("turns", spatial.nTurns);
        entry.pushKV("shifted_count", spatial.nShiftedCount);
    }

    void operator()(const CRepeatMatch& repeat) const
    {
        entry.pushKV("base_token", repeat.strBaseToken);
        entry.pushKV("base_guesses", repeat.nBaseGuesses);
        entry.pushKV("repeat_count", repeat.nRepeatCount);
    }

    void operator()(const CSequenceMatch& sequence) const
    {
        entry.pushKV("sequence_name", sequence.strSequenceName);
        entry.pushKV("sequence_space", sequence.nSequenceSpace);
        entry.pushKV("ascending", sequence.fAscending);
    }

    void operator()(const CRegexMatch& regex) const
    {
        entry.pushKV("regex_name", regex.strRegexName);
    }

    void operator()(const CDateMatch& date) const
    {
        entry.pushKV("separator", date.strSeparator);
        entry.pushKV("year", date.nYear);
        entry.pushKV("month", date.nMonth);
        entry.pushKV("day", date.nDay);
    }

    void operator()(const CBruteforceMatch& bruteforce) const
    {
        entry.pushKV("cardinality", bruteforce.nCardinality);
    }
};
} // anon namespace

UniValue MatchToJSON(const CMatch& match)
{
    UniValue entry(UniValue::VOBJ);
    entry.pushKV("pattern", GetPatternName(match.pattern));
    entry.pushKV("i", (uint64_t)match.i);
    entry.pushKV("j", (uint64_t)match.j);
    entry.pushKV("token", match.strToken);
    entry.pushKV("guesses", match.nGuesses);
    entry.pushKV("guesses_log10", match.nGuessesLog10);
    boost::apply_visitor(CDetailToJSONVisitor(entry), match.detail);
    return entry;
}

static UniValue StringsToJSON(const std::vector<std::string>& vStrings)
{
    UniValue arr(UniValue::VARR);
    for (size_t n = 0; n < vStrings.size(); n++)
        arr.push_back(vStrings[n]);
    return arr;
}

UniValue StrengthResultToJSON(const CStrengthResult& result, bool fIncludePassword)
{
    UniValue obj(UniValue::VOBJ);
    if (fIncludePassword)
        obj.pushKV("password", result.strPassword);
    obj.pushKV("guesses", result.nGuesses);
    obj.pushKV("guesses_log10", result.nGuessesLog10);
    obj.pushKV("score", result.nScore);

    UniValue sequence(UniValue::VARR);
    for (size_t n = 0; n < result.vSequence.size(); n++)
        sequence.push_back(MatchToJSON(result.vSequence[n]));
    obj.pushKV("sequence", sequence);

    UniValue seconds(UniValue::VOBJ);
    UniValue display(UniValue::VOBJ);
    for (int n = 0; n < MAX_ATTACK_SCENARIOS; n++) {
        const char* pszName = GetScenarioName((AttackScenario)n);
        seconds.pushKV(pszName, result.crackTimes.nSeconds[n]);
        display.pushKV(pszName, result.strCrackTimesDisplay[n]);
    }
    obj.pushKV("crack_times_seconds", seconds);
    obj.pushKV("crack_times_display", display);

    UniValue feedback(UniValue::VOBJ);
    feedback.pushKV("warning", result.feedback.strWarning);
    feedback.pushKV("suggestions", StringsToJSON(result.feedback.vSuggestions));
    if (result.fHaveFeedbackText) {
        UniValue text(UniValue::VOBJ);
        text.pushKV("warning", result.feedbackText.strWarning);
        text.pushKV("suggestions", StringsToJSON(result.feedbackText.vSuggestions));
        feedback.pushKV("text", text);
    }
    obj.pushKV("feedback", feedback);
    obj.pushKV("calc_time", result.nCalcTimeMicros * 0.001);
    return obj;
}
