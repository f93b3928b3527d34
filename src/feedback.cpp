// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "feedback.h"

#include "utilstrencodings.h"

static bool IsNameDictionary(const std::string& strName)
{
    return strName == "surnames" || strName == "male_names" || strName == "female_names";
}

static CFeedback GetDictionaryFeedback(const CMatch& match, bool fSoleMatch)
{
    CFeedback feedback;
    const CDictionaryMatch& dict = match.Get<CDictionaryMatch>();

    if (dict.strDictionaryName == "passwords") {
        if (fSoleMatch && match.pattern == PATTERN_DICTIONARY) {
            if (dict.nRank <= 10)
                feedback.strWarning = "top10_password";
            else if (dict.nRank <= 100)
                feedback.strWarning = "top100_password";
            else
                feedback.strWarning = "very_common_password";
        } else if (match.nGuessesLog10 <= 4) {
            feedback.strWarning = "similar_to_common";
        }
    } else if (dict.strDictionaryName == "english_wikipedia") {
        if (fSoleMatch)
            feedback.strWarning = "word_by_itself";
    } else if (IsNameDictionary(dict.strDictionaryName)) {
        feedback.strWarning = fSoleMatch ? "names_by_themselves" : "common_names";
    }

    std::u32string word = DecodeUTF8(match.strToken);
    int nUpper = 0, nLower = 0;
    for (size_t n = 0; n < word.size(); n++) {
        if (IsUpperChar(word[n]))
            nUpper++;
        else if (IsLowerChar(word[n]))
            nLower++;
    }
    if (word.size() > 1 && nUpper == 1 && IsUpperChar(word[0]))
        feedback.vSuggestions.push_back("capitalization");
    else if (nUpper > 0 && nLower == 0)
        feedback.vSuggestions.push_back("all_uppercase");

    if (match.pattern == PATTERN_REVERSE_DICTIONARY && word.size() >= 4)
        feedback.vSuggestions.push_back("reversed_words");
    if (match.pattern == PATTERN_LEET)
        feedback.vSuggestions.push_back("predictable_substitutions");
    return feedback;
}

/** Feedback for one match; false if the pattern has nothing to say */
static bool GetMatchFeedback(const CMatch& match, bool fSoleMatch, CFeedback& feedbackRet)
{
    switch (match.pattern) {
    case PATTERN_DICTIONARY:
    case PATTERN_REVERSE_DICTIONARY:
    case PATTERN_LEET:
        feedbackRet = GetDictionaryFeedback(match, fSoleMatch);
        return true;
    case PATTERN_SPATIAL:
        feedbackRet.strWarning = match.Get<CSpatialMatch>().nTurns == 1 ? "straight_rows" : "short_keyboard_patterns";
        feedbackRet.vSuggestions.push_back("longer_keyboard_pattern");
        return true;
    case PATTERN_REPEAT:
        feedbackRet.strWarning = UTF8Length(match.Get<CRepeatMatch>().strBaseToken) == 1 ? "repeats_aaa" : "repeats_abcabc";
        feedbackRet.vSuggestions.push_back("avoid_repeats");
        return true;
    case PATTERN_SEQUENCE:
        feedbackRet.strWarning = "sequences";
        feedbackRet.vSuggestions.push_back("avoid_sequences");
        return true;
    case PATTERN_REGEX:
        if (match.Get<CRegexMatch>().strRegexName != "recent_year")
            return false;
        feedbackRet.strWarning = "recent_years";
        feedbackRet.vSuggestions.push_back("avoid_recent_years");
        feedbackRet.vSuggestions.push_back("avoid_associated_years");
        return true;
    case PATTERN_DATE:
        feedbackRet.strWarning = "dates";
        feedbackRet.vSuggestions.push_back("avoid_associated_dates");
        return true;
    case PATTERN_BRUTEFORCE:
        return false;
    }
    return false;
}

const CMatch* GetDominantMatch(const std::vector<CMatch>& vSequence)
{
    const CMatch* pbest = NULL;
    for (size_t n = 0; n < vSequence.size(); n++) {
        const CMatch& match = vSequence[n];
        // strictly better only, so the earliest wins a full tie
        if (pbest == NULL || match.Length() > pbest->Length() ||
            (match.Length() == pbest->Length() && match.nGuesses > pbest->nGuesses))
            pbest = &match;
    }
    return pbest;
}

CFeedback GetFeedback(int nScore, const std::vector<CMatch>& vSequence)
{
    CFeedback feedback;
    if (vSequence.empty()) {
        feedback.vSuggestions.push_back("use_few_words");
        feedback.vSuggestions.push_back("no_need_symbols");
        return feedback;
    }
    if (nScore > MAX_SCORE_WITH_FEEDBACK)
        return feedback;

    const CMatch* pmatch = GetDominantMatch(vSequence);
    if (!GetMatchFeedback(*pmatch, vSequence.size() == 1, feedback))
        feedback = CFeedback();
    feedback.vSuggestions.insert(feedback.vSuggestions.begin(), "add_another_word");
    return feedback;
}

CFeedbackText RenderFeedback(const CFeedback& feedback, const TranslationFn& translate)
{
    CFeedbackText text;
    if (!feedback.strWarning.empty())
        text.strWarning = translate ? translate(feedback.strWarning) : feedback.strWarning;
    for (size_t n = 0; n < feedback.vSuggestions.size(); n++)
        text.vSuggestions.push_back(translate ? translate(feedback.vSuggestions[n]) : feedback.vSuggestions[n]);
    return text;
}
