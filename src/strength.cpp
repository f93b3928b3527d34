// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "strength.h"

#include "matching.h"
#include "scoring.h"
#include "util.h"
#include "utilstrencodings.h"
#include "utiltime.h"

password_length_error::password_length_error(size_t nLengthIn, size_t nMaxLengthIn)
    : std::runtime_error(strprintf("Password exceeds max length of %u characters", nMaxLengthIn)),
      nLength(nLengthIn), nMaxLength(nMaxLengthIn)
{
}

std::string CStrengthResult::ToString() const
{
    std::string str = strprintf("CStrengthResult(score=%d, guesses=%g, log10=%.5f, matches=%u, %dus)\n",
        nScore, nGuesses, nGuessesLog10, vSequence.size(), nCalcTimeMicros);
    for (size_t n = 0; n < vSequence.size(); n++)
        str += "    " + vSequence[n].ToString() + "\n";
    return str;
}

static std::string TranslateEnglish(const std::string& strKey)
{
    const TranslationCatalog& catalog = DefaultEnglishCatalog();
    TranslationCatalog::const_iterator it = catalog.find(strKey);
    return it == catalog.end() ? strKey : it->second;
}

CStrengthResult EvaluatePassword(const std::string& strPassword, const CDictionarySnapshot& snapshot,
    const CKeyboardGraphs& graphs, size_t nMaxLength, const TranslationFn& translate)
{
    int64_t nTimeStart = GetTimeMicros();

    std::u32string password = DecodeUTF8(strPassword);
    if (password.size() > nMaxLength)
        throw password_length_error(password.size(), nMaxLength);

    CStrengthResult result;
    result.strPassword = strPassword;

    std::vector<CMatch> vMatches = OmniMatch(password, snapshot, graphs);
    COptimalSequence optimal = MostGuessableMatchSequence(password, vMatches);
    result.vSequence.swap(optimal.vSequence);
    result.nGuesses = optimal.nGuesses;
    result.nGuessesLog10 = optimal.nGuessesLog10;
    result.nScore = GuessesToScore(result.nGuesses);

    result.crackTimes = EstimateAttackTimes(result.nGuesses);
    TranslationFn display = translate ? translate : TranslationFn(&TranslateEnglish);
    for (int n = 0; n < MAX_ATTACK_SCENARIOS; n++)
        result.strCrackTimesDisplay[n] = DisplayTime(result.crackTimes.buckets[n], display);

    result.feedback = GetFeedback(result.nScore, result.vSequence);
    if (translate) {
        result.feedbackText = RenderFeedback(result.feedback, translate);
        result.fHaveFeedbackText = true;
    }

    result.nCalcTimeMicros = GetTimeMicros() - nTimeStart;
    LogPrint("bench", "    - Evaluate %u code points: %.2fms (%u candidates, %u in sequence)\n",
        password.size(), result.nCalcTimeMicros * 0.001, vMatches.size(), result.vSequence.size());
    return result;
}

CStrengthEstimator::CStrengthEstimator(const std::string& strLangIn, const std::vector<std::string>& vUserInputs, size_t nMaxLengthIn)
    : strLang(NormalizeLanguageTag(strLangIn.empty() ? DEFAULT_LANGUAGE : strLangIn)),
      nMaxLength(nMaxLengthIn), fHavePassword(false)
{
    if (!vUserInputs.empty())
        dictionaries.SetUserInputs(vUserInputs);
    translate = translator.GetTranslation(strLang);
}

CStrengthResult CStrengthEstimator::SetPassword(const std::string& strPasswordIn)
{
    LOCK(cs);
    CStrengthResult result = EvaluatePassword(strPasswordIn, *dictionaries.GetSnapshot(), DefaultKeyboardGraphs(), nMaxLength, translate);
    strPassword = strPasswordIn;
    fHavePassword = true;
    lastResult = result;
    return result;
}

bool CStrengthEstimator::GetResult(CStrengthResult& resultRet) const
{
    LOCK(cs);
    if (!fHavePassword)
        return false;
    resultRet = lastResult;
    return true;
}

bool CStrengthEstimator::GetPassword(std::string& strPasswordRet) const
{
    LOCK(cs);
    if (!fHavePassword)
        return false;
    strPasswordRet = strPassword;
    return true;
}

// cs must be held
void CStrengthEstimator::Reevaluate()
{
    if (fHavePassword)
        lastResult = EvaluatePassword(strPassword, *dictionaries.GetSnapshot(), DefaultKeyboardGraphs(), nMaxLength, translate);
}

void CStrengthEstimator::UpdateUserInputs(const std::vector<std::string>& vUserInputs)
{
    LOCK(cs);
    dictionaries.SetUserInputs(vUserInputs);
    Reevaluate();
}

void CStrengthEstimator::AddDictionary(const CRankedDictionary& dict)
{
    LOCK(cs);
    dictionaries.AddDictionary(dict);
    Reevaluate();
}

bool CStrengthEstimator::LoadCatalogFile(const std::string& strCatalogLang, const boost::filesystem::path& path)
{
    LOCK(cs);
    if (!translator.LoadCatalogFile(strCatalogLang, path))
        return false;
    translate = translator.GetTranslation(strLang);
    Reevaluate();
    return true;
}

void CStrengthEstimator::SetLanguage(const std::string& strLangIn)
{
    std::string strNew = NormalizeLanguageTag(strLangIn.empty() ? DEFAULT_LANGUAGE : strLangIn);
    LOCK(cs);
    if (strNew == strLang)
        return;
    strLang = strNew;
    translate = translator.GetTranslation(strLang);
    LogPrint("i18n", "%s: language now %s\n", __func__, strLang);
    Reevaluate();
}

std::string CStrengthEstimator::GetLanguage() const
{
    LOCK(cs);
    return strLang;
}

std::string CStrengthEstimator::ToString() const
{
    LOCK(cs);
    return strprintf("CStrengthEstimator(lang=%s, maxlength=%u, password_set=%s)", strLang, nMaxLength, fHavePassword ? "true" : "false");
}
