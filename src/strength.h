// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PWGUESS_STRENGTH_H
#define PWGUESS_STRENGTH_H

#include "adjacency_graphs.h"
#include "dictionaries.h"
#include "feedback.h"
#include "match.h"
#include "sync.h"
#include "time_estimates.h"
#include "translation.h"

#include <stdexcept>
#include <stdint.h>
#include <string>
#include <vector>

static const unsigned int DEFAULT_MAX_PASSWORD_LENGTH = 72;

/** Thrown before any matching when a password is too long */
class password_length_error : public std::runtime_error
{
public:
    password_length_error(size_t nLengthIn, size_t nMaxLengthIn);

    size_t nLength;
    size_t nMaxLength;
};

class CStrengthResult
{
public:
    std::string strPassword;
    double nGuesses;
    double nGuessesLog10;
    std::vector<CMatch> vSequence;
    int nScore;
    CCrackTimes crackTimes;
    std::string strCrackTimesDisplay[MAX_ATTACK_SCENARIOS];
    CFeedback feedback;
    //! set only when a translation was passed
    bool fHaveFeedbackText;
    CFeedbackText feedbackText;
    int64_t nCalcTimeMicros;

    CStrengthResult() : nGuesses(1), nGuessesLog10(0), nScore(0), fHaveFeedbackText(false), nCalcTimeMicros(0) {}

    std::string ToString() const;
};

/**
 * Estimate the strength of a UTF-8 password against one dictionary
 * snapshot. Crack times are displayed through translate, or through the
 * English catalog when none is given.
 * @throws password_length_error if the password has more than nMaxLength code points
 */
CStrengthResult EvaluatePassword(const std::string& strPassword, const CDictionarySnapshot& snapshot,
    const CKeyboardGraphs& graphs, size_t nMaxLength = DEFAULT_MAX_PASSWORD_LENGTH,
    const TranslationFn& translate = TranslationFn());

/**
 * Long lived estimator. Keeps its dictionaries and translation between
 * evaluations and re-evaluates the current password when either changes.
 * All methods may be called from any thread.
 */
class CStrengthEstimator
{
public:
    explicit CStrengthEstimator(const std::string& strLangIn = DEFAULT_LANGUAGE,
        const std::vector<std::string>& vUserInputs = std::vector<std::string>(),
        size_t nMaxLengthIn = DEFAULT_MAX_PASSWORD_LENGTH);

    /** @throws password_length_error, the previous password and result are kept */
    CStrengthResult SetPassword(const std::string& strPassword);

    /** False until a password has been evaluated */
    bool GetResult(CStrengthResult& resultRet) const;
    bool GetPassword(std::string& strPasswordRet) const;

    void UpdateUserInputs(const std::vector<std::string>& vUserInputs);
    void SetLanguage(const std::string& strLangIn);

    /** Add a word list ahead of user_inputs */
    void AddDictionary(const CRankedDictionary& dict);

    /** Load a catalog file and re-render the current result */
    bool LoadCatalogFile(const std::string& strCatalogLang, const boost::filesystem::path& path);

    std::string GetLanguage() const;
    size_t GetMaxLength() const { return nMaxLength; }

    std::string ToString() const;

private:
    mutable CCriticalSection cs;
    std::string strLang;
    const size_t nMaxLength;
    CDictionaryProvider dictionaries;
    CTranslator translator;
    TranslationFn translate;
    bool fHavePassword;
    std::string strPassword;
    CStrengthResult lastResult;

    void Reevaluate();
};

#endif // PWGUESS_STRENGTH_H
