// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PWGUESS_FEEDBACK_H
#define PWGUESS_FEEDBACK_H

#include "match.h"
#include "translation.h"

#include <string>
#include <vector>

/** Catalog keys explaining a result; an empty warning means none */
class CFeedback
{
public:
    std::string strWarning;
    std::vector<std::string> vSuggestions;

    bool IsNull() const { return strWarning.empty() && vSuggestions.empty(); }
};

/** Rendered text of a CFeedback */
class CFeedbackText
{
public:
    std::string strWarning;
    std::vector<std::string> vSuggestions;
};

/** Scores above this get no feedback */
static const int MAX_SCORE_WITH_FEEDBACK = 2;

/** The match feedback is based on: longest, then most guesses, then earliest */
const CMatch* GetDominantMatch(const std::vector<CMatch>& vSequence);

CFeedback GetFeedback(int nScore, const std::vector<CMatch>& vSequence);

CFeedbackText RenderFeedback(const CFeedback& feedback, const TranslationFn& translate);

#endif // PWGUESS_FEEDBACK_H
