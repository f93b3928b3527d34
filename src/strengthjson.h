// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PWGUESS_STRENGTHJSON_H
#define PWGUESS_STRENGTHJSON_H

#include "match.h"
#include "strength.h"

#include <univalue.h>

UniValue MatchToJSON(const CMatch& match);

/** The password itself is only included when fIncludePassword is set */
UniValue StrengthResultToJSON(const CStrengthResult& result, bool fIncludePassword = false);

#endif // PWGUESS_STRENGTHJSON_H
