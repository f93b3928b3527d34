// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PWGUESS_UTILTIME_H
#define PWGUESS_UTILTIME_H

#include <stdint.h>
#include <string>

int64_t GetTime();
int64_t GetTimeMicros();

std::string DateTimeStrFormat(const char* pszFormat, int64_t nTime);

/** Calendar year (UTC) of a unix timestamp */
int GetYear(int64_t nTime);

#endif // PWGUESS_UTILTIME_H
