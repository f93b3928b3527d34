// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PWGUESS_FREQUENCY_LISTS_H
#define PWGUESS_FREQUENCY_LISTS_H

/**
 * Built-in word lists, most frequent first, lower case, each terminated
 * by a NULL entry.
 */
extern const char* const FREQUENCY_LIST_PASSWORDS[];
extern const char* const FREQUENCY_LIST_ENGLISH_WIKIPEDIA[];
extern const char* const FREQUENCY_LIST_FEMALE_NAMES[];
extern const char* const FREQUENCY_LIST_SURNAMES[];
extern const char* const FREQUENCY_LIST_US_TV_AND_FILM[];
extern const char* const FREQUENCY_LIST_MALE_NAMES[];

#endif // PWGUESS_FREQUENCY_LISTS_H
