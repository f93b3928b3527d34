// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PWGUESS_MATCHING_H
#define PWGUESS_MATCHING_H

#include "adjacency_graphs.h"
#include "dictionaries.h"
#include "match.h"

#include <map>
#include <string>
#include <vector>

/**
 * Matchers. Each scans a password (as code points) and returns candidate
 * matches without guess estimates, except that a repeat match carries the
 * estimate of its base token. Overlapping candidates are expected; the
 * sequence optimizer picks among them.
 */

static const size_t MIN_SPATIAL_LENGTH = 3;
static const size_t MIN_SEQUENCE_LENGTH = 3;

static const int DATE_MIN_YEAR = 1000;
static const int DATE_MAX_YEAR = 2050;

/** A leet substitution: leet character -> the letter it replaces */
typedef std::map<char32_t, char32_t> LeetSub;

/** Letter -> characters that stand in for it */
const std::map<char32_t, std::u32string>& LeetTable();

/** The part of the leet table whose substitutes occur in the password */
std::map<char32_t, std::u32string> RelevantLeetSubtable(const std::u32string& password);

/**
 * Every distinct way of reading the leet characters of a subtable, where
 * a character standing for several letters (1 for i or l) picks one.
 */
std::vector<LeetSub> EnumerateLeetSubs(const std::map<char32_t, std::u32string>& table);

std::vector<CMatch> DictionaryMatch(const std::u32string& password, const CDictionarySnapshot& snapshot);
std::vector<CMatch> ReverseDictionaryMatch(const std::u32string& password, const CDictionarySnapshot& snapshot);
std::vector<CMatch> LeetMatch(const std::u32string& password, const CDictionarySnapshot& snapshot);
std::vector<CMatch> SpatialMatch(const std::u32string& password, const CKeyboardGraphs& graphs);
std::vector<CMatch> RepeatMatch(const std::u32string& password, const CDictionarySnapshot& snapshot, const CKeyboardGraphs& graphs);
std::vector<CMatch> SequenceMatch(const std::u32string& password);
std::vector<CMatch> RegexMatch(const std::u32string& password);
std::vector<CMatch> DateMatch(const std::u32string& password);

/** All matchers, sorted by span and de-duplicated */
std::vector<CMatch> OmniMatch(const std::u32string& password, const CDictionarySnapshot& snapshot, const CKeyboardGraphs& graphs);

#endif // PWGUESS_MATCHING_H
