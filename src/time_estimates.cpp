// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "time_estimates.h"

#include "util.h"

#include <cmath>

#include <boost/algorithm/string/replace.hpp>

static const double MINUTE = 60;
static const double HOUR = MINUTE * 60;
static const double DAY = HOUR * 24;
static const double MONTH = DAY * 31;
static const double YEAR = MONTH * 12;
static const double CENTURY = YEAR * 100;

struct ScenarioInfo {
    const char* pszName;
    double nGuessesPerSecond;
};

static const ScenarioInfo scenarios[MAX_ATTACK_SCENARIOS] = {
    {"online_throttling_100_per_hour", 100.0 / 3600},
    {"online_no_throttling_10_per_second", 10},
    {"offline_slow_hashing_1e4_per_second", 1e4},
    {"offline_fast_hashing_1e10_per_second", 1e10},
};

const char* GetScenarioName(AttackScenario scenario)
{
    return scenarios[scenario].pszName;
}

double GetGuessesPerSecond(AttackScenario scenario)
{
    return scenarios[scenario].nGuessesPerSecond;
}

std::string CTimeBucket::GetKey() const
{
    if (strBucket == "instant" || strBucket == "centuries")
        return "time." + strBucket;
    // singular for one unit: "time.minute"
    if (nCount == 1)
        return "time." + strBucket.substr(0, strBucket.size() - 1);
    return "time." + strBucket;
}

CTimeBucket GetTimeBucket(double nSeconds)
{
    if (nSeconds < 1)
        return CTimeBucket("instant", 0);
    if (nSeconds < MINUTE)
        return CTimeBucket("seconds", std::llround(nSeconds));
    if (nSeconds < HOUR)
        return CTimeBucket("minutes", std::llround(nSeconds / MINUTE));
    if (nSeconds < DAY)
        return CTimeBucket("hours", std::llround(nSeconds / HOUR));
    if (nSeconds < MONTH)
        return CTimeBucket("days", std::llround(nSeconds / DAY));
    if (nSeconds < YEAR)
        return CTimeBucket("months", std::llround(nSeconds / MONTH));
    if (nSeconds < CENTURY)
        return CTimeBucket("years", std::llround(nSeconds / YEAR));
    return CTimeBucket("centuries", 0);
}

std::string DisplayTime(const CTimeBucket& bucket, const TranslationFn& translate)
{
    std::string strText = translate ? translate(bucket.GetKey()) : bucket.GetKey();
    boost::algorithm::replace_all(strText, "%d", strprintf("%d", bucket.nCount));
    return strText;
}

CCrackTimes EstimateAttackTimes(double nGuesses)
{
    CCrackTimes times;
    for (int n = 0; n < MAX_ATTACK_SCENARIOS; n++) {
        times.nSeconds[n] = nGuesses / scenarios[n].nGuessesPerSecond;
        times.buckets[n] = GetTimeBucket(times.nSeconds[n]);
    }
    return times;
}
