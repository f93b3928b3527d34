// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PWGUESS_TIME_ESTIMATES_H
#define PWGUESS_TIME_ESTIMATES_H

#include "translation.h"

#include <stdint.h>
#include <string>

enum AttackScenario {
    ONLINE_THROTTLING,
    ONLINE_NO_THROTTLING,
    OFFLINE_SLOW_HASHING,
    OFFLINE_FAST_HASHING,
    MAX_ATTACK_SCENARIOS
};

/** "online_throttling_100_per_hour", ... */
const char* GetScenarioName(AttackScenario scenario);

/** Guesses per second the attacker manages in a scenario */
double GetGuessesPerSecond(AttackScenario scenario);

/** A duration rounded into one display unit */
class CTimeBucket
{
public:
    //! instant, seconds, minutes, hours, days, months, years or centuries
    std::string strBucket;
    //! rounded number of units, 0 for instant and centuries
    int64_t nCount;

    CTimeBucket() : nCount(0) {}
    CTimeBucket(const std::string& strBucketIn, int64_t nCountIn) : strBucket(strBucketIn), nCount(nCountIn) {}

    /** Catalog key of the display text ("time.minutes") */
    std::string GetKey() const;
};

CTimeBucket GetTimeBucket(double nSeconds);

/** Render a bucket through a translation, "%d" in the text becomes the count */
std::string DisplayTime(const CTimeBucket& bucket, const TranslationFn& translate);

class CCrackTimes
{
public:
    double nSeconds[MAX_ATTACK_SCENARIOS];
    CTimeBucket buckets[MAX_ATTACK_SCENARIOS];
};

CCrackTimes EstimateAttackTimes(double nGuesses);

#endif // PWGUESS_TIME_ESTIMATES_H
