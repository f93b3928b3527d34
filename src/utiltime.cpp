// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "utiltime.h"

#include <locale>
#include <time.h>
#include <sstream>

#include <boost/date_time/posix_time/posix_time.hpp>

int64_t GetTime()
{
    return time(NULL);
}

int64_t GetTimeMicros()
{
    return (boost::posix_time::microsec_clock::universal_time() -
               boost::posix_time::ptime(boost::gregorian::date(1970, 1, 1)))
        .total_microseconds();
}

std::string DateTimeStrFormat(const char* pszFormat, int64_t nTime)
{
    // std::locale takes ownership of the pointer
    std::locale loc(std::locale::classic(), new boost::posix_time::time_facet(pszFormat));
    std::stringstream ss;
    ss.imbue(loc);
    ss << boost::posix_time::from_time_t(nTime);
    return ss.str();
}

int GetYear(int64_t nTime)
{
    return boost::posix_time::from_time_t(nTime).date().year();
}
