// Copyright (c) 2012-2014 The Bitcoin developers
// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "clientversion.h"

#include "util.h"

const std::string CLIENT_NAME("pwguess");

static std::string FormatVersion(int nVersion)
{
    return strprintf("%d.%d.%d", nVersion / 1000000, (nVersion / 10000) % 100, (nVersion / 100) % 100);
}

std::string FormatFullVersion()
{
    return "v" + FormatVersion(CLIENT_VERSION);
}

std::string LicenseInfo()
{
    return strprintf("Copyright (C) %d The Pwguess developers\n\n", COPYRIGHT_YEAR) +
           "This is experimental software.\n\n" +
           "Distributed under the MIT software license, see the accompanying file COPYING\n" +
           "or <http://www.opensource.org/licenses/mit-license.php>.\n";
}
