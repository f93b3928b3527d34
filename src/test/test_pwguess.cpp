// Copyright (c) 2011-2013 The Bitcoin Core developers
// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#define BOOST_TEST_MODULE Pwguess Test Suite

#include "util.h"

#include <boost/test/unit_test.hpp>

struct TestingSetup {
    TestingSetup()
    {
        SetupEnvironment();
        fPrintToConsole = false;
        fPrintToDebugLog = false; // don't want to write to a log file
        fDebug = false;
        mapArgs.clear();
        mapMultiArgs.clear();
        ResetLogCategories();
    }
    ~TestingSetup()
    {
        OpenDebugLog(boost::filesystem::path());
    }
};

BOOST_GLOBAL_FIXTURE(TestingSetup);
