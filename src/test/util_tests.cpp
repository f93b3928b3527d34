// Copyright (c) 2011-2014 The Bitcoin developers
// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util.h"

#include "utilstrencodings.h"

#include <string>
#include <vector>

#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/test/unit_test.hpp>

BOOST_AUTO_TEST_SUITE(util_tests)

BOOST_AUTO_TEST_CASE(util_ParseParameters)
{
    const char* argv_test[] = {"-ignored", "-a", "-b", "-ccc=argument", "-ccc=multiple", "f", "-d=e"};

    ParseParameters(0, argv_test);
    BOOST_CHECK(mapArgs.empty() && mapMultiArgs.empty());

    ParseParameters(1, argv_test);
    BOOST_CHECK(mapArgs.empty() && mapMultiArgs.empty());

    ParseParameters(5, argv_test);
    // expectation: -ignored is ignored (program name argument),
    // -a, -b and -ccc end up in map, -d ignored because it is after
    // a non-option argument (non-GNU option parsing)
    BOOST_CHECK(mapArgs.size() == 3 && mapMultiArgs.size() == 3);
    BOOST_CHECK(mapArgs.count("-a") && mapArgs.count("-b") && mapArgs.count("-ccc") && !mapArgs.count("f") && !mapArgs.count("-d"));
    BOOST_CHECK(mapMultiArgs.count("-a") && mapMultiArgs.count("-b") && mapMultiArgs.count("-ccc") && !mapMultiArgs.count("f") && !mapMultiArgs.count("-d"));

    BOOST_CHECK(mapArgs["-a"] == "" && mapArgs["-ccc"] == "multiple");
    BOOST_CHECK(mapMultiArgs["-ccc"].size() == 2);

    ParseParameters(7, argv_test);
    BOOST_CHECK(!mapArgs.count("-d"));
    mapArgs.clear();
    mapMultiArgs.clear();
}

BOOST_AUTO_TEST_CASE(util_ParseParameters_terminator)
{
    const char* argv_test[] = {"pwguess-cli", "-json", "--", "-secret", "--lang=de", "plain"};

    ParseParameters(6, argv_test);
    BOOST_CHECK(mapArgs.count("-json"));
    BOOST_CHECK(!mapArgs.count("-") && !mapArgs.count("--"));
    BOOST_CHECK(!mapArgs.count("-secret") && !mapArgs.count("-lang"));
    BOOST_CHECK_EQUAL(FirstNonOptionArg(6, argv_test), 3);

    // no terminator: the first argument not starting with '-'
    const char* argv_plain[] = {"pwguess-cli", "-json", "plain", "-secret"};
    ParseParameters(4, argv_plain);
    BOOST_CHECK_EQUAL(FirstNonOptionArg(4, argv_plain), 2);

    // only options, or a trailing terminator: read from stdin
    BOOST_CHECK_EQUAL(FirstNonOptionArg(2, argv_test), 2);
    BOOST_CHECK_EQUAL(FirstNonOptionArg(3, argv_test), 3);
    mapArgs.clear();
    mapMultiArgs.clear();
}

BOOST_AUTO_TEST_CASE(util_GetArg)
{
    mapArgs.clear();
    mapArgs["strtest1"] = "string...";
    // strtest2 undefined on purpose
    mapArgs["inttest1"] = "12345";
    mapArgs["inttest2"] = "81985529216486895";
    // inttest3 undefined on purpose
    mapArgs["booltest1"] = "";
    // booltest2 undefined on purpose
    mapArgs["booltest3"] = "0";
    mapArgs["booltest4"] = "1";

    BOOST_CHECK_EQUAL(GetArg("strtest1", "default"), "string...");
    BOOST_CHECK_EQUAL(GetArg("strtest2", "default"), "default");
    BOOST_CHECK_EQUAL(GetArg("inttest1", -1), 12345);
    BOOST_CHECK_EQUAL(GetArg("inttest2", -1), 81985529216486895LL);
    BOOST_CHECK_EQUAL(GetArg("inttest3", -1), -1);
    BOOST_CHECK_EQUAL(GetBoolArg("booltest1", false), true);
    BOOST_CHECK_EQUAL(GetBoolArg("booltest2", false), false);
    BOOST_CHECK_EQUAL(GetBoolArg("booltest3", false), false);
    BOOST_CHECK_EQUAL(GetBoolArg("booltest4", false), true);

    BOOST_CHECK(!SoftSetArg("strtest1", "other"));
    BOOST_CHECK_EQUAL(GetArg("strtest1", "default"), "string...");
    BOOST_CHECK(SoftSetBoolArg("booltest2", true));
    BOOST_CHECK_EQUAL(GetBoolArg("booltest2", false), true);
    mapArgs.clear();
}

BOOST_AUTO_TEST_CASE(util_NegativeSettings)
{
    const char* argv_test[] = {"ignored", "-nojson", "-noprinttoconsole=0", "--lang=de"};
    ParseParameters(4, argv_test);
    BOOST_CHECK_EQUAL(GetBoolArg("-json", true), false);
    BOOST_CHECK_EQUAL(GetBoolArg("-printtoconsole", false), true);
    BOOST_CHECK_EQUAL(GetArg("-lang", "en"), "de");
    mapArgs.clear();
    mapMultiArgs.clear();
}

BOOST_AUTO_TEST_CASE(util_SplitNamedArg)
{
    std::string strName, strValue;
    BOOST_CHECK(SplitNamedArg("de:/usr/share/pwguess/de.txt", strName, strValue));
    BOOST_CHECK_EQUAL(strName, "de");
    BOOST_CHECK_EQUAL(strValue, "/usr/share/pwguess/de.txt");
    BOOST_CHECK(SplitNamedArg("win:C:\\words.txt", strName, strValue));
    BOOST_CHECK_EQUAL(strValue, "C:\\words.txt");
    BOOST_CHECK(!SplitNamedArg("nocolon", strName, strValue));
    BOOST_CHECK(!SplitNamedArg(":value", strName, strValue));
    BOOST_CHECK(!SplitNamedArg("name:", strName, strValue));
}

BOOST_AUTO_TEST_CASE(util_ReadConfigFile)
{
    boost::filesystem::path path = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("pwguess_%%%%-%%%%.conf");
    {
        boost::filesystem::ofstream stream(path);
        stream << "# settings\n"
               << "lang=de\n"
               << "maxlength=40\n"
               << "userinput=alice\n"
               << "userinput=bob\n"
               << "nologtimestamps=1\n";
    }

    std::string strConf = "-conf=" + path.string();
    const char* argv_test[] = {"ignored", strConf.c_str(), "-maxlength=10"};
    ParseParameters(3, argv_test);
    BOOST_CHECK(ReadConfigFile(mapArgs, mapMultiArgs));

    // the command line wins over the file
    BOOST_CHECK_EQUAL(GetArg("-maxlength", (int64_t)0), 10);
    BOOST_CHECK_EQUAL(GetArg("-lang", "en"), "de");
    BOOST_CHECK_EQUAL(mapMultiArgs["-userinput"].size(), 2U);
    BOOST_CHECK_EQUAL(mapMultiArgs["-userinput"][1], "bob");
    BOOST_CHECK_EQUAL(GetBoolArg("-logtimestamps", true), false);
    boost::filesystem::remove(path);

    // a missing file is not an error
    mapArgs["-conf"] = "/nonexistent/pwguess.conf";
    BOOST_CHECK(ReadConfigFile(mapArgs, mapMultiArgs));
    mapArgs.clear();
    mapMultiArgs.clear();
}

BOOST_AUTO_TEST_CASE(util_FormatParagraph)
{
    BOOST_CHECK_EQUAL(FormatParagraph("", 79, 0), "");
    BOOST_CHECK_EQUAL(FormatParagraph("test", 79, 0), "test");
    BOOST_CHECK_EQUAL(FormatParagraph(" test", 79, 0), "test");
    BOOST_CHECK_EQUAL(FormatParagraph("test test", 79, 0), "test test");
    BOOST_CHECK_EQUAL(FormatParagraph("test test", 4, 0), "test\ntest");
    BOOST_CHECK_EQUAL(FormatParagraph("testerde test ", 4, 0), "testerde\ntest");
    BOOST_CHECK_EQUAL(FormatParagraph("test test", 4, 4), "test\n    test");
}

BOOST_AUTO_TEST_CASE(util_CaseMapping)
{
    BOOST_CHECK(ToLowerChar('A') == 'a');
    BOOST_CHECK(ToLowerChar(0xC9) == 0xE9);
    // Y with diaeresis is the one Latin Extended-A capital with a Latin-1 lower case
    BOOST_CHECK(ToLowerChar(0x178) == 0xFF);
    BOOST_CHECK(ToLowerChar(0xFF) == 0xFF);
    BOOST_CHECK(IsUpperChar(0x178));
    BOOST_CHECK(IsLowerChar(0xFF));
    BOOST_CHECK(ToLowerChar(0x179) == 0x17A);
    BOOST_CHECK(ToLowerChar(0x17D) == 0x17E);
    BOOST_CHECK(ToLowerChar(0x139) == 0x13A);
    BOOST_CHECK(ToLowerChar(0x100) == 0x101);
    BOOST_CHECK(!IsUpperChar(0x17A));
    BOOST_CHECK_EQUAL(ToLowerUTF8("\xc5\xb8" "ES"), "\xc3\xbf" "es");
}

BOOST_AUTO_TEST_CASE(util_strprintf)
{
    BOOST_CHECK_EQUAL(strprintf("%s %d %u", "abc", -5, 7U), "abc -5 7");
    BOOST_CHECK_EQUAL(strprintf("%.2f", 1.005e3), "1005.00");
}

BOOST_AUTO_TEST_SUITE_END()
