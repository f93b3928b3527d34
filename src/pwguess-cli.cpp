// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "clientversion.h"
#include "dictionaries.h"
#include "strength.h"
#include "strengthjson.h"
#include "util.h"

#include <iostream>
#include <stdio.h>
#include <stdlib.h>

#include <boost/filesystem/operations.hpp>

static std::string HelpMessageCli()
{
    std::string strUsage;
    strUsage += HelpMessageGroup("Options:");
    strUsage += HelpMessageOpt("-?", "This help message");
    strUsage += HelpMessageOpt("-version", "Print version and exit");
    strUsage += HelpMessageOpt("-conf=<file>", strprintf("Specify configuration file (default: %s)", "pwguess.conf"));
    strUsage += HelpMessageOpt("-json", "Print each result as JSON");

    strUsage += HelpMessageGroup("Estimation options:");
    strUsage += HelpMessageOpt("-maxlength=<n>", strprintf("Reject passwords longer than <n> characters (default: %u)", DEFAULT_MAX_PASSWORD_LENGTH));
    strUsage += HelpMessageOpt("-lang=<lang>", strprintf("Language of warnings, suggestions and crack times (default: %s)", DEFAULT_LANGUAGE));
    strUsage += HelpMessageOpt("-userinput=<word>", "Treat <word> as known to the attacker, e.g. a user name or e-mail address (can be specified multiple times)");
    strUsage += HelpMessageOpt("-wordlist=<name>:<file>", "Add a ranked word list, one word per line, most frequent first (can be specified multiple times)");
    strUsage += HelpMessageOpt("-catalog=<lang>:<file>", "Load key=text translations for <lang> (can be specified multiple times)");

    strUsage += HelpMessageGroup("Debugging options:");
    strUsage += HelpMessageOpt("-debug=<category>", "Output debugging information (default: 0, supplying <category> is optional). "
                                                    "If <category> is not supplied, output all debugging information. "
                                                    "<category> can be: matching, scoring, bench, dict, i18n.");
    strUsage += HelpMessageOpt("-debuglogfile=<file>", "Also write the log to <file>");
    strUsage += HelpMessageOpt("-printtoconsole", "Send trace/debug info to console (default: 1 when -debug is set)");
    strUsage += HelpMessageOpt("-logtimestamps", "Prepend debug output with timestamp (default: 1)");
    return strUsage;
}

static bool AppInitLogging()
{
    fDebug = mapArgs.count("-debug") && GetBoolArg("-debug", true);
    fPrintToConsole = GetBoolArg("-printtoconsole", fDebug);
    fLogTimestamps = GetBoolArg("-logtimestamps", true);

    if (mapArgs.count("-debuglogfile")) {
        boost::filesystem::path pathLog(mapArgs["-debuglogfile"]);
        if (!OpenDebugLog(pathLog)) {
            fprintf(stderr, "Error: Cannot open debug log file %s\n", pathLog.string().c_str());
            return false;
        }
        fPrintToDebugLog = true;
    }
    LogPrintf("%s %s\n", CLIENT_NAME, FormatFullVersion());
    return true;
}

static bool AppInitWordLists(CStrengthEstimator& estimator)
{
    const std::vector<std::string>& vArgs = mapMultiArgs["-wordlist"];
    for (size_t n = 0; n < vArgs.size(); n++) {
        std::string strName, strPath;
        if (!SplitNamedArg(vArgs[n], strName, strPath)) {
            fprintf(stderr, "Error: Invalid -wordlist '%s', expected <name>:<file>\n", vArgs[n].c_str());
            return false;
        }
        CRankedDictionary dict;
        if (!LoadWordListFile(strName, strPath, dict)) {
            fprintf(stderr, "Error: Cannot read word list %s\n", strPath.c_str());
            return false;
        }
        estimator.AddDictionary(dict);
    }
    return true;
}

static bool AppInitCatalogs(CStrengthEstimator& estimator)
{
    const std::vector<std::string>& vArgs = mapMultiArgs["-catalog"];
    for (size_t n = 0; n < vArgs.size(); n++) {
        std::string strLang, strPath;
        if (!SplitNamedArg(vArgs[n], strLang, strPath)) {
            fprintf(stderr, "Error: Invalid -catalog '%s', expected <lang>:<file>\n", vArgs[n].c_str());
            return false;
        }
        if (!estimator.LoadCatalogFile(strLang, strPath)) {
            fprintf(stderr, "Error: Cannot read catalog %s\n", strPath.c_str());
            return false;
        }
    }
    return true;
}

static std::string FormatTextReport(const CStrengthResult& result)
{
    std::string strReport;
    strReport += strprintf("score: %d/4\n", result.nScore);
    strReport += strprintf("guesses: %g (log10 %.3f)\n", result.nGuesses, result.nGuessesLog10);
    strReport += "crack times:\n";
    for (int n = 0; n < MAX_ATTACK_SCENARIOS; n++)
        strReport += strprintf("  %-38s %s\n", GetScenarioName((AttackScenario)n), result.strCrackTimesDisplay[n]);

    const CFeedbackText& text = result.feedbackText;
    if (!text.strWarning.empty())
        strReport += "warning: " + text.strWarning + "\n";
    if (!text.vSuggestions.empty()) {
        strReport += "suggestions:\n";
        for (size_t n = 0; n < text.vSuggestions.size(); n++)
            strReport += "  - " + text.vSuggestions[n] + "\n";
    }

    strReport += "sequence:\n";
    for (size_t n = 0; n < result.vSequence.size(); n++) {
        const CMatch& match = result.vSequence[n];
        strReport += strprintf("  %-18s [%u,%u] %-20s guesses=%g\n", GetPatternName(match.pattern), match.i, match.j,
            "\"" + match.strToken + "\"", match.nGuesses);
    }
    return strReport;
}

/** Estimate one password and print the report; false if it was rejected */
static bool ProcessPassword(CStrengthEstimator& estimator, const std::string& strPassword, bool fJSON)
{
    CStrengthResult result;
    try {
        result = estimator.SetPassword(strPassword);
    } catch (const password_length_error& e) {
        fprintf(stderr, "error: %s\n", e.what());
        return false;
    }

    if (fJSON)
        fprintf(stdout, "%s\n", StrengthResultToJSON(result, true).write(2).c_str());
    else
        fprintf(stdout, "%s\n", FormatTextReport(result).c_str());
    return true;
}

static int AppInitCli(int argc, char* argv[])
{
    //
    // Parameters
    //
    ParseParameters(argc, argv);

    if (mapArgs.count("-?") || mapArgs.count("-help") || mapArgs.count("-version")) {
        std::string strUsage = "Pwguess password strength estimator version " + FormatFullVersion() + "\n";
        if (mapArgs.count("-version")) {
            strUsage += LicenseInfo();
        } else {
            strUsage += "\nUsage:\n"
                        "  pwguess-cli [options] <password> ...      Estimate the given passwords\n"
                        "  pwguess-cli [options] -- <password> ...   Estimate passwords that may start with '-'\n"
                        "  pwguess-cli [options]                     Estimate passwords read from stdin, one per line\n";
            strUsage += "\n" + HelpMessageCli();
        }
        fprintf(stdout, "%s", strUsage.c_str());
        return EXIT_SUCCESS;
    }

    if (!ReadConfigFile(mapArgs, mapMultiArgs)) {
        fprintf(stderr, "Error reading configuration file %s\n", GetConfigFile().string().c_str());
        return EXIT_FAILURE;
    }
    if (!AppInitLogging())
        return EXIT_FAILURE;

    int64_t nMaxLength = GetArg("-maxlength", (int64_t)DEFAULT_MAX_PASSWORD_LENGTH);
    if (nMaxLength < 0) {
        fprintf(stderr, "%s", strprintf("Error: Invalid -maxlength %d\n", nMaxLength).c_str());
        return EXIT_FAILURE;
    }

    std::vector<std::string> vUserInputs;
    const std::vector<std::string>& vArgs = mapMultiArgs["-userinput"];
    for (size_t n = 0; n < vArgs.size(); n++)
        vUserInputs.push_back(SanitizeUserInput(vArgs[n]));

    CStrengthEstimator estimator(GetArg("-lang", DEFAULT_LANGUAGE), vUserInputs, (size_t)nMaxLength);
    if (!AppInitWordLists(estimator) || !AppInitCatalogs(estimator))
        return EXIT_FAILURE;
    LogPrint("dict", "%s\n", estimator.ToString());

    // Passwords follow the options, or a "--" when they start with '-'
    int nFirst = FirstNonOptionArg(argc, argv);

    bool fJSON = GetBoolArg("-json", false);
    bool fAllAccepted = true;
    if (nFirst < argc) {
        for (int i = nFirst; i < argc; i++)
            if (!ProcessPassword(estimator, argv[i], fJSON))
                fAllAccepted = false;
    } else {
        std::string strLine;
        while (std::getline(std::cin, strLine)) {
            if (!strLine.empty() && strLine[strLine.size() - 1] == '\r')
                strLine.erase(strLine.size() - 1);
            if (!ProcessPassword(estimator, strLine, fJSON))
                fAllAccepted = false;
        }
    }
    return fAllAccepted ? EXIT_SUCCESS : EXIT_FAILURE;
}

int main(int argc, char* argv[])
{
    SetupEnvironment();

    try {
        return AppInitCli(argc, argv);
    } catch (const std::exception& e) {
        PrintExceptionContinue(&e, "AppInitCli()");
    } catch (...) {
        PrintExceptionContinue(NULL, "AppInitCli()");
    }
    return EXIT_FAILURE;
}
