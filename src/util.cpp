// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util.h"

#include "sync.h"
#include "utilstrencodings.h"

#include <assert.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <locale>
#include <set>
#include <stdexcept>
#include <typeinfo>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/program_options/detail/config_file.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/thread/once.hpp>

std::map<std::string, std::string> mapArgs;
std::map<std::string, std::vector<std::string> > mapMultiArgs;
bool fDebug = false;
bool fPrintToConsole = false;
bool fPrintToDebugLog = false;
bool fLogTimestamps = true;

/**
 * The log mutex is created on first use and never deleted, so that logging
 * from static destructors at shutdown still finds a live mutex.
 */
static boost::once_flag debugPrintInitFlag = BOOST_ONCE_INIT;

static FILE* fileout = NULL;
static CCriticalSection* mutexDebugLog = NULL;
static std::set<std::string>* setLogCategories = NULL;

static void DebugPrintInit()
{
    assert(mutexDebugLog == NULL);
    mutexDebugLog = new CCriticalSection();
}

bool OpenDebugLog(const boost::filesystem::path& pathLog)
{
    boost::call_once(&DebugPrintInit, debugPrintInitFlag);
    LOCK(*mutexDebugLog);

    if (fileout) {
        fclose(fileout);
        fileout = NULL;
    }
    if (pathLog.empty())
        return true;

    fileout = fopen(pathLog.string().c_str(), "a");
    if (!fileout)
        return false;
    setbuf(fileout, NULL); // unbuffered
    return true;
}

void ResetLogCategories()
{
    boost::call_once(&DebugPrintInit, debugPrintInitFlag);
    LOCK(*mutexDebugLog);
    delete setLogCategories;
    setLogCategories = NULL;
}

bool LogAcceptCategory(const char* category)
{
    if (category != NULL) {
        if (!fDebug)
            return false;

        boost::call_once(&DebugPrintInit, debugPrintInitFlag);
        LOCK(*mutexDebugLog);

        // Build the set of enabled categories the first time a categorized
        // message goes out; ResetLogCategories() forces a rebuild.
        if (setLogCategories == NULL) {
            const std::vector<std::string>& categories = mapMultiArgs["-debug"];
            setLogCategories = new std::set<std::string>(categories.begin(), categories.end());
        }

        // if not debugging everything and not debugging specific category, LogPrint does nothing.
        if (setLogCategories->count(std::string("")) == 0 &&
            setLogCategories->count(std::string("1")) == 0 &&
            setLogCategories->count(std::string(category)) == 0)
            return false;
    }
    return true;
}

int LogPrintStr(const std::string& str)
{
    int ret = 0; // Returns total number of characters written
    static bool fStartedNewLine = true;

    if (!fPrintToConsole && !fPrintToDebugLog)
        return ret;

    boost::call_once(&DebugPrintInit, debugPrintInitFlag);
    LOCK(*mutexDebugLog);

    std::string strStamped = str;
    if (fLogTimestamps && fStartedNewLine)
        strStamped = DateTimeStrFormat("%Y-%m-%d %H:%M:%S", GetTime()) + ' ' + str;
    fStartedNewLine = !str.empty() && str[str.size() - 1] == '\n';

    if (fPrintToConsole) {
        ret = fwrite(strStamped.data(), 1, strStamped.size(), stderr);
        fflush(stderr);
    }
    if (fPrintToDebugLog && fileout != NULL)
        ret = fwrite(strStamped.data(), 1, strStamped.size(), fileout);

    return ret;
}

/** Interpret string as boolean, for argument parsing */
static bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    return (atoi(strValue) != 0);
}

/** Turn -noX into -X=0 */
static void InterpretNegativeSetting(std::string& strKey, std::string& strValue)
{
    if (strKey.length() > 3 && strKey[0] == '-' && strKey[1] == 'n' && strKey[2] == 'o') {
        strKey = "-" + strKey.substr(3);
        strValue = InterpretBool(strValue) ? "0" : "1";
    }
}

void ParseParameters(int argc, const char* const argv[])
{
    mapArgs.clear();
    mapMultiArgs.clear();

    for (int i = 1; i < argc; i++) {
        std::string str(argv[i]);
        // "--" ends the options; what follows is never parsed as one
        if (str == "--")
            break;
        std::string strValue;
        size_t is_index = str.find('=');
        if (is_index != std::string::npos) {
            strValue = str.substr(is_index + 1);
            str = str.substr(0, is_index);
        }
#ifdef WIN32
        boost::to_lower(str);
        if (boost::algorithm::starts_with(str, "/"))
            str = "-" + str.substr(1);
#endif

        if (str[0] != '-')
            break;

        // Interpret --foo as -foo.
        // If both --foo and -foo are set, the last takes effect.
        if (str.length() > 1 && str[1] == '-')
            str = str.substr(1);
        InterpretNegativeSetting(str, strValue);

        mapArgs[str] = strValue;
        mapMultiArgs[str].push_back(strValue);
    }

    ResetLogCategories();
}

int FirstNonOptionArg(int argc, const char* const argv[])
{
    int i = 1;
    while (i < argc && IsSwitchChar(argv[i][0])) {
        if (strcmp(argv[i], "--") == 0)
            return i + 1;
        i++;
    }
    return i;
}

std::string GetArg(const std::string& strArg, const std::string& strDefault)
{
    if (mapArgs.count(strArg))
        return mapArgs[strArg];
    return strDefault;
}

int64_t GetArg(const std::string& strArg, int64_t nDefault)
{
    if (mapArgs.count(strArg))
        return atoi64(mapArgs[strArg]);
    return nDefault;
}

bool GetBoolArg(const std::string& strArg, bool fDefault)
{
    if (mapArgs.count(strArg))
        return InterpretBool(mapArgs[strArg]);
    return fDefault;
}

bool SoftSetArg(const std::string& strArg, const std::string& strValue)
{
    if (mapArgs.count(strArg))
        return false;
    mapArgs[strArg] = strValue;
    return true;
}

bool SoftSetBoolArg(const std::string& strArg, bool fValue)
{
    if (fValue)
        return SoftSetArg(strArg, std::string("1"));
    else
        return SoftSetArg(strArg, std::string("0"));
}

static const int screenWidth = 79;
static const int optIndent = 2;
static const int msgIndent = 7;

std::string HelpMessageGroup(const std::string& message)
{
    return std::string(message) + std::string("\n\n");
}

std::string HelpMessageOpt(const std::string& option, const std::string& message)
{
    return std::string(optIndent, ' ') + std::string(option) +
           std::string("\n") + std::string(msgIndent, ' ') +
           FormatParagraph(message, screenWidth - msgIndent, msgIndent) +
           std::string("\n\n");
}

bool SplitNamedArg(const std::string& strArg, std::string& strNameRet, std::string& strValueRet)
{
    size_t nColon = strArg.find(':');
    if (nColon == std::string::npos || nColon == 0 || nColon + 1 == strArg.size())
        return false;
    strNameRet = strArg.substr(0, nColon);
    strValueRet = strArg.substr(nColon + 1);
    return true;
}

static std::string FormatException(const std::exception* pex, const char* pszThread)
{
    if (pex)
        return strprintf(
            "EXCEPTION: %s       \n%s       \n%s in %s       \n", typeid(*pex).name(), pex->what(), "pwguess", pszThread);
    else
        return strprintf(
            "UNKNOWN EXCEPTION       \n%s in %s       \n", "pwguess", pszThread);
}

void PrintExceptionContinue(const std::exception* pex, const char* pszThread)
{
    std::string message = FormatException(pex, pszThread);
    LogPrintf("\n\n************************\n%s\n", message);
    fprintf(stderr, "\n\n************************\n%s\n", message.c_str());
}

boost::filesystem::path GetConfigFile()
{
    return boost::filesystem::path(GetArg("-conf", "pwguess.conf"));
}

bool ReadConfigFile(std::map<std::string, std::string>& mapSettingsRet,
    std::map<std::string, std::vector<std::string> >& mapMultiSettingsRet)
{
    boost::filesystem::ifstream streamConfig(GetConfigFile());
    if (!streamConfig.good())
        return true; // No pwguess.conf file is OK

    std::set<std::string> setOptions;
    setOptions.insert("*");

    try {
        for (boost::program_options::detail::config_file_iterator it(streamConfig, setOptions), end; it != end; ++it) {
            // Don't overwrite existing settings so command line settings override pwguess.conf
            std::string strKey = std::string("-") + it->string_key;
            std::string strValue = it->value[0];
            InterpretNegativeSetting(strKey, strValue);
            if (mapSettingsRet.count(strKey) == 0)
                mapSettingsRet[strKey] = strValue;
            mapMultiSettingsRet[strKey].push_back(strValue);
        }
    } catch (const boost::program_options::error& e) {
        return error("%s: %s: %s", __func__, GetConfigFile().string(), e.what());
    }

    ResetLogCategories();
    return true;
}

void SetupEnvironment()
{
    // On most POSIX systems (e.g. Linux, but not BSD) the environment's locale
    // may be invalid, in which case the "C" locale is used as fallback.
#if !defined(WIN32) && !defined(MAC_OSX) && !defined(__FreeBSD__) && !defined(__OpenBSD__)
    try {
        std::locale(""); // Raises a runtime error if current locale is invalid
    } catch (const std::runtime_error&) {
        setenv("LC_ALL", "C", 1);
    }
#endif
}
