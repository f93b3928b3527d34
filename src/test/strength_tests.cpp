// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "strength.h"

#include "guesses.h"
#include "matching.h"
#include "scoring.h"
#include "utilstrencodings.h"

#include <cmath>
#include <string>
#include <vector>

#include <boost/assign/list_of.hpp>
#include <boost/bind.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/random/mersenne_twister.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <boost/test/unit_test.hpp>
#include <boost/thread.hpp>

static const char* const testPasswords[] = {
    "", "password", "p4ssw0rd", "drowssap", "aaaaaaaa", "2020-01-01", "musculature", "smith",
    "qwertyuiop", "abcdef", "1qaz2wsx", "correcthorsebatterystaple", "Tr0ub4dor&3",
    "8jX#q2Vz!Lw9$Rt5", "\xc3\xa9t\xc3\xa9" "2019", NULL};

static CStrengthResult Evaluate(const std::string& strPassword)
{
    std::vector<std::string> vNoInputs;
    return EvaluatePassword(strPassword, *BuildDictionarySnapshot(vNoInputs), DefaultKeyboardGraphs());
}

/** The sequence tiles the whole password without gaps or overlaps */
static bool TilesPassword(const CStrengthResult& result, size_t nLength)
{
    size_t nNext = 0;
    for (size_t n = 0; n < result.vSequence.size(); n++) {
        if (result.vSequence[n].i != nNext)
            return false;
        nNext = result.vSequence[n].j + 1;
    }
    return nNext == nLength;
}

static void EvaluateAll(const CDictionarySnapshot* psnapshot, std::vector<CStrengthResult>* pvResults)
{
    for (int n = 0; testPasswords[n] != NULL; n++)
        pvResults->push_back(EvaluatePassword(testPasswords[n], *psnapshot, DefaultKeyboardGraphs()));
}

static bool SameSequence(const CStrengthResult& a, const CStrengthResult& b)
{
    if (a.nGuesses != b.nGuesses || a.vSequence.size() != b.vSequence.size())
        return false;
    for (size_t n = 0; n < a.vSequence.size(); n++) {
        const CMatch& ma = a.vSequence[n];
        const CMatch& mb = b.vSequence[n];
        if (ma.pattern != mb.pattern || ma.i != mb.i || ma.j != mb.j || ma.strToken != mb.strToken ||
            ma.nGuesses != mb.nGuesses || ma.GetDescriptor() != mb.GetDescriptor())
            return false;
    }
    return true;
}

static boost::filesystem::path WriteGermanCatalog()
{
    boost::filesystem::path path = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("pwguess_de_%%%%-%%%%.txt");
    boost::filesystem::ofstream stream(path);
    stream << "top10_password=Das ist eines der 10 h\xc3\xa4ufigsten Passw\xc3\xb6rter\n"
           << "add_another_word=F\xc3\xbcge ein oder zwei W\xc3\xb6rter hinzu\n"
           << "time.instant=weniger als eine Sekunde\n";
    return path;
}

BOOST_AUTO_TEST_SUITE(strength_tests)

BOOST_AUTO_TEST_CASE(empty_password)
{
    CStrengthResult result = Evaluate("");
    BOOST_CHECK_EQUAL(result.nScore, 0);
    BOOST_CHECK_EQUAL(result.nGuesses, 1);
    BOOST_CHECK_EQUAL(result.nGuessesLog10, 0);
    BOOST_CHECK(result.vSequence.empty());
    BOOST_CHECK(result.feedback.strWarning.empty());
    std::vector<std::string> vExpected = boost::assign::list_of("use_few_words")("no_need_symbols");
    BOOST_CHECK(result.feedback.vSuggestions == vExpected);
    BOOST_CHECK(!result.fHaveFeedbackText);
}

BOOST_AUTO_TEST_CASE(result_properties)
{
    for (int n = 0; testPasswords[n] != NULL; n++) {
        std::string strPassword = testPasswords[n];
        CStrengthResult result = Evaluate(strPassword);
        size_t nLength = DecodeUTF8(strPassword).size();

        BOOST_CHECK_MESSAGE(TilesPassword(result, nLength), strPassword);
        BOOST_CHECK(result.nGuesses >= 1);
        BOOST_CHECK(result.nScore >= 0 && result.nScore <= 4);
        BOOST_CHECK_EQUAL(result.nScore, GuessesToScore(result.nGuesses));
        BOOST_CHECK_EQUAL(result.strPassword, strPassword);
        for (int s = 1; s < MAX_ATTACK_SCENARIOS; s++)
            BOOST_CHECK(result.crackTimes.nSeconds[s] <= result.crackTimes.nSeconds[s - 1]);
        if (result.nScore > MAX_SCORE_WITH_FEEDBACK && !result.vSequence.empty())
            BOOST_CHECK(result.feedback.IsNull());

        // deterministic
        BOOST_CHECK_EQUAL(Evaluate(strPassword).nGuesses, result.nGuesses);
    }
}

BOOST_AUTO_TEST_CASE(common_passwords)
{
    CStrengthResult result = Evaluate("password");
    BOOST_CHECK_EQUAL(result.vSequence.size(), 1U);
    BOOST_CHECK_EQUAL(result.vSequence[0].pattern, PATTERN_DICTIONARY);
    BOOST_CHECK_EQUAL(result.nGuesses, 2);
    BOOST_CHECK_EQUAL(result.nScore, 0);
    BOOST_CHECK_EQUAL(result.feedback.strWarning, "top10_password");
    BOOST_CHECK_EQUAL(result.strCrackTimesDisplay[OFFLINE_FAST_HASHING], "less than a second");

    result = Evaluate("aaaaaaaa");
    BOOST_CHECK_EQUAL(result.vSequence.size(), 1U);
    BOOST_CHECK_EQUAL(result.vSequence[0].pattern, PATTERN_REPEAT);
    BOOST_CHECK_EQUAL(result.feedback.strWarning, "repeats_aaa");
    BOOST_CHECK(result.nGuesses < std::pow(26.0, 8));

    result = Evaluate("8jX#q2Vz!Lw9$Rt5");
    BOOST_CHECK_EQUAL(result.nScore, 4);
    BOOST_CHECK(result.feedback.IsNull());
}

BOOST_AUTO_TEST_CASE(single_word)
{
    CStrengthResult result = Evaluate("musculature");
    BOOST_REQUIRE_EQUAL(result.vSequence.size(), 1U);
    const CMatch& match = result.vSequence[0];
    BOOST_CHECK_EQUAL(match.pattern, PATTERN_DICTIONARY);
    BOOST_CHECK_EQUAL(match.i, 0U);
    BOOST_CHECK_EQUAL(match.j, 10U);
    BOOST_CHECK_EQUAL(match.Get<CDictionaryMatch>().strDictionaryName, "english_wikipedia");
    BOOST_CHECK_EQUAL(result.nGuesses, match.Get<CDictionaryMatch>().nRank);
    BOOST_CHECK_EQUAL(result.feedback.strWarning, "word_by_itself");
}

BOOST_AUTO_TEST_CASE(keyboard_run)
{
    std::u32string password = DecodeUTF8("sdfghj");
    std::vector<CMatch> vSpatial = SpatialMatch(password, DefaultKeyboardGraphs());
    bool fFound = false;
    for (size_t n = 0; n < vSpatial.size(); n++) {
        if (vSpatial[n].i != 0 || vSpatial[n].j != 5)
            continue;
        fFound = true;
        CMatch bruteforce = MakeBruteforceMatch(password, 0, 5);
        BOOST_CHECK(EstimateGuesses(vSpatial[n], password.size()) < bruteforce.nGuesses);
    }
    BOOST_CHECK(fFound);

    CStrengthResult result = Evaluate("sdfghj");
    BOOST_REQUIRE_EQUAL(result.vSequence.size(), 1U);
    BOOST_CHECK_EQUAL(result.vSequence[0].pattern, PATTERN_SPATIAL);
    BOOST_CHECK(result.nGuesses < MakeBruteforceMatch(password, 0, 5).nGuesses);
}

BOOST_AUTO_TEST_CASE(longer_is_not_cheaper)
{
    std::vector<std::string> vChain = boost::assign::list_of("password")("password!")("password!#")("password!#x");
    double nPrev = 0;
    for (size_t n = 0; n < vChain.size(); n++) {
        double nGuesses = Evaluate(vChain[n]).nGuesses;
        BOOST_CHECK_MESSAGE(nGuesses >= nPrev, vChain[n]);
        nPrev = nGuesses;
    }

    nPrev = 0;
    for (size_t n = 1; n <= 20; n++) {
        double nGuesses = Evaluate(std::string(n, 'a')).nGuesses;
        BOOST_CHECK(nGuesses >= nPrev);
        nPrev = nGuesses;
    }
}

BOOST_AUTO_TEST_CASE(appending_never_cheaper)
{
    static const std::string strAlphabet = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789!@#$%&*-_.";
    boost::random::mt19937 rng(20261017);
    boost::random::uniform_int_distribution<> pickChar(0, strAlphabet.size() - 1);
    boost::random::uniform_int_distribution<> pickLength(1, 10);

    std::vector<std::string> vNoInputs;
    DictionarySnapshotRef snapshot = BuildDictionarySnapshot(vNoInputs);
    int nChecked = 0;
    for (int n = 0; n < 3000; n++) {
        std::string strPrefix;
        for (int l = pickLength(rng); l > 0; l--)
            strPrefix += strAlphabet[pickChar(rng)];
        std::string strLonger = strPrefix + strAlphabet[pickChar(rng)];

        // a match that starts inside the prefix and ends on the new
        // character may complete a cheaper pattern
        std::u32string longer = DecodeUTF8(strLonger);
        std::vector<CMatch> vMatches = OmniMatch(longer, *snapshot, DefaultKeyboardGraphs());
        bool fCompletes = false;
        for (size_t m = 0; m < vMatches.size(); m++) {
            if (vMatches[m].i < strPrefix.size() && vMatches[m].j == strPrefix.size())
                fCompletes = true;
        }
        if (fCompletes)
            continue;

        nChecked++;
        double nPrefix = EvaluatePassword(strPrefix, *snapshot, DefaultKeyboardGraphs()).nGuesses;
        double nLonger = EvaluatePassword(strLonger, *snapshot, DefaultKeyboardGraphs()).nGuesses;
        BOOST_CHECK_MESSAGE(nLonger >= nPrefix, strPrefix + " -> " + strLonger);
    }
    BOOST_CHECK(nChecked > 0);
}

BOOST_AUTO_TEST_CASE(max_length)
{
    std::vector<std::string> vNoInputs;
    DictionarySnapshotRef snapshot = BuildDictionarySnapshot(vNoInputs);

    BOOST_CHECK_NO_THROW(EvaluatePassword(std::string(72, 'x'), *snapshot, DefaultKeyboardGraphs()));
    BOOST_CHECK_THROW(EvaluatePassword(std::string(73, 'x'), *snapshot, DefaultKeyboardGraphs()), password_length_error);

    // the limit counts code points, not bytes
    std::string strWide;
    for (int n = 0; n < 72; n++)
        strWide += "\xc3\xa9";
    BOOST_CHECK_NO_THROW(EvaluatePassword(strWide, *snapshot, DefaultKeyboardGraphs()));

    try {
        EvaluatePassword("abcdef", *snapshot, DefaultKeyboardGraphs(), 5);
        BOOST_ERROR("expected password_length_error");
    } catch (const password_length_error& e) {
        BOOST_CHECK_EQUAL(e.nLength, 6U);
        BOOST_CHECK_EQUAL(e.nMaxLength, 5U);
        BOOST_CHECK_EQUAL(std::string(e.what()), "Password exceeds max length of 5 characters");
    }
}

BOOST_AUTO_TEST_CASE(invalid_utf8)
{
    CStrengthResult result;
    BOOST_CHECK_NO_THROW(result = Evaluate("ab\xff\xfe" "cd"));
    BOOST_CHECK(TilesPassword(result, 6));
}

BOOST_AUTO_TEST_CASE(estimator)
{
    CStrengthEstimator estimator("en", std::vector<std::string>(), 12);
    CStrengthResult result;
    std::string strPassword;
    BOOST_CHECK(!estimator.GetResult(result));
    BOOST_CHECK(!estimator.GetPassword(strPassword));
    BOOST_CHECK_EQUAL(estimator.GetMaxLength(), 12U);
    BOOST_CHECK_EQUAL(estimator.GetLanguage(), "en");

    result = estimator.SetPassword("password");
    BOOST_CHECK(result.fHaveFeedbackText);
    BOOST_CHECK_EQUAL(result.feedbackText.strWarning, "This is a top-10 common password");
    BOOST_CHECK(estimator.GetPassword(strPassword));
    BOOST_CHECK_EQUAL(strPassword, "password");

    // a rejected password leaves the previous one in place
    BOOST_CHECK_THROW(estimator.SetPassword("passwordpassword"), password_length_error);
    BOOST_CHECK(estimator.GetPassword(strPassword));
    BOOST_CHECK_EQUAL(strPassword, "password");
    BOOST_CHECK(estimator.GetResult(result));
    BOOST_CHECK_EQUAL(result.nGuesses, 2);

    BOOST_CHECK_EQUAL(estimator.ToString(), "CStrengthEstimator(lang=en, maxlength=12, password_set=true)");
}

BOOST_AUTO_TEST_CASE(user_inputs_are_cheap)
{
    CStrengthEstimator estimator;
    double nBefore = estimator.SetPassword("zaphodbeeblebrox").nGuesses;

    std::vector<std::string> vInputs = boost::assign::list_of("ZaphodBeeblebrox")("zaphod@example.com");
    estimator.UpdateUserInputs(vInputs);

    // re-evaluated without setting the password again
    CStrengthResult result;
    BOOST_CHECK(estimator.GetResult(result));
    BOOST_CHECK(result.nGuesses < nBefore);
    BOOST_CHECK_EQUAL(result.vSequence.size(), 1U);
    BOOST_CHECK(result.vSequence[0].IsDictionary());
    BOOST_CHECK_EQUAL(result.vSequence[0].Get<CDictionaryMatch>().strDictionaryName, USER_INPUTS_DICTIONARY);
    BOOST_CHECK_EQUAL(result.vSequence[0].Get<CDictionaryMatch>().nRank, 1);

    std::vector<std::string> vWords = boost::assign::list_of("quokka");
    estimator.AddDictionary(CRankedDictionary("marsupials", vWords));
    result = estimator.SetPassword("quokka");
    BOOST_CHECK_EQUAL(result.vSequence.size(), 1U);
    BOOST_CHECK_EQUAL(result.vSequence[0].Get<CDictionaryMatch>().strDictionaryName, "marsupials");
}

BOOST_AUTO_TEST_CASE(languages)
{
    CStrengthEstimator estimator;
    boost::filesystem::path path = WriteGermanCatalog();
    BOOST_CHECK(estimator.LoadCatalogFile("de", path));
    boost::filesystem::remove(path);

    estimator.SetPassword("password");
    estimator.SetLanguage("de-AT");
    BOOST_CHECK_EQUAL(estimator.GetLanguage(), "de_AT");

    CStrengthResult result;
    BOOST_CHECK(estimator.GetResult(result));
    BOOST_CHECK_EQUAL(result.feedbackText.strWarning, "Das ist eines der 10 h\xc3\xa4ufigsten Passw\xc3\xb6rter");
    BOOST_CHECK_EQUAL(result.feedbackText.vSuggestions[0], "F\xc3\xbcge ein oder zwei W\xc3\xb6rter hinzu");
    BOOST_CHECK_EQUAL(result.strCrackTimesDisplay[OFFLINE_FAST_HASHING], "weniger als eine Sekunde");
    // keys the catalog lacks fall back to English
    BOOST_CHECK_EQUAL(result.strCrackTimesDisplay[ONLINE_THROTTLING], "1 minute");
    // the keys themselves do not depend on the language
    BOOST_CHECK_EQUAL(result.feedback.strWarning, "top10_password");

    estimator.SetLanguage("");
    BOOST_CHECK_EQUAL(estimator.GetLanguage(), "en");
    BOOST_CHECK(estimator.GetResult(result));
    BOOST_CHECK_EQUAL(result.feedbackText.strWarning, "This is a top-10 common password");

    BOOST_CHECK(!estimator.LoadCatalogFile("fr", boost::filesystem::path("/nonexistent/pwguess/fr.txt")));
}

BOOST_AUTO_TEST_CASE(concurrent_evaluation)
{
    std::vector<std::string> vInputs = boost::assign::list_of("smith")("2020");
    DictionarySnapshotRef snapshot = BuildDictionarySnapshot(vInputs);

    std::vector<CStrengthResult> vSerial;
    EvaluateAll(snapshot.get(), &vSerial);

    static const int nThreads = 4;
    std::vector<std::vector<CStrengthResult> > vResults(nThreads);
    boost::thread_group threads;
    for (int n = 0; n < nThreads; n++)
        threads.create_thread(boost::bind(&EvaluateAll, snapshot.get(), &vResults[n]));
    threads.join_all();

    for (int n = 0; n < nThreads; n++) {
        BOOST_CHECK_EQUAL(vResults[n].size(), vSerial.size());
        for (size_t r = 0; r < vSerial.size() && r < vResults[n].size(); r++)
            BOOST_CHECK_MESSAGE(SameSequence(vResults[n][r], vSerial[r]), vSerial[r].strPassword);
    }
}

BOOST_AUTO_TEST_SUITE_END()
