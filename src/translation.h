// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PWGUESS_TRANSLATION_H
#define PWGUESS_TRANSLATION_H

#include "sync.h"

#include <map>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>
#include <boost/function.hpp>

/** Message key -> display text */
typedef boost::function<std::string(const std::string&)> TranslationFn;

typedef std::map<std::string, std::string> TranslationCatalog;

static const char* const DEFAULT_LANGUAGE = "en";

/** English texts for every feedback and crack time key */
const TranslationCatalog& DefaultEnglishCatalog();

/** "zh-Hans" -> "zh_Hans", "EN" -> "en" */
std::string NormalizeLanguageTag(const std::string& strTag);

/**
 * Catalogs by language tag. A lookup walks the exact tag, the tags
 * registered as aliases of its base language, the base language, the
 * default language and finally returns the key itself.
 */
class CTranslator
{
public:
    CTranslator();

    void AddCatalog(const std::string& strLang, const TranslationCatalog& catalog);

    /** Read "key=text" lines; blank lines and '#' comments are skipped */
    bool LoadCatalogFile(const std::string& strLang, const boost::filesystem::path& path);

    /** Make strTag a fallback for every tag of strBaseLang, ahead of strBaseLang itself */
    void AddAlias(const std::string& strBaseLang, const std::string& strTag);

    bool HaveCatalog(const std::string& strLang) const;

    std::vector<std::string> GetFallbackChain(const std::string& strLang) const;

    std::string Translate(const std::string& strLang, const std::string& strKey) const;

    /**
     * A self-contained lookup for one language. It holds its own copy of
     * the catalogs it needs, so later changes to the translator do not
     * affect it and it can be called from any thread.
     */
    TranslationFn GetTranslation(const std::string& strLang) const;

private:
    mutable CCriticalSection cs;
    std::map<std::string, TranslationCatalog> mapCatalogs;
    std::map<std::string, std::vector<std::string> > mapAliases;
};

#endif // PWGUESS_TRANSLATION_H
