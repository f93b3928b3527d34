// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "utilstrencodings.h"

#include <sstream>
#include <stdlib.h>

static const char32_t ESCAPED_BYTE_BASE = 0xDC00;

int64_t atoi64(const char* psz)
{
#ifdef _MSC_VER
    return _atoi64(psz);
#else
    return strtoll(psz, NULL, 10);
#endif
}

int64_t atoi64(const std::string& str)
{
#ifdef _MSC_VER
    return _atoi64(str.c_str());
#else
    return strtoll(str.c_str(), NULL, 10);
#endif
}

int atoi(const std::string& str)
{
    return atoi(str.c_str());
}

std::string FormatParagraph(const std::string& in, size_t width, size_t indent)
{
    std::stringstream out;
    size_t col = 0;
    size_t ptr = 0;
    while (ptr < in.size()) {
        // Find beginning of next word
        ptr = in.find_first_not_of(' ', ptr);
        if (ptr == std::string::npos)
            break;
        // Find end of next word
        size_t endword = in.find_first_of(' ', ptr);
        if (endword == std::string::npos)
            endword = in.size();
        // Add newline and indentation if this wraps over the allowed width
        if (col > 0) {
            if ((col + endword - ptr) > width) {
                out << '\n';
                for (size_t i = 0; i < indent; ++i)
                    out << ' ';
                col = 0;
            } else
                out << ' ';
        }
        // Append word
        out << in.substr(ptr, endword - ptr);
        col += endword - ptr + 1;
        ptr = endword;
    }
    return out.str();
}

/** Length of the sequence introduced by lead byte c, 0 if c cannot lead one */
static int SequenceLength(unsigned char c)
{
    if (c < 0x80) return 1;
    if (c >= 0xC2 && c <= 0xDF) return 2;
    if (c >= 0xE0 && c <= 0xEF) return 3;
    if (c >= 0xF0 && c <= 0xF4) return 4;
    return 0;
}

std::u32string DecodeUTF8(const std::string& str)
{
    std::u32string ret;
    ret.reserve(str.size());
    size_t i = 0;
    while (i < str.size()) {
        unsigned char c = str[i];
        int nLen = SequenceLength(c);
        bool fValid = nLen > 0 && i + nLen <= str.size();
        char32_t cp = 0;
        if (fValid) {
            cp = (nLen == 1) ? c : (c & (0x7F >> nLen));
            for (int k = 1; k < nLen && fValid; k++) {
                unsigned char cc = str[i + k];
                if ((cc & 0xC0) != 0x80)
                    fValid = false;
                cp = (cp << 6) | (cc & 0x3F);
            }
            // reject overlong encodings, surrogates and out of range values
            if (fValid && ((nLen == 3 && cp < 0x800) || (nLen == 4 && (cp < 0x10000 || cp > 0x10FFFF)) ||
                              (cp >= 0xD800 && cp <= 0xDFFF)))
                fValid = false;
        }
        if (fValid) {
            ret.push_back(cp);
            i += nLen;
        } else {
            ret.push_back(ESCAPED_BYTE_BASE + c);
            i += 1;
        }
    }
    return ret;
}

static void AppendUTF8(std::string& out, char32_t cp)
{
    if (cp >= ESCAPED_BYTE_BASE + 0x80 && cp <= ESCAPED_BYTE_BASE + 0xFF) {
        out.push_back(static_cast<char>(cp - ESCAPED_BYTE_BASE));
    } else if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string EncodeUTF8(const std::u32string& str, size_t nBegin, size_t nEnd)
{
    std::string ret;
    ret.reserve(nEnd - nBegin);
    for (size_t i = nBegin; i < nEnd && i < str.size(); i++)
        AppendUTF8(ret, str[i]);
    return ret;
}

std::string EncodeUTF8(const std::u32string& str)
{
    return EncodeUTF8(str, 0, str.size());
}

size_t UTF8Length(const std::string& str)
{
    return DecodeUTF8(str).size();
}

// Simple case mappings for Latin-1, Latin Extended-A, Greek and Cyrillic.
char32_t ToLowerChar(char32_t c)
{
    if (IsAsciiUpper(c))
        return c + 32;
    if (c < 0xC0)
        return c;
    if ((c >= 0xC0 && c <= 0xDE && c != 0xD7) ||
        (c >= 0x391 && c <= 0x3AB && c != 0x3A2) ||
        (c >= 0x410 && c <= 0x42F))
        return c + 0x20;
    if (c >= 0x400 && c <= 0x40F)
        return c + 0x50;
    // Y with diaeresis lowers into Latin-1
    if (c == 0x178)
        return 0xFF;
    if (c >= 0x100 && c <= 0x17F && c != 0x130 && c != 0x138 && c != 0x149 && c != 0x17F) {
        // Latin Extended-A alternates upper/lower, with the parity flipping
        // between U+0139 and U+0148 and again from U+0179
        bool fOddUpper = (c >= 0x139 && c <= 0x148) || c >= 0x179;
        bool fUpper = fOddUpper ? (c & 1) == 1 : (c & 1) == 0;
        return fUpper ? c + 1 : c;
    }
    return c;
}

bool IsUpperChar(char32_t c)
{
    return ToLowerChar(c) != c;
}

bool IsLowerChar(char32_t c)
{
    if (IsAsciiLower(c))
        return true;
    if (c < 0xDF)
        return false;
    // a code point is lower case if some upper case code point maps onto it
    if ((c >= 0xE0 && c <= 0xFF && c != 0xF7) || c == 0xDF ||
        (c >= 0x3B1 && c <= 0x3CB && c != 0x3C2) || c == 0x3C2 ||
        (c >= 0x430 && c <= 0x45F))
        return true;
    if (c >= 0x100 && c <= 0x17F)
        return !IsUpperChar(c) && c != 0x130;
    return false;
}

std::u32string ToLower(const std::u32string& str)
{
    std::u32string ret(str);
    for (size_t i = 0; i < ret.size(); i++)
        ret[i] = ToLowerChar(ret[i]);
    return ret;
}

std::string ToLowerUTF8(const std::string& str)
{
    return EncodeUTF8(ToLower(DecodeUTF8(str)));
}

std::string AsciiProjection(const std::u32string& str)
{
    std::string ret(str.size(), '\x01');
    for (size_t i = 0; i < str.size(); i++) {
        if (str[i] < 0x80)
            ret[i] = static_cast<char>(str[i]);
    }
    return ret;
}
