// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Utilities for converting data from/to strings.
 */
#ifndef PWGUESS_UTILSTRENCODINGS_H
#define PWGUESS_UTILSTRENCODINGS_H

#include <stdint.h>
#include <string>
#include <vector>

int64_t atoi64(const char* psz);
int64_t atoi64(const std::string& str);
int atoi(const std::string& str);

/**
 * Format a paragraph of text to a fixed width, adding spaces for
 * indentation to any added line.
 */
std::string FormatParagraph(const std::string& in, size_t width = 79, size_t indent = 0);

/**
 * Passwords are handled as sequences of code points. Bytes that are not
 * part of a valid UTF-8 sequence decode to U+DC80..U+DCFF and encode back
 * to the same byte, so decoding never fails and never loses data.
 */
std::u32string DecodeUTF8(const std::string& str);
std::string EncodeUTF8(const std::u32string& str);
std::string EncodeUTF8(const std::u32string& str, size_t nBegin, size_t nEnd);

/** Number of code points in a UTF-8 string */
size_t UTF8Length(const std::string& str);

char32_t ToLowerChar(char32_t c);
bool IsUpperChar(char32_t c);
bool IsLowerChar(char32_t c);
std::u32string ToLower(const std::u32string& str);
std::string ToLowerUTF8(const std::string& str);

inline bool IsAsciiDigit(char32_t c) { return c >= '0' && c <= '9'; }
inline bool IsAsciiUpper(char32_t c) { return c >= 'A' && c <= 'Z'; }
inline bool IsAsciiLower(char32_t c) { return c >= 'a' && c <= 'z'; }

/**
 * Map every code point to one byte so that std::regex can run over a
 * password with match positions equal to code point indexes. Anything
 * outside 7-bit ASCII becomes 0x01.
 */
std::string AsciiProjection(const std::u32string& str);

#endif // PWGUESS_UTILSTRENCODINGS_H
