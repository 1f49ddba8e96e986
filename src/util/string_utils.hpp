#ifndef PIIANON_UTIL_STRING_UTILS_HPP
#define PIIANON_UTIL_STRING_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>
#include <vector>

/**
 * @file string_utils.hpp
 * @brief Small ASCII string helpers used across the detectors, the config layer
 *        and the anonymizers. All case conversions are byte-wise ASCII so that
 *        UTF-8 byte offsets are never shifted.
 */

namespace piianon {
namespace util {

/**
 * @brief Trim leading/trailing whitespace in place.
 */
inline void trim(std::string &s)
{
    static const std::string whitespace = " \t\r\n\f\v";
    auto pos = s.find_first_not_of(whitespace);
    if (pos == std::string::npos) {
        s.clear();
        return;
    }
    s.erase(0, pos);
    pos = s.find_last_not_of(whitespace);
    if (pos != std::string::npos) {
        s.erase(pos + 1);
    }
}

inline std::string trimmed(std::string s)
{
    trim(s);
    return s;
}

inline std::string toLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline std::string toUpper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

inline bool startsWith(const std::string &s, const std::string &prefix)
{
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool endsWith(const std::string &s, const std::string &suffix)
{
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/**
 * @brief Split on a delimiter, trimming each piece and dropping empty pieces.
 *        Used for comma-separated config lists.
 */
inline std::vector<std::string> splitList(const std::string &s, char delim = ',')
{
    std::vector<std::string> out;
    std::string piece;
    for (char c : s) {
        if (c == delim) {
            trim(piece);
            if (!piece.empty()) {
                out.push_back(piece);
            }
            piece.clear();
        } else {
            piece.push_back(c);
        }
    }
    trim(piece);
    if (!piece.empty()) {
        out.push_back(piece);
    }
    return out;
}

/**
 * @brief Split on runs of ASCII whitespace.
 */
inline std::vector<std::string> splitWords(const std::string &s)
{
    std::vector<std::string> out;
    std::string word;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!word.empty()) {
                out.push_back(word);
                word.clear();
            }
        } else {
            word.push_back(c);
        }
    }
    if (!word.empty()) {
        out.push_back(word);
    }
    return out;
}

inline std::string join(const std::vector<std::string> &parts, const std::string &sep)
{
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += sep;
        }
        out += parts[i];
    }
    return out;
}

/**
 * @brief Expand $VAR and ${VAR} references from the environment.
 *        Unset variables are left untouched, as a POSIX shell's expandvars would.
 */
inline std::string expandEnv(const std::string &value)
{
    std::string out;
    size_t i = 0;
    while (i < value.size()) {
        if (value[i] != '$' || i + 1 >= value.size()) {
            out.push_back(value[i++]);
            continue;
        }

        size_t nameStart = i + 1;
        size_t nameEnd = nameStart;
        bool braced = value[nameStart] == '{';
        if (braced) {
            nameStart++;
            nameEnd = value.find('}', nameStart);
            if (nameEnd == std::string::npos) {
                out.append(value, i, std::string::npos);
                break;
            }
        } else {
            while (nameEnd < value.size() &&
                   (std::isalnum(static_cast<unsigned char>(value[nameEnd])) || value[nameEnd] == '_')) {
                nameEnd++;
            }
        }

        std::string name = value.substr(nameStart, nameEnd - nameStart);
        size_t consumedEnd = braced ? nameEnd + 1 : nameEnd;
        const char *env = name.empty() ? nullptr : std::getenv(name.c_str());
        if (env) {
            out += env;
        } else {
            out.append(value, i, consumedEnd - i);
        }
        i = consumedEnd;
    }
    return out;
}

/**
 * @brief True for ASCII letters; bytes of multi-byte UTF-8 sequences are not letters here.
 */
inline bool isAsciiAlpha(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

inline bool isAsciiDigit(char c)
{
    return c >= '0' && c <= '9';
}

inline std::string digitsOnly(const std::string &s)
{
    std::string out;
    for (char c : s) {
        if (isAsciiDigit(c)) {
            out.push_back(c);
        }
    }
    return out;
}

/**
 * @brief Byte offset of every code point boundary in @p text (size = code points + 1).
 *        Continuation bytes (10xxxxxx) never start a code point.
 */
inline std::vector<size_t> codePointByteOffsets(const std::string &text)
{
    std::vector<size_t> offsets;
    offsets.reserve(text.size() + 1);
    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if ((c & 0xC0) != 0x80) {
            offsets.push_back(i);
        }
    }
    offsets.push_back(text.size());
    return offsets;
}

} // namespace util
} // namespace piianon

#endif // PIIANON_UTIL_STRING_UTILS_HPP
