#ifndef PIIANON_DETECTION_ENTITY_NORMALIZER_HPP
#define PIIANON_DETECTION_ENTITY_NORMALIZER_HPP

#include <regex>
#include <string>

#include "util/string_utils.hpp"

/**
 * @file entity_normalizer.hpp
 * @brief Title-cases shouted personal names ("MR JOHN O'BRIEN" -> "Mr John O'Brien")
 *        so a mixed-case NER model recognises them.
 *
 * The rewrite only flips ASCII letter case, so the output has exactly the
 * same byte length and every offset found on it is valid in the input.
 * A title keyword is required: bare all-caps runs such as "NBN FTTP 100MBPS"
 * are left alone.
 */

namespace piianon {
namespace detection {

class EntityNormalizer
{
public:
    std::string normalize(const std::string &text) const
    {
        std::string out = text;
        const std::regex &re = pattern();
        for (auto it = std::sregex_iterator(text.begin(), text.end(), re);
             it != std::sregex_iterator(); ++it)
        {
            size_t start = static_cast<size_t>(it->position(0));
            size_t len = static_cast<size_t>(it->length(0));
            titleCaseInPlace(out, start, len);
        }
        return out;
    }

private:
    static const std::regex& pattern()
    {
        static const std::regex re(
            R"(\b(?:MR|MRS|MS|MISS|DR|PROF|REV|SIR|DAME|LORD|LADY)\s+)"
            R"((?:[A-Z]+'[A-Z]+|[A-Z]{2,}(?:-[A-Z]+)*))"
            R"((?:\s+(?:[A-Z]+'[A-Z]+|[A-Z]{2,}(?:-[A-Z]+)*)){0,2}\b)",
            std::regex::ECMAScript | std::regex::optimize);
        return re;
    }

    /// Upper case after a non-letter, lower case after a letter.
    static void titleCaseInPlace(std::string &s, size_t start, size_t len)
    {
        bool prevLetter = false;
        for (size_t i = start; i < start + len; ++i) {
            char c = s[i];
            if (util::isAsciiAlpha(c)) {
                if (prevLetter) {
                    if (c >= 'A' && c <= 'Z') {
                        s[i] = static_cast<char>(c - 'A' + 'a');
                    }
                } else if (c >= 'a' && c <= 'z') {
                    s[i] = static_cast<char>(c - 'a' + 'A');
                }
                prevLetter = true;
            } else {
                prevLetter = false;
            }
        }
    }
};

} // namespace detection
} // namespace piianon

#endif // PIIANON_DETECTION_ENTITY_NORMALIZER_HPP
