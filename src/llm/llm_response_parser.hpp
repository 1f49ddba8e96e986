#ifndef PIIANON_LLM_LLM_RESPONSE_PARSER_HPP
#define PIIANON_LLM_LLM_RESPONSE_PARSER_HPP

#include <cctype>
#include <nlohmann/json.hpp>
#include <regex>
#include <string>
#include <vector>

#include "util/logger.hpp"
#include "util/string_utils.hpp"

/**
 * @file llm_response_parser.hpp
 * @brief Turns a chat-completion reply into located findings.
 *
 * The model is asked for a JSON array such as
 *   [{"t":"NAME","v":"John Smith"},{"t":"PHONE","v":"0412 345 678"}]
 * and may wrap it in a markdown fence, prepend reasoning, or use the long
 * keys "type"/"value". Anything that does not parse yields no findings.
 */

namespace piianon {
namespace llm {

struct LlmItem
{
    std::string type;
    std::string value;
};

/**
 * @brief Remove every <think>...</think> block; an unterminated block runs to the end.
 */
inline std::string stripThinkBlocks(const std::string &content)
{
    static const std::string open = "<think>";
    static const std::string close = "</think>";

    std::string out;
    size_t pos = 0;
    while (pos < content.size()) {
        size_t start = content.find(open, pos);
        if (start == std::string::npos) {
            out.append(content, pos, std::string::npos);
            break;
        }
        out.append(content, pos, start - pos);
        size_t end = content.find(close, start + open.size());
        if (end == std::string::npos) {
            break;
        }
        pos = end + close.size();
    }
    return out;
}

/**
 * @brief Locate the JSON array inside @p content. Fenced replies use the first
 *        bracketed run, others the outermost one. Empty when there is none.
 */
inline std::string extractJsonArray(const std::string &rawContent)
{
    std::string content = util::trimmed(rawContent);

    if (util::startsWith(content, "```")) {
        size_t open = content.find('[');
        if (open != std::string::npos) {
            size_t close = content.find(']', open);
            if (close != std::string::npos) {
                content = content.substr(open, close - open + 1);
            }
        }
    }

    size_t first = content.find('[');
    size_t last = content.rfind(']');
    if (first == std::string::npos || last == std::string::npos || last < first) {
        return std::string();
    }
    return content.substr(first, last - first + 1);
}

inline std::string itemField(const nlohmann::json &obj, const char *shortKey, const char *longKey)
{
    for (const char *key : {shortKey, longKey}) {
        auto it = obj.find(key);
        if (it != obj.end() && it->is_string() && !it->get<std::string>().empty()) {
            return it->get<std::string>();
        }
    }
    return std::string();
}

/**
 * @brief Parse the findings list. Items missing a type or value are skipped.
 */
inline std::vector<LlmItem> parseItems(const std::string &content)
{
    std::vector<LlmItem> items;
    const std::string json = extractJsonArray(stripThinkBlocks(content));
    if (json.empty()) {
        return items;
    }

    nlohmann::json parsed = nlohmann::json::parse(json, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array()) {
        util::logger::debug("LlmResponseParser: reply is not a JSON array");
        return items;
    }

    for (const auto &entry : parsed) {
        if (!entry.is_object()) {
            continue;
        }
        LlmItem item;
        item.type = itemField(entry, "t", "type");
        item.value = itemField(entry, "v", "value");
        if (item.type.empty() || item.value.empty()) {
            continue;
        }
        items.push_back(std::move(item));
    }
    return items;
}

/// Upper case, with spaces and dashes turned into underscores.
inline std::string normalizeType(const std::string &type)
{
    std::string out = util::toUpper(type);
    for (auto &c : out) {
        if (c == ' ' || c == '-') {
            c = '_';
        }
    }
    return out;
}

inline std::string escapeRegexChar(char c)
{
    static const std::string special = "\\^$.|?*+()[]{}/";
    if (special.find(c) != std::string::npos) {
        return std::string("\\") + c;
    }
    return std::string(1, c);
}

/**
 * @brief Find @p value in @p text: exact, then ASCII case-insensitive, then with
 *        any whitespace allowed between its characters ("0412345678" matches
 *        "0412 345 678").
 * @return true and the half-open byte range, or false when nothing matches.
 */
inline bool findPosition(const std::string &value, const std::string &text, size_t &start, size_t &end)
{
    if (value.empty()) {
        return false;
    }

    size_t pos = text.find(value);
    if (pos != std::string::npos) {
        start = pos;
        end = pos + value.size();
        return true;
    }

    pos = util::toLower(text).find(util::toLower(value));
    if (pos != std::string::npos) {
        start = pos;
        end = pos + value.size();
        return true;
    }

    std::string pattern;
    for (char c : value) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        if (!pattern.empty()) {
            pattern += "\\s*";
        }
        pattern += escapeRegexChar(c);
    }
    if (pattern.empty()) {
        return false;
    }

    try {
        std::regex re(pattern, std::regex::ECMAScript | std::regex::icase);
        std::smatch m;
        if (std::regex_search(text, m, re)) {
            start = static_cast<size_t>(m.position(0));
            end = start + static_cast<size_t>(m.length(0));
            return true;
        }
    }
    catch (const std::regex_error &ex) {
        util::logger::debug(std::string("LlmResponseParser: cannot search for value: ") + ex.what());
    }
    return false;
}

/**
 * @brief True for texts with nothing left worth sending: whitespace, brackets,
 *        upper-case letters and underscores only (e.g. "[PERSON_REDACTED]").
 */
inline bool isFullyRedacted(const std::string &text)
{
    for (char c : text) {
        bool allowed = std::isspace(static_cast<unsigned char>(c)) || c == '[' || c == ']' ||
                       c == '_' || (c >= 'A' && c <= 'Z');
        if (!allowed) {
            return false;
        }
    }
    return true;
}

/// Texts the second pass skips without using a request slot.
inline bool shouldSkip(const std::string &text)
{
    return util::trimmed(text).empty() || isFullyRedacted(text);
}

} // namespace llm
} // namespace piianon

#endif // PIIANON_LLM_LLM_RESPONSE_PARSER_HPP
