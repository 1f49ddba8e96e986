#ifndef PIIANON_ANONYMIZERS_MASKER_HPP
#define PIIANON_ANONYMIZERS_MASKER_HPP

#include <algorithm>
#include <string>
#include <vector>

#include "anonymizers/anonymization_policy.hpp"
#include "util/string_utils.hpp"

/**
 * @file masker.hpp
 * @brief Partial masking that keeps the value's shape.
 *
 *   john@example.com     -> j***@example.com
 *   555-123-4567         -> 555-***-****
 *   4111 1111 1111 1111  -> **** **** **** 1111
 *   192.168.10.20        -> 192.168.***.***
 *
 * A value that does not fit its category's shape (wrong digit count, no
 * '@', ...) gets generic masking: first character kept, the rest masked.
 * Characters are UTF-8 code points, never single bytes of one.
 */

namespace piianon {
namespace anonymizers {

inline bool isPhoneCategory(const std::string &category)
{
    return category == "PHONE" || category == "PHONE_NUMBER" || category == "AU_PHONE_NUMBER" ||
           category == "AU_SPECIAL_PHONE";
}

class Masker
{
public:
    explicit Masker(const AnonymizationPolicy &policy)
        : policy_(policy)
    {
    }

    std::string mask(const std::string &category, const std::string &value) const
    {
        if (category == "EMAIL" || category == "EMAIL_ADDRESS") {
            return maskEmail(value);
        }
        if (isPhoneCategory(category)) {
            return maskPhone(value);
        }
        if (category == "SSN" || category == "US_SSN") {
            return maskSsn(value);
        }
        if (category == "CREDIT_CARD") {
            return maskCreditCard(value);
        }
        if (category == "IP_ADDRESS") {
            return maskIp(value);
        }
        return maskGeneric(value);
    }

    std::string maskEmail(const std::string &email) const
    {
        auto at = email.find('@');
        if (at == std::string::npos) {
            return maskGeneric(email);
        }
        const std::string local = email.substr(0, at);
        const std::vector<size_t> offsets = util::codePointByteOffsets(local);
        const size_t codePoints = offsets.size() - 1;
        const size_t visible = std::min<size_t>(policy_.emailVisibleChars, codePoints);
        const size_t masked = codePoints - visible;
        return local.substr(0, offsets[visible]) + std::string(std::max<size_t>(1, masked), policy_.maskChar) +
               email.substr(at);
    }

    /// First n digits visible, remaining digits masked, separators untouched.
    std::string maskPhone(const std::string &phone) const
    {
        const size_t digitCount = util::digitsOnly(phone).size();
        if (digitCount == 0 || digitCount < policy_.phoneVisibleChars) {
            return maskGeneric(phone);
        }
        std::string out = phone;
        size_t seen = 0;
        for (auto &c : out) {
            if (util::isAsciiDigit(c)) {
                if (seen >= policy_.phoneVisibleChars) {
                    c = policy_.maskChar;
                }
                ++seen;
            }
        }
        return out;
    }

    /// Exactly nine digits; the last n stay visible.
    std::string maskSsn(const std::string &ssn) const
    {
        if (util::digitsOnly(ssn).size() != 9) {
            return maskGeneric(ssn);
        }
        return keepTrailingDigits(ssn, 9, policy_.ssnVisibleChars);
    }

    /// Thirteen digits or more; the last n stay visible.
    std::string maskCreditCard(const std::string &card) const
    {
        const size_t digitCount = util::digitsOnly(card).size();
        if (digitCount < 13) {
            return maskGeneric(card);
        }
        return keepTrailingDigits(card, digitCount, policy_.creditCardVisibleChars);
    }

    std::string maskIp(const std::string &ip) const
    {
        const std::string m3(3, policy_.maskChar);
        if (ip.find(':') != std::string::npos) {
            std::vector<std::string> groups = split(ip, ':');
            if (groups.size() > 4) {
                return groups[0] + ":" + groups[1] + ":" + std::string(4, policy_.maskChar) + ":" +
                       groups[groups.size() - 2] + ":" + groups[groups.size() - 1];
            }
            return maskGeneric(ip);
        }
        std::vector<std::string> octets = split(ip, '.');
        if (octets.size() == 4) {
            return octets[0] + "." + octets[1] + "." + m3 + "." + m3;
        }
        return maskGeneric(ip);
    }

    /// First code point kept, one mask character per remaining code point.
    std::string maskGeneric(const std::string &value) const
    {
        const std::vector<size_t> offsets = util::codePointByteOffsets(value);
        const size_t codePoints = offsets.size() - 1;
        if (codePoints <= 1) {
            return std::string(1, policy_.maskChar);
        }
        return value.substr(0, offsets[1]) + std::string(codePoints - 1, policy_.maskChar);
    }

private:
    std::string keepTrailingDigits(const std::string &value, size_t digitCount, size_t visible) const
    {
        const size_t hidden = digitCount > visible ? digitCount - visible : 0;
        std::string out = value;
        size_t seen = 0;
        for (auto &c : out) {
            if (util::isAsciiDigit(c)) {
                if (seen < hidden) {
                    c = policy_.maskChar;
                }
                ++seen;
            }
        }
        return out;
    }

    static std::vector<std::string> split(const std::string &s, char delim)
    {
        std::vector<std::string> parts;
        std::string cur;
        for (char c : s) {
            if (c == delim) {
                parts.push_back(cur);
                cur.clear();
            } else {
                cur += c;
            }
        }
        parts.push_back(cur);
        return parts;
    }

    AnonymizationPolicy policy_;
};

} // namespace anonymizers
} // namespace piianon

#endif // PIIANON_ANONYMIZERS_MASKER_HPP
