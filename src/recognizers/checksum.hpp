#ifndef PIIANON_RECOGNIZERS_CHECKSUM_HPP
#define PIIANON_RECOGNIZERS_CHECKSUM_HPP

#include <string>

#include "util/string_utils.hpp"

/**
 * @file checksum.hpp
 * @brief Check-digit and format validators for identifier rules.
 *
 * Every function takes the raw matched text and looks only at its ASCII
 * digits, so separators ("123 456 782", "4532-1488-...") are ignored.
 */

namespace piianon {
namespace recognizers {
namespace checksum {

/**
 * @brief Luhn mod-10 check for 13 to 19 digit card numbers.
 */
inline bool luhn(const std::string &value)
{
    const std::string digits = util::digitsOnly(value);
    if (digits.size() < 13 || digits.size() > 19) {
        return false;
    }

    int sum = 0;
    bool doubleIt = false;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        int d = *it - '0';
        if (doubleIt) {
            d *= 2;
            if (d > 9) {
                d -= 9;
            }
        }
        sum += d;
        doubleIt = !doubleIt;
    }
    return sum % 10 == 0;
}

/**
 * @brief US SSN structural rules: area not 000, 666 or 9xx; group not 00; serial not 0000.
 */
inline bool usSsn(const std::string &value)
{
    const std::string digits = util::digitsOnly(value);
    if (digits.size() != 9) {
        return false;
    }
    const std::string area = digits.substr(0, 3);
    const std::string group = digits.substr(3, 2);
    const std::string serial = digits.substr(5, 4);
    if (area == "000" || area == "666" || area[0] == '9') {
        return false;
    }
    if (group == "00" || serial == "0000") {
        return false;
    }
    // Published sample numbers and repeated digits are never issued.
    if (digits == "123456789" || digits == "078051120" || digits.compare(0, 8, "98765432") == 0) {
        return false;
    }
    return digits.find_first_not_of(digits[0]) != std::string::npos;
}

/**
 * @brief Australian Tax File Number: weighted sum of 9 digits divisible by 11.
 */
inline bool auTfn(const std::string &value)
{
    static const int weights[9] = {1, 4, 3, 7, 5, 8, 6, 9, 10};
    const std::string digits = util::digitsOnly(value);
    if (digits.size() != 9) {
        return false;
    }
    int sum = 0;
    for (size_t i = 0; i < 9; ++i) {
        sum += (digits[i] - '0') * weights[i];
    }
    return sum % 11 == 0;
}

/**
 * @brief Australian Medicare card: first digit 2-6, ninth digit is the
 *        weighted sum of the first eight mod 10.
 */
inline bool auMedicare(const std::string &value)
{
    static const int weights[8] = {1, 3, 7, 9, 1, 3, 7, 9};
    const std::string digits = util::digitsOnly(value);
    if (digits.size() != 10 || digits[0] < '2' || digits[0] > '6') {
        return false;
    }
    int sum = 0;
    for (size_t i = 0; i < 8; ++i) {
        sum += (digits[i] - '0') * weights[i];
    }
    return sum % 10 == digits[8] - '0';
}

/**
 * @brief Australian Business Number: subtract 1 from the leading digit,
 *        weighted sum divisible by 89.
 */
inline bool auAbn(const std::string &value)
{
    static const int weights[11] = {10, 1, 3, 5, 7, 9, 11, 13, 15, 17, 19};
    const std::string digits = util::digitsOnly(value);
    if (digits.size() != 11 || digits[0] == '0') {
        return false;
    }
    int sum = 0;
    for (size_t i = 0; i < 11; ++i) {
        int d = digits[i] - '0';
        if (i == 0) {
            d -= 1;
        }
        sum += d * weights[i];
    }
    return sum % 89 == 0;
}

/**
 * @brief Australian Company Number: weights 8..1 over the first eight digits,
 *        check digit is the ten's complement of the sum mod 10.
 */
inline bool auAcn(const std::string &value)
{
    const std::string digits = util::digitsOnly(value);
    if (digits.size() != 9) {
        return false;
    }
    int sum = 0;
    for (size_t i = 0; i < 8; ++i) {
        sum += (digits[i] - '0') * static_cast<int>(8 - i);
    }
    int check = (10 - sum % 10) % 10;
    return check == digits[8] - '0';
}

} // namespace checksum
} // namespace recognizers
} // namespace piianon

#endif // PIIANON_RECOGNIZERS_CHECKSUM_HPP
