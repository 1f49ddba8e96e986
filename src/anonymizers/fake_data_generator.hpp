#ifndef PIIANON_ANONYMIZERS_FAKE_DATA_GENERATOR_HPP
#define PIIANON_ANONYMIZERS_FAKE_DATA_GENERATOR_HPP

#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "util/string_utils.hpp"

/**
 * @file fake_data_generator.hpp
 * @brief Synthetic replacement values for the replace strategy.
 *
 * DESIGN GOALS:
 *   - A replacement looks like the category it replaces: names become
 *     names, card numbers stay Luhn-valid, phone numbers keep their layout.
 *   - Two locales ship built in (en_US, en_AU); any other locale makes
 *     create() return nullptr and the caller falls back to a bracket token.
 *   - With a seed, the sequence of values is reproducible.
 *
 * USAGE:
 *   @code
 *   auto gen = piianon::anonymizers::FakeDataGenerator::create("en_AU", true, 42);
 *   std::string fake = gen->generate("PERSON", "John Smith", true);
 *   @endcode
 */

namespace piianon {
namespace anonymizers {

struct LocaleTables
{
    std::vector<std::string> firstNames;
    std::vector<std::string> lastNames;
    std::vector<std::string> streets;
    std::vector<std::string> streetSuffixes;
    std::vector<std::string> cities;
    std::vector<std::string> states;
    std::vector<std::string> companies;
    std::vector<std::string> emailDomains;
    /// '#' is a random digit.
    std::vector<std::string> phoneFormats;
    std::string postcodeFormat;
};

inline const LocaleTables& enUsTables()
{
    static const LocaleTables t = {
        {"James", "Mary", "Robert", "Patricia", "Michael", "Jennifer", "William", "Linda",
         "David", "Elizabeth", "Richard", "Barbara", "Joseph", "Susan", "Thomas", "Jessica"},
        {"Smith", "Johnson", "Williams", "Brown", "Jones", "Garcia", "Miller", "Davis",
         "Rodriguez", "Martinez", "Hernandez", "Lopez", "Wilson", "Anderson", "Taylor", "Moore"},
        {"Maple", "Oak", "Pine", "Cedar", "Elm", "Washington", "Lake", "Hill", "Park", "Sunset"},
        {"Street", "Avenue", "Road", "Boulevard", "Lane", "Drive"},
        {"Springfield", "Riverside", "Franklin", "Greenville", "Bristol", "Clinton",
         "Fairview", "Salem", "Madison", "Georgetown"},
        {"CA", "TX", "NY", "FL", "IL", "PA", "OH", "GA", "NC", "MI"},
        {"Acme Corporation", "Globex Inc", "Initech LLC", "Umbrella Group", "Stark Industries",
         "Wayne Enterprises", "Hooli", "Vandelay Industries"},
        {"example.com", "example.org", "example.net", "mail.test"},
        {"(###) ###-####", "###-###-####", "###.###.####"},
        "#####"
    };
    return t;
}

inline const LocaleTables& enAuTables()
{
    static const LocaleTables t = {
        {"Oliver", "Charlotte", "Jack", "Amelia", "William", "Isla", "Noah", "Olivia",
         "Thomas", "Mia", "Lachlan", "Chloe", "Cooper", "Ruby", "Riley", "Matilda"},
        {"Smith", "Jones", "Williams", "Brown", "Wilson", "Taylor", "Nguyen", "Johnson",
         "Martin", "White", "Anderson", "Walker", "Thompson", "Kelly", "Ryan", "Harris"},
        {"George", "King", "Queen", "Victoria", "Elizabeth", "Collins", "Bourke", "Flinders",
         "Macquarie", "Hunter"},
        {"Street", "Road", "Avenue", "Parade", "Crescent", "Place", "Terrace"},
        {"Sydney", "Melbourne", "Brisbane", "Perth", "Adelaide", "Hobart", "Darwin",
         "Canberra", "Geelong", "Newcastle", "Wollongong", "Ballarat"},
        {"NSW", "VIC", "QLD", "WA", "SA", "TAS", "NT", "ACT"},
        {"Southern Cross Pty Ltd", "Koala Holdings", "Outback Trading Co", "Harbour Group",
         "Eucalypt Services Pty Ltd", "Coral Coast Logistics"},
        {"example.com.au", "example.net.au", "mail.test"},
        {"04## ### ###", "(02) #### ####", "(03) #### ####", "+61 4## ### ###"},
        "####"
    };
    return t;
}

class FakeDataGenerator
{
public:
    /**
     * @return nullptr when @p locale has no built-in tables.
     */
    static std::unique_ptr<FakeDataGenerator> create(const std::string &locale, bool hasSeed, uint64_t seed)
    {
        const std::string l = util::toLower(locale);
        const LocaleTables *tables = nullptr;
        if (l == "en_us" || l == "en-us") {
            tables = &enUsTables();
        } else if (l == "en_au" || l == "en-au") {
            tables = &enAuTables();
        } else {
            return nullptr;
        }
        if (!hasSeed) {
            std::random_device rd;
            seed = (static_cast<uint64_t>(rd()) << 32) ^ rd();
        }
        return std::unique_ptr<FakeDataGenerator>(new FakeDataGenerator(*tables, seed));
    }

    /**
     * @brief A fake value for @p category, shaped after @p original where that matters.
     * @param preserveFormat Keep the domain of email addresses.
     */
    std::string generate(const std::string &category, const std::string &original, bool preserveFormat)
    {
        if (category == "PERSON" || category == "NAME" || category == "PER") {
            return name();
        }
        if (category == "EMAIL" || category == "EMAIL_ADDRESS") {
            return email(original, preserveFormat);
        }
        if (category == "PHONE" || category == "PHONE_NUMBER" || category == "AU_PHONE_NUMBER" ||
            category == "AU_SPECIAL_PHONE")
        {
            return phone(original);
        }
        if (category == "SSN" || category == "US_SSN") {
            return ssn(original);
        }
        if (category == "CREDIT_CARD") {
            return creditCard(original);
        }
        if (category == "IP_ADDRESS") {
            return original.find(':') != std::string::npos ? ipv6() : ipv4();
        }
        if (category == "AU_PO_BOX") {
            return "PO Box " + digits(4);
        }
        if (category == "AU_ADDRESS" || category == "ADDRESS" || category == "STREET_ADDRESS") {
            return streetAddress();
        }
        if (category == "LOCATION" || category == "GPE" || category == "LOC") {
            return pick(tables_.cities);
        }
        if (category == "ORGANIZATION" || category == "ORG") {
            return pick(tables_.companies);
        }
        if (category == "DATE_OF_BIRTH") {
            return dateOfBirth();
        }
        return substituteCharacters(original);
    }

    std::string name()
    {
        return pick(tables_.firstNames) + " " + pick(tables_.lastNames);
    }

    std::string email(const std::string &original, bool preserveFormat)
    {
        std::string user = util::toLower(pick(tables_.firstNames)) + "." +
                           util::toLower(pick(tables_.lastNames)) + std::to_string(uniform(1, 99));
        auto at = original.find('@');
        if (preserveFormat && at != std::string::npos && at + 1 < original.size()) {
            return user + original.substr(at);
        }
        return user + "@" + pick(tables_.emailDomains);
    }

    /**
     * @brief Same layout as @p original: separators stay, a leading "+country"
     *        code and the first digit stay, other digits are random.
     */
    std::string phone(const std::string &original)
    {
        if (util::digitsOnly(original).empty()) {
            return fillFormat(pick(tables_.phoneFormats));
        }
        std::string out = original;
        size_t i = 0;
        if (!out.empty() && out[0] == '+') {
            i = 1;
            while (i < out.size() && util::isAsciiDigit(out[i])) {
                ++i;
            }
        }
        bool keptLeading = false;
        for (; i < out.size(); ++i) {
            if (!util::isAsciiDigit(out[i])) {
                continue;
            }
            if (!keptLeading) {
                keptLeading = true;
                continue;
            }
            out[i] = randomDigit();
        }
        return out;
    }

    /// Area 001-665 or 667-899, group 01-99, serial 0001-9999, in the original separator style.
    std::string ssn(const std::string &original)
    {
        int area = uniform(1, 898);
        if (area >= 666) {
            ++area;
        }
        std::string a = pad(area, 3);
        std::string g = pad(uniform(1, 99), 2);
        std::string s = pad(uniform(1, 9999), 4);
        if (original.find('-') != std::string::npos) {
            return a + "-" + g + "-" + s;
        }
        if (original.find(' ') != std::string::npos) {
            return a + " " + g + " " + s;
        }
        return a + g + s;
    }

    /**
     * @brief Luhn-valid number with as many digits as the original (13-19, else 16),
     *        laid into the original separator layout.
     */
    std::string creditCard(const std::string &original)
    {
        const std::string origDigits = util::digitsOnly(original);
        size_t n = origDigits.size();
        bool keepLayout = n >= 13 && n <= 19;
        if (!keepLayout) {
            n = 16;
        }

        std::string number = "4";
        while (number.size() < n - 1) {
            number += randomDigit();
        }
        number += luhnCheckDigit(number);

        if (!keepLayout) {
            return number;
        }
        std::string out = original;
        size_t k = 0;
        for (auto &c : out) {
            if (util::isAsciiDigit(c)) {
                c = number[k++];
            }
        }
        return out;
    }

    std::string ipv4()
    {
        return std::to_string(uniform(1, 223)) + "." + std::to_string(uniform(0, 255)) + "." +
               std::to_string(uniform(0, 255)) + "." + std::to_string(uniform(1, 254));
    }

    std::string ipv6()
    {
        static const char hex[] = "0123456789abcdef";
        std::string out;
        for (int g = 0; g < 8; ++g) {
            if (g) {
                out += ':';
            }
            for (int k = 0; k < 4; ++k) {
                out += hex[uniform(0, 15)];
            }
        }
        return out;
    }

    std::string streetAddress()
    {
        return std::to_string(uniform(1, 999)) + " " + pick(tables_.streets) + " " +
               pick(tables_.streetSuffixes) + ", " + pick(tables_.cities) + " " +
               pick(tables_.states) + " " + fillFormat(tables_.postcodeFormat);
    }

    std::string dateOfBirth()
    {
        return pad(uniform(1, 28), 2) + "/" + pad(uniform(1, 12), 2) + "/" + std::to_string(uniform(1940, 2005));
    }

    /// Digit to random digit, letter to random letter of the same case, the rest unchanged.
    std::string substituteCharacters(const std::string &original)
    {
        std::string out = original;
        for (auto &c : out) {
            if (c >= 'a' && c <= 'z') {
                c = static_cast<char>('a' + uniform(0, 25));
            } else if (c >= 'A' && c <= 'Z') {
                c = static_cast<char>('A' + uniform(0, 25));
            } else if (util::isAsciiDigit(c)) {
                c = randomDigit();
            }
        }
        return out;
    }

    static char luhnCheckDigit(const std::string &partial)
    {
        int sum = 0;
        bool dbl = true;
        for (auto it = partial.rbegin(); it != partial.rend(); ++it) {
            int d = *it - '0';
            if (dbl) {
                d *= 2;
                if (d > 9) {
                    d -= 9;
                }
            }
            sum += d;
            dbl = !dbl;
        }
        return static_cast<char>('0' + (10 - sum % 10) % 10);
    }

private:
    FakeDataGenerator(const LocaleTables &tables, uint64_t seed)
        : tables_(tables),
          rng_(seed)
    {
    }

    int uniform(int lo, int hi)
    {
        std::uniform_int_distribution<int> dist(lo, hi);
        return dist(rng_);
    }

    char randomDigit() { return static_cast<char>('0' + uniform(0, 9)); }

    std::string digits(size_t n)
    {
        std::string out;
        for (size_t i = 0; i < n; ++i) {
            out += randomDigit();
        }
        return out;
    }

    const std::string& pick(const std::vector<std::string> &v)
    {
        return v[static_cast<size_t>(uniform(0, static_cast<int>(v.size()) - 1))];
    }

    std::string fillFormat(const std::string &format)
    {
        std::string out = format;
        for (auto &c : out) {
            if (c == '#') {
                c = randomDigit();
            }
        }
        return out;
    }

    static std::string pad(int value, size_t width)
    {
        std::string s = std::to_string(value);
        if (s.size() < width) {
            s.insert(0, width - s.size(), '0');
        }
        return s;
    }

    const LocaleTables &tables_;
    std::mt19937_64 rng_;
};

} // namespace anonymizers
} // namespace piianon

#endif // PIIANON_ANONYMIZERS_FAKE_DATA_GENERATOR_HPP
