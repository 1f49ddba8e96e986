/**
 * @file builtin_rules.cpp
 * @brief The built-in recognizer rules as data.
 *
 * Score conventions:
 *   - Patterns anchored by a keyword ("IMEI: ...", "DOB ...") score 0.9 or more
 *     and report only the identifier through their capture group.
 *   - Bare numeric shapes score low so they surface only with a context
 *     keyword nearby or a passing checksum.
 *   - Every repetition is bounded. std::regex matches repeats recursively, so
 *     an unbounded one overflows the stack on a long token.
 */

#include "recognizers/recognizer_rule.hpp"

#include <mutex>

namespace piianon {
namespace recognizers {

namespace {

const char *kStreetSuffix =
    "(?:Street|St|Road|Rd|Avenue|Ave|Drive|Dr|Lane|Ln|Boulevard|Blvd|Circuit|Cct|Court|Ct|Place|Pl|Way|Crescent|Cres)";
const char *kAuState = "(?:NSW|VIC|QLD|WA|SA|TAS|ACT|NT)";
const char *kMonthShort =
    "(?:Jan(?:uary)?|Feb(?:ruary)?|Mar(?:ch)?|Apr(?:il)?|May|Jun(?:e)?|Jul(?:y)?|Aug(?:ust)?|"
    "Sep(?:tember)?|Oct(?:ober)?|Nov(?:ember)?|Dec(?:ember)?)";
const char *kMonthLong =
    "(?:January|February|March|April|May|June|July|August|September|October|November|December)";
const char *kDobPrefix = "(?:\\bdob|\\bd\\.o\\.b\\.?|date\\s{0,8}of\\s{0,8}birth|birth\\s{0,8}date|\\bborn)";

std::string cat(std::initializer_list<std::string> parts)
{
    std::string out;
    for (const auto &p : parts) {
        out += p;
    }
    return out;
}

std::vector<RuleDefinition> makeDefinitions()
{
    std::vector<RuleDefinition> defs;

    // ---- generic identifiers -------------------------------------------------

    defs.push_back({"EMAIL",
        {
            {"email", R"(\b[-A-Za-z0-9._%+]{1,64}@[-A-Za-z0-9]{1,63}(?:\.[-A-Za-z0-9]{1,63}){0,8}\.[A-Za-z]{2,24}\b)", 0.9, 0, false},
        },
        {"email", "e-mail", "mail", "contact"},
        ValidatorKind::None});

    defs.push_back({"PHONE",
        {
            {"us_paren", R"(\(\d{3}\)\s?\d{3}[-.\s]\d{4}\b)", 0.7, 0, false},
            {"us_dashed", R"(\b\d{3}[-.]\d{3}[-.]\d{4}\b)", 0.6, 0, false},
            {"us_international", R"(\+1[-.\s]?\d{3}[-.\s]?\d{3}[-.\s]?\d{4}\b)", 0.7, 0, false},
        },
        {"phone", "mobile", "cell", "tel", "call", "fax", "number"},
        ValidatorKind::None});

    defs.push_back({"SSN",
        {
            {"ssn_dashed", R"(\b\d{3}-\d{2}-\d{4}\b)", 0.6, 0, false},
            {"ssn_spaced", R"(\b\d{3} \d{2} \d{4}\b)", 0.3, 0, false},
        },
        {"ssn", "social security", "social security number"},
        ValidatorKind::UsSsn});

    defs.push_back({"CREDIT_CARD",
        {
            {"card_16", R"(\b(?:\d{4}[-\s]?){3}\d{4}\b)", 0.3, 0, false},
            {"card_amex", R"(\b3[47]\d{2}[-\s]?\d{6}[-\s]?\d{5}\b)", 0.3, 0, false},
        },
        {"credit", "card", "visa", "mastercard", "amex", "cc"},
        ValidatorKind::Luhn});

    defs.push_back({"IP_ADDRESS",
        {
            {"ipv4", R"(\b(?:(?:25[0-5]|2[0-4]\d|1\d\d|[1-9]?\d)\.){3}(?:25[0-5]|2[0-4]\d|1\d\d|[1-9]?\d)\b)", 0.6, 0, false},
            {"ipv6_full", R"(\b(?:[0-9A-Fa-f]{1,4}:){7}[0-9A-Fa-f]{1,4}\b)", 0.6, 0, false},
            {"ipv6_compressed", R"(\b(?:[0-9A-Fa-f]{1,4}:){1,6}:(?:[0-9A-Fa-f]{1,4}:){0,5}[0-9A-Fa-f]{1,4}\b)", 0.5, 0, false},
        },
        {"ip", "ipv4", "ipv6", "address", "host"},
        ValidatorKind::None});

    // ---- Australian phone numbers ---------------------------------------------

    defs.push_back({"AU_PHONE_NUMBER",
        {
            {"au_landline", R"(\(?\b0[2-9]\)?[-\s]?\d{4}[-\s]?\d{4}\b)", 0.85, 0, false},
            {"au_mobile", R"(\b04\d{2}[-\s.]?\d{3}[-\s.]?\d{3}\b)", 0.9, 0, false},
            {"au_international", R"(\+?\b61[-\s]?\(?0?\)?[-\s]?[2-9][-\s]?\d{4}[-\s]?\d{4}\b)", 0.95, 0, false},
            {"au_international_mobile", R"(\+?\b61[-\s]?4\d{2}[-\s]?\d{3}[-\s]?\d{3}\b)", 0.95, 0, false},
            {"au_mobile_partial", R"(\b04\d{2}[-\s]?\d{2,3}[-\s]?\d{2,3}\b)", 0.6, 0, false},
        },
        {"phone", "mobile", "cell", "number", "call", "contact", "tel", "ph"},
        ValidatorKind::None});

    defs.push_back({"AU_SPECIAL_PHONE",
        {
            {"au_1300_number", R"(\b1300[-\s]?\d{3}[-\s]?\d{3}\b)", 0.9, 0, false},
            {"au_1800_number", R"(\b1800[-\s]?\d{3}[-\s]?\d{3}\b)", 0.9, 0, false},
            {"au_13_number", R"(\b13[-\s]?\d{2}[-\s]?\d{2}\b)", 0.85, 0, false},
        },
        {"phone", "call", "contact", "helpline", "support", "hotline", "number"},
        ValidatorKind::None});

    // ---- dates of birth -------------------------------------------------------

    defs.push_back({"DATE_OF_BIRTH",
        {
            {"dob_with_prefix",
             cat({kDobPrefix, R"([:\s]{1,8}(\d{1,2}[-/.]\d{1,2}[-/.]\d{2,4}))"}), 0.95, 1, true},
            {"dob_written_with_prefix",
             cat({kDobPrefix, R"([:\s]{1,8}(\d{1,2}(?:st|nd|rd|th)?\s{1,8})", kMonthShort, R"(\s{1,8}\d{2,4}))"}), 0.95, 1, true},
            {"dob_ddmmyyyy_slash", R"(\b(?:0?[1-9]|[12][0-9]|3[01])/(?:0?[1-9]|1[0-2])/(?:19|20)\d{2}\b)", 0.3, 0, false},
            {"dob_ddmmyyyy_dash", R"(\b(?:0?[1-9]|[12][0-9]|3[01])-(?:0?[1-9]|1[0-2])-(?:19|20)\d{2}\b)", 0.3, 0, false},
            {"dob_iso_format", R"(\b(?:19|20)\d{2}-(?:0?[1-9]|1[0-2])-(?:0?[1-9]|[12][0-9]|3[01])\b)", 0.3, 0, false},
            {"dob_written_long",
             cat({R"(\b\d{1,2}(?:st|nd|rd|th)?\s{1,8})", kMonthLong, R"(\s{1,8}(?:19|20)\d{2}\b)"}), 0.3, 0, true},
        },
        {"date of birth", "dob", "d.o.b", "birthdate", "born", "birthday", "age"},
        ValidatorKind::None});

    // ---- addresses ------------------------------------------------------------

    defs.push_back({"AU_ADDRESS",
        {
            {"australian_street_address",
             cat({R"(\b\d{1,3}\s{1,8}(?:[A-Za-z]{1,40}\s{1,8}){1,5})", kStreetSuffix,
                  R"(\b,?\s{0,8}(?:[A-Za-z]{1,40}\s{1,8}){1,3})", kAuState, R"(\s{1,8}\d{4}\b)"}), 0.95, 0, false},
            {"australian_street_with_suburb",
             cat({R"(\b\d{1,3}\s{1,8}(?:[A-Za-z]{1,40}\s{1,8}){1,5})", kStreetSuffix,
                  R"(\b,?\s{1,8}[A-Za-z]{1,40}(?:\s{1,8}[A-Za-z]{1,40}){0,2}\b)"}), 0.8, 0, false},
            {"australian_street_simple",
             cat({R"(\b\d{1,3}\s{1,8}(?:[A-Za-z]{1,40}\s{1,8}){1,5})", kStreetSuffix, R"(\b)"}), 0.7, 0, false},
        },
        {"address", "street", "live", "lives", "residing", "located"},
        ValidatorKind::None});

    defs.push_back({"AU_PO_BOX",
        {
            {"po_box_standard", R"(\bP\.?\s{0,8}O\.?\s{0,8}Box\s{1,8}\d{1,6}\b)", 0.85, 0, true},
            {"gpo_box", R"(\bGPO\s{0,8}Box\s{1,8}\d{1,6}\b)", 0.85, 0, true},
            {"locked_bag", R"(\bLocked\s{1,8}Bag\s{1,8}\d{1,6}\b)", 0.85, 0, true},
            {"private_bag", R"(\bPrivate\s{1,8}Bag\s{1,8}\d{1,6}\b)", 0.85, 0, true},
            {"po_box_full_address",
             cat({R"(\b(?:P\.?\s{0,8}O\.?\s{0,8}Box|GPO\s{0,8}Box)\s{1,8}\d{1,6}\s{0,8},?\s{0,8}[A-Za-z][A-Za-z\s]{2,25}\s{1,8})", kAuState,
                  R"(\s{1,8}\d{4}\b)"}), 0.95, 0, true},
            {"cmb_rmb_rural", R"(\b(?:CMB|RMB|RSD|MS)\s{0,8}\.?\s{0,8}\d{1,6}\b)", 0.8, 0, true},
        },
        {"postal", "mail", "correspondence", "send to", "address", "post"},
        ValidatorKind::None});

    // ---- NBN / telecom references ---------------------------------------------

    defs.push_back({"AU_NBN_LOC_ID",
        {
            {"nbn_loc_id_standard", R"(\bLOC[-\s]?[A-Z0-9]{10,12}\b)", 0.9, 0, true},
            {"nbn_loc_id_with_context",
             R"((?:location\s{0,8}id|\bloc\s{0,8}id|nbn\s{0,8}location)[:\s#]{0,8}((?:LOC)?[-\s]?[A-Z0-9]{10,12})\b)", 0.95, 1, true},
        },
        {"location id", "loc id", "nbn location", "premises", "nbn address", "service address"},
        ValidatorKind::None});

    defs.push_back({"AU_NBN_SERVICE_ID",
        {
            {"nbn_avc_id", R"(\bAVC[-\s]?[A-Z0-9]{10,12}\b)", 0.9, 0, true},
            {"nbn_cvc_id", R"(\bCVC[-\s]?[A-Z0-9]{6,12}\b)", 0.9, 0, true},
            {"nbn_poi_id", R"(\bPOI[-:\s]?[A-Z0-9]{3,15}\b)", 0.8, 0, true},
            {"nbn_service_class", R"(\b(?:Service\s{0,8}Class|SC)[-\s]?[0-9]{1,2}\b)", 0.7, 0, true},
        },
        {"avc", "cvc", "virtual circuit", "nbn service", "access circuit", "poi", "service class"},
        ValidatorKind::None});

    // ---- devices ----------------------------------------------------------------

    defs.push_back({"IMEI",
        {
            {"imei_with_context", R"((?:\bimei|device\s{0,8}id|\bhandset)[:\s#]{0,8}(\d{15,17})\b)", 0.95, 1, true},
            {"imei_15_digit", R"(\b\d{15}\b)", 0.4, 0, false},
            {"imei_formatted", R"(\b\d{2}[-\s]\d{6}[-\s]\d{6}[-\s]\d\b)", 0.7, 0, false},
        },
        {"imei", "device id", "handset", "phone serial", "mobile device", "device"},
        ValidatorKind::None});

    defs.push_back({"ICCID",
        {
            {"iccid_with_context", R"((?:\biccid|\bsim\s{0,8}card|\bsim\s{0,8}number|\bsim)[:\s#]{0,8}(89\d{17,19})\b)", 0.95, 1, true},
            {"iccid_generic", R"(\b89\d{17,19}\b)", 0.85, 0, false},
        },
        {"iccid", "sim", "sim card", "sim number", "icc", "sim serial"},
        ValidatorKind::None});

    defs.push_back({"AU_NTD_SERIAL",
        {
            {"ntd_prefixed", R"(\bNTD[-\s]?[A-Z0-9]{8,16}\b)", 0.9, 0, true},
            {"ntd_nokia", R"(\bNOKA[A-Z0-9]{8,14}\b)", 0.85, 0, false},
            {"ntd_alcatel", R"(\bALCL[A-Z0-9]{8,14}\b)", 0.85, 0, false},
            {"ntd_hfc_modem", R"(\b[23]M[A-Z0-9]{8,12}\b)", 0.8, 0, false},
            {"ntd_with_context",
             R"((?:network\s{0,8}termination|connection\s{0,8}box|nbn\s{0,8}device)[:\s#]{0,8}((?=[A-Z]{0,15}\d)[A-Z0-9]{8,16})\b)", 0.95, 1, true},
        },
        {"ntd", "network termination", "connection box", "nbn device", "nbn equipment", "modem serial"},
        ValidatorKind::None});

    // ---- Australian identity documents --------------------------------------

    defs.push_back({"AU_DRIVER_LICENSE",
        {
            {"au_dl_with_context",
             R"((?:\bdriver'?s?\s{0,8}licen[cs]e|\bDL|\blicen[cs]e\s{0,8}(?:no|number|num|#))[:\s#]{0,8}([A-Za-z]?\d{6,9})\b)", 0.9, 1, true},
            {"au_dl_number_prefix",
             R"((?:\blicen[cs]e|\bDL)[:\s#]{0,8}((?=[A-Za-z]{0,9}\d)[A-Za-z0-9]{6,10})\b)", 0.85, 1, true},
            {"au_dl_state_prefix",
             R"((?:\blicen[cs]e|\blic\.?)\s{1,8}(?:vic|nsw|qld|sa|wa|tas|nt|act)\s{1,8}(\d{6,10})\b)", 0.9, 1, true},
            {"au_dl_license_state",
             R"(\b(?:vic|nsw|qld|sa|wa|tas|nt|act)\s{1,8}(?:licen[cs]e|lic\.?)\s{0,8}[-:#]?\s{0,8}(\d{6,10})\b)", 0.9, 1, true},
            {"au_dl_vic_alpha", R"(\b[A-Za-z]\d{8}\b)", 0.5, 0, false},
            {"au_dl_sa", R"(\b[A-Za-z]\d{5}\b)", 0.4, 0, false},
            {"au_dl_8digit", R"(\b\d{8}\b)", 0.01, 0, false},
            {"au_dl_9digit", R"(\b\d{9}\b)", 0.01, 0, false},
        },
        {"driver license", "driver licence", "drivers license", "drivers licence",
         "driving license", "driving licence", "dl", "licence number", "license number",
         "licence no", "license no", "lic", "drv", "d/l", "dl#"},
        ValidatorKind::None});

    defs.push_back({"AU_PASSPORT",
        {
            {"au_passport_standard", R"(\b[PNE][A-Za-z]\d{7}\b)", 0.7, 0, false},
            {"au_passport_single_letter", R"(\b[PNELM]\d{7}\b)", 0.65, 0, false},
            {"au_passport_generic", R"(\b[A-Za-z]{2}\d{7}\b)", 0.5, 0, false},
            {"au_passport_with_context",
             R"((?:\bpassport(?:\s{0,8}(?:no|number|num|#))?|travel\s{0,8}document)[:\s#]{0,8}([A-Za-z]{1,2}\d{7})\b)", 0.95, 1, true},
        },
        {"passport", "passport number", "travel document", "passport no", "australian passport", "au passport"},
        ValidatorKind::None});

    defs.push_back({"AU_CENTRELINK_CRN",
        {
            {"au_crn_standard", R"(\b\d{9}[A-Za-z]\b)", 0.75, 0, false},
            {"au_crn_with_context",
             R"((?:\bcentrelink|\bCRN|customer\s{0,8}reference\s{0,8}(?:no|number|num)?|\breference\s{0,8}(?:no|number|num))[:\s#]{0,8}(\d{9}[A-Za-z])\b)", 0.95, 1, true},
            {"au_crn_pension",
             R"((?:\bpension|\bconcession|health\s{0,8}care|\bseniors)\s{0,8}(?:card)?[:\s#]{0,8}(\d{9}[A-Za-z])\b)", 0.9, 1, true},
        },
        {"centrelink", "crn", "customer reference number", "reference number",
         "pension", "concession", "health care card", "seniors card"},
        ValidatorKind::None});

    // ---- checksum-validated Australian numbers -------------------------------

    defs.push_back({"AU_TFN",
        {
            {"tfn_spaced", R"(\b\d{3}\s\d{3}\s\d{3}\b)", 0.1, 0, false},
            {"tfn_plain", R"(\b\d{9}\b)", 0.01, 0, false},
        },
        {"tax file number", "tfn"},
        ValidatorKind::AuTfn});

    defs.push_back({"AU_MEDICARE",
        {
            {"medicare_spaced", R"(\b[2-6]\d{3}\s\d{5}\s\d\b)", 0.1, 0, false},
            {"medicare_plain", R"(\b[2-6]\d{9}\b)", 0.01, 0, false},
        },
        {"medicare"},
        ValidatorKind::AuMedicare});

    defs.push_back({"AU_ABN",
        {
            {"abn_spaced", R"(\b\d{2}\s\d{3}\s\d{3}\s\d{3}\b)", 0.1, 0, false},
            {"abn_plain", R"(\b\d{11}\b)", 0.01, 0, false},
        },
        {"australian business number", "abn"},
        ValidatorKind::AuAbn});

    defs.push_back({"AU_ACN",
        {
            {"acn_spaced", R"(\b\d{3}\s\d{3}\s\d{3}\b)", 0.1, 0, false},
            {"acn_plain", R"(\b\d{9}\b)", 0.01, 0, false},
        },
        {"australian company number", "acn"},
        ValidatorKind::AuAcn});

    return defs;
}

} // namespace

const std::vector<RuleDefinition>& builtinRuleDefinitions()
{
    static const std::vector<RuleDefinition> defs = makeDefinitions();
    return defs;
}

std::shared_ptr<const RuleTable> builtinRuleTable()
{
    static std::once_flag flag;
    static std::shared_ptr<const RuleTable> table;
    std::call_once(flag, []() { table = compileRules(builtinRuleDefinitions()); });
    return table;
}

} // namespace recognizers
} // namespace piianon
