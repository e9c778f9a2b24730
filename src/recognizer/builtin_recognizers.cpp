#include "recognizer/builtin_recognizers.hpp"
#include "recognizer/pattern_recognizer.hpp"

#include <cctype>

namespace piishield {

namespace {

std::string digits_only(std::string_view value) {
    std::string digits;
    digits.reserve(value.size());
    for (char c : value) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits += c;
        }
    }
    return digits;
}

int to_int(std::string_view digits) {
    int n = 0;
    for (char c : digits) {
        n = n * 10 + (c - '0');
    }
    return n;
}

} // anonymous namespace

namespace builtin {

bool luhn_validate(std::string_view value) {
    const std::string digits = digits_only(value);
    if (digits.size() < 13 || digits.size() > 19) {
        return false;
    }

    int sum = 0;
    bool double_digit = false;

    // Right to left, doubling every second digit
    for (int i = static_cast<int>(digits.size()) - 1; i >= 0; --i) {
        int digit = digits[i] - '0';
        if (double_digit) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }
        sum += digit;
        double_digit = !double_digit;
    }

    return (sum % 10) == 0;
}

bool validate_ssn(std::string_view value) {
    const std::string digits = digits_only(value);
    if (digits.size() != 9) {
        return false;
    }

    const int area = to_int(std::string_view(digits).substr(0, 3));
    if (area == 0 || area == 666 || area >= 900) {
        return false;
    }
    if (to_int(std::string_view(digits).substr(3, 2)) == 0) {
        return false;
    }
    return to_int(std::string_view(digits).substr(5, 4)) != 0;
}

bool validate_ipv4(std::string_view value) {
    int octets = 0;
    size_t pos = 0;
    while (pos <= value.size()) {
        const size_t dot = value.find('.', pos);
        const auto part = value.substr(pos, dot == std::string_view::npos ? std::string_view::npos
                                                                          : dot - pos);
        if (part.empty() || part.size() > 3) return false;
        for (char c : part) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        }
        if (to_int(part) > 255) return false;
        ++octets;
        if (dot == std::string_view::npos) break;
        pos = dot + 1;
    }
    return octets == 4;
}

bool validate_phone(std::string_view value) {
    const size_t n = digits_only(value).size();
    return n == 10 || n == 11;
}

} // namespace builtin

std::vector<std::shared_ptr<const IRecognizer>> make_builtin_recognizers() {
    std::vector<std::shared_ptr<const IRecognizer>> recognizers;
    recognizers.reserve(6);

    // Email: no leading/trailing dot in local part or domain
    recognizers.push_back(std::make_shared<PatternRecognizer>(
        "EmailRecognizer", "EMAIL_ADDRESS",
        R"([a-zA-Z0-9](?:[a-zA-Z0-9._%+-]*[a-zA-Z0-9])?@[a-zA-Z0-9](?:[a-zA-Z0-9.-]*[a-zA-Z0-9])?\.[a-zA-Z]{2,8}\b)",
        1.0));

    // Card numbers: 13-19 digits with optional single separators, Luhn validated
    recognizers.push_back(std::make_shared<PatternRecognizer>(
        "CreditCardRecognizer", "CREDIT_CARD",
        R"(\b(?:\d[ -]?){12,18}\d\b)",
        1.0, builtin::luhn_validate));

    recognizers.push_back(std::make_shared<PatternRecognizer>(
        "UsSsnRecognizer", "US_SSN",
        R"(\b\d{3}[- ]?\d{2}[- ]?\d{4}\b)",
        0.85, builtin::validate_ssn));

    recognizers.push_back(std::make_shared<PatternRecognizer>(
        "IpRecognizer", "IP_ADDRESS",
        R"(\b(?:\d{1,3}\.){3}\d{1,3}\b)",
        0.95, builtin::validate_ipv4));

    // Phone: US/international format, 10-11 digits
    recognizers.push_back(std::make_shared<PatternRecognizer>(
        "PhoneRecognizer", "PHONE_NUMBER",
        R"((?:\+?1[-. ]?)?\(?\b[0-9]{3}\)?[-. ]?[0-9]{3}[-. ]?[0-9]{4}\b)",
        0.75, builtin::validate_phone));

    // URL: explicit scheme or www. prefix, so bare domains inside emails stay out
    recognizers.push_back(std::make_shared<PatternRecognizer>(
        "UrlRecognizer", "URL",
        R"(\b(?:https?://|www\.)[A-Za-z0-9._~:/?#@!$&'*+,;=%-]*[A-Za-z0-9/#=&_~-])",
        0.6));

    return recognizers;
}

const std::vector<std::string>& default_model_entities() {
    static const std::vector<std::string> entities = {
        "PERSON", "PHONE_NUMBER", "EMAIL_ADDRESS", "CREDIT_CARD",
        "US_SSN", "URL", "IP_ADDRESS", "DOMAIN_NAME",
        "USERNAME", "US_PASSPORT", "MEDICAL_LICENSE",
    };
    return entities;
}

} // namespace piishield
