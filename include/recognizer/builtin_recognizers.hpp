#pragma once

#include "recognizer/recognizer.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace piishield {

namespace builtin {

/**
 * @brief Luhn checksum over the digits of value (separators ignored)
 * @return true for 13-19 digit numbers passing the check
 */
[[nodiscard]] bool luhn_validate(std::string_view value);

/**
 * @brief Structural SSN check: area not 000/666/9xx, group not 00, serial not 0000
 */
[[nodiscard]] bool validate_ssn(std::string_view value);

/**
 * @brief Dotted-quad check: four octets, each 0-255
 */
[[nodiscard]] bool validate_ipv4(std::string_view value);

/**
 * @brief Phone numbers carry 10 digits, or 11 with a leading country code
 */
[[nodiscard]] bool validate_phone(std::string_view value);

} // namespace builtin

/**
 * @brief Standard recognizers present in every registry from construction
 *
 * EMAIL_ADDRESS, PHONE_NUMBER, CREDIT_CARD, US_SSN, IP_ADDRESS, URL.
 */
[[nodiscard]] std::vector<std::shared_ptr<const IRecognizer>> make_builtin_recognizers();

/**
 * @brief Entity catalog requested from a model-backed recognizer by default
 */
[[nodiscard]] const std::vector<std::string>& default_model_entities();

} // namespace piishield
