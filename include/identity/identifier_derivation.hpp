#pragma once

#include <string>
#include <string_view>

namespace anonymizer::identity {

/**
 * @brief Deterministic, hash-derived substitutes for national identifiers
 *
 * Every function is a pure function of its input: the MD5 digest of the
 * UTF-8 bytes is split into 16 byte values, which are re-read as letters
 * ('A' + b % 26) or digits ('0' + b % 10) and re-assembled into a fixed
 * layout. Outputs only resemble the real formats; no check character is
 * computed and the results are not claimed to be irreversible.
 */

// Letter for every digest byte (16 letters)
[[nodiscard]] std::string letter_stream(std::string_view input);

// Digit for every digest byte (16 digits)
[[nodiscard]] std::string digit_stream(std::string_view input);

/**
 * @brief Person fiscal code lookalike, 16 characters
 *
 * Layout: LLLLLL DD M DD L DDD L
 *   - letters 0-5
 *   - digits 0-1 of the digit stream taken from bytes 6..15 ("year")
 *   - letter 8 if it is a month letter (ABCDEHLMPRST), else 'E'
 *   - digits 3-4 ("day"); a first day digit above 7 becomes '1'
 *   - letter 11, digits 6-8, letter 12
 */
[[nodiscard]] std::string derive_person_code(std::string_view input);

// Legal entity fiscal code lookalike: the first 9 digits of the digit stream
[[nodiscard]] std::string derive_business_code(std::string_view input);

// "IT" + business code of the input without its 2-character country prefix
[[nodiscard]] std::string derive_vat_number(std::string_view input);

// Business code when the input starts with a decimal digit, person code otherwise
[[nodiscard]] std::string derive_fiscal_or_business_code(std::string_view input);

} // namespace anonymizer::identity
