#include "identity/identifier_derivation.hpp"
#include "core/digest.hpp"
#include "core/utils.hpp"

#include <cctype>

namespace anonymizer::identity {

namespace {

constexpr std::string_view kMonthLetters = "ABCDEHLMPRST";
constexpr char kFallbackMonth = kMonthLetters[4];

constexpr size_t kPersonDigitOffset = 6;   // digits skip the first six letter bytes
constexpr size_t kBusinessLength = 9;
constexpr std::string_view kVatCountryCode = "IT";
constexpr size_t kVatPrefixLength = 2;

char month_letter(char candidate) {
    return kMonthLetters.find(candidate) != std::string_view::npos ? candidate : kFallbackMonth;
}

} // anonymous namespace

std::string letter_stream(std::string_view input) {
    const auto bytes = Digest::md5(input);
    std::string letters;
    letters.reserve(bytes.size());
    for (const uint8_t b : bytes) {
        letters += static_cast<char>('A' + b % 26);
    }
    return letters;
}

std::string digit_stream(std::string_view input) {
    const auto bytes = Digest::md5(input);
    std::string digits;
    digits.reserve(bytes.size());
    for (const uint8_t b : bytes) {
        digits += static_cast<char>('0' + b % 10);
    }
    return digits;
}

std::string derive_person_code(std::string_view input) {
    const std::string letters = letter_stream(input);
    const std::string digits = digit_stream(input).substr(kPersonDigitOffset);

    std::string day = digits.substr(3, 2);
    if (day[0] > '7') {
        day[0] = '1';
    }

    std::string code;
    code.reserve(16);
    code.append(letters, 0, 6);
    code.append(digits, 0, 2);
    code += month_letter(letters[8]);
    code += day;
    code += letters[11];
    code.append(digits, 6, 3);
    code += letters[12];
    return code;
}

std::string derive_business_code(std::string_view input) {
    return digit_stream(input).substr(0, kBusinessLength);
}

std::string derive_vat_number(std::string_view input) {
    const std::string_view national = input.substr(utils::utf8_offset(input, kVatPrefixLength));
    std::string vat(kVatCountryCode);
    vat += derive_business_code(national);
    return vat;
}

std::string derive_fiscal_or_business_code(std::string_view input) {
    if (!input.empty() && std::isdigit(static_cast<unsigned char>(input.front()))) {
        return derive_business_code(input);
    }
    return derive_person_code(input);
}

} // namespace anonymizer::identity
