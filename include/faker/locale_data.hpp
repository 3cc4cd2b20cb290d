#pragma once

#include <span>
#include <string_view>
#include <vector>

namespace anonymizer::faker {

/**
 * @brief Static word lists and formats for one locale
 *
 * Formats use '#' for a random digit and '?' for a random uppercase letter.
 * Street formats use {street} and {number}; address formats use
 * {street_address}, {postcode} and {city}.
 */
struct LocaleData {
    std::string_view code;
    std::span<const std::string_view> first_names;
    std::span<const std::string_view> last_names;
    std::span<const std::string_view> street_names;
    std::string_view street_format;        // "{number} {street}" / "{street} {number}"
    std::string_view building_number_format;
    std::span<const std::string_view> cities;
    std::string_view postcode_format;
    std::string_view address_format;
    std::span<const std::string_view> phone_formats;
    std::string_view country;
    std::span<const std::string_view> company_suffixes;
    std::span<const std::string_view> jobs;
    std::span<const std::string_view> free_email_domains;
    std::span<const std::string_view> tlds;
};

// Locale data by code (e.g. "it_IT"), nullptr when unsupported
[[nodiscard]] const LocaleData* find_locale_data(std::string_view code);

[[nodiscard]] std::vector<std::string_view> supported_locales();

// Locale used when no locale is configured
inline constexpr std::string_view kDefaultLocale = "en_US";

// Filler words shared by word/sentence/text
[[nodiscard]] std::span<const std::string_view> lorem_words();

} // namespace anonymizer::faker
