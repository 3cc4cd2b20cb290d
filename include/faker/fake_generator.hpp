#pragma once

#include "core/types.hpp"
#include "faker/locale_data.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace anonymizer::faker {

/**
 * @brief Fake value generator over one or more locales
 *
 * With several locales each call picks one of them at random (the
 * "unlocalized" generator spans every configured locale).
 *
 * Rule configuration reaches the generator only through invoke(), which looks
 * the method name up in a fixed allow-list and rejects unknown keyword
 * arguments. There is no open-ended attribute traversal.
 *
 * All methods are const and draw randomness from the calling thread's engine,
 * so one instance can be shared by concurrent workers.
 */
class FakeGenerator {
public:
    static constexpr int kMaxAge = 1000;
    static constexpr int kMaxWords = 10000;
    static constexpr int kMaxTextChars = 100000;

    /**
     * @param locales Non-empty list of locale data (not owned, static lifetime)
     * @throws std::invalid_argument if locales is empty or contains nullptr
     */
    explicit FakeGenerator(std::vector<const LocaleData*> locales);

    /**
     * @brief Invoke an allow-listed method by name
     * @param method Method name ("first_name", "date_of_birth", ...)
     * @param kwargs Object with the method's keyword arguments
     * @throws UnsupportedGeneratorMethodError for names outside the allow-list
     * @throws InvalidProviderArgumentError for unknown or malformed kwargs
     */
    [[nodiscard]] Value invoke(std::string_view method, const Value& kwargs) const;

    [[nodiscard]] static bool supports(std::string_view method);

    // Allow-listed method names, sorted
    [[nodiscard]] static std::vector<std::string_view> methods();

    [[nodiscard]] std::vector<std::string_view> locale_codes() const;

    // ---- Person ---------------------------------------------------------------
    [[nodiscard]] std::string first_name() const;
    [[nodiscard]] std::string last_name() const;
    [[nodiscard]] std::string name() const;
    [[nodiscard]] std::string user_name() const;
    [[nodiscard]] std::string email() const;
    [[nodiscard]] std::string safe_email() const;
    [[nodiscard]] std::string phone_number() const;
    [[nodiscard]] std::string job() const;

    // ---- Address --------------------------------------------------------------
    [[nodiscard]] std::string street_address() const;
    [[nodiscard]] std::string city() const;
    [[nodiscard]] std::string postcode() const;
    [[nodiscard]] std::string country() const;
    [[nodiscard]] std::string address() const;

    // ---- Company / internet ---------------------------------------------------
    [[nodiscard]] std::string company() const;
    [[nodiscard]] std::string url() const;
    [[nodiscard]] std::string ipv4() const;
    [[nodiscard]] std::string uuid4() const;

    // ---- Dates and numbers ----------------------------------------------------

    /**
     * @brief Random birth date for an age in [minimum_age, maximum_age]
     * @throws InvalidProviderArgumentError if the ages are negative, inverted
     *         or maximum_age exceeds kMaxAge
     */
    [[nodiscard]] std::chrono::year_month_day date_of_birth(
        int minimum_age = 0, int maximum_age = 115) const;

    // Random date between 1970-01-01 and today, strftime-formatted
    [[nodiscard]] std::string date(const std::string& pattern = "%Y-%m-%d") const;

    [[nodiscard]] int64_t random_int(int64_t min = 0, int64_t max = 9999) const;
    [[nodiscard]] bool boolean(int chance_of_getting_true = 50) const;

    // ---- Text -----------------------------------------------------------------
    // Larger nb_words / max_nb_chars raise InvalidProviderArgumentError
    [[nodiscard]] std::string word() const;
    [[nodiscard]] std::string sentence(int nb_words = 6) const;
    [[nodiscard]] std::string text(int max_nb_chars = 200) const;

private:
    [[nodiscard]] const LocaleData& pick_locale() const;

    std::vector<const LocaleData*> locales_;
};

// Replace '#' with random digits and '?' with random uppercase letters
[[nodiscard]] std::string bothify(std::string_view format);

// Lowercase ASCII rendering of a name (umlauts and accents folded, others dropped)
[[nodiscard]] std::string ascii_slug(std::string_view text);

// "YYYY-MM-DD"
[[nodiscard]] std::string format_iso_date(const std::chrono::year_month_day& date);

} // namespace anonymizer::faker
