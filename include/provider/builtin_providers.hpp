#pragma once

#include "provider/iprovider.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace anonymizer {

class ProviderRegistry;

namespace faker {
class FakerResolver;
}

/**
 * @brief IProvider with a fixed identifier and description
 */
class NamedProvider : public IProvider {
public:
    NamedProvider(std::string_view id, std::string_view description)
        : id_(id), description_(description) {}

    [[nodiscard]] std::string_view id() const override { return id_; }
    [[nodiscard]] std::string_view description() const override { return description_; }

private:
    std::string_view id_;
    std::string_view description_;
};

// ============================================================================
// Value providers
// ============================================================================

class ChoiceProvider final : public NamedProvider {
public:
    ChoiceProvider() : NamedProvider("choice", "Provider that returns a random value from a list of choices.") {}
    [[nodiscard]] Value alter_value(const Value& original, const ProviderArgs& args) const override;
};

class ClearProvider final : public NamedProvider {
public:
    ClearProvider() : NamedProvider("clear", "Provider to set a field value to None.") {}
    [[nodiscard]] Value alter_value(const Value& original, const ProviderArgs& args) const override;
};

/**
 * @brief Replace every character with `sign` (default "X")
 */
class MaskProvider final : public NamedProvider {
public:
    static constexpr std::string_view kDefaultSign = "X";

    MaskProvider() : NamedProvider("mask", "Provider that masks the original value.") {}
    [[nodiscard]] Value alter_value(const Value& original, const ProviderArgs& args) const override;
};

/**
 * @brief Keep `unmasked_left` leading and `unmasked_right` trailing characters
 *
 * Values with no room for a masked middle (left + right >= length) are
 * masked entirely.
 */
class PartialMaskProvider final : public NamedProvider {
public:
    static constexpr std::string_view kDefaultSign = "X";
    static constexpr int64_t kDefaultUnmaskedLeft = 1;
    static constexpr int64_t kDefaultUnmaskedRight = 1;

    PartialMaskProvider() : NamedProvider("partial_mask", "Provider that masks some of the original value.") {}
    [[nodiscard]] Value alter_value(const Value& original, const ProviderArgs& args) const override;

    [[nodiscard]] static std::string mask(std::string_view value, size_t left, size_t right,
                                          std::string_view sign);
};

/**
 * @brief MD5 hex digest, or with `as_number` the digest modulo 10^as_number_length
 *
 * Numeric results that fit in 64 bits are returned as numbers, larger ones
 * (as_number_length above 19) as decimal strings.
 */
class Md5Provider final : public NamedProvider {
public:
    static constexpr int64_t kDefaultNumberLength = 8;

    Md5Provider() : NamedProvider("md5", "Provider to hash a value with the md5 algorithm.") {}
    [[nodiscard]] Value alter_value(const Value& original, const ProviderArgs& args) const override;
};

class SetProvider final : public NamedProvider {
public:
    SetProvider() : NamedProvider("set", "Provider to set a static value.") {}
    [[nodiscard]] Value alter_value(const Value& original, const ProviderArgs& args) const override;
};

class Uuid4Provider final : public NamedProvider {
public:
    Uuid4Provider() : NamedProvider("uuid4", "Provider to set a random uuid value.") {}
    [[nodiscard]] Value alter_value(const Value& original, const ProviderArgs& args) const override;
};

class PhoneNumberItaProvider final : public NamedProvider {
public:
    static constexpr std::string_view kPrefix = "+003";
    static constexpr size_t kDigits = 9;

    PhoneNumberItaProvider()
        : NamedProvider("phonenumberita", "Provider to set a random value for phone number.") {}
    [[nodiscard]] Value alter_value(const Value& original, const ProviderArgs& args) const override;
};

class RandomIdCardProvider final : public NamedProvider {
public:
    RandomIdCardProvider() : NamedProvider("randomidcard", "Provider to set a random value for id card.") {}
    [[nodiscard]] Value alter_value(const Value& original, const ProviderArgs& args) const override;
};

class ApiKeyProvider final : public NamedProvider {
public:
    ApiKeyProvider() : NamedProvider("apikey", "Provider to set a random uuid") {}
    [[nodiscard]] Value alter_value(const Value& original, const ProviderArgs& args) const override;
};

class JsonStringProvider final : public NamedProvider {
public:
    JsonStringProvider() : NamedProvider("jsonstring", "Provider to generate jsonstring") {}
    [[nodiscard]] Value alter_value(const Value& original, const ProviderArgs& args) const override;
};

/**
 * @brief Random date of birth moved into the year of the original date
 *
 * Accepts "YYYY-MM-DD" strings, optionally followed by a time part
 * ("T..." or " ..."). Birth dates falling in a leap year get their day
 * re-drawn in [1, 25] before the year is replaced, so Feb 29 never reaches a
 * non-leap year.
 */
class SameYearProvider final : public NamedProvider {
public:
    explicit SameYearProvider(const faker::FakerResolver& faker)
        : NamedProvider("sameyear", "Provider to generate a random date but with same year of original value."),
          faker_(faker) {}
    [[nodiscard]] Value alter_value(const Value& original, const ProviderArgs& args) const override;

    // @throws InvalidProviderArgumentError for anything but an ISO date
    [[nodiscard]] static std::chrono::year_month_day parse_date(std::string_view text);

private:
    const faker::FakerResolver& faker_;
};

// ============================================================================
// Registration
// ============================================================================

/**
 * @brief Register every built-in provider in dispatch order
 *
 * Order matters: "fake.+" is registered third and captures every
 * "fake.<method>" identifier.
 *
 * @param faker Resolver shared by fake.* and sameyear, must outlive the registry
 */
void register_builtin_providers(ProviderRegistry& registry, const faker::FakerResolver& faker);

} // namespace anonymizer
