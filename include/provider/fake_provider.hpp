#pragma once

#include "provider/builtin_providers.hpp"

namespace anonymizer {

/**
 * @brief Pattern provider "fake.+" delegating to the fake data generator
 *
 * The rule name after the first dot selects the generator method
 * ("fake.first_name" -> first_name), `kwargs` are passed through and
 * `locale` selects the generator (field locale, then the default locale,
 * then the unlocalized generator).
 */
class FakeProvider final : public NamedProvider {
public:
    explicit FakeProvider(const faker::FakerResolver& faker)
        : NamedProvider("fake.+", "Provider to generate fake data."), faker_(faker) {}

    [[nodiscard]] MatchKind match_kind() const override { return MatchKind::PATTERN; }

    /**
     * @throws UnsupportedGeneratorMethodError for methods outside the allow-list
     * @throws UnknownLocaleError for locales outside options.faker.locales
     */
    [[nodiscard]] Value alter_value(const Value& original, const ProviderArgs& args) const override;

private:
    const faker::FakerResolver& faker_;
};

} // namespace anonymizer
