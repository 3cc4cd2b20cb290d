#include "faker/faker_resolver.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace anonymizer::faker {

FakerResolver::FakerResolver(FakerOptions options)
    : options_(std::move(options)) {

    locales_ = options_.locales;
    if (locales_.empty()) {
        locales_.emplace_back(kDefaultLocale);
    }

    for (const auto& code : locales_) {
        if (!find_locale_data(code)) {
            throw UnknownLocaleError(
                std::format("Locale '{}' is not supported by the fake data generator", code));
        }
    }
}

const FakeGenerator& FakerResolver::unlocalized() const {
    std::call_once(unlocalized_once_, [this] {
        std::vector<const LocaleData*> data;
        data.reserve(locales_.size());
        for (const auto& code : locales_) {
            data.push_back(find_locale_data(code));
        }
        unlocalized_ = std::make_unique<FakeGenerator>(std::move(data));
        utils::log::debug(std::format("Fake data generator initialized ({} locale(s))", locales_.size()));
    });
    return *unlocalized_;
}

const FakeGenerator& FakerResolver::for_locale(const std::string& locale) const {
    {
        std::shared_lock lock(cache_mutex_);
        const auto it = per_locale_.find(locale);
        if (it != per_locale_.end()) {
            return *it->second;
        }
    }

    if (std::find(locales_.begin(), locales_.end(), locale) == locales_.end()) {
        throw UnknownLocaleError(std::format(
            "Locale '{}' is unknown. Have you added it to the global option (options.faker.locales)?",
            locale));
    }

    std::unique_lock lock(cache_mutex_);
    auto& slot = per_locale_[locale];
    if (!slot) {
        slot = std::make_unique<FakeGenerator>(std::vector<const LocaleData*>{find_locale_data(locale)});
    }
    return *slot;
}

const FakeGenerator& FakerResolver::resolve(const std::optional<std::string>& locale) const {
    if (!locale || locale->empty()) {
        return unlocalized();
    }
    return for_locale(*locale);
}

const FakeGenerator& FakerResolver::for_field(const std::optional<std::string>& field_locale) const {
    if (field_locale && !field_locale->empty()) {
        return for_locale(*field_locale);
    }
    return resolve(options_.default_locale);
}

} // namespace anonymizer::faker
