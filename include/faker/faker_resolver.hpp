#pragma once

#include "core/types.hpp"
#include "faker/fake_generator.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace anonymizer::faker {

/**
 * @brief Locale-aware generator resolver built from [options.faker]
 *
 * Holds the unlocalized generator (spanning every configured locale) and a
 * cache of single-locale generators. Both are created on first use:
 *   - unlocalized(): std::call_once
 *   - for_locale():  shared lock for hits, exclusive lock to insert
 * so concurrent first use from several workers is race-free. Generators are
 * never evicted and references stay valid for the resolver's lifetime.
 *
 * Configured locale set is `locales`, or {en_US} when the list is empty.
 */
class FakerResolver {
public:
    /**
     * @throws UnknownLocaleError if a configured locale has no locale data
     */
    explicit FakerResolver(FakerOptions options = {});

    FakerResolver(const FakerResolver&) = delete;
    FakerResolver& operator=(const FakerResolver&) = delete;

    [[nodiscard]] const FakeGenerator& unlocalized() const;

    /**
     * @brief Generator scoped to one configured locale
     * @throws UnknownLocaleError if locale is not in the configured set
     */
    [[nodiscard]] const FakeGenerator& for_locale(const std::string& locale) const;

    // Empty/absent locale -> unlocalized(), otherwise for_locale()
    [[nodiscard]] const FakeGenerator& resolve(const std::optional<std::string>& locale) const;

    /**
     * @brief Generator for a field: explicit field locale, then the configured
     *        default locale, then the unlocalized generator
     */
    [[nodiscard]] const FakeGenerator& for_field(const std::optional<std::string>& field_locale) const;

    [[nodiscard]] const std::optional<std::string>& default_locale() const { return options_.default_locale; }
    [[nodiscard]] const std::vector<std::string>& locales() const { return locales_; }

private:
    FakerOptions options_;
    std::vector<std::string> locales_;

    mutable std::once_flag unlocalized_once_;
    mutable std::unique_ptr<FakeGenerator> unlocalized_;

    mutable std::shared_mutex cache_mutex_;
    mutable std::unordered_map<std::string, std::unique_ptr<FakeGenerator>> per_locale_;
};

} // namespace anonymizer::faker
