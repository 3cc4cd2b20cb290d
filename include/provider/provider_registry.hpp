#pragma once

#include "provider/iprovider.hpp"

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace anonymizer {

/**
 * @brief Ordered rule-identifier -> provider dispatch table
 *
 * Entries are tried in registration order and the first match wins:
 *   - LITERAL entries match when the identifier equals the key
 *   - PATTERN entries match when the regex matches at the start of the
 *     identifier (prefix anchored, the rest of the identifier is free)
 *
 * An early pattern therefore shadows later literal keys it happens to match
 * ("fake.+" captures every "fake.<something>").
 *
 * Populated once at startup; resolve() and list() are const and safe to call
 * from many threads without locking as long as nobody registers concurrently.
 */
class ProviderRegistry {
public:
    struct ProviderInfo {
        std::string id;
        MatchKind kind;
        std::string description;
    };

    /**
     * @brief Add a provider under provider->id()
     * @throws DuplicateRegistrationError if the id is taken (literal and pattern keys share one namespace)
     * @throws ProviderRegistrationError if a pattern id is not a valid regex
     */
    void register_provider(std::shared_ptr<const IProvider> provider);

    /**
     * @brief First provider matching the rule identifier
     * @throws UnknownProviderError if nothing matches
     */
    [[nodiscard]] const IProvider& resolve(std::string_view identifier) const;

    // Non-throwing variant of resolve()
    [[nodiscard]] const IProvider* find(std::string_view identifier) const;

    [[nodiscard]] std::vector<ProviderInfo> list() const;

    [[nodiscard]] size_t size() const { return entries_.size(); }

private:
    struct Entry {
        std::string id;
        std::optional<std::regex> pattern;   // set for PATTERN entries
        std::shared_ptr<const IProvider> provider;

        [[nodiscard]] bool matches(std::string_view identifier) const;
    };

    std::vector<Entry> entries_;
};

} // namespace anonymizer
