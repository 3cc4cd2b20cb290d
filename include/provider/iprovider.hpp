#pragma once

#include "core/types.hpp"
#include "provider/provider_args.hpp"

#include <string_view>

namespace anonymizer {

enum class MatchKind {
    LITERAL,
    PATTERN
};

/**
 * @brief A named, stateless value transformer
 *
 * Implementations hold only constant tables and injected, thread-safe
 * collaborators: alter_value may run concurrently from many workers.
 */
class IProvider {
public:
    virtual ~IProvider() = default;

    // Rule identifier: exact key or regular expression depending on match_kind()
    [[nodiscard]] virtual std::string_view id() const = 0;

    [[nodiscard]] virtual MatchKind match_kind() const { return MatchKind::LITERAL; }

    // One-line description shown by --list-providers
    [[nodiscard]] virtual std::string_view description() const = 0;

    /**
     * @brief Compute the replacement for a column value
     * @param original Original column value (null when absent)
     * @param args Provider definition of the field rule
     * @return Replacement value (null clears the column)
     * @throws InvalidProviderArgumentError on missing or malformed arguments
     */
    [[nodiscard]] virtual Value alter_value(const Value& original, const ProviderArgs& args) const = 0;
};

} // namespace anonymizer
