#pragma once

#include "core/types.hpp"
#include "faker/faker_resolver.hpp"
#include "provider/provider_registry.hpp"

#include <memory>
#include <string>

namespace anonymizer {

class TableAnonymizer;

/**
 * @brief Startup-built anonymization engine
 *
 * Owns the faker resolver and the provider registry with every built-in
 * provider registered. Both are immutable after construction and shared by
 * all table anonymizers created from this engine.
 */
class Anonymizer {
public:
    /**
     * @throws UnknownLocaleError if options.faker names a locale without data
     */
    explicit Anonymizer(FakerOptions faker_options = {});

    Anonymizer(const Anonymizer&) = delete;
    Anonymizer& operator=(const Anonymizer&) = delete;

    [[nodiscard]] const ProviderRegistry& registry() const { return registry_; }
    [[nodiscard]] const faker::FakerResolver& faker() const { return *faker_; }

    // Replacement value for one column under one field rule
    [[nodiscard]] Value alter(const FieldRule& field, const Value& original) const;

    /**
     * @brief Prepared anonymizer for a table rule
     * @throws UnknownProviderError if the rule names an unregistered provider
     */
    [[nodiscard]] TableAnonymizer for_table(const TableRule& rule) const;

private:
    std::unique_ptr<faker::FakerResolver> faker_;
    ProviderRegistry registry_;
};

} // namespace anonymizer
