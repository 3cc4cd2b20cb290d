#pragma once

#include "provider/builtin_providers.hpp"

namespace anonymizer {

// Providers backed by identity::derive_* (deterministic, hash-derived).
// A null column value stays null.

class FiscalCodeProvider final : public NamedProvider {
public:
    FiscalCodeProvider() : NamedProvider("fiscalcode", "Provider to hash a fiscal code.") {}
    [[nodiscard]] Value alter_value(const Value& original, const ProviderArgs& args) const override;
};

class VatNumberProvider final : public NamedProvider {
public:
    VatNumberProvider() : NamedProvider("vatnumber", "Provider to hash a vat number.") {}
    [[nodiscard]] Value alter_value(const Value& original, const ProviderArgs& args) const override;
};

class FiscalCodeBusinessProvider final : public NamedProvider {
public:
    FiscalCodeBusinessProvider()
        : NamedProvider("fiscalcodebusiness", "Provider to hash a legal entity fiscal code.") {}
    [[nodiscard]] Value alter_value(const Value& original, const ProviderArgs& args) const override;
};

// Business code for values starting with a digit, person code otherwise
class FiscalCodeVatProvider final : public NamedProvider {
public:
    FiscalCodeVatProvider()
        : NamedProvider("fiscalcodevat", "Provider to hash a fiscal code or a vat number.") {}
    [[nodiscard]] Value alter_value(const Value& original, const ProviderArgs& args) const override;
};

} // namespace anonymizer
