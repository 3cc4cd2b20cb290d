#include "provider/identifier_providers.hpp"
#include "identity/identifier_derivation.hpp"

namespace anonymizer {

namespace {

template<typename Derive>
Value derive_or_null(const Value& original, Derive derive) {
    const auto text = scalar_text(original);
    if (!text) return nullptr;
    return derive(*text);
}

} // anonymous namespace

Value FiscalCodeProvider::alter_value(const Value& original, const ProviderArgs&) const {
    return derive_or_null(original, identity::derive_person_code);
}

Value VatNumberProvider::alter_value(const Value& original, const ProviderArgs&) const {
    return derive_or_null(original, identity::derive_vat_number);
}

Value FiscalCodeBusinessProvider::alter_value(const Value& original, const ProviderArgs&) const {
    return derive_or_null(original, identity::derive_business_code);
}

Value FiscalCodeVatProvider::alter_value(const Value& original, const ProviderArgs&) const {
    return derive_or_null(original, identity::derive_fiscal_or_business_code);
}

} // namespace anonymizer
