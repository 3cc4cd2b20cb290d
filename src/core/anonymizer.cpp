#include "core/anonymizer.hpp"
#include "core/table_anonymizer.hpp"
#include "core/utils.hpp"
#include "provider/builtin_providers.hpp"

#include <format>

namespace anonymizer {

Anonymizer::Anonymizer(FakerOptions faker_options)
    : faker_(std::make_unique<faker::FakerResolver>(std::move(faker_options))) {
    register_builtin_providers(registry_, *faker_);
    utils::log::debug(std::format("Registered {} providers", registry_.size()));
}

Value Anonymizer::alter(const FieldRule& field, const Value& original) const {
    const ProviderArgs args(field.provider);
    Value replacement = registry_.resolve(args.name()).alter_value(original, args);
    if (field.append && replacement.is_string()) {
        replacement = replacement.get<std::string>() + *field.append;
    }
    return replacement;
}

TableAnonymizer Anonymizer::for_table(const TableRule& rule) const {
    return TableAnonymizer(rule, registry_);
}

} // namespace anonymizer
