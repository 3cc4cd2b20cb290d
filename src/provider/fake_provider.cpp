#include "provider/fake_provider.hpp"
#include "faker/faker_resolver.hpp"
#include "core/error.hpp"

#include <format>

namespace anonymizer {

Value FakeProvider::alter_value(const Value&, const ProviderArgs& args) const {
    const std::string name = args.name();
    const size_t dot = name.find('.');
    if (dot == std::string::npos || dot + 1 == name.size()) {
        throw InvalidProviderArgumentError(
            std::format("Fake provider name '{}' does not name a generator method", name));
    }
    const std::string method = name.substr(dot + 1);

    const auto& generator = faker_.for_field(args.optional_string("locale"));
    return generator.invoke(method, args.kwargs());
}

} // namespace anonymizer
