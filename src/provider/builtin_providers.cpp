#include "provider/builtin_providers.hpp"
#include "provider/fake_provider.hpp"
#include "provider/identifier_providers.hpp"
#include "provider/provider_registry.hpp"
#include "faker/faker_resolver.hpp"
#include "core/digest.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <memory>

namespace anonymizer {

using namespace std::chrono;

// ============================================================================
// choice / clear / set
// ============================================================================

Value ChoiceProvider::alter_value(const Value&, const ProviderArgs& args) const {
    const Value& values = args.required("values");
    if (!values.is_array() || values.empty()) {
        throw InvalidProviderArgumentError("Argument 'values' must be a non-empty list");
    }
    return values[utils::random_int<size_t>(0, values.size() - 1)];
}

Value ClearProvider::alter_value(const Value&, const ProviderArgs&) const {
    return nullptr;
}

Value SetProvider::alter_value(const Value&, const ProviderArgs& args) const {
    const Value* v = args.find("value");
    return v ? *v : Value(nullptr);
}

// ============================================================================
// mask / partial_mask
// ============================================================================

Value MaskProvider::alter_value(const Value& original, const ProviderArgs& args) const {
    const auto text = scalar_text(original);
    if (!text) return nullptr;

    const std::string sign = args.string_or("sign", kDefaultSign);
    return utils::repeat(sign, utils::utf8_length(*text));
}

std::string PartialMaskProvider::mask(std::string_view value, size_t left, size_t right,
                                      std::string_view sign) {
    const size_t len = utils::utf8_length(value);

    // No room for a masked middle: mask everything instead of exposing overlapping ends
    if (left + right >= len) {
        return utils::repeat(sign, len);
    }

    std::string result;
    result.reserve(value.size() + sign.size() * (len - left - right));
    result.append(utils::utf8_substr(value, 0, left));
    result.append(utils::repeat(sign, len - left - right));
    result.append(utils::utf8_substr(value, len - right, right));
    return result;
}

Value PartialMaskProvider::alter_value(const Value& original, const ProviderArgs& args) const {
    const auto text = scalar_text(original);
    if (!text) return nullptr;

    const std::string sign = args.string_or("sign", kDefaultSign);
    const int64_t left = args.int_or("unmasked_left", kDefaultUnmaskedLeft);
    const int64_t right = args.int_or("unmasked_right", kDefaultUnmaskedRight);
    if (left < 0 || right < 0) {
        throw InvalidProviderArgumentError("unmasked_left and unmasked_right must not be negative");
    }
    return mask(*text, static_cast<size_t>(left), static_cast<size_t>(right), sign);
}

// ============================================================================
// md5
// ============================================================================

Value Md5Provider::alter_value(const Value& original, const ProviderArgs& args) const {
    const auto text = scalar_text(original);
    if (!text) return nullptr;

    if (!args.flag("as_number")) {
        return Digest::md5_hex(*text);
    }

    const int64_t length = args.int_or("as_number_length", kDefaultNumberLength);
    if (length < 0) {
        throw InvalidProviderArgumentError("as_number_length must not be negative");
    }

    std::string digits = Digest::md5_decimal_mod(*text, static_cast<size_t>(length));
    if (const auto n = utils::try_parse_int<uint64_t>(digits)) {
        return *n;
    }
    return digits;
}

// ============================================================================
// Random values
// ============================================================================

Value Uuid4Provider::alter_value(const Value&, const ProviderArgs&) const {
    return utils::generate_uuid_v4();
}

Value ApiKeyProvider::alter_value(const Value&, const ProviderArgs&) const {
    return utils::generate_uuid_v4();
}

Value PhoneNumberItaProvider::alter_value(const Value&, const ProviderArgs&) const {
    return std::string(kPrefix) + utils::random_digits(kDigits);
}

Value RandomIdCardProvider::alter_value(const Value&, const ProviderArgs&) const {
    return utils::random_upper_letters(2) + utils::random_digits(7);
}

namespace {

// ", " and ": " separators, non-ASCII escaped as \uXXXX
void dump_spaced(const Value& v, std::string& out) {
    if (v.is_object()) {
        out += '{';
        bool first = true;
        for (const auto& [key, item] : v.items()) {
            if (!first) out += ", ";
            first = false;
            out += Value(key).dump(-1, ' ', true);
            out += ": ";
            dump_spaced(item, out);
        }
        out += '}';
    } else if (v.is_array()) {
        out += '[';
        for (size_t i = 0; i < v.size(); ++i) {
            if (i > 0) out += ", ";
            dump_spaced(v[i], out);
        }
        out += ']';
    } else {
        out += v.dump(-1, ' ', true);
    }
}

} // anonymous namespace

Value JsonStringProvider::alter_value(const Value&, const ProviderArgs& args) const {
    const Value* object = args.find("object");
    if (!object) return std::string("null");
    std::string out;
    dump_spaced(*object, out);
    return out;
}

// ============================================================================
// sameyear
// ============================================================================

year_month_day SameYearProvider::parse_date(std::string_view text) {
    // Date part ends at the optional time separator
    const size_t end = text.find_first_of("T ");
    const std::string_view date_part = text.substr(0, end);

    const size_t d1 = date_part.find('-');
    const size_t d2 = d1 == std::string_view::npos ? d1 : date_part.find('-', d1 + 1);
    if (d2 == std::string_view::npos) {
        throw InvalidProviderArgumentError(
            std::format("time data '{}' does not match format '%Y-%m-%d'", text));
    }

    const auto y = utils::try_parse_int<int>(date_part.substr(0, d1));
    const auto m = utils::try_parse_int<unsigned>(date_part.substr(d1 + 1, d2 - d1 - 1));
    const auto d = utils::try_parse_int<unsigned>(date_part.substr(d2 + 1));
    if (!y || !m || !d || d1 != 4) {
        throw InvalidProviderArgumentError(
            std::format("time data '{}' does not match format '%Y-%m-%d'", text));
    }

    const year_month_day ymd{year{*y}, month{*m}, day{*d}};
    if (!ymd.ok()) {
        throw InvalidProviderArgumentError(std::format("'{}' is not a valid date", text));
    }
    return ymd;
}

Value SameYearProvider::alter_value(const Value& original, const ProviderArgs&) const {
    if (original.is_null() || (original.is_string() && original.get_ref<const std::string&>().empty())) {
        return nullptr;
    }
    if (!original.is_string()) {
        throw InvalidProviderArgumentError(
            std::format("sameyear expects a date value, got {}", original.type_name()));
    }

    const year target_year = parse_date(original.get_ref<const std::string&>()).year();

    year_month_day birth = faker_.unlocalized().date_of_birth();
    if (birth.year().is_leap()) {
        birth = year_month_day{birth.year(), birth.month(), day{utils::random_int(1u, 25u)}};
    }
    return faker::format_iso_date(year_month_day{target_year, birth.month(), birth.day()});
}

// ============================================================================
// Registration
// ============================================================================

void register_builtin_providers(ProviderRegistry& registry, const faker::FakerResolver& faker) {
    registry.register_provider(std::make_shared<ChoiceProvider>());
    registry.register_provider(std::make_shared<ClearProvider>());
    registry.register_provider(std::make_shared<FakeProvider>(faker));
    registry.register_provider(std::make_shared<MaskProvider>());
    registry.register_provider(std::make_shared<PartialMaskProvider>());
    registry.register_provider(std::make_shared<Md5Provider>());
    registry.register_provider(std::make_shared<SetProvider>());
    registry.register_provider(std::make_shared<Uuid4Provider>());
    registry.register_provider(std::make_shared<FiscalCodeProvider>());
    registry.register_provider(std::make_shared<VatNumberProvider>());
    registry.register_provider(std::make_shared<FiscalCodeBusinessProvider>());
    registry.register_provider(std::make_shared<FiscalCodeVatProvider>());
    registry.register_provider(std::make_shared<PhoneNumberItaProvider>());
    registry.register_provider(std::make_shared<RandomIdCardProvider>());
    registry.register_provider(std::make_shared<ApiKeyProvider>());
    registry.register_provider(std::make_shared<JsonStringProvider>());
    registry.register_provider(std::make_shared<SameYearProvider>(faker));
}

} // namespace anonymizer
