#include "provider/provider_args.hpp"
#include "core/error.hpp"

#include <format>
#include <utility>

namespace anonymizer {

namespace {

const Value& empty_object() {
    static const Value kEmpty = Value::object();
    return kEmpty;
}

} // anonymous namespace

ProviderArgs::ProviderArgs() : definition_(Value::object()) {}

ProviderArgs::ProviderArgs(Value definition) : definition_(std::move(definition)) {
    if (definition_.is_null()) {
        definition_ = Value::object();
    }
    if (!definition_.is_object()) {
        throw InvalidProviderArgumentError(
            std::format("Provider definition must be a table, got {}", definition_.type_name()));
    }
}

const Value* ProviderArgs::find(std::string_view key) const {
    const auto it = definition_.find(std::string(key));
    if (it == definition_.end() || it->is_null()) return nullptr;
    return &*it;
}

const Value& ProviderArgs::required(std::string_view key) const {
    const Value* v = find(key);
    if (!v) {
        throw InvalidProviderArgumentError(
            std::format("Provider '{}' requires argument '{}'", name(), key));
    }
    return *v;
}

std::string ProviderArgs::name() const {
    const auto it = definition_.find("name");
    if (it != definition_.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return {};
}

std::optional<std::string> ProviderArgs::optional_string(std::string_view key) const {
    const Value* v = find(key);
    if (!v) return std::nullopt;
    if (!v->is_string()) {
        throw InvalidProviderArgumentError(
            std::format("Argument '{}' must be a string, got {}", key, v->type_name()));
    }
    return v->get<std::string>();
}

std::string ProviderArgs::string_or(std::string_view key, std::string_view fallback) const {
    auto v = optional_string(key);
    if (!v || v->empty()) return std::string(fallback);
    return *v;
}

int64_t ProviderArgs::int_or(std::string_view key, int64_t fallback) const {
    const Value* v = find(key);
    if (!v) return fallback;
    if (!v->is_number_integer()) {
        throw InvalidProviderArgumentError(
            std::format("Argument '{}' must be an integer, got {}", key, v->type_name()));
    }
    return v->get<int64_t>();
}

bool ProviderArgs::flag(std::string_view key) const {
    const Value* v = find(key);
    if (!v) return false;
    if (v->is_boolean()) return v->get<bool>();
    if (v->is_number()) return v->get<double>() != 0.0;
    if (v->is_string()) return !v->get_ref<const std::string&>().empty();
    throw InvalidProviderArgumentError(
        std::format("Argument '{}' must be a boolean, got {}", key, v->type_name()));
}

const Value& ProviderArgs::kwargs() const {
    const Value* v = find("kwargs");
    if (!v) return empty_object();
    if (!v->is_object()) {
        throw InvalidProviderArgumentError(
            std::format("Argument 'kwargs' must be a table, got {}", v->type_name()));
    }
    return *v;
}

std::optional<std::string> scalar_text(const Value& value) {
    if (value.is_null()) return std::nullopt;
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number() || value.is_boolean()) return value.dump();
    throw InvalidProviderArgumentError(
        std::format("Expected a scalar column value, got {}", value.type_name()));
}

} // namespace anonymizer
