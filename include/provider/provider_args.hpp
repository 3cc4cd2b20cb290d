#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace anonymizer {

/**
 * @brief Read-only view over a field's provider definition
 *
 * The definition is the provider table of a field rule:
 *   { name = "md5", as_number = true, kwargs = {...}, locale = "de_DE" }
 *
 * Accessors throw InvalidProviderArgumentError for missing required keys and
 * for values of the wrong type. A key holding `null` counts as absent.
 */
class ProviderArgs {
public:
    ProviderArgs();
    explicit ProviderArgs(Value definition);

    [[nodiscard]] const Value& raw() const { return definition_; }

    [[nodiscard]] bool has(std::string_view key) const { return find(key) != nullptr; }
    [[nodiscard]] const Value* find(std::string_view key) const;

    [[nodiscard]] const Value& required(std::string_view key) const;

    // Rule identifier ("name" key), empty when unset
    [[nodiscard]] std::string name() const;

    [[nodiscard]] std::optional<std::string> optional_string(std::string_view key) const;

    // Falls back to `fallback` when the key is absent or holds an empty string
    [[nodiscard]] std::string string_or(std::string_view key, std::string_view fallback) const;

    [[nodiscard]] int64_t int_or(std::string_view key, int64_t fallback) const;

    // Booleans, numbers (non-zero) and strings (non-empty) are accepted
    [[nodiscard]] bool flag(std::string_view key) const;

    // "kwargs" object forwarded to generator methods (empty object when absent)
    [[nodiscard]] const Value& kwargs() const;

private:
    Value definition_;
};

/**
 * @brief Text form of a scalar column value
 *
 * Strings are returned as-is, numbers and booleans as their JSON text,
 * null as std::nullopt.
 * @throws InvalidProviderArgumentError for arrays and objects
 */
[[nodiscard]] std::optional<std::string> scalar_text(const Value& value);

} // namespace anonymizer
