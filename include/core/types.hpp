#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace anonymizer {

// ============================================================================
// Values
// ============================================================================

/**
 * Field values and provider arguments. Insertion order of object keys is kept
 * so that serialized arguments (jsonstring) follow the schema's key order.
 * `null` is the absent value.
 */
using Value = nlohmann::ordered_json;

// Column name -> value
using Row = Value;

// ============================================================================
// Rule Schema
// ============================================================================

struct FakerOptions {
    std::optional<std::string> default_locale;
    std::vector<std::string> locales;
};

struct FieldRule {
    std::string column;
    Value provider = Value::object();      // name, kwargs, locale, provider-specific keys
    std::optional<std::string> append;     // suffix added to string results

    [[nodiscard]] std::string provider_name() const {
        if (provider.is_object()) {
            const auto it = provider.find("name");
            if (it != provider.end() && it->is_string()) {
                return it->get<std::string>();
            }
        }
        return {};
    }
};

struct ExcludeRule {
    std::string column;
    std::vector<std::string> patterns;
};

struct TableRule {
    static constexpr size_t kDefaultChunkSize = 2000;

    std::string name;
    std::string primary_key = "id";
    size_t chunk_size = kDefaultChunkSize;
    std::vector<FieldRule> fields;
    std::vector<ExcludeRule> excludes;
};

struct AnonymizationSchema {
    FakerOptions faker;
    std::vector<TableRule> tables;
    std::vector<std::string> truncate;

    [[nodiscard]] const TableRule* find_table(const std::string& name) const {
        for (const auto& t : tables) {
            if (t.name == name) return &t;
        }
        return nullptr;
    }
};

} // namespace anonymizer
