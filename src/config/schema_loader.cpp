#include "config/schema_loader.hpp"
#include "core/utils.hpp"

#include <toml.hpp>

#include <cstdlib>
#include <format>
#include <fstream>
#include <regex>
#include <stdexcept>

using namespace std::string_literals;

namespace anonymizer {

// Config keys used more than once
static constexpr std::string_view kTables   = "tables";
static constexpr std::string_view kFields   = "fields";
static constexpr std::string_view kExcludes = "excludes";
static constexpr std::string_view kColumn   = "column";
static constexpr std::string_view kProvider = "provider";

namespace {

// ============================================================================
// Environment expansion (${VAR_NAME})
// ============================================================================

std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

// ============================================================================
// TOML -> Value
// ============================================================================

std::string format_date(const toml::date& d) {
    return std::format("{:04d}-{:02d}-{:02d}",
        static_cast<int>(d.year), static_cast<int>(d.month), static_cast<int>(d.day));
}

std::string format_time(const toml::time& t) {
    std::string out = std::format("{:02d}:{:02d}:{:02d}",
        static_cast<int>(t.hour), static_cast<int>(t.minute), static_cast<int>(t.second));
    if (t.nanosecond != 0) {
        out += std::format(".{:06d}", t.nanosecond / 1000);
    }
    return out;
}

Value to_value(const toml::node& node) {
    if (const auto* tbl = node.as_table()) {
        Value obj = Value::object();
        for (auto&& [key, val] : *tbl) {
            obj[std::string(key.str())] = to_value(val);
        }
        return obj;
    }
    if (const auto* arr = node.as_array()) {
        Value out = Value::array();
        for (const auto& elem : *arr) {
            out.push_back(to_value(elem));
        }
        return out;
    }
    if (const auto* s = node.as_string())         return s->get();
    if (const auto* i = node.as_integer())        return i->get();
    if (const auto* f = node.as_floating_point()) return f->get();
    if (const auto* b = node.as_boolean())        return b->get();
    if (const auto* d = node.as_date())           return format_date(d->get());
    if (const auto* t = node.as_time())           return format_time(t->get());
    if (const auto* dt = node.as_date_time()) {
        const auto& v = dt->get();
        std::string out = format_date(v.date) + "T" + format_time(v.time);
        if (v.offset) {
            const int minutes = v.offset->minutes;
            const int abs_minutes = minutes < 0 ? -minutes : minutes;
            out += std::format("{}{:02d}:{:02d}", minutes < 0 ? '-' : '+',
                               abs_minutes / 60, abs_minutes % 60);
        }
        return out;
    }
    return nullptr;
}

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

// ============================================================================
// Section extractors (throw std::runtime_error on invalid input)
// ============================================================================

FakerOptions extract_faker_options(const toml::table& root) {
    FakerOptions options;
    const auto* faker = root["options"]["faker"].as_table();
    if (!faker) return options;

    if (auto v = (*faker)["default_locale"].value<std::string>(); v && !v->empty()) {
        options.default_locale = *v;
    }
    options.locales = toml_string_array(*faker, "locales");
    return options;
}

FieldRule extract_field(const toml::table& tbl, const std::string& table_name) {
    FieldRule field;
    field.column = tbl[kColumn].value_or(""s);
    if (field.column.empty()) {
        throw std::runtime_error(std::format("Table '{}': field must have a column", table_name));
    }

    const auto* provider = tbl[kProvider].as_table();
    if (!provider) {
        throw std::runtime_error(std::format(
            "Table '{}', column '{}': missing [provider] table", table_name, field.column));
    }
    field.provider = to_value(*provider);
    if (field.provider_name().empty()) {
        throw std::runtime_error(std::format(
            "Table '{}', column '{}': provider must have a name", table_name, field.column));
    }

    if (auto append = tbl["append"].value<std::string>()) {
        field.append = *append;
    }
    return field;
}

ExcludeRule extract_exclude(const toml::table& tbl, const std::string& table_name) {
    ExcludeRule exclude;
    exclude.column = tbl[kColumn].value_or(""s);
    if (exclude.column.empty()) {
        throw std::runtime_error(std::format("Table '{}': exclude must have a column", table_name));
    }
    exclude.patterns = toml_string_array(tbl, "patterns");

    for (const auto& pattern : exclude.patterns) {
        try {
            std::regex compiled(pattern);
        } catch (const std::regex_error& e) {
            throw std::runtime_error(std::format(
                "Table '{}', column '{}': invalid exclude pattern '{}': {}",
                table_name, exclude.column, pattern, e.what()));
        }
    }
    return exclude;
}

TableRule extract_table(const toml::table& tbl) {
    TableRule table;
    table.name = tbl["name"].value_or(""s);
    if (table.name.empty()) {
        throw std::runtime_error("Table must have a name");
    }
    table.primary_key = tbl["primary_key"].value_or("id"s);

    const int64_t chunk_size = tbl["chunk_size"].value_or(static_cast<int64_t>(TableRule::kDefaultChunkSize));
    if (chunk_size <= 0) {
        throw std::runtime_error(std::format(
            "Table '{}': chunk_size must be positive, got {}", table.name, chunk_size));
    }
    table.chunk_size = static_cast<size_t>(chunk_size);

    if (const auto* fields = tbl[kFields].as_array()) {
        for (const auto& elem : *fields) {
            if (const auto* node = elem.as_table()) {
                table.fields.push_back(extract_field(*node, table.name));
            }
        }
    }

    if (const auto* excludes = tbl[kExcludes].as_array()) {
        for (const auto& elem : *excludes) {
            if (const auto* node = elem.as_table()) {
                table.excludes.push_back(extract_exclude(*node, table.name));
            }
        }
    }
    return table;
}

} // anonymous namespace

// ============================================================================
// Public API
// ============================================================================

SchemaLoader::LoadResult SchemaLoader::load_from_file(const std::string& schema_path) {
    std::ifstream file(schema_path);
    if (!file.is_open()) {
        return LoadResult::error(std::format("Cannot open schema file: {}", schema_path));
    }

    std::string buffer((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    return load_from_string(buffer);
}

SchemaLoader::LoadResult SchemaLoader::load_from_string(const std::string& toml_content) {
    try {
        auto root = toml::parse(toml_content);
        expand_env_vars_recursive(root);

        AnonymizationSchema schema;
        schema.faker = extract_faker_options(root);
        schema.truncate = toml_string_array(root, "truncate");

        if (const auto* tables = root[kTables].as_array()) {
            for (const auto& elem : *tables) {
                const auto* node = elem.as_table();
                if (!node) continue;
                auto table = extract_table(*node);
                if (schema.find_table(table.name)) {
                    return LoadResult::error(std::format("Table '{}' is defined twice", table.name));
                }
                schema.tables.push_back(std::move(table));
            }
        }

        utils::log::debug(std::format("Schema loaded: {} table(s), {} truncated",
            schema.tables.size(), schema.truncate.size()));
        return LoadResult::ok(std::move(schema));

    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error: {}", e.what()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Error parsing schema: {}", e.what()));
    }
}

} // namespace anonymizer
