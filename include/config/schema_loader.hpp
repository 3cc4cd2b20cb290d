#pragma once

#include "core/types.hpp"

#include <string>

namespace anonymizer {

/**
 * @brief Anonymization schema loader (TOML)
 *
 * Layout:
 *   [options.faker]            default_locale, locales
 *   truncate = [...]           tables whose rows are dropped
 *   [[tables]]                 name, primary_key, chunk_size
 *   [[tables.fields]]          column, append, provider = { name = ..., ... }
 *   [[tables.excludes]]        column, patterns
 *
 * ${VAR} references in string values are replaced with environment variables.
 * Provider tables are converted to Value as-is (TOML dates and times become
 * ISO strings) so provider-specific keys reach the provider untouched.
 */
class SchemaLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        AnonymizationSchema schema;

        static LoadResult ok(AnonymizationSchema s) {
            LoadResult result;
            result.success = true;
            result.schema = std::move(s);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load schema from a TOML file
     * @param schema_path Path to the schema file
     * @return LoadResult with the schema or an error message
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& schema_path);

    /**
     * @brief Load schema from TOML content
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);
};

} // namespace anonymizer
