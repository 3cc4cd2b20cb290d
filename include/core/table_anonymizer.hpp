#pragma once

#include "core/types.hpp"
#include "provider/provider_args.hpp"

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace anonymizer {

class IProvider;
class ProviderRegistry;

/**
 * @brief Applies one table's field rules to rows
 *
 * Providers and exclude patterns are resolved once at construction, so a
 * schema naming an unknown provider fails before any row is touched.
 *
 * A row is excluded (left untouched) when any exclude pattern matches at the
 * start of the text of its column. Fields whose column is absent from a row
 * are skipped. `append` is added to string results only.
 */
class TableAnonymizer {
public:
    struct Stats {
        size_t rows = 0;
        size_t anonymized = 0;
        size_t excluded = 0;
    };

    /**
     * @throws UnknownProviderError if a field names no registered provider
     * @throws InvalidProviderArgumentError if a provider definition is not an object
     */
    TableAnonymizer(const TableRule& rule, const ProviderRegistry& registry);

    [[nodiscard]] const std::string& table_name() const { return name_; }

    [[nodiscard]] bool is_excluded(const Row& row) const;

    // Rewrites the configured columns of one row in place
    void anonymize_row(Row& row) const;

    /**
     * @brief Anonymize a batch of rows in place
     *
     * Batches larger than one chunk are split into chunk_size slices and run on
     * worker threads. The first provider error from any worker is rethrown
     * after all workers have finished.
     */
    Stats anonymize_rows(std::vector<Row>& rows) const;

private:
    struct PreparedField {
        std::string column;
        const IProvider* provider;
        ProviderArgs args;
        std::optional<std::string> append;
    };

    struct PreparedExclude {
        std::string column;
        std::vector<std::regex> patterns;
    };

    Stats anonymize_range(std::vector<Row>& rows, size_t start, size_t end) const;

    std::string name_;
    size_t chunk_size_;
    std::vector<PreparedField> fields_;
    std::vector<PreparedExclude> excludes_;
};

} // namespace anonymizer
