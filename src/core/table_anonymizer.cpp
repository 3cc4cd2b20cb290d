#include "core/table_anonymizer.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "provider/provider_registry.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <format>
#include <future>
#include <thread>

namespace anonymizer {

TableAnonymizer::TableAnonymizer(const TableRule& rule, const ProviderRegistry& registry)
    : name_(rule.name),
      chunk_size_(std::max<size_t>(rule.chunk_size, 1)) {

    fields_.reserve(rule.fields.size());
    for (const auto& field : rule.fields) {
        ProviderArgs args(field.provider);
        const IProvider& provider = registry.resolve(args.name());
        utils::log::debug(std::format("{}.{} -> {} ({})",
            name_, field.column, args.name(), provider.id()));
        fields_.push_back({field.column, &provider, std::move(args), field.append});
    }

    excludes_.reserve(rule.excludes.size());
    for (const auto& exclude : rule.excludes) {
        PreparedExclude prepared;
        prepared.column = exclude.column;
        prepared.patterns.reserve(exclude.patterns.size());
        for (const auto& pattern : exclude.patterns) {
            try {
                prepared.patterns.emplace_back(pattern, std::regex::ECMAScript | std::regex::optimize);
            } catch (const std::regex_error& e) {
                throw InvalidProviderArgumentError(std::format(
                    "Table '{}': invalid exclude pattern \"{}\" for column '{}': {}",
                    name_, pattern, exclude.column, e.what()));
            }
        }
        excludes_.push_back(std::move(prepared));
    }
}

bool TableAnonymizer::is_excluded(const Row& row) const {
    if (!row.is_object()) return false;

    for (const auto& exclude : excludes_) {
        const auto it = row.find(exclude.column);
        if (it == row.end() || it->is_structured()) continue;

        const auto text = scalar_text(*it);
        if (!text) continue;

        for (const auto& re : exclude.patterns) {
            if (std::regex_search(*text, re, std::regex_constants::match_continuous)) {
                return true;
            }
        }
    }
    return false;
}

void TableAnonymizer::anonymize_row(Row& row) const {
    if (!row.is_object()) {
        throw InvalidProviderArgumentError(
            std::format("Table '{}': row is not a JSON object", name_));
    }

    for (const auto& field : fields_) {
        const auto it = row.find(field.column);
        if (it == row.end()) continue;

        Value replacement = field.provider->alter_value(*it, field.args);
        if (field.append && replacement.is_string()) {
            replacement = replacement.get<std::string>() + *field.append;
        }
        *it = std::move(replacement);
    }
}

TableAnonymizer::Stats TableAnonymizer::anonymize_range(
    std::vector<Row>& rows, size_t start, size_t end) const {

    Stats stats;
    for (size_t r = start; r < end; ++r) {
        ++stats.rows;
        if (is_excluded(rows[r])) {
            ++stats.excluded;
            continue;
        }
        anonymize_row(rows[r]);
        ++stats.anonymized;
    }
    return stats;
}

TableAnonymizer::Stats TableAnonymizer::anonymize_rows(std::vector<Row>& rows) const {
    const size_t num_rows = rows.size();
    const size_t num_chunks = (num_rows + chunk_size_ - 1) / chunk_size_;
    const unsigned hw_threads = std::max(std::thread::hardware_concurrency(), 1u);

    if (num_chunks <= 1 || hw_threads == 1) {
        return anonymize_range(rows, 0, num_rows);
    }

    // Workers pull chunk indices until every chunk is taken
    std::atomic<size_t> next_chunk{0};
    auto worker = [&]() {
        Stats stats;
        for (size_t c = next_chunk.fetch_add(1); c < num_chunks; c = next_chunk.fetch_add(1)) {
            const size_t start = c * chunk_size_;
            const size_t end = std::min(start + chunk_size_, num_rows);
            const Stats part = anonymize_range(rows, start, end);
            stats.rows += part.rows;
            stats.anonymized += part.anonymized;
            stats.excluded += part.excluded;
        }
        return stats;
    };

    const size_t num_workers = std::min<size_t>(hw_threads, num_chunks);
    std::vector<std::future<Stats>> futures;
    futures.reserve(num_workers);
    for (size_t w = 0; w < num_workers; ++w) {
        futures.push_back(std::async(std::launch::async, worker));
    }

    Stats total;
    std::exception_ptr first_error;
    for (auto& f : futures) {
        try {
            const Stats part = f.get();
            total.rows += part.rows;
            total.anonymized += part.anonymized;
            total.excluded += part.excluded;
        } catch (...) {
            if (!first_error) first_error = std::current_exception();
        }
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }
    return total;
}

} // namespace anonymizer
