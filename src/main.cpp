#include "config/schema_loader.hpp"
#include "core/anonymizer.hpp"
#include "core/table_anonymizer.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace anonymizer;

namespace {

constexpr std::string_view kDefaultSchemaFile = "schema.toml";

struct CliOptions {
    bool list_providers = false;
    bool verbose = false;
    bool dry_run = false;
    bool help = false;
    std::string schema_file{kDefaultSchemaFile};
    std::string table;
    std::optional<std::string> input_file;
    std::optional<std::string> output_file;
};

void print_usage(std::ostream& out) {
    out << "Usage: anonymizer [options]\n"
           "\n"
           "Anonymize JSON-lines rows of a table with the rules of a TOML schema.\n"
           "\n"
           "Options:\n"
           "  -l, --list-providers  Show a list of all available providers\n"
           "      --schema FILE     TOML schema with the anonymization rules (default: schema.toml)\n"
           "      --table NAME      Table whose rules are applied to the input rows\n"
           "      --input FILE      JSON-lines input (default: stdin)\n"
           "      --output FILE     JSON-lines output (default: stdout)\n"
           "      --dry-run         Anonymize but write no output\n"
           "  -v, --verbose         Debug logging\n"
           "  -h, --help            Show this help\n";
}

// Returns std::nullopt (after logging) on malformed arguments
std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        auto next_value = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                utils::log::error(std::format("Option {} requires a value", arg));
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "-l" || arg == "--list-providers") {
            opts.list_providers = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--dry-run") {
            opts.dry_run = true;
        } else if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "--schema") {
            auto v = next_value();
            if (!v) return std::nullopt;
            opts.schema_file = std::move(*v);
        } else if (arg == "--table") {
            auto v = next_value();
            if (!v) return std::nullopt;
            opts.table = std::move(*v);
        } else if (arg == "--input") {
            opts.input_file = next_value();
            if (!opts.input_file) return std::nullopt;
        } else if (arg == "--output") {
            opts.output_file = next_value();
            if (!opts.output_file) return std::nullopt;
        } else {
            utils::log::error(std::format("Unknown option: {}", arg));
            return std::nullopt;
        }
    }
    return opts;
}

void list_providers(const Anonymizer& engine) {
    std::cout << "Available provider classes:\n\n";
    for (const auto& info : engine.registry().list()) {
        std::cout << std::format("{:<20} {}\n", info.id, info.description);
    }
}

std::vector<Row> read_rows(std::istream& in) {
    std::vector<Row> rows;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (utils::trim(line).empty()) continue;
        try {
            rows.push_back(Value::parse(line));
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error(std::format("Input line {}: {}", line_no, e.what()));
        }
    }
    return rows;
}

void write_rows(std::ostream& out, const std::vector<Row>& rows) {
    for (const auto& row : rows) {
        out << row.dump() << '\n';
    }
    out.flush();
}

int run(const CliOptions& opts) {
    if (opts.list_providers) {
        const Anonymizer engine;
        list_providers(engine);
        return EXIT_SUCCESS;
    }

    if (opts.table.empty()) {
        utils::log::error("--table is required");
        print_usage(std::cerr);
        return EXIT_FAILURE;
    }

    utils::log::info(std::format("Loading schema from {}", opts.schema_file));
    auto schema_result = SchemaLoader::load_from_file(opts.schema_file);
    if (!schema_result.success) {
        utils::log::error(schema_result.error_message);
        return EXIT_FAILURE;
    }
    const auto& schema = schema_result.schema;

    std::ifstream input_file;
    if (opts.input_file) {
        input_file.open(*opts.input_file);
        if (!input_file.is_open()) {
            utils::log::error(std::format("Cannot open input file: {}", *opts.input_file));
            return EXIT_FAILURE;
        }
    }
    std::istream& in = opts.input_file ? static_cast<std::istream&>(input_file) : std::cin;

    const utils::Timer timer;
    auto rows = read_rows(in);

    const bool truncated = std::find(schema.truncate.begin(), schema.truncate.end(), opts.table)
                           != schema.truncate.end();
    if (truncated) {
        utils::log::info(std::format("Table '{}' is truncated: dropped {} rows", opts.table, rows.size()));
        rows.clear();
    } else {
        const TableRule* rule = schema.find_table(opts.table);
        if (!rule) {
            utils::log::error(std::format("Table '{}' has no rules in {}", opts.table, opts.schema_file));
            return EXIT_FAILURE;
        }

        const Anonymizer engine(schema.faker);
        const auto table = engine.for_table(*rule);
        const auto stats = table.anonymize_rows(rows);
        utils::log::info(std::format("Table '{}' (key '{}'): {} rows, {} anonymized, {} excluded",
            opts.table, rule->primary_key, stats.rows, stats.anonymized, stats.excluded));
    }

    if (opts.dry_run) {
        utils::log::info("Dry run: no output written");
    } else if (opts.output_file) {
        std::ofstream out(*opts.output_file, std::ios::trunc);
        if (!out.is_open()) {
            utils::log::error(std::format("Cannot open output file: {}", *opts.output_file));
            return EXIT_FAILURE;
        }
        write_rows(out, rows);
    } else {
        write_rows(std::cout, rows);
    }

    utils::log::info(std::format("Anonymization took {}ms", timer.elapsed_ms().count()));
    return EXIT_SUCCESS;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage(std::cerr);
        return EXIT_FAILURE;
    }
    if (opts->help) {
        print_usage(std::cout);
        return EXIT_SUCCESS;
    }
    if (opts->verbose) {
        utils::log::set_level(utils::log::Level::DEBUG);
    }

    try {
        return run(*opts);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return EXIT_FAILURE;
    }
}
