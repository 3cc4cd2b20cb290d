#include <catch2/catch_test_macros.hpp>
#include "config/schema_loader.hpp"

#include <cstdlib>
#include <cstdio>
#include <fstream>

using namespace anonymizer;

static const std::string kFullSchema = R"(
truncate = ["django_session", "auth_permission"]

[options.faker]
default_locale = "de_DE"
locales = ["de_DE", "en_US"]

[[tables]]
name = "auth_user"
primary_key = "id"
chunk_size = 5000

[[tables.fields]]
column = "email"
append = "@localhost"
provider = { name = "md5" }

[[tables.fields]]
column = "first_name"
provider = { name = "fake.first_name", locale = "en_US" }

[[tables.fields]]
column = "card"
[tables.fields.provider]
name = "partial_mask"
sign = "*"
unmasked_left = 0
unmasked_right = 4

[[tables.excludes]]
column = "email"
patterns = ["\\S[^@]*@example\\.com", "admin"]

[[tables]]
name = "customer"

[[tables.fields]]
column = "birth_date"
provider = { name = "fake.date_of_birth", kwargs = { minimum_age = 18, maximum_age = 60 } }
)";

TEST_CASE("SchemaLoader parses a full schema", "[config][schema]") {
    auto result = SchemaLoader::load_from_string(kFullSchema);
    REQUIRE(result.success);
    const auto& schema = result.schema;

    SECTION("Faker options") {
        REQUIRE(schema.faker.default_locale.has_value());
        CHECK(*schema.faker.default_locale == "de_DE");
        CHECK(schema.faker.locales == std::vector<std::string>{"de_DE", "en_US"});
    }

    SECTION("Truncated tables") {
        CHECK(schema.truncate == std::vector<std::string>{"django_session", "auth_permission"});
    }

    SECTION("Table settings") {
        REQUIRE(schema.tables.size() == 2);
        const auto* user = schema.find_table("auth_user");
        REQUIRE(user != nullptr);
        CHECK(user->primary_key == "id");
        CHECK(user->chunk_size == 5000);

        const auto* customer = schema.find_table("customer");
        REQUIRE(customer != nullptr);
        CHECK(customer->primary_key == "id");
        CHECK(customer->chunk_size == TableRule::kDefaultChunkSize);

        CHECK(schema.find_table("missing") == nullptr);
    }

    SECTION("Field rules keep their provider definitions") {
        const auto& fields = schema.find_table("auth_user")->fields;
        REQUIRE(fields.size() == 3);

        CHECK(fields[0].column == "email");
        CHECK(fields[0].provider_name() == "md5");
        REQUIRE(fields[0].append.has_value());
        CHECK(*fields[0].append == "@localhost");

        CHECK(fields[1].provider_name() == "fake.first_name");
        CHECK(fields[1].provider["locale"] == "en_US");
        CHECK_FALSE(fields[1].append.has_value());

        CHECK(fields[2].provider["sign"] == "*");
        CHECK(fields[2].provider["unmasked_left"] == 0);
        CHECK(fields[2].provider["unmasked_right"] == 4);

        const auto& birth = schema.find_table("customer")->fields.at(0);
        CHECK(birth.provider["kwargs"]["minimum_age"] == 18);
        CHECK(birth.provider["kwargs"]["maximum_age"] == 60);
    }

    SECTION("Exclude rules") {
        const auto& excludes = schema.find_table("auth_user")->excludes;
        REQUIRE(excludes.size() == 1);
        CHECK(excludes[0].column == "email");
        CHECK(excludes[0].patterns == std::vector<std::string>{"\\S[^@]*@example\\.com", "admin"});
    }
}

TEST_CASE("SchemaLoader accepts an empty schema", "[config][schema]") {
    auto result = SchemaLoader::load_from_string("");
    REQUIRE(result.success);
    CHECK(result.schema.tables.empty());
    CHECK(result.schema.truncate.empty());
    CHECK(result.schema.faker.locales.empty());
    CHECK_FALSE(result.schema.faker.default_locale.has_value());
}

TEST_CASE("SchemaLoader converts TOML dates to ISO strings", "[config][schema]") {
    auto result = SchemaLoader::load_from_string(R"(
[[tables]]
name = "events"

[[tables.fields]]
column = "created"
provider = { name = "set", value = 2020-01-02 }

[[tables.fields]]
column = "updated"
provider = { name = "set", value = 2020-01-02T03:04:05Z }
)");
    REQUIRE(result.success);
    const auto& fields = result.schema.tables.at(0).fields;
    CHECK(fields.at(0).provider["value"] == "2020-01-02");
    CHECK(fields.at(1).provider["value"] == "2020-01-02T03:04:05+00:00");
}

TEST_CASE("SchemaLoader expands environment variables", "[config][schema][env]") {
    ::setenv("ANONYMIZER_TEST_SUFFIX", "@corp.example", 1);

    auto result = SchemaLoader::load_from_string(R"(
[[tables]]
name = "auth_user"

[[tables.fields]]
column = "email"
append = "${ANONYMIZER_TEST_SUFFIX}"
provider = { name = "set", value = "user${ANONYMIZER_TEST_SUFFIX}" }
)");
    REQUIRE(result.success);
    const auto& field = result.schema.tables.at(0).fields.at(0);
    CHECK(*field.append == "@corp.example");
    CHECK(field.provider["value"] == "user@corp.example");

    ::unsetenv("ANONYMIZER_TEST_SUFFIX");
}

TEST_CASE("SchemaLoader reports invalid schemas", "[config][schema]") {
    SECTION("TOML syntax error") {
        auto result = SchemaLoader::load_from_string("[[tables]\nname = ");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("TOML parse error") != std::string::npos);
    }

    SECTION("Table without a name") {
        auto result = SchemaLoader::load_from_string("[[tables]]\nprimary_key = \"id\"\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("Table must have a name") != std::string::npos);
    }

    SECTION("Field without a provider") {
        auto result = SchemaLoader::load_from_string(R"(
[[tables]]
name = "t"
[[tables.fields]]
column = "c"
)");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("missing [provider] table") != std::string::npos);
    }

    SECTION("Provider without a name") {
        auto result = SchemaLoader::load_from_string(R"(
[[tables]]
name = "t"
[[tables.fields]]
column = "c"
provider = { sign = "*" }
)");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("provider must have a name") != std::string::npos);
    }

    SECTION("Invalid exclude pattern") {
        auto result = SchemaLoader::load_from_string(R"(
[[tables]]
name = "t"
[[tables.excludes]]
column = "c"
patterns = ["(unclosed"]
)");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("invalid exclude pattern") != std::string::npos);
    }

    SECTION("Non-positive chunk size") {
        auto result = SchemaLoader::load_from_string("[[tables]]\nname = \"t\"\nchunk_size = 0\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("chunk_size must be positive") != std::string::npos);
    }

    SECTION("Duplicate table") {
        auto result = SchemaLoader::load_from_string("[[tables]]\nname = \"t\"\n[[tables]]\nname = \"t\"\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("defined twice") != std::string::npos);
    }
}

TEST_CASE("SchemaLoader reads files", "[config][schema]") {
    SECTION("Missing file") {
        auto result = SchemaLoader::load_from_file("/nonexistent/schema.toml");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("Cannot open schema file") != std::string::npos);
    }

    SECTION("Schema on disk") {
        const std::string path = "test_schema_loader_tmp.toml";
        {
            std::ofstream out(path);
            out << kFullSchema;
        }
        auto result = SchemaLoader::load_from_file(path);
        std::remove(path.c_str());

        REQUIRE(result.success);
        CHECK(result.schema.tables.size() == 2);
    }
}
