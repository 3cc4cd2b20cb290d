#include <catch2/catch_test_macros.hpp>
#include "provider/builtin_providers.hpp"
#include "provider/provider_registry.hpp"
#include "faker/faker_resolver.hpp"
#include "core/error.hpp"

#include <regex>
#include <set>
#include <string>

using namespace anonymizer;

namespace {

struct Fixture {
    faker::FakerResolver faker{FakerOptions{std::nullopt, {"en_US", "it_IT"}}};
    ProviderRegistry registry;

    Fixture() { register_builtin_providers(registry, faker); }

    Value alter(const Value& definition, const Value& original) const {
        const ProviderArgs args(definition);
        return registry.resolve(args.name()).alter_value(original, args);
    }
};

bool matches(const Value& v, const char* pattern) {
    return v.is_string() && std::regex_match(v.get<std::string>(), std::regex(pattern));
}

} // anonymous namespace

// ============================================================================
// mask / partial_mask
// ============================================================================

TEST_CASE("mask replaces every character", "[providers][mask]") {
    Fixture f;
    CHECK(f.alter({{"name", "mask"}, {"sign", "*"}}, "secret") == "******");
    CHECK(f.alter({{"name", "mask"}}, "abc") == "XXX");
    CHECK(f.alter({{"name", "mask"}}, "") == "");

    SECTION("Length counts characters, not bytes") {
        CHECK(f.alter({{"name", "mask"}}, "h\xC3\xA9llo") == "XXXXX");
    }

    SECTION("Scalars are masked by their text") {
        CHECK(f.alter({{"name", "mask"}}, 12345) == "XXXXX");
        CHECK(f.alter({{"name", "mask"}}, true) == "XXXX");
    }

    SECTION("Null passes through") {
        CHECK(f.alter({{"name", "mask"}}, nullptr).is_null());
    }

    SECTION("Structured values are rejected") {
        CHECK_THROWS_AS(f.alter({{"name", "mask"}}, Value::array({1, 2})), InvalidProviderArgumentError);
    }
}

TEST_CASE("partial_mask keeps the requested ends", "[providers][mask]") {
    Fixture f;
    CHECK(f.alter({{"name", "partial_mask"}, {"unmasked_left", 2}, {"unmasked_right", 2}},
                  "1234567890") == "12XXXXXX90");
    CHECK(f.alter({{"name", "partial_mask"}}, "abcdef") == "aXXXXf");
    // An explicit zero keeps nothing on that side
    CHECK(f.alter({{"name", "partial_mask"}, {"sign", "#"}, {"unmasked_left", 0}, {"unmasked_right", 3}},
                  "4111111111111111") == "#############111");

    SECTION("No room for a masked middle masks everything") {
        CHECK(f.alter({{"name", "partial_mask"}}, "ab") == "XX");
        CHECK(f.alter({{"name", "partial_mask"}, {"unmasked_left", 5}, {"unmasked_right", 5}},
                      "short") == "XXXXX");
    }

    SECTION("Invalid arguments throw") {
        CHECK_THROWS_AS(f.alter({{"name", "partial_mask"}, {"unmasked_left", -1}}, "abcdef"),
                        InvalidProviderArgumentError);
        CHECK_THROWS_AS(f.alter({{"name", "partial_mask"}, {"unmasked_left", "two"}}, "abcdef"),
                        InvalidProviderArgumentError);
    }

    SECTION("Static helper counts characters") {
        CHECK(PartialMaskProvider::mask("\xC3\xA9t\xC3\xA9", 1, 1, "*") == "\xC3\xA9*\xC3\xA9");
    }
}

// ============================================================================
// md5
// ============================================================================

TEST_CASE("md5 hashes the value", "[providers][md5]") {
    Fixture f;
    CHECK(f.alter({{"name", "md5"}}, "abc") == "900150983cd24fb0d6963f7d28e17f72");
    CHECK(f.alter({{"name", "md5"}}, nullptr).is_null());

    SECTION("Numbers hash their decimal text") {
        CHECK(f.alter({{"name", "md5"}}, 123) == f.alter({{"name", "md5"}}, "123"));
    }

    SECTION("as_number reduces the digest to a number") {
        const Value def = {{"name", "md5"}, {"as_number", true}};
        const Value result = f.alter(def, "abc");
        REQUIRE(result.is_number_unsigned());
        CHECK(result.get<uint64_t>() == 22803570);
    }

    SECTION("as_number_length selects the digit count") {
        CHECK(f.alter({{"name", "md5"}, {"as_number", true}, {"as_number_length", 4}}, "abc") == 3570);
        CHECK(f.alter({{"name", "md5"}, {"as_number", true}, {"as_number_length", 1}}, "abc") == 0);
    }

    SECTION("Results beyond 64 bits are decimal strings") {
        CHECK(f.alter({{"name", "md5"}, {"as_number", true}, {"as_number_length", 20}}, "abc")
              == "68031473277922803570");
    }
}

// ============================================================================
// choice / clear / set
// ============================================================================

TEST_CASE("choice picks one of the values", "[providers]") {
    Fixture f;
    const Value def = {{"name", "choice"}, {"values", {"a", "b", "c"}}};
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        const Value v = f.alter(def, "original");
        REQUIRE(v.is_string());
        seen.insert(v.get<std::string>());
    }
    CHECK(seen == std::set<std::string>{"a", "b", "c"});

    CHECK_THROWS_AS(f.alter({{"name", "choice"}}, "x"), InvalidProviderArgumentError);
    CHECK_THROWS_AS(f.alter({{"name", "choice"}, {"values", Value::array()}}, "x"),
                    InvalidProviderArgumentError);
}

TEST_CASE("clear and set", "[providers]") {
    Fixture f;
    CHECK(f.alter({{"name", "clear"}}, "anything").is_null());
    CHECK(f.alter({{"name", "set"}, {"value", 42}}, "anything") == 42);
    CHECK(f.alter({{"name", "set"}, {"value", "fixed"}}, nullptr) == "fixed");
    CHECK(f.alter({{"name", "set"}}, "anything").is_null());
}

// ============================================================================
// Random identifiers
// ============================================================================

TEST_CASE("Random value providers produce the expected shapes", "[providers]") {
    Fixture f;
    const char* kUuid = "[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}";

    for (int i = 0; i < 20; ++i) {
        CHECK(matches(f.alter({{"name", "uuid4"}}, "x"), kUuid));
        CHECK(matches(f.alter({{"name", "apikey"}}, "x"), kUuid));
        CHECK(matches(f.alter({{"name", "phonenumberita"}}, "x"), "\\+003[0-9]{9}"));
        CHECK(matches(f.alter({{"name", "randomidcard"}}, "x"), "[A-Z]{2}[0-9]{7}"));
    }

    CHECK(f.alter({{"name", "uuid4"}}, "x") != f.alter({{"name", "uuid4"}}, "x"));
}

TEST_CASE("jsonstring serializes the object argument", "[providers]") {
    Fixture f;
    Value def = {{"name", "jsonstring"}};
    def["object"] = {{"b", 1}, {"a", {true, nullptr}}};
    // Key order of the definition is kept
    CHECK(f.alter(def, "x") == R"({"b": 1, "a": [true, null]})");
    CHECK(f.alter({{"name", "jsonstring"}}, "x") == "null");

    SECTION("Non-ASCII text is escaped") {
        Value nested = {{"name", "jsonstring"}};
        nested["object"] = {{"citt\u00e0", "M\u00fcnchen"}, {"n", {{"x", 1.5}}}};
        CHECK(f.alter(nested, "x") == R"({"citt\u00e0": "M\u00fcnchen", "n": {"x": 1.5}})");
        nested["object"] = Value::array();
        CHECK(f.alter(nested, "x") == "[]");
    }
}

// ============================================================================
// sameyear
// ============================================================================

TEST_CASE("sameyear keeps the year of the original date", "[providers][sameyear]") {
    Fixture f;
    const Value def = {{"name", "sameyear"}};

    for (int i = 0; i < 200; ++i) {
        const Value v = f.alter(def, "2001-05-10");
        REQUIRE(v.is_string());
        const std::string s = v.get<std::string>();
        CHECK(s.substr(0, 5) == "2001-");
        // 2001 is not a leap year, the result must still be a real date
        CHECK(SameYearProvider::parse_date(s).ok());
    }

    CHECK(f.alter(def, "1999-12-31T23:59:59").get<std::string>().substr(0, 5) == "1999-");
    CHECK(f.alter(def, "2024-02-29 08:00:00").get<std::string>().substr(0, 5) == "2024-");

    SECTION("Empty values are returned as null") {
        CHECK(f.alter(def, nullptr).is_null());
        CHECK(f.alter(def, "").is_null());
    }

    SECTION("Malformed dates throw") {
        CHECK_THROWS_AS(f.alter(def, "10/05/2001"), InvalidProviderArgumentError);
        CHECK_THROWS_AS(f.alter(def, "2001-02-30"), InvalidProviderArgumentError);
        CHECK_THROWS_AS(f.alter(def, 2001), InvalidProviderArgumentError);
    }
}

// ============================================================================
// Fiscal identifiers
// ============================================================================

TEST_CASE("Fiscal identifier providers are deterministic", "[providers][identity]") {
    Fixture f;
    CHECK(f.alter({{"name", "fiscalcode"}}, "abc") == "OBCWIC96E03V057O");
    CHECK(f.alter({{"name", "fiscalcodebusiness"}}, "12345678901") == "160779391");
    CHECK(f.alter({{"name", "vatnumber"}}, "IT12345678901") == "IT160779391");
    CHECK(f.alter({{"name", "fiscalcodevat"}}, "12345678901") == "160779391");
    CHECK(f.alter({{"name", "fiscalcodevat"}}, "RSSMRA85T10A562S") == "DMITJW25E56Q730F");

    SECTION("Numeric column values use their decimal text") {
        CHECK(f.alter({{"name", "fiscalcodebusiness"}}, 12345678901LL) == "160779391");
    }

    SECTION("Null passes through") {
        CHECK(f.alter({{"name", "fiscalcode"}}, nullptr).is_null());
        CHECK(f.alter({{"name", "vatnumber"}}, nullptr).is_null());
    }
}

// ============================================================================
// fake.*
// ============================================================================

TEST_CASE("fake providers delegate to the generator", "[providers][fake]") {
    Fixture f;
    const Value name = f.alter({{"name", "fake.first_name"}}, "Alice");
    REQUIRE(name.is_string());
    CHECK_FALSE(name.get<std::string>().empty());

    const Value n = f.alter({{"name", "fake.random_int"}, {"kwargs", {{"min", 5}, {"max", 5}}}}, 1);
    CHECK(n == 5);

    CHECK(f.alter({{"name", "fake.first_name"}, {"locale", "it_IT"}}, "x").is_string());

    SECTION("Unsupported methods and locales throw") {
        CHECK_THROWS_AS(f.alter({{"name", "fake.__class__"}}, "x"), UnsupportedGeneratorMethodError);
        CHECK_THROWS_AS(f.alter({{"name", "fake.first_name"}, {"locale", "de_DE"}}, "x"),
                        UnknownLocaleError);
        CHECK_THROWS_AS(f.alter({{"name", "fake.first_name"}, {"kwargs", {{"bogus", 1}}}}, "x"),
                        InvalidProviderArgumentError);
    }
}
