#include <catch2/catch_test_macros.hpp>
#include "faker/fake_generator.hpp"
#include "faker/locale_data.hpp"
#include "core/error.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

using namespace anonymizer;
using namespace anonymizer::faker;

namespace {

const LocaleData& locale(std::string_view code) {
    const LocaleData* data = find_locale_data(code);
    REQUIRE(data != nullptr);
    return *data;
}

bool contains(std::span<const std::string_view> items, const std::string& value) {
    return std::find(items.begin(), items.end(), value) != items.end();
}

} // anonymous namespace

// ============================================================================
// Locale data
// ============================================================================

TEST_CASE("Locale data is available for the supported locales", "[faker]") {
    for (const auto code : {"en_US", "it_IT", "de_DE", "fr_FR"}) {
        INFO(code);
        const LocaleData* data = find_locale_data(code);
        REQUIRE(data != nullptr);
        CHECK(data->code == code);
        CHECK_FALSE(data->first_names.empty());
        CHECK_FALSE(data->last_names.empty());
        CHECK_FALSE(data->phone_formats.empty());
    }
    CHECK(find_locale_data("xx_XX") == nullptr);
    CHECK(supported_locales().size() == 4);
    CHECK(find_locale_data(kDefaultLocale) != nullptr);
}

TEST_CASE("FakeGenerator requires locale data", "[faker]") {
    CHECK_THROWS_AS(FakeGenerator({}), std::invalid_argument);
    CHECK_THROWS_AS(FakeGenerator({nullptr}), std::invalid_argument);
}

// ============================================================================
// Generated values
// ============================================================================

TEST_CASE("FakeGenerator draws names from its locale", "[faker]") {
    const FakeGenerator it({&locale("it_IT")});
    for (int i = 0; i < 50; ++i) {
        CHECK(contains(locale("it_IT").first_names, it.first_name()));
        CHECK(contains(locale("it_IT").last_names, it.last_name()));
        CHECK(contains(locale("it_IT").cities, it.city()));
    }
    CHECK(it.country() == "Italia");
}

TEST_CASE("FakeGenerator over several locales mixes them", "[faker]") {
    const FakeGenerator mixed({&locale("en_US"), &locale("de_DE")});
    REQUIRE(mixed.locale_codes().size() == 2);

    bool saw_en = false;
    bool saw_de = false;
    for (int i = 0; i < 200; ++i) {
        const std::string c = mixed.country();
        saw_en = saw_en || c == locale("en_US").country;
        saw_de = saw_de || c == locale("de_DE").country;
    }
    CHECK(saw_en);
    CHECK(saw_de);
}

TEST_CASE("FakeGenerator formatted values", "[faker]") {
    const FakeGenerator gen({&locale("en_US")});

    CHECK(std::regex_match(gen.postcode(), std::regex("[0-9]{5}")));
    CHECK(std::regex_match(gen.email(), std::regex("[a-z0-9.]+@[a-z.]+")));
    CHECK(std::regex_match(gen.safe_email(), std::regex("[a-z0-9.]+@example\\.(org|com|net)")));
    CHECK(std::regex_match(gen.ipv4(), std::regex("[0-9]{1,3}(\\.[0-9]{1,3}){3}")));
    CHECK(std::regex_match(gen.url(), std::regex("https://www\\.[a-z]+\\.[a-z]+/")));
    CHECK(gen.street_address().find('{') == std::string::npos);
    CHECK(gen.address().find('\n') != std::string::npos);

    const std::string phone = gen.phone_number();
    CHECK(phone.find('#') == std::string::npos);
}

TEST_CASE("FakeGenerator date_of_birth honours the age range", "[faker]") {
    using namespace std::chrono;
    const FakeGenerator gen({&locale("en_US")});
    const auto this_year = year_month_day{floor<days>(system_clock::now())}.year();

    for (int i = 0; i < 100; ++i) {
        const auto dob = gen.date_of_birth(18, 20);
        REQUIRE(dob.ok());
        const int age_years = static_cast<int>(this_year) - static_cast<int>(dob.year());
        CHECK(age_years >= 18);
        CHECK(age_years <= 21);
    }

    CHECK_THROWS_AS(gen.date_of_birth(-1, 10), InvalidProviderArgumentError);
    CHECK_THROWS_AS(gen.date_of_birth(30, 20), InvalidProviderArgumentError);
}

TEST_CASE("FakeGenerator rejects oversized numeric arguments", "[faker]") {
    const FakeGenerator gen({&locale("en_US")});

    SECTION("Ages beyond the supported calendar range") {
        CHECK(gen.date_of_birth(0, FakeGenerator::kMaxAge).ok());
        CHECK_THROWS_AS(gen.date_of_birth(0, FakeGenerator::kMaxAge + 1), InvalidProviderArgumentError);
        CHECK_THROWS_AS(gen.date_of_birth(0, 2147483647), InvalidProviderArgumentError);
        CHECK_THROWS_AS(gen.invoke("date_of_birth", {{"maximum_age", 40000}}), InvalidProviderArgumentError);
        CHECK_THROWS_AS(gen.invoke("date_of_birth", {{"maximum_age", 2147483647}}), InvalidProviderArgumentError);
        CHECK_THROWS_AS(gen.invoke("date_of_birth", {{"maximum_age", 9223372036854775807LL}}),
                        InvalidProviderArgumentError);
    }

    SECTION("Text lengths") {
        CHECK_THROWS_AS(gen.sentence(FakeGenerator::kMaxWords + 1), InvalidProviderArgumentError);
        CHECK_THROWS_AS(gen.invoke("sentence", {{"nb_words", 2147483647}}), InvalidProviderArgumentError);
        CHECK_THROWS_AS(gen.text(FakeGenerator::kMaxTextChars + 1), InvalidProviderArgumentError);
        CHECK_THROWS_AS(gen.invoke("text", {{"max_nb_chars", 2147483647}}), InvalidProviderArgumentError);
    }
}

TEST_CASE("FakeGenerator text helpers", "[faker]") {
    const FakeGenerator gen({&locale("en_US")});

    const std::string sentence = gen.sentence(4);
    CHECK(sentence.back() == '.');
    CHECK(std::count(sentence.begin(), sentence.end(), ' ') == 3);
    CHECK(std::isupper(static_cast<unsigned char>(sentence.front())));

    for (int max : {5, 20, 200}) {
        const std::string text = gen.text(max);
        CHECK_FALSE(text.empty());
        CHECK(text.size() <= static_cast<size_t>(max));
    }
    CHECK_THROWS_AS(gen.text(4), InvalidProviderArgumentError);
}

TEST_CASE("FakeGenerator helpers", "[faker]") {
    CHECK(std::regex_match(bothify("??-###"), std::regex("[A-Z]{2}-[0-9]{3}")));
    CHECK(ascii_slug("M\xC3\xBCller-L\xC3\xBCdenscheid") == "muellerluedenscheid");
    CHECK(ascii_slug("De Luca") == "deluca");

    using namespace std::chrono;
    CHECK(format_iso_date(year_month_day{year{987}, month{3}, day{4}}) == "0987-03-04");
}

// ============================================================================
// invoke() allow-list
// ============================================================================

TEST_CASE("FakeGenerator invoke dispatches allow-listed methods", "[faker]") {
    const FakeGenerator gen({&locale("en_US")});

    CHECK(gen.invoke("first_name", Value::object()).is_string());
    CHECK(gen.invoke("boolean", {{"chance_of_getting_true", 100}}) == true);
    CHECK(gen.invoke("boolean", {{"chance_of_getting_true", 0}}) == false);
    CHECK(gen.invoke("random_int", {{"min", 7}, {"max", 7}}) == 7);
    CHECK(gen.invoke("date", {{"pattern", "%Y"}}).get<std::string>().size() == 4);

    const auto dob = gen.invoke("date_of_birth", {{"minimum_age", 1}, {"maximum_age", 2}}).get<std::string>();
    CHECK(std::regex_match(dob, std::regex("[0-9]{4}-[0-9]{2}-[0-9]{2}")));

    SECTION("Null kwargs are treated as empty") {
        CHECK(gen.invoke("city", nullptr).is_string());
    }
}

TEST_CASE("FakeGenerator invoke rejects anything outside the allow-list", "[faker]") {
    const FakeGenerator gen({&locale("en_US")});

    CHECK_THROWS_AS(gen.invoke("__init__", Value::object()), UnsupportedGeneratorMethodError);
    CHECK_THROWS_AS(gen.invoke("seed", Value::object()), UnsupportedGeneratorMethodError);
    CHECK_THROWS_AS(gen.invoke("first_name", {{"gender", "f"}}), InvalidProviderArgumentError);
    CHECK_THROWS_AS(gen.invoke("random_int", {{"min", "one"}}), InvalidProviderArgumentError);
    CHECK_THROWS_AS(gen.invoke("random_int", {{"min", 9}, {"max", 1}}), InvalidProviderArgumentError);
    CHECK_THROWS_AS(gen.invoke("city", Value::array()), InvalidProviderArgumentError);

    CHECK(FakeGenerator::supports("first_name"));
    CHECK_FALSE(FakeGenerator::supports("__class__"));

    const auto methods = FakeGenerator::methods();
    CHECK(std::is_sorted(methods.begin(), methods.end()));
    CHECK(std::find(methods.begin(), methods.end(), "date_of_birth") != methods.end());
}
