#include "faker/fake_generator.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "provider/provider_args.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <format>
#include <limits>
#include <map>
#include <stdexcept>
#include <utility>

namespace anonymizer::faker {

using namespace std::chrono;

namespace {

template<typename T>
const T& pick(std::span<const T> items) {
    return items[utils::random_int<size_t>(0, items.size() - 1)];
}

// Replace "{key}" placeholders; unknown placeholders are kept verbatim
std::string fill(std::string_view format,
                 std::initializer_list<std::pair<std::string_view, std::string>> values) {
    std::string out;
    out.reserve(format.size() + 32);
    size_t i = 0;
    while (i < format.size()) {
        if (format[i] == '{') {
            const size_t close = format.find('}', i + 1);
            if (close != std::string_view::npos) {
                const auto key = format.substr(i + 1, close - i - 1);
                const auto it = std::find_if(values.begin(), values.end(),
                    [&](const auto& kv) { return kv.first == key; });
                if (it != values.end()) {
                    out += it->second;
                    i = close + 1;
                    continue;
                }
            }
        }
        out += format[i++];
    }
    return out;
}

year_month_day today() {
    return year_month_day{floor<days>(system_clock::now())};
}

// Same calendar day `count` years earlier; Feb 29 becomes Feb 28
year_month_day years_before(const year_month_day& d, int count) {
    year_month_day shifted{d.year() - years{count}, d.month(), d.day()};
    if (!shifted.ok()) {
        shifted = year_month_day{shifted.year(), shifted.month(), day{28}};
    }
    return shifted;
}

year_month_day random_day_between(sys_days lo, sys_days hi) {
    const auto span = (hi - lo).count();
    return year_month_day{lo + days{utils::random_int<int64_t>(0, span)}};
}

std::string capitalize(std::string s) {
    if (!s.empty()) {
        s[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
    }
    return s;
}

// ============================================================================
// Method allow-list
// ============================================================================

struct MethodSpec {
    Value (*call)(const FakeGenerator&, const ProviderArgs&);
    std::vector<std::string_view> params;
};

int int_kwarg(const ProviderArgs& kw, std::string_view key, int fallback) {
    const int64_t v = kw.int_or(key, fallback);
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        throw InvalidProviderArgumentError(std::format("Argument '{}' is out of range", key));
    }
    return static_cast<int>(v);
}

const std::map<std::string_view, MethodSpec>& method_table() {
    static const std::map<std::string_view, MethodSpec> kTable = {
        {"first_name",     {[](const FakeGenerator& g, const ProviderArgs&) { return Value(g.first_name()); }, {}}},
        {"last_name",      {[](const FakeGenerator& g, const ProviderArgs&) { return Value(g.last_name()); }, {}}},
        {"name",           {[](const FakeGenerator& g, const ProviderArgs&) { return Value(g.name()); }, {}}},
        {"user_name",      {[](const FakeGenerator& g, const ProviderArgs&) { return Value(g.user_name()); }, {}}},
        {"email",          {[](const FakeGenerator& g, const ProviderArgs&) { return Value(g.email()); }, {}}},
        {"safe_email",     {[](const FakeGenerator& g, const ProviderArgs&) { return Value(g.safe_email()); }, {}}},
        {"phone_number",   {[](const FakeGenerator& g, const ProviderArgs&) { return Value(g.phone_number()); }, {}}},
        {"job",            {[](const FakeGenerator& g, const ProviderArgs&) { return Value(g.job()); }, {}}},
        {"street_address", {[](const FakeGenerator& g, const ProviderArgs&) { return Value(g.street_address()); }, {}}},
        {"city",           {[](const FakeGenerator& g, const ProviderArgs&) { return Value(g.city()); }, {}}},
        {"postcode",       {[](const FakeGenerator& g, const ProviderArgs&) { return Value(g.postcode()); }, {}}},
        {"country",        {[](const FakeGenerator& g, const ProviderArgs&) { return Value(g.country()); }, {}}},
        {"address",        {[](const FakeGenerator& g, const ProviderArgs&) { return Value(g.address()); }, {}}},
        {"company",        {[](const FakeGenerator& g, const ProviderArgs&) { return Value(g.company()); }, {}}},
        {"url",            {[](const FakeGenerator& g, const ProviderArgs&) { return Value(g.url()); }, {}}},
        {"ipv4",           {[](const FakeGenerator& g, const ProviderArgs&) { return Value(g.ipv4()); }, {}}},
        {"uuid4",          {[](const FakeGenerator& g, const ProviderArgs&) { return Value(g.uuid4()); }, {}}},
        {"word",           {[](const FakeGenerator& g, const ProviderArgs&) { return Value(g.word()); }, {}}},
        {"date_of_birth",  {[](const FakeGenerator& g, const ProviderArgs& kw) {
                                return Value(format_iso_date(g.date_of_birth(
                                    int_kwarg(kw, "minimum_age", 0),
                                    int_kwarg(kw, "maximum_age", 115))));
                            }, {"minimum_age", "maximum_age"}}},
        {"date",           {[](const FakeGenerator& g, const ProviderArgs& kw) {
                                return Value(g.date(kw.string_or("pattern", "%Y-%m-%d")));
                            }, {"pattern"}}},
        {"random_int",     {[](const FakeGenerator& g, const ProviderArgs& kw) {
                                return Value(g.random_int(kw.int_or("min", 0), kw.int_or("max", 9999)));
                            }, {"min", "max"}}},
        {"boolean",        {[](const FakeGenerator& g, const ProviderArgs& kw) {
                                return Value(g.boolean(int_kwarg(kw, "chance_of_getting_true", 50)));
                            }, {"chance_of_getting_true"}}},
        {"sentence",       {[](const FakeGenerator& g, const ProviderArgs& kw) {
                                return Value(g.sentence(int_kwarg(kw, "nb_words", 6)));
                            }, {"nb_words"}}},
        {"text",           {[](const FakeGenerator& g, const ProviderArgs& kw) {
                                return Value(g.text(int_kwarg(kw, "max_nb_chars", 200)));
                            }, {"max_nb_chars"}}},
    };
    return kTable;
}

} // anonymous namespace

// ============================================================================
// Free helpers
// ============================================================================

std::string bothify(std::string_view format) {
    std::string out;
    out.reserve(format.size());
    for (const char c : format) {
        if (c == '#') {
            out += static_cast<char>('0' + utils::random_int(0, 9));
        } else if (c == '?') {
            out += static_cast<char>('A' + utils::random_int(0, 25));
        } else {
            out += c;
        }
    }
    return out;
}

std::string ascii_slug(std::string_view text) {
    static const std::pair<std::string_view, std::string_view> kFold[] = {
        {"ä", "ae"}, {"ö", "oe"}, {"ü", "ue"}, {"Ä", "ae"}, {"Ö", "oe"}, {"Ü", "ue"},
        {"ß", "ss"}, {"à", "a"}, {"â", "a"}, {"ç", "c"}, {"é", "e"}, {"è", "e"},
        {"ê", "e"}, {"ë", "e"}, {"î", "i"}, {"ï", "i"}, {"ô", "o"}, {"ù", "u"},
        {"û", "u"}, {"ì", "i"}, {"ò", "o"}, {"É", "e"},
    };

    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (c < 0x80) {
            if (std::isalnum(c)) out += static_cast<char>(std::tolower(c));
            ++i;
            continue;
        }
        bool folded = false;
        for (const auto& [from, to] : kFold) {
            if (text.substr(i, from.size()) == from) {
                out += to;
                i += from.size();
                folded = true;
                break;
            }
        }
        if (!folded) {
            ++i;
            while (i < text.size() && utils::is_utf8_continuation(text[i])) ++i;
        }
    }
    return out;
}

std::string format_iso_date(const year_month_day& date) {
    return std::format("{:04d}-{:02d}-{:02d}",
        static_cast<int>(date.year()),
        static_cast<unsigned>(date.month()),
        static_cast<unsigned>(date.day()));
}

// ============================================================================
// FakeGenerator
// ============================================================================

FakeGenerator::FakeGenerator(std::vector<const LocaleData*> locales)
    : locales_(std::move(locales)) {
    if (locales_.empty()) {
        throw std::invalid_argument("FakeGenerator requires at least one locale");
    }
    if (std::find(locales_.begin(), locales_.end(), nullptr) != locales_.end()) {
        throw std::invalid_argument("FakeGenerator: null locale data");
    }
}

Value FakeGenerator::invoke(std::string_view method, const Value& kwargs) const {
    const auto& table = method_table();
    const auto it = table.find(method);
    if (it == table.end()) {
        throw UnsupportedGeneratorMethodError(
            std::format("Generator method '{}' is not supported", method));
    }

    const ProviderArgs args(kwargs);
    for (const auto& [key, _] : args.raw().items()) {
        const auto& params = it->second.params;
        if (std::find(params.begin(), params.end(), key) == params.end()) {
            throw InvalidProviderArgumentError(
                std::format("{}() got an unexpected keyword argument '{}'", method, key));
        }
    }
    return it->second.call(*this, args);
}

bool FakeGenerator::supports(std::string_view method) {
    return method_table().count(method) > 0;
}

std::vector<std::string_view> FakeGenerator::methods() {
    std::vector<std::string_view> names;
    for (const auto& [name, _] : method_table()) {
        names.push_back(name);
    }
    return names;
}

std::vector<std::string_view> FakeGenerator::locale_codes() const {
    std::vector<std::string_view> codes;
    codes.reserve(locales_.size());
    for (const auto* l : locales_) {
        codes.push_back(l->code);
    }
    return codes;
}

const LocaleData& FakeGenerator::pick_locale() const {
    if (locales_.size() == 1) return *locales_.front();
    return *locales_[utils::random_int<size_t>(0, locales_.size() - 1)];
}

std::string FakeGenerator::first_name() const {
    return std::string(pick(pick_locale().first_names));
}

std::string FakeGenerator::last_name() const {
    return std::string(pick(pick_locale().last_names));
}

std::string FakeGenerator::name() const {
    const auto& l = pick_locale();
    return std::format("{} {}", pick(l.first_names), pick(l.last_names));
}

std::string FakeGenerator::user_name() const {
    const auto& l = pick_locale();
    switch (utils::random_int(0, 2)) {
        case 0:
            return std::format("{}.{}", ascii_slug(pick(l.first_names)), ascii_slug(pick(l.last_names)));
        case 1:
            return std::format("{}{}", ascii_slug(pick(l.last_names)), utils::random_digits(2));
        default:
            return std::format("{}{}", ascii_slug(pick(l.first_names).substr(0, 1)),
                               ascii_slug(pick(l.last_names)));
    }
}

std::string FakeGenerator::email() const {
    return std::format("{}@{}", user_name(), pick(pick_locale().free_email_domains));
}

std::string FakeGenerator::safe_email() const {
    static constexpr std::string_view kSafeDomains[] = {"example.org", "example.com", "example.net"};
    return std::format("{}@{}", user_name(), pick(std::span<const std::string_view>(kSafeDomains)));
}

std::string FakeGenerator::phone_number() const {
    return bothify(pick(pick_locale().phone_formats));
}

std::string FakeGenerator::job() const {
    return std::string(pick(pick_locale().jobs));
}

std::string FakeGenerator::street_address() const {
    const auto& l = pick_locale();
    std::string number = bothify(l.building_number_format);
    if (number.front() == '0') number.front() = '1';
    return fill(l.street_format, {{"street", std::string(pick(l.street_names))},
                                  {"number", std::move(number)}});
}

std::string FakeGenerator::city() const {
    return std::string(pick(pick_locale().cities));
}

std::string FakeGenerator::postcode() const {
    return bothify(pick_locale().postcode_format);
}

std::string FakeGenerator::country() const {
    return std::string(pick_locale().country);
}

std::string FakeGenerator::address() const {
    const auto& l = pick_locale();
    return fill(l.address_format, {{"street_address", street_address()},
                                   {"postcode", bothify(l.postcode_format)},
                                   {"city", std::string(pick(l.cities))}});
}

std::string FakeGenerator::company() const {
    const auto& l = pick_locale();
    if (utils::random_int(0, 1) == 0) {
        return std::format("{} {}", pick(l.last_names), pick(l.company_suffixes));
    }
    return std::format("{}-{}", pick(l.last_names), pick(l.last_names));
}

std::string FakeGenerator::url() const {
    const auto& l = pick_locale();
    return std::format("https://www.{}.{}/", ascii_slug(pick(l.last_names)), pick(l.tlds));
}

std::string FakeGenerator::ipv4() const {
    return std::format("{}.{}.{}.{}",
        utils::random_int(1, 223), utils::random_int(0, 255),
        utils::random_int(0, 255), utils::random_int(1, 254));
}

std::string FakeGenerator::uuid4() const {
    return utils::generate_uuid_v4();
}

year_month_day FakeGenerator::date_of_birth(int minimum_age, int maximum_age) const {
    if (minimum_age < 0) {
        throw InvalidProviderArgumentError("minimum_age must be greater than or equal to zero");
    }
    if (maximum_age < minimum_age) {
        throw InvalidProviderArgumentError("maximum_age must be greater than or equal to minimum_age");
    }
    if (maximum_age > kMaxAge) {
        throw InvalidProviderArgumentError(
            std::format("maximum_age must not exceed {}", kMaxAge));
    }

    const auto now = today();
    // Oldest possible birth date is one day after the (maximum_age + 1)th birthday
    const sys_days lo = sys_days{years_before(now, maximum_age + 1)} + days{1};
    const sys_days hi = sys_days{years_before(now, minimum_age)};
    return random_day_between(lo, hi);
}

std::string FakeGenerator::date(const std::string& pattern) const {
    const year_month_day d = random_day_between(sys_days{year{1970} / January / 1}, sys_days{today()});

    std::tm tm_buf{};
    tm_buf.tm_year = static_cast<int>(d.year()) - 1900;
    tm_buf.tm_mon = static_cast<int>(static_cast<unsigned>(d.month())) - 1;
    tm_buf.tm_mday = static_cast<int>(static_cast<unsigned>(d.day()));
    tm_buf.tm_wday = static_cast<int>(weekday{sys_days{d}}.c_encoding());

    char buf[128];
    const size_t n = std::strftime(buf, sizeof(buf), pattern.c_str(), &tm_buf);
    return std::string(buf, n);
}

int64_t FakeGenerator::random_int(int64_t min, int64_t max) const {
    if (min > max) {
        throw InvalidProviderArgumentError(
            std::format("random_int: min ({}) must not exceed max ({})", min, max));
    }
    return utils::random_int(min, max);
}

bool FakeGenerator::boolean(int chance_of_getting_true) const {
    return utils::random_int(1, 100) <= chance_of_getting_true;
}

std::string FakeGenerator::word() const {
    return std::string(pick(lorem_words()));
}

std::string FakeGenerator::sentence(int nb_words) const {
    if (nb_words > kMaxWords) {
        throw InvalidProviderArgumentError(
            std::format("nb_words must not exceed {}", kMaxWords));
    }
    if (nb_words <= 0) return "";
    std::string out;
    for (int i = 0; i < nb_words; ++i) {
        if (i > 0) out += ' ';
        out += word();
    }
    out += '.';
    return capitalize(std::move(out));
}

std::string FakeGenerator::text(int max_nb_chars) const {
    if (max_nb_chars < 5) {
        throw InvalidProviderArgumentError("text() can only generate text of at least 5 characters");
    }
    if (max_nb_chars > kMaxTextChars) {
        throw InvalidProviderArgumentError(
            std::format("max_nb_chars must not exceed {}", kMaxTextChars));
    }

    std::string out;
    while (true) {
        std::string next = sentence(utils::random_int(3, 8));
        const size_t needed = out.empty() ? next.size() : out.size() + 1 + next.size();
        if (needed > static_cast<size_t>(max_nb_chars)) break;
        if (!out.empty()) out += ' ';
        out += next;
    }
    if (out.empty()) {
        // Not even one sentence fits: a single truncated word list
        std::string words;
        while (true) {
            const std::string w = word();
            const size_t needed = words.empty() ? w.size() + 1 : words.size() + 1 + w.size() + 1;
            if (needed > static_cast<size_t>(max_nb_chars)) break;
            if (!words.empty()) words += ' ';
            words += w;
        }
        if (words.empty()) {
            words = word().substr(0, static_cast<size_t>(max_nb_chars) - 1);
        }
        out = capitalize(std::move(words)) + ".";
    }
    return out;
}

} // namespace anonymizer::faker
