#include "faker/locale_data.hpp"

#include <array>

namespace anonymizer::faker {

using namespace std::string_view_literals;

namespace {

// ============================================================================
// en_US
// ============================================================================

constexpr std::array kEnFirstNames = {
    "James"sv, "Mary"sv, "Robert"sv, "Patricia"sv, "John"sv, "Jennifer"sv, "Michael"sv,
    "Linda"sv, "David"sv, "Elizabeth"sv, "William"sv, "Barbara"sv, "Richard"sv, "Susan"sv,
    "Joseph"sv, "Jessica"sv, "Thomas"sv, "Sarah"sv, "Charles"sv, "Karen"sv,
};
constexpr std::array kEnLastNames = {
    "Smith"sv, "Johnson"sv, "Williams"sv, "Brown"sv, "Jones"sv, "Garcia"sv, "Miller"sv,
    "Davis"sv, "Rodriguez"sv, "Martinez"sv, "Hernandez"sv, "Lopez"sv, "Gonzalez"sv,
    "Wilson"sv, "Anderson"sv, "Thomas"sv, "Taylor"sv, "Moore"sv, "Jackson"sv, "Martin"sv,
};
constexpr std::array kEnStreets = {
    "Main Street"sv, "Oak Avenue"sv, "Maple Drive"sv, "Cedar Lane"sv, "Park Road"sv,
    "Washington Boulevard"sv, "Lake Street"sv, "Hill Court"sv, "Pine Way"sv, "Elm Street"sv,
};
constexpr std::array kEnCities = {
    "Springfield"sv, "Riverside"sv, "Franklin"sv, "Greenville"sv, "Bristol"sv,
    "Clinton"sv, "Fairview"sv, "Salem"sv, "Madison"sv, "Georgetown"sv,
};
constexpr std::array kEnPhones = {
    "###-###-####"sv, "(###)###-####"sv, "+1-###-###-####"sv, "###.###.####"sv,
};
constexpr std::array kEnCompanySuffixes = {"Inc"sv, "LLC"sv, "Ltd"sv, "Group"sv, "PLC"sv};
constexpr std::array kEnJobs = {
    "Accountant"sv, "Architect"sv, "Civil engineer"sv, "Data scientist"sv, "Dentist"sv,
    "Editor"sv, "Electrician"sv, "Librarian"sv, "Nurse"sv, "Pharmacist"sv,
    "Software engineer"sv, "Teacher"sv,
};
constexpr std::array kEnEmailDomains = {"gmail.com"sv, "yahoo.com"sv, "hotmail.com"sv};
constexpr std::array kEnTlds = {"com"sv, "net"sv, "org"sv, "info"sv};

// ============================================================================
// it_IT
// ============================================================================

constexpr std::array kItFirstNames = {
    "Giuseppe"sv, "Maria"sv, "Giovanni"sv, "Anna"sv, "Antonio"sv, "Giulia"sv, "Mario"sv,
    "Francesca"sv, "Luigi"sv, "Chiara"sv, "Francesco"sv, "Sara"sv, "Alessandro"sv,
    "Martina"sv, "Lorenzo"sv, "Elena"sv, "Matteo"sv, "Valentina"sv, "Andrea"sv, "Paola"sv,
};
constexpr std::array kItLastNames = {
    "Rossi"sv, "Russo"sv, "Ferrari"sv, "Esposito"sv, "Bianchi"sv, "Romano"sv, "Colombo"sv,
    "Ricci"sv, "Marino"sv, "Greco"sv, "Bruno"sv, "Gallo"sv, "Conti"sv, "De Luca"sv,
    "Mancini"sv, "Costa"sv, "Giordano"sv, "Rizzo"sv, "Lombardi"sv, "Moretti"sv,
};
constexpr std::array kItStreets = {
    "Via Roma"sv, "Via Garibaldi"sv, "Corso Italia"sv, "Via Mazzini"sv, "Piazza Dante"sv,
    "Via Verdi"sv, "Viale dei Mille"sv, "Via Cavour"sv, "Via Manzoni"sv, "Borgo San Frediano"sv,
};
constexpr std::array kItCities = {
    "Roma"sv, "Milano"sv, "Napoli"sv, "Torino"sv, "Palermo"sv, "Genova"sv, "Bologna"sv,
    "Firenze"sv, "Bari"sv, "Verona"sv,
};
constexpr std::array kItPhones = {
    "+39 ### ## ## ####"sv, "+39 ## #######"sv, "3## ### ####"sv, "0#########"sv,
};
constexpr std::array kItCompanySuffixes = {"SPA"sv, "s.r.l."sv, "s.n.c."sv, "e figli"sv};
constexpr std::array kItJobs = {
    "Avvocato"sv, "Architetto"sv, "Commercialista"sv, "Farmacista"sv, "Ingegnere"sv,
    "Insegnante"sv, "Infermiere"sv, "Medico"sv, "Notaio"sv, "Programmatore"sv,
};
constexpr std::array kItEmailDomains = {"libero.it"sv, "virgilio.it"sv, "tim.it"sv, "gmail.com"sv};
constexpr std::array kItTlds = {"it"sv, "com"sv, "net"sv, "org"sv};

// ============================================================================
// de_DE
// ============================================================================

constexpr std::array kDeFirstNames = {
    "Hans"sv, "Ursula"sv, "Peter"sv, "Monika"sv, "Klaus"sv, "Petra"sv, "Wolfgang"sv,
    "Sabine"sv, "Jürgen"sv, "Renate"sv, "Stefan"sv, "Andrea"sv, "Michael"sv, "Claudia"sv,
    "Thomas"sv, "Birgit"sv, "Uwe"sv, "Karin"sv, "Dieter"sv, "Gabriele"sv,
};
constexpr std::array kDeLastNames = {
    "Müller"sv, "Schmidt"sv, "Schneider"sv, "Fischer"sv, "Weber"sv, "Meyer"sv, "Wagner"sv,
    "Becker"sv, "Schulz"sv, "Hoffmann"sv, "Schäfer"sv, "Koch"sv, "Bauer"sv, "Richter"sv,
    "Klein"sv, "Wolf"sv, "Schröder"sv, "Neumann"sv, "Schwarz"sv, "Zimmermann"sv,
};
constexpr std::array kDeStreets = {
    "Hauptstraße"sv, "Schulstraße"sv, "Gartenstraße"sv, "Bahnhofstraße"sv, "Dorfstraße"sv,
    "Bergstraße"sv, "Lindenstraße"sv, "Kirchweg"sv, "Am Markt"sv, "Waldweg"sv,
};
constexpr std::array kDeCities = {
    "Berlin"sv, "Hamburg"sv, "München"sv, "Köln"sv, "Frankfurt am Main"sv, "Stuttgart"sv,
    "Düsseldorf"sv, "Leipzig"sv, "Dortmund"sv, "Bremen"sv,
};
constexpr std::array kDePhones = {
    "+49(0)##########"sv, "0#### ######"sv, "0### ########"sv, "(0###) ######"sv,
};
constexpr std::array kDeCompanySuffixes = {"GmbH"sv, "AG"sv, "GmbH & Co. KG"sv, "KG"sv, "e.G."sv};
constexpr std::array kDeJobs = {
    "Apotheker"sv, "Architekt"sv, "Bäcker"sv, "Elektriker"sv, "Ingenieur"sv, "Journalist"sv,
    "Krankenpfleger"sv, "Lehrer"sv, "Rechtsanwalt"sv, "Softwareentwickler"sv,
};
constexpr std::array kDeEmailDomains = {"web.de"sv, "gmx.de"sv, "t-online.de"sv, "gmail.com"sv};
constexpr std::array kDeTlds = {"de"sv, "com"sv, "net"sv, "org"sv};

// ============================================================================
// fr_FR
// ============================================================================

constexpr std::array kFrFirstNames = {
    "Jean"sv, "Marie"sv, "Pierre"sv, "Nathalie"sv, "Michel"sv, "Isabelle"sv, "Philippe"sv,
    "Sylvie"sv, "Alain"sv, "Catherine"sv, "Nicolas"sv, "Françoise"sv, "Julien"sv,
    "Camille"sv, "Louis"sv, "Chloé"sv, "Hugo"sv, "Léa"sv, "Antoine"sv, "Manon"sv,
};
constexpr std::array kFrLastNames = {
    "Martin"sv, "Bernard"sv, "Dubois"sv, "Thomas"sv, "Robert"sv, "Richard"sv, "Petit"sv,
    "Durand"sv, "Leroy"sv, "Moreau"sv, "Simon"sv, "Laurent"sv, "Lefebvre"sv, "Michel"sv,
    "Garcia"sv, "David"sv, "Bertrand"sv, "Roux"sv, "Vincent"sv, "Fournier"sv,
};
constexpr std::array kFrStreets = {
    "rue de la Paix"sv, "avenue Victor Hugo"sv, "boulevard Saint-Michel"sv, "rue Pasteur"sv,
    "place de la République"sv, "rue du Moulin"sv, "chemin des Vignes"sv, "rue Nationale"sv,
    "allée des Tilleuls"sv, "quai Voltaire"sv,
};
constexpr std::array kFrCities = {
    "Paris"sv, "Marseille"sv, "Lyon"sv, "Toulouse"sv, "Nice"sv, "Nantes"sv, "Strasbourg"sv,
    "Montpellier"sv, "Bordeaux"sv, "Lille"sv,
};
constexpr std::array kFrPhones = {
    "+33 # ## ## ## ##"sv, "0# ## ## ## ##"sv, "+33 (0)# ## ## ## ##"sv,
};
constexpr std::array kFrCompanySuffixes = {"SA"sv, "SARL"sv, "SAS"sv, "S.A.R.L."sv};
constexpr std::array kFrJobs = {
    "Avocat"sv, "Architecte"sv, "Boulanger"sv, "Comptable"sv, "Infirmier"sv, "Ingénieur"sv,
    "Journaliste"sv, "Médecin"sv, "Pharmacien"sv, "Professeur"sv,
};
constexpr std::array kFrEmailDomains = {"orange.fr"sv, "free.fr"sv, "laposte.net"sv, "gmail.com"sv};
constexpr std::array kFrTlds = {"fr"sv, "com"sv, "net"sv, "org"sv};

// ============================================================================
// Shared
// ============================================================================

constexpr std::array kLoremWords = {
    "lorem"sv, "ipsum"sv, "dolor"sv, "sit"sv, "amet"sv, "consectetur"sv, "adipiscing"sv,
    "elit"sv, "sed"sv, "do"sv, "eiusmod"sv, "tempor"sv, "incididunt"sv, "ut"sv, "labore"sv,
    "et"sv, "dolore"sv, "magna"sv, "aliqua"sv, "enim"sv, "ad"sv, "minim"sv, "veniam"sv,
    "quis"sv, "nostrud"sv, "exercitation"sv, "ullamco"sv, "laboris"sv, "nisi"sv,
    "aliquip"sv, "ex"sv, "ea"sv, "commodo"sv, "consequat"sv,
};

const LocaleData kLocales[] = {
    {
        .code = "en_US",
        .first_names = kEnFirstNames,
        .last_names = kEnLastNames,
        .street_names = kEnStreets,
        .street_format = "{number} {street}",
        .building_number_format = "####",
        .cities = kEnCities,
        .postcode_format = "#####",
        .address_format = "{street_address}\n{city}, {postcode}",
        .phone_formats = kEnPhones,
        .country = "United States of America",
        .company_suffixes = kEnCompanySuffixes,
        .jobs = kEnJobs,
        .free_email_domains = kEnEmailDomains,
        .tlds = kEnTlds,
    },
    {
        .code = "it_IT",
        .first_names = kItFirstNames,
        .last_names = kItLastNames,
        .street_names = kItStreets,
        .street_format = "{street} {number}",
        .building_number_format = "###",
        .cities = kItCities,
        .postcode_format = "#####",
        .address_format = "{street_address}\n{postcode} {city}",
        .phone_formats = kItPhones,
        .country = "Italia",
        .company_suffixes = kItCompanySuffixes,
        .jobs = kItJobs,
        .free_email_domains = kItEmailDomains,
        .tlds = kItTlds,
    },
    {
        .code = "de_DE",
        .first_names = kDeFirstNames,
        .last_names = kDeLastNames,
        .street_names = kDeStreets,
        .street_format = "{street} {number}",
        .building_number_format = "##",
        .cities = kDeCities,
        .postcode_format = "#####",
        .address_format = "{street_address}\n{postcode} {city}",
        .phone_formats = kDePhones,
        .country = "Deutschland",
        .company_suffixes = kDeCompanySuffixes,
        .jobs = kDeJobs,
        .free_email_domains = kDeEmailDomains,
        .tlds = kDeTlds,
    },
    {
        .code = "fr_FR",
        .first_names = kFrFirstNames,
        .last_names = kFrLastNames,
        .street_names = kFrStreets,
        .street_format = "{number} {street}",
        .building_number_format = "##",
        .cities = kFrCities,
        .postcode_format = "#####",
        .address_format = "{street_address}\n{postcode} {city}",
        .phone_formats = kFrPhones,
        .country = "France",
        .company_suffixes = kFrCompanySuffixes,
        .jobs = kFrJobs,
        .free_email_domains = kFrEmailDomains,
        .tlds = kFrTlds,
    },
};

} // anonymous namespace

const LocaleData* find_locale_data(std::string_view code) {
    for (const auto& locale : kLocales) {
        if (locale.code == code) {
            return &locale;
        }
    }
    return nullptr;
}

std::vector<std::string_view> supported_locales() {
    std::vector<std::string_view> codes;
    for (const auto& locale : kLocales) {
        codes.push_back(locale.code);
    }
    return codes;
}

std::span<const std::string_view> lorem_words() {
    return kLoremWords;
}

} // namespace anonymizer::faker
