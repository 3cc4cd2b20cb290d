#include "provider/provider_registry.hpp"
#include "core/error.hpp"

#include <format>
#include <stdexcept>

namespace anonymizer {

bool ProviderRegistry::Entry::matches(std::string_view identifier) const {
    if (pattern) {
        return std::regex_search(identifier.begin(), identifier.end(), *pattern,
                                 std::regex_constants::match_continuous);
    }
    return id == identifier;
}

void ProviderRegistry::register_provider(std::shared_ptr<const IProvider> provider) {
    if (!provider) {
        throw std::invalid_argument("ProviderRegistry: null provider");
    }

    std::string id(provider->id());
    for (const auto& e : entries_) {
        if (e.id == id) {
            throw DuplicateRegistrationError(
                std::format("A provider with the id \"{}\" has already been registered", id));
        }
    }

    Entry entry;
    entry.id = id;
    if (provider->match_kind() == MatchKind::PATTERN) {
        try {
            entry.pattern.emplace(id, std::regex::ECMAScript | std::regex::optimize);
        } catch (const std::regex_error& e) {
            throw ProviderRegistrationError(
                std::format("Invalid provider pattern \"{}\": {}", id, e.what()));
        }
    }
    entry.provider = std::move(provider);
    entries_.emplace_back(std::move(entry));
}

const IProvider* ProviderRegistry::find(std::string_view identifier) const {
    for (const auto& e : entries_) {
        if (e.matches(identifier)) {
            return e.provider.get();
        }
    }
    return nullptr;
}

const IProvider& ProviderRegistry::resolve(std::string_view identifier) const {
    const IProvider* provider = find(identifier);
    if (!provider) {
        throw UnknownProviderError(
            std::format("Could not find provider with id \"{}\"", identifier));
    }
    return *provider;
}

std::vector<ProviderRegistry::ProviderInfo> ProviderRegistry::list() const {
    std::vector<ProviderInfo> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) {
        out.push_back({e.id, e.provider->match_kind(), std::string(e.provider->description())});
    }
    return out;
}

} // namespace anonymizer
