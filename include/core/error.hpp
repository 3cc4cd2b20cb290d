#pragma once

#include <stdexcept>
#include <string>

namespace anonymizer {

/**
 * @brief Root of every error raised by the anonymization engine
 *
 * All errors are configuration or programming errors, never transient:
 * callers abort the field (or the run) instead of retrying.
 */
class AnonymizerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A provider could not be added to the registry
 */
class ProviderRegistrationError : public AnonymizerError {
public:
    using AnonymizerError::AnonymizerError;
};

/**
 * @brief Two providers claim the same rule identifier
 */
class DuplicateRegistrationError : public ProviderRegistrationError {
public:
    using ProviderRegistrationError::ProviderRegistrationError;
};

/**
 * @brief A rule identifier matches no registered provider
 */
class UnknownProviderError : public AnonymizerError {
public:
    using AnonymizerError::AnonymizerError;
};

/**
 * @brief Missing or malformed provider argument
 */
class InvalidProviderArgumentError : public AnonymizerError {
public:
    using AnonymizerError::AnonymizerError;
};

// Locale not declared in [options.faker] locales (or without locale data)
class UnknownLocaleError : public InvalidProviderArgumentError {
public:
    using InvalidProviderArgumentError::InvalidProviderArgumentError;
};

// fake.<method> names a method outside the generator allow-list
class UnsupportedGeneratorMethodError : public InvalidProviderArgumentError {
public:
    using InvalidProviderArgumentError::InvalidProviderArgumentError;
};

} // namespace anonymizer
