/**
 * @file poolreg_errors.hpp
 * @brief Failure taxonomy of the registries.
 *
 * Every failed operation throws one of these. Catching a category
 * (ValidationError, NotFoundError ...) is usually what a caller wants,
 * the leaf types pinpoint the precondition that was violated.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace poolreg {
namespace model {

struct RegistryError: std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct ConfigError: RegistryError
{
    using RegistryError::RegistryError;
};

/**
 * @defgroup validation Malformed or null input
 * @{
 */
struct ValidationError: RegistryError
{
    using RegistryError::RegistryError;
};
struct InvalidName:       ValidationError { using ValidationError::ValidationError; };
struct InvalidIdentifier: ValidationError { using ValidationError::ValidationError; };
struct ZeroToken:         ValidationError { using ValidationError::ValidationError; };
struct InvalidPair:       ValidationError { using ValidationError::ValidationError; };
/** @} */

/**
 * @defgroup not_found Lookups that did not match
 * @{
 */
struct NotFoundError: RegistryError
{
    using RegistryError::RegistryError;
};
struct NameNotFound:       NotFoundError { using NotFoundError::NotFoundError; };
struct VersionNotFound:    NotFoundError { using NotFoundError::NotFoundError; };
struct IdentifierNotFound: NotFoundError { using NotFoundError::NotFoundError; };
struct PoolNotFound:       NotFoundError { using NotFoundError::NotFoundError; };
struct BasePoolNotFound:   NotFoundError { using NotFoundError::NotFoundError; };
struct OutOfBounds:        NotFoundError { using NotFoundError::NotFoundError; };
/** @} */

/**
 * @defgroup conflict Uniqueness violations
 * @{
 */
struct ConflictError: RegistryError
{
    using RegistryError::RegistryError;
};
struct AlreadyRegistered:     ConflictError { using ConflictError::ConflictError; };
struct NameAlreadyRegistered: ConflictError { using ConflictError::ConflictError; };
struct DuplicateIdentifier:   ConflictError { using ConflictError::ConflictError; };
/** @} */

struct AuthorizationError: RegistryError
{
    using RegistryError::RegistryError;
};

/**
 * @defgroup external Collaborators answering something unexpected, or nothing
 * @{
 */
struct ExternalMismatchError: RegistryError
{
    using RegistryError::RegistryError;
};
struct WrapperMismatch: ExternalMismatchError { using ExternalMismatchError::ExternalMismatchError; };
struct NotSaddleOwned:  ExternalMismatchError { using ExternalMismatchError::ExternalMismatchError; };

struct ExternalUnavailableError: RegistryError
{
    using RegistryError::RegistryError;
};
struct NoParameterData: ExternalUnavailableError { using ExternalUnavailableError::ExternalUnavailableError; };
struct NoSuchContract:  ExternalUnavailableError { using ExternalUnavailableError::ExternalUnavailableError; };
/** @} */

/**
 * @brief a write was attempted from within another write in progress
 */
struct ReentrancyError: RegistryError
{
    using RegistryError::RegistryError;
};


/**
 * @brief upfront precondition check: throws @p Error with @p msg unless @p cond holds
 */
template<typename Error>
inline void require(bool cond, const std::string &msg)
{
    if (!cond) throw Error(msg);
}

} // namespace model
} // namespace poolreg
