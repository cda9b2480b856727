/**
 * @file Errors.hpp
 * @brief Error taxonomy shared by every layer, plus the Result type used at the
 * resolver boundary.
 *
 * Messages carried by these types are expected to be sanitized already: no
 * component may place a raw absolute path into an error it hands upward.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace shotgate::domain {

/**
 * @enum ErrorKind
 * @brief Categorization of failures crossing the core boundary.
 */
enum class ErrorKind {
    None,
    NotFound,            ///< Path does not exist. Recoverable.
    SecurityViolation,   ///< Symlink, ownership mismatch, path swapped mid-operation. Always fatal.
    ValidationFailure,   ///< Oversize, forged format, bomb, trailing payload. Skippable in batches.
    PersistenceFailure,  ///< Temp file, copy or rename failure.
    InvalidInput         ///< Bad option value or unknown setting name.
};

inline const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::NotFound: return "not found";
        case ErrorKind::SecurityViolation: return "security violation";
        case ErrorKind::ValidationFailure: return "validation failure";
        case ErrorKind::PersistenceFailure: return "persistence failure";
        case ErrorKind::InvalidInput: return "invalid input";
    }
    return "unknown";
}

/**
 * @class ShotgateError
 * @brief Base exception; carries the ErrorKind so callers can decide fatality.
 */
class ShotgateError : public std::runtime_error {
public:
    ShotgateError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

class NotFoundError : public ShotgateError {
public:
    explicit NotFoundError(const std::string& message)
        : ShotgateError(ErrorKind::NotFound, message) {}
};

class SecurityError : public ShotgateError {
public:
    explicit SecurityError(const std::string& message)
        : ShotgateError(ErrorKind::SecurityViolation, message) {}
};

class ValidationError : public ShotgateError {
public:
    explicit ValidationError(const std::string& message)
        : ShotgateError(ErrorKind::ValidationFailure, message) {}
};

class PersistenceError : public ShotgateError {
public:
    explicit PersistenceError(const std::string& message)
        : ShotgateError(ErrorKind::PersistenceFailure, message) {}
};

class InvalidInputError : public ShotgateError {
public:
    explicit InvalidInputError(const std::string& message)
        : ShotgateError(ErrorKind::InvalidInput, message) {}
};

/**
 * @brief Throws the exception subclass matching @p kind.
 */
[[noreturn]] inline void ThrowError(ErrorKind kind, const std::string& message) {
    switch (kind) {
        case ErrorKind::NotFound: throw NotFoundError(message);
        case ErrorKind::SecurityViolation: throw SecurityError(message);
        case ErrorKind::ValidationFailure: throw ValidationError(message);
        case ErrorKind::PersistenceFailure: throw PersistenceError(message);
        case ErrorKind::InvalidInput: throw InvalidInputError(message);
        case ErrorKind::None: break;
    }
    throw ShotgateError(kind, message);
}

/**
 * @class Result
 * @brief Either a value or an ErrorKind with a sanitized message.
 *
 * Expected failures travel as values; value() converts them into the matching
 * exception for callers that treat every failure as fatal.
 */
template <typename T>
class Result {
public:
    Result(T value) : m_value(std::move(value)) {}
    Result(ErrorKind kind, std::string message)
        : m_value(kind), m_message(std::move(message)) {}

    bool isSuccess() const { return std::holds_alternative<T>(m_value); }
    bool isError() const { return !isSuccess(); }

    const T& value() const {
        if (isError()) {
            ThrowError(error(), m_message);
        }
        return std::get<T>(m_value);
    }

    ErrorKind error() const {
        if (isSuccess()) {
            return ErrorKind::None;
        }
        return std::get<ErrorKind>(m_value);
    }

    const std::string& message() const { return m_message; }

    explicit operator bool() const { return isSuccess(); }
    const T* operator->() const { return &value(); }

private:
    std::variant<T, ErrorKind> m_value;
    std::string m_message;
};

} // namespace shotgate::domain
