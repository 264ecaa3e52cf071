#ifndef CONCORD_ERRORS_HPP
#define CONCORD_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace Concord {

/**
 * @brief Base class for all Concord exceptions.
 */
class Exception : public std::exception {
public:
    explicit Exception(const std::string& message) : msg_(message) {}
    explicit Exception(const char* message) : msg_(message) {}
    virtual ~Exception() noexcept override = default;

    virtual const char* what() const noexcept override {
        return msg_.c_str();
    }

protected:
    std::string msg_;
};

/**
 * @brief Exception for errors that occur at runtime.
 */
class RuntimeError : public Exception {
public:
    explicit RuntimeError(const std::string& message) : Exception(message) {}
    explicit RuntimeError(const char* message) : Exception(message) {}
};

/**
 * @brief Exception for logic errors in the library's usage.
 */
class LogicError : public Exception {
public:
    explicit LogicError(const std::string& message) : Exception(message) {}
    explicit LogicError(const char* message) : Exception(message) {}
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgument : public LogicError {
public:
    explicit InvalidArgument(const std::string& message) : LogicError(message) {}
    explicit InvalidArgument(const char* message) : LogicError(message) {}
};

/**
 * @brief A session was set up with an unusable agent list, identity or config file.
 */
class ConfigurationError : public LogicError {
public:
    explicit ConfigurationError(const std::string& message) : LogicError(message) {}
    explicit ConfigurationError(const char* message) : LogicError(message) {}
};

/**
 * @brief An operation was called in a session state that does not allow it.
 */
class StateError : public LogicError {
public:
    explicit StateError(const std::string& message) : LogicError(message) {}
    explicit StateError(const char* message) : LogicError(message) {}
};

/**
 * @brief An agent or peer name is not part of the session.
 */
class LookupError : public LogicError {
public:
    explicit LookupError(const std::string& message) : LogicError(message) {}
    explicit LookupError(const char* message) : LogicError(message) {}
};

/**
 * @brief Signing, verification or key handling failed.
 */
class CryptoError : public RuntimeError {
public:
    explicit CryptoError(const std::string& message) : RuntimeError(message) {}
    explicit CryptoError(const char* message) : RuntimeError(message) {}
};

/**
 * @brief The event store or an export sink could not be written.
 */
class PersistenceError : public RuntimeError {
public:
    explicit PersistenceError(const std::string& message) : RuntimeError(message) {}
    explicit PersistenceError(const char* message) : RuntimeError(message) {}
};

/**
 * @brief The two sides of a handshake could not agree (e.g. no common protocol version).
 */
class HandshakeError : public RuntimeError {
public:
    explicit HandshakeError(const std::string& message) : RuntimeError(message) {}
    explicit HandshakeError(const char* message) : RuntimeError(message) {}
};

} // namespace Concord

#endif // CONCORD_ERRORS_HPP
