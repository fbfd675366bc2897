#ifndef WORDBASE_ERRORS_HPP
#define WORDBASE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace wordbase {

enum class ErrorKind {
    Connectivity,     // pool exhausted, store unreachable, connection lost
    Conflict,         // unique constraint violated
    PaymentRequired,  // write blocked by an inactive subscription
    Validation,       // malformed envelope, payload or argument
    Storage,          // any other store failure
    Configuration     // fatal startup misconfiguration
};

const char* errorKindToString(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class ConnectivityError : public Error {
public:
    explicit ConnectivityError(const std::string& message)
        : Error(ErrorKind::Connectivity, message) {}
};

class ConflictError : public Error {
public:
    explicit ConflictError(const std::string& message)
        : Error(ErrorKind::Conflict, message) {}
};

class PaymentRequiredError : public Error {
public:
    explicit PaymentRequiredError(const std::string& message)
        : Error(ErrorKind::PaymentRequired, message) {}
};

class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message)
        : Error(ErrorKind::Validation, message) {}
};

class StorageError : public Error {
public:
    explicit StorageError(const std::string& message)
        : Error(ErrorKind::Storage, message) {}
};

class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& message)
        : Error(ErrorKind::Configuration, message) {}
};

} // namespace wordbase

#endif // WORDBASE_ERRORS_HPP
