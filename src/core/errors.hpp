#pragma once

#include <stdexcept>
#include <string>

namespace sqlgraph::core {

// A required argument (command text, parameter name, callback) was missing.
// Always raised before any I/O is attempted.
class ContractViolation : public std::invalid_argument {
public:
    explicit ContractViolation(const std::string& message)
        : std::invalid_argument(message) {}
};

// A SQL null was read into a type that cannot represent it
class NullValueError : public std::runtime_error {
public:
    explicit NullValueError(const std::string& message)
        : std::runtime_error(message) {}
};

class TypeConversionError : public std::runtime_error {
public:
    explicit TypeConversionError(const std::string& message)
        : std::runtime_error(message) {}
};

// Raised after a cancellation request was observed and the remote
// operation has been cancelled
class OperationCancelled : public std::runtime_error {
public:
    explicit OperationCancelled(const std::string& message = "Operation cancelled")
        : std::runtime_error(message) {}
};

// An object was used outside its lifecycle (value read before execution,
// executor reused, more than one row where one was expected)
class InvalidStateError : public std::logic_error {
public:
    explicit InvalidStateError(const std::string& message)
        : std::logic_error(message) {}
};

// Throws ContractViolation when a required name is empty
inline void require_name(const std::string& value, const char* what) {
    if (value.empty()) {
        throw ContractViolation(std::string(what) + " must not be empty");
    }
}

} // namespace sqlgraph::core
