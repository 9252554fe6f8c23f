#ifndef STEPGRAPH_ERRORS_HPP
#define STEPGRAPH_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace stepgraph {

// A caller broke a documented contract (duplicate append, removal of absent keys, ...)
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& what) : std::logic_error(what) {}
};

// Operation that is deliberately not provided, e.g. hashing a mutable GroupedDeps
class UnsupportedOperation : public std::logic_error {
public:
    explicit UnsupportedOperation(const std::string& what) : std::logic_error(what) {}
};

// Requested key names a function nobody registered
class NoSuchFunctionError : public std::runtime_error {
public:
    explicit NoSuchFunctionError(const std::string& function)
        : std::runtime_error("No function registered for '" + function + "'") {}
};

} // namespace stepgraph

#endif // STEPGRAPH_ERRORS_HPP
