#pragma once

#include <stdexcept>
#include <string>

namespace domain {

// Malformed or missing input. Rejected before any side effect.
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& message) : std::invalid_argument(message) {}
};

// The durable store could not complete a read or write.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// Volatile cache failure. Callers degrade to store-only behaviour.
class CacheError : public std::runtime_error {
public:
    explicit CacheError(const std::string& message) : std::runtime_error(message) {}
};

// One endpoint could not be reached, timed out, or answered with a 5xx.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message) : std::runtime_error(message) {}
};

// Every endpoint of a shard failed.
class ServiceUnavailableError : public std::runtime_error {
public:
    explicit ServiceUnavailableError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace domain
