#pragma once
#include <stdexcept>
#include <string>

// Exception types used across the scanner.
// SetupError is the only error allowed to abort a scan; CacheError never
// leaves the cache layer (the tiered store turns it into a miss).

class SetupError : public std::runtime_error {
public:
    explicit SetupError(const std::string& what)
        : std::runtime_error(what) {}
};

class CacheError : public std::runtime_error {
public:
    explicit CacheError(const std::string& what)
        : std::runtime_error(what) {}
};
