#pragma once
#include <stdexcept>
#include <string>

// Raised while loading or validating configuration. Fatal at startup only.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error(what) {}
};

// An operation referenced an address name the table does not hold
// (or holds with the wrong kind).
class MissingAddressError : public ConfigError {
public:
    explicit MissingAddressError(const std::string& name)
        : ConfigError("missing address: " + name) {}
};
