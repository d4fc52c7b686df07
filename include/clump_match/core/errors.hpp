#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace clump_match {

class ClumpMatchError : public std::runtime_error {
public:
    explicit ClumpMatchError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public ClumpMatchError {
public:
    explicit ConfigError(const std::string& message)
        : ClumpMatchError("Config error: " + message) {}
};

class ValidationError : public ClumpMatchError {
public:
    explicit ValidationError(const std::string& message)
        : ClumpMatchError("Validation error: " + message) {}
};

class IOError : public ClumpMatchError {
public:
    explicit IOError(const std::string& message)
        : ClumpMatchError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

// Required column absent, non-numeric value, empty or duplicate identifier.
class MalformedCatalogError : public ClumpMatchError {
public:
    explicit MalformedCatalogError(const std::string& message)
        : ClumpMatchError("Malformed catalog: " + message) {}
};

class InsufficientSamplesError : public ClumpMatchError {
public:
    InsufficientSamplesError(const std::string& what_for, int available, int required)
        : ClumpMatchError("Insufficient samples for " + what_for + ": " +
                          std::to_string(available) + " < " + std::to_string(required)),
          available_(available), required_(required) {}

    int available() const { return available_; }
    int required() const { return required_; }

private:
    int available_;
    int required_;
};

class DegenerateFitError : public ClumpMatchError {
public:
    explicit DegenerateFitError(const std::string& message)
        : ClumpMatchError("Degenerate fit: " + message) {}
};

// Short machine-readable name of the error class, "error" for anything
// outside the hierarchy.
inline std::string error_kind(const std::exception& e) {
    if (dynamic_cast<const MalformedCatalogError*>(&e)) return "malformed_catalog";
    if (dynamic_cast<const InsufficientSamplesError*>(&e)) return "insufficient_samples";
    if (dynamic_cast<const DegenerateFitError*>(&e)) return "degenerate_fit";
    if (dynamic_cast<const ValidationError*>(&e)) return "validation";
    if (dynamic_cast<const ConfigError*>(&e)) return "config";
    if (dynamic_cast<const IOError*>(&e)) return "io";
    return "error";
}

} // namespace clump_match
