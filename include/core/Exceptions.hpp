#pragma once

#include <stdexcept>
#include <string>

class SamplingException : public std::runtime_error {
public:
    explicit SamplingException(const std::string& message) : std::runtime_error(message) {}
};

// Strategy or schema configuration does not match the data it is applied to
class ConfigurationError : public SamplingException {
public:
    explicit ConfigurationError(const std::string& message)
        : SamplingException("Configuration Error: " + message) {}
};

// A class is too small for neighbour search or fold construction
class InsufficientSamplesError : public SamplingException {
public:
    explicit InsufficientSamplesError(const std::string& message)
        : SamplingException("Insufficient Samples: " + message) {}
};

class KeyConflictError : public SamplingException {
public:
    explicit KeyConflictError(const std::string& message)
        : SamplingException("Key Conflict: " + message) {}
};

class IOError : public SamplingException {
public:
    explicit IOError(const std::string& message)
        : SamplingException("IO Error: " + message) {}
};
