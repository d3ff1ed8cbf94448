#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Unusable setup: bad options, unsupported device layout, missing model or binary.
// Reported once at startup, the process exits.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// The dispatcher was told about samples the producer never buffered.
// Means a logic defect, never an environmental condition.
class DesyncError : public std::logic_error {
public:
    explicit DesyncError(const std::string& what) : std::logic_error(what) {}
};

#endif
