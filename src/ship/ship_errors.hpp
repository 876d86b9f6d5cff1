// src/ship/ship_errors.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace ship {

// Two subsystems declare the same command. Fatal at assembly time.
class DuplicateCommandError : public std::runtime_error {
public:
    explicit DuplicateCommandError(const std::string& msg) : std::runtime_error(msg) {}
};

// Two subsystems attached under the same name.
class DuplicateSubsystemError : public std::runtime_error {
public:
    explicit DuplicateSubsystemError(const std::string& msg) : std::runtime_error(msg) {}
};

// Attribute key that names no ship field or subsystem field.
class UnknownFieldError : public std::runtime_error {
public:
    explicit UnknownFieldError(const std::string& msg) : std::runtime_error(msg) {}
};

// Command handed to a subsystem that does not declare it.
class UnrecognizedCommandError : public std::runtime_error {
public:
    explicit UnrecognizedCommandError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace ship
