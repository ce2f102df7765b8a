#pragma once

#include <stdexcept>
#include <string>

namespace slnscan {

// Base class for every failure raised while locating or reading Visual Studio files
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Target file or directory does not exist
class NotFoundError : public Error {
public:
    using Error::Error;
};

// File extension differs from the one expected for its kind
class WrongExtensionError : public Error {
public:
    using Error::Error;
};

// No solution header within the first lines of the file
class MalformedSolutionFileError : public Error {
public:
    using Error::Error;
};

// Solution header present but its format version is unreadable
class MalformedHeaderError : public Error {
public:
    using Error::Error;
};

// Project block unterminated, not matching the grammar, or missing required metadata
class MalformedProjectReferenceError : public Error {
public:
    using Error::Error;
};

// Project file is not well-formed XML or has no Project root element
class MalformedProjectFileError : public Error {
public:
    using Error::Error;
};

// Blank required argument (path, name, extension)
class InvalidArgumentError : public Error {
public:
    using Error::Error;
};

// Line reader asked for a line after it was exhausted
class EndOfInputError : public Error {
public:
    using Error::Error;
};

// Build "file(line): error: message", the shape used for all format errors
std::string format_error_message(const std::string& file, int line, const std::string& message);

// Throw E with a located message
template<typename E>
[[noreturn]] void throw_format_error(const std::string& file, int line, const std::string& message) {
    throw E(format_error_message(file, line, message));
}

} // namespace slnscan
