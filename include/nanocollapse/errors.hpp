#pragma once

#include <stdexcept>
#include <string>

namespace nanocollapse {

// Required input column absent, or inputs disagree on their header line.
class SchemaError : public std::runtime_error {
public:
    explicit SchemaError(const std::string& msg) : std::runtime_error(msg) {}
};

// Malformed data line or numeric field.
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& msg) : std::runtime_error(msg) {}
};

// Open, read or write failure on an input or output file.
class IOError : public std::runtime_error {
public:
    explicit IOError(const std::string& msg) : std::runtime_error(msg) {}
};

// Rejected before any pipeline thread is started.
class InvalidConfig : public std::runtime_error {
public:
    explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {}
};

}  // namespace nanocollapse
