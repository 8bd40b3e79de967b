#pragma once
#include <stdexcept>
#include <string>

namespace LPV {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// invalid order / window_size / overlap / sample_rate
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& what) : Error("config error: " + what) {}
};

// malformed or truncated binary/structured input
class FormatError : public Error {
public:
    explicit FormatError(const std::string& what) : Error("format error: " + what) {}
};

class NumericalError : public Error {
public:
    explicit NumericalError(const std::string& what) : Error("numerical error: " + what) {}
};

class IoError : public Error {
public:
    explicit IoError(const std::string& what) : Error("io error: " + what) {}
};

} // namespace LPV
