#ifndef HYPSIM_ERRORS_H
#define HYPSIM_ERRORS_H

#include <stdexcept>
#include <string>

// malformed observed data: empty group, wrong arity, NaN/inf, ...
class InvalidDataError : public std::invalid_argument
{
public:
    explicit InvalidDataError(const std::string& what) : std::invalid_argument(what) {}
};

// trial statistics requested before pValue() was ever called
class NotYetRunError : public std::logic_error
{
public:
    explicit NotYetRunError(const std::string& what) : std::logic_error(what) {}
};

// internal consistency failure - a programming error, never recovered
class InvariantViolationError : public std::logic_error
{
public:
    explicit InvariantViolationError(const std::string& what) : std::logic_error(what) {}
};

#endif //HYPSIM_ERRORS_H
