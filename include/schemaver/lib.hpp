#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdarg>
#include <cstdio>

namespace schemaver {

// Base of every fatal failure raised by the library.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

// Malformed Order shape.
class OrderError : public Error {
public:
    explicit OrderError(const std::string& msg) : Error(msg) {}
};

// The before/after labels of a set of orders form a loop.
class CyclicDependencyError : public OrderError {
public:
    explicit CyclicDependencyError(const std::string& msg) : OrderError(msg) {}
};

// A model object was built with inconsistent data.
class ModelError : public Error {
public:
    explicit ModelError(const std::string& msg) : Error(msg) {}
};

class AlreadyExists : public Error {
public:
    explicit AlreadyExists(const std::string& msg) : Error(msg) {}
};

class NotFound : public Error {
public:
    explicit NotFound(const std::string& msg) : Error(msg) {}
};

// printf style formatting, prefixed with the call site: "file:line: message"
std::string format_message(const char* file, int line, const char* msg, ...);

// std::visit helper
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace schemaver

// A helper macro to automatically pass __FILE__ and __LINE__
#define SCHEMAVER_THROW(type, msg, ...) \
    throw type(::schemaver::format_message(__FILE__, __LINE__, msg, ##__VA_ARGS__))
