#ifndef ZKFRAME_ZKP_ERRORS_H_INCLUDED
#define ZKFRAME_ZKP_ERRORS_H_INCLUDED

#include "Field.h"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace zkframe {
namespace zkp {

// Pipeline stage a failure is attributed to.
enum class Stage { Parse, Compile, Witness, Backend };

char const*
to_string(Stage stage);

/**
 * Base of every failure raised by the circuit pipeline.
 *
 * Each error belongs to exactly one stage so callers can report
 * "parse failed at line N" separately from "witness violates circuit".
 */
class Error : public std::runtime_error
{
public:
    Error(Stage stage, std::string const& message);

    Stage
    stage() const
    {
        return stage_;
    }

private:
    Stage stage_;
};

// Malformed statement, wrong token count or bad literal.
class SyntaxError : public Error
{
public:
    SyntaxError(std::size_t line, std::string const& detail);

    std::size_t
    line() const
    {
        return line_;
    }

    std::string const&
    detail() const
    {
        return detail_;
    }

private:
    std::size_t line_;
    std::string detail_;
};

class DuplicateVariable : public Error
{
public:
    DuplicateVariable(std::string const& name, std::size_t line);

    std::string const&
    name() const
    {
        return name_;
    }

    std::size_t
    line() const
    {
        return line_;
    }

private:
    std::string name_;
    std::size_t line_;
};

class UndefinedVariable : public Error
{
public:
    UndefinedVariable(std::string const& name, std::size_t line);

    std::string const&
    name() const
    {
        return name_;
    }

    std::size_t
    line() const
    {
        return line_;
    }

private:
    std::string name_;
    std::size_t line_;
};

// Structural problem found while emitting constraints.
class CompileError : public Error
{
public:
    explicit CompileError(std::string const& detail);
};

// A supplied value cannot satisfy the encoded computation.
class UnsatisfiedConstraint : public Error
{
public:
    UnsatisfiedConstraint(std::string const& detail, std::size_t line);

    std::size_t
    line() const
    {
        return line_;
    }

private:
    std::size_t line_;
};

class OutputMismatch : public Error
{
public:
    OutputMismatch(
        std::string const& name,
        FieldT const& expected,
        FieldT const& actual);

    std::string const&
    name() const
    {
        return name_;
    }

    FieldT const&
    expected() const
    {
        return expected_;
    }

    FieldT const&
    actual() const
    {
        return actual_;
    }

private:
    std::string name_;
    FieldT expected_;
    FieldT actual_;
};

// Setup, proving or verification machinery failed.
class BackendError : public Error
{
public:
    explicit BackendError(std::string const& detail);
};

}  // namespace zkp
}  // namespace zkframe

#endif  // ZKFRAME_ZKP_ERRORS_H_INCLUDED
