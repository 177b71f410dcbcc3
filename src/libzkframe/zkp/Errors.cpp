#include "Errors.h"

namespace zkframe {
namespace zkp {

char const*
to_string(Stage stage)
{
    switch (stage)
    {
        case Stage::Parse:
            return "parse";
        case Stage::Compile:
            return "compile";
        case Stage::Witness:
            return "witness";
        case Stage::Backend:
            return "backend";
    }
    return "unknown";
}

Error::Error(Stage stage, std::string const& message)
    : std::runtime_error(message), stage_(stage)
{
}

SyntaxError::SyntaxError(std::size_t line, std::string const& detail)
    : Error(Stage::Parse, "line " + std::to_string(line) + ": " + detail)
    , line_(line)
    , detail_(detail)
{
}

DuplicateVariable::DuplicateVariable(std::string const& name, std::size_t line)
    : Error(
          Stage::Parse,
          "line " + std::to_string(line) + ": duplicate declaration of '" +
              name + "'")
    , name_(name)
    , line_(line)
{
}

UndefinedVariable::UndefinedVariable(std::string const& name, std::size_t line)
    : Error(
          Stage::Parse,
          "line " + std::to_string(line) + ": undefined variable '" + name +
              "'")
    , name_(name)
    , line_(line)
{
}

CompileError::CompileError(std::string const& detail)
    : Error(Stage::Compile, detail)
{
}

UnsatisfiedConstraint::UnsatisfiedConstraint(
    std::string const& detail,
    std::size_t line)
    : Error(Stage::Witness, "line " + std::to_string(line) + ": " + detail)
    , line_(line)
{
}

OutputMismatch::OutputMismatch(
    std::string const& name,
    FieldT const& expected,
    FieldT const& actual)
    : Error(
          Stage::Witness,
          "output '" + name + "' expected " + toDecimalString(expected) +
              ", computed " + toDecimalString(actual))
    , name_(name)
    , expected_(expected)
    , actual_(actual)
{
}

BackendError::BackendError(std::string const& detail)
    : Error(Stage::Backend, detail)
{
}

}  // namespace zkp
}  // namespace zkframe
