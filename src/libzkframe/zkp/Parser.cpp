#include "Parser.h"
#include "Errors.h"

#include <cctype>
#include <sstream>
#include <vector>

namespace zkframe {
namespace zkp {

namespace {

bool
isIdentifier(std::string const& token)
{
    if (token.empty())
        return false;
    auto const first = static_cast<unsigned char>(token[0]);
    if (!std::isalpha(first) && first != '_')
        return false;
    for (char c : token)
    {
        auto const u = static_cast<unsigned char>(c);
        if (!std::isalnum(u) && u != '_')
            return false;
    }
    return true;
}

std::optional<OpKind>
opKindFor(std::string const& keyword)
{
    if (keyword == "add")
        return OpKind::Add;
    if (keyword == "sub")
        return OpKind::Sub;
    if (keyword == "mul")
        return OpKind::Mul;
    if (keyword == "xor")
        return OpKind::Xor;
    if (keyword == "eq")
        return OpKind::Eq;
    return std::nullopt;
}

struct PendingOutput
{
    std::string name;
    FieldT expected;
    std::size_t line;
    std::optional<VariableRef> index;
};

class CircuitParser
{
public:
    Circuit
    run(std::istream& in);

private:
    void
    parseLine(std::vector<std::string> const& tokens);

    void
    parseName(std::vector<std::string> const& tokens);

    void
    parseDeclaration(std::vector<std::string> const& tokens);

    void
    parseOutput(std::vector<std::string> const& tokens);

    void
    parseOperation(OpKind kind, std::vector<std::string> const& tokens);

    void
    expectArity(std::vector<std::string> const& tokens, std::size_t count) const;

    std::string const&
    expectIdentifier(std::string const& token) const;

    FieldT
    expectLiteral(std::string const& token) const;

    VariableRef
    resolve(std::string const& name) const;

    PendingOutput*
    findOutput(std::string const& name);

    Circuit circuit_;
    std::vector<PendingOutput> outputs_;
    bool hasName_ = false;
    std::size_t line_ = 0;
};

Circuit
CircuitParser::run(std::istream& in)
{
    initializeCurve();

    std::string text;
    while (std::getline(in, text))
    {
        ++line_;
        std::istringstream stream(text);
        std::vector<std::string> tokens;
        std::string token;
        while (stream >> token)
            tokens.push_back(token);

        if (tokens.empty() || tokens.front().compare(0, 2, "//") == 0)
            continue;
        parseLine(tokens);
    }

    if (!hasName_)
        throw SyntaxError(0, "missing 'name' statement");

    for (auto const& output : outputs_)
    {
        if (!output.index)
            throw UndefinedVariable(output.name, output.line);
        circuit_.variables.setVisibility(*output.index, Visibility::Public);
        circuit_.outputs.push_back(
            {output.name, output.expected, *output.index, output.line});
    }

    return std::move(circuit_);
}

void
CircuitParser::parseLine(std::vector<std::string> const& tokens)
{
    std::string const& keyword = tokens.front();

    if (keyword == "name")
        parseName(tokens);
    else if (keyword == "input" || keyword == "const")
        parseDeclaration(tokens);
    else if (keyword == "output")
        parseOutput(tokens);
    else if (auto const kind = opKindFor(keyword))
        parseOperation(*kind, tokens);
    else
        throw SyntaxError(line_, "unknown statement '" + keyword + "'");
}

void
CircuitParser::parseName(std::vector<std::string> const& tokens)
{
    expectArity(tokens, 2);
    if (hasName_)
        throw SyntaxError(line_, "circuit name declared twice");
    circuit_.name = expectIdentifier(tokens[1]);
    hasName_ = true;
}

void
CircuitParser::parseDeclaration(std::vector<std::string> const& tokens)
{
    expectArity(tokens, 3);
    std::string const& name = expectIdentifier(tokens[1]);
    FieldT const value = expectLiteral(tokens[2]);

    if (circuit_.variables.find(name) || findOutput(name))
        throw DuplicateVariable(name, line_);

    bool const isInput = tokens[0] == "input";
    VariableRef const index = circuit_.variables.allocate(
        name, isInput ? Visibility::Public : Visibility::Constant);

    auto& target = isInput ? circuit_.inputs : circuit_.constants;
    target.push_back({name, value, index, line_});
}

void
CircuitParser::parseOutput(std::vector<std::string> const& tokens)
{
    expectArity(tokens, 3);
    std::string const& name = expectIdentifier(tokens[1]);
    FieldT const expected = expectLiteral(tokens[2]);

    if (findOutput(name))
        throw DuplicateVariable(name, line_);

    std::optional<VariableRef> index = circuit_.variables.find(name);
    // Only operation results may be outputs; inputs and constants are
    // already fixed by their own declaration.
    if (index &&
        circuit_.variables.at(*index).visibility != Visibility::Private)
        throw DuplicateVariable(name, line_);

    outputs_.push_back({name, expected, line_, index});
}

void
CircuitParser::parseOperation(
    OpKind kind,
    std::vector<std::string> const& tokens)
{
    expectArity(tokens, 4);
    std::string const& lhsName = expectIdentifier(tokens[1]);
    std::string const& rhsName = expectIdentifier(tokens[2]);
    std::string const& resultName = expectIdentifier(tokens[3]);

    Operation op;
    op.kind = kind;
    op.lhs = resolve(lhsName);
    op.rhs = resolve(rhsName);
    op.line = line_;

    if (circuit_.variables.find(resultName))
        throw DuplicateVariable(resultName, line_);

    op.result = circuit_.variables.allocate(resultName, Visibility::Private);
    if (kind == OpKind::Eq)
        op.inverse = circuit_.variables.allocate(
            inverseName(resultName), Visibility::Private);

    if (auto* output = findOutput(resultName))
        output->index = op.result;

    circuit_.operations.push_back(op);
}

void
CircuitParser::expectArity(
    std::vector<std::string> const& tokens,
    std::size_t count) const
{
    if (tokens.size() != count)
    {
        throw SyntaxError(
            line_,
            "'" + tokens.front() + "' expects " + std::to_string(count - 1) +
                " arguments, got " + std::to_string(tokens.size() - 1));
    }
}

std::string const&
CircuitParser::expectIdentifier(std::string const& token) const
{
    if (!isIdentifier(token))
        throw SyntaxError(line_, "invalid identifier '" + token + "'");
    return token;
}

FieldT
CircuitParser::expectLiteral(std::string const& token) const
{
    FieldT value;
    if (!parseFieldLiteral(token, value))
        throw SyntaxError(line_, "malformed integer literal '" + token + "'");
    return value;
}

VariableRef
CircuitParser::resolve(std::string const& name) const
{
    auto const index = circuit_.variables.find(name);
    if (!index)
        throw UndefinedVariable(name, line_);
    return *index;
}

PendingOutput*
CircuitParser::findOutput(std::string const& name)
{
    for (auto& output : outputs_)
    {
        if (output.name == name)
            return &output;
    }
    return nullptr;
}

}  // namespace

Circuit
parseCircuit(std::istream& in)
{
    CircuitParser parser;
    return parser.run(in);
}

Circuit
parseCircuit(std::string const& text)
{
    std::istringstream in(text);
    return parseCircuit(in);
}

std::string
inverseName(std::string const& resultName)
{
    return resultName + ".inv";
}

}  // namespace zkp
}  // namespace zkframe
