#include "Circuit.h"
#include "Errors.h"

#include <stdexcept>

namespace zkframe {
namespace zkp {

char const*
to_string(Visibility visibility)
{
    switch (visibility)
    {
        case Visibility::Public:
            return "public";
        case Visibility::Private:
            return "private";
        case Visibility::Constant:
            return "constant";
    }
    return "unknown";
}

char const*
to_string(OpKind kind)
{
    switch (kind)
    {
        case OpKind::Add:
            return "add";
        case OpKind::Sub:
            return "sub";
        case OpKind::Mul:
            return "mul";
        case OpKind::Xor:
            return "xor";
        case OpKind::Eq:
            return "eq";
    }
    return "unknown";
}

VariableTable::VariableTable()
{
    variables_.push_back({"~one", oneIndex, Visibility::Constant});
    byName_.emplace(variables_.front().name, oneIndex);
}

VariableRef
VariableTable::allocate(std::string const& name, Visibility visibility)
{
    if (byName_.count(name) != 0)
        throw std::invalid_argument("variable already allocated: " + name);

    VariableRef const index = variables_.size();
    variables_.push_back({name, index, visibility});
    byName_.emplace(name, index);
    return index;
}

std::optional<VariableRef>
VariableTable::find(std::string const& name) const
{
    auto const it = byName_.find(name);
    if (it == byName_.end())
        return std::nullopt;
    return it->second;
}

Variable const&
VariableTable::at(VariableRef index) const
{
    return variables_.at(index);
}

void
VariableTable::setVisibility(VariableRef index, Visibility visibility)
{
    if (index == oneIndex)
        throw std::invalid_argument("the constant 1 cannot change visibility");
    variables_.at(index).visibility = visibility;
}

std::vector<VariableRef>
Circuit::publicIndices() const
{
    std::vector<VariableRef> indices;
    indices.reserve(inputs.size() + outputs.size());
    for (auto const& input : inputs)
        indices.push_back(input.index);
    for (auto const& output : outputs)
        indices.push_back(output.index);
    return indices;
}

std::string
describe(Operation const& op, VariableTable const& variables)
{
    return std::string(to_string(op.kind)) + " " + variables.at(op.lhs).name +
        " " + variables.at(op.rhs).name + " -> " +
        variables.at(op.result).name;
}

void
checkOperationOrder(Circuit const& circuit)
{
    std::size_t const n = circuit.numVariables();
    std::vector<bool> defined(n, false);
    defined[oneIndex] = true;

    auto markSeeded = [&](Declaration const& decl) {
        if (decl.index >= n)
            throw CompileError(
                "declaration '" + decl.name + "' has no allocated variable");
        defined[decl.index] = true;
    };
    for (auto const& input : circuit.inputs)
        markSeeded(input);
    for (auto const& constant : circuit.constants)
        markSeeded(constant);

    auto produce = [&](VariableRef index, Operation const& op) {
        if (index >= n)
            throw CompileError(
                "operation at line " + std::to_string(op.line) +
                " writes an unallocated variable");
        if (defined[index])
            throw CompileError(
                "operation at line " + std::to_string(op.line) +
                " overwrites '" + circuit.variables.at(index).name + "'");
        defined[index] = true;
    };

    for (auto const& op : circuit.operations)
    {
        for (VariableRef operand : {op.lhs, op.rhs})
        {
            if (operand >= n || !defined[operand])
                throw CompileError(
                    "operation at line " + std::to_string(op.line) +
                    " reads a variable before it is produced");
        }
        if (op.kind == OpKind::Eq && !op.inverse)
            throw CompileError(
                "eq at line " + std::to_string(op.line) +
                " has no inverse witness");
        produce(op.result, op);
        if (op.inverse)
            produce(*op.inverse, op);
    }

    for (auto const& output : circuit.outputs)
    {
        if (output.index >= n || !defined[output.index])
            throw CompileError(
                "output '" + output.name + "' is never produced");
    }
}

}  // namespace zkp
}  // namespace zkframe
