#ifndef ZKFRAME_ZKP_CIRCUIT_H_INCLUDED
#define ZKFRAME_ZKP_CIRCUIT_H_INCLUDED

#include "Field.h"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace zkframe {
namespace zkp {

// Dense allocation index of a variable. Index 0 is the constant 1.
using VariableRef = std::size_t;

constexpr VariableRef oneIndex = 0;

enum class Visibility { Public, Private, Constant };

char const*
to_string(Visibility visibility);

struct Variable
{
    std::string name;
    VariableRef index;
    Visibility visibility;
};

/**
 * Append-only arena of circuit variables.
 *
 * Indices are handed out in allocation order and never reused. Index 0 is
 * bound to the constant 1 before anything else is allocated; its name is not
 * a legal identifier so it cannot be referenced from circuit text.
 */
class VariableTable
{
public:
    VariableTable();

    // Throws std::invalid_argument if the name is already allocated.
    VariableRef
    allocate(std::string const& name, Visibility visibility);

    std::optional<VariableRef>
    find(std::string const& name) const;

    Variable const&
    at(VariableRef index) const;

    void
    setVisibility(VariableRef index, Visibility visibility);

    std::size_t
    size() const
    {
        return variables_.size();
    }

    std::vector<Variable>::const_iterator
    begin() const
    {
        return variables_.begin();
    }

    std::vector<Variable>::const_iterator
    end() const
    {
        return variables_.end();
    }

private:
    std::vector<Variable> variables_;
    std::unordered_map<std::string, VariableRef> byName_;
};

enum class OpKind { Add, Sub, Mul, Xor, Eq };

char const*
to_string(OpKind kind);

struct Operation
{
    OpKind kind;
    VariableRef lhs;
    VariableRef rhs;
    VariableRef result;
    // Eq only: auxiliary witness holding (lhs - rhs)^-1, or 0 when equal.
    std::optional<VariableRef> inverse;
    std::size_t line = 0;
};

// An input, constant or output line of the circuit text.
struct Declaration
{
    std::string name;
    FieldT value;
    VariableRef index;
    std::size_t line = 0;
};

/**
 * Validated in-memory circuit.
 *
 * Every operand of every operation refers to a variable allocated before the
 * operation's result. Outputs carry the expected value checked by the
 * witness evaluator; their index is that of the producing operation.
 */
struct Circuit
{
    std::string name;
    std::vector<Declaration> inputs;
    std::vector<Declaration> outputs;
    std::vector<Declaration> constants;
    std::vector<Operation> operations;
    VariableTable variables;

    std::size_t
    numVariables() const
    {
        return variables.size();
    }

    /**
     * Public-input vector order handed to the proving backend:
     * inputs in declaration order, then outputs in declaration order.
     */
    std::vector<VariableRef>
    publicIndices() const;
};

// Human-readable form of an operation, e.g. "mul x two -> x2".
std::string
describe(Operation const& op, VariableTable const& variables);

/**
 * Check that operations only read variables defined before them and that
 * every result is produced exactly once.
 *
 * Circuits built by the parser always pass; hand-assembled ones may not.
 * Throws CompileError on the first violation.
 */
void
checkOperationOrder(Circuit const& circuit);

}  // namespace zkp
}  // namespace zkframe

#endif  // ZKFRAME_ZKP_CIRCUIT_H_INCLUDED
