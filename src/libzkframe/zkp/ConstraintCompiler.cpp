#include "ConstraintCompiler.h"
#include "Errors.h"
#include "gadgets/ArithmeticGadget.h"
#include "gadgets/EqualityGadget.h"
#include "gadgets/ProtoboardLayout.h"
#include "gadgets/XorGadget.h"

#include <libsnark/gadgetlib1/gadgets/basic_gadgets.hpp>
#include <libsnark/gadgetlib1/protoboard.hpp>

namespace zkframe {
namespace zkp {

using libsnark::pb_variable;
using libsnark::protoboard;
using libsnark::r1cs_constraint;

namespace {

class ConstraintCompiler
{
public:
    explicit ConstraintCompiler(Circuit const& circuit)
        : circuit_(circuit)
        , variables_(allocateVariables(pb_, circuit.variables))
        , knownBoolean_(circuit.numVariables(), false)
    {
        knownBoolean_[oneIndex] = true;
    }

    ConstraintSystem
    compile();

private:
    void
    bindConstant(Declaration const& constant);

    void
    emitOperation(Operation const& op);

    void
    requireBoolean(VariableRef index, std::string const& prefix);

    // Attribute every row added since the last call to one statement.
    void
    record(std::size_t line, std::string const& label);

    Circuit const& circuit_;
    protoboard<FieldT> pb_;
    std::vector<pb_variable<FieldT>> variables_;
    std::vector<bool> knownBoolean_;
    std::vector<RowOrigin> origins_;
};

ConstraintSystem
ConstraintCompiler::compile()
{
    for (auto const& constant : circuit_.constants)
        bindConstant(constant);

    for (auto const& op : circuit_.operations)
        emitOperation(op);

    return ConstraintSystem(
        pb_.get_constraint_system(),
        circuit_.publicIndices(),
        std::move(origins_));
}

void
ConstraintCompiler::bindConstant(Declaration const& constant)
{
    pb_.add_r1cs_constraint(
        r1cs_constraint<FieldT>(constant.value, 1, variables_[constant.index]),
        "const_" + constant.name);
    record(
        constant.line,
        "const " + constant.name + " = " + toDecimalString(constant.value));

    if (isBoolean(constant.value))
        knownBoolean_[constant.index] = true;
}

void
ConstraintCompiler::emitOperation(Operation const& op)
{
    std::string const prefix = "line" + std::to_string(op.line);

    switch (op.kind)
    {
        case OpKind::Add:
        case OpKind::Sub:
        case OpKind::Mul: {
            ArithmeticGadget<FieldT> gadget(
                pb_,
                op.kind,
                variables_[op.lhs],
                variables_[op.rhs],
                variables_[op.result],
                prefix);
            gadget.generate_r1cs_constraints();
            break;
        }
        case OpKind::Xor: {
            requireBoolean(op.lhs, prefix);
            requireBoolean(op.rhs, prefix);
            XorGadget<FieldT> gadget(
                pb_,
                variables_[op.lhs],
                variables_[op.rhs],
                variables_[op.result],
                prefix);
            gadget.generate_r1cs_constraints();
            knownBoolean_[op.result] = true;
            break;
        }
        case OpKind::Eq: {
            EqualityGadget<FieldT> gadget(
                pb_,
                variables_[op.lhs],
                variables_[op.rhs],
                variables_[op.result],
                variables_[*op.inverse],
                prefix);
            gadget.generate_r1cs_constraints();
            knownBoolean_[op.result] = true;
            break;
        }
    }

    record(op.line, describe(op, circuit_.variables));
}

void
ConstraintCompiler::requireBoolean(VariableRef index, std::string const& prefix)
{
    if (knownBoolean_[index])
        return;

    libsnark::generate_boolean_r1cs_constraint<FieldT>(
        pb_,
        variables_[index],
        prefix + "_" + circuit_.variables.at(index).name);
    knownBoolean_[index] = true;
}

void
ConstraintCompiler::record(std::size_t line, std::string const& label)
{
    while (origins_.size() < pb_.num_constraints())
        origins_.push_back({line, label});
}

}  // namespace

ConstraintSystem
compileConstraints(Circuit const& circuit)
{
    checkOperationOrder(circuit);

    ConstraintCompiler compiler(circuit);
    return compiler.compile();
}

}  // namespace zkp
}  // namespace zkframe
