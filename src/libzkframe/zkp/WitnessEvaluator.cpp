#include "WitnessEvaluator.h"
#include "Errors.h"
#include "gadgets/ArithmeticGadget.h"
#include "gadgets/EqualityGadget.h"
#include "gadgets/ProtoboardLayout.h"
#include "gadgets/XorGadget.h"

#include <libsnark/gadgetlib1/protoboard.hpp>

namespace zkframe {
namespace zkp {

namespace {

void
requireBoolean(
    libsnark::protoboard<FieldT> const& pb,
    std::vector<libsnark::pb_variable<FieldT>> const& variables,
    Circuit const& circuit,
    Operation const& op,
    VariableRef operand)
{
    FieldT const value = pb.val(variables[operand]);
    if (!isBoolean(value))
    {
        throw UnsatisfiedConstraint(
            std::string(to_string(op.kind)) + " operand '" +
                circuit.variables.at(operand).name + "' has value " +
                toDecimalString(value) + ", expected 0 or 1",
            op.line);
    }
}

}  // namespace

Witness
evaluateWitness(Circuit const& circuit)
{
    checkOperationOrder(circuit);

    libsnark::protoboard<FieldT> pb;
    auto const variables = allocateVariables(pb, circuit.variables);

    for (auto const& input : circuit.inputs)
        pb.val(variables[input.index]) = input.value;
    for (auto const& constant : circuit.constants)
        pb.val(variables[constant.index]) = constant.value;

    for (auto const& op : circuit.operations)
    {
        std::string const prefix = "line" + std::to_string(op.line);

        switch (op.kind)
        {
            case OpKind::Add:
            case OpKind::Sub:
            case OpKind::Mul: {
                ArithmeticGadget<FieldT> gadget(
                    pb,
                    op.kind,
                    variables[op.lhs],
                    variables[op.rhs],
                    variables[op.result],
                    prefix);
                gadget.generate_r1cs_witness();
                break;
            }
            case OpKind::Xor: {
                requireBoolean(pb, variables, circuit, op, op.lhs);
                requireBoolean(pb, variables, circuit, op, op.rhs);
                XorGadget<FieldT> gadget(
                    pb,
                    variables[op.lhs],
                    variables[op.rhs],
                    variables[op.result],
                    prefix);
                gadget.generate_r1cs_witness();
                break;
            }
            case OpKind::Eq: {
                EqualityGadget<FieldT> gadget(
                    pb,
                    variables[op.lhs],
                    variables[op.rhs],
                    variables[op.result],
                    variables[*op.inverse],
                    prefix);
                gadget.generate_r1cs_witness();
                break;
            }
        }
    }

    for (auto const& output : circuit.outputs)
    {
        FieldT const actual = pb.val(variables[output.index]);
        if (actual != output.value)
            throw OutputMismatch(output.name, output.value, actual);
    }

    std::vector<FieldT> values;
    values.reserve(circuit.numVariables());
    values.push_back(FieldT::one());
    for (auto const& value : pb.full_variable_assignment())
        values.push_back(value);

    return Witness(std::move(values));
}

}  // namespace zkp
}  // namespace zkframe
