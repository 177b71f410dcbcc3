#include "ZkpTestBase.h"

#include <libzkframe/zkp/ConstraintCompiler.h>
#include <libzkframe/zkp/Groth16Backend.h>
#include <libzkframe/zkp/Parser.h>
#include <libzkframe/zkp/WitnessEvaluator.h>

#include <algorithm>
#include <map>

namespace zkframe {
namespace zkp {
namespace test {

class PublicOrder_test : public ZkpTest
{
protected:
    struct Value
    {
        std::string name;
        long value;
    };

    // Inputs and outputs are declared in the given orders; operations sit
    // between them and never change.
    static std::string
    circuitText(
        std::vector<Value> const& inputs,
        std::vector<Value> const& outputs)
    {
        std::string text = "name permuted\n";
        for (auto const& input : inputs)
            text += "input " + input.name + " " +
                std::to_string(input.value) + "\n";
        text += "add a b ab\n";
        text += "mul ab c abc\n";
        text += "sub c a ca\n";
        for (auto const& output : outputs)
            text += "output " + output.name + " " +
                std::to_string(output.value) + "\n";
        return text;
    }
};

TEST_F(PublicOrder_test, publicVectorFollowsDeclarationOrder)
{
    std::vector<Value> inputs{{"a", 2}, {"b", 3}, {"c", 7}};
    std::vector<Value> const outputs{{"ab", 5}, {"abc", 35}, {"ca", 5}};

    std::vector<std::size_t> outputOrder{0, 1, 2};
    std::sort(inputs.begin(), inputs.end(), [](auto const& x, auto const& y) {
        return x.name < y.name;
    });

    do
    {
        do
        {
            std::vector<Value> orderedOutputs;
            for (std::size_t i : outputOrder)
                orderedOutputs.push_back(outputs[i]);

            Circuit const circuit =
                parseCircuit(circuitText(inputs, orderedOutputs));
            ConstraintSystem const system = compileConstraints(circuit);
            Witness const witness = evaluateWitness(circuit);
            Groth16Backend const backend(system);

            std::vector<Value> expected = inputs;
            expected.insert(
                expected.end(), orderedOutputs.begin(), orderedOutputs.end());

            auto const indices = circuit.publicIndices();
            auto const systemPrimary = system.primaryInput(witness);
            auto const backendPrimary = backend.primaryInput(witness);
            ASSERT_EQ(indices.size(), expected.size());
            ASSERT_EQ(systemPrimary.size(), expected.size());
            ASSERT_EQ(backendPrimary.size(), expected.size());

            for (std::size_t i = 0; i < expected.size(); ++i)
            {
                EXPECT_EQ(
                    circuit.variables.at(indices[i]).name, expected[i].name);
                EXPECT_EQ(systemPrimary[i], field(expected[i].value));
                EXPECT_EQ(backendPrimary[i], field(expected[i].value));
                EXPECT_EQ(backend.columnOf(indices[i]), i + 1);
            }
        } while (std::next_permutation(outputOrder.begin(), outputOrder.end()));
    } while (std::next_permutation(
        inputs.begin(), inputs.end(), [](auto const& x, auto const& y) {
            return x.name < y.name;
        }));
}

TEST_F(PublicOrder_test, backendColumnPermutation)
{
    Circuit const circuit = parseCircuit(sumCheckCircuit);
    ConstraintSystem const system = compileConstraints(circuit);
    Witness const witness = evaluateWitness(circuit);
    Groth16Backend const backend(system);

    // Public: x, y, result, check. Then the rest in allocation order.
    std::map<std::string, std::size_t> const expected{
        {"x", 1},
        {"y", 2},
        {"result", 3},
        {"check", 4},
        {"one", 5},
        {"two", 6},
        {"sixteen", 7},
        {"x2", 8},
        {"y2", 9},
        {"sum", 10},
        {"check.inv", 11}};

    EXPECT_EQ(backend.columnOf(oneIndex), 0u);
    for (auto const& [name, column] : expected)
        EXPECT_EQ(backend.columnOf(indexOf(circuit, name)), column) << name;

    auto const& backendSystem = backend.backendSystem();
    EXPECT_EQ(backendSystem.num_inputs(), 4u);
    EXPECT_EQ(backendSystem.num_variables(), 11u);
    EXPECT_EQ(backendSystem.num_constraints(), system.numConstraints());

    auto const primary = backend.primaryInput(witness);
    auto const auxiliary = backend.auxiliaryInput(witness);
    EXPECT_EQ(auxiliary.size(), 7u);
    EXPECT_EQ(auxiliary.back(), FieldT::zero());
    EXPECT_TRUE(backendSystem.is_satisfied(primary, auxiliary));

    auto broken = auxiliary;
    broken[3] += FieldT::one();
    EXPECT_FALSE(backendSystem.is_satisfied(primary, broken));
}

}  // namespace test
}  // namespace zkp
}  // namespace zkframe
