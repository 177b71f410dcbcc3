#include "ZkpTestBase.h"

#include <libzkframe/zkp/ConstraintCompiler.h>
#include <libzkframe/zkp/Parser.h>
#include <libzkframe/zkp/WitnessEvaluator.h>

namespace zkframe {
namespace zkp {
namespace test {

class Soundness_test : public ZkpTest
{
protected:
    // (A.w) o (B.w) == (C.w), evaluated from the sparse matrices directly.
    static bool
    hadamardHolds(ConstraintSystem const& system, Witness const& witness)
    {
        std::size_t const rows = system.numConstraints();
        std::vector<FieldT> a(rows, FieldT::zero());
        std::vector<FieldT> b(rows, FieldT::zero());
        std::vector<FieldT> c(rows, FieldT::zero());

        for (auto const& e : system.matrixA())
            a[e.row] += e.coefficient * witness[e.column];
        for (auto const& e : system.matrixB())
            b[e.row] += e.coefficient * witness[e.column];
        for (auto const& e : system.matrixC())
            c[e.row] += e.coefficient * witness[e.column];

        for (std::size_t row = 0; row < rows; ++row)
        {
            if (a[row] * b[row] != c[row])
                return false;
        }
        return true;
    }

    static Witness
    withEntry(Witness const& witness, VariableRef index, FieldT const& value)
    {
        std::vector<FieldT> values = witness.values();
        values.at(index) = value;
        return Witness(std::move(values));
    }
};

TEST_F(Soundness_test, evaluatedWitnessSatisfiesEveryRow)
{
    for (std::string const& text : {sumCheckCircuit, xorCircuit})
    {
        Circuit const circuit = parseCircuit(text);
        ConstraintSystem const system = compileConstraints(circuit);
        Witness const witness = evaluateWitness(circuit);

        EXPECT_TRUE(hadamardHolds(system, witness)) << circuit.name;
        EXPECT_TRUE(system.isSatisfied(witness)) << circuit.name;
        EXPECT_FALSE(system.firstUnsatisfiedRow(witness).has_value());
    }
}

TEST_F(Soundness_test, everySingleEntryMutationBreaksARow)
{
    Circuit const circuit = parseCircuit(sumCheckCircuit);
    ConstraintSystem const system = compileConstraints(circuit);
    Witness const witness = evaluateWitness(circuit);

    for (VariableRef index = 1; index < witness.size(); ++index)
    {
        for (FieldT const& delta : {FieldT::one(), -FieldT::one(), field(7)})
        {
            Witness const mutated =
                withEntry(witness, index, witness[index] + delta);
            EXPECT_FALSE(hadamardHolds(system, mutated))
                << circuit.variables.at(index).name;
            EXPECT_TRUE(system.firstUnsatisfiedRow(mutated).has_value())
                << circuit.variables.at(index).name;
        }
    }
}

TEST_F(Soundness_test, mutatedOutputReportsItsRow)
{
    Circuit const circuit = parseCircuit(sumCheckCircuit);
    ConstraintSystem const system = compileConstraints(circuit);
    Witness const witness = evaluateWitness(circuit);

    Witness const forged =
        withEntry(witness, indexOf(circuit, "result"), field(16));
    auto const row = system.firstUnsatisfiedRow(forged);
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(*row, 6u);
    EXPECT_EQ(system.origin(*row).label, "sub sum two -> result");
}

TEST_F(Soundness_test, nonBooleanXorOperandFailsBooleanity)
{
    Circuit const circuit = parseCircuit(
        "name forged_xor\n"
        "input a 0\n"
        "input b 0\n"
        "xor a b r\n");
    ConstraintSystem const system = compileConstraints(circuit);

    // a = 2, b = 0, r = a + b - 2ab = 2 satisfies the xor row itself.
    Witness const forged(
        std::vector<FieldT>{FieldT::one(), field(2), field(0), field(2)});
    auto const row = system.firstUnsatisfiedRow(forged);
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(*row, 0u);
    EXPECT_TRUE(system.r1cs().constraints[2].a.evaluate(
                    forged.assignment()) *
                    system.r1cs().constraints[2].b.evaluate(
                        forged.assignment()) ==
                system.r1cs().constraints[2].c.evaluate(forged.assignment()));
}

TEST_F(Soundness_test, xorResultIsPinned)
{
    Circuit const circuit = parseCircuit(xorCircuit);
    ConstraintSystem const system = compileConstraints(circuit);

    // a = b = 1 with the wrong result 1, or a non-boolean result.
    for (long r : {1L, 2L, -1L})
    {
        Witness const forged(std::vector<FieldT>{
            FieldT::one(), FieldT::one(), FieldT::one(), field(r)});
        EXPECT_FALSE(system.isSatisfied(forged)) << r;
    }
}

TEST_F(Soundness_test, equalityCannotBeForged)
{
    Circuit const circuit = parseCircuit(
        "name forged_eq\n"
        "input a 3\n"
        "input b 3\n"
        "eq a b same\n");
    ConstraintSystem const system = compileConstraints(circuit);
    Witness const honest = evaluateWitness(circuit);
    ASSERT_TRUE(system.isSatisfied(honest));

    VariableRef const a = indexOf(circuit, "a");
    VariableRef const same = indexOf(circuit, "same");
    VariableRef const inv = indexOf(circuit, inverseName("same"));

    // Equal operands claimed unequal, with any inverse.
    for (long candidate : {0L, 1L, 5L})
    {
        std::vector<FieldT> values = honest.values();
        values[same] = FieldT::zero();
        values[inv] = field(candidate);
        EXPECT_FALSE(system.isSatisfied(Witness(values))) << candidate;
    }

    // Unequal operands claimed equal.
    {
        std::vector<FieldT> values = honest.values();
        values[a] = field(5);
        values[same] = FieldT::one();
        values[inv] = FieldT::zero();
        EXPECT_FALSE(system.isSatisfied(Witness(values)));
        values[inv] = field(2).inverse();
        EXPECT_FALSE(system.isSatisfied(Witness(values)));
    }

    // Non-boolean result.
    {
        std::vector<FieldT> values = honest.values();
        values[same] = field(2);
        EXPECT_FALSE(system.isSatisfied(Witness(values)));
    }

    // Equal operands with a non-zero inverse.
    {
        std::vector<FieldT> values = honest.values();
        values[inv] = field(9);
        EXPECT_FALSE(system.isSatisfied(Witness(values)));
    }
}

TEST_F(Soundness_test, witnessSizeMustMatch)
{
    Circuit const circuit = parseCircuit(xorCircuit);
    ConstraintSystem const system = compileConstraints(circuit);

    Witness const tooShort(std::vector<FieldT>{FieldT::one(), field(1)});
    EXPECT_THROW(system.isSatisfied(tooShort), std::invalid_argument);
}

}  // namespace test
}  // namespace zkp
}  // namespace zkframe
