#ifndef ZKFRAME_ZKP_CONSTRAINTCOMPILER_H_INCLUDED
#define ZKFRAME_ZKP_CONSTRAINTCOMPILER_H_INCLUDED

#include "Circuit.h"
#include "ConstraintSystem.h"

namespace zkframe {
namespace zkp {

/**
 * Compile a circuit into a rank-1 constraint system.
 *
 * ROW ORDER (stable, the backend's setup depends on it):
 * 1. One binding row per constant, in declaration order:
 *    (value * 1) * 1 = c
 * 2. The rows of each operation, in operation order:
 *    - add, sub, mul: one row each (see ArithmeticGadget)
 *    - xor: a booleanity row v * (1 - v) = 0 for every operand not already
 *      known to be boolean, then the XOR row (see XorGadget)
 *    - eq: four rows (see EqualityGadget)
 *
 * A variable is known to be boolean once it is a constant with value 0 or
 * 1, an eq or xor result, or has had a booleanity row emitted. Booleanity
 * of raw inputs is never assumed: non-boolean values fail in the witness
 * evaluator and in the booleanity rows.
 *
 * @throws CompileError if the circuit's operations are out of order.
 */
ConstraintSystem
compileConstraints(Circuit const& circuit);

}  // namespace zkp
}  // namespace zkframe

#endif  // ZKFRAME_ZKP_CONSTRAINTCOMPILER_H_INCLUDED
