#ifndef ZKFRAME_ZKP_WITNESSEVALUATOR_H_INCLUDED
#define ZKFRAME_ZKP_WITNESSEVALUATOR_H_INCLUDED

#include "Circuit.h"
#include "Witness.h"

namespace zkframe {
namespace zkp {

/**
 * Compute the value of every circuit variable from the declared inputs and
 * constants, in allocation order, then check each declared output.
 *
 *   add -> x + y      sub -> x - y      mul -> x * y
 *   xor -> x + y - 2xy (x and y must be 0 or 1)
 *   eq  -> 1 if x == y else 0; inverse witness (x - y)^-1, or 0 if equal
 *
 * @throws CompileError if the circuit's operations are out of order.
 * @throws UnsatisfiedConstraint if an xor operand is not boolean.
 * @throws OutputMismatch for the first output (in declaration order) whose
 *         computed value differs from the declared one.
 */
Witness
evaluateWitness(Circuit const& circuit);

}  // namespace zkp
}  // namespace zkframe

#endif  // ZKFRAME_ZKP_WITNESSEVALUATOR_H_INCLUDED
